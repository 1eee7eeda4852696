#include "ebml/tree/parser.hpp"

#include "ebml/codec/primitive.hpp"
#include "ebml/core/error.hpp"
#include "ebml/schema/registry.hpp"

#include <spdlog/spdlog.h>

#include <string>
#include <utility>
#include <vector>

namespace ebml::tree {
namespace {

class tree_error_category final : public std::error_category {
 public:
  const char* name() const noexcept override { return "ebml.tree"; }

  std::string message(int ev) const override {
    switch (static_cast<errc>(ev)) {
      case errc::ok:
        return "ok";
      case errc::truncated:
        return "truncated input";
      case errc::bad_signature:
        return "bad ebml signature";
      case errc::span_mismatch:
        return "child element overruns parent span";
      case errc::unknown_size:
        return "unknown-size elements are not supported";
      case errc::depth_exceeded:
        return "element nesting too deep";
      case errc::element_too_large:
        return "element payload exceeds size limit";
      case errc::io_error:
        return "byte source i/o error";
      default:
        return "unknown ebml.tree error";
    }
  }
};

/*
 * EBML 元素的字节布局：
 *
 *   [ID: 1..8B, 保留长度前缀] [Size: 1..8B vint] [Payload: Size 字节]
 *
 * - master 元素的 payload 是子元素序列，按声明长度递归消费；
 * - 其他类别的 payload 原样读入，解释推迟到字段访问时（codec 层）；
 * - 所有读取都是“已知长度”的精确读取，因此任何输入都会在有限步内结束。
 */

// 字节源 / codec 层的错误统一折算为本层错误码，调用方只需面对 tree::errc。
std::error_code normalize_(std::error_code ec) noexcept {
  if (ec == core::errc::end_of_stream || ec == codec::errc::truncated) {
    return make_error_code(errc::truncated);
  }
  if (ec == core::errc::io_error || ec == core::errc::invalid_argument) {
    return make_error_code(errc::io_error);
  }
  return ec;
}

std::error_code fail_(ParseFailure* failure,
                      std::error_code ec,
                      ParseStage stage,
                      std::uint64_t offset,
                      std::optional<std::uint64_t> id = std::nullopt) noexcept {
  if (failure != nullptr) {
    failure->stage = stage;
    failure->offset = offset;
    failure->element_id = id;
  }
  spdlog::debug("ebml parse failed: stage={} offset={} id=0x{:X} ({})",
                stage_name(stage),
                offset,
                id.value_or(0),
                ec.message());
  return ec;
}

// 是否 [begin, begin + size) 超出 limit；避免 begin + size 溢出。
[[nodiscard]] bool exceeds_(std::uint64_t begin, std::uint64_t size, std::uint64_t limit) noexcept {
  return begin > limit || size > limit - begin;
}

std::error_code read_header_(core::ByteSource& source, Element& out, ParseFailure* failure) noexcept {
  const auto offset = source.position();

  std::uint64_t id = 0;
  std::size_t id_length = 0;
  auto ec = codec::read_id(source, id, id_length);
  if (ec) {
    return fail_(failure, normalize_(ec), ParseStage::element_id, offset);
  }

  std::uint64_t size = 0;
  std::size_t size_length = 0;
  ec = codec::read_vint(source, size, size_length);
  if (ec) {
    return fail_(failure, normalize_(ec), ParseStage::element_size, offset, id);
  }
  if (codec::is_unknown_size(size, size_length)) {
    return fail_(failure, make_error_code(errc::unknown_size), ParseStage::element_size, offset, id);
  }

  out.id = id;
  out.declared_size = size;
  out.kind = schema::element_kind(id);
  out.offset = offset;
  out.header_size = static_cast<std::uint8_t>(id_length + size_length);
  out.data = ElementData{};

  spdlog::trace("ebml element id=0x{:X} ({}) size={} offset={}",
                id,
                schema::element_name(id),
                size,
                offset);
  return {};
}

std::error_code read_payload_(core::ByteSource& source,
                              const ParseOptions& options,
                              Element& element,
                              ParseFailure* failure) noexcept {
  if (element.kind == schema::ElementKind::master) {
    return {};
  }
  if (element.declared_size > options.max_element_size) {
    return fail_(failure, make_error_code(errc::element_too_large), ParseStage::element_data,
                 element.offset, element.id);
  }
  // 总长度已知时先判断截断，避免按不可信的声明长度分配内存。
  const auto total = source.size();
  if (total && exceeds_(element.payload_offset(), element.declared_size, *total)) {
    return fail_(failure, make_error_code(errc::truncated), ParseStage::element_data,
                 element.offset, element.id);
  }

  std::vector<byte> payload(static_cast<std::size_t>(element.declared_size));
  auto ec = source.read(core::mutable_bytes_view{payload.data(), payload.size()});
  if (ec) {
    return fail_(failure, normalize_(ec), ParseStage::element_data, element.offset, element.id);
  }
  element.data = ElementData(std::move(payload));
  return {};
}

std::error_code build_node_(core::ByteSource& source,
                            const ParseOptions& options,
                            Node& out,
                            ParseFailure* failure,
                            std::size_t depth,
                            std::optional<std::uint64_t> limit) noexcept {
  if (depth > options.max_depth) {
    return fail_(failure, make_error_code(errc::depth_exceeded), ParseStage::children, source.position());
  }

  Node node;
  auto ec = read_header_(source, node.element, failure);
  if (ec) {
    return ec;
  }
  auto& element = node.element;

  // 子元素必须完整落在父元素声明的跨度内；在读 payload 之前判断，
  // 保证“声明过长”的子元素报 span_mismatch 而不是 truncated。
  if (limit && exceeds_(element.payload_offset(), element.declared_size, *limit)) {
    return fail_(failure, make_error_code(errc::span_mismatch), ParseStage::children,
                 element.offset, element.id);
  }

  ec = read_payload_(source, options, element, failure);
  if (ec) {
    return ec;
  }

  if (node.is_master()) {
    const auto end = element.payload_offset() + element.declared_size;
    while (source.position() < end) {
      Node child;
      ec = build_node_(source, options, child, failure, depth + 1, end);
      if (ec) {
        return ec;
      }
      node.children.push_back(std::move(child));
    }
  }

  out = std::move(node);
  return {};
}

}  // namespace

const std::error_category& error_category() noexcept {
  static tree_error_category category;
  return category;
}

std::error_code make_error_code(errc e) noexcept {
  return {static_cast<int>(e), error_category()};
}

std::string_view stage_name(ParseStage stage) noexcept {
  switch (stage) {
    case ParseStage::none:
      return "none";
    case ParseStage::signature:
      return "signature";
    case ParseStage::element_id:
      return "element-id";
    case ParseStage::element_size:
      return "element-size";
    case ParseStage::element_data:
      return "element-data";
    case ParseStage::children:
      return "children";
  }
  return "none";
}

std::error_code parse_element(core::ByteSource& source,
                              Element& out,
                              const ParseOptions& options,
                              ParseFailure* failure) noexcept {
  Element element;
  auto ec = read_header_(source, element, failure);
  if (ec) {
    return ec;
  }
  ec = read_payload_(source, options, element, failure);
  if (ec) {
    return ec;
  }
  out = std::move(element);
  return {};
}

std::error_code build_tree(core::ByteSource& source,
                           Node& out,
                           const ParseOptions& options,
                           ParseFailure* failure) noexcept {
  return build_node_(source, options, out, failure, 0, std::nullopt);
}

std::error_code check_signature(core::ByteSource& source, ParseFailure* failure) noexcept {
  const auto offset = source.position();
  std::array<byte, kSignature.size()> head{};
  auto ec = source.read(core::mutable_bytes_view{head.data(), head.size()});
  if (ec == core::errc::end_of_stream || (!ec && head != kSignature)) {
    return fail_(failure, make_error_code(errc::bad_signature), ParseStage::signature, offset);
  }
  if (ec) {
    return fail_(failure, normalize_(ec), ParseStage::signature, offset);
  }
  return {};
}

std::error_code parse_document(core::ByteSource& source,
                               Document& out,
                               const ParseOptions& options,
                               ParseFailure* failure) noexcept {
  auto ec = source.seek(0);
  if (ec) {
    return fail_(failure, normalize_(ec), ParseStage::signature, 0);
  }
  ec = check_signature(source, failure);
  if (ec) {
    return ec;
  }
  // 签名即 EBML 头 ID 的前 4 字节：回到起点，由 build_tree 完整读取头元素。
  ec = source.seek(0);
  if (ec) {
    return fail_(failure, normalize_(ec), ParseStage::signature, 0);
  }

  Node header;
  ec = build_tree(source, header, options, failure);
  if (ec) {
    return ec;
  }
  Node root;
  ec = build_tree(source, root, options, failure);
  if (ec) {
    return ec;
  }

  const auto end = source.position();
  const auto total = source.size();
  if (total && end < *total) {
    spdlog::debug("ebml: ignoring {} trailing bytes after top-level element 0x{:X}",
                  *total - end,
                  root.element.id);
  }
  spdlog::debug("ebml document parsed: header fields={} segment children={} bytes={}",
                header.children.size(),
                root.children.size(),
                end);

  out = Document(std::move(header), std::move(root));
  return {};
}

}  // namespace ebml::tree
