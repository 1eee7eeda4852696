#include "ebml/utils/node_dump.hpp"

#include "ebml/schema/registry.hpp"
#include "ebml/utils/hex.hpp"

#include <algorithm>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string_view>
#include <system_error>

namespace ebml::utils {
namespace {

struct Ansi final {
  static constexpr const char* reset = "\033[0m";
  static constexpr const char* id = "\033[2m";
  static constexpr const char* name = "\033[1;35m";
  static constexpr const char* string = "\033[1;32m";
  static constexpr const char* value = "\033[1;33m";
  static constexpr const char* error = "\033[1;31m";
};

[[nodiscard]] const char* ansi_(bool enable, const char* code) noexcept {
  return enable ? code : "";
}

struct DumpContext final {
  std::ostringstream oss;
  NodeDumpOptions options{};
};

void append_quoted_(DumpContext& ctx, const std::string& s) {
  const auto limit = ctx.options.max_payload_bytes;
  auto n = limit == 0 ? s.size() : std::min(s.size(), limit);
  // 截断点落在多字节字符中间时退回到该字符起始处。
  while (n > 0 && n < s.size() && (static_cast<unsigned char>(s[n]) & 0xC0u) == 0x80u) {
    --n;
  }
  auto& oss = ctx.oss;

  oss << ansi_(ctx.options.enable_color, Ansi::string) << '"';
  for (std::size_t i = 0; i < n; ++i) {
    const auto c = static_cast<unsigned char>(s[i]);
    if (c == '\\' || c == '"') {
      oss << '\\' << static_cast<char>(c);
    } else if (c < 0x20 || c == 0x7F) {
      oss << "\\x" << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(c) << std::dec;
    } else {
      // UTF-8 多字节序列原样输出。
      oss << static_cast<char>(c);
    }
  }
  if (n < s.size()) {
    oss << "...";
  }
  oss << '"' << ansi_(ctx.options.enable_color, Ansi::reset);
}

void append_error_(DumpContext& ctx, const std::error_code& ec) {
  ctx.oss << ansi_(ctx.options.enable_color, Ansi::error) << "<invalid: " << ec.message() << '>'
          << ansi_(ctx.options.enable_color, Ansi::reset);
}

void append_value_(DumpContext& ctx, const tree::Element& element) {
  const bool color = ctx.options.enable_color;
  const auto& data = element.data;
  auto& oss = ctx.oss;

  switch (element.kind) {
    case schema::ElementKind::uinteger: {
      std::uint64_t v = 0;
      if (auto ec = data.to_uint(v)) {
        append_error_(ctx, ec);
        return;
      }
      oss << ansi_(color, Ansi::value) << v << ansi_(color, Ansi::reset);
      return;
    }
    case schema::ElementKind::integer:
    case schema::ElementKind::date: {
      std::int64_t v = 0;
      if (auto ec = data.to_int(v)) {
        append_error_(ctx, ec);
        return;
      }
      oss << ansi_(color, Ansi::value) << v << ansi_(color, Ansi::reset);
      return;
    }
    case schema::ElementKind::floating: {
      double v = 0.0;
      if (auto ec = data.to_float(v)) {
        append_error_(ctx, ec);
        return;
      }
      oss << ansi_(color, Ansi::value) << std::setprecision(10) << v << ansi_(color, Ansi::reset);
      return;
    }
    case schema::ElementKind::string:
    case schema::ElementKind::utf8: {
      std::string v;
      if (auto ec = data.to_utf8(v)) {
        append_error_(ctx, ec);
        return;
      }
      append_quoted_(ctx, v);
      return;
    }
    case schema::ElementKind::binary:
    case schema::ElementKind::unknown:
    case schema::ElementKind::master:
      break;
  }
  oss << ansi_(color, Ansi::value) << to_hex(data.bytes(), ctx.options.max_payload_bytes)
      << ansi_(color, Ansi::reset);
}

void append_node_(DumpContext& ctx, const tree::Node& node, std::size_t depth) {
  const auto& opt = ctx.options;
  const bool color = opt.enable_color;
  const auto* reset = ansi_(color, Ansi::reset);
  const auto& element = node.element;
  auto& oss = ctx.oss;

  const auto name = schema::element_name(element.id);

  oss << std::string(depth * opt.indent_spaces, ' ');
  oss << ansi_(color, Ansi::id) << "[0x" << std::uppercase << std::hex << element.id << std::dec
      << std::nouppercase << ']' << reset << ' ';
  oss << ansi_(color, Ansi::name) << (name.empty() ? std::string_view{"Unknown"} : name) << reset;
  oss << " (" << schema::kind_name(element.kind) << ", size=" << element.declared_size;
  if (opt.show_offset) {
    oss << " @" << element.offset;
  }
  oss << ')';

  if (!node.is_master()) {
    const bool opaque =
        element.kind == schema::ElementKind::binary || element.kind == schema::ElementKind::unknown;
    if (!opaque || !element.data.empty()) {
      oss << " = ";
      append_value_(ctx, element);
    }
    oss << '\n';
    return;
  }

  if (node.children.empty()) {
    oss << '\n';
    return;
  }
  if (depth >= opt.max_depth) {
    oss << " { ... " << node.children.size() << " children }\n";
    return;
  }
  oss << '\n';

  const auto total = node.children.size();
  const auto n = opt.max_children == 0 ? total : std::min(total, opt.max_children);
  for (std::size_t i = 0; i < n; ++i) {
    append_node_(ctx, node.children[i], depth + 1);
  }
  if (n < total) {
    oss << std::string((depth + 1) * opt.indent_spaces, ' ') << "... (" << (total - n) << " more)\n";
  }
}

}  // namespace

std::string dump_node(const tree::Node& node, NodeDumpOptions options) {
  DumpContext ctx;
  ctx.options = options;
  append_node_(ctx, node, 0);
  return ctx.oss.str();
}

std::string dump_document(const tree::Document& doc, NodeDumpOptions options) {
  return dump_node(doc.header(), options) + dump_node(doc.root(), options);
}

}  // namespace ebml::utils
