#pragma once

#include "ebml/core/common.hpp"
#include "ebml/schema/registry.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace ebml::tree {

using byte = ebml::core::byte;
using bytes_view = ebml::core::bytes_view;

/**
 * @brief 非 master 元素的 payload（不透明字节缓冲区）。
 *
 * 约定：
 * - 所有转换均可重复调用，不修改内部状态；
 * - to_bool 仅当整数值恰好为 1 时为 true（其他非零值一律为 false）。
 */
class ElementData final {
 public:
  ElementData() = default;
  explicit ElementData(std::vector<byte> bytes) noexcept : bytes_(std::move(bytes)) {}

  [[nodiscard]] bytes_view bytes() const noexcept { return bytes_view{bytes_.data(), bytes_.size()}; }
  [[nodiscard]] std::size_t size() const noexcept { return bytes_.size(); }
  [[nodiscard]] bool empty() const noexcept { return bytes_.empty(); }

  std::error_code to_uint(std::uint64_t& out) const noexcept;
  std::error_code to_int(std::int64_t& out) const noexcept;
  std::error_code to_float(double& out) const noexcept;
  std::error_code to_utf8(std::string& out) const noexcept;
  std::error_code to_bool(bool& out) const noexcept;

  friend bool operator==(const ElementData&, const ElementData&) = default;

 private:
  std::vector<byte> bytes_;
};

/**
 * @brief 单个 EBML 元素（头部 + payload）。
 *
 * - declared_size：头部声明的 payload 字节数（master 也记录，用于跨度校验）
 * - offset：ID 首字节在流中的绝对偏移
 * - header_size：ID 字节数 + size 字节数
 * - data：master 时为空（数据在子节点里），否则恰好 declared_size 字节
 */
struct Element final {
  std::uint64_t id{0};
  std::uint64_t declared_size{0};
  schema::ElementKind kind{schema::ElementKind::unknown};
  std::uint64_t offset{0};
  std::uint8_t header_size{0};
  ElementData data{};

  [[nodiscard]] std::uint64_t encoded_size() const noexcept { return header_size + declared_size; }
  [[nodiscard]] std::uint64_t payload_offset() const noexcept { return offset + header_size; }
};

/**
 * @brief 通用树节点。
 *
 * 不变量：children 仅在 master 元素上非空；且所有子节点 encoded_size() 之和
 * 恰好等于 element.declared_size（解析器保证，不符即解析失败）。
 */
struct Node final {
  Element element{};
  std::vector<Node> children{};

  [[nodiscard]] bool is_master() const noexcept { return element.kind == schema::ElementKind::master; }

  /**
   * @brief 第一个 ID 匹配的直接子节点；没有返回 nullptr。
   */
  [[nodiscard]] const Node* find_child(std::uint64_t id) const noexcept;

  /**
   * @brief 所有 ID 匹配的直接子节点（文档顺序）。
   */
  [[nodiscard]] std::vector<const Node*> find_children(std::uint64_t id) const;
};

}  // namespace ebml::tree
