#pragma once

#include <cstdint>
#include <span>
#include <string_view>

namespace ebml::schema {

/**
 * @brief 元素语义类别：决定 payload 字节如何解释。
 *
 * - master：payload 为子元素序列，解析器递归建树
 * - unknown：未登记的 ID，按不透明二进制保留，绝不递归，也不报错
 * - date：有符号整数，单位为纳秒，起点 2001-01-01T00:00:00 UTC
 */
enum class ElementKind : std::uint8_t {
  unknown = 0,
  master = 1,
  uinteger = 2,
  integer = 3,
  floating = 4,
  string = 5,
  utf8 = 6,
  date = 7,
  binary = 8,
};

struct ElementInfo final {
  std::uint64_t id{0};
  ElementKind kind{ElementKind::unknown};
  std::string_view name{};
};

/**
 * @brief 查询登记信息；未登记返回 nullptr。
 *
 * 表为编译期常量（按 ID 排序后二分查找），无可变全局状态，可并发调用。
 */
[[nodiscard]] const ElementInfo* find_element_info(std::uint64_t id) noexcept;

/**
 * @brief 元素类别；未登记返回 ElementKind::unknown。
 */
[[nodiscard]] ElementKind element_kind(std::uint64_t id) noexcept;

/**
 * @brief 元素名（仅用于诊断输出）；未登记返回空串。
 */
[[nodiscard]] std::string_view element_name(std::uint64_t id) noexcept;

[[nodiscard]] std::string_view kind_name(ElementKind kind) noexcept;

/**
 * @brief 全部登记项（按 ID 升序）。
 */
[[nodiscard]] std::span<const ElementInfo> registered_elements() noexcept;

}  // namespace ebml::schema
