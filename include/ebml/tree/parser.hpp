#pragma once

#include "ebml/core/common.hpp"
#include "ebml/core/source.hpp"
#include "ebml/tree/document.hpp"
#include "ebml/tree/node.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <system_error>

namespace ebml::tree {

enum class errc : int {
  ok = 0,
  truncated = 1,
  bad_signature = 2,
  span_mismatch = 3,
  unknown_size = 4,
  depth_exceeded = 5,
  element_too_large = 6,
  io_error = 7,
};

const std::error_category& error_category() noexcept;
std::error_code make_error_code(errc e) noexcept;

// 流首 4 字节必须等于 EBML 头 ID 的原始字节。
inline constexpr std::array<byte, 4> kSignature{0x1A, 0x45, 0xDF, 0xA3};

/**
 * @brief 解析限制（用于约束不可信输入的资源消耗）。
 */
struct ParseOptions final {
  // master 元素最大嵌套深度（顶层元素深度为 0）。
  std::size_t max_depth{core::kDefaultMaxDepth};

  // 单个非 master 元素 payload 的最大字节数（超出返回 errc::element_too_large）。
  std::uint64_t max_element_size{core::kDefaultMaxElementSize};
};

/**
 * @brief 失败发生的阶段。
 */
enum class ParseStage : std::uint8_t {
  none = 0,
  signature = 1,
  element_id = 2,
  element_size = 3,
  element_data = 4,
  children = 5,
};

[[nodiscard]] std::string_view stage_name(ParseStage stage) noexcept;

/**
 * @brief 失败定位信息（可选输出）。
 *
 * - offset：出错元素 ID 首字节的绝对偏移（签名阶段为 0）
 * - element_id：已读出 ID 时给出
 */
struct ParseFailure final {
  ParseStage stage{ParseStage::none};
  std::uint64_t offset{0};
  std::optional<std::uint64_t> element_id{};
};

/**
 * @brief 从当前位置读取一个元素（头部 + 非 master 的 payload）。
 *
 * master 元素只读头部，data 留空，游标停在第一个子元素处。
 */
std::error_code parse_element(core::ByteSource& source,
                              Element& out,
                              const ParseOptions& options = {},
                              ParseFailure* failure = nullptr) noexcept;

/**
 * @brief 从当前位置递归构建一棵子树。
 *
 * master 元素按声明长度消费子元素；子元素越过父元素边界返回 errc::span_mismatch，
 * 不做静默截断或延长。
 */
std::error_code build_tree(core::ByteSource& source,
                           Node& out,
                           const ParseOptions& options = {},
                           ParseFailure* failure = nullptr) noexcept;

/**
 * @brief 校验流首 4 字节签名（从当前位置读取）。
 */
std::error_code check_signature(core::ByteSource& source, ParseFailure* failure = nullptr) noexcept;

/**
 * @brief 解析完整文档：签名校验 -> 回到偏移 0 -> 依次构建 header 与 root。
 *
 * 说明：
 * - 签名不符时立即返回 errc::bad_signature，不尝试建树；
 * - 只建模第一个 Segment；其后的字节被忽略（debug 日志中记录）；
 * - 失败时 out 保持不变。
 */
std::error_code parse_document(core::ByteSource& source,
                               Document& out,
                               const ParseOptions& options = {},
                               ParseFailure* failure = nullptr) noexcept;

}  // namespace ebml::tree

namespace std {
template <>
struct is_error_code_enum<ebml::tree::errc> : true_type {};
}  // namespace std
