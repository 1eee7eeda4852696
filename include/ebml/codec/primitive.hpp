#pragma once

#include "ebml/core/common.hpp"
#include "ebml/core/source.hpp"

#include <bit>
#include <cstddef>
#include <cstdint>
#include <string>
#include <system_error>
#include <vector>

namespace ebml::codec {

using byte = ebml::core::byte;
using bytes_view = ebml::core::bytes_view;

enum class errc : int {
  ok = 0,
  truncated = 1,
  invalid_length = 2,
  invalid_utf8 = 3,
  value_overflow = 4,
};

const std::error_category& error_category() noexcept;
std::error_code make_error_code(errc e) noexcept;

/**
 * @brief EBML 变长整数（vint）。
 *
 * 编码：首字节中第一个置 1 的 bit 位置给出总字节数（1..8），
 * 该标记位及其前面的 0 位为长度前缀，其余 bit 与后续字节按大端拼接为数值。
 * - 1 字节：0..127
 * - 2 字节：0..16383
 * - 每多一个字节多 7 个有效 bit，最多 8 字节 / 56 bit
 *
 * 元素 ID 使用同样的长度前缀，但不去掉前缀位：整段原始字节即 ID。
 */
inline constexpr std::size_t kMaxVintLength = 8;

/**
 * @brief 首字节中第一个置 1 bit 之前的 0 的个数（0..7）；0x00 返回 8。
 */
[[nodiscard]] constexpr unsigned leading_zero_count(byte b) noexcept {
  return static_cast<unsigned>(std::countl_zero(b));
}

/**
 * @brief 由首字节得到 vint 总字节数（1..8）。
 *
 * 0x00 没有标记位，按 8 字节处理（前缀掩码为 0），不视为错误。
 */
[[nodiscard]] constexpr std::size_t vint_length(byte first) noexcept {
  const auto n = static_cast<std::size_t>(leading_zero_count(first)) + 1;
  return n > kMaxVintLength ? kMaxVintLength : n;
}

/**
 * @brief 是否为保留的“未知长度”标记（所有数值 bit 均为 1）。
 */
[[nodiscard]] constexpr bool is_unknown_size(std::uint64_t value, std::size_t length) noexcept {
  if (length == 0 || length > kMaxVintLength) {
    return false;
  }
  return value == ((std::uint64_t{1} << (7u * length)) - 1u);
}

/**
 * @brief 从内存缓冲区解码一个 vint（去掉长度前缀）。
 *
 * 成功时 length 为消耗的字节数；缓冲区不足返回 errc::truncated。
 */
std::error_code decode_vint(bytes_view in, std::uint64_t& value, std::size_t& length) noexcept;

/**
 * @brief 从内存缓冲区解码一个元素 ID（保留长度前缀）。
 */
std::error_code decode_id(bytes_view in, std::uint64_t& id, std::size_t& length) noexcept;

/**
 * @brief 从字节源读取一个 vint / 元素 ID。
 *
 * 字节源短读时透传 core::errc::end_of_stream，由调用方决定如何归类。
 */
std::error_code read_vint(core::ByteSource& source, std::uint64_t& value, std::size_t& length) noexcept;
std::error_code read_id(core::ByteSource& source, std::uint64_t& id, std::size_t& length) noexcept;

/**
 * @brief 编码 value 所需的最小 vint 字节数（避开全 1 的保留值）；超出 56 bit 返回 0。
 */
[[nodiscard]] std::size_t vint_size(std::uint64_t value) noexcept;

/**
 * @brief 编码 vint 并追加到 out。
 *
 * length 为 0 时使用最小长度；指定长度放不下 value 返回 errc::value_overflow。
 * 仅用于测试夹具与工具输出，本库不提供写路径。
 */
std::error_code encode_vint(std::uint64_t value, std::vector<byte>& out, std::size_t length = 0) noexcept;

/**
 * @brief 定长 payload 到标量的转换（输入必须是完整 payload，不做部分读取）。
 *
 * - bytes_to_uint：大端累加；空 payload 为 0；超过 8 字节返回 errc::invalid_length
 * - bytes_to_int：按 payload 宽度做二进制补码符号扩展（首字节最高位为符号位）
 * - bytes_to_float：长度 > 4 按 64-bit IEEE754，否则按 32-bit 再扩展为 double；
 *   空 payload 为 0.0；超过 8 字节返回 errc::invalid_length
 * - bytes_to_utf8：严格校验 UTF-8，不做替换字符修补，非法返回 errc::invalid_utf8
 */
std::error_code bytes_to_uint(bytes_view in, std::uint64_t& out) noexcept;
std::error_code bytes_to_int(bytes_view in, std::int64_t& out) noexcept;
std::error_code bytes_to_float(bytes_view in, double& out) noexcept;
std::error_code bytes_to_utf8(bytes_view in, std::string& out) noexcept;

[[nodiscard]] bool is_valid_utf8(bytes_view in) noexcept;

}  // namespace ebml::codec

namespace std {
template <>
struct is_error_code_enum<ebml::codec::errc> : true_type {};
}  // namespace std
