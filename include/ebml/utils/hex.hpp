#pragma once

#include "ebml/core/common.hpp"
#include "ebml/core/error.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace ebml::utils {

struct HexDumpOptions final {
  // 每行字节数（0 按 16 处理）。
  std::size_t bytes_per_line{16};

  // 最多输出的字节数（0 表示不限制），超出时追加截断提示行。
  std::size_t max_bytes{256};

  // 行首输出偏移（"0010: "）。
  bool show_offset{true};

  // 行尾输出可打印 ASCII 列。
  bool show_ascii{false};

  // ANSI 颜色（写入文件时关闭）。
  bool enable_color{false};
};

/**
 * @brief 多行 hexdump，每行以 '\n' 结尾；空输入返回空串。
 */
[[nodiscard]] std::string hex_dump(core::bytes_view bytes, HexDumpOptions options = {});

/**
 * @brief 单行紧凑形式："1A 45 DF A3"；超过 max_bytes（非 0）时以 " ..." 结尾。
 */
[[nodiscard]] std::string to_hex(core::bytes_view bytes, std::size_t max_bytes = 0);

/**
 * @brief 解析 16 进制文本为字节序列（用于测试夹具与命令行输入）。
 *
 * 接受大小写、可选 0x 前缀，以及空白/逗号/冒号/连字符/下划线分隔；
 * 奇数个 nibble 或非法字符返回 core::errc::invalid_argument，此时 out 不变。
 */
std::error_code parse_hex(std::string_view text, std::vector<core::byte>& out) noexcept;

}  // namespace ebml::utils
