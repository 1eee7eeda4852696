#include "ebml/utils/hex.hpp"

#include <algorithm>
#include <array>
#include <new>
#include <utility>

namespace ebml::utils {
namespace {

constexpr std::string_view kDigits = "0123456789ABCDEF";

constexpr const char* kReset = "\033[0m";
constexpr const char* kDim = "\033[2m";
constexpr const char* kBytes = "\033[1;33m";
constexpr const char* kAscii = "\033[1;32m";
constexpr const char* kWarn = "\033[1;31m";

void put_byte_(std::string& out, core::byte b) {
  out.push_back(kDigits[b >> 4u]);
  out.push_back(kDigits[b & 0x0Fu]);
}

// 0..15；非 16 进制字符返回 -1。
[[nodiscard]] int nibble_(char c) noexcept {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

[[nodiscard]] bool is_separator_(char c) noexcept {
  constexpr std::string_view kSeparators = " \t\r\n,;:-_";
  return kSeparators.find(c) != std::string_view::npos;
}

}  // namespace

std::string hex_dump(core::bytes_view bytes, HexDumpOptions options) {
  const auto* reset = options.enable_color ? kReset : "";
  const auto per_line = options.bytes_per_line == 0 ? std::size_t{16} : options.bytes_per_line;
  const auto shown =
      options.max_bytes == 0 ? bytes.size() : std::min(bytes.size(), options.max_bytes);

  std::string out;
  for (std::size_t line = 0; line < shown; line += per_line) {
    const auto n = std::min(per_line, shown - line);

    if (options.show_offset) {
      out += options.enable_color ? kDim : "";
      std::array<char, 9> buf{};
      std::size_t len = 0;
      // 至少 4 位，按需加宽。
      for (int shift = 28; shift >= 0; shift -= 4) {
        const auto digit = (line >> static_cast<unsigned>(shift)) & 0x0Fu;
        if (len == 0 && digit == 0 && shift >= 16) {
          continue;
        }
        buf[len++] = kDigits[digit];
      }
      out.append(buf.data(), len);
      out += ": ";
      out += reset;
    }

    out += options.enable_color ? kBytes : "";
    for (std::size_t i = 0; i < n; ++i) {
      if (i != 0) {
        out.push_back(' ');
      }
      put_byte_(out, bytes[line + i]);
    }
    out += reset;

    if (options.show_ascii) {
      // 最后一行不足一整行时补空格，使 ASCII 列对齐。
      out.append((per_line - n) * 3 + 2, ' ');
      out += options.enable_color ? kAscii : "";
      for (std::size_t i = 0; i < n; ++i) {
        const auto c = bytes[line + i];
        out.push_back(c >= 0x20 && c <= 0x7E ? static_cast<char>(c) : '.');
      }
      out += reset;
    }
    out.push_back('\n');
  }

  if (shown < bytes.size()) {
    out += options.enable_color ? kWarn : "";
    out += "... (truncated, total=" + std::to_string(bytes.size()) + " bytes)";
    out += reset;
    out.push_back('\n');
  }
  return out;
}

std::string to_hex(core::bytes_view bytes, std::size_t max_bytes) {
  const auto shown = max_bytes == 0 ? bytes.size() : std::min(bytes.size(), max_bytes);
  std::string out;
  out.reserve(shown * 3 + 4);
  for (std::size_t i = 0; i < shown; ++i) {
    if (i != 0) {
      out.push_back(' ');
    }
    put_byte_(out, bytes[i]);
  }
  if (shown < bytes.size()) {
    out += " ...";
  }
  return out;
}

std::error_code parse_hex(std::string_view text, std::vector<core::byte>& out) noexcept {
  std::vector<core::byte> bytes;
  int high = -1;

  try {
    bytes.reserve(text.size() / 2);
    for (std::size_t i = 0; i < text.size(); ++i) {
      const char c = text[i];
      if (is_separator_(c)) {
        continue;
      }
      // 仅在字节边界识别 0x 前缀，避免吞掉 "A0 x..." 之类的非法输入。
      if (high < 0 && c == '0' && i + 1 < text.size() && (text[i + 1] == 'x' || text[i + 1] == 'X')) {
        ++i;
        continue;
      }
      const int v = nibble_(c);
      if (v < 0) {
        return core::make_error_code(core::errc::invalid_argument);
      }
      if (high < 0) {
        high = v;
      } else {
        bytes.push_back(static_cast<core::byte>((high << 4) | v));
        high = -1;
      }
    }
  } catch (const std::bad_alloc&) {
    return core::make_error_code(core::errc::invalid_argument);
  }

  if (high >= 0) {
    return core::make_error_code(core::errc::invalid_argument);
  }
  out = std::move(bytes);
  return {};
}

}  // namespace ebml::utils
