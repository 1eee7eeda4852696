#include "ebml/codec/primitive.hpp"

#include <array>
#include <cstring>

namespace ebml::codec {
namespace {

class codec_error_category final : public std::error_category {
 public:
  const char* name() const noexcept override { return "ebml.codec"; }

  std::string message(int ev) const override {
    switch (static_cast<errc>(ev)) {
      case errc::ok:
        return "ok";
      case errc::truncated:
        return "truncated input";
      case errc::invalid_length:
        return "invalid payload length for element kind";
      case errc::invalid_utf8:
        return "invalid utf-8 sequence";
      case errc::value_overflow:
        return "value does not fit the vint length";
      default:
        return "unknown ebml.codec error";
    }
  }
};

std::uint64_t read_be_uint(bytes_view in) noexcept {
  std::uint64_t v = 0;
  for (byte b : in) {
    v = (v << 8) | static_cast<std::uint64_t>(b);
  }
  return v;
}

constexpr std::uint64_t vint_mask(std::size_t length) noexcept {
  // 首字节清除长度前缀后剩余的有效 bit：2^(8-length) - 1。
  return (std::uint64_t{1} << (8u - length)) - 1u;
}

// 读首字节 + 剩余 length-1 字节；mask_prefix 决定是否去掉长度前缀。
std::error_code read_prefixed(core::ByteSource& source,
                              bool mask_prefix,
                              std::uint64_t& value,
                              std::size_t& length) noexcept {
  std::array<byte, kMaxVintLength> buf{};
  auto ec = source.read(core::mutable_bytes_view{buf.data(), 1});
  if (ec) {
    return ec;
  }
  const auto n = vint_length(buf[0]);
  if (n > 1) {
    ec = source.read(core::mutable_bytes_view{buf.data() + 1, n - 1});
    if (ec) {
      return ec;
    }
  }
  if (mask_prefix) {
    buf[0] = static_cast<byte>(buf[0] & vint_mask(n));
  }
  value = read_be_uint(bytes_view{buf.data(), n});
  length = n;
  return {};
}

std::error_code decode_prefixed(bytes_view in,
                                bool mask_prefix,
                                std::uint64_t& value,
                                std::size_t& length) noexcept {
  if (in.empty()) {
    return make_error_code(errc::truncated);
  }
  const auto n = vint_length(in[0]);
  if (in.size() < n) {
    return make_error_code(errc::truncated);
  }
  std::uint64_t v = mask_prefix ? (in[0] & vint_mask(n)) : in[0];
  for (std::size_t i = 1; i < n; ++i) {
    v = (v << 8) | static_cast<std::uint64_t>(in[i]);
  }
  value = v;
  length = n;
  return {};
}

// 期望的 continuation byte 个数；非法首字节返回 -1。
int utf8_tail_length(byte lead) noexcept {
  if (lead < 0x80) {
    return 0;
  }
  if (lead >= 0xC2 && lead <= 0xDF) {
    return 1;
  }
  if (lead >= 0xE0 && lead <= 0xEF) {
    return 2;
  }
  if (lead >= 0xF0 && lead <= 0xF4) {
    return 3;
  }
  return -1;
}

}  // namespace

const std::error_category& error_category() noexcept {
  static codec_error_category category;
  return category;
}

std::error_code make_error_code(errc e) noexcept {
  return {static_cast<int>(e), error_category()};
}

std::error_code decode_vint(bytes_view in, std::uint64_t& value, std::size_t& length) noexcept {
  return decode_prefixed(in, true, value, length);
}

std::error_code decode_id(bytes_view in, std::uint64_t& id, std::size_t& length) noexcept {
  return decode_prefixed(in, false, id, length);
}

std::error_code read_vint(core::ByteSource& source, std::uint64_t& value, std::size_t& length) noexcept {
  return read_prefixed(source, true, value, length);
}

std::error_code read_id(core::ByteSource& source, std::uint64_t& id, std::size_t& length) noexcept {
  return read_prefixed(source, false, id, length);
}

std::size_t vint_size(std::uint64_t value) noexcept {
  for (std::size_t n = 1; n <= kMaxVintLength; ++n) {
    // 全 1 为保留的“未知长度”，需要多用一个字节。
    if (value < ((std::uint64_t{1} << (7u * n)) - 1u)) {
      return n;
    }
  }
  return 0;
}

std::error_code encode_vint(std::uint64_t value, std::vector<byte>& out, std::size_t length) noexcept {
  if (length == 0) {
    length = vint_size(value);
    if (length == 0) {
      return make_error_code(errc::value_overflow);
    }
  }
  if (length > kMaxVintLength || value > ((std::uint64_t{1} << (7u * length)) - 1u)) {
    return make_error_code(errc::value_overflow);
  }
  const auto marker = std::uint64_t{1} << (7u * length);
  const auto encoded = value | marker;
  for (std::size_t i = 0; i < length; ++i) {
    const auto shift = static_cast<unsigned>(8u * (length - 1u - i));
    out.push_back(static_cast<byte>((encoded >> shift) & 0xFFu));
  }
  return {};
}

std::error_code bytes_to_uint(bytes_view in, std::uint64_t& out) noexcept {
  if (in.size() > 8) {
    return make_error_code(errc::invalid_length);
  }
  out = read_be_uint(in);
  return {};
}

std::error_code bytes_to_int(bytes_view in, std::int64_t& out) noexcept {
  if (in.size() > 8) {
    return make_error_code(errc::invalid_length);
  }
  if (in.empty()) {
    out = 0;
    return {};
  }
  // 先按符号位预填全 1，再逐字节左移拼接，即完成对 payload 宽度的符号扩展。
  std::uint64_t v = (in[0] & 0x80u) != 0 ? ~std::uint64_t{0} : 0;
  for (byte b : in) {
    v = (v << 8) | static_cast<std::uint64_t>(b);
  }
  out = static_cast<std::int64_t>(v);
  return {};
}

std::error_code bytes_to_float(bytes_view in, double& out) noexcept {
  if (in.size() > 8) {
    return make_error_code(errc::invalid_length);
  }
  if (in.empty()) {
    out = 0.0;
    return {};
  }
  const auto bits = read_be_uint(in);
  if (in.size() > 4) {
    out = std::bit_cast<double>(bits);
  } else {
    out = static_cast<double>(std::bit_cast<float>(static_cast<std::uint32_t>(bits)));
  }
  return {};
}

bool is_valid_utf8(bytes_view in) noexcept {
  std::size_t i = 0;
  while (i < in.size()) {
    const byte lead = in[i];
    const int tail = utf8_tail_length(lead);
    if (tail < 0) {
      return false;
    }
    if (in.size() - i - 1 < static_cast<std::size_t>(tail)) {
      return false;
    }
    for (int k = 1; k <= tail; ++k) {
      if ((in[i + static_cast<std::size_t>(k)] & 0xC0u) != 0x80u) {
        return false;
      }
    }
    if (tail >= 2) {
      const byte second = in[i + 1];
      // 拒绝超长编码、UTF-16 代理区以及 > U+10FFFF 的码点。
      if (lead == 0xE0 && second < 0xA0) {
        return false;
      }
      if (lead == 0xED && second > 0x9F) {
        return false;
      }
      if (lead == 0xF0 && second < 0x90) {
        return false;
      }
      if (lead == 0xF4 && second > 0x8F) {
        return false;
      }
    }
    i += static_cast<std::size_t>(tail) + 1;
  }
  return true;
}

std::error_code bytes_to_utf8(bytes_view in, std::string& out) noexcept {
  if (!is_valid_utf8(in)) {
    return make_error_code(errc::invalid_utf8);
  }
  out.assign(reinterpret_cast<const char*>(in.data()), in.size());
  return {};
}

}  // namespace ebml::codec
