#pragma once

#include "ebml/core/common.hpp"
#include "ebml/core/error.hpp"

#include <cstdint>
#include <iosfwd>
#include <optional>
#include <system_error>

namespace ebml::core {

/**
 * @brief 可定位、可读的字节源抽象（解析器唯一的输入依赖）。
 *
 * 注意：
 * - 该接口不规定底层是内存/文件/其他；打开文件等 I/O 准备由调用方完成；
 * - read 为“精确读取”：要么读满 out.size() 字节，要么返回错误；
 * - 解析期间解析器独占游标，实现无需线程安全。
 */
class ByteSource {
 public:
  virtual ~ByteSource() = default;

  /**
   * @brief 从当前位置精确读取 out.size() 字节。
   *
   * 剩余字节不足时返回 errc::end_of_stream（此时游标位置不作保证）。
   */
  virtual std::error_code read(mutable_bytes_view out) noexcept = 0;

  /**
   * @brief 定位到绝对偏移（允许等于 size，表示末尾）。
   */
  virtual std::error_code seek(std::uint64_t offset) noexcept = 0;

  [[nodiscard]] virtual std::uint64_t position() const noexcept = 0;

  /**
   * @brief 总字节数；未知时返回 nullopt（解析器会退化为“读到再说”）。
   */
  [[nodiscard]] virtual std::optional<std::uint64_t> size() const noexcept = 0;
};

/**
 * @brief 内存字节源：只引用外部缓冲区，不拷贝。
 *
 * 调用方需保证 data 在 MemorySource 生命周期内有效。
 */
class MemorySource final : public ByteSource {
 public:
  explicit MemorySource(bytes_view data) noexcept : data_(data) {}

  std::error_code read(mutable_bytes_view out) noexcept override;
  std::error_code seek(std::uint64_t offset) noexcept override;

  [[nodiscard]] std::uint64_t position() const noexcept override { return pos_; }
  [[nodiscard]] std::optional<std::uint64_t> size() const noexcept override { return data_.size(); }

 private:
  bytes_view data_{};
  std::size_t pos_{0};
};

/**
 * @brief std::istream 适配（典型为调用方以 binary 模式打开的 std::ifstream）。
 *
 * 说明：
 * - 构造时尝试探测总长度（seekg(end)），失败则 size() 为 nullopt；
 * - 不接管流的生命周期，也不改变流的异常掩码。
 */
class StreamSource final : public ByteSource {
 public:
  explicit StreamSource(std::istream &in);

  std::error_code read(mutable_bytes_view out) noexcept override;
  std::error_code seek(std::uint64_t offset) noexcept override;

  [[nodiscard]] std::uint64_t position() const noexcept override { return pos_; }
  [[nodiscard]] std::optional<std::uint64_t> size() const noexcept override { return size_; }

 private:
  std::istream *in_{nullptr};
  std::uint64_t base_{0};
  std::uint64_t pos_{0};
  std::optional<std::uint64_t> size_{};
};

}  // 命名空间 ebml::core
