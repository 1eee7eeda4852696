#pragma once

#include <system_error>

namespace ebml::core {

/**
 * @brief 字节源层错误码（ByteSource 及其实现复用）。
 *
 * 约定：
 * - 本库所有解析/访问接口返回 std::error_code，不抛异常、不终止进程；
 * - end_of_stream：请求的字节数超过剩余可读字节（上层会映射为 truncated）；
 * - io_error：底层流报告读/定位失败；
 * - invalid_argument：定位到范围之外等调用方错误。
 */
enum class errc : int {
  ok = 0,
  end_of_stream = 1,
  io_error = 2,
  invalid_argument = 3,
};

const std::error_category& error_category() noexcept;
std::error_code make_error_code(errc e) noexcept;

}  // namespace ebml::core

namespace std {
template <>
struct is_error_code_enum<ebml::core::errc> : true_type {};
}  // namespace std
