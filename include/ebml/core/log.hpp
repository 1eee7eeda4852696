#pragma once

#include <cstdint>
#include <string_view>
#include <system_error>

namespace ebml::core {

/**
 * @brief 日志级别（用于库内 spdlog 日志的统一控制）。
 *
 * 说明：
 * - 本库内部日志使用 spdlog，但不把 spdlog 类型暴露到 public headers；
 * - 解析器在 trace 级别输出逐元素头信息，在 debug 级别输出解析结果与失败位置；
 * - 业务侧可通过 set_log_level 调整全局日志级别。
 */
enum class LogLevel : std::uint8_t {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    critical = 5,
    off = 6,
};

void set_log_level(LogLevel level) noexcept;
[[nodiscard]] LogLevel log_level() noexcept;

/**
 * @brief spdlog 的级别名（"trace"/"debug"/"warning"/.../"off"），用于命令行与配置输出。
 */
[[nodiscard]] std::string_view log_level_name(LogLevel level) noexcept;

/**
 * @brief 从名字解析级别（大小写不敏感，接受 spdlog 级别名及 "warn"/"err"）。
 *
 * 失败返回 core::errc::invalid_argument，out 不变。
 */
std::error_code parse_log_level(std::string_view text, LogLevel &out) noexcept;

} // namespace ebml::core
