#include "ebml/core/log.hpp"

#include "ebml/core/error.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <cctype>
#include <string>

namespace ebml::core {
namespace {

struct LevelEntry final {
    LogLevel level;
    spdlog::level::level_enum native;
};

constexpr std::array<LevelEntry, 7> kLevels{{
    {LogLevel::trace, spdlog::level::trace},
    {LogLevel::debug, spdlog::level::debug},
    {LogLevel::info, spdlog::level::info},
    {LogLevel::warn, spdlog::level::warn},
    {LogLevel::error, spdlog::level::err},
    {LogLevel::critical, spdlog::level::critical},
    {LogLevel::off, spdlog::level::off},
}};

// 最长的级别名是 "critical"/"warning"；更长的输入一定不是级别名。
constexpr std::size_t kMaxLevelNameLength = 8;

[[nodiscard]] spdlog::level::level_enum to_native_(LogLevel level) noexcept {
    for (const auto &entry : kLevels) {
        if (entry.level == level) {
            return entry.native;
        }
    }
    return spdlog::level::off;
}

[[nodiscard]] LogLevel from_native_(spdlog::level::level_enum native) noexcept {
    for (const auto &entry : kLevels) {
        if (entry.native == native) {
            return entry.level;
        }
    }
    return LogLevel::off;
}

} // namespace

void set_log_level(LogLevel level) noexcept {
    // 宿主程序可能另外配置了 spdlog；这里只改全局级别，不替换 sink。
    spdlog::set_level(to_native_(level));
}

LogLevel log_level() noexcept {
    return from_native_(spdlog::get_level());
}

std::string_view log_level_name(LogLevel level) noexcept {
    const auto name = spdlog::level::to_string_view(to_native_(level));
    return std::string_view{name.data(), name.size()};
}

std::error_code parse_log_level(std::string_view text, LogLevel &out) noexcept {
    if (text.empty() || text.size() > kMaxLevelNameLength) {
        return make_error_code(errc::invalid_argument);
    }
    std::string lower(text);
    for (auto &c : lower) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    // from_str 对未知名字同样返回 off，需要单独区分。
    const auto native = spdlog::level::from_str(lower);
    if (native == spdlog::level::off && lower != "off") {
        return make_error_code(errc::invalid_argument);
    }
    out = from_native_(native);
    return {};
}

} // namespace ebml::core
