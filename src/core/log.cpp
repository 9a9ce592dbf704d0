#include "dagcbor/core/log.hpp"

#include "log_internal.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <array>
#include <memory>
#include <utility>

namespace dagcbor::core {
namespace {

constexpr const char *kLoggerName = "dagcbor";

// LogLevel 与 spdlog 级别一一对应（按枚举值索引）。
constexpr std::array<std::pair<LogLevel, spdlog::level::level_enum>, 7> kLevels{{
    {LogLevel::trace, spdlog::level::trace},
    {LogLevel::debug, spdlog::level::debug},
    {LogLevel::info, spdlog::level::info},
    {LogLevel::warn, spdlog::level::warn},
    {LogLevel::error, spdlog::level::err},
    {LogLevel::critical, spdlog::level::critical},
    {LogLevel::off, spdlog::level::off},
}};

[[nodiscard]] spdlog::level::level_enum to_spdlog_level(LogLevel level) noexcept {
    for (const auto &[ours, theirs] : kLevels) {
        if (ours == level) {
            return theirs;
        }
    }
    return spdlog::level::off;
}

[[nodiscard]] LogLevel from_spdlog_level(spdlog::level::level_enum level) noexcept {
    for (const auto &[ours, theirs] : kLevels) {
        if (theirs == level) {
            return ours;
        }
    }
    return LogLevel::off;
}

std::shared_ptr<spdlog::logger> make_logger() noexcept {
    if (auto existing = spdlog::get(kLoggerName)) {
        return existing;
    }
    // 默认输出到 stderr；注册时沿用 spdlog 全局级别（默认 info，编解码失败日志不可见）。
    try {
        return spdlog::stderr_color_mt(kLoggerName);
    } catch (const spdlog::spdlog_ex &) {
        // 创建/注册失败时退回默认 logger。
        return spdlog::default_logger();
    }
}

} // namespace

namespace detail {

const std::shared_ptr<spdlog::logger> &logger() noexcept {
    static const std::shared_ptr<spdlog::logger> instance = make_logger();
    return instance;
}

} // namespace detail

void set_log_level(LogLevel level) noexcept {
    // spdlog::set_level 会同步到所有已注册 logger（包括 "dagcbor"），新建 logger 也沿用该级别。
    spdlog::set_level(to_spdlog_level(level));
}

LogLevel log_level() noexcept { return from_spdlog_level(spdlog::get_level()); }

} // namespace dagcbor::core
