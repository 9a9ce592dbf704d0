#pragma once

#include <spdlog/logger.h>

#include <memory>

namespace dagcbor::core::detail {

// 库内部共享的 spdlog logger（名称 "dagcbor"）。
// 首次调用时查找或创建并注册，此后返回同一实例；
// 业务侧若要接管输出，须在首次编解码前注册同名 logger。
[[nodiscard]] const std::shared_ptr<spdlog::logger> &logger() noexcept;

} // namespace dagcbor::core::detail
