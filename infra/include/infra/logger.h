#pragma once

#include "core/logger.h"

#include <memory>

namespace evx::infra {

enum class LogLevel { Info, Warn, Error, Off };

/// spdlog-backed console logger writing to stderr (stdout is reserved for
/// the progress display).
/// Format: [ts] [level] [trace_id] [component] event: msg
std::shared_ptr<evx::core::ILogger>
create_console_logger(LogLevel level = LogLevel::Warn);

} // namespace evx::infra
