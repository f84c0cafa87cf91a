#pragma once

#include "core/progress_estimator.h"

#include <string>

namespace evx::core {

/// Where the engine sends progress and outcome text. The core emits
/// structured values only; formatting, colors and in-place updates belong to
/// the implementation.
class IDisplaySink {
public:
  virtual ~IDisplaySink() = default;

  /// Task progress line. replace=true asks to overwrite the previous progress
  /// line when the sink is interactive.
  virtual void render_task(const std::string &task_id, const ProgressView &view,
                           bool replace) = 0;

  /// Byte transfer progress line (ProgressView in byte mode).
  virtual void render_transfer(const ProgressView &view, bool replace) = 0;

  virtual void message(const std::string &text) = 0;
  virtual void warning(const std::string &text) = 0;

  [[nodiscard]] virtual bool is_interactive() const = 0;
};

} // namespace evx::core
