#pragma once

#include "core/display_sink.h"

#include <ctime>
#include <iosfwd>
#include <memory>
#include <string>

namespace evx::infra {

/// Display sink for a terminal. Interactive sinks redraw the progress line in
/// place and color warnings; non-interactive ones (pipes, CI logs) print one
/// plain line per update.
class TerminalDisplaySink final : public evx::core::IDisplaySink {
public:
  TerminalDisplaySink(std::ostream &out, std::ostream &err, bool interactive);

  /// stdout/stderr, interactive when stdout is a TTY and TERM is not "dumb".
  static std::shared_ptr<TerminalDisplaySink> create_for_stdio();

  void render_task(const std::string &task_id, const evx::core::ProgressView &view,
                   bool replace) override;
  void render_transfer(const evx::core::ProgressView &view, bool replace) override;
  void message(const std::string &text) override;
  void warning(const std::string &text) override;
  [[nodiscard]] bool is_interactive() const override { return interactive_; }

  /// "14:02:11 42.00% (420/1000) completed... 12.5/s ETA: 14:03:00 (status=RUNNING)"
  static std::string format_task_line(const evx::core::ProgressView &view,
                                      std::time_t now);
  /// "Progress: 42.0% (440401920/1048576000 bytes) 12.4 MiB/s ETA: 00:00:48"
  static std::string format_transfer_line(const evx::core::ProgressView &view);

  static std::string format_bytes_per_second(double rate);
  static std::string format_duration(double seconds);

private:
  std::ostream &out_;
  std::ostream &err_;
  bool interactive_;
  bool line_open_ = false; // an in-place line is on screen without newline

  void emit_progress(const std::string &line, bool replace);
  void close_line();
};

} // namespace evx::infra
