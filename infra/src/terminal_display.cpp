#include "infra/terminal_display.h"

#include <unistd.h>

#include <cmath>
#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace evx::infra {

namespace {

constexpr const char *kClearLine = "\r\033[K";
constexpr const char *kYellow = "\033[33m";
constexpr const char *kReset = "\033[0m";

std::string clock_text(std::time_t when) {
  std::tm local{};
  localtime_r(&when, &local);
  std::ostringstream oss;
  oss << std::put_time(&local, "%H:%M:%S");
  return oss.str();
}

} // namespace

TerminalDisplaySink::TerminalDisplaySink(std::ostream &out, std::ostream &err,
                                         bool interactive)
    : out_(out), err_(err), interactive_(interactive) {}

std::shared_ptr<TerminalDisplaySink> TerminalDisplaySink::create_for_stdio() {
  const char *term = std::getenv("TERM");
  const bool dumb = term != nullptr && std::strcmp(term, "dumb") == 0;
  const bool interactive = ::isatty(STDOUT_FILENO) == 1 && !dumb;
  return std::make_shared<TerminalDisplaySink>(std::cout, std::cerr, interactive);
}

std::string TerminalDisplaySink::format_duration(double seconds) {
  if (!std::isfinite(seconds) || seconds < 0.0) {
    return "--:--:--";
  }
  const auto total = static_cast<long long>(std::llround(seconds));
  std::ostringstream oss;
  oss << std::setfill('0') << std::setw(2) << total / 3600 << ':'
      << std::setw(2) << (total / 60) % 60 << ':' << std::setw(2) << total % 60;
  return oss.str();
}

std::string TerminalDisplaySink::format_bytes_per_second(double rate) {
  static const char *const units[] = {"B/s", "KiB/s", "MiB/s", "GiB/s"};
  std::size_t unit = 0;
  double value = rate < 0.0 ? 0.0 : rate;
  while (value >= 1024.0 && unit + 1 < sizeof(units) / sizeof(units[0])) {
    value /= 1024.0;
    ++unit;
  }
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(1) << value << ' ' << units[unit];
  return oss.str();
}

std::string TerminalDisplaySink::format_task_line(const evx::core::ProgressView &view,
                                                  std::time_t now) {
  std::ostringstream oss;
  oss << clock_text(now) << ' ';

  const char *status = evx::core::to_string(view.status);
  if (!view.fraction || !view.total) {
    oss << "status=" << status << " (progress unavailable)";
    return oss.str();
  }

  oss << std::fixed << std::setprecision(2) << *view.fraction * 100.0 << "% ("
      << view.completed.value_or(0) << '/' << *view.total << ") completed...";
  if (view.rate && *view.rate > 0.0) {
    oss << ' ' << std::setprecision(1) << *view.rate << "/s";
  }
  if (view.remaining) {
    const auto eta = now + static_cast<std::time_t>(std::llround(view.remaining->count()));
    oss << " ETA: " << clock_text(eta);
  } else {
    oss << " ETA: calculating...";
  }
  oss << " (status=" << status << ')';
  return oss.str();
}

std::string TerminalDisplaySink::format_transfer_line(const evx::core::ProgressView &view) {
  std::ostringstream oss;
  const auto bytes = view.completed.value_or(0);
  if (view.fraction && view.total) {
    oss << "Progress: " << std::fixed << std::setprecision(1)
        << *view.fraction * 100.0 << "% (" << bytes << '/' << *view.total
        << " bytes)";
  } else {
    oss << "Downloaded: " << bytes << " bytes";
  }
  if (view.throughput) {
    oss << ' ' << format_bytes_per_second(*view.throughput);
  }
  if (view.remaining) {
    oss << " ETA: " << format_duration(view.remaining->count());
  }
  return oss.str();
}

void TerminalDisplaySink::render_task(const std::string &task_id,
                                      const evx::core::ProgressView &view,
                                      bool replace) {
  (void)task_id;
  emit_progress(format_task_line(view, std::time(nullptr)), replace);
}

void TerminalDisplaySink::render_transfer(const evx::core::ProgressView &view,
                                          bool replace) {
  emit_progress(format_transfer_line(view), replace);
}

void TerminalDisplaySink::message(const std::string &text) {
  close_line();
  out_ << text << '\n';
  out_.flush();
}

void TerminalDisplaySink::warning(const std::string &text) {
  close_line();
  if (interactive_) {
    err_ << kYellow << "Warning: " << text << kReset << '\n';
  } else {
    err_ << "Warning: " << text << '\n';
  }
  err_.flush();
}

void TerminalDisplaySink::emit_progress(const std::string &line, bool replace) {
  if (!interactive_) {
    out_ << line << '\n';
    out_.flush();
    return;
  }
  if (replace && line_open_) {
    out_ << kClearLine << line;
  } else {
    close_line();
    out_ << line;
  }
  line_open_ = true;
  out_.flush();
}

void TerminalDisplaySink::close_line() {
  if (line_open_) {
    out_ << '\n';
    line_open_ = false;
  }
}

} // namespace evx::infra
