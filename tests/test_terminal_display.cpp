#include <gtest/gtest.h>

#include "infra/terminal_display.h"

#include <chrono>
#include <ctime>
#include <sstream>
#include <string>

using namespace evx::infra;
using evx::core::ProgressView;
using evx::core::Seconds;
using evx::core::TaskStatus;

namespace {

ProgressView running_view(std::uint64_t completed, std::uint64_t total) {
  ProgressView view;
  view.status = TaskStatus::Running;
  view.completed = completed;
  view.total = total;
  view.fraction = static_cast<double>(completed) / static_cast<double>(total);
  return view;
}

std::time_t local_noon() {
  std::tm tm{};
  tm.tm_year = 124;
  tm.tm_mon = 0;
  tm.tm_mday = 15;
  tm.tm_hour = 12;
  tm.tm_isdst = -1;
  return std::mktime(&tm);
}

} // namespace

TEST(TerminalDisplayTest, TaskLineWithEta) {
  ProgressView view = running_view(420, 1000);
  view.rate = 12.5;
  view.remaining = Seconds(90.0);

  const std::string line = TerminalDisplaySink::format_task_line(view, local_noon());

  EXPECT_EQ(line, "12:00:00 42.00% (420/1000) completed... 12.5/s ETA: 12:01:30 "
                  "(status=RUNNING)");
}

TEST(TerminalDisplayTest, TaskLineWhileRateIsUnknown) {
  const std::string line =
      TerminalDisplaySink::format_task_line(running_view(0, 1000), local_noon());

  EXPECT_NE(line.find("0.00% (0/1000)"), std::string::npos);
  EXPECT_NE(line.find("ETA: calculating..."), std::string::npos);
}

TEST(TerminalDisplayTest, TaskLineWithoutTotal) {
  ProgressView view;
  view.status = TaskStatus::Pending;

  const std::string line = TerminalDisplaySink::format_task_line(view, local_noon());

  EXPECT_EQ(line, "12:00:00 status=PENDING (progress unavailable)");
}

TEST(TerminalDisplayTest, TransferLine) {
  ProgressView view = running_view(512 * 1024, 1024 * 1024);
  view.throughput = 256.0 * 1024;
  view.remaining = Seconds(2.0);

  EXPECT_EQ(TerminalDisplaySink::format_transfer_line(view),
            "Progress: 50.0% (524288/1048576 bytes) 256.0 KiB/s ETA: 00:00:02");
}

TEST(TerminalDisplayTest, TransferLineWithoutContentLength) {
  ProgressView view;
  view.completed = 2048;

  EXPECT_EQ(TerminalDisplaySink::format_transfer_line(view), "Downloaded: 2048 bytes");
}

TEST(TerminalDisplayTest, Formatting) {
  EXPECT_EQ(TerminalDisplaySink::format_duration(3725.0), "01:02:05");
  EXPECT_EQ(TerminalDisplaySink::format_duration(-1.0), "--:--:--");
  EXPECT_EQ(TerminalDisplaySink::format_bytes_per_second(512.0), "512.0 B/s");
  EXPECT_EQ(TerminalDisplaySink::format_bytes_per_second(3.5 * 1024 * 1024), "3.5 MiB/s");
}

TEST(TerminalDisplayTest, NonInteractivePrintsOneLinePerUpdate) {
  std::ostringstream out;
  std::ostringstream err;
  TerminalDisplaySink sink(out, err, false);

  sink.render_transfer(running_view(1, 4), false);
  sink.render_transfer(running_view(2, 4), true);
  sink.warning("careful");

  EXPECT_EQ(out.str(), "Progress: 25.0% (1/4 bytes)\nProgress: 50.0% (2/4 bytes)\n");
  EXPECT_EQ(err.str(), "Warning: careful\n");
  EXPECT_EQ(out.str().find('\r'), std::string::npos);
}

TEST(TerminalDisplayTest, InteractiveRedrawsInPlace) {
  std::ostringstream out;
  std::ostringstream err;
  TerminalDisplaySink sink(out, err, true);

  sink.render_transfer(running_view(1, 4), false);
  sink.render_transfer(running_view(2, 4), true);
  sink.message("done");

  EXPECT_EQ(out.str(), "Progress: 25.0% (1/4 bytes)\r\033[KProgress: 50.0% (2/4 bytes)\ndone\n");
}
