#include <gtest/gtest.h>

#include "core/task.h"

using namespace evx::core;

TEST(TaskStatusTest, ParsesCanonicalNames) {
  EXPECT_EQ(parse_task_status("PENDING"), TaskStatus::Pending);
  EXPECT_EQ(parse_task_status("RUNNING"), TaskStatus::Running);
  EXPECT_EQ(parse_task_status("FINISHED"), TaskStatus::Finished);
  EXPECT_EQ(parse_task_status("FAILED"), TaskStatus::Failed);
  EXPECT_EQ(parse_task_status("CANCELLED"), TaskStatus::Cancelled);
}

TEST(TaskStatusTest, ParsingIsCaseInsensitive) {
  EXPECT_EQ(parse_task_status("finished"), TaskStatus::Finished);
  EXPECT_EQ(parse_task_status("Running"), TaskStatus::Running);
}

TEST(TaskStatusTest, AcceptsBothCanceledSpellings) {
  EXPECT_EQ(parse_task_status("CANCELED"), TaskStatus::Cancelled);
  EXPECT_EQ(parse_task_status("canceled"), TaskStatus::Cancelled);
}

TEST(TaskStatusTest, MapsQueuedAndStartedSynonyms) {
  EXPECT_EQ(parse_task_status("QUEUED"), TaskStatus::Pending);
  EXPECT_EQ(parse_task_status("STARTED"), TaskStatus::Running);
}

TEST(TaskStatusTest, UnrecognizedIsUnknown) {
  EXPECT_EQ(parse_task_status(""), TaskStatus::Unknown);
  EXPECT_EQ(parse_task_status("PAUSED"), TaskStatus::Unknown);
  EXPECT_STREQ(to_string(TaskStatus::Unknown), "UNKNOWN");
}

TEST(TaskStatusTest, TerminalStates) {
  EXPECT_TRUE(is_terminal(TaskStatus::Finished));
  EXPECT_TRUE(is_terminal(TaskStatus::Failed));
  EXPECT_TRUE(is_terminal(TaskStatus::Cancelled));
  EXPECT_FALSE(is_terminal(TaskStatus::Pending));
  EXPECT_FALSE(is_terminal(TaskStatus::Running));
  EXPECT_FALSE(is_terminal(TaskStatus::Unknown));
}

TEST(TaskTest, KnownTotalIgnoresZero) {
  Task task;
  EXPECT_FALSE(task.known_total().has_value());
  task.total = 0;
  EXPECT_FALSE(task.known_total().has_value());
  task.total = 42;
  EXPECT_EQ(task.known_total(), 42u);
}
