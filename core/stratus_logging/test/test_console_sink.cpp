// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * @file test_console_sink.cpp
 * @brief Unit tests for console sink creation, filtering and formatting
 */

#include <boost/log/utility/setup/common_attributes.hpp>
#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "stratus_console_sink.hpp"
#include "stratus_log_init.hpp"
#include "stratus_log_macros.hpp"

using namespace stratus::logging;

namespace {

// Emits a record tagged as if it came from another translation unit
void log_as(const std::string& component, severity_level level, const std::string& message) {
  BOOST_LOG_SEV(get_logger(), level) << boost::log::add_value(component_attr, component)
                                     << message;
}

}  // namespace

// ============================================================================
// Console Sink Tests
// ============================================================================

class ConsoleSinkTest : public ::testing::Test {
protected:
  void SetUp() override {
    // Ensure clean logging state
    if (is_logging_initialized()) {
      shutdown_logging();
    }
    boost::log::add_common_attributes();
  }

  void TearDown() override {
    if (sink_) {
      remove_sink(sink_);
      sink_->stop();
      sink_.reset();
    }
    if (is_logging_initialized()) {
      shutdown_logging();
    }
  }

  void attach(
    severity_level level, bool use_colors, const component_levels_t& component_levels = {}
  ) {
    sink_ = create_console_sink(level, use_colors, &output_, component_levels);
    add_sink(sink_);
  }

  std::string captured() {
    sink_->flush();
    return output_.str();
  }

  std::ostringstream output_;
  boost::shared_ptr<async_console_sink_t> sink_;
};

TEST_F(ConsoleSinkTest, CreateWithDefaultParams) {
  auto sink = create_console_sink();
  ASSERT_NE(sink, nullptr);
  sink->stop();
}

TEST_F(ConsoleSinkTest, CreateWithoutColors) {
  auto sink = create_console_sink(severity_level::info, false);
  ASSERT_NE(sink, nullptr);
  sink->stop();
}

TEST_F(ConsoleSinkTest, PlainFormatContainsLevelAndMessage) {
  attach(severity_level::info, false);

  STRATUS_LOG_WARN("part rejected" << kv("number", 3));

  std::string out = captured();
  EXPECT_NE(out.find("[WARN]"), std::string::npos);
  EXPECT_NE(out.find("[stratus] part rejected number=3"), std::string::npos);
  EXPECT_EQ(out.find("\033["), std::string::npos);
}

TEST_F(ConsoleSinkTest, ColoredFormatWrapsLevel) {
  attach(severity_level::info, true);

  STRATUS_LOG_ERROR("backend down");

  std::string out = captured();
  EXPECT_NE(out.find(severity_color(severity_level::error)), std::string::npos);
  EXPECT_NE(out.find("[ERROR]"), std::string::npos);
  EXPECT_NE(out.find("\033[0m"), std::string::npos);
}

TEST_F(ConsoleSinkTest, FiltersBelowMinimumLevel) {
  attach(severity_level::warn, false);

  STRATUS_LOG_INFO("hidden message");
  STRATUS_LOG_ERROR("visible message");

  std::string out = captured();
  EXPECT_EQ(out.find("hidden message"), std::string::npos);
  EXPECT_NE(out.find("visible message"), std::string::npos);
}

TEST_F(ConsoleSinkTest, ComponentIsFormatted) {
  attach(severity_level::info, false);

  log_as("multipart", severity_level::info, "part committed");

  EXPECT_NE(captured().find("[INFO] [multipart] part committed"), std::string::npos);
}

TEST_F(ConsoleSinkTest, ComponentThresholdOverridesSinkLevel) {
  attach(
    severity_level::info, false,
    {{"ingestion", severity_level::debug}, {"s3_client", severity_level::error}}
  );

  log_as("ingestion", severity_level::debug, "slice read");
  log_as("s3_client", severity_level::warn, "retrying request");
  log_as("s3_client", severity_level::error, "request failed");
  log_as("reconciler", severity_level::debug, "page listed");
  log_as("reconciler", severity_level::info, "orphan aborted");

  std::string out = captured();
  EXPECT_NE(out.find("slice read"), std::string::npos);
  EXPECT_EQ(out.find("retrying request"), std::string::npos);
  EXPECT_NE(out.find("request failed"), std::string::npos);
  EXPECT_EQ(out.find("page listed"), std::string::npos);
  EXPECT_NE(out.find("orphan aborted"), std::string::npos);
}

TEST_F(ConsoleSinkTest, ScopedFileIdIsAppended) {
  attach(severity_level::info, false);

  {
    STRATUS_LOG_SCOPED_FILE(std::string("0123abcd"));
    STRATUS_LOG_INFO("inside scope");
  }
  STRATUS_LOG_INFO("outside scope");

  std::string out = captured();
  EXPECT_NE(out.find("inside scope | file_id=0123abcd"), std::string::npos);

  auto outside = out.find("outside scope");
  ASSERT_NE(outside, std::string::npos);
  auto line_end = out.find('\n', outside);
  EXPECT_EQ(out.substr(outside, line_end - outside).find("file_id="), std::string::npos);
}

TEST_F(ConsoleSinkTest, SinkFlush) {
  attach(severity_level::info, true);
  EXPECT_NO_THROW(sink_->flush());
}

// ============================================================================
// Severity Tests
// ============================================================================

TEST(SeverityTest, ColorsAreDistinctPerLevel) {
  EXPECT_STRNE(severity_color(severity_level::debug), severity_color(severity_level::info));
  EXPECT_STRNE(severity_color(severity_level::warn), severity_color(severity_level::error));
  EXPECT_STRNE(severity_color(severity_level::error), severity_color(severity_level::fatal));
}

TEST(SeverityTest, PassesThreshold) {
  component_levels_t levels{{"sweeper", severity_level::warn}};
  EXPECT_TRUE(passes_threshold(severity_level::info, "multipart", severity_level::info, levels));
  EXPECT_FALSE(passes_threshold(severity_level::info, "sweeper", severity_level::info, levels));
  EXPECT_TRUE(passes_threshold(severity_level::warn, "sweeper", severity_level::info, levels));
  EXPECT_FALSE(passes_threshold(severity_level::debug, "", severity_level::info, levels));
}

TEST(SeverityTest, StreamsUppercaseNames) {
  std::ostringstream oss;
  oss << severity_level::debug << " " << severity_level::fatal;
  EXPECT_EQ(oss.str(), "DEBUG FATAL");
}

int main(int argc, char** argv) {
  testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
