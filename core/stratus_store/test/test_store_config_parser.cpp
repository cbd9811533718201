// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Unit tests for StoreConfigParser
 */

#include <gtest/gtest.h>

#include <chrono>
#include <cstdio>
#include <fstream>
#include <string>

#include "store_config_parser.hpp"

using namespace stratus::store;
using stratus::logging::severity_level;

class StoreConfigParserTest : public ::testing::Test {
protected:
  StratusConfig validConfig() {
    StratusConfig config;
    config.store.s3.bucket = "uploads";
    return config;
  }

  StoreConfigParser parser_;
  StratusConfig config_;
};

// =============================================================================
// Parsing
// =============================================================================

TEST_F(StoreConfigParserTest, EmptyDocumentKeepsDefaults) {
  ASSERT_TRUE(parser_.load_from_string("", config_)) << parser_.get_last_error();
  EXPECT_EQ(config_.store.file_prefix, "files/");
  EXPECT_EQ(config_.store.state_prefix, "upload-info/");
  EXPECT_EQ(config_.store.s3.region, "us-east-1");
  EXPECT_EQ(config_.store.default_expiration, std::chrono::hours(24));
  EXPECT_EQ(config_.store.part_limits.preferred_part_size, 50 * kMegaByte);
  EXPECT_TRUE(config_.logging.console_enabled);
}

TEST_F(StoreConfigParserTest, FullDocument) {
  const std::string yaml = R"(
s3:
  endpoint_url: "http://localhost:9000"
  bucket: uploads
  region: eu-west-1
  use_ssl: false
  verify_ssl: false
  access_key: minio
  secret_key: minio123
  connect_timeout_ms: 2000
  request_timeout_ms: 60000
  max_sdk_retries: 5
store:
  file_prefix: data
  state_prefix: state/
  default_expiration_sec: 3600
  orphan_grace_period_sec: 600
  content_chunk_size: 1048576
parts:
  min_part_size: 5242880
  max_part_size: 104857600
  preferred_part_size: 10485760
  max_part_count: 500
sweeper:
  interval_sec: 60
logging:
  console:
    enabled: true
    colors: false
    level: debug
    components:
      s3_client: warn
)";
  ASSERT_TRUE(parser_.load_from_string(yaml, config_)) << parser_.get_last_error();

  const S3Config& s3 = config_.store.s3;
  EXPECT_EQ(s3.endpoint_url, "http://localhost:9000");
  EXPECT_EQ(s3.bucket, "uploads");
  EXPECT_EQ(s3.region, "eu-west-1");
  EXPECT_FALSE(s3.use_ssl);
  EXPECT_FALSE(s3.verify_ssl);
  EXPECT_EQ(s3.access_key, "minio");
  EXPECT_EQ(s3.secret_key, "minio123");
  EXPECT_EQ(s3.connect_timeout_ms, 2000);
  EXPECT_EQ(s3.request_timeout_ms, 60000);
  EXPECT_EQ(s3.max_sdk_retries, 5);

  EXPECT_EQ(config_.store.file_prefix, "data");
  EXPECT_EQ(config_.store.state_prefix, "state/");
  EXPECT_EQ(config_.store.default_expiration, std::chrono::hours(1));
  EXPECT_EQ(config_.store.orphan_grace_period, std::chrono::minutes(10));
  EXPECT_EQ(config_.store.content_chunk_size, 1048576u);

  EXPECT_EQ(config_.store.part_limits.max_part_size, 100 * kMegaByte);
  EXPECT_EQ(config_.store.part_limits.preferred_part_size, 10 * kMegaByte);
  EXPECT_EQ(config_.store.part_limits.max_part_count, 500);
  EXPECT_EQ(config_.store.sweep_interval, std::chrono::minutes(1));

  EXPECT_TRUE(config_.logging.console_enabled);
  EXPECT_FALSE(config_.logging.console_colors);
  EXPECT_EQ(config_.logging.console_level, severity_level::debug);
  ASSERT_EQ(config_.logging.component_levels.size(), 1u);
  EXPECT_EQ(config_.logging.component_levels.at("s3_client"), severity_level::warn);

  std::string error;
  EXPECT_TRUE(StoreConfigParser::validate(config_, error)) << error;
}

TEST_F(StoreConfigParserTest, PartialDocumentKeepsOtherDefaults) {
  ASSERT_TRUE(parser_.load_from_string("s3:\n  bucket: b\n", config_));
  EXPECT_EQ(config_.store.s3.bucket, "b");
  EXPECT_TRUE(config_.store.s3.use_ssl);
  EXPECT_EQ(config_.store.s3.max_sdk_retries, 3);
}

TEST_F(StoreConfigParserTest, InvalidYaml) {
  EXPECT_FALSE(parser_.load_from_string("s3: [unclosed", config_));
  EXPECT_NE(parser_.get_last_error().find("Failed to parse YAML"), std::string::npos);
}

TEST_F(StoreConfigParserTest, WrongValueType) {
  EXPECT_FALSE(parser_.load_from_string("s3:\n  max_sdk_retries: many\n", config_));
  EXPECT_FALSE(parser_.get_last_error().empty());
}

TEST_F(StoreConfigParserTest, SectionMustBeMap) {
  EXPECT_FALSE(parser_.load_from_string("store: files/\n", config_));
  EXPECT_EQ(parser_.get_last_error(), "store must be a map");
}

TEST_F(StoreConfigParserTest, InvalidLogLevel) {
  EXPECT_FALSE(parser_.load_from_string("logging:\n  console:\n    level: loud\n", config_));
  EXPECT_NE(parser_.get_last_error().find("loud"), std::string::npos);
}

TEST_F(StoreConfigParserTest, InvalidComponentLevel) {
  EXPECT_FALSE(parser_.load_from_string(
    "logging:\n  console:\n    components:\n      ingestion: chatty\n", config_
  ));
  EXPECT_NE(parser_.get_last_error().find("components.ingestion"), std::string::npos);
}

TEST_F(StoreConfigParserTest, ComponentsMustBeMap) {
  EXPECT_FALSE(parser_.load_from_string(
    "logging:\n  console:\n    components: [ingestion]\n", config_
  ));
  EXPECT_EQ(parser_.get_last_error(), "logging.console.components must be a map");
}

TEST_F(StoreConfigParserTest, LoadFromFile) {
  std::string path = "/tmp/stratus_config_test_" +
                     std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) +
                     ".yaml";
  {
    std::ofstream file(path);
    file << "s3:\n  bucket: from-file\nparts:\n  max_part_count: 42\n";
  }

  ASSERT_TRUE(parser_.load_from_file(path, config_)) << parser_.get_last_error();
  EXPECT_EQ(config_.store.s3.bucket, "from-file");
  EXPECT_EQ(config_.store.part_limits.max_part_count, 42);
  std::remove(path.c_str());
}

TEST_F(StoreConfigParserTest, LoadFromMissingFile) {
  EXPECT_FALSE(parser_.load_from_file("/nonexistent/stratus.yaml", config_));
  EXPECT_NE(parser_.get_last_error().find("not found"), std::string::npos);
}

// =============================================================================
// Validation
// =============================================================================

TEST_F(StoreConfigParserTest, ValidateDefaultsWithBucket) {
  std::string error;
  EXPECT_TRUE(StoreConfigParser::validate(validConfig(), error)) << error;
}

TEST_F(StoreConfigParserTest, ValidateRequiresBucket) {
  std::string error;
  EXPECT_FALSE(StoreConfigParser::validate(StratusConfig(), error));
  EXPECT_NE(error.find("bucket"), std::string::npos);
}

TEST_F(StoreConfigParserTest, ValidateEndpointScheme) {
  StratusConfig config = validConfig();
  std::string error;
  config.store.s3.endpoint_url = "localhost:9000";
  EXPECT_FALSE(StoreConfigParser::validate(config, error));

  config.store.s3.endpoint_url = "https://s3.example.com";
  EXPECT_TRUE(StoreConfigParser::validate(config, error)) << error;
}

TEST_F(StoreConfigParserTest, ValidateTimeoutsAndRetries) {
  std::string error;
  StratusConfig config = validConfig();
  config.store.s3.request_timeout_ms = 0;
  EXPECT_FALSE(StoreConfigParser::validate(config, error));

  config = validConfig();
  config.store.s3.max_sdk_retries = -1;
  EXPECT_FALSE(StoreConfigParser::validate(config, error));

  config.store.s3.max_sdk_retries = 101;
  EXPECT_FALSE(StoreConfigParser::validate(config, error));
}

TEST_F(StoreConfigParserTest, ValidateSweepInterval) {
  std::string error;
  StratusConfig config = validConfig();
  config.store.sweep_interval = std::chrono::seconds(0);
  EXPECT_FALSE(StoreConfigParser::validate(config, error));
}

TEST_F(StoreConfigParserTest, ValidateRejectsEqualPrefixes) {
  std::string error;
  StratusConfig config = validConfig();
  config.store.file_prefix = "shared";
  config.store.state_prefix = "shared/";
  EXPECT_FALSE(StoreConfigParser::validate(config, error));
  EXPECT_NE(error.find("must differ"), std::string::npos);
}

TEST_F(StoreConfigParserTest, ValidateRejectsNestedPrefixes) {
  std::string error;
  StratusConfig config = validConfig();
  config.store.state_prefix = "data/";
  config.store.file_prefix = "data/files/";
  EXPECT_FALSE(StoreConfigParser::validate(config, error));
  EXPECT_NE(error.find("nested"), std::string::npos);
}

TEST_F(StoreConfigParserTest, ValidateRejectsEmptyPrefix) {
  std::string error;
  StratusConfig config = validConfig();
  config.store.state_prefix = "";
  EXPECT_FALSE(StoreConfigParser::validate(config, error));
  EXPECT_NE(error.find("must not be empty"), std::string::npos);
}

TEST_F(StoreConfigParserTest, ValidateStoreSettings) {
  std::string error;
  StratusConfig config = validConfig();
  config.store.content_chunk_size = 0;
  EXPECT_FALSE(StoreConfigParser::validate(config, error));

  config = validConfig();
  config.store.default_expiration = std::chrono::seconds(0);
  EXPECT_FALSE(StoreConfigParser::validate(config, error));

  config = validConfig();
  config.store.orphan_grace_period = std::chrono::seconds(-1);
  EXPECT_FALSE(StoreConfigParser::validate(config, error));

  config = validConfig();
  config.store.part_limits.preferred_part_size = config.store.part_limits.max_part_size + 1;
  EXPECT_FALSE(StoreConfigParser::validate(config, error));
}

int main(int argc, char** argv) {
  testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
