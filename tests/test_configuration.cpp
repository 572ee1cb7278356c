#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <string>
#include <vector>

#include "TestUtils.h"
#include "oscwire/ConfigurationParser.h"
#include "oscwire/Logging.h"
#include "oscwire/Message.h"

using namespace oscwire;
using oscwire::test::errorCodeOf;
using ErrorCode = OSCException::ErrorCode;

class ConfigurationTest : public ::testing::Test {
   protected:
    void SetUp() override { log_init(nullptr, LOG_WARNING, nullptr); }

    void TearDown() override {
        log_cleanup();
        log_set_level(LOG_WARNING);
    }
};

TEST_F(ConfigurationTest, Defaults) {
    CodecOptions options;
    EXPECT_EQ(options.maxPacketSize, 0u);
    EXPECT_EQ(options.maxBlobSize, DEFAULT_MAX_BLOB_SIZE);
    EXPECT_EQ(options.logLevel, LOG_WARNING);
    EXPECT_TRUE(options.logFile.empty());
}

TEST_F(ConfigurationTest, ParseAllKeys) {
    CodecOptions options;
    ASSERT_TRUE(ConfigurationParser::parseJsonString(
        R"({"maxPacketSize": 1500, "maxBlobSize": 4096, "logLevel": "debug",
            "logFile": "codec.log"})",
        options));

    EXPECT_EQ(options.maxPacketSize, 1500u);
    EXPECT_EQ(options.maxBlobSize, 4096u);
    EXPECT_EQ(options.logLevel, LOG_DEBUG);
    EXPECT_EQ(options.logFile, "codec.log");
}

TEST_F(ConfigurationTest, MissingKeysKeepTheirValues) {
    CodecOptions options;
    options.maxPacketSize = 512;
    ASSERT_TRUE(ConfigurationParser::parseJsonString(R"({"logLevel": "info"})", options));
    EXPECT_EQ(options.maxPacketSize, 512u);
    EXPECT_EQ(options.logLevel, LOG_INFO);
}

TEST_F(ConfigurationTest, InvalidJsonLeavesOptionsUntouched) {
    CodecOptions options;
    options.maxBlobSize = 77;
    EXPECT_FALSE(ConfigurationParser::parseJsonString("{ not json", options));
    EXPECT_FALSE(ConfigurationParser::parseJsonString("[1, 2]", options));
    EXPECT_EQ(options.maxBlobSize, 77u);
}

TEST_F(ConfigurationTest, BadValuesAreRejected) {
    CodecOptions options;
    EXPECT_FALSE(ConfigurationParser::parseJsonString(R"({"maxBlobSize": -1})", options));
    EXPECT_FALSE(ConfigurationParser::parseJsonString(R"({"maxPacketSize": "big"})", options));
    EXPECT_FALSE(ConfigurationParser::parseJsonString(R"({"logLevel": "verbose"})", options));
    EXPECT_FALSE(ConfigurationParser::parseJsonString(R"({"logFile": 3})", options));

    // A bad key after a good one must not leave a partial update behind
    EXPECT_FALSE(ConfigurationParser::parseJsonString(
        R"({"maxPacketSize": 100, "logLevel": "loud"})", options));
    EXPECT_EQ(options.maxPacketSize, 0u);

    std::vector<std::string> lines;
    ASSERT_GT(log_get_recent(lines, 1), 0u);
    EXPECT_NE(lines[0].find("logLevel"), std::string::npos);
}

TEST_F(ConfigurationTest, UnknownKeysWarn) {
    CodecOptions options;
    EXPECT_TRUE(ConfigurationParser::parseJsonString(R"({"sampleRate": 48000})", options));

    std::vector<std::string> lines;
    ASSERT_EQ(log_get_recent(lines, 1), 1u);
    EXPECT_NE(lines[0].find("warning"), std::string::npos);
    EXPECT_NE(lines[0].find("sampleRate"), std::string::npos);
}

TEST_F(ConfigurationTest, ParseFile) {
    const std::string path = ::testing::TempDir() + "oscwire_config_test.json";
    {
        std::ofstream file(path);
        file << R"({"maxBlobSize": 16})";
    }

    CodecOptions options;
    EXPECT_TRUE(ConfigurationParser::parseJsonFile(path, options));
    EXPECT_EQ(options.maxBlobSize, 16u);
    std::remove(path.c_str());

    EXPECT_FALSE(ConfigurationParser::parseJsonFile(path, options));
    EXPECT_EQ(options.maxBlobSize, 16u);
}

TEST_F(ConfigurationTest, ParseLogLevel) {
    LogLevel level = LOG_ERROR;
    EXPECT_TRUE(ConfigurationParser::parseLogLevel("warning", level));
    EXPECT_EQ(level, LOG_WARNING);
    EXPECT_TRUE(ConfigurationParser::parseLogLevel("error", level));
    EXPECT_EQ(level, LOG_ERROR);
    EXPECT_FALSE(ConfigurationParser::parseLogLevel("WARNING", level));
    EXPECT_EQ(level, LOG_ERROR);
}

TEST_F(ConfigurationTest, ApplyLogging) {
    CodecOptions options;
    options.logLevel = LOG_DEBUG;
    EXPECT_TRUE(ConfigurationParser::applyLogging(options));
    EXPECT_EQ(log_get_level(), LOG_DEBUG);

    options.logFile = "/nonexistent-directory/oscwire.log";
    EXPECT_FALSE(ConfigurationParser::applyLogging(options));
}

TEST_F(ConfigurationTest, ParsedLimitsDriveTheDecoder) {
    CodecOptions options;
    ASSERT_TRUE(ConfigurationParser::parseJsonString(R"({"maxBlobSize": 2})", options));

    const uint8_t payload[] = {1, 2, 3};
    Message msg("/blob");
    msg.addBlob(payload, sizeof(payload));
    std::vector<std::byte> bytes = msg.serialize();

    EXPECT_EQ(errorCodeOf([&] { Message::deserialize(bytes.data(), bytes.size(), options); }),
              ErrorCode::MessageTooLarge);
}
