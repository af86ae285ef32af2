#include <gtest/gtest.h>
#include "nslog.hpp"
#include <chrono>

using nslog::JsonFormatter;
using nslog::LogRecord;

namespace {
    LogRecord makeRecord() {
        LogRecord record;
        record.level = nslog::LogLevel::WARN;
        record.timestamp = std::chrono::system_clock::from_time_t(1705314645) +
                           std::chrono::milliseconds(123);
        record.hasMessage = true;
        record.message = "disk almost full";
        record.fields["namespace"] = "storage";
        record.fields["usage"] = 97;
        return record;
    }
}

TEST(JsonFormatterTest, FieldOrder) {
    JsonFormatter formatter;
    std::string line = formatter.format(makeRecord());

    nlohmann::ordered_json j = nlohmann::ordered_json::parse(line);
    std::vector<std::string> keys;
    for (auto it = j.begin(); it != j.end(); ++it) keys.push_back(it.key());

    std::vector<std::string> expected = {"level", "time", "pid", "hostname", "namespace", "usage", "msg"};
    EXPECT_EQ(keys, expected);
    EXPECT_EQ(j["level"], 40);
    EXPECT_EQ(j["time"], 1705314645123LL);
    EXPECT_EQ(j["pid"], nslog::detail::processId());
    EXPECT_EQ(j["hostname"], nslog::detail::hostName());
    EXPECT_EQ(j["msg"], "disk almost full");
}

TEST(JsonFormatterTest, SingleLine) {
    LogRecord record = makeRecord();
    record.fields["nested"] = {{"a", 1}, {"b", {1, 2, 3}}};
    std::string line = JsonFormatter().format(record);
    EXPECT_EQ(line.find('\n'), std::string::npos);
}

TEST(JsonFormatterTest, RecordWithoutMessage) {
    LogRecord record = makeRecord();
    record.hasMessage = false;
    nlohmann::ordered_json j = nlohmann::ordered_json::parse(JsonFormatter().format(record));
    EXPECT_FALSE(j.contains("msg"));
    EXPECT_EQ(j["usage"], 97);
}

TEST(JsonFormatterTest, ErrorFieldSerialized) {
    LogRecord record = makeRecord();
    record.fields["err"] = nslog::Value(std::runtime_error("boom")).toJson();
    nlohmann::ordered_json j = nlohmann::ordered_json::parse(JsonFormatter().format(record));
    EXPECT_EQ(j["err"]["type"], "std::runtime_error");
    EXPECT_EQ(j["err"]["message"], "boom");
}

TEST(JsonFormatterTest, InvalidUtf8RaisesFormatError) {
    LogRecord record = makeRecord();
    record.message = "bad \xff byte";
    try {
        JsonFormatter().format(record);
        FAIL() << "expected LoggerError";
    } catch (const nslog::LoggerError &e) {
        EXPECT_EQ(e.code(), nslog::ErrorCode::FormatFailed);
        ASSERT_NE(e.cause(), nullptr);
    }
}
