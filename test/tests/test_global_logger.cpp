#include <gtest/gtest.h>
#include "nslog.hpp"
#include "utils/test_utils.hpp"
#include <memory>
#include <string>

using nslog::Environment;
using nslog::Fields;
using nslog::Log;

class GlobalLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        m_dir = TestUtils::makeTempDir("global_logger");
        nslog::AppInfo app;
        app.name = "orders";
        app.version = "1.4.0";
        Log::setAppInfo(app);
    }

    void TearDown() override {
        Log::resetAll();
        TestUtils::removeTree(m_dir);
    }

    Environment fileEnvironment(const std::string &debug) const {
        return Environment{{"DEBUG", debug},
                           {"TRANSPORT1", "file"},
                           {"TRANSPORT1_FOLDER", m_dir},
                           {"TRANSPORT1_LEVEL", "debug"},
                           {"TRANSPORT1_SYNC", "true"}};
    }

    std::string m_dir;
};

TEST_F(GlobalLoggerTest, FileTransportReceivesJsonLines) {
    Log::setEnvironment(fileEnvironment("api:*"));
    nslog::Logger log = Log::createLogger("api:users");
    log.info(Fields{{"userId", 42}}, "user %s logged in", "alice");
    log.debug("details");
    Log::createLogger("db").info("filtered out");
    Log::flush();

    std::vector<std::string> lines = TestUtils::readLines(m_dir + "/orders.log");
    ASSERT_EQ(lines.size(), 2u);
    nlohmann::ordered_json first = nlohmann::ordered_json::parse(lines[0]);
    EXPECT_EQ(first["level"], 30);
    EXPECT_EQ(first["namespace"], "api:users");
    EXPECT_EQ(first["userId"], 42);
    EXPECT_EQ(first["msg"], "user alice logged in");
    EXPECT_EQ(nlohmann::ordered_json::parse(lines[1])["level"], 20);
}

TEST_F(GlobalLoggerTest, ResolvedTransportsDescribeTheBaseLogger) {
    EXPECT_EQ(Log::resolvedTransports(), nullptr);
    Log::setEnvironment(fileEnvironment(""));
    Log::createLogger();

    std::shared_ptr<const nslog::ResolvedTransportSet> set = Log::resolvedTransports();
    ASSERT_NE(set, nullptr);
    EXPECT_FALSE(set->legacyMode);
    ASSERT_EQ(set->transports.size(), 1u);
    EXPECT_EQ(set->transports[0].path, m_dir + "/orders.log");
    EXPECT_EQ(Log::baseLogger()->level(), nslog::LogLevel::DEBUG);
}

TEST_F(GlobalLoggerTest, BaseLoggerIsSharedUntilReset) {
    Log::setEnvironment(fileEnvironment(""));
    std::shared_ptr<nslog::SinkLogger> first = Log::baseLogger();
    EXPECT_EQ(Log::baseLogger(), first);

    Log::reset();
    EXPECT_EQ(Log::resolvedTransports(), nullptr);
    EXPECT_NE(Log::baseLogger(), first);
}

TEST_F(GlobalLoggerTest, InjectedBaseLogger) {
    RecordingFixture fx;
    Log::setEnvironment(Environment{{"DEBUG", "*"}});
    Log::setBaseLogger(fx.base);

    Log::createLogger("svc").warn("namespaced");
    Log::createLogger().info("plain");

    ASSERT_EQ(fx.sink->records.size(), 2u);
    EXPECT_EQ(fx.sink->records[0].fields["namespace"], "svc");
    EXPECT_FALSE(fx.sink->records[1].fields.contains("namespace"));
    EXPECT_EQ(Log::resolvedTransports(), nullptr);
}

TEST_F(GlobalLoggerTest, SilencingUnnamespacedLoggerDoesNotLeak) {
    RecordingFixture fx;
    Log::setEnvironment(Environment());
    Log::setBaseLogger(fx.base);

    nslog::Logger quiet = Log::createLogger();
    quiet.silent();
    quiet.error("suppressed");
    Log::createLogger().error("delivered");

    ASSERT_EQ(fx.sink->records.size(), 1u);
    EXPECT_EQ(fx.sink->records[0].message, "delivered");
    EXPECT_EQ(fx.base->level(), nslog::LogLevel::TRACE);
}

TEST_F(GlobalLoggerTest, ExistingHandlesSeeNewDebugExpression) {
    RecordingFixture fx;
    Log::setEnvironment(Environment{{"DEBUG", "worker"}});
    Log::setBaseLogger(fx.base);
    nslog::Logger worker = Log::createLogger("worker");

    worker.info("first");
    Log::setEnvironment(Environment{{"DEBUG", "-worker"}});
    worker.info("second");
    Log::setEnvironment(Environment{{"DEBUG", "worker"}, {"LOG_MAX_STRING_LENGTH", "3"}});
    worker.info("third");

    ASSERT_EQ(fx.sink->records.size(), 2u);
    EXPECT_EQ(fx.sink->records[0].message, "first");
    EXPECT_EQ(fx.sink->records[1].message, "thi...");
}

TEST_F(GlobalLoggerTest, InaccessibleDirectoryFallsBackToConsole) {
    auto fs = std::make_shared<DenyingFileSystem>();
    std::string locked = m_dir + "/locked";
    fs->deny(locked);
    Log::setFileSystem(fs);
    Log::setEnvironment(Environment{{"TRANSPORT1", "file"}, {"TRANSPORT1_FOLDER", locked}});

    testing::internal::CaptureStderr();
    testing::internal::CaptureStdout();
    Log::createLogger().info("still logged");
    Log::flush();
    std::string out = testing::internal::GetCapturedStdout();
    std::string err = testing::internal::GetCapturedStderr();

    std::shared_ptr<const nslog::ResolvedTransportSet> set = Log::resolvedTransports();
    ASSERT_NE(set, nullptr);
    EXPECT_TRUE(set->usedFallback);
    ASSERT_EQ(set->dropped.size(), 1u);
    EXPECT_NE(err.find("Failed to access or create log directory"), std::string::npos);
    EXPECT_NE(out.find("still logged"), std::string::npos);
    EXPECT_FALSE(TestUtils::fileExists(locked));
}

TEST_F(GlobalLoggerTest, EnvironmentAccessor) {
    Log::setEnvironment(Environment{{"DEBUG", "x"}});
    EXPECT_EQ(Log::environment()->get("DEBUG"), "x");
    EXPECT_EQ(Log::config()->debugExpression(), "x");
}
