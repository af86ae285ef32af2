#include <gtest/gtest.h>
#include "nslog.hpp"
#include "utils/test_utils.hpp"
#include <chrono>
#include <ctime>
#include <memory>

using nslog::Environment;
using nslog::LogLevel;
using nslog::ResolvedTransportSet;
using nslog::TransportConfigResolver;
using nslog::TransportKind;

namespace {
    // 2024-01-15T10:30:45Z
    std::chrono::system_clock::time_point fixedTime() {
        return std::chrono::system_clock::from_time_t(static_cast<std::time_t>(1705314645));
    }

    nslog::AppInfo testApp() {
        nslog::AppInfo app;
        app.name = "billing";
        app.version = "2.3.1";
        return app;
    }
}

class TransportConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        m_dir = TestUtils::makeTempDir("transport_config");
    }

    void TearDown() override {
        TestUtils::removeTree(m_dir);
    }

    ResolvedTransportSet resolve(const Environment &env) {
        TransportConfigResolver resolver(m_fs, testApp());
        resolver.setTime(fixedTime());
        return resolver.resolve(env);
    }

    std::string m_dir;
    DenyingFileSystem m_fs;
};

TEST_F(TransportConfigTest, ConsoleAndFileTransports) {
    Environment env{
        {"TRANSPORT1", "console"}, {"TRANSPORT1_LEVEL", "debug"},
        {"TRANSPORT2", "file"}, {"TRANSPORT2_LEVEL", "warn"},
        {"TRANSPORT2_FOLDER", m_dir}, {"TRANSPORT2_FILENAME", "app.log"}};

    ResolvedTransportSet set = resolve(env);
    ASSERT_EQ(set.transports.size(), 2u);
    EXPECT_FALSE(set.legacyMode);
    EXPECT_FALSE(set.usedFallback);
    EXPECT_EQ(set.level, LogLevel::DEBUG);

    EXPECT_EQ(set.transports[0].kind, TransportKind::Console);
    EXPECT_EQ(set.transports[0].index, 1);
    EXPECT_EQ(set.transports[0].level, LogLevel::DEBUG);

    EXPECT_EQ(set.transports[1].kind, TransportKind::File);
    EXPECT_EQ(set.transports[1].level, LogLevel::WARN);
    EXPECT_EQ(set.transports[1].path, m_dir + "/app.log");
}

TEST_F(TransportConfigTest, InaccessibleDirectoryDropsOnlyThatTransport) {
    std::string denied = m_dir + "/locked";
    m_fs.deny(denied);
    Environment env{
        {"TRANSPORT1", "console"},
        {"TRANSPORT2", "file"}, {"TRANSPORT2_FOLDER", denied}};

    testing::internal::CaptureStderr();
    ResolvedTransportSet set = resolve(env);
    std::string err = testing::internal::GetCapturedStderr();

    ASSERT_EQ(set.transports.size(), 1u);
    EXPECT_EQ(set.transports[0].kind, TransportKind::Console);
    EXPECT_FALSE(set.usedFallback);

    ASSERT_EQ(set.dropped.size(), 1u);
    EXPECT_EQ(set.dropped[0].code, nslog::ErrorCode::LogDirCreateFailed);
    EXPECT_EQ(set.dropped[0].descriptor.index, 2);

    EXPECT_NE(err.find("[NSLOG FATAL] Failed to access or create log directory \"" + denied + "\""),
              std::string::npos);
    EXPECT_NE(err.find("Permission denied"), std::string::npos);
    EXPECT_NE(err.find("will be disabled"), std::string::npos);
}

TEST_F(TransportConfigTest, FallbackWhenEveryTransportFails) {
    std::string denied = m_dir + "/locked";
    m_fs.deny(denied);
    Environment env{{"TRANSPORT1", "file"}, {"TRANSPORT1_FOLDER", denied},
                    {"TRANSPORT1_LEVEL", "error"}};

    testing::internal::CaptureStderr();
    ResolvedTransportSet set = resolve(env);
    std::string err = testing::internal::GetCapturedStderr();

    ASSERT_EQ(set.transports.size(), 1u);
    EXPECT_TRUE(set.usedFallback);
    EXPECT_EQ(set.transports[0].kind, TransportKind::Console);
    EXPECT_EQ(set.transports[0].level, LogLevel::INFO);
    EXPECT_EQ(set.level, LogLevel::INFO);
    EXPECT_NE(err.find("Falling back to console output."), std::string::npos);
}

TEST_F(TransportConfigTest, MissingDirectoryIsCreated) {
    std::string nested = m_dir + "/a/b";
    Environment env{{"TRANSPORT1", "file"}, {"TRANSPORT1_FOLDER", nested}};

    ResolvedTransportSet set = resolve(env);
    ASSERT_EQ(set.transports.size(), 1u);
    EXPECT_TRUE(TestUtils::fileExists(nested));
    EXPECT_EQ(set.transports[0].path, nested + "/billing.log");
}

TEST_F(TransportConfigTest, MkdirDisabledRejectsMissingDirectory) {
    std::string nested = m_dir + "/missing";
    Environment env{{"TRANSPORT1", "file"}, {"TRANSPORT1_FOLDER", nested},
                    {"TRANSPORT1_MKDIR", "false"}};

    testing::internal::CaptureStderr();
    ResolvedTransportSet set = resolve(env);
    std::string err = testing::internal::GetCapturedStderr();

    EXPECT_TRUE(set.usedFallback);
    EXPECT_FALSE(TestUtils::fileExists(nested));
    ASSERT_EQ(set.dropped.size(), 1u);
    EXPECT_EQ(set.dropped[0].reason, "No such file or directory");
    EXPECT_NE(err.find("No such file or directory"), std::string::npos);
}

TEST_F(TransportConfigTest, LegacyKeysIgnoredWhenTransportsConfigured) {
    std::string legacyFolder = m_dir + "/legacy";
    Environment env{{"TRANSPORT1", "console"},
                    {"LOG_FOLDER", legacyFolder}, {"LOG_FILE_OUTPUT", "true"},
                    {"LOG_LEVEL", "trace"}};

    ResolvedTransportSet set = resolve(env);
    ASSERT_EQ(set.transports.size(), 1u);
    EXPECT_EQ(set.transports[0].kind, TransportKind::Console);
    EXPECT_EQ(set.level, LogLevel::INFO);
    EXPECT_FALSE(TestUtils::fileExists(legacyFolder));
}

TEST_F(TransportConfigTest, LaterIndexAloneSelectsMultiTransportMode) {
    std::string legacyFolder = m_dir + "/legacy";
    Environment env{{"TRANSPORT2", "console"},
                    {"LOG_FOLDER", legacyFolder}, {"LOG_FILE_OUTPUT", "false"},
                    {"LOG_LEVEL", "error"}};

    testing::internal::CaptureStderr();
    ResolvedTransportSet set = resolve(env);
    std::string diagnostics = testing::internal::GetCapturedStderr();

    EXPECT_FALSE(set.legacyMode);
    EXPECT_TRUE(set.usedFallback);
    ASSERT_EQ(set.transports.size(), 1u);
    EXPECT_EQ(set.transports[0].kind, TransportKind::Console);
    EXPECT_EQ(set.level, LogLevel::INFO);
    EXPECT_FALSE(TestUtils::fileExists(legacyFolder));
    EXPECT_NE(diagnostics.find("Falling back to console output"), std::string::npos);
}

TEST_F(TransportConfigTest, IndexedOptionKeyAloneSelectsMultiTransportMode) {
    EXPECT_TRUE(nslog::hasIndexedTransportKeys(Environment{{"TRANSPORT1_LEVEL", "debug"}}));
    EXPECT_TRUE(nslog::hasIndexedTransportKeys(Environment{{"TRANSPORT12", "file"}}));
    EXPECT_FALSE(nslog::hasIndexedTransportKeys(Environment{{"TRANSPORT", "file"}}));
    EXPECT_FALSE(nslog::hasIndexedTransportKeys(Environment{{"TRANSPORTS", "file"}}));
    EXPECT_FALSE(nslog::hasIndexedTransportKeys(Environment{{"TRANSPORT1", ""}}));
    EXPECT_FALSE(nslog::hasIndexedTransportKeys(Environment{{"LOG_LEVEL", "debug"}}));
}

TEST_F(TransportConfigTest, TransportLevelOutsideSeveritiesBecomesInfo) {
    Environment env{{"TRANSPORT1", "console"}, {"TRANSPORT1_LEVEL", "silent"},
                    {"TRANSPORT2", "console"}, {"TRANSPORT2_LEVEL", "warning"},
                    {"TRANSPORT3", "console"}, {"TRANSPORT3_LEVEL", "ERROR"}};

    ResolvedTransportSet set = resolve(env);
    ASSERT_EQ(set.transports.size(), 3u);
    EXPECT_EQ(set.transports[0].level, LogLevel::INFO);
    EXPECT_EQ(set.transports[1].level, LogLevel::INFO);
    EXPECT_EQ(set.transports[2].level, LogLevel::ERROR);
    EXPECT_EQ(set.level, LogLevel::INFO);
}

TEST_F(TransportConfigTest, LegacySilentLevelBecomesInfo) {
    Environment env{{"LOG_FILE_OUTPUT", "false"}, {"LOG_LEVEL", "silent"}};

    ResolvedTransportSet set = resolve(env);
    ASSERT_EQ(set.transports.size(), 1u);
    EXPECT_EQ(set.transports[0].level, LogLevel::INFO);
    EXPECT_EQ(set.level, LogLevel::INFO);
}

TEST_F(TransportConfigTest, LegacyModeBuildsFileAndConsole) {
    std::string folder = m_dir + "/logs";
    Environment env{{"LOG_FOLDER", folder}, {"LOG_LEVEL", "warn"}, {"LOG_PRETTY", "true"},
                    {"LOG_COLORIZE", "false"}};

    ResolvedTransportSet set = resolve(env);
    EXPECT_TRUE(set.legacyMode);
    ASSERT_EQ(set.transports.size(), 2u);

    EXPECT_EQ(set.transports[0].kind, TransportKind::File);
    EXPECT_TRUE(set.transports[0].sync);
    EXPECT_EQ(set.transports[0].path, folder + "/billing.log");
    EXPECT_EQ(set.transports[0].level, LogLevel::WARN);

    EXPECT_EQ(set.transports[1].kind, TransportKind::Console);
    EXPECT_FALSE(set.transports[1].colors);
    EXPECT_FALSE(set.transports[1].singleLine);
    EXPECT_EQ(set.level, LogLevel::WARN);
}

TEST_F(TransportConfigTest, LegacyModeWithEverythingOffKeepsConsole) {
    Environment env{{"LOG_FILE_OUTPUT", "false"}, {"LOG_CONSOLE_OUTPUT", "false"}};

    ResolvedTransportSet set = resolve(env);
    ASSERT_EQ(set.transports.size(), 1u);
    EXPECT_EQ(set.transports[0].kind, TransportKind::Console);
    EXPECT_TRUE(set.transports[0].singleLine);
    EXPECT_FALSE(set.usedFallback);
}

TEST_F(TransportConfigTest, FilenameTemplates) {
    Environment env{{"TRANSPORT1", "file"}, {"TRANSPORT1_FOLDER", m_dir},
                    {"TRANSPORT1_FILENAME", "{app_name}-{app_version}-{date}_{time}.log"}};

    ResolvedTransportSet set = resolve(env);
    ASSERT_EQ(set.transports.size(), 1u);
    EXPECT_EQ(set.transports[0].path, m_dir + "/billing-2.3.1-2024-01-15_10-30-45.log");
}

TEST(FilenameTemplateTest, Placeholders) {
    nslog::AppInfo app = testApp();
    EXPECT_EQ(nslog::processFilenameTemplate("{datetime}.log", app, fixedTime()),
              "2024-01-15_10-30-45.log");
    EXPECT_EQ(nslog::processFilenameTemplate("{pid}.log", app, fixedTime()),
              std::to_string(nslog::detail::processId()) + ".log");
    EXPECT_EQ(nslog::processFilenameTemplate("{hostname}", app, fixedTime()),
              nslog::detail::hostName());
    EXPECT_EQ(nslog::processFilenameTemplate("", app, fixedTime()), "app.log");
    EXPECT_EQ(nslog::processFilenameTemplate("plain.log", app, fixedTime()), "plain.log");
}

TEST_F(TransportConfigTest, StdioDestinations) {
    Environment env{{"TRANSPORT1", "file"}, {"TRANSPORT1_DESTINATION", "1"},
                    {"TRANSPORT2", "file"}, {"TRANSPORT2_DESTINATION", "2"},
                    {"TRANSPORT2_PRETTY_PRINT", "true"}};

    ResolvedTransportSet set = resolve(env);
    ASSERT_EQ(set.transports.size(), 2u);
    EXPECT_TRUE(set.transports[0].isStdioDestination());
    EXPECT_TRUE(set.transports[0].path.empty());
    EXPECT_EQ(set.transports[1].destination, "2");
    EXPECT_TRUE(set.transports[1].prettyPrint);
    EXPECT_TRUE(set.dropped.empty());
}

TEST_F(TransportConfigTest, ExplicitDestinationPath) {
    std::string target = m_dir + "/out/explicit.log";
    Environment env{{"TRANSPORT1", "file"}, {"TRANSPORT1_DESTINATION", target}};

    ResolvedTransportSet set = resolve(env);
    ASSERT_EQ(set.transports.size(), 1u);
    EXPECT_EQ(set.transports[0].path, target);
    EXPECT_TRUE(TestUtils::fileExists(m_dir + "/out"));
}

TEST_F(TransportConfigTest, UnknownKindIsSkipped) {
    Environment env{{"TRANSPORT1", "syslog"}, {"TRANSPORT2", "console"}};

    testing::internal::CaptureStderr();
    ResolvedTransportSet set = resolve(env);
    std::string err = testing::internal::GetCapturedStderr();

    ASSERT_EQ(set.transports.size(), 1u);
    EXPECT_EQ(set.transports[0].index, 2);
    EXPECT_NE(err.find("Unknown transport type \"syslog\""), std::string::npos);
}

TEST_F(TransportConfigTest, ParsingStopsAtFirstGap) {
    Environment env{{"TRANSPORT1", "console"}, {"TRANSPORT3", "console"}};

    std::vector<nslog::TransportDescriptor> descriptors = nslog::parseTransportDescriptors(env);
    ASSERT_EQ(descriptors.size(), 1u);
    EXPECT_EQ(descriptors[0].index, 1);
}

TEST_F(TransportConfigTest, DisabledTransportsAreLeftOut) {
    Environment env{{"TRANSPORT1", "console"}, {"TRANSPORT1_ENABLED", "false"},
                    {"TRANSPORT2", "console"}, {"TRANSPORT2_LEVEL", "error"}};

    ResolvedTransportSet set = resolve(env);
    ASSERT_EQ(set.transports.size(), 1u);
    EXPECT_EQ(set.transports[0].index, 2);
    EXPECT_EQ(set.level, LogLevel::ERROR);
}

TEST_F(TransportConfigTest, ConsoleOptions) {
    Environment env{{"TRANSPORT1", "Console"},
                    {"TRANSPORT1_COLORS", "false"},
                    {"TRANSPORT1_TRANSLATE_TIME", "false"},
                    {"TRANSPORT1_IGNORE", "pid, hostname ,namespace"},
                    {"TRANSPORT1_SINGLE_LINE", "true"},
                    {"TRANSPORT1_HIDE_OBJECT_KEYS", "password,token"},
                    {"TRANSPORT1_SHOW_METADATA", "true"}};

    std::vector<nslog::TransportDescriptor> d = nslog::parseTransportDescriptors(env);
    ASSERT_EQ(d.size(), 1u);
    EXPECT_FALSE(d[0].colors);
    EXPECT_TRUE(d[0].translateTime.empty());
    ASSERT_EQ(d[0].ignore.size(), 3u);
    EXPECT_EQ(d[0].ignore[1], "hostname");
    EXPECT_EQ(d[0].ignore[2], "namespace");
    EXPECT_TRUE(d[0].singleLine);
    ASSERT_EQ(d[0].hideObjectKeys.size(), 2u);
    EXPECT_EQ(d[0].hideObjectKeys[1], "token");
    EXPECT_TRUE(d[0].showMetadata);
}

TEST_F(TransportConfigTest, RotationOptions) {
    Environment env{{"TRANSPORT1", "file"},
                    {"TRANSPORT1_ROTATE", "true"},
                    {"TRANSPORT1_ROTATE_MAX_SIZE", "2048"},
                    {"TRANSPORT1_ROTATE_MAX_FILES", "3"},
                    {"TRANSPORT1_ROTATE_COMPRESS", "true"},
                    {"TRANSPORT2", "file"},
                    {"TRANSPORT2_ROTATE_MAX_SIZE", "-5"}};

    std::vector<nslog::TransportDescriptor> d = nslog::parseTransportDescriptors(env);
    ASSERT_EQ(d.size(), 2u);
    EXPECT_TRUE(d[0].rotation.enabled);
    EXPECT_EQ(d[0].rotation.maxSize, 2048u);
    EXPECT_EQ(d[0].rotation.maxFiles, 3);
    EXPECT_TRUE(d[0].rotation.compress);

    EXPECT_FALSE(d[1].rotation.enabled);
    EXPECT_EQ(d[1].rotation.maxSize, 10485760u);
    EXPECT_EQ(d[1].rotation.maxFiles, 5);
}

TEST_F(TransportConfigTest, InvalidLevelDegradesToInfo) {
    Environment env{{"TRANSPORT1", "console"}, {"TRANSPORT1_LEVEL", "verbose"}};

    ResolvedTransportSet set = resolve(env);
    EXPECT_EQ(set.transports[0].level, LogLevel::INFO);
}

// ---------------------------------------------------------------------------
// Transport factory
// ---------------------------------------------------------------------------

TEST_F(TransportConfigTest, FactoryBuildsOneSinkPerDescriptor) {
    Environment env{
        {"TRANSPORT1", "console"}, {"TRANSPORT1_LEVEL", "debug"},
        {"TRANSPORT2", "file"}, {"TRANSPORT2_FOLDER", m_dir}, {"TRANSPORT2_LEVEL", "error"},
        {"TRANSPORT3", "file"}, {"TRANSPORT3_FOLDER", m_dir}, {"TRANSPORT3_FILENAME", "roll.log"},
        {"TRANSPORT3_ROTATE", "true"}};

    ResolvedTransportSet set = resolve(env);
    std::unique_ptr<nslog::MultiSink> multi =
        nslog::TransportFactory::build(set, std::make_shared<nslog::PosixFileSystem>(), env);

    ASSERT_EQ(multi->size(), 3u);
    EXPECT_EQ(multi->sinkAt(0)->level(), LogLevel::DEBUG);
    EXPECT_NE(dynamic_cast<nslog::PrettyFormatter *>(multi->sinkAt(0)->formatter()), nullptr);
    EXPECT_EQ(multi->sinkAt(1)->level(), LogLevel::ERROR);
    EXPECT_NE(dynamic_cast<nslog::JsonFormatter *>(multi->sinkAt(1)->formatter()), nullptr);
    EXPECT_NE(dynamic_cast<nslog::RollingFileSink *>(multi->sinkAt(2)), nullptr);
    EXPECT_EQ(multi->minLevel(), LogLevel::DEBUG);
    EXPECT_TRUE(TestUtils::fileExists(m_dir + "/billing.log"));
    EXPECT_TRUE(TestUtils::fileExists(m_dir + "/roll.log"));
}

TEST_F(TransportConfigTest, FactoryDisablesColorsUnderNoColor) {
    Environment env{{"TRANSPORT1", "console"}, {"NO_COLOR", "1"}};
    ResolvedTransportSet set = resolve(env);
    std::unique_ptr<nslog::MultiSink> multi =
        nslog::TransportFactory::build(set, std::make_shared<nslog::PosixFileSystem>(), env);

    auto *pretty = dynamic_cast<nslog::PrettyFormatter *>(multi->sinkAt(0)->formatter());
    ASSERT_NE(pretty, nullptr);
    EXPECT_FALSE(pretty->options().colors);
}

TEST_F(TransportConfigTest, FactoryUsesPrettyFormatterForPrettyStdio) {
    Environment env{{"TRANSPORT1", "file"}, {"TRANSPORT1_DESTINATION", "2"},
                    {"TRANSPORT1_PRETTY_PRINT", "true"}};
    ResolvedTransportSet set = resolve(env);
    std::unique_ptr<nslog::MultiSink> multi =
        nslog::TransportFactory::build(set, std::make_shared<nslog::PosixFileSystem>(), env);

    ASSERT_EQ(multi->size(), 1u);
    EXPECT_NE(dynamic_cast<nslog::PrettyFormatter *>(multi->sinkAt(0)->formatter()), nullptr);
    EXPECT_NE(dynamic_cast<nslog::StderrTransport *>(multi->sinkAt(0)->transport()), nullptr);
}

TEST_F(TransportConfigTest, FactoryFallsBackWhenFileCannotOpen) {
    ResolvedTransportSet set;
    nslog::TransportDescriptor file = nslog::TransportDescriptor::file(LogLevel::WARN);
    file.path = m_dir + "/no/such/dir/app.log";
    set.transports.push_back(file);

    testing::internal::CaptureStderr();
    std::unique_ptr<nslog::MultiSink> multi =
        nslog::TransportFactory::build(set, std::make_shared<nslog::PosixFileSystem>(), Environment());
    std::string err = testing::internal::GetCapturedStderr();

    ASSERT_EQ(multi->size(), 1u);
    EXPECT_EQ(multi->sinkAt(0)->level(), LogLevel::INFO);
    EXPECT_NE(dynamic_cast<nslog::StdoutTransport *>(multi->sinkAt(0)->transport()), nullptr);
    EXPECT_NE(err.find("[NSLOG ERROR] Failed to initialize file transport"), std::string::npos);
    EXPECT_NE(err.find("Falling back to console output."), std::string::npos);
}

TEST_F(TransportConfigTest, FolderThatIsAFileIsRejected) {
    std::string notADir = m_dir + "/plain";
    TestUtils::writeFile(notADir, "x");
    Environment env{{"TRANSPORT1", "file"}, {"TRANSPORT1_FOLDER", notADir},
                    {"TRANSPORT2", "console"}};

    testing::internal::CaptureStderr();
    ResolvedTransportSet set = resolve(env);
    std::string err = testing::internal::GetCapturedStderr();

    ASSERT_EQ(set.transports.size(), 1u);
    EXPECT_EQ(set.transports[0].kind, TransportKind::Console);
    ASSERT_EQ(set.dropped.size(), 1u);
    EXPECT_EQ(set.dropped[0].reason, "Not a directory");
}
