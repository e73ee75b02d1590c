#include <gtest/gtest.h>
#include <core/config.hpp>
#include <core/log.hpp>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>

namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
    fs::path test_dir;
    fs::path home_dir;
    std::string saved_home;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "cctrace_config_test";
        home_dir = test_dir / "home";
        fs::remove_all(test_dir);
        fs::create_directories(home_dir);

        if (const char* h = std::getenv("HOME")) saved_home = h;
        setenv("HOME", home_dir.c_str(), 1);
        unsetenv("CCTRACE_PRIVACY_MODE");
    }

    void TearDown() override {
        if (!saved_home.empty()) setenv("HOME", saved_home.c_str(), 1);
        unsetenv("CCTRACE_PRIVACY_MODE");
        fs::remove_all(test_dir);
    }

    void write_project(const std::string& yaml) {
        std::ofstream(test_dir / "cctrace.yaml") << yaml;
    }

    void write_global(const std::string& yaml) {
        fs::create_directories(home_dir / ".cctrace");
        std::ofstream(home_dir / ".cctrace" / "config.yaml") << yaml;
    }
};

TEST_F(ConfigTest, DefaultsWithoutFiles) {
    auto r = Config::load(test_dir);
    ASSERT_TRUE(r.is_ok()) << r.error;
    const TracerSettings& s = r.value.settings();
    EXPECT_EQ(s.command, "claude");
    EXPECT_EQ(s.privacy_mode, PrivacyMode::kStrict);
    EXPECT_EQ(s.sessions_dir, "./sessions");
    EXPECT_FALSE(s.debug);
    EXPECT_EQ(s.prompt_marker, ">");
    EXPECT_EQ(s.session_timeout, 0);
    EXPECT_EQ(s.teardown_grace_ms, 2000);
    EXPECT_TRUE(s.patterns.empty());
    EXPECT_TRUE(r.value.warnings().empty());
}

TEST_F(ConfigTest, ProjectOverridesGlobal) {
    write_global("command: aider\nprivacy_mode: minimal\nsessions_dir: /var/sessions\n");
    write_project("privacy_mode: moderate\ndebug: true\n");

    auto r = Config::load(test_dir);
    ASSERT_TRUE(r.is_ok()) << r.error;
    const TracerSettings& s = r.value.settings();
    EXPECT_EQ(s.command, "aider");
    EXPECT_EQ(s.privacy_mode, PrivacyMode::kModerate);
    EXPECT_EQ(s.sessions_dir, "/var/sessions");
    EXPECT_TRUE(s.debug);
}

TEST_F(ConfigTest, EnvironmentOverridesFiles) {
    write_project("privacy_mode: moderate\n");
    setenv("CCTRACE_PRIVACY_MODE", "minimal", 1);
    auto r = Config::load(test_dir);
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.settings().privacy_mode, PrivacyMode::kMinimal);
}

TEST_F(ConfigTest, UnknownModeIsAWarning) {
    write_project("privacy_mode: paranoid\n");
    setenv("CCTRACE_PRIVACY_MODE", "loose", 1);
    auto r = Config::load(test_dir);
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.settings().privacy_mode, PrivacyMode::kStrict);
    EXPECT_EQ(r.value.warnings().size(), 2u);
}

TEST_F(ConfigTest, CustomPatternsAccumulate) {
    write_global(
        "patterns:\n"
        "  - name: TICKET\n"
        "    pattern: \"TICKET-[0-9]+\"\n"
        "    level: high\n"
        "    replacement: \"[TICKET]\"\n"
        "disabled_patterns: [EMAIL]\n");
    write_project(
        "patterns:\n"
        "  - name: BUILD\n"
        "    pattern: \"build-[a-f0-9]{8}\"\n"
        "    description: build id\n"
        "disabled_patterns: PHONE_US\n");

    auto r = Config::load(test_dir);
    ASSERT_TRUE(r.is_ok()) << r.error;
    const TracerSettings& s = r.value.settings();
    ASSERT_EQ(s.patterns.size(), 2u);
    EXPECT_EQ(s.patterns[0].name, "TICKET");
    ASSERT_TRUE(s.patterns[0].replacement.has_value());
    EXPECT_EQ(*s.patterns[0].replacement, "[TICKET]");
    EXPECT_EQ(s.patterns[1].name, "BUILD");
    EXPECT_EQ(s.patterns[1].level, "high");
    EXPECT_FALSE(s.patterns[1].replacement.has_value());
    ASSERT_EQ(s.disabled_patterns.size(), 2u);
    EXPECT_EQ(s.disabled_patterns[1], "PHONE_US");
}

TEST_F(ConfigTest, ValuesAreClamped) {
    write_project("session_timeout: -5\nteardown_grace_ms: -1\nprompt_marker: \"\"\n");
    auto r = Config::load(test_dir);
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.settings().session_timeout, 0);
    EXPECT_EQ(r.value.settings().teardown_grace_ms, 2000);
    EXPECT_EQ(r.value.settings().prompt_marker, ">");
}

TEST_F(ConfigTest, MalformedFileIsAnError) {
    write_project("command: [unclosed\n");
    auto r = Config::load(test_dir);
    EXPECT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("cctrace.yaml"), std::string::npos);
}

TEST_F(ConfigTest, LoadProjectIgnoresGlobal) {
    write_global("command: aider\n");
    write_project("sessions_dir: ./traces\n");
    auto r = Config::load_project(test_dir);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.settings().command, "claude");
    EXPECT_EQ(r.value.settings().sessions_dir, "./traces");
}

TEST_F(ConfigTest, LoadFileMissing) {
    EXPECT_TRUE(Config::load_file(test_dir / "absent.yaml").is_err());
}

TEST_F(ConfigTest, DefaultGlobalConfigRoundTrips) {
    EXPECT_FALSE(global_config_exists());
    ASSERT_TRUE(create_default_global_config().is_ok());
    EXPECT_TRUE(global_config_exists());

    auto r = Config::load_global();
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.settings().command, "claude");
    EXPECT_EQ(r.value.settings().privacy_mode, PrivacyMode::kStrict);

    // Never overwrites an existing file.
    write_global("command: other\n");
    ASSERT_TRUE(create_default_global_config().is_ok());
    EXPECT_EQ(Config::load_global().value.settings().command, "other");
}

TEST(LogLevel, ParsesNames) {
    EXPECT_EQ(parse_log_level("debug"), LogLevel::kDebug);
    EXPECT_EQ(parse_log_level("WARNING"), LogLevel::kWarn);
    EXPECT_EQ(parse_log_level("error"), LogLevel::kError);
    EXPECT_EQ(parse_log_level("chatty"), LogLevel::kInfo);
}

TEST(Log, WritesToConfiguredFile) {
    fs::path file = fs::temp_directory_path() / "cctrace_log_test" / "trace.log";
    fs::remove_all(file.parent_path());

    log_configure(file.string(), LogLevel::kInfo);
    log_debug("hidden detail");
    log_warn("visible warning");
    EXPECT_EQ(log_path(), file.string());

    std::ifstream in(file);
    std::string contents((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_EQ(contents.find("hidden detail"), std::string::npos);
    EXPECT_NE(contents.find("WARN  visible warning"), std::string::npos);

    log_configure((fs::temp_directory_path() / "cctrace.log").string(), LogLevel::kInfo);
    fs::remove_all(file.parent_path());
}
