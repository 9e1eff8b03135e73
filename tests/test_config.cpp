#include "privgate/common/config.hpp"
#include "privgate/config/validator.hpp"
#include <gtest/gtest.h>

using namespace privgate::common;
using privgate::config::ConfigValidator;

namespace {

class ConfigTest : public ::testing::Test {
protected:
    void TearDown() override {
        Config::instance().loadFromString("", "reset");
    }
};

bool hasMessageFor(const std::vector<std::string>& messages, const std::string& key) {
    for (const auto& message : messages) {
        if (message.rfind(key + ":", 0) == 0) {
            return true;
        }
    }
    return false;
}

}

TEST_F(ConfigTest, EmptyDocumentKeepsDefaults) {
    auto& config = Config::instance();
    ASSERT_TRUE(config.loadFromString(""));

    const auto& global = config.global();
    EXPECT_EQ(global.logging.level, LogLevel::INFO);
    EXPECT_EQ(global.privilege.elevation_command, "sudo");
    EXPECT_EQ(global.privilege.default_user, "runner");
    EXPECT_EQ(global.privilege.default_group, "sudo");
    EXPECT_EQ(global.privilege.sudoers_file, "/etc/sudoers");
    EXPECT_EQ(global.privilege.sudoers_dir, "/etc/sudoers.d");
    EXPECT_EQ(global.agent.executable, "codex");
    EXPECT_EQ(global.agent.originator, "privgate");
    EXPECT_EQ(global.process.command_timeout_seconds, 0);
}

TEST_F(ConfigTest, AllSectionsApplied) {
    auto& config = Config::instance();
    ASSERT_TRUE(config.loadFromString(R"(
[logging]
level = "debug"
format = "json"
file = "/var/log/privgate.log"
max_files = 5

[privilege]
elevation_command = "/usr/bin/sudo"
default_user = "ci"
default_group = "wheel"
sudoers_file = "/tmp/sudoers"
sudoers_dir = "/tmp/sudoers.d"

[agent]
executable = "/opt/codex/bin/codex"
originator = "pipeline"

[process]
max_capture_bytes = 4096
command_timeout_seconds = 30
agent_timeout_seconds = 600
)"));

    const auto& global = config.global();
    EXPECT_EQ(global.logging.level, LogLevel::DEBUG);
    EXPECT_EQ(global.logging.format, LogFormat::JSON);
    EXPECT_EQ(global.logging.file, "/var/log/privgate.log");
    EXPECT_EQ(global.logging.max_files, 5u);
    EXPECT_EQ(global.privilege.elevation_command, "/usr/bin/sudo");
    EXPECT_EQ(global.privilege.default_user, "ci");
    EXPECT_EQ(global.privilege.default_group, "wheel");
    EXPECT_EQ(global.privilege.sudoers_file, "/tmp/sudoers");
    EXPECT_EQ(global.privilege.sudoers_dir, "/tmp/sudoers.d");
    EXPECT_EQ(global.agent.executable, "/opt/codex/bin/codex");
    EXPECT_EQ(global.agent.originator, "pipeline");
    EXPECT_EQ(global.process.max_capture_bytes, 4096u);
    EXPECT_EQ(global.process.command_timeout_seconds, 30);
    EXPECT_EQ(global.process.agent_timeout_seconds, 600);

    EXPECT_TRUE(ConfigValidator().validate(global).is_valid);
}

TEST_F(ConfigTest, MalformedDocumentRejected) {
    EXPECT_FALSE(Config::instance().loadFromString("[privilege\ndefault_user = ", "broken"));
}

TEST_F(ConfigTest, MissingFileRejected) {
    EXPECT_FALSE(Config::instance().load("/nonexistent/privgate.toml"));
}

TEST(ConfigValidatorTest, DefaultsAreValid) {
    auto result = ConfigValidator().validate(Config::createDefaultConfig());
    EXPECT_TRUE(result.is_valid);
    EXPECT_TRUE(result.errors.empty());
}

TEST(ConfigValidatorTest, ReportsEachBadField) {
    auto global = Config::createDefaultConfig();
    global.privilege.sudoers_file = "etc/sudoers";
    global.privilege.default_user = "-root";
    global.agent.executable = "bin/codex";
    global.process.max_capture_bytes = 0;
    global.process.command_timeout_seconds = -1;

    auto result = ConfigValidator().validate(global);

    EXPECT_FALSE(result.is_valid);
    EXPECT_EQ(result.errors.size(), 5u);
    EXPECT_TRUE(hasMessageFor(result.errors, "privilege.sudoers_file"));
    EXPECT_TRUE(hasMessageFor(result.errors, "privilege.default_user"));
    EXPECT_TRUE(hasMessageFor(result.errors, "agent.executable"));
    EXPECT_TRUE(hasMessageFor(result.errors, "process.max_capture_bytes"));
    EXPECT_TRUE(hasMessageFor(result.errors, "process.command_timeout_seconds"));
}

TEST(ConfigValidatorTest, BlankOriginatorIsOnlyAWarning) {
    auto global = Config::createDefaultConfig();
    global.agent.originator.clear();

    auto result = ConfigValidator().validate(global);

    EXPECT_TRUE(result.is_valid);
    EXPECT_TRUE(hasMessageFor(result.warnings, "agent.originator"));
}

TEST(ConfigValidatorTest, CommandNames) {
    EXPECT_TRUE(ConfigValidator::validateCommandName("doas"));
    EXPECT_TRUE(ConfigValidator::validateCommandName("/usr/bin/sudo"));
    EXPECT_FALSE(ConfigValidator::validateCommandName("./sudo"));
    EXPECT_FALSE(ConfigValidator::validateCommandName("sudo -n"));
    EXPECT_FALSE(ConfigValidator::validateCommandName(""));
}

TEST(LogLevelTest, ParsesCaseInsensitively) {
    EXPECT_EQ(parseLogLevel("debug"), LogLevel::DEBUG);
    EXPECT_EQ(parseLogLevel("Warning"), LogLevel::WARN);
    EXPECT_EQ(parseLogLevel("WARN"), LogLevel::WARN);
    EXPECT_EQ(parseLogLevel("error"), LogLevel::ERROR);
    EXPECT_EQ(parseLogLevel("bogus"), LogLevel::INFO);
    EXPECT_EQ(to_string(LogLevel::DEBUG), "DEBUG");
}
