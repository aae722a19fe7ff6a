#include <gtest/gtest.h>

#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <string>
#include <vector>

#include "fwr/app/service_runner.hpp"

using namespace fwr::app;
using fwr::foundation::ConfigManager;
using fwr::foundation::ErrorCode;
using fwr::foundation::LogLevel;
namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace {

/// Owns argv storage for parseArgs().
class Argv {
public:
    Argv(std::initializer_list<std::string> args) : storage_(args) {
        for (auto& arg : storage_) {
            pointers_.push_back(arg.data());
        }
        pointers_.push_back(nullptr);
    }

    int argc() const { return static_cast<int>(storage_.size()); }
    char** argv() { return pointers_.data(); }

private:
    std::vector<std::string> storage_;
    std::vector<char*> pointers_;
};

} // namespace

// ---------------------------------------------------------------------------
// CLI parsing
// ---------------------------------------------------------------------------

TEST(ParseArgsTest, PatternsOnly) {
    Argv args{"fwr", "src/*.go", "test/*.go"};
    auto options = parseArgs(args.argc(), args.argv());
    ASSERT_TRUE(options.hasValue()) << options.error().message();
    EXPECT_EQ(options.value().patterns, (std::vector<std::string>{"src/*.go", "test/*.go"}));
    EXPECT_FALSE(options.value().command.has_value());
    EXPECT_FALSE(options.value().restart);
    EXPECT_FALSE(options.value().timeoutSeconds.has_value());
    EXPECT_TRUE(options.value().configPath.empty());
}

TEST(ParseArgsTest, AllOptions) {
    Argv args{"fwr", "-c", "make test", "-r", "-t", "30", "-p", "250",
              "-m", "500", "--config", "/etc/fwr.yml", "-v", "**/*.c"};
    auto options = parseArgs(args.argc(), args.argv());
    ASSERT_TRUE(options.hasValue()) << options.error().message();

    const auto& o = options.value();
    EXPECT_EQ(o.command, std::optional<std::string>("make test"));
    EXPECT_TRUE(o.restart);
    EXPECT_EQ(o.timeoutSeconds, std::optional<int64_t>(30));
    EXPECT_EQ(o.pendingPeriodMs, std::optional<int64_t>(250));
    EXPECT_EQ(o.maxWatchDirs, std::optional<int64_t>(500));
    EXPECT_EQ(o.configPath, fs::path("/etc/fwr.yml"));
    EXPECT_EQ(o.logLevel, std::optional<LogLevel>(LogLevel::Debug));
    EXPECT_EQ(o.patterns, (std::vector<std::string>{"**/*.c"}));
}

TEST(ParseArgsTest, LongOptionNames) {
    Argv args{"fwr", "--command", "ls", "--restart", "--timeout", "5", "--pending", "0",
              "--max-watch-dirs", "7", "--quiet", "x"};
    auto options = parseArgs(args.argc(), args.argv());
    ASSERT_TRUE(options.hasValue()) << options.error().message();
    EXPECT_EQ(options.value().command, std::optional<std::string>("ls"));
    EXPECT_EQ(options.value().pendingPeriodMs, std::optional<int64_t>(0));
    EXPECT_EQ(options.value().maxWatchDirs, std::optional<int64_t>(7));
    EXPECT_EQ(options.value().logLevel, std::optional<LogLevel>(LogLevel::Warning));
}

TEST(ParseArgsTest, DoubleDashEndsOptions) {
    Argv args{"fwr", "--", "-weird-name.txt"};
    auto options = parseArgs(args.argc(), args.argv());
    ASSERT_TRUE(options.hasValue());
    EXPECT_EQ(options.value().patterns, (std::vector<std::string>{"-weird-name.txt"}));
}

TEST(ParseArgsTest, HelpAndVersionNeedNoPattern) {
    Argv help{"fwr", "--help"};
    auto h = parseArgs(help.argc(), help.argv());
    ASSERT_TRUE(h.hasValue());
    EXPECT_TRUE(h.value().showHelp);

    Argv version{"fwr", "--version"};
    auto v = parseArgs(version.argc(), version.argv());
    ASSERT_TRUE(v.hasValue());
    EXPECT_TRUE(v.value().showVersion);
}

TEST(ParseArgsTest, Errors) {
    Argv noPattern{"fwr", "-r"};
    auto a = parseArgs(noPattern.argc(), noPattern.argv());
    ASSERT_TRUE(a.hasError());
    EXPECT_EQ(a.error().code(), ErrorCode::InvalidArgument);

    Argv unknown{"fwr", "--frobnicate", "x"};
    EXPECT_TRUE(parseArgs(unknown.argc(), unknown.argv()).hasError());

    Argv missingValue{"fwr", "x", "-t"};
    EXPECT_TRUE(parseArgs(missingValue.argc(), missingValue.argv()).hasError());

    Argv badNumber{"fwr", "-t", "soon", "x"};
    EXPECT_TRUE(parseArgs(badNumber.argc(), badNumber.argv()).hasError());

    Argv negative{"fwr", "-m", "-1", "x"};
    EXPECT_TRUE(parseArgs(negative.argc(), negative.argv()).hasError());
}

TEST(UsageTest, MentionsOptions) {
    auto text = usage("fwr");
    EXPECT_NE(text.find("Usage: fwr [options] <pattern>..."), std::string::npos);
    EXPECT_NE(text.find("--restart"), std::string::npos);
    EXPECT_NE(text.find("{{file}}"), std::string::npos);
}

// ---------------------------------------------------------------------------
// Config lookup and settings
// ---------------------------------------------------------------------------

class ConfigLookupTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        tmpDir_ = fs::temp_directory_path() / (std::string("fwr_lookup_test_") + info->name());
        fs::remove_all(tmpDir_);
        fs::create_directories(tmpDir_ / "home");

        if (const char* home = std::getenv("HOME")) {
            savedHome_ = home;
        }
        if (const char* env = std::getenv("FWR_CONFIG_PATH")) {
            savedConfigPath_ = env;
        }
        ::setenv("HOME", (tmpDir_ / "home").c_str(), 1);
        ::unsetenv("FWR_CONFIG_PATH");
    }

    void TearDown() override {
        if (savedHome_) {
            ::setenv("HOME", savedHome_->c_str(), 1);
        }
        if (savedConfigPath_) {
            ::setenv("FWR_CONFIG_PATH", savedConfigPath_->c_str(), 1);
        } else {
            ::unsetenv("FWR_CONFIG_PATH");
        }
        std::error_code ec;
        fs::remove_all(tmpDir_, ec);
    }

    fs::path writeYaml(const fs::path& path, const std::string& content) {
        std::ofstream(path) << content;
        return path;
    }

    fs::path tmpDir_;
    std::optional<std::string> savedHome_;
    std::optional<std::string> savedConfigPath_;
};

TEST_F(ConfigLookupTest, BuiltInDefaultWhenNothingIsFound) {
    ConfigManager config;
    auto loaded = loadConfig(config, {});
    ASSERT_TRUE(loaded.hasValue());
    EXPECT_TRUE(loaded.value().empty());
    EXPECT_TRUE(config.hasKey("commands"));
}

TEST_F(ConfigLookupTest, HomeFileIsUsed) {
    auto home = writeYaml(tmpDir_ / "home" / ".fwr.yml", "log:\n  level: debug\n");
    ConfigManager config;
    auto loaded = loadConfig(config, {});
    ASSERT_TRUE(loaded.hasValue());
    EXPECT_EQ(loaded.value(), home);
    EXPECT_FALSE(config.hasKey("commands"));
}

TEST_F(ConfigLookupTest, EnvironmentBeatsHomeFile) {
    writeYaml(tmpDir_ / "home" / ".fwr.yml", "log:\n  level: debug\n");
    auto env = writeYaml(tmpDir_ / "env.yml", "log:\n  level: error\n");
    ::setenv("FWR_CONFIG_PATH", env.c_str(), 1);

    ConfigManager config;
    auto loaded = loadConfig(config, {});
    ASSERT_TRUE(loaded.hasValue());
    EXPECT_EQ(loaded.value(), env);
    EXPECT_EQ(config.get<std::string>("log.level").value(), "error");
}

TEST_F(ConfigLookupTest, CliPathBeatsEnvironment) {
    auto env = writeYaml(tmpDir_ / "env.yml", "log:\n  level: error\n");
    auto cli = writeYaml(tmpDir_ / "cli.yml", "log:\n  level: trace\n");
    ::setenv("FWR_CONFIG_PATH", env.c_str(), 1);

    ConfigManager config;
    auto loaded = loadConfig(config, cli);
    ASSERT_TRUE(loaded.hasValue());
    EXPECT_EQ(loaded.value(), cli);
    EXPECT_EQ(config.get<std::string>("log.level").value(), "trace");
}

TEST_F(ConfigLookupTest, MissingExplicitFileIsAnError) {
    ConfigManager config;
    auto loaded = loadConfig(config, tmpDir_ / "missing.yml");
    ASSERT_TRUE(loaded.hasError());
    EXPECT_EQ(loaded.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST(RunSettingsTest, Defaults) {
    ConfigManager config;
    auto settings = buildRunSettings(config);
    ASSERT_TRUE(settings.hasValue()) << settings.error().message();
    EXPECT_EQ(settings.value().timeout, 0s);
    EXPECT_FALSE(settings.value().restart);
    EXPECT_EQ(settings.value().pendingPeriodMs, 100);
    EXPECT_EQ(settings.value().maxWatchDirs, 100u);
    EXPECT_EQ(settings.value().logLevel, LogLevel::Info);
}

TEST(RunSettingsTest, FromFile) {
    ConfigManager config;
    ASSERT_TRUE(config.loadString(R"(
watch:
  max_dirs: 20
notify:
  pending_period_ms: 300
dispatch:
  timeout_seconds: 12
  restart: true
log:
  level: warning
)"));
    auto settings = buildRunSettings(config);
    ASSERT_TRUE(settings.hasValue()) << settings.error().message();
    EXPECT_EQ(settings.value().timeout, 12s);
    EXPECT_TRUE(settings.value().restart);
    EXPECT_EQ(settings.value().pendingPeriodMs, 300);
    EXPECT_EQ(settings.value().maxWatchDirs, 20u);
    EXPECT_EQ(settings.value().logLevel, LogLevel::Warning);
}

TEST(RunSettingsTest, CliOverridesFile) {
    ConfigManager config;
    ASSERT_TRUE(config.loadString("dispatch:\n  timeout_seconds: 12\nwatch:\n  max_dirs: 20\n"));

    CliOptions options;
    options.patterns = {"x"};
    options.restart = true;
    options.timeoutSeconds = 3;
    options.logLevel = LogLevel::Debug;
    applyCliOverrides(config, options);

    auto settings = buildRunSettings(config);
    ASSERT_TRUE(settings.hasValue()) << settings.error().message();
    EXPECT_EQ(settings.value().timeout, 3s);
    EXPECT_TRUE(settings.value().restart);
    EXPECT_EQ(settings.value().maxWatchDirs, 20u);
    EXPECT_EQ(settings.value().logLevel, LogLevel::Debug);
}

TEST(RunSettingsTest, InvalidValues) {
    ConfigManager negative;
    ASSERT_TRUE(negative.loadString("dispatch:\n  timeout_seconds: -1\n"));
    auto a = buildRunSettings(negative);
    ASSERT_TRUE(a.hasError());
    EXPECT_EQ(a.error().code(), ErrorCode::ConfigInvalidValue);

    ConfigManager zeroDirs;
    ASSERT_TRUE(zeroDirs.loadString("watch:\n  max_dirs: 0\n"));
    EXPECT_TRUE(buildRunSettings(zeroDirs).hasError());

    ConfigManager badLevel;
    ASSERT_TRUE(badLevel.loadString("log:\n  level: loud\n"));
    EXPECT_TRUE(buildRunSettings(badLevel).hasError());

    ConfigManager wrongType;
    ASSERT_TRUE(wrongType.loadString("dispatch:\n  restart: sometimes\n"));
    auto d = buildRunSettings(wrongType);
    ASSERT_TRUE(d.hasError());
    EXPECT_EQ(d.error().code(), ErrorCode::ConfigTypeMismatch);
}

TEST(CommandTableSelectionTest, CommandFlagWins) {
    ConfigManager config;
    ASSERT_TRUE(config.loadString("commands:\n  - {ext: .go, run: go run}\n"));

    CliOptions options;
    options.command = "make";
    auto table = buildCommandTable(config, options);
    ASSERT_TRUE(table.hasValue());
    ASSERT_NE(table.value().match("main.go"), nullptr);
    EXPECT_EQ(table.value().match("main.go")->run, "make");
}

TEST(CommandTableSelectionTest, ConfiguredCommands) {
    ConfigManager config;
    ASSERT_TRUE(config.loadString("commands:\n  - {ext: .go, run: go run}\n"));

    auto table = buildCommandTable(config, CliOptions{});
    ASSERT_TRUE(table.hasValue());
    EXPECT_EQ(table.value().size(), 1u);
    EXPECT_EQ(table.value().match("main.py"), nullptr);
}

TEST(CommandTableSelectionTest, NoCommandsAnywhere) {
    ConfigManager config;
    auto table = buildCommandTable(config, CliOptions{});
    ASSERT_TRUE(table.hasError());
    EXPECT_EQ(table.error().code(), ErrorCode::ConfigKeyNotFound);
}

// ---------------------------------------------------------------------------
// SignalHandler
// ---------------------------------------------------------------------------

TEST(SignalHandlerTest, SignalRequestsStop) {
    SignalHandler signals;
    EXPECT_FALSE(signals.shutdownRequested());

    std::stop_source stop;
    auto bridge = signals.forwardTo(stop);

    std::raise(SIGTERM);
    EXPECT_TRUE(signals.shutdownRequested());

    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (!stop.stop_requested() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(10ms);
    }
    EXPECT_TRUE(stop.stop_requested());
}

TEST(SignalHandlerTest, BridgeStopsWithoutSignal) {
    SignalHandler signals;
    std::stop_source stop;
    {
        auto bridge = signals.forwardTo(stop);
    }
    EXPECT_FALSE(stop.stop_requested());
}
