#include <gtest/gtest.h>
#include <cli/aisafe_cli.hpp>
#include <cli/prompt.hpp>
#include <core/constants.hpp>
#include <platform/platform.hpp>
#include "test_helpers.hpp"
#include <cstdlib>
#include <fstream>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

class CliTest : public ::testing::Test {
protected:
    fs::path test_dir;
    fs::path creds;
    Config config;
    std::string out;
    std::string err;
    std::map<std::string, std::optional<std::string>> saved_env;

    void SetUp() override {
        for (const char* name : {"AISAFE_FILE", "XDG_CONFIG_HOME"}) {
            const char* v = std::getenv(name);
            saved_env[name] = v ? std::optional<std::string>(v) : std::nullopt;
        }
        test_dir = make_test_dir("aisafe_cli_test");
        creds = test_dir / "credentials.toml";
        setenv("XDG_CONFIG_HOME", (test_dir / "config").c_str(), 1);
        unsetenv("AISAFE_FILE");
        config = load_config("color: false\n");
    }

    void TearDown() override {
        for (const auto& [name, value] : saved_env) {
            if (value) setenv(name.c_str(), value->c_str(), 1);
            else unsetenv(name.c_str());
        }
        fs::remove_all(test_dir);
    }

    Config load_config(const std::string& yaml) {
        fs::path p = test_dir / "config.yaml";
        std::ofstream(p) << yaml;
        auto r = Config::load(p);
        EXPECT_TRUE(r.is_ok()) << r.error;
        return r.value;
    }

    static std::string read_file(const fs::path& p) {
        std::ifstream f(p, std::ios::binary);
        std::ostringstream ss;
        ss << f.rdbuf();
        return ss.str();
    }

    int run(AisafeCLI& cli, std::vector<std::string> args) {
        std::string prog = APP_NAME;
        std::vector<char*> argv{prog.data()};
        for (auto& a : args) argv.push_back(a.data());

        testing::internal::CaptureStdout();
        testing::internal::CaptureStderr();
        int rc = cli.run(static_cast<int>(argv.size()), argv.data());
        out = testing::internal::GetCapturedStdout();
        err = testing::internal::GetCapturedStderr();
        return rc;
    }

    // Fresh CLI (and store) per invocation, like separate processes
    int run(std::vector<std::string> args) {
        AisafeCLI cli(config);
        return run(cli, std::move(args));
    }

    // Same, with --file pointing at the test credentials file
    int run_on_file(std::vector<std::string> args) {
        args.insert(args.begin(), {"--file", creds.string()});
        return run(std::move(args));
    }
};

// ── Commands ────────────────────────────────────────────────

TEST_F(CliTest, SetGetRemove) {
    EXPECT_EQ(run_on_file({"set", "db.user", "alice"}), 0) << err;
    EXPECT_NE(out.find("Set 'db.user'"), std::string::npos) << out;
    EXPECT_EQ(read_file(creds), "[db]\nuser = \"alice\"\n");

    EXPECT_EQ(run_on_file({"get", "db.user"}), 0) << err;
    EXPECT_EQ(out, "alice\n");

    EXPECT_EQ(run_on_file({"remove", "db.user"}), 0) << err;
    EXPECT_NE(out.find("Removed 'db.user'"), std::string::npos) << out;
    EXPECT_EQ(read_file(creds), "[db]\n");

    EXPECT_EQ(run_on_file({"get", "db.user"}), 1);
    EXPECT_NE(err.find("not found"), std::string::npos) << err;
}

TEST_F(CliTest, GetPrintsTypedValuesAsLiterals) {
    std::ofstream(creds) << "[svc]\nport = 8080\ntls = true\n";

    EXPECT_EQ(run_on_file({"get", "svc.port"}), 0) << err;
    EXPECT_EQ(out, "8080\n");
    EXPECT_EQ(run_on_file({"get", "svc.tls"}), 0) << err;
    EXPECT_EQ(out, "true\n");
}

TEST_F(CliTest, EveryStoreErrorExitsOne) {
    // InvalidKey
    EXPECT_EQ(run_on_file({"get", "nodot"}), 1);
    EXPECT_NE(err.find("Invalid key"), std::string::npos) << err;
    EXPECT_EQ(run_on_file({"set", "nodot", "v"}), 1);
    EXPECT_EQ(run_on_file({"remove", ".key"}), 1);

    // KeyNotFound
    EXPECT_EQ(run_on_file({"get", "db.missing"}), 1);
    EXPECT_EQ(run_on_file({"remove", "db.missing"}), 1);
    EXPECT_FALSE(fs::exists(creds));

    // ParseError
    std::ofstream(creds) << "[a.b]\nk = 1\n";
    EXPECT_EQ(run_on_file({"get", "a.k"}), 1);
    EXPECT_NE(err.find("line 1"), std::string::npos) << err;
    EXPECT_EQ(run_on_file({"list"}), 1);
    EXPECT_EQ(run_on_file({"set", "a.k", "2"}), 1);
    EXPECT_EQ(read_file(creds), "[a.b]\nk = 1\n");

    // IOError: a directory where the file should be
    EXPECT_EQ(run({"--file", test_dir.string(), "get", "a.b"}), 1);
    EXPECT_FALSE(err.empty());
}

TEST_F(CliTest, FailuresAreOneLineOnStderr) {
    EXPECT_EQ(run_on_file({"get", "db.missing"}), 1);
    EXPECT_TRUE(out.empty()) << out;
    ASSERT_FALSE(err.empty());
    EXPECT_EQ(err.find('\n'), err.size() - 1) << err;
}

TEST_F(CliTest, ListEmptyStore) {
    EXPECT_EQ(run_on_file({"list"}), 0) << err;
    EXPECT_NE(out.find("No credentials configured yet."), std::string::npos) << out;
    EXPECT_FALSE(fs::exists(creds));
}

TEST_F(CliTest, ListShowsSectionsAndKeysWithoutValues) {
    ASSERT_EQ(run_on_file({"set", "db.user", "alice"}), 0);
    ASSERT_EQ(run_on_file({"set", "db.pass", "hunter2"}), 0);
    ASSERT_EQ(run_on_file({"set", "api.token", "tok"}), 0);

    EXPECT_EQ(run_on_file({"list"}), 0) << err;
    EXPECT_EQ(out, "[db]\n  user\n  pass\n[api]\n  token\n");
    EXPECT_EQ(out.find("hunter2"), std::string::npos);

    EXPECT_EQ(run_on_file({"list", "db"}), 0) << err;
    EXPECT_EQ(out, "  db.user\n  db.pass\n");
}

TEST_F(CliTest, ListOfMissingOrEmptySectionFails) {
    EXPECT_EQ(run_on_file({"list", "nosuch"}), 1);
    EXPECT_NE(err.find("Section 'nosuch' not found or empty"), std::string::npos) << err;

    ASSERT_EQ(run_on_file({"set", "db.user", "alice"}), 0);
    ASSERT_EQ(run_on_file({"remove", "db.user"}), 0);
    EXPECT_EQ(run_on_file({"list", "db"}), 1);
    EXPECT_NE(err.find("Section 'db' not found or empty"), std::string::npos) << err;
}

TEST_F(CliTest, PathReportsWhetherFileExists) {
    EXPECT_EQ(run_on_file({"path"}), 0) << err;
    EXPECT_EQ(out, creds.string() + " (not created yet)\n");

    ASSERT_EQ(run_on_file({"set", "a.b", "c"}), 0);
    EXPECT_EQ(run_on_file({"path"}), 0) << err;
    EXPECT_EQ(out, creds.string() + "\n");
}

// ── Global options ──────────────────────────────────────────

TEST_F(CliTest, FileOptionBeatsEnvironment) {
    fs::path env_file = test_dir / "env.toml";
    setenv("AISAFE_FILE", env_file.c_str(), 1);

    EXPECT_EQ(run({"--file", creds.string(), "set", "a.b", "c"}), 0) << err;
    EXPECT_TRUE(fs::exists(creds));
    EXPECT_FALSE(fs::exists(env_file));

    EXPECT_EQ(run({"--file=" + creds.string(), "get", "a.b"}), 0) << err;
    EXPECT_EQ(out, "c\n");

    // Without --file the environment applies
    EXPECT_EQ(run({"set", "x.y", "z"}), 0) << err;
    EXPECT_TRUE(fs::exists(env_file));
    EXPECT_EQ(read_file(creds), "[a]\nb = \"c\"\n");
}

TEST_F(CliTest, UsageErrorsExitOne) {
    EXPECT_EQ(run({}), 1);
    EXPECT_EQ(run({"bogus"}), 1);
    EXPECT_NE(err.find("Unknown command: bogus"), std::string::npos) << err;
    EXPECT_EQ(run({"--bogus", "list"}), 1);
    EXPECT_NE(err.find("Unknown option: --bogus"), std::string::npos) << err;
    EXPECT_EQ(run({"--file"}), 1);

    EXPECT_EQ(run_on_file({"get"}), 1);
    EXPECT_NE(err.find("Usage:"), std::string::npos) << err;
    EXPECT_EQ(run_on_file({"set"}), 1);
    EXPECT_EQ(run_on_file({"set", "a.b", "c", "extra"}), 1);
    EXPECT_EQ(run_on_file({"remove"}), 1);
    EXPECT_EQ(run_on_file({"list", "a", "b"}), 1);
    EXPECT_EQ(run_on_file({"path", "extra"}), 1);
    EXPECT_FALSE(fs::exists(creds));
}

TEST_F(CliTest, HelpAndVersion) {
    EXPECT_EQ(run({"--help"}), 0);
    EXPECT_NE(out.find("Usage"), std::string::npos);
    for (const char* cmd : {"set", "get", "list", "remove", "path"}) {
        EXPECT_NE(out.find(cmd), std::string::npos) << cmd;
    }
    EXPECT_EQ(run({"-h"}), 0);

    EXPECT_EQ(run({"--version"}), 0);
    EXPECT_EQ(out, std::string(APP_NAME) + " version " + APP_VERSION + "\n");
}

// ── Prompted values ─────────────────────────────────────────

TEST_F(CliTest, SetPromptsWhenValueOmitted) {
    AisafeCLI cli(config);
    std::string asked;
    cli.set_secret_reader([&asked](const std::string& prompt) {
        asked = prompt;
        return std::string("typed-secret");
    });

    EXPECT_EQ(run(cli, {"--file", creds.string(), "set", "db.password"}), 0) << err;
    EXPECT_NE(asked.find("db.password"), std::string::npos) << asked;
    EXPECT_EQ(read_file(creds), "[db]\npassword = \"typed-secret\"\n");
}

TEST_F(CliTest, AbandonedPromptStoresNothing) {
    AisafeCLI cli(config);
    cli.set_secret_reader([](const std::string&) { return std::string(); });

    EXPECT_EQ(run(cli, {"--file", creds.string(), "set", "db.password"}), 1);
    EXPECT_NE(err.find("empty"), std::string::npos) << err;
    EXPECT_FALSE(fs::exists(creds));
}

TEST_F(CliTest, KeyCheckedBeforePrompting) {
    AisafeCLI cli(config);
    bool asked = false;
    cli.set_secret_reader([&asked](const std::string&) {
        asked = true;
        return std::string("unused");
    });

    EXPECT_EQ(run(cli, {"--file", creds.string(), "set", "nodot"}), 1);
    EXPECT_FALSE(asked);
}

TEST_F(CliTest, PipedValueIsReadFromStdin) {
    if (platform::stdin_is_tty()) GTEST_SKIP() << "stdin is a terminal";

    std::istringstream input("piped-secret\r\n");
    std::streambuf* saved = std::cin.rdbuf(input.rdbuf());
    int rc = run_on_file({"set", "db.password"});
    std::cin.rdbuf(saved);

    EXPECT_EQ(rc, 0) << err;
    EXPECT_NE(err.find("Enter value for 'db.password'"), std::string::npos) << err;
    EXPECT_EQ(read_file(creds), "[db]\npassword = \"piped-secret\"\n");
}

// ── Debug log ───────────────────────────────────────────────

#if !defined(_WIN32) && !defined(__APPLE__)
TEST_F(CliTest, DebugLogIsPrivateAndHasNoValues) {
    config = load_config("color: false\ndebug_log: true\n");
    fs::path log_dir = test_dir / "config" / "aisafe";
    fs::create_directories(log_dir);

    ASSERT_EQ(run_on_file({"set", "db.password", "hunter2"}), 0) << err;
    ASSERT_EQ(run_on_file({"get", "db.missing"}), 1);

    fs::path log = log_dir / DEBUG_LOG_FILENAME;
    ASSERT_TRUE(fs::exists(log));
    EXPECT_EQ(fs::status(log).permissions() & fs::perms::all,
              fs::perms::owner_read | fs::perms::owner_write);

    std::string text = read_file(log);
    EXPECT_NE(text.find("set key=db.password"), std::string::npos) << text;
    EXPECT_NE(text.find("error kind=key not found"), std::string::npos) << text;
    EXPECT_EQ(text.find("hunter2"), std::string::npos) << text;
}

TEST_F(CliTest, DebugLogOffByDefault) {
    fs::path log_dir = test_dir / "config" / "aisafe";
    fs::create_directories(log_dir);

    ASSERT_EQ(run_on_file({"set", "db.password", "hunter2"}), 0) << err;
    EXPECT_FALSE(fs::exists(log_dir / DEBUG_LOG_FILENAME));
}
#endif

// ── collect_line ────────────────────────────────────────────

// Byte source that runs dry after the given text, like a prompt timing out
static std::function<bool(char&)> bytes_from(const std::string& text) {
    auto pos = std::make_shared<size_t>(0);
    return [text, pos](char& c) {
        if (*pos >= text.size()) return false;
        c = text[(*pos)++];
        return true;
    };
}

TEST(CollectLine, StopsAtLineEnd) {
    EXPECT_EQ(collect_line(bytes_from("secret\nrest")), std::optional<std::string>("secret"));
    EXPECT_EQ(collect_line(bytes_from("secret\r")), std::optional<std::string>("secret"));
    EXPECT_EQ(collect_line(bytes_from("\n")), std::optional<std::string>(""));
}

TEST(CollectLine, BackspaceAndControlCharacters) {
    EXPECT_EQ(collect_line(bytes_from("ab\x7f" "c\n")), std::optional<std::string>("ac"));
    EXPECT_EQ(collect_line(bytes_from("\x08\x08x\n")), std::optional<std::string>("x"));
    EXPECT_EQ(collect_line(bytes_from("a\x01\x1b" "b\n")), std::optional<std::string>("ab"));
}

TEST(CollectLine, PartialLineIsDiscarded) {
    EXPECT_EQ(collect_line(bytes_from("abc")), std::nullopt);
    EXPECT_EQ(collect_line(bytes_from("")), std::nullopt);
}
