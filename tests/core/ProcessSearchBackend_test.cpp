#include <gtest/gtest.h>
#include "core/ProcessSearchBackend.hpp"
#include <atomic>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <exception>
#include <filesystem>
#include <fstream>
#include <thread>
#include <unistd.h>

using namespace grok_mcp;
namespace fs = std::filesystem;
using Clock = std::chrono::steady_clock;

class ProcessSearchBackendTest : public ::testing::Test {
protected:
    fs::path test_dir_;
    EffectiveConfig config_;

    void SetUp() override {
        test_dir_ = fs::temp_directory_path() /
            (std::string("search_backend_") +
             ::testing::UnitTest::GetInstance()->current_test_info()->name() + "_" +
             std::to_string(::getpid()));
        fs::remove_all(test_dir_);
        fs::create_directories(test_dir_);

        config_.base_url = "https://api.example";
        config_.api_key = "sk-test-secret";
        config_.model = "grok-test";
        config_.timeout_seconds = 10;
    }

    void TearDown() override {
        fs::remove_all(test_dir_);
    }

    fs::path write_script(const std::string& name, const std::string& body, bool executable = true) {
        fs::path path = test_dir_ / name;
        std::ofstream file(path);
        file << "#!/bin/sh\n" << body << "\n";
        file.close();
        if (executable) {
            fs::permissions(path, fs::perms::owner_all, fs::perm_options::replace);
        }
        return path;
    }

    std::string read_file(const fs::path& path) {
        std::ifstream file(path);
        std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
        return content;
    }
};

TEST_F(ProcessSearchBackendTest, CapturesStdoutOnSuccess) {
    auto script = write_script("ok.sh", "printf 'result text'");
    ProcessSearchBackend backend({script.string()});

    auto result = backend.invoke("anything", config_);

    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.stdout_text, "result text");
    EXPECT_TRUE(result.stderr_text.empty());
    EXPECT_GE(result.duration_ms, 0);
}

TEST_F(ProcessSearchBackendTest, KeepsStdoutAndStderrSeparate) {
    auto script = write_script("mixed.sh", "echo out\necho err >&2\nexit 3");
    ProcessSearchBackend backend({script.string()});

    auto result = backend.invoke("q", config_);

    EXPECT_EQ(result.exit_code, 3);
    EXPECT_EQ(result.stdout_text, "out\n");
    EXPECT_EQ(result.stderr_text, "err\n");
}

TEST_F(ProcessSearchBackendTest, PassesQueryAsArgument) {
    auto script = write_script("args.sh", "printf '%s\\n' \"$@\"");
    ProcessSearchBackend backend({script.string()});

    auto result = backend.invoke("hello world", config_);

    EXPECT_EQ(result.stdout_text, "--query\nhello world\n");
    EXPECT_EQ(result.stdout_text.find(config_.api_key), std::string::npos);
}

TEST_F(ProcessSearchBackendTest, PassesConfigThroughEnvironment) {
    auto script = write_script("env.sh",
        "printf '%s|%s|%s|%s' \"$GROK_BASE_URL\" \"$GROK_API_KEY\" \"$GROK_MODEL\" \"$GROK_TIMEOUT_SECONDS\"");
    ProcessSearchBackend backend({script.string()});

    auto result = backend.invoke("q", config_);

    EXPECT_EQ(result.stdout_text, "https://api.example|sk-test-secret|grok-test|10");
}

TEST_F(ProcessSearchBackendTest, OptionalSettingsOnlySetWhenConfigured) {
    auto script = write_script("optional.sh",
        "printf '%s|%s' \"${GROK_SYSTEM_PROMPT-unset}\" \"${GROK_EXTRA_BODY_JSON-unset}\"");
    ProcessSearchBackend backend({script.string()});

    EXPECT_EQ(backend.invoke("q", config_).stdout_text, "unset|unset");

    config_.system_prompt = "Be brief.";
    config_.extra_body = {{"temperature", 0}};
    EXPECT_EQ(backend.invoke("q", config_).stdout_text, "Be brief.|{\"temperature\":0}");
}

TEST_F(ProcessSearchBackendTest, LeadingCommandArgumentsArePreserved) {
    auto script = write_script("plain.sh", "printf '%s' \"$1\"", false);
    ProcessSearchBackend backend({"/bin/sh", script.string()});

    auto result = backend.invoke("q", config_);

    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.stdout_text, "--query");
}

TEST_F(ProcessSearchBackendTest, MissingExecutableThrowsInvocationError) {
    ProcessSearchBackend backend({(test_dir_ / "does-not-exist").string()});

    try {
        backend.invoke("q", config_);
        FAIL() << "Expected InvocationError";
    } catch (const InvocationTimeout&) {
        FAIL() << "Launch failure must not be reported as a timeout";
    } catch (const InvocationError& e) {
        EXPECT_NE(std::string(e.what()).find("does-not-exist"), std::string::npos);
    }
}

TEST_F(ProcessSearchBackendTest, NonExecutableFileThrowsInvocationError) {
    auto script = write_script("noexec.sh", "echo hi", false);
    ProcessSearchBackend backend({script.string()});

    EXPECT_THROW(backend.invoke("q", config_), InvocationError);
}

TEST_F(ProcessSearchBackendTest, SignalledChildReportsShellStyleExitCode) {
    auto script = write_script("killed.sh", "kill -9 $$");
    ProcessSearchBackend backend({script.string()});

    auto result = backend.invoke("q", config_);

    EXPECT_EQ(result.exit_code, 128 + SIGKILL);
}

TEST_F(ProcessSearchBackendTest, TimeoutTerminatesChild) {
    auto pid_file = test_dir_ / "child.pid";
    auto script = write_script("hang.sh",
        "echo $$ > '" + pid_file.string() + "'\necho partial\nsleep 30");
    ProcessSearchBackend backend({script.string()});
    config_.timeout_seconds = 1;

    auto start = Clock::now();
    EXPECT_THROW(backend.invoke("q", config_), InvocationTimeout);
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);

    EXPECT_LE(elapsed.count(), 1500);

    ASSERT_TRUE(fs::exists(pid_file));
    pid_t child = static_cast<pid_t>(std::stol(read_file(pid_file)));
    errno = 0;
    EXPECT_EQ(::kill(child, 0), -1);
    EXPECT_EQ(errno, ESRCH);
}

TEST_F(ProcessSearchBackendTest, CancelAllInterruptsInFlightSearch) {
    auto script = write_script("slow.sh", "sleep 30");
    ProcessSearchBackend backend({script.string()});
    config_.timeout_seconds = 30;

    std::exception_ptr error;
    auto start = Clock::now();
    std::thread worker([&] {
        try {
            backend.invoke("q", config_);
        } catch (...) {
            error = std::current_exception();
        }
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    backend.cancel_all();
    worker.join();

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
    EXPECT_LT(elapsed.count(), 5000);

    ASSERT_TRUE(error);
    try {
        std::rethrow_exception(error);
    } catch (const InvocationTimeout&) {
        FAIL() << "Cancellation must not be reported as a timeout";
    } catch (const InvocationError& e) {
        EXPECT_NE(std::string(e.what()).find("cancelled"), std::string::npos);
    }

    // Refuses new work after cancellation
    EXPECT_THROW(backend.invoke("q", config_), InvocationError);
}

TEST_F(ProcessSearchBackendTest, ConcurrentInvocationsAreIndependent) {
    auto script = write_script("echo.sh", "sleep 0.2\nprintf '%s' \"$2\"");
    ProcessSearchBackend backend({script.string()});

    constexpr int kWorkers = 4;
    std::vector<std::string> outputs(kWorkers);
    std::vector<std::thread> threads;
    for (int i = 0; i < kWorkers; ++i) {
        threads.emplace_back([&, i] {
            outputs[i] = backend.invoke("query-" + std::to_string(i), config_).stdout_text;
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    for (int i = 0; i < kWorkers; ++i) {
        EXPECT_EQ(outputs[i], "query-" + std::to_string(i));
    }
}

TEST_F(ProcessSearchBackendTest, ReturnsWhenChildExitsBeforeBackgroundJob) {
    auto script = write_script("background.sh", "sleep 30 &\necho 'result text'\nexit 0");
    ProcessSearchBackend backend({script.string()});
    config_.timeout_seconds = 5;

    auto start = Clock::now();
    auto result = backend.invoke("q", config_);
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);

    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.stdout_text, "result text\n");
    EXPECT_LT(elapsed.count(), 2000);
}

TEST_F(ProcessSearchBackendTest, CaptureIsCappedPerStream) {
    auto script = write_script("flood.sh",
        "head -c 100000 /dev/zero | tr '\\0' 'a'\nhead -c 50 /dev/zero | tr '\\0' 'e' >&2");
    ProcessSearchBackend backend({script.string()}, 1000);

    auto result = backend.invoke("q", config_);

    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.stdout_text, std::string(1000, 'a'));
    EXPECT_EQ(result.stderr_text, std::string(50, 'e'));
    EXPECT_TRUE(result.truncated);
}

TEST_F(ProcessSearchBackendTest, ShortOutputIsNotTruncated) {
    auto script = write_script("short.sh", "printf 'ok'");
    ProcessSearchBackend backend({script.string()}, 1000);

    EXPECT_FALSE(backend.invoke("q", config_).truncated);
}

TEST_F(ProcessSearchBackendTest, ChildrenAreForgottenOnceReaped) {
    auto ok = write_script("ok.sh", "printf 'done'");
    auto hang = write_script("hang.sh", "sleep 30");
    ProcessSearchBackend finished({ok.string()});
    ProcessSearchBackend hanging({hang.string()});

    finished.invoke("q", config_);
    EXPECT_EQ(finished.active_children(), 0u);

    config_.timeout_seconds = 1;
    EXPECT_THROW(hanging.invoke("q", config_), InvocationTimeout);
    EXPECT_EQ(hanging.active_children(), 0u);
}

TEST_F(ProcessSearchBackendTest, EmptyCommandIsRejected) {
    EXPECT_THROW(ProcessSearchBackend(std::vector<std::string>{}), std::invalid_argument);
    EXPECT_THROW(ProcessSearchBackend(std::vector<std::string>{""}), std::invalid_argument);
}
