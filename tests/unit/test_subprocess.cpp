#include "dokuwiki/errors.hpp"
#include "../../src/internal/git/git.hpp"
#include "../../src/internal/subprocess/process.hpp"
#include "../test_utils.hpp"

#include <chrono>
#include <gtest/gtest.h>
#include <thread>

using namespace dokuwiki::subprocess;
namespace git = dokuwiki::git;

// Test basic process spawn
TEST(ProcessTest, SpawnEcho)
{
    Process proc;
    proc.spawn("/bin/echo", {"Hello"});

    EXPECT_TRUE(proc.is_running() || proc.try_wait().has_value());
    EXPECT_EQ(proc.wait(), 0);
}

TEST(ProcessTest, CaptureStdout)
{
    Process proc;
    proc.spawn("/bin/echo", {"TestOutput"});

    std::string output = proc.stdout_pipe().read_line();
    EXPECT_EQ(output, "TestOutput\n");
    proc.wait();
}

TEST(ProcessTest, WriteStdin)
{
    Process proc;
    proc.spawn("/bin/cat", {});

    proc.stdin_pipe().write("Hello\n");
    proc.stdin_pipe().close(); // EOF

    EXPECT_EQ(proc.stdout_pipe().read_line(), "Hello\n");
    proc.wait();
}

TEST(ProcessTest, Terminate)
{
    Process proc;
    proc.spawn("/bin/sleep", {"10"});
    EXPECT_TRUE(proc.is_running());

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    proc.terminate();
    proc.wait();
    EXPECT_FALSE(proc.is_running());
}

TEST(ProcessTest, FindExecutable)
{
    EXPECT_TRUE(find_executable("sh").has_value());
    EXPECT_FALSE(find_executable("this_should_not_exist_12345").has_value());
}

TEST(ProcessTest, WorkingDirectory)
{
    dokuwiki::test::TempDir dir;
    ProcessOptions opts;
    opts.working_directory = dir.path().string();

    ProcessResult result = run("/bin/pwd", {}, {}, opts);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_NE(result.out.find(dir.path().filename().string()), std::string::npos);
}

TEST(ProcessTest, EnvironmentOverlay)
{
    ProcessOptions opts;
    opts.environment["DOKUWIKI_TEST_VAR"] = "test_value";

    ProcessResult result = run("/bin/sh", {"-c", "echo $DOKUWIKI_TEST_VAR"}, {}, opts);
    EXPECT_EQ(result.out, "test_value\n");
}

TEST(ProcessTest, CleanEnvironment)
{
    ::setenv("DOKUWIKI_LEAKED_VAR", "leak", 1);
    ProcessOptions opts;
    opts.inherit_environment = false;
    opts.environment["ONLY"] = "this";

    ProcessResult result =
        run("/bin/sh", {"-c", "echo \"[$DOKUWIKI_LEAKED_VAR][$ONLY]\""}, {}, opts);
    ::unsetenv("DOKUWIKI_LEAKED_VAR");
    EXPECT_EQ(result.out, "[][this]\n");
}

TEST(ProcessTest, ExitCodeIsReported)
{
    EXPECT_EQ(run("/bin/sh", {"-c", "exit 3"}).exit_code, 3);
    EXPECT_EQ(run("/bin/true", {}).exit_code, 0);
}

// Large input and output must not deadlock on full pipes
TEST(ProcessTest, RunMultiplexesLargePayloads)
{
    std::string input(1 << 20, 'x');
    ProcessResult result = run("/bin/cat", {}, input);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.out.size(), input.size());
}

TEST(ProcessTest, RunCapturesStderrWhenRedirected)
{
    ProcessOptions opts;
    opts.redirect_stderr = true;
    ProcessResult result = run("/bin/sh", {"-c", "echo out; echo err >&2"}, {}, opts);
    EXPECT_EQ(result.out, "out\n");
    EXPECT_EQ(result.err, "err\n");
}

TEST(ProcessTest, ReadMultipleLines)
{
    Process proc;
    proc.spawn("/bin/sh", {"-c", "echo Line1; echo Line2"});

    EXPECT_EQ(proc.stdout_pipe().read_line(), "Line1\n");
    EXPECT_EQ(proc.stdout_pipe().read_line(), "Line2\n");
    EXPECT_EQ(proc.stdout_pipe().read_line(), "");
    proc.wait();
}

// ============================================================================
// git plumbing
// ============================================================================

TEST(GitCredentialTest, FormatAndParse)
{
    dokuwiki::Credential credential;
    credential.protocol = "https";
    credential.host = "wiki.example.com:8443";
    credential.username = "admin";

    const std::string text = git::format_credential(credential);
    EXPECT_EQ(text, "protocol=https\nhost=wiki.example.com:8443\nusername=admin\n\n");

    dokuwiki::Credential parsed =
        git::parse_credential("protocol=https\nhost=h\nusername=u\npassword=p=q\nnoise\n");
    EXPECT_EQ(parsed.host, "h");
    EXPECT_EQ(parsed.username, "u");
    EXPECT_EQ(parsed.password, "p=q");
}

TEST(GitTest, ConfigAndBlobsInScratchRepository)
{
    SKIP_WITHOUT_GIT();
    dokuwiki::test::TempDir dir;
    const std::string repo = dir.file("repo");

    ASSERT_EQ(git::run({"init", "-q", repo}).exit_code, 0);
    ASSERT_EQ(git::run({"-C", repo, "config", "dokuwiki.extension", "wiki"}).exit_code, 0);

    ::setenv("GIT_DIR", (repo + "/.git").c_str(), 1);
    EXPECT_EQ(git::config_get("dokuwiki.extension"), "wiki");
    EXPECT_FALSE(git::config_get("dokuwiki.depth").has_value());
    EXPECT_EQ(git::git_dir(), repo + "/.git");

    git::GitResult hashed = git::run({"hash-object", "-w", "--stdin"}, "page text\n");
    ASSERT_EQ(hashed.exit_code, 0);
    std::string oid = hashed.out.substr(0, hashed.out.find('\n'));
    EXPECT_EQ(git::cat_blob(oid), "page text\n");
    EXPECT_THROW(git::cat_blob(std::string(40, '0')), dokuwiki::StreamError);
    ::unsetenv("GIT_DIR");
}
