#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "launchpad/command.hpp"
#include "launchpad/launcher.hpp"
#include "tests/helpers/helper_path.hpp"

namespace launchpad {

namespace {

namespace fs = std::filesystem;

fs::path unique_temp_path(std::string_view stem) {
  static std::atomic<unsigned> counter{0};
  std::string name = "launchpad_";
  name.append(stem);
  name += "_" + std::to_string(::getpid()) + "_" + std::to_string(counter.fetch_add(1)) + ".txt";
  return fs::temp_directory_path() / name;
}

std::string read_file(const fs::path& path) {
  std::ifstream file(path, std::ios::binary);
  return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

std::size_t count_open_fds() {
  std::size_t count = 0;
  for ([[maybe_unused]] const auto& entry : fs::directory_iterator("/proc/self/fd")) {
    ++count;
  }
  return count;
}

std::vector<int> parse_fd_list(const std::string& text) {
  std::vector<int> fds;
  std::istringstream stream(text);
  int fd = 0;
  while (stream >> fd) {
    fds.push_back(fd);
  }
  return fds;
}

bool contains(const std::vector<int>& values, int value) {
  return std::find(values.begin(), values.end(), value) != values.end();
}

// Points the test process's own stdout and stderr at files until destroyed.
class ScopedStandardRedirect {
 public:
  ScopedStandardRedirect(const fs::path& out_path, const fs::path& err_path) {
    std::cout.flush();
    std::cerr.flush();
    std::fflush(nullptr);
    saved_out_ = ::dup(STDOUT_FILENO);
    saved_err_ = ::dup(STDERR_FILENO);
    int out = ::open(out_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    int err = ::open(err_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    ok_ = saved_out_ >= 0 && saved_err_ >= 0 && out >= 0 && err >= 0 &&
          ::dup2(out, STDOUT_FILENO) != -1 && ::dup2(err, STDERR_FILENO) != -1;
    for (int fd : {out, err}) {
      if (fd >= 0) {
        ::close(fd);
      }
    }
  }
  ~ScopedStandardRedirect() {
    std::cout.flush();
    std::cerr.flush();
    std::fflush(nullptr);
    if (saved_out_ >= 0) {
      ::dup2(saved_out_, STDOUT_FILENO);
      ::close(saved_out_);
    }
    if (saved_err_ >= 0) {
      ::dup2(saved_err_, STDERR_FILENO);
      ::close(saved_err_);
    }
  }
  ScopedStandardRedirect(const ScopedStandardRedirect&) = delete;
  ScopedStandardRedirect& operator=(const ScopedStandardRedirect&) = delete;

  [[nodiscard]] bool ok() const { return ok_; }

 private:
  int saved_out_ = -1;
  int saved_err_ = -1;
  bool ok_ = false;
};

std::string describe(const Error& error) {
  return error.context + ": " + error.code.message();
}

std::string strategy_name(const ::testing::TestParamInfo<Strategy>& info) {
  return info.param == Strategy::fork_exec ? "ForkExec" : "PosixSpawn";
}

}  // namespace

class LauncherIntegrationTest : public ::testing::TestWithParam<Strategy> {
 protected:
  void SetUp() override {
    helper_ = support::helper_path();
    ASSERT_FALSE(helper_.empty());
  }

  Command helper_command() const {
    Command cmd(helper_);
    cmd.strategy(GetParam());
    return cmd;
  }

  std::string helper_;
};

TEST_P(LauncherIntegrationTest, ReportsExitCode) {
  auto result = helper_command().arg("--exit-code").arg("7").launch();
  ASSERT_TRUE(result.has_value()) << describe(result.error());
  EXPECT_EQ(result->status.kind(), ExitStatus::Kind::exited);
  EXPECT_EQ(result->status.code(), 7);
  EXPECT_GT(result->pid, 0);
}

TEST_P(LauncherIntegrationTest, SameRequestTwiceGivesSameStatus) {
  LaunchRequest request = helper_command().arg("--exit-code").arg("3").request();
  for (int i = 0; i < 2; ++i) {
    auto result = launch(request);
    ASSERT_TRUE(result.has_value()) << describe(result.error());
    EXPECT_EQ(result->status.code(), 3);
  }
}

TEST_P(LauncherIntegrationTest, MissingProgramIsNotFoundAndLeavesNoChild) {
  Command cmd("/nonexistent/launchpad/program");
  cmd.strategy(GetParam());
  auto result = cmd.launch();
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, make_error_code(errc::executable_not_found));

  int status = 0;
  errno = 0;
  EXPECT_EQ(::waitpid(-1, &status, WNOHANG), -1);
  EXPECT_EQ(errno, ECHILD);
}

TEST_P(LauncherIntegrationTest, BareNameIsSearchedOnPath) {
  fs::path dir = fs::path(helper_).parent_path();
  LaunchRequest request =
      helper_command().arg("--exit-code").arg("4").env("PATH", dir.string()).request();
  request.program = fs::path(helper_).filename().string();
  auto launched = launch(request);
  ASSERT_TRUE(launched.has_value()) << describe(launched.error());
  EXPECT_EQ(launched->status.code(), 4);
}

TEST_P(LauncherIntegrationTest, PassesArgumentsVerbatim) {
  auto result = helper_command()
                    .arg0("renamed")
                    .arg("--echo-args")
                    .arg("two words")
                    .arg("")
                    .arg("quote\"d")
                    .output();
  ASSERT_TRUE(result.has_value()) << describe(result.error());
  std::string expected;
  for (const char* arg : {"renamed", "--echo-args", "two words", "", "quote\"d"}) {
    expected.append(arg);
    expected.push_back('\0');
  }
  EXPECT_EQ(result->stdout_data, expected);
}

TEST_P(LauncherIntegrationTest, CapturesLargeOutputLosslessly) {
  constexpr std::size_t kStdoutBytes = 1024 * 1024;
  constexpr std::size_t kStderrBytes = 512 * 1024;
  auto result = helper_command()
                    .arg("--stdout-bytes")
                    .arg(std::to_string(kStdoutBytes))
                    .arg("--stderr-bytes")
                    .arg(std::to_string(kStderrBytes))
                    .output();
  ASSERT_TRUE(result.has_value()) << describe(result.error());
  EXPECT_TRUE(result->status.success());
  EXPECT_EQ(result->stdout_data, support::pattern(kStdoutBytes, 'a'));
  EXPECT_EQ(result->stderr_data, support::pattern(kStderrBytes, 'A'));
}

TEST_P(LauncherIntegrationTest, MergeStderrIntoStdout) {
  LaunchOptions options;
  options.strategy = GetParam();
  options.merge_stderr_into_stdout = true;
  auto result = Command(helper_)
                    .arg("--stdout-bytes")
                    .arg("5")
                    .arg("--stderr-bytes")
                    .arg("3")
                    .options(options)
                    .output();
  ASSERT_TRUE(result.has_value()) << describe(result.error());
  // The helper's stdout is buffered and its stderr is not, so only the byte counts are fixed.
  EXPECT_EQ(result->stdout_data.size(), 8u);
  EXPECT_NE(result->stdout_data.find("abcde"), std::string::npos);
  EXPECT_NE(result->stdout_data.find("ABC"), std::string::npos);
  EXPECT_TRUE(result->stderr_data.empty());
}

TEST_P(LauncherIntegrationTest, SignaledChildIsReportedAsSignaled) {
  auto result = helper_command().arg("--raise-signal").arg(std::to_string(SIGTERM)).launch();
  ASSERT_TRUE(result.has_value()) << describe(result.error());
  EXPECT_EQ(result->status.kind(), ExitStatus::Kind::signaled);
  EXPECT_EQ(result->status.signal(), SIGTERM);
  EXPECT_FALSE(result->status.code().has_value());

  auto code = checked_exit_code(result->status);
  ASSERT_FALSE(code.has_value());
  EXPECT_EQ(code.error().code, make_error_code(errc::abnormal_termination));
}

TEST_P(LauncherIntegrationTest, RunsInRequestedDirectory) {
  fs::path cwd = fs::temp_directory_path();
  auto result = helper_command().arg("--print-cwd").current_dir(cwd).output();
  ASSERT_TRUE(result.has_value()) << describe(result.error());
  std::error_code ec;
  EXPECT_TRUE(fs::equivalent(fs::path(result->stdout_data), cwd, ec)) << ec.message();
}

TEST_P(LauncherIntegrationTest, MissingDirectoryFailsWithoutStarting) {
  auto result = helper_command().current_dir("/nonexistent/launchpad/dir").launch();
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, make_error_code(errc::chdir_failed));
}

TEST_P(LauncherIntegrationTest, SetsAndRemovesEnvironment) {
  ASSERT_EQ(::setenv("LAUNCHPAD_TEST_REMOVED", "present", 1), 0);
  auto removed = helper_command()
                     .arg("--print-env")
                     .arg("LAUNCHPAD_TEST_REMOVED")
                     .env_remove("LAUNCHPAD_TEST_REMOVED")
                     .output();
  ::unsetenv("LAUNCHPAD_TEST_REMOVED");
  ASSERT_TRUE(removed.has_value()) << describe(removed.error());
  EXPECT_EQ(removed->stdout_data, "<unset>");

  auto set = helper_command()
                 .arg("--print-env")
                 .arg("LAUNCHPAD_TEST_VALUE")
                 .env("LAUNCHPAD_TEST_VALUE", "value")
                 .output();
  ASSERT_TRUE(set.has_value()) << describe(set.error());
  EXPECT_EQ(set->stdout_data, "value");
}

TEST_P(LauncherIntegrationTest, ClearedEnvironmentHidesParentVariables) {
  auto result = helper_command().arg("--print-env").arg("HOME").env_clear().output();
  ASSERT_TRUE(result.has_value()) << describe(result.error());
  EXPECT_EQ(result->stdout_data, "<unset>");
}

TEST_P(LauncherIntegrationTest, StreamsOutputIntoCallerSink) {
  std::ostringstream out;
  std::ostringstream err;
  auto result = helper_command()
                    .arg("--stdout-bytes")
                    .arg("100000")
                    .arg("--stderr-bytes")
                    .arg("10")
                    .stdout(Stdio::stream(out))
                    .stderr(Stdio::stream(err))
                    .launch();
  ASSERT_TRUE(result.has_value()) << describe(result.error());
  EXPECT_TRUE(result->stdout_data.empty());
  EXPECT_EQ(out.str(), support::pattern(100000, 'a'));
  EXPECT_EQ(err.str(), support::pattern(10, 'A'));
}

TEST_P(LauncherIntegrationTest, SpawnedChildDrainsSinkOnWait) {
  std::ostringstream out;
  auto child = helper_command().arg("--stdout-bytes").arg("70000").stdout(Stdio::stream(out)).spawn();
  ASSERT_TRUE(child.has_value()) << describe(child.error());
  auto status = child->wait();
  ASSERT_TRUE(status.has_value()) << describe(status.error());
  EXPECT_TRUE(status->success());
  EXPECT_EQ(out.str().size(), 70000u);
}

TEST_P(LauncherIntegrationTest, StdinPipeRoundTrip) {
  auto child = helper_command()
                   .arg("--echo-stdin")
                   .stdin(Stdio::piped())
                   .stdout(Stdio::piped())
                   .spawn();
  ASSERT_TRUE(child.has_value()) << describe(child.error());
  EXPECT_EQ(child->strategy(), GetParam());

  auto input = child->take_stdin();
  auto output = child->take_stdout();
  ASSERT_TRUE(input.has_value());
  ASSERT_TRUE(output.has_value());
  EXPECT_FALSE(child->take_stdin().has_value());

  auto written = input->write_all("hello launchpad");
  ASSERT_TRUE(written.has_value()) << describe(written.error());
  input->close();

  auto echoed = output->read_all();
  ASSERT_TRUE(echoed.has_value()) << describe(echoed.error());
  EXPECT_EQ(*echoed, "hello launchpad");

  auto status = child->wait();
  ASSERT_TRUE(status.has_value()) << describe(status.error());
  EXPECT_TRUE(status->success());
}

TEST_P(LauncherIntegrationTest, WaitClosesUntakenStdin) {
  auto child = helper_command().arg("--echo-stdin").stdin(Stdio::piped()).stdout(Stdio::null()).spawn();
  ASSERT_TRUE(child.has_value()) << describe(child.error());
  auto status = child->wait();
  ASSERT_TRUE(status.has_value()) << describe(status.error());
  EXPECT_TRUE(status->success());
}

TEST_P(LauncherIntegrationTest, OnlyDeclaredDescriptorsAreInherited) {
  int declared[2];
  int undeclared[2];
  ASSERT_EQ(::pipe2(declared, O_CLOEXEC), 0);
  ASSERT_EQ(::pipe(undeclared), 0);

  fs::path fd_path = unique_temp_path("open_fds");
  auto result = helper_command()
                    .arg("--write-open-fds")
                    .arg(fd_path.string())
                    .inherit_fd(declared[0])
                    .launch();
  for (int fd : {declared[0], declared[1], undeclared[0], undeclared[1]}) {
    ::close(fd);
  }
  ASSERT_TRUE(result.has_value()) << describe(result.error());
  ASSERT_TRUE(result->status.success());

  auto fds = parse_fd_list(read_file(fd_path));
  std::error_code ec;
  fs::remove(fd_path, ec);
  EXPECT_TRUE(contains(fds, STDIN_FILENO));
  EXPECT_TRUE(contains(fds, STDOUT_FILENO));
  EXPECT_TRUE(contains(fds, STDERR_FILENO));
  EXPECT_TRUE(contains(fds, declared[0]));
  EXPECT_FALSE(contains(fds, declared[1]));
  EXPECT_FALSE(contains(fds, undeclared[0]));
  EXPECT_FALSE(contains(fds, undeclared[1]));
}

TEST_P(LauncherIntegrationTest, InvalidInheritedDescriptorIsRejected) {
  auto result = helper_command().inherit_fd(1000000).launch();
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, make_error_code(errc::invalid_fd));
}

TEST_P(LauncherIntegrationTest, RedirectsToFiles) {
  fs::path out_path = unique_temp_path("stdout");
  auto first = helper_command().arg("--stdout-bytes").arg("4").stdout(Stdio::file(out_path)).launch();
  ASSERT_TRUE(first.has_value()) << describe(first.error());
  auto second = helper_command()
                    .arg("--stdout-bytes")
                    .arg("2")
                    .stdout(Stdio::file(out_path, OpenMode::write_append))
                    .launch();
  ASSERT_TRUE(second.has_value()) << describe(second.error());
  EXPECT_EQ(read_file(out_path), "abcdab");

  auto echoed = helper_command().arg("--echo-stdin").stdin(Stdio::file(out_path)).output();
  ASSERT_TRUE(echoed.has_value()) << describe(echoed.error());
  EXPECT_EQ(echoed->stdout_data, "abcdab");

  std::error_code ec;
  fs::remove(out_path, ec);
}

TEST_P(LauncherIntegrationTest, UnopenableRedirectionFails) {
  auto result = helper_command().stdout(Stdio::file("/nonexistent/launchpad/out.txt")).launch();
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, make_error_code(errc::open_failed));
}

TEST_P(LauncherIntegrationTest, NullRedirectionDiscardsOutput) {
  auto result = helper_command()
                    .arg("--stdout-bytes")
                    .arg("64")
                    .stdout(Stdio::null())
                    .stderr(Stdio::piped())
                    .output();
  ASSERT_TRUE(result.has_value()) << describe(result.error());
  EXPECT_TRUE(result->stdout_data.empty());
}

TEST_P(LauncherIntegrationTest, TimedWaitStopsHungChild) {
  auto child = helper_command().arg("--sleep-ms").arg("10000").spawn();
  ASSERT_TRUE(child.has_value()) << describe(child.error());

  WaitOptions options;
  options.timeout = std::chrono::milliseconds(100);
  auto start = std::chrono::steady_clock::now();
  auto status = child->wait(options);
  auto elapsed = std::chrono::steady_clock::now() - start;

  ASSERT_FALSE(status.has_value());
  EXPECT_EQ(status.error().code, make_error_code(errc::timeout));
  EXPECT_TRUE(child->reaped());
  EXPECT_LT(elapsed, std::chrono::seconds(5));
}

TEST_P(LauncherIntegrationTest, TimedWaitDeliversLargeStreamOutput) {
  constexpr std::size_t kStdoutBytes = 1000000;
  constexpr std::size_t kStderrBytes = 300000;
  std::ostringstream out;
  std::ostringstream err;
  auto child = helper_command()
                   .arg("--stdout-bytes")
                   .arg(std::to_string(kStdoutBytes))
                   .arg("--stderr-bytes")
                   .arg(std::to_string(kStderrBytes))
                   .stdout(Stdio::stream(out))
                   .stderr(Stdio::stream(err))
                   .spawn();
  ASSERT_TRUE(child.has_value()) << describe(child.error());

  WaitOptions options;
  options.timeout = std::chrono::seconds(5);
  auto status = child->wait(options);
  ASSERT_TRUE(status.has_value()) << describe(status.error());
  EXPECT_TRUE(status->success());
  EXPECT_EQ(out.str(), support::pattern(kStdoutBytes, 'a'));
  EXPECT_EQ(err.str(), support::pattern(kStderrBytes, 'A'));
}

TEST_P(LauncherIntegrationTest, TimedWaitWithStreamSinkStillStopsHungChild) {
  std::ostringstream out;
  auto child = helper_command()
                   .arg("--sleep-ms")
                   .arg("10000")
                   .stdout(Stdio::stream(out))
                   .spawn();
  ASSERT_TRUE(child.has_value()) << describe(child.error());

  WaitOptions options;
  options.timeout = std::chrono::milliseconds(200);
  auto status = child->wait(options);
  ASSERT_FALSE(status.has_value());
  EXPECT_EQ(status.error().code, make_error_code(errc::timeout));
  EXPECT_TRUE(child->reaped());
}

TEST_P(LauncherIntegrationTest, PipedOutputReadBeforeWait) {
  constexpr std::size_t kStdoutBytes = 1000000;
  auto child = helper_command()
                   .arg("--stdout-bytes")
                   .arg(std::to_string(kStdoutBytes))
                   .stdout(Stdio::piped())
                   .spawn();
  ASSERT_TRUE(child.has_value()) << describe(child.error());
  auto output = child->take_stdout();
  ASSERT_TRUE(output.has_value());
  auto data = output->read_all();
  ASSERT_TRUE(data.has_value()) << describe(data.error());
  auto status = child->wait();
  ASSERT_TRUE(status.has_value()) << describe(status.error());
  EXPECT_TRUE(status->success());
  EXPECT_EQ(data->size(), kStdoutBytes);
}

TEST_P(LauncherIntegrationTest, SwapsStdoutAndStderr) {
  fs::path out_path = unique_temp_path("parent_stdout");
  fs::path err_path = unique_temp_path("parent_stderr");
  std::optional<Result<LaunchResult>> result;
  {
    ScopedStandardRedirect redirect(out_path, err_path);
    ASSERT_TRUE(redirect.ok());
    result = helper_command()
                 .arg("--stdout-bytes")
                 .arg("3")
                 .arg("--stderr-bytes")
                 .arg("2")
                 .stdout(Stdio::fd(STDERR_FILENO))
                 .stderr(Stdio::fd(STDOUT_FILENO))
                 .launch();
  }
  ASSERT_TRUE(result.has_value());
  ASSERT_TRUE(result->has_value()) << describe(result->error());
  EXPECT_TRUE((*result)->status.success());
  EXPECT_EQ(read_file(out_path), "AB");
  EXPECT_EQ(read_file(err_path), "abc");

  std::error_code ec;
  fs::remove(out_path, ec);
  fs::remove(err_path, ec);
}

TEST_P(LauncherIntegrationTest, TimedWaitReturnsStatusOfQuickChild) {
  auto child = helper_command().arg("--exit-code").arg("5").spawn();
  ASSERT_TRUE(child.has_value()) << describe(child.error());
  WaitOptions options;
  options.timeout = std::chrono::seconds(10);
  auto status = child->wait(options);
  ASSERT_TRUE(status.has_value()) << describe(status.error());
  EXPECT_EQ(status->code(), 5);
}

TEST_P(LauncherIntegrationTest, SecondWaitReturnsCachedStatus) {
  auto child = helper_command().arg("--exit-code").arg("9").spawn();
  ASSERT_TRUE(child.has_value()) << describe(child.error());
  auto first = child->wait();
  ASSERT_TRUE(first.has_value()) << describe(first.error());
  auto second = child->wait();
  ASSERT_TRUE(second.has_value()) << describe(second.error());
  EXPECT_EQ(first->code(), 9);
  EXPECT_EQ(second->code(), 9);

  auto polled = child->try_wait();
  ASSERT_TRUE(polled.has_value());
  ASSERT_TRUE(polled->has_value());
  EXPECT_EQ((*polled)->code(), 9);

  auto signaled = child->terminate();
  ASSERT_FALSE(signaled.has_value());
  EXPECT_EQ(signaled.error().code, make_error_code(errc::signal_failed));
}

TEST_P(LauncherIntegrationTest, TryWaitIsEmptyWhileRunning) {
  auto child = helper_command().arg("--sleep-ms").arg("5000").spawn();
  ASSERT_TRUE(child.has_value()) << describe(child.error());
  auto polled = child->try_wait();
  ASSERT_TRUE(polled.has_value()) << describe(polled.error());
  EXPECT_FALSE(polled->has_value());

  ASSERT_TRUE(child->kill().has_value());
  auto status = child->wait();
  ASSERT_TRUE(status.has_value()) << describe(status.error());
  EXPECT_EQ(status->signal(), SIGKILL);
}

TEST_P(LauncherIntegrationTest, TerminatesProcessGroup) {
  LaunchOptions options;
  options.strategy = GetParam();
  options.new_process_group = true;
  auto child = Command(helper_).arg("--sleep-ms").arg("10000").options(options).spawn();
  ASSERT_TRUE(child.has_value()) << describe(child.error());
  EXPECT_EQ(::getpgid(child->id()), child->id());

  ASSERT_TRUE(child->terminate().has_value());
  auto status = child->wait();
  ASSERT_TRUE(status.has_value()) << describe(status.error());
  EXPECT_EQ(status->signal(), SIGTERM);
}

TEST_P(LauncherIntegrationTest, ConcurrentChildrenKeepTheirOwnStatus) {
  constexpr int kChildren = 6;
  std::vector<Child> children;
  for (int i = 0; i < kChildren; ++i) {
    auto child = helper_command()
                     .arg("--sleep-ms")
                     .arg(std::to_string((kChildren - i) * 30))
                     .arg("--exit-code")
                     .arg(std::to_string(i))
                     .spawn();
    ASSERT_TRUE(child.has_value()) << describe(child.error());
    children.push_back(std::move(child.value()));
  }
  for (int i = 0; i < kChildren; ++i) {
    auto status = children[i].wait();
    ASSERT_TRUE(status.has_value()) << describe(status.error());
    EXPECT_EQ(status->code(), i);
  }
}

TEST_P(LauncherIntegrationTest, ParallelLaunchesFromThreads) {
  constexpr int kThreads = 8;
  std::vector<std::thread> threads;
  std::vector<std::optional<LaunchResult>> results(kThreads);
  std::vector<std::optional<Error>> errors(kThreads);
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&, i] {
      auto result = helper_command()
                        .arg("--stdout-bytes")
                        .arg(std::to_string(1000 * (i + 1)))
                        .arg("--exit-code")
                        .arg(std::to_string(i))
                        .output();
      if (result) {
        results[i] = std::move(result.value());
      } else {
        errors[i] = result.error();
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  for (int i = 0; i < kThreads; ++i) {
    ASSERT_FALSE(errors[i].has_value()) << describe(*errors[i]);
    ASSERT_TRUE(results[i].has_value());
    EXPECT_EQ(results[i]->status.code(), i);
    EXPECT_EQ(results[i]->stdout_data, support::pattern(1000 * (i + 1), 'a'));
  }
}

TEST_P(LauncherIntegrationTest, FdCountStableAfterRepeatedLaunches) {
  std::size_t before = count_open_fds();
  for (int i = 0; i < 50; ++i) {
    auto result = helper_command().arg("--stdout-bytes").arg("4").arg("--stderr-bytes").arg("2").output();
    ASSERT_TRUE(result.has_value()) << describe(result.error());
  }
  for (int i = 0; i < 10; ++i) {
    auto result = Command("/nonexistent/launchpad/program").strategy(GetParam()).output();
    ASSERT_FALSE(result.has_value());
  }
  EXPECT_EQ(count_open_fds(), before);
}

TEST_P(LauncherIntegrationTest, LaunchOrThrowRaisesLaunchError) {
  LaunchRequest request = Command("/nonexistent/launchpad/program").strategy(GetParam()).request();
  try {
    (void)launch_or_throw(request);
    FAIL() << "expected LaunchError";
  } catch (const LaunchError& error) {
    EXPECT_EQ(error.error().code, make_error_code(errc::executable_not_found));
    EXPECT_EQ(error.code(), make_error_code(errc::executable_not_found));
  }
}

INSTANTIATE_TEST_SUITE_P(Strategies, LauncherIntegrationTest,
                         ::testing::Values(Strategy::fork_exec, Strategy::posix_spawn),
                         strategy_name);

TEST(LauncherAutomaticTest, AutomaticPrefersPosixSpawn) {
  std::string helper = support::helper_path();
  ASSERT_FALSE(helper.empty());
  ::unsetenv("LAUNCHPAD_STRATEGY");
  auto child = Command(helper).spawn();
  ASSERT_TRUE(child.has_value()) << describe(child.error());
  EXPECT_EQ(child->strategy(), Strategy::posix_spawn);
  ASSERT_TRUE(child->wait().has_value());
}

TEST(LauncherAutomaticTest, EnvironmentSelectsForkExec) {
  std::string helper = support::helper_path();
  ASSERT_FALSE(helper.empty());
  ASSERT_EQ(::setenv("LAUNCHPAD_STRATEGY", "fork_exec", 1), 0);
  auto child = Command(helper).spawn();
  ::unsetenv("LAUNCHPAD_STRATEGY");
  ASSERT_TRUE(child.has_value()) << describe(child.error());
  EXPECT_EQ(child->strategy(), Strategy::fork_exec);
  ASSERT_TRUE(child->wait().has_value());
}

TEST(LauncherAutomaticTest, EmptyProgramIsRejected) {
  LaunchRequest request;
  auto result = launch(request);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, make_error_code(errc::empty_program));
}

}  // namespace launchpad
