#include "exec.h"

#include "errors.h"
#include "test_support.h"

#include "doctest.h"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <thread>
#include <tuple>
#include <utility>
#include <vector>

#include <sys/types.h>
#include <unistd.h>

namespace {

struct collected {
  std::vector<std::string> out;
  std::vector<std::string> err;
  std::vector<cmdex::exec_fault> out_faults;
  std::vector<cmdex::exec_fault> err_faults;
  std::vector<cmdex::exec_fault> process_faults;
};

collected drain(cmdex::async_execution &execution) {
  collected result;
  while (auto ev{ execution.next() }) {
    if (ev->is_line()) {
      (ev->is_stderr ? result.err : result.out).push_back(ev->line);
    } else if (ev->fault->kind == cmdex::fault_kind::process_wait) {
      result.process_faults.push_back(*ev->fault);
    } else {
      (ev->is_stderr ? result.err_faults : result.out_faults).push_back(*ev->fault);
    }
  }
  return result;
}

collected run_async(std::string const &command, std::vector<std::string> args = {}) {
  cmdex::executor const exec{ cmdex::shell_kind::bash };
  auto execution{ exec.async_execute(command, std::move(args)) };
  return drain(execution);
}

void check_clean_close(collected const &c) {
  REQUIRE(c.out_faults.size() == 1);
  REQUIRE(c.err_faults.size() == 1);
  CHECK(c.out_faults[0].end_of_stream());
  CHECK(c.err_faults[0].end_of_stream());
  CHECK(c.process_faults.empty());
}

// Waits until the shell itself has been reaped; its background jobs may live on.
bool wait_for_reap(pid_t pid) {
  auto const deadline{ std::chrono::steady_clock::now() + std::chrono::seconds{ 10 } };
  while (std::chrono::steady_clock::now() < deadline) {
    if (::kill(pid, 0) == -1 && errno == ESRCH) { return true; }
    std::this_thread::sleep_for(std::chrono::milliseconds{ 10 });
  }
  return false;
}

}  // namespace

TEST_CASE("async_execute delivers a single stdout line") {
  auto const c{ run_async("echo hello") };
  REQUIRE(c.out.size() == 1);
  CHECK(c.out[0] == "hello");
  CHECK(c.err.empty());
  check_clean_close(c);
}

TEST_CASE("async_execute tags lines by stream") {
  auto const c{ run_async("echo out; echo err 1>&2") };
  CHECK(c.out == std::vector<std::string>{ "out" });
  CHECK(c.err == std::vector<std::string>{ "err" });
  check_clean_close(c);
}

TEST_CASE("async_execute preserves per-stream order and counts") {
  auto const c{ run_async(
      "for i in $(seq 1 100); do echo out$i; echo err$i 1>&2; done; echo tail") };

  REQUIRE(c.out.size() == 101);
  REQUIRE(c.err.size() == 100);
  for (int i{ 0 }; i < 100; ++i) {
    CHECK(c.out[static_cast<size_t>(i)] == "out" + std::to_string(i + 1));
    CHECK(c.err[static_cast<size_t>(i)] == "err" + std::to_string(i + 1));
  }
  CHECK(c.out.back() == "tail");
  check_clean_close(c);
}

TEST_CASE("async_execute handles output larger than the channel and pipe buffers") {
  auto const c{ run_async("seq 1 20000") };
  REQUIRE(c.out.size() == 20000);
  CHECK(c.out.front() == "1");
  CHECK(c.out.back() == "20000");
  check_clean_close(c);
}

TEST_CASE("async_execute keeps empty lines") {
  auto const c{ run_async("printf 'a\\n\\nb\\n'") };
  CHECK(c.out == std::vector<std::string>{ "a", "", "b" });
  check_clean_close(c);
}

TEST_CASE("async_execute flushes a trailing unterminated line") {
  auto const c{ run_async("printf 'first\\nlast'") };
  CHECK(c.out == std::vector<std::string>{ "first", "last" });
  check_clean_close(c);
}

TEST_CASE("async_execute with no output yields only terminal faults") {
  auto const c{ run_async("true") };
  CHECK(c.out.empty());
  CHECK(c.err.empty());
  check_clean_close(c);
}

TEST_CASE("async_execute passes extra args as positional parameters") {
  auto const c{ run_async("echo \"$0\"; echo \"$1\"", { "alpha beta", "gamma" }) };
  CHECK(c.out == std::vector<std::string>{ "alpha beta", "gamma" });
  check_clean_close(c);
}

TEST_CASE("async_execute reports a failing exit once") {
  auto const c{ run_async("echo partial; exit 7") };
  CHECK(c.out == std::vector<std::string>{ "partial" });
  REQUIRE(c.process_faults.size() == 1);

  auto const &fault{ c.process_faults[0] };
  CHECK(fault.kind == cmdex::fault_kind::process_wait);
  CHECK_FALSE(fault.end_of_stream());
  REQUIRE(fault.status.has_value());
  CHECK(fault.status->exit_code == 7);
  CHECK(c.out_faults.size() == 1);
  CHECK(c.err_faults.size() == 1);

  CHECK_THROWS_AS(fault.raise(false), cmdex::process_wait_error);
}

TEST_CASE("async_execute end-of-stream fault raises stream_read_error") {
  auto const c{ run_async("true") };
  REQUIRE(c.err_faults.size() == 1);
  try {
    c.err_faults[0].raise(true);
    FAIL("expected stream_read_error");
  } catch (cmdex::stream_read_error const &ex) { CHECK(ex.is_stderr()); }
}

TEST_CASE("async_execute throws launch_error for a missing shell") {
  cmdex::executor const exec{ cmdex::shell_binding{ .executable = "/nonexistent/shell",
                                                    .inline_flag = "-c" } };
  CHECK_THROWS_AS(exec.async_execute("echo hi"), cmdex::launch_error);
}

TEST_CASE("async_execute honors the working directory") {
  auto const dir{ std::filesystem::canonical(std::filesystem::temp_directory_path()) };
  cmdex::executor exec{ cmdex::shell_kind::bash };
  exec.set_working_directory(dir);
  CHECK(exec.working_directory() == dir);

  auto execution{ exec.async_execute("pwd -P") };
  auto const c{ drain(execution) };
  CHECK(c.out == std::vector<std::string>{ dir.string() });
}

TEST_CASE("async_execution supports range-for") {
  cmdex::executor const exec{ cmdex::shell_kind::bash };
  auto execution{ exec.async_execute("echo one; echo two") };

  std::vector<std::string> lines;
  int faults{ 0 };
  for (auto const &ev : execution) {
    if (ev.is_line()) {
      lines.push_back(ev.line);
    } else {
      ++faults;
    }
  }

  CHECK(lines == std::vector<std::string>{ "one", "two" });
  CHECK(faults == 2);
  CHECK(execution.finished());
  CHECK_FALSE(execution.next().has_value());
}

TEST_CASE("async_execution cancel stops a long-running command") {
  cmdex::executor const exec{ cmdex::shell_kind::bash };
  auto execution{ exec.async_execute("echo started; sleep 30") };

  auto const first{ execution.next() };
  REQUIRE(first.has_value());
  CHECK(first->line == "started");

  auto const begin{ std::chrono::steady_clock::now() };
  execution.cancel();
  auto const c{ drain(execution) };
  CHECK(std::chrono::steady_clock::now() - begin < std::chrono::seconds{ 10 });

  REQUIRE(c.process_faults.size() == 1);
  REQUIRE(c.process_faults[0].status.has_value());
  CHECK(c.process_faults[0].status->signal == std::optional<int>{ SIGKILL });
  CHECK(execution.finished());
}

TEST_CASE("async_execution destroyed mid-stream does not hang") {
  cmdex::executor const exec{ cmdex::shell_kind::bash };
  auto const begin{ std::chrono::steady_clock::now() };
  pid_t pid{ -1 };
  {
    auto execution{ exec.async_execute("yes") };
    pid = execution.pid();
    auto const first{ execution.next() };
    REQUIRE(first.has_value());
    CHECK(first->line == "y");
  }
  CHECK(std::chrono::steady_clock::now() - begin < std::chrono::seconds{ 10 });
  CHECK(::kill(pid, 0) == -1);
}

TEST_CASE("async_execution cancel unblocks readers held by a background job") {
  cmdex::executor const exec{ cmdex::shell_kind::bash };
  auto execution{ exec.async_execute("echo started; sleep 30 &") };
  pid_t const pid{ execution.pid() };

  auto const first{ execution.next() };
  REQUIRE(first.has_value());
  CHECK(first->line == "started");
  REQUIRE(wait_for_reap(pid));

  auto const begin{ std::chrono::steady_clock::now() };
  execution.cancel();
  auto const c{ drain(execution) };
  CHECK(std::chrono::steady_clock::now() - begin < std::chrono::seconds{ 5 });

  REQUIRE(c.out_faults.size() == 1);
  REQUIRE(c.err_faults.size() == 1);
  CHECK(c.out_faults[0].code == std::make_error_code(std::errc::operation_canceled));
  CHECK(c.err_faults[0].code == std::make_error_code(std::errc::operation_canceled));
  CHECK(c.process_faults.empty());
  CHECK(execution.finished());

  std::ignore = ::kill(-pid, SIGKILL);
}

TEST_CASE("async_execution destroyed after the shell exits does not wait for background jobs") {
  cmdex::executor const exec{ cmdex::shell_kind::bash };
  pid_t pid{ -1 };
  std::chrono::steady_clock::time_point begin;
  {
    auto execution{ exec.async_execute("echo started; sleep 30 &") };
    pid = execution.pid();
    auto const first{ execution.next() };
    REQUIRE(first.has_value());
    REQUIRE(wait_for_reap(pid));
    begin = std::chrono::steady_clock::now();
  }
  CHECK(std::chrono::steady_clock::now() - begin < std::chrono::seconds{ 5 });

  std::ignore = ::kill(-pid, SIGKILL);
}

TEST_CASE("async_execution survives a move") {
  cmdex::executor const exec{ cmdex::shell_kind::bash };
  auto original{ exec.async_execute("echo moved") };
  cmdex::async_execution moved{ std::move(original) };
  auto const c{ drain(moved) };
  CHECK(c.out == std::vector<std::string>{ "moved" });

  CHECK_FALSE(original.next().has_value());
  CHECK(original.finished());
  CHECK(original.pid() == -1);
  CHECK_NOTHROW(original.cancel());
}

TEST_CASE("async_execute in debug mode mirrors stderr and still emits lines") {
  cmdex::executor exec{ cmdex::shell_kind::bash };
  exec.set_debug(true);

  collected c;
  std::string mirrored;
  {
    cmdex::test::fd_capture capture{ STDERR_FILENO };
    auto execution{ exec.async_execute("echo out; echo err 1>&2") };
    c = drain(execution);
    mirrored = capture.finish();
  }

  CHECK(mirrored == "err\n");
  CHECK(c.out == std::vector<std::string>{ "out" });
  CHECK(c.err == std::vector<std::string>{ "err" });
  check_clean_close(c);
}

TEST_CASE("execute in debug mode hands stderr to the caller") {
  cmdex::executor exec{ cmdex::shell_kind::bash };
  exec.set_debug(true);

  std::string output;
  std::string passed_through;
  {
    cmdex::test::fd_capture capture{ STDERR_FILENO };
    output = exec.execute("echo out; echo err 1>&2");
    passed_through = capture.finish();
  }

  CHECK(output == "out\n");
  CHECK(passed_through == "err\n");
}

TEST_CASE("execute returns stdout verbatim") {
  cmdex::executor const exec{ cmdex::shell_kind::bash };
  CHECK(exec.execute("echo hello") == "hello\n");
  CHECK(exec.execute("printf 'no newline'") == "no newline");
  CHECK(exec.execute("echo out; echo err 1>&2") == "out\n");
  CHECK(exec.execute("echo \"$0-$1\"", { "a", "b" }) == "a-b\n");
}

TEST_CASE("execute and async_execute agree on stdout") {
  std::string const command{ "printf 'x\\n\\ny\\nz\\n'; echo noise 1>&2" };
  cmdex::executor const exec{ cmdex::shell_kind::bash };

  std::string const sync_output{ exec.execute(command) };

  auto const c{ run_async(command) };
  std::string joined;
  for (auto const &line : c.out) {
    joined += line;
    joined += '\n';
  }
  CHECK(joined == sync_output);
}

TEST_CASE("execute throws process_wait_error carrying the output") {
  cmdex::executor const exec{ cmdex::shell_kind::bash };
  try {
    std::ignore = exec.execute("echo got; echo bad 1>&2; exit 4");
    FAIL("expected process_wait_error");
  } catch (cmdex::process_wait_error const &ex) {
    REQUIRE(ex.status().has_value());
    CHECK(ex.status()->exit_code == 4);
    CHECK(ex.output() == "got\n");
    CHECK(ex.error_output() == "bad\n");
  }
}

TEST_CASE("execute throws launch_error for a missing shell") {
  cmdex::executor const exec{ cmdex::shell_binding{ .executable = "/nonexistent/shell",
                                                    .inline_flag = "-c" } };
  CHECK_THROWS_AS(exec.execute("echo hi"), cmdex::launch_error);
}

TEST_CASE("executor defaults") {
  cmdex::executor exec;
  CHECK(exec.binding() == cmdex::shell_resolve(cmdex::shell_kind::auto_detect));
  CHECK_FALSE(exec.debug());
  CHECK_FALSE(exec.working_directory().has_value());

  exec.set_debug(true);
  CHECK(exec.debug());
}
