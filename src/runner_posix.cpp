#if defined(_WIN32)
#error "runner_posix.cpp should not be compiled on Windows builds"
#else

#include "runner.h"

#include "errors.h"
#include "platform.h"
#include "trace.h"
#include "tui.h"

#include <algorithm>
#include <array>
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <utility>

#include <fcntl.h>
#include <poll.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace skillet {
namespace {

constexpr int kChildErrorExit{ 127 };
constexpr int kSignalExitBase{ 128 };
constexpr std::chrono::milliseconds kDrainGrace{ 2000 };
constexpr std::chrono::milliseconds kReapPollInterval{ 10 };

class fd_cleanup {
 public:
  explicit fd_cleanup(int fd) : fd_{ fd } {}
  ~fd_cleanup() {
    if (fd_ == -1) { return; }
    close_with_retry();
  }

  fd_cleanup(fd_cleanup const &) = delete;
  fd_cleanup &operator=(fd_cleanup const &) = delete;
  fd_cleanup(fd_cleanup &&other) noexcept : fd_{ other.fd_ } { other.fd_ = -1; }

  int get() const { return fd_; }

  void release() {
    if (fd_ == -1) { return; }
    close_with_retry();
    fd_ = -1;
  }

 private:
  void close_with_retry() {
    for (int attempts{ 0 }; attempts < 3 && ::close(fd_) == -1; ++attempts) {
      if (errno != EINTR) { break; }
    }
  }

  int fd_{ -1 };
};

struct pipe_state {
  fd_cleanup read_fd;
  captured_stream *sink;
  bool closed;
};

void append_bounded(captured_stream &sink, char const *data, std::size_t size, std::size_t limit) {
  std::size_t const room{ sink.text.size() < limit ? limit - sink.text.size() : 0 };
  std::size_t const kept{ std::min(room, size) };
  sink.text.append(data, kept);
  sink.dropped += size - kept;
}

std::int64_t ms_until(std::chrono::steady_clock::time_point deadline) {
  auto const left{ std::chrono::duration_cast<std::chrono::milliseconds>(
      deadline - std::chrono::steady_clock::now()) };
  return std::max<std::int64_t>(0, left.count());
}

// Read both pipes until EOF or `deadline`. Returns false when the deadline passed first.
bool drain_pipes(std::array<pipe_state, 2> &pipes,
                 std::size_t limit,
                 std::chrono::steady_clock::time_point deadline) {
  std::array<pollfd, 2> poll_fds{};
  std::array<char, 4096> chunk{};

  for (;;) {
    std::size_t open_count{ 0 };
    for (std::size_t i{ 0 }; i < pipes.size(); ++i) {
      poll_fds[i].fd = pipes[i].closed ? -1 : pipes[i].read_fd.get();
      poll_fds[i].events = pipes[i].closed ? 0 : POLLIN;
      poll_fds[i].revents = 0;
      if (!pipes[i].closed) { ++open_count; }
    }
    if (open_count == 0) { return true; }

    auto const wait_ms{ ms_until(deadline) };
    if (wait_ms == 0) { return false; }

    int const poll_result{ ::poll(poll_fds.data(),
                                  poll_fds.size(),
                                  static_cast<int>(std::min<std::int64_t>(wait_ms, 1000))) };
    if (poll_result == -1) {
      if (errno == EINTR) { continue; }
      throw std::system_error(errno, std::generic_category(), "poll failed");
    }

    for (std::size_t i{ 0 }; i < pipes.size(); ++i) {
      if (pipes[i].closed || poll_fds[i].revents == 0) { continue; }
      if (poll_fds[i].revents & POLLNVAL) {
        throw std::runtime_error("poll failed on child pipe");
      }

      ssize_t const read_bytes{ ::read(pipes[i].read_fd.get(), chunk.data(), chunk.size()) };
      if (read_bytes == -1) {
        if (errno == EINTR) { continue; }
        throw std::system_error(errno, std::generic_category(), "read failed");
      }

      if (read_bytes == 0) {
        pipes[i].closed = true;
        pipes[i].read_fd.release();
        continue;
      }

      append_bounded(*pipes[i].sink, chunk.data(), static_cast<std::size_t>(read_bytes), limit);
    }
  }
}

int decode_wait_status(int status) {
  if (WIFEXITED(status)) { return WEXITSTATUS(status); }
  if (WIFSIGNALED(status)) { return kSignalExitBase + WTERMSIG(status); }
  return status;
}

int wait_for_child(pid_t child) {
  int status{ 0 };
  while (true) {
    pid_t const result = ::waitpid(child, &status, 0);
    if (result == -1 && errno == EINTR) { continue; }
    if (result == -1) {
      throw std::system_error(errno, std::generic_category(), "waitpid failed");
    }
    break;
  }
  return decode_wait_status(status);
}

// Reap the child unless `deadline` passes first. Pipes may hit EOF long before exit.
std::optional<int> wait_for_child_until(pid_t child,
                                        std::chrono::steady_clock::time_point deadline) {
  while (true) {
    int status{ 0 };
    pid_t const result = ::waitpid(child, &status, WNOHANG);
    if (result == -1 && errno == EINTR) { continue; }
    if (result == -1) {
      throw std::system_error(errno, std::generic_category(), "waitpid failed");
    }
    if (result == child) { return decode_wait_status(status); }

    auto const wait_ms{ ms_until(deadline) };
    if (wait_ms == 0) { return std::nullopt; }
    std::this_thread::sleep_for(
        std::min(kReapPollInterval, std::chrono::milliseconds{ wait_ms }));
  }
}

void kill_group(pid_t pgid) {
  if (::killpg(pgid, SIGKILL) == -1 && errno != ESRCH && errno != EPERM) {
    tui::warn("killpg(%d) failed: %s", static_cast<int>(pgid), std::strerror(errno));
  }
}

std::string resolve_program(std::string const &name, process_env_t const &env) {
  if (name.find('/') != std::string::npos) { return name; }

  std::string path_var;
  if (auto const it{ env.find("PATH") }; it != env.end()) {
    path_var = it->second;
  } else if (auto host{ platform::get_env_var("PATH") }) {
    path_var = std::move(*host);
  }

  std::size_t pos{ 0 };
  while (pos <= path_var.size()) {
    auto const colon{ path_var.find(':', pos) };
    std::string dir{ path_var.substr(pos, colon == std::string::npos ? colon : colon - pos) };
    if (dir.empty()) { dir = "."; }

    auto const candidate{ (std::filesystem::path{ dir } / name).string() };
    if (::access(candidate.c_str(), X_OK) == 0) { return candidate; }

    if (colon == std::string::npos) { break; }
    pos = colon + 1;
  }
  return name;
}

void set_limit(int resource, rlim_t value) {
  struct rlimit const lim{ .rlim_cur = value, .rlim_max = value };
  if (::setrlimit(resource, &lim) == -1) {
    std::perror("setrlimit");
    _exit(kChildErrorExit);
  }
}

// Only async-signal-safe calls: the parent may be multi-threaded.
[[noreturn]] void exec_child_process(int stdout_write,
                                     int stderr_write,
                                     char const *cwd,
                                     char *const *argv,
                                     char *const *envp,
                                     process_spec const &spec) {
  ::setpgid(0, 0);

  set_limit(RLIMIT_CORE, 0);
  if (spec.memory_limit_mb) {
    set_limit(RLIMIT_AS, static_cast<rlim_t>(*spec.memory_limit_mb) * 1024 * 1024);
  }
  if (spec.cpu_limit_s) { set_limit(RLIMIT_CPU, static_cast<rlim_t>(*spec.cpu_limit_s)); }

  int const null_fd{ ::open("/dev/null", O_RDONLY) };
  if (null_fd == -1) {
    std::perror("open /dev/null");
    _exit(kChildErrorExit);
  }

  std::array<std::pair<int, int>, 3> const fd_mappings{
    std::pair{ null_fd, STDIN_FILENO },
    std::pair{ stdout_write, STDOUT_FILENO },
    std::pair{ stderr_write, STDERR_FILENO },
  };

  for (auto const &[src, dst] : fd_mappings) {
    if (::dup2(src, dst) == -1) {
      std::perror("dup2");
      _exit(kChildErrorExit);
    }
  }
  if (null_fd != STDIN_FILENO) { ::close(null_fd); }

  if (::chdir(cwd) == -1) {
    std::perror("chdir");
    _exit(kChildErrorExit);
  }

  ::execve(argv[0], argv, envp);
  std::perror("execve");
  _exit(kChildErrorExit);
}

std::string replace_all(std::string text, std::string_view from, std::string_view to) {
  std::size_t pos{ 0 };
  while ((pos = text.find(from, pos)) != std::string::npos) {
    text.replace(pos, from.size(), to);
    pos += to.size();
  }
  return text;
}

}  // namespace

std::string_view run_status_name(run_status status) {
  switch (status) {
    case run_status::pending: return "pending";
    case run_status::running: return "running";
    case run_status::succeeded: return "succeeded";
    case run_status::failed: return "failed";
    case run_status::timed_out: return "timed_out";
  }
  return "unknown";
}

process_result run_process(process_spec const &spec, std::string_view phase) {
  if (spec.argv.empty()) { throw std::invalid_argument("run_process: argv must be non-empty"); }

  std::string const program{ resolve_program(spec.argv[0], spec.env) };
  std::string const cwd{ spec.cwd.string() };

  std::vector<std::string> argv_strings{ spec.argv };
  argv_strings[0] = program;
  std::vector<char *> argv;
  argv.reserve(argv_strings.size() + 1);
  for (auto &arg : argv_strings) { argv.push_back(arg.data()); }
  argv.push_back(nullptr);

  std::vector<std::string> env_strings;
  std::vector<char *> envp;
  env_strings.reserve(spec.env.size());
  envp.reserve(spec.env.size() + 1);
  for (auto const &[key, value] : spec.env) { env_strings.push_back(key + "=" + value); }
  for (auto &entry : env_strings) { envp.push_back(entry.data()); }
  envp.push_back(nullptr);

  int stdout_pipefd[2];
  if (::pipe2(stdout_pipefd, O_CLOEXEC) == -1) {
    throw std::system_error(errno, std::generic_category(), "pipe failed");
  }
  fd_cleanup stdout_read_end{ stdout_pipefd[0] };
  fd_cleanup stdout_write_end{ stdout_pipefd[1] };

  int stderr_pipefd[2];
  if (::pipe2(stderr_pipefd, O_CLOEXEC) == -1) {
    throw std::system_error(errno, std::generic_category(), "pipe failed");
  }
  fd_cleanup stderr_read_end{ stderr_pipefd[0] };
  fd_cleanup stderr_write_end{ stderr_pipefd[1] };

  auto const start{ std::chrono::steady_clock::now() };
  pid_t const child{ ::fork() };
  if (child == -1) { throw std::system_error(errno, std::generic_category(), "fork failed"); }

  if (child == 0) {  // child process exits in exec_child_process
    exec_child_process(stdout_write_end.get(),
                       stderr_write_end.get(),
                       cwd.c_str(),
                       argv.data(),
                       envp.data(),
                       spec);
  }

  ::setpgid(child, child);  // also done by the child; whichever runs first wins

  stdout_write_end.release();  // Parent: close write ends and capture output
  stderr_write_end.release();

  tui::debug("[%.*s] spawned pid %d: %s",
             static_cast<int>(phase.size()),
             phase.data(),
             static_cast<int>(child),
             program.c_str());
  SKILLET_TRACE_PHASE_SPAWNED(std::string{ phase }, program, child);

  process_result result{ .timed_out = false,
                         .exit_code = std::nullopt,
                         .out = {},
                         .err = {},
                         .duration_ms = 0 };
  try {
    std::array<pipe_state, 2> pipes{
      pipe_state{ std::move(stdout_read_end), &result.out, false },
      pipe_state{ std::move(stderr_read_end), &result.err, false },
    };

    if (!drain_pipes(pipes, spec.output_limit, start + spec.timeout)) {
      result.timed_out = true;
      kill_group(child);
      drain_pipes(pipes, spec.output_limit, std::chrono::steady_clock::now() + kDrainGrace);
    }

    std::optional<int> code;
    if (!result.timed_out) { code = wait_for_child_until(child, start + spec.timeout); }
    if (!code) {
      if (!result.timed_out) {
        result.timed_out = true;  // output closed but the child kept running
        kill_group(child);
      }
      code = wait_for_child(child);
    }
    kill_group(child);  // stragglers left in the group
    if (!result.timed_out) { result.exit_code = code; }
  } catch (...) {
    kill_group(child);
    wait_for_child(child);
    throw;
  }

  result.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                           std::chrono::steady_clock::now() - start)
                           .count();

  if (result.timed_out) {
    tui::debug("[%.*s] timed out after %lld ms",
               static_cast<int>(phase.size()),
               phase.data(),
               static_cast<long long>(spec.timeout.count()));
    SKILLET_TRACE_PHASE_TIMED_OUT(std::string{ phase }, spec.timeout.count() / 1000);
  } else {
    tui::debug("[%.*s] exited %d in %lld ms",
               static_cast<int>(phase.size()),
               phase.data(),
               *result.exit_code,
               static_cast<long long>(result.duration_ms));
    SKILLET_TRACE_PHASE_EXITED(std::string{ phase }, *result.exit_code, result.duration_ms);
  }

  return result;
}

std::vector<std::string> runner_expand_template(std::vector<std::string> const &tmpl,
                                                std::map<std::string, std::string> const &vars,
                                                std::vector<std::string> const &packages) {
  std::vector<std::string> argv;
  for (auto const &arg : tmpl) {
    if (arg == "{packages}") {
      argv.insert(argv.end(), packages.begin(), packages.end());
      continue;
    }

    std::string expanded{ arg };
    for (auto const &[key, value] : vars) {
      expanded = replace_all(std::move(expanded), "{" + key + "}", value);
    }
    argv.push_back(std::move(expanded));
  }
  return argv;
}

sandbox_run::sandbox_run(execution_cfg const &cfg) : cfg_{ cfg } {}

void sandbox_run::transition(run_status next) {
  bool const legal{ (status_ == run_status::pending && next == run_status::running) ||
                    (status_ == run_status::running &&
                     (next == run_status::succeeded || next == run_status::failed ||
                      next == run_status::timed_out)) };
  if (!legal) {
    throw std::logic_error("sandbox_run: illegal transition " +
                           std::string{ run_status_name(status_) } + " -> " +
                           std::string{ run_status_name(next) });
  }
  status_ = next;
}

run_outcome sandbox_run::execute(run_request const &request) {
  transition(run_status::running);
  auto const start{ std::chrono::steady_clock::now() };

  try {
    platform::ensure_private_directory(cfg_.work_root);

    std::string scratch_template{ (cfg_.work_root / "run-XXXXXX").string() };
    if (!::mkdtemp(scratch_template.data())) {
      throw std::system_error(errno,
                              std::generic_category(),
                              "Failed to create scratch directory in " +
                                  cfg_.work_root.string());
    }
    std::filesystem::path const scratch{ scratch_template };
    scoped_path_cleanup const scratch_cleanup{ scratch };

    auto const script{ scratch / "artifact.py" };
    platform::write_private_file(script, request.artifact);

    std::map<std::string, std::string> const vars{
      { "python", request.python },
      { "venv", (scratch / "venv").string() },
      { "script", script.string() },
      { "scratch", scratch.string() },
    };

    process_env_t install_env{ request.env };
    install_env["UV_CACHE_DIR"] =
        (cfg_.package_cache ? *cfg_.package_cache : scratch / "cache").string();

    auto const install_deadline{ start + std::chrono::seconds{ cfg_.install_timeout } };
    auto const run_install_phase{ [&](char const *phase, std::vector<std::string> const &tmpl) {
      auto const remaining{ std::chrono::milliseconds{ ms_until(install_deadline) } };
      auto const r{ run_process(
          process_spec{ .argv = runner_expand_template(tmpl, vars, request.packages),
                        .env = install_env,
                        .cwd = scratch,
                        .timeout = remaining,
                        .output_limit = cfg_.output_limit,
                        .memory_limit_mb = cfg_.memory_limit_mb,
                        .cpu_limit_s = std::nullopt },
          phase) };

      if (r.timed_out || *r.exit_code != 0) {
        transition(run_status::failed);
        std::string const what{
          r.timed_out ? std::string{ "Dependency " } + phase + " timed out after " +
                            std::to_string(cfg_.install_timeout) + "s"
                      : std::string{ "Dependency " } + phase + " failed with exit code " +
                            std::to_string(*r.exit_code)
        };
        throw dependency_install_error{ what, r.out.text, r.err.text };
      }
    } };

    if (!cfg_.provision.empty()) { run_install_phase("provision", cfg_.provision); }
    if (!cfg_.install.empty() && !request.packages.empty()) {
      run_install_phase("install", cfg_.install);
    }

    auto r{ run_process(
        process_spec{ .argv = runner_expand_template(cfg_.interpreter, vars, request.packages),
                      .env = request.env,
                      .cwd = scratch,
                      .timeout = request.timeout,
                      .output_limit = cfg_.output_limit,
                      .memory_limit_mb = cfg_.memory_limit_mb,
                      .cpu_limit_s = cfg_.cpu_limit_s },
        "interpreter") };

    if (r.timed_out) {
      transition(run_status::timed_out);
    } else {
      transition(*r.exit_code == 0 ? run_status::succeeded : run_status::failed);
    }

    return run_outcome{ .status = status_,
                        .exit_code = r.exit_code,
                        .out = std::move(r.out),
                        .err = std::move(r.err),
                        .duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                                           std::chrono::steady_clock::now() - start)
                                           .count() };
  } catch (...) {
    if (status_ == run_status::running) { status_ = run_status::failed; }
    throw;
  }
}

}  // namespace skillet

#endif  // POSIX implementation
