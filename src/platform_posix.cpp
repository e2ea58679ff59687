#include "platform.h"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <wordexp.h>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <mutex>
#include <stdexcept>
#include <string>
#include <system_error>
#include <unordered_map>

namespace skillet::platform {

struct file_lock::impl {
  int fd;
  std::mutex *path_mutex;  // owned by the s_lock_mutexes map
  std::filesystem::path lock_path;

  // POSIX file locks are per-process, not per-thread: multiple threads in the same process
  // can bypass the file lock and acquire it simultaneously. To ensure thread-level mutual
  // exclusion for file locks within a process, we use an in-process mutex per path.
  static std::mutex s_lock_map_mutex;
  static std::unordered_map<std::string, std::unique_ptr<std::mutex> > s_lock_mutexes;
};

std::mutex file_lock::impl::s_lock_map_mutex;
std::unordered_map<std::string, std::unique_ptr<std::mutex> >
    file_lock::impl::s_lock_mutexes;

file_lock::file_lock(std::filesystem::path const &path) {
  // Canonicalize path to ensure different representations of same path use same mutex
  std::string const canonical_key{
    std::filesystem::absolute(path).lexically_normal().string()
  };

  std::unique_lock<std::mutex> path_lock{ [&]() {
    std::lock_guard<std::mutex> lock(impl::s_lock_map_mutex);
    auto &mutex_ptr{ impl::s_lock_mutexes[canonical_key] };
    if (!mutex_ptr) { mutex_ptr = std::make_unique<std::mutex>(); }
    return std::unique_lock<std::mutex>{ *mutex_ptr };
  }() };

  int const fd{ ::open(path.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0600) };
  if (fd == -1) {
    throw std::system_error(errno,
                            std::system_category(),
                            "Failed to open lock file: " + path.string());
  }

  struct flock fl{ .l_type = F_WRLCK,
                   .l_whence = SEEK_SET,
                   .l_start = 0,
                   .l_len = 0,
                   .l_pid = 0 };

  while (::fcntl(fd, F_SETLKW, &fl) == -1) {
    if (errno == EINTR) { continue; }
    int const err{ errno };
    ::close(fd);
    throw std::system_error(err,
                            std::system_category(),
                            "Failed to acquire exclusive lock: " + path.string());
  }

  impl_ = std::make_unique<impl>();
  impl_->fd = fd;
  impl_->path_mutex = path_lock.release();  // Transfer ownership, mutex stays locked
  impl_->lock_path = path;
}

file_lock::~file_lock() {
  if (impl_) {
    ::close(impl_->fd);
    if (impl_->path_mutex) { impl_->path_mutex->unlock(); }
  }
}

file_lock::file_lock(file_lock &&) noexcept = default;
file_lock &file_lock::operator=(file_lock &&) noexcept = default;

file_lock::operator bool() const { return impl_ != nullptr; }

void atomic_rename(std::filesystem::path const &from, std::filesystem::path const &to) {
  if (::rename(from.c_str(), to.c_str()) != 0) {
    throw std::system_error(errno,
                            std::system_category(),
                            "Failed to rename " + from.string() + " to " + to.string());
  }
}

void ensure_private_directory(std::filesystem::path const &dir) {
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    throw std::system_error(ec, "Failed to create directory: " + dir.string());
  }

  if (::chmod(dir.c_str(), S_IRWXU) != 0) {
    throw std::system_error(errno,
                            std::system_category(),
                            "Failed to restrict directory: " + dir.string());
  }
}

void write_private_file(std::filesystem::path const &target, std::string_view content) {
  std::string tmpl{ target.string() + ".XXXXXX" };
  int const fd{ ::mkstemp(tmpl.data()) };
  if (fd == -1) {
    throw std::system_error(errno,
                            std::system_category(),
                            "Failed to create temp file for " + target.string());
  }

  std::filesystem::path const tmp_path{ tmpl };
  auto const fail{ [&](char const *what) {
    int const err{ errno };
    ::close(fd);
    ::unlink(tmp_path.c_str());
    throw std::system_error(err, std::system_category(), what + tmp_path.string());
  } };

  if (::fchmod(fd, S_IRUSR | S_IWUSR) != 0) { fail("Failed to chmod "); }

  std::size_t written{ 0 };
  while (written < content.size()) {
    ssize_t const n{ ::write(fd, content.data() + written, content.size() - written) };
    if (n < 0) {
      if (errno == EINTR) { continue; }
      fail("Failed to write ");
    }
    written += static_cast<std::size_t>(n);
  }

  if (::fsync(fd) != 0) { fail("Failed to fsync "); }
  if (::close(fd) != 0) {
    int const err{ errno };
    ::unlink(tmp_path.c_str());
    throw std::system_error(err, std::system_category(), "Failed to close " + tmpl);
  }

  try {
    atomic_rename(tmp_path, target);
  } catch (std::system_error const &) {
    ::unlink(tmp_path.c_str());
    throw;
  }
}

bool is_owner_only(std::filesystem::path const &path) {
  struct stat st{};
  if (::stat(path.c_str(), &st) != 0) {
    throw std::system_error(errno, std::system_category(), "Failed to stat " + path.string());
  }
  return (st.st_mode & (S_IRWXG | S_IRWXO)) == 0;
}

std::optional<std::filesystem::path> get_default_data_root() {
  if (char const *xdg_data{ std::getenv("XDG_DATA_HOME") }; xdg_data && *xdg_data) {
    return std::filesystem::path{ xdg_data } / "skillet";
  }

  if (char const *home{ std::getenv("HOME") }; home && *home) {
    return std::filesystem::path{ home } / ".local" / "share" / "skillet";
  }

  return std::nullopt;
}

std::optional<std::filesystem::path> get_default_config_path() {
  if (char const *explicit_cfg{ std::getenv("SKILLET_CONFIG") };
      explicit_cfg && *explicit_cfg) {
    return std::filesystem::path{ explicit_cfg };
  }

  if (char const *xdg_cfg{ std::getenv("XDG_CONFIG_HOME") }; xdg_cfg && *xdg_cfg) {
    return std::filesystem::path{ xdg_cfg } / "skillet" / "config.lua";
  }

  if (char const *home{ std::getenv("HOME") }; home && *home) {
    return std::filesystem::path{ home } / ".config" / "skillet" / "config.lua";
  }

  return std::nullopt;
}

std::filesystem::path expand_path(std::string_view p) {
  if (p.empty()) { return {}; }

  wordexp_t we{};
  std::string const path_str{ p };
  int const flags{ WRDE_NOCMD | WRDE_UNDEF };  // no $(cmd), fail on undefined $VAR

  int const rc{ wordexp(path_str.c_str(), &we, flags) };

  if (rc == 0) {
    if (we.we_wordc == 0) {
      wordfree(&we);
      throw std::runtime_error("path expansion produced no results: " + path_str);
    }
    std::filesystem::path result{ we.we_wordv[0] };
    wordfree(&we);
    return result;
  }

  // POSIX: wordfree() must only be called after successful wordexp()
  if (rc == WRDE_BADVAL) {
    throw std::runtime_error("undefined variable in path: " + path_str);
  }
  throw std::runtime_error("path expansion failed: " + path_str);
}

std::optional<std::string> get_env_var(char const *name) {
  if (char const *value{ std::getenv(name) }) { return std::string{ value }; }
  return std::nullopt;
}

bool is_tty() { return ::isatty(::fileno(stderr)) != 0; }

}  // namespace skillet::platform
