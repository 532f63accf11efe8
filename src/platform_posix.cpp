#include "platform.h"

#include "errors.h"

#include <fcntl.h>
#include <unistd.h>

#ifdef __APPLE__
#include <mach-o/dyld.h>
#endif

#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <unordered_map>
#include <vector>

namespace refpack::platform {

namespace {

constexpr std::chrono::milliseconds kLockPollInterval{ 20 };

}  // namespace

struct file_lock::impl {
  int fd;
  std::timed_mutex *path_mutex;  // owned by the s_lock_mutexes map

  // POSIX file locks are per-process, not per-thread: multiple threads in the same process
  // can bypass the file lock and acquire it simultaneously. To ensure thread-level mutual
  // exclusion for file locks within a process, we use an in-process mutex per path.
  static std::mutex s_lock_map_mutex;
  static std::unordered_map<std::string, std::unique_ptr<std::timed_mutex> >
      s_lock_mutexes;
};

std::mutex file_lock::impl::s_lock_map_mutex;
std::unordered_map<std::string, std::unique_ptr<std::timed_mutex> >
    file_lock::impl::s_lock_mutexes;

file_lock::~file_lock() {
  if (impl_) {
    ::close(impl_->fd);
    if (impl_->path_mutex) { impl_->path_mutex->unlock(); }
  }
}

file_lock::file_lock(file_lock &&) noexcept = default;

file_lock::operator bool() const { return impl_ != nullptr; }

file_lock::file_lock(std::filesystem::path const &path,
                     std::stop_token stop,
                     std::function<void()> const &on_contended) {
  throw_if_stopped(stop);

  bool notified{ false };
  auto const contended{ [&] {
    if (!notified && on_contended) { on_contended(); }
    notified = true;
  } };

  // One mutex per normalized path so spellings of the same file share it.
  std::string const canonical_key{
    std::filesystem::absolute(path).lexically_normal().string()
  };

  std::timed_mutex &path_mutex{ [&]() -> std::timed_mutex & {
    std::lock_guard<std::mutex> lock(impl::s_lock_map_mutex);
    auto &mutex_ptr{ impl::s_lock_mutexes[canonical_key] };
    if (!mutex_ptr) { mutex_ptr = std::make_unique<std::timed_mutex>(); }
    return *mutex_ptr;
  }() };

  std::unique_lock<std::timed_mutex> path_lock{ path_mutex, std::try_to_lock };
  if (!path_lock) {
    contended();
    if (stop.stop_possible()) {
      while (!path_lock.try_lock_for(kLockPollInterval)) { throw_if_stopped(stop); }
    } else {
      path_lock.lock();
    }
  }

  int const fd{ ::open(path.c_str(), O_CREAT | O_RDWR, 0666) };
  if (fd == -1) {
    throw std::system_error(errno,
                            std::system_category(),
                            "Failed to open lock file: " + path.string());
  }

  struct flock fl{};
  fl.l_type = F_WRLCK;
  fl.l_whence = SEEK_SET;
  fl.l_start = 0;
  fl.l_len = 0;

  auto const fail{ [&](int err) {
    ::close(fd);
    throw std::system_error(err,
                            std::system_category(),
                            "Failed to acquire exclusive lock: " + path.string());
  } };

  while (::fcntl(fd, F_SETLK, &fl) == -1) {
    int const err{ errno };
    if (err == EINTR) { continue; }
    if (err != EAGAIN && err != EACCES) { fail(err); }
    contended();

    if (!stop.stop_possible()) {
      if (::fcntl(fd, F_SETLKW, &fl) == -1) { fail(errno); }
      break;
    }
    if (stop.stop_requested()) {
      ::close(fd);
      throw cancelled_error{ "cancelled while waiting for lock: " + path.string() };
    }
    std::this_thread::sleep_for(kLockPollInterval);
  }

  impl_ = std::make_unique<impl>();
  impl_->fd = fd;
  impl_->path_mutex = path_lock.release();  // stays locked until destruction
}

void atomic_rename(std::filesystem::path const &from, std::filesystem::path const &to) {
  if (::rename(from.c_str(), to.c_str()) != 0) {
    throw std::system_error(errno,
                            std::system_category(),
                            "Failed to rename " + from.string() + " to " + to.string());
  }
}

std::filesystem::path get_default_packages_root() {
  if (char const *env_root{ std::getenv("REFPACK_PACKAGES_ROOT") }; env_root && *env_root) {
    return std::filesystem::path{ env_root };
  }
  return std::filesystem::temp_directory_path() / "test-packages";
}

std::optional<std::filesystem::path> get_default_global_packages_folder() {
  if (char const *env_root{ std::getenv("NUGET_PACKAGES") }; env_root && *env_root) {
    return std::filesystem::path{ env_root };
  }

  if (char const *home{ std::getenv("HOME") }) {
    return std::filesystem::path{ home } / ".nuget" / "packages";
  }

  return std::nullopt;
}

std::filesystem::path get_exe_path() {
#ifdef __APPLE__
  uint32_t size{ 0 };
  _NSGetExecutablePath(nullptr, &size);
  std::vector<char> buf(size);
  if (_NSGetExecutablePath(buf.data(), &size) != 0) {
    throw std::runtime_error("_NSGetExecutablePath failed");
  }
  return std::filesystem::canonical(buf.data());
#else
  std::vector<char> buf(4096);
  ssize_t const len{ ::readlink("/proc/self/exe", buf.data(), buf.size() - 1) };
  if (len == -1) {
    throw std::system_error(errno,
                            std::system_category(),
                            "readlink /proc/self/exe failed");
  }
  buf[static_cast<size_t>(len)] = '\0';
  return std::filesystem::path{ buf.data() };
#endif
}

}  // namespace refpack::platform
