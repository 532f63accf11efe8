#include "termination.h"

#include "tui.h"

#include <pthread.h>
#include <unistd.h>

#include <csignal>
#include <stdexcept>
#include <string>
#include <tuple>
#include <utility>

namespace refpack {
namespace {

// SIGUSR2 only wakes the watcher on shutdown.
sigset_t watched_signals() {
  sigset_t set;
  sigemptyset(&set);
  sigaddset(&set, SIGINT);
  sigaddset(&set, SIGTERM);
  sigaddset(&set, SIGUSR2);
  return set;
}

}  // namespace

termination_watch::termination_watch(std::stop_source source)
    : source_{ std::move(source) } {
  sigset_t const set{ watched_signals() };
  if (int const rc{ pthread_sigmask(SIG_BLOCK, &set, nullptr) }; rc != 0) {
    throw std::runtime_error("pthread_sigmask failed: " + std::to_string(rc));
  }

  thread_ = std::thread{ [this, set] {
    bool interrupted{ false };
    for (;;) {
      int sig{ 0 };
      if (sigwait(&set, &sig) != 0 || sig == SIGUSR2) { return; }
      if (interrupted) {
        std::ignore = write(STDERR_FILENO, "\n", 1);
        _exit(128 + sig);
      }
      interrupted = true;
      tui::warn("Interrupted, cancelling (repeat to exit immediately)");
      source_.request_stop();
    }
  } };
}

termination_watch::~termination_watch() {
  if (thread_.joinable()) {
    pthread_kill(thread_.native_handle(), SIGUSR2);
    thread_.join();
  }
}

}  // namespace refpack
