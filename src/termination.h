#pragma once

#include "util.h"

#include <stop_token>
#include <thread>

namespace refpack {

// Turns the first SIGINT/SIGTERM into a stop request on `source`; a second
// signal terminates the process immediately. The signals are blocked for the
// calling thread, so construct this before starting any other thread.
class termination_watch : unmovable {
 public:
  explicit termination_watch(std::stop_source source);
  ~termination_watch();

 private:
  std::stop_source source_;
  std::thread thread_;
};

}  // namespace refpack
