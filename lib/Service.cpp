#include "Service.h"

namespace bx {

Service::~Service() {
  if (thread_.joinable()) {
    isStopSet_ = true;
    thread_.join();
  }
}

Service::Roe<void> Service::start() {
  if (!isStopSet_) {
    return Error(-1, "Service is already running");
  }

  auto result = onStart();
  if (!result) {
    return Error(-2, "Service onStart() failed: " + result.error().message);
  }

  isStopSet_ = false;
  thread_ = std::thread(&Service::runLoop, this);

  log().info << "Service started";
  return {};
}

void Service::stop() {
  if (isStopSet_) {
    if (thread_.joinable()) {
      thread_.join();
    }
    return;
  }

  log().info << "Stopping service";

  isStopSet_ = true;
  onStopRequest();

  if (thread_.joinable()) {
    thread_.join();
  }

  onStop();

  log().info << "Service stopped";
}

} // namespace bx
