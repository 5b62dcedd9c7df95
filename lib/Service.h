#pragma once

#include "Module.h"
#include "ResultOrError.hpp"
#include <atomic>
#include <thread>

namespace bx {

/**
 * Service - Base class for components that run in a dedicated thread.
 *
 * Provides thread lifecycle management with start/stop functionality.
 * Derived classes implement the runLoop() method which executes in the service
 * thread.
 */
class Service : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  explicit Service(const std::string &name) : Module(name) {}

  /**
   * Virtual destructor. Derived classes must call stop() in their own
   * destructor since runLoop() may still touch their members.
   */
  ~Service() override;

  bool isStopSet() const { return isStopSet_; }

  Roe<void> start();
  void stop();

protected:
  /**
   * Main service loop - implement in derived classes.
   * Runs in the service thread.
   * Must return once stop has been requested.
   */
  virtual void runLoop() = 0;

  /**
   * Called before the thread starts (in the calling thread context).
   * An error aborts the start.
   */
  virtual Roe<void> onStart() { return {}; }

  /**
   * Called from stop() right after the stop flag is set, before joining.
   * Loops that block (e.g. in accept) unblock themselves here.
   */
  virtual void onStopRequest() {}

  /**
   * Called after the thread has stopped (in the calling thread context).
   */
  virtual void onStop() {}

private:
  std::atomic<bool> isStopSet_{ true };

  std::thread thread_;
};

} // namespace bx
