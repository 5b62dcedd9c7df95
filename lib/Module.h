#pragma once

#include "Logger.h"
#include <memory>
#include <string>

namespace bx {

/**
 * Base class for modules that need logging functionality.
 * Provides a common interface for logger management across components.
 */
class Module {
public:
  /**
   * Constructor
   * @param name Hierarchical name for the module's logger (e.g.,
   * "explorer.rpc")
   */
  explicit Module(const std::string &name);

  virtual ~Module() = default;

  Module(const Module &) = delete;
  Module &operator=(const Module &) = delete;

  /**
   * Get the logger instance for this module.
   * @return Reference to the logger instance
   */
  logging::Logger &log() const;

private:
  std::unique_ptr<logging::Logger> upLogger_;
};

} // namespace bx
