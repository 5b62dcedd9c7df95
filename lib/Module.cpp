#include "Module.h"

namespace bx {

Module::Module(const std::string &name)
    : upLogger_(std::make_unique<logging::Logger>(logging::getLogger(name))) {}

logging::Logger &Module::log() const { return *upLogger_; }

} // namespace bx
