#pragma once

#include <cstddef>
#include <string>

#include "command.h"

namespace lockstep {

// Pure structural check run before a command is queued or sent. Holds no state
// so that every peer reaches the same accept/reject decision for the same bytes.
class CommandValidator {
 public:
  static constexpr size_t kMaxPayloadBytes = 1024;

  // On rejection, *reason (if given) describes the first failed rule.
  bool Validate(const Command& command, std::string* reason = nullptr) const;
};

}  // namespace lockstep
