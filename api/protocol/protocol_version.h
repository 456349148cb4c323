#pragma once

namespace protocol {

// Bump when the command or batch wire layout changes; peers refuse mismatches.
constexpr int kProtocolVersion = 1;

}  // namespace protocol
