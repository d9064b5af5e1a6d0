#pragma once

#include <chrono>
#include <string>
#include <string_view>

namespace fleetwatch::probe {

inline constexpr std::string_view kReasonTimeout        = "timeout";
inline constexpr std::string_view kReasonUnreachable    = "unreachable";
inline constexpr std::string_view kReasonInvalidAddress = "invalid address";
inline constexpr std::string_view kReasonInternalError  = "internal error";

struct ProbeOutcome {
  bool        success{false};
  double      latency_ms{0.0};
  std::string reason;

  static ProbeOutcome Reachable(double latency_ms) {
    return {true, latency_ms, {}};
  }

  static ProbeOutcome Failed(std::string_view reason) {
    return {false, 0.0, std::string(reason)};
  }
};

/*
  Reachability check for a single address.

  Contract:
    - network-level failures (no reply, unreachable, bad address) are
      returned as a failed outcome, never thrown
    - timeout must be positive (std::invalid_argument otherwise)
    - local resource failures may throw; the dispatcher turns them into
      an "internal error" result
    - no retries

  Implementations must be safe to call from several threads at once.
*/
class Prober {
 public:
  virtual ~Prober() = default;

  virtual ProbeOutcome Probe(const std::string& address, std::chrono::milliseconds timeout) = 0;
};

} // namespace fleetwatch::probe
