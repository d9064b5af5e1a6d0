#pragma once

#include <cstdint>

#include "internal/probe/prober.hpp"

namespace fleetwatch::probe {

/*
  ICMP echo prober.

  Prefers an unprivileged ICMP datagram socket (net.ipv4.ping_group_range)
  and falls back to a raw socket, which needs CAP_NET_RAW. One socket per
  probe, so concurrent probes never consume each other's replies.
*/
class IcmpProber final : public Prober {
 public:
  IcmpProber();

  ProbeOutcome Probe(const std::string& address, std::chrono::milliseconds timeout) override;

 private:
  std::uint16_t identifier_;
};

} // namespace fleetwatch::probe
