#include "icmp_prober.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <netinet/ip.h>
#include <netinet/ip_icmp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <cmath>
#include <cstring>
#include <stdexcept>
#include <system_error>

namespace fleetwatch::probe {

namespace {

constexpr std::size_t kPayloadBytes = 32;

struct EchoPacket {
  icmphdr       header;
  unsigned char payload[kPayloadBytes];
};

uint16_t Checksum(const void* data, std::size_t len) {
  const auto* words = static_cast<const uint16_t*>(data);
  uint32_t    sum   = 0;
  for (; len > 1; len -= 2) sum += *words++;
  if (len == 1) sum += *reinterpret_cast<const uint8_t*>(words);
  sum = (sum >> 16) + (sum & 0xFFFF);
  sum += (sum >> 16);
  return static_cast<uint16_t>(~sum);
}

uint16_t NextSequence() {
  static std::atomic<uint16_t> sequence{1};
  return sequence.fetch_add(1, std::memory_order_relaxed);
}

bool IsUnreachableErrno(int err) {
  return err == EHOSTUNREACH || err == ENETUNREACH || err == EHOSTDOWN || err == ENETDOWN || err == ECONNREFUSED;
}

class Socket {
 public:
  Socket() {
    fd_ = ::socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, IPPROTO_ICMP);
    if (fd_ >= 0) {
      datagram_ = true;
      // surface ICMP errors (host unreachable) as recv errors
      int on = 1;
      ::setsockopt(fd_, IPPROTO_IP, IP_RECVERR, &on, sizeof(on));
      return;
    }

    fd_ = ::socket(AF_INET, SOCK_RAW | SOCK_CLOEXEC, IPPROTO_ICMP);
    if (fd_ < 0) {
      throw std::system_error(errno, std::generic_category(), "open ICMP socket");
    }
    int ttl = 64;
    ::setsockopt(fd_, IPPROTO_IP, IP_TTL, &ttl, sizeof(ttl));
  }

  ~Socket() {
    if (fd_ >= 0) ::close(fd_);
  }

  Socket(const Socket&)            = delete;
  Socket& operator=(const Socket&) = delete;

  int fd() const {
    return fd_;
  }

  bool datagram() const {
    return datagram_;
  }

 private:
  int  fd_       = -1;
  bool datagram_ = false;
};

double ElapsedMs(std::chrono::steady_clock::time_point start) {
  const double ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
  return std::round(ms * 100.0) / 100.0;
}

enum class ReplyKind { kIgnore, kEchoReply, kUnreachable };

/*
  Datagram sockets deliver the bare ICMP message and the kernel already
  filtered on our identifier. Raw sockets see every ICMP packet for the
  host, IP header included.
*/
ReplyKind Classify(const unsigned char* buf, std::size_t len, bool datagram, uint16_t identifier, uint16_t sequence) {
  std::size_t offset = 0;
  if (!datagram) {
    if (len < sizeof(iphdr)) return ReplyKind::kIgnore;
    offset = static_cast<std::size_t>(reinterpret_cast<const iphdr*>(buf)->ihl) * 4;
  }
  if (len < offset + sizeof(icmphdr)) return ReplyKind::kIgnore;

  icmphdr reply{};
  std::memcpy(&reply, buf + offset, sizeof(reply));

  if (reply.type == ICMP_ECHOREPLY) {
    if (ntohs(reply.un.echo.sequence) != sequence) return ReplyKind::kIgnore;
    if (!datagram && ntohs(reply.un.echo.id) != identifier) return ReplyKind::kIgnore;
    return ReplyKind::kEchoReply;
  }

  if (reply.type == ICMP_DEST_UNREACH && !datagram) {
    // embedded original datagram: IP header + first 8 bytes of our echo
    const std::size_t inner = offset + sizeof(icmphdr);
    if (len < inner + sizeof(iphdr)) return ReplyKind::kIgnore;
    const std::size_t inner_ip_len = static_cast<std::size_t>(reinterpret_cast<const iphdr*>(buf + inner)->ihl) * 4;
    if (len < inner + inner_ip_len + sizeof(icmphdr)) return ReplyKind::kIgnore;

    icmphdr original{};
    std::memcpy(&original, buf + inner + inner_ip_len, sizeof(original));
    if (original.type == ICMP_ECHO && ntohs(original.un.echo.id) == identifier && ntohs(original.un.echo.sequence) == sequence) {
      return ReplyKind::kUnreachable;
    }
  }

  return ReplyKind::kIgnore;
}

} // namespace

IcmpProber::IcmpProber() : identifier_(static_cast<uint16_t>(::getpid() & 0xFFFF)) {
}

ProbeOutcome IcmpProber::Probe(const std::string& address, std::chrono::milliseconds timeout) {
  if (timeout.count() <= 0) {
    throw std::invalid_argument("probe timeout must be positive");
  }

  sockaddr_in target{};
  target.sin_family = AF_INET;
  if (address.empty() || ::inet_pton(AF_INET, address.c_str(), &target.sin_addr) != 1) {
    return ProbeOutcome::Failed(kReasonInvalidAddress);
  }

  Socket         socket;
  const uint16_t sequence = NextSequence();

  EchoPacket packet{};
  packet.header.type             = ICMP_ECHO;
  packet.header.code             = 0;
  packet.header.un.echo.id       = htons(identifier_);
  packet.header.un.echo.sequence = htons(sequence);
  for (std::size_t i = 0; i < kPayloadBytes; ++i) {
    packet.payload[i] = static_cast<unsigned char>('a' + i % 26);
  }
  packet.header.checksum = Checksum(&packet, sizeof(packet));

  const auto start    = std::chrono::steady_clock::now();
  const auto deadline = start + timeout;

  ssize_t sent = ::sendto(socket.fd(), &packet, sizeof(packet), 0, reinterpret_cast<const sockaddr*>(&target), sizeof(target));
  if (sent < 0) {
    const int err = errno;
    if (IsUnreachableErrno(err)) {
      return ProbeOutcome::Failed(kReasonUnreachable);
    }
    if (err == EINVAL || err == EAFNOSUPPORT) {
      return ProbeOutcome::Failed(kReasonInvalidAddress);
    }
    throw std::system_error(err, std::generic_category(), "send ICMP echo");
  }

  unsigned char buf[1500];
  for (;;) {
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
      return ProbeOutcome::Failed(kReasonTimeout);
    }

    pollfd pfd{};
    pfd.fd     = socket.fd();
    pfd.events = POLLIN;

    const int ready = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
    if (ready < 0) {
      if (errno == EINTR) continue;
      throw std::system_error(errno, std::generic_category(), "poll ICMP socket");
    }
    if (ready == 0) {
      return ProbeOutcome::Failed(kReasonTimeout);
    }

    sockaddr_in from{};
    socklen_t   from_len = sizeof(from);
    ssize_t     n        = ::recvfrom(socket.fd(), buf, sizeof(buf), MSG_DONTWAIT, reinterpret_cast<sockaddr*>(&from), &from_len);
    if (n < 0) {
      const int err = errno;
      if (IsUnreachableErrno(err) || ((err == EAGAIN || err == EWOULDBLOCK) && (pfd.revents & POLLERR))) {
        return ProbeOutcome::Failed(kReasonUnreachable);
      }
      if (err == EAGAIN || err == EWOULDBLOCK || err == EINTR) continue;
      throw std::system_error(err, std::generic_category(), "receive ICMP reply");
    }

    if (!socket.datagram() && from.sin_addr.s_addr != target.sin_addr.s_addr) {
      // raw sockets also get unreachable notices from routers; those are checked by content
      if (Classify(buf, static_cast<std::size_t>(n), false, identifier_, sequence) == ReplyKind::kUnreachable) {
        return ProbeOutcome::Failed(kReasonUnreachable);
      }
      continue;
    }

    switch (Classify(buf, static_cast<std::size_t>(n), socket.datagram(), identifier_, sequence)) {
      case ReplyKind::kEchoReply:
        return ProbeOutcome::Reachable(ElapsedMs(start));
      case ReplyKind::kUnreachable:
        return ProbeOutcome::Failed(kReasonUnreachable);
      case ReplyKind::kIgnore:
        break;
    }
  }
}

} // namespace fleetwatch::probe
