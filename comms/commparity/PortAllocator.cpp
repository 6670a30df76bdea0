// Copyright (c) Meta Platforms, Inc. and affiliates.

#include "comms/commparity/PortAllocator.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <optional>
#include <string>

#include <fmt/core.h>

#include "comms/commparity/ParityException.hpp"
#include "comms/commparity/ParityLogging.hpp"

namespace commparity {

namespace {

// Closes the wrapped descriptor when it goes out of scope.
class ScopedSocket {
 public:
  explicit ScopedSocket(int fd) : fd_(fd) {}
  ~ScopedSocket() {
    if (fd_ >= 0) {
      ::close(fd_);
    }
  }

  ScopedSocket(const ScopedSocket&) = delete;
  ScopedSocket& operator=(const ScopedSocket&) = delete;

  int get() const {
    return fd_;
  }

 private:
  int fd_;
};

std::optional<int> tryBindEphemeral(int family, std::string& error) {
  ScopedSocket sock(::socket(family, SOCK_STREAM, 0));
  if (sock.get() < 0) {
    error = fmt::format("socket() failed: {}", std::strerror(errno));
    return std::nullopt;
  }

  sockaddr_storage addr{};
  socklen_t addr_len = 0;
  if (family == AF_INET) {
    auto* addr4 = reinterpret_cast<sockaddr_in*>(&addr);
    addr4->sin_family = AF_INET;
    addr4->sin_addr.s_addr = htonl(INADDR_ANY);
    addr4->sin_port = 0;
    addr_len = sizeof(sockaddr_in);
  } else {
    auto* addr6 = reinterpret_cast<sockaddr_in6*>(&addr);
    addr6->sin6_family = AF_INET6;
    addr6->sin6_addr = in6addr_any;
    addr6->sin6_port = 0;
    addr_len = sizeof(sockaddr_in6);
  }

  if (::bind(sock.get(), reinterpret_cast<sockaddr*>(&addr), addr_len) != 0) {
    error = fmt::format("bind() failed: {}", std::strerror(errno));
    return std::nullopt;
  }
  if (::getsockname(sock.get(), reinterpret_cast<sockaddr*>(&addr), &addr_len) !=
      0) {
    error = fmt::format("getsockname() failed: {}", std::strerror(errno));
    return std::nullopt;
  }

  int port = family == AF_INET
      ? ntohs(reinterpret_cast<sockaddr_in*>(&addr)->sin_port)
      : ntohs(reinterpret_cast<sockaddr_in6*>(&addr)->sin6_port);
  return port;
}

} // namespace

int getOpenPort() {
  std::string ipv4_error;
  if (auto port = tryBindEphemeral(AF_INET, ipv4_error)) {
    return *port;
  }
  CP_LOG(WARNING) << "IPv4 port allocation failed (" << ipv4_error
                  << "), trying IPv6";

  std::string ipv6_error;
  if (auto port = tryBindEphemeral(AF_INET6, ipv6_error)) {
    return *port;
  }
  throw ResourceUnavailableError(
      fmt::format(
          "Unable to allocate a rendezvous port. IPv4: {}. IPv6: {}",
          ipv4_error,
          ipv6_error));
}

} // namespace commparity
