// Copyright (c) Meta Platforms, Inc. and affiliates.

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "comms/commparity/ParityTypes.hpp"
#include "comms/commparity/PortAllocator.hpp"

namespace commparity::test {

namespace {

// Listens on an ephemeral IPv4 port for the lifetime of the object.
class HeldListener {
 public:
  HeldListener() {
    fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd_ < 0) {
      return;
    }
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
    addr.sin_port = 0;
    socklen_t len = sizeof(addr);
    if (::bind(fd_, reinterpret_cast<sockaddr*>(&addr), len) == 0 &&
        ::listen(fd_, 1) == 0 &&
        ::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len) == 0) {
      port_ = ntohs(addr.sin_port);
    }
  }

  ~HeldListener() {
    if (fd_ >= 0) {
      ::close(fd_);
    }
  }

  HeldListener(const HeldListener&) = delete;
  HeldListener& operator=(const HeldListener&) = delete;

  int port() const {
    return port_;
  }

 private:
  int fd_{-1};
  int port_{-1};
};

} // namespace

TEST(PortAllocatorTest, ReturnsPortInRange) {
  int port = getOpenPort();
  EXPECT_GE(port, kMinPort);
  EXPECT_LE(port, kMaxPort);
}

TEST(PortAllocatorTest, ReturnedPortCanBeBound) {
  int port = getOpenPort();
  int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  ASSERT_GE(fd, 0);
  int one = 1;
  ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_ANY);
  addr.sin_port = htons(static_cast<uint16_t>(port));
  EXPECT_EQ(::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)), 0);
  ::close(fd);
}

TEST(PortAllocatorTest, NeverReturnsAPortInUse) {
  HeldListener listener;
  ASSERT_GT(listener.port(), 0);
  for (int i = 0; i < 64; ++i) {
    EXPECT_NE(getOpenPort(), listener.port());
  }
}

} // namespace commparity::test
