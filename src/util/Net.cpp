#include "Net.h"
#include "../app/Logger.h"
#include <arpa/inet.h>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <sys/socket.h>
#include <unistd.h>

int Net::createUdpSocket() {
  int fd = socket(AF_INET, SOCK_DGRAM, 0);
  if (fd < 0) {
    LOG_ERROR("Failed to create socket: " << strerror(errno));
    return fd;
  }

  int opt = 1;
  if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
    LOG_WARN("Failed to set SO_REUSEADDR");
  }

  return fd;
}

bool Net::bindSocket(int fd, const std::string &ip, int port) {
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  if (inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) <= 0) {
    LOG_ERROR("Invalid IP address: " << ip);
    return false;
  }

  if (bind(fd, (struct sockaddr *)&addr, sizeof(addr)) < 0) {
    LOG_DEBUG("Bind failed on " << ip << ":" << port << " error: " << strerror(errno));
    return false;
  }
  return true;
}

bool Net::setNonBlocking(int fd) {
  int flags = fcntl(fd, F_GETFL, 0);
  if (flags == -1) {
    LOG_ERROR("fcntl F_GETFL failed: " << strerror(errno));
    return false;
  }
  if (fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1) {
    LOG_ERROR("fcntl F_SETFL O_NONBLOCK failed: " << strerror(errno));
    return false;
  }
  return true;
}

void Net::closeSocket(int fd) {
  if (fd >= 0)
    close(fd);
}

bool Net::resolve(const std::string &host, int port, sockaddr_in &out) {
  out = sockaddr_in{};
  out.sin_family = AF_INET;
  out.sin_port = htons(port);
  if (inet_pton(AF_INET, host.c_str(), &out.sin_addr) == 1)
    return true;

  addrinfo hints{};
  hints.ai_family = AF_INET;
  hints.ai_socktype = SOCK_DGRAM;
  addrinfo *result = nullptr;
  int rc = getaddrinfo(host.c_str(), nullptr, &hints, &result);
  if (rc != 0 || !result) {
    LOG_ERROR("Failed to resolve " << host << ": " << gai_strerror(rc));
    return false;
  }
  out.sin_addr = reinterpret_cast<sockaddr_in *>(result->ai_addr)->sin_addr;
  freeaddrinfo(result);
  return true;
}

std::string Net::localAddressFor(const sockaddr_in &remote) {
  int fd = socket(AF_INET, SOCK_DGRAM, 0);
  if (fd < 0)
    return "127.0.0.1";

  std::string ip = "127.0.0.1";
  // connect() on UDP only selects a route, nothing is sent.
  if (connect(fd, (const struct sockaddr *)&remote, sizeof(remote)) == 0) {
    sockaddr_in local{};
    socklen_t len = sizeof(local);
    if (getsockname(fd, (struct sockaddr *)&local, &len) == 0)
      ip = ipFromSockAddr(local);
  }
  close(fd);
  return ip;
}

int Net::boundPort(int fd) {
  sockaddr_in local{};
  socklen_t len = sizeof(local);
  if (getsockname(fd, (struct sockaddr *)&local, &len) != 0)
    return -1;
  return ntohs(local.sin_port);
}

std::string Net::ipFromSockAddr(const sockaddr_in &addr) {
  char ip[INET_ADDRSTRLEN];
  inet_ntop(AF_INET, &(addr.sin_addr), ip, INET_ADDRSTRLEN);
  return std::string(ip);
}

int Net::portFromSockAddr(const sockaddr_in &addr) {
  return ntohs(addr.sin_port);
}

bool Net::sameEndpoint(const sockaddr_in &a, const sockaddr_in &b) {
  return a.sin_addr.s_addr == b.sin_addr.s_addr && a.sin_port == b.sin_port;
}
