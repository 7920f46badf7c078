#include "SipTransport.h"
#include "../app/Logger.h"
#include "../util/Net.h"
#include "SipParser.h"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <sys/socket.h>

SipTransport::SipTransport(const std::string &bindIp, int port)
    : bindIp_(bindIp), port_(port) {}

SipTransport::~SipTransport() { close(); }

bool SipTransport::start() {
  socketFd_ = Net::createUdpSocket();
  if (socketFd_ < 0)
    return false;

  if (!Net::bindSocket(socketFd_, bindIp_, port_)) {
    LOG_ERROR("Cannot bind SIP socket to " << bindIp_ << ":" << port_);
    close();
    return false;
  }

  Net::setNonBlocking(socketFd_);
  localPort_ = Net::boundPort(socketFd_);
  LOG_INFO("SIP transport listening on " << bindIp_ << ":" << localPort_
                                         << "/udp");
  return true;
}

void SipTransport::close() {
  if (socketFd_ >= 0) {
    Net::closeSocket(socketFd_);
    socketFd_ = -1;
  }
}

void SipTransport::setMessageHandler(MessageHandler handler) {
  handler_ = std::move(handler);
}

void SipTransport::poll(int timeoutMs) {
  if (socketFd_ < 0)
    return;

  struct pollfd pfd;
  pfd.fd = socketFd_;
  pfd.events = POLLIN;
  pfd.revents = 0;

  int ret = ::poll(&pfd, 1, timeoutMs);
  if (ret < 0) {
    if (errno != EINTR)
      LOG_ERROR("SIP poll error: " << strerror(errno));
    return;
  }
  if (ret == 0 || !(pfd.revents & POLLIN))
    return;

  while (true) { // Drain all available packets
    sockaddr_in senderAddr{};
    socklen_t addrLen = sizeof(senderAddr);
    ssize_t n = recvfrom(socketFd_, buffer_, sizeof(buffer_) - 1, 0,
                         (struct sockaddr *)&senderAddr, &addrLen);
    if (n < 0) {
      if (errno != EAGAIN && errno != EWOULDBLOCK)
        LOG_ERROR("SIP recvfrom error: " << strerror(errno));
      break;
    }
    if (n == 0)
      break;

    // CRLF keep-alives
    if (n < 32 && (buffer_[0] == '\r' || buffer_[0] == '\n' ||
                   buffer_[0] == ' '))
      continue;

    LOG_DEBUG("SIP in from " << Net::ipFromSockAddr(senderAddr) << ":"
                             << Net::portFromSockAddr(senderAddr) << "\n"
                             << std::string(buffer_, std::min<size_t>(n, 512)));

    auto msg = SipParser::parse(buffer_, n);
    if (!msg) {
      LOG_WARN("Failed to parse SIP message from "
               << Net::ipFromSockAddr(senderAddr));
      continue;
    }
    if (handler_)
      handler_(*msg, senderAddr);
  }
}

bool SipTransport::send(const SipMessage &msg, const sockaddr_in &dest) {
  if (socketFd_ < 0)
    return false;
  std::string raw = msg.toString();
  LOG_DEBUG("SIP out to " << Net::ipFromSockAddr(dest) << ":"
                          << Net::portFromSockAddr(dest) << "\n"
                          << raw.substr(0, std::min<size_t>(raw.size(), 512)));
  ssize_t n = sendto(socketFd_, raw.data(), raw.size(), 0,
                     (const struct sockaddr *)&dest, sizeof(dest));
  if (n < 0) {
    LOG_ERROR("SIP sendto failed: " << strerror(errno));
    return false;
  }
  return true;
}
