#pragma once

#include <functional>
#include <netinet/in.h>
#include <string>

#include "SipMessage.h"

// One UDP socket carrying every SIP message of the user agent.
class SipTransport {
public:
  using MessageHandler =
      std::function<void(const SipMessage &, const sockaddr_in &)>;

  SipTransport(const std::string &bindIp, int port);
  ~SipTransport();

  SipTransport(const SipTransport &) = delete;
  SipTransport &operator=(const SipTransport &) = delete;

  bool start();
  void close();
  void setMessageHandler(MessageHandler handler);

  // Waits up to timeoutMs for traffic and dispatches everything queued.
  void poll(int timeoutMs);

  bool send(const SipMessage &msg, const sockaddr_in &dest);

  int localPort() const { return localPort_; }

private:
  std::string bindIp_;
  int port_;
  int localPort_ = 0;
  int socketFd_ = -1;
  MessageHandler handler_;

  char buffer_[8192];
};
