#pragma once

#include <netinet/in.h>
#include <string>

class Net {
public:
  static int createUdpSocket();
  static bool bindSocket(int fd, const std::string &ip, int port);
  static bool setNonBlocking(int fd);
  static void closeSocket(int fd);

  // Resolves a hostname or dotted quad (IPv4 only).
  static bool resolve(const std::string &host, int port, sockaddr_in &out);

  // Local interface address the kernel would use to reach `remote`.
  static std::string localAddressFor(const sockaddr_in &remote);

  static int boundPort(int fd);

  // address helper
  static std::string ipFromSockAddr(const sockaddr_in &addr);
  static int portFromSockAddr(const sockaddr_in &addr);
  static bool sameEndpoint(const sockaddr_in &a, const sockaddr_in &b);
};
