#pragma once

#include <optional>
#include <string>

struct DigestChallenge {
  std::string realm;
  std::string nonce;
  std::string opaque;
  std::string algorithm = "MD5";
  bool qopAuth = false; // server offered qop=auth
  bool stale = false;
};

// RFC 2617 digest (MD5) for REGISTER/INVITE challenges.
class DigestAuth {
public:
  // Parses a WWW-Authenticate / Proxy-Authenticate value.
  static std::optional<DigestChallenge> parseChallenge(const std::string &header);

  static std::string md5Hex(const std::string &input);

  // Builds an Authorization value. `nonceCount` starts at 1 for a fresh
  // nonce; `cnonce` is only used with qop=auth.
  static std::string authorization(const DigestChallenge &challenge,
                                   const std::string &username,
                                   const std::string &password,
                                   const std::string &method,
                                   const std::string &uri, int nonceCount,
                                   const std::string &cnonce);

  static std::string response(const DigestChallenge &challenge,
                              const std::string &username,
                              const std::string &password,
                              const std::string &method,
                              const std::string &uri, const std::string &nc,
                              const std::string &cnonce);
};
