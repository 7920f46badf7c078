#include "DigestAuth.h"
#include "../app/Logger.h"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <memory>
#include <openssl/evp.h>
#include <sstream>

namespace {

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(::tolower(c));
  });
  return s;
}

} // namespace

std::optional<DigestChallenge>
DigestAuth::parseChallenge(const std::string &header) {
  auto start = header.find_first_not_of(' ');
  if (start == std::string::npos ||
      lower(header.substr(start, 6)) != "digest")
    return std::nullopt;

  DigestChallenge challenge;
  size_t pos = start + 6;
  while (pos < header.size()) {
    pos = header.find_first_not_of(" ,\t", pos);
    if (pos == std::string::npos)
      break;
    auto eq = header.find('=', pos);
    if (eq == std::string::npos)
      break;
    std::string key = lower(header.substr(pos, eq - pos));
    key.erase(key.find_last_not_of(' ') + 1);

    std::string value;
    pos = eq + 1;
    if (pos < header.size() && header[pos] == '"') {
      auto close = header.find('"', pos + 1);
      if (close == std::string::npos)
        return std::nullopt;
      value = header.substr(pos + 1, close - pos - 1);
      pos = close + 1;
    } else {
      auto end = header.find(',', pos);
      value = header.substr(pos, end == std::string::npos ? std::string::npos
                                                          : end - pos);
      value.erase(value.find_last_not_of(' ') + 1);
      pos = end == std::string::npos ? header.size() : end;
    }

    if (key == "realm")
      challenge.realm = value;
    else if (key == "nonce")
      challenge.nonce = value;
    else if (key == "opaque")
      challenge.opaque = value;
    else if (key == "algorithm")
      challenge.algorithm = value;
    else if (key == "stale")
      challenge.stale = lower(value) == "true";
    else if (key == "qop") {
      std::istringstream options(value);
      std::string option;
      while (std::getline(options, option, ',')) {
        option.erase(0, option.find_first_not_of(' '));
        option.erase(option.find_last_not_of(' ') + 1);
        if (lower(option) == "auth")
          challenge.qopAuth = true;
      }
    }
  }

  if (challenge.nonce.empty())
    return std::nullopt;
  if (lower(challenge.algorithm) != "md5") {
    LOG_WARN("Unsupported digest algorithm " << challenge.algorithm);
    return std::nullopt;
  }
  return challenge;
}

std::string DigestAuth::md5Hex(const std::string &input) {
  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(),
                                                              EVP_MD_CTX_free);
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int len = 0;
  if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1 ||
      EVP_DigestUpdate(ctx.get(), input.data(), input.size()) != 1 ||
      EVP_DigestFinal_ex(ctx.get(), digest, &len) != 1) {
    LOG_ERROR("MD5 digest computation failed");
    return "";
  }

  static const char *hex = "0123456789abcdef";
  std::string out;
  out.reserve(len * 2);
  for (unsigned int i = 0; i < len; ++i) {
    out.push_back(hex[digest[i] >> 4]);
    out.push_back(hex[digest[i] & 0x0F]);
  }
  return out;
}

std::string DigestAuth::response(const DigestChallenge &challenge,
                                 const std::string &username,
                                 const std::string &password,
                                 const std::string &method,
                                 const std::string &uri, const std::string &nc,
                                 const std::string &cnonce) {
  std::string ha1 = md5Hex(username + ":" + challenge.realm + ":" + password);
  std::string ha2 = md5Hex(method + ":" + uri);
  if (challenge.qopAuth)
    return md5Hex(ha1 + ":" + challenge.nonce + ":" + nc + ":" + cnonce +
                  ":auth:" + ha2);
  return md5Hex(ha1 + ":" + challenge.nonce + ":" + ha2);
}

std::string DigestAuth::authorization(const DigestChallenge &challenge,
                                      const std::string &username,
                                      const std::string &password,
                                      const std::string &method,
                                      const std::string &uri, int nonceCount,
                                      const std::string &cnonce) {
  char nc[9];
  std::snprintf(nc, sizeof(nc), "%08x", nonceCount);

  std::ostringstream oss;
  oss << "Digest username=\"" << username << "\", realm=\"" << challenge.realm
      << "\", nonce=\"" << challenge.nonce << "\", uri=\"" << uri
      << "\", response=\""
      << response(challenge, username, password, method, uri, nc, cnonce)
      << "\", algorithm=MD5";
  if (challenge.qopAuth)
    oss << ", qop=auth, nc=" << nc << ", cnonce=\"" << cnonce << "\"";
  if (!challenge.opaque.empty())
    oss << ", opaque=\"" << challenge.opaque << "\"";
  return oss.str();
}
