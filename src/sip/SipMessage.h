#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

enum class SipMethod {
  INVITE,
  ACK,
  BYE,
  CANCEL,
  OPTIONS,
  REGISTER,
  INFO,
  UPDATE,
  UNKNOWN
};

class SipMessage {
public:
  bool isRequest = false;

  // Request Line
  SipMethod method = SipMethod::UNKNOWN;
  std::string methodStr;
  std::string uri;
  std::string version = "SIP/2.0";

  // Status Line (if response)
  int statusCode = 0;
  std::string statusPhrase;

  // Headers in wire order; names keep their spelling, lookups ignore case.
  std::vector<std::pair<std::string, std::string>> headers;

  std::string body;

  static SipMessage request(SipMethod method, const std::string &uri);
  static const char *methodName(SipMethod method);

  void addHeader(const std::string &name, const std::string &value);
  // Replaces every header of that name with a single value.
  void setHeader(const std::string &name, const std::string &value);
  void removeHeader(const std::string &name);
  std::optional<std::string> getHeader(const std::string &name) const;
  std::vector<std::string> getHeaders(const std::string &name) const;
  std::string toString() const;

  // Common Header Parsing helpers
  std::string getCallId() const;
  std::string getFromTag() const;
  std::string getToTag() const;
  int getCSeq() const;
  SipMethod getCSeqMethod() const;
  std::string getBranch() const;
  std::string getFromUri() const;
  std::string getContactUri() const;
  // Expires header, or the expires parameter of the Contact; -1 if absent.
  int getExpires() const;

  // Value of `name=` inside a header value (tag, branch, expires ...).
  static std::string headerParam(const std::string &value,
                                 const std::string &name);
  // The URI between <> or, without brackets, up to the first ';'.
  static std::string uriOf(const std::string &value);
};
