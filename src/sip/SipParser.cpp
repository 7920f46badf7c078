#include "SipParser.h"
#include <algorithm>
#include <cctype>

namespace {

std::string_view trim(std::string_view s) {
  auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string_view::npos)
    return {};
  auto end = s.find_last_not_of(" \t\r\n");
  return s.substr(start, end - start + 1);
}

bool parseInt(std::string_view sv, int &out) {
  if (sv.empty())
    return false;
  int value = 0;
  for (char c : sv) {
    if (c < '0' || c > '9')
      return false;
    value = value * 10 + (c - '0');
    if (value > 1000000000)
      return false;
  }
  out = value;
  return true;
}

// Next CRLF- or LF-terminated line; the terminator is consumed.
bool nextLine(std::string_view raw, size_t &pos, std::string_view &line) {
  if (pos >= raw.size())
    return false;
  auto nl = raw.find('\n', pos);
  if (nl == std::string_view::npos) {
    line = raw.substr(pos);
    pos = raw.size();
  } else {
    line = raw.substr(pos, nl - pos);
    pos = nl + 1;
  }
  if (!line.empty() && line.back() == '\r')
    line.remove_suffix(1);
  return true;
}

} // namespace

SipMethod SipParser::parseMethod(std::string_view sv) {
  if (sv == "INVITE")
    return SipMethod::INVITE;
  if (sv == "ACK")
    return SipMethod::ACK;
  if (sv == "BYE")
    return SipMethod::BYE;
  if (sv == "CANCEL")
    return SipMethod::CANCEL;
  if (sv == "OPTIONS")
    return SipMethod::OPTIONS;
  if (sv == "REGISTER")
    return SipMethod::REGISTER;
  if (sv == "INFO")
    return SipMethod::INFO;
  if (sv == "UPDATE")
    return SipMethod::UPDATE;
  return SipMethod::UNKNOWN;
}

std::optional<SipMessage> SipParser::parse(const char *buffer, size_t length) {
  SipMessage msg;
  std::string_view raw(buffer, length);
  size_t pos = 0;
  std::string_view line;

  // Parse First Line
  if (!nextLine(raw, pos, line))
    return std::nullopt;

  if (line.rfind("SIP/2.0 ", 0) == 0) {
    // Response: SIP/2.0 200 OK
    msg.isRequest = false;
    msg.version = "SIP/2.0";
    auto firstSpace = line.find(' ');
    auto secondSpace = line.find(' ', firstSpace + 1);
    std::string_view code =
        line.substr(firstSpace + 1, secondSpace == std::string_view::npos
                                        ? std::string_view::npos
                                        : secondSpace - firstSpace - 1);
    if (!parseInt(code, msg.statusCode) || msg.statusCode < 100 ||
        msg.statusCode > 699)
      return std::nullopt;
    if (secondSpace != std::string_view::npos)
      msg.statusPhrase = std::string(line.substr(secondSpace + 1));
  } else {
    // Request: INVITE sip:user@host SIP/2.0
    msg.isRequest = true;
    auto firstSpace = line.find(' ');
    auto lastSpace = line.rfind(' ');
    if (firstSpace == std::string_view::npos || firstSpace == lastSpace)
      return std::nullopt;
    std::string method(line.substr(0, firstSpace));
    std::transform(method.begin(), method.end(), method.begin(),
                   [](unsigned char c) {
                     return static_cast<char>(::toupper(c));
                   });
    msg.methodStr = method;
    msg.method = parseMethod(method);
    msg.uri = std::string(line.substr(firstSpace + 1, lastSpace - firstSpace - 1));
    msg.version = std::string(line.substr(lastSpace + 1));
    if (msg.version.rfind("SIP/", 0) != 0)
      return std::nullopt;
  }

  // Headers
  int contentLength = -1;
  bool sawBlank = false;
  while (nextLine(raw, pos, line)) {
    if (line.empty()) {
      sawBlank = true;
      break; // End of headers
    }

    // Folded continuation of the previous header
    if (line[0] == ' ' || line[0] == '\t') {
      if (!msg.headers.empty())
        msg.headers.back().second += " " + std::string(trim(line));
      continue;
    }

    auto colon = line.find(':');
    if (colon == std::string_view::npos)
      continue;
    std::string name(trim(line.substr(0, colon)));
    std::string value(trim(line.substr(colon + 1)));
    msg.addHeader(name, value);

    std::string lowerName = msg.headers.back().first;
    std::transform(lowerName.begin(), lowerName.end(), lowerName.begin(),
                   [](unsigned char c) {
                     return static_cast<char>(::tolower(c));
                   });
    if (lowerName == "content-length") {
      int n = 0;
      if (parseInt(trim(line.substr(colon + 1)), n))
        contentLength = n;
    }
  }

  // Body
  if (sawBlank && pos < raw.size()) {
    size_t available = raw.size() - pos;
    size_t take = contentLength < 0
                      ? available
                      : std::min(available, static_cast<size_t>(contentLength));
    msg.body.assign(raw.data() + pos, take);
  }

  return msg;
}
