#include "SipMessage.h"
#include "SipParser.h"
#include <algorithm>
#include <cstring>
#include <sstream>

namespace {

bool iequals(const std::string &a, const std::string &b) {
  return a.size() == b.size() &&
         std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
           return ::tolower(static_cast<unsigned char>(x)) ==
                  ::tolower(static_cast<unsigned char>(y));
         });
}

// Compact forms from RFC 3261 section 7.3.3.
std::string expandCompact(const std::string &name) {
  if (name.size() != 1)
    return name;
  switch (::tolower(static_cast<unsigned char>(name[0]))) {
  case 'i':
    return "Call-ID";
  case 'f':
    return "From";
  case 't':
    return "To";
  case 'v':
    return "Via";
  case 'm':
    return "Contact";
  case 'l':
    return "Content-Length";
  case 'c':
    return "Content-Type";
  default:
    return name;
  }
}

} // namespace

SipMessage SipMessage::request(SipMethod method, const std::string &uri) {
  SipMessage msg;
  msg.isRequest = true;
  msg.method = method;
  msg.methodStr = methodName(method);
  msg.uri = uri;
  return msg;
}

const char *SipMessage::methodName(SipMethod method) {
  switch (method) {
  case SipMethod::INVITE:
    return "INVITE";
  case SipMethod::ACK:
    return "ACK";
  case SipMethod::BYE:
    return "BYE";
  case SipMethod::CANCEL:
    return "CANCEL";
  case SipMethod::OPTIONS:
    return "OPTIONS";
  case SipMethod::REGISTER:
    return "REGISTER";
  case SipMethod::INFO:
    return "INFO";
  case SipMethod::UPDATE:
    return "UPDATE";
  case SipMethod::UNKNOWN:
    break;
  }
  return "UNKNOWN";
}

void SipMessage::addHeader(const std::string &name, const std::string &value) {
  headers.emplace_back(expandCompact(name), value);
}

void SipMessage::setHeader(const std::string &name, const std::string &value) {
  removeHeader(name);
  addHeader(name, value);
}

void SipMessage::removeHeader(const std::string &name) {
  std::string full = expandCompact(name);
  headers.erase(std::remove_if(headers.begin(), headers.end(),
                               [&](const auto &h) {
                                 return iequals(h.first, full);
                               }),
                headers.end());
}

std::optional<std::string>
SipMessage::getHeader(const std::string &name) const {
  std::string full = expandCompact(name);
  for (const auto &[key, value] : headers) {
    if (iequals(key, full))
      return value;
  }
  return std::nullopt;
}

std::vector<std::string> SipMessage::getHeaders(const std::string &name) const {
  std::string full = expandCompact(name);
  std::vector<std::string> out;
  for (const auto &[key, value] : headers) {
    if (iequals(key, full))
      out.push_back(value);
  }
  return out;
}

std::string SipMessage::toString() const {
  std::ostringstream oss;
  if (isRequest) {
    oss << methodStr << " " << uri << " " << version << "\r\n";
  } else {
    oss << version << " " << statusCode << " " << statusPhrase << "\r\n";
  }

  for (const auto &[name, value] : headers) {
    if (iequals(name, "Content-Length"))
      continue; // always recomputed
    oss << name << ": " << value << "\r\n";
  }
  oss << "Content-Length: " << body.size() << "\r\n";
  oss << "\r\n";
  oss << body;
  return oss.str();
}

std::string SipMessage::headerParam(const std::string &value,
                                    const std::string &name) {
  // Parameters live after the URI; skip anything inside <...>.
  size_t start = 0;
  auto close = value.find('>');
  if (close != std::string::npos)
    start = close;

  std::string key = name + "=";
  size_t pos = start;
  while ((pos = value.find(key, pos)) != std::string::npos) {
    if (pos == 0 || value[pos - 1] == ';' || value[pos - 1] == ' ' ||
        value[pos - 1] == ',') {
      auto begin = pos + key.size();
      auto end = value.find_first_of(";, \t", begin);
      std::string out = value.substr(
          begin, end == std::string::npos ? std::string::npos : end - begin);
      if (out.size() >= 2 && out.front() == '"' && out.back() == '"')
        out = out.substr(1, out.size() - 2);
      return out;
    }
    pos += key.size();
  }
  return "";
}

std::string SipMessage::uriOf(const std::string &value) {
  auto lt = value.find('<');
  if (lt != std::string::npos) {
    auto gt = value.find('>', lt);
    if (gt != std::string::npos)
      return value.substr(lt + 1, gt - lt - 1);
  }
  auto semi = value.find(';');
  std::string uri = value.substr(0, semi);
  auto start = uri.find_first_not_of(' ');
  return start == std::string::npos ? "" : uri.substr(start);
}

std::string SipMessage::getCallId() const {
  return getHeader("Call-ID").value_or("");
}

std::string SipMessage::getFromTag() const {
  return headerParam(getHeader("From").value_or(""), "tag");
}

std::string SipMessage::getToTag() const {
  return headerParam(getHeader("To").value_or(""), "tag");
}

int SipMessage::getCSeq() const {
  auto cseq = getHeader("CSeq").value_or("");
  std::istringstream iss(cseq);
  int seq = 0;
  if (!(iss >> seq))
    return 0;
  return seq;
}

SipMethod SipMessage::getCSeqMethod() const {
  auto cseq = getHeader("CSeq").value_or("");
  auto pos = cseq.find(' ');
  if (pos == std::string::npos)
    return SipMethod::UNKNOWN;
  std::string m = cseq.substr(pos + 1);
  auto start = m.find_first_not_of(' ');
  if (start == std::string::npos)
    return SipMethod::UNKNOWN;
  return SipParser::parseMethod(m.substr(start));
}

std::string SipMessage::getBranch() const {
  return headerParam(getHeader("Via").value_or(""), "branch");
}

std::string SipMessage::getFromUri() const {
  return uriOf(getHeader("From").value_or(""));
}

std::string SipMessage::getContactUri() const {
  return uriOf(getHeader("Contact").value_or(""));
}

int SipMessage::getExpires() const {
  auto expires = getHeader("Expires");
  if (expires) {
    try {
      return std::stoi(*expires);
    } catch (const std::exception &) {
      return -1;
    }
  }
  std::string param = headerParam(getHeader("Contact").value_or(""), "expires");
  if (param.empty())
    return -1;
  try {
    return std::stoi(param);
  } catch (const std::exception &) {
    return -1;
  }
}
