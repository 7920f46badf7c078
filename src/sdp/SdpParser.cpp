#include "SdpParser.h"
#include <sstream>

static std::string trim(const std::string &s) {
  auto start = s.find_first_not_of(" \t\r\n");
  auto end = s.find_last_not_of(" \t\r\n");
  if (start == std::string::npos)
    return "";
  return s.substr(start, end - start + 1);
}

static std::string parseConnection(const std::string &value) {
  // c=IN IP4 1.2.3.4
  if (value.find("IN IP4") == std::string::npos)
    return "";
  auto pos = value.rfind(' ');
  if (pos == std::string::npos)
    return "";
  std::string ip = value.substr(pos + 1);
  auto slash = ip.find('/'); // multicast TTL
  return slash == std::string::npos ? ip : ip.substr(0, slash);
}

const SdpMedia *SdpSession::audio() const {
  for (const auto &m : media) {
    if (m.type == "audio" && m.port > 0)
      return &m;
  }
  return nullptr;
}

std::string SdpSession::audioAddress() const {
  const SdpMedia *m = audio();
  if (m && !m->connectionIp.empty())
    return m->connectionIp;
  return connectionIp;
}

std::optional<SdpSession> SdpParser::parse(const std::string &sdpBody) {
  SdpSession session;
  std::istringstream stream(sdpBody);
  std::string line;

  while (std::getline(stream, line)) {
    line = trim(line);
    if (line.size() < 2 || line[1] != '=')
      continue;
    char type = line[0];
    std::string value = line.substr(2);
    SdpMedia *current = session.media.empty() ? nullptr : &session.media.back();

    if (type == 'v')
      session.version = value;
    else if (type == 'o')
      session.origin = value;
    else if (type == 's')
      session.sessionName = value;
    else if (type == 'c') {
      std::string ip = parseConnection(value);
      if (current)
        current->connectionIp = ip;
      else
        session.connectionIp = ip;
    } else if (type == 'm') {
      // m=audio 12345 RTP/AVP 0 8 101
      std::istringstream mStream(value);
      SdpMedia m;
      if (!(mStream >> m.type >> m.port >> m.proto))
        continue;
      int pt;
      while (mStream >> pt)
        m.payloadTypes.push_back(pt);
      session.media.push_back(m);
    } else if (type == 'a') {
      if (value == "sendrecv" || value == "sendonly" || value == "recvonly" ||
          value == "inactive") {
        if (current)
          current->direction = value;
      } else if (value.rfind("rtpmap:", 0) == 0) {
        // a=rtpmap:0 PCMU/8000
        auto space = value.find(' ');
        if (space == std::string::npos)
          continue;
        int pt = 0;
        std::istringstream ptStream(value.substr(7, space - 7));
        if (!(ptStream >> pt))
          continue;
        std::string codec = value.substr(space + 1);
        auto slash = codec.find('/');
        if (slash != std::string::npos)
          codec = codec.substr(0, slash);
        session.rtpMap[pt] = codec;
      }
    }
  }

  if (session.media.empty())
    return std::nullopt;
  return session;
}
