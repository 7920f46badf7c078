#include "SdpAnswer.h"
#include "../app/Logger.h"
#include <chrono>
#include <sstream>

namespace {

std::string codecName(const SdpSession &offer, int pt) {
  auto it = offer.rtpMap.find(pt);
  if (it != offer.rtpMap.end())
    return it->second;
  // Static defaults
  if (pt == 0)
    return "PCMU";
  if (pt == 8)
    return "PCMA";
  return "";
}

} // namespace

bool SdpAnswer::negotiate(const SdpSession &offer,
                          const std::vector<std::string> &preference,
                          NegotiatedCodec &outCodec) {
  outCodec = NegotiatedCodec{};
  const SdpMedia *audio = offer.audio();
  if (!audio)
    return false;

  for (const auto &pref : preference) {
    for (int pt : audio->payloadTypes) {
      if (codecName(offer, pt) == pref) {
        outCodec.payloadType = pt;
        outCodec.name = pref;
        outCodec.rate = 8000;
        return true;
      }
    }
  }
  return false;
}

std::string SdpAnswer::generate(const SdpSession &offer,
                                const std::string &localIp, int localPort,
                                const std::vector<std::string> &preference,
                                NegotiatedCodec &outCodec, int ptimeMs) {
  if (!negotiate(offer, preference, outCodec)) {
    LOG_WARN("No matching codec found in offer");
    return "";
  }

  static const auto sessionId =
      std::chrono::system_clock::now().time_since_epoch().count() % 1000000000;

  std::ostringstream oss;
  oss << "v=0\r\n";
  oss << "o=- " << sessionId << " " << sessionId << " IN IP4 " << localIp
      << "\r\n";
  oss << "s=voice-gateway\r\n";
  oss << "c=IN IP4 " << localIp << "\r\n";
  oss << "t=0 0\r\n";
  oss << "m=audio " << localPort << " RTP/AVP " << outCodec.payloadType
      << "\r\n";
  oss << "a=rtpmap:" << outCodec.payloadType << " " << outCodec.name << "/"
      << outCodec.rate << "\r\n";
  oss << "a=ptime:" << ptimeMs << "\r\n";
  oss << "a=sendrecv\r\n";
  return oss.str();
}
