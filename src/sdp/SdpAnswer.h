#pragma once

#include "SdpParser.h"
#include <string>
#include <vector>

struct NegotiatedCodec {
  int payloadType = -1;
  std::string name;
  int rate = 8000;
};

class SdpAnswer {
public:
  // Picks the first codec of `preference` the offer contains. Empty string
  // when nothing matches.
  static std::string generate(const SdpSession &offer,
                              const std::string &localIp, int localPort,
                              const std::vector<std::string> &preference,
                              NegotiatedCodec &outCodec, int ptimeMs = 20);

  static bool negotiate(const SdpSession &offer,
                        const std::vector<std::string> &preference,
                        NegotiatedCodec &outCodec);
};
