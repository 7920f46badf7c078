#pragma once

#include "SipMessage.h"
#include <string>

class SipResponseBuilder {
public:
  // Mirrors Via/From/To/Call-ID/CSeq of the request. `localTag` is added to
  // To on non-100 responses when the request carried none.
  static SipMessage createResponse(const SipMessage &req, int code,
                                   const std::string &phrase,
                                   const std::string &localTag = "");

  static const char *defaultPhrase(int code);
};
