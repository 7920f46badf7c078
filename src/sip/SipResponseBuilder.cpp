#include "SipResponseBuilder.h"
#include "SipConstants.h"

SipMessage SipResponseBuilder::createResponse(const SipMessage &req, int code,
                                              const std::string &phrase,
                                              const std::string &localTag) {
  SipMessage res;
  res.isRequest = false;
  res.version = "SIP/2.0";
  res.statusCode = code;
  res.statusPhrase = phrase.empty() ? defaultPhrase(code) : phrase;

  for (const auto &via : req.getHeaders("Via"))
    res.addHeader("Via", via);

  auto from = req.getHeader("From");
  if (from)
    res.addHeader("From", *from);

  auto to = req.getHeader("To");
  if (to) {
    std::string toVal = *to;
    if (code > 100 && !localTag.empty() && req.getToTag().empty())
      toVal += ";tag=" + localTag;
    res.addHeader("To", toVal);
  }

  auto callId = req.getHeader("Call-ID");
  if (callId)
    res.addHeader("Call-ID", *callId);

  auto cseq = req.getHeader("CSeq");
  if (cseq)
    res.addHeader("CSeq", *cseq);

  res.addHeader(SipConstants::HDR_USER_AGENT, SipConstants::USER_AGENT);
  return res;
}

const char *SipResponseBuilder::defaultPhrase(int code) {
  switch (code) {
  case SipConstants::TRYING:
    return "Trying";
  case SipConstants::RINGING:
    return "Ringing";
  case SipConstants::OK:
    return "OK";
  case SipConstants::BAD_REQUEST:
    return "Bad Request";
  case SipConstants::CALL_DOES_NOT_EXIST:
    return "Call/Transaction Does Not Exist";
  case SipConstants::BUSY_HERE:
    return "Busy Here";
  case SipConstants::REQUEST_TERMINATED:
    return "Request Terminated";
  case SipConstants::NOT_ACCEPTABLE:
    return "Not Acceptable Here";
  case SipConstants::INTERNAL_SERVER_ERROR:
    return "Internal Server Error";
  case SipConstants::NOT_IMPLEMENTED:
    return "Not Implemented";
  case SipConstants::DECLINE:
    return "Decline";
  default:
    return "Unknown";
  }
}
