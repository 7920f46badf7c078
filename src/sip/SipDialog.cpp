#include "SipDialog.h"

SipDialog::SipDialog(const SipMessage &invite, const std::string &localTag,
                     const sockaddr_in &remoteAddr)
    : callId_(invite.getCallId()), localTag_(localTag),
      remoteTag_(invite.getFromTag()), remoteAddr_(remoteAddr) {
  localTo_ = invite.getHeader("To").value_or("");
  if (SipMessage::headerParam(localTo_, "tag").empty())
    localTo_ += ";tag=" + localTag_;
  remoteFrom_ = invite.getHeader("From").value_or("");
  remoteTarget_ = invite.getContactUri();
  if (remoteTarget_.empty())
    remoteTarget_ = invite.getFromUri();
  routeSet_ = invite.getHeaders("Record-Route");
  remoteSeq_ = invite.getCSeq();
}

void SipDialog::updateRemoteSeq(int seq) {
  if (seq > remoteSeq_)
    remoteSeq_ = seq;
}

void SipDialog::updateRemoteTarget(const SipMessage &req) {
  std::string contact = req.getContactUri();
  if (!contact.empty())
    remoteTarget_ = contact;
}

bool SipDialog::matches(const SipMessage &req) const {
  if (req.getCallId() != callId_)
    return false;
  std::string toTag = req.getToTag();
  return toTag.empty() || toTag == localTag_;
}

SipMessage SipDialog::createRequest(SipMethod method,
                                    const std::string &via) {
  SipMessage req = SipMessage::request(method, remoteTarget_);
  req.addHeader("Via", via);
  req.addHeader("Max-Forwards", "70");
  for (const auto &route : routeSet_)
    req.addHeader("Route", route);
  req.addHeader("From", localTo_);
  req.addHeader("To", remoteFrom_);
  req.addHeader("Call-ID", callId_);
  req.addHeader("CSeq", std::to_string(++localSeq_) + " " +
                            SipMessage::methodName(method));
  return req;
}
