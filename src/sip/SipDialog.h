#pragma once

#include "SipMessage.h"
#include <netinet/in.h>
#include <string>
#include <vector>

enum class DialogState { EARLY, CONFIRMED, TERMINATED };

// UAS side of an INVITE dialog.
class SipDialog {
public:
  SipDialog(const SipMessage &invite, const std::string &localTag,
            const sockaddr_in &remoteAddr);

  std::string getCallId() const { return callId_; }
  std::string getRemoteTag() const { return remoteTag_; }
  std::string getLocalTag() const { return localTag_; }
  std::string getRemoteUri() const { return SipMessage::uriOf(remoteFrom_); }
  const sockaddr_in &getRemoteAddr() const { return remoteAddr_; }

  DialogState getState() const { return state_; }
  void setState(DialogState s) { state_ = s; }

  int getNextLocalSeq() { return ++localSeq_; }
  int getRemoteSeq() const { return remoteSeq_; }
  void updateRemoteSeq(int seq);
  // Target refresh from a re-INVITE.
  void updateRemoteTarget(const SipMessage &req);

  bool matches(const SipMessage &req) const;

  // New in-dialog request from us (BYE).
  SipMessage createRequest(SipMethod method, const std::string &via);

private:
  std::string callId_;
  std::string localTag_;
  std::string remoteTag_;
  std::string localTo_;    // To of the INVITE, our side
  std::string remoteFrom_; // From of the INVITE, the caller
  std::string remoteTarget_;
  std::vector<std::string> routeSet_;
  sockaddr_in remoteAddr_;
  DialogState state_ = DialogState::EARLY;

  int localSeq_ = 0;
  int remoteSeq_ = 0;
};
