#include "SipTransaction.h"

namespace {
// 64*T1
constexpr std::chrono::seconds kLinger{32};
} // namespace

SipTransaction::SipTransaction(const SipMessage &req)
    : key_(keyFor(req)), method_(req.method),
      lastActive_(std::chrono::steady_clock::now()) {}

std::string SipTransaction::keyFor(const SipMessage &req) {
  // CANCEL and ACK share the INVITE's branch; keep them apart by method.
  return req.getCallId() + ":" + req.getBranch() + ":" + req.methodStr;
}

void SipTransaction::sendResponse(const SipMessage &res) {
  lastActive_ = std::chrono::steady_clock::now();
  lastResponse_ = std::make_shared<SipMessage>(res);

  if (res.statusCode < 200) {
    state_ = TransactionState::PROCEEDING;
  } else if (isInviteTransaction() && res.statusCode < 300) {
    // 2xx retransmission is the dialog's job.
    state_ = TransactionState::TERMINATED;
  } else {
    state_ = TransactionState::COMPLETED;
  }
}

void SipTransaction::receiveAck() {
  lastActive_ = std::chrono::steady_clock::now();
  if (isInviteTransaction() && state_ == TransactionState::COMPLETED)
    state_ = TransactionState::CONFIRMED;
}

bool SipTransaction::isExpired(std::chrono::steady_clock::time_point now) const {
  return now - lastActive_ > kLinger;
}
