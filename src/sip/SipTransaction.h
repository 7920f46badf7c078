#pragma once

#include "SipMessage.h"
#include <chrono>
#include <memory>
#include <string>

enum class TransactionState {
  TRYING,
  PROCEEDING,
  COMPLETED,
  CONFIRMED, // For Invite
  TERMINATED
};

// Server transaction: remembers the last response so retransmitted
// requests can be answered without reprocessing them.
class SipTransaction {
public:
  explicit SipTransaction(const SipMessage &req);

  static std::string keyFor(const SipMessage &req);

  std::string getKey() const { return key_; }
  TransactionState getState() const { return state_; }

  void sendResponse(const SipMessage &res);
  void receiveAck();

  std::shared_ptr<SipMessage> getLastResponse() const { return lastResponse_; }
  bool isExpired(std::chrono::steady_clock::time_point now) const;

private:
  bool isInviteTransaction() const { return method_ == SipMethod::INVITE; }

  std::string key_;
  SipMethod method_;
  TransactionState state_ = TransactionState::TRYING;
  std::shared_ptr<SipMessage> lastResponse_;
  std::chrono::steady_clock::time_point lastActive_;
};
