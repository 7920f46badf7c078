#pragma once

#include "../app/Config.h"
#include "../rtp/RtpStream.h"
#include "../sdp/SdpAnswer.h"
#include "../sdp/SdpParser.h"
#include "../telephony/TelephonyEngine.h"
#include "DigestAuth.h"
#include "SipDialog.h"
#include "SipMessage.h"
#include "SipTransaction.h"
#include "SipTransport.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

// SIP user agent for a single extension: registers with the PBX and
// accepts one inbound call at a time over UDP. Everything runs on one
// event thread; answer()/hangup()/stop() hand work to it.
class SipUserAgent : public TelephonyEngine {
public:
  using Clock = std::chrono::steady_clock;

  SipUserAgent(const SipConfig &sip, const RtpConfig &rtp,
               const AudioConfig &audio);
  ~SipUserAgent() override;

  bool start(TelephonyListener *listener, MediaPort *media) override;
  void stop() override;
  bool isRegistered() const override { return registered_; }

  bool answer(const std::string &callId, int statusCode = 200) override;
  bool hangup(const std::string &callId) override;

  int localSipPort() const;
  const std::string &localIp() const { return localIp_; }

private:
  // Client side retransmission (RFC 3261 timers E/F, and G for 2xx).
  struct Retransmit {
    SipMessage msg;
    sockaddr_in dest{};
    Clock::time_point next;
    Clock::time_point deadline;
    std::chrono::milliseconds interval{500};
    bool active = false;

    void arm(const SipMessage &m, const sockaddr_in &to);
  };

  struct ActiveCall {
    std::unique_ptr<SipDialog> dialog;
    SipMessage invite;
    sockaddr_in inviteSource{};
    std::shared_ptr<SipTransaction> inviteTx;
    SdpSession offer;
    NegotiatedCodec codec;
    std::string sdpAnswer;
    std::unique_ptr<RtpStream> rtp;
    bool answered = false;
    Retransmit okRetransmit;
  };

  void eventLoop();
  void post(std::function<void()> task);
  void runPosted();
  void onTimer(Clock::time_point now);

  void handleMessage(const SipMessage &msg, const sockaddr_in &sender);
  void handleRequest(const SipMessage &req, const sockaddr_in &sender);
  void handleResponse(const SipMessage &res);

  void onInvite(const SipMessage &req, const sockaddr_in &sender,
                const std::shared_ptr<SipTransaction> &tx);
  void onReInvite(const SipMessage &req, const sockaddr_in &sender,
                  const std::shared_ptr<SipTransaction> &tx);
  void onAck(const SipMessage &req);
  void onBye(const SipMessage &req, const sockaddr_in &sender,
             const std::shared_ptr<SipTransaction> &tx);
  void onCancel(const SipMessage &req, const sockaddr_in &sender,
                const std::shared_ptr<SipTransaction> &tx);

  void doAnswer(const std::string &callId, int statusCode);
  void doHangup(const std::string &callId);
  void beginShutdown();

  // Registration
  void sendRegister(int expires);
  void onRegisterResponse(const SipMessage &res);
  void registrationFailed(int code, const std::string &reason);
  void finishShutdown();

  // Helpers
  SipMessage respond(const SipMessage &req, const sockaddr_in &dest,
                     const std::shared_ptr<SipTransaction> &tx, int code,
                     const std::string &phrase = "",
                     const std::string &localTag = "");
  SipMessage buildOk(const SipMessage &req, const std::string &sdp);
  void endCall(const std::string &reason);
  void fireCallState(const std::string &callId, CallState state,
                     const std::string &remoteUri);
  std::string newVia() const;
  std::string contactHeader() const;
  std::string accountHeader() const;

  const SipConfig sip_;
  const RtpConfig rtp_;
  const AudioConfig audio_;

  TelephonyListener *listener_ = nullptr;
  MediaPort *media_ = nullptr;

  std::unique_ptr<SipTransport> transport_;
  sockaddr_in registrar_{};
  std::string localIp_;

  std::thread thread_;
  std::atomic<bool> running_{false};
  std::mutex postMutex_;
  std::deque<std::function<void()>> posted_;

  // Event thread only below this line
  std::map<std::string, std::shared_ptr<SipTransaction>> transactions_;
  std::unique_ptr<ActiveCall> call_;
  Retransmit byeRetransmit_;

  std::string regCallId_;
  std::string regFromTag_;
  int regCSeq_ = 0;
  int regAuthAttempts_ = 0;
  std::optional<DigestChallenge> challenge_;
  bool proxyChallenge_ = false;
  int nonceCount_ = 0;
  std::string cnonce_;
  Retransmit regRetransmit_;
  int requestedExpires_ = 0;
  bool unregistering_ = false;
  std::optional<Clock::time_point> refreshAt_;
  Clock::time_point expiresAt_;
  Clock::time_point lastCleanup_;

  std::atomic<bool> registered_{false};

  std::mutex shutdownMutex_;
  std::condition_variable shutdownCv_;
  bool shutdownDone_ = false;
};
