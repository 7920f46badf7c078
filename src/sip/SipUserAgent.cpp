#include "SipUserAgent.h"
#include "../app/Logger.h"
#include "../util/Net.h"
#include "SipConstants.h"
#include "SipParser.h"
#include "SipResponseBuilder.h"
#include <algorithm>
#include <cstdio>
#include <random>

namespace {

constexpr std::chrono::milliseconds T1{500};
constexpr std::chrono::milliseconds T2{4000};
constexpr std::chrono::milliseconds kTimerF{32000}; // 64*T1
constexpr std::chrono::seconds kUnregisterWait{2};
constexpr int kPollMs = 20;
constexpr int kMaxAuthAttempts = 2;

std::string randomToken(size_t hexChars) {
  thread_local std::mt19937 gen{std::random_device{}()};
  static const char *hex = "0123456789abcdef";
  std::string out;
  out.reserve(hexChars);
  for (size_t i = 0; i < hexChars; ++i)
    out.push_back(hex[gen() & 0x0F]);
  return out;
}

} // namespace

void SipUserAgent::Retransmit::arm(const SipMessage &m, const sockaddr_in &to) {
  msg = m;
  dest = to;
  interval = T1;
  next = Clock::now() + interval;
  deadline = Clock::now() + kTimerF;
  active = true;
}

SipUserAgent::SipUserAgent(const SipConfig &sip, const RtpConfig &rtp,
                           const AudioConfig &audio)
    : sip_(sip), rtp_(rtp), audio_(audio) {}

SipUserAgent::~SipUserAgent() { stop(); }

int SipUserAgent::localSipPort() const {
  return transport_ ? transport_->localPort() : 0;
}

bool SipUserAgent::start(TelephonyListener *listener, MediaPort *media) {
  if (running_)
    return false;
  listener_ = listener;
  media_ = media;

  if (!Net::resolve(sip_.server, sip_.port, registrar_)) {
    LOG_ERROR("Cannot resolve SIP server " << sip_.server);
    return false;
  }

  transport_ = std::make_unique<SipTransport>(sip_.bindIp, sip_.localPort);
  if (!transport_->start()) {
    transport_.reset();
    return false;
  }
  transport_->setMessageHandler(
      [this](const SipMessage &msg, const sockaddr_in &sender) {
        handleMessage(msg, sender);
      });

  localIp_ = sip_.publicIp;
  if (localIp_.empty())
    localIp_ = Net::localAddressFor(registrar_);
  if (localIp_.empty() || localIp_ == "0.0.0.0")
    localIp_ = sip_.bindIp;

  regCallId_ = randomToken(24) + "@" + localIp_;
  regFromTag_ = randomToken(10);
  regCSeq_ = 0;
  challenge_.reset();
  unregistering_ = false;
  {
    std::lock_guard<std::mutex> lock(shutdownMutex_);
    shutdownDone_ = false;
  }
  lastCleanup_ = Clock::now();

  LOG_INFO("SIP account " << sip_.accountUri() << " via "
                          << Net::ipFromSockAddr(registrar_) << ":"
                          << sip_.port << ", local " << localIp_ << ":"
                          << transport_->localPort());

  running_ = true;
  thread_ = std::thread(&SipUserAgent::eventLoop, this);
  post([this] { sendRegister(sip_.registerExpires); });
  return true;
}

void SipUserAgent::stop() {
  if (!running_)
    return;

  post([this] { beginShutdown(); });
  {
    std::unique_lock<std::mutex> lock(shutdownMutex_);
    shutdownCv_.wait_for(lock, kUnregisterWait + std::chrono::seconds(1),
                         [this] { return shutdownDone_; });
  }

  running_ = false;
  if (thread_.joinable())
    thread_.join();

  if (call_) {
    // Shutdown timed out before the event thread got to it.
    if (call_->rtp)
      call_->rtp->stop();
    call_.reset();
  }
  transport_.reset();
  registered_ = false;
  LOG_INFO("SIP user agent stopped");
}

bool SipUserAgent::answer(const std::string &callId, int statusCode) {
  if (!running_)
    return false;
  post([this, callId, statusCode] { doAnswer(callId, statusCode); });
  return true;
}

bool SipUserAgent::hangup(const std::string &callId) {
  if (!running_)
    return false;
  post([this, callId] { doHangup(callId); });
  return true;
}

void SipUserAgent::post(std::function<void()> task) {
  std::lock_guard<std::mutex> lock(postMutex_);
  posted_.push_back(std::move(task));
}

void SipUserAgent::runPosted() {
  std::deque<std::function<void()>> tasks;
  {
    std::lock_guard<std::mutex> lock(postMutex_);
    tasks.swap(posted_);
  }
  for (auto &task : tasks)
    task();
}

void SipUserAgent::eventLoop() {
  LOG_DEBUG("SIP event thread started");
  while (running_) {
    try {
      transport_->poll(kPollMs);
      runPosted();
      onTimer(Clock::now());
    } catch (const std::exception &e) {
      LOG_ERROR("SIP event thread error: " << e.what());
    }
  }
  LOG_DEBUG("SIP event thread ended");
}

void SipUserAgent::onTimer(Clock::time_point now) {
  // REGISTER retransmission / timeout
  if (regRetransmit_.active) {
    if (now >= regRetransmit_.deadline) {
      regRetransmit_.active = false;
      if (unregistering_) {
        LOG_WARN("No answer to un-REGISTER");
        finishShutdown();
      } else {
        registrationFailed(408, "Request Timeout");
      }
    } else if (now >= regRetransmit_.next) {
      transport_->send(regRetransmit_.msg, regRetransmit_.dest);
      regRetransmit_.interval = std::min(regRetransmit_.interval * 2, T2);
      regRetransmit_.next = now + regRetransmit_.interval;
    }
  }

  if (refreshAt_ && now >= *refreshAt_ && !regRetransmit_.active) {
    refreshAt_.reset();
    LOG_DEBUG("Refreshing SIP registration");
    sendRegister(sip_.registerExpires);
  }

  if (registered_ && !unregistering_ && now >= expiresAt_) {
    registrationFailed(408, "Registration expired");
  }

  // 2xx to INVITE until ACK
  if (call_ && call_->okRetransmit.active) {
    auto &rt = call_->okRetransmit;
    if (now >= rt.deadline) {
      rt.active = false;
      LOG_WARN("No ACK for 200 OK on call " << call_->dialog->getCallId());
    } else if (now >= rt.next) {
      transport_->send(rt.msg, rt.dest);
      rt.interval = std::min(rt.interval * 2, T2);
      rt.next = now + rt.interval;
    }
  }

  if (byeRetransmit_.active) {
    if (now >= byeRetransmit_.deadline) {
      byeRetransmit_.active = false;
    } else if (now >= byeRetransmit_.next) {
      transport_->send(byeRetransmit_.msg, byeRetransmit_.dest);
      byeRetransmit_.interval = std::min(byeRetransmit_.interval * 2, T2);
      byeRetransmit_.next = now + byeRetransmit_.interval;
    }
  }

  if (now - lastCleanup_ > std::chrono::seconds(5)) {
    lastCleanup_ = now;
    for (auto it = transactions_.begin(); it != transactions_.end();) {
      if (it->second->isExpired(now))
        it = transactions_.erase(it);
      else
        ++it;
    }
  }
}

void SipUserAgent::handleMessage(const SipMessage &msg,
                                 const sockaddr_in &sender) {
  if (msg.getCallId().empty()) {
    LOG_WARN("Dropping SIP message without Call-ID");
    return;
  }
  if (msg.isRequest)
    handleRequest(msg, sender);
  else
    handleResponse(msg);
}

void SipUserAgent::handleRequest(const SipMessage &req,
                                 const sockaddr_in &sender) {
  if (req.method == SipMethod::ACK) {
    onAck(req);
    return;
  }

  std::string key = SipTransaction::keyFor(req);
  auto it = transactions_.find(key);
  if (it != transactions_.end()) {
    auto res = it->second->getLastResponse();
    if (res) {
      LOG_DEBUG("Retransmission of " << req.methodStr << ", resending "
                                     << res->statusCode);
      transport_->send(*res, sender);
    }
    return;
  }

  auto tx = std::make_shared<SipTransaction>(req);
  transactions_[key] = tx;

  switch (req.method) {
  case SipMethod::INVITE:
    if (!req.getToTag().empty())
      onReInvite(req, sender, tx);
    else
      onInvite(req, sender, tx);
    break;
  case SipMethod::BYE:
    onBye(req, sender, tx);
    break;
  case SipMethod::CANCEL:
    onCancel(req, sender, tx);
    break;
  case SipMethod::OPTIONS: {
    SipMessage res = SipResponseBuilder::createResponse(req, SipConstants::OK,
                                                        "OK", randomToken(8));
    res.addHeader(SipConstants::HDR_ALLOW, SipConstants::ALLOW_METHODS);
    res.addHeader("Accept", "application/sdp");
    tx->sendResponse(res);
    transport_->send(res, sender);
    break;
  }
  default:
    LOG_INFO("Unsupported SIP method " << req.methodStr);
    respond(req, sender, tx, SipConstants::NOT_IMPLEMENTED);
    break;
  }
}

void SipUserAgent::onInvite(const SipMessage &req, const sockaddr_in &sender,
                            const std::shared_ptr<SipTransaction> &tx) {
  if (call_) {
    if (call_->dialog->getCallId() == req.getCallId())
      return; // new branch of the same INVITE, already handled
    LOG_WARN("Rejecting call " << req.getCallId() << ": busy with "
                               << call_->dialog->getCallId());
    respond(req, sender, tx, SipConstants::BUSY_HERE, "", randomToken(8));
    return;
  }

  respond(req, sender, tx, SipConstants::TRYING);

  auto offer = SdpParser::parse(req.body);
  NegotiatedCodec codec;
  if (!offer || !offer->audio() ||
      !SdpAnswer::negotiate(*offer, sip_.codecPreference(), codec)) {
    LOG_WARN("INVITE " << req.getCallId() << " has no usable audio offer");
    respond(req, sender, tx, SipConstants::NOT_ACCEPTABLE, "", randomToken(8));
    return;
  }

  auto call = std::make_unique<ActiveCall>();
  call->dialog = std::make_unique<SipDialog>(req, randomToken(10), sender);
  call->invite = req;
  call->inviteSource = sender;
  call->inviteTx = tx;
  call->offer = *offer;
  call->codec = codec;
  call_ = std::move(call);

  respond(req, sender, tx, SipConstants::RINGING, "",
          call_->dialog->getLocalTag());

  std::string remoteUri = call_->dialog->getRemoteUri();
  LOG_INFO("Incoming call " << req.getCallId() << " from " << remoteUri
                            << " (" << codec.name << ")");
  fireCallState(req.getCallId(), CallState::Ringing, remoteUri);
}

void SipUserAgent::onReInvite(const SipMessage &req, const sockaddr_in &sender,
                              const std::shared_ptr<SipTransaction> &tx) {
  if (!call_ || !call_->dialog->matches(req)) {
    respond(req, sender, tx, SipConstants::CALL_DOES_NOT_EXIST);
    return;
  }
  if (!call_->answered) {
    respond(req, sender, tx, SipConstants::INTERNAL_SERVER_ERROR);
    return;
  }

  call_->dialog->updateRemoteSeq(req.getCSeq());
  call_->dialog->updateRemoteTarget(req);

  if (!req.body.empty()) {
    auto offer = SdpParser::parse(req.body);
    NegotiatedCodec codec;
    if (!offer || !offer->audio() ||
        !SdpAnswer::negotiate(*offer, sip_.codecPreference(), codec)) {
      respond(req, sender, tx, SipConstants::NOT_ACCEPTABLE);
      return;
    }
    call_->offer = *offer;
    if (codec.payloadType != call_->codec.payloadType) {
      LOG_INFO("Re-INVITE switches codec to " << codec.name);
      call_->codec = codec;
      call_->rtp->setPayloadType(codec.payloadType);
      call_->sdpAnswer =
          SdpAnswer::generate(*offer, localIp_, call_->rtp->localPort(),
                              sip_.codecPreference(), codec, audio_.frameMs);
    }
    sockaddr_in remote{};
    if (Net::resolve(offer->audioAddress(), offer->audio()->port, remote))
      call_->rtp->setRemote(remote);
  }

  SipMessage ok = buildOk(req, call_->sdpAnswer);
  tx->sendResponse(ok);
  transport_->send(ok, sender);
  call_->okRetransmit.arm(ok, sender);

  LOG_INFO("Re-INVITE on call " << req.getCallId() << " answered");
  fireCallState(req.getCallId(), CallState::MediaActive,
                call_->dialog->getRemoteUri());
}

void SipUserAgent::onAck(const SipMessage &req) {
  auto it = transactions_.find(req.getCallId() + ":" + req.getBranch() +
                               ":INVITE");
  if (it != transactions_.end())
    it->second->receiveAck();

  if (call_ && call_->dialog->getCallId() == req.getCallId() &&
      call_->answered) {
    call_->okRetransmit.active = false;
    if (call_->dialog->getState() != DialogState::CONFIRMED) {
      call_->dialog->setState(DialogState::CONFIRMED);
      LOG_DEBUG("Call " << req.getCallId() << " confirmed by ACK");
    }
  }
}

void SipUserAgent::onBye(const SipMessage &req, const sockaddr_in &sender,
                         const std::shared_ptr<SipTransaction> &tx) {
  if (!call_ || !call_->dialog->matches(req)) {
    respond(req, sender, tx, SipConstants::CALL_DOES_NOT_EXIST);
    return;
  }
  respond(req, sender, tx, SipConstants::OK);
  LOG_INFO("Remote party hung up call " << req.getCallId());
  endCall("BYE received");
}

void SipUserAgent::onCancel(const SipMessage &req, const sockaddr_in &sender,
                            const std::shared_ptr<SipTransaction> &tx) {
  if (!call_ || call_->dialog->getCallId() != req.getCallId()) {
    respond(req, sender, tx, SipConstants::CALL_DOES_NOT_EXIST);
    return;
  }
  respond(req, sender, tx, SipConstants::OK);
  if (call_->answered)
    return; // too late, a BYE will follow

  respond(call_->invite, call_->inviteSource, call_->inviteTx,
          SipConstants::REQUEST_TERMINATED, "", call_->dialog->getLocalTag());
  LOG_INFO("Caller cancelled call " << req.getCallId());
  endCall("CANCEL received");
}

void SipUserAgent::doAnswer(const std::string &callId, int statusCode) {
  if (!call_ || call_->dialog->getCallId() != callId) {
    LOG_WARN("Cannot answer call " << callId << ": no such call");
    return;
  }
  if (call_->answered) {
    LOG_DEBUG("Call " << callId << " already answered");
    return;
  }

  if (statusCode > 100 && statusCode < 200) {
    respond(call_->invite, call_->inviteSource, call_->inviteTx, statusCode,
            "", call_->dialog->getLocalTag());
    return;
  }
  if (statusCode >= 300) {
    respond(call_->invite, call_->inviteSource, call_->inviteTx, statusCode,
            "", call_->dialog->getLocalTag());
    endCall("rejected locally");
    return;
  }

  auto rtp = std::make_unique<RtpStream>(*media_, call_->codec.payloadType,
                                         audio_.frameMs, audio_.telephonyRate);
  if (!rtp->open(sip_.bindIp, rtp_.portStart, rtp_.portEnd)) {
    respond(call_->invite, call_->inviteSource, call_->inviteTx,
            SipConstants::INTERNAL_SERVER_ERROR, "No RTP ports",
            call_->dialog->getLocalTag());
    endCall("no RTP port");
    return;
  }

  sockaddr_in remote{};
  if (Net::resolve(call_->offer.audioAddress(), call_->offer.audio()->port,
                   remote))
    rtp->setRemote(remote);
  else
    LOG_WARN("Offer has no usable media address, waiting for first packet");

  NegotiatedCodec codec;
  call_->sdpAnswer =
      SdpAnswer::generate(call_->offer, localIp_, rtp->localPort(),
                          sip_.codecPreference(), codec, audio_.frameMs);
  call_->rtp = std::move(rtp);
  call_->rtp->start();

  SipMessage ok = buildOk(call_->invite, call_->sdpAnswer);
  call_->inviteTx->sendResponse(ok);
  transport_->send(ok, call_->inviteSource);
  call_->okRetransmit.arm(ok, call_->inviteSource);
  call_->answered = true;

  LOG_INFO("Answered call " << callId << " (" << call_->codec.name
                            << ", RTP port " << call_->rtp->localPort() << ")");
  fireCallState(callId, CallState::MediaActive, call_->dialog->getRemoteUri());
}

void SipUserAgent::doHangup(const std::string &callId) {
  if (!call_ || call_->dialog->getCallId() != callId) {
    LOG_DEBUG("Hangup for unknown call " << callId);
    return;
  }

  if (call_->answered) {
    SipMessage bye = call_->dialog->createRequest(SipMethod::BYE, newVia());
    bye.addHeader(SipConstants::HDR_USER_AGENT, SipConstants::USER_AGENT);
    transport_->send(bye, call_->dialog->getRemoteAddr());
    byeRetransmit_.arm(bye, call_->dialog->getRemoteAddr());
  } else {
    respond(call_->invite, call_->inviteSource, call_->inviteTx,
            SipConstants::DECLINE, "", call_->dialog->getLocalTag());
  }
  endCall("local hangup");
}

void SipUserAgent::beginShutdown() {
  if (call_)
    doHangup(call_->dialog->getCallId());

  if (registered_ || regRetransmit_.active) {
    unregistering_ = true;
    refreshAt_.reset();
    sendRegister(0);
  } else {
    finishShutdown();
  }
}

void SipUserAgent::finishShutdown() {
  {
    std::lock_guard<std::mutex> lock(shutdownMutex_);
    shutdownDone_ = true;
  }
  shutdownCv_.notify_all();
}

void SipUserAgent::sendRegister(int expires) {
  requestedExpires_ = expires;

  SipMessage req = SipMessage::request(SipMethod::REGISTER, sip_.registrarUri());
  req.addHeader("Via", newVia());
  req.addHeader("Max-Forwards", "70");
  req.addHeader("From", accountHeader() + ";tag=" + regFromTag_);
  req.addHeader("To", accountHeader());
  req.addHeader("Call-ID", regCallId_);
  req.addHeader("CSeq", std::to_string(++regCSeq_) + " REGISTER");
  req.addHeader("Contact", contactHeader());
  req.addHeader(SipConstants::HDR_EXPIRES, std::to_string(expires));
  req.addHeader(SipConstants::HDR_ALLOW, SipConstants::ALLOW_METHODS);
  req.addHeader(SipConstants::HDR_USER_AGENT, SipConstants::USER_AGENT);

  if (challenge_) {
    std::string auth = DigestAuth::authorization(
        *challenge_, sip_.authId, sip_.password, "REGISTER",
        sip_.registrarUri(), ++nonceCount_, cnonce_);
    req.addHeader(proxyChallenge_ ? SipConstants::HDR_PROXY_AUTHORIZATION
                                  : SipConstants::HDR_AUTHORIZATION,
                  auth);
  }

  LOG_INFO((expires == 0 ? "Unregistering " : "Registering ")
           << sip_.accountUri() << " (CSeq " << regCSeq_ << ")");
  transport_->send(req, registrar_);
  regRetransmit_.arm(req, registrar_);
}

void SipUserAgent::handleResponse(const SipMessage &res) {
  if (res.getCallId() == regCallId_ &&
      res.getCSeqMethod() == SipMethod::REGISTER) {
    onRegisterResponse(res);
    return;
  }

  if (res.getCSeqMethod() == SipMethod::BYE) {
    if (byeRetransmit_.active && res.statusCode >= 200) {
      byeRetransmit_.active = false;
      LOG_DEBUG("BYE answered with " << res.statusCode);
    }
    return;
  }

  LOG_DEBUG("Ignoring response " << res.statusCode << " for "
                                 << res.getCallId());
}

void SipUserAgent::onRegisterResponse(const SipMessage &res) {
  if (res.getCSeq() != regCSeq_) {
    LOG_DEBUG("Stale REGISTER response (CSeq " << res.getCSeq() << ")");
    return;
  }
  if (res.statusCode < 200)
    return;
  regRetransmit_.active = false;

  if (res.statusCode == SipConstants::UNAUTHORIZED ||
      res.statusCode == SipConstants::PROXY_AUTH_REQUIRED) {
    bool proxy = res.statusCode == SipConstants::PROXY_AUTH_REQUIRED;
    auto header = res.getHeader(proxy ? SipConstants::HDR_PROXY_AUTHENTICATE
                                      : SipConstants::HDR_WWW_AUTHENTICATE);
    auto challenge = header ? DigestAuth::parseChallenge(*header) : std::nullopt;
    if (!challenge) {
      LOG_ERROR("Registrar sent " << res.statusCode
                                  << " without a usable digest challenge");
      registrationFailed(res.statusCode, res.statusPhrase);
      return;
    }

    if (regAuthAttempts_ >= kMaxAuthAttempts && !challenge->stale) {
      LOG_ERROR("Registrar rejected our credentials for " << sip_.authId);
      regAuthAttempts_ = 0;
      challenge_.reset();
      registrationFailed(res.statusCode, res.statusPhrase);
      return;
    }

    if (!challenge_ || challenge_->nonce != challenge->nonce) {
      nonceCount_ = 0;
      cnonce_ = randomToken(16);
    }
    challenge_ = challenge;
    proxyChallenge_ = proxy;
    regAuthAttempts_++;
    sendRegister(requestedExpires_);
    return;
  }

  regAuthAttempts_ = 0;

  if (unregistering_) {
    registered_ = false;
    LOG_INFO("Unregistered (" << res.statusCode << " " << res.statusPhrase
                              << ")");
    finishShutdown();
    return;
  }

  if (res.statusCode >= 300) {
    registrationFailed(res.statusCode, res.statusPhrase);
    return;
  }

  int granted = res.getExpires();
  if (granted <= 0)
    granted = requestedExpires_;
  auto now = Clock::now();
  int refreshIn = std::max(granted / 2, 1);
  if (granted - refreshIn < SipConstants::MIN_REFRESH_MARGIN)
    refreshIn = std::max(granted - SipConstants::MIN_REFRESH_MARGIN, 1);
  refreshAt_ = now + std::chrono::seconds(refreshIn);
  expiresAt_ = now + std::chrono::seconds(granted);

  bool wasRegistered = registered_.exchange(true);
  LOG_INFO("Registration " << (wasRegistered ? "refreshed" : "active")
                           << ", expires in " << granted << "s");
  if (!wasRegistered && listener_)
    listener_->onRegistrationState(true, res.statusCode, res.statusPhrase);
}

void SipUserAgent::registrationFailed(int code, const std::string &reason) {
  registered_ = false;
  refreshAt_.reset();
  LOG_WARN("Registration failed: " << code << " " << reason);
  if (listener_)
    listener_->onRegistrationState(false, code, reason);
}

SipMessage SipUserAgent::respond(const SipMessage &req,
                                 const sockaddr_in &dest,
                                 const std::shared_ptr<SipTransaction> &tx,
                                 int code, const std::string &phrase,
                                 const std::string &localTag) {
  SipMessage res =
      SipResponseBuilder::createResponse(req, code, phrase, localTag);
  if (tx)
    tx->sendResponse(res);
  transport_->send(res, dest);
  return res;
}

SipMessage SipUserAgent::buildOk(const SipMessage &req, const std::string &sdp) {
  SipMessage ok = SipResponseBuilder::createResponse(
      req, SipConstants::OK, "OK", call_->dialog->getLocalTag());
  ok.addHeader("Contact", contactHeader());
  ok.addHeader(SipConstants::HDR_ALLOW, SipConstants::ALLOW_METHODS);
  ok.addHeader(SipConstants::HDR_CONTENT_TYPE, "application/sdp");
  ok.body = sdp;
  return ok;
}

void SipUserAgent::endCall(const std::string &reason) {
  if (!call_)
    return;
  std::string callId = call_->dialog->getCallId();
  std::string remoteUri = call_->dialog->getRemoteUri();
  LOG_DEBUG("Releasing call " << callId << " (" << reason << ")");

  if (call_->rtp)
    call_->rtp->stop();
  call_->dialog->setState(DialogState::TERMINATED);
  call_.reset();

  fireCallState(callId, CallState::Ended, remoteUri);
}

void SipUserAgent::fireCallState(const std::string &callId, CallState state,
                                 const std::string &remoteUri) {
  if (listener_)
    listener_->onCallState(CallEvent{callId, state, remoteUri});
}

std::string SipUserAgent::newVia() const {
  return "SIP/2.0/UDP " + localIp_ + ":" +
         std::to_string(transport_->localPort()) +
         ";branch=" + SipConstants::BRANCH_MAGIC + randomToken(16) + ";rport";
}

std::string SipUserAgent::contactHeader() const {
  return "<sip:" + sip_.extension + "@" + localIp_ + ":" +
         std::to_string(transport_->localPort()) + ";transport=udp>";
}

std::string SipUserAgent::accountHeader() const {
  return "<" + sip_.accountUri() + ">";
}
