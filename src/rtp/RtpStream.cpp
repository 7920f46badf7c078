#include "RtpStream.h"
#include "../app/Logger.h"
#include "../util/G711Utils.h"
#include "../util/Net.h"
#include <cerrno>
#include <chrono>
#include <cstring>
#include <poll.h>
#include <random>
#include <sys/socket.h>

RtpStream::RtpStream(MediaPort &media, int payloadType, int frameMs,
                     int sampleRate)
    : media_(media), payloadType_(payloadType), frameMs_(frameMs),
      samplesPerFrame_(sampleRate * frameMs / 1000) {
  std::random_device rd;
  std::mt19937 gen(rd());
  ssrc_ = gen();
  outgoingSeq_ = static_cast<uint16_t>(gen() & 0xFFFF);
  outgoingTimestamp_ = gen();
}

RtpStream::~RtpStream() {
  stop();
  Net::closeSocket(socketFd_);
}

bool RtpStream::open(const std::string &bindIp, int portStart, int portEnd) {
  static std::atomic<int> rotation{0};

  int first = portStart + (portStart % 2);
  int count = (portEnd - first) / 2 + 1;
  if (count <= 0) {
    LOG_ERROR("Empty RTP port range " << portStart << "-" << portEnd);
    return false;
  }

  int offset = rotation.fetch_add(1) % count;
  for (int i = 0; i < count; ++i) {
    int port = first + ((offset + i) % count) * 2;
    int fd = Net::createUdpSocket();
    if (fd < 0)
      return false;
    if (Net::bindSocket(fd, bindIp, port)) {
      Net::setNonBlocking(fd);
      socketFd_ = fd;
      localPort_ = port;
      LOG_DEBUG("RTP bound to " << bindIp << ":" << port);
      return true;
    }
    Net::closeSocket(fd);
  }

  LOG_ERROR("No free RTP port in " << portStart << "-" << portEnd);
  return false;
}

void RtpStream::setRemote(const sockaddr_in &remote) {
  std::lock_guard<std::mutex> lock(remoteMutex_);
  remote_ = remote;
  haveRemote_ = true;
  latched_ = false;
}

bool RtpStream::start() {
  if (socketFd_ < 0 || running_)
    return false;
  running_ = true;
  receiveThread_ = std::thread(&RtpStream::receiveLoop, this);
  sendThread_ = std::thread(&RtpStream::sendLoop, this);
  LOG_INFO("RTP stream started on port " << localPort_ << " (PT "
                                         << payloadType_ << ")");
  return true;
}

void RtpStream::stop() {
  if (!running_.exchange(false))
    return;
  if (receiveThread_.joinable())
    receiveThread_.join();
  if (sendThread_.joinable())
    sendThread_.join();
  LOG_INFO("RTP stream on port " << localPort_ << " stopped (rx "
                                 << packetsReceived_ << ", tx " << packetsSent_
                                 << ")");
}

void RtpStream::receiveLoop() {
  struct pollfd pfd;
  pfd.fd = socketFd_;
  pfd.events = POLLIN;

  while (running_) {
    pfd.revents = 0;
    int ret = ::poll(&pfd, 1, frameMs_);
    if (ret < 0) {
      if (errno != EINTR)
        LOG_ERROR("RTP poll error: " << strerror(errno));
      continue;
    }
    if (ret == 0)
      continue;

    while (running_) {
      RtpPacket pkt;
      sockaddr_in sender{};
      socklen_t len = sizeof(sender);
      ssize_t n = recvfrom(socketFd_, pkt.buffer, sizeof(pkt.buffer), 0,
                           (struct sockaddr *)&sender, &len);
      if (n <= 0)
        break;
      if (!pkt.parse(n))
        continue;
      handlePacket(pkt, sender);
    }
  }
}

void RtpStream::handlePacket(RtpPacket &pkt, const sockaddr_in &sender) {
  {
    // Symmetric RTP: answer to wherever the media actually comes from.
    std::lock_guard<std::mutex> lock(remoteMutex_);
    if (!latched_) {
      if (!haveRemote_ || !Net::sameEndpoint(remote_, sender))
        LOG_INFO("RTP latched to " << Net::ipFromSockAddr(sender) << ":"
                                   << Net::portFromSockAddr(sender));
      remote_ = sender;
      haveRemote_ = true;
      latched_ = true;
    }
  }

  int pt = pkt.getPayloadType();
  if (!G711Utils::isSupported(pt))
    return; // comfort noise, telephone-event ...

  packetsReceived_++;
  AudioChunk pcm = G711Utils::decode(pt, pkt.getPayload(), pkt.getPayloadSize());
  media_.onFrameReceived(pcm);
}

void RtpStream::sendLoop() {
  auto next = std::chrono::steady_clock::now();
  bool first = true;

  while (running_) {
    next += std::chrono::milliseconds(frameMs_);
    std::this_thread::sleep_until(next);
    if (!running_)
      break;

    // Fell behind (suspend, debugger): resync instead of bursting.
    auto now = std::chrono::steady_clock::now();
    if (now - next > std::chrono::milliseconds(frameMs_ * 5))
      next = now;

    AudioChunk frame = media_.requestFrame();
    int pt = payloadType_;
    std::vector<uint8_t> payload = G711Utils::encode(pt, frame);

    sockaddr_in dest;
    {
      std::lock_guard<std::mutex> lock(remoteMutex_);
      if (!haveRemote_)
        continue;
      dest = remote_;
    }

    RtpPacket pkt;
    pkt.setHeader(static_cast<uint8_t>(pt), outgoingSeq_++, outgoingTimestamp_,
                  ssrc_, first);
    pkt.setPayload(payload.data(), payload.size());
    outgoingTimestamp_ += samplesPerFrame_;
    first = false;

    ssize_t n = sendto(socketFd_, pkt.buffer, pkt.size, 0,
                       (struct sockaddr *)&dest, sizeof(dest));
    if (n < 0)
      LOG_DEBUG("RTP sendto failed: " << strerror(errno));
    else
      packetsSent_++;
  }
}
