#pragma once

#include "../telephony/TelephonyEngine.h"
#include "RtpPacket.h"
#include <atomic>
#include <mutex>
#include <netinet/in.h>
#include <string>
#include <thread>

// Media of one call: a UDP socket, a receive thread feeding decoded PCM to
// the MediaPort, and a paced send thread pulling one frame per interval.
class RtpStream {
public:
  RtpStream(MediaPort &media, int payloadType, int frameMs = 20,
            int sampleRate = 8000);
  ~RtpStream();

  RtpStream(const RtpStream &) = delete;
  RtpStream &operator=(const RtpStream &) = delete;

  // Binds the first free even port of the range.
  bool open(const std::string &bindIp, int portStart, int portEnd);
  void setRemote(const sockaddr_in &remote);
  void setPayloadType(int payloadType) { payloadType_ = payloadType; }

  bool start();
  void stop();

  int localPort() const { return localPort_; }
  uint64_t packetsReceived() const { return packetsReceived_; }
  uint64_t packetsSent() const { return packetsSent_; }

private:
  void receiveLoop();
  void sendLoop();
  void handlePacket(RtpPacket &pkt, const sockaddr_in &sender);

  MediaPort &media_;
  std::atomic<int> payloadType_;
  const int frameMs_;
  const int samplesPerFrame_;

  int socketFd_ = -1;
  int localPort_ = 0;

  std::mutex remoteMutex_;
  sockaddr_in remote_{};
  bool haveRemote_ = false;
  bool latched_ = false;

  std::atomic<bool> running_{false};
  std::thread receiveThread_;
  std::thread sendThread_;

  // RTP Stream State
  uint32_t ssrc_ = 0;
  uint32_t outgoingTimestamp_ = 0;
  uint16_t outgoingSeq_ = 0;

  std::atomic<uint64_t> packetsReceived_{0};
  std::atomic<uint64_t> packetsSent_{0};
};
