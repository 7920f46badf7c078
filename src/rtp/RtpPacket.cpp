#include "RtpPacket.h"
#include <cstring>
#include <netinet/in.h>

bool RtpPacket::parse(size_t len) {
  size = len;
  headerSize_ = kFixedHeader;
  paddingSize_ = 0;
  if (size < kFixedHeader || getVersion() != 2)
    return false;

  size_t csrcCount = buffer[0] & 0x0F;
  headerSize_ += csrcCount * 4;

  bool extension = (buffer[0] >> 4) & 0x01;
  if (extension) {
    if (size < headerSize_ + 4)
      return false;
    uint16_t words;
    memcpy(&words, &buffer[headerSize_ + 2], 2);
    headerSize_ += 4 + static_cast<size_t>(ntohs(words)) * 4;
  }

  bool padding = (buffer[0] >> 5) & 0x01;
  if (padding && size > headerSize_)
    paddingSize_ = buffer[size - 1];

  return headerSize_ + paddingSize_ <= size;
}

uint8_t RtpPacket::getVersion() const {
  if (size < 1)
    return 0;
  return (buffer[0] >> 6) & 0x03;
}

bool RtpPacket::getMarker() const {
  if (size < 2)
    return false;
  return (buffer[1] >> 7) & 0x01;
}

uint8_t RtpPacket::getPayloadType() const {
  if (size < 2)
    return 0;
  return buffer[1] & 0x7F;
}

uint16_t RtpPacket::getSequenceNumber() const {
  if (size < 4)
    return 0;
  uint16_t seq;
  memcpy(&seq, &buffer[2], 2);
  return ntohs(seq);
}

uint32_t RtpPacket::getTimestamp() const {
  if (size < 8)
    return 0;
  uint32_t ts;
  memcpy(&ts, &buffer[4], 4);
  return ntohl(ts);
}

uint32_t RtpPacket::getSsrc() const {
  if (size < 12)
    return 0;
  uint32_t ssrc;
  memcpy(&ssrc, &buffer[8], 4);
  return ntohl(ssrc);
}

const uint8_t *RtpPacket::getPayload() const {
  if (size < headerSize_ + paddingSize_)
    return nullptr;
  return &buffer[headerSize_];
}

size_t RtpPacket::getPayloadSize() const {
  if (size < headerSize_ + paddingSize_)
    return 0;
  return size - headerSize_ - paddingSize_;
}

void RtpPacket::setHeader(uint8_t pt, uint16_t seq, uint32_t ts, uint32_t ssrc,
                          bool marker) {
  // V=2, P=0, X=0, CC=0
  buffer[0] = 0x80;
  buffer[1] = (marker ? 0x80 : 0x00) | (pt & 0x7F);

  uint16_t n_seq = htons(seq);
  memcpy(&buffer[2], &n_seq, 2);

  uint32_t n_ts = htonl(ts);
  memcpy(&buffer[4], &n_ts, 4);

  uint32_t n_ssrc = htonl(ssrc);
  memcpy(&buffer[8], &n_ssrc, 4);

  headerSize_ = kFixedHeader;
  paddingSize_ = 0;
  if (size < kFixedHeader)
    size = kFixedHeader;
}

void RtpPacket::setPayload(const uint8_t *data, size_t len) {
  if (len + kFixedHeader > sizeof(buffer))
    len = sizeof(buffer) - kFixedHeader;
  memcpy(&buffer[kFixedHeader], data, len);
  size = kFixedHeader + len;
}
