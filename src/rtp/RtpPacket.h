#pragma once

#include <cstddef>
#include <cstdint>

class RtpPacket {
public:
  static constexpr size_t kFixedHeader = 12;

  uint8_t buffer[1500]; // Max MTU usually
  size_t size = 0;

  // False when the datagram is not a well-formed RTP v2 packet.
  bool parse(size_t len);

  // Header accessors
  uint8_t getVersion() const;
  bool getMarker() const;
  uint8_t getPayloadType() const;
  uint16_t getSequenceNumber() const;
  uint32_t getTimestamp() const;
  uint32_t getSsrc() const;

  // Payload access, after CSRCs and header extension, minus padding
  const uint8_t *getPayload() const;
  size_t getPayloadSize() const;

  // Setters for outgoing
  void setHeader(uint8_t pt, uint16_t seq, uint32_t ts, uint32_t ssrc,
                 bool marker = false);
  void setPayload(const uint8_t *data, size_t len);

private:
  size_t headerSize_ = kFixedHeader;
  size_t paddingSize_ = 0;
};
