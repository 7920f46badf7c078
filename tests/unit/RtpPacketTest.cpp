#include <catch2/catch.hpp>

#include "rtp/RtpPacket.h"
#include <cstring>

TEST_CASE("Outgoing packets carry a 12-byte header", "[rtp]") {
  RtpPacket pkt;
  const uint8_t payload[] = {1, 2, 3, 4, 5};
  pkt.setHeader(8, 0xBEEF, 160000, 0x11223344, true);
  pkt.setPayload(payload, sizeof(payload));

  REQUIRE(pkt.size == 17);
  REQUIRE(pkt.parse(pkt.size));
  CHECK(pkt.getVersion() == 2);
  CHECK(pkt.getMarker());
  CHECK(pkt.getPayloadType() == 8);
  CHECK(pkt.getSequenceNumber() == 0xBEEF);
  CHECK(pkt.getTimestamp() == 160000);
  CHECK(pkt.getSsrc() == 0x11223344);
  REQUIRE(pkt.getPayloadSize() == 5);
  CHECK(std::memcmp(pkt.getPayload(), payload, 5) == 0);
}

TEST_CASE("CSRCs, extension and padding are skipped", "[rtp]") {
  RtpPacket pkt;
  const uint8_t raw[] = {
      0xB1, 0x00, 0x00, 0x01,             // V=2 P=1 X=1 CC=1, PT 0, seq 1
      0x00, 0x00, 0x00, 0xA0,             // ts 160
      0x00, 0x00, 0x00, 0x07,             // ssrc
      0xCA, 0xFE, 0xBA, 0xBE,             // csrc
      0xBE, 0xDE, 0x00, 0x01,             // extension, one word
      0x00, 0x00, 0x00, 0x00,             // extension data
      0x7F, 0x7E,                         // payload
      0x00, 0x00, 0x03};                  // padding, count 3
  std::memcpy(pkt.buffer, raw, sizeof(raw));

  REQUIRE(pkt.parse(sizeof(raw)));
  CHECK(pkt.getPayloadType() == 0);
  REQUIRE(pkt.getPayloadSize() == 2);
  CHECK(pkt.getPayload()[0] == 0x7F);
  CHECK(pkt.getPayload()[1] == 0x7E);
}

TEST_CASE("Non-RTP datagrams are rejected", "[rtp]") {
  RtpPacket pkt;
  std::memset(pkt.buffer, 0, 20);
  CHECK_FALSE(pkt.parse(8));  // too short
  CHECK_FALSE(pkt.parse(20)); // version 0

  pkt.buffer[0] = 0x8F; // 15 CSRCs announced, none present
  CHECK_FALSE(pkt.parse(20));
}
