#include <catch2/catch.hpp>

#include "sdp/SdpAnswer.h"
#include "sdp/SdpParser.h"

namespace {

const std::string kOffer = "v=0\r\n"
                           "o=- 1 1 IN IP4 10.0.0.1\r\n"
                           "s=call\r\n"
                           "c=IN IP4 10.0.0.1\r\n"
                           "t=0 0\r\n"
                           "m=audio 40000 RTP/AVP 8 0 101\r\n"
                           "c=IN IP4 10.0.0.9\r\n"
                           "a=rtpmap:8 PCMA/8000\r\n"
                           "a=rtpmap:0 PCMU/8000\r\n"
                           "a=rtpmap:101 telephone-event/8000\r\n"
                           "a=sendrecv\r\n";

} // namespace

TEST_CASE("Offer parsing finds the audio stream", "[sdp]") {
  auto offer = SdpParser::parse(kOffer);
  REQUIRE(offer.has_value());
  const SdpMedia *audio = offer->audio();
  REQUIRE(audio != nullptr);
  CHECK(audio->port == 40000);
  CHECK(audio->payloadTypes == std::vector<int>{8, 0, 101});
  CHECK(offer->connectionIp == "10.0.0.1");
  CHECK(offer->audioAddress() == "10.0.0.9");
  CHECK(offer->rtpMap.at(101) == "telephone-event");
}

TEST_CASE("SDP without media is rejected", "[sdp]") {
  CHECK_FALSE(SdpParser::parse("v=0\r\ns=x\r\n").has_value());
}

TEST_CASE("Negotiation follows our preference, not the offer order",
          "[sdp]") {
  auto offer = SdpParser::parse(kOffer);
  REQUIRE(offer.has_value());

  NegotiatedCodec codec;
  REQUIRE(SdpAnswer::negotiate(*offer, {"PCMU", "PCMA"}, codec));
  CHECK(codec.payloadType == 0);
  CHECK(codec.name == "PCMU");

  REQUIRE(SdpAnswer::negotiate(*offer, {"PCMA", "PCMU"}, codec));
  CHECK(codec.payloadType == 8);
}

TEST_CASE("Static payload types need no rtpmap", "[sdp]") {
  auto offer = SdpParser::parse("v=0\r\nc=IN IP4 1.2.3.4\r\n"
                                "m=audio 5000 RTP/AVP 0\r\n");
  REQUIRE(offer.has_value());
  NegotiatedCodec codec;
  REQUIRE(SdpAnswer::negotiate(*offer, {"PCMA", "PCMU"}, codec));
  CHECK(codec.name == "PCMU");
}

TEST_CASE("No common codec means no answer", "[sdp]") {
  auto offer = SdpParser::parse("v=0\r\nc=IN IP4 1.2.3.4\r\n"
                                "m=audio 5000 RTP/AVP 9\r\n"
                                "a=rtpmap:9 G722/8000\r\n");
  REQUIRE(offer.has_value());
  NegotiatedCodec codec;
  CHECK_FALSE(SdpAnswer::negotiate(*offer, {"PCMU", "PCMA"}, codec));
  CHECK(SdpAnswer::generate(*offer, "10.0.0.5", 20000, {"PCMU", "PCMA"},
                            codec)
            .empty());
}

TEST_CASE("Answer advertises our address, port and the chosen codec",
          "[sdp]") {
  auto offer = SdpParser::parse(kOffer);
  REQUIRE(offer.has_value());
  NegotiatedCodec codec;
  std::string answer = SdpAnswer::generate(*offer, "10.0.0.5", 20002,
                                           {"PCMU", "PCMA"}, codec, 20);
  CHECK(answer.find("c=IN IP4 10.0.0.5\r\n") != std::string::npos);
  CHECK(answer.find("m=audio 20002 RTP/AVP 0\r\n") != std::string::npos);
  CHECK(answer.find("a=rtpmap:0 PCMU/8000\r\n") != std::string::npos);
  CHECK(answer.find("a=ptime:20\r\n") != std::string::npos);

  auto parsed = SdpParser::parse(answer);
  REQUIRE(parsed.has_value());
  CHECK(parsed->audio()->port == 20002);
}
