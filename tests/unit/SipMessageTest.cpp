#include <catch2/catch.hpp>

#include "sip/SipDialog.h"
#include "sip/SipParser.h"
#include "sip/SipResponseBuilder.h"
#include "sip/SipTransaction.h"
#include <netinet/in.h>

namespace {

const std::string kInvite =
    "INVITE sip:1001@10.0.0.5:5060 SIP/2.0\r\n"
    "Via: SIP/2.0/UDP 10.0.0.1:5060;branch=z9hG4bK776asdhds;rport\r\n"
    "Max-Forwards: 70\r\n"
    "f: \"Alice\" <sip:alice@pbx.example.com>;tag=1928301774\r\n"
    "To: <sip:1001@pbx.example.com>\r\n"
    "i: a84b4c76e66710@pbx.example.com\r\n"
    "CSeq: 314159 INVITE\r\n"
    "Contact: <sip:alice@10.0.0.1:5060>\r\n"
    "Record-Route: <sip:pbx.example.com;lr>\r\n"
    "Subject: folded\r\n"
    " header value\r\n"
    "Content-Type: application/sdp\r\n"
    "content-length: 4\r\n"
    "\r\n"
    "v=0\r\nextra";

std::optional<SipMessage> parse(const std::string &text) {
  return SipParser::parse(text.data(), text.size());
}

} // namespace

TEST_CASE("Parser reads request line, headers and body", "[sip]") {
  auto msg = parse(kInvite);
  REQUIRE(msg.has_value());
  CHECK(msg->isRequest);
  CHECK(msg->method == SipMethod::INVITE);
  CHECK(msg->uri == "sip:1001@10.0.0.5:5060");

  // Compact forms are expanded and lookups ignore case.
  CHECK(msg->getCallId() == "a84b4c76e66710@pbx.example.com");
  CHECK(msg->getHeader("from").has_value());
  CHECK(msg->getFromTag() == "1928301774");
  CHECK(msg->getToTag().empty());
  CHECK(msg->getFromUri() == "sip:alice@pbx.example.com");
  CHECK(msg->getContactUri() == "sip:alice@10.0.0.1:5060");
  CHECK(msg->getBranch() == "z9hG4bK776asdhds");
  CHECK(msg->getCSeq() == 314159);
  CHECK(msg->getCSeqMethod() == SipMethod::INVITE);
  CHECK(*msg->getHeader("Subject") == "folded header value");

  // Content-Length bounds the body.
  CHECK(msg->body == "v=0\r");
}

TEST_CASE("Parser reads a status line", "[sip]") {
  auto msg = parse("SIP/2.0 401 Unauthorized\r\n"
                   "Call-ID: abc\r\n"
                   "CSeq: 2 REGISTER\r\n"
                   "Contact: <sip:1001@10.0.0.5>;expires=120\r\n"
                   "\r\n");
  REQUIRE(msg.has_value());
  CHECK_FALSE(msg->isRequest);
  CHECK(msg->statusCode == 401);
  CHECK(msg->statusPhrase == "Unauthorized");
  CHECK(msg->getCSeqMethod() == SipMethod::REGISTER);
  CHECK(msg->getExpires() == 120);
}

TEST_CASE("Parser rejects malformed start lines", "[sip]") {
  CHECK_FALSE(parse("").has_value());
  CHECK_FALSE(parse("garbage\r\n\r\n").has_value());
  CHECK_FALSE(parse("SIP/2.0 abc OK\r\n\r\n").has_value());
  CHECK_FALSE(parse("SIP/2.0 999 Nope\r\n\r\n").has_value());
  CHECK_FALSE(parse("INVITE sip:x HTTP/1.1\r\n\r\n").has_value());
}

TEST_CASE("Parser case-folds raw bytes outside ASCII safely", "[sip]") {
  auto lower = parse("bye sip:1001@10.0.0.5 SIP/2.0\r\n"
                     "CONTENT-length: 0\r\n"
                     "\r\n");
  REQUIRE(lower.has_value());
  CHECK(lower->method == SipMethod::BYE);

  auto binary = parse("inv\xE9te sip:1001@10.0.0.5 SIP/2.0\r\n"
                      "X-\xC4\xB0" "d: \xFF\r\n"
                      "Content-Length: 2\r\n"
                      "\r\n"
                      "okTRAILER");
  REQUIRE(binary.has_value());
  CHECK(binary->method == SipMethod::UNKNOWN);
  CHECK(binary->methodStr == "INV\xE9TE");
  CHECK(*binary->getHeader("X-\xC4\xB0" "d") == "\xFF");
  CHECK(binary->body == "ok");
}

TEST_CASE("Serialisation recomputes Content-Length", "[sip]") {
  SipMessage msg = SipMessage::request(SipMethod::OPTIONS, "sip:pbx");
  msg.addHeader("Call-ID", "x1");
  msg.addHeader("Content-Length", "999");
  msg.body = "hello";

  std::string text = msg.toString();
  CHECK(text.rfind("OPTIONS sip:pbx SIP/2.0\r\n", 0) == 0);
  CHECK(text.find("Content-Length: 5\r\n") != std::string::npos);
  CHECK(text.find("999") == std::string::npos);

  auto back = parse(text);
  REQUIRE(back.has_value());
  CHECK(back->body == "hello");
}

TEST_CASE("Expires header wins over the contact parameter", "[sip]") {
  SipMessage msg;
  msg.addHeader("Contact", "<sip:a@b>;expires=60");
  msg.addHeader("Expires", "3600");
  CHECK(msg.getExpires() == 3600);
  msg.removeHeader("Expires");
  CHECK(msg.getExpires() == 60);
  msg.removeHeader("m");
  CHECK(msg.getExpires() == -1);
}

TEST_CASE("Responses copy the dialog headers and add our tag", "[sip]") {
  auto invite = parse(kInvite);
  REQUIRE(invite.has_value());

  auto trying = SipResponseBuilder::createResponse(*invite, 100, "", "tag9");
  CHECK(trying.statusPhrase == "Trying");
  CHECK(trying.getToTag().empty());

  auto ringing = SipResponseBuilder::createResponse(*invite, 180, "", "tag9");
  CHECK(ringing.getToTag() == "tag9");
  CHECK(ringing.getCallId() == invite->getCallId());
  CHECK(ringing.getBranch() == "z9hG4bK776asdhds");
  CHECK(*ringing.getHeader("CSeq") == "314159 INVITE");
}

TEST_CASE("Dialog matches in-dialog requests and builds a BYE", "[sip]") {
  auto invite = parse(kInvite);
  REQUIRE(invite.has_value());
  sockaddr_in remote{};
  SipDialog dialog(*invite, "local1", remote);

  CHECK(dialog.getCallId() == "a84b4c76e66710@pbx.example.com");
  CHECK(dialog.getRemoteUri() == "sip:alice@pbx.example.com");

  auto bye = parse("BYE sip:1001@10.0.0.5 SIP/2.0\r\n"
                   "Call-ID: a84b4c76e66710@pbx.example.com\r\n"
                   "To: <sip:1001@pbx.example.com>;tag=local1\r\n"
                   "CSeq: 314160 BYE\r\n\r\n");
  REQUIRE(bye.has_value());
  CHECK(dialog.matches(*bye));

  auto other = parse("BYE sip:1001@10.0.0.5 SIP/2.0\r\n"
                     "Call-ID: a84b4c76e66710@pbx.example.com\r\n"
                     "To: <sip:1001@pbx.example.com>;tag=someone-else\r\n"
                     "CSeq: 1 BYE\r\n\r\n");
  REQUIRE(other.has_value());
  CHECK_FALSE(dialog.matches(*other));

  SipMessage ours = dialog.createRequest(
      SipMethod::BYE, "SIP/2.0/UDP 10.0.0.5:5060;branch=z9hG4bKx");
  CHECK(ours.uri == "sip:alice@10.0.0.1:5060");
  CHECK(ours.getCallId() == dialog.getCallId());
  CHECK(ours.getFromTag() == "local1");
  CHECK(ours.getToTag() == "1928301774");
  CHECK(ours.getCSeqMethod() == SipMethod::BYE);
  CHECK(*ours.getHeader("Route") == "<sip:pbx.example.com;lr>");
}

TEST_CASE("Transactions remember their last response", "[sip]") {
  auto invite = parse(kInvite);
  REQUIRE(invite.has_value());

  SipTransaction tx(*invite);
  CHECK(tx.getKey() == SipTransaction::keyFor(*invite));
  CHECK(tx.getLastResponse() == nullptr);

  tx.sendResponse(SipResponseBuilder::createResponse(*invite, 180, "", "t"));
  CHECK(tx.getState() == TransactionState::PROCEEDING);
  tx.sendResponse(SipResponseBuilder::createResponse(*invite, 486, "", "t"));
  CHECK(tx.getState() == TransactionState::COMPLETED);
  REQUIRE(tx.getLastResponse() != nullptr);
  CHECK(tx.getLastResponse()->statusCode == 486);

  auto now = std::chrono::steady_clock::now();
  CHECK_FALSE(tx.isExpired(now));
  CHECK(tx.isExpired(now + std::chrono::seconds(60)));
}
