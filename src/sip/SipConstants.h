#pragma once

#include <string>

namespace SipConstants {
    // Response Codes
    constexpr int TRYING = 100;
    constexpr int RINGING = 180;
    constexpr int OK = 200;
    constexpr int BAD_REQUEST = 400;
    constexpr int UNAUTHORIZED = 401;
    constexpr int PROXY_AUTH_REQUIRED = 407;
    constexpr int INTERVAL_TOO_BRIEF = 423;
    constexpr int CALL_DOES_NOT_EXIST = 481;
    constexpr int BUSY_HERE = 486;
    constexpr int REQUEST_TERMINATED = 487;
    constexpr int NOT_ACCEPTABLE = 488;
    constexpr int INTERNAL_SERVER_ERROR = 500;
    constexpr int NOT_IMPLEMENTED = 501;
    constexpr int DECLINE = 603;

    // Headers
    const std::string HDR_CALL_ID = "Call-ID";
    const std::string HDR_CSEQ = "CSeq";
    const std::string HDR_FROM = "From";
    const std::string HDR_TO = "To";
    const std::string HDR_VIA = "Via";
    const std::string HDR_CONTACT = "Contact";
    const std::string HDR_CONTENT_TYPE = "Content-Type";
    const std::string HDR_USER_AGENT = "User-Agent";
    const std::string HDR_ALLOW = "Allow";
    const std::string HDR_EXPIRES = "Expires";
    const std::string HDR_MAX_FORWARDS = "Max-Forwards";
    const std::string HDR_WWW_AUTHENTICATE = "WWW-Authenticate";
    const std::string HDR_PROXY_AUTHENTICATE = "Proxy-Authenticate";
    const std::string HDR_AUTHORIZATION = "Authorization";
    const std::string HDR_PROXY_AUTHORIZATION = "Proxy-Authorization";
    const std::string HDR_RECORD_ROUTE = "Record-Route";
    const std::string HDR_ROUTE = "Route";

    const std::string USER_AGENT = "voice-gateway";
    const std::string ALLOW_METHODS = "INVITE, ACK, BYE, CANCEL, OPTIONS";
    const std::string BRANCH_MAGIC = "z9hG4bK";

    // Re-register this many seconds before the granted expiry at the latest.
    constexpr int MIN_REFRESH_MARGIN = 5;
}
