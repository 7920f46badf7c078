#pragma once

#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

struct SipConfig {
  std::string extension;
  std::string password;
  std::string server;
  std::string authId; // digest username, defaults to extension
  int port = 5060;
  int localPort = 5060;
  std::string bindIp = "0.0.0.0";
  std::string publicIp;
  std::string transport = "udp";
  std::string preferredCodec = "PCMU";
  int registerExpires = 300;
  int autoAnswerDelayMs = 200;

  std::string registrarUri() const {
    return "sip:" + server + ":" + std::to_string(port);
  }
  std::string accountUri() const { return "sip:" + extension + "@" + server; }

  // Preferred codec first, the other G.711 law as fallback.
  std::vector<std::string> codecPreference() const;
};

struct RtpConfig {
  int portStart = 20000;
  int portEnd = 30000;
};

struct AudioConfig {
  int telephonyRate = 8000;
  int frameMs = 20;
  size_t queueCapacity = 100;

  int samplesPerFrame() const { return telephonyRate * frameMs / 1000; }
};

struct AiConfig {
  std::string target = "127.0.0.1:50051";
  std::string apiKey;
  std::string model = "gemini-2.0-flash-exp";
  std::string voice = "Aoede";
  int inputRate = 16000;
  int outputRate = 24000;
  std::string instructions;
  std::string greeting;
  int connectTimeoutMs = 5000;
};

struct SupervisorConfig {
  int retryDelaySec = 10;
  int maxRetries = 0; // 0 = forever
  int registrationTimeoutSec = 10;
};

class Config {
public:
  bool load(const std::string &path);
  bool loadFromString(const std::string &yaml);

  // Human readable dump with secrets masked.
  std::string describe() const;

  SipConfig sip;
  RtpConfig rtp;
  AudioConfig audio;
  AiConfig ai;
  SupervisorConfig supervisor;
  std::string logLevel = "INFO";

private:
  bool apply(const YAML::Node &root);
};
