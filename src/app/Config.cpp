#include "Config.h"
#include "Logger.h"
#include "../util/G711Utils.h"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace {

const char *kDefaultInstructions =
    "You are a helpful voice assistant answering a phone call. "
    "You are concise and friendly. Keep answers short.";

const char *kDefaultGreeting = "The call is now connected. Greet the caller!";

std::string readFile(const std::string &path) {
  std::ifstream in(path);
  if (!in.is_open())
    return "";
  std::ostringstream oss;
  oss << in.rdbuf();
  std::string text = oss.str();
  auto end = text.find_last_not_of(" \t\r\n");
  return end == std::string::npos ? "" : text.substr(0, end + 1);
}

// Missing sections read as empty maps so every key falls back to its default.
YAML::Node section(const YAML::Node &root, const char *name) {
  const YAML::Node node = root[name];
  if (node && node.IsMap())
    return node;
  return YAML::Node(YAML::NodeType::Map);
}

std::string mask(const std::string &secret) {
  if (secret.empty())
    return "<unset>";
  return "****";
}

} // namespace

std::vector<std::string> SipConfig::codecPreference() const {
  std::string pref = preferredCodec;
  std::transform(pref.begin(), pref.end(), pref.begin(), [](unsigned char c) {
    return static_cast<char>(::toupper(c));
  });
  if (pref == "PCMA")
    return {"PCMA", "PCMU"};
  return {"PCMU", "PCMA"};
}

bool Config::load(const std::string &path) {
  try {
    return apply(YAML::LoadFile(path));
  } catch (const std::exception &e) {
    LOG_ERROR("Failed to load config " << path << ": " << e.what());
    return false;
  }
}

bool Config::loadFromString(const std::string &yaml) {
  try {
    return apply(YAML::Load(yaml));
  } catch (const std::exception &e) {
    LOG_ERROR("Failed to parse config: " << e.what());
    return false;
  }
}

bool Config::apply(const YAML::Node &root) {
  logLevel = root["log_level"].as<std::string>("INFO");

  const YAML::Node s = section(root, "sip");
  sip.extension = s["extension"].as<std::string>("");
  sip.password = s["password"].as<std::string>("");
  sip.server = s["server"].as<std::string>("");
  sip.authId = s["auth_id"].as<std::string>("");
  if (sip.authId.empty())
    sip.authId = sip.extension;
  sip.port = s["port"].as<int>(5060);
  sip.localPort = s["local_port"].as<int>(5060);
  sip.bindIp = s["bind_ip"].as<std::string>("0.0.0.0");
  sip.publicIp = s["public_ip"].as<std::string>("");
  sip.transport = s["transport"].as<std::string>("udp");
  std::transform(sip.transport.begin(), sip.transport.end(),
                 sip.transport.begin(), [](unsigned char c) {
                   return static_cast<char>(::tolower(c));
                 });
  sip.preferredCodec = s["preferred_codec"].as<std::string>("PCMU");
  sip.registerExpires = s["register_expires"].as<int>(300);
  sip.autoAnswerDelayMs = s["auto_answer_delay_ms"].as<int>(200);

  const YAML::Node r = section(root, "rtp");
  rtp.portStart = r["port_start"].as<int>(20000);
  rtp.portEnd = r["port_end"].as<int>(30000);

  const YAML::Node a = section(root, "audio");
  audio.telephonyRate = a["telephony_rate"].as<int>(8000);
  audio.frameMs = a["frame_ms"].as<int>(20);
  audio.queueCapacity = a["queue_capacity"].as<size_t>(100);

  const YAML::Node g = section(root, "ai");
  ai.target = g["target"].as<std::string>("127.0.0.1:50051");
  ai.apiKey = g["api_key"].as<std::string>("");
  ai.model = g["model"].as<std::string>("gemini-2.0-flash-exp");
  ai.voice = g["voice"].as<std::string>("Aoede");
  ai.inputRate = g["input_rate"].as<int>(16000);
  ai.outputRate = g["output_rate"].as<int>(24000);
  ai.instructions = g["instructions"].as<std::string>(kDefaultInstructions);
  std::string instructionsFile = g["instructions_file"].as<std::string>("");
  if (!instructionsFile.empty()) {
    std::string text = readFile(instructionsFile);
    if (text.empty()) {
      LOG_WARN("Failed to read instructions file " << instructionsFile
                                                   << ", using inline text");
    } else {
      ai.instructions = text;
    }
  }
  ai.greeting = g["greeting"].as<std::string>(kDefaultGreeting);
  ai.connectTimeoutMs = g["connect_timeout_ms"].as<int>(5000);

  const YAML::Node v = section(root, "supervisor");
  supervisor.retryDelaySec = v["retry_delay_s"].as<int>(10);
  supervisor.maxRetries = v["max_retries"].as<int>(0);
  supervisor.registrationTimeoutSec = v["registration_timeout_s"].as<int>(10);

  std::vector<std::string> missing;
  if (sip.extension.empty())
    missing.push_back("sip.extension");
  if (sip.password.empty())
    missing.push_back("sip.password");
  if (sip.server.empty())
    missing.push_back("sip.server");
  if (ai.apiKey.empty())
    missing.push_back("ai.api_key");

  if (!missing.empty()) {
    std::ostringstream oss;
    for (size_t i = 0; i < missing.size(); ++i)
      oss << (i ? ", " : "") << missing[i];
    LOG_ERROR("Missing required configuration: " << oss.str());
    return false;
  }

  if (sip.transport != "udp") {
    LOG_ERROR("Unsupported SIP transport '" << sip.transport
                                            << "', only udp is available");
    return false;
  }

  if (audio.telephonyRate <= 0 || audio.frameMs <= 0 ||
      audio.queueCapacity == 0 || ai.inputRate <= 0 || ai.outputRate <= 0) {
    LOG_ERROR("Audio rates, frame size and queue capacity must be positive");
    return false;
  }

  // The call leg is always G.711, whose clock is fixed.
  if (audio.telephonyRate != G711Utils::SAMPLE_RATE) {
    LOG_ERROR("audio.telephony_rate must be " << G711Utils::SAMPLE_RATE
              << " for G.711 calls, got " << audio.telephonyRate);
    return false;
  }

  if (rtp.portStart <= 0 || rtp.portEnd < rtp.portStart) {
    LOG_ERROR("Invalid RTP port range " << rtp.portStart << "-" << rtp.portEnd);
    return false;
  }

  return true;
}

std::string Config::describe() const {
  std::ostringstream oss;
  oss << "sip: " << sip.extension << "@" << sip.server << ":" << sip.port
      << " (auth " << sip.authId << ", password " << mask(sip.password)
      << ", local " << sip.bindIp << ":" << sip.localPort << ", codec "
      << sip.preferredCodec << ")\n"
      << "rtp: " << rtp.portStart << "-" << rtp.portEnd << "\n"
      << "audio: " << audio.telephonyRate << "Hz, " << audio.frameMs
      << "ms frames, queue " << audio.queueCapacity << "\n"
      << "ai: " << ai.target << " model=" << ai.model << " voice=" << ai.voice
      << " in=" << ai.inputRate << "Hz out=" << ai.outputRate
      << "Hz key=" << mask(ai.apiKey) << "\n"
      << "supervisor: retry " << supervisor.retryDelaySec << "s, max "
      << supervisor.maxRetries << "\n"
      << "log_level: " << logLevel;
  return oss.str();
}
