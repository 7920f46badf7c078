#include "GrpcAiTransport.h"
#include "../app/Logger.h"
#include <chrono>
#include <cmath>
#include <google/protobuf/util/json_util.h>
#include <sstream>

namespace {

std::string valueToText(const google::protobuf::Value &value) {
  switch (value.kind_case()) {
  case google::protobuf::Value::kStringValue:
    return value.string_value();
  case google::protobuf::Value::kBoolValue:
    return value.bool_value() ? "true" : "false";
  case google::protobuf::Value::kNumberValue: {
    double n = value.number_value();
    std::ostringstream oss;
    if (std::floor(n) == n && std::fabs(n) < 1e15)
      oss << static_cast<long long>(n);
    else
      oss << n;
    return oss.str();
  }
  case google::protobuf::Value::kNullValue:
    return "";
  default: {
    std::string json;
    if (!google::protobuf::util::MessageToJsonString(value, &json).ok())
      return "";
    return json;
  }
  }
}

google::protobuf::Struct parametersSchema(const ToolDeclaration &decl) {
  google::protobuf::Struct schema;
  auto &fields = *schema.mutable_fields();
  fields["type"].set_string_value("object");

  auto *properties = fields["properties"].mutable_struct_value();
  auto *required = fields["required"].mutable_list_value();
  for (const auto &param : decl.parameters) {
    auto &prop = *(*properties->mutable_fields())[param.name]
                      .mutable_struct_value()
                      ->mutable_fields();
    prop["type"].set_string_value(param.type);
    prop["description"].set_string_value(param.description);
    if (param.required)
      required->add_values()->set_string_value(param.name);
  }
  return schema;
}

} // namespace

GrpcAiTransport::GrpcAiTransport(std::unique_ptr<grpc::ClientContext> context,
                                 std::unique_ptr<Stream> stream)
    : context_(std::move(context)), stream_(std::move(stream)) {}

GrpcAiTransport::~GrpcAiTransport() { close(); }

void GrpcAiTransport::write(const voicegw::ClientMessage &msg) {
  std::lock_guard<std::mutex> lock(writeMutex_);
  if (closed_)
    throw AiTransportError("stream closed");
  if (!stream_->Write(msg))
    throw AiTransportError("write failed, stream is down");
}

void GrpcAiTransport::send(const AudioChunk &pcm) {
  voicegw::ClientMessage msg;
  auto *audio = msg.mutable_audio();
  audio->set_data(pcm.data(), pcm.size());
  audio->set_mime_type("audio/pcm");
  write(msg);
}

void GrpcAiTransport::sendText(const std::string &text) {
  voicegw::ClientMessage msg;
  auto *content = msg.mutable_content();
  content->set_role("user");
  content->set_text(text);
  content->set_turn_complete(true);
  write(msg);
}

voicegw::FunctionResponse
GrpcAiTransport::toFunctionResponse(const ToolResult &result) {
  voicegw::FunctionResponse response;
  response.set_id(result.callId);
  response.set_name(result.name);
  auto &fields = *response.mutable_response()->mutable_fields();
  fields[result.ok ? "result" : "error"].set_string_value(result.payload);
  return response;
}

void GrpcAiTransport::respondToTool(const ToolResult &result) {
  voicegw::ClientMessage msg;
  *msg.mutable_tool_response()->add_function_responses() =
      toFunctionResponse(result);
  write(msg);
}

ToolArgs GrpcAiTransport::argsFromStruct(const google::protobuf::Struct &args) {
  ToolArgs out;
  for (const auto &[key, value] : args.fields())
    out[key] = valueToText(value);
  return out;
}

void GrpcAiTransport::translate(const voicegw::ServerMessage &msg,
                                std::deque<AiEvent> &out, bool &goAway) {
  const size_t before = out.size();
  switch (msg.payload_case()) {
  case voicegw::ServerMessage::kServerContent: {
    const auto &content = msg.server_content();
    if (content.interrupted())
      out.push_back(EmptyEvent{true});
    for (const auto &part : content.parts()) {
      if (part.data_case() == voicegw::Part::kAudio) {
        const std::string &data = part.audio();
        out.push_back(AudioEvent{AudioChunk(data.begin(), data.end())});
      } else if (part.data_case() == voicegw::Part::kText) {
        out.push_back(TextEvent{part.text()});
      }
    }
    if (out.size() == before)
      out.push_back(EmptyEvent{});
    break;
  }
  case voicegw::ServerMessage::kToolCall:
    for (const auto &call : msg.tool_call().function_calls())
      out.push_back(
          ToolCallEvent{call.id(), call.name(), argsFromStruct(call.args())});
    break;
  case voicegw::ServerMessage::kGoAway:
    LOG_WARN("AI service is going away: " << msg.go_away().reason());
    goAway = true;
    break;
  case voicegw::ServerMessage::kSetupComplete:
    LOG_DEBUG("AI session setup complete");
    out.push_back(EmptyEvent{});
    break;
  default:
    out.push_back(EmptyEvent{});
    break;
  }
}

std::optional<AiEvent> GrpcAiTransport::receive() {
  while (pending_.empty()) {
    if (closed_)
      return std::nullopt;

    voicegw::ServerMessage msg;
    if (!stream_->Read(&msg)) {
      LOG_INFO("AI stream ended");
      return std::nullopt;
    }

    bool goAway = false;
    translate(msg, pending_, goAway);
    if (goAway) {
      cancel();
      return std::nullopt;
    }
  }

  AiEvent event = std::move(pending_.front());
  pending_.pop_front();
  return event;
}

void GrpcAiTransport::cancel() {
  if (context_)
    context_->TryCancel();
}

void GrpcAiTransport::close() {
  if (closed_.exchange(true))
    return;

  {
    std::lock_guard<std::mutex> lock(writeMutex_);
    stream_->WritesDone();
  }
  context_->TryCancel();
  grpc::Status status = stream_->Finish();
  if (!status.ok() && status.error_code() != grpc::StatusCode::CANCELLED) {
    LOG_WARN("AI stream finished with error: " << status.error_message());
  }
}

GrpcAiConnector::GrpcAiConnector(const std::string &target,
                                 const std::string &apiKey,
                                 int connectTimeoutMs)
    : target_(target), apiKey_(apiKey), connectTimeoutMs_(connectTimeoutMs) {
  channel_ = grpc::CreateChannel(target_, grpc::InsecureChannelCredentials());
  stub_ = voicegw::RealtimeSession::NewStub(channel_);
}

voicegw::SessionSetup GrpcAiConnector::buildSetup(const AiSessionConfig &config) {
  voicegw::SessionSetup setup;
  setup.set_model(config.model);
  setup.set_system_instruction(config.instructions);
  setup.set_voice_name(config.voice);
  setup.set_input_sample_rate(config.inputRate);
  setup.set_output_sample_rate(config.outputRate);
  setup.add_response_modalities("AUDIO");
  for (const auto &decl : config.tools) {
    auto *fn = setup.add_tools();
    fn->set_name(decl.name);
    fn->set_description(decl.description);
    *fn->mutable_parameters() = parametersSchema(decl);
  }
  return setup;
}

std::unique_ptr<AiTransport>
GrpcAiConnector::connect(const AiSessionConfig &config) {
  auto deadline = std::chrono::system_clock::now() +
                  std::chrono::milliseconds(connectTimeoutMs_);
  if (!channel_->WaitForConnected(deadline)) {
    LOG_ERROR("AI service " << target_ << " unreachable after "
                            << connectTimeoutMs_ << "ms");
    return nullptr;
  }

  auto context = std::make_unique<grpc::ClientContext>();
  context->AddMetadata("authorization", "Bearer " + apiKey_);
  context->AddMetadata("x-model", config.model);

  auto stream = stub_->Converse(context.get());
  if (!stream) {
    LOG_ERROR("Failed to open AI stream");
    return nullptr;
  }

  voicegw::ClientMessage first;
  *first.mutable_setup() = buildSetup(config);
  if (!stream->Write(first)) {
    grpc::Status status = stream->Finish();
    LOG_ERROR("AI session setup rejected: " << status.error_message());
    return nullptr;
  }

  LOG_INFO("Connected to AI service " << target_);
  return std::make_unique<GrpcAiTransport>(std::move(context),
                                           std::move(stream));
}
