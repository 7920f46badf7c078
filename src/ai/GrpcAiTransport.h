#pragma once

#include "AiTransport.h"
#include <atomic>
#include <deque>
#include <memory>
#include <mutex>
#include <string>

#include "realtime.grpc.pb.h"
#include "realtime.pb.h"
#include <grpcpp/grpcpp.h>

class GrpcAiTransport : public AiTransport {
public:
  using Stream = grpc::ClientReaderWriter<voicegw::ClientMessage,
                                          voicegw::ServerMessage>;

  GrpcAiTransport(std::unique_ptr<grpc::ClientContext> context,
                  std::unique_ptr<Stream> stream);
  ~GrpcAiTransport() override;

  void send(const AudioChunk &pcm) override;
  void sendText(const std::string &text) override;
  void respondToTool(const ToolResult &result) override;
  std::optional<AiEvent> receive() override;
  void cancel() override;
  void close() override;

  // Server message -> zero or more events. Exposed for tests.
  static void translate(const voicegw::ServerMessage &msg,
                        std::deque<AiEvent> &out, bool &goAway);
  static ToolArgs argsFromStruct(const google::protobuf::Struct &args);
  static voicegw::FunctionResponse toFunctionResponse(const ToolResult &result);

private:
  void write(const voicegw::ClientMessage &msg);

  std::unique_ptr<grpc::ClientContext> context_;
  std::unique_ptr<Stream> stream_;

  std::mutex writeMutex_;
  std::deque<AiEvent> pending_; // receive() side only
  std::atomic<bool> closed_{false};
};

class GrpcAiConnector : public AiConnector {
public:
  GrpcAiConnector(const std::string &target, const std::string &apiKey,
                  int connectTimeoutMs);

  std::unique_ptr<AiTransport> connect(const AiSessionConfig &config) override;

  static voicegw::SessionSetup buildSetup(const AiSessionConfig &config);

private:
  std::string target_;
  std::string apiKey_;
  int connectTimeoutMs_;

  std::shared_ptr<grpc::Channel> channel_;
  std::unique_ptr<voicegw::RealtimeSession::Stub> stub_;
};
