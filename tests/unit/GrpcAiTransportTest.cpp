#include <catch2/catch.hpp>

#include "ai/GrpcAiTransport.h"

namespace {

std::deque<AiEvent> translate(const voicegw::ServerMessage &msg,
                              bool *goAwayOut = nullptr) {
  std::deque<AiEvent> out;
  bool goAway = false;
  GrpcAiTransport::translate(msg, out, goAway);
  if (goAwayOut)
    *goAwayOut = goAway;
  return out;
}

} // namespace

TEST_CASE("Server content parts become audio and text events", "[grpc]") {
  voicegw::ServerMessage msg;
  auto *content = msg.mutable_server_content();
  content->add_parts()->set_audio(std::string("\x01\x02\x03\x04", 4));
  content->add_parts()->set_text("hello");

  auto events = translate(msg);
  REQUIRE(events.size() == 2);
  auto *audio = std::get_if<AudioEvent>(&events[0]);
  REQUIRE(audio != nullptr);
  CHECK(audio->pcm == AudioChunk{1, 2, 3, 4});
  auto *text = std::get_if<TextEvent>(&events[1]);
  REQUIRE(text != nullptr);
  CHECK(text->text == "hello");
}

TEST_CASE("An interrupted turn leads with an interrupt marker", "[grpc]") {
  voicegw::ServerMessage msg;
  msg.mutable_server_content()->set_interrupted(true);

  auto events = translate(msg);
  REQUIRE(events.size() == 1);
  auto *empty = std::get_if<EmptyEvent>(&events[0]);
  REQUIRE(empty != nullptr);
  CHECK(empty->interrupted);
}

TEST_CASE("Content without parts is an empty event", "[grpc]") {
  voicegw::ServerMessage msg;
  msg.mutable_server_content()->set_turn_complete(true);

  auto events = translate(msg);
  REQUIRE(events.size() == 1);
  auto *empty = std::get_if<EmptyEvent>(&events[0]);
  REQUIRE(empty != nullptr);
  CHECK_FALSE(empty->interrupted);
}

TEST_CASE("Tool calls carry id, name and flattened arguments", "[grpc]") {
  voicegw::ServerMessage msg;
  auto *call = msg.mutable_tool_call()->add_function_calls();
  call->set_id("call-7");
  call->set_name("set_reminder");
  auto &fields = *call->mutable_args()->mutable_fields();
  fields["text"].set_string_value("buy milk");
  fields["minutes"].set_number_value(15);
  fields["urgent"].set_bool_value(true);

  auto events = translate(msg);
  REQUIRE(events.size() == 1);
  auto *tool = std::get_if<ToolCallEvent>(&events[0]);
  REQUIRE(tool != nullptr);
  CHECK(tool->id == "call-7");
  CHECK(tool->name == "set_reminder");
  CHECK(tool->args.at("text") == "buy milk");
  CHECK(tool->args.at("minutes") == "15");
  CHECK(tool->args.at("urgent") == "true");
}

TEST_CASE("go_away is flagged and produces no event", "[grpc]") {
  voicegw::ServerMessage msg;
  msg.mutable_go_away()->set_reason("maintenance");

  bool goAway = false;
  auto events = translate(msg, &goAway);
  CHECK(goAway);
  CHECK(events.empty());
}

TEST_CASE("Tool results are wrapped as result or error", "[grpc]") {
  ToolResult ok{"id-1", "get_service_status", true, "{}"};
  auto response = GrpcAiTransport::toFunctionResponse(ok);
  CHECK(response.id() == "id-1");
  CHECK(response.name() == "get_service_status");
  REQUIRE(response.response().fields().count("result") == 1);
  CHECK(response.response().fields().at("result").string_value() == "{}");

  ToolResult failed{"id-2", "nope", false, "Unknown tool: nope"};
  response = GrpcAiTransport::toFunctionResponse(failed);
  REQUIRE(response.response().fields().count("error") == 1);
  CHECK(response.response().fields().count("result") == 0);
  CHECK(response.response().fields().at("error").string_value() ==
        "Unknown tool: nope");
}

TEST_CASE("Session setup declares model, voice, rates and tools", "[grpc]") {
  AiSessionConfig config;
  config.model = "m1";
  config.instructions = "be brief";
  config.voice = "Aoede";
  config.tools.push_back(
      {"set_reminder", "remind", {{"text", "string", "what", true}}});

  auto setup = GrpcAiConnector::buildSetup(config);
  CHECK(setup.model() == "m1");
  CHECK(setup.system_instruction() == "be brief");
  CHECK(setup.voice_name() == "Aoede");
  CHECK(setup.input_sample_rate() == 16000);
  CHECK(setup.output_sample_rate() == 24000);
  REQUIRE(setup.tools_size() == 1);

  const auto &schema = setup.tools(0).parameters().fields();
  CHECK(schema.at("type").string_value() == "object");
  const auto &props = schema.at("properties").struct_value().fields();
  CHECK(props.at("text").struct_value().fields().at("type").string_value() ==
        "string");
  const auto &required = schema.at("required").list_value();
  REQUIRE(required.values_size() == 1);
  CHECK(required.values(0).string_value() == "text");
}
