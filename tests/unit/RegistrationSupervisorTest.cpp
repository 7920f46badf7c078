#include <catch2/catch.hpp>

#include "FakeTelephony.h"
#include "TestHelpers.h"
#include "app/RegistrationSupervisor.h"
#include "call/CallSessionOrchestrator.h"
#include <future>

using namespace std::chrono_literals;
using TestHelpers::waitUntil;

namespace {

struct SupervisorFixture {
  SupervisorFixture()
      : bridge(BridgeConfig{}), assembler(bridge, 160),
        engineLog(std::make_shared<FakeEngineLog>()),
        sessionLog(std::make_shared<FakeSessionLog>()),
        orchestrator(
            loop, bridge, assembler,
            [this](AiSessionListener *) -> std::unique_ptr<AiSession> {
              return std::make_unique<FakeSession>(sessionLog);
            },
            50ms) {
    config.retryDelaySec = 0;
    config.registrationTimeoutSec = 1;
    loop.start();
  }

  ~SupervisorFixture() {
    orchestrator.shutdown();
    loop.stop();
  }

  RegistrationSupervisor::EngineFactory factory(FakeEngine::OnStart onStart) {
    return [this, onStart]() -> std::unique_ptr<TelephonyEngine> {
      return std::make_unique<FakeEngine>(engineLog, onStart);
    };
  }

  SupervisorConfig config;
  EventLoop loop;
  DuplexAudioBridge bridge;
  FrameAssembler assembler;
  std::shared_ptr<FakeEngineLog> engineLog;
  std::shared_ptr<FakeSessionLog> sessionLog;
  CallSessionOrchestrator orchestrator;
};

void rejectRegistration(TelephonyListener *listener) {
  listener->onRegistrationState(false, 403, "Forbidden");
}

void acceptRegistration(TelephonyListener *listener) {
  listener->onRegistrationState(true, 200, "OK");
}

} // namespace

TEST_CASE_METHOD(SupervisorFixture,
                 "Supervisor gives up after the retry budget",
                 "[supervisor]") {
  config.maxRetries = 2;
  RegistrationSupervisor supervisor(config, factory(rejectRegistration),
                                    orchestrator, assembler);

  REQUIRE_FALSE(supervisor.run());
  CHECK(supervisor.attempts() == 2);
  CHECK(engineLog->created == 2);
  CHECK(engineLog->stopped == 2);
}

TEST_CASE_METHOD(SupervisorFixture,
                 "A registration that never completes counts as a failure",
                 "[supervisor]") {
  config.maxRetries = 1;
  config.registrationTimeoutSec = 0;
  RegistrationSupervisor supervisor(config, factory(nullptr), orchestrator,
                                    assembler);

  REQUIRE_FALSE(supervisor.run());
  CHECK(engineLog->created == 1);
  CHECK(engineLog->stopped == 1);
}

TEST_CASE_METHOD(SupervisorFixture,
                 "Supervisor serves calls while registered and stops on request",
                 "[supervisor]") {
  RegistrationSupervisor supervisor(config, factory(acceptRegistration),
                                    orchestrator, assembler);

  auto result = std::async(std::launch::async, [&] { return supervisor.run(); });
  REQUIRE(waitUntil([&] { return engineLog->started == 1; }));

  // attempts() drops back to zero once registered, right before the engine
  // is handed to the orchestrator.
  REQUIRE(waitUntil([&] { return supervisor.attempts() == 0; }));

  // Calls reported by the engine reach the orchestrator, which answers
  // through the attached engine.
  engineLog->listener->onCallState(
      CallEvent{"c1", CallState::Ringing, "sip:caller@pbx"});
  loop.waitIdle();
  CHECK(orchestrator.phase() == CallPhase::Ringing);
  REQUIRE(waitUntil([&] { return engineLog->answeredCount() == 1; }));

  supervisor.requestStop();
  REQUIRE(result.wait_for(5s) == std::future_status::ready);
  CHECK(result.get());
  CHECK(engineLog->stopped == 1);
  CHECK(orchestrator.phase() == CallPhase::Ended);
}

TEST_CASE_METHOD(SupervisorFixture,
                 "Losing the registration starts a fresh engine",
                 "[supervisor]") {
  RegistrationSupervisor supervisor(config, factory(acceptRegistration),
                                    orchestrator, assembler);

  auto result = std::async(std::launch::async, [&] { return supervisor.run(); });
  REQUIRE(waitUntil([&] { return engineLog->started == 1; }));

  supervisor.onRegistrationState(false, 408, "Registration expired");
  REQUIRE(waitUntil([&] { return engineLog->started == 2; }));
  CHECK(engineLog->stopped >= 1);

  supervisor.requestStop();
  REQUIRE(result.wait_for(5s) == std::future_status::ready);
  CHECK(result.get());
  CHECK(engineLog->created == 2);
  CHECK(engineLog->stopped == 2);
}
