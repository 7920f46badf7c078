#include <catch2/catch.hpp>

#include "tools/ToolRegistry.h"
#include <algorithm>
#include <stdexcept>

TEST_CASE("Builtin tools are registered with their declarations", "[tools]") {
  ToolRegistry registry;
  BuiltinTools::registerAll(registry);

  REQUIRE(registry.has("get_service_status"));
  REQUIRE(registry.has("set_reminder"));
  REQUIRE_FALSE(registry.has("launch_rockets"));

  auto decls = registry.declarations();
  REQUIRE(decls.size() == 2);
  auto reminder = std::find_if(decls.begin(), decls.end(), [](const auto &d) {
    return d.name == "set_reminder";
  });
  REQUIRE(reminder != decls.end());
  REQUIRE(reminder->parameters.size() == 1);
  CHECK(reminder->parameters[0].name == "text");
  CHECK(reminder->parameters[0].type == "string");
  CHECK(reminder->parameters[0].required);
}

TEST_CASE("get_service_status reports every service online", "[tools]") {
  ToolRegistry registry;
  BuiltinTools::registerAll(registry);
  REQUIRE(registry.execute("get_service_status", {}) ==
          R"({"server_1": "online", "database": "online", "uptime": "99%"})");
}

TEST_CASE("set_reminder acknowledges the reminder", "[tools]") {
  ToolRegistry registry;
  BuiltinTools::registerAll(registry);
  REQUIRE(registry.execute("set_reminder", {{"text", "call mom"}}) == "Success");
}

TEST_CASE("set_reminder without text is an execution error", "[tools]") {
  ToolRegistry registry;
  BuiltinTools::registerAll(registry);
  REQUIRE_THROWS_AS(registry.execute("set_reminder", {}), ToolExecutionError);
  REQUIRE_THROWS_AS(BuiltinTools::setReminder({}), ToolExecutionError);
}

TEST_CASE("Unknown tools are reported by name", "[tools]") {
  ToolRegistry registry;
  REQUIRE_THROWS_WITH(registry.execute("nope", {}), "Unknown tool: nope");
  REQUIRE_THROWS_AS(registry.execute("nope", {}), UnknownToolError);
}

TEST_CASE("Handler failures are wrapped with their cause", "[tools]") {
  ToolRegistry registry;
  registry.add({"flaky", "always fails", {}},
               [](const ToolArgs &) -> std::string {
                 throw std::runtime_error("backend down");
               });

  try {
    registry.execute("flaky", {});
    FAIL("expected ToolExecutionError");
  } catch (const ToolExecutionError &e) {
    CHECK(e.cause() == "backend down");
    CHECK(std::string(e.what()) == "Tool flaky failed: backend down");
  }
}
