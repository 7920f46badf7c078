#include "ToolRegistry.h"
#include "../app/Logger.h"
#include <iostream>

void ToolRegistry::add(const ToolDeclaration &declaration, Handler handler) {
  tools_[declaration.name] = Entry{declaration, std::move(handler)};
}

std::string ToolRegistry::execute(const std::string &name,
                                  const ToolArgs &args) const {
  auto it = tools_.find(name);
  if (it == tools_.end()) {
    LOG_ERROR("Unknown tool requested: " << name);
    throw UnknownToolError(name);
  }

  for (const auto &param : it->second.declaration.parameters) {
    if (param.required && args.find(param.name) == args.end())
      throw ToolExecutionError(name, "missing argument '" + param.name + "'");
  }

  LOG_DEBUG("Executing tool " << name << " with " << args.size()
                              << " argument(s)");
  try {
    std::string result = it->second.handler(args);
    LOG_DEBUG("Tool " << name << " returned: " << result);
    return result;
  } catch (const ToolError &) {
    throw;
  } catch (const std::exception &e) {
    LOG_ERROR("Tool " << name << " failed: " << e.what());
    throw ToolExecutionError(name, e.what());
  }
}

bool ToolRegistry::has(const std::string &name) const {
  return tools_.count(name) > 0;
}

std::vector<ToolDeclaration> ToolRegistry::declarations() const {
  std::vector<ToolDeclaration> out;
  out.reserve(tools_.size());
  for (const auto &[name, entry] : tools_)
    out.push_back(entry.declaration);
  return out;
}

namespace BuiltinTools {

std::string getServiceStatus(const ToolArgs &) {
  LOG_INFO("Tool called: get_service_status()");
  return R"({"server_1": "online", "database": "online", "uptime": "99%"})";
}

std::string setReminder(const ToolArgs &args) {
  auto it = args.find("text");
  if (it == args.end())
    throw ToolExecutionError("set_reminder", "missing argument 'text'");
  LOG_INFO("Tool called: set_reminder(text='" << it->second << "')");
  std::cout << "Reminder set: " << it->second << std::endl;
  return "Success";
}

void registerAll(ToolRegistry &registry) {
  registry.add({"get_service_status",
                "Get the current status of all monitored services including "
                "servers and database. Use this when the user asks about "
                "service health, server status, or system uptime.",
                {}},
               getServiceStatus);

  registry.add({"set_reminder",
                "Set a reminder with the given text. Use this when the user "
                "wants to be reminded about something.",
                {{"text", "string",
                  "The reminder text describing what the user wants to be "
                  "reminded about.",
                  true}}},
               setReminder);
}

} // namespace BuiltinTools
