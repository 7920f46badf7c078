#pragma once

#include <functional>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

// Arguments of a tool call, flattened to text.
using ToolArgs = std::map<std::string, std::string>;

struct ToolParameter {
  std::string name;
  std::string type; // JSON schema type
  std::string description;
  bool required = false;
};

struct ToolDeclaration {
  std::string name;
  std::string description;
  std::vector<ToolParameter> parameters;
};

class ToolError : public std::runtime_error {
public:
  explicit ToolError(const std::string &what) : std::runtime_error(what) {}
};

class UnknownToolError : public ToolError {
public:
  explicit UnknownToolError(const std::string &name)
      : ToolError("Unknown tool: " + name) {}
};

class ToolExecutionError : public ToolError {
public:
  ToolExecutionError(const std::string &name, const std::string &cause)
      : ToolError("Tool " + name + " failed: " + cause), cause_(cause) {}
  const std::string &cause() const { return cause_; }

private:
  std::string cause_;
};

class ToolRegistry {
public:
  using Handler = std::function<std::string(const ToolArgs &)>;

  void add(const ToolDeclaration &declaration, Handler handler);

  // Throws UnknownToolError or ToolExecutionError.
  std::string execute(const std::string &name, const ToolArgs &args) const;

  bool has(const std::string &name) const;
  std::vector<ToolDeclaration> declarations() const;

private:
  struct Entry {
    ToolDeclaration declaration;
    Handler handler;
  };
  std::map<std::string, Entry> tools_;
};

namespace BuiltinTools {

std::string getServiceStatus(const ToolArgs &args);
std::string setReminder(const ToolArgs &args);

// get_service_status and set_reminder.
void registerAll(ToolRegistry &registry);

} // namespace BuiltinTools
