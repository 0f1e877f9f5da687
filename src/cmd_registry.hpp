#pragma once
/*
 * CommandRegistry
 *
 * Purpose: register and dispatch named settings commands ("set number").
 * Design: map name -> handler(args, msg); the caller splits the line.
 */
#include <string>
#include <unordered_map>
#include <functional>
#include <vector>

class CommandRegistry {
public:
  enum class Outcome { Ok, Failed, Unknown };
  // Handlers return false and fill msg when the arguments are unusable.
  using Handler = std::function<bool(const std::vector<std::string>& args, std::string& msg)>;

  void register_command(const std::string& name, Handler h) { map_[name] = std::move(h); }
  bool contains(const std::string& name) const { return map_.count(name) != 0; }
  Outcome execute(const std::string& name, const std::vector<std::string>& args, std::string& msg) const {
    auto it = map_.find(name);
    if (it == map_.end()) { msg = "unknown command: " + name; return Outcome::Unknown; }
    return it->second(args, msg) ? Outcome::Ok : Outcome::Failed;
  }
private:
  std::unordered_map<std::string, Handler> map_;
};
