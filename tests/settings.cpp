#include <cassert>
#include <cstdlib>
#include <string>
#include "mcpgate/exceptions.hpp"
#include "mcpgate/settings.hpp"
#include "mcpgate/util/log.hpp"

static void set_env(const char* name, const char* value) { setenv(name, value, 1); }

int main() {
  using namespace mcpgate;
  // JSON parse
  auto s = Settings::from_json(Json{{"log_level","debug"},{"container_socket","unix:///tmp/engine.sock"}});
  assert(s.log_level == "debug");
  assert(s.container_socket == "/tmp/engine.sock");

  auto d = Settings::from_json(Json::object());
  assert(d.log_level == "INFO");
  assert(d.container_socket == "/var/run/docker.sock");

  // Env parse (set locally)
  set_env("MCPGATE_LOG_LEVEL","warn");
  set_env("DOCKER_HOST","unix:///run/user/1000/docker.sock");
  auto e = Settings::from_env();
  assert(e.log_level == "WARN"); // uppercased
  assert(e.container_socket == "/run/user/1000/docker.sock");

  e.apply();
  assert(log::level() == log::Level::Warning);
  assert(!log::enabled(log::Level::Info));
  assert(log::enabled(log::Level::Error));

  // Only local sockets are reachable
  set_env("DOCKER_HOST","tcp://10.0.0.1:2375");
  bool rejected = false;
  try { Settings::from_env(); } catch (const ConfigError&) { rejected = true; }
  assert(rejected);

  unsetenv("DOCKER_HOST");
  unsetenv("MCPGATE_LOG_LEVEL");
  auto defaults = Settings::from_env();
  assert(defaults.log_level == "INFO");
  assert(defaults.container_socket == "/var/run/docker.sock");
  return 0;
}
