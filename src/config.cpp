#include "callpop/config.hpp"

#include <cstdlib>

#include "callpop/errors.hpp"
#include "callpop/strings.hpp"

namespace callpop {

void ClientConfig::validate() const {
  if (trim(host).empty()) throw ConfigError("host is empty");
  if (port <= 0 || port > 65535) throw ConfigError("port " + std::to_string(port) + " is out of range");
  if (trim(username).empty()) throw ConfigError("username is empty");
  if (secret.empty()) throw ConfigError("secret is empty");
  if (connect_timeout.count() <= 0) throw ConfigError("connect timeout must be positive");
  if (action_timeout.count() <= 0) throw ConfigError("action timeout must be positive");
  if (keepalive_idle.count() <= 0) throw ConfigError("keep-alive idle time must be positive");
  if (keepalive_grace.count() <= 0) throw ConfigError("keep-alive grace must be positive");
  if (ended_call_grace.count() < 0) throw ConfigError("ended call grace must not be negative");
  if (hangup_retries < 0) throw ConfigError("hangup retries must not be negative");
  if (reconnect.base_delay.count() <= 0) throw ConfigError("reconnect base delay must be positive");
  if (reconnect.max_delay < reconnect.base_delay)
    throw ConfigError("reconnect max delay is below the base delay");
  if (reconnect.jitter < 0.0 || reconnect.jitter >= 1.0)
    throw ConfigError("reconnect jitter must be in [0, 1)");
  if (reconnect.max_attempts < 0) throw ConfigError("reconnect attempts must not be negative");
  for (const auto& e : monitored_extensions) {
    if (trim(e).empty() || e == "_") throw ConfigError("empty monitored extension entry");
  }
}

ClientConfig config_from_env(ClientConfig cfg) {
  auto getenv_s = [](const char* k) -> std::string {
    const char* v = std::getenv(k);
    return v ? std::string(v) : "";
  };
  auto getenv_int = [&](const char* k, int current) -> int {
    std::string v = getenv_s(k);
    if (v.empty()) return current;
    int n = to_int_safe(v, -1);
    if (n < 0) throw ConfigError(std::string(k) + " is not a number: " + v);
    return n;
  };

  if (!getenv_s("AMI_HOST").empty()) cfg.host = getenv_s("AMI_HOST");
  cfg.port = getenv_int("AMI_PORT", cfg.port);
  if (!getenv_s("AMI_USER").empty()) cfg.username = getenv_s("AMI_USER");
  if (!getenv_s("AMI_SECRET").empty()) cfg.secret = getenv_s("AMI_SECRET");
  if (!getenv_s("AMI_EVENTS").empty()) cfg.events = getenv_s("AMI_EVENTS");
  if (!getenv_s("AMI_EXTENSIONS").empty()) cfg.monitored_extensions = split_list(getenv_s("AMI_EXTENSIONS"));
  if (!getenv_s("AMI_TRUNK_PREFIXES").empty()) cfg.trunk_prefixes = split_list(getenv_s("AMI_TRUNK_PREFIXES"));
  if (!getenv_s("AMI_CAUSE_MAP").empty()) cfg.causes.apply_overrides(getenv_s("AMI_CAUSE_MAP"));

  cfg.action_timeout = std::chrono::milliseconds(
      getenv_int("AMI_ACTION_TIMEOUT_MS", static_cast<int>(cfg.action_timeout.count())));
  cfg.reconnect.base_delay = std::chrono::milliseconds(
      getenv_int("AMI_RECONNECT_BASE_MS", static_cast<int>(cfg.reconnect.base_delay.count())));
  cfg.reconnect.max_delay = std::chrono::milliseconds(
      getenv_int("AMI_RECONNECT_MAX_MS", static_cast<int>(cfg.reconnect.max_delay.count())));
  cfg.reconnect.max_attempts = getenv_int("AMI_RECONNECT_ATTEMPTS", cfg.reconnect.max_attempts);

  return cfg;
}

}  // namespace callpop
