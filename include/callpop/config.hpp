#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "callpop/cause_map.hpp"

namespace callpop {

struct ReconnectPolicy {
  std::chrono::milliseconds base_delay{2000};
  std::chrono::milliseconds max_delay{60000};
  double jitter = 0.2;    // fraction of each delay that may be shaved off
  int max_attempts = 10;  // 0 = retry forever
};

struct ClientConfig {
  std::string host;
  int port = 5038;
  std::string username;
  std::string secret;
  std::string events = "on";  // Login event mask

  std::chrono::milliseconds connect_timeout{10000};
  std::chrono::milliseconds action_timeout{5000};
  std::chrono::milliseconds keepalive_idle{30000};
  std::chrono::milliseconds keepalive_grace{5000};
  std::chrono::milliseconds ended_call_grace{5000};
  int hangup_retries = 1;

  ReconnectPolicy reconnect;

  // Empty = every extension-looking endpoint.
  std::vector<std::string> monitored_extensions;

  // Channel name prefixes that identify trunks, for direction guessing.
  std::vector<std::string> trunk_prefixes = {"PJSIP/trunk", "PJSIP/siptrunk", "PJSIP/provider",
                                             "SIP/trunk"};
  CauseMap causes;

  // Throws ConfigError naming the first bad setting.
  void validate() const;
};

// Overlays AMI_* environment variables on base. Throws ConfigError for
// values that do not parse.
ClientConfig config_from_env(ClientConfig base = ClientConfig());

}  // namespace callpop
