#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace gridcore {
namespace domain {

enum class SupervisorState {
  Starting,
  Running,
  Degraded,
  Recovering,
  Stopped,
};

enum class ConnectionState {
  Connected,
  Reconnecting,
  Failed,
};

inline const char* toString(SupervisorState s) {
  switch (s) {
    case SupervisorState::Starting:   return "Starting";
    case SupervisorState::Running:    return "Running";
    case SupervisorState::Degraded:   return "Degraded";
    case SupervisorState::Recovering: return "Recovering";
    case SupervisorState::Stopped:    return "Stopped";
  }
  return "Unknown";
}

inline const char* toString(ConnectionState s) {
  switch (s) {
    case ConnectionState::Connected:    return "Connected";
    case ConnectionState::Reconnecting: return "Reconnecting";
    case ConnectionState::Failed:       return "Failed";
  }
  return "Unknown";
}

// Owned and written by the Supervisor only; everyone else gets copies.
struct HealthStatus {
  SupervisorState state{SupervisorState::Starting};
  std::int64_t last_tick_ms{0};
  int consecutive_failures{0};
  ConnectionState connection{ConnectionState::Reconnecting};
  std::size_t restarts_in_window{0};
  std::int64_t next_attempt_ms{0};
  std::string last_error;
};

}  // namespace domain
}  // namespace gridcore
