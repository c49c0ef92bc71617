#pragma once

#include <cstdint>
#include <string>

namespace gridcore {

// Health report of a trading session, read by the Supervisor every check.
struct SessionHealth {
  bool running{false};      // tick loop thread alive
  bool connected{false};    // exchange session up
  int consecutive_failures{0};
  std::int64_t last_tick_ms{0};  // last successfully completed tick
  std::uint64_t ticks_completed{0};
  bool kill_switch{false};  // session ended by the kill switch
  bool fatal{false};        // unrecoverable error, do not restart
  std::string last_error;
};

// -----------------------------------------------------------------------------
// ISupervisedSession
// -----------------------------------------------------------------------------
// What the Supervisor needs from the thing it supervises.
//
//   start()    connect, restore or initialize, run the first tick, spawn the
//              tick loop. Throws on failure.
//   recover()  stop the loop, reconnect, reconcile with the exchange, run a
//              fresh tick, restart the loop. Throws on failure.
//   stop()     cooperative stop; returns once the loop has exited.
//   health()   cheap, thread-safe snapshot.
// -----------------------------------------------------------------------------
class ISupervisedSession {
 public:
  virtual ~ISupervisedSession() = default;

  virtual void start() = 0;
  virtual void recover() = 0;
  virtual void stop() = 0;
  virtual SessionHealth health() const = 0;
};

}  // namespace gridcore
