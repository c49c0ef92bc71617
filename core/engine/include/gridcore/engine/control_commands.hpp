#pragma once

#include "gridcore/engine/trading_session.hpp"
#include "gridcore/supervisor/supervisor.hpp"

#include <string>

namespace gridcore {

// -----------------------------------------------------------------------------
// handleControlCommand(cmd, session, supervisor)
// -----------------------------------------------------------------------------
//
// @brief  Executes one operator command received over IPC and returns the
//         JSON reply.
//
// @details
//   PING    {"status":"ok","response":"PONG"}
//   STATUS  supervisor state and health, position, risk state, grid and
//           DCA counters from the last published snapshot
//   PERFORMANCE  account performance as of the last tick (initial capital,
//           balance, total return, realized and unrealized PnL, drawdown
//           and its maximum, margin ratio) plus the ten newest trades
//   HALT    operator kill switch: cancel all, flatten, session ends
//   STOP    graceful shutdown through the supervisor
//
// Anything else yields {"status":"error", ...}. Leading and trailing
// whitespace is ignored.
//
// Thread-safety: only touches the thread-safe surface of both arguments,
// so it may run on the IPC worker thread.
// -----------------------------------------------------------------------------
std::string handleControlCommand(const std::string& command,
                                 TradingSession& session,
                                 Supervisor& supervisor);

}  // namespace gridcore
