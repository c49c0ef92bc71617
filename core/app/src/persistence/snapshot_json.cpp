#include "gridcore/persistence/snapshot_json.hpp"
#include "gridcore/errors/errors.hpp"

#include <string>

namespace gridcore {

namespace {

// Bump when the layout changes incompatibly; loadState() rejects others.
constexpr int kSnapshotVersion = 1;

}  // namespace

namespace domain {

void to_json(nlohmann::json& j, const Order& o) {
  j = nlohmann::json{{"id", o.id},
                     {"symbol", o.symbol},
                     {"side", o.side},
                     {"type", o.type},
                     {"quantity", o.quantity},
                     {"price", o.price},
                     {"reduce_only", o.reduce_only},
                     {"status", o.status},
                     {"filled_quantity", o.filled_quantity}};
}

void from_json(const nlohmann::json& j, Order& o) {
  j.at("id").get_to(o.id);
  j.at("symbol").get_to(o.symbol);
  j.at("side").get_to(o.side);
  j.at("type").get_to(o.type);
  j.at("quantity").get_to(o.quantity);
  j.at("price").get_to(o.price);
  j.at("reduce_only").get_to(o.reduce_only);
  j.at("status").get_to(o.status);
  j.at("filled_quantity").get_to(o.filled_quantity);
}

void to_json(nlohmann::json& j, const Position& p) {
  j = nlohmann::json{{"symbol", p.symbol},
                     {"net_quantity", p.net_quantity},
                     {"average_price", p.average_price},
                     {"mark_price", p.mark_price},
                     {"unrealized_pnl", p.unrealized_pnl},
                     {"realized_pnl", p.realized_pnl},
                     {"leverage", p.leverage}};
}

void from_json(const nlohmann::json& j, Position& p) {
  j.at("symbol").get_to(p.symbol);
  j.at("net_quantity").get_to(p.net_quantity);
  j.at("average_price").get_to(p.average_price);
  j.at("mark_price").get_to(p.mark_price);
  j.at("unrealized_pnl").get_to(p.unrealized_pnl);
  j.at("realized_pnl").get_to(p.realized_pnl);
  j.at("leverage").get_to(p.leverage);
}

void to_json(nlohmann::json& j, const RiskState& r) {
  j = nlohmann::json{{"peak_equity", r.peak_equity},
                     {"current_equity", r.current_equity},
                     {"drawdown_percent", r.drawdown_percent},
                     {"max_drawdown_percent", r.max_drawdown_percent},
                     {"margin_ratio_percent", r.margin_ratio_percent},
                     {"breakeven_armed", r.breakeven_armed},
                     {"partial_profit_taken", r.partial_profit_taken},
                     {"kill_switch_armed", r.kill_switch_armed},
                     {"wind_down_pending", r.wind_down_pending},
                     {"breakeven_stop_price", r.breakeven_stop_price},
                     {"breakeven_stop_quantity", r.breakeven_stop_quantity},
                     {"breakeven_stop_order_id", r.breakeven_stop_order_id}};
}

void from_json(const nlohmann::json& j, RiskState& r) {
  j.at("peak_equity").get_to(r.peak_equity);
  j.at("current_equity").get_to(r.current_equity);
  j.at("drawdown_percent").get_to(r.drawdown_percent);
  // Absent from files written before these fields existed.
  r.max_drawdown_percent = j.value("max_drawdown_percent", r.drawdown_percent);
  r.margin_ratio_percent = j.value("margin_ratio_percent", 0.0);
  j.at("breakeven_armed").get_to(r.breakeven_armed);
  j.at("partial_profit_taken").get_to(r.partial_profit_taken);
  j.at("kill_switch_armed").get_to(r.kill_switch_armed);
  r.wind_down_pending = j.value("wind_down_pending", false);
  j.at("breakeven_stop_price").get_to(r.breakeven_stop_price);
  j.at("breakeven_stop_quantity").get_to(r.breakeven_stop_quantity);
  j.at("breakeven_stop_order_id").get_to(r.breakeven_stop_order_id);
}

void to_json(nlohmann::json& j, const GridLevel& l) {
  j = nlohmann::json{{"index", l.index},
                     {"price", l.price},
                     {"side", l.side},
                     {"size", l.size},
                     {"order_id", l.order_id},
                     {"state", l.state},
                     {"filled_quantity", l.filled_quantity},
                     {"rejections", l.rejections},
                     {"cycles", l.cycles}};
}

void from_json(const nlohmann::json& j, GridLevel& l) {
  j.at("index").get_to(l.index);
  j.at("price").get_to(l.price);
  j.at("side").get_to(l.side);
  j.at("size").get_to(l.size);
  j.at("order_id").get_to(l.order_id);
  j.at("state").get_to(l.state);
  j.at("filled_quantity").get_to(l.filled_quantity);
  j.at("rejections").get_to(l.rejections);
  j.at("cycles").get_to(l.cycles);
}

void to_json(nlohmann::json& j, const DcaLadderEntry& e) {
  j = nlohmann::json{{"sequence", e.sequence},
                     {"trigger_price", e.trigger_price},
                     {"size_multiplier", e.size_multiplier},
                     {"size", e.size},
                     {"order_id", e.order_id},
                     {"status", e.status},
                     {"filled_quantity", e.filled_quantity}};
}

void from_json(const nlohmann::json& j, DcaLadderEntry& e) {
  j.at("sequence").get_to(e.sequence);
  j.at("trigger_price").get_to(e.trigger_price);
  j.at("size_multiplier").get_to(e.size_multiplier);
  j.at("size").get_to(e.size);
  j.at("order_id").get_to(e.order_id);
  j.at("status").get_to(e.status);
  j.at("filled_quantity").get_to(e.filled_quantity);
}

void to_json(nlohmann::json& j, const Fill& f) {
  j = nlohmann::json{{"order_id", f.order_id},
                     {"symbol", f.symbol},
                     {"side", f.side},
                     {"price", f.price},
                     {"quantity", f.quantity},
                     {"timestamp_ms", f.timestamp_ms}};
}

void from_json(const nlohmann::json& j, Fill& f) {
  j.at("order_id").get_to(f.order_id);
  j.at("symbol").get_to(f.symbol);
  j.at("side").get_to(f.side);
  j.at("price").get_to(f.price);
  j.at("quantity").get_to(f.quantity);
  j.at("timestamp_ms").get_to(f.timestamp_ms);
}

}  // namespace domain

void to_json(nlohmann::json& j, const TrackedOrder& t) {
  j = nlohmann::json{{"order", t.order}, {"owner", t.owner}, {"slot", t.slot}};
}

void from_json(const nlohmann::json& j, TrackedOrder& t) {
  j.at("order").get_to(t.order);
  j.at("owner").get_to(t.owner);
  j.at("slot").get_to(t.slot);
}

void to_json(nlohmann::json& j, const GridSnapshot& g) {
  j = nlohmann::json{{"reference_price", g.reference_price},
                     {"lower_price", g.lower_price},
                     {"upper_price", g.upper_price},
                     {"levels", g.levels}};
}

void from_json(const nlohmann::json& j, GridSnapshot& g) {
  j.at("reference_price").get_to(g.reference_price);
  j.at("lower_price").get_to(g.lower_price);
  j.at("upper_price").get_to(g.upper_price);
  j.at("levels").get_to(g.levels);
}

void to_json(nlohmann::json& j, const DcaSnapshot& d) {
  j = nlohmann::json{{"reference_price", d.reference_price},
                     {"next_sequence", d.next_sequence},
                     {"entries", d.entries}};
}

void from_json(const nlohmann::json& j, DcaSnapshot& d) {
  j.at("reference_price").get_to(d.reference_price);
  j.at("next_sequence").get_to(d.next_sequence);
  j.at("entries").get_to(d.entries);
}

void to_json(nlohmann::json& j, const SessionSnapshot& s) {
  j = nlohmann::json{{"version", kSnapshotVersion},
                     {"symbol", s.symbol},
                     {"tick_sequence", s.tick_sequence},
                     {"timestamp_ms", s.timestamp_ms},
                     {"last_price", s.last_price},
                     {"equity", s.equity},
                     {"position", s.position},
                     {"risk", s.risk},
                     {"grid", s.grid},
                     {"dca", s.dca},
                     {"open_orders", s.open_orders}};
}

void from_json(const nlohmann::json& j, SessionSnapshot& s) {
  int version = j.at("version").get<int>();
  if (version != kSnapshotVersion) {
    throw StateStoreError("unsupported snapshot version " +
                          std::to_string(version));
  }
  j.at("symbol").get_to(s.symbol);
  j.at("tick_sequence").get_to(s.tick_sequence);
  j.at("timestamp_ms").get_to(s.timestamp_ms);
  j.at("last_price").get_to(s.last_price);
  j.at("equity").get_to(s.equity);
  j.at("position").get_to(s.position);
  j.at("risk").get_to(s.risk);
  j.at("grid").get_to(s.grid);
  j.at("dca").get_to(s.dca);
  j.at("open_orders").get_to(s.open_orders);
}

void to_json(nlohmann::json& j, const TradeRecord& t) {
  j = nlohmann::json(t.fill);
  j["owner"] = t.owned ? nlohmann::json(t.owner) : nlohmann::json(nullptr);
}

void from_json(const nlohmann::json& j, TradeRecord& t) {
  j.get_to(t.fill);
  const nlohmann::json& owner = j.at("owner");
  t.owned = !owner.is_null();
  if (t.owned) {
    owner.get_to(t.owner);
  }
}

void to_json(nlohmann::json& j, const EquityRecord& e) {
  j = nlohmann::json{{"timestamp_ms", e.timestamp_ms},
                     {"balance", e.balance},
                     {"equity", e.equity},
                     {"unrealized_pnl", e.unrealized_pnl},
                     {"realized_pnl", e.realized_pnl},
                     {"drawdown_percent", e.drawdown_percent},
                     {"margin_ratio_percent", e.margin_ratio_percent}};
}

void from_json(const nlohmann::json& j, EquityRecord& e) {
  j.at("timestamp_ms").get_to(e.timestamp_ms);
  j.at("balance").get_to(e.balance);
  j.at("equity").get_to(e.equity);
  j.at("unrealized_pnl").get_to(e.unrealized_pnl);
  j.at("realized_pnl").get_to(e.realized_pnl);
  j.at("drawdown_percent").get_to(e.drawdown_percent);
  j.at("margin_ratio_percent").get_to(e.margin_ratio_percent);
}

}  // namespace gridcore
