#pragma once

#include "gridcore/persistence/journal_records.hpp"
#include "gridcore/persistence/session_snapshot.hpp"

#include <nlohmann/json.hpp>

// JSON mapping of the persisted types. Free functions live next to the
// types (ADL) so nlohmann::json converts them implicitly.

namespace gridcore {
namespace domain {

NLOHMANN_JSON_SERIALIZE_ENUM(Side, {
    {Side::Buy, "Buy"},
    {Side::Sell, "Sell"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(OrderType, {
    {OrderType::Limit, "Limit"},
    {OrderType::Market, "Market"},
    {OrderType::Stop, "Stop"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(OrderStatus, {
    {OrderStatus::Accepted, "Accepted"},
    {OrderStatus::PartiallyFilled, "PartiallyFilled"},
    {OrderStatus::Filled, "Filled"},
    {OrderStatus::Canceled, "Canceled"},
    {OrderStatus::Rejected, "Rejected"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(GridLevelState, {
    {GridLevelState::Pending, "Pending"},
    {GridLevelState::Open, "Open"},
    {GridLevelState::Filled, "Filled"},
    {GridLevelState::Cancelled, "Cancelled"},
    {GridLevelState::Parked, "Parked"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(DcaEntryStatus, {
    {DcaEntryStatus::Pending, "Pending"},
    {DcaEntryStatus::Open, "Open"},
    {DcaEntryStatus::Filled, "Filled"},
    {DcaEntryStatus::Rejected, "Rejected"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(IntentSource, {
    {IntentSource::Grid, "Grid"},
    {IntentSource::Dca, "Dca"},
    {IntentSource::Risk, "Risk"},
})

void to_json(nlohmann::json& j, const Order& o);
void from_json(const nlohmann::json& j, Order& o);

void to_json(nlohmann::json& j, const Position& p);
void from_json(const nlohmann::json& j, Position& p);

void to_json(nlohmann::json& j, const RiskState& r);
void from_json(const nlohmann::json& j, RiskState& r);

void to_json(nlohmann::json& j, const GridLevel& l);
void from_json(const nlohmann::json& j, GridLevel& l);

void to_json(nlohmann::json& j, const DcaLadderEntry& e);
void from_json(const nlohmann::json& j, DcaLadderEntry& e);

void to_json(nlohmann::json& j, const Fill& f);
void from_json(const nlohmann::json& j, Fill& f);

}  // namespace domain

void to_json(nlohmann::json& j, const TrackedOrder& t);
void from_json(const nlohmann::json& j, TrackedOrder& t);

void to_json(nlohmann::json& j, const GridSnapshot& g);
void from_json(const nlohmann::json& j, GridSnapshot& g);

void to_json(nlohmann::json& j, const DcaSnapshot& d);
void from_json(const nlohmann::json& j, DcaSnapshot& d);

void to_json(nlohmann::json& j, const SessionSnapshot& s);
void from_json(const nlohmann::json& j, SessionSnapshot& s);

void to_json(nlohmann::json& j, const TradeRecord& t);
void from_json(const nlohmann::json& j, TradeRecord& t);

void to_json(nlohmann::json& j, const EquityRecord& e);
void from_json(const nlohmann::json& j, EquityRecord& e);

}  // namespace gridcore
