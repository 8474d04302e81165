#pragma once

#include <nlohmann/json.hpp>

#include "matching/types.hpp"

namespace matching {

// nlohmann::json ADL hooks. Prices, quantities and ids must be JSON integers;
// floats, strings and out-of-range values throw std::invalid_argument, a
// missing key throws nlohmann::json::out_of_range.
//
//   Order     {"id","side","price","quantity","timestamp"}
//   Trade     {"trade_id","maker_order_id","taker_order_id","taker_side",
//              "price","quantity","timestamp"}
//   LevelInfo {"price","qty","orders"}
//   Side      "BUY" | "SELL"

void to_json(nlohmann::json& j, Side side);
void from_json(const nlohmann::json& j, Side& side);

void to_json(nlohmann::json& j, const Order& order);
void from_json(const nlohmann::json& j, Order& order);

void to_json(nlohmann::json& j, const Trade& trade);
void from_json(const nlohmann::json& j, Trade& trade);

void to_json(nlohmann::json& j, const LevelInfo& level);

} // namespace matching
