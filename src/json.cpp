#include "matching/json.hpp"

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>

using nlohmann::json;

namespace matching {

namespace {

[[noreturn]] void bad_field(const char* key, const char* expected, const json& v)
{
    throw std::invalid_argument(std::string("field '") + key + "' must be " + expected +
                                ", got " + v.type_name() + ": " + v.dump());
}

// json::get<int64_t>() silently truncates 12.5 -> 12; money must not.
std::int64_t get_integer(const json& j, const char* key)
{
    const auto& v = j.at(key);
    if (!v.is_number_integer()) {
        bad_field(key, "an integer", v);
    }
    if (v.is_number_unsigned() &&
        v.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
        bad_field(key, "a 64-bit signed integer", v);
    }
    return v.get<std::int64_t>();
}

std::uint64_t get_id(const json& j, const char* key)
{
    const auto& v = j.at(key);
    // json{{"id", 5}} stores a signed integer; only its sign matters
    if (!v.is_number_integer() || (!v.is_number_unsigned() && v.get<std::int64_t>() < 0)) {
        bad_field(key, "a non-negative integer", v);
    }
    return v.get<std::uint64_t>();
}

} // namespace

void to_json(json& j, Side side)
{
    j = to_string(side);
}

void from_json(const json& j, Side& side)
{
    const auto s = j.get<std::string>();
    if (s == "BUY") {
        side = Side::Buy;
    } else if (s == "SELL") {
        side = Side::Sell;
    } else {
        throw std::invalid_argument("unknown side: " + s);
    }
}

void to_json(json& j, const Order& order)
{
    j = json{
        {"id",        order.id},
        {"side",      order.side},
        {"price",     order.price},
        {"quantity",  order.quantity},
        {"timestamp", order.timestamp},
    };
}

void from_json(const json& j, Order& order)
{
    order.id        = get_id(j, "id");
    order.side      = j.at("side").get<Side>();
    order.price     = get_integer(j, "price");
    order.quantity  = get_integer(j, "quantity");
    order.timestamp = j.contains("timestamp") ? get_integer(j, "timestamp") : 0;
}

void to_json(json& j, const Trade& trade)
{
    j = json{
        {"trade_id",       trade.trade_id},
        {"maker_order_id", trade.maker_order_id},
        {"taker_order_id", trade.taker_order_id},
        {"taker_side",     trade.taker_side},
        {"price",          trade.price},
        {"quantity",       trade.quantity},
        {"timestamp",      trade.timestamp},
    };
}

void from_json(const json& j, Trade& trade)
{
    trade.trade_id       = get_id(j, "trade_id");
    trade.maker_order_id = get_id(j, "maker_order_id");
    trade.taker_order_id = get_id(j, "taker_order_id");
    trade.taker_side     = j.at("taker_side").get<Side>();
    trade.price          = get_integer(j, "price");
    trade.quantity       = get_integer(j, "quantity");
    trade.timestamp      = get_integer(j, "timestamp");
}

void to_json(json& j, const LevelInfo& level)
{
    j = json{
        {"price",  level.price},
        {"qty",    level.qty},
        {"orders", level.orders},
    };
}

} // namespace matching
