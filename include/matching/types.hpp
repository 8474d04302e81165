#pragma once

#include <cstddef>
#include <cstdint>
#include <type_traits>
#include <vector>

#include "matching/errors.hpp"

namespace matching {

// Money and size are integers only: price in minimal currency units (ticks).
using Price     = std::int64_t;
using Quantity  = std::int64_t;
using OrderId   = std::uint64_t;
using TradeId   = std::uint64_t;
using Timestamp = std::int64_t;   // ns since epoch

enum class Side : std::uint8_t {
    Buy,
    Sell
};

const char* to_string(Side side) noexcept;

struct Order {
    OrderId   id{0};
    Side      side{Side::Buy};
    Price     price{0};
    Quantity  quantity{0};   // remaining
    Timestamp timestamp{0};  // 0 = stamped by the book on submission
};

struct Trade {
    TradeId   trade_id{0};
    OrderId   maker_order_id{0};  // resting order
    OrderId   taker_order_id{0};  // incoming order
    Side      taker_side{Side::Buy};
    Price     price{0};           // always the maker's price
    Quantity  quantity{0};
    Timestamp timestamp{0};

    OrderId buy_order_id() const noexcept
    {
        return taker_side == Side::Buy ? taker_order_id : maker_order_id;
    }

    OrderId sell_order_id() const noexcept
    {
        return taker_side == Side::Sell ? taker_order_id : maker_order_id;
    }
};

// Aggregated view of one price level.
struct LevelInfo {
    Price       price{};
    Quantity    qty{};
    std::size_t orders{0};
    bool        valid{false};
};

struct AddResult {
    EngineError        error{EngineError::None};
    std::vector<Trade> trades;  // in match order
    Quantity           requested{0};
    Quantity           filled{0};
    Quantity           remaining{0};
    bool               rested{false};

    bool ok() const noexcept { return error == EngineError::None; }
};

static_assert(std::is_signed_v<Price>);
static_assert(std::is_signed_v<Quantity>);
static_assert(sizeof(Price) == 8 && sizeof(Quantity) == 8);

} // namespace matching
