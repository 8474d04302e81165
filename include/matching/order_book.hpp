#pragma once

#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "matching/types.hpp"

namespace matching {

/**
 * In-memory limit order book for a single instrument with price-time priority.
 *
 * Design
 *  - Two price books:
 *      * bids_ : Price -> Level, ordered by std::greater (best bid at begin()).
 *      * asks_ : Price -> Level, ordered by std::less   (best ask at begin()).
 *  - Each Level keeps a FIFO of indices into a flat vector<Slot> slots_,
 *    plus the aggregated quantity and number of live orders at that price.
 *  - id_to_index_ maps a resting OrderId to its slot, so cancel touches only
 *    the order's own level.
 *  - Cancelled slots stay in their level queue as tombstones until the
 *    matching loop pops them, the level is compacted (tombstones outnumber
 *    live orders) or the level is erased; only then the slot goes back to
 *    free_indices_.
 *
 * All methods are NOT thread-safe; use SynchronizedOrderBook or
 * MatchingEngine when the book is shared between threads.
 */
class OrderBook
{
public:
    using Clock = std::function<Timestamp()>;

    /// An empty clock means wall-clock nanoseconds (std::chrono::system_clock).
    explicit OrderBook(std::string symbol = {}, Clock clock = {});

    const std::string& symbol() const noexcept { return symbol_; }

    /// True if there are no resting bids and asks.
    bool empty() const noexcept;

    /// Remove all orders and trades and restart trade ids at 1.
    void clear() noexcept;

    /// Match `order` against the opposite side, then rest any remainder.
    ///
    /// Rejected with InvalidOrder (price or quantity <= 0, or a quantity that
    /// would overflow the total of its own price level) or DuplicateOrderId
    /// (id already resting) before any matching; a rejected order leaves the
    /// book untouched.
    AddResult add_order(Order order);

    /// Remove a resting order. OrderNotFound if the id is not resting.
    EngineError cancel_order(OrderId id);

    std::optional<Price> best_bid() const noexcept;
    std::optional<Price> best_ask() const noexcept;

    /// best_ask - best_bid, absent unless both sides are non-empty.
    std::optional<Price> spread() const noexcept;

    /// Aggregated best level of a side; valid == false when the side is empty.
    LevelInfo top_of_book(Side side) const noexcept;

    /// Total resting quantity at `price` (0 when there is no such level).
    Quantity depth_at(Side side, Price price) const noexcept;

    std::size_t level_count(Side side) const noexcept;
    std::size_t order_count() const noexcept { return id_to_index_.size(); }

    /// Order slots allocated so far, live or free.
    std::size_t slot_capacity() const noexcept { return slots_.size(); }

    /// Levels from best to worse. max_levels == 0 returns every level.
    std::vector<LevelInfo> snapshot(Side side, std::size_t max_levels = 0) const;

    /// Resting order with its current remaining quantity.
    std::optional<Order> find_order(OrderId id) const;

    /// Every trade produced by this book, in match order.
    const std::vector<Trade>& trades() const noexcept { return trade_log_; }

private:
    struct Slot
    {
        Order order;
        bool  active{false};
    };

    using OrderIndex = std::uint32_t;

    struct Level
    {
        std::deque<OrderIndex> queue;  // FIFO, may hold tombstones
        Quantity               total_qty{0};
        std::size_t            live{0};
    };

    using BidBook = std::map<Price, Level, std::greater<Price>>;
    using AskBook = std::map<Price, Level, std::less<Price>>;

    Timestamp now() const;

    OrderIndex allocate_slot();
    void       release_slot(OrderIndex idx);

    /// Release every slot still queued on a level that is being erased.
    void release_level(Level& level);

    /// Pop tombstones from the front of a level queue.
    void prune_front(Level& level);

    /// Drop every tombstone of a level once they outnumber its live orders.
    void compact_level(Level& level);

    /// Core matching routine: fills `taker` against book until its quantity
    /// is 0 or should_cross(level_price) returns false. Appends one Trade per
    /// fill to `out`.
    template <typename Book, typename PricePredicate>
    void match_on_book(Book& book, Order& taker, PricePredicate&& should_cross,
                       Timestamp ts, std::vector<Trade>& out);

    template <typename Book>
    void rest_order(Book& book, const Order& order);

    static LevelInfo make_level_info(Price price, const Level& level) noexcept;

    template <typename Book>
    std::vector<LevelInfo> collect_levels(const Book& book, std::size_t max_levels) const;

    std::string symbol_;
    Clock       clock_;

    BidBook bids_;
    AskBook asks_;

    std::vector<Slot>       slots_;         // indexed by OrderIndex (0-based)
    std::vector<OrderIndex> free_indices_;  // free slots for reuse
    std::unordered_map<OrderId, OrderIndex> id_to_index_;

    std::vector<Trade> trade_log_;

    TradeId next_trade_id_{1};
};

} // namespace matching
