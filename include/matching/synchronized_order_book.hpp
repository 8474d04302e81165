#pragma once

#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

#include "matching/order_book.hpp"

namespace matching {

/**
 * OrderBook behind one reader/writer lock.
 *
 * add_order / cancel_order hold the exclusive lock for the whole matching
 * loop; queries hold the shared lock, so they never see a half-applied match.
 */
class SynchronizedOrderBook
{
public:
    explicit SynchronizedOrderBook(std::string symbol = {}, OrderBook::Clock clock = {})
        : book_(std::move(symbol), std::move(clock))
    {}

    SynchronizedOrderBook(const SynchronizedOrderBook&)            = delete;
    SynchronizedOrderBook& operator=(const SynchronizedOrderBook&) = delete;

    AddResult add_order(const Order& order)
    {
        std::unique_lock lock(mutex_);
        return book_.add_order(order);
    }

    EngineError cancel_order(OrderId id)
    {
        std::unique_lock lock(mutex_);
        return book_.cancel_order(id);
    }

    std::optional<Price> best_bid() const
    {
        std::shared_lock lock(mutex_);
        return book_.best_bid();
    }

    std::optional<Price> best_ask() const
    {
        std::shared_lock lock(mutex_);
        return book_.best_ask();
    }

    std::optional<Price> spread() const
    {
        std::shared_lock lock(mutex_);
        return book_.spread();
    }

    LevelInfo top_of_book(Side side) const
    {
        std::shared_lock lock(mutex_);
        return book_.top_of_book(side);
    }

    Quantity depth_at(Side side, Price price) const
    {
        std::shared_lock lock(mutex_);
        return book_.depth_at(side, price);
    }

    std::vector<LevelInfo> snapshot(Side side, std::size_t max_levels = 0) const
    {
        std::shared_lock lock(mutex_);
        return book_.snapshot(side, max_levels);
    }

    std::size_t order_count() const
    {
        std::shared_lock lock(mutex_);
        return book_.order_count();
    }

    /// Run `fn(const OrderBook&)` under the shared lock.
    template <typename Fn>
    decltype(auto) read(Fn&& fn) const
    {
        std::shared_lock lock(mutex_);
        return std::forward<Fn>(fn)(static_cast<const OrderBook&>(book_));
    }

private:
    mutable std::shared_mutex mutex_;
    OrderBook                 book_;
};

} // namespace matching
