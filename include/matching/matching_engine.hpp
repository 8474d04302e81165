#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <boost/asio/thread_pool.hpp>

#include "matching/engine_config.hpp"
#include "matching/order_book.hpp"

namespace matching {

/**
 * Multi-instrument front end.
 *
 * Every instrument owns an OrderBook and a Boost.Asio strand on a shared
 * thread pool. All requests for one symbol run on its strand, one at a time
 * and in submission order; different symbols run in parallel.
 *
 * Results come back as futures. Calling get() on one of them from inside a
 * trade handler of the same instrument deadlocks.
 */
class MatchingEngine
{
public:
    /// Called on the instrument's strand with the trades of one add_order,
    /// in match order. Hand-off point for journaling and fill notification.
    /// An exception thrown by the handler is logged and counted; the
    /// submitter still receives its AddResult.
    using TradeHandler =
        std::function<void(const std::string& symbol, const std::vector<Trade>& trades)>;

    explicit MatchingEngine(std::size_t worker_threads = 1, OrderBook::Clock clock = {});

    /// Creates the pool with config.worker_threads and a book per instrument.
    explicit MatchingEngine(const EngineConfig& config, OrderBook::Clock clock = {});

    ~MatchingEngine();

    MatchingEngine(const MatchingEngine&)            = delete;
    MatchingEngine& operator=(const MatchingEngine&) = delete;

    /// Returns false if the symbol is already registered.
    bool add_instrument(const std::string& symbol);
    bool has_instrument(const std::string& symbol) const;
    std::vector<std::string> instruments() const;

    void set_trade_handler(TradeHandler handler);

    /// Number of trade handler calls that threw.
    std::size_t trade_handler_failures() const noexcept;

    /// UnknownInstrument (ready immediately) if the symbol is not registered.
    std::future<AddResult>   submit(const std::string& symbol, Order order);
    std::future<EngineError> cancel(const std::string& symbol, OrderId id);

    /// Queries are ordered with mutations on the same strand.
    /// An unknown symbol yields an empty optional / empty vector.
    std::future<std::optional<Price>>   best_bid(const std::string& symbol) const;
    std::future<std::optional<Price>>   best_ask(const std::string& symbol) const;
    std::future<std::vector<LevelInfo>> snapshot(const std::string& symbol, Side side,
                                                 std::size_t max_levels = 0) const;

    /// Finish queued work and join the workers. Requests made afterwards
    /// fail with std::runtime_error stored in the returned future.
    void shutdown();

private:
    struct Instrument;

    Instrument* find_locked(const std::string& symbol) const;

    /// Run fn(book, trade_handler) on the symbol's strand; `if_unknown` is the
    /// immediate result for an unregistered symbol.
    template <typename R, typename Fn>
    std::future<R> dispatch(const std::string& symbol, R if_unknown, Fn fn) const;

    OrderBook::Clock clock_;

    boost::asio::thread_pool pool_;
    std::atomic<bool>        stopped_{false};
    std::atomic<std::size_t> handler_failures_{0};

    mutable std::shared_mutex registry_mutex_;
    std::unordered_map<std::string, std::unique_ptr<Instrument>> instruments_;
    std::shared_ptr<const TradeHandler> trade_handler_;
};

} // namespace matching
