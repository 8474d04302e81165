#include "matching/matching_engine.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>

#include <exception>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <utility>

namespace matching {

namespace net = boost::asio;

struct MatchingEngine::Instrument
{
    Instrument(net::thread_pool::executor_type ex, const std::string& symbol,
               OrderBook::Clock clock)
        : strand(net::make_strand(ex))
        , book(symbol, std::move(clock))
    {}

    net::strand<net::thread_pool::executor_type> strand;
    OrderBook                                    book;
};

MatchingEngine::MatchingEngine(std::size_t worker_threads, OrderBook::Clock clock)
    : clock_(std::move(clock))
    , pool_(worker_threads == 0 ? 1 : worker_threads)
{
}

MatchingEngine::MatchingEngine(const EngineConfig& config, OrderBook::Clock clock)
    : MatchingEngine(config.worker_threads, std::move(clock))
{
    for (const auto& symbol : config.instruments) {
        add_instrument(symbol);
    }
}

MatchingEngine::~MatchingEngine()
{
    shutdown();
}

bool MatchingEngine::add_instrument(const std::string& symbol)
{
    std::unique_lock lock(registry_mutex_);
    if (instruments_.count(symbol) != 0) {
        return false;
    }

    instruments_.emplace(symbol,
                         std::make_unique<Instrument>(pool_.get_executor(), symbol, clock_));
    return true;
}

bool MatchingEngine::has_instrument(const std::string& symbol) const
{
    std::shared_lock lock(registry_mutex_);
    return find_locked(symbol) != nullptr;
}

std::vector<std::string> MatchingEngine::instruments() const
{
    std::shared_lock lock(registry_mutex_);
    std::vector<std::string> out;
    out.reserve(instruments_.size());
    for (const auto& kv : instruments_) {
        out.push_back(kv.first);
    }
    return out;
}

void MatchingEngine::set_trade_handler(TradeHandler handler)
{
    auto ptr = std::make_shared<const TradeHandler>(std::move(handler));
    std::unique_lock lock(registry_mutex_);
    trade_handler_ = std::move(ptr);
}

MatchingEngine::Instrument* MatchingEngine::find_locked(const std::string& symbol) const
{
    auto it = instruments_.find(symbol);
    return it == instruments_.end() ? nullptr : it->second.get();
}

template <typename R, typename Fn>
std::future<R> MatchingEngine::dispatch(const std::string& symbol, R if_unknown, Fn fn) const
{
    // Shared lock spans the stopped_ check and the post, so shutdown() can
    // not join the pool between them.
    std::shared_lock lock(registry_mutex_);

    if (stopped_.load(std::memory_order_acquire)) {
        std::promise<R> p;
        p.set_exception(std::make_exception_ptr(
            std::runtime_error("MatchingEngine is shut down")));
        return p.get_future();
    }

    Instrument* inst = find_locked(symbol);
    if (inst == nullptr) {
        std::promise<R> p;
        p.set_value(std::move(if_unknown));
        return p.get_future();
    }

    auto handler = trade_handler_;
    auto task    = std::make_shared<std::packaged_task<R()>>(
        [inst, handler, fn = std::move(fn)]() mutable {
            return fn(inst->book, handler.get());
        });

    auto fut = task->get_future();
    net::post(inst->strand, [task]() { (*task)(); });
    return fut;
}

std::future<AddResult> MatchingEngine::submit(const std::string& symbol, Order order)
{
    AddResult unknown;
    unknown.error     = EngineError::UnknownInstrument;
    unknown.requested = order.quantity;

    return dispatch(symbol, std::move(unknown),
        [this, order](OrderBook& book, const TradeHandler* on_trades) {
            AddResult res = book.add_order(order);
            if (on_trades != nullptr && *on_trades && !res.trades.empty()) {
                // The order has executed; its result is returned even if
                // the handler throws.
                try {
                    (*on_trades)(book.symbol(), res.trades);
                } catch (const std::exception& ex) {
                    handler_failures_.fetch_add(1, std::memory_order_relaxed);
                    std::cerr << "[engine] trade handler failed on " << book.symbol()
                              << " for order " << order.id << ": " << ex.what() << "\n";
                }
            }
            return res;
        });
}

std::future<EngineError> MatchingEngine::cancel(const std::string& symbol, OrderId id)
{
    return dispatch(symbol, EngineError::UnknownInstrument,
        [id](OrderBook& book, const TradeHandler*) {
            return book.cancel_order(id);
        });
}

std::future<std::optional<Price>> MatchingEngine::best_bid(const std::string& symbol) const
{
    return dispatch(symbol, std::optional<Price>{},
        [](OrderBook& book, const TradeHandler*) { return book.best_bid(); });
}

std::future<std::optional<Price>> MatchingEngine::best_ask(const std::string& symbol) const
{
    return dispatch(symbol, std::optional<Price>{},
        [](OrderBook& book, const TradeHandler*) { return book.best_ask(); });
}

std::future<std::vector<LevelInfo>> MatchingEngine::snapshot(const std::string& symbol,
                                                             Side side,
                                                             std::size_t max_levels) const
{
    return dispatch(symbol, std::vector<LevelInfo>{},
        [side, max_levels](OrderBook& book, const TradeHandler*) {
            return book.snapshot(side, max_levels);
        });
}

std::size_t MatchingEngine::trade_handler_failures() const noexcept
{
    return handler_failures_.load(std::memory_order_relaxed);
}

void MatchingEngine::shutdown()
{
    {
        std::unique_lock lock(registry_mutex_);
        if (stopped_.exchange(true, std::memory_order_acq_rel)) {
            return;
        }
    }

    // No stop(): join() returns once every queued handler has run.
    pool_.join();
}

} // namespace matching
