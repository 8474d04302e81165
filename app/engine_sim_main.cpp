#include "matching/engine_config.hpp"
#include "matching/json.hpp"
#include "matching/matching_engine.hpp"
#include "matching/types.hpp"
#include "utils/checked_math.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <future>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

using namespace matching;

using SteadyClock = std::chrono::steady_clock;

namespace {

struct Args {
    std::size_t   orders_per_producer = 0;
    std::uint32_t seed                = 0;
    std::size_t   producers           = 2;
    std::string   config_path;          // empty = built-in defaults
};

void print_usage() {
    std::cerr << "Usage: trading_engine_sim <orders_per_producer> <seed> "
                 "[--config CONFIG.json] [--producers N]\n";
}

std::optional<Args> parse_args(int argc, char** argv) {
    if (argc < 3) {
        return std::nullopt;
    }

    Args a;
    try {
        a.orders_per_producer = static_cast<std::size_t>(std::stoull(argv[1]));
        a.seed                = static_cast<std::uint32_t>(std::stoul(argv[2]));

        for (int i = 3; i < argc; ++i) {
            std::string k = argv[i];
            if (i + 1 >= argc) {
                std::cerr << "Missing value after " << k << "\n";
                return std::nullopt;
            }
            if (k == "--config") {
                a.config_path = argv[++i];
            } else if (k == "--producers") {
                a.producers = static_cast<std::size_t>(std::stoull(argv[++i]));
            } else {
                std::cerr << "Unknown option: " << k << "\n";
                return std::nullopt;
            }
        }
    } catch (const std::exception& ex) {
        std::cerr << "Bad argument: " << ex.what() << "\n";
        return std::nullopt;
    }

    if (a.producers == 0) {
        std::cerr << "--producers must be > 0\n";
        return std::nullopt;
    }
    return a;
}

EngineConfig default_config() {
    EngineConfig cfg;
    cfg.worker_threads = 2;
    cfg.instruments    = {"BTCUSDT", "ETHUSDT", "SOLUSDT"};
    return cfg;
}

// Per-instrument counters, filled from the trade handler (strand threads)
// and from the producers' futures.
struct InstrumentStats {
    std::size_t submitted       = 0;
    std::size_t rejected        = 0;
    std::size_t cancels_ok      = 0;
    std::size_t cancels_missed  = 0;
    std::size_t trades          = 0;
    utils::SaturatingSum traded_qty;
};

class SimReport {
public:
    explicit SimReport(const std::vector<std::string>& symbols) {
        for (const auto& s : symbols) {
            stats_.emplace(s, InstrumentStats{});
        }
    }

    void on_trades(const std::string& symbol, const std::vector<Trade>& trades) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& st = stats_.at(symbol);
        for (const auto& tr : trades) {
            ++st.trades;
            st.traded_qty.add(tr.quantity);
        }
    }

    template <typename Fn>
    void update(const std::string& symbol, Fn&& fn) {
        std::lock_guard<std::mutex> lock(mutex_);
        fn(stats_.at(symbol));
    }

    std::map<std::string, InstrumentStats> copy() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stats_;
    }

private:
    mutable std::mutex                     mutex_;
    std::map<std::string, InstrumentStats> stats_;
};

class TradeJournal {
public:
    explicit TradeJournal(const std::string& path)
        : out_(path, std::ios::out | std::ios::trunc) {
        if (!out_) {
            throw std::runtime_error("Failed to open trades journal: " + path);
        }
    }

    void write(const std::string& symbol, const std::vector<Trade>& trades) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& tr : trades) {
            nlohmann::json j = tr;
            j["symbol"] = symbol;
            out_ << j.dump() << "\n";
        }
    }

    void flush() {
        std::lock_guard<std::mutex> lock(mutex_);
        out_.flush();
    }

private:
    std::mutex    mutex_;
    std::ofstream out_;
};

// Random limit flow around a fixed mid per instrument. Order ids are unique
// across producers (shared counter), so DuplicateOrderId never fires here.
class OrderFlow {
public:
    OrderFlow(const std::vector<std::string>& symbols,
              std::atomic<OrderId>& next_id,
              std::uint32_t seed)
        : symbols_(symbols),
          next_id_(next_id),
          rng_(seed),
          symbol_dist_(0, symbols.size() - 1),
          action_dist_(0, 99),
          side_dist_(0, 1),
          offset_dist_(-2, 5),
          qty_dist_(1, 10)
    {}

    void run(MatchingEngine& engine, std::size_t num_orders, SimReport& report) {
        struct PendingAdd {
            std::string            symbol;
            std::future<AddResult> result;
        };
        struct PendingCancel {
            std::string              symbol;
            std::future<EngineError> result;
        };

        std::vector<PendingAdd>    adds;
        std::vector<PendingCancel> cancels;
        adds.reserve(num_orders);

        // (symbol, id) this producer may still cancel
        std::vector<std::pair<std::size_t, OrderId>> cancellable;

        constexpr Price MID = 1000;

        for (std::size_t i = 0; i < num_orders; ++i) {
            if (!cancellable.empty() && action_dist_(rng_) < 20) {
                std::uniform_int_distribution<std::size_t> idx_dist(0, cancellable.size() - 1);
                std::size_t idx = idx_dist(rng_);
                auto target     = cancellable[idx];
                cancellable[idx] = cancellable.back();
                cancellable.pop_back();

                const auto& sym = symbols_[target.first];
                cancels.push_back({sym, engine.cancel(sym, target.second)});
                continue;
            }

            std::size_t s = symbol_dist_(rng_);
            Order o;
            o.id       = next_id_.fetch_add(1, std::memory_order_relaxed);
            o.side     = (side_dist_(rng_) == 0) ? Side::Buy : Side::Sell;
            Price off  = offset_dist_(rng_);
            o.price    = (o.side == Side::Buy) ? MID - off : MID + off;
            o.quantity = qty_dist_(rng_);

            cancellable.emplace_back(s, o.id);
            adds.push_back({symbols_[s], engine.submit(symbols_[s], o)});
        }

        for (auto& p : adds) {
            AddResult res = p.result.get();
            report.update(p.symbol, [&](InstrumentStats& st) {
                ++st.submitted;
                if (!res.ok()) {
                    ++st.rejected;
                }
            });
        }
        for (auto& p : cancels) {
            EngineError err = p.result.get();
            report.update(p.symbol, [&](InstrumentStats& st) {
                if (err == EngineError::None) {
                    ++st.cancels_ok;
                } else {
                    ++st.cancels_missed;
                }
            });
        }
    }

private:
    const std::vector<std::string>& symbols_;
    std::atomic<OrderId>&           next_id_;

    std::mt19937_64 rng_;
    std::uniform_int_distribution<std::size_t> symbol_dist_;
    std::uniform_int_distribution<int>         action_dist_;
    std::uniform_int_distribution<int>         side_dist_;
    std::uniform_int_distribution<Price>       offset_dist_;
    std::uniform_int_distribution<Quantity>    qty_dist_;
};

void print_level(const char* label, const std::optional<Price>& px) {
    std::cout << label;
    if (px) {
        std::cout << *px;
    } else {
        std::cout << "-";
    }
}

} // namespace

int main(int argc, char** argv) {
    auto args = parse_args(argc, argv);
    if (!args) {
        print_usage();
        return 1;
    }

    try {
        EngineConfig cfg = args->config_path.empty()
                               ? default_config()
                               : load_engine_config(args->config_path);
        if (cfg.instruments.empty()) {
            std::cerr << "[sim] config lists no instruments\n";
            return 1;
        }

        std::cout << "[sim] workers=" << cfg.worker_threads
                  << " instruments=" << cfg.instruments.size()
                  << " producers=" << args->producers
                  << " orders/producer=" << args->orders_per_producer << "\n";

        MatchingEngine engine(cfg);
        SimReport      report(cfg.instruments);

        std::unique_ptr<TradeJournal> journal;
        if (!cfg.trade_journal.empty()) {
            journal = std::make_unique<TradeJournal>(cfg.trade_journal);
        }

        TradeJournal* journal_ptr = journal.get();
        engine.set_trade_handler(
            [&report, journal_ptr](const std::string& symbol, const std::vector<Trade>& trades) {
                report.on_trades(symbol, trades);
                if (journal_ptr != nullptr) {
                    journal_ptr->write(symbol, trades);
                }
            });

        std::atomic<OrderId> next_id{1};

        auto t_start = SteadyClock::now();

        std::vector<std::thread> producers;
        producers.reserve(args->producers);
        for (std::size_t p = 0; p < args->producers; ++p) {
            producers.emplace_back([&, p]() {
                OrderFlow flow(cfg.instruments, next_id,
                               args->seed + static_cast<std::uint32_t>(p));
                flow.run(engine, args->orders_per_producer, report);
            });
        }
        for (auto& t : producers) {
            t.join();
        }

        auto t_end = SteadyClock::now();
        auto total_ns =
            std::chrono::duration_cast<std::chrono::nanoseconds>(t_end - t_start).count();

        std::cout << "\n=== Engine simulation summary ===\n";
        for (const auto& [symbol, st] : report.copy()) {
            std::cout << symbol << ":\n";
            std::cout << "  orders submitted: " << st.submitted << " (rejected " << st.rejected << ")\n";
            std::cout << "  cancels         : " << st.cancels_ok << " ok, "
                      << st.cancels_missed << " not resting\n";
            std::cout << "  trades          : " << st.trades << " (qty " << st.traded_qty.value()
                      << (st.traded_qty.saturated() ? ", saturated" : "") << ")\n";

            auto bid = engine.best_bid(symbol).get();
            auto ask = engine.best_ask(symbol).get();
            print_level("  top of book     : bid ", bid);
            print_level(" / ask ", ask);
            std::cout << "\n";
            if (bid && ask && *bid >= *ask) {
                std::cerr << "[sim] crossed book on " << symbol << "\n";
            }
        }

        if (engine.trade_handler_failures() > 0) {
            std::cerr << "[sim] trade handler failed " << engine.trade_handler_failures()
                      << " times; journal is incomplete\n";
        }

        std::size_t total_orders = args->producers * args->orders_per_producer;
        std::cout << "\nWall time: " << static_cast<double>(total_ns) / 1e6 << " ms";
        if (total_ns > 0) {
            double throughput = static_cast<double>(total_orders) * 1e9 / static_cast<double>(total_ns);
            std::cout << " (" << static_cast<std::uint64_t>(throughput) << " requests/s)";
        }
        std::cout << "\n";

        engine.shutdown();
        if (journal) {
            journal->flush();
        }
        return 0;
    } catch (const std::exception& ex) {
        std::cerr << "[sim] error: " << ex.what() << "\n";
        return 1;
    }
}
