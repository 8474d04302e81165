#include "matching/event.hpp"
#include "matching/json.hpp"
#include "matching/order_book.hpp"
#include "matching/types.hpp"
#include "utils/checked_math.hpp"
#include "utils/spsc_queue.hpp"

#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

using namespace matching;

namespace {

struct Args {
    std::string events_path;        // "-" = stdin
    std::string symbol = "SIM";
    std::string trades_out;         // JSON lines, empty = no journal
    bool        pipeline = false;   // reader thread + matching thread
    std::size_t depth    = 5;       // levels printed at the end
};

void print_usage() {
    std::cerr << "Usage: trading_replay <events_file|-> [--symbol SYM] "
                 "[--trades-out TRADES.jsonl] [--pipeline] [--depth N]\n";
}

std::optional<Args> parse_args(int argc, char** argv) {
    if (argc < 2) {
        return std::nullopt;
    }

    Args a;
    a.events_path = argv[1];

    for (int i = 2; i < argc; ++i) {
        std::string k = argv[i];
        auto need = [&](const char* opt) -> std::optional<std::string> {
            if (i + 1 >= argc) {
                std::cerr << "Missing value after " << opt << "\n";
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };

        if (k == "--symbol") {
            auto v = need("--symbol");
            if (!v) return std::nullopt;
            a.symbol = *v;
        } else if (k == "--trades-out") {
            auto v = need("--trades-out");
            if (!v) return std::nullopt;
            a.trades_out = *v;
        } else if (k == "--depth") {
            auto v = need("--depth");
            if (!v) return std::nullopt;
            try {
                a.depth = static_cast<std::size_t>(std::stoull(*v));
            } catch (const std::exception&) {
                std::cerr << "Bad --depth value: " << *v << "\n";
                return std::nullopt;
            }
        } else if (k == "--pipeline") {
            a.pipeline = true;
        } else {
            std::cerr << "Unknown option: " << k << "\n";
            return std::nullopt;
        }
    }
    return a;
}

// --------- stats struct ---------

struct ReplayStats {
    std::size_t lines_skipped = 0;
    std::size_t add_count     = 0;
    std::size_t cancel_count  = 0;

    // volumes and notionals saturate instead of overflowing
    utils::SaturatingSum total_added_buy;
    utils::SaturatingSum total_added_sell;

    std::size_t rejected_invalid   = 0;
    std::size_t rejected_duplicate = 0;

    std::size_t cancel_success = 0;
    std::size_t cancel_fail    = 0;

    std::size_t trade_count = 0;

    utils::SaturatingSum filled_buy;  // filled for aggressive BUYs
    utils::SaturatingSum filled_sell; // filled for aggressive SELLs

    // price * qty in ticks, integer like the book itself
    utils::SaturatingSum notional_buy;
    utils::SaturatingSum notional_sell;

    std::size_t full_fill_count    = 0;
    std::size_t partial_fill_count = 0;
    std::size_t rested_count       = 0;

    // spread stats (ask - bid), ticks
    Price       spread_min   = std::numeric_limits<Price>::max();
    Price       spread_max   = 0;
    long double spread_sum   = 0.0L;
    std::size_t spread_count = 0;

    // must stay 0: best_bid >= best_ask after an event
    std::size_t crossed_count = 0;
};

class TradeJournal {
public:
    TradeJournal(const std::string& path, std::string symbol)
        : out_(path, std::ios::out | std::ios::trunc), symbol_(std::move(symbol)) {
        if (!out_) {
            throw std::runtime_error("Failed to open trades journal: " + path);
        }
    }

    void write(const Trade& tr) {
        nlohmann::json j = tr;
        j["symbol"] = symbol_;
        out_ << j.dump() << "\n";
    }

    void flush() { out_.flush(); }

private:
    std::ofstream out_;
    std::string   symbol_;
};

void update_book_stats(const OrderBook& book, ReplayStats& stats) {
    auto bb = book.best_bid();
    auto ba = book.best_ask();
    if (!bb || !ba) {
        return;
    }

    Price spread = *ba - *bb;
    if (spread <= 0) {
        ++stats.crossed_count;
        return;
    }
    stats.spread_sum += spread;
    if (spread < stats.spread_min) stats.spread_min = spread;
    if (spread > stats.spread_max) stats.spread_max = spread;
    ++stats.spread_count;
}

void apply_event(OrderBook& book, const Event& ev, ReplayStats& stats, TradeJournal* journal) {
    switch (ev.type) {
    case EventType::Add: {
        ++stats.add_count;

        AddResult res = book.add_order(to_order(ev));
        if (!res.ok()) {
            if (res.error == EngineError::DuplicateOrderId) {
                ++stats.rejected_duplicate;
            } else {
                ++stats.rejected_invalid;
            }
            break;
        }

        if (ev.side == Side::Buy) {
            stats.total_added_buy.add(ev.qty);
        } else {
            stats.total_added_sell.add(ev.qty);
        }

        if (res.filled > 0) {
            if (res.remaining == 0) {
                ++stats.full_fill_count;
            } else {
                ++stats.partial_fill_count;
            }
        }
        if (res.rested) {
            ++stats.rested_count;
        }

        for (const auto& tr : res.trades) {
            ++stats.trade_count;
            if (tr.taker_side == Side::Buy) {
                stats.filled_buy.add(tr.quantity);
                stats.notional_buy.add_product(tr.price, tr.quantity);
            } else {
                stats.filled_sell.add(tr.quantity);
                stats.notional_sell.add_product(tr.price, tr.quantity);
            }
            if (journal != nullptr) {
                journal->write(tr);
            }
        }
        break;
    }
    case EventType::Cancel: {
        ++stats.cancel_count;
        if (book.cancel_order(ev.id) == EngineError::None) {
            ++stats.cancel_success;
        } else {
            ++stats.cancel_fail;
        }
        break;
    }
    case EventType::End:
        break;
    }

    update_book_stats(book, stats);
}

std::ostream& operator<<(std::ostream& os, const utils::SaturatingSum& sum) {
    os << sum.value();
    if (sum.saturated()) {
        os << " (overflow, saturated)";
    }
    return os;
}

void print_vwap(const char* label, const utils::SaturatingSum& notional,
                const utils::SaturatingSum& filled) {
    std::cout << "  " << label << " VWAP: ";
    if (notional.saturated() || filled.saturated()) {
        std::cout << "n/a (overflow)\n";
    } else if (filled.value() > 0) {
        // reporting only; the book never sees this value
        double vwap = static_cast<double>(notional.value()) / static_cast<double>(filled.value());
        std::cout << std::fixed << std::setprecision(2) << vwap << "\n";
    } else {
        std::cout << "n/a\n";
    }
}

void print_levels(const char* label, const std::vector<LevelInfo>& levels) {
    std::cout << "  " << label << ":\n";
    if (levels.empty()) {
        std::cout << "    none\n";
        return;
    }
    for (const auto& lvl : levels) {
        std::cout << "    " << lvl.price << " x " << lvl.qty
                  << " (" << lvl.orders << " orders)\n";
    }
}

void print_stats(const ReplayStats& st, const OrderBook& book, std::size_t depth) {
    std::cout << "=== Replay summary: " << book.symbol() << " ===\n\n";

    std::cout << "Events:\n";
    std::cout << "  ADD    : " << st.add_count     << "\n";
    std::cout << "  CANCEL : " << st.cancel_count  << "\n";
    std::cout << "  skipped: " << st.lines_skipped << "\n\n";

    std::cout << "Added volume:\n";
    std::cout << "  Buy  : " << st.total_added_buy  << "\n";
    std::cout << "  Sell : " << st.total_added_sell << "\n\n";

    std::cout << "Rejected orders:\n";
    std::cout << "  InvalidOrder    : " << st.rejected_invalid   << "\n";
    std::cout << "  DuplicateOrderId: " << st.rejected_duplicate << "\n\n";

    std::cout << "Trades: " << st.trade_count << "\n";
    std::cout << "  Buy  taker filled: " << st.filled_buy  << "\n";
    std::cout << "  Sell taker filled: " << st.filled_sell << "\n";
    print_vwap("Buy ", st.notional_buy, st.filled_buy);
    print_vwap("Sell", st.notional_sell, st.filled_sell);
    std::cout << "\n";

    std::cout << "Order outcomes:\n";
    std::cout << "  full fills   : " << st.full_fill_count    << "\n";
    std::cout << "  partial fills: " << st.partial_fill_count << "\n";
    std::cout << "  rested       : " << st.rested_count       << "\n\n";

    std::cout << "Cancel stats:\n";
    std::cout << "  success: " << st.cancel_success << "\n";
    std::cout << "  fail   : " << st.cancel_fail    << "\n\n";

    std::cout << "Spread stats (ask - bid):\n";
    if (st.spread_count > 0) {
        double avg_spread = static_cast<double>(st.spread_sum / st.spread_count);
        std::cout << "  mean : " << std::fixed << std::setprecision(2) << avg_spread << "\n";
        std::cout << "  min  : " << st.spread_min << "\n";
        std::cout << "  max  : " << st.spread_max << "\n";
        std::cout << "  count: " << st.spread_count << "\n";
    } else {
        std::cout << "  not enough data (no simultaneous best bid & ask)\n";
    }
    if (st.crossed_count > 0) {
        std::cerr << "[replay] crossed book observed " << st.crossed_count << " times\n";
    }

    std::cout << "\nFinal book (" << book.order_count() << " resting orders):\n";
    print_levels("asks", book.snapshot(Side::Sell, depth));
    print_levels("bids", book.snapshot(Side::Buy, depth));
}

// Reads lines, reports malformed ones, hands events to `sink`.
template <typename Sink>
void read_events(std::istream& in, ReplayStats& stats, Sink&& sink) {
    std::string line;
    std::size_t line_no = 0;

    while (std::getline(in, line)) {
        ++line_no;
        if (is_comment_or_empty(line)) {
            continue;
        }
        auto ev = parse_event_line(line);
        if (!ev) {
            ++stats.lines_skipped;
            std::cerr << "[replay] skipping line " << line_no << ": " << line << "\n";
            continue;
        }
        sink(*ev);
    }
}

void run_inline(std::istream& in, OrderBook& book, ReplayStats& stats, TradeJournal* journal) {
    read_events(in, stats, [&](const Event& ev) {
        apply_event(book, ev, stats, journal);
    });
}

// Reader (this thread) -> SPSC queue -> matching thread. The matching thread
// is the only one touching the book.
void run_pipeline(std::istream& in, OrderBook& book, ReplayStats& stats, TradeJournal* journal) {
    constexpr std::size_t QUEUE_CAPACITY = 4096;
    utils::SpscQueue<Event> queue(QUEUE_CAPACITY);

    ReplayStats engine_stats;

    std::thread engine_thread([&]() {
        Event ev;
        for (;;) {
            if (!queue.try_pop(ev)) {
                std::this_thread::yield();
                continue;
            }
            if (ev.type == EventType::End) {
                break;
            }
            apply_event(book, ev, engine_stats, journal);
        }
    });

    auto push = [&](const Event& ev) {
        // Backpressure: if queue is full, yield until there is space
        while (!queue.try_push(ev)) {
            std::this_thread::yield();
        }
    };

    read_events(in, stats, push);

    Event end;
    end.type = EventType::End;
    push(end);
    engine_thread.join();

    engine_stats.lines_skipped = stats.lines_skipped;
    stats = engine_stats;
}

} // namespace

int main(int argc, char** argv) {
    auto args = parse_args(argc, argv);
    if (!args) {
        print_usage();
        return 1;
    }

    try {
        std::ifstream file;
        std::istream* in = &std::cin;
        if (args->events_path != "-") {
            file.open(args->events_path);
            if (!file) {
                std::cerr << "Failed to open: " << args->events_path << "\n";
                return 1;
            }
            in = &file;
        }

        std::unique_ptr<TradeJournal> journal;
        if (!args->trades_out.empty()) {
            journal = std::make_unique<TradeJournal>(args->trades_out, args->symbol);
        }

        OrderBook   book(args->symbol);
        ReplayStats stats;

        if (args->pipeline) {
            run_pipeline(*in, book, stats, journal.get());
        } else {
            run_inline(*in, book, stats, journal.get());
        }

        if (journal) {
            journal->flush();
        }

        print_stats(stats, book, args->depth);
        return stats.crossed_count == 0 ? 0 : 2;
    } catch (const std::exception& ex) {
        std::cerr << "[replay] error: " << ex.what() << "\n";
        return 1;
    }
}
