#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

#include "matching/synchronized_order_book.hpp"

using namespace matching;

namespace {

Order make_order(OrderId id, Side side, Price price, Quantity qty) {
    Order o;
    o.id       = id;
    o.side     = side;
    o.price    = price;
    o.quantity = qty;
    return o;
}

} // namespace

TEST(SynchronizedOrderBook, ForwardsToBook) {
    SynchronizedOrderBook book("SIM");

    book.add_order(make_order(1, Side::Sell, 100, 10));
    book.add_order(make_order(2, Side::Sell, 99, 5));
    auto res = book.add_order(make_order(3, Side::Buy, 100, 12));

    ASSERT_EQ(res.trades.size(), 2u);
    EXPECT_EQ(*book.best_ask(), 100);
    EXPECT_FALSE(book.best_bid().has_value());
    EXPECT_FALSE(book.spread().has_value());
    EXPECT_EQ(book.depth_at(Side::Sell, 100), 3);
    EXPECT_EQ(book.top_of_book(Side::Sell).qty, 3);
    EXPECT_EQ(book.snapshot(Side::Sell).size(), 1u);
    EXPECT_EQ(book.order_count(), 1u);

    EXPECT_EQ(book.cancel_order(1), EngineError::None);
    EXPECT_EQ(book.cancel_order(1), EngineError::OrderNotFound);

    auto n = book.read([](const OrderBook& b) { return b.trades().size(); });
    EXPECT_EQ(n, 2u);
}

// Writers cross the book constantly while readers poll; readers must never
// see a crossed book and every unit a buyer takes is accounted for.
TEST(SynchronizedOrderBook, ConcurrentWritersAndReaders) {
    SynchronizedOrderBook book;

    constexpr int kWriters        = 4;
    constexpr int kOrdersPerWriter = 5000;

    std::atomic<bool> done{false};
    std::atomic<int>  crossed{0};
    std::atomic<long long> traded{0};

    std::vector<std::thread> readers;
    for (int r = 0; r < 2; ++r) {
        readers.emplace_back([&]() {
            while (!done.load(std::memory_order_acquire)) {
                bool is_crossed = book.read([](const OrderBook& b) {
                    auto bb = b.best_bid();
                    auto ba = b.best_ask();
                    return bb && ba && *bb >= *ba;
                });
                if (is_crossed) {
                    crossed.fetch_add(1);
                }
            }
        });
    }

    std::vector<std::thread> writers;
    for (int w = 0; w < kWriters; ++w) {
        writers.emplace_back([&, w]() {
            for (int i = 0; i < kOrdersPerWriter; ++i) {
                OrderId id   = static_cast<OrderId>(w) * 1'000'000 + static_cast<OrderId>(i) + 1;
                Side    side = (i % 2 == 0) ? Side::Buy : Side::Sell;
                Price   px   = 100 + (i % 3) - 1;
                auto res = book.add_order(make_order(id, side, px, 1 + i % 4));
                for (const auto& tr : res.trades) {
                    traded.fetch_add(tr.quantity);
                }
            }
        });
    }

    for (auto& t : writers) {
        t.join();
    }
    done.store(true, std::memory_order_release);
    for (auto& t : readers) {
        t.join();
    }

    EXPECT_EQ(crossed.load(), 0);

    long long logged = book.read([](const OrderBook& b) {
        long long sum = 0;
        for (const auto& tr : b.trades()) {
            sum += tr.quantity;
        }
        return sum;
    });
    EXPECT_EQ(logged, traded.load());
}
