#include <gtest/gtest.h>

#include <future>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "matching/engine_config.hpp"
#include "matching/matching_engine.hpp"

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

TEST(MatchingEngine, RegistersInstruments) {
    MatchingEngine engine(2);

    EXPECT_TRUE(engine.add_instrument("BTCUSDT"));
    EXPECT_TRUE(engine.add_instrument("ETHUSDT"));
    EXPECT_FALSE(engine.add_instrument("BTCUSDT"));

    EXPECT_TRUE(engine.has_instrument("ETHUSDT"));
    EXPECT_FALSE(engine.has_instrument("DOGEUSDT"));
    EXPECT_EQ(engine.instruments().size(), 2u);
}

TEST(MatchingEngine, BuildsFromConfig) {
    EngineConfig cfg;
    cfg.worker_threads = 3;
    cfg.instruments    = {"A", "B", "C"};

    MatchingEngine engine(cfg);
    EXPECT_TRUE(engine.has_instrument("A"));
    EXPECT_TRUE(engine.has_instrument("C"));
    EXPECT_EQ(engine.instruments().size(), 3u);
}

TEST(MatchingEngine, SubmitMatchesOnInstrumentBook) {
    MatchingEngine engine(2, [] { return Timestamp{5}; });
    engine.add_instrument("SIM");

    engine.submit("SIM", make_order(1, Side::Sell, 100, 10));
    engine.submit("SIM", make_order(2, Side::Sell, 99, 5));
    auto res = engine.submit("SIM", make_order(3, Side::Buy, 100, 12)).get();

    ASSERT_TRUE(res.ok());
    ASSERT_EQ(res.trades.size(), 2u);
    EXPECT_EQ(res.trades[0].price, 99);
    EXPECT_EQ(res.trades[1].price, 100);
    EXPECT_EQ(res.trades[1].quantity, 7);
    EXPECT_EQ(res.trades[0].timestamp, 5);

    EXPECT_EQ(engine.best_ask("SIM").get(), std::optional<Price>(100));
    EXPECT_FALSE(engine.best_bid("SIM").get().has_value());

    auto asks = engine.snapshot("SIM", Side::Sell).get();
    ASSERT_EQ(asks.size(), 1u);
    EXPECT_EQ(asks[0].qty, 3);
}

TEST(MatchingEngine, UnknownInstrument) {
    MatchingEngine engine(1);
    engine.add_instrument("SIM");

    auto res = engine.submit("NOPE", make_order(1, Side::Buy, 100, 1)).get();
    EXPECT_EQ(res.error, EngineError::UnknownInstrument);
    EXPECT_EQ(res.requested, 1);
    EXPECT_EQ(engine.cancel("NOPE", 1).get(), EngineError::UnknownInstrument);
    EXPECT_FALSE(engine.best_bid("NOPE").get().has_value());
    EXPECT_TRUE(engine.snapshot("NOPE", Side::Buy).get().empty());
}

TEST(MatchingEngine, CancelIsOrderedWithSubmit) {
    MatchingEngine engine(4);
    engine.add_instrument("SIM");

    engine.submit("SIM", make_order(1, Side::Buy, 100, 10));
    auto c1 = engine.cancel("SIM", 1);
    auto c2 = engine.cancel("SIM", 1);

    EXPECT_EQ(c1.get(), EngineError::None);
    EXPECT_EQ(c2.get(), EngineError::OrderNotFound);
    EXPECT_FALSE(engine.best_bid("SIM").get().has_value());
}

TEST(MatchingEngine, InstrumentsAreIndependent) {
    MatchingEngine engine(2);
    engine.add_instrument("A");
    engine.add_instrument("B");

    engine.submit("A", make_order(1, Side::Sell, 100, 5));
    auto res = engine.submit("B", make_order(2, Side::Buy, 100, 5)).get();

    EXPECT_TRUE(res.trades.empty());
    EXPECT_TRUE(res.rested);
    EXPECT_EQ(engine.best_ask("A").get(), std::optional<Price>(100));
    EXPECT_EQ(engine.best_bid("B").get(), std::optional<Price>(100));

    // same id on another instrument is not a duplicate
    auto again = engine.submit("B", make_order(1, Side::Buy, 90, 1)).get();
    EXPECT_TRUE(again.ok());
}

TEST(MatchingEngine, TradeHandlerSeesTradesInOrder) {
    MatchingEngine engine(2);
    engine.add_instrument("A");
    engine.add_instrument("B");

    std::mutex mtx;
    std::map<std::string, std::vector<TradeId>> seen;
    engine.set_trade_handler([&](const std::string& symbol, const std::vector<Trade>& trades) {
        std::lock_guard<std::mutex> lock(mtx);
        for (const auto& tr : trades) {
            seen[symbol].push_back(tr.trade_id);
        }
    });

    std::vector<std::future<AddResult>> futures;
    OrderId id = 1;
    for (int i = 0; i < 50; ++i) {
        for (const char* sym : {"A", "B"}) {
            futures.push_back(engine.submit(sym, make_order(id++, Side::Sell, 100, 1)));
            futures.push_back(engine.submit(sym, make_order(id++, Side::Buy, 100, 1)));
        }
    }
    for (auto& f : futures) {
        ASSERT_TRUE(f.get().ok());
    }

    std::lock_guard<std::mutex> lock(mtx);
    for (const char* sym : {"A", "B"}) {
        const auto& ids = seen[sym];
        ASSERT_EQ(ids.size(), 50u);
        for (std::size_t i = 0; i < ids.size(); ++i) {
            EXPECT_EQ(ids[i], static_cast<TradeId>(i + 1));
        }
    }
}

TEST(MatchingEngine, ConcurrentProducersOnOneInstrument) {
    MatchingEngine engine(4);
    engine.add_instrument("SIM");

    constexpr int kProducers = 4;
    constexpr int kPerProducer = 1000;

    std::vector<std::thread> producers;
    std::mutex mtx;
    Quantity bought = 0;
    Quantity sold   = 0;

    for (int p = 0; p < kProducers; ++p) {
        producers.emplace_back([&, p]() {
            Side side = (p % 2 == 0) ? Side::Buy : Side::Sell;
            std::vector<std::future<AddResult>> futures;
            for (int i = 0; i < kPerProducer; ++i) {
                OrderId id = static_cast<OrderId>(p) * 100'000 + static_cast<OrderId>(i) + 1;
                futures.push_back(engine.submit("SIM", make_order(id, side, 100, 1)));
            }
            Quantity filled = 0;
            for (auto& f : futures) {
                filled += f.get().filled;
            }
            std::lock_guard<std::mutex> lock(mtx);
            (side == Side::Buy ? bought : sold) += filled;
        });
    }
    for (auto& t : producers) {
        t.join();
    }

    // equal buy and sell volume at one price: every unit trades exactly once,
    // and taker fills count each trade once
    EXPECT_EQ(bought + sold, Quantity{kProducers / 2} * kPerProducer);
    EXPECT_FALSE(engine.best_bid("SIM").get().has_value());
    EXPECT_FALSE(engine.best_ask("SIM").get().has_value());
}

TEST(MatchingEngine, RequestsAfterShutdownFail) {
    MatchingEngine engine(1);
    engine.add_instrument("SIM");
    auto before = engine.submit("SIM", make_order(1, Side::Buy, 100, 1));

    engine.shutdown();
    EXPECT_TRUE(before.get().ok());

    auto after = engine.submit("SIM", make_order(2, Side::Buy, 100, 1));
    EXPECT_THROW(after.get(), std::runtime_error);

    engine.shutdown(); // idempotent
}

TEST(MatchingEngine, ThrowingTradeHandlerStillReturnsResult) {
    MatchingEngine engine(1);
    engine.add_instrument("SIM");
    engine.set_trade_handler([](const std::string&, const std::vector<Trade>&) {
        throw std::runtime_error("journal down");
    });

    engine.submit("SIM", make_order(1, Side::Sell, 100, 5));
    engine.submit("SIM", make_order(2, Side::Sell, 100, 5));

    AddResult res;
    ASSERT_NO_THROW(res = engine.submit("SIM", make_order(3, Side::Buy, 100, 5)).get());
    ASSERT_TRUE(res.ok());
    ASSERT_EQ(res.trades.size(), 1u);
    EXPECT_EQ(res.trades[0].maker_order_id, 1u);
    EXPECT_EQ(res.filled, 5);
    EXPECT_EQ(engine.trade_handler_failures(), 1u);

    // only the executed maker is gone
    auto asks = engine.snapshot("SIM", Side::Sell).get();
    ASSERT_EQ(asks.size(), 1u);
    EXPECT_EQ(asks[0].qty, 5);
    EXPECT_EQ(asks[0].orders, 1u);
}
