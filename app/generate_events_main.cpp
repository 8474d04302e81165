#include "matching/event.hpp"
#include "matching/types.hpp"

#include <cstdint>
#include <iostream>
#include <random>
#include <string>
#include <vector>

using namespace matching;

// Writes a random ADD/CANCEL stream in the trading_replay format to stdout.
// Bids are drawn a little below mid and asks a little above, with overlap,
// so part of the flow crosses and trades.
int main(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "Usage: trading_generate <num_events> <seed> [mid_price]\n";
        return 1;
    }

    std::size_t   num_events = 0;
    std::uint32_t seed       = 0;
    Price         mid        = 100;
    try {
        num_events = static_cast<std::size_t>(std::stoull(argv[1]));
        seed       = static_cast<std::uint32_t>(std::stoul(argv[2]));
        if (argc > 3) {
            mid = static_cast<Price>(std::stoll(argv[3]));
        }
    } catch (const std::exception& ex) {
        std::cerr << "Bad argument: " << ex.what() << "\n";
        return 1;
    }
    if (mid <= 5) {
        std::cerr << "mid_price must be > 5\n";
        return 1;
    }

    std::mt19937_64 rng(seed);

    // 0..74  -> ADD (75%)
    // 75..99 -> CANCEL (25%)
    std::uniform_int_distribution<int>      event_type_dist(0, 99);
    std::uniform_int_distribution<int>      side_dist(0, 1);
    std::uniform_int_distribution<Price>    offset_dist(-2, 5);
    std::uniform_int_distribution<Quantity> qty_dist(1, 10);

    std::vector<OrderId> active_ids;
    active_ids.reserve(num_events);

    OrderId next_id = 1;

    // replay skips lines starting with '#'
    std::cout << "# ADD,side,price,qty,id | CANCEL,id\n";

    for (std::size_t i = 0; i < num_events; ++i) {
        int r = event_type_dist(rng);

        Event ev;
        if (active_ids.empty() || r < 75) {
            ev.type = EventType::Add;
            ev.side = (side_dist(rng) == 0) ? Side::Buy : Side::Sell;

            Price offset = offset_dist(rng);
            ev.price = (ev.side == Side::Buy) ? mid - offset : mid + offset;
            ev.qty   = qty_dist(rng);
            ev.id    = next_id++;

            active_ids.push_back(ev.id);
        } else {
            // The id may already be filled; replay then counts a failed cancel.
            std::uniform_int_distribution<std::size_t> idx_dist(0, active_ids.size() - 1);
            std::size_t idx = idx_dist(rng);

            ev.type = EventType::Cancel;
            ev.id   = active_ids[idx];

            // never cancel the same id twice
            active_ids[idx] = active_ids.back();
            active_ids.pop_back();
        }

        std::cout << format_event(ev) << "\n";
    }

    return 0;
}
