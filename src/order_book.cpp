#include "matching/order_book.hpp"

#include "utils/checked_math.hpp"

#include <algorithm> // std::min
#include <chrono>
#include <utility>

namespace matching {

OrderBook::OrderBook(std::string symbol, Clock clock)
    : symbol_(std::move(symbol))
    , clock_(std::move(clock))
{
    slots_.reserve(1024);
    free_indices_.reserve(1024);
}

bool OrderBook::empty() const noexcept
{
    return bids_.empty() && asks_.empty();
}

void OrderBook::clear() noexcept
{
    bids_.clear();
    asks_.clear();
    slots_.clear();
    free_indices_.clear();
    id_to_index_.clear();
    trade_log_.clear();
    next_trade_id_ = 1;
}

Timestamp OrderBook::now() const
{
    if (clock_)
        return clock_();

    using namespace std::chrono;
    return duration_cast<nanoseconds>(system_clock::now().time_since_epoch()).count();
}

OrderBook::OrderIndex OrderBook::allocate_slot()
{
    if (!free_indices_.empty())
    {
        OrderIndex idx = free_indices_.back();
        free_indices_.pop_back();
        return idx;
    }

    OrderIndex idx = static_cast<OrderIndex>(slots_.size());
    slots_.push_back(Slot{});
    return idx;
}

void OrderBook::release_slot(OrderIndex idx)
{
    slots_[idx] = Slot{};
    free_indices_.push_back(idx);
}

void OrderBook::release_level(Level& level)
{
    for (OrderIndex idx : level.queue)
        release_slot(idx);
    level.queue.clear();
}

void OrderBook::prune_front(Level& level)
{
    while (!level.queue.empty() && !slots_[level.queue.front()].active)
    {
        release_slot(level.queue.front());
        level.queue.pop_front();
    }
}

void OrderBook::compact_level(Level& level)
{
    if (level.queue.size() <= 2 * level.live)
        return;

    std::deque<OrderIndex> kept;
    for (OrderIndex idx : level.queue)
    {
        if (slots_[idx].active)
            kept.push_back(idx);
        else
            release_slot(idx);
    }
    level.queue.swap(kept);
}

std::optional<Price> OrderBook::best_bid() const noexcept
{
    if (bids_.empty())
        return std::nullopt;
    return bids_.begin()->first; // max price due to std::greater
}

std::optional<Price> OrderBook::best_ask() const noexcept
{
    if (asks_.empty())
        return std::nullopt;
    return asks_.begin()->first; // min price due to std::less
}

std::optional<Price> OrderBook::spread() const noexcept
{
    auto bid = best_bid();
    auto ask = best_ask();
    if (!bid || !ask)
        return std::nullopt;
    return *ask - *bid;
}

LevelInfo OrderBook::make_level_info(Price price, const Level& level) noexcept
{
    LevelInfo info;
    info.valid  = true;
    info.price  = price;
    info.qty    = level.total_qty;
    info.orders = level.live;
    return info;
}

LevelInfo OrderBook::top_of_book(Side side) const noexcept
{
    if (side == Side::Buy)
    {
        if (bids_.empty())
            return LevelInfo{};
        return make_level_info(bids_.begin()->first, bids_.begin()->second);
    }

    if (asks_.empty())
        return LevelInfo{};
    return make_level_info(asks_.begin()->first, asks_.begin()->second);
}

Quantity OrderBook::depth_at(Side side, Price price) const noexcept
{
    if (side == Side::Buy)
    {
        auto it = bids_.find(price);
        return it == bids_.end() ? 0 : it->second.total_qty;
    }

    auto it = asks_.find(price);
    return it == asks_.end() ? 0 : it->second.total_qty;
}

std::size_t OrderBook::level_count(Side side) const noexcept
{
    return side == Side::Buy ? bids_.size() : asks_.size();
}

template <typename Book>
std::vector<LevelInfo> OrderBook::collect_levels(const Book& book, std::size_t max_levels) const
{
    std::vector<LevelInfo> out;
    out.reserve(max_levels == 0 ? book.size() : std::min(max_levels, book.size()));

    for (const auto& [price, level] : book)
    {
        if (max_levels != 0 && out.size() >= max_levels)
            break;
        out.push_back(make_level_info(price, level));
    }
    return out;
}

std::vector<LevelInfo> OrderBook::snapshot(Side side, std::size_t max_levels) const
{
    return side == Side::Buy ? collect_levels(bids_, max_levels)
                             : collect_levels(asks_, max_levels);
}

std::optional<Order> OrderBook::find_order(OrderId id) const
{
    auto it = id_to_index_.find(id);
    if (it == id_to_index_.end())
        return std::nullopt;
    return slots_[it->second].order;
}

template <typename Book>
void OrderBook::rest_order(Book& book, const Order& order)
{
    OrderIndex idx = allocate_slot();

    Slot& slot  = slots_[idx];
    slot.order  = order;
    slot.active = true;

    id_to_index_[order.id] = idx;

    Level& level = book[order.price];
    level.queue.push_back(idx);
    level.total_qty += order.quantity;
    ++level.live;
}

template <typename Book, typename PricePredicate>
void OrderBook::match_on_book(Book& book, Order& taker, PricePredicate&& should_cross,
                              Timestamp ts, std::vector<Trade>& out)
{
    while (taker.quantity > 0 && !book.empty())
    {
        // For both books begin() is the best level (depends on the comparator).
        auto  lvl_it      = book.begin();
        Price level_price = lvl_it->first;

        if (!should_cross(level_price))
            break;

        Level& level = lvl_it->second;

        while (taker.quantity > 0 && level.live > 0)
        {
            prune_front(level);

            OrderIndex idx   = level.queue.front();
            Order&     maker = slots_[idx].order;

            Quantity traded = std::min(taker.quantity, maker.quantity);

            Trade tr;
            tr.trade_id       = next_trade_id_++;
            tr.maker_order_id = maker.id;
            tr.taker_order_id = taker.id;
            tr.taker_side     = taker.side;
            tr.price          = maker.price;
            tr.quantity       = traded;
            tr.timestamp      = ts;
            out.push_back(tr);

            taker.quantity  -= traded;
            maker.quantity  -= traded;
            level.total_qty -= traded;

            if (maker.quantity == 0)
            {
                id_to_index_.erase(maker.id);
                level.queue.pop_front();
                --level.live;
                release_slot(idx);
            }
        }

        if (level.live == 0)
        {
            release_level(level);
            book.erase(lvl_it);
        }
    }
}

AddResult OrderBook::add_order(Order order)
{
    AddResult res;
    res.requested = order.quantity;

    if (order.quantity <= 0 || order.price <= 0)
    {
        res.error = EngineError::InvalidOrder;
        return res;
    }

    if (id_to_index_.find(order.id) != id_to_index_.end())
    {
        res.error = EngineError::DuplicateOrderId;
        return res;
    }

    // The remainder may rest on its own level: that level's total must stay
    // representable even if nothing trades.
    Quantity level_total = 0;
    if (!utils::checked_add(depth_at(order.side, order.price), order.quantity, level_total))
    {
        res.error = EngineError::InvalidOrder;
        return res;
    }

    const Timestamp ts = now();
    if (order.timestamp == 0)
        order.timestamp = ts;

    // Aggressive part first: match against the opposite side.
    if (order.side == Side::Buy)
    {
        // Buy limit matches asks priced <= ours.
        const Price limit = order.price;
        match_on_book(asks_, order,
                      [limit](Price top_price) { return top_price <= limit; },
                      ts, res.trades);
    }
    else
    {
        // Sell limit matches bids priced >= ours.
        const Price limit = order.price;
        match_on_book(bids_, order,
                      [limit](Price top_price) { return top_price >= limit; },
                      ts, res.trades);
    }

    res.remaining = order.quantity;
    res.filled    = res.requested - res.remaining;

    if (order.quantity > 0)
    {
        if (order.side == Side::Buy)
            rest_order(bids_, order);
        else
            rest_order(asks_, order);
        res.rested = true;
    }

    trade_log_.insert(trade_log_.end(), res.trades.begin(), res.trades.end());
    return res;
}

EngineError OrderBook::cancel_order(OrderId id)
{
    auto it = id_to_index_.find(id);
    if (it == id_to_index_.end())
        return EngineError::OrderNotFound;

    Slot&          slot  = slots_[it->second];
    const Side     side  = slot.order.side;
    const Price    price = slot.order.price;
    const Quantity qty   = slot.order.quantity;

    // Tombstone: the index stays queued until pruned or the level goes away.
    slot.active = false;
    id_to_index_.erase(it);

    auto unlink = [&](auto& book) {
        auto lvl_it = book.find(price);
        if (lvl_it == book.end())
            return;

        Level& level = lvl_it->second;
        level.total_qty -= qty;
        --level.live;

        if (level.live == 0)
        {
            release_level(level);
            book.erase(lvl_it);
        }
        else
        {
            prune_front(level);
            compact_level(level);
        }
    };

    if (side == Side::Buy)
        unlink(bids_);
    else
        unlink(asks_);

    return EngineError::None;
}

} // namespace matching
