#pragma once

#include "matching/types.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace matching {

enum class EventType : std::uint8_t {
    Add,
    Cancel,
    End    // sentinel closing a pipelined stream
};

// One line of an event file, fed to an OrderBook by the replay tools.
struct Event {
    EventType type      = EventType::Add;
    Side      side      = Side::Buy;
    Price     price     = 0;   // valid for Add
    Quantity  qty       = 0;   // valid for Add
    OrderId   id        = 0;
    Timestamp ts_ns     = 0;   // optional for Add, 0 = stamped by the book
};

/// Blank lines and lines starting with '#'.
bool is_comment_or_empty(const std::string& line);

/// Parse one CSV line:
///   ADD,<BUY|SELL|B|S>,<price>,<qty>,<id>[,<ts_ns>]
///   CANCEL,<id>          (alias CXL)
/// Keywords are case-insensitive, tokens are trimmed. Returns nullopt for
/// comments, blank and malformed lines.
std::optional<Event> parse_event_line(const std::string& line);

/// Inverse of parse_event_line (no trailing newline).
std::string format_event(const Event& ev);

/// Order carried by an Add event.
Order to_order(const Event& ev);

} // namespace matching
