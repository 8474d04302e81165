#pragma once

#include <cstdint>

namespace matching {

/// Reasons a request is rejected. All of them leave the book unchanged.
enum class EngineError : std::uint8_t {
    None,
    InvalidOrder,       // non-positive price or quantity
    DuplicateOrderId,   // id already resting in the book
    OrderNotFound,      // cancel target is not resting
    UnknownInstrument   // MatchingEngine has no book for the symbol
};

const char* to_string(EngineError err) noexcept;

} // namespace matching
