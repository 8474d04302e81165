#include "matching/types.hpp"
#include "matching/errors.hpp"

namespace matching {

const char* to_string(Side side) noexcept
{
    return side == Side::Buy ? "BUY" : "SELL";
}

const char* to_string(EngineError err) noexcept
{
    switch (err) {
    case EngineError::None:              return "None";
    case EngineError::InvalidOrder:      return "InvalidOrder";
    case EngineError::DuplicateOrderId:  return "DuplicateOrderId";
    case EngineError::OrderNotFound:     return "OrderNotFound";
    case EngineError::UnknownInstrument: return "UnknownInstrument";
    }
    return "Unknown";
}

} // namespace matching
