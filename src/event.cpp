#include "matching/event.hpp"

#include <cctype>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace matching {

namespace {

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    auto start = s.find_first_not_of(ws);
    if (start == std::string::npos) return {};
    auto end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

std::string to_upper(std::string s) {
    for (auto& c : s) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return s;
}

std::optional<Side> parse_side(const std::string& token) {
    auto up = to_upper(token);
    if (up == "BUY" || up == "B")  return Side::Buy;
    if (up == "SELL" || up == "S") return Side::Sell;
    return std::nullopt;
}

// std::stoll accepts "12abc"; a field must be a whole number.
std::int64_t parse_int(const std::string& token) {
    std::size_t pos = 0;
    auto v = std::stoll(token, &pos);
    if (pos != token.size()) {
        throw std::invalid_argument("trailing characters in '" + token + "'");
    }
    return v;
}

std::uint64_t parse_uint(const std::string& token) {
    if (!token.empty() && token[0] == '-') {
        throw std::invalid_argument("negative id '" + token + "'");
    }
    std::size_t pos = 0;
    auto v = std::stoull(token, &pos);
    if (pos != token.size()) {
        throw std::invalid_argument("trailing characters in '" + token + "'");
    }
    return v;
}

std::vector<std::string> split_fields(const std::string& line) {
    std::vector<std::string> fields;
    std::stringstream ss(line);
    std::string token;
    while (std::getline(ss, token, ',')) {
        fields.push_back(trim(token));
    }
    // getline does not report the empty field after a trailing comma
    if (!line.empty() && line.back() == ',') {
        fields.emplace_back();
    }
    return fields;
}

} // namespace

bool is_comment_or_empty(const std::string& line) {
    auto t = trim(line);
    return t.empty() || t[0] == '#';
}

std::optional<Event> parse_event_line(const std::string& line) {
    if (is_comment_or_empty(line)) {
        return std::nullopt;
    }

    const auto fields = split_fields(line);
    if (fields.empty()) {
        return std::nullopt;
    }

    const auto type_str = to_upper(fields[0]);
    Event ev;

    try {
        if (type_str == "ADD") {
            // ADD,side,price,qty,id[,ts_ns]
            if (fields.size() != 5 && fields.size() != 6) {
                return std::nullopt;
            }

            auto side_opt = parse_side(fields[1]);
            if (!side_opt) return std::nullopt;

            ev.type  = EventType::Add;
            ev.side  = *side_opt;
            ev.price = static_cast<Price>(parse_int(fields[2]));
            ev.qty   = static_cast<Quantity>(parse_int(fields[3]));
            ev.id    = static_cast<OrderId>(parse_uint(fields[4]));
            if (fields.size() == 6) {
                ev.ts_ns = static_cast<Timestamp>(parse_int(fields[5]));
            }
            return ev;
        } else if (type_str == "CANCEL" || type_str == "CXL") {
            // CANCEL,id
            if (fields.size() != 2) {
                return std::nullopt;
            }

            ev.type = EventType::Cancel;
            ev.id   = static_cast<OrderId>(parse_uint(fields[1]));
            return ev;
        }
        // unknown event type
        return std::nullopt;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::string format_event(const Event& ev) {
    std::ostringstream out;
    switch (ev.type) {
    case EventType::Add:
        out << "ADD," << to_string(ev.side) << ',' << ev.price << ',' << ev.qty << ',' << ev.id;
        if (ev.ts_ns != 0) {
            out << ',' << ev.ts_ns;
        }
        break;
    case EventType::Cancel:
        out << "CANCEL," << ev.id;
        break;
    case EventType::End:
        out << "# end";
        break;
    }
    return out.str();
}

Order to_order(const Event& ev) {
    Order o;
    o.id        = ev.id;
    o.side      = ev.side;
    o.price     = ev.price;
    o.quantity  = ev.qty;
    o.timestamp = ev.ts_ns;
    return o;
}

} // namespace matching
