#include "matching/engine_config.hpp"

#include <cstdint>
#include <fstream>
#include <stdexcept>
#include <unordered_set>

using nlohmann::json;

namespace matching {

EngineConfig parse_engine_config(const json& j)
{
    if (!j.is_object()) {
        throw std::runtime_error("engine config must be a JSON object");
    }

    EngineConfig cfg;

    if (j.contains("worker_threads")) {
        auto threads = j.at("worker_threads").get<std::int64_t>();
        if (threads <= 0) {
            throw std::runtime_error("worker_threads must be > 0, got " + std::to_string(threads));
        }
        cfg.worker_threads = static_cast<std::size_t>(threads);
    }

    if (j.contains("instruments")) {
        if (!j.at("instruments").is_array()) {
            throw std::runtime_error("instruments must be an array of symbols");
        }

        std::unordered_set<std::string> seen;
        for (const auto& item : j.at("instruments")) {
            auto symbol = item.get<std::string>();
            if (symbol.empty()) {
                throw std::runtime_error("instrument symbol must not be empty");
            }
            if (!seen.insert(symbol).second) {
                throw std::runtime_error("duplicate instrument symbol: " + symbol);
            }
            cfg.instruments.push_back(std::move(symbol));
        }
    }

    cfg.trade_journal = j.value("trade_journal", std::string{});
    return cfg;
}

EngineConfig load_engine_config(const std::string& path)
{
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Failed to open config: " + path);
    }

    json j = json::parse(in);
    return parse_engine_config(j);
}

} // namespace matching
