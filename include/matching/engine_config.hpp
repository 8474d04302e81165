#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace matching {

struct EngineConfig {
    std::size_t              worker_threads{2};
    std::vector<std::string> instruments;   // one book per symbol
    std::string              trade_journal; // JSON-lines output, empty = none
};

/// Missing keys keep their defaults. Throws std::runtime_error on a
/// non-positive worker count or an empty/duplicate symbol, and
/// nlohmann::json::exception on wrongly typed values.
EngineConfig parse_engine_config(const nlohmann::json& j);

/// Read and parse a JSON config file. Throws std::runtime_error if the file
/// cannot be opened.
EngineConfig load_engine_config(const std::string& path);

} // namespace matching
