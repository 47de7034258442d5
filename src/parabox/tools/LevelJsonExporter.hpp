#pragma once

#include "level/Level.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace PB {

struct LevelJsonOptions {
    int  dumpIndent  = 2; // negative for compact output
    bool includeMeta = false;
};

class LevelJsonExporter {
public:
    static auto ToJson(Level const& level, LevelJsonOptions const& options = LevelJsonOptions{}) -> nlohmann::json;
    static auto Export(Level const& level, LevelJsonOptions const& options = LevelJsonOptions{}) -> std::string;
};

} // namespace PB
