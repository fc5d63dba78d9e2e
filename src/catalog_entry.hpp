#pragma once
#include <cstdint>
#include <optional>
#include <string>

// One row of a bot's pack listing. `id` is only unique within `source_peer`.
struct CatalogEntry {
    uint32_t id = 0;
    uint64_t downloads = 0;
    uint64_t size_bytes = 0;
    std::string filename;
    std::string group;
    std::string title;
    std::string episode;       // empty when the filename has no " - <ep>" segment
    std::string resolution;    // "720p", "SD", ...
    std::string source_peer;
    std::string raw;           // listing line as received

    std::string display_line() const;
};

// Multiplier for a listing size unit: B, K, M, G. nullopt for anything else.
std::optional<uint64_t> size_unit_multiplier(char unit);
