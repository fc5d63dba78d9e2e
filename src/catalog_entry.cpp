#include "catalog_entry.hpp"

#include <spdlog/fmt/fmt.h>

std::string CatalogEntry::display_line() const {
    return fmt::format("[{}] {} - {} ({})        (#{} - {})",
                       group, title, episode, resolution, id, source_peer);
}

std::optional<uint64_t> size_unit_multiplier(char unit) {
    switch(unit) {
    case 'B': return uint64_t{1};
    case 'K': return uint64_t{1} << 10;
    case 'M': return uint64_t{1} << 20;
    case 'G': return uint64_t{1} << 30;
    default: return std::nullopt;
    }
}
