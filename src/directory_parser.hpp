#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "catalog_entry.hpp"
#include "log.hpp"

// XDCC bots frame their listing with a fixed banner and footer. These counts
// are a bot convention, not something the listing describes about itself.
inline constexpr std::size_t kListingHeaderLines = 4;
inline constexpr std::size_t kListingFooterLines = 2;

class DirectoryParser {
public:
    explicit DirectoryParser(std::shared_ptr<Logger> logger = nullptr);

    // Rows that do not follow the listing grammar are logged and skipped.
    std::vector<CatalogEntry> parse(const std::vector<std::string>& lines,
                                    const std::string& source_peer);

    // Throws ListingParseError.
    CatalogEntry parse_line(const std::string& line, const std::string& source_peer) const;

    // Number of rows skipped by the last parse().
    std::size_t last_rejected() const { return rejected_; }

    // Splits a raw listing body into lines and drops the bot's banner/footer.
    static std::vector<std::string> strip_frame(const std::string& body);

    // "700.5", 'M' -> 734527488. Throws ListingParseError for unknown units.
    static uint64_t parse_size(const std::string& value, char unit);

private:
    std::shared_ptr<Logger> logger_;
    std::size_t rejected_ = 0;
};
