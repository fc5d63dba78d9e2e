#include "directory_parser.hpp"

#include <limits>
#include <regex>
#include <sstream>
#include <stdexcept>

#include "utils.hpp"
#include "xdcc_errors.hpp"

namespace {

// #<id>  <downloads>x  [<size><unit>] [<group>] <title>[ - <episode>] (<resolution>)...<ext>
// Submatches: 1 id, 2 downloads, 3 size value, 4 size unit, 5 filename,
// 6 group, 7 title, 8 episode, 9 resolution.
const std::regex& listing_line_regex() {
    static const std::regex re(
        R"(^#(\d+) +(\d+)x +\[([\d. ]+)(\w)\] )"
        R"((\[([^\]]+)\] (.+?)(?: - (.+?))? [\[(](\w+)[\])].*\.\w+))");
    return re;
}

template<typename T>
T parse_unsigned(const std::string& text, const char* what) {
    try {
        std::size_t used = 0;
        unsigned long long value = std::stoull(text, &used);
        if(used != text.size()) throw std::invalid_argument(text);
        if(value > std::numeric_limits<T>::max()) throw std::out_of_range(text);
        return static_cast<T>(value);
    } catch(const std::exception&) {
        throw ListingParseError(std::string("invalid ") + what + " '" + text + "'");
    }
}

} // namespace

DirectoryParser::DirectoryParser(std::shared_ptr<Logger> logger)
    : logger_(std::move(logger)) {}

uint64_t DirectoryParser::parse_size(const std::string& value, char unit) {
    auto multiplier = size_unit_multiplier(unit);
    if(!multiplier) {
        throw ListingParseError(std::string("unknown size unit '") + unit + "'");
    }
    std::string clean = trim_copy(value);
    double amount = 0.0;
    try {
        std::size_t used = 0;
        amount = std::stod(clean, &used);
        if(used != clean.size()) throw std::invalid_argument(clean);
    } catch(const std::exception&) {
        throw ListingParseError("invalid size '" + value + "'");
    }
    return static_cast<uint64_t>(amount * static_cast<double>(*multiplier));
}

CatalogEntry DirectoryParser::parse_line(const std::string& line,
                                         const std::string& source_peer) const {
    std::smatch m;
    if(!std::regex_search(line, m, listing_line_regex())) {
        throw ListingParseError("Incorrect file format: '" + line + "'");
    }
    CatalogEntry entry;
    entry.id = parse_unsigned<uint32_t>(m[1].str(), "pack id");
    entry.downloads = parse_unsigned<uint64_t>(m[2].str(), "download count");
    entry.size_bytes = parse_size(m[3].str(), m[4].str().front());
    entry.filename = m[5].str();
    entry.group = m[6].str();
    entry.title = m[7].str();
    entry.episode = m[8].matched ? m[8].str() : std::string();
    entry.resolution = m[9].str();
    entry.source_peer = source_peer;
    entry.raw = line;
    return entry;
}

std::vector<CatalogEntry> DirectoryParser::parse(const std::vector<std::string>& lines,
                                                 const std::string& source_peer) {
    rejected_ = 0;
    std::vector<CatalogEntry> entries;
    entries.reserve(lines.size());
    for(const auto& line : lines) {
        try {
            entries.push_back(parse_line(line, source_peer));
        } catch(const ListingParseError& e) {
            ++rejected_;
            log_warn(logger_.get(), "{}: {}", source_peer, e.what());
        }
    }
    return entries;
}

std::vector<std::string> DirectoryParser::strip_frame(const std::string& body) {
    std::vector<std::string> lines;
    std::istringstream in(body);
    std::string line;
    while(std::getline(in, line)) {
        if(!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(std::move(line));
    }
    if(lines.size() <= kListingHeaderLines + kListingFooterLines) return {};
    return std::vector<std::string>(lines.begin() + kListingHeaderLines,
                                    lines.end() - kListingFooterLines);
}
