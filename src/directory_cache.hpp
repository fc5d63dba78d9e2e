#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "log.hpp"

inline constexpr std::chrono::hours kListingStaleAfter{24};
// Records shorter than this are assumed to be truncated writes.
inline constexpr std::uintmax_t kMinPlausibleListingBytes = 0x1000;

// Raw bot listings on disk, one file per bot, aged by the file's mtime.
class DirectoryCache {
public:
    explicit DirectoryCache(std::filesystem::path directory = default_directory(),
                            std::chrono::seconds staleness = kListingStaleAfter,
                            std::uintmax_t min_bytes = kMinPlausibleListingBytes,
                            std::shared_ptr<Logger> logger = nullptr);

    std::optional<std::string> read(const std::string& peer) const;
    void write(const std::string& peer, const std::string& raw_listing) const;

    std::filesystem::path path_for(const std::string& peer) const;
    const std::filesystem::path& directory() const { return directory_; }

    static std::filesystem::path default_directory();
    static std::string safe_name(const std::string& peer);

private:
    std::filesystem::path directory_;
    std::chrono::seconds staleness_;
    std::uintmax_t min_bytes_;
    std::shared_ptr<Logger> logger_;
};
