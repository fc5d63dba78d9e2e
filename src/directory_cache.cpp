#include "directory_cache.hpp"

#include <cctype>
#include <fstream>
#include <sstream>

#include "utils.hpp"
#include "xdcc_errors.hpp"

namespace fs = std::filesystem;

DirectoryCache::DirectoryCache(fs::path directory,
                               std::chrono::seconds staleness,
                               std::uintmax_t min_bytes,
                               std::shared_ptr<Logger> logger)
    : directory_(std::move(directory)),
      staleness_(staleness),
      min_bytes_(min_bytes),
      logger_(std::move(logger)) {}

fs::path DirectoryCache::default_directory() {
    return fs::temp_directory_path() / "xdcc_cache";
}

std::string DirectoryCache::safe_name(const std::string& peer) {
    std::string out = peer;
    for(auto& ch : out) {
        unsigned char c = static_cast<unsigned char>(ch);
        if(!std::isalnum(c) && ch != '-' && ch != '_' && ch != '.') ch = '.';
    }
    // Distinct names can sanitize identically ("A|B", "A.B").
    return out + "-" + sha256_hex(peer).substr(0, 8);
}

fs::path DirectoryCache::path_for(const std::string& peer) const {
    return directory_ / (safe_name(peer) + ".xdcc.txt");
}

std::optional<std::string> DirectoryCache::read(const std::string& peer) const {
    auto path = path_for(peer);
    std::error_code ec;
    if(!fs::is_regular_file(path, ec)) {
        log_debug(logger_.get(), "cache miss for {}: no record", peer);
        return std::nullopt;
    }
    auto size = fs::file_size(path, ec);
    if(ec || size < min_bytes_) {
        log_debug(logger_.get(), "cache miss for {}: record too small ({} bytes)", peer, size);
        return std::nullopt;
    }
    auto written = fs::last_write_time(path, ec);
    if(ec) return std::nullopt;
    auto age = fs::file_time_type::clock::now() - written;
    if(age > staleness_) {
        log_debug(logger_.get(), "cache miss for {}: record is {}s old", peer,
                  std::chrono::duration_cast<std::chrono::seconds>(age).count());
        return std::nullopt;
    }

    std::ifstream in(path, std::ios::binary);
    if(!in) return std::nullopt;
    std::ostringstream body;
    body << in.rdbuf();
    log_debug(logger_.get(), "cache hit for {} ({})", peer, path.string());
    return body.str();
}

void DirectoryCache::write(const std::string& peer, const std::string& raw_listing) const {
    std::error_code ec;
    fs::create_directories(directory_, ec);
    if(ec) {
        throw TransferError("Unable to create cache directory " + directory_.string() + ": " + ec.message());
    }
    auto path = path_for(peer);
    auto staging = path;
    staging += ".part";
    {
        std::ofstream out(staging, std::ios::binary | std::ios::trunc);
        if(!out) throw TransferError("Unable to write " + staging.string());
        out.write(raw_listing.data(), static_cast<std::streamsize>(raw_listing.size()));
        if(!out) throw TransferError("Unable to write " + staging.string());
    }
    fs::rename(staging, path, ec);
    if(ec) {
        throw TransferError("Unable to replace " + path.string() + ": " + ec.message());
    }
    log_debug(logger_.get(), "cached listing for {} ({} bytes)", peer, raw_listing.size());
}
