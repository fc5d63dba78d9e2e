#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "catalog_entry.hpp"
#include "directory_cache.hpp"
#include "directory_parser.hpp"
#include "log.hpp"
#include "xdcc_client.hpp"

inline constexpr double kDefaultSearchCutoff = 0.6;
inline constexpr std::size_t kMaxTitleMatches = 8;

// Builds an unconnected client for one bot.
using ClientFactory = std::function<std::unique_ptr<XdccClient>(const std::string& bot)>;

struct CatalogOptions {
  // Bound on a listing transfer; nullopt waits as long as the bot keeps the stream open.
  std::optional<std::chrono::milliseconds> listing_timeout;
  // Bound on a pack download.
  std::optional<std::chrono::milliseconds> download_timeout;
};

// Listing, search and download against a single bot. The client is created
// and connected on first use and reused afterwards.
class CatalogService {
public:
  CatalogService(std::string bot,
                 std::shared_ptr<DirectoryCache> cache,
                 ClientFactory client_factory,
                 CatalogOptions options = {},
                 std::shared_ptr<Logger> logger = nullptr);
  ~CatalogService();

  CatalogService(const CatalogService&) = delete;
  CatalogService& operator=(const CatalogService&) = delete;

  // Cached listing when fresh, otherwise fetched from the bot and cached.
  std::vector<CatalogEntry> list_files();

  // Every entry whose title is among the (at most eight) titles closest to `title`.
  std::vector<CatalogEntry> search(const std::string& title, double cutoff = kDefaultSearchCutoff);

  TransferResult download(uint32_t pack_id, std::ostream* stream = nullptr);

  void close();

  const std::string& bot() const { return bot_; }

private:
  XdccClient& client();
  std::string fetch_listing();

  std::string bot_;
  std::shared_ptr<DirectoryCache> cache_;
  ClientFactory client_factory_;
  CatalogOptions options_;
  std::shared_ptr<Logger> logger_;
  std::unique_ptr<XdccClient> client_;
};
