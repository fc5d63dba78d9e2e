#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "catalog_entry.hpp"
#include "catalog_service.hpp"
#include "log.hpp"
#include "peer_orchestrator.hpp"
#include "xdcc_client.hpp"

// "1,3,5-7" -> {1, 3, 5, 6, 7}. A reversed range contributes nothing.
// Throws std::invalid_argument for anything else, e.g. "1-2-3" or "x".
std::vector<int> parse_episode_ranges(const std::string& text);

// Leading zeros removed; an all-zero episode becomes "0".
std::string normalize_episode(const std::string& episode);

struct SearchFilters {
  std::set<std::string> episodes;   // normalized; empty keeps every episode
  std::string resolution;
  std::string group;
  std::string bot;

  static SearchFilters from_settings(const std::string& episodes,
                                     const std::string& resolution,
                                     const std::string& group,
                                     const std::string& bot);

  bool matches(const CatalogEntry& entry) const;
};

struct SearchCommandOptions {
  std::string title;
  double cutoff = kDefaultSearchCutoff;
  SearchFilters filters;
  bool download = false;
  std::filesystem::path download_dir = std::filesystem::current_path();
  bool transfer_progress = true;
  std::size_t progress_meter_size = 40;
};

// A local file within this many bytes of the announced size counts as downloaded.
inline constexpr uint64_t kAlreadyDownloadedSlack = 0x1000;

class SearchCommand {
public:
  SearchCommand(const PeerOrchestrator& orchestrator,
                ClientFactory client_factory,
                SearchCommandOptions options,
                std::shared_ptr<Logger> logger = nullptr);

  // Prints the matching entries and, when asked, downloads them.
  // Returns the process exit status.
  int run();

  // Matching entries, each printed as it arrives. Sets `all_failed` when no bot answered.
  std::vector<CatalogEntry> collect(bool& all_failed);

  // True when every entry was fetched or skipped.
  bool download_all(const std::vector<CatalogEntry>& entries);

  static bool already_downloaded(const CatalogEntry& entry, const std::filesystem::path& dir);

  static std::string format_size(uint64_t bytes);
  static std::string format_meter(uint64_t received, uint64_t total, std::size_t width);

private:
  bool download_one(const CatalogEntry& entry);

  const PeerOrchestrator& orchestrator_;
  ClientFactory client_factory_;
  SearchCommandOptions options_;
  std::shared_ptr<Logger> logger_;
};
