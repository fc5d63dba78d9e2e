#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "catalog_entry.hpp"
#include "catalog_service.hpp"
#include "log.hpp"

inline constexpr std::size_t kDefaultPeerWorkers = 5;

using ServiceFactory = std::function<std::unique_ptr<CatalogService>(const std::string& bot)>;

struct PeerFailure {
  std::string bot;
  std::string reason;
};

// Entries from several bots in arrival order. next() blocks until an entry
// is ready and returns nullopt once every bot has reported. Destroying the
// stream waits for the remaining workers.
class SearchStream {
public:
  SearchStream(SearchStream&&) = default;
  SearchStream& operator=(SearchStream&&) = delete;
  SearchStream(const SearchStream&) = delete;
  SearchStream& operator=(const SearchStream&) = delete;
  ~SearchStream();

  std::optional<CatalogEntry> next();

  // Blocks until exhausted and returns what was not yet consumed.
  std::vector<CatalogEntry> drain();

  std::vector<PeerFailure> failures() const;
  // Only meaningful once the stream is exhausted.
  bool all_failed() const;

private:
  friend class PeerOrchestrator;

  struct Shared {
    mutable std::mutex mutex;
    std::condition_variable cv;
    std::deque<std::string> jobs;
    std::deque<CatalogEntry> ready;
    std::size_t peers = 0;
    std::size_t remaining = 0;
    std::vector<PeerFailure> failures;
  };

  SearchStream(std::shared_ptr<Shared> shared, std::vector<std::thread> workers);

  std::shared_ptr<Shared> shared_;
  std::vector<std::thread> workers_;
};

// Runs one catalog operation against every known bot on a bounded pool.
// Bots share nothing; a bot that fails is logged and contributes nothing.
class PeerOrchestrator {
public:
  using Operation = std::function<std::vector<CatalogEntry>(CatalogService&)>;

  PeerOrchestrator(std::vector<std::string> bots,
                   std::size_t max_workers,
                   ServiceFactory service_factory,
                   std::shared_ptr<Logger> logger = nullptr);

  SearchStream search_all(const std::string& title, double cutoff = kDefaultSearchCutoff) const;
  SearchStream list_all() const;
  SearchStream run(Operation operation) const;

  const std::vector<std::string>& bots() const { return bots_; }

private:
  std::vector<std::string> bots_;
  std::size_t max_workers_;
  ServiceFactory service_factory_;
  std::shared_ptr<Logger> logger_;
};
