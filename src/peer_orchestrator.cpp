#include "peer_orchestrator.hpp"

#include <algorithm>
#include <exception>
#include <utility>

#include "xdcc_errors.hpp"

SearchStream::SearchStream(std::shared_ptr<Shared> shared, std::vector<std::thread> workers)
  : shared_(std::move(shared)), workers_(std::move(workers)) {}

SearchStream::~SearchStream() {
  for(auto& worker : workers_) {
    if(worker.joinable()) worker.join();
  }
}

std::optional<CatalogEntry> SearchStream::next() {
  std::unique_lock<std::mutex> lock(shared_->mutex);
  shared_->cv.wait(lock, [this]{
    return !shared_->ready.empty() || shared_->remaining == 0;
  });
  if(shared_->ready.empty()) return std::nullopt;
  CatalogEntry entry = std::move(shared_->ready.front());
  shared_->ready.pop_front();
  return entry;
}

std::vector<CatalogEntry> SearchStream::drain() {
  std::vector<CatalogEntry> out;
  while(auto entry = next()) {
    out.push_back(std::move(*entry));
  }
  return out;
}

std::vector<PeerFailure> SearchStream::failures() const {
  std::lock_guard<std::mutex> lock(shared_->mutex);
  return shared_->failures;
}

bool SearchStream::all_failed() const {
  std::lock_guard<std::mutex> lock(shared_->mutex);
  return shared_->peers > 0 && shared_->failures.size() == shared_->peers;
}

PeerOrchestrator::PeerOrchestrator(std::vector<std::string> bots,
                                   std::size_t max_workers,
                                   ServiceFactory service_factory,
                                   std::shared_ptr<Logger> logger)
  : bots_(std::move(bots)),
    max_workers_(std::max<std::size_t>(1, max_workers)),
    service_factory_(std::move(service_factory)),
    logger_(std::move(logger)) {}

SearchStream PeerOrchestrator::search_all(const std::string& title, double cutoff) const {
  return run([title, cutoff](CatalogService& service){
    return service.search(title, cutoff);
  });
}

SearchStream PeerOrchestrator::list_all() const {
  return run([](CatalogService& service){
    return service.list_files();
  });
}

SearchStream PeerOrchestrator::run(Operation operation) const {
  auto shared = std::make_shared<SearchStream::Shared>();
  shared->jobs.assign(bots_.begin(), bots_.end());
  shared->peers = bots_.size();
  shared->remaining = bots_.size();

  auto take_job = [shared]() -> std::optional<std::string> {
    std::lock_guard<std::mutex> lock(shared->mutex);
    if(shared->jobs.empty()) return std::nullopt;
    std::string bot = std::move(shared->jobs.front());
    shared->jobs.pop_front();
    return bot;
  };

  auto worker_fn = [shared, take_job, operation, factory = service_factory_, logger = logger_](){
    while(auto bot = take_job()) {
      std::vector<CatalogEntry> results;
      std::optional<std::string> failure;
      try {
        auto service = factory(*bot);
        if(!service) throw ConnectionError(*bot + ": no catalog service");
        results = operation(*service);
      } catch(const std::exception& e) {
        failure = e.what();
      }

      if(failure) {
        log_warn(logger.get(), "{} skipped: {}", *bot, *failure);
      } else {
        log_debug(logger.get(), "{} returned {} entries", *bot, results.size());
      }
      {
        std::lock_guard<std::mutex> lock(shared->mutex);
        if(failure) {
          shared->failures.push_back(PeerFailure{*bot, *failure});
        }
        for(auto& entry : results) {
          shared->ready.push_back(std::move(entry));
        }
        --shared->remaining;
      }
      shared->cv.notify_all();
    }
  };

  const std::size_t worker_count = std::min(max_workers_, bots_.size());
  std::vector<std::thread> workers;
  workers.reserve(worker_count);
  for(std::size_t i = 0; i < worker_count; ++i) {
    workers.emplace_back(worker_fn);
  }
  return SearchStream(std::move(shared), std::move(workers));
}
