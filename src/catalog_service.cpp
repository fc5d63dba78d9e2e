#include "catalog_service.hpp"

#include <algorithm>
#include <iterator>
#include <set>
#include <sstream>
#include <unordered_set>

#include "fuzzy_match.hpp"
#include "xdcc_errors.hpp"

CatalogService::CatalogService(std::string bot,
                               std::shared_ptr<DirectoryCache> cache,
                               ClientFactory client_factory,
                               CatalogOptions options,
                               std::shared_ptr<Logger> logger)
  : bot_(std::move(bot)),
    cache_(std::move(cache)),
    client_factory_(std::move(client_factory)),
    options_(options),
    logger_(std::move(logger)) {}

CatalogService::~CatalogService() {
  close();
}

void CatalogService::close() {
  if(client_) {
    client_->close();
    client_.reset();
  }
}

XdccClient& CatalogService::client() {
  if(!client_) {
    auto created = client_factory_(bot_);
    if(!created) throw ConnectionError(bot_ + ": no client available");
    created->connect();
    client_ = std::move(created);
  }
  return *client_;
}

std::string CatalogService::fetch_listing() {
  log_info(logger_.get(), "fetching pack listing from {}", bot_);
  std::ostringstream body;
  client().request_pack(Pack::listing(), &body, options_.listing_timeout);
  std::string raw = body.str();
  if(cache_) {
    try {
      cache_->write(bot_, raw);
    } catch(const TransferError& e) {
      log_warn(logger_.get(), "listing not cached: {}", e.what());
    }
  }
  return raw;
}

std::vector<CatalogEntry> CatalogService::list_files() {
  std::optional<std::string> raw;
  if(cache_) raw = cache_->read(bot_);
  if(!raw) raw = fetch_listing();

  DirectoryParser parser(logger_);
  auto entries = parser.parse(DirectoryParser::strip_frame(*raw), bot_);
  if(parser.last_rejected() > 0) {
    log_warn(logger_.get(), "{}: skipped {} malformed listing lines", bot_, parser.last_rejected());
  }
  return entries;
}

std::vector<CatalogEntry> CatalogService::search(const std::string& title, double cutoff) {
  auto files = list_files();

  std::vector<std::string> titles;
  std::unordered_set<std::string> seen;
  for(const auto& entry : files) {
    if(seen.insert(entry.title).second) titles.push_back(entry.title);
  }

  auto best = close_matches(title, titles, kMaxTitleMatches, cutoff);
  if(best.empty()) return {};
  std::set<std::string> matched(best.begin(), best.end());

  std::vector<CatalogEntry> out;
  std::copy_if(files.begin(), files.end(), std::back_inserter(out),
               [&matched](const CatalogEntry& entry){ return matched.count(entry.title) > 0; });
  log_debug(logger_.get(), "{}: '{}' matched {} titles, {} entries", bot_, title, matched.size(), out.size());
  return out;
}

TransferResult CatalogService::download(uint32_t pack_id, std::ostream* stream) {
  return client().request_pack(Pack::number(pack_id), stream, options_.download_timeout);
}
