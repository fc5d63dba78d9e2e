#include "catalog_service.hpp"
#include "directory_cache.hpp"
#include "log.hpp"
#include "peer_orchestrator.hpp"
#include "search_command.hpp"
#include "test_runner_utils.hpp"
#include "xdcc_errors.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

using xdcc::test::TestCase;
using xdcc::test::TestContext;
using xdcc::test::listing_row;
using xdcc::test::make_listing;
using namespace std::chrono_literals;

const std::vector<std::string> kBots = {"CR-HOLLAND|NEW", "CR-ARUTHA|NEW", "ARUTHA-BATCH|1080p"};

// Every bot carries the same show under its own pack numbers; the listings
// are served from the cache so no client is ever needed.
std::shared_ptr<DirectoryCache> seeded_cache(const std::filesystem::path& dir) {
  auto cache = std::make_shared<DirectoryCache>(dir);
  uint32_t base = 100;
  for(const auto& bot : kBots) {
    cache->write(bot, make_listing({
      listing_row(base + 1, 10, "1.4G", "SubsPlease", "Some Anime", "01", "1080p"),
      listing_row(base + 2, 10, "700.5M", "SubsPlease", "Some Anime", "01", "720p"),
      listing_row(base + 3, 10, "1.4G", "SubsPlease", "Some Anime", "02", "1080p"),
      listing_row(base + 4, 10, "300M", "Erai-raws", "Some Anime", "10", "480p"),
      listing_row(base + 5, 10, "1.4G", "SubsPlease", "Other Series", "01", "1080p"),
    }));
    base += 100;
  }
  return cache;
}

ClientFactory no_clients() {
  return [](const std::string& bot) -> std::unique_ptr<XdccClient> {
    throw ConnectionError(bot + ": unreachable");
  };
}

ServiceFactory cached_services(std::shared_ptr<DirectoryCache> cache,
                               std::shared_ptr<Logger> logger,
                               std::set<std::string> failing = {}) {
  return [cache, logger, failing](const std::string& bot) -> std::unique_ptr<CatalogService> {
    if(failing.count(bot)) {
      throw ConnectionError(bot + ": no route to host");
    }
    return std::make_unique<CatalogService>(bot, cache, no_clients(), CatalogOptions{}, logger);
  };
}

bool test_search_all_merges_bots(TestContext& ctx) {
  xdcc::test::TempWorkspace workspace("orchestrator_merge");
  auto logger = std::make_shared<Logger>("orchestrator");
  ctx.logs.attach(logger);
  PeerOrchestrator orchestrator(kBots, 2, cached_services(seeded_cache(workspace.root()), logger), logger);

  auto stream = orchestrator.search_all("Some Anime");
  std::map<std::string, std::vector<uint32_t>> per_bot;
  std::size_t total = 0;
  while(auto entry = stream.next()) {
    per_bot[entry->source_peer].push_back(entry->id);
    ++total;
  }
  bool in_order = std::all_of(per_bot.begin(), per_bot.end(), [](const auto& kv){
    return std::is_sorted(kv.second.begin(), kv.second.end()) && kv.second.size() == 4;
  });
  return total == 12 && per_bot.size() == 3 && in_order &&
         stream.failures().empty() && !stream.all_failed() &&
         !stream.next().has_value();
}

bool test_list_all(TestContext& ctx) {
  xdcc::test::TempWorkspace workspace("orchestrator_list");
  auto logger = std::make_shared<Logger>("orchestrator");
  ctx.logs.attach(logger);
  PeerOrchestrator orchestrator(kBots, 5, cached_services(seeded_cache(workspace.root()), logger), logger);
  auto entries = orchestrator.list_all().drain();
  return entries.size() == 15;
}

bool test_failing_bot_does_not_abort(TestContext& ctx) {
  xdcc::test::TempWorkspace workspace("orchestrator_failure");
  auto logger = std::make_shared<Logger>("orchestrator");
  ctx.logs.attach(logger);
  PeerOrchestrator orchestrator(kBots, 3,
                                cached_services(seeded_cache(workspace.root()), logger, {"CR-ARUTHA|NEW"}),
                                logger);
  auto stream = orchestrator.search_all("Some Anime");
  auto entries = stream.drain();
  auto failures = stream.failures();
  bool no_failed_entries = std::none_of(entries.begin(), entries.end(), [](const CatalogEntry& e){
    return e.source_peer == "CR-ARUTHA|NEW";
  });
  return entries.size() == 8 && no_failed_entries &&
         failures.size() == 1 && failures.front().bot == "CR-ARUTHA|NEW" &&
         !stream.all_failed() &&
         ctx.logs.contains("CR-ARUTHA|NEW skipped");
}

bool test_all_failed(TestContext& ctx) {
  auto logger = std::make_shared<Logger>("orchestrator");
  ctx.logs.attach(logger);
  ServiceFactory broken = [](const std::string& bot) -> std::unique_ptr<CatalogService> {
    throw ConnectionError(bot + ": no welcome");
  };
  PeerOrchestrator orchestrator(kBots, 2, broken, logger);
  auto stream = orchestrator.search_all("Some Anime");
  return !stream.next().has_value() && stream.all_failed() && stream.failures().size() == kBots.size();
}

bool test_worker_bound(TestContext& ctx) {
  auto logger = std::make_shared<Logger>("orchestrator");
  ctx.logs.attach(logger);
  std::vector<std::string> bots;
  for(int i = 0; i < 6; ++i) bots.push_back("BOT-" + std::to_string(i));

  auto active = std::make_shared<std::atomic<int>>(0);
  auto peak = std::make_shared<std::atomic<int>>(0);
  ServiceFactory factory = [](const std::string& bot){
    return std::make_unique<CatalogService>(bot, nullptr, no_clients(), CatalogOptions{}, nullptr);
  };
  PeerOrchestrator orchestrator(bots, 2, factory, logger);
  auto stream = orchestrator.run([active, peak](CatalogService& service){
    int now = ++*active;
    int seen = peak->load();
    while(now > seen && !peak->compare_exchange_weak(seen, now)) {}
    std::this_thread::sleep_for(30ms);
    --*active;
    CatalogEntry entry;
    entry.source_peer = service.bot();
    return std::vector<CatalogEntry>{entry};
  });
  auto entries = stream.drain();
  return entries.size() == bots.size() && peak->load() <= 2 && peak->load() >= 1;
}

bool test_episode_ranges(TestContext&) {
  auto parsed = parse_episode_ranges("1,3,5-7");
  bool ranges = parsed == std::vector<int>{1, 3, 5, 6, 7};
  bool reversed = parse_episode_ranges("7-5").empty();
  bool spaced = parse_episode_ranges(" 2 , 4") == std::vector<int>{2, 4};

  auto rejects = [](const std::string& text){
    try {
      parse_episode_ranges(text);
    } catch(const std::invalid_argument&) {
      return true;
    }
    return false;
  };
  return ranges && reversed && spaced &&
         rejects("1-2-3") && rejects("abc") && rejects("1,,2") && rejects("-3");
}

bool test_episode_normalization(TestContext&) {
  return normalize_episode("05") == "5" &&
         normalize_episode("12") == "12" &&
         normalize_episode("00") == "0" &&
         normalize_episode("0") == "0" &&
         normalize_episode("").empty() &&
         normalize_episode("01v2") == "1v2";
}

bool test_filters(TestContext&) {
  auto filters = SearchFilters::from_settings("1-2", "1080p", "SubsPlease", "");
  CatalogEntry entry;
  entry.episode = "02";
  entry.resolution = "1080p";
  entry.group = "SubsPlease";
  entry.source_peer = "CR-HOLLAND|NEW";
  bool keeps = filters.matches(entry);

  CatalogEntry wrong_res = entry;
  wrong_res.resolution = "720p";
  CatalogEntry wrong_ep = entry;
  wrong_ep.episode = "03";
  CatalogEntry wrong_group = entry;
  wrong_group.group = "Erai-raws";

  auto by_bot = SearchFilters::from_settings("", "", "", "CR-ARUTHA|NEW");
  auto everything = SearchFilters::from_settings("", "", "", "");
  return keeps && !filters.matches(wrong_res) && !filters.matches(wrong_ep) &&
         !filters.matches(wrong_group) &&
         !by_bot.matches(entry) && everything.matches(entry);
}

bool test_search_command_prints_filtered(TestContext& ctx) {
  xdcc::test::TempWorkspace workspace("search_command");
  auto logger = std::make_shared<Logger>("orchestrator");
  ctx.logs.attach(logger);
  auto out = std::make_shared<Logger>("out");
  ctx.logs.attach(out, "out");
  PeerOrchestrator orchestrator(kBots, 3, cached_services(seeded_cache(workspace.root()), logger), logger);

  SearchCommandOptions options;
  options.title = "Some Anime";
  options.filters = SearchFilters::from_settings("1", "1080p", "", "");
  SearchCommand command(orchestrator, no_clients(), options, out);
  bool all_failed = true;
  auto entries = command.collect(all_failed);
  bool printed = ctx.logs.contains("out: [SubsPlease] Some Anime - 01 (1080p)        (#101 - CR-HOLLAND|NEW)");
  bool only_matching = std::all_of(entries.begin(), entries.end(), [](const CatalogEntry& e){
    return e.episode == "01" && e.resolution == "1080p";
  });
  return !all_failed && entries.size() == 3 && only_matching && printed && command.run() == 0;
}

bool test_search_command_fails_when_every_bot_fails(TestContext& ctx) {
  auto logger = std::make_shared<Logger>("orchestrator");
  ctx.logs.attach(logger);
  ServiceFactory broken = [](const std::string& bot) -> std::unique_ptr<CatalogService> {
    throw ConnectionError(bot + ": no welcome");
  };
  PeerOrchestrator orchestrator(kBots, 2, broken, logger);
  SearchCommandOptions options;
  options.title = "Some Anime";
  SearchCommand command(orchestrator, no_clients(), options, logger);
  return command.run() == 1;
}

bool test_already_downloaded(TestContext&) {
  xdcc::test::TempWorkspace workspace("already_downloaded");
  CatalogEntry entry;
  entry.filename = "episode.mkv";
  entry.size_bytes = 10000;
  bool missing = !SearchCommand::already_downloaded(entry, workspace.root());

  workspace.write_file("episode.mkv", std::string(10000 - 4095, 'x'));
  bool close_enough = SearchCommand::already_downloaded(entry, workspace.root());

  workspace.write_file("episode.mkv", std::string(10000 - 4096, 'x'));
  bool too_short = !SearchCommand::already_downloaded(entry, workspace.root());
  return missing && close_enough && too_short;
}

bool test_download_skips_existing(TestContext& ctx) {
  xdcc::test::TempWorkspace workspace("download_skip");
  auto logger = std::make_shared<Logger>("orchestrator");
  ctx.logs.attach(logger);
  auto out = std::make_shared<Logger>("out");
  ctx.logs.attach(out, "out");
  PeerOrchestrator orchestrator(kBots, 1, cached_services(nullptr, logger), logger);

  CatalogEntry present;
  present.filename = "present.mkv";
  present.size_bytes = 2048;
  present.source_peer = kBots.front();
  workspace.write_file("present.mkv", std::string(2048, 'p'));

  CatalogEntry absent = present;
  absent.filename = "absent.mkv";
  absent.id = 9;

  SearchCommandOptions options;
  options.download_dir = workspace.root();
  options.transfer_progress = false;
  SearchCommand command(orchestrator, no_clients(), options, out);
  bool ok = command.download_all({present, absent});
  return !ok &&
         ctx.logs.contains("out: Skipping present.mkv, already downloaded") &&
         ctx.logs.contains("Failed to download absent.mkv");
}

bool test_size_formatting(TestContext&) {
  return SearchCommand::format_size(512) == "512b" &&
         SearchCommand::format_size(2048) == "2K" &&
         SearchCommand::format_size(734527488) == "700.5M" &&
         SearchCommand::format_meter(0, 100, 4) == "[    ] 0.0%" &&
         SearchCommand::format_meter(100, 100, 4) == "[####] 100.0%" &&
         SearchCommand::format_meter(50, 100, 4) == "[##  ] 50.0%";
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"search_all_merges_bots", test_search_all_merges_bots},
    {"list_all", test_list_all},
    {"failing_bot_does_not_abort", test_failing_bot_does_not_abort},
    {"all_failed", test_all_failed},
    {"worker_bound", test_worker_bound},
    {"episode_ranges", test_episode_ranges},
    {"episode_normalization", test_episode_normalization},
    {"filters", test_filters},
    {"search_command_prints_filtered", test_search_command_prints_filtered},
    {"search_command_fails_when_every_bot_fails", test_search_command_fails_when_every_bot_fails},
    {"already_downloaded", test_already_downloaded},
    {"download_skips_existing", test_download_skips_existing},
    {"size_formatting", test_size_formatting}
  };
  return xdcc::test::run_suite("orchestrator", tests, argc, argv);
}
