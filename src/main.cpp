#include <cpptrace/cpptrace.hpp>
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <memory>
#include <stdexcept>

#include "catalog_service.hpp"
#include "command_line_parser.hpp"
#include "directory_cache.hpp"
#include "irc_transport.hpp"
#include "log.hpp"
#include "peer_orchestrator.hpp"
#include "search_command.hpp"
#include "settings_manager.hpp"
#include "xdcc_client.hpp"

namespace {

std::filesystem::path path_or(const std::string& value, const std::filesystem::path& fallback) {
  return value.empty() ? fallback : std::filesystem::path(value);
}

XdccClientOptions client_options(const SettingsManager& settings) {
  XdccClientOptions options;
  options.server = settings.get<std::string>("server");
  int port = settings.get<int>("port");
  if(port <= 0 || port > 65535) {
    throw std::invalid_argument("Invalid port '" + std::to_string(port) + "'");
  }
  options.port = static_cast<uint16_t>(port);
  options.nickname = settings.get<std::string>("nickname");
  options.channel = settings.get<std::string>("channel");
  options.connect_timeout = std::chrono::seconds(std::max(1, settings.get<int>("connect_timeout")));
  options.availability_timeout = std::chrono::seconds(std::max(1, settings.get<int>("request_timeout")));
  options.download_dir = path_or(settings.get<std::string>("download_dir"), std::filesystem::current_path());
  return options;
}

} // namespace

int main(int argc, char** argv){
  try {
    SettingsManager settings;
    settings.set_settings_path(std::filesystem::current_path() / ".config" / "settings.json");
    settings.load();

    CommandLineParser parser((argc > 0 && argv && argv[0])
                               ? std::filesystem::path(argv[0]).filename().string()
                               : "xdccdl");
    parser.parse(argc, argv, settings);
    if(settings.help_requested()) {
      parser.usage();
      return 0;
    }

    init(settings.get<bool>("verbose"));
    auto logger = std::make_shared<Logger>("xdccdl");
    logger->debug("Verbose logging enabled");

    if(settings.save_requested()) {
      if(!settings.save()) {
        logger->error("Unable to persist settings to {}", settings.settings_path().string());
      }
    }

    const auto title = settings.get<std::string>("anime");
    if(title.empty()) {
      logger->print_err("Missing <anime> argument");
      parser.usage();
      return 1;
    }

    const double cutoff = settings.get<double>("cutoff");
    if(cutoff < 0.0 || cutoff > 1.0) {
      logger->print_err("Invalid cutoff '{}': expected a value in [0, 1]", cutoff);
      return 1;
    }

    auto peers = settings.get_list("peers");
    const auto bot = settings.get<std::string>("bot");
    if(!bot.empty()) {
      if(std::find(peers.begin(), peers.end(), bot) == peers.end()) {
        logger->print_err("Unknown bot '{}'", bot);
        return 1;
      }
      peers = {bot};
    }
    if(peers.empty()) {
      logger->print_err("No bots configured");
      return 1;
    }

    SearchCommandOptions command_options;
    try {
      command_options.filters = SearchFilters::from_settings(settings.get<std::string>("episodes"),
                                                             settings.get<std::string>("resolution"),
                                                             settings.get<std::string>("group"),
                                                             bot);
    } catch(const std::invalid_argument& e) {
      logger->print_err("{}", e.what());
      return 1;
    }
    command_options.title = title;
    command_options.cutoff = cutoff;
    command_options.download = settings.get<bool>("download");
    command_options.transfer_progress = settings.get<bool>("transfer_progress");
    command_options.progress_meter_size =
      static_cast<std::size_t>(std::max(1, settings.get<int>("progress_meter_size")));

    const auto base_options = client_options(settings);
    command_options.download_dir = base_options.download_dir;

    auto cache = std::make_shared<DirectoryCache>(
      path_or(settings.get<std::string>("cache_dir"), DirectoryCache::default_directory()),
      kListingStaleAfter,
      kMinPlausibleListingBytes,
      logger->child("cache"));

    ClientFactory client_factory = [base_options, logger](const std::string& peer){
      auto peer_logger = logger->child(peer);
      auto transport = std::make_unique<IrcTransport>(peer_logger->child("irc"));
      return std::make_unique<XdccClient>(peer, std::move(transport), base_options, peer_logger);
    };

    CatalogOptions catalog_options;
    if(int seconds = settings.get<int>("listing_timeout"); seconds > 0) {
      catalog_options.listing_timeout = std::chrono::seconds(seconds);
    }

    ServiceFactory service_factory = [cache, client_factory, catalog_options, logger](const std::string& peer){
      return std::make_unique<CatalogService>(peer, cache, client_factory, catalog_options, logger->child(peer));
    };

    PeerOrchestrator orchestrator(peers,
                                  static_cast<std::size_t>(std::max(1, settings.get<int>("workers"))),
                                  service_factory,
                                  logger->child("peers"));

    SearchCommand command(orchestrator, client_factory, command_options, logger);
    return command.run();
  } catch(std::exception& e) {
    init(false);
    Logger logger("xdccdl-main");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
