#include "search_command.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <system_error>

#include "protocol.hpp"
#include "utils.hpp"
#include "xdcc_errors.hpp"

namespace {

int parse_episode_number(const std::string& text, const std::string& part) {
  std::string clean = trim_copy(text);
  if(clean.empty() ||
     !std::all_of(clean.begin(), clean.end(), [](unsigned char ch){ return std::isdigit(ch); })) {
    throw std::invalid_argument("Episode '" + part + "' is not valid");
  }
  try {
    return std::stoi(clean);
  } catch(const std::out_of_range&) {
    throw std::invalid_argument("Episode '" + part + "' is out of range");
  }
}

} // namespace

std::vector<int> parse_episode_ranges(const std::string& text) {
  std::vector<int> episodes;
  for(const auto& part : split(text, ',')) {
    const auto dashes = std::count(part.begin(), part.end(), '-');
    if(dashes >= 2) {
      throw std::invalid_argument("Range '" + part + "' is not valid");
    }
    if(dashes == 1) {
      const auto dash = part.find('-');
      int first = parse_episode_number(part.substr(0, dash), part);
      int last = parse_episode_number(part.substr(dash + 1), part);
      for(int episode = first; episode <= last; ++episode) {
        episodes.push_back(episode);
      }
    } else {
      episodes.push_back(parse_episode_number(part, part));
    }
  }
  return episodes;
}

std::string normalize_episode(const std::string& episode) {
  const auto first = episode.find_first_not_of('0');
  if(first == std::string::npos) {
    return episode.empty() ? episode : std::string("0");
  }
  return episode.substr(first);
}

SearchFilters SearchFilters::from_settings(const std::string& episodes,
                                           const std::string& resolution,
                                           const std::string& group,
                                           const std::string& bot) {
  SearchFilters filters;
  if(!trim_copy(episodes).empty()) {
    for(int episode : parse_episode_ranges(episodes)) {
      filters.episodes.insert(std::to_string(episode));
    }
  }
  filters.resolution = resolution;
  filters.group = group;
  filters.bot = bot;
  return filters;
}

bool SearchFilters::matches(const CatalogEntry& entry) const {
  if(!episodes.empty() && !episodes.count(normalize_episode(entry.episode))) return false;
  if(!resolution.empty() && resolution != entry.resolution) return false;
  if(!group.empty() && group != entry.group) return false;
  if(!bot.empty() && bot != entry.source_peer) return false;
  return true;
}

SearchCommand::SearchCommand(const PeerOrchestrator& orchestrator,
                             ClientFactory client_factory,
                             SearchCommandOptions options,
                             std::shared_ptr<Logger> logger)
  : orchestrator_(orchestrator),
    client_factory_(std::move(client_factory)),
    options_(std::move(options)),
    logger_(std::move(logger)) {}

int SearchCommand::run() {
  bool all_failed = false;
  auto entries = collect(all_failed);
  if(all_failed) {
    print_err(logger_.get(), "No bot could be reached");
    return 1;
  }
  if(options_.download && !download_all(entries)) {
    return 1;
  }
  return 0;
}

std::vector<CatalogEntry> SearchCommand::collect(bool& all_failed) {
  std::vector<CatalogEntry> matched;
  auto stream = orchestrator_.search_all(options_.title, options_.cutoff);
  while(auto entry = stream.next()) {
    if(!options_.filters.matches(*entry)) continue;
    print_out(logger_.get(), "{}", entry->display_line());
    matched.push_back(std::move(*entry));
  }
  all_failed = stream.all_failed();
  return matched;
}

bool SearchCommand::already_downloaded(const CatalogEntry& entry, const std::filesystem::path& dir) {
  std::error_code ec;
  const auto path = dir / entry.filename;
  if(!std::filesystem::is_regular_file(path, ec)) return false;
  const auto size = std::filesystem::file_size(path, ec);
  if(ec) return false;
  const uint64_t diff = size > entry.size_bytes ? size - entry.size_bytes : entry.size_bytes - size;
  return diff < kAlreadyDownloadedSlack;
}

bool SearchCommand::download_all(const std::vector<CatalogEntry>& entries) {
  bool ok = true;
  for(const auto& entry : entries) {
    if(already_downloaded(entry, options_.download_dir)) {
      print_out(logger_.get(), "Skipping {}, already downloaded", entry.filename);
      continue;
    }
    if(!download_one(entry)) ok = false;
  }
  return ok;
}

bool SearchCommand::download_one(const CatalogEntry& entry) {
  std::size_t meter_width = 0;
  auto last_draw = std::chrono::steady_clock::time_point{};
  std::unique_ptr<XdccClient> client;
  try {
    client = client_factory_(entry.source_peer);
    if(!client) throw ConnectionError(entry.source_peer + ": no client available");

    if(options_.transfer_progress) {
      client->set_progress_callback([&](const TransferProgress& progress){
        const auto now = std::chrono::steady_clock::now();
        const bool finished = progress.bytes_received >= progress.declared_size;
        if(!finished && now - last_draw < std::chrono::milliseconds(200)) return;
        last_draw = now;
        std::ostringstream line;
        line << "\r" << progress.filename << " "
             << format_meter(progress.bytes_received, progress.declared_size, options_.progress_meter_size)
             << " " << format_size(progress.bytes_received);
        auto rendered = line.str();
        std::cerr << rendered;
        if(rendered.size() < meter_width) {
          std::cerr << std::string(meter_width - rendered.size(), ' ');
        } else {
          meter_width = rendered.size();
        }
        std::cerr.flush();
      });
    }

    client->connect();
    auto result = client->request_pack(Pack::number(entry.id));
    if(meter_width > 0) std::cerr << "\n";
    print_out(logger_.get(), "Downloaded {} ({})", result.filename, format_size(result.bytes_received));
    client->close();
    return true;
  } catch(const XdccError& e) {
    if(meter_width > 0) std::cerr << "\n";
    print_err(logger_.get(), "Failed to download {} from {}: {}", entry.filename, entry.source_peer, e.what());
  }
  if(client) client->close();
  return false;
}

std::string SearchCommand::format_size(uint64_t bytes) {
  if(bytes < 1024) {
    return std::to_string(bytes) + "b";
  }
  static const char* suffixes[] = {"B", "K", "M", "G", "T"};
  constexpr std::size_t suffix_count = sizeof(suffixes) / sizeof(suffixes[0]);
  double value = static_cast<double>(bytes);
  std::size_t idx = 0;
  while(idx + 1 < suffix_count && value >= 1024.0) {
    value /= 1024.0;
    ++idx;
  }
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(1) << value;
  std::string out = oss.str();
  if(out.size() > 2 && out.compare(out.size() - 2, 2, ".0") == 0) out.resize(out.size() - 2);
  return out + suffixes[idx];
}

std::string SearchCommand::format_meter(uint64_t received, uint64_t total, std::size_t width) {
  static constexpr char kMeterChars[] = {' ', '.', '_', 'v', 'Y', 'X', 'H', '#'};
  constexpr std::size_t kMeterCharCount = sizeof(kMeterChars) / sizeof(kMeterChars[0]);
  const std::size_t slots = std::max<std::size_t>(1, width);
  const double ratio = total == 0
    ? 1.0
    : std::clamp(static_cast<double>(received) / static_cast<double>(total), 0.0, 1.0);

  std::string bar;
  bar.reserve(slots + 2);
  bar.push_back('[');
  const double filled = ratio * static_cast<double>(slots);
  for(std::size_t slot = 0; slot < slots; ++slot) {
    const double fill = std::clamp(filled - static_cast<double>(slot), 0.0, 1.0);
    std::size_t index = static_cast<std::size_t>(fill * static_cast<double>(kMeterCharCount - 1));
    bar.push_back(kMeterChars[index]);
  }
  bar.push_back(']');

  std::ostringstream oss;
  oss << bar << " " << std::fixed << std::setprecision(1) << ratio * 100.0 << "%";
  return oss.str();
}
