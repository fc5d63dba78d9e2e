#include "xdcc_client.hpp"

#include <algorithm>
#include <exception>
#include <utility>

#include "utils.hpp"
#include "xdcc_errors.hpp"

namespace fs = std::filesystem;

namespace {

long long whole_seconds(std::chrono::milliseconds value) {
  return std::chrono::duration_cast<std::chrono::seconds>(value).count();
}

} // namespace

const char* to_string(ClientState state) {
  switch(state) {
  case ClientState::Idle: return "Idle";
  case ClientState::Connecting: return "Connecting";
  case ClientState::Connected: return "Connected";
  case ClientState::JoiningChannel: return "JoiningChannel";
  case ClientState::Available: return "Available";
  case ClientState::AwaitingHandshake: return "AwaitingHandshake";
  case ClientState::Transferring: return "Transferring";
  case ClientState::Closed: return "Closed";
  }
  return "Unknown";
}

XdccClient::XdccClient(std::string bot,
                       std::unique_ptr<Transport> transport,
                       XdccClientOptions options,
                       std::shared_ptr<Logger> logger)
  : bot_(std::move(bot)),
    transport_(std::move(transport)),
    options_(std::move(options)),
    logger_(std::move(logger)),
    nickname_(options_.nickname.empty() ? random_nickname() : options_.nickname) {
  Transport::Events events;
  events.on_welcome = [this](){ on_welcome(); };
  events.on_joined = [this](const std::string& channel){ on_joined(channel); };
  events.on_ctcp = [this](const std::string& from, const std::string& payload){ on_ctcp(from, payload); };
  events.on_binary_data = [this](BinaryId id, const char* data, std::size_t size){ on_binary_data(id, data, size); };
  events.on_binary_closed = [this](BinaryId id){ on_binary_closed(id); };
  events.on_disconnected = [this](const std::string& reason){ on_disconnected(reason); };
  transport_->set_events(std::move(events));
}

XdccClient::~XdccClient() {
  close();
}

ClientState XdccClient::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

void XdccClient::set_progress_callback(ProgressCallback callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  progress_ = std::move(callback);
}

void XdccClient::connect() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if(state_ == ClientState::Closed) {
      throw ConnectionError(bot_ + ": client is closed");
    }
    if(state_ != ClientState::Idle) return;
    set_state_locked(ClientState::Connecting);
    log_debug(logger_.get(), "connecting to {}:{} as {}", options_.server, options_.port, nickname_);
    // Started under the lock so close() always sees the thread it has to join.
    loop_thread_ = std::thread([this](){
      try {
        transport_->run();
      } catch(const std::exception& e) {
        log_error(logger_.get(), "event loop failed: {}", e.what());
        on_disconnected(e.what());
      }
    });
  }
  transport_->connect(options_.server, options_.port, nickname_);

  std::unique_lock<std::mutex> lock(mutex_);
  bool settled = cv_.wait_for(lock, options_.connect_timeout,
                              [this]{ return state_ != ClientState::Connecting; });
  if(!settled) {
    lock.unlock();
    close();
    throw ConnectionError(bot_ + ": no welcome from " + options_.server + " within " +
                          std::to_string(whole_seconds(options_.connect_timeout)) + "s");
  }
  if(state_ == ClientState::Closed) {
    throw ConnectionError(bot_ + ": " + (disconnect_reason_.empty() ? std::string("connection closed")
                                                                    : disconnect_reason_));
  }
}

TransferResult XdccClient::request_pack(const Pack& pack,
                                        std::ostream* stream,
                                        std::optional<std::chrono::milliseconds> timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  bool ready = cv_.wait_for(lock, options_.availability_timeout, [this]{
    return state_ == ClientState::Available || state_ == ClientState::Closed;
  });
  if(!ready) {
    throw RequestTimeout(bot_ + ": not available within " +
                         std::to_string(whole_seconds(options_.availability_timeout)) + "s");
  }
  if(state_ == ClientState::Closed) {
    throw ConnectionError(bot_ + ": client is closed");
  }

  auto transfer = std::make_shared<PendingTransfer>();
  transfer->pack = pack;
  transfer->caller_stream = stream;
  pending_ = transfer;
  set_state_locked(ClientState::AwaitingHandshake);
  lock.unlock();

  log_debug(logger_.get(), "SEND {}", pack.token());
  try {
    transport_->send_ctcp(bot_, make_xdcc_request(pack));
  } catch(const std::exception& e) {
    lock.lock();
    resolve_locked(Resolution::Failed, std::string("unable to send request: ") + e.what());
    throw ConnectionError(bot_ + ": unable to send request: " + e.what());
  }

  lock.lock();
  auto resolved = [&transfer]{ return transfer->resolution.has_value(); };
  if(timeout) {
    if(!cv_.wait_for(lock, *timeout, resolved)) {
      // Re-arm here instead of waiting for the bot to hang up.
      auto binary = transfer->binary;
      transfer->resolution = Resolution::Failed;
      release_stream_locked(*transfer);
      if(pending_ == transfer) pending_.reset();
      if(state_ != ClientState::Closed) set_state_locked(ClientState::Available);
      lock.unlock();
      if(binary) transport_->close_binary(*binary);
      throw RequestTimeout(bot_ + ": pack " + pack.token() + " not resolved within " +
                           std::to_string(timeout->count()) + "ms");
    }
  } else {
    cv_.wait(lock, resolved);
  }

  switch(*transfer->resolution) {
  case Resolution::Completed:
    return TransferResult{transfer->filename,
                          transfer->declared_size.value_or(0),
                          transfer->bytes_received,
                          transfer->owned_path};
  case Resolution::Interrupted:
    throw TransferInterrupted(transfer->filename, transfer->bytes_received,
                              transfer->declared_size.value_or(0));
  case Resolution::Closed:
    throw ConnectionError(bot_ + ": " + transfer->error);
  case Resolution::Failed:
    break;
  }
  if(transfer->protocol_error) throw ProtocolError(bot_ + ": " + transfer->error);
  throw TransferError(bot_ + ": " + transfer->error);
}

void XdccClient::close() {
  std::optional<BinaryId> binary;
  std::thread loop;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if(state_ == ClientState::Closed && !loop_thread_.joinable()) return;
    if(pending_) binary = pending_->binary;
    resolve_locked(Resolution::Closed, "client closed");
    if(state_ != ClientState::Closed) set_state_locked(ClientState::Closed);
    // Only the caller that takes the thread tears the connection down.
    loop = std::move(loop_thread_);
  }
  cv_.notify_all();

  if(!loop.joinable()) return;
  if(binary) transport_->close_binary(*binary);
  transport_->disconnect();
  transport_->stop();
  if(loop.get_id() == std::this_thread::get_id()) {
    loop.detach();
  } else {
    loop.join();
  }
}

void XdccClient::on_welcome() {
  bool join = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if(state_ != ClientState::Connecting) return;
    log_debug(logger_.get(), "WELCOME");
    set_state_locked(ClientState::Connected);
    if(options_.channel.empty()) {
      set_state_locked(ClientState::Available);
    } else {
      set_state_locked(ClientState::JoiningChannel);
      join = true;
    }
  }
  if(join) transport_->join(options_.channel);
}

void XdccClient::on_joined(const std::string& channel) {
  std::lock_guard<std::mutex> lock(mutex_);
  if(state_ != ClientState::JoiningChannel || !iequals(channel, options_.channel)) return;
  log_debug(logger_.get(), "JOIN {}", channel);
  set_state_locked(ClientState::Available);
}

void XdccClient::on_ctcp(const std::string& from, const std::string& payload) {
  std::lock_guard<std::mutex> lock(mutex_);
  if(!iequals(from, bot_)) {
    log_debug(logger_.get(), "ignoring CTCP from {}: {}", from, payload);
    return;
  }

  std::optional<DccOffer> offer;
  try {
    offer = parse_dcc_send(payload);
  } catch(const ProtocolError& e) {
    if(state_ != ClientState::AwaitingHandshake || !pending_) {
      log_debug(logger_.get(), "ignoring malformed handshake in state {}: {}", to_string(state_), e.what());
      return;
    }
    log_warn(logger_.get(), "{}", e.what());
    pending_->protocol_error = true;
    resolve_locked(Resolution::Failed, e.what());
    return;
  }
  if(!offer) {
    log_debug(logger_.get(), "ignoring CTCP {}", payload);
    return;
  }
  if(state_ != ClientState::AwaitingHandshake || !pending_) {
    log_debug(logger_.get(), "ignoring DCC SEND for {} in state {}", offer->filename, to_string(state_));
    return;
  }

  log_debug(logger_.get(), "CTCP {}", payload);
  auto& transfer = *pending_;
  transfer.filename = offer->filename;
  transfer.declared_size = offer->size;

  if(!transfer.caller_stream) {
    fs::path name = fs::path(offer->filename).filename();
    if(name.empty() || name == "." || name == "..") {
      transfer.protocol_error = true;
      resolve_locked(Resolution::Failed, "unusable filename '" + offer->filename + "'");
      return;
    }
    fs::path target = options_.download_dir / name;
    auto out = std::make_unique<std::ofstream>(target, std::ios::binary | std::ios::trunc);
    if(!*out) {
      resolve_locked(Resolution::Failed, "unable to open " + target.string() + " for writing");
      return;
    }
    transfer.owned_stream = std::move(out);
    transfer.owned_path = target;
  }

  // open_binary() only queues work, so holding the lock here cannot re-enter it.
  transfer.binary = transport_->open_binary(offer->address, offer->port);
  set_state_locked(ClientState::Transferring);
  log_info(logger_.get(), "receiving {} ({} bytes) from {}:{}",
           offer->filename, offer->size, offer->address, offer->port);
}

void XdccClient::on_binary_data(BinaryId id, const char* data, std::size_t size) {
  std::optional<BinaryId> finish;
  ProgressCallback progress;
  TransferProgress snapshot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if(state_ != ClientState::Transferring || !pending_ || pending_->binary != id) return;
    auto& transfer = *pending_;
    const uint64_t declared = transfer.declared_size.value_or(0);
    const uint64_t room = declared > transfer.bytes_received ? declared - transfer.bytes_received : 0;
    const std::size_t accepted = static_cast<std::size_t>(std::min<uint64_t>(size, room));
    if(accepted < size) {
      log_debug(logger_.get(), "dropping {} bytes past the declared size of {}",
                size - accepted, transfer.filename);
    }
    std::ostream* out = transfer.sink();
    out->write(data, static_cast<std::streamsize>(accepted));
    if(!*out) {
      resolve_locked(Resolution::Failed, "write to destination failed for " + transfer.filename);
      finish = id;
    } else {
      transfer.bytes_received += accepted;
      if(!transfer.completion_requested && transfer.bytes_received >= declared) {
        transfer.completion_requested = true;
        finish = id;
      }
      progress = progress_;
      snapshot = TransferProgress{transfer.filename, transfer.bytes_received, declared};
    }
  }
  if(progress) progress(snapshot);
  if(finish) transport_->close_binary(*finish);
}

void XdccClient::on_binary_closed(BinaryId id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if(!pending_ || pending_->binary != id) return;
  const auto& transfer = *pending_;
  const uint64_t declared = transfer.declared_size.value_or(0);
  if(transfer.bytes_received >= declared) {
    log_info(logger_.get(), "received {} ({} bytes)", transfer.filename, transfer.bytes_received);
    resolve_locked(Resolution::Completed);
  } else {
    log_warn(logger_.get(), "{} closed after {} of {} bytes",
             transfer.filename, transfer.bytes_received, declared);
    resolve_locked(Resolution::Interrupted);
  }
}

void XdccClient::on_disconnected(const std::string& reason) {
  std::lock_guard<std::mutex> lock(mutex_);
  if(state_ == ClientState::Closed) return;
  disconnect_reason_ = reason;
  resolve_locked(Resolution::Closed, "connection lost: " + reason);
  set_state_locked(ClientState::Closed);
}

void XdccClient::set_state_locked(ClientState next) {
  if(state_ == next) return;
  log_debug(logger_.get(), "{} -> {}", to_string(state_), to_string(next));
  state_ = next;
  cv_.notify_all();
}

void XdccClient::resolve_locked(Resolution resolution, const std::string& error) {
  auto transfer = pending_;
  if(!transfer || transfer->resolution) return;
  transfer->resolution = resolution;
  transfer->error = error;
  release_stream_locked(*transfer);
  pending_.reset();
  if(state_ != ClientState::Closed) set_state_locked(ClientState::Available);
  cv_.notify_all();
}

void XdccClient::release_stream_locked(PendingTransfer& transfer) {
  if(transfer.owned_stream) {
    transfer.owned_stream->close();
    transfer.owned_stream.reset();
  } else if(transfer.caller_stream) {
    transfer.caller_stream->flush();
    transfer.caller_stream = nullptr;
  }
}
