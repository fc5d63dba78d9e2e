#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <thread>

#include "log.hpp"
#include "protocol.hpp"
#include "transport.hpp"

struct XdccClientOptions {
  std::string server = "irc.rizon.net";
  uint16_t port = 6670;
  std::string nickname;   // empty: random_nickname()
  std::string channel;    // empty: the bot is reachable without joining
  std::chrono::milliseconds connect_timeout{std::chrono::seconds(30)};
  std::chrono::milliseconds availability_timeout{std::chrono::seconds(60)};
  std::filesystem::path download_dir = std::filesystem::current_path();
};

enum class ClientState {
  Idle,
  Connecting,
  Connected,
  JoiningChannel,
  Available,
  AwaitingHandshake,
  Transferring,
  Closed
};

const char* to_string(ClientState state);

struct TransferResult {
  std::string filename;
  uint64_t declared_size = 0;
  uint64_t bytes_received = 0;
  std::filesystem::path path;   // set when the client opened the destination itself
};

struct TransferProgress {
  std::string filename;
  uint64_t bytes_received = 0;
  uint64_t declared_size = 0;
};

// XDCC client for a single bot over one chat connection.
//
// One request is outstanding at a time; concurrent request_pack() callers
// queue on availability. Every way out of request_pack() leaves the client
// Available (or Closed).
class XdccClient {
public:
  using ProgressCallback = std::function<void(const TransferProgress&)>;

  XdccClient(std::string bot,
             std::unique_ptr<Transport> transport,
             XdccClientOptions options = {},
             std::shared_ptr<Logger> logger = nullptr);
  ~XdccClient();

  XdccClient(const XdccClient&) = delete;
  XdccClient& operator=(const XdccClient&) = delete;

  // Returns once the server has welcomed us; channel joining continues in the
  // background. Throws ConnectionError.
  void connect();

  // Asks the bot for `pack` and blocks until it has been received.
  //
  // With `stream` the bytes go there and the caller keeps ownership; without
  // it the file is written to download_dir under the name the bot announces.
  // `timeout` bounds the wait for resolution (nullopt waits indefinitely).
  //
  // Throws RequestTimeout, ProtocolError, TransferInterrupted, TransferError,
  // ConnectionError.
  TransferResult request_pack(const Pack& pack,
                              std::ostream* stream = nullptr,
                              std::optional<std::chrono::milliseconds> timeout = std::nullopt);

  void close();

  ClientState state() const;
  const std::string& bot() const { return bot_; }
  const std::string& nickname() const { return nickname_; }

  void set_progress_callback(ProgressCallback callback);

private:
  enum class Resolution { Completed, Interrupted, Failed, Closed };

  struct PendingTransfer {
    Pack pack;
    std::ostream* caller_stream = nullptr;
    std::unique_ptr<std::ofstream> owned_stream;
    std::filesystem::path owned_path;
    std::string filename;
    std::optional<uint64_t> declared_size;
    uint64_t bytes_received = 0;
    std::optional<BinaryId> binary;
    bool completion_requested = false;
    std::optional<Resolution> resolution;
    std::string error;
    bool protocol_error = false;

    std::ostream* sink() { return owned_stream ? owned_stream.get() : caller_stream; }
  };

  void on_welcome();
  void on_joined(const std::string& channel);
  void on_ctcp(const std::string& from, const std::string& payload);
  void on_binary_data(BinaryId id, const char* data, std::size_t size);
  void on_binary_closed(BinaryId id);
  void on_disconnected(const std::string& reason);

  // All of these require mutex_ to be held.
  void set_state_locked(ClientState next);
  void resolve_locked(Resolution resolution, const std::string& error = std::string());
  void release_stream_locked(PendingTransfer& transfer);

  std::string bot_;
  std::unique_ptr<Transport> transport_;
  XdccClientOptions options_;
  std::shared_ptr<Logger> logger_;
  std::string nickname_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  ClientState state_ = ClientState::Idle;
  std::shared_ptr<PendingTransfer> pending_;
  std::string disconnect_reason_;
  ProgressCallback progress_;

  std::thread loop_thread_;
};
