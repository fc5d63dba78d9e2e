#pragma once

#include "transport.hpp"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace xdcc::test {

// In-process stand-in for an IRC server plus one XDCC bot. Requests are
// answered from a pack table; every event is delivered from the thread that
// calls run(), never from inside a request method.
class MockTransport : public Transport {
public:
  struct Behaviour {
    bool welcome = true;
    bool echo_join = true;
    bool respond = true;
    std::chrono::milliseconds handshake_delay{0};
    std::chrono::milliseconds chunk_delay{0};
    std::size_t chunk_size = 1024;
    // Bot hangs up after this many bytes.
    std::optional<std::size_t> truncate_at;
    // Sent instead of a well formed DCC SEND; the pack content is still
    // what the binary stream delivers.
    std::string handshake_override;
    // Nick the handshake comes from; empty means the nick the request went to.
    std::string reply_from;
  };

  struct PackFile {
    std::string filename;
    std::string content;
  };

  MockTransport() : MockTransport(Behaviour()) {}
  explicit MockTransport(Behaviour behaviour) : behaviour_(std::move(behaviour)) {}

  ~MockTransport() override {
    stop();
  }

  void add_pack(const std::string& token, std::string filename, std::string content) {
    std::lock_guard<std::mutex> lock(mutex_);
    packs_[token] = PackFile{std::move(filename), std::move(content)};
  }

  void update(const std::function<void(Behaviour&)>& change) {
    std::lock_guard<std::mutex> lock(mutex_);
    change(behaviour_);
  }

  // Runs `fn` on the event thread with the registered callbacks.
  void inject(std::function<void(const Events&)> fn) {
    schedule(std::chrono::milliseconds(0), [this, fn = std::move(fn)](){ fn(events_); });
  }

  void drop_connection(const std::string& reason) {
    inject([reason](const Events& events){
      if(events.on_disconnected) events.on_disconnected(reason);
    });
  }

  std::vector<std::string> requests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_;
  }

  std::vector<std::string> joined() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return joined_;
  }

  std::size_t binaries_opened() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return binaries_opened_;
  }

  std::size_t max_open_binaries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return max_open_;
  }

  bool disconnected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return disconnected_;
  }

  void set_events(Events events) override {
    events_ = std::move(events);
  }

  void connect(const std::string&, uint16_t, const std::string& nickname) override {
    bool welcome = false;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      nickname_ = nickname;
      welcome = behaviour_.welcome;
    }
    if(welcome) {
      inject([](const Events& events){ if(events.on_welcome) events.on_welcome(); });
    }
  }

  void join(const std::string& channel) override {
    bool echo = false;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      joined_.push_back(channel);
      echo = behaviour_.echo_join;
    }
    if(echo) {
      inject([channel](const Events& events){ if(events.on_joined) events.on_joined(channel); });
    }
  }

  void send_ctcp(const std::string& target, const std::string& payload) override {
    static const std::string kRequestPrefix = "XDCC send ";
    std::string handshake;
    std::string from;
    std::chrono::milliseconds delay{0};
    {
      std::lock_guard<std::mutex> lock(mutex_);
      requests_.push_back(payload);
      if(!behaviour_.respond || payload.rfind(kRequestPrefix, 0) != 0) return;
      auto it = packs_.find(payload.substr(kRequestPrefix.size()));
      if(it == packs_.end()) return;
      from = behaviour_.reply_from.empty() ? target : behaviour_.reply_from;
      delay = behaviour_.handshake_delay;
      if(!behaviour_.handshake_override.empty()) {
        handshake = behaviour_.handshake_override;
      } else {
        // 2130706433 is 127.0.0.1.
        handshake = "DCC SEND \"" + it->second.filename + "\" 2130706433 5000 " +
                    std::to_string(it->second.content.size());
      }
      offered_.push_back(it->second.content);
    }
    schedule(delay, [this, from, handshake](){
      if(events_.on_ctcp) events_.on_ctcp(from, handshake);
    });
  }

  BinaryId open_binary(const std::string&, uint16_t) override {
    std::lock_guard<std::mutex> lock(mutex_);
    const BinaryId id = next_binary_++;
    ++binaries_opened_;
    open_.insert(id);
    max_open_ = std::max(max_open_, open_.size());

    std::string content;
    if(!offered_.empty()) {
      content = std::move(offered_.front());
      offered_.erase(offered_.begin());
    }
    std::size_t limit = content.size();
    if(behaviour_.truncate_at) limit = std::min(limit, *behaviour_.truncate_at);

    const std::size_t chunk = std::max<std::size_t>(1, behaviour_.chunk_size);
    std::size_t step = 0;
    for(std::size_t offset = 0; offset < limit; offset += chunk, ++step) {
      std::string piece = content.substr(offset, std::min(chunk, limit - offset));
      schedule_locked(behaviour_.chunk_delay * static_cast<int>(step + 1), [this, id, piece](){
        if(!is_open(id)) return;
        if(events_.on_binary_data) events_.on_binary_data(id, piece.data(), piece.size());
      });
    }
    if(limit < content.size()) {
      schedule_locked(behaviour_.chunk_delay * static_cast<int>(step + 1), [this, id](){
        close_binary(id);
      });
    }
    return id;
  }

  void close_binary(BinaryId id) override {
    std::lock_guard<std::mutex> lock(mutex_);
    if(open_.erase(id) == 0) return;
    schedule_locked(std::chrono::milliseconds(0), [this, id](){
      if(events_.on_binary_closed) events_.on_binary_closed(id);
    });
  }

  void disconnect() override {
    std::vector<BinaryId> open;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      disconnected_ = true;
      open.assign(open_.begin(), open_.end());
    }
    for(auto id : open) close_binary(id);
  }

  void run() override {
    std::unique_lock<std::mutex> lock(mutex_);
    while(!stopped_) {
      if(tasks_.empty()) {
        cv_.wait(lock);
        continue;
      }
      auto next = tasks_.begin();
      if(next->first.first > Clock::now()) {
        cv_.wait_until(lock, next->first.first);
        continue;
      }
      auto task = std::move(next->second);
      tasks_.erase(next);
      lock.unlock();
      task();
      lock.lock();
    }
  }

  void stop() override {
    std::lock_guard<std::mutex> lock(mutex_);
    stopped_ = true;
    cv_.notify_all();
  }

private:
  using Clock = std::chrono::steady_clock;
  // (due time, sequence) keeps same-time tasks in submission order.
  using TaskKey = std::pair<Clock::time_point, uint64_t>;

  void schedule(std::chrono::milliseconds delay, std::function<void()> task) {
    std::lock_guard<std::mutex> lock(mutex_);
    schedule_locked(delay, std::move(task));
  }

  void schedule_locked(std::chrono::milliseconds delay, std::function<void()> task) {
    tasks_.emplace(TaskKey{Clock::now() + delay, next_task_++}, std::move(task));
    cv_.notify_all();
  }

  bool is_open(BinaryId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return open_.count(id) != 0;
  }

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::map<TaskKey, std::function<void()>> tasks_;
  uint64_t next_task_ = 0;
  bool stopped_ = false;

  Events events_;
  Behaviour behaviour_;
  std::map<std::string, PackFile> packs_;
  std::vector<std::string> offered_;
  std::string nickname_;
  std::vector<std::string> requests_;
  std::vector<std::string> joined_;
  std::set<BinaryId> open_;
  BinaryId next_binary_ = 1;
  std::size_t binaries_opened_ = 0;
  std::size_t max_open_ = 0;
  bool disconnected_ = false;
};

} // namespace xdcc::test
