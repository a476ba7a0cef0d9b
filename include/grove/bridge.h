#ifndef INCLUDE_GROVE_BRIDGE_H_
#define INCLUDE_GROVE_BRIDGE_H_

#include <deque>
#include <mutex>
#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <functional>
#include <condition_variable>

#include <grove/config.h>
#include <grove/registry.h>

class Launcher;
class Subprocess;

#define ENUM_CLOSE_REASON_ \
  X(CLIENT_CLOSED, "client disconnected") \
  X(COMPANION_EXITED, "language server exited") \
  X(FRAMING_ERROR, "malformed frame from language server") \
  X(TRANSPORT_ERROR, "language server transport error") \
  X(START_FAILED, "failed to start language server")
enum class CloseReason {
#define X(name, desc) name,
  ENUM_CLOSE_REASON_
#undef X
};

// Relays one client connection to its own companion language server.
// Client messages are raw JSON-RPC; the companion speaks Content-Length framing
// on stdin/stdout. The companion is started on the first client message.
class BridgeSession {
 public:
  struct Client {
    // called from the session's reader thread; should not block
    std::function<void(const std::string&)> Send;
    // called at most once, never after OnClientClose
    std::function<void(CloseReason, const std::string& detail)> Close;
  };

 private:
  SessionRegistry& registry_;
  const Launcher& launcher_;
  std::vector<std::string> command_;
  size_t max_frame_size_;
  Client client_;
  const std::string key_;

  SessionRegistry::Handle handle_;
  std::shared_ptr<Subprocess> companion_;
  std::thread reader_, writer_;

  std::mutex mtx_;
  std::condition_variable cv_;
  std::deque<std::string> outgoing_;
  bool started_, stopping_, released_;
  std::atomic_bool client_closed_;

  void Start_();
  void WriterLoop_();
  void ReaderLoop_();
  void Fail_(CloseReason, const std::string& detail);
  void Release_();
 public:
  BridgeSession(SessionRegistry& registry, const Launcher& launcher, const Config& config, Client client);
  ~BridgeSession();
  BridgeSession(const BridgeSession&) = delete;
  BridgeSession& operator=(const BridgeSession&) = delete;

  // Transport thread, in arrival order; never blocks on the companion
  void OnClientMessage(std::string msg);
  // The client is gone: stop the companion and release the workspace.
  // Blocks until the session threads have stopped.
  void OnClientClose();

  const std::string& Key() const { return key_; }
  bool Started();
};

#endif  // INCLUDE_GROVE_BRIDGE_H_
