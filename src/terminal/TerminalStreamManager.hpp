#ifndef __JM_TERMINAL_STREAM_MANAGER__
#define __JM_TERMINAL_STREAM_MANAGER__

#include "BindingRegistry.hpp"
#include "RemoteChannel.hpp"
#include "RingBuffer.hpp"
#include "SyncConfig.hpp"

namespace jm {
typedef function<void(const string& bytes)> TerminalConsumer;

/**
 * @brief Owns per-session terminal buffers and the single binary
 * subscription to the active device.
 *
 * Consumers get the buffered snapshot as one unit, then the live tail.
 * Buffers outlive consumers and are dropped only by `reset`.  All methods
 * must run on the executor.  Owned by a shared_ptr; the byte feed holds it
 * weakly.
 */
class TerminalStreamManager
    : public std::enable_shared_from_this<TerminalStreamManager> {
 public:
  TerminalStreamManager(shared_ptr<RemoteChannel> _channel,
                        shared_ptr<Executor> _executor,
                        const SyncConfig& _config);
  /** @brief Leaves the byte feed. */
  ~TerminalStreamManager();

  /**
   * @brief Attaches a live consumer to `sessionId`, binding the session on
   * the remote producer if this is the first reference.
   * @return A token for `detach`.
   */
  int attach(const string& sessionId, TerminalConsumer consumer);

  /** @brief Removes a consumer and drops its binding reference. */
  void detach(const string& sessionId, int token);

  /**
   * @brief Called on real session termination.  Schedules the deferred
   * unbind.
   */
  void finalize(const string& sessionId);

  /** @brief Appends bytes produced outside the binary feed (e.g. a start
   * log). */
  void appendLocal(const string& sessionId, const string& bytes);

  /** @brief Sends text to live consumers without buffering it. */
  void deliverNotice(const string& sessionId, const string& text);

  /**
   * @brief Tracks connectivity of the active device.  A fresh connection
   * re-opens the subscription and rebinds every bound session.
   */
  void onConnectivityChanged(const string& deviceId, bool connected);

  /** @brief Routes one raw binary frame from the transport. */
  void handleRawFrame(const string& raw);

  /** @brief Drops every buffer, binding and the subscription. */
  void reset();

  string snapshot(const string& sessionId) const;
  bool hasBuffer(const string& sessionId) const {
    return streams.find(sessionId) != streams.end();
  }
  optional<int64_t> lastActivityMs(const string& sessionId) const;
  const string& getLastBoundSessionId() const { return lastBoundSessionId; }
  const BindingRegistry& getBindings() const { return bindings; }
  bool isSubscribed() const { return subscriptionId >= 0; }

 protected:
  struct SessionStream {
    shared_ptr<RingBuffer> buffer;
    map<int, TerminalConsumer> consumers;
    optional<int64_t> lastActivityMs;
  };

  SessionStream& ensureStream(const string& sessionId);
  /** @brief Opens the device subscription if needed.  Returns true when a
   * new one was created. */
  bool ensureSubscription(const string& deviceId);
  void dropSubscription();
  void sendBind(const string& sessionId, bool includeSnapshot);
  void sendUnbind(const string& deviceId, const string& sessionId);

  shared_ptr<RemoteChannel> channel;
  shared_ptr<Executor> executor;
  SyncConfig config;
  BindingRegistry bindings;
  unordered_map<string, SessionStream> streams;
  string subscribedDeviceId;
  int subscriptionId;
  string lastBoundSessionId;
  int nextConsumerToken;
  uint64_t generation;
};
}  // namespace jm

#endif  // __JM_TERMINAL_STREAM_MANAGER__
