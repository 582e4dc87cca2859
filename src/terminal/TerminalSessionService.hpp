#ifndef __JM_TERMINAL_SESSION_SERVICE__
#define __JM_TERMINAL_SESSION_SERVICE__

#include "JsonFields.hpp"
#include "ObservableValue.hpp"
#include "RpcCall.hpp"
#include "TerminalStreamManager.hpp"

namespace jm {
struct TerminalSession {
  string id;
  string jobId;
  string deviceId;
  string workingDirectory;
  string shell;
  bool isActive = false;

  json toJson() const;
};

/** @brief jobId -> session. */
typedef map<string, TerminalSession> TerminalSessionTable;

typedef function<void(const optional<TerminalSession>&,
                      const optional<SyncError>&)>
    TerminalSessionCallback;
typedef function<void(const optional<SyncError>&)> TerminalCompletion;

/**
 * @brief Remote terminal session lifecycle keyed by job id.
 *
 * Wraps the terminal.* RPCs and keeps the session table that the stream
 * manager's buffers belong to.  All methods must run on the executor.  Owned
 * by a shared_ptr; remote replies hold it weakly.
 */
class TerminalSessionService
    : public std::enable_shared_from_this<TerminalSessionService> {
 public:
  TerminalSessionService(shared_ptr<RemoteChannel> _channel,
                         shared_ptr<Executor> _executor,
                         shared_ptr<TerminalStreamManager> _streams,
                         const SyncConfig& _config);

  /** @brief Starts a new remote session for `jobId`. */
  void startSession(const string& jobId, const string& shell,
                    TerminalSessionCallback callback);

  /**
   * @brief Returns the known session for `jobId`, recovering it from the
   * remote side or starting one when `autostart` is set.  Concurrent calls
   * for one job share a single attempt.
   */
  void ensureSession(const string& jobId, bool autostart,
                     TerminalSessionCallback callback);

  /** @brief Writes raw bytes to the session's input. */
  void write(const string& jobId, const string& bytes,
             TerminalCompletion completion);

  /** @brief Writes `text` in `largeTextChunkSize` pieces, in order. */
  void sendLargeText(const string& jobId, const string& text,
                     bool appendNewline, TerminalCompletion completion);

  void sendCtrlC(const string& jobId, TerminalCompletion completion);

  void resize(const string& jobId, int cols, int rows,
              TerminalCompletion completion);

  /** @brief Terminates the remote process and finalizes the binding. */
  void kill(const string& jobId, TerminalCompletion completion);

  /** @brief Best-effort remote detach.  Failures are only logged. */
  void detach(const string& jobId);

  /** @brief Recovers sessions that are already running on the device. */
  void bootstrapFromRemote(TerminalCompletion completion);

  /** @brief Handles `terminal.exit`; other events are ignored. */
  void handleEvent(const RemoteEvent& event);

  optional<TerminalSession> sessionForJob(const string& jobId) const;
  ObservableValue<TerminalSessionTable>& sessions() { return published; }

  /** @brief Forgets all sessions.  Pending callbacks are failed. */
  void reset();

 protected:
  void callRemote(const string& method, const json& params,
                  RpcCompletion completion);
  void recordSession(const TerminalSession& session);
  void markInactive(const string& jobId);
  TerminalSession sessionFromMetadata(const string& sessionId,
                                      const string& jobId,
                                      const string& deviceId,
                                      const json& metadata) const;
  void finishEnsure(const string& jobId,
                    const optional<TerminalSession>& session,
                    const optional<SyncError>& error);
  void recoverFromStatus(const string& jobId, const string& sessionId,
                         bool autostart, const string& status);
  void writeChunks(const string& sessionId, shared_ptr<vector<string>> chunks,
                   size_t index, TerminalCompletion completion);
  optional<string> requireSessionId(const string& jobId,
                                    TerminalCompletion completion);

  shared_ptr<RemoteChannel> channel;
  shared_ptr<Executor> executor;
  shared_ptr<TerminalStreamManager> streams;
  SyncConfig config;
  TerminalSessionTable table;
  ObservableValue<TerminalSessionTable> published;
  unordered_map<string, vector<TerminalSessionCallback>> ensureWaiters;
  uint64_t generation;
};
}  // namespace jm

#endif  // __JM_TERMINAL_SESSION_SERVICE__
