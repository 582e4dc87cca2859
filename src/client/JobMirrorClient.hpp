#ifndef __JM_JOB_MIRROR_CLIENT__
#define __JM_JOB_MIRROR_CLIENT__

#include "EventApplier.hpp"
#include "JobRepository.hpp"
#include "RequestCoordinator.hpp"
#include "TerminalSessionService.hpp"
#include "TerminalStreamManager.hpp"

namespace jm {
/**
 * @brief Entry point for the UI layer.
 *
 * Wires the job engine and the terminal manager to one RemoteChannel and one
 * executor.  Public methods may be called from any thread; they post onto the
 * executor, and callbacks run there.  Must be owned by a shared_ptr: queued
 * tasks and remote replies hold the client weakly, so work still pending
 * when it is destroyed is dropped.
 */
class JobMirrorClient : public std::enable_shared_from_this<JobMirrorClient> {
 public:
  JobMirrorClient(shared_ptr<RemoteChannel> _channel,
                  shared_ptr<Executor> _executor, const SyncConfig& _config);
  ~JobMirrorClient();

  /** @brief Subscribes to the channel and evaluates current connectivity. */
  void start();

  /** @brief Unsubscribes from the channel and cancels every timer. */
  void stop();

  /** @brief Changes the job scope and reconciles if it changed. */
  void setActiveSession(const string& sessionId,
                        const string& projectDirectory);

  void reconcile(ReconcileReason reason, SyncCompletion completion);
  void listJobs(const ListJobsRequest& request, ListJobsCallback callback);
  void getJob(const string& jobId, JobCallback callback);
  void cancelJob(const string& jobId, const string& reason,
                 SyncCompletion completion);
  void deleteJob(const string& jobId, SyncCompletion completion);

  /**
   * @brief Thread-safe lookup in the last published projection.  After a
   * high-frequency update (tokens, cost, stream progress, response chunks)
   * the copy returned may trail the store by up to `publish_debounce_ms`,
   * the same lag `derivedState()` subscribers see.
   */
  JobPtr job(const string& jobId) const;

  ObservableValue<DerivedState>& derivedState() {
    return repository->derivedState();
  }
  ObservableValue<JobsStatus>& jobsStatus() { return repository->status(); }
  ObservableValue<TerminalSessionTable>& terminalSessions() {
    return sessions->sessions();
  }

  void startTerminal(const string& jobId, const string& shell,
                     TerminalSessionCallback callback);
  void ensureTerminal(const string& jobId, bool autostart,
                      TerminalSessionCallback callback);
  void writeTerminal(const string& jobId, const string& bytes,
                     TerminalCompletion completion);
  void sendLargeText(const string& jobId, const string& text,
                     bool appendNewline, TerminalCompletion completion);
  void sendCtrlC(const string& jobId, TerminalCompletion completion);
  void resizeTerminal(const string& jobId, int cols, int rows,
                      TerminalCompletion completion);
  void killTerminal(const string& jobId, TerminalCompletion completion);
  void detachTerminal(const string& jobId);

  /**
   * @brief Attaches `consumer` to the job's terminal output: buffered bytes
   * first, then the live tail.  `opened` receives the token for
   * `closeTerminalStream`.
   */
  void openTerminalStream(
      const string& jobId, TerminalConsumer consumer,
      function<void(int token, const optional<SyncError>&)> opened);
  void closeTerminalStream(const string& jobId, int token);

  /** @brief Buffered bytes for a job's terminal.  Executor only. */
  string terminalSnapshot(const string& jobId) const;

 protected:
  void handleConnectivity(const string& deviceId, bool connected);
  void handleEvent(const RemoteEvent& event);
  void resetAll();
  void schedulePeriodicSync();
  /** @brief Posts `task`, skipping it if the client is gone by then. */
  void runOnExecutor(function<void()> task);

  shared_ptr<RemoteChannel> channel;
  shared_ptr<Executor> executor;
  SyncConfig config;
  shared_ptr<JobRepository> repository;
  shared_ptr<RequestCoordinator> coordinator;
  shared_ptr<EventApplier> applier;
  shared_ptr<TerminalStreamManager> streams;
  shared_ptr<TerminalSessionService> sessions;

  string currentDeviceId;
  bool connected;
  bool hasConnectedOnce;
  int eventSubscription;
  int connectivitySubscription;
};
}  // namespace jm

#endif  // __JM_JOB_MIRROR_CLIENT__
