#include "JobMirrorClient.hpp"

namespace jm {
namespace {
const string PERIODIC_SYNC_TIMER = "periodic-sync";

void logFailure(const string& what, const optional<SyncError>& error) {
  if (error) {
    LOG(WARNING) << what << " failed: " << *error;
  }
}
}  // namespace

JobMirrorClient::JobMirrorClient(shared_ptr<RemoteChannel> _channel,
                                 shared_ptr<Executor> _executor,
                                 const SyncConfig& _config)
    : channel(_channel),
      executor(_executor),
      config(_config),
      connected(false),
      hasConnectedOnce(false),
      eventSubscription(-1),
      connectivitySubscription(-1) {
  repository.reset(new JobRepository(executor, config));
  coordinator.reset(
      new RequestCoordinator(channel, executor, repository, config));
  applier.reset(new EventApplier(repository, coordinator));
  streams.reset(new TerminalStreamManager(channel, executor, config));
  sessions.reset(
      new TerminalSessionService(channel, executor, streams, config));
}

JobMirrorClient::~JobMirrorClient() { stop(); }

void JobMirrorClient::runOnExecutor(function<void()> task) {
  weak_ptr<JobMirrorClient> weakSelf = weak_from_this();
  executor->post([weakSelf, task]() {
    auto self = weakSelf.lock();
    if (!self) {
      VLOG(1) << "Dropping task for a destroyed client";
      return;
    }
    task();
  });
}

void JobMirrorClient::start() {
  if (eventSubscription >= 0) {
    return;
  }
  // Channel threads never touch the client directly.
  weak_ptr<JobMirrorClient> weakSelf = weak_from_this();
  shared_ptr<Executor> exec = executor;
  eventSubscription = channel->subscribeEvents(
      [weakSelf, exec](const RemoteEvent& event) {
        exec->post([weakSelf, event]() {
          auto self = weakSelf.lock();
          if (self) {
            self->handleEvent(event);
          }
        });
      });
  connectivitySubscription = channel->subscribeConnectivity(
      [weakSelf, exec](const string& deviceId, bool isConnected) {
        exec->post([weakSelf, deviceId, isConnected]() {
          auto self = weakSelf.lock();
          if (self) {
            self->handleConnectivity(deviceId, isConnected);
          }
        });
      });
  runOnExecutor([this]() {
    auto deviceId = channel->activeDeviceId().value_or("");
    handleConnectivity(deviceId,
                       !deviceId.empty() && channel->isConnected(deviceId));
  });
}

void JobMirrorClient::stop() {
  if (eventSubscription >= 0) {
    channel->unsubscribe(eventSubscription);
    eventSubscription = -1;
  }
  if (connectivitySubscription >= 0) {
    channel->unsubscribe(connectivitySubscription);
    connectivitySubscription = -1;
  }
  executor->cancelAll();
}

void JobMirrorClient::handleConnectivity(const string& deviceId,
                                         bool isConnected) {
  if (deviceId != currentDeviceId) {
    if (!currentDeviceId.empty()) {
      LOG(INFO) << "Active device changed from " << currentDeviceId << " to "
                << (deviceId.empty() ? "<none>" : deviceId)
                << ", resetting local state";
      resetAll();
    }
    currentDeviceId = deviceId;
    connected = false;
  }

  streams->onConnectivityChanged(deviceId, isConnected);

  if (isConnected && !connected) {
    connected = true;
    ReconcileReason reason = hasConnectedOnce
                                 ? ReconcileReason::CONNECTIVITY_RECONNECTED
                                 : ReconcileReason::INITIAL_LOAD;
    hasConnectedOnce = true;
    LOG(INFO) << "Connected to " << deviceId;
    coordinator->reconcile(reason, [](const optional<SyncError>& error) {
      logFailure("Reconnect reconcile", error);
    });
    sessions->bootstrapFromRemote([](const optional<SyncError>& error) {
      logFailure("Terminal bootstrap", error);
    });
    schedulePeriodicSync();
  } else if (!isConnected && connected) {
    connected = false;
    LOG(INFO) << "Disconnected from " << deviceId;
    executor->cancel(PERIODIC_SYNC_TIMER);
  }
}

void JobMirrorClient::handleEvent(const RemoteEvent& event) {
  applier->apply(event);
  sessions->handleEvent(event);
}

void JobMirrorClient::resetAll() {
  executor->cancelAll();
  coordinator->reset();
  applier->reset();
  repository->reset();
  streams->reset();
  sessions->reset();
}

void JobMirrorClient::schedulePeriodicSync() {
  weak_ptr<JobMirrorClient> weakSelf = weak_from_this();
  executor->schedule(PERIODIC_SYNC_TIMER, config.periodicSyncIntervalMs,
                     [weakSelf]() {
                       auto self = weakSelf.lock();
                       if (!self || !self->connected) {
                         return;
                       }
                       self->coordinator->reconcile(
                           ReconcileReason::PERIODIC_SYNC,
                           [](const optional<SyncError>& error) {
                             logFailure("Periodic reconcile", error);
                           });
                       self->schedulePeriodicSync();
                     });
}

void JobMirrorClient::setActiveSession(const string& sessionId,
                                       const string& projectDirectory) {
  runOnExecutor([this, sessionId, projectDirectory]() {
    JobScope scope = JobScope::normalize(sessionId, projectDirectory);
    const JobScope& current = coordinator->getScope();
    if (scope.sessionId == current.sessionId &&
        scope.projectDirectory == current.projectDirectory) {
      return;
    }
    coordinator->setScope(scope);
    coordinator->reconcile(ReconcileReason::SESSION_CHANGED,
                           [](const optional<SyncError>& error) {
                             logFailure("Session change reconcile", error);
                           });
  });
}

void JobMirrorClient::reconcile(ReconcileReason reason,
                                SyncCompletion completion) {
  runOnExecutor([this, reason, completion]() {
    coordinator->reconcile(reason, completion);
  });
}

void JobMirrorClient::listJobs(const ListJobsRequest& request,
                               ListJobsCallback callback) {
  runOnExecutor(
      [this, request, callback]() { coordinator->listJobs(request, callback); });
}

void JobMirrorClient::getJob(const string& jobId, JobCallback callback) {
  runOnExecutor(
      [this, jobId, callback]() { coordinator->fetchJob(jobId, callback); });
}

void JobMirrorClient::cancelJob(const string& jobId, const string& reason,
                                SyncCompletion completion) {
  runOnExecutor([this, jobId, reason, completion]() {
    coordinator->cancelJob(jobId, reason, completion);
  });
}

void JobMirrorClient::deleteJob(const string& jobId,
                                SyncCompletion completion) {
  runOnExecutor([this, jobId, completion]() {
    coordinator->deleteJob(jobId, completion);
  });
}

JobPtr JobMirrorClient::job(const string& jobId) const {
  auto state = repository->derivedState().get();
  for (const auto& job : state.jobs) {
    if (job->id == jobId) {
      return job;
    }
  }
  return nullptr;
}

void JobMirrorClient::startTerminal(const string& jobId, const string& shell,
                                    TerminalSessionCallback callback) {
  runOnExecutor([this, jobId, shell, callback]() {
    sessions->startSession(jobId, shell, callback);
  });
}

void JobMirrorClient::ensureTerminal(const string& jobId, bool autostart,
                                     TerminalSessionCallback callback) {
  runOnExecutor([this, jobId, autostart, callback]() {
    sessions->ensureSession(jobId, autostart, callback);
  });
}

void JobMirrorClient::writeTerminal(const string& jobId, const string& bytes,
                                    TerminalCompletion completion) {
  runOnExecutor([this, jobId, bytes, completion]() {
    sessions->write(jobId, bytes, completion);
  });
}

void JobMirrorClient::sendLargeText(const string& jobId, const string& text,
                                    bool appendNewline,
                                    TerminalCompletion completion) {
  runOnExecutor([this, jobId, text, appendNewline, completion]() {
    sessions->sendLargeText(jobId, text, appendNewline, completion);
  });
}

void JobMirrorClient::sendCtrlC(const string& jobId,
                                TerminalCompletion completion) {
  runOnExecutor(
      [this, jobId, completion]() { sessions->sendCtrlC(jobId, completion); });
}

void JobMirrorClient::resizeTerminal(const string& jobId, int cols, int rows,
                                     TerminalCompletion completion) {
  runOnExecutor([this, jobId, cols, rows, completion]() {
    sessions->resize(jobId, cols, rows, completion);
  });
}

void JobMirrorClient::killTerminal(const string& jobId,
                                   TerminalCompletion completion) {
  runOnExecutor(
      [this, jobId, completion]() { sessions->kill(jobId, completion); });
}

void JobMirrorClient::detachTerminal(const string& jobId) {
  runOnExecutor([this, jobId]() { sessions->detach(jobId); });
}

void JobMirrorClient::openTerminalStream(
    const string& jobId, TerminalConsumer consumer,
    function<void(int, const optional<SyncError>&)> opened) {
  runOnExecutor([this, jobId, consumer, opened]() {
    sessions->ensureSession(
        jobId, true,
        [this, consumer, opened](const optional<TerminalSession>& session,
                                 const optional<SyncError>& error) {
          if (!session) {
            opened(-1, error ? error
                             : optional<SyncError>(SyncError::invalidState(
                                   "No terminal session")));
            return;
          }
          opened(streams->attach(session->id, consumer), std::nullopt);
        });
  });
}

void JobMirrorClient::closeTerminalStream(const string& jobId, int token) {
  runOnExecutor([this, jobId, token]() {
    auto session = sessions->sessionForJob(jobId);
    if (!session) {
      LOG(WARNING) << "No terminal session to close for job " << jobId;
      return;
    }
    streams->detach(session->id, token);
  });
}

string JobMirrorClient::terminalSnapshot(const string& jobId) const {
  auto session = sessions->sessionForJob(jobId);
  if (!session) {
    return "";
  }
  return streams->snapshot(session->id);
}
}  // namespace jm
