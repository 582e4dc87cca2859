#include "TerminalSessionService.hpp"

namespace jm {
namespace {
const string TERMINAL_EXIT = "terminal.exit";

string decodeLogEntry(const json& entry) {
  auto data = jsonString(entry, "data");
  if (!data) {
    return "";
  }
  string decoded;
  if (!Base64::Decode(*data, &decoded)) {
    // Older hosts send plain text.
    return *data;
  }
  return decoded;
}
}  // namespace

json TerminalSession::toJson() const {
  json j;
  j["id"] = id;
  j["jobId"] = jobId;
  j["deviceId"] = deviceId;
  j["workingDirectory"] = workingDirectory;
  j["shell"] = shell;
  j["isActive"] = isActive;
  return j;
}

TerminalSessionService::TerminalSessionService(
    shared_ptr<RemoteChannel> _channel, shared_ptr<Executor> _executor,
    shared_ptr<TerminalStreamManager> _streams, const SyncConfig& _config)
    : channel(_channel),
      executor(_executor),
      streams(_streams),
      config(_config),
      published(TerminalSessionTable()),
      generation(0) {}

void TerminalSessionService::callRemote(const string& method,
                                        const json& params,
                                        RpcCompletion completion) {
  weak_ptr<TerminalSessionService> weakSelf = weak_from_this();
  string deviceId;
  try {
    deviceId = RpcCall::requireConnectedDevice(channel);
  } catch (const SyncError& error) {
    LOG(WARNING) << method << " not sent: " << error;
    RpcOutcome outcome;
    outcome.error = error;
    executor->post([weakSelf, completion, outcome]() {
      if (weakSelf.lock()) {
        completion(outcome);
      }
    });
    return;
  }
  RpcRequest request;
  request.method = method;
  request.params = params;
  uint64_t startGeneration = generation;
  RpcCall::invoke(channel, executor, deviceId, request, weakSelf,
                  [this, method, completion,
                   startGeneration](const RpcOutcome& outcome) {
                    if (startGeneration != generation) {
                      VLOG(1) << "Ignoring " << method
                              << " result from before a reset";
                      return;
                    }
                    completion(outcome);
                  });
}

void TerminalSessionService::startSession(const string& jobId,
                                          const string& shell,
                                          TerminalSessionCallback callback) {
  json params = {{"jobId", jobId}};
  if (!shell.empty()) {
    params["shell"] = shell;
  }
  LOG(INFO) << "Starting terminal for job " << jobId;
  callRemote("terminal.start", params,
             [this, jobId, callback](const RpcOutcome& outcome) {
               if (!outcome.ok()) {
                 callback(std::nullopt, outcome.error);
                 return;
               }
               const json& result = outcome.result;
               auto sessionId = jsonString(result, "sessionId");
               if (!sessionId || sessionId->empty()) {
                 callback(std::nullopt,
                          SyncError::invalidResponse(
                              "terminal.start returned no sessionId"));
                 return;
               }
               TerminalSession session;
               session.id = *sessionId;
               session.jobId = jobId;
               session.deviceId = channel->activeDeviceId().value_or("");
               session.workingDirectory =
                   jsonString(result, "workingDirectory").value_or("~");
               session.shell =
                   jsonString(result, "shell").value_or("default");
               session.isActive = true;
               recordSession(session);

               auto initialLog = result.find("initialLog");
               if (initialLog != result.end() && initialLog->is_array()) {
                 for (const auto& entry : *initialLog) {
                   string bytes = decodeLogEntry(entry);
                   if (!bytes.empty()) {
                     streams->appendLocal(session.id, bytes);
                   }
                 }
               }
               LOG(INFO) << "Terminal session " << session.id
                         << " started for job " << jobId;
               callback(session, std::nullopt);
             });
}

void TerminalSessionService::ensureSession(const string& jobId, bool autostart,
                                           TerminalSessionCallback callback) {
  auto known = table.find(jobId);
  if (known != table.end() && known->second.isActive) {
    TerminalSession session = known->second;
    executor->post([callback, session]() { callback(session, std::nullopt); });
    return;
  }
  auto waiting = ensureWaiters.find(jobId);
  if (waiting != ensureWaiters.end()) {
    waiting->second.push_back(callback);
    return;
  }
  ensureWaiters[jobId].push_back(callback);

  string sessionId = known != table.end() ? known->second.id : jobId;
  callRemote("terminal.getStatus", {{"sessionId", sessionId}},
             [this, jobId, sessionId, autostart](const RpcOutcome& outcome) {
               string status;
               if (outcome.ok()) {
                 status = jsonString(outcome.result, "status").value_or("");
               } else {
                 LOG(WARNING) << "Status of " << sessionId
                              << " unavailable: " << *outcome.error;
               }
               recoverFromStatus(jobId, sessionId, autostart, status);
             });
}

void TerminalSessionService::recoverFromStatus(const string& jobId,
                                               const string& sessionId,
                                               bool autostart,
                                               const string& status) {
  auto startFresh = [this, jobId]() {
    startSession(jobId, "",
                 [this, jobId](const optional<TerminalSession>& session,
                               const optional<SyncError>& error) {
                   finishEnsure(jobId, session, error);
                 });
  };

  if (status != "running" && status != "restored") {
    if (autostart) {
      startFresh();
    } else {
      finishEnsure(jobId, std::nullopt,
                   SyncError::invalidState("No terminal session for job " +
                                           jobId));
    }
    return;
  }

  if (status == "restored" && autostart) {
    LOG(INFO) << "Session " << sessionId << " was restored, restarting";
    startFresh();
    return;
  }

  callRemote("terminal.getMetadata", {{"sessionId", sessionId}},
             [this, jobId, sessionId, status](const RpcOutcome& outcome) {
               json metadata = outcome.ok() ? outcome.result : json::object();
               if (!outcome.ok()) {
                 LOG(WARNING) << "Metadata of " << sessionId
                              << " unavailable: " << *outcome.error;
               }
               if (!metadata.contains("status")) {
                 metadata["status"] = status;
               }
               TerminalSession session = sessionFromMetadata(
                   sessionId, jobId, channel->activeDeviceId().value_or(""),
                   metadata);
               recordSession(session);
               finishEnsure(jobId, session, std::nullopt);
             });
}

void TerminalSessionService::finishEnsure(
    const string& jobId, const optional<TerminalSession>& session,
    const optional<SyncError>& error) {
  auto it = ensureWaiters.find(jobId);
  if (it == ensureWaiters.end()) {
    return;
  }
  auto waiters = std::move(it->second);
  ensureWaiters.erase(it);
  for (const auto& waiter : waiters) {
    waiter(session, error);
  }
}

optional<string> TerminalSessionService::requireSessionId(
    const string& jobId, TerminalCompletion completion) {
  auto session = sessionForJob(jobId);
  if (!session) {
    SyncError error =
        SyncError::invalidState("No terminal session for job " + jobId);
    executor->post([completion, error]() { completion(error); });
    return std::nullopt;
  }
  return session->id;
}

void TerminalSessionService::write(const string& jobId, const string& bytes,
                                   TerminalCompletion completion) {
  auto sessionId = requireSessionId(jobId, completion);
  if (!sessionId) {
    return;
  }
  auto chunks = make_shared<vector<string>>();
  chunks->push_back(bytes);
  writeChunks(*sessionId, chunks, 0, completion);
}

void TerminalSessionService::sendLargeText(const string& jobId,
                                           const string& text,
                                           bool appendNewline,
                                           TerminalCompletion completion) {
  auto sessionId = requireSessionId(jobId, completion);
  if (!sessionId) {
    return;
  }
  string payload = appendNewline ? text + "\n" : text;
  auto chunks = make_shared<vector<string>>();
  for (size_t offset = 0; offset < payload.size();
       offset += config.largeTextChunkSize) {
    chunks->push_back(payload.substr(offset, config.largeTextChunkSize));
  }
  if (chunks->empty()) {
    executor->post([completion]() { completion(std::nullopt); });
    return;
  }
  VLOG(1) << "Sending " << payload.size() << " bytes in " << chunks->size()
          << " chunks to " << *sessionId;
  writeChunks(*sessionId, chunks, 0, completion);
}

void TerminalSessionService::writeChunks(const string& sessionId,
                                         shared_ptr<vector<string>> chunks,
                                         size_t index,
                                         TerminalCompletion completion) {
  string encoded;
  if (!Base64::Encode((*chunks)[index], &encoded)) {
    SyncError error = SyncError::invalidState("b64 encode failed");
    executor->post([completion, error]() { completion(error); });
    return;
  }
  callRemote("terminal.write", {{"sessionId", sessionId}, {"data", encoded}},
             [this, sessionId, chunks, index,
              completion](const RpcOutcome& outcome) {
               if (!outcome.ok()) {
                 completion(outcome.error);
                 return;
               }
               if (index + 1 < chunks->size()) {
                 writeChunks(sessionId, chunks, index + 1, completion);
                 return;
               }
               completion(std::nullopt);
             });
}

void TerminalSessionService::sendCtrlC(const string& jobId,
                                       TerminalCompletion completion) {
  write(jobId, string(1, '\x03'), completion);
}

void TerminalSessionService::resize(const string& jobId, int cols, int rows,
                                    TerminalCompletion completion) {
  auto sessionId = requireSessionId(jobId, completion);
  if (!sessionId) {
    return;
  }
  callRemote("terminal.resize",
             {{"sessionId", *sessionId}, {"cols", cols}, {"rows", rows}},
             [completion](const RpcOutcome& outcome) {
               completion(outcome.error);
             });
}

void TerminalSessionService::kill(const string& jobId,
                                  TerminalCompletion completion) {
  auto sessionId = requireSessionId(jobId, completion);
  if (!sessionId) {
    return;
  }
  string id = *sessionId;
  callRemote("terminal.kill", {{"sessionId", id}},
             [this, jobId, id, completion](const RpcOutcome& outcome) {
               if (!outcome.ok()) {
                 completion(outcome.error);
                 return;
               }
               LOG(INFO) << "Killed terminal session " << id;
               markInactive(jobId);
               streams->finalize(id);
               table.erase(jobId);
               published.set(table);
               completion(std::nullopt);
             });
}

void TerminalSessionService::detach(const string& jobId) {
  auto session = sessionForJob(jobId);
  if (!session) {
    return;
  }
  string id = session->id;
  callRemote("terminal.detach", {{"sessionId", id}},
             [id](const RpcOutcome& outcome) {
               if (!outcome.ok()) {
                 LOG(WARNING) << "Detach of " << id
                              << " failed: " << *outcome.error;
               }
             });
}

void TerminalSessionService::bootstrapFromRemote(
    TerminalCompletion completion) {
  callRemote(
      "terminal.getActiveSessions", json::object(),
      [this, completion](const RpcOutcome& outcome) {
        if (!outcome.ok()) {
          LOG(WARNING) << "Terminal bootstrap failed: " << *outcome.error;
          completion(outcome.error);
          return;
        }
        vector<string> unknown;
        auto sessionList = outcome.result.find("sessions");
        if (sessionList != outcome.result.end() && sessionList->is_array()) {
          for (const auto& entry : *sessionList) {
            string id = entry.is_string()
                            ? entry.get<string>()
                            : jsonString(entry, "sessionId").value_or("");
            if (id.empty()) {
              continue;
            }
            bool known = false;
            for (const auto& it : table) {
              known = known || it.second.id == id;
            }
            if (!known) {
              unknown.push_back(id);
            }
          }
        }
        if (unknown.empty()) {
          completion(std::nullopt);
          return;
        }
        auto remaining = make_shared<size_t>(unknown.size());
        for (const auto& id : unknown) {
          callRemote("terminal.getMetadata", {{"sessionId", id}},
                     [this, id, remaining, completion](const RpcOutcome& meta) {
                       if (meta.ok()) {
                         string jobId =
                             jsonString(meta.result, "jobId").value_or(id);
                         recordSession(sessionFromMetadata(
                             id, jobId, channel->activeDeviceId().value_or(""),
                             meta.result));
                         LOG(INFO) << "Bootstrapped terminal session " << id;
                       } else {
                         LOG(WARNING) << "Metadata of " << id
                                      << " unavailable: " << *meta.error;
                       }
                       if (--(*remaining) == 0) {
                         completion(std::nullopt);
                       }
                     });
        }
      });
}

void TerminalSessionService::handleEvent(const RemoteEvent& event) {
  if (event.eventType != TERMINAL_EXIT) {
    return;
  }
  auto sessionId = jsonString(event.payload, "sessionId");
  if (!sessionId) {
    LOG(WARNING) << "terminal.exit without sessionId";
    return;
  }
  for (const auto& it : table) {
    if (it.second.id != *sessionId) {
      continue;
    }
    string jobId = it.first;
    auto code = event.payload.find("code");
    ostringstream notice;
    notice << "\r\n[Process exited";
    if (code != event.payload.end() && code->is_number_integer()) {
      notice << " with code " << code->get<int>();
    }
    notice << "]\r\n";
    LOG(INFO) << "Terminal session " << *sessionId << " exited";
    markInactive(jobId);
    streams->deliverNotice(*sessionId, notice.str());
    streams->finalize(*sessionId);
    return;
  }
  VLOG(1) << "Exit for unknown terminal session " << *sessionId;
}

optional<TerminalSession> TerminalSessionService::sessionForJob(
    const string& jobId) const {
  auto it = table.find(jobId);
  if (it == table.end()) {
    return std::nullopt;
  }
  return it->second;
}

void TerminalSessionService::recordSession(const TerminalSession& session) {
  table[session.jobId] = session;
  published.set(table);
}

void TerminalSessionService::markInactive(const string& jobId) {
  auto it = table.find(jobId);
  if (it == table.end() || !it->second.isActive) {
    return;
  }
  it->second.isActive = false;
  published.set(table);
}

TerminalSession TerminalSessionService::sessionFromMetadata(
    const string& sessionId, const string& jobId, const string& deviceId,
    const json& metadata) const {
  TerminalSession session;
  session.id = sessionId;
  session.jobId = jobId;
  session.deviceId = deviceId;
  session.workingDirectory =
      jsonString(metadata, "workingDirectory").value_or("~");
  session.shell = jsonString(metadata, "shell").value_or("default");
  session.isActive = jsonString(metadata, "status").value_or("") == "running";
  return session;
}

void TerminalSessionService::reset() {
  generation++;
  table.clear();
  published.set(table);
  auto abandoned = std::move(ensureWaiters);
  ensureWaiters.clear();
  SyncError error = SyncError::connection("Terminal state was reset");
  for (const auto& it : abandoned) {
    for (const auto& waiter : it.second) {
      waiter(std::nullopt, error);
    }
  }
}
}  // namespace jm
