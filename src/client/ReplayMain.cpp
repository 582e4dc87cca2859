#include <cxxopts.hpp>

#include "JobMirrorClient.hpp"
#include "LogHandler.hpp"
#include "ManualExecutor.hpp"
#include "ReplayChannel.hpp"

using namespace jm;

namespace {
ReconcileReason parseReason(const string& name) {
  const ReconcileReason reasons[] = {
      ReconcileReason::INITIAL_LOAD,     ReconcileReason::FOREGROUND_RESUME,
      ReconcileReason::CONNECTIVITY_RECONNECTED, ReconcileReason::PUSH_HINT,
      ReconcileReason::USER_REFRESH,     ReconcileReason::LIST_INVALIDATED,
      ReconcileReason::RELAY_REGISTERED, ReconcileReason::SESSION_CHANGED,
      ReconcileReason::PERIODIC_SYNC,
  };
  for (auto reason : reasons) {
    if (reconcileReasonName(reason) == name) {
      return reason;
    }
  }
  LOG(WARNING) << "Unknown reconcile reason " << name << ", using userRefresh";
  return ReconcileReason::USER_REFRESH;
}

json outcome(const string& action, const string& target,
             const optional<SyncError>& error) {
  json entry = {{"action", action}, {"target", target}, {"ok", !error}};
  if (error) {
    entry["error"] = syncErrorKindName(error->getKind());
    entry["message"] = error->what();
  }
  return entry;
}

json statusToJson(const JobsStatus& status) {
  json j = {{"isLoading", status.isLoading},
            {"hasLoadedOnce", status.hasLoadedOnce}};
  if (status.error) {
    j["error"] = syncErrorKindName(status.error->getKind());
    j["message"] = status.error->what();
  } else {
    j["error"] = nullptr;
  }
  return j;
}

class ReplayRunner {
 public:
  ReplayRunner(const json& _script, const SyncConfig& config)
      : script(_script), results(json::array()) {
    channel.reset(new ReplayChannel(script.value("responses", json::object()),
                                    script.value("producer", json::object())));
    executor.reset(new ManualExecutor());
    client.reset(new JobMirrorClient(channel, executor, config));
    deviceId = script.value("device", string("desktop"));
  }

  void run(int64_t settleMs) {
    client->start();
    if (script.contains("session") && script["session"].is_object()) {
      client->setActiveSession(
          script["session"].value("sessionId", string()),
          script["session"].value("projectDirectory", string()));
    }
    executor->runPending();

    vector<json> steps;
    if (script.contains("timeline") && script["timeline"].is_array()) {
      for (const auto& step : script["timeline"]) {
        steps.push_back(step);
      }
    }
    stable_sort(steps.begin(), steps.end(),
                [](const json& a, const json& b) {
                  return a.value("at", int64_t(0)) < b.value("at", int64_t(0));
                });
    for (const auto& step : steps) {
      int64_t at = step.value("at", int64_t(0));
      if (at > executor->nowMs()) {
        executor->advance(at - executor->nowMs());
      }
      apply(step);
      executor->runPending();
    }
    executor->advance(settleMs);
    client->stop();
  }

  json report() const {
    json terminals = json::object();
    for (const auto& it : terminalOutput) {
      terminals[it.first] = {{"received", it.second},
                             {"buffered", client->terminalSnapshot(it.first)}};
    }
    json sessions = json::object();
    for (const auto& it : client->terminalSessions().get()) {
      sessions[it.first] = it.second.toJson();
    }
    return {{"derivedState", client->derivedState().get().toJson()},
            {"status", statusToJson(client->jobsStatus().get())},
            {"terminalSessions", sessions},
            {"terminals", terminals},
            {"results", results},
            {"transcript", channel->getTranscript()},
            {"elapsedMs", executor->nowMs()}};
  }

 protected:
  void apply(const json& step) {
    string action = step.value("action", string());
    VLOG(1) << "Replaying " << action << " at " << executor->nowMs();
    if (action == "connect") {
      deviceId = step.value("device", deviceId);
      channel->setConnection(deviceId, true);
    } else if (action == "disconnect") {
      channel->setConnection(deviceId, false);
    } else if (action == "event") {
      RemoteEvent event;
      event.eventType = step.value("type", string());
      event.payload = step.value("payload", json::object());
      channel->emitEvent(event);
    } else if (action == "frame") {
      string payload = step.value("text", string());
      if (step.contains("base64")) {
        if (!Base64::Decode(step["base64"].get<string>(), &payload)) {
          LOG(WARNING) << "Skipping frame with invalid base64";
          return;
        }
      }
      channel->emitFrame(step.value("sessionId", string()), payload);
    } else if (action == "session") {
      client->setActiveSession(step.value("sessionId", string()),
                               step.value("projectDirectory", string()));
    } else if (action == "reconcile") {
      string reason = step.value("reason", string("userRefresh"));
      client->reconcile(parseReason(reason),
                        [this, reason](const optional<SyncError>& error) {
                          results.push_back(outcome("reconcile", reason, error));
                        });
    } else if (action == "cancel") {
      string jobId = step.value("jobId", string());
      client->cancelJob(jobId, step.value("reason", string()),
                        [this, jobId](const optional<SyncError>& error) {
                          results.push_back(outcome("cancel", jobId, error));
                        });
    } else if (action == "delete") {
      string jobId = step.value("jobId", string());
      client->deleteJob(jobId, [this, jobId](const optional<SyncError>& error) {
        results.push_back(outcome("delete", jobId, error));
      });
    } else if (action == "openTerminal") {
      string jobId = step.value("jobId", string());
      terminalOutput[jobId];
      client->openTerminalStream(
          jobId,
          [this, jobId](const string& bytes) {
            terminalOutput[jobId].append(bytes);
          },
          [this, jobId](int token, const optional<SyncError>& error) {
            if (!error) {
              terminalTokens[jobId] = token;
            }
            results.push_back(outcome("openTerminal", jobId, error));
          });
    } else if (action == "closeTerminal") {
      string jobId = step.value("jobId", string());
      auto it = terminalTokens.find(jobId);
      if (it != terminalTokens.end()) {
        client->closeTerminalStream(jobId, it->second);
        terminalTokens.erase(it);
      }
    } else if (action == "write") {
      string jobId = step.value("jobId", string());
      client->sendLargeText(jobId, step.value("text", string()),
                            step.value("newline", false),
                            [this, jobId](const optional<SyncError>& error) {
                              results.push_back(outcome("write", jobId, error));
                            });
    } else if (action == "ctrlc") {
      string jobId = step.value("jobId", string());
      client->sendCtrlC(jobId, [this, jobId](const optional<SyncError>& error) {
        results.push_back(outcome("ctrlc", jobId, error));
      });
    } else if (action == "kill") {
      string jobId = step.value("jobId", string());
      client->killTerminal(jobId,
                           [this, jobId](const optional<SyncError>& error) {
                             results.push_back(outcome("kill", jobId, error));
                           });
    } else {
      LOG(WARNING) << "Unknown replay action: " << action;
    }
  }

  json script;
  json results;
  string deviceId;
  shared_ptr<ReplayChannel> channel;
  shared_ptr<ManualExecutor> executor;
  shared_ptr<JobMirrorClient> client;
  map<string, string> terminalOutput;
  map<string, int> terminalTokens;
};
}  // namespace

int main(int argc, char** argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  jm::HandleTerminate();

  // Override easylogging handler for sigint
  ::signal(SIGINT, jm::InterruptSignalHandler);

  cxxopts::Options options("jmreplay",
                           "Replays a scripted remote session through the "
                           "job and terminal sync engine");
  try {
    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("script", "JSON script describing the remote side",
         cxxopts::value<std::string>())  //
        ("config", "Location of the config file",
         cxxopts::value<std::string>()->default_value(""))  //
        ("settle", "Virtual milliseconds to run after the timeline",
         cxxopts::value<int64_t>()->default_value("2000"))  //
        ("logtostdout", "log to stdout")                    //
        ("l,logdir", "Base directory for log files.",
         cxxopts::value<std::string>())  //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"), "LEVEL")  //
        ;

    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "jmreplay version " << JM_VERSION << endl;
      exit(0);
    }
    if (!result.count("script")) {
      CLOG(INFO, "stdout") << "Missing --script" << endl
                           << options.help({}) << endl;
      exit(1);
    }

    SyncConfig config;
    string cfgfilename = result["config"].as<string>();
    if (cfgfilename.empty() && fs::exists(SyncConfig::defaultConfigPath())) {
      cfgfilename = SyncConfig::defaultConfigPath();
    }
    if (!cfgfilename.empty()) {
      try {
        config = SyncConfig::loadFromFile(cfgfilename);
      } catch (const SyncError& se) {
        CLOG(INFO, "stdout") << "Invalid config file " << cfgfilename << ": "
                             << se.what() << endl;
        exit(1);
      }
    }

    // prioritize command line option over cfgfile
    optional<int> verbose;
    if (result.count("verbose")) {
      verbose = result["verbose"].as<int>();
    }
    LogHandler::applyConfig(&defaultConf, config, verbose);

    string logDirectory = config.logDirectory.empty()
                              ? GetTempDirectory()
                              : config.logDirectory;
    if (result.count("logdir")) {
      logDirectory = result["logdir"].as<string>();
    }

    GOOGLE_PROTOBUF_VERIFY_VERSION;
    if (sodium_init() == -1) {
      STFATAL << "libsodium init failed";
    }

    LogHandler::setupLogFiles(&defaultConf, logDirectory, "jmreplay",
                              result.count("logtostdout") > 0, false,
                              config.maxLogSize);
    LogHandler::installDefaultLogger(defaultConf, "jmreplay-main");

    string scriptPath = result["script"].as<string>();
    ifstream scriptStream(scriptPath);
    if (!scriptStream.good()) {
      CLOG(INFO, "stdout") << "Could not open script: " << scriptPath << endl;
      exit(1);
    }
    json script;
    try {
      script = json::parse(scriptStream);
    } catch (const json::exception& je) {
      CLOG(INFO, "stdout") << "Invalid script " << scriptPath << ": "
                           << je.what() << endl;
      exit(1);
    }

    LOG(INFO) << "Replaying " << scriptPath;
    ReplayRunner runner(script, config);
    runner.run(result["settle"].as<int64_t>());
    CLOG(INFO, "stdout") << runner.report().dump(2) << endl;
  } catch (cxxopts::OptionException& oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  }

  // Uninstall log rotation callback
  el::Helpers::uninstallPreRollOutCallback();
  return 0;
}
