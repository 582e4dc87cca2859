#include "SyncConfig.hpp"

#include "SimpleIni.h"

namespace jm {
namespace {
int64_t readInt(const CSimpleIniA& ini, const char* section, const char* key,
                int64_t defaultValue) {
  const char* value = ini.GetValue(section, key, NULL);
  if (!value) {
    return defaultValue;
  }
  try {
    size_t consumed = 0;
    int64_t parsed = stoll(string(value), &consumed);
    if (consumed != trim(value).size()) {
      throw std::invalid_argument(value);
    }
    return parsed;
  } catch (const std::logic_error& e) {
    throw SyncError::invalidState(string("Invalid value for [") + section +
                                  "] " + key + ": " + value);
  }
}

set<string> readList(const string& value) {
  set<string> items;
  for (const auto& item : split(value, ',')) {
    auto trimmed = trim(item);
    if (!trimmed.empty()) {
      items.insert(trimmed);
    }
  }
  return items;
}
}  // namespace

SyncConfig::SyncConfig()
    : ringBufferMaxBytes(2000000),
      unbindGraceMs(1000),
      largeTextChunkSize(4096),
      derivedPublishDebounceMs(100),
      listDedupWindowMs(1000),
      resyncMinDelayMs(400),
      resyncMaxDelayMs(700),
      defaultPageSize(50),
      resyncPageSize(100),
      periodicSyncIntervalMs(30000),
      internalTaskTypes({"extended_path_finder", "file_relevance_assessment",
                         "regex_file_filter", "path_correction",
                         "web_search_prompts_generation",
                         "web_search_execution", "root_folder_selection"}),
      counterFamilies(
          {{"workflows", {"file_finder_workflow", "web_search_workflow"}},
           {"implementationPlans",
            {"implementation_plan", "implementation_plan_merge"}}}),
      verbose(0),
      silent(false),
      maxLogSize("20971520") {}

SyncConfig SyncConfig::loadFromFile(const string& path) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadFile(path.c_str());
  if (rc < 0) {
    throw SyncError::invalidState("Invalid config file: " + path);
  }

  SyncConfig config;
  config.ringBufferMaxBytes = size_t(
      readInt(ini, "Terminal", "max_bytes", config.ringBufferMaxBytes));
  config.unbindGraceMs =
      readInt(ini, "Terminal", "unbind_grace_ms", config.unbindGraceMs);
  config.largeTextChunkSize = size_t(
      readInt(ini, "Terminal", "chunk_size", config.largeTextChunkSize));

  config.derivedPublishDebounceMs = readInt(ini, "Jobs", "publish_debounce_ms",
                                            config.derivedPublishDebounceMs);
  config.listDedupWindowMs =
      readInt(ini, "Jobs", "dedup_window_ms", config.listDedupWindowMs);
  config.resyncMinDelayMs =
      readInt(ini, "Jobs", "resync_min_delay_ms", config.resyncMinDelayMs);
  config.resyncMaxDelayMs =
      readInt(ini, "Jobs", "resync_max_delay_ms", config.resyncMaxDelayMs);
  config.defaultPageSize =
      int(readInt(ini, "Jobs", "page_size", config.defaultPageSize));
  config.resyncPageSize =
      int(readInt(ini, "Jobs", "resync_page_size", config.resyncPageSize));
  config.periodicSyncIntervalMs = readInt(ini, "Jobs", "periodic_sync_ms",
                                          config.periodicSyncIntervalMs);

  if (config.ringBufferMaxBytes == 0 || config.largeTextChunkSize == 0) {
    throw SyncError::invalidState("Terminal sizes must be positive in " +
                                  path);
  }
  if (config.resyncMaxDelayMs < config.resyncMinDelayMs) {
    throw SyncError::invalidState(
        "resync_max_delay_ms is smaller than resync_min_delay_ms in " + path);
  }

  CSimpleIniA::TNamesDepend keys;
  ini.GetAllKeys("Categories", keys);
  bool sawCounter = false;
  for (const auto& entry : keys) {
    string key = entry.pItem;
    const char* value = ini.GetValue("Categories", entry.pItem, "");
    if (key == "internal_task_types") {
      config.internalTaskTypes = readList(value);
    } else if (startsWith(key, "counter.")) {
      if (!sawCounter) {
        // An explicit family list replaces the built-in one.
        config.counterFamilies.clear();
        sawCounter = true;
      }
      config.counterFamilies[key.substr(strlen("counter."))] =
          readList(value);
    } else {
      LOG(WARNING) << "Ignoring unknown [Categories] key: " << key;
    }
  }

  config.verbose = int(readInt(ini, "Debug", "verbose", 0));
  config.silent = readInt(ini, "Debug", "silent", 0) != 0;
  const char* logsize = ini.GetValue("Debug", "logsize", NULL);
  if (logsize && atoi(logsize) != 0) {
    config.maxLogSize = string(logsize);
  }
  const char* logdir = ini.GetValue("Debug", "logdir", NULL);
  if (logdir) {
    config.logDirectory = string(logdir);
  }
  return config;
}

string SyncConfig::defaultConfigPath() {
  return sago::getConfigHome() + "/jobmirror/jm.cfg";
}

bool SyncConfig::isInternalTaskType(const string& taskType) const {
  return internalTaskTypes.find(taskType) != internalTaskTypes.end();
}

optional<string> SyncConfig::counterFamilyFor(const string& taskType) const {
  for (const auto& it : counterFamilies) {
    if (it.second.find(taskType) != it.second.end()) {
      return it.first;
    }
  }
  return std::nullopt;
}
}  // namespace jm
