#ifndef __JM_SYNC_CONFIG__
#define __JM_SYNC_CONFIG__

#include "Headers.hpp"
#include "SyncError.hpp"

namespace jm {
/**
 * @brief Tunables for the job engine and the terminal stream manager.
 *
 * Defaults match the production constants; an INI file can override any of
 * them.
 */
class SyncConfig {
 public:
  SyncConfig();

  /**
   * @brief Loads overrides from an INI file.  Throws INVALID_STATE when the
   * file cannot be read or a value is malformed.
   */
  static SyncConfig loadFromFile(const string& path);

  /** @brief Default location under the user's config directory. */
  static string defaultConfigPath();

  bool isInternalTaskType(const string& taskType) const;

  /** @brief Name of the umbrella counter family `taskType` belongs to. */
  optional<string> counterFamilyFor(const string& taskType) const;

  // [Terminal]
  size_t ringBufferMaxBytes;
  int64_t unbindGraceMs;
  size_t largeTextChunkSize;

  // [Jobs]
  int64_t derivedPublishDebounceMs;
  int64_t listDedupWindowMs;
  int64_t resyncMinDelayMs;
  int64_t resyncMaxDelayMs;
  int defaultPageSize;
  int resyncPageSize;
  int64_t periodicSyncIntervalMs;

  // [Categories]
  set<string> internalTaskTypes;
  map<string, set<string>> counterFamilies;

  // [Debug]
  int verbose;
  bool silent;
  string maxLogSize;
  string logDirectory;
};
}  // namespace jm

#endif  // __JM_SYNC_CONFIG__
