#ifndef __JM_SYNC_ERROR__
#define __JM_SYNC_ERROR__

#include <ostream>
#include <stdexcept>
#include <string>

namespace jm {
/**
 * @brief Failure classes surfaced by the synchronization core.
 */
enum class SyncErrorKind {
  /** @brief No active device, or the transport is unavailable. */
  CONNECTION,
  /** @brief The remote side answered with an explicit error. */
  SERVER,
  /** @brief A response was missing fields or could not be decoded. */
  INVALID_RESPONSE,
  /** @brief A precondition or contract was violated by the caller. */
  INVALID_STATE,
  /** @brief The remote side did not answer in time. */
  TIMEOUT,
  /** @brief Transport failure with no more specific class. */
  NETWORK,
};

inline const char* syncErrorKindName(SyncErrorKind kind) {
  switch (kind) {
    case SyncErrorKind::CONNECTION:
      return "connection";
    case SyncErrorKind::SERVER:
      return "server";
    case SyncErrorKind::INVALID_RESPONSE:
      return "invalid-response";
    case SyncErrorKind::INVALID_STATE:
      return "invalid-state";
    case SyncErrorKind::TIMEOUT:
      return "timeout";
    case SyncErrorKind::NETWORK:
      return "network";
  }
  return "unknown";
}

/**
 * @brief Exception type carried through callbacks and thrown for contract
 * violations.
 */
class SyncError : public std::runtime_error {
 public:
  SyncError(SyncErrorKind _kind, const std::string& message)
      : std::runtime_error(message), kind(_kind) {}

  SyncErrorKind getKind() const { return kind; }

  static SyncError connection(const std::string& message) {
    return SyncError(SyncErrorKind::CONNECTION, message);
  }
  static SyncError server(const std::string& message) {
    return SyncError(SyncErrorKind::SERVER, message);
  }
  static SyncError invalidResponse(const std::string& message) {
    return SyncError(SyncErrorKind::INVALID_RESPONSE, message);
  }
  static SyncError invalidState(const std::string& message) {
    return SyncError(SyncErrorKind::INVALID_STATE, message);
  }
  static SyncError timeout(const std::string& message) {
    return SyncError(SyncErrorKind::TIMEOUT, message);
  }
  static SyncError network(const std::string& message) {
    return SyncError(SyncErrorKind::NETWORK, message);
  }

 protected:
  SyncErrorKind kind;
};

inline std::ostream& operator<<(std::ostream& os, const SyncError& error) {
  os << syncErrorKindName(error.getKind()) << ": " << error.what();
  return os;
}
}  // namespace jm

#endif  // __JM_SYNC_ERROR__
