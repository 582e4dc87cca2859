#ifndef __JM_RPC_CALL__
#define __JM_RPC_CALL__

#include "Executor.hpp"
#include "RemoteChannel.hpp"

namespace jm {
/** @brief Outcome of a collected RPC stream. */
struct RpcOutcome {
  json result;
  optional<SyncError> error;

  bool ok() const { return !error; }
};

typedef function<void(const RpcOutcome&)> RpcCompletion;

/**
 * @brief Collapses a streamed RPC reply into one outcome delivered on the
 * executor.
 *
 * The last non-null result wins.  An error response ends the stream with that
 * error; a stream that finishes without any result object is reported as
 * INVALID_RESPONSE.
 */
class RpcCall {
 public:
  static void invoke(shared_ptr<RemoteChannel> channel,
                     shared_ptr<Executor> executor, const string& deviceId,
                     const RpcRequest& request, RpcCompletion completion);

  /**
   * @brief Same as above, but `completion` is skipped once `owner` is gone.
   * The owner is kept alive while the completion runs.
   */
  static void invoke(shared_ptr<RemoteChannel> channel,
                     shared_ptr<Executor> executor, const string& deviceId,
                     const RpcRequest& request, weak_ptr<void> owner,
                     RpcCompletion completion);

  /**
   * @brief Resolves the device to talk to.  Throws CONNECTION when there is no
   * active device or it is offline.
   */
  static string requireConnectedDevice(shared_ptr<RemoteChannel> channel);
};
}  // namespace jm

#endif  // __JM_RPC_CALL__
