#ifndef __JM_REMOTE_CHANNEL__
#define __JM_REMOTE_CHANNEL__

#include "Headers.hpp"
#include "SyncError.hpp"

namespace jm {
/** @brief A method call addressed to the active remote device. */
struct RpcRequest {
  string method;
  json params;
  /** @brief Correlation id for logs; assigned on dispatch when empty. */
  string requestId;
};

/**
 * @brief One element of a streamed RPC reply.  The stream ends at the first
 * response that is final or carries an error.
 */
struct RpcResponse {
  json result;
  bool isFinal = false;
  optional<SyncError> error;
};

/** @brief A discrete change notification pushed by the remote side. */
struct RemoteEvent {
  string eventType;
  json payload;
};

typedef function<void(const RpcResponse&)> RpcResponseHandler;
typedef function<void(const RemoteEvent&)> RemoteEventHandler;
/**
 * @brief Called whenever the active device or its connectivity changes.
 * `deviceId` is empty when no device is active.
 */
typedef function<void(const string& deviceId, bool connected)>
    ConnectivityHandler;
typedef function<void(const string& bytes)> TerminalBytesHandler;

/**
 * @brief Boundary to the transport/session layer.
 *
 * Implementations may invoke handlers on any thread.  The sync core marshals
 * every callback back onto its executor before touching state.
 */
class RemoteChannel {
 public:
  virtual ~RemoteChannel() {}

  /** @brief Issues an RPC to `deviceId`; `handler` receives each response. */
  virtual void call(const string& deviceId, const RpcRequest& request,
                    RpcResponseHandler handler) = 0;

  /** @brief The currently selected remote device, if any. */
  virtual optional<string> activeDeviceId() = 0;

  virtual bool isConnected(const string& deviceId) = 0;

  virtual int subscribeEvents(RemoteEventHandler handler) = 0;

  virtual int subscribeConnectivity(ConnectivityHandler handler) = 0;

  /** @brief Removes an event or connectivity subscription. */
  virtual void unsubscribe(int subscriptionId) = 0;

  /**
   * @brief Opens the binary terminal feed for a device.  Frames arrive raw,
   * possibly prefixed with a session header.
   */
  virtual int subscribeTerminalBytes(const string& deviceId,
                                     TerminalBytesHandler handler) = 0;

  virtual void unsubscribeTerminalBytes(int subscriptionId) = 0;

  /** @brief Sends a bind or unbind control message to the byte producer. */
  virtual void sendTerminalControl(const string& deviceId,
                                   const TerminalControl& control) = 0;
};
}  // namespace jm

#endif  // __JM_REMOTE_CHANNEL__
