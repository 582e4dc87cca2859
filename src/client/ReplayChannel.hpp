#ifndef __JM_REPLAY_CHANNEL__
#define __JM_REPLAY_CHANNEL__

#include "RemoteChannel.hpp"

namespace jm {
/**
 * @brief RemoteChannel that answers from a scripted table instead of a
 * network connection.
 *
 * `responses` maps an RPC method to a list of replies, each either
 * `{"result": ...}` or `{"error": {"kind": ..., "message": ...}}`.  Replies
 * are consumed in order and the last one repeats.  `producerBuffers` maps a
 * terminal session id to the bytes the producer replays when a bind asks for
 * a snapshot.
 */
class ReplayChannel : public RemoteChannel {
 public:
  ReplayChannel(const json& responses, const json& producerBuffers);

  virtual void call(const string& deviceId, const RpcRequest& request,
                    RpcResponseHandler handler);
  virtual optional<string> activeDeviceId();
  virtual bool isConnected(const string& deviceId);
  virtual int subscribeEvents(RemoteEventHandler handler);
  virtual int subscribeConnectivity(ConnectivityHandler handler);
  virtual void unsubscribe(int subscriptionId);
  virtual int subscribeTerminalBytes(const string& deviceId,
                                     TerminalBytesHandler handler);
  virtual void unsubscribeTerminalBytes(int subscriptionId);
  virtual void sendTerminalControl(const string& deviceId,
                                   const TerminalControl& control);

  /** @brief Selects `deviceId` and notifies connectivity subscribers. */
  void setConnection(const string& deviceId, bool connected);

  void emitEvent(const RemoteEvent& event);

  /** @brief Pushes a framed terminal chunk to the active device's feed. */
  void emitFrame(const string& sessionId, const string& payload);

  /** @brief Every call and control message seen, in order. */
  const json& getTranscript() const { return transcript; }

  static SyncErrorKind parseErrorKind(const string& name);

 protected:
  RpcResponse nextResponse(const string& method);

  map<string, deque<json>> responses;
  map<string, json> lastResponse;
  json producerBuffers;
  json transcript;

  string deviceId;
  bool connected;
  int nextSubscriptionId;
  map<int, RemoteEventHandler> eventHandlers;
  map<int, ConnectivityHandler> connectivityHandlers;
  map<int, pair<string, TerminalBytesHandler>> byteHandlers;
};
}  // namespace jm

#endif  // __JM_REPLAY_CHANNEL__
