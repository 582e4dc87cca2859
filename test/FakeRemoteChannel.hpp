#ifndef __JM_FAKE_REMOTE_CHANNEL__
#define __JM_FAKE_REMOTE_CHANNEL__

#include "RemoteChannel.hpp"
#include "TerminalFrameCodec.hpp"

namespace jm {
/**
 * In-memory RemoteChannel.  Calls are recorded and stay pending until the
 * test answers them, unless an automatic reply is registered for the method.
 */
class FakeRemoteChannel : public RemoteChannel {
 public:
  struct Call {
    string deviceId;
    RpcRequest request;
    RpcResponseHandler handler;
    bool answered = false;
  };

  FakeRemoteChannel() : connected(false), nextId(1) {}

  virtual void call(const string& targetDeviceId, const RpcRequest& request,
                    RpcResponseHandler handler) {
    Call call;
    call.deviceId = targetDeviceId;
    call.request = request;
    call.handler = handler;
    calls.push_back(call);
    auto it = autoReplies.find(request.method);
    if (it != autoReplies.end()) {
      respond(calls.size() - 1, it->second);
    }
  }

  virtual optional<string> activeDeviceId() {
    if (deviceId.empty()) {
      return nullopt;
    }
    return deviceId;
  }

  virtual bool isConnected(const string& queried) {
    return connected && queried == deviceId;
  }

  virtual int subscribeEvents(RemoteEventHandler handler) {
    int id = nextId++;
    eventHandlers[id] = handler;
    return id;
  }

  virtual int subscribeConnectivity(ConnectivityHandler handler) {
    int id = nextId++;
    connectivityHandlers[id] = handler;
    return id;
  }

  virtual void unsubscribe(int id) {
    eventHandlers.erase(id);
    connectivityHandlers.erase(id);
  }

  virtual int subscribeTerminalBytes(const string& targetDeviceId,
                                     TerminalBytesHandler handler) {
    int id = nextId++;
    byteHandlers[id] = make_pair(targetDeviceId, handler);
    return id;
  }

  virtual void unsubscribeTerminalBytes(int id) { byteHandlers.erase(id); }

  virtual void sendTerminalControl(const string& targetDeviceId,
                                   const TerminalControl& control) {
    controls.push_back(make_pair(targetDeviceId, control));
    if (control.has_bind() && control.bind().include_snapshot()) {
      auto it = producerBuffers.find(control.bind().session_id());
      if (it != producerBuffers.end()) {
        pushFrame(it->first, it->second);
      }
    }
  }

  void setConnection(const string& _deviceId, bool _connected) {
    deviceId = _deviceId;
    connected = _connected;
    auto handlers = connectivityHandlers;
    for (auto& it : handlers) {
      it.second(deviceId, connected);
    }
  }

  /** Connects without notifying subscribers. */
  void connectQuietly(const string& _deviceId) {
    deviceId = _deviceId;
    connected = true;
  }

  void emitEvent(const string& type, const json& payload) {
    RemoteEvent event;
    event.eventType = type;
    event.payload = payload;
    auto handlers = eventHandlers;
    for (auto& it : handlers) {
      it.second(event);
    }
  }

  void pushRaw(const string& raw) {
    auto handlers = byteHandlers;
    for (auto& it : handlers) {
      if (it.second.first == deviceId) {
        it.second.second(raw);
      }
    }
  }

  void pushFrame(const string& sessionId, const string& payload) {
    pushRaw(TerminalFrameCodec::encode(sessionId, payload));
  }

  void respond(size_t index, const json& result) {
    RpcResponse response;
    response.result = result;
    response.isFinal = true;
    finish(index, response);
  }

  /** Delivers one element of a streamed reply as-is. */
  void send(size_t index, const RpcResponse& response) {
    finish(index, response);
  }

  void fail(size_t index, const SyncError& error) {
    RpcResponse response;
    response.isFinal = true;
    response.error = error;
    finish(index, response);
  }

  /** Answers the oldest unanswered call to `method`. */
  bool respondTo(const string& method, const json& result) {
    for (size_t i = 0; i < calls.size(); ++i) {
      if (!calls[i].answered && calls[i].request.method == method) {
        respond(i, result);
        return true;
      }
    }
    return false;
  }

  bool failNext(const string& method, const SyncError& error) {
    for (size_t i = 0; i < calls.size(); ++i) {
      if (!calls[i].answered && calls[i].request.method == method) {
        fail(i, error);
        return true;
      }
    }
    return false;
  }

  int countCalls(const string& method) const {
    int count = 0;
    for (const auto& call : calls) {
      if (call.request.method == method) {
        count++;
      }
    }
    return count;
  }

  int pendingCalls(const string& method) const {
    int count = 0;
    for (const auto& call : calls) {
      if (!call.answered && call.request.method == method) {
        count++;
      }
    }
    return count;
  }

  const Call& lastCall(const string& method) const {
    for (auto it = calls.rbegin(); it != calls.rend(); ++it) {
      if (it->request.method == method) {
        return *it;
      }
    }
    throw std::runtime_error("No call to " + method);
  }

  int countBinds(const string& sessionId) const {
    int count = 0;
    for (const auto& it : controls) {
      if (it.second.has_bind() && it.second.bind().session_id() == sessionId) {
        count++;
      }
    }
    return count;
  }

  int countUnbinds(const string& sessionId) const {
    int count = 0;
    for (const auto& it : controls) {
      if (it.second.has_unbind() &&
          it.second.unbind().session_id() == sessionId) {
        count++;
      }
    }
    return count;
  }

  int byteSubscriberCount() const { return int(byteHandlers.size()); }

  int eventSubscriberCount() const { return int(eventHandlers.size()); }

  string deviceId;
  bool connected;
  vector<Call> calls;
  map<string, json> autoReplies;
  vector<pair<string, TerminalControl>> controls;
  /** Bytes the producer replays when a bind asks for a snapshot. */
  map<string, string> producerBuffers;

 protected:
  void finish(size_t index, const RpcResponse& response) {
    if (index >= calls.size()) {
      throw std::runtime_error("No call at index " + to_string(index));
    }
    if (response.isFinal || response.error) {
      calls[index].answered = true;
    }
    auto handler = calls[index].handler;
    handler(response);
  }

  int nextId;
  map<int, RemoteEventHandler> eventHandlers;
  map<int, ConnectivityHandler> connectivityHandlers;
  map<int, pair<string, TerminalBytesHandler>> byteHandlers;
};
}  // namespace jm

#endif  // __JM_FAKE_REMOTE_CHANNEL__
