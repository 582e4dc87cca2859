#include "ReplayChannel.hpp"

#include "TerminalFrameCodec.hpp"

namespace jm {
ReplayChannel::ReplayChannel(const json& _responses,
                             const json& _producerBuffers)
    : producerBuffers(_producerBuffers),
      transcript(json::array()),
      connected(false),
      nextSubscriptionId(1) {
  if (_responses.is_object()) {
    for (auto it = _responses.begin(); it != _responses.end(); ++it) {
      if (it.value().is_array()) {
        for (const auto& reply : it.value()) {
          responses[it.key()].push_back(reply);
        }
      } else {
        responses[it.key()].push_back(it.value());
      }
    }
  }
  if (!producerBuffers.is_object()) {
    producerBuffers = json::object();
  }
}

SyncErrorKind ReplayChannel::parseErrorKind(const string& name) {
  const SyncErrorKind kinds[] = {
      SyncErrorKind::CONNECTION,    SyncErrorKind::SERVER,
      SyncErrorKind::INVALID_RESPONSE, SyncErrorKind::INVALID_STATE,
      SyncErrorKind::TIMEOUT,       SyncErrorKind::NETWORK,
  };
  for (auto kind : kinds) {
    if (name == syncErrorKindName(kind)) {
      return kind;
    }
  }
  return SyncErrorKind::SERVER;
}

RpcResponse ReplayChannel::nextResponse(const string& method) {
  json reply;
  auto it = responses.find(method);
  if (it != responses.end() && !it->second.empty()) {
    reply = it->second.front();
    it->second.pop_front();
    lastResponse[method] = reply;
  } else if (lastResponse.count(method)) {
    reply = lastResponse[method];
  } else {
    RpcResponse response;
    response.isFinal = true;
    response.error = SyncError::server("No scripted response for " + method);
    return response;
  }

  RpcResponse response;
  response.isFinal = true;
  if (reply.is_object() && reply.contains("error")) {
    const json& error = reply["error"];
    string kind = "server";
    string message = "Scripted failure";
    if (error.is_object()) {
      kind = error.value("kind", kind);
      message = error.value("message", message);
    } else if (error.is_string()) {
      message = error.get<string>();
    }
    response.error = SyncError(parseErrorKind(kind), message);
  } else if (reply.is_object() && reply.contains("result")) {
    response.result = reply["result"];
  } else {
    response.result = reply;
  }
  return response;
}

void ReplayChannel::call(const string& targetDeviceId,
                         const RpcRequest& request,
                         RpcResponseHandler handler) {
  transcript.push_back({{"type", "call"},
                        {"deviceId", targetDeviceId},
                        {"method", request.method},
                        {"params", request.params}});
  if (!connected || targetDeviceId != deviceId) {
    RpcResponse response;
    response.isFinal = true;
    response.error = SyncError::connection("Device " + targetDeviceId +
                                           " is not connected");
    handler(response);
    return;
  }
  handler(nextResponse(request.method));
}

optional<string> ReplayChannel::activeDeviceId() {
  if (deviceId.empty()) {
    return nullopt;
  }
  return deviceId;
}

bool ReplayChannel::isConnected(const string& queried) {
  return connected && queried == deviceId;
}

int ReplayChannel::subscribeEvents(RemoteEventHandler handler) {
  int id = nextSubscriptionId++;
  eventHandlers[id] = handler;
  return id;
}

int ReplayChannel::subscribeConnectivity(ConnectivityHandler handler) {
  int id = nextSubscriptionId++;
  connectivityHandlers[id] = handler;
  return id;
}

void ReplayChannel::unsubscribe(int subscriptionId) {
  eventHandlers.erase(subscriptionId);
  connectivityHandlers.erase(subscriptionId);
}

int ReplayChannel::subscribeTerminalBytes(const string& targetDeviceId,
                                          TerminalBytesHandler handler) {
  int id = nextSubscriptionId++;
  byteHandlers[id] = make_pair(targetDeviceId, handler);
  return id;
}

void ReplayChannel::unsubscribeTerminalBytes(int subscriptionId) {
  byteHandlers.erase(subscriptionId);
}

void ReplayChannel::sendTerminalControl(const string& targetDeviceId,
                                        const TerminalControl& control) {
  if (control.has_bind()) {
    const auto& bind = control.bind();
    transcript.push_back({{"type", "bind"},
                          {"deviceId", targetDeviceId},
                          {"sessionId", bind.session_id()},
                          {"includeSnapshot", bind.include_snapshot()}});
    if (bind.include_snapshot() &&
        producerBuffers.contains(bind.session_id()) &&
        producerBuffers[bind.session_id()].is_string()) {
      emitFrame(bind.session_id(),
                producerBuffers[bind.session_id()].get<string>());
    }
  } else if (control.has_unbind()) {
    transcript.push_back({{"type", "unbind"},
                          {"deviceId", targetDeviceId},
                          {"sessionId", control.unbind().session_id()}});
  }
}

void ReplayChannel::setConnection(const string& _deviceId, bool _connected) {
  deviceId = _deviceId;
  connected = _connected;
  transcript.push_back({{"type", "connectivity"},
                        {"deviceId", deviceId},
                        {"connected", connected}});
  auto handlers = connectivityHandlers;
  for (auto& it : handlers) {
    it.second(deviceId, connected);
  }
}

void ReplayChannel::emitEvent(const RemoteEvent& event) {
  auto handlers = eventHandlers;
  for (auto& it : handlers) {
    it.second(event);
  }
}

void ReplayChannel::emitFrame(const string& sessionId,
                              const string& payload) {
  if (!connected) {
    VLOG(1) << "Dropping frame for " << sessionId << " while offline";
    return;
  }
  string raw = TerminalFrameCodec::encode(sessionId, payload);
  auto handlers = byteHandlers;
  for (auto& it : handlers) {
    if (it.second.first == deviceId) {
      it.second.second(raw);
    }
  }
}
}  // namespace jm
