#include "TerminalStreamManager.hpp"

#include "TerminalFrameCodec.hpp"

namespace jm {
TerminalStreamManager::TerminalStreamManager(
    shared_ptr<RemoteChannel> _channel, shared_ptr<Executor> _executor,
    const SyncConfig& _config)
    : channel(_channel),
      executor(_executor),
      config(_config),
      bindings(_executor, _config.unbindGraceMs),
      subscriptionId(-1),
      nextConsumerToken(1),
      generation(0) {}

TerminalStreamManager::~TerminalStreamManager() {
  if (subscriptionId >= 0) {
    channel->unsubscribeTerminalBytes(subscriptionId);
  }
}

TerminalStreamManager::SessionStream& TerminalStreamManager::ensureStream(
    const string& sessionId) {
  auto it = streams.find(sessionId);
  if (it != streams.end()) {
    return it->second;
  }
  SessionStream& stream = streams[sessionId];
  stream.buffer.reset(new RingBuffer(config.ringBufferMaxBytes));
  return stream;
}

int TerminalStreamManager::attach(const string& sessionId,
                                  TerminalConsumer consumer) {
  SessionStream& stream = ensureStream(sessionId);
  int token = nextConsumerToken++;
  string buffered = stream.buffer->snapshot();
  if (!buffered.empty()) {
    consumer(buffered);
  }
  stream.consumers[token] = consumer;

  if (bindings.attach(sessionId)) {
    // Ask the producer for its buffer only when there is nothing local yet.
    sendBind(sessionId, buffered.empty());
  }
  return token;
}

void TerminalStreamManager::detach(const string& sessionId, int token) {
  auto it = streams.find(sessionId);
  if (it != streams.end()) {
    it->second.consumers.erase(token);
  }
  bindings.detach(sessionId);
}

void TerminalStreamManager::finalize(const string& sessionId) {
  string deviceId = subscribedDeviceId;
  bindings.finalize(sessionId, [this, deviceId](const string& id) {
    sendUnbind(deviceId, id);
    if (lastBoundSessionId == id) {
      lastBoundSessionId.clear();
    }
  });
}

void TerminalStreamManager::appendLocal(const string& sessionId,
                                        const string& bytes) {
  SessionStream& stream = ensureStream(sessionId);
  stream.buffer->append(bytes);
  // Consumers may detach while being called.
  auto consumers = stream.consumers;
  for (const auto& it : consumers) {
    it.second(bytes);
  }
}

void TerminalStreamManager::deliverNotice(const string& sessionId,
                                          const string& text) {
  auto it = streams.find(sessionId);
  if (it == streams.end()) {
    return;
  }
  auto consumers = it->second.consumers;
  for (const auto& consumer : consumers) {
    consumer.second(text);
  }
}

void TerminalStreamManager::onConnectivityChanged(const string& deviceId,
                                                  bool connected) {
  if (!connected) {
    if (!subscribedDeviceId.empty() &&
        (deviceId.empty() || deviceId == subscribedDeviceId)) {
      LOG(INFO) << "Terminal feed for " << subscribedDeviceId
                << " lost, bytes produced while offline are not recoverable";
      dropSubscription();
    }
    return;
  }
  if (!ensureSubscription(deviceId)) {
    return;
  }
  auto toRebind = bindings.boundSessions();
  if (!toRebind.empty()) {
    LOG(INFO) << "Rebinding " << toRebind.size() << " terminal sessions on "
              << deviceId;
  }
  for (const auto& sessionId : toRebind) {
    sendBind(sessionId, true);
  }
}

bool TerminalStreamManager::ensureSubscription(const string& deviceId) {
  if (deviceId.empty() || !channel->isConnected(deviceId)) {
    return false;
  }
  if (subscriptionId >= 0 && subscribedDeviceId == deviceId) {
    return false;
  }
  dropSubscription();
  uint64_t subscriptionGeneration = generation;
  shared_ptr<Executor> exec = executor;
  weak_ptr<TerminalStreamManager> weakSelf = weak_from_this();
  subscriptionId = channel->subscribeTerminalBytes(
      deviceId, [weakSelf, exec, subscriptionGeneration](const string& bytes) {
        exec->post([weakSelf, subscriptionGeneration, bytes]() {
          auto self = weakSelf.lock();
          if (!self || subscriptionGeneration != self->generation) {
            return;
          }
          self->handleRawFrame(bytes);
        });
      });
  subscribedDeviceId = deviceId;
  VLOG(1) << "Subscribed to terminal bytes on " << deviceId;
  return true;
}

void TerminalStreamManager::dropSubscription() {
  if (subscriptionId >= 0) {
    channel->unsubscribeTerminalBytes(subscriptionId);
  }
  subscriptionId = -1;
  subscribedDeviceId.clear();
  generation++;
}

void TerminalStreamManager::sendBind(const string& sessionId,
                                     bool includeSnapshot) {
  auto deviceId = channel->activeDeviceId();
  if (!deviceId || deviceId->empty() || !channel->isConnected(*deviceId)) {
    VLOG(1) << "Deferring bind of " << sessionId << " until connected";
    return;
  }
  ensureSubscription(*deviceId);
  TerminalControl control;
  TerminalBinaryBind* bind = control.mutable_bind();
  bind->set_session_id(sessionId);
  bind->set_include_snapshot(includeSnapshot);
  bind->set_producer_device_id(*deviceId);
  VLOG(1) << "Binding " << sessionId << " (snapshot=" << includeSnapshot
          << ")";
  try {
    channel->sendTerminalControl(*deviceId, control);
    lastBoundSessionId = sessionId;
  } catch (const std::runtime_error& re) {
    // The binding stays marked; the next reconnect resends it.
    LOG(WARNING) << "Bind of " << sessionId << " failed: " << re.what();
  }
}

void TerminalStreamManager::sendUnbind(const string& deviceId,
                                       const string& sessionId) {
  if (deviceId.empty()) {
    return;
  }
  TerminalControl control;
  control.mutable_unbind()->set_session_id(sessionId);
  VLOG(1) << "Unbinding " << sessionId;
  try {
    channel->sendTerminalControl(deviceId, control);
  } catch (const std::runtime_error& re) {
    LOG(WARNING) << "Unbind of " << sessionId << " failed: " << re.what();
  }
}

void TerminalStreamManager::handleRawFrame(const string& raw) {
  TerminalFrame frame = TerminalFrameCodec::decode(raw, executor->nowMs());
  string sessionId = frame.session_id();
  if (sessionId.empty()) {
    sessionId = lastBoundSessionId;
  }
  if (sessionId.empty()) {
    VLOG(3) << "Dropping " << raw.size() << " untagged bytes, nothing bound";
    return;
  }
  auto it = streams.find(sessionId);
  if (it == streams.end()) {
    VLOG(3) << "Dropping bytes for unknown session " << sessionId;
    return;
  }
  VLOG(3) << "Routing " << frame.payload().size() << " bytes to " << sessionId;
  it->second.buffer->append(frame.payload());
  it->second.lastActivityMs = frame.received_at_ms();
  auto consumers = it->second.consumers;
  for (const auto& consumer : consumers) {
    consumer.second(frame.payload());
  }
}

void TerminalStreamManager::reset() {
  bindings.reset();
  dropSubscription();
  streams.clear();
  lastBoundSessionId.clear();
}

string TerminalStreamManager::snapshot(const string& sessionId) const {
  auto it = streams.find(sessionId);
  if (it == streams.end()) {
    return "";
  }
  return it->second.buffer->snapshot();
}

optional<int64_t> TerminalStreamManager::lastActivityMs(
    const string& sessionId) const {
  auto it = streams.find(sessionId);
  if (it == streams.end()) {
    return std::nullopt;
  }
  return it->second.lastActivityMs;
}
}  // namespace jm
