#include "RpcCall.hpp"

namespace jm {
namespace {
struct CallState {
  mutex stateMutex;
  json lastResult;
  bool hasResult = false;
  bool done = false;
};
}  // namespace

void RpcCall::invoke(shared_ptr<RemoteChannel> channel,
                     shared_ptr<Executor> executor, const string& deviceId,
                     const RpcRequest& request, RpcCompletion completion) {
  auto state = make_shared<CallState>();
  RpcRequest tagged = request;
  if (tagged.requestId.empty()) {
    tagged.requestId = sole::uuid4().str();
  }
  string method = tagged.method;
  string requestId = tagged.requestId;
  VLOG(2) << "RPC " << method << " [" << requestId << "] -> " << deviceId;
  channel->call(
      deviceId, tagged,
      [state, executor, completion, method,
       requestId](const RpcResponse& response) {
        RpcOutcome outcome;
        {
          lock_guard<mutex> guard(state->stateMutex);
          if (state->done) {
            return;
          }
          if (response.error) {
            state->done = true;
            outcome.error = response.error;
          } else {
            if (!response.result.is_null()) {
              state->lastResult = response.result;
              state->hasResult = true;
            }
            if (!response.isFinal) {
              return;
            }
            state->done = true;
            if (state->hasResult) {
              outcome.result = state->lastResult;
            } else {
              outcome.error =
                  SyncError::invalidResponse("No result for " + method);
            }
          }
        }
        if (outcome.error) {
          LOG(WARNING) << "RPC " << method << " [" << requestId
                       << "] failed: " << *outcome.error;
        }
        executor->post([completion, outcome]() { completion(outcome); });
      });
}

void RpcCall::invoke(shared_ptr<RemoteChannel> channel,
                     shared_ptr<Executor> executor, const string& deviceId,
                     const RpcRequest& request, weak_ptr<void> owner,
                     RpcCompletion completion) {
  string method = request.method;
  invoke(channel, executor, deviceId, request,
         [owner, completion, method](const RpcOutcome& outcome) {
           auto alive = owner.lock();
           if (!alive) {
             VLOG(1) << "Dropping " << method << " result, owner is gone";
             return;
           }
           completion(outcome);
         });
}

string RpcCall::requireConnectedDevice(shared_ptr<RemoteChannel> channel) {
  auto deviceId = channel->activeDeviceId();
  if (!deviceId || deviceId->empty()) {
    throw SyncError::connection("No active device");
  }
  if (!channel->isConnected(*deviceId)) {
    throw SyncError::connection("Device " + *deviceId + " is not connected");
  }
  return *deviceId;
}
}  // namespace jm
