#include "SessionChannelBridge.hpp"

#include "Packet.hpp"

namespace dx {
int64_t ReconnectPolicy::delayForAttempt(int attempt) const {
  int64_t delay = baseBackoffMs;
  for (int a = 0; a < attempt && delay < maxBackoffMs; a++) {
    delay *= 2;
  }
  return std::min(delay, maxBackoffMs);
}

SessionChannelBridge::SessionChannelBridge(
    const string& _channelId, shared_ptr<ChannelConnector> _connector,
    shared_ptr<Scheduler> _scheduler, const ReconnectPolicy& _policy)
    : channelId(_channelId),
      connector(_connector),
      scheduler(_scheduler),
      policy(_policy),
      state(CONNECTION_DISCONNECTED),
      reconnectAttempts(0),
      requestSequence(0),
      messageCount(0),
      totalLatency(0),
      maxLatency(0),
      timedResponses(0),
      channelsActive(0) {
  if (channelId.empty()) {
    throw std::invalid_argument("Channel id must not be empty");
  }
  if (!connector || !scheduler) {
    throw std::invalid_argument("Bridge is missing a collaborator");
  }
}

SessionChannelBridge::~SessionChannelBridge() {
  retryTask.cancel();
  closeEndpoints();
}

void SessionChannelBridge::initialize() {
  LOG(INFO) << "Setting up channel " << channelId;
  if (state == CONNECTION_CONNECTED) {
    channelsActive = std::max(0, channelsActive - 1);
  }
  closeEndpoints();
  state = CONNECTION_CONNECTING;
  try {
    endpoints = connector->connect(channelId);
    if (!endpoints.frontEnd || !endpoints.host) {
      throw std::runtime_error("Connector returned an incomplete channel");
    }
    endpoints.frontEnd->onMessage(
        [this](const Packet& packet) { handleFrontEndMessage(packet); });
    endpoints.frontEnd->onClose([this]() {
      LOG(WARNING) << "Front-end port of " << channelId << " closed";
      handleDisconnection();
    });
    endpoints.host->onMessage(
        [this](const Packet& packet) { handleHostMessage(packet); });
    endpoints.host->onClose([this]() {
      LOG(WARNING) << "Host port of " << channelId << " closed";
      handleDisconnection();
    });
    endpoints.frontEnd->start();
    endpoints.host->start();
  } catch (const std::runtime_error& ex) {
    LOG(ERROR) << "Failed to set up channel " << channelId << ": "
               << ex.what();
    closeEndpoints();
    handleConnectionError(ex.what());
    throw;
  }

  state = CONNECTION_CONNECTED;
  reconnectAttempts = 0;
  retryTask.cancel();
  channelsActive++;
  flushQueue();
  if (state != CONNECTION_CONNECTED) {
    // Lost again during the replay; a retry is already scheduled.
    return;
  }
  LOG(INFO) << "Channel " << channelId << " connected";
  connectedEvent.emit();
}

ChannelRequest SessionChannelBridge::buildRequest(ChannelRequestType type,
                                                  const string& op) {
  int64_t timestamp = scheduler->now();
  ChannelRequest request;
  request.set_type(type);
  request.set_terminalid(channelId);
  request.set_timestamp(timestamp);
  request.set_requestid(op + "-" + channelId + "-" + to_string(timestamp) +
                        "-" + to_string(++requestSequence));
  return request;
}

bool SessionChannelBridge::createTerminal(
    const TerminalCreateOptions& options) {
  auto request = buildRequest(CREATE, "create");
  *(request.mutable_data()->mutable_options()) = options;
  return sendRequest(request);
}

bool SessionChannelBridge::write(const string& text) {
  auto request = buildRequest(WRITE, "write");
  request.mutable_data()->set_text(text);
  return sendRequest(request);
}

bool SessionChannelBridge::resize(int cols, int rows) {
  auto request = buildRequest(RESIZE, "resize");
  request.mutable_data()->set_cols(cols);
  request.mutable_data()->set_rows(rows);
  return sendRequest(request);
}

bool SessionChannelBridge::kill() { return sendRequest(buildRequest(KILL, "kill")); }

bool SessionChannelBridge::listTerminals() {
  return sendRequest(buildRequest(LIST, "list"));
}

bool SessionChannelBridge::sendRequest(const ChannelRequest& request) {
  if (state != CONNECTION_CONNECTED || !endpoints.host) {
    LOG(WARNING) << "Queuing " << request.requestid() << ": not connected";
    queue.push_back(request);
    return false;
  }
  try {
    endpoints.host->post(Packet::fromProto(CHANNEL_REQUEST, request));
  } catch (const std::runtime_error& ex) {
    if (state != CONNECTION_CONNECTED) {
      // The channel broke under the write; send it after reconnecting.
      LOG(WARNING) << "Queuing " << request.requestid()
                   << ": channel lost while sending (" << ex.what() << ")";
      queue.push_back(request);
      return false;
    }
    LOG(ERROR) << "Failed to send " << request.requestid() << ": "
               << ex.what();
    return false;
  }
  messageCount++;
  VLOG(1) << "Sent request " << request.requestid();
  return true;
}

void SessionChannelBridge::flushQueue() {
  if (queue.empty()) {
    return;
  }
  LOG(INFO) << "Replaying " << queue.size() << " queued requests on "
            << channelId;
  deque<ChannelRequest> replay;
  replay.swap(queue);
  while (!replay.empty()) {
    ChannelRequest request = replay.front();
    replay.pop_front();
    if (state != CONNECTION_CONNECTED) {
      // Lost the channel mid-replay: keep the rest, in order.
      queue.push_back(request);
      continue;
    }
    if (!sendRequest(request) && state == CONNECTION_CONNECTED) {
      errorEvent.emit("Failed to replay queued request " +
                      request.requestid());
    }
  }
}

void SessionChannelBridge::handleFrontEndMessage(const Packet& packet) {
  ChannelRequest request;
  try {
    if (packet.getHeader() != CHANNEL_REQUEST) {
      throw std::runtime_error("Unexpected packet type " +
                               to_string(int(packet.getHeader())) +
                               " from the front end");
    }
    request = packet.parsePayload<ChannelRequest>();
  } catch (const std::runtime_error& ex) {
    LOG(ERROR) << "Bad front-end message on " << channelId << ": "
               << ex.what();
    errorEvent.emit(ex.what());
    return;
  }
  VLOG(1) << "Forwarding front-end request " << request.requestid();
  if (!sendRequest(request)) {
    errorEvent.emit("Failed to forward request " + request.requestid());
  }
}

void SessionChannelBridge::handleHostMessage(const Packet& packet) {
  ChannelResponse response;
  try {
    if (packet.getHeader() != CHANNEL_RESPONSE) {
      throw std::runtime_error("Unexpected packet type " +
                               to_string(int(packet.getHeader())) +
                               " from the host");
    }
    response = packet.parsePayload<ChannelResponse>();
  } catch (const std::runtime_error& ex) {
    LOG(ERROR) << "Bad host message on " << channelId << ": " << ex.what();
    errorEvent.emit(ex.what());
    return;
  }
  VLOG(1) << "Received response " << response.requestid();

  if (response.has_timestamp() && !response.requestid().empty()) {
    int64_t latency = scheduler->now() - response.timestamp();
    totalLatency += latency;
    maxLatency = std::max(maxLatency, latency);
    timedResponses++;
  }
  if (response.has_data() && !response.data().output().empty()) {
    dataEvent.emit(response.data().output());
  }
  responseEvent.emit(response);
}

void SessionChannelBridge::handleDisconnection() {
  if (state != CONNECTION_CONNECTED) {
    return;
  }
  state = CONNECTION_DISCONNECTED;
  closeEndpoints();
  channelsActive = std::max(0, channelsActive - 1);
  disconnectedEvent.emit();
  handleConnectionError("Channel " + channelId + " disconnected");
}

void SessionChannelBridge::handleConnectionError(const string& message) {
  state = CONNECTION_DISCONNECTED;
  errorEvent.emit(message);
  if (reconnectAttempts < policy.maxAttempts) {
    reconnectAttempts++;
    int64_t delay = policy.delayForAttempt(reconnectAttempts);
    LOG(INFO) << "Reconnecting " << channelId << " (" << reconnectAttempts
              << "/" << policy.maxAttempts << ") in " << delay << "ms";
    retryTask = DeferredTask(scheduler, scheduler->schedule(delay, [this]() {
      try {
        initialize();
      } catch (const std::runtime_error& ex) {
        LOG(ERROR) << "Reconnection of " << channelId
                   << " failed: " << ex.what();
      }
    }));
  } else {
    LOG(ERROR) << "Giving up on " << channelId << " after "
               << reconnectAttempts << " reconnection attempts";
    maxReconnectAttemptsReachedEvent.emit();
  }
}

void SessionChannelBridge::reconnect() {
  LOG(INFO) << "Manual reconnect of " << channelId;
  retryTask.cancel();
  reconnectAttempts = 0;
  try {
    initialize();
  } catch (const std::runtime_error& ex) {
    errorEvent.emit(string("Manual reconnection failed: ") + ex.what());
  }
}

void SessionChannelBridge::cleanup() {
  retryTask.cancel();
  state = CONNECTION_DISCONNECTED;
  queue.clear();
  closeEndpoints();
  channelsActive = 0;
  LOG(INFO) << "Channel " << channelId << " cleaned up";
  cleanupEvent.emit();
}

void SessionChannelBridge::closeEndpoints() {
  for (auto port : {endpoints.frontEnd, endpoints.host}) {
    if (port) {
      port->clearHandlers();
      port->close();
    }
  }
  endpoints = ChannelEndpoints();
}

ConnectionStatus SessionChannelBridge::getConnectionStatus() const {
  ConnectionStatus status;
  status.connected = state == CONNECTION_CONNECTED;
  status.reconnectAttempts = reconnectAttempts;
  status.queuedMessages = queue.size();
  status.performance.messageCount = messageCount;
  status.performance.avgLatency =
      timedResponses > 0 ? double(totalLatency) / double(timedResponses) : 0.0;
  status.performance.maxLatency = maxLatency;
  status.performance.channelsActive = channelsActive;
  return status;
}
}  // namespace dx
