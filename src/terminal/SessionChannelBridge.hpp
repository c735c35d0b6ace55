#ifndef __DX_SESSION_CHANNEL_BRIDGE__
#define __DX_SESSION_CHANNEL_BRIDGE__

#include "ChannelConnector.hpp"
#include "EventSignal.hpp"
#include "Headers.hpp"
#include "Scheduler.hpp"

namespace dx {
enum ConnectionState {
  CONNECTION_DISCONNECTED = 0,
  CONNECTION_CONNECTING = 1,
  CONNECTION_CONNECTED = 2,
};

struct ReconnectPolicy {
  int maxAttempts = 5;
  int64_t baseBackoffMs = 1000;
  int64_t maxBackoffMs = 10000;

  /** @brief min(base * 2^attempt, max) */
  int64_t delayForAttempt(int attempt) const;
};

struct BridgePerformance {
  int64_t messageCount;
  double avgLatency;
  int64_t maxLatency;
  int channelsActive;
};

struct ConnectionStatus {
  bool connected;
  int reconnectAttempts;
  size_t queuedMessages;
  BridgePerformance performance;
};

/**
 * @brief Carries session requests and responses for one channel.
 *
 * Requests built here, or received on the front-end endpoint, go out on the
 * host endpoint.  Responses from the host are timed, republished as data when
 * they carry output, and republished whole on the response event.  While
 * disconnected, requests queue up and are replayed in order inside the next
 * successful initialize(), before it returns.  Lost connections are retried
 * with capped exponential backoff.
 */
class SessionChannelBridge {
 public:
  typedef function<void()> Handler;
  typedef function<void(const string&)> DataHandler;
  typedef function<void(const string&)> ErrorHandler;
  typedef function<void(const ChannelResponse&)> ResponseHandler;

  SessionChannelBridge(const string& _channelId,
                       shared_ptr<ChannelConnector> _connector,
                       shared_ptr<Scheduler> _scheduler,
                       const ReconnectPolicy& _policy = ReconnectPolicy());
  ~SessionChannelBridge();

  /**
   * @brief Opens a fresh pair of endpoints and replays queued requests.
   * @throws std::runtime_error after starting the reconnect path on failure.
   */
  void initialize();

  /** @return true when the request was posted, false if queued or failed. */
  bool createTerminal(const TerminalCreateOptions& options);
  bool write(const string& text);
  bool resize(int cols, int rows);
  bool kill();
  bool listTerminals();

  /** @brief Resets the retry budget and connects immediately. */
  void reconnect();
  /** @brief Disconnects for good and drops queued requests. */
  void cleanup();

  ConnectionStatus getConnectionStatus() const;
  ConnectionState getState() const { return state; }
  const string& getChannelId() const { return channelId; }

  void onConnected(const Handler& handler) { connectedEvent.connect(handler); }
  void onDisconnected(const Handler& handler) {
    disconnectedEvent.connect(handler);
  }
  void onData(const DataHandler& handler) { dataEvent.connect(handler); }
  void onError(const ErrorHandler& handler) { errorEvent.connect(handler); }
  void onResponse(const ResponseHandler& handler) {
    responseEvent.connect(handler);
  }
  void onCleanup(const Handler& handler) { cleanupEvent.connect(handler); }
  void onMaxReconnectAttemptsReached(const Handler& handler) {
    maxReconnectAttemptsReachedEvent.connect(handler);
  }

 protected:
  ChannelRequest buildRequest(ChannelRequestType type, const string& op);
  bool sendRequest(const ChannelRequest& request);
  void flushQueue();
  void handleFrontEndMessage(const Packet& packet);
  void handleHostMessage(const Packet& packet);
  void handleDisconnection();
  void handleConnectionError(const string& message);
  void closeEndpoints();

  string channelId;
  shared_ptr<ChannelConnector> connector;
  shared_ptr<Scheduler> scheduler;
  ReconnectPolicy policy;

  ConnectionState state;
  int reconnectAttempts;
  deque<ChannelRequest> queue;
  ChannelEndpoints endpoints;
  DeferredTask retryTask;
  uint64_t requestSequence;

  int64_t messageCount;
  int64_t totalLatency;
  int64_t maxLatency;
  int64_t timedResponses;
  int channelsActive;

  EventSignal<> connectedEvent;
  EventSignal<> disconnectedEvent;
  EventSignal<const string&> dataEvent;
  EventSignal<const string&> errorEvent;
  EventSignal<const ChannelResponse&> responseEvent;
  EventSignal<> cleanupEvent;
  EventSignal<> maxReconnectAttemptsReachedEvent;
};
}  // namespace dx

#endif  // __DX_SESSION_CHANNEL_BRIDGE__
