#ifndef __DX_FAKE_CHANNEL_CONNECTOR_HPP__
#define __DX_FAKE_CHANNEL_CONNECTOR_HPP__

#include "ChannelConnector.hpp"
#include "Headers.hpp"
#include "MessagePort.hpp"

namespace dx {
/**
 * @brief In-memory MessagePort.  Delivery to the linked port is synchronous.
 */
class FakeMessagePort : public MessagePort {
 public:
  FakeMessagePort()
      : started(false), closed(false), failPosts(false), breakOnPost(false) {}
  virtual ~FakeMessagePort() {}

  static void link(shared_ptr<FakeMessagePort> a,
                   shared_ptr<FakeMessagePort> b) {
    a->peer = b;
    b->peer = a;
  }

  virtual void start() {
    if (started) return;
    started = true;
    while (!inbox.empty() && !closed) {
      Packet packet = inbox.front();
      inbox.pop_front();
      messageEvent.emit(packet);
    }
  }

  virtual void post(const Packet& packet) {
    if (closed) {
      throw std::runtime_error("Tried to post on a closed port");
    }
    if (failPosts) {
      throw std::runtime_error("Simulated post failure");
    }
    if (breakOnPost) {
      // Like a write hitting EPIPE: the port closes itself, then throws.
      remoteClosed();
      throw std::runtime_error("Port closed while posting");
    }
    posted.push_back(packet);
    auto other = peer.lock();
    if (other) {
      other->receive(packet);
    }
  }

  virtual void close() {
    if (closed) return;
    closed = true;
    auto other = peer.lock();
    if (other) {
      other->remoteClosed();
    }
  }

  virtual bool isClosed() const { return closed; }

  void receive(const Packet& packet) {
    if (closed) return;
    received.push_back(packet);
    if (!started) {
      inbox.push_back(packet);
      return;
    }
    messageEvent.emit(packet);
  }

  void remoteClosed() {
    if (closed) return;
    closed = true;
    closeEvent.emit();
  }

  template <typename T>
  vector<T> receivedAs(uint8_t header) const {
    vector<T> messages;
    for (auto& packet : received) {
      if (packet.getHeader() == header) {
        messages.push_back(packet.parsePayload<T>());
      }
    }
    return messages;
  }

  bool started;
  bool closed;
  bool failPosts;
  bool breakOnPost;
  vector<Packet> posted;
  vector<Packet> received;
  deque<Packet> inbox;
  weak_ptr<FakeMessagePort> peer;
};

/**
 * @brief Hands out linked in-memory ports and can fail on demand.
 */
class FakeChannelConnector : public ChannelConnector {
 public:
  FakeChannelConnector() : failuresRemaining(0), connectCalls(0) {}
  virtual ~FakeChannelConnector() {}

  virtual ChannelEndpoints connect(const string& channelId) {
    connectCalls++;
    if (failuresRemaining > 0) {
      failuresRemaining--;
      throw std::runtime_error("Simulated failure opening " + channelId);
    }
    frontEnd = make_shared<FakeMessagePort>();
    frontEndPeer = make_shared<FakeMessagePort>();
    host = make_shared<FakeMessagePort>();
    hostPeer = make_shared<FakeMessagePort>();
    FakeMessagePort::link(frontEnd, frontEndPeer);
    FakeMessagePort::link(host, hostPeer);
    frontEndPeer->start();
    if (hostAttacher) {
      hostAttacher(hostPeer);
    }
    ChannelEndpoints endpoints;
    endpoints.frontEnd = frontEnd;
    endpoints.host = host;
    return endpoints;
  }

  int failuresRemaining;
  int connectCalls;
  function<void(shared_ptr<MessagePort>)> hostAttacher;
  shared_ptr<FakeMessagePort> frontEnd;
  shared_ptr<FakeMessagePort> frontEndPeer;
  shared_ptr<FakeMessagePort> host;
  shared_ptr<FakeMessagePort> hostPeer;
};
}  // namespace dx

#endif  // __DX_FAKE_CHANNEL_CONNECTOR_HPP__
