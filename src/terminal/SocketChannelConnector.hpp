#ifndef __DX_SOCKET_CHANNEL_CONNECTOR__
#define __DX_SOCKET_CHANNEL_CONNECTOR__

#include "ChannelConnector.hpp"
#include "EventLoop.hpp"
#include "Headers.hpp"
#include "SocketMessagePort.hpp"

namespace dx {
/**
 * @brief Builds channels out of two socketpair(2)s.
 *
 * The far end of the host-facing pair is handed to the attach callback (a
 * SessionHost).  The far end of the front-end pair is kept so the display side
 * can post requests into the bridge.
 */
class SocketChannelConnector : public ChannelConnector {
 public:
  typedef function<void(shared_ptr<MessagePort>)> HostAttacher;

  SocketChannelConnector(shared_ptr<EventLoop> _loop, HostAttacher _attachHost)
      : loop(_loop), attachHost(_attachHost) {}
  virtual ~SocketChannelConnector() {}

  virtual ChannelEndpoints connect(const string& channelId);

  /** @brief Display-side peer of the most recent channel. */
  shared_ptr<MessagePort> getFrontEndPeer() const { return frontEndPeer; }

 protected:
  shared_ptr<EventLoop> loop;
  HostAttacher attachHost;
  shared_ptr<MessagePort> frontEndPeer;
};
}  // namespace dx

#endif  // __DX_SOCKET_CHANNEL_CONNECTOR__
