#ifndef __DX_CHANNEL_CONNECTOR__
#define __DX_CHANNEL_CONNECTOR__

#include "Headers.hpp"
#include "MessagePort.hpp"

namespace dx {
/**
 * @brief The two endpoints a bridge holds for one channel.
 *
 * frontEnd receives requests from the display side.  host carries requests to
 * the session host and brings its responses back.
 */
struct ChannelEndpoints {
  shared_ptr<MessagePort> frontEnd;
  shared_ptr<MessagePort> host;
};

class ChannelConnector {
 public:
  virtual ~ChannelConnector() {}

  /**
   * @brief Creates a fresh pair of linked endpoints for @p channelId.
   * @throws std::runtime_error when the channel cannot be created.
   */
  virtual ChannelEndpoints connect(const string& channelId) = 0;
};
}  // namespace dx

#endif  // __DX_CHANNEL_CONNECTOR__
