#ifndef __DX_MESSAGE_PORT__
#define __DX_MESSAGE_PORT__

#include "EventSignal.hpp"
#include "Headers.hpp"
#include "Packet.hpp"

namespace dx {
/**
 * @brief One end of a bidirectional, ordered packet channel.
 *
 * Packets posted on one end arrive, in order, as message events on the linked
 * end.  Closing one end raises the close event on the other end only.
 */
class MessagePort {
 public:
  typedef function<void(const Packet&)> MessageHandler;
  typedef function<void()> CloseHandler;

  virtual ~MessagePort() {}

  /** @brief Begins delivering inbound packets. */
  virtual void start() = 0;
  /**
   * @brief Queues a packet for the linked end.
   * @throws std::runtime_error when the port is closed, cannot accept more, or
   * fails while writing.  In the last case the close event has already fired.
   */
  virtual void post(const Packet& packet) = 0;
  virtual void close() = 0;
  virtual bool isClosed() const = 0;

  void onMessage(const MessageHandler& handler) {
    messageEvent.connect(handler);
  }
  void onClose(const CloseHandler& handler) { closeEvent.connect(handler); }

  void clearHandlers() {
    messageEvent.disconnectAll();
    closeEvent.disconnectAll();
  }

 protected:
  EventSignal<const Packet&> messageEvent;
  EventSignal<> closeEvent;
};
}  // namespace dx

#endif  // __DX_MESSAGE_PORT__
