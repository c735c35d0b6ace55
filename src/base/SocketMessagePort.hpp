#ifndef __DX_SOCKET_MESSAGE_PORT__
#define __DX_SOCKET_MESSAGE_PORT__

#include "EventLoop.hpp"
#include "Headers.hpp"
#include "MessagePort.hpp"
#include "WriteBuffer.hpp"

namespace dx {
/**
 * @brief MessagePort over a connected stream socket.
 *
 * Each packet travels as an 8-byte big-endian length followed by the
 * serialized Packet.  Writes never block: bytes are parked in a WriteBuffer
 * and drained when the loop reports the socket writable.
 */
class SocketMessagePort : public MessagePort,
                          public enable_shared_from_this<SocketMessagePort> {
 public:
  static constexpr int64_t MAX_PACKET_SIZE = 128 * 1024 * 1024;

  /** @brief Takes ownership of @p fd. */
  SocketMessagePort(shared_ptr<EventLoop> _loop, int _fd);
  virtual ~SocketMessagePort();

  virtual void start();
  virtual void post(const Packet& packet);
  virtual void close();
  virtual bool isClosed() const { return closed; }

 protected:
  void handleReadable();
  /** @brief Returns false when the socket failed and the port was closed. */
  bool flushWrites();
  void parseFrames();
  void handleRemoteClose(const string& reason);
  void releaseFd();

  shared_ptr<EventLoop> loop;
  int fd;
  bool started;
  bool closed;
  string readBuffer;
  WriteBuffer writeBuffer;
};
}  // namespace dx

#endif  // __DX_SOCKET_MESSAGE_PORT__
