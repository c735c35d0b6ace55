#include "SocketMessagePort.hpp"

namespace dx {
namespace {
string encodeLength(int64_t length) {
  string s(8, '\0');
  for (int i = 7; i >= 0; --i) {
    s[i] = char(length & 0xff);
    length >>= 8;
  }
  return s;
}

int64_t decodeLength(const string& s) {
  int64_t length = 0;
  for (int i = 0; i < 8; ++i) {
    length = (length << 8) | uint8_t(s[i]);
  }
  return length;
}
}  // namespace

SocketMessagePort::SocketMessagePort(shared_ptr<EventLoop> _loop, int _fd)
    : loop(_loop), fd(_fd), started(false), closed(false) {
  int flags = fcntl(fd, F_GETFL, 0);
  FATAL_FAIL(flags);
  FATAL_FAIL(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
  // Spawned shells must not hold the channel open.
  int fdFlags = fcntl(fd, F_GETFD, 0);
  FATAL_FAIL(fdFlags);
  FATAL_FAIL(fcntl(fd, F_SETFD, fdFlags | FD_CLOEXEC));
}

SocketMessagePort::~SocketMessagePort() { releaseFd(); }

void SocketMessagePort::start() {
  if (started || closed) {
    return;
  }
  started = true;
  loop->watchRead(fd, [this]() { handleReadable(); });
}

void SocketMessagePort::post(const Packet& packet) {
  if (closed) {
    throw std::runtime_error("Tried to post on a closed port");
  }
  if (!writeBuffer.canAcceptMore()) {
    throw std::runtime_error("Port write buffer is full");
  }
  string serialized = packet.serialize();
  writeBuffer.enqueue(encodeLength(serialized.length()) + serialized);
  auto self = shared_from_this();
  if (!flushWrites()) {
    throw std::runtime_error("Port closed while posting");
  }
}

void SocketMessagePort::close() {
  if (closed) {
    return;
  }
  VLOG(1) << "Closing port on fd " << fd;
  releaseFd();
}

void SocketMessagePort::releaseFd() {
  closed = true;
  writeBuffer.clear();
  if (fd >= 0) {
    loop->unwatch(fd);
    ::close(fd);
    fd = -1;
  }
}

bool SocketMessagePort::flushWrites() {
  if (closed) {
    return false;
  }
  auto self = shared_from_this();
  if (!writeBuffer.writeTo(fd)) {
    handleRemoteClose(string("write failed: ") + strerror(GetErrno()));
    return false;
  }
  if (writeBuffer.hasPendingData()) {
    loop->watchWrite(fd, [this]() { flushWrites(); });
  } else {
    loop->unwatchWrite(fd);
  }
  return true;
}

void SocketMessagePort::handleReadable() {
  auto self = shared_from_this();
  char buf[64 * 1024];
  ssize_t bytesRead = ::read(fd, buf, sizeof(buf));
  if (bytesRead == 0) {
    handleRemoteClose("end of stream");
    return;
  }
  if (bytesRead < 0) {
    auto localErrno = GetErrno();
    if (localErrno == EAGAIN || localErrno == EWOULDBLOCK ||
        localErrno == EINTR) {
      return;
    }
    handleRemoteClose(string("read failed: ") + strerror(localErrno));
    return;
  }
  readBuffer.append(buf, bytesRead);
  parseFrames();
}

void SocketMessagePort::parseFrames() {
  while (!closed && readBuffer.length() >= 8) {
    int64_t length = decodeLength(readBuffer);
    if (length < 1 || length > MAX_PACKET_SIZE) {
      STERROR << "Invalid packet length on port: " << length;
      handleRemoteClose("protocol error");
      return;
    }
    if (int64_t(readBuffer.length()) < 8 + length) {
      return;
    }
    Packet packet(readBuffer.substr(8, length));
    readBuffer.erase(0, 8 + length);
    messageEvent.emit(packet);
  }
}

void SocketMessagePort::handleRemoteClose(const string& reason) {
  if (closed) {
    return;
  }
  LOG(INFO) << "Port on fd " << fd << " closed: " << reason;
  releaseFd();
  readBuffer.clear();
  closeEvent.emit();
}
}  // namespace dx
