#ifndef __DX_WRITE_BUFFER__
#define __DX_WRITE_BUFFER__

#include "Headers.hpp"

namespace dx {
/**
 * @brief Bounded queue of bytes waiting for a non-blocking fd to drain.
 *
 * Used for child stdin and for channel sockets.  Once the buffer holds
 * maxBytes the owner refuses new data instead of blocking the loop.
 */
class WriteBuffer {
 public:
  static constexpr size_t DEFAULT_MAX_BYTES = 4 * 1024 * 1024;

  explicit WriteBuffer(size_t _maxBytes = DEFAULT_MAX_BYTES)
      : maxBytes(_maxBytes), totalBytes(0), writeOffset(0) {}

  bool canAcceptMore() const { return totalBytes < maxBytes; }

  bool hasPendingData() const { return !pending.empty(); }

  size_t size() const { return totalBytes; }

  size_t getMaxBytes() const { return maxBytes; }

  void enqueue(const string &data) {
    if (data.empty()) return;
    pending.push_back(data);
    totalBytes += data.size();
  }

  /**
   * @brief Returns the next contiguous run of unwritten bytes.
   * @param count Output: number of bytes at the returned pointer.
   * @return nullptr when the buffer is empty.
   */
  const char *peekData(size_t *count) const {
    if (pending.empty()) {
      *count = 0;
      return nullptr;
    }
    const string &front = pending.front();
    *count = front.size() - writeOffset;
    return front.data() + writeOffset;
  }

  /** @brief Drops @p bytesWritten bytes from the front. */
  void consume(size_t bytesWritten) {
    while (bytesWritten > 0 && !pending.empty()) {
      size_t available = pending.front().size() - writeOffset;
      if (bytesWritten >= available) {
        bytesWritten -= available;
        totalBytes -= available;
        writeOffset = 0;
        pending.pop_front();
      } else {
        writeOffset += bytesWritten;
        totalBytes -= bytesWritten;
        bytesWritten = 0;
      }
    }
  }

  /**
   * @brief Writes as much as @p fd accepts without blocking.
   * @return false on a hard write error (errno is left set), true otherwise.
   */
  bool writeTo(int fd) {
    while (hasPendingData()) {
      size_t count;
      const char *data = peekData(&count);
      ssize_t written = ::write(fd, data, count);
      if (written < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
          return true;
        }
        if (errno == EINTR) {
          continue;
        }
        return false;
      }
      if (written == 0) {
        return true;
      }
      consume(size_t(written));
    }
    return true;
  }

  void clear() {
    pending.clear();
    totalBytes = 0;
    writeOffset = 0;
  }

 private:
  size_t maxBytes;
  std::deque<string> pending;
  size_t totalBytes;
  size_t writeOffset;
};
}  // namespace dx

#endif  // __DX_WRITE_BUFFER__
