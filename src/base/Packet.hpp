#ifndef __DX_PACKET_H__
#define __DX_PACKET_H__

#include "Headers.hpp"

namespace dx {
/**
 * @brief One framed channel message: a type byte followed by a serialized
 * protobuf.
 */
class Packet {
 public:
  Packet() : header(255) {}

  Packet(uint8_t _header, const string& _payload)
      : header(_header), payload(_payload) {}

  /**
   * @brief Parses the wire form produced by serialize().
   * @throws std::runtime_error when the input is empty.
   */
  explicit Packet(const string& serializedPacket) {
    if (serializedPacket.empty()) {
      throw std::runtime_error("Tried to parse an empty packet");
    }
    header = uint8_t(serializedPacket[0]);
    payload = serializedPacket.substr(HEADER_SIZE);
  }

  template <typename T>
  static Packet fromProto(uint8_t header, const T& message) {
    return Packet(header, protoToString(message));
  }

  uint8_t getHeader() const { return header; }
  const string& getPayload() const { return payload; }

  /** @brief Decodes the payload as @p T, throwing on malformed bytes. */
  template <typename T>
  T parsePayload() const {
    return stringToProto<T>(payload);
  }

  ssize_t length() const { return HEADER_SIZE + payload.length(); }

  string serialize() const {
    string s(1, char(header));
    s += payload;
    return s;
  }

 protected:
  static const int HEADER_SIZE = 1;
  uint8_t header;
  string payload;
};
}  // namespace dx

#endif
