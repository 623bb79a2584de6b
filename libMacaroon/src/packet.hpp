#ifndef MACAROON_PACKET_HPP
#define MACAROON_PACKET_HPP

#include <ndn-cxx/encoding/buffer.hpp>

#include <stdexcept>
#include <string>
#include <stdint.h>

namespace macaroon {

  typedef ndn::Buffer Buffer;

  // Field tags, numbered as in libmacaroons.
  enum class Field : uint8_t {
    INVALID         = 0,
    LOCATION        = 1,
    IDENTIFIER      = 2,
    SIGNATURE       = 3,
    CAVEAT          = 4,
    VERIFICATION_ID = 5
  };

  std::string
  toString(Field field);

  // [2-byte little-endian total length][1-byte field tag][payload]
  const size_t PACKET_HEADER_SIZE = 3;
  const size_t MAX_PACKET_SIZE = 0xffff;
  // Anything shorter cannot be followed by a signature packet.
  const size_t MIN_PACKET_SIZE = 6;

  class PacketError : public std::runtime_error
  {
  public:
    explicit
    PacketError(const std::string& what)
      : std::runtime_error(what)
    {
    }
  };

  /*
    Packet refers to a range of the buffer owned by a macaroon. A
    packet with totalLength == 0 is the "absent" value.
  */
  struct Packet
  {
    uint32_t start = 0;
    uint16_t totalLength = 0;

    bool
    isAbsent() const
    {
      return totalLength == 0;
    }

    size_t
    getPayloadSize() const
    {
      return isAbsent() ? 0 : totalLength - PACKET_HEADER_SIZE;
    }
  };

  inline bool
  fitsInPacket(size_t payloadSize)
  {
    return PACKET_HEADER_SIZE + payloadSize <= MAX_PACKET_SIZE;
  }

  // Size of the packet that would hold payloadSize bytes.
  inline size_t
  getPacketSize(size_t payloadSize)
  {
    return PACKET_HEADER_SIZE + payloadSize;
  }

  // Appends a packet to buffer and stores its reference in
  // packet. Returns false, leaving buffer untouched, if the payload
  // does not fit in a packet.
  bool
  appendPacket(Buffer& buffer, Field field,
               const uint8_t* payload, size_t payloadSize,
               Packet& packet);

  bool
  appendPacket(Buffer& buffer, Field field, const std::string& payload,
               Packet& packet);

  // Parses the packet starting at offset. Throws PacketError if the
  // remaining input cannot hold a packet or the declared length is
  // out of range.
  Packet
  parsePacket(const uint8_t* data, size_t size, size_t offset);

  // Like parsePacket, but also requires the packet to carry the given
  // field tag.
  Packet
  expectPacket(const uint8_t* data, size_t size, size_t offset, Field field);

  Field
  getField(const uint8_t* data, const Packet& packet);

  const uint8_t*
  getPayload(const uint8_t* data, const Packet& packet);

  std::string
  getPayloadString(const Buffer& buffer, const Packet& packet);

  Buffer
  getPayloadBuffer(const Buffer& buffer, const Packet& packet);

} // namespace macaroon

#endif // MACAROON_PACKET_HPP
