#include "packet.hpp"

#include <boost/lexical_cast.hpp>

namespace macaroon {

  std::string
  toString(Field field)
  {
    switch (field) {
    case Field::LOCATION:
      return "location";
    case Field::IDENTIFIER:
      return "identifier";
    case Field::SIGNATURE:
      return "signature";
    case Field::CAVEAT:
      return "cav";
    case Field::VERIFICATION_ID:
      return "vid";
    default:
      return "invalid";
    }
  }

  bool
  appendPacket(Buffer& buffer, Field field,
               const uint8_t* payload, size_t payloadSize,
               Packet& packet)
  {
    if (!fitsInPacket(payloadSize))
      return false;

    size_t totalLength = getPacketSize(payloadSize);

    packet.start = static_cast<uint32_t>(buffer.size());
    packet.totalLength = static_cast<uint16_t>(totalLength);

    buffer.reserve(buffer.size() + totalLength);
    buffer.push_back(static_cast<uint8_t>(totalLength & 0xff));
    buffer.push_back(static_cast<uint8_t>(totalLength >> 8));
    buffer.push_back(static_cast<uint8_t>(field));
    buffer.insert(buffer.end(), payload, payload + payloadSize);
    return true;
  }

  bool
  appendPacket(Buffer& buffer, Field field, const std::string& payload,
               Packet& packet)
  {
    return appendPacket(buffer, field,
                        reinterpret_cast<const uint8_t*>(payload.data()), payload.size(),
                        packet);
  }

  Packet
  parsePacket(const uint8_t* data, size_t size, size_t offset)
  {
    if (offset > size || size - offset < MIN_PACKET_SIZE)
      throw PacketError("malformed packet: packet too short");

    size_t totalLength = data[offset] | (static_cast<size_t>(data[offset + 1]) << 8);
    if (totalLength < PACKET_HEADER_SIZE)
      throw PacketError("malformed packet: packet size too small");
    if (totalLength > size - offset)
      throw PacketError("malformed packet: packet size too big");

    Packet packet;
    packet.start = static_cast<uint32_t>(offset);
    packet.totalLength = static_cast<uint16_t>(totalLength);
    return packet;
  }

  Packet
  expectPacket(const uint8_t* data, size_t size, size_t offset, Field field)
  {
    Packet packet = parsePacket(data, size, offset);

    Field actual = getField(data, packet);
    if (actual != field) {
      std::string name = toString(actual);
      if (name == "invalid")
        name += " (" + boost::lexical_cast<std::string>(static_cast<unsigned>(data[offset + 2])) + ")";
      throw PacketError("unexpected field " + name + "; expected " + toString(field));
    }
    return packet;
  }

  Field
  getField(const uint8_t* data, const Packet& packet)
  {
    if (packet.isAbsent())
      return Field::INVALID;

    uint8_t tag = data[packet.start + 2];
    if (tag > static_cast<uint8_t>(Field::VERIFICATION_ID))
      return Field::INVALID;
    return static_cast<Field>(tag);
  }

  const uint8_t*
  getPayload(const uint8_t* data, const Packet& packet)
  {
    return data + packet.start + PACKET_HEADER_SIZE;
  }

  std::string
  getPayloadString(const Buffer& buffer, const Packet& packet)
  {
    if (packet.isAbsent())
      return std::string();

    const uint8_t* payload = getPayload(buffer.data(), packet);
    return std::string(payload, payload + packet.getPayloadSize());
  }

  Buffer
  getPayloadBuffer(const Buffer& buffer, const Packet& packet)
  {
    if (packet.isAbsent())
      return Buffer();

    const uint8_t* payload = getPayload(buffer.data(), packet);
    return Buffer(payload, payload + packet.getPayloadSize());
  }

} // namespace macaroon
