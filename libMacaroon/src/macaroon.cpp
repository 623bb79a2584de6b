#include "macaroon.hpp"
#include "crypto.hpp"
#include "macaroon-utils.hpp"
#include "verifier.hpp"

#include <ndn-cxx/util/logger.hpp>

#include <cryptopp/osrng.h>

#include <memory>
#include <sstream>
#include <utility>

namespace macaroon {

  NDN_LOG_INIT(macaroon.Macaroon);

  /*
    Macaroon
  */

  Macaroon::Macaroon()
  {
  }

  Macaroon::Macaroon(const Buffer& wire)
  {
    size_t consumed = 0;
    try {
      consumed = decode(wire.data(), wire.size());
    }
    catch (const PacketError& e) {
      throw Error(e.what());
    }

    if (consumed != wire.size())
      throw Error("unexpected trailing data after macaroon");
  }

  Macaroon::Macaroon(const uint8_t* wire, size_t size)
  {
    size_t consumed = 0;
    try {
      consumed = decode(wire, size);
    }
    catch (const PacketError& e) {
      throw Error(e.what());
    }

    if (consumed != size)
      throw Error("unexpected trailing data after macaroon");
  }

  Macaroon::Macaroon(const Buffer& rootKey,
                     const std::string& id,
                     const std::string& location)
  {
    if (!fitsInPacket(id.size()))
      throw Error("macaroon identifier too big");
    if (!appendPacket(m_buffer, Field::LOCATION, location, m_location))
      throw Error("macaroon location too big");
    if (!appendPacket(m_buffer, Field::IDENTIFIER, id, m_identifier))
      throw Error("macaroon identifier too big");

    m_signature = keyedHash(rootKey, id);
  }

  Macaroon
  Macaroon::fromFields(const std::string& location,
                       const std::string& id,
                       const Buffer& rawCaveats,
                       const Buffer& signature)
  {
    Buffer wire;
    Packet packet;
    if (!appendPacket(wire, Field::LOCATION, location, packet))
      throw Error("macaroon location too big");
    if (!appendPacket(wire, Field::IDENTIFIER, id, packet))
      throw Error("macaroon identifier too big");
    wire.insert(wire.end(), rawCaveats.begin(), rawCaveats.end());
    if (!appendPacket(wire, Field::SIGNATURE, signature.data(), signature.size(), packet))
      throw Error("macaroon signature too big");

    return Macaroon(wire);
  }

  Macaroon
  Macaroon::clone() const
  {
    Macaroon copy(*this);
    // Drop any spare capacity so the copy grows into fresh storage.
    copy.m_buffer.shrink_to_fit();
    return copy;
  }

  std::string
  Macaroon::getLocation() const
  {
    return getPayloadString(m_buffer, m_location);
  }

  std::string
  Macaroon::getIdentifier() const
  {
    return getPayloadString(m_buffer, m_identifier);
  }

  std::vector<Caveat>
  Macaroon::getCaveats() const
  {
    std::vector<Caveat> caveats;
    caveats.reserve(m_caveats.size());

    for (const CaveatPackets& packets : m_caveats) {
      Caveat caveat;
      caveat.id = getPayloadString(m_buffer, packets.id);
      caveat.verificationId = getPayloadBuffer(m_buffer, packets.verificationId);
      caveat.location = getPayloadString(m_buffer, packets.location);
      caveats.push_back(caveat);
    }
    return caveats;
  }

  Buffer
  Macaroon::getRawCaveats() const
  {
    size_t start = m_identifier.start + m_identifier.totalLength;
    return Buffer(m_buffer.begin() + start, m_buffer.end());
  }

  unsigned
  Macaroon::getNumThirdPartyCaveats() const
  {
    unsigned n = 0;
    for (const CaveatPackets& packets : m_caveats) {
      if (packets.verificationId.getPayloadSize() > 0)
        ++n;
    }
    return n;
  }

  // n = 1 ..
  void
  Macaroon::getThirdPartyCaveat(unsigned n, std::string& thirdPartyLocation,
                                std::string& thirdPartyId) const
  {
    unsigned seen = 0;
    for (const CaveatPackets& packets : m_caveats) {
      if (packets.verificationId.getPayloadSize() == 0)
        continue;
      if (++seen == n) {
        thirdPartyLocation = getPayloadString(m_buffer, packets.location);
        thirdPartyId = getPayloadString(m_buffer, packets.id);
        return;
      }
    }
    throw Error("Macaroon::getThirdPartyCaveat: inexistent third party caveat");
  }

  void
  Macaroon::appendCaveat(const std::string& caveatId,
                         const Buffer& verificationId,
                         const std::string& location)
  {
    // All size checks come first so a failure leaves the buffer as it was.
    if (!fitsInPacket(caveatId.size()))
      throw Error("caveat identifier too big");
    if (!fitsInPacket(verificationId.size()))
      throw Error("caveat verification id too big");
    if (!fitsInPacket(location.size()))
      throw Error("caveat location too big");

    CaveatPackets caveat;
    bool ok = appendPacket(m_buffer, Field::CAVEAT, caveatId, caveat.id);
    if (ok && !verificationId.empty())
      ok = appendPacket(m_buffer, Field::VERIFICATION_ID,
                        verificationId.data(), verificationId.size(),
                        caveat.verificationId);
    if (ok && !location.empty())
      ok = appendPacket(m_buffer, Field::LOCATION, location, caveat.location);
    if (!ok)
      throw Error("caveat too big");

    m_caveats.push_back(caveat);
  }

  void
  Macaroon::addFirstPartyCaveat(const std::string& condition)
  {
    appendCaveat(condition, Buffer(), std::string());
    m_signature = keyedHash(m_signature, condition);

    NDN_LOG_TRACE("first party caveat added to " << getIdentifier()
                  << ", " << m_caveats.size() << " caveats");
  }

  void
  Macaroon::addThirdPartyCaveat(const Buffer& dischargeRootKey,
                                const std::string& caveatId,
                                const std::string& location)
  {
    std::unique_ptr<CryptoPP::AutoSeededRandomPool> rng;
    try {
      rng.reset(new CryptoPP::AutoSeededRandomPool);
    }
    catch (const CryptoPP::Exception& e) {
      throw Error("cannot generate random bytes: " + e.GetWhat());
    }

    addThirdPartyCaveat(dischargeRootKey, caveatId, location, *rng);
  }

  void
  Macaroon::addThirdPartyCaveat(const Buffer& dischargeRootKey,
                                const std::string& caveatId,
                                const std::string& location,
                                CryptoPP::RandomNumberGenerator& rng)
  {
    Buffer nonce(NONCE_SIZE);
    try {
      rng.GenerateBlock(nonce.data(), nonce.size());
    }
    catch (const std::exception& e) {
      throw Error(std::string("cannot generate random bytes: ") + e.what());
    }

    Buffer verificationId = encrypt(deriveCaveatKey(m_signature), nonce, dischargeRootKey);

    appendCaveat(caveatId, verificationId, location);
    m_signature = KeyedHasher(m_signature)
      .update(verificationId)
      .update(caveatId)
      .finalize();

    NDN_LOG_TRACE("third party caveat " << caveatId << " for " << location
                  << " added to " << getIdentifier());
  }

  void
  Macaroon::bind(const Buffer& rootSignature)
  {
    m_signature = bindForRequest(rootSignature, m_signature);
  }

  Macaroon
  Macaroon::prepareForRequest(const Macaroon& discharge) const
  {
    Macaroon bound = discharge.clone();
    bound.bind(m_signature);
    return bound;
  }

  void
  Macaroon::verify(const Buffer& rootKey,
                   const ConditionChecker& check,
                   const Slice& discharges) const
  {
    macaroon::verify(*this, rootKey, check, discharges);
  }

  void
  Macaroon::verify(const Buffer& rootKey) const
  {
    // A Verifier with nothing to satisfy rejects every condition.
    macaroon::verify(*this, rootKey, Verifier(), Slice());
  }

  size_t
  Macaroon::getSerializedSize() const
  {
    return m_buffer.size() + getPacketSize(m_signature.size());
  }

  Buffer
  Macaroon::serialize() const
  {
    Buffer wire;
    wire.reserve(getSerializedSize());
    serializeTo(wire);
    return wire;
  }

  void
  Macaroon::serializeTo(Buffer& wire) const
  {
    wire.insert(wire.end(), m_buffer.begin(), m_buffer.end());

    Packet packet;
    if (!appendPacket(wire, Field::SIGNATURE, m_signature.data(), m_signature.size(), packet))
      throw Error("failed to append signature to macaroon, packet is too long");
  }

  std::string
  Macaroon::inspect() const
  {
    std::ostringstream os;
    os << "location " << getLocation() << "\n"
       << "identifier " << getIdentifier() << "\n";

    for (const Caveat& caveat : getCaveats()) {
      os << "cid " << caveat.id << "\n";
      if (caveat.isThirdParty()) {
        os << "vid " << encode(caveat.verificationId) << "\n";
        os << "cl " << caveat.location << "\n";
      }
    }

    os << "signature " << encode(m_signature) << "\n";
    return os.str();
  }

  // The binary format of a macaroon is a sequence of packets:
  //
  // location
  // identifier
  // (
  //   caveatId
  //   verificationId?
  //   caveatLocation?
  // )*
  // signature
  size_t
  Macaroon::decode(const uint8_t* data, size_t size)
  {
    size_t offset = 0;

    m_location = expectPacket(data, size, offset, Field::LOCATION);
    offset += m_location.totalLength;

    m_identifier = expectPacket(data, size, offset, Field::IDENTIFIER);
    offset += m_identifier.totalLength;

    m_caveats.clear();
    while (true) {
      Packet packet = parsePacket(data, size, offset);
      Field field = getField(data, packet);

      if (field == Field::SIGNATURE) {
        if (packet.getPayloadSize() != SIGNATURE_SIZE)
          throw PacketError("malformed packet: signature has wrong length");

        m_buffer = Buffer(data, data + offset);
        m_signature = Buffer(getPayload(data, packet), getPayload(data, packet) + SIGNATURE_SIZE);
        return offset + packet.totalLength;
      }

      if (field != Field::CAVEAT)
        throw PacketError("unexpected field " + toString(field) + "; expected " +
                          toString(Field::CAVEAT) + " or " + toString(Field::SIGNATURE));

      CaveatPackets caveat;
      caveat.id = packet;
      offset += packet.totalLength;

      packet = parsePacket(data, size, offset);
      if (getField(data, packet) == Field::VERIFICATION_ID) {
        caveat.verificationId = packet;
        offset += packet.totalLength;
        packet = parsePacket(data, size, offset);
      }
      if (getField(data, packet) == Field::LOCATION) {
        caveat.location = packet;
        offset += packet.totalLength;
      }

      m_caveats.push_back(caveat);
    }
  }


  Buffer
  serializeSlice(const Slice& slice)
  {
    size_t size = 0;
    for (const Macaroon& m : slice)
      size += m.getSerializedSize();

    Buffer wire;
    wire.reserve(size);
    for (const Macaroon& m : slice)
      m.serializeTo(wire);
    return wire;
  }

  Slice
  deserializeSlice(const uint8_t* wire, size_t size)
  {
    Slice slice;
    size_t offset = 0;
    while (offset < size) {
      // Every macaroon copies its own bytes out of wire, so appending
      // to one of them never touches its neighbours.
      Macaroon m;
      try {
        offset += m.decode(wire + offset, size - offset);
      }
      catch (const PacketError& e) {
        throw Macaroon::Error(std::string("cannot unmarshal macaroon: ") + e.what());
      }
      slice.push_back(std::move(m));
    }
    return slice;
  }

  Slice
  deserializeSlice(const Buffer& wire)
  {
    return deserializeSlice(wire.data(), wire.size());
  }

}// namespace macaroon
