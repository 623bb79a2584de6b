#ifndef MACAROON_MACAROON_HPP
#define MACAROON_MACAROON_HPP

#include "packet.hpp"

#include <boost/function.hpp>

#include <cryptopp/cryptlib.h>

#include <string>
#include <vector>


namespace macaroon {

  class Macaroon;

  // By convention the first macaroon of a slice is the primary one
  // and the rest are discharges for its third party caveats.
  typedef std::vector<Macaroon> Slice;

  // Called with the condition of every first party caveat met during
  // verification. Rejects a condition by throwing; whatever it throws
  // reaches the caller of verify unchanged.
  typedef boost::function<void(const std::string& condition)> ConditionChecker;

  struct Caveat
  {
    std::string id;
    // Empty for first party caveats.
    Buffer verificationId;
    std::string location;

    bool
    isThirdParty() const
    {
      return !verificationId.empty();
    }
  };


  class Macaroon {
  public:
    class Error : public std::runtime_error
    {
    public:
      explicit
      Error(const std::string& what)
	: std::runtime_error(what)
      {
      }
    };

    // Decodes one macaroon in binary form. Trailing bytes are an error.
    explicit
    Macaroon(const Buffer& wire);

    Macaroon(const uint8_t* wire, size_t size);

    Macaroon(const Buffer& rootKey,
             const std::string& id,
             const std::string& location);

    // Rebuilds a macaroon from its parts; rawCaveats holds the caveat
    // packets exactly as returned by getRawCaveats().
    static Macaroon
    fromFields(const std::string& location,
               const std::string& id,
               const Buffer& rawCaveats,
               const Buffer& signature);

    // Independent copy: appending to the copy never affects this one.
    Macaroon
    clone() const;

    std::string
    getLocation() const;

    std::string
    getIdentifier() const;

    const Buffer&
    getSignature() const
    {
      return m_signature;
    }

    size_t
    getNumCaveats() const
    {
      return m_caveats.size();
    }

    std::vector<Caveat>
    getCaveats() const;

    // Caveat packets in wire form, as they follow the identifier.
    Buffer
    getRawCaveats() const;

    unsigned
    getNumThirdPartyCaveats() const;

    // returns the nth third-party location and id. n = 1..
    void
    getThirdPartyCaveat(unsigned n, std::string& thirdPartyLocation,
                        std::string& thirdPartyId) const;

    void
    addFirstPartyCaveat(const std::string& condition);

    // The discharge root key is encrypted under a key derived from the
    // current signature and stored as the caveat's verification id;
    // the third party mints the discharge macaroon with the same root
    // key and caveatId as its identifier.
    void
    addThirdPartyCaveat(const Buffer& dischargeRootKey,
                        const std::string& caveatId,
                        const std::string& location);

    // Same, drawing the nonce from rng.
    void
    addThirdPartyCaveat(const Buffer& dischargeRootKey,
                        const std::string& caveatId,
                        const std::string& location,
                        CryptoPP::RandomNumberGenerator& rng);

    // Binds this (discharge) macaroon to the signature of the primary
    // macaroon it will be presented with. Bind exactly once.
    void
    bind(const Buffer& rootSignature);

    // Returns a copy of discharge bound to this macaroon.
    Macaroon
    prepareForRequest(const Macaroon& discharge) const;

    // Throws VerificationError on any signature or discharge failure;
    // exceptions from check propagate as they are.
    void
    verify(const Buffer& rootKey,
           const ConditionChecker& check,
           const Slice& discharges) const;

    // Verifies a macaroon that carries no caveats needing a check or a
    // discharge: every first party caveat is rejected.
    void
    verify(const Buffer& rootKey) const;

    // Serialize macaroon
    Buffer
    serialize() const;

    // Appends the binary form to wire.
    void
    serializeTo(Buffer& wire) const;

    size_t
    getSerializedSize() const;

    // Human readable dump, one field per line
    std::string
    inspect() const;

  private:
    Macaroon();

    // Decodes a macaroon from the start of data and returns the number
    // of bytes it occupied.
    size_t
    decode(const uint8_t* data, size_t size);

    void
    appendCaveat(const std::string& caveatId,
                 const Buffer& verificationId,
                 const std::string& location);

    friend Slice
    deserializeSlice(const uint8_t* wire, size_t size);

  private:
    struct CaveatPackets
    {
      Packet id;
      Packet verificationId;
      Packet location;
    };

    // location, identifier and caveat packets, in append order
    Buffer m_buffer;
    Packet m_location;
    Packet m_identifier;
    std::vector<CaveatPackets> m_caveats;
    Buffer m_signature;
  };


  Buffer
  serializeSlice(const Slice& slice);

  Slice
  deserializeSlice(const uint8_t* wire, size_t size);

  Slice
  deserializeSlice(const Buffer& wire);

}// namespace macaroon

#endif // MACAROON_MACAROON_HPP
