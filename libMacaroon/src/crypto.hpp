#ifndef MACAROON_CRYPTO_HPP
#define MACAROON_CRYPTO_HPP

#include "packet.hpp"

#include <cryptopp/hmac.h>
#include <cryptopp/sha.h>

namespace macaroon {

  // Length of every signature and derived key (HMAC-SHA-256 output).
  const size_t SIGNATURE_SIZE = CryptoPP::SHA256::DIGESTSIZE;

  // Secretbox parameters (XSalsa20-Poly1305).
  const size_t NONCE_SIZE = 24;
  const size_t AUTHENTICATOR_SIZE = 16;

  // Context under which a third-party caveat encryption key is
  // derived from the signature at the point of the caveat.
  extern const std::string KEY_GENERATOR;

  class CryptoError : public std::runtime_error
  {
  public:
    explicit
    CryptoError(const std::string& what)
      : std::runtime_error(what)
    {
    }
  };

  Buffer
  keyedHash(const Buffer& key, const uint8_t* message, size_t messageSize);

  Buffer
  keyedHash(const Buffer& key, const std::string& message);

  /*
    Incremental HMAC-SHA-256: several writes chained under one key.
  */
  class KeyedHasher
  {
  public:
    explicit
    KeyedHasher(const Buffer& key);

    KeyedHasher&
    update(const uint8_t* data, size_t size);

    KeyedHasher&
    update(const Buffer& data);

    KeyedHasher&
    update(const std::string& data);

    Buffer
    finalize();

  private:
    CryptoPP::HMAC<CryptoPP::SHA256> m_hmac;
  };

  // Binds a discharge signature to the signature of the macaroon it
  // discharges. Equal signatures are returned unchanged.
  Buffer
  bindForRequest(const Buffer& rootSignature, const Buffer& dischargeSignature);

  // Derives the key protecting a third-party caveat's discharge root
  // key from the signature preceding that caveat.
  Buffer
  deriveCaveatKey(const Buffer& signature);

  // Returns nonce || secretbox(key, nonce, plaintext). The nonce must
  // never be reused with the same key.
  Buffer
  encrypt(const Buffer& key, const Buffer& nonce, const Buffer& plaintext);

  // Inverse of encrypt. Throws CryptoError if the input is too short
  // or fails authentication.
  Buffer
  decrypt(const Buffer& key, const Buffer& ciphertext);

  // Size of encrypt()'s output for a plaintext of the given size.
  inline size_t
  getEncryptedSize(size_t plaintextSize)
  {
    return NONCE_SIZE + AUTHENTICATOR_SIZE + plaintextSize;
  }

  bool
  constantTimeEquals(const Buffer& a, const Buffer& b);

} // namespace macaroon

#endif // MACAROON_CRYPTO_HPP
