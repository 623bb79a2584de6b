#include "crypto.hpp"

#include <cryptopp/misc.h>
#include <cryptopp/naclite.h>

#include <algorithm>

namespace macaroon {

  using CryptoPP::NaCl::crypto_secretbox;
  using CryptoPP::NaCl::crypto_secretbox_open;
  using CryptoPP::NaCl::crypto_secretbox_KEYBYTES;
  using CryptoPP::NaCl::crypto_secretbox_NONCEBYTES;
  using CryptoPP::NaCl::crypto_secretbox_ZEROBYTES;
  using CryptoPP::NaCl::crypto_secretbox_BOXZEROBYTES;

  static_assert(crypto_secretbox_NONCEBYTES == NONCE_SIZE, "unexpected secretbox nonce size");
  static_assert(crypto_secretbox_ZEROBYTES - crypto_secretbox_BOXZEROBYTES == AUTHENTICATOR_SIZE,
                "unexpected secretbox authenticator size");
  static_assert(crypto_secretbox_KEYBYTES == SIGNATURE_SIZE, "unexpected secretbox key size");

  const std::string KEY_GENERATOR = "macaroons-key-generator";

  Buffer
  keyedHash(const Buffer& key, const uint8_t* message, size_t messageSize)
  {
    return KeyedHasher(key).update(message, messageSize).finalize();
  }

  Buffer
  keyedHash(const Buffer& key, const std::string& message)
  {
    return KeyedHasher(key).update(message).finalize();
  }

  static const uint8_t EMPTY_KEY[1] = {0};

  KeyedHasher::KeyedHasher(const Buffer& key)
    : m_hmac(key.empty() ? EMPTY_KEY : key.data(), key.size())
  {
  }

  KeyedHasher&
  KeyedHasher::update(const uint8_t* data, size_t size)
  {
    if (size > 0)
      m_hmac.Update(data, size);
    return *this;
  }

  KeyedHasher&
  KeyedHasher::update(const Buffer& data)
  {
    return update(data.data(), data.size());
  }

  KeyedHasher&
  KeyedHasher::update(const std::string& data)
  {
    return update(reinterpret_cast<const uint8_t*>(data.data()), data.size());
  }

  Buffer
  KeyedHasher::finalize()
  {
    Buffer digest(m_hmac.DigestSize());
    m_hmac.Final(digest.data());
    return digest;
  }

  Buffer
  bindForRequest(const Buffer& rootSignature, const Buffer& dischargeSignature)
  {
    if (rootSignature == dischargeSignature)
      return rootSignature;

    CryptoPP::SHA256 hash;
    hash.Update(rootSignature.data(), rootSignature.size());
    hash.Update(dischargeSignature.data(), dischargeSignature.size());

    Buffer bound(CryptoPP::SHA256::DIGESTSIZE);
    hash.Final(bound.data());
    return bound;
  }

  Buffer
  deriveCaveatKey(const Buffer& signature)
  {
    return keyedHash(signature, KEY_GENERATOR);
  }

  Buffer
  encrypt(const Buffer& key, const Buffer& nonce, const Buffer& plaintext)
  {
    if (key.size() != crypto_secretbox_KEYBYTES)
      throw CryptoError("invalid encryption key size");
    if (nonce.size() != crypto_secretbox_NONCEBYTES)
      throw CryptoError("invalid nonce size");

    // NaCl wants ZEROBYTES of zero padding in front of the message and
    // leaves BOXZEROBYTES of zeros in front of the box.
    Buffer padded(crypto_secretbox_ZEROBYTES + plaintext.size());
    std::copy(plaintext.begin(), plaintext.end(), padded.begin() + crypto_secretbox_ZEROBYTES);

    Buffer box(padded.size());
    if (crypto_secretbox(box.data(), padded.data(), padded.size(), nonce.data(), key.data()) != 0)
      throw CryptoError("cannot encrypt");

    Buffer result;
    result.reserve(getEncryptedSize(plaintext.size()));
    result.insert(result.end(), nonce.begin(), nonce.end());
    result.insert(result.end(), box.begin() + crypto_secretbox_BOXZEROBYTES, box.end());
    return result;
  }

  Buffer
  decrypt(const Buffer& key, const Buffer& ciphertext)
  {
    if (key.size() != crypto_secretbox_KEYBYTES)
      throw CryptoError("invalid decryption key size");
    if (ciphertext.size() < NONCE_SIZE + AUTHENTICATOR_SIZE)
      throw CryptoError("ciphertext too short");

    const uint8_t* nonce = ciphertext.data();

    Buffer box(crypto_secretbox_BOXZEROBYTES + ciphertext.size() - NONCE_SIZE);
    std::copy(ciphertext.begin() + NONCE_SIZE, ciphertext.end(),
              box.begin() + crypto_secretbox_BOXZEROBYTES);

    Buffer padded(box.size());
    if (crypto_secretbox_open(padded.data(), box.data(), box.size(), nonce, key.data()) != 0)
      throw CryptoError("decryption failed");

    return Buffer(padded.begin() + crypto_secretbox_ZEROBYTES, padded.end());
  }

  bool
  constantTimeEquals(const Buffer& a, const Buffer& b)
  {
    if (a.size() != b.size())
      return false;
    return CryptoPP::VerifyBufsEqual(a.data(), b.data(), a.size());
  }

} // namespace macaroon
