#ifndef MACAROON_MACAROON_UTILS_HPP
#define MACAROON_MACAROON_UTILS_HPP

#include "macaroon.hpp"

namespace macaroon {

  class JsonError : public std::runtime_error
  {
  public:
    explicit
    JsonError(const std::string& what)
      : std::runtime_error(what)
    {
    }
  };

  // Lowercase hex
  std::string encode(const Buffer& bits);
  std::string encode(const std::string& bits);

  // Accepts either case; throws JsonError on anything else.
  Buffer decode(const std::string& hex);

  std::string encodeBase64(const Buffer& bits);
  Buffer decodeBase64(const std::string& text);

  enum class JsonFormat {
    // "caveats" holds the hex encoded caveat packets
    COMPACT,
    // "caveats" is an array of {"cid", "vid" (base64), "cl"} objects
    PER_CAVEAT
  };

  // Identifiers and locations are written as JSON strings, so they must be
  // valid UTF-8; JsonError otherwise.
  std::string
  toJson(const Macaroon& m, JsonFormat format = JsonFormat::COMPACT);

  // Reads either format.
  Macaroon
  fromJson(const std::string& json);

  std::string
  sliceToJson(const Slice& slice, JsonFormat format = JsonFormat::COMPACT);

  Slice
  sliceFromJson(const std::string& json);

}// namespace macaroon

#endif // MACAROON_MACAROON_UTILS_HPP
