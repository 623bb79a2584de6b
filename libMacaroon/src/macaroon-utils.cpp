#include "macaroon-utils.hpp"

#include <cryptopp/base64.h>
#include <cryptopp/filters.h>
#include <cryptopp/hex.h>

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include <cctype>
#include <sstream>


namespace macaroon {

  using boost::property_tree::ptree;

  std::string
  encode(const Buffer& bits)
  {
    std::string encoded;
    CryptoPP::StringSource
      (bits.data(), bits.size(), true,
       new CryptoPP::HexEncoder
       (
	new CryptoPP::StringSink(encoded),
	false // lowercase
	) // HexEncoder
       ); // StringSource
    return encoded;
  }

  std::string
  encode(const std::string& bits)
  {
    return encode(Buffer(bits.data(), bits.size()));
  }

  Buffer
  decode(const std::string& hex)
  {
    // HexDecoder skips characters it does not know, so check first.
    if (hex.size() % 2 != 0)
      throw JsonError("odd length hex string");
    for (char c : hex) {
      if (!std::isxdigit(static_cast<unsigned char>(c)))
        throw JsonError("invalid hex character");
    }

    std::string decoded;
    CryptoPP::StringSource
      (hex, true,
       new CryptoPP::HexDecoder
       (
	new CryptoPP::StringSink(decoded)
	) // HexDecoder
       ); // StringSource
    return Buffer(decoded.data(), decoded.size());
  }

  std::string
  encodeBase64(const Buffer& bits)
  {
    std::string encoded;
    CryptoPP::StringSource
      (bits.data(), bits.size(), true,
       new CryptoPP::Base64Encoder
       (
	new CryptoPP::StringSink(encoded),
	false // no line breaks
	) // Base64Encoder
       ); // StringSource
    return encoded;
  }

  Buffer
  decodeBase64(const std::string& text)
  {
    if (text.size() % 4 != 0)
      throw JsonError("illegal base64 data length");
    for (char c : text) {
      if (!std::isalnum(static_cast<unsigned char>(c)) && c != '+' && c != '/' && c != '=')
        throw JsonError("illegal base64 character");
    }

    std::string decoded;
    CryptoPP::StringSource
      (text, true,
       new CryptoPP::Base64Decoder
       (
	new CryptoPP::StringSink(decoded)
	) // Base64Decoder
       ); // StringSource
    return Buffer(decoded.data(), decoded.size());
  }


  namespace {

    bool
    isUtf8(const std::string& text)
    {
      size_t i = 0;
      while (i < text.size()) {
        uint8_t c = static_cast<uint8_t>(text[i]);
        size_t trailing = 0;
        uint32_t codepoint = 0;
        if (c < 0x80) {
          ++i;
          continue;
        }
        else if ((c & 0xe0) == 0xc0) {
          trailing = 1;
          codepoint = c & 0x1f;
        }
        else if ((c & 0xf0) == 0xe0) {
          trailing = 2;
          codepoint = c & 0x0f;
        }
        else if ((c & 0xf8) == 0xf0) {
          trailing = 3;
          codepoint = c & 0x07;
        }
        else {
          return false;
        }

        if (text.size() - i <= trailing)
          return false;
        for (size_t j = 1; j <= trailing; ++j) {
          uint8_t t = static_cast<uint8_t>(text[i + j]);
          if ((t & 0xc0) != 0x80)
            return false;
          codepoint = (codepoint << 6) | (t & 0x3f);
        }

        // overlong forms, surrogates and values past U+10FFFF
        static const uint32_t MIN_CODEPOINT[] = {0, 0x80, 0x800, 0x10000};
        if (codepoint < MIN_CODEPOINT[trailing] || codepoint > 0x10ffff ||
            (codepoint >= 0xd800 && codepoint <= 0xdfff))
          return false;

        i += trailing + 1;
      }
      return true;
    }

    void
    putText(ptree& tree, const std::string& key, const std::string& text, const std::string& name)
    {
      if (!isUtf8(text))
        throw JsonError("cannot marshal json data: " + name + " is not valid UTF-8");
      tree.put(key, text);
    }

    ptree
    toTree(const Macaroon& m, JsonFormat format)
    {
      ptree tree;

      if (format == JsonFormat::COMPACT) {
        tree.put("caveats", encode(m.getRawCaveats()));
      }
      else {
        ptree caveats;
        for (const Caveat& caveat : m.getCaveats()) {
          ptree item;
          putText(item, "cid", caveat.id, "caveat identifier");
          if (!caveat.verificationId.empty())
            item.put("vid", encodeBase64(caveat.verificationId));
          if (!caveat.location.empty())
            putText(item, "cl", caveat.location, "caveat location");
          caveats.push_back(std::make_pair("", item));
        }
        tree.add_child("caveats", caveats);
      }

      putText(tree, "location", m.getLocation(), "location");
      putText(tree, "identifier", m.getIdentifier(), "identifier");
      tree.put("signature", encode(m.getSignature()));
      return tree;
    }

    Buffer
    caveatsFromArray(const ptree& caveats)
    {
      Buffer raw;
      for (const ptree::value_type& item : caveats) {
        if (!item.first.empty())
          throw JsonError("cannot decode macaroon caveats: expected an array");

        std::string cid = item.second.get<std::string>("cid", "");
        Buffer vid = decodeBase64(item.second.get<std::string>("vid", ""));
        std::string cl = item.second.get<std::string>("cl", "");

        Packet packet;
        if (!appendPacket(raw, Field::CAVEAT, cid, packet))
          throw JsonError("caveat identifier too big");
        if (!vid.empty() &&
            !appendPacket(raw, Field::VERIFICATION_ID, vid.data(), vid.size(), packet))
          throw JsonError("caveat verification id too big");
        if (!cl.empty() && !appendPacket(raw, Field::LOCATION, cl, packet))
          throw JsonError("caveat location too big");
      }
      return raw;
    }

    Macaroon
    fromTree(const ptree& tree)
    {
      std::string location = tree.get<std::string>("location", "");
      std::string identifier = tree.get<std::string>("identifier", "");

      Buffer signature;
      try {
        signature = decode(tree.get<std::string>("signature", ""));
      }
      catch (const JsonError& e) {
        throw JsonError(std::string("cannot decode macaroon signature: ") + e.what());
      }

      Buffer rawCaveats;
      boost::optional<const ptree&> caveats = tree.get_child_optional("caveats");
      if (caveats) {
        try {
          if (caveats->empty())
            rawCaveats = decode(caveats->data());
          else
            rawCaveats = caveatsFromArray(*caveats);
        }
        catch (const JsonError& e) {
          throw JsonError(std::string("cannot decode macaroon caveats: ") + e.what());
        }
      }

      try {
        return Macaroon::fromFields(location, identifier, rawCaveats, signature);
      }
      catch (const Macaroon::Error& e) {
        throw JsonError(std::string("cannot decode macaroon: ") + e.what());
      }
    }

    ptree
    parse(const std::string& json)
    {
      ptree tree;
      std::istringstream is(json);
      try {
        boost::property_tree::read_json(is, tree);
      }
      catch (const boost::property_tree::json_parser_error& e) {
        throw JsonError("cannot unmarshal json data: " + e.message());
      }
      return tree;
    }

    std::string
    write(const ptree& tree)
    {
      std::ostringstream os;
      boost::property_tree::write_json(os, tree, false);

      std::string json = os.str();
      if (!json.empty() && json[json.size() - 1] == '\n')
        json.erase(json.size() - 1);
      return json;
    }

  } // namespace


  std::string
  toJson(const Macaroon& m, JsonFormat format)
  {
    return write(toTree(m, format));
  }

  Macaroon
  fromJson(const std::string& json)
  {
    return fromTree(parse(json));
  }

  std::string
  sliceToJson(const Slice& slice, JsonFormat format)
  {
    // property_tree writes an empty tree as "", not as an array
    if (slice.empty())
      return "[]";

    ptree tree;
    for (const Macaroon& m : slice)
      tree.push_back(std::make_pair("", toTree(m, format)));
    return write(tree);
  }

  Slice
  sliceFromJson(const std::string& json)
  {
    ptree tree = parse(json);

    Slice slice;
    for (const ptree::value_type& item : tree) {
      if (!item.first.empty())
        throw JsonError("cannot unmarshal json data: expected an array of macaroons");
      slice.push_back(fromTree(item.second));
    }
    return slice;
  }

}// namespace macaroon
