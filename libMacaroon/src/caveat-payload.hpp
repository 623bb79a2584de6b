#ifndef MACAROON_CAVEAT_PAYLOAD_HPP
#define MACAROON_CAVEAT_PAYLOAD_HPP

#include "packet.hpp"

#include <type_traits>

namespace macaroon {

  class PayloadError : public std::runtime_error
  {
  public:
    explicit
    PayloadError(const std::string& what)
      : std::runtime_error(what)
    {
    }
  };

  /*
    Structured data carried in a caveat identifier, as a sequence of
    [field index][length][value bytes] tuples. Integers are written
    little-endian with their exact width; callers declare each field's
    index and type at both ends.
  */
  class PayloadWriter
  {
  public:
    // Largest value a single field can hold.
    static const size_t MAX_FIELD_SIZE = 0xff;

    template<typename Integer>
    PayloadWriter&
    writeInteger(uint8_t index, Integer value)
    {
      static_assert(std::is_integral<Integer>::value && !std::is_same<Integer, bool>::value,
                    "writeInteger needs a fixed width integer");
      uint8_t bytes[sizeof(Integer)];
      typedef typename std::make_unsigned<Integer>::type Unsigned;
      Unsigned bits = static_cast<Unsigned>(value);
      for (size_t i = 0; i < sizeof(Integer); ++i) {
        bytes[i] = static_cast<uint8_t>(bits & 0xff);
        bits = static_cast<Unsigned>(bits >> 8);
      }
      return writeField(index, bytes, sizeof(bytes));
    }

    PayloadWriter&
    writeBool(uint8_t index, bool value);

    PayloadWriter&
    writeString(uint8_t index, const std::string& value);

    PayloadWriter&
    writeBytes(uint8_t index, const Buffer& value);

    const Buffer&
    getBuffer() const
    {
      return m_buffer;
    }

    // The payload as a caveat condition.
    std::string
    toString() const;

  private:
    PayloadWriter&
    writeField(uint8_t index, const uint8_t* value, size_t size);

  private:
    Buffer m_buffer;
  };


  class PayloadReader
  {
  public:
    explicit
    PayloadReader(const Buffer& payload);

    explicit
    PayloadReader(const std::string& payload);

    // Moves to the next field. Returns false at the end of the payload
    // and throws PayloadError on a truncated field.
    bool
    next();

    uint8_t
    getFieldIndex() const;

    template<typename Integer>
    Integer
    readInteger() const
    {
      static_assert(std::is_integral<Integer>::value && !std::is_same<Integer, bool>::value,
                    "readInteger needs a fixed width integer");
      const uint8_t* value = getValue(sizeof(Integer));
      typedef typename std::make_unsigned<Integer>::type Unsigned;
      Unsigned bits = 0;
      for (size_t i = sizeof(Integer); i > 0; --i)
        bits = static_cast<Unsigned>((bits << 8) | value[i - 1]);
      return static_cast<Integer>(bits);
    }

    bool
    readBool() const;

    std::string
    readString() const;

    Buffer
    readBytes() const;

  private:
    // Value of the current field, which must be size bytes long.
    const uint8_t*
    getValue(size_t size) const;

    void
    checkCurrent() const;

  private:
    Buffer m_payload;
    size_t m_next;
    size_t m_current;
    bool m_hasCurrent;
  };

} // namespace macaroon

#endif // MACAROON_CAVEAT_PAYLOAD_HPP
