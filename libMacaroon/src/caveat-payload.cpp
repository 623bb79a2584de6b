#include "caveat-payload.hpp"

#include <boost/lexical_cast.hpp>

namespace macaroon {

  const size_t PayloadWriter::MAX_FIELD_SIZE;

  static std::string
  fieldName(uint8_t index)
  {
    return boost::lexical_cast<std::string>(static_cast<unsigned>(index));
  }

  PayloadWriter&
  PayloadWriter::writeBool(uint8_t index, bool value)
  {
    uint8_t byte = value ? 1 : 0;
    return writeField(index, &byte, 1);
  }

  PayloadWriter&
  PayloadWriter::writeString(uint8_t index, const std::string& value)
  {
    return writeField(index, reinterpret_cast<const uint8_t*>(value.data()), value.size());
  }

  PayloadWriter&
  PayloadWriter::writeBytes(uint8_t index, const Buffer& value)
  {
    return writeField(index, value.data(), value.size());
  }

  std::string
  PayloadWriter::toString() const
  {
    return std::string(m_buffer.begin(), m_buffer.end());
  }

  PayloadWriter&
  PayloadWriter::writeField(uint8_t index, const uint8_t* value, size_t size)
  {
    if (size > MAX_FIELD_SIZE)
      throw PayloadError("payload field " + fieldName(index) + " too big");

    m_buffer.push_back(index);
    m_buffer.push_back(static_cast<uint8_t>(size));
    m_buffer.insert(m_buffer.end(), value, value + size);
    return *this;
  }


  PayloadReader::PayloadReader(const Buffer& payload)
    : m_payload(payload)
    , m_next(0)
    , m_current(0)
    , m_hasCurrent(false)
  {
  }

  PayloadReader::PayloadReader(const std::string& payload)
    : m_payload(payload.data(), payload.size())
    , m_next(0)
    , m_current(0)
    , m_hasCurrent(false)
  {
  }

  bool
  PayloadReader::next()
  {
    if (m_next >= m_payload.size()) {
      m_hasCurrent = false;
      return false;
    }

    if (m_payload.size() - m_next < 2)
      throw PayloadError("truncated payload field header");

    size_t size = m_payload[m_next + 1];
    if (m_payload.size() - m_next - 2 < size)
      throw PayloadError("payload field " + fieldName(m_payload[m_next]) + " is truncated");

    m_current = m_next;
    m_next += 2 + size;
    m_hasCurrent = true;
    return true;
  }

  uint8_t
  PayloadReader::getFieldIndex() const
  {
    checkCurrent();
    return m_payload[m_current];
  }

  bool
  PayloadReader::readBool() const
  {
    const uint8_t* value = getValue(1);
    if (*value == 1)
      return true;
    if (*value == 0)
      return false;
    throw PayloadError("cannot decode boolean field " + fieldName(m_payload[m_current]));
  }

  std::string
  PayloadReader::readString() const
  {
    checkCurrent();
    const uint8_t* value = m_payload.data() + m_current + 2;
    return std::string(value, value + m_payload[m_current + 1]);
  }

  Buffer
  PayloadReader::readBytes() const
  {
    checkCurrent();
    const uint8_t* value = m_payload.data() + m_current + 2;
    return Buffer(value, value + m_payload[m_current + 1]);
  }

  const uint8_t*
  PayloadReader::getValue(size_t size) const
  {
    checkCurrent();
    if (m_payload[m_current + 1] != size)
      throw PayloadError("payload field " + fieldName(m_payload[m_current]) + " has length " +
                         fieldName(m_payload[m_current + 1]) + ", expected " +
                         boost::lexical_cast<std::string>(size));
    return m_payload.data() + m_current + 2;
  }

  void
  PayloadReader::checkCurrent() const
  {
    if (!m_hasCurrent)
      throw PayloadError("no current payload field");
  }

} // namespace macaroon
