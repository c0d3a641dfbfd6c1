#include <tlv/tlv_syntax.h>

namespace tlv {

uint64_t
Record::uint_value() const
{
  return decode_uint(value);
}

bool
operator==(const Record& lhs, const Record& rhs)
{
  return lhs.type == rhs.type && lhs.value == rhs.value;
}

owned_bytes
encode_uint(uint64_t value, size_t length)
{
  if (length > sizeof(value)) {
    throw WriteError("Integer length too large");
  }

  if (length < sizeof(value) && (value >> (8 * length)) != 0) {
    throw WriteError("Integer does not fit in requested length");
  }

  auto out = owned_bytes(length);
  for (size_t i = 0; i < length; i++) {
    auto shift = 8 * (length - i - 1);
    out.at(i) = static_cast<uint8_t>(value >> shift);
  }
  return out;
}

uint64_t
decode_uint(const owned_bytes& data)
{
  if (data.size() > sizeof(uint64_t)) {
    throw ReadError("Integer value too long");
  }

  uint64_t value = 0;
  for (const auto byte : data) {
    value = (value << unsigned(8)) + byte;
  }
  return value;
}

///
/// ostream
///

ostream&
ostream::write(uint16_t type, const owned_bytes& value)
{
  if (value.size() > max_value_size) {
    throw WriteError("Record value exceeds maximum size");
  }

  write_raw(encode_uint(type, 2));
  write_raw(encode_uint(value.size(), 2));
  write_raw(value);
  return *this;
}

ostream&
ostream::write_uint(uint16_t type, uint64_t value, size_t length)
{
  return write(type, encode_uint(value, length));
}

void
ostream::write_raw(const owned_bytes& content)
{
  _buffer.insert(_buffer.end(), content.begin(), content.end());
}

ostream&
operator<<(ostream& out, const Record& record)
{
  return out.write(record.type, record.value);
}

///
/// istream
///

std::optional<uint16_t>
istream::peek_type() const
{
  if (size() < 2) {
    return std::nullopt;
  }

  return static_cast<uint16_t>((_data.at(_pos) << 8U) | _data.at(_pos + 1));
}

owned_bytes
istream::remaining() const
{
  return owned_bytes(_data.begin() + static_cast<std::ptrdiff_t>(_pos),
                     _data.end());
}

uint64_t
istream::read_uint(size_t length)
{
  if (size() < length) {
    throw ReadError("Attempt to read past end of buffer");
  }

  uint64_t value = 0;
  for (size_t i = 0; i < length; i += 1) {
    value = (value << unsigned(8)) + _data.at(_pos);
    _pos += 1;
  }
  return value;
}

Record
istream::next()
{
  auto record = Record{};
  record.type = static_cast<uint16_t>(read_uint(2));

  const auto length = static_cast<size_t>(read_uint(2));
  if (size() < length) {
    throw ReadError("Record length exceeds available data");
  }

  const auto start = _data.begin() + static_cast<std::ptrdiff_t>(_pos);
  record.value = owned_bytes(start, start + static_cast<std::ptrdiff_t>(length));
  _pos += length;
  return record;
}

istream&
operator>>(istream& in, Record& record)
{
  record = in.next();
  return in;
}

std::vector<Record>
read_all(const owned_bytes& data)
{
  auto r = istream(data);
  auto out = std::vector<Record>{};
  while (!r.empty()) {
    out.push_back(r.next());
  }
  return out;
}

} // namespace tlv
