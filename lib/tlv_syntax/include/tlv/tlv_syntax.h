#pragma once

#include <cstdint>
#include <limits>
#include <optional>
#include <stdexcept>
#include <vector>

namespace tlv {

using owned_bytes = std::vector<uint8_t>;

// Largest value that fits in the 16-bit length field
const size_t max_value_size = std::numeric_limits<uint16_t>::max();

class WriteError : public std::invalid_argument
{
public:
  using parent = std::invalid_argument;
  using parent::parent;
};

class ReadError : public std::invalid_argument
{
public:
  using parent = std::invalid_argument;
  using parent::parent;
};

///
/// A single type-length-value record
///
///   struct {
///     uint16 type;
///     opaque value<0..2^16-1>;
///   } Record;
///
struct Record
{
  uint16_t type = 0;
  owned_bytes value;

  // Interpret the value as a big-endian unsigned integer
  uint64_t uint_value() const;
};

bool
operator==(const Record& lhs, const Record& rhs);

///
/// Integer helpers
///

owned_bytes
encode_uint(uint64_t value, size_t length);

uint64_t
decode_uint(const owned_bytes& data);

///
/// ostream
///

class ostream
{
public:
  ostream() = default;

  ostream& write(uint16_t type, const owned_bytes& value);
  ostream& write_uint(uint16_t type, uint64_t value, size_t length);
  void write_raw(const owned_bytes& content);

  const owned_bytes& bytes() const { return _buffer; }
  size_t size() const { return _buffer.size(); }

private:
  owned_bytes _buffer;
};

ostream&
operator<<(ostream& out, const Record& record);

///
/// istream
///

class istream
{
public:
  istream(owned_bytes data)
    : _data(std::move(data))
  {
  }

  size_t size() const { return _data.size() - _pos; }
  bool empty() const { return _pos == _data.size(); }

  // The type of the next record, without consuming it
  std::optional<uint16_t> peek_type() const;

  // Everything not yet read
  owned_bytes remaining() const;

  Record next();

private:
  owned_bytes _data;
  size_t _pos = 0;

  uint64_t read_uint(size_t length);
};

istream&
operator>>(istream& in, Record& record);

// Read every record in a buffer; fails on trailing bytes
std::vector<Record>
read_all(const owned_bytes& data);

} // namespace tlv
