#include <bytes/bytes.h>

#include <iomanip>
#include <openssl/evp.h>
#include <sstream>
#include <stdexcept>

namespace bytes_ns {

bytes
from_ascii(const std::string& ascii)
{
  return bytes(ascii.begin(), ascii.end());
}

std::string
to_ascii(const bytes& data)
{
  return std::string(data.begin(), data.end());
}

std::string
to_hex(const bytes& data)
{
  std::stringstream hex(std::ios_base::out);
  hex.flags(std::ios::hex);
  for (const auto& byte : data) {
    hex << std::setw(2) << std::setfill('0') << int(byte);
  }
  return hex.str();
}

static uint8_t
hex_digit(char c)
{
  if (c >= '0' && c <= '9') {
    return static_cast<uint8_t>(c - '0');
  }

  if (c >= 'a' && c <= 'f') {
    return static_cast<uint8_t>(c - 'a' + 10);
  }

  if (c >= 'A' && c <= 'F') {
    return static_cast<uint8_t>(c - 'A' + 10);
  }

  throw std::invalid_argument("Invalid hex character");
}

bytes
from_hex(const std::string& hex)
{
  if (hex.length() % 2 == 1) {
    throw std::invalid_argument("Odd-length hex string");
  }

  auto len = hex.length() / 2;
  auto out = bytes(len);
  for (size_t i = 0; i < len; i += 1) {
    const auto hi = hex_digit(hex.at(2 * i));
    const auto lo = hex_digit(hex.at(2 * i + 1));
    out.at(i) = static_cast<uint8_t>((hi << 4U) | lo);
  }

  return out;
}

std::string
to_base64(const bytes& data)
{
  if (data.empty()) {
    return "";
  }

  // EVP_EncodeBlock writes a trailing NUL after the encoded text
  auto out = bytes(4 * ((data.size() + 2) / 3) + 1);
  const auto len =
    EVP_EncodeBlock(out.data(), data.data(), static_cast<int>(data.size()));
  if (len < 0) {
    throw std::runtime_error("Base64 encode failed");
  }

  return std::string(out.begin(), out.begin() + len);
}

bytes
from_base64(const std::string& enc)
{
  if (enc.empty()) {
    return {};
  }

  if (enc.length() % 4 != 0) {
    throw std::invalid_argument("Base64 length is not divisible by 4");
  }

  auto padding = size_t(0);
  if (enc.back() == '=') {
    padding = (enc.at(enc.length() - 2) == '=') ? 2 : 1;
  }

  const auto input = from_ascii(enc);
  auto out = bytes(input.size() / 4 * 3);
  const auto len =
    EVP_DecodeBlock(out.data(), input.data(), static_cast<int>(input.size()));
  if (len < 0 || static_cast<size_t>(len) != out.size()) {
    throw std::invalid_argument("Malformed base64");
  }

  // EVP_DecodeBlock emits a zero byte for each padding character
  out.resize(out.size() - padding);
  return out;
}

namespace operators {

bytes&
operator+=(bytes& lhs, const bytes& rhs)
{
  // Not sure what the default argument is here
  // NOLINTNEXTLINE(fuchsia-default-arguments)
  lhs.insert(lhs.end(), rhs.begin(), rhs.end());
  return lhs;
}

bytes
operator+(const bytes& lhs, const bytes& rhs)
{
  bytes out = lhs;
  out += rhs;
  return out;
}

std::ostream&
operator<<(std::ostream& out, const bytes& data)
{
  // Adjust this threshold to make output more compact
  const size_t threshold = 0xffff;
  if (data.size() < threshold) {
    return out << to_hex(data);
  }

  const auto head = bytes(data.begin(), data.begin() + threshold);
  return out << to_hex(head) << "...";
}

} // namespace operators

} // namespace bytes_ns
