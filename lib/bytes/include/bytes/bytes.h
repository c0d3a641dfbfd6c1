#pragma once

#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>

namespace bytes_ns {

using bytes = std::vector<uint8_t>;

bytes
from_ascii(const std::string& ascii);

std::string
to_ascii(const bytes& data);

std::string
to_hex(const bytes& data);

bytes
from_hex(const std::string& hex);

// Standard alphabet with padding, no line breaks
std::string
to_base64(const bytes& data);

bytes
from_base64(const std::string& enc);

// Operators on bytes are defined in a separate namespace because operator
// resolution requires them to be in the caller namespace.
namespace operators {

bytes_ns::bytes&
operator+=(bytes_ns::bytes& lhs, const bytes_ns::bytes& rhs);

bytes_ns::bytes
operator+(const bytes_ns::bytes& lhs, const bytes_ns::bytes& rhs);

std::ostream&
operator<<(std::ostream& out, const bytes_ns::bytes& data);

} // namespace operators

} // namespace bytes_ns
