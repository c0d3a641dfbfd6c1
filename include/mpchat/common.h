#pragma once

#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

using namespace std::literals::string_literals;

// Expose the bytes library globally
#include <bytes/bytes.h>
using namespace bytes_ns;

namespace mpchat {

// Expose bytes operators for code within this namespace
using namespace bytes_ns::operators;

// Members of a channel are identified by opaque strings assigned by the
// transport
using MemberId = std::string;

// Make variant equality work in the same way as optional equality, with
// automatic unwrapping.  In other words
//
//     v == T(x) <=> hold_alternative<T>(v) && get<T>(v) == x
//
// For consistency, we also define symmetric and negated version.
template<typename T, typename... Ts>
bool
operator==(const std::variant<Ts...>& v, const T& t)
{
  return std::visit(
    [&](const auto& arg) {
      using U = std::decay_t<decltype(arg)>;
      if constexpr (std::is_same_v<U, T>) {
        return arg == t;
      } else {
        return false;
      }
    },
    v);
}

template<typename T, typename... Ts>
bool
operator==(const T& t, const std::variant<Ts...>& v)
{
  return v == t;
}

template<typename T, typename... Ts>
bool
operator!=(const std::variant<Ts...>& v, const T& t)
{
  return !(v == t);
}

template<typename T, typename... Ts>
bool
operator!=(const T& t, const std::variant<Ts...>& v)
{
  return !(v == t);
}

///
/// Easy construction of overloaded lambdas
///

template<class... Ts>
struct overloaded : Ts...
{
  using Ts::operator()...;
};

// clang-format off
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;
// clang-format on

///
/// Error types
///

// The `using parent = X` / `using parent::parent` construction here
// imports the constructors of the parent.

class ProtocolError : public std::runtime_error
{
public:
  using parent = std::runtime_error;
  using parent::parent;
};

// A control notice that cannot be applied to the current membership
class ChannelStateError : public ProtocolError
{
public:
  using parent = ProtocolError;
  using parent::parent;
};

class InvalidParameterError : public std::invalid_argument
{
public:
  using parent = std::invalid_argument;
  using parent::parent;
};

enum struct ValidationError
{
  contradictory_intent,
  empty_delta,
  overlapping_delta,
};

const char*
validation_error_name(ValidationError kind);

class ChannelControlError : public InvalidParameterError
{
public:
  ChannelControlError(ValidationError kind, const std::string& what);

  ValidationError kind() const { return _kind; }

private:
  ValidationError _kind;
};

} // namespace mpchat
