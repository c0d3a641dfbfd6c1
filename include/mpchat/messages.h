#pragma once

#include <mpchat/common.h>

#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace mpchat {

///
/// Classification of greet messages
///

enum struct Agreement : uint8_t
{
  initial,
  auxiliary,
};

enum struct Flow : uint8_t
{
  upflow,
  downflow,
};

enum struct GreetOperation : uint8_t
{
  start = 1,
  include = 2,
  exclude = 3,
  refresh = 4,
  quit = 5,
};

// Bit layout of a greet type
struct GreetTypeBits
{
  static constexpr uint16_t auxiliary = 0x0001;
  static constexpr uint16_t downflow = 0x0002;
  static constexpr uint16_t gka = 0x0004;
  static constexpr uint16_t ske = 0x0008;
  static constexpr uint16_t operation_mask = 0x0070;
  static constexpr uint16_t operation_shift = 4;
  static constexpr uint16_t initiator = 0x0080;
  static constexpr uint16_t recover = 0x0100;
};

// The greet types used by the key agreement flows.  Any of them may be
// combined with GreetTypeBits::recover.
enum struct GreetType : uint16_t
{
  init_initiator_up = 0x009c,
  init_participant_up = 0x001c,
  init_participant_down = 0x001e,
  init_participant_confirm_down = 0x001a,

  include_aux_initiator_up = 0x00ad,
  include_aux_participant_up = 0x002d,
  include_aux_participant_down = 0x002f,
  include_aux_participant_confirm_down = 0x002b,

  exclude_aux_initiator_down = 0x00bf,
  exclude_aux_participant_confirm_down = 0x003b,

  refresh_aux_initiator_down = 0x00c7,
  refresh_aux_participant_down = 0x0047,

  quit_down = 0x00d3,
};

bool
is_auxiliary(GreetType type);
bool
is_downflow(GreetType type);
bool
has_gka(GreetType type);
bool
has_ske(GreetType type);
bool
is_initiator(GreetType type);
bool
is_recover(GreetType type);

GreetOperation
operation(GreetType type);

GreetType
with_recover(GreetType type);

Agreement
agreement(GreetType type);

Flow
flow(GreetType type);

// E.g., "INIT_INITIATOR_UP" or "RECOVER_QUIT_DOWN"; unnamed values print as
// hex
std::string
greet_type_name(GreetType type);

const char*
operation_name(GreetOperation op);

// The operation being negotiated, e.g., "EXCLUDE (recovery)"
std::string
negotiation_name(GreetType type);

std::ostream&
operator<<(std::ostream& str, GreetType type);

///
/// Key agreement message envelope
///

struct ProtocolMessage
{
  explicit ProtocolMessage(MemberId source_in = "");

  MemberId source;

  // Empty for a broadcast
  MemberId dest;

  std::optional<GreetType> greet_type;
  std::optional<Agreement> agreement;
  std::optional<Flow> flow;

  std::vector<MemberId> members;

  // Aligned by position with `members`
  std::vector<bytes> int_keys;
  std::vector<std::string> debug_keys;
  std::vector<bytes> nonces;
  std::vector<bytes> pub_keys;

  std::optional<bytes> session_signature;

  // Only disclosed when a member leaves
  std::optional<bytes> signing_key;

  bytes signature;
  bool signature_ok = false;

  // Encoded content covered by the signature
  bytes raw_message;

  std::optional<uint8_t> protocol_version;
  bytes data;

  bool is_broadcast() const { return dest.empty(); }
};

///
/// Summary of a message, for inspection without decoding
///

enum struct MessageCategory : uint8_t
{
  plain = 0x00,
  query = 0x01,
  greet = 0x02,
  data = 0x03,
  error = 0x04,
};

const char*
category_name(MessageCategory category);

enum struct Origin : uint8_t
{
  participant,
  outsider,
  unknown,
};

const char*
origin_name(Origin origin);

// Where a message came from, relative to the members it lists
Origin
classify_origin(const MemberId& from, const std::vector<MemberId>& members);

struct GreetInfo
{
  GreetType greet_type;
  Agreement agreement;
  Flow flow;
  bool from_initiator;
  std::string negotiation;
  std::vector<MemberId> members;
  size_t num_nonces;
  size_t num_pub_keys;
  size_t num_int_keys;
};

struct ProtocolMessageInfo
{
  MessageCategory type;
  uint8_t protocol_version;
  MemberId from;
  MemberId to;
  Origin origin;
  std::optional<GreetInfo> greet;

  // Data messages only
  std::optional<bytes> sidkey_hint;

  bool is_greet() const { return greet.has_value(); }
};

} // namespace mpchat
