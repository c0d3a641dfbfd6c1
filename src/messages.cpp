#include <mpchat/messages.h>

#include <algorithm>
#include <iomanip>
#include <map>
#include <sstream>

namespace mpchat {

///
/// GreetType
///

static bool
has_bit(GreetType type, uint16_t bit)
{
  return (static_cast<uint16_t>(type) & bit) != 0;
}

bool
is_auxiliary(GreetType type)
{
  return has_bit(type, GreetTypeBits::auxiliary);
}

bool
is_downflow(GreetType type)
{
  return has_bit(type, GreetTypeBits::downflow);
}

bool
has_gka(GreetType type)
{
  return has_bit(type, GreetTypeBits::gka);
}

bool
has_ske(GreetType type)
{
  return has_bit(type, GreetTypeBits::ske);
}

bool
is_initiator(GreetType type)
{
  return has_bit(type, GreetTypeBits::initiator);
}

bool
is_recover(GreetType type)
{
  return has_bit(type, GreetTypeBits::recover);
}

GreetOperation
operation(GreetType type)
{
  const auto bits = static_cast<uint16_t>(type) & GreetTypeBits::operation_mask;
  return static_cast<GreetOperation>(bits >> GreetTypeBits::operation_shift);
}

GreetType
with_recover(GreetType type)
{
  return static_cast<GreetType>(static_cast<uint16_t>(type) |
                                GreetTypeBits::recover);
}

Agreement
agreement(GreetType type)
{
  return is_auxiliary(type) ? Agreement::auxiliary : Agreement::initial;
}

Flow
flow(GreetType type)
{
  return is_downflow(type) ? Flow::downflow : Flow::upflow;
}

std::string
greet_type_name(GreetType type)
{
  static const auto names = std::map<GreetType, std::string>{
    { GreetType::init_initiator_up, "INIT_INITIATOR_UP" },
    { GreetType::init_participant_up, "INIT_PARTICIPANT_UP" },
    { GreetType::init_participant_down, "INIT_PARTICIPANT_DOWN" },
    { GreetType::init_participant_confirm_down,
      "INIT_PARTICIPANT_CONFIRM_DOWN" },
    { GreetType::include_aux_initiator_up, "INCLUDE_AUX_INITIATOR_UP" },
    { GreetType::include_aux_participant_up, "INCLUDE_AUX_PARTICIPANT_UP" },
    { GreetType::include_aux_participant_down, "INCLUDE_AUX_PARTICIPANT_DOWN" },
    { GreetType::include_aux_participant_confirm_down,
      "INCLUDE_AUX_PARTICIPANT_CONFIRM_DOWN" },
    { GreetType::exclude_aux_initiator_down, "EXCLUDE_AUX_INITIATOR_DOWN" },
    { GreetType::exclude_aux_participant_confirm_down,
      "EXCLUDE_AUX_PARTICIPANT_CONFIRM_DOWN" },
    { GreetType::refresh_aux_initiator_down, "REFRESH_AUX_INITIATOR_DOWN" },
    { GreetType::refresh_aux_participant_down, "REFRESH_AUX_PARTICIPANT_DOWN" },
    { GreetType::quit_down, "QUIT_DOWN" },
  };

  const auto raw = static_cast<uint16_t>(type);
  const auto base =
    static_cast<GreetType>(raw & static_cast<uint16_t>(~GreetTypeBits::recover));
  const auto it = names.find(base);
  if (it == names.end()) {
    auto ss = std::stringstream();
    ss << "0x" << std::hex << std::setw(4) << std::setfill('0') << raw;
    return ss.str();
  }

  if (is_recover(type)) {
    return "RECOVER_" + it->second;
  }
  return it->second;
}

const char*
operation_name(GreetOperation op)
{
  switch (op) {
    case GreetOperation::start:
      return "START";
    case GreetOperation::include:
      return "INCLUDE";
    case GreetOperation::exclude:
      return "EXCLUDE";
    case GreetOperation::refresh:
      return "REFRESH";
    case GreetOperation::quit:
      return "QUIT";
  }

  return "UNKNOWN";
}

std::string
negotiation_name(GreetType type)
{
  auto name = std::string(operation_name(operation(type)));
  if (is_recover(type)) {
    name += " (recovery)";
  }
  return name;
}

std::ostream&
operator<<(std::ostream& str, GreetType type)
{
  return str << greet_type_name(type);
}

///
/// ProtocolMessage
///

ProtocolMessage::ProtocolMessage(MemberId source_in)
  : source(std::move(source_in))
{
}

///
/// ProtocolMessageInfo
///

const char*
category_name(MessageCategory category)
{
  switch (category) {
    case MessageCategory::plain:
      return "plain";
    case MessageCategory::query:
      return "query";
    case MessageCategory::greet:
      return "greet";
    case MessageCategory::data:
      return "data";
    case MessageCategory::error:
      return "error";
  }

  return "unknown";
}

const char*
origin_name(Origin origin)
{
  switch (origin) {
    case Origin::participant:
      return "participant";
    case Origin::outsider:
      return "outsider";
    case Origin::unknown:
      return "unknown";
  }

  return "unknown";
}

Origin
classify_origin(const MemberId& from, const std::vector<MemberId>& members)
{
  if (members.empty()) {
    return Origin::unknown;
  }

  const auto listed = std::find(members.begin(), members.end(), from);
  return (listed != members.end()) ? Origin::participant : Origin::outsider;
}

} // namespace mpchat
