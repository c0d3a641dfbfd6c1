#include <mpchat/channel.h>

#include <sstream>

namespace mpchat {

///
/// ChannelControl
///

MembershipDelta::MembershipDelta(MemberSet enter, MemberSet leave)
  : _enter(std::move(enter))
  , _leave(std::move(leave))
{
}

bool
operator==(const SelfEnter& /* lhs */, const SelfEnter& /* rhs */)
{
  return true;
}

bool
operator==(const SelfLeave& /* lhs */, const SelfLeave& /* rhs */)
{
  return true;
}

bool
operator==(const MembershipDelta& lhs, const MembershipDelta& rhs)
{
  return lhs.enter() == rhs.enter() && lhs.leave() == rhs.leave();
}

ChannelControl::ChannelControl(Content content)
  : _content(std::move(content))
{
}

ChannelControl
ChannelControl::self_enter()
{
  return { SelfEnter{} };
}

ChannelControl
ChannelControl::self_leave()
{
  return { SelfLeave{} };
}

ChannelControl
ChannelControl::membership_delta(const MemberSet& enter,
                                 const MemberSet& leave)
{
  if (enter.empty() && leave.empty()) {
    throw ChannelControlError(ValidationError::empty_delta,
                              "Nobody enters or leaves");
  }

  const auto both = enter.intersect(leave);
  if (!both.empty()) {
    auto ss = std::stringstream();
    ss << "Members both enter and leave: " << both;
    throw ChannelControlError(ValidationError::overlapping_delta, ss.str());
  }

  return { MembershipDelta(enter, leave) };
}

bool
operator==(const ChannelControl& lhs, const ChannelControl& rhs)
{
  return lhs.content() == rhs.content();
}

bool
operator!=(const ChannelControl& lhs, const ChannelControl& rhs)
{
  return !(lhs == rhs);
}

std::ostream&
operator<<(std::ostream& str, const ChannelControl& control)
{
  const auto print = overloaded{
    [&](const SelfEnter& /* unused */) { str << "SelfEnter"; },
    [&](const SelfLeave& /* unused */) { str << "SelfLeave"; },
    [&](const MembershipDelta& delta) {
      str << "MembershipDelta{enter=" << delta.enter()
          << ", leave=" << delta.leave() << "}";
    },
  };

  std::visit(print, control.content());
  return str;
}

static bool
is_true(const std::optional<ChannelControlRequest::Field>& field)
{
  return field && std::holds_alternative<bool>(field.value()) &&
         std::get<bool>(field.value());
}

// Absent and false both mean "nobody"
static MemberSet
to_member_set(const std::optional<ChannelControlRequest::Field>& field)
{
  if (!field) {
    return {};
  }

  const auto convert = overloaded{
    [](bool /* flag */) { return MemberSet{}; },
    [](const std::vector<MemberId>& ids) { return MemberSet::from(ids); },
    [](const MemberSet& ids) { return ids; },
  };

  return std::visit(convert, field.value());
}

ChannelControl
check_channel_control(const ChannelControlRequest& request)
{
  if (is_true(request.enter)) {
    if (request.leave) {
      throw ChannelControlError(ValidationError::contradictory_intent,
                                "Cannot enter together with a leave request");
    }
    return ChannelControl::self_enter();
  }

  if (is_true(request.leave)) {
    if (request.enter) {
      throw ChannelControlError(ValidationError::contradictory_intent,
                                "Cannot leave together with an enter request");
    }
    return ChannelControl::self_leave();
  }

  return ChannelControl::membership_delta(to_member_set(request.enter),
                                          to_member_set(request.leave));
}

///
/// Raw payloads
///

bool
operator==(const RawSend& lhs, const RawSend& rhs)
{
  return lhs.pubtxt == rhs.pubtxt && lhs.recipients == rhs.recipients;
}

bool
operator==(const RawRecv& lhs, const RawRecv& rhs)
{
  return lhs.pubtxt == rhs.pubtxt && lhs.sender == rhs.sender;
}

} // namespace mpchat
