#pragma once

#include <mpchat/common.h>
#include <mpchat/ordered_set.h>

#include <functional>
#include <optional>
#include <ostream>
#include <variant>

namespace mpchat {

using MemberSet = OrderedSet<MemberId>;

///
/// Channel control
///

// The local member enters the channel
struct SelfEnter
{
};

// The local member leaves the channel
struct SelfLeave
{
};

// Other members enter and/or leave the channel.  The two sets are disjoint
// and not both empty.
class MembershipDelta
{
public:
  const MemberSet& enter() const { return _enter; }
  const MemberSet& leave() const { return _leave; }

private:
  MemberSet _enter;
  MemberSet _leave;

  MembershipDelta(MemberSet enter, MemberSet leave);
  friend class ChannelControl;
};

bool
operator==(const SelfEnter& lhs, const SelfEnter& rhs);
bool
operator==(const SelfLeave& lhs, const SelfLeave& rhs);
bool
operator==(const MembershipDelta& lhs, const MembershipDelta& rhs);

// A validated change to the membership of a channel.  Sent to a channel it is
// a request; received from a channel it is a fact.
class ChannelControl
{
public:
  using Content = std::variant<SelfEnter, SelfLeave, MembershipDelta>;

  static ChannelControl self_enter();
  static ChannelControl self_leave();

  // Fails with ChannelControlError if the sets overlap or are both empty
  static ChannelControl membership_delta(const MemberSet& enter,
                                         const MemberSet& leave);

  const Content& content() const { return _content; }

  template<typename T>
  bool is() const
  {
    return std::holds_alternative<T>(_content);
  }

  template<typename T>
  const T& get() const
  {
    return std::get<T>(_content);
  }

private:
  Content _content;

  ChannelControl(Content content);
};

bool
operator==(const ChannelControl& lhs, const ChannelControl& rhs);
bool
operator!=(const ChannelControl& lhs, const ChannelControl& rhs);

std::ostream&
operator<<(std::ostream& str, const ChannelControl& control);

// An unvalidated membership change request.  Each field may be absent, a
// boolean flag, or a collection of member ids.
struct ChannelControlRequest
{
  using Field = std::variant<bool, std::vector<MemberId>, MemberSet>;

  std::optional<Field> enter;
  std::optional<Field> leave;
};

// Validate and canonicalize a request.  Throws ChannelControlError.
ChannelControl
check_channel_control(const ChannelControlRequest& request);

///
/// Channel actions and notices
///

// Best-effort send of an opaque payload to some members of the channel
struct RawSend
{
  bytes pubtxt;
  MemberSet recipients;
};

// An opaque payload received from some member of the channel
struct RawRecv
{
  bytes pubtxt;
  MemberId sender;
};

bool
operator==(const RawSend& lhs, const RawSend& rhs);
bool
operator==(const RawRecv& lhs, const RawRecv& rhs);

using ChannelAction = std::variant<RawSend, ChannelControl>;
using ChannelNotice = std::variant<RawRecv, ChannelControl>;

///
/// A group transport channel.  Membership of the channel exists
/// independently of any session built on top of it, and changes only through
/// control notices received from the channel.  Concurrent membership changes
/// are resolved by the transport, not by the channel.
///
class GroupChannel
{
public:
  // Returns true if the subscriber handled the notice
  using Subscriber = std::function<bool(const ChannelNotice&)>;

  // Returns true if the subscription was still active
  using Canceller = std::function<bool()>;

  virtual ~GroupChannel() = default;

  // The current membership, or nullopt if we are not in the channel.  Never
  // an empty set.
  virtual std::optional<MemberSet> cur_members() const = 0;

  // Hand an action to the transport.  Returns false if the action is not
  // valid in the current state.  The outcome arrives later as a notice.
  virtual bool send(const ChannelAction& action) = 0;

  virtual Canceller on_recv(Subscriber subscriber) = 0;
};

} // namespace mpchat
