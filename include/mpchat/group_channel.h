#pragma once

#include <mpchat/channel.h>

#include <map>
#include <memory>

namespace mpchat {

///
/// A GroupChannel that tracks membership for one local member.  Actions are
/// handed to a transport callback; the transport delivers notices back via
/// recv().
///
class BaseGroupChannel : public GroupChannel
{
public:
  using Transport = std::function<void(const ChannelAction&)>;

  explicit BaseGroupChannel(MemberId owner);

  const MemberId& owner() const { return _owner; }

  // Install the callback that carries accepted actions to the transport
  void on_send(Transport transport);

  std::optional<MemberSet> cur_members() const override;
  bool send(const ChannelAction& action) override;
  Canceller on_recv(Subscriber subscriber) override;

  // Apply a notice from the transport, then deliver it to subscribers.
  // Returns true if some subscriber handled it.  A subscriber that throws is
  // logged and counted as not handling it.  Throws ChannelStateError if a
  // control notice does not fit the current membership.
  bool recv(const ChannelNotice& notice);

private:
  struct Subscribers
  {
    size_t next_id = 0;
    std::map<size_t, Subscriber> active;
  };

  MemberId _owner;
  std::optional<MemberSet> _members;
  Transport _transport;
  std::shared_ptr<Subscribers> _subscribers;

  bool joined() const { return _members.has_value(); }
  bool accepts(const ChannelAction& action) const;
  bool accepts(const ChannelControl& control) const;
  void apply(const ChannelControl& control);
  bool publish(const ChannelNotice& notice);
};

} // namespace mpchat
