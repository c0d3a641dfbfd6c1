#include <mpchat/group_channel.h>
#include <mpchat/log.h>

#include <stdexcept>

namespace mpchat {

using log::Log;

static const auto log_mod = "channel"s;

BaseGroupChannel::BaseGroupChannel(MemberId owner)
  : _owner(std::move(owner))
  , _subscribers(std::make_shared<Subscribers>())
{
}

void
BaseGroupChannel::on_send(Transport transport)
{
  _transport = std::move(transport);
}

std::optional<MemberSet>
BaseGroupChannel::cur_members() const
{
  return _members;
}

bool
BaseGroupChannel::accepts(const ChannelControl& control) const
{
  const auto check = overloaded{
    [&](const SelfEnter& /* unused */) { return !joined(); },
    [&](const SelfLeave& /* unused */) { return joined(); },
    [&](const MembershipDelta& delta) {
      // Our own membership changes via SelfEnter / SelfLeave only
      return joined() && !delta.enter().contains(_owner) &&
             !delta.leave().contains(_owner);
    },
  };

  return std::visit(check, control.content());
}

bool
BaseGroupChannel::accepts(const ChannelAction& action) const
{
  const auto check = overloaded{
    [&](const RawSend& /* unused */) { return joined(); },
    [&](const ChannelControl& control) { return accepts(control); },
  };

  return std::visit(check, action);
}

bool
BaseGroupChannel::send(const ChannelAction& action)
{
  if (!_transport) {
    Log::warn(log_mod, _owner, ": no transport for outgoing action");
    return false;
  }

  if (!accepts(action)) {
    if (const auto* control = std::get_if<ChannelControl>(&action)) {
      Log::warn(log_mod, _owner, ": rejected ", *control);
    } else {
      Log::warn(log_mod, _owner, ": rejected raw send while not joined");
    }
    return false;
  }

  _transport(action);
  return true;
}

GroupChannel::Canceller
BaseGroupChannel::on_recv(Subscriber subscriber)
{
  const auto id = _subscribers->next_id;
  _subscribers->next_id += 1;
  _subscribers->active.emplace(id, std::move(subscriber));

  auto weak = std::weak_ptr<Subscribers>(_subscribers);
  return [weak, id]() {
    auto subscribers = weak.lock();
    if (!subscribers) {
      return false;
    }

    return subscribers->active.erase(id) > 0;
  };
}

void
BaseGroupChannel::apply(const ChannelControl& control)
{
  const auto apply_enter = [&](const SelfEnter& /* unused */) {
    if (joined()) {
      throw ChannelStateError("SelfEnter received while already joined");
    }
    _members = MemberSet{ _owner };
  };

  const auto apply_leave = [&](const SelfLeave& /* unused */) {
    if (!joined()) {
      throw ChannelStateError("SelfLeave received while not joined");
    }
    _members = std::nullopt;
  };

  const auto apply_delta = [&](const MembershipDelta& delta) {
    if (!joined()) {
      throw ChannelStateError("MembershipDelta received while not joined");
    }

    const auto& members = _members.value();
    if (!delta.enter().is_disjoint(members)) {
      throw ChannelStateError("Entering members are already present");
    }

    if (!delta.leave().is_subset_of(members)) {
      throw ChannelStateError("Leaving members are not present");
    }

    if (delta.leave().contains(_owner)) {
      throw ChannelStateError("Own departure must be a SelfLeave");
    }

    _members = members.patch(delta.enter(), delta.leave());
  };

  std::visit(overloaded{ apply_enter, apply_leave, apply_delta },
             control.content());
}

bool
BaseGroupChannel::publish(const ChannelNotice& notice)
{
  // Subscribers may cancel each other while we iterate.  A subscriber that
  // was cancelled before its turn does not see the notice.
  const auto subscribers = _subscribers;
  const auto current = subscribers->active;

  auto handled = false;
  for (const auto& [id, subscriber] : current) {
    if (subscribers->active.count(id) == 0) {
      continue;
    }

    // One failing subscriber must not keep the notice from the others
    try {
      if (subscriber(notice)) {
        handled = true;
      }
    } catch (const std::exception& e) {
      Log::error(log_mod, _owner, ": subscriber failed: ", e.what());
    }
  }
  return handled;
}

bool
BaseGroupChannel::recv(const ChannelNotice& notice)
{
  if (const auto* control = std::get_if<ChannelControl>(&notice)) {
    apply(*control);
    Log::info(log_mod,
              _owner,
              ": ",
              *control,
              " -> ",
              _members.value_or(MemberSet{}));
    return publish(notice);
  }

  const auto& raw = std::get<RawRecv>(notice);
  if (!joined()) {
    Log::warn(
      log_mod, _owner, ": dropped payload from ", raw.sender, " (not joined)");
    return false;
  }

  Log::debug(log_mod,
             _owner,
             ": payload of ",
             raw.pubtxt.size(),
             " bytes from ",
             raw.sender);
  return publish(notice);
}

} // namespace mpchat
