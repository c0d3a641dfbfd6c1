#include <mpchat/log.h>
#include <mpchat_ds/group_server.h>

namespace mpchat::mpchat_ds {

using log::Log;

static const auto log_mod = "server"s;

BaseGroupChannel&
DummyGroupServer::channel(const MemberId& id)
{
  auto it = _channels.find(id);
  if (it != _channels.end()) {
    return *it->second;
  }

  auto chan = std::make_unique<BaseGroupChannel>(id);
  chan->on_send([this, id](const ChannelAction& action) {
    _incoming.push_back({ id, action });
  });

  _queues[id];
  return *_channels.emplace(id, std::move(chan)).first->second;
}

size_t
DummyGroupServer::queued(const MemberId& id) const
{
  const auto it = _queues.find(id);
  if (it == _queues.end()) {
    return 0;
  }

  return it->second.size();
}

void
DummyGroupServer::enqueue(const MemberId& id, ChannelNotice notice)
{
  // Make sure the member has a channel to deliver to
  channel(id);
  _queues.at(id).push_back(std::move(notice));
}

void
DummyGroupServer::recv(size_t index)
{
  if (index >= _incoming.size()) {
    throw InvalidParameterError("Nothing to receive at this position");
  }

  const auto pos = _incoming.begin() + static_cast<std::ptrdiff_t>(index);
  const auto sender = pos->sender;
  for (auto it = _incoming.begin(); it != pos; it++) {
    if (it->sender == sender) {
      throw InvalidParameterError("Packets from " + sender +
                                  " must be processed in order");
    }
  }

  const auto action = pos->action;
  _incoming.erase(pos);

  const auto* control = std::get_if<ChannelControl>(&action);
  const auto entering = control != nullptr && control->is<SelfEnter>();
  if (!_members.contains(sender) && !entering) {
    Log::info(log_mod, "Ignoring packet from non-member ", sender);
    return;
  }

  if (control != nullptr) {
    resolve(*control, sender);
    return;
  }

  deliver(std::get<RawSend>(action), sender);
}

void
DummyGroupServer::deliver(const RawSend& raw, const MemberId& sender)
{
  const auto gone = raw.recipients.subtract(_members);
  if (!gone.empty()) {
    Log::info(log_mod,
              "Some recipients already left: ",
              gone,
              "; sending to ",
              _members);
  }

  for (const auto& id : _members) {
    enqueue(id, RawRecv{ raw.pubtxt, sender });
  }
}

void
DummyGroupServer::resolve(const ChannelControl& control, const MemberId& sender)
{
  auto to_enter = MemberSet{};
  auto to_leave = MemberSet{};

  const auto requested = overloaded{
    [&](const SelfEnter& /* unused */) { to_enter = MemberSet{ sender }; },
    [&](const SelfLeave& /* unused */) { to_leave = MemberSet{ sender }; },
    [&](const MembershipDelta& delta) {
      to_enter = delta.enter();
      to_leave = delta.leave();
    },
  };
  std::visit(requested, control.content());

  const auto done_enter = to_enter.intersect(_members);
  if (!done_enter.empty()) {
    Log::info(log_mod, "Already entered: ", done_enter);
    to_enter = to_enter.subtract(_members);
  }

  const auto done_leave = to_leave.subtract(_members);
  if (!done_leave.empty()) {
    Log::info(log_mod, "Already left: ", done_leave);
    to_leave = to_leave.intersect(_members);
  }

  if (to_enter.empty() && to_leave.empty()) {
    return;
  }

  const auto to_remain = _members.subtract(to_leave);
  _members = to_remain.unite(to_enter);
  Log::debug(log_mod, "Membership is now ", _members);

  if (!to_remain.empty()) {
    const auto delta = ChannelControl::membership_delta(to_enter, to_leave);
    for (const auto& id : to_remain) {
      enqueue(id, delta);
    }
  }

  for (const auto& id : to_enter) {
    enqueue(id, ChannelControl::self_enter());

    const auto others = _members.subtract(MemberSet{ id });
    if (!others.empty()) {
      enqueue(id, ChannelControl::membership_delta(others, {}));
    }
  }

  for (const auto& id : to_leave) {
    enqueue(id, ChannelControl::self_leave());
  }
}

size_t
DummyGroupServer::recv_all()
{
  auto count = size_t(0);
  while (!_incoming.empty()) {
    recv();
    count += 1;
  }
  return count;
}

bool
DummyGroupServer::send()
{
  const auto target = select_next_send_target();
  if (!target) {
    throw InvalidParameterError("No notices waiting");
  }

  return send(target.value());
}

bool
DummyGroupServer::send(const MemberId& id)
{
  const auto it = _channels.find(id);
  if (it == _channels.end()) {
    throw InvalidParameterError("Unknown member " + id);
  }

  auto& queue = _queues.at(id);
  if (queue.empty()) {
    throw InvalidParameterError("No notices waiting for " + id);
  }

  const auto notice = queue.front();
  queue.pop_front();
  return it->second->recv(notice);
}

size_t
DummyGroupServer::send_all()
{
  auto count = size_t(0);
  while (const auto target = select_next_send_target()) {
    send(target.value());
    count += 1;
  }
  return count;
}

std::optional<MemberId>
DummyGroupServer::select_next_send_target() const
{
  auto longest = size_t(0);
  auto target = std::optional<MemberId>{};
  for (const auto& [id, queue] : _queues) {
    if (queue.size() > longest) {
      longest = queue.size();
      target = id;
    }
  }
  return target;
}

void
DummyGroupServer::run()
{
  while (true) {
    const auto received = recv_all();
    const auto sent = send_all();
    if (received == 0 && sent == 0) {
      break;
    }
  }
}

} // namespace mpchat::mpchat_ds
