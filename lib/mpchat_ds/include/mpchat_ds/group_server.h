#pragma once

#include <mpchat/group_channel.h>

#include <deque>
#include <map>
#include <memory>
#include <optional>

namespace mpchat::mpchat_ds {

using namespace mpchat;

// An in-memory delivery service for a single channel.  Actions sent by
// members queue up at the server; the server resolves them in the order it
// processes them, so the first action received wins.  The resulting notices
// queue up per member until they are delivered.
class DummyGroupServer
{
public:
  DummyGroupServer() = default;

  // Channels refer back to the server
  DummyGroupServer(const DummyGroupServer&) = delete;
  DummyGroupServer& operator=(const DummyGroupServer&) = delete;

  // Get the channel for a member, creating it if needed
  BaseGroupChannel& channel(const MemberId& id);

  // Membership as of the last processed action
  const MemberSet& cur_members() const { return _members; }

  size_t pending() const { return _incoming.size(); }
  size_t queued(const MemberId& id) const;

  // Process the action at position `index` of the incoming queue.  Actions
  // from one sender must be processed in the order they were sent.
  void recv(size_t index = 0);
  size_t recv_all();

  // Deliver the next notice queued for a member.  Returns the result of the
  // member's channel.
  bool send();
  bool send(const MemberId& id);
  size_t send_all();

  // The member with the longest queue, if any has notices waiting
  std::optional<MemberId> select_next_send_target() const;

  // Alternate receiving and sending until nothing is left
  void run();

private:
  struct Packet
  {
    MemberId sender;
    ChannelAction action;
  };

  std::map<MemberId, std::unique_ptr<BaseGroupChannel>> _channels;
  std::map<MemberId, std::deque<ChannelNotice>> _queues;
  std::deque<Packet> _incoming;
  MemberSet _members;

  void deliver(const RawSend& raw, const MemberId& sender);
  void resolve(const ChannelControl& control, const MemberId& sender);
  void enqueue(const MemberId& id, ChannelNotice notice);
};

} // namespace mpchat::mpchat_ds
