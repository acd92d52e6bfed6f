#pragma once

#include "channel.hpp"
#include "events.hpp"
#include "protocol.hpp"
#include <boost/smart_ptr.hpp>
#include <cstddef>
#include <mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

using protocol::ConnectionId;

class InvariantError : public std::logic_error {
public:
  InvariantError(const std::string &err) : std::logic_error(err) {}
};

enum class SendResult {
  Ok,
  NotConnected,
  WriteFailed,
};

char const* send_result_str(SendResult);

struct BroadcastReport {
  std::size_t delivered = 0;
  std::vector<ConnectionId> failed;
};

class Registry {
  mutable std::mutex mtx_;
  std::unordered_map<ConnectionId, boost::shared_ptr<WriteChannel>> channels_;
  EventSink sink_;

  SendResult write_locked(ConnectionId, WriteChannel&, Payload const&);

public:
  explicit Registry(EventSink sink = {});

  Registry(Registry const&) = delete;
  Registry& operator=(Registry const&) = delete;

  // Overwrites any channel already held for the id; returns true if it did.
  bool register_channel(ConnectionId, boost::shared_ptr<WriteChannel>);

  // register_channel and login under one lock: LOGIN:<id> is the first thing
  // written to the channel and the id cannot vanish in between.
  bool register_and_login(ConnectionId, boost::shared_ptr<WriteChannel>);

  bool deregister(ConnectionId);
  // Only removes the entry if it still holds this channel.
  bool deregister(ConnectionId, WriteChannel const*);

  SendResult send_to(ConnectionId, Payload const&);
  SendResult send_to(ConnectionId, std::string);

  // Sends the login line to a connection that must already be registered.
  void login(ConnectionId);

  // One locked sweep: payload to every peer, the ack token to the sender.
  BroadcastReport broadcast(ConnectionId sender, Payload const& payload);

  bool contains(ConnectionId) const;
  std::size_t size() const;
};
