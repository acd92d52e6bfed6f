#pragma once

#include "channel.hpp"
#include "events.hpp"
#include "protocol.hpp"
#include "registry.hpp"
#include <boost/smart_ptr.hpp>
#include <string>

using namespace protocol;

// Runs the relay protocol for every connection over one shared Registry.
class Coordinator {
  EventSink sink_;
  Registry registry_;

public:
  explicit Coordinator(EventSink sink = {});

  // Registers the channel and sends LOGIN:<id> to it alone.
  void connect(ConnectionId, boost::shared_ptr<WriteChannel>);

  // MESSAGE:<id> <text> to every peer, ACK:MESSAGE to the sender.
  BroadcastReport relay(Envelope const&);
  BroadcastReport relay(ConnectionId, std::string line);

  // Returns false if the id no longer maps to this channel.
  bool disconnect(ConnectionId, WriteChannel const*, std::string const& reason);

  // Transport-side events (read and write errors) go to the same sink.
  void report(EventKind, ConnectionId, std::string detail = {}) const;

  Registry& registry();
  Registry const& registry() const;
};
