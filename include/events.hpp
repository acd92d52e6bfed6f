#pragma once

#include "protocol.hpp"
#include <functional>
#include <string>

enum class EventKind {
  Listening,
  Connected,
  Message,
  WriteFailure,
  ReadFailure,
  Disconnected,
  Replaced,
  AcceptFailure,
};

struct Event {
  EventKind kind;
  protocol::ConnectionId id;
  std::string detail;
};

// May be empty; emit() drops events in that case.
using EventSink = std::function<void(Event const&)>;

char const* event_kind_str(EventKind kind);

void emit(EventSink const& sink, EventKind kind, protocol::ConnectionId id,
          std::string detail = {});

EventSink console_sink();
