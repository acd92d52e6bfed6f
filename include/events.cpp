#include "events.hpp"
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

char const* event_kind_str(EventKind kind) {
  switch (kind) {
  case EventKind::Listening:
    return "listening";
  case EventKind::Connected:
    return "connected";
  case EventKind::Message:
    return "message";
  case EventKind::WriteFailure:
    return "write_failure";
  case EventKind::ReadFailure:
    return "read_failure";
  case EventKind::Disconnected:
    return "disconnected";
  case EventKind::Replaced:
    return "replaced";
  case EventKind::AcceptFailure:
    return "accept_failure";
  }
  return "unknown";
}

void emit(EventSink const& sink, EventKind kind, protocol::ConnectionId id,
          std::string detail) {
  if (sink) {
    sink(Event{kind, id, std::move(detail)});
  }
}

EventSink console_sink() {
  // Events arrive from every io thread; keep lines whole.
  auto mtx = std::make_shared<std::mutex>();
  return [mtx](Event const& ev) {
    std::lock_guard lock(*mtx);
    switch (ev.kind) {
    case EventKind::Listening:
      std::cout << "listening on " << ev.detail << '\n';
      break;
    case EventKind::Connected:
      std::cout << "connected " << ev.detail << ' ' << ev.id << '\n';
      break;
    case EventKind::Message:
      std::cout << "message " << ev.id << ' ' << ev.detail << '\n';
      break;
    case EventKind::WriteFailure:
      std::cerr << "Failed to send data to client_id " << ev.id << ": "
                << ev.detail << '\n';
      break;
    case EventKind::ReadFailure:
      std::cerr << "read failed for client_id " << ev.id << ": " << ev.detail
                << '\n';
      break;
    case EventKind::Disconnected:
      std::cout << "disconnected " << ev.id << '\n';
      break;
    case EventKind::Replaced:
      std::cerr << "replaced " << ev.id << '\n';
      break;
    case EventKind::AcceptFailure:
      std::cerr << "accept: " << ev.detail << '\n';
      break;
    }
  };
}
