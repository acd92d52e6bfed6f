#include "coordinator.hpp"
#include <boost/smart_ptr.hpp>
#include <string>
#include <utility>

using namespace protocol;

/******************** Coordinator ********************/

Coordinator::Coordinator(EventSink sink)
    : sink_(sink), registry_(std::move(sink)) {}

void Coordinator::connect(ConnectionId id, boost::shared_ptr<WriteChannel> channel) {
  if (this->registry_.register_and_login(id, std::move(channel))) {
    emit(this->sink_, EventKind::Replaced, id);
  }
}

BroadcastReport Coordinator::relay(Envelope const& env) {
  emit(this->sink_, EventKind::Message, env.sender, env.text);
  auto ss = boost::make_shared<std::string const>(env.wrap());
  return this->registry_.broadcast(env.sender, ss);
}

BroadcastReport Coordinator::relay(ConnectionId id, std::string line) {
  return this->relay(Envelope(id, std::move(line)));
}

bool Coordinator::disconnect(ConnectionId id, WriteChannel const* channel,
                             std::string const& reason) {
  if (!this->registry_.deregister(id, channel)) {
    return false;
  }
  emit(this->sink_, EventKind::Disconnected, id, reason);
  return true;
}

void Coordinator::report(EventKind kind, ConnectionId id, std::string detail) const {
  emit(this->sink_, kind, id, std::move(detail));
}

Registry& Coordinator::registry() { return this->registry_; }

Registry const& Coordinator::registry() const { return this->registry_; }
