#include "registry.hpp"
#include <boost/smart_ptr.hpp>
#include <mutex>
#include <string>
#include <utility>

using namespace protocol;

namespace {

Payload const& ack_payload() {
  static Payload const ack = boost::make_shared<std::string const>(ack_frame());
  return ack;
}

}

char const* send_result_str(SendResult res) {
  switch (res) {
  case SendResult::Ok:
    return "ok";
  case SendResult::NotConnected:
    return "not connected";
  case SendResult::WriteFailed:
    return "write failed";
  }
  return "unknown";
}

/******************** Registry ********************/

Registry::Registry(EventSink sink) : sink_(std::move(sink)) {}

SendResult Registry::write_locked(ConnectionId id, WriteChannel& channel,
                                  Payload const& payload) {
  if (channel.write(payload) != WriteResult::Ok) {
    emit(this->sink_, EventKind::WriteFailure, id, "channel closed");
    return SendResult::WriteFailed;
  }
  return SendResult::Ok;
}

bool Registry::register_channel(ConnectionId id,
                                boost::shared_ptr<WriteChannel> channel) {
  std::lock_guard lock(this->mtx_);
  auto it = this->channels_.find(id);
  if (it != this->channels_.end()) {
    it->second = std::move(channel);
    return true;
  }
  this->channels_.emplace(id, std::move(channel));
  return false;
}

bool Registry::register_and_login(ConnectionId id,
                                  boost::shared_ptr<WriteChannel> channel) {
  auto ss = boost::make_shared<std::string const>(login_frame(id));
  std::lock_guard lock(this->mtx_);
  auto [it, inserted] = this->channels_.insert_or_assign(id, std::move(channel));
  this->write_locked(id, *it->second, ss);
  return !inserted;
}

bool Registry::deregister(ConnectionId id) {
  std::lock_guard lock(this->mtx_);
  return this->channels_.erase(id) > 0;
}

bool Registry::deregister(ConnectionId id, WriteChannel const* channel) {
  std::lock_guard lock(this->mtx_);
  auto it = this->channels_.find(id);
  if (it == this->channels_.end() || it->second.get() != channel) {
    return false;
  }
  this->channels_.erase(it);
  return true;
}

SendResult Registry::send_to(ConnectionId id, Payload const& payload) {
  std::lock_guard lock(this->mtx_);
  auto it = this->channels_.find(id);
  if (it == this->channels_.end()) {
    return SendResult::NotConnected;
  }
  return this->write_locked(id, *it->second, payload);
}

SendResult Registry::send_to(ConnectionId id, std::string bytes) {
  return this->send_to(id, boost::make_shared<std::string const>(std::move(bytes)));
}

void Registry::login(ConnectionId id) {
  if (this->send_to(id, login_frame(id)) == SendResult::NotConnected) {
    throw InvariantError("login for unregistered client_id " + std::to_string(id));
  }
}

BroadcastReport Registry::broadcast(ConnectionId sender, Payload const& payload) {
  BroadcastReport report;
  std::lock_guard lock(this->mtx_);
  for (auto& [id, channel] : this->channels_) {
    auto const& bytes = (id == sender) ? ack_payload() : payload;
    if (this->write_locked(id, *channel, bytes) == SendResult::Ok) {
      ++report.delivered;
    } else {
      report.failed.push_back(id);
    }
  }
  return report;
}

bool Registry::contains(ConnectionId id) const {
  std::lock_guard lock(this->mtx_);
  return this->channels_.count(id) > 0;
}

std::size_t Registry::size() const {
  std::lock_guard lock(this->mtx_);
  return this->channels_.size();
}
