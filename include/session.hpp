#pragma once

#include "beast.hpp"
#include "channel.hpp"
#include "coordinator.hpp"
#include "net.hpp"
#include <atomic>
#include <boost/smart_ptr.hpp>
#include <cstdlib>
#include <memory>
#include <queue>
#include <string>

class Session;

// Write half of a session as seen by the Registry.
class SessionChannel : public WriteChannel {
  boost::weak_ptr<Session> session_;

public:
  explicit SessionChannel(boost::weak_ptr<Session>);

  WriteResult write(Payload const&) override;
};

class Session : public boost::enable_shared_from_this<Session> {
public:
  enum class State {
    Connecting,
    LoggedIn,
    Closed,
  };

private:
  beast::tcp_stream stream_;
  std::string buffer_;
  boost::shared_ptr<Coordinator> coordinator_;
  ConnectionId id_;
  boost::shared_ptr<SessionChannel> channel_;
  std::queue<Payload> queue_;
  State state_ = State::Connecting;
  std::atomic<bool> closed_{false};
  // Set after end of stream: close once the write queue is empty.
  bool draining_ = false;

  void start();
  void do_read();
  void on_read(beast::error_code, std::size_t);
  void on_write(beast::error_code, std::size_t);
  void on_send(Payload const&);
  void close(std::string const& reason);
  void finish();
  void shutdown();

public:
  Session(tcp::socket&&, boost::shared_ptr<Coordinator> const&, ConnectionId);

  void run();
  void send(Payload const&);

  ConnectionId id() const;
  bool closed() const;
};
