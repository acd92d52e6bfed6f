#include "session.hpp"
#include "beast.hpp"
#include "net.hpp"
#include <string>
#include <string_view>
#include <utility>

/******************** SessionChannel ********************/

SessionChannel::SessionChannel(boost::weak_ptr<Session> session)
    : session_(std::move(session)) {}

WriteResult SessionChannel::write(Payload const& ss) {
  auto strong = this->session_.lock();
  if (!strong || strong->closed()) {
    return WriteResult::Failed;
  }
  strong->send(ss);
  return WriteResult::Ok;
}

/******************** Session ********************/

Session::Session(tcp::socket&& socket, boost::shared_ptr<Coordinator> const& coordinator,
                 ConnectionId id)
    : stream_(std::move(socket)), coordinator_(coordinator), id_(id) {}

void Session::run() {
  // Everything below runs on the connection's strand.
  net::dispatch(this->stream_.get_executor(), beast::bind_front_handler(
    &Session::start, this->shared_from_this()
  ));
}

void Session::start() {
  this->channel_ = boost::make_shared<SessionChannel>(this->weak_from_this());
  this->coordinator_->connect(this->id_, this->channel_);
  this->state_ = State::LoggedIn;
  this->do_read();
}

void Session::do_read() {
  net::async_read_until(
    this->stream_, net::dynamic_buffer(this->buffer_), LINE_DELIM,
    beast::bind_front_handler(&Session::on_read, this->shared_from_this())
  );
}

void Session::on_read(beast::error_code ec, std::size_t bytes) {
  if (ec == net::error::eof) {
    // A final line without a trailing newline is still relayed.
    if (!this->buffer_.empty()) {
      this->coordinator_->relay(this->id_, extract_line(this->buffer_));
      this->buffer_.clear();
    }
    this->close("end of stream");
    // Runs after the sends already posted to this strand, so the last ack
    // is queued before the socket goes away.
    net::post(this->stream_.get_executor(), beast::bind_front_handler(
      &Session::finish, this->shared_from_this()
    ));
    return;
  }
  if (ec) {
    if (ec != net::error::operation_aborted) {
      this->coordinator_->report(EventKind::ReadFailure, this->id_, ec.message());
    }
    this->close(ec.message());
    // Pending writes are abandoned, not flushed.
    this->shutdown();
    return;
  }
  auto line = extract_line(std::string_view(this->buffer_).substr(0, bytes));
  this->buffer_.erase(0, bytes);
  this->coordinator_->relay(this->id_, std::move(line));
  this->do_read();
}

void Session::close(std::string const& reason) {
  if (this->state_ == State::Closed) {
    return;
  }
  this->state_ = State::Closed;
  this->closed_ = true;
  this->coordinator_->disconnect(this->id_, this->channel_.get(), reason);
}

void Session::finish() {
  if (this->queue_.empty()) {
    this->shutdown();
  } else {
    this->draining_ = true;
  }
}

// A write still in flight completes with an error and empties the queue.
void Session::shutdown() {
  beast::error_code ec;
  this->stream_.socket().shutdown(tcp::socket::shutdown_both, ec);
  this->stream_.socket().close(ec);
}

void Session::on_write(beast::error_code ec, std::size_t) {
  // The socket was closed under a write in flight; nothing left to report.
  if (!this->stream_.socket().is_open()) {
    std::queue<Payload>().swap(this->queue_);
    return;
  }
  if (ec && ec != net::error::operation_aborted) {
    this->coordinator_->report(EventKind::WriteFailure, this->id_, ec.message());
  }
  this->queue_.pop();

  if (!this->queue_.empty()) {
    net::async_write(this->stream_, net::buffer(*this->queue_.front()), beast::bind_front_handler(
      &Session::on_write, this->shared_from_this()
    ));
  } else if (this->draining_) {
    this->shutdown();
  }
}

void Session::on_send(Payload const& ss) {
  if (!this->stream_.socket().is_open()) {
    return;
  }
  this->queue_.push(ss);
  // Check if we are already writing
  if (this->queue_.size() > 1) {
    return;
  }
  // If not, send immediately
  net::async_write(this->stream_, net::buffer(*this->queue_.front()), beast::bind_front_handler(
    &Session::on_write, this->shared_from_this()
  ));
}

void Session::send(Payload const& ss) {
  // Post to the strand to ensure the members of `this` aren't accessed
  // concurrently.
  net::post(this->stream_.get_executor(), beast::bind_front_handler(
    &Session::on_send, this->shared_from_this(), ss
  ));
}

ConnectionId Session::id() const { return this->id_; }

bool Session::closed() const { return this->closed_; }
