#include "listener.hpp"
#include "coordinator.hpp"
#include "session.hpp"
#include <sstream>
#include <string>

namespace {

void check(beast::error_code ec, char const* what) {
  if (ec) {
    throw BindError(std::string(what) + ": " + ec.message());
  }
}

std::string endpoint_str(tcp::endpoint const& ep) {
  std::ostringstream oss;
  oss << ep;
  return oss.str();
}

}

Listener::Listener(net::io_context& ioc, tcp::endpoint endpoint, boost::shared_ptr<Coordinator> const& coordinator) : ioc_(ioc), acceptor_(ioc), coordinator_(coordinator) {
  beast::error_code ec;

  this->acceptor_.open(endpoint.protocol(), ec);
  check(ec, "open");

  this->acceptor_.set_option(net::socket_base::reuse_address(true), ec);
  check(ec, "set_option");

  this->acceptor_.bind(endpoint, ec);
  check(ec, "bind");

  this->acceptor_.listen(net::socket_base::max_listen_connections, ec);
  check(ec, "listen");
}

void Listener::fail(beast::error_code ec, char const* what) {
  if (ec != net::error::operation_aborted) {
    this->coordinator_->report(EventKind::AcceptFailure, 0,
                               std::string(what) + ": " + ec.message());
  }
}

void Listener::accept(beast::error_code ec, tcp::socket socket) {
  if (ec) {
    this->fail(ec, "accept");
    if (ec == net::error::operation_aborted) {
      return;
    }
  } else {
    auto const remote = socket.remote_endpoint(ec);
    if (ec) {
      this->fail(ec, "remote_endpoint");
    } else {
      // The remote port names the connection while it is live.
      auto const id = static_cast<ConnectionId>(remote.port());
      this->coordinator_->report(EventKind::Connected, id, remote.address().to_string());
      boost::make_shared<Session>(std::move(socket), this->coordinator_, id)->run();
    }
  }
  this->do_accept();
}

void Listener::do_accept() {
  this->acceptor_.async_accept(
    net::make_strand(this->ioc_),
    beast::bind_front_handler(&Listener::accept, this->shared_from_this())
  );
}

void Listener::run() {
  this->coordinator_->report(EventKind::Listening, 0, endpoint_str(this->local_endpoint()));
  this->do_accept();
}

tcp::endpoint Listener::local_endpoint() const {
  return this->acceptor_.local_endpoint();
}
