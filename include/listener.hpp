#pragma once

#include "beast.hpp"
#include "net.hpp"
#include <boost/smart_ptr.hpp>
#include <memory>
#include <stdexcept>
#include <string>

class Coordinator;

class BindError : public std::runtime_error {
public:
  BindError(const std::string &err) : std::runtime_error(err) {}
};

class Listener : public boost::enable_shared_from_this<Listener> {
  net::io_context& ioc_;
  tcp::acceptor acceptor_;
  boost::shared_ptr<Coordinator> coordinator_;

  void fail(beast::error_code, char const*);
  void do_accept();
  void accept(beast::error_code, tcp::socket);
public:
  // Throws BindError if the endpoint cannot be opened, bound or listened on.
  Listener(net::io_context&, tcp::endpoint, boost::shared_ptr<Coordinator> const& coordinator);
  void run();

  tcp::endpoint local_endpoint() const;
};
