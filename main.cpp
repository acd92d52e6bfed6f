#include "include/config.hpp"
#include "include/coordinator.hpp"
#include "include/events.hpp"
#include "include/listener.hpp"
#include <boost/asio/signal_set.hpp>
#include <boost/smart_ptr.hpp>
#include <cstdlib>
#include <iostream>
#include <thread>
#include <vector>

void die(const char *msg) {
  std::cerr << msg << std::endl;
  std::exit(1);
}

int main(int argc, char **argv) {
  Config config;
  try {
    config = parse_config(argc, argv);
  } catch (AddressError const& e) {
    die(e.what());
  }

  net::io_context ioc;

  auto coordinator = boost::make_shared<Coordinator>(console_sink());
  try {
    boost::make_shared<Listener>(ioc, config.endpoint, coordinator)->run();
  } catch (BindError const& e) {
    die(e.what());
  }

  net::signal_set signals(ioc, SIGINT, SIGTERM);
  signals.async_wait(
      [&ioc](boost::system::error_code const &, int) { ioc.stop(); });

  std::vector<std::thread> threads;
  threads.reserve(config.workers - 1);
  for (auto i = config.workers - 1; i > 0; --i) {
    threads.emplace_back([&ioc] { ioc.run(); });
  }
  ioc.run();

  for (auto &t : threads) {
    t.join();
  }

  return 0;
}
