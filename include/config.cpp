#include "config.hpp"
#include <algorithm>
#include <cstdlib>
#include <limits>
#include <string>
#include <string_view>

tcp::endpoint parse_address(std::string_view addr) {
  auto const pos = addr.rfind(":");
  if (pos == std::string_view::npos) {
    throw AddressError("must provide valid address");
  }

  boost::system::error_code ec;
  auto host = std::string(addr.substr(0, pos));
  // Accept bracketed IPv6 literals such as [::1]:8888.
  if (host.size() >= 2 && host.front() == '[' && host.back() == ']') {
    host = host.substr(1, host.size() - 2);
  }
  auto ip = net::ip::make_address(host, ec);
  if (ec) {
    throw AddressError("must provide valid address");
  }

  unsigned long port;
  try {
    std::size_t used = 0;
    auto const port_str = std::string(addr.substr(pos + 1));
    port = std::stoul(port_str, &used);
    if (used != port_str.size()) {
      throw AddressError("must provide valid port");
    }
  } catch (std::logic_error const&) {
    throw AddressError("must provide valid port");
  }
  if (port > std::numeric_limits<unsigned short>::max()) {
    throw AddressError("must provide valid port");
  }
  return tcp::endpoint{ip, static_cast<unsigned short>(port)};
}

Config parse_config(int argc, char const* const* argv) {
  Config config;
  config.endpoint = parse_address(argc > 1 ? std::string_view(argv[1]) : DEFAULT_ADDRESS);
  config.workers = (argc > 2) ? std::max<int>(1, std::atoi(argv[2])) : 1;
  return config;
}
