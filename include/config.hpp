#pragma once

#include "net.hpp"
#include <stdexcept>
#include <string>
#include <string_view>

class AddressError : public std::runtime_error {
public:
  AddressError(const std::string &err) : std::runtime_error(err) {}
};

constexpr std::string_view DEFAULT_ADDRESS = "127.0.0.1:8888";

struct Config {
  tcp::endpoint endpoint;
  int workers = 1;
};

// linerelay [address [workers]]
Config parse_config(int argc, char const* const* argv);

tcp::endpoint parse_address(std::string_view);
