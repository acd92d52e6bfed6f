#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace protocol {

// Derived from the remote port; unique only among live connections.
using ConnectionId = std::uint16_t;

constexpr char LINE_DELIM = '\n';

std::string login_frame(ConnectionId id);
std::string message_frame(ConnectionId id, std::string_view text);
std::string const& ack_frame();

std::string extract_line(std::string_view raw);

struct Envelope {
  ConnectionId sender;
  std::string text;

  Envelope(ConnectionId sender, std::string text);

  std::string wrap() const;
};

};
