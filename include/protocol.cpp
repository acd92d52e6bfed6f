#include "protocol.hpp"
#include <string>      // string, to_string
#include <string_view> // string_view
#include <utility>     // move

namespace protocol {

std::string login_frame(ConnectionId id) {
  return "LOGIN:" + std::to_string(id) + LINE_DELIM;
}

std::string message_frame(ConnectionId id, std::string_view text) {
  std::string s;
  s.reserve(8 + 5 + 1 + text.size() + 1);
  s.append("MESSAGE:");
  s.append(std::to_string(id));
  s.push_back(' ');
  s.append(text);
  s.push_back(LINE_DELIM);
  return s;
}

std::string const& ack_frame() {
  static std::string const ack = "ACK:MESSAGE\n";
  return ack;
}

// Strips "\n" and then "\r", so CRLF clients relay the bare text.
std::string extract_line(std::string_view raw) {
  if (!raw.empty() && raw.back() == LINE_DELIM) {
    raw.remove_suffix(1);
  }
  if (!raw.empty() && raw.back() == '\r') {
    raw.remove_suffix(1);
  }
  return std::string(raw);
}

Envelope::Envelope(ConnectionId sender, std::string text)
    : sender(sender), text(std::move(text)) {}

std::string Envelope::wrap() const {
  return message_frame(this->sender, this->text);
}

} // namespace protocol
