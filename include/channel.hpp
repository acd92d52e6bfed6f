#pragma once

#include <boost/smart_ptr.hpp>
#include <string>

using Payload = boost::shared_ptr<std::string const>;

enum class WriteResult {
  Ok,
  Failed,
};

// Outbound byte sink for one remote peer. Once registered it is owned by the
// Registry and only written to while the registry lock is held.
class WriteChannel {
public:
  virtual ~WriteChannel() = default;

  // Must not block on the network; delivery may complete later.
  virtual WriteResult write(Payload const&) = 0;
};
