#include "coordinator.hpp"
#include "listener.hpp"

#include "RecordingSink.hpp"
#include "TestHeaders.hpp"

#include <boost/smart_ptr.hpp>
#include <chrono>
#include <thread>
#include <utility>

namespace {
// Blocking client used to drive the relay over loopback.
class LineClient {
 public:
  explicit LineClient(tcp::endpoint const& server) : socket(ioc) {
    socket.connect(server);
  }

  ConnectionId id() const {
    return static_cast<ConnectionId>(socket.local_endpoint().port());
  }

  void send(std::string const& bytes) { net::write(socket, net::buffer(bytes)); }

  std::string readLine() {
    auto n = net::read_until(socket, net::dynamic_buffer(buffer), '\n');
    auto line = buffer.substr(0, n);
    buffer.erase(0, n);
    return line;
  }

  void shutdownSend() { socket.shutdown(tcp::socket::shutdown_send); }

  void close() { socket.close(); }

  // Closes with SO_LINGER {on, 0} so the server sees a reset, not EOF.
  void reset() {
    socket.set_option(net::socket_base::linger(true, 0));
    socket.close();
  }

 private:
  net::io_context ioc;
  tcp::socket socket;
  std::string buffer;
};

class RelayFixture {
 public:
  explicit RelayFixture(EventSink sink = {})
      : coordinator(boost::make_shared<Coordinator>(std::move(sink))),
        listener(boost::make_shared<Listener>(
            ioc, tcp::endpoint{net::ip::make_address("127.0.0.1"), 0},
            coordinator)) {
    listener->run();
    runner = std::thread([this] { ioc.run(); });
  }

  ~RelayFixture() {
    ioc.stop();
    runner.join();
  }

  tcp::endpoint endpoint() const { return listener->local_endpoint(); }

  // Registry changes land on the io thread; wait for them.
  bool waitForSize(size_t expected) {
    for (int i = 0; i < 500; ++i) {
      if (coordinator->registry().size() == expected) {
        return true;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return false;
  }

  net::io_context ioc;
  boost::shared_ptr<Coordinator> coordinator;
  boost::shared_ptr<Listener> listener;
  std::thread runner;
};
}  // namespace

TEST_CASE("Relay over loopback", "[Integration]") {
  RelayFixture relay;

  LineClient first(relay.endpoint());
  REQUIRE(first.readLine() == "LOGIN:" + std::to_string(first.id()) + "\n");
  LineClient second(relay.endpoint());
  REQUIRE(second.readLine() == "LOGIN:" + std::to_string(second.id()) + "\n");

  SECTION("Message fans out and the sender is acknowledged") {
    first.send("hello\n");
    REQUIRE(first.readLine() == "ACK:MESSAGE\n");
    REQUIRE(second.readLine() ==
            "MESSAGE:" + std::to_string(first.id()) + " hello\n");
  }

  SECTION("Lines keep their order and lose CRLF terminators") {
    first.send("one\r\ntwo\n");
    auto const prefix = "MESSAGE:" + std::to_string(first.id());
    REQUIRE(second.readLine() == prefix + " one\n");
    REQUIRE(second.readLine() == prefix + " two\n");
    REQUIRE(first.readLine() == "ACK:MESSAGE\n");
    REQUIRE(first.readLine() == "ACK:MESSAGE\n");
  }

  SECTION("A closed client is removed and others carry on") {
    first.close();
    REQUIRE(relay.waitForSize(1));
    REQUIRE_FALSE(relay.coordinator->registry().contains(first.id()));

    second.send("x\n");
    REQUIRE(second.readLine() == "ACK:MESSAGE\n");
  }

  SECTION("A final unterminated line is relayed at end of stream") {
    first.send("tail");
    first.shutdownSend();
    REQUIRE(second.readLine() ==
            "MESSAGE:" + std::to_string(first.id()) + " tail\n");
    REQUIRE(first.readLine() == "ACK:MESSAGE\n");
    REQUIRE(relay.waitForSize(1));
  }
}

TEST_CASE("Listener reports a taken port", "[Integration]") {
  RelayFixture relay;
  net::io_context other;
  auto const taken = relay.endpoint();
  auto bindAgain = [&] {
    Listener listener(other, taken, boost::make_shared<Coordinator>());
  };
  REQUIRE_THROWS_AS(bindAgain(), BindError);
}

TEST_CASE("A reset connection is a read failure", "[Integration]") {
  RecordingSink events;
  RelayFixture relay(events.sink());

  LineClient first(relay.endpoint());
  REQUIRE(first.readLine() == "LOGIN:" + std::to_string(first.id()) + "\n");
  LineClient second(relay.endpoint());
  REQUIRE(second.readLine() == "LOGIN:" + std::to_string(second.id()) + "\n");
  auto const gone = first.id();

  second.send("a\nb\nc\n");
  for (int i = 0; i < 3; ++i) {
    REQUIRE(second.readLine() == "ACK:MESSAGE\n");
    REQUIRE(first.readLine().rfind("MESSAGE:", 0) == 0);
  }
  first.reset();

  REQUIRE(relay.waitForSize(1));
  REQUIRE_FALSE(relay.coordinator->registry().contains(gone));
  REQUIRE(events.count(EventKind::ReadFailure, gone) == 1);
  REQUIRE(events.count(EventKind::Disconnected, gone) == 1);
  REQUIRE(events.count(EventKind::WriteFailure, gone) == 0);

  second.send("x\n");
  REQUIRE(second.readLine() == "ACK:MESSAGE\n");
  REQUIRE(events.count(EventKind::WriteFailure, gone) == 0);
}
