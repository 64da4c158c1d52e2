#include <doctest/doctest.h>
#include "wlanpipe/broker.hpp"
#include "datagram_io.hpp"
#include "fake_wifi.hpp"

#include <unistd.h>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <sstream>
#include <string>
#include <thread>

using namespace wlanpipe;
namespace fs = std::filesystem;

namespace {

fs::path make_temp_dir() {
    static int counter = 0;
    fs::path p = fs::temp_directory_path() /
                 ("wlanpipe-loop-" + std::to_string(::getpid()) + "-" + std::to_string(counter++));
    fs::create_directories(p);
    return p;
}

// A broker running on its own thread over a real AF_UNIX socket.
struct LiveBroker {
    fs::path            dir = make_temp_dir();
    std::string         path = (dir / "broker.sock").string();
    test::FakeWifi      wifi;
    BrokerConfig        cfg;
    Session             session{wifi};
    std::ostringstream  log;
    Broker              broker{session, cfg, log};   // reads cfg by reference
    std::atomic<bool>   stop{false};
    std::atomic<bool>   finished{false};
    int                 fd = -1;
    std::thread         th;

    LiveBroker() {
        cfg.recv_timeout_ms = 50;
        cfg.link_wait_ms = 30;
        cfg.address_wait_ms = 30;
        cfg.poll_step_ms = 5;
        fd = open_local_endpoint(path);
    }

    void start() {
        th = std::thread([this] {
            broker.run(fd, stop);
            finished = true;
        });
    }

    bool wait_finished(int ms) {
        for (int i = 0; i < ms / 5; ++i) {
            if (finished) return true;
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return finished.load();
    }

    ~LiveBroker() {
        stop = true;
        if (th.joinable()) th.join();
        close_endpoint(fd, path);
        std::error_code ec;
        fs::remove_all(dir, ec);
    }
};

struct Client {
    std::string own;
    PeerAddress peer;
    int fd = -1;

    Client(const LiveBroker& b, const std::string& name)
    : own((b.dir / name).string()) {
        fd = open_local_client(own, b.path, peer);
    }
    ~Client() { close_endpoint(fd, own); }

    bool send(const std::vector<uint8_t>& bytes) { return send_datagram(fd, bytes, peer); }

    RecvStatus recv(Frame& f, int timeout_ms) {
        std::vector<uint8_t> in;
        PeerAddress from;
        RecvStatus st = recv_datagram(fd, in, from, timeout_ms);
        if (st != RecvStatus::Ok) return st;
        return decode(in.data(), in.size(), f) == DecodeStatus::Ok ? RecvStatus::Ok : RecvStatus::Error;
    }
};

} // namespace

TEST_CASE("Short datagram gets no reply and the loop keeps serving") {
    LiveBroker b;
    REQUIRE(b.fd >= 0);
    b.wifi.in_range = {"WiiU77"};
    b.start();

    Client c(b, "client.sock");
    REQUIRE(c.fd >= 0);

    std::vector<uint8_t> eight(8, 0);
    eight[0] = SYNC;
    REQUIRE(c.send(eight));

    Frame f;
    CHECK(c.recv(f, 200) == RecvStatus::Timeout);

    REQUIRE(c.send(encode(make_sync(1))));
    REQUIRE(c.recv(f, 2000) == RecvStatus::Ok);
    CHECK(f.control_code == STATUS);
    CHECK(f.status_value() == static_cast<uint32_t>(StatusCode::Success));
}

TEST_CASE("QUIT ends the loop without a reply") {
    LiveBroker b;
    REQUIRE(b.fd >= 0);
    b.start();

    Client c(b, "client.sock");
    REQUIRE(c.fd >= 0);
    REQUIRE(c.send(encode(make_quit())));

    CHECK(b.wait_finished(2000));
    CHECK_FALSE(b.stop.load());
    CHECK(b.session.state() == SessionState::ShuttingDown);

    Frame f;
    CHECK(c.recv(f, 100) == RecvStatus::Timeout);
    CHECK(b.log.str().find("event=loop_exit reason=quit") != std::string::npos);
}

TEST_CASE("Stop flag ends an idle loop within one receive timeout") {
    LiveBroker b;
    REQUIRE(b.fd >= 0);
    b.start();

    std::this_thread::sleep_for(std::chrono::milliseconds(60));
    b.stop = true;
    CHECK(b.wait_finished(1000));
    CHECK(b.session.state() == SessionState::Idle);
    CHECK(b.log.str().find("event=loop_exit reason=signal") != std::string::npos);
}

TEST_CASE("Replies go only to the sender of the request") {
    LiveBroker b;
    REQUIRE(b.fd >= 0);
    b.start();

    Client a(b, "a.sock");
    Client other(b, "other.sock");
    REQUIRE(a.fd >= 0);
    REQUIRE(other.fd >= 0);

    REQUIRE(a.send(encode(make_unbind())));

    Frame f;
    REQUIRE(a.recv(f, 2000) == RecvStatus::Ok);
    CHECK(f.control_code == STATUS);
    CHECK(other.recv(f, 100) == RecvStatus::Timeout);
}

TEST_CASE("CONNECT over the socket delivers BIND_ACK then STATUS") {
    LiveBroker b;
    REQUIRE(b.fd >= 0);
    b.wifi.in_range = {"WiiU77"};
    b.start();

    Client c(b, "client.sock");
    REQUIRE(c.fd >= 0);

    wifi::TargetNetwork t;
    t.ssid = wifi::SsidStr("WiiU77");
    REQUIRE(c.send(encode(make_connect(t))));

    Frame f;
    REQUIRE(c.recv(f, 2000) == RecvStatus::Ok);
    CHECK(f.control_code == BIND_ACK);
    REQUIRE(c.recv(f, 2000) == RecvStatus::Ok);
    CHECK(f.control_code == STATUS);
    CHECK(f.status_value() == static_cast<uint32_t>(StatusCode::Success));

    b.stop = true;
    CHECK(b.wait_finished(1000));
    CHECK(b.session.state() == SessionState::Associated);
}
