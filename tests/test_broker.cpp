#include <doctest/doctest.h>
#include "wlanpipe/broker.hpp"
#include "fake_wifi.hpp"

#include <algorithm>
#include <sstream>
#include <string>
#include <vector>

using namespace wlanpipe;

namespace {

BrokerConfig fast_config() {
    BrokerConfig c;
    c.link_wait_ms    = 30;
    c.address_wait_ms = 30;
    c.poll_step_ms    = 5;
    return c;
}

// Broker wired to a FakeWifi, with replies captured in order and mirrored
// into the provider's call journal.
struct Harness {
    test::FakeWifi           wifi;
    BrokerConfig             cfg = fast_config();
    Session                  session{wifi};
    std::ostringstream       log;
    Broker                   broker{session, cfg, log};
    std::vector<Frame>       replies;
    std::vector<std::string> journal;
    bool                     send_ok = true;

    Harness() { wifi.journal = &journal; }

    DispatchStatus feed(const Frame& f) {
        std::vector<uint8_t> w = encode(f);
        return feed_bytes(w);
    }

    DispatchStatus feed_bytes(const std::vector<uint8_t>& w) {
        return broker.handle_datagram(w.data(), w.size(), [this](const Frame& out) {
            replies.push_back(out);
            journal.push_back(std::string("reply:") + control_name(out.control_code));
            return send_ok;
        });
    }

    long index_of(const std::string& entry) const {
        auto it = std::find(journal.begin(), journal.end(), entry);
        return it == journal.end() ? -1 : static_cast<long>(it - journal.begin());
    }
};

Frame connect_to(const char* ssid) {
    wifi::TargetNetwork t;
    t.ssid = wifi::SsidStr(ssid);
    for (int i = 0; i < 32; ++i) t.secret.push_back(static_cast<uint8_t>(i));
    return make_connect(t);
}

bool is_status(const Frame& f, StatusCode code) {
    return f.control_code == STATUS && f.status_value() == static_cast<uint32_t>(code);
}

} // namespace

TEST_CASE("SYNC with no target in range replies err_generic") {
    Harness h;
    h.wifi.in_range = {"HomeNet", "Cafe"};

    CHECK(h.feed(make_sync(1)) == DispatchStatus::Handled);

    REQUIRE(h.replies.size() == 1);
    CHECK(is_status(h.replies[0], StatusCode::ErrGeneric));
    CHECK(h.session.state() == SessionState::Idle);
    CHECK_FALSE(h.session.last_discovered().has_value());
    CHECK(h.wifi.count("associate") == 0);
}

TEST_CASE("SYNC with a matching network replies success and records it") {
    Harness h;
    h.wifi.in_range = {"HomeNet", "WiiU5c6d7e"};

    CHECK(h.feed(make_sync(1234)) == DispatchStatus::Handled);

    REQUIRE(h.replies.size() == 1);
    CHECK(is_status(h.replies[0], StatusCode::Success));
    CHECK(h.session.state() == SessionState::Idle);
    REQUIRE(h.session.last_discovered().has_value());
    CHECK(*h.session.last_discovered() == wifi::SsidStr("WiiU5c6d7e"));
    CHECK(h.wifi.calls.front() == "scan:WiiU");
    CHECK(h.wifi.count("associate") == 0);
}

TEST_CASE("A failed SYNC forgets the network an earlier SYNC found") {
    Harness h;
    h.wifi.in_range = {"WiiU5c6d7e"};
    h.feed(make_sync(1));
    REQUIRE(h.session.last_discovered().has_value());

    h.wifi.in_range.clear();
    h.feed(make_sync(2));

    REQUIRE(h.replies.size() == 2);
    CHECK(is_status(h.replies[1], StatusCode::ErrGeneric));
    CHECK_FALSE(h.session.last_discovered().has_value());
}

TEST_CASE("SYNC provider error replies err_generic and keeps the state") {
    Harness h;
    h.wifi.scan_result = wifi::WifiResult::Error;
    h.session.mark_associated(wifi::SsidStr("WiiU1"), wifi::IpStr("10.0.0.5"));

    h.feed(make_sync(0));

    REQUIRE(h.replies.size() == 1);
    CHECK(is_status(h.replies[0], StatusCode::ErrGeneric));
    CHECK(h.session.state() == SessionState::Associated);
    CHECK(h.session.current_network().has_value());
}

TEST_CASE("CONNECT acks first, then associates and reports success") {
    Harness h;
    h.wifi.in_range = {"WiiU5c6d7e"};

    CHECK(h.feed(connect_to("WiiU5c6d7e")) == DispatchStatus::Handled);

    REQUIRE(h.replies.size() == 2);
    CHECK(h.replies[0].control_code == BIND_ACK);
    CHECK(is_status(h.replies[1], StatusCode::Success));

    CHECK(h.session.state() == SessionState::Associated);
    REQUIRE(h.session.current_network().has_value());
    CHECK(*h.session.current_network() == wifi::SsidStr("WiiU5c6d7e"));
    CHECK(h.session.current_address() == wifi::IpStr("192.168.1.11"));

    // BIND_ACK leaves before the provider is touched
    const long ack = h.index_of("reply:BIND_ACK");
    const long assoc = h.index_of("associate:WiiU5c6d7e");
    REQUIRE(ack >= 0);
    REQUIRE(assoc >= 0);
    CHECK(ack < assoc);
    CHECK(ack == 0);

    // secret passed through untouched
    REQUIRE(h.wifi.last_target.secret.size() == 32);
    CHECK(h.wifi.last_target.secret[31] == 31);
}

TEST_CASE("CONNECT to a network that is not in range fails with not_found") {
    Harness h;
    h.wifi.in_range = {"Other"};

    h.feed(connect_to("WiiU5c6d7e"));

    REQUIRE(h.replies.size() == 2);
    CHECK(h.replies[0].control_code == BIND_ACK);
    CHECK(is_status(h.replies[1], StatusCode::ErrNotFound));
    CHECK(h.session.state() == SessionState::Idle);
    CHECK_FALSE(h.session.current_network().has_value());
    CHECK(h.wifi.count("associate") == 0);
    CHECK(h.wifi.count("disassociate") == 1);
}

TEST_CASE("CONNECT association failure disassociates before reporting") {
    Harness h;
    h.wifi.in_range = {"WiiU5c6d7e"};
    h.wifi.associate_result = wifi::WifiResult::AuthFailed;

    h.feed(connect_to("WiiU5c6d7e"));

    REQUIRE(h.replies.size() == 2);
    CHECK(is_status(h.replies[1], StatusCode::ErrAssociation));
    CHECK(h.session.state() == SessionState::Idle);

    const long dis = h.index_of("disassociate");
    const long status = h.index_of("reply:STATUS");
    REQUIRE(dis >= 0);
    REQUIRE(status >= 0);
    CHECK(dis < status);
}

TEST_CASE("CONNECT with no link-up fails with no_link after the wait") {
    Harness h;
    h.wifi.in_range = {"WiiU5c6d7e"};
    h.wifi.link_up_after_associate = false;

    h.feed(connect_to("WiiU5c6d7e"));

    REQUIRE(h.replies.size() == 2);
    CHECK(is_status(h.replies[1], StatusCode::ErrNoLink));
    CHECK(h.session.state() == SessionState::Idle);
    CHECK(h.wifi.count("is_connected") >= 2);
    CHECK(h.wifi.count("disassociate") == 1);
    CHECK_FALSE(h.wifi.associated);
}

TEST_CASE("CONNECT without an address fails with no_address") {
    Harness h;
    h.wifi.in_range = {"WiiU5c6d7e"};
    h.wifi.ip.clear();

    h.feed(connect_to("WiiU5c6d7e"));

    REQUIRE(h.replies.size() == 2);
    CHECK(is_status(h.replies[1], StatusCode::ErrNoAddress));
    CHECK(h.session.state() == SessionState::Idle);
    CHECK(h.wifi.count("disassociate") == 1);
}

TEST_CASE("CONNECT with a bad payload replies invalid_argument without ack") {
    Harness h;
    std::vector<uint8_t> w(kFrameSize, 0);
    w[0] = CONNECT;
    w[kConnSsidLenOff] = 40;

    CHECK(h.feed_bytes(w) == DispatchStatus::Handled);

    REQUIRE(h.replies.size() == 1);
    CHECK(is_status(h.replies[0], StatusCode::ErrInvalidArgument));
    CHECK(h.wifi.calls.empty());
    CHECK(h.session.state() == SessionState::Idle);
}

TEST_CASE("CONNECT while associated is rejected without provider calls") {
    Harness h;
    h.session.mark_associated(wifi::SsidStr("WiiU1"), wifi::IpStr("10.0.0.5"));

    CHECK(h.feed(connect_to("WiiU2")) == DispatchStatus::Rejected);

    REQUIRE(h.replies.size() == 1);
    CHECK(is_status(h.replies[0], StatusCode::ErrGeneric));
    CHECK(h.wifi.calls.empty());
    CHECK(h.session.state() == SessionState::Associated);
    CHECK(h.broker.stats().rejected == 1);
}

TEST_CASE("UNBIND from Associated and from Idle always ends Idle") {
    Harness h;
    h.session.mark_associated(wifi::SsidStr("WiiU1"), wifi::IpStr("10.0.0.5"));

    h.feed(make_unbind());
    REQUIRE(h.replies.size() == 1);
    CHECK(is_status(h.replies[0], StatusCode::Success));
    CHECK(h.session.state() == SessionState::Idle);
    CHECK_FALSE(h.session.current_network().has_value());

    // second UNBIND is harmless and still calls the provider
    h.feed(make_unbind());
    REQUIRE(h.replies.size() == 2);
    CHECK(is_status(h.replies[1], StatusCode::Success));
    CHECK(h.session.state() == SessionState::Idle);
    CHECK(h.wifi.count("disassociate") == 2);
}

TEST_CASE("UNBIND reports a provider failure but still forces Idle") {
    Harness h;
    h.session.mark_associated(wifi::SsidStr("WiiU1"), wifi::IpStr("10.0.0.5"));
    h.wifi.disassoc_result = wifi::WifiResult::Error;

    h.feed(make_unbind());
    REQUIRE(h.replies.size() == 1);
    CHECK(is_status(h.replies[0], StatusCode::ErrGeneric));
    CHECK(h.session.state() == SessionState::Idle);
}

TEST_CASE("QUIT sends nothing and everything after it is ignored") {
    Harness h;
    h.wifi.in_range = {"WiiU1"};

    CHECK(h.feed(make_quit()) == DispatchStatus::Handled);
    CHECK(h.replies.empty());
    CHECK(h.session.state() == SessionState::ShuttingDown);

    CHECK(h.feed(make_sync(1)) == DispatchStatus::Ignored);
    CHECK(h.feed(connect_to("WiiU1")) == DispatchStatus::Ignored);
    CHECK(h.feed(make_quit()) == DispatchStatus::Ignored);
    CHECK(h.replies.empty());
    CHECK(h.wifi.calls.empty());
    CHECK(h.broker.stats().ignored == 3);
}

TEST_CASE("Malformed and unknown frames are dropped silently") {
    Harness h;

    std::vector<uint8_t> short_buf(8, 0);
    short_buf[0] = SYNC;
    CHECK(h.feed_bytes(short_buf) == DispatchStatus::Malformed);

    std::vector<uint8_t> unknown(kFrameSize, 0);
    unknown[0] = 0x7F;
    CHECK(h.feed_bytes(unknown) == DispatchStatus::Unknown);

    // broker->frontend codes arriving at the broker are unknown too
    CHECK(h.feed(make_status(StatusCode::Success)) == DispatchStatus::Unknown);
    CHECK(h.feed(make_bind_ack()) == DispatchStatus::Unknown);

    CHECK(h.replies.empty());
    CHECK(h.wifi.calls.empty());
    CHECK(h.session.state() == SessionState::Idle);
    CHECK(h.broker.stats().malformed == 1);
    CHECK(h.broker.stats().unknown == 3);
    CHECK(h.log.str().find("reason=malformed len=8") != std::string::npos);

    // still responsive afterwards
    h.wifi.in_range = {"WiiU1"};
    h.feed(make_sync(0));
    REQUIRE(h.replies.size() == 1);
    CHECK(is_status(h.replies[0], StatusCode::Success));
}

TEST_CASE("Failed sends are counted, never retried") {
    Harness h;
    h.send_ok = false;

    h.feed(make_unbind());
    CHECK(h.replies.size() == 1);
    CHECK(h.broker.stats().send_failures == 1);
    CHECK(h.broker.stats().replies_sent == 0);
}

TEST_CASE("The secret never reaches the diagnostic log") {
    Harness h;
    h.wifi.in_range = {"WiiU1"};

    wifi::TargetNetwork t;
    t.ssid = wifi::SsidStr("WiiU1");
    const std::string pass = "hunter2hunter2";
    t.secret.assign(pass.begin(), pass.end());
    h.feed(make_connect(t));

    CHECK(h.log.str().find(pass) == std::string::npos);
    CHECK(h.log.str().find("event=connect status=ok") != std::string::npos);
}
