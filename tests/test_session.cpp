#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <stdexcept>
#include <thread>

#include <midea/config.hpp>
#include <midea/device_io.hpp>
#include <midea/packet.hpp>
#include <midea/session.hpp>

#include "test_helpers.hpp"

using midea::Attr;
using midea::AttributeValue;
using midea::Bytes;
using midea::ChangeSet;
using midea::DeviceSession;
using midea::Error;
using midea::Security;
namespace defs = midea::defs;
namespace messages = midea::messages;
namespace packet = midea::packet;

namespace {

const uint64_t DEVICE_ID = 0x0000112233445566ull;
const Bytes KEY = test::sequence(32, 0x10);
const Bytes PLAIN = test::sequence(32, 0xA0);
const Bytes TOKEN = test::sequence(64, 0x01);

midea::DeviceInfo device_info(defs::ProtocolVersion version) {
    midea::DeviceInfo info;
    info.ip = "192.168.1.20";
    info.id = DEVICE_ID;
    info.name = "net_ac_1A2B";
    info.type = 0xAC;
    info.version = version;
    return info;
}

struct Harness {
    explicit Harness(defs::ProtocolVersion version) {
        auto mock = std::make_unique<test::MockLink>();
        link = mock.get();
        session = std::make_unique<DeviceSession>(device_info(version), std::move(mock));
        session->set_state_callback([this](SessionState state) { states.push_back(state); });
        session->set_status_callback([this](const ChangeSet& c) { changes.push_back(c); });
    }

    /// Lan packet as the appliance would send it.
    Bytes lan_packet(const Bytes& frame) const {
        return packet::build(lan, DEVICE_ID, frame);
    }

    /// Inner frame of the n-th packet written by the session (V2 only).
    messages::Frame written_frame(size_t n) const {
        Bytes frame;
        bool heartbeat = false;
        EXPECT_EQ(packet::parse(lan, link->writes.at(n).data(), link->writes.at(n).size(), frame, heartbeat),
                  Error::Ok);
        messages::Frame out;
        EXPECT_EQ(messages::decode_frame(frame.data(), frame.size(), out), Error::Ok);
        return out;
    }

    test::MockLink* link{nullptr};
    std::vector<SessionState> states;
    std::vector<ChangeSet> changes;
    Security lan;
    std::unique_ptr<DeviceSession> session;
};

class SessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        saved = midea::get_config();
        midea::set_handshake_timeout_ms(200);
    }
    void TearDown() override {
        midea::set_config(saved);
    }

    midea::config saved;
};

void answer_handshake(test::MockLink& link) {
    link.on_write = [&link](const Bytes& written) {
        if (written.size() >= 2 && written[0] == 0x83 && link.writes.size() == 1)
            link.rx.push_back(test::handshake_reply(KEY, PLAIN));
    };
}

} // namespace

TEST_F(SessionTest, V2ConnectSkipsHandshake) {
    Harness h(defs::ProtocolVersion::V2);
    ASSERT_EQ(h.session->connect(false), Error::Ok);
    EXPECT_EQ(h.session->state(), SessionState::Connected);
    EXPECT_EQ(h.link->opens, 1);
    EXPECT_TRUE(h.link->writes.empty());
    EXPECT_EQ(h.states, (std::vector<SessionState>{SessionState::Handshaking, SessionState::Connected}));

    // already connected
    EXPECT_EQ(h.session->connect(false), Error::Ok);
    EXPECT_EQ(h.link->opens, 1);
}

TEST_F(SessionTest, ConnectFailureIsSummarised) {
    midea::set_max_retries(3);
    Harness h(defs::ProtocolVersion::V2);
    h.link->open_ok = false;

    EXPECT_EQ(h.session->connect(true), Error::Connection);
    EXPECT_EQ(h.link->opens, 3);
    EXPECT_EQ(h.session->state(), SessionState::Disconnected);
    EXPECT_EQ(h.session->last_error(), Error::Connection);
    EXPECT_NE(h.session->get_error().find("unable to open link"), std::string::npos);
    EXPECT_EQ(h.states.size(), 6u);
    EXPECT_EQ(h.states.back(), SessionState::Disconnected);
}

TEST_F(SessionTest, ConnectAsync) {
    Harness h(defs::ProtocolVersion::V2);
    auto result = h.session->connect_async(false);
    EXPECT_EQ(result.get(), Error::Ok);
    EXPECT_EQ(h.session->state(), SessionState::Connected);
}

TEST_F(SessionTest, ConnectAsyncWhileConnecting) {
    Harness h(defs::ProtocolVersion::V2);
    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();
    std::atomic<bool> opening{false};
    h.link->on_open = [&opening, gate] {
        opening = true;
        gate.wait();
    };

    auto first = h.session->connect_async(true);
    while (!opening)
        std::this_thread::yield();

    // the link is still opening, none of these may wait for it
    auto second = h.session->connect_async(true);
    EXPECT_EQ(h.session->state(), SessionState::Handshaking);
    EXPECT_EQ(h.session->send(messages::Query{}), Error::Connection);

    release.set_value();
    EXPECT_EQ(first.get(), Error::Ok);
    EXPECT_EQ(second.get(), Error::Ok);
    EXPECT_EQ(h.link->opens, 1);
    EXPECT_EQ(h.session->state(), SessionState::Connected);

    // a finished attempt does not hold back the next one
    h.session->disconnect();
    h.link->on_open = nullptr;
    EXPECT_EQ(h.session->connect_async(false).get(), Error::Ok);
    EXPECT_EQ(h.link->opens, 2);
}

TEST_F(SessionTest, DisconnectCancelsConnectInProgress) {
    midea::set_max_retries(3);
    Harness h(defs::ProtocolVersion::V2);
    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();
    std::atomic<bool> opening{false};
    h.link->on_open = [&opening, gate] {
        opening = true;
        gate.wait();
    };

    auto pending = h.session->connect_async(true);
    while (!opening)
        std::this_thread::yield();
    h.session->disconnect();
    EXPECT_EQ(h.session->state(), SessionState::Disconnected);
    EXPECT_EQ(h.link->closes, 0);

    release.set_value();
    EXPECT_EQ(pending.get(), Error::Connection);
    EXPECT_EQ(h.session->state(), SessionState::Disconnected);
    EXPECT_EQ(h.link->opens, 1);
    EXPECT_EQ(h.link->closes, 1);
    EXPECT_NE(h.session->get_error().find("connect cancelled"), std::string::npos);
}

TEST_F(SessionTest, SendRequiresConnection) {
    Harness h(defs::ProtocolVersion::V2);
    EXPECT_EQ(h.session->send(messages::Query{}), Error::Connection);
    EXPECT_EQ(h.session->refresh_status(), Error::Connection);
    EXPECT_EQ(h.session->send_heartbeat(), Error::Connection);
    EXPECT_TRUE(h.link->writes.empty());
}

TEST_F(SessionTest, RefreshSendsQueries) {
    Harness h(defs::ProtocolVersion::V2);
    ASSERT_EQ(h.session->connect(false), Error::Ok);
    ASSERT_EQ(h.session->refresh_status(), Error::Ok);

    ASSERT_EQ(h.link->writes.size(), 3u);
    const auto query = h.written_frame(0);
    EXPECT_EQ(query.type, defs::FrameType::Request);
    EXPECT_EQ(query.body[0], defs::BODY_QUERY);
    EXPECT_EQ(query.body[22], 1);
    EXPECT_EQ(h.written_frame(1).body[0], defs::BODY_NEW_PROTOCOL_QUERY);
    EXPECT_EQ(h.written_frame(2).body[0], defs::BODY_QUERY);
    EXPECT_EQ(h.written_frame(2).body[1], 0x21);
}

TEST_F(SessionTest, ReceiveMergesStatus) {
    Harness h(defs::ProtocolVersion::V2);
    ASSERT_EQ(h.session->connect(false), Error::Ok);

    const Bytes pkt = h.lan_packet(test::response_frame(test::status_body(true, 2, 23, 60), 0x04, 3));
    ASSERT_EQ(h.session->receive(pkt.data(), pkt.size()), Error::Ok);

    ASSERT_EQ(h.changes.size(), 1u);
    EXPECT_EQ(h.changes[0].at(Attr::Power), AttributeValue(true));
    EXPECT_EQ(h.changes[0].at(Attr::FanSpeed), AttributeValue(60));
    EXPECT_DOUBLE_EQ(h.session->attributes().get_number(Attr::TargetTemperature), 23.0);

    // the protocol version reported by the appliance is echoed back
    ASSERT_EQ(h.session->send(messages::Query{}), Error::Ok);
    EXPECT_EQ(h.written_frame(0).protocol_version, 3);
}

TEST_F(SessionTest, ReceiveReassemblesSplitPackets) {
    Harness h(defs::ProtocolVersion::V2);
    ASSERT_EQ(h.session->connect(false), Error::Ok);

    const Bytes a = h.lan_packet(test::response_frame(test::status_body(true, 2, 24, 102)));
    const Bytes b = h.lan_packet(test::response_frame(test::status_body(true, 3, 24, 102)));
    Bytes stream = a;
    stream.insert(stream.end(), b.begin(), b.end());

    const size_t split = a.size() + 10;
    ASSERT_EQ(h.session->receive(stream.data(), split), Error::Ok);
    EXPECT_EQ(h.changes.size(), 1u);
    ASSERT_EQ(h.session->receive(stream.data() + split, stream.size() - split), Error::Ok);
    ASSERT_EQ(h.changes.size(), 2u);
    EXPECT_EQ(h.changes[1].at(Attr::Mode), AttributeValue(3));
}

TEST_F(SessionTest, CorruptedPacketIsDroppedAndLogged) {
    Harness h(defs::ProtocolVersion::V2);
    ASSERT_EQ(h.session->connect(false), Error::Ok);
    test::LogCapture logs;

    Bytes pkt = h.lan_packet(test::response_frame(test::status_body(true, 2, 24, 102)));
    pkt[48] ^= 0x5A;
    EXPECT_EQ(h.session->receive(pkt.data(), pkt.size()), Error::Integrity);

    EXPECT_EQ(h.session->state(), SessionState::Connected);
    EXPECT_TRUE(h.changes.empty());
    EXPECT_TRUE(logs.contains("IntegrityError"));
    EXPECT_EQ(h.link->closes, 0);
}

TEST_F(SessionTest, BadFrameChecksumIsDropped) {
    Harness h(defs::ProtocolVersion::V2);
    ASSERT_EQ(h.session->connect(false), Error::Ok);
    test::LogCapture logs;

    Bytes frame = test::response_frame(test::status_body(true, 2, 24, 102));
    frame.back() ^= 0xFF;
    const Bytes pkt = h.lan_packet(frame);
    EXPECT_EQ(h.session->receive(pkt.data(), pkt.size()), Error::MalformedFrame);

    EXPECT_EQ(h.session->state(), SessionState::Connected);
    EXPECT_TRUE(h.changes.empty());
    EXPECT_TRUE(logs.contains("MalformedFrameError"));
}

TEST_F(SessionTest, RepeatedIntegrityErrorsCloseConnection) {
    midea::set_max_integrity_errors(3);
    Harness h(defs::ProtocolVersion::V2);
    ASSERT_EQ(h.session->connect(false), Error::Ok);

    Bytes bad = h.lan_packet(test::response_frame(test::status_body(true, 2, 24, 102)));
    bad.back() ^= 0x01;
    const Bytes good = h.lan_packet(test::response_frame(test::status_body(true, 2, 24, 102)));

    h.session->receive(bad.data(), bad.size());
    h.session->receive(bad.data(), bad.size());
    // a good packet resets the count
    ASSERT_EQ(h.session->receive(good.data(), good.size()), Error::Ok);
    h.session->receive(bad.data(), bad.size());
    h.session->receive(bad.data(), bad.size());
    EXPECT_EQ(h.session->state(), SessionState::Connected);

    h.session->receive(bad.data(), bad.size());
    EXPECT_EQ(h.session->state(), SessionState::Disconnected);
    EXPECT_EQ(h.link->closes, 1);
    EXPECT_EQ(h.states.back(), SessionState::Disconnected);
}

TEST_F(SessionTest, GarbageResynchronises) {
    Harness h(defs::ProtocolVersion::V2);
    ASSERT_EQ(h.session->connect(false), Error::Ok);

    const Bytes junk = {0x01, 0x02, 0x03};
    EXPECT_EQ(h.session->receive(junk.data(), junk.size()), Error::MalformedFrame);

    const Bytes pkt = h.lan_packet(test::response_frame(test::status_body(true, 2, 24, 102)));
    EXPECT_EQ(h.session->receive(pkt.data(), pkt.size()), Error::Ok);
    EXPECT_EQ(h.changes.size(), 1u);
}

TEST_F(SessionTest, SetAttributeCommitsOptimistically) {
    Harness h(defs::ProtocolVersion::V2);
    ASSERT_EQ(h.session->connect(false), Error::Ok);

    ASSERT_EQ(h.session->set_attribute({{Attr::FanSpeed, 40}}), Error::Ok);
    ASSERT_EQ(h.link->writes.size(), 1u);
    const auto frame = h.written_frame(0);
    EXPECT_EQ(frame.type, defs::FrameType::Set);
    EXPECT_EQ(frame.body[0], defs::BODY_GENERAL_SET);
    EXPECT_EQ(frame.body[3], 40);

    ASSERT_EQ(h.changes.size(), 1u);
    EXPECT_EQ(h.changes[0].at(Attr::FanSpeed), AttributeValue(40));
    EXPECT_EQ(h.session->attributes().get_int(Attr::FanSpeed), 40);
}

TEST_F(SessionTest, FailedSendKeepsAttributes) {
    Harness h(defs::ProtocolVersion::V2);
    ASSERT_EQ(h.session->connect(false), Error::Ok);
    h.link->write_ok = false;

    EXPECT_EQ(h.session->set_attribute({{Attr::FanSpeed, 40}}), Error::Transport);
    EXPECT_EQ(h.session->attributes().get_int(Attr::FanSpeed), 102);
    EXPECT_EQ(h.session->state(), SessionState::Disconnected);
}

TEST_F(SessionTest, SetAttributeByName) {
    Harness h(defs::ProtocolVersion::V2);
    ASSERT_EQ(h.session->connect(false), Error::Ok);
    test::LogCapture logs;

    ASSERT_EQ(h.session->set_attribute("SCREEN_DISPAY", true), Error::Ok);
    ASSERT_EQ(h.link->writes.size(), 1u);
    const auto frame = h.written_frame(0);
    EXPECT_EQ(frame.body[0], defs::BODY_QUERY);
    EXPECT_EQ(frame.body[4], 0x02);

    EXPECT_EQ(h.session->set_attribute("NO_SUCH_THING", true), Error::Ok);
    EXPECT_EQ(h.link->writes.size(), 1u);
    EXPECT_TRUE(logs.contains("NO_SUCH_THING"));
}

TEST_F(SessionTest, TargetTemperatureAndSwing) {
    Harness h(defs::ProtocolVersion::V2);
    ASSERT_EQ(h.session->connect(false), Error::Ok);

    ASSERT_EQ(h.session->set_target_temperature(21.5, 2), Error::Ok);
    ASSERT_EQ(h.session->set_swing(false, true), Error::Ok);
    ASSERT_EQ(h.link->writes.size(), 2u);

    const auto temperature = h.written_frame(0);
    EXPECT_EQ(temperature.body[1] & 0x01, 0x01);
    EXPECT_EQ(temperature.body[2], 0x55);
    EXPECT_EQ(h.written_frame(1).body[7], 0x3C);

    const auto attrs = h.session->attributes();
    EXPECT_DOUBLE_EQ(attrs.get_number(Attr::TargetTemperature), 21.5);
    EXPECT_TRUE(attrs.get_bool(Attr::SwingVertical));
}

TEST_F(SessionTest, HeartbeatAndHeartbeatReply) {
    Harness h(defs::ProtocolVersion::V2);
    ASSERT_EQ(h.session->connect(false), Error::Ok);

    ASSERT_EQ(h.session->send_heartbeat(), Error::Ok);
    ASSERT_EQ(h.link->writes.size(), 1u);
    EXPECT_EQ(h.link->writes[0].size(), 56u);

    const Bytes ack = packet::build_heartbeat(DEVICE_ID);
    EXPECT_EQ(h.session->receive(ack.data(), ack.size()), Error::Ok);
    EXPECT_TRUE(h.changes.empty());
}

TEST_F(SessionTest, PollReadsFromLink) {
    Harness h(defs::ProtocolVersion::V2);
    ASSERT_EQ(h.session->connect(false), Error::Ok);

    EXPECT_EQ(h.session->poll(1), Error::Ok);
    EXPECT_TRUE(h.changes.empty());

    h.link->rx.push_back(h.lan_packet(test::response_frame(test::status_body(true, 2, 24, 102))));
    EXPECT_EQ(h.session->poll(1), Error::Ok);
    EXPECT_EQ(h.changes.size(), 1u);

    h.link->read_fails = true;
    EXPECT_EQ(h.session->poll(1), Error::Transport);
    EXPECT_EQ(h.session->state(), SessionState::Disconnected);
    EXPECT_EQ(h.session->poll(1), Error::Connection);
}

TEST_F(SessionTest, Disconnect) {
    Harness h(defs::ProtocolVersion::V2);
    ASSERT_EQ(h.session->connect(false), Error::Ok);
    h.session->disconnect();
    EXPECT_EQ(h.session->state(), SessionState::Disconnected);
    EXPECT_EQ(h.states.back(), SessionState::Disconnected);
    EXPECT_EQ(h.link->closes, 1);

    const Bytes pkt = h.lan_packet(test::response_frame(test::status_body(true, 2, 24, 102)));
    EXPECT_EQ(h.session->receive(pkt.data(), pkt.size()), Error::Connection);
}

TEST_F(SessionTest, V3HandshakeAndEncryptedTraffic) {
    Harness h(defs::ProtocolVersion::V3);
    answer_handshake(*h.link);
    h.session->set_credentials(TOKEN, KEY);

    ASSERT_EQ(h.session->connect(false), Error::Ok);
    ASSERT_EQ(h.link->writes.size(), 1u);
    const Bytes& request = h.link->writes[0];
    ASSERT_EQ(request.size(), 72u);
    EXPECT_EQ(request[0], 0x83);
    EXPECT_EQ(request[1], 0x70);
    EXPECT_TRUE(std::equal(TOKEN.begin(), TOKEN.end(), request.begin() + 8));

    Security device;
    const Bytes reply = test::handshake_reply(KEY, PLAIN);
    ASSERT_EQ(device.handshake_complete(reply.data(), reply.size(), KEY), Error::Ok);

    // outbound: 8370 wrapped lan packet
    ASSERT_EQ(h.session->send(messages::Query{}), Error::Ok);
    const Bytes& wrapped = h.link->writes[1];
    Bytes pkt;
    size_t consumed = 0;
    ASSERT_EQ(device.decode_8370(wrapped.data(), wrapped.size(), pkt, consumed), Error::Ok);
    EXPECT_EQ(consumed, wrapped.size());
    Bytes frame;
    bool heartbeat = false;
    ASSERT_EQ(packet::parse(h.lan, pkt.data(), pkt.size(), frame, heartbeat), Error::Ok);
    EXPECT_EQ(frame[10], defs::BODY_QUERY);

    // inbound
    Bytes response;
    ASSERT_EQ(device.encode_8370(h.lan_packet(test::response_frame(test::status_body(true, 4, 28, 80))),
                                 defs::TcpMessageType::EncryptedResponse, response),
              Error::Ok);
    ASSERT_EQ(h.session->receive(response.data(), response.size()), Error::Ok);
    ASSERT_EQ(h.changes.size(), 1u);
    EXPECT_EQ(h.session->attributes().get_int(Attr::Mode), 4);
}

TEST_F(SessionTest, V3HandshakeRejected) {
    Harness h(defs::ProtocolVersion::V3);
    h.link->on_write = [&h](const Bytes&) { h.link->rx.push_back(test::error_reply()); };
    h.session->set_credentials(TOKEN, KEY);

    EXPECT_EQ(h.session->connect(false), Error::Connection);
    EXPECT_EQ(h.session->state(), SessionState::Disconnected);
    EXPECT_NE(h.session->get_error().find("handshake rejected"), std::string::npos);
    EXPECT_EQ(h.link->closes, 1);
}

TEST_F(SessionTest, V3HandshakeTimesOut) {
    midea::set_handshake_timeout_ms(20);
    Harness h(defs::ProtocolVersion::V3);
    h.session->set_credentials(TOKEN, KEY);

    EXPECT_EQ(h.session->connect(false), Error::Connection);
    EXPECT_NE(h.session->get_error().find("timed out"), std::string::npos);
}

TEST_F(SessionTest, V3WithoutCredentialsDoesNotRetry) {
    midea::set_max_retries(3);
    Harness h(defs::ProtocolVersion::V3);

    EXPECT_EQ(h.session->connect(true), Error::Connection);
    EXPECT_EQ(h.link->opens, 1);
    EXPECT_NE(h.session->get_error().find("no credentials"), std::string::npos);
}

TEST_F(SessionTest, MalformedHexCredentials) {
    Harness h(defs::ProtocolVersion::V3);
    EXPECT_THROW(h.session->set_credentials_hex("abc", "00"), std::invalid_argument);
}

TEST_F(SessionTest, DeviceIOProcess) {
    midea::set_heartbeat_interval_ms(0);
    Harness h(defs::ProtocolVersion::V2);
    ASSERT_EQ(h.session->connect(false), Error::Ok);

    std::vector<ChangeSet> seen;
    midea::DeviceIO io(*h.session);
    io.run([&seen](const ChangeSet& c) { seen.push_back(c); }, false);

    h.link->rx.push_back(h.lan_packet(test::response_frame(test::status_body(true, 2, 24, 102))));
    EXPECT_EQ(io.process(1), Error::Ok);
    EXPECT_EQ(seen.size(), 1u);
    EXPECT_TRUE(h.link->writes.empty());

    h.session->disconnect();
    EXPECT_EQ(io.process(1), Error::Connection);
}

TEST_F(SessionTest, DeviceIOSendsHeartbeats) {
    midea::set_heartbeat_interval_ms(1);
    Harness h(defs::ProtocolVersion::V2);
    ASSERT_EQ(h.session->connect(false), Error::Ok);

    midea::DeviceIO io(*h.session);
    io.run([](const ChangeSet&) {}, false);
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    EXPECT_EQ(io.process(1), Error::Ok);
    ASSERT_EQ(h.link->writes.size(), 1u);
    EXPECT_EQ(h.link->writes[0][3], 0x10);
}

TEST_F(SessionTest, DeviceIOBackgroundLoop) {
    midea::set_heartbeat_interval_ms(0);
    midea::set_io_timeout_ms(1);
    Harness h(defs::ProtocolVersion::V2);
    ASSERT_EQ(h.session->connect(false), Error::Ok);
    h.link->rx.push_back(h.lan_packet(test::response_frame(test::status_body(true, 2, 24, 102))));

    std::atomic<int> seen{0};
    midea::DeviceIO io(*h.session);
    io.run([&seen](const ChangeSet&) { ++seen; });

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (seen == 0 && std::chrono::steady_clock::now() < deadline)
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    io.quit();
    EXPECT_EQ(seen, 1);
}
