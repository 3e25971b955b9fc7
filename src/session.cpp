#include <midea/session.hpp>

#include <algorithm>
#include <chrono>
#include <future>
#include <string>

#include <midea/config.hpp>
#include <midea/endian.hpp>
#include <midea/hex.hpp>
#include <midea/log.hpp>
#include <midea/packet.hpp>
#include <midea/response.hpp>

const char* to_string(SessionState state) {
    switch (state) {
    case SessionState::Disconnected:
        return "Disconnected";
    case SessionState::Handshaking:
        return "Handshaking";
    case SessionState::Connected:
        return "Connected";
    }
    return "Unknown";
}

namespace midea {

namespace {

using SessionFSM = detail::SessionFSM;
using Allocator = SessionFSM::StateAllocatorType;

void enter_state(detail::SessionContext& ctx, SessionState state) {
    ctx.state = state;
    ctx.entered.push_back(state);
}

struct DisconnectedState : public SessionFSM::SimpleStateType {
    detail::SessionContext& ctx;
    DisconnectedState(detail::SessionContext& c) : ctx(c) {
    }
    void enter() override {
        enter_state(ctx, SessionState::Disconnected);
    }
    fsm::states::HandleEventResult handle_event(Allocator& alloc, SessionEvent ev) override;
};

struct HandshakingState : public SessionFSM::SimpleStateType {
    detail::SessionContext& ctx;
    HandshakingState(detail::SessionContext& c) : ctx(c) {
    }
    void enter() override {
        enter_state(ctx, SessionState::Handshaking);
    }
    fsm::states::HandleEventResult handle_event(Allocator& alloc, SessionEvent ev) override;
};

struct ConnectedState : public SessionFSM::SimpleStateType {
    detail::SessionContext& ctx;
    ConnectedState(detail::SessionContext& c) : ctx(c) {
    }
    void enter() override {
        enter_state(ctx, SessionState::Connected);
    }
    fsm::states::HandleEventResult handle_event(Allocator& alloc, SessionEvent ev) override;
};

fsm::states::HandleEventResult DisconnectedState::handle_event(Allocator& alloc, SessionEvent ev) {
    if (ev == SessionEvent::Connect)
        return alloc.create_simple<HandshakingState>(ctx);
    if (ev == SessionEvent::Disconnect || ev == SessionEvent::TransportError)
        return Allocator::HANDLED_INTERNALLY;
    return Allocator::PASS_ON;
}

fsm::states::HandleEventResult HandshakingState::handle_event(Allocator& alloc, SessionEvent ev) {
    if (ev == SessionEvent::HandshakeOk)
        return alloc.create_simple<ConnectedState>(ctx);
    if (ev == SessionEvent::HandshakeFailed || ev == SessionEvent::TransportError || ev == SessionEvent::Disconnect)
        return alloc.create_simple<DisconnectedState>(ctx);
    return Allocator::PASS_ON;
}

fsm::states::HandleEventResult ConnectedState::handle_event(Allocator& alloc, SessionEvent ev) {
    if (ev == SessionEvent::TransportError || ev == SessionEvent::Disconnect)
        return alloc.create_simple<DisconnectedState>(ctx);
    return Allocator::PASS_ON;
}

const size_t READ_CHUNK = 1024;

} // namespace

DeviceSession::DeviceSession(const DeviceInfo& info, std::unique_ptr<transport::Link> l, random_fn_t random) :
    device(info), link(std::move(l)), security(std::move(random)) {
    machine.reset<DisconnectedState>(ctx);
    ctx.entered.clear();
}

DeviceSession::~DeviceSession() {
    std::shared_future<Error> in_flight;
    {
        Lock lock(mtx);
        connect_cancelled = true;
        in_flight = pending_connect;
    }
    if (in_flight.valid())
        in_flight.wait();

    Lock lock(mtx);
    if (link)
        link->close();
}

void DeviceSession::set_credentials(const Bytes& t, const Bytes& k) {
    Lock lock(mtx);
    token = t;
    key = k;
}

void DeviceSession::set_credentials_hex(const std::string& t, const std::string& k) {
    const Bytes token_bytes = from_hex(t);
    const Bytes key_bytes = from_hex(k);
    set_credentials(token_bytes, key_bytes);
}

void DeviceSession::dispatch(SessionEvent ev) {
    const SessionState before = ctx.state;
    if (machine.handle_event(ev) != fsm::HandleEventResult::SUCCESS) {
        MIDEA_LOGD(MIDEA_LOG_TAG, "event %d ignored in %s", static_cast<int>(ev), to_string(before));
        return;
    }
    if (before != ctx.state)
        MIDEA_LOGD(MIDEA_LOG_TAG, "%s -> %s", to_string(before), to_string(ctx.state));
}

bool DeviceSession::uses_handshake() const {
    return device.version == defs::ProtocolVersion::V3;
}

void DeviceSession::set_error(Error err, const std::string& msg) {
    last = err;
    error = msg;
}

void DeviceSession::drain_states(Pending& pending) {
    pending.states.insert(pending.states.end(), ctx.entered.begin(), ctx.entered.end());
    ctx.entered.clear();
}

void DeviceSession::notify(const Pending& pending) {
    status_callback_t on_status;
    state_callback_t on_state;
    {
        Lock lock(mtx);
        on_status = status_cb;
        on_state = state_cb;
    }

    if (on_state) {
        for (auto state : pending.states)
            on_state(state);
    }
    if (on_status) {
        for (const auto& changes : pending.changes)
            on_status(changes);
    }
}

Error DeviceSession::connect(bool retry_handshake_on_failure) {
    std::lock_guard<std::mutex> serial(connect_mtx);
    {
        Lock lock(mtx);
        if (ctx.state == SessionState::Connected)
            return Error::Ok;
        connect_cancelled = false;
    }

    const uint32_t attempts = retry_handshake_on_failure ? std::max<uint32_t>(1, max_retries()) : 1;
    Error result = Error::Connection;
    for (uint32_t attempt = 1; attempt <= attempts; ++attempt) {
        const Error err = connect_once();
        Lock lock(mtx);
        if (err == Error::Ok) {
            result = Error::Ok;
            MIDEA_LOGI(MIDEA_LOG_TAG, "connected to %s:%u", device.ip.c_str(), device.port);
            break;
        }
        MIDEA_LOGW(MIDEA_LOG_TAG, "connect %s attempt %u/%u failed: %s", device.ip.c_str(), attempt, attempts,
                   error.c_str());
        // new credentials are needed, retrying cannot help
        if (err == Error::Credential || connect_cancelled)
            break;
    }

    Pending pending;
    {
        Lock lock(mtx);
        if (result != Error::Ok)
            set_error(Error::Connection, "connection to " + device.ip + " failed: " + error);
        drain_states(pending);
    }
    notify(pending);
    return result;
}

std::shared_future<Error> DeviceSession::connect_async(bool retry_handshake_on_failure) {
    std::shared_future<Error> finished;
    std::shared_future<Error> started;
    {
        Lock lock(mtx);
        if (pending_connect.valid() &&
            pending_connect.wait_for(std::chrono::seconds(0)) != std::future_status::ready)
            return pending_connect;

        // a finished future may own the worker thread, release it outside the lock
        finished = std::move(pending_connect);
        started = std::async(std::launch::async,
                             [this, retry_handshake_on_failure] { return connect(retry_handshake_on_failure); })
                      .share();
        pending_connect = started;
    }
    return started;
}

Error DeviceSession::connect_once() {
    Security candidate;
    Bytes credentials_token;
    Bytes credentials_key;
    {
        Lock lock(mtx);
        dispatch(SessionEvent::Connect);
        security.reset();
        rx_buffer.clear();
        integrity_errors = 0;

        if (!link) {
            set_error(Error::Transport, "no transport link");
            dispatch(SessionEvent::TransportError);
            return Error::Transport;
        }
        connecting = true;
        candidate = security;
        credentials_token = token;
        credentials_key = key;
    }

    // link I/O runs unlocked, disconnect() only flags the attempt meanwhile
    Error err = Error::Ok;
    SessionEvent failure = SessionEvent::HandshakeFailed;
    std::string why;
    Bytes leftover;
    if (!link->open(connect_timeout_ms())) {
        err = Error::Connection;
        failure = SessionEvent::TransportError;
        why = "unable to open link";
    } else if (uses_handshake()) {
        err = handshake(candidate, credentials_token, credentials_key, leftover, why);
        if (err != Error::Ok)
            link->close();
    }

    Lock lock(mtx);
    connecting = false;
    if (err == Error::Ok && (connect_cancelled || ctx.state != SessionState::Handshaking)) {
        link->close();
        err = Error::Connection;
        why = "connect cancelled";
    }
    if (err != Error::Ok) {
        set_error(err, why);
        dispatch(failure);
        return err;
    }

    security = std::move(candidate);
    rx_buffer = std::move(leftover);
    dispatch(SessionEvent::HandshakeOk);
    error.clear();
    last = Error::Ok;
    return Error::Ok;
}

Error DeviceSession::handshake(Security& session_security, const Bytes& credentials_token,
                               const Bytes& credentials_key, Bytes& leftover, std::string& why) {
    using namespace std::chrono;

    if (credentials_token.empty() || credentials_key.empty()) {
        why = "no credentials";
        return Error::Credential;
    }

    const Bytes request = session_security.handshake_request(credentials_token);
    if (!link->write(request.data(), request.size(), handshake_timeout_ms())) {
        why = "handshake write failed";
        return Error::Transport;
    }

    Bytes reply;
    size_t frame_len = 0;
    uint8_t buf[READ_CHUNK];
    const auto deadline = steady_clock::now() + milliseconds(handshake_timeout_ms());

    while (frame_len == 0) {
        const auto now = steady_clock::now();
        if (now >= deadline)
            break;

        size_t n = 0;
        const auto remaining = static_cast<uint32_t>(duration_cast<milliseconds>(deadline - now).count());
        const auto res = link->read(buf, sizeof(buf), &n, remaining);
        if (res == transport::LinkError::Transport) {
            why = "link closed during handshake";
            return Error::Transport;
        }
        if (res != transport::LinkError::Ok)
            continue;
        reply.insert(reply.end(), buf, buf + n);

        if (reply.size() < 2)
            continue;
        if (reply[0] != defs::V3_MAGIC_0 || reply[1] != defs::V3_MAGIC_1) {
            // "ERROR" or garbage, let the security layer judge it
            frame_len = reply.size();
        } else if (reply.size() >= defs::V3_HEADER_LEN) {
            const size_t need = load_be16(&reply[2]) + defs::V3_HEADER_LEN + defs::V3_COUNTER_LEN;
            if (reply.size() >= need)
                frame_len = need;
        }
    }

    if (frame_len == 0) {
        why = "handshake timed out";
        return Error::Timeout;
    }

    const Error err = session_security.handshake_complete(reply.data(), frame_len, credentials_key);
    if (err != Error::Ok) {
        why = std::string("handshake rejected: ") + to_string(err);
        return err;
    }

    leftover.assign(reply.begin() + static_cast<std::ptrdiff_t>(frame_len), reply.end());
    return Error::Ok;
}

void DeviceSession::teardown(const char* reason) {
    MIDEA_LOGW(MIDEA_LOG_TAG, "closing connection to %s: %s", device.ip.c_str(), reason);
    if (link)
        link->close();
    rx_buffer.clear();
    security.reset();
    dispatch(SessionEvent::TransportError);
}

void DeviceSession::disconnect() {
    Pending pending;
    {
        Lock lock(mtx);
        if (ctx.state == SessionState::Disconnected)
            return;
        // an attempt still owns the link, it closes it when it sees the flag
        if (connecting)
            connect_cancelled = true;
        else if (link)
            link->close();
        rx_buffer.clear();
        security.reset();
        dispatch(SessionEvent::Disconnect);
        drain_states(pending);
    }
    notify(pending);
}

SessionState DeviceSession::state() const {
    Lock lock(mtx);
    return ctx.state;
}

std::string DeviceSession::get_error() const {
    Lock lock(mtx);
    return error;
}

Error DeviceSession::last_error() const {
    Lock lock(mtx);
    return last;
}

uint8_t DeviceSession::next_message_id() {
    if (++message_id >= defs::MESSAGE_ID_MAX)
        message_id = 1;
    return message_id;
}

std::vector<messages::Command> DeviceSession::build_query() const {
    Lock lock(mtx);
    return appliance.build_query();
}

Error DeviceSession::write_packet(const Bytes& pkt) {
    Bytes out;
    if (uses_handshake()) {
        if (security.encode_8370(pkt, defs::TcpMessageType::EncryptedRequest, out) != Error::Ok) {
            set_error(Error::Transport, "unable to encrypt transport frame");
            teardown("encryption failed");
            return Error::Transport;
        }
    } else {
        out = pkt;
    }

    if (!link || !link->write(out.data(), out.size(), connect_timeout_ms())) {
        set_error(Error::Transport, "write failed");
        teardown("write failed");
        return Error::Transport;
    }
    return Error::Ok;
}

Error DeviceSession::send_locked(const messages::Command& command) {
    if (ctx.state != SessionState::Connected) {
        set_error(Error::Connection, "not connected");
        return Error::Connection;
    }

    const Bytes frame = messages::encode(command, protocol_version, next_message_id());
    const Bytes pkt = packet::build(security, device.id, frame);
    if (pkt.empty()) {
        set_error(Error::Transport, "unable to encrypt message");
        teardown("encryption failed");
        return Error::Transport;
    }

    MIDEA_LOGD(MIDEA_LOG_TAG, "send %s (%zu bytes)", messages::command_name(command), frame.size());
    return write_packet(pkt);
}

Error DeviceSession::send(const messages::Command& command) {
    Pending pending;
    Error err;
    {
        Lock lock(mtx);
        err = send_locked(command);
        drain_states(pending);
    }
    notify(pending);
    return err;
}

Error DeviceSession::refresh_status() {
    Pending pending;
    Error err = Error::Ok;
    {
        Lock lock(mtx);
        for (const auto& command : appliance.build_query()) {
            err = send_locked(command);
            if (err != Error::Ok)
                break;
        }
        drain_states(pending);
    }
    notify(pending);
    return err;
}

Error DeviceSession::send_heartbeat() {
    Pending pending;
    Error err;
    {
        Lock lock(mtx);
        if (ctx.state != SessionState::Connected)
            return Error::Connection;
        err = write_packet(packet::build_heartbeat(device.id));
        drain_states(pending);
    }
    notify(pending);
    return err;
}

Error DeviceSession::drop(Error err, const char* what) {
    MIDEA_LOGW(MIDEA_LOG_TAG, "%s from %s dropped: %s", what, device.ip.c_str(), to_string(err));
    last = err;

    if (err == Error::Integrity) {
        ++integrity_errors;
        const uint32_t limit = max_integrity_errors();
        if (limit > 0 && integrity_errors >= limit) {
            set_error(Error::Integrity, "repeated integrity failures");
            teardown("repeated integrity failures");
        }
    }
    return err;
}

Error DeviceSession::handle_packet(const uint8_t* data, size_t len, Pending& pending) {
    Bytes frame;
    bool heartbeat = false;
    Error err = packet::parse(security, data, len, frame, heartbeat);
    if (err != Error::Ok)
        return drop(err, "lan packet");
    if (heartbeat) {
        MIDEA_LOGD(MIDEA_LOG_TAG, "heartbeat from %s", device.ip.c_str());
        return Error::Ok;
    }

    messages::Response response;
    err = messages::decode(frame.data(), frame.size(), response, power_analysis_method());
    if (err != Error::Ok)
        return drop(err, "appliance frame");

    integrity_errors = 0;
    if (response.protocol_version != protocol_version) {
        MIDEA_LOGD(MIDEA_LOG_TAG, "protocol version %u", response.protocol_version);
        protocol_version = response.protocol_version;
    }

    ChangeSet changes = appliance.process_incoming(response);
    if (!changes.empty())
        pending.changes.push_back(std::move(changes));
    return Error::Ok;
}

Error DeviceSession::process_rx(Pending& pending) {
    Error result = Error::Ok;

    while (!rx_buffer.empty() && ctx.state == SessionState::Connected) {
        if (uses_handshake()) {
            Bytes pkt;
            size_t consumed = 0;
            const Error err = security.decode_8370(rx_buffer.data(), rx_buffer.size(), pkt, consumed);
            if (err == Error::Ok && consumed == 0)
                break;
            rx_buffer.erase(rx_buffer.begin(), rx_buffer.begin() + static_cast<std::ptrdiff_t>(consumed));
            if (err != Error::Ok) {
                result = drop(err, "transport frame");
                continue;
            }
            const Error pkt_err = handle_packet(pkt.data(), pkt.size(), pending);
            if (pkt_err != Error::Ok)
                result = pkt_err;
            continue;
        }

        if (rx_buffer.size() >= 2 &&
            (rx_buffer[0] != defs::PACKET_MAGIC_0 || rx_buffer[1] != defs::PACKET_MAGIC_1)) {
            rx_buffer.clear();
            result = drop(Error::MalformedFrame, "lan packet");
            break;
        }
        const size_t len = packet::pending_length(rx_buffer.data(), rx_buffer.size());
        if (len == 0)
            break;
        if (len < defs::PACKET_MIN_LEN) {
            rx_buffer.clear();
            result = drop(Error::MalformedFrame, "lan packet");
            break;
        }
        if (rx_buffer.size() < len)
            break;

        const Bytes pkt(rx_buffer.begin(), rx_buffer.begin() + static_cast<std::ptrdiff_t>(len));
        rx_buffer.erase(rx_buffer.begin(), rx_buffer.begin() + static_cast<std::ptrdiff_t>(len));
        const Error pkt_err = handle_packet(pkt.data(), pkt.size(), pending);
        if (pkt_err != Error::Ok)
            result = pkt_err;
    }
    return result;
}

Error DeviceSession::receive(const uint8_t* data, size_t len) {
    Pending pending;
    Error err;
    {
        Lock lock(mtx);
        if (ctx.state != SessionState::Connected)
            return Error::Connection;
        rx_buffer.insert(rx_buffer.end(), data, data + len);
        err = process_rx(pending);
        drain_states(pending);
    }
    notify(pending);
    return err;
}

Error DeviceSession::poll(uint32_t timeout_ms) {
    Pending pending;
    Error err = Error::Ok;
    {
        Lock lock(mtx);
        if (ctx.state != SessionState::Connected || !link)
            return Error::Connection;

        uint8_t buf[READ_CHUNK];
        size_t n = 0;
        const auto res = link->read(buf, sizeof(buf), &n, timeout_ms);
        if (res == transport::LinkError::Timeout)
            return Error::Ok;
        if (res == transport::LinkError::Transport) {
            set_error(Error::Transport, "read failed");
            teardown("read failed");
            err = Error::Transport;
        } else {
            rx_buffer.insert(rx_buffer.end(), buf, buf + n);
            err = process_rx(pending);
        }
        drain_states(pending);
    }
    notify(pending);
    return err;
}

Error DeviceSession::send_outbound(std::vector<OutboundCommand> commands, Pending& pending) {
    for (auto& command : commands) {
        const Error err = send_locked(command.command);
        if (err != Error::Ok)
            return err;
        ChangeSet changes = appliance.commit(command.optimistic);
        if (!changes.empty())
            pending.changes.push_back(std::move(changes));
    }
    return Error::Ok;
}

Error DeviceSession::set_attribute(const DesiredAttributes& desired) {
    Pending pending;
    Error err;
    {
        Lock lock(mtx);
        err = send_outbound(appliance.build_command(desired), pending);
        drain_states(pending);
    }
    notify(pending);
    return err;
}

Error DeviceSession::set_attribute(const std::string& name, const AttributeValue& value) {
    Attr attr;
    if (!attribute_from_name(name, attr)) {
        MIDEA_LOGW(MIDEA_LOG_TAG, "unknown attribute %s ignored", name.c_str());
        return Error::Ok;
    }
    return set_attribute(DesiredAttributes{{attr, value}});
}

Error DeviceSession::set_target_temperature(double value, int mode) {
    Pending pending;
    Error err;
    {
        Lock lock(mtx);
        std::vector<OutboundCommand> commands;
        commands.push_back(appliance.set_target_temperature(value, mode));
        err = send_outbound(std::move(commands), pending);
        drain_states(pending);
    }
    notify(pending);
    return err;
}

Error DeviceSession::set_swing(bool horizontal, bool vertical) {
    Pending pending;
    Error err;
    {
        Lock lock(mtx);
        std::vector<OutboundCommand> commands;
        commands.push_back(appliance.set_swing(horizontal, vertical));
        err = send_outbound(std::move(commands), pending);
        drain_states(pending);
    }
    notify(pending);
    return err;
}

void DeviceSession::set_status_callback(status_callback_t cb) {
    Lock lock(mtx);
    status_cb = std::move(cb);
}

void DeviceSession::set_state_callback(state_callback_t cb) {
    Lock lock(mtx);
    state_cb = std::move(cb);
}

AttributeSet DeviceSession::attributes() const {
    Lock lock(mtx);
    return appliance.attributes();
}

FreshAirVersion DeviceSession::fresh_air_version() const {
    Lock lock(mtx);
    return appliance.fresh_air_version();
}

ProtocolFamily DeviceSession::family() const {
    Lock lock(mtx);
    return appliance.family();
}

} // namespace midea
