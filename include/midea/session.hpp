#ifndef MIDEA_SESSION_HPP
#define MIDEA_SESSION_HPP

#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <midea/air_conditioner.hpp>
#include <midea/discovery.hpp>
#include <midea/fsm.hpp>
#include <midea/security.hpp>
#include <midea/session_states.hpp>
#include <midea/transport.hpp>

namespace midea {

namespace detail {

using SessionFSMBuffer = fsm::buffer::SwapBuffer<64, 0, 1>;
using SessionFSM = fsm::FSM<SessionEvent, int, SessionFSMBuffer>;

struct SessionContext {
    SessionState state{SessionState::Disconnected};
    // states entered since the last drain, reported outside the session lock
    std::vector<SessionState> entered;
};

} // namespace detail

/**
 * \brief Connection to one air conditioner.
 *
 * Owns the link, the key material and the attribute model of a single
 * appliance.  All public members are safe to call from several threads; the
 * status and state callbacks run on the calling thread after the session lock
 * has been released.
 *
 * Reconnection is left to the owner: the session only exposes connect,
 * disconnect and its state so a supervising loop can apply backoff.
 */
class DeviceSession {
public:
    using status_callback_t = std::function<void(const ChangeSet& changes)>;
    using state_callback_t = std::function<void(SessionState state)>;

    DeviceSession(const DeviceInfo& info, std::unique_ptr<transport::Link> link, random_fn_t random = nullptr);
    ~DeviceSession();

    DeviceSession(const DeviceSession&) = delete;
    DeviceSession& operator=(const DeviceSession&) = delete;

    void set_credentials(const Bytes& token, const Bytes& key);
    /// Hex encoded credentials as persisted by the host; throws
    /// std::invalid_argument on malformed hex.
    void set_credentials_hex(const std::string& token, const std::string& key);

    /// Open the link and run the handshake.  With @p retry_handshake_on_failure
    /// up to max_retries() attempts are made.  Any failure is summarised as
    /// Error::Connection, details via get_error().
    Error connect(bool retry_handshake_on_failure);
    std::shared_future<Error> connect_async(bool retry_handshake_on_failure);
    void disconnect();

    SessionState state() const;
    std::string get_error() const;
    Error last_error() const;

    std::vector<messages::Command> build_query() const;
    Error refresh_status();
    Error send(const messages::Command& command);
    Error send_heartbeat();

    /// Feed bytes received from the appliance.  Frames that fail to decode are
    /// logged and dropped; the connection survives them.
    Error receive(const uint8_t* data, size_t len);

    /// Read from the link for at most @p timeout_ms and process what arrived.
    Error poll(uint32_t timeout_ms);

    Error set_attribute(const DesiredAttributes& desired);
    Error set_attribute(const std::string& name, const AttributeValue& value);
    Error set_target_temperature(double value, int mode = 0);
    Error set_swing(bool horizontal, bool vertical);

    void set_status_callback(status_callback_t cb);
    void set_state_callback(state_callback_t cb);

    AttributeSet attributes() const;
    FreshAirVersion fresh_air_version() const;
    ProtocolFamily family() const;

    const DeviceInfo& info() const {
        return device;
    }

private:
    using Lock = std::unique_lock<std::mutex>;

    struct Pending {
        std::vector<ChangeSet> changes;
        std::vector<SessionState> states;
    };

    void dispatch(SessionEvent ev);
    bool uses_handshake() const;
    Error connect_once();
    Error handshake(Security& session_security, const Bytes& credentials_token, const Bytes& credentials_key,
                    Bytes& leftover, std::string& why);
    Error send_locked(const messages::Command& command);
    Error send_outbound(std::vector<OutboundCommand> commands, Pending& pending);
    Error write_packet(const Bytes& packet);
    Error process_rx(Pending& pending);
    Error handle_packet(const uint8_t* data, size_t len, Pending& pending);
    Error drop(Error err, const char* what);
    void teardown(const char* reason);
    void set_error(Error err, const std::string& msg);
    uint8_t next_message_id();
    void drain_states(Pending& pending);
    void notify(const Pending& pending);

    DeviceInfo device;
    std::unique_ptr<transport::Link> link;
    Security security;
    AirConditioner appliance;

    detail::SessionFSMBuffer machine_buf{};
    detail::SessionContext ctx{};
    detail::SessionFSM machine{machine_buf};

    Bytes token;
    Bytes key;
    Bytes rx_buffer;
    uint8_t message_id{0};
    uint8_t protocol_version{0};
    uint32_t integrity_errors{0};

    std::string error;
    Error last{Error::Ok};

    status_callback_t status_cb;
    state_callback_t state_cb;

    mutable std::mutex mtx;
    std::mutex connect_mtx;
    std::shared_future<Error> pending_connect;
    bool connecting{false};
    bool connect_cancelled{false};
};

} // namespace midea

#endif // MIDEA_SESSION_HPP
