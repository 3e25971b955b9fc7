#ifndef MIDEA_SESSION_STATES_HPP
#define MIDEA_SESSION_STATES_HPP

#include <cstdint>

enum class SessionState : uint8_t {
    Disconnected = 0,
    Handshaking = 1,
    Connected = 2,
};

const char* to_string(SessionState state);

#endif // MIDEA_SESSION_STATES_HPP
