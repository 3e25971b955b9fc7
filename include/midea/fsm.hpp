#ifndef MIDEA_FSM_HPP
#define MIDEA_FSM_HPP

#include <fsm/buffer.hpp>
#include <fsm/fsm.hpp>
#include <fsm/states.hpp>

namespace midea {

// Re-export libfsm into the midea namespace for convenience
namespace fsm = ::fsm;

enum class SessionEvent {
    Connect,
    HandshakeOk,
    HandshakeFailed,
    TransportError,
    Disconnect,
};

} // namespace midea

#endif // MIDEA_FSM_HPP
