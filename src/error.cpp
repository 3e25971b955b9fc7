#include <midea/error.hpp>

namespace midea {

const char* to_string(Error err) {
    switch (err) {
    case Error::Ok:
        return "Ok";
    case Error::Connection:
        return "ConnectionError";
    case Error::Transport:
        return "TransportError";
    case Error::Integrity:
        return "IntegrityError";
    case Error::MalformedFrame:
        return "MalformedFrameError";
    case Error::UnknownFrameType:
        return "UnknownFrameTypeError";
    case Error::UnsupportedFeature:
        return "UnsupportedFeatureError";
    case Error::Credential:
        return "CredentialError";
    case Error::Timeout:
        return "Timeout";
    }
    return "Unknown";
}

} // namespace midea
