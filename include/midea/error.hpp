#ifndef MIDEA_ERROR_HPP
#define MIDEA_ERROR_HPP

namespace midea {

enum class Error {
    Ok,
    Connection,
    Transport,
    Integrity,
    MalformedFrame,
    UnknownFrameType,
    UnsupportedFeature,
    Credential,
    Timeout,
};

const char* to_string(Error err);

} // namespace midea

#endif // MIDEA_ERROR_HPP
