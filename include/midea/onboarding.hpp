#ifndef MIDEA_ONBOARDING_HPP
#define MIDEA_ONBOARDING_HPP

#include <mutex>
#include <string>

#include <midea/session.hpp>

namespace midea {

/// Byte order of the device id when asking the cloud for a token.
enum class Endianness : uint8_t {
    Little,
    Big,
};

const char* to_string(Endianness endianness);

/// Remote source of (token, key) pairs, e.g. a cloud account.
class CredentialProvider {
public:
    virtual bool logged_in() const = 0;
    virtual Error login() = 0;
    virtual Error get_token(uint64_t device_id, Endianness endianness, Bytes& token, Bytes& key) = 0;
    virtual ~CredentialProvider() = default;
};

/// Credentials as the host persists them.
struct PersistedCredentials {
    std::string token;
    std::string key;
};

/**
 * \brief Serialises logins of one credential provider.
 *
 * Several appliances may be onboarded concurrently; only one of them runs the
 * login flow while the others wait and then reuse the session.
 */
class LoginGate {
public:
    Error ensure_login(CredentialProvider& provider);

private:
    std::mutex mtx;
};

/// First pairing: log in, then try little and big endian tokens in that
/// order until one connects.  On success @p out holds the hex credentials to
/// persist.
Error onboard(DeviceSession& session, CredentialProvider& provider, LoginGate& gate, PersistedCredentials& out);

/// Reconnect with credentials persisted by an earlier onboard().
Error restore(DeviceSession& session, const PersistedCredentials& saved);

} // namespace midea

#endif // MIDEA_ONBOARDING_HPP
