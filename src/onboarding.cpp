#include <midea/onboarding.hpp>

#include <stdexcept>

#include <midea/hex.hpp>
#include <midea/log.hpp>

namespace midea {

const char* to_string(Endianness endianness) {
    return endianness == Endianness::Little ? "little" : "big";
}

Error LoginGate::ensure_login(CredentialProvider& provider) {
    std::lock_guard<std::mutex> lock(mtx);
    if (provider.logged_in())
        return Error::Ok;

    const Error err = provider.login();
    if (err != Error::Ok) {
        MIDEA_LOGE(MIDEA_LOG_TAG, "login failed: %s", to_string(err));
        return Error::Credential;
    }
    return Error::Ok;
}

Error onboard(DeviceSession& session, CredentialProvider& provider, LoginGate& gate, PersistedCredentials& out) {
    const DeviceInfo& info = session.info();
    Error err = gate.ensure_login(provider);
    if (err != Error::Ok)
        return err;

    bool got_token = false;
    for (auto endianness : {Endianness::Little, Endianness::Big}) {
        Bytes token;
        Bytes key;
        err = provider.get_token(info.id, endianness, token, key);
        if (err != Error::Ok || token.empty() || key.empty()) {
            MIDEA_LOGD(MIDEA_LOG_TAG, "no %s-endian token for %s: %s", to_string(endianness), info.name.c_str(),
                       to_string(err));
            continue;
        }

        got_token = true;
        session.set_credentials(token, key);
        if (session.connect(false) == Error::Ok) {
            out.token = to_hex(token);
            out.key = to_hex(key);
            MIDEA_LOGI(MIDEA_LOG_TAG, "paired %s with %s-endian token", info.name.c_str(), to_string(endianness));
            return Error::Ok;
        }
        MIDEA_LOGD(MIDEA_LOG_TAG, "%s-endian token rejected by %s", to_string(endianness), info.name.c_str());
    }

    MIDEA_LOGE(MIDEA_LOG_TAG, "cannot connect to %s:%u", info.ip.c_str(), info.port);
    return got_token ? Error::Connection : Error::Credential;
}

Error restore(DeviceSession& session, const PersistedCredentials& saved) {
    try {
        session.set_credentials_hex(saved.token, saved.key);
    } catch (const std::invalid_argument& e) {
        MIDEA_LOGE(MIDEA_LOG_TAG, "stored credentials for %s unusable: %s", session.info().name.c_str(), e.what());
        return Error::Credential;
    }
    return session.connect(false);
}

} // namespace midea
