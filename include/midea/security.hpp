#ifndef MIDEA_SECURITY_HPP
#define MIDEA_SECURITY_HPP

#include <functional>

#include <midea/defs.hpp>
#include <midea/error.hpp>

namespace midea {

using random_fn_t = std::function<void(uint8_t* buf, size_t len)>;

/**
 * \brief Key material and transforms for one appliance session.
 *
 * The lan packet layer uses AES-128-ECB under MD5(SIGN_KEY) and an MD5
 * signature over the packet.  V3 appliances additionally wrap every packet in
 * an "8370" frame encrypted with a session key negotiated during the
 * handshake.  Randomness (frame padding) comes from the injected random
 * function; when none is given OpenSSL's RAND_bytes is used.
 *
 * One instance belongs to exactly one DeviceSession; nothing is shared.
 */
class Security {
public:
    explicit Security(random_fn_t random = nullptr);

    static Error encrypt(const Bytes& body, const uint8_t key[16], Bytes& out);
    static Error decrypt(const Bytes& body, const uint8_t key[16], Bytes& out);

    Bytes aes_encrypt(const Bytes& body) const;
    Error aes_decrypt(const Bytes& body, Bytes& out) const;

    static Error aes_cbc_encrypt(const Bytes& plain, const Bytes& key, Bytes& out);
    static Error aes_cbc_decrypt(const Bytes& cipher, const Bytes& key, Bytes& out);

    static void sign_packet(const uint8_t* data, size_t len, uint8_t sign[defs::PACKET_SIGN_LEN]);
    static bool verify_packet(const uint8_t* packet, size_t len);

    Bytes handshake_request(const Bytes& token);
    Error handshake_complete(const uint8_t* reply, size_t len, const Bytes& key);

    Error encode_8370(const Bytes& data, defs::TcpMessageType type, Bytes& out);

    /// Decode one 8370 frame from the front of @p data.  When the frame is
    /// incomplete Ok is returned with @p consumed set to 0.  On any error
    /// @p consumed tells how many bytes to discard.
    Error decode_8370(const uint8_t* data, size_t len, Bytes& packet, size_t& consumed);

    bool has_session_key() const {
        return !tcp_key.empty();
    }

    const Bytes& session_key() const {
        return tcp_key;
    }

    uint16_t get_response_count() const {
        return response_count;
    }

    void reset();

private:
    random_fn_t random;
    uint8_t enc_key[16]{};
    Bytes tcp_key;
    uint16_t request_count{0};
    uint16_t response_count{0};
};

} // namespace midea

#endif // MIDEA_SECURITY_HPP
