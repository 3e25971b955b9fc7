#include <midea/security.hpp>

#include <algorithm>
#include <cstring>
#include <utility>

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <hash_library/md5.h>
#include <hash_library/sha256.h>

#include <midea/endian.hpp>

namespace midea {

namespace {

Error evp_crypt(const EVP_CIPHER* cipher, const uint8_t* key, bool padding, bool enc, const uint8_t* in,
                size_t len, Bytes& out) {
    // ECB ignores the iv, CBC runs with an all-zero one
    const uint8_t iv[16] = {0};

    EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
    if (!ctx) {
        out.clear();
        return Error::Integrity;
    }

    out.resize(len + EVP_MAX_BLOCK_LENGTH);
    int out_len = 0;
    int final_len = 0;
    bool ok = EVP_CipherInit_ex(ctx, cipher, nullptr, key, iv, enc ? 1 : 0) == 1 &&
              EVP_CIPHER_CTX_set_padding(ctx, padding ? 1 : 0) == 1 &&
              EVP_CipherUpdate(ctx, out.data(), &out_len, in, static_cast<int>(len)) == 1 &&
              EVP_CipherFinal_ex(ctx, out.data() + out_len, &final_len) == 1;
    EVP_CIPHER_CTX_free(ctx);

    if (!ok) {
        out.clear();
        return Error::Integrity;
    }
    out.resize(static_cast<size_t>(out_len + final_len));
    return Error::Ok;
}

void sha256_of(const uint8_t* a, size_t a_len, const uint8_t* b, size_t b_len, uint8_t hash[SHA256::HashBytes]) {
    SHA256 sha256;
    sha256.add(a, a_len);
    if (b_len)
        sha256.add(b, b_len);
    sha256.getHash(hash);
}

bool is_encrypted(defs::TcpMessageType type) {
    return type == defs::TcpMessageType::EncryptedRequest || type == defs::TcpMessageType::EncryptedResponse;
}

} // namespace

Security::Security(random_fn_t r) : random(std::move(r)) {
    if (!random) {
        random = [](uint8_t* buf, size_t len) {
            if (RAND_bytes(buf, static_cast<int>(len)) != 1)
                std::fill(buf, buf + len, 0);
        };
    }

    MD5 md5;
    md5.add(defs::SIGN_KEY, defs::SIGN_KEY_LEN);
    md5.getHash(enc_key);
}

Error Security::encrypt(const Bytes& body, const uint8_t key[16], Bytes& out) {
    return evp_crypt(EVP_aes_128_ecb(), key, true, true, body.data(), body.size(), out);
}

Error Security::decrypt(const Bytes& body, const uint8_t key[16], Bytes& out) {
    if (body.empty() || body.size() % 16 != 0) {
        out.clear();
        return Error::Integrity;
    }
    return evp_crypt(EVP_aes_128_ecb(), key, true, false, body.data(), body.size(), out);
}

Bytes Security::aes_encrypt(const Bytes& body) const {
    Bytes out;
    if (encrypt(body, enc_key, out) != Error::Ok)
        out.clear();
    return out;
}

Error Security::aes_decrypt(const Bytes& body, Bytes& out) const {
    return decrypt(body, enc_key, out);
}

Error Security::aes_cbc_encrypt(const Bytes& plain, const Bytes& key, Bytes& out) {
    if (key.size() != defs::KEY_LEN || plain.size() % 16 != 0) {
        out.clear();
        return Error::Integrity;
    }
    return evp_crypt(EVP_aes_256_cbc(), key.data(), false, true, plain.data(), plain.size(), out);
}

Error Security::aes_cbc_decrypt(const Bytes& cipher, const Bytes& key, Bytes& out) {
    if (key.size() != defs::KEY_LEN || cipher.size() % 16 != 0) {
        out.clear();
        return Error::Integrity;
    }
    return evp_crypt(EVP_aes_256_cbc(), key.data(), false, false, cipher.data(), cipher.size(), out);
}

void Security::sign_packet(const uint8_t* data, size_t len, uint8_t sign[defs::PACKET_SIGN_LEN]) {
    MD5 md5;
    md5.add(data, len);
    md5.add(defs::SIGN_KEY, defs::SIGN_KEY_LEN);
    md5.getHash(sign);
}

bool Security::verify_packet(const uint8_t* packet, size_t len) {
    if (len < defs::PACKET_SIGN_LEN)
        return false;
    uint8_t sign[defs::PACKET_SIGN_LEN];
    sign_packet(packet, len - defs::PACKET_SIGN_LEN, sign);
    return memcmp(sign, packet + len - defs::PACKET_SIGN_LEN, defs::PACKET_SIGN_LEN) == 0;
}

Bytes Security::handshake_request(const Bytes& token) {
    Bytes out;
    encode_8370(token, defs::TcpMessageType::HandshakeRequest, out);
    return out;
}

Error Security::handshake_complete(const uint8_t* reply, size_t len, const Bytes& key) {
    static const char ERROR_REPLY[] = "ERROR";

    tcp_key.clear();
    if (len >= sizeof(ERROR_REPLY) - 1 && memcmp(reply, ERROR_REPLY, sizeof(ERROR_REPLY) - 1) == 0)
        return Error::Connection;
    if (len < defs::HANDSHAKE_MIN_REPLY_LEN)
        return Error::Connection;
    if (key.size() != defs::KEY_LEN)
        return Error::Credential;

    // reply bytes 8..71: AES-256-CBC(plain) followed by SHA256(plain)
    const size_t offset = defs::V3_HEADER_LEN + defs::V3_COUNTER_LEN;
    if (len < offset + defs::HANDSHAKE_PAYLOAD_LEN)
        return Error::Connection;

    Bytes payload(reply + offset, reply + offset + defs::KEY_LEN);
    const uint8_t* sign = reply + offset + defs::KEY_LEN;

    Bytes plain;
    if (aes_cbc_decrypt(payload, key, plain) != Error::Ok)
        return Error::Integrity;

    uint8_t hash[SHA256::HashBytes];
    sha256_of(plain.data(), plain.size(), nullptr, 0, hash);
    if (memcmp(hash, sign, sizeof(hash)) != 0)
        return Error::Integrity;

    tcp_key.resize(defs::KEY_LEN);
    for (size_t i = 0; i < defs::KEY_LEN; ++i)
        tcp_key[i] = plain[i] ^ key[i];

    request_count = 0;
    response_count = 0;
    return Error::Ok;
}

Error Security::encode_8370(const Bytes& data, defs::TcpMessageType type, Bytes& out) {
    out.clear();
    const bool encrypted = is_encrypted(type);
    if (encrypted && tcp_key.empty())
        return Error::Connection;

    Bytes body(defs::V3_COUNTER_LEN + data.size());
    store_be16(body.data(), request_count);
    std::copy(data.begin(), data.end(), body.begin() + defs::V3_COUNTER_LEN);
    ++request_count;

    size_t padding = 0;
    if (encrypted && body.size() % 16 != 0) {
        padding = 16 - body.size() % 16;
        const size_t start = body.size();
        body.resize(start + padding);
        random(body.data() + start, padding);
    }

    const size_t size = data.size() + padding + (encrypted ? defs::V3_SIGN_LEN : 0);
    uint8_t header[defs::V3_HEADER_LEN] = {defs::V3_MAGIC_0, defs::V3_MAGIC_1, 0, 0, defs::V3_FIXED_BYTE,
                                           static_cast<uint8_t>((padding << 4) | static_cast<uint8_t>(type))};
    store_be16(header + 2, static_cast<uint16_t>(size));

    out.assign(header, header + sizeof(header));
    if (!encrypted) {
        out.insert(out.end(), body.begin(), body.end());
        return Error::Ok;
    }

    uint8_t sign[SHA256::HashBytes];
    sha256_of(header, sizeof(header), body.data(), body.size(), sign);

    Bytes cipher;
    auto err = aes_cbc_encrypt(body, tcp_key, cipher);
    if (err != Error::Ok) {
        out.clear();
        return err;
    }
    out.insert(out.end(), cipher.begin(), cipher.end());
    out.insert(out.end(), sign, sign + sizeof(sign));
    return Error::Ok;
}

Error Security::decode_8370(const uint8_t* data, size_t len, Bytes& packet, size_t& consumed) {
    packet.clear();
    consumed = 0;
    if (len < defs::V3_HEADER_LEN)
        return Error::Ok;

    if (data[0] != defs::V3_MAGIC_0 || data[1] != defs::V3_MAGIC_1) {
        consumed = len;
        return Error::MalformedFrame;
    }

    const size_t size = load_be16(data + 2) + defs::V3_HEADER_LEN + defs::V3_COUNTER_LEN;
    if (len < size)
        return Error::Ok;
    consumed = size;

    if (data[4] != defs::V3_FIXED_BYTE)
        return Error::MalformedFrame;

    const size_t padding = data[5] >> 4;
    const auto type = static_cast<defs::TcpMessageType>(data[5] & 0x0F);

    Bytes body(data + defs::V3_HEADER_LEN, data + size);
    if (is_encrypted(type)) {
        if (tcp_key.empty())
            return Error::Integrity;
        if (body.size() < defs::V3_SIGN_LEN || (body.size() - defs::V3_SIGN_LEN) % 16 != 0)
            return Error::MalformedFrame;

        const uint8_t* sign = body.data() + body.size() - defs::V3_SIGN_LEN;
        Bytes cipher(body.begin(), body.end() - defs::V3_SIGN_LEN);
        Bytes plain;
        if (aes_cbc_decrypt(cipher, tcp_key, plain) != Error::Ok)
            return Error::Integrity;

        uint8_t hash[SHA256::HashBytes];
        sha256_of(data, defs::V3_HEADER_LEN, plain.data(), plain.size(), hash);
        if (memcmp(hash, sign, sizeof(hash)) != 0)
            return Error::Integrity;

        if (padding > plain.size())
            return Error::MalformedFrame;
        plain.resize(plain.size() - padding);
        body.swap(plain);
    }

    if (body.size() < defs::V3_COUNTER_LEN)
        return Error::MalformedFrame;

    response_count = load_be16(body.data());
    packet.assign(body.begin() + defs::V3_COUNTER_LEN, body.end());
    return Error::Ok;
}

void Security::reset() {
    tcp_key.clear();
    request_count = 0;
    response_count = 0;
}

} // namespace midea
