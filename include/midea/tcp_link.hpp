#ifndef MIDEA_TCP_LINK_HPP
#define MIDEA_TCP_LINK_HPP

#include <midea/defs.hpp>
#include <midea/transport.hpp>
#include <string>

namespace midea {

class TcpLink : public transport::Link {
public:
    explicit TcpLink(const std::string& ip, uint16_t port = defs::DEVICE_PORT);
    ~TcpLink() override;

    bool open(uint32_t timeout_ms) override;
    bool write(const uint8_t* buf, size_t len, uint32_t timeout_ms) override;
    transport::LinkError read(uint8_t* buf, size_t len, size_t* out_len, uint32_t timeout_ms) override;
    void close() override;
    bool is_open() const override {
        return fd >= 0;
    }

private:
    std::string address;
    uint16_t port;
    int fd{-1};
};

} // namespace midea

#endif // MIDEA_TCP_LINK_HPP
