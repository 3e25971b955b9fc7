#pragma once

#include <stddef.h>
#include <stdint.h>


namespace midea {

struct config {
    uint32_t connect_timeout_ms = 5000;
    uint32_t handshake_timeout_ms = 5000;
    uint32_t io_timeout_ms = 10;
    uint32_t heartbeat_interval_ms = 10000;
    uint32_t max_retries = 3;
    uint32_t max_integrity_errors = 3;
    uint8_t power_analysis_method = 2;
    double temperature_step = 0.5;
    bool verify_packet_sign = true;
};

const config& get_config();
void set_config(const config& cfg);

uint32_t connect_timeout_ms();
void set_connect_timeout_ms(uint32_t ms);

uint32_t handshake_timeout_ms();
void set_handshake_timeout_ms(uint32_t ms);

uint32_t io_timeout_ms();
void set_io_timeout_ms(uint32_t ms);

uint32_t heartbeat_interval_ms();
void set_heartbeat_interval_ms(uint32_t ms);

uint32_t max_retries();
void set_max_retries(uint32_t retries);

uint32_t max_integrity_errors();
void set_max_integrity_errors(uint32_t count);

uint8_t power_analysis_method();
void set_power_analysis_method(uint8_t method);

double temperature_step();
void set_temperature_step(double step);

bool packet_sign_verified();
void set_packet_sign_verified(bool verify);

} // namespace midea
