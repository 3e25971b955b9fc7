#include <midea/config.hpp>

namespace midea {

static config g_cfg{}; // default-initialized with default values

const config& get_config() { return g_cfg; }

void set_config(const config& cfg) { g_cfg = cfg; }

uint32_t connect_timeout_ms() { return g_cfg.connect_timeout_ms; }
void set_connect_timeout_ms(uint32_t ms) { g_cfg.connect_timeout_ms = ms; }

uint32_t handshake_timeout_ms() { return g_cfg.handshake_timeout_ms; }
void set_handshake_timeout_ms(uint32_t ms) { g_cfg.handshake_timeout_ms = ms; }

uint32_t io_timeout_ms() { return g_cfg.io_timeout_ms; }
void set_io_timeout_ms(uint32_t ms) { g_cfg.io_timeout_ms = ms; }

uint32_t heartbeat_interval_ms() { return g_cfg.heartbeat_interval_ms; }
void set_heartbeat_interval_ms(uint32_t ms) { g_cfg.heartbeat_interval_ms = ms; }

uint32_t max_retries() { return g_cfg.max_retries; }
void set_max_retries(uint32_t retries) { g_cfg.max_retries = retries; }

uint32_t max_integrity_errors() { return g_cfg.max_integrity_errors; }
void set_max_integrity_errors(uint32_t count) { g_cfg.max_integrity_errors = count; }

uint8_t power_analysis_method() { return g_cfg.power_analysis_method; }
void set_power_analysis_method(uint8_t method) { g_cfg.power_analysis_method = method; }

double temperature_step() { return g_cfg.temperature_step; }
void set_temperature_step(double step) { g_cfg.temperature_step = step; }

bool packet_sign_verified() { return g_cfg.verify_packet_sign; }
void set_packet_sign_verified(bool verify) { g_cfg.verify_packet_sign = verify; }

} // namespace midea
