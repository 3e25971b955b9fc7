#include <midea/device_io.hpp>

#include <midea/config.hpp>
#include <midea/log.hpp>

namespace midea {

DeviceIO::DeviceIO(DeviceSession& s) : session(s), last_heartbeat(std::chrono::steady_clock::now()) {
}

DeviceIO::~DeviceIO() {
    quit();
}

void DeviceIO::run(std::function<StatusHandlerFnType> callback, bool spawn_background) {
    session.set_status_callback(std::move(callback));
    running = true;

    if (!spawn_background) {
        return;
    }
    loop_thread = std::thread(&DeviceIO::loop, this);
}

void DeviceIO::quit() {
    if (!running) {
        return;
    }

    running = false;
    if (loop_thread.joinable())
        loop_thread.join();
}

void DeviceIO::loop() {
    while (running) {
        const Error err = process(io_timeout_ms());
        if (err == Error::Transport)
            MIDEA_LOGW(MIDEA_LOG_TAG, "%s: %s", session.info().ip.c_str(), session.get_error().c_str());
    }
}

Error DeviceIO::process(uint32_t timeout_ms) {
    if (session.state() != SessionState::Connected) {
        std::this_thread::sleep_for(std::chrono::milliseconds(timeout_ms));
        return Error::Connection;
    }

    const uint32_t interval = heartbeat_interval_ms();
    const auto now = std::chrono::steady_clock::now();
    if (interval > 0 && now - last_heartbeat >= std::chrono::milliseconds(interval)) {
        last_heartbeat = now;
        const Error err = session.send_heartbeat();
        if (err != Error::Ok)
            return err;
    }

    return session.poll(timeout_ms);
}

} // namespace midea
