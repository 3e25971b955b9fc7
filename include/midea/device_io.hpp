#ifndef MIDEA_DEVICE_IO_HPP
#define MIDEA_DEVICE_IO_HPP

#include <atomic>
#include <chrono>
#include <functional>
#include <thread>

#include <midea/session.hpp>

namespace midea {

class DeviceIO {
public:
    using StatusHandlerFnType = void(const ChangeSet&);
    explicit DeviceIO(DeviceSession& session);
    ~DeviceIO();

    DeviceIO(const DeviceIO&) = delete;
    DeviceIO& operator=(const DeviceIO&) = delete;

    /**
     * Start receive processing for the session.
     *
     * When @p spawn_background is true a background thread is created that
     * continuously polls the link, dispatches change-sets to @p callback and
     * keeps the connection alive with heartbeats.  If set to false no thread
     * is spawned and the user must call process() periodically.
     */
    void run(std::function<StatusHandlerFnType> callback, bool spawn_background = true);

    /// Poll the session once.  While disconnected this only waits
    /// @p timeout_ms; reconnecting is up to the owner.
    Error process(uint32_t timeout_ms);
    void quit();

private:
    void loop();

    DeviceSession& session;
    std::thread loop_thread;
    std::atomic<bool> running{false};
    std::chrono::steady_clock::time_point last_heartbeat;
};

} // namespace midea

#endif // MIDEA_DEVICE_IO_HPP
