#include "chatlink/core/session/heartbeat_driver.hpp"
#include "chatlink/core/util/logger.hpp"
#include <condition_variable>
#include <format>
#include <mutex>

namespace chatlink {

    /* owned jointly by the driver and its worker, so a detached worker never touches the driver */
    struct HeartbeatDriver::Shared {
        std::mutex m;
        std::condition_variable_any cv;
        Beat beat;
        FailureHandler onFailure;
    };

    HeartbeatDriver::HeartbeatDriver(std::chrono::milliseconds interval, Beat beat, FailureHandler onFailure)
        : interval_(interval), shared_(std::make_shared<Shared>())
    {
        shared_->beat = std::move(beat);
        shared_->onFailure = std::move(onFailure);
    }

    HeartbeatDriver::~HeartbeatDriver() {
        stop();
    }

    void HeartbeatDriver::start() {
        if (worker_.joinable()) return;

        worker_ = std::jthread([sh = shared_, interval = interval_](std::stop_token st) {
            while (!st.stop_requested()) {
                {
                    std::unique_lock lk(sh->m);
                    if (sh->cv.wait_for(lk, st, interval, [] { return false; }) || st.stop_requested())
                        return;
                }
                try {
                    sh->beat();
                    LOG_TRACE("heartbeat sent");
                } catch (const std::exception& ex) {
                    LOG_WARN(std::format("heartbeat failed: {}", ex.what()));
                    if (!st.stop_requested())
                        sh->onFailure(ex.what());
                    return;
                }
            }
        });
    }

    void HeartbeatDriver::stop() {
        if (!worker_.joinable()) return;
        worker_.request_stop();
        if (worker_.get_id() == std::this_thread::get_id())
            worker_.detach();
        else
            worker_.join();
    }

}
