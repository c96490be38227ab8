#include "conduit/shutdown.hpp"

#include "conduit/log.hpp"

namespace conduit {

    shutdown_coordinator::shutdown_coordinator(
            tool_dispatcher& dispatcher, server_registry& registry, shutdown_graces graces)
            : dispatcher_{dispatcher}, registry_{registry}, graces_{graces} {}

    shutdown_coordinator::~shutdown_coordinator() {
        run();
    }

    void shutdown_coordinator::initiate_shutdown() {
        std::lock_guard lock{mutex_};
        switch (phase_) {
            case shutdown_phase::running:
                phase_ = shutdown_phase::draining;
                log_info{"shutdown requested, draining ", dispatcher_.in_flight(), " in-flight calls"};
                worker_ = std::jthread{[this] { sequence(); }};
                break;
            case shutdown_phase::draining:
                if (force_.request_stop()) {
                    log_warn{"second shutdown request, forcing immediate stop"};
                }
                break;
            case shutdown_phase::stopped:
                break;
        }
    }

    void shutdown_coordinator::run() {
        initiate_shutdown();
        wait();
    }

    void shutdown_coordinator::wait() {
        {
            std::unique_lock lock{mutex_};
            stopped_cv_.wait(lock, [this] { return phase_ == shutdown_phase::stopped; });
        }
        // the worker may still be returning from sequence()
        std::lock_guard lock{mutex_};
        if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
            worker_.join();
        }
    }

    bool shutdown_coordinator::wait_for(std::chrono::milliseconds timeout) {
        std::unique_lock lock{mutex_};
        return stopped_cv_.wait_for(lock, timeout, [this] { return phase_ == shutdown_phase::stopped; });
    }

    shutdown_phase shutdown_coordinator::phase() const {
        std::lock_guard lock{mutex_};
        return phase_;
    }

    void shutdown_coordinator::drain_calls() {
        auto force = force_.get_token();
        if (dispatcher_.wait_idle(graces_.drain, force)) {
            return;
        }

        log_info{"cancelling ", dispatcher_.in_flight(), " calls still running"};
        dispatcher_.cancel_all();
        auto cancel_grace = force.stop_requested() ? std::chrono::milliseconds{0} : graces_.cancel;
        if (!dispatcher_.wait_idle(cancel_grace, force)) {
            log_warn{dispatcher_.in_flight(), " calls still unwinding, stopping servers anyway"};
        }
    }

    void shutdown_coordinator::sequence() {
        dispatcher_.stop_accepting();
        drain_calls();

        auto force = force_.get_token();
        registry_.stop_all(force.stop_requested() ? std::chrono::milliseconds{0} : graces_.stop, force);

        {
            std::lock_guard lock{mutex_};
            phase_ = shutdown_phase::stopped;
        }
        stopped_cv_.notify_all();
        log_info{"shutdown complete"};
    }

}  // namespace conduit
