/**
* @file observability.cpp
 * @brief spdlog-backed implementation of Observer and the shared "kprim" logger.
 */
#include "kprim/obs/observability.hpp"
#include "kprim/config/config_loader.hpp"
#include "kprim/config/constants.hpp"
#include "kprim/version.hpp"

#include <mutex>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace kprim::obs {

    std::shared_ptr<spdlog::logger> logger() {
        static const std::shared_ptr<spdlog::logger> lg = [] {
            // Reuse a logger the host application registered under our name.
            if (auto existing = spdlog::get(config::constants::LOGGER_NAME)) return existing;
            auto created = spdlog::stderr_color_mt(config::constants::LOGGER_NAME);
            const auto& cfg = config::current();
            created->set_level(cfg.log_level);
            created->debug("kprim {} (copy buffer {} bytes)", version_string, cfg.copy_buffer_bytes);
            return created;
        }();
        return lg;
    }

    class SpdlogObserver : public Observer {
    public:
        void record(const CloneEvent& e) override {
            {
                std::lock_guard<std::mutex> lk(mu_);
                ctr_.clone_calls++;
                if (e.attempted_clone) ctr_.clone_attempts++;
                if (e.result) {
                    if (*e.result == clone::Result::Reflinked) ctr_.reflinked++;
                    else ctr_.copied++;
                }
                if (e.error) ctr_.clone_failures++;
            }
            if (e.error) {
                logger()->debug("clone from={} to={} behavior={} attempted_clone={} error={}",
                                e.from_fd, e.to_fd, clone::to_string(e.behavior),
                                e.attempted_clone, e.error->to_string());
            } else {
                logger()->debug("clone from={} to={} behavior={} attempted_clone={} result={}",
                                e.from_fd, e.to_fd, clone::to_string(e.behavior), e.attempted_clone,
                                e.result ? clone::to_string(*e.result) : "none");
            }
        }

        void record(const MapEvent& e) override {
            {
                std::lock_guard<std::mutex> lk(mu_);
                if (e.error) ctr_.map_failures++;
                else if (e.op == mem::MapOp::Map) ctr_.maps++;
                else if (e.op == mem::MapOp::Unmap) ctr_.unmaps++;
            }
            if (e.error) {
                logger()->debug("{} length={} shared={} error={}",
                                mem::to_string(e.op), e.length, e.shared, e.error->to_string());
            } else {
                logger()->trace("{} length={} shared={}", mem::to_string(e.op), e.length, e.shared);
            }
        }

        Counters snapshot() const override {
            std::lock_guard<std::mutex> lk(mu_);
            return ctr_;
        }

    private:
        mutable std::mutex mu_;
        Counters ctr_;
    };

    Observer* make_spdlog_observer() {
        static SpdlogObserver obs; // process-wide singleton
        return &obs;
    }

} // namespace kprim::obs
