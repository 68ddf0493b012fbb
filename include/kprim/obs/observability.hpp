#pragma once
/**
 * @file observability.hpp
 * @brief Observability facade: the shared spdlog logger, engine events and counters.
 */

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>

#include <spdlog/logger.h>

#include "kprim/clone/clone_types.hpp"
#include "kprim/mem/map_types.hpp"

namespace kprim::obs {

    /** @struct Counters
     *  @brief Process-level counters for engine activity.
     */
    struct Counters {
        uint64_t clone_calls{0};     ///< Total clone engine calls recorded
        uint64_t clone_attempts{0};  ///< Calls that issued a clone syscall
        uint64_t reflinked{0};       ///< Calls that ended as Result::Reflinked
        uint64_t copied{0};          ///< Calls that ended as Result::Copied
        uint64_t clone_failures{0};  ///< Calls that returned a CopyError
        uint64_t maps{0};            ///< Successful map operations
        uint64_t unmaps{0};          ///< Successful unmap operations
        uint64_t map_failures{0};    ///< Failed map/unmap/sync/protect operations
    };

    /** @struct CloneEvent
     *  @brief Payload describing a single clone engine call.
     */
    struct CloneEvent {
        int                               from_fd{-1};            ///< Source descriptor (-1 for path calls)
        int                               to_fd{-1};              ///< Destination descriptor (-1 for path calls)
        clone::Behavior                   behavior{clone::Behavior::ReflinkOrCopy};
        bool                              attempted_clone{false}; ///< Whether a clone syscall was issued
        std::optional<clone::Result>      result;                 ///< Set on success
        std::optional<clone::CopyError>   error;                  ///< Set on failure
    };

    /** @struct MapEvent
     *  @brief Payload describing a single memory map engine operation.
     */
    struct MapEvent {
        mem::MapOp                       op{mem::MapOp::Map};
        std::size_t                      length{0};   ///< Bytes covered by the operation
        bool                             shared{false};
        std::optional<mem::MapError>     error;       ///< Set on failure
    };

    /** @class Observer
     *  @brief Observability sink interface.
     */
    class Observer {
    public:
        virtual ~Observer() = default;
        /// Record a single clone engine call.
        virtual void record(const CloneEvent& e) = 0;
        /// Record a single map engine operation.
        virtual void record(const MapEvent& e) = 0;
        /// Return a snapshot of counters.
        virtual Counters snapshot() const = 0;
    };

    /// Process-wide spdlog-backed observer (singleton).
    Observer* make_spdlog_observer();

    /// Shared "kprim" logger (stderr). Level comes from config::current().
    std::shared_ptr<spdlog::logger> logger();

} // namespace kprim::obs
