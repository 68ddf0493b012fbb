#pragma once
/**
 * @file config_loader.hpp
 * @brief Runtime configuration: named defaults overridden from the environment.
 * @details All defaults reference named constants to avoid magic numbers.
 */

#include <cstddef>
#include <optional>
#include <string>

#include <spdlog/common.h>

namespace kprim::config {

    /** @struct RuntimeConfig
     *  @brief Process-wide tunables for the engines and the logger.
     */
    struct RuntimeConfig {
        std::size_t               copy_buffer_bytes; ///< Buffer used by the pread/pwrite copy fallback
        spdlog::level::level_enum log_level;         ///< Level of the "kprim" logger
    };

    /** @class Loader
     *  @brief Source of runtime configuration (defaults or environment).
     */
    class Loader {
    public:
        /// @return RuntimeConfig populated from constants only.
        static RuntimeConfig defaults();

        /**
         * @brief Defaults overridden by KPRIM_COPY_BUFFER_BYTES and KPRIM_LOG_LEVEL.
         * Unparseable values keep the default; the buffer size is clamped to [min, max].
         */
        static RuntimeConfig load_from_env();

        /// @brief Parse a byte count ("65536"); std::nullopt when not a positive integer.
        static std::optional<std::size_t> parse_bytes(const std::string& text);

        /// @brief Parse a level name (trace|debug|info|warn|error|critical|off).
        static std::optional<spdlog::level::level_enum> parse_level(const std::string& text);
    };

    /// @brief Configuration of this process, loaded from the environment on first use.
    const RuntimeConfig& current();

} // namespace kprim::config
