#pragma once
/**
 * @file constants.hpp
 * @brief Centralized named defaults for the clone and map engines.
 * @details These values eliminate magic numbers from the codebase. Override via the
 *          environment (see config_loader.hpp).
 */

#include <cstddef>
#include <cstdint>

namespace kprim::config::constants {

// =====================
// Byte-copy fallback (pread/pwrite loop)
// =====================
inline constexpr std::size_t COPY_BUFFER_BYTES     = 64 * 1024;        ///< 64 KiB per read/write round
inline constexpr std::size_t COPY_BUFFER_MIN_BYTES = 4 * 1024;         ///< Never below one typical page
inline constexpr std::size_t COPY_BUFFER_MAX_BYTES = 16 * 1024 * 1024; ///< 16 MiB upper clamp

/// Largest chunk handed to copy_file_range in one call (kernel clamps to this anyway).
inline constexpr std::size_t COPY_RANGE_CHUNK_BYTES = 0x7ffff000;

// =====================
// File creation
// =====================
inline constexpr std::uint32_t DEFAULT_FILE_MODE = 0644; ///< rw-r--r-- for clone destinations

// =====================
// Logging
// =====================
inline constexpr const char* LOGGER_NAME       = "kprim";
inline constexpr const char* LOG_LEVEL_DEFAULT = "warn";

// =====================
// Environment overrides
// =====================
inline constexpr const char* ENV_COPY_BUFFER_BYTES = "KPRIM_COPY_BUFFER_BYTES";
inline constexpr const char* ENV_LOG_LEVEL         = "KPRIM_LOG_LEVEL";

} // namespace kprim::config::constants
