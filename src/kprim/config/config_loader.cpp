/**
* @file config_loader.cpp
 * @brief Loader that starts from named defaults and applies environment overrides.
 */
#include "kprim/config/config_loader.hpp"
#include "kprim/config/constants.hpp"
#include "kprim/os/environment.hpp"

#include <algorithm>
#include <charconv>

namespace kprim::config {
    using namespace kprim::config::constants;

    RuntimeConfig Loader::defaults() {
        RuntimeConfig rc{};
        rc.copy_buffer_bytes = COPY_BUFFER_BYTES;
        rc.log_level         = spdlog::level::from_str(LOG_LEVEL_DEFAULT);
        return rc;
    }

    std::optional<std::size_t> Loader::parse_bytes(const std::string& text) {
        std::size_t value = 0;
        const char* first = text.data();
        const char* last  = text.data() + text.size();
        const auto [ptr, ec] = std::from_chars(first, last, value);
        if (ec != std::errc{} || ptr != last || value == 0) return std::nullopt;
        return value;
    }

    std::optional<spdlog::level::level_enum> Loader::parse_level(const std::string& text) {
        // from_str() maps unknown names to "off"; only accept "off" when asked for it.
        const auto lvl = spdlog::level::from_str(text);
        if (lvl == spdlog::level::off && text != "off") return std::nullopt;
        return lvl;
    }

    RuntimeConfig Loader::load_from_env() {
        RuntimeConfig rc = defaults();
        if (const auto v = os::env::get(ENV_COPY_BUFFER_BYTES)) {
            if (const auto bytes = parse_bytes(*v)) {
                rc.copy_buffer_bytes = std::clamp(*bytes, COPY_BUFFER_MIN_BYTES, COPY_BUFFER_MAX_BYTES);
            }
        }
        if (const auto v = os::env::get(ENV_LOG_LEVEL)) {
            if (const auto lvl = parse_level(*v)) rc.log_level = *lvl;
        }
        return rc;
    }

    const RuntimeConfig& current() {
        static const RuntimeConfig rc = Loader::load_from_env(); // loaded once per process
        return rc;
    }

} // namespace kprim::config
