#pragma once


/*
    ---------------------------
    Stanza logging (spdlog)
    ---------------------------
    The library logs through one named spdlog logger, `"stanza"`. It is
    created lazily with a colored stdout sink at level `warn`, so a quiet
    application sees only cached metadata failures. Applications that
    already run spdlog can hand the library their own logger (or set the
    level of the default one) before first use.

    Logged events:
        - options frozen (debug)
        - type metadata published / failed (debug / warn)
        - converter lookup failures (debug)
        - streaming buffer growth (trace), cancellation (info)
*/

#include <memory>

#include <spdlog/spdlog.h>

#include "stanza/config.hpp"

namespace Stanza {

    /// @brief Returns the library logger, creating the default one on first use.
    STANZA_API std::shared_ptr<spdlog::logger> logger();

    /// @brief Replaces the library logger. Passing nullptr restores the default.
    STANZA_API void set_logger(std::shared_ptr<spdlog::logger> l);

} // namespace Stanza

#define STANZA_LOG_TRACE(...) ::Stanza::logger()->trace(__VA_ARGS__)
#define STANZA_LOG_DEBUG(...) ::Stanza::logger()->debug(__VA_ARGS__)
#define STANZA_LOG_INFO(...)  ::Stanza::logger()->info(__VA_ARGS__)
#define STANZA_LOG_WARN(...)  ::Stanza::logger()->warn(__VA_ARGS__)
#define STANZA_LOG_ERROR(...) ::Stanza::logger()->error(__VA_ARGS__)
