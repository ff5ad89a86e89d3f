#include "stanza/log.hpp"

#include <mutex>
#include <shared_mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace Stanza {

    namespace {
        std::shared_ptr<spdlog::logger> create_default_logger() {
            if (auto existing = spdlog::get("stanza")) return existing;
            auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            sink->set_pattern("%^[%T] [%n] [%l]%$ %v");
            auto l = std::make_shared<spdlog::logger>("stanza", std::move(sink));
            l->set_level(spdlog::level::warn);
            spdlog::register_logger(l);
            return l;
        }

        std::shared_mutex& logger_mutex() {
            static std::shared_mutex m;
            return m;
        }

        std::shared_ptr<spdlog::logger>& logger_slot() {
            static std::shared_ptr<spdlog::logger> l = create_default_logger();
            return l;
        }
    } // namespace

    std::shared_ptr<spdlog::logger> logger() {
        std::shared_lock lock{ logger_mutex() };
        return logger_slot();
    }

    void set_logger(std::shared_ptr<spdlog::logger> l) {
        if (!l) l = create_default_logger();
        std::unique_lock lock{ logger_mutex() };
        logger_slot() = std::move(l);
    }

} // namespace Stanza
