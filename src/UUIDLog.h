#pragma once

#include <memory>
#include <utility>

#include <spdlog/spdlog.h>

/*
 * UUIDLog - logger used by the generators.
 *
 * Defaults to a logger named "uuiddraft" that writes to the sinks of spdlog's
 * default logger (or to the logger registered under that name, if any).
 * Applications that want the library output on its own sink install one with
 * setLogger() before generating.
 */
class UUIDLog {
public:
    static std::shared_ptr<spdlog::logger> logger() {
        std::shared_ptr<spdlog::logger> l = std::atomic_load(&slot());
        return l ? l : named();
    }

    static void setLogger(std::shared_ptr<spdlog::logger> l) {
        std::atomic_store(&slot(), std::move(l));
    }

    template<typename... Args>
    static void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        logger()->debug(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        logger()->error(fmt, std::forward<Args>(args)...);
    }

private:
    static std::shared_ptr<spdlog::logger> named() {
        static std::shared_ptr<spdlog::logger> s_named = makeNamed();
        return s_named;
    }

    static std::shared_ptr<spdlog::logger> makeNamed() {
        std::shared_ptr<spdlog::logger> registered = spdlog::get("uuiddraft");
        if (registered) return registered;

        std::shared_ptr<spdlog::logger> def = spdlog::default_logger();
        std::shared_ptr<spdlog::logger> l =
            std::make_shared<spdlog::logger>("uuiddraft", def->sinks().begin(), def->sinks().end());
        l->set_level(def->level());
        return l;
    }

    static std::shared_ptr<spdlog::logger>& slot() {
        static std::shared_ptr<spdlog::logger> s_logger;
        return s_logger;
    }
};
