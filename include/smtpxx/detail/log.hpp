/*

log.hpp
-------

Process wide logger of smtpxx: severity filter, optional sink callback and a
separate switch for the SMTP wire trace. Without a sink, lines go to stderr.


Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <functional>
#include <iostream>
#include <mutex>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>

namespace smtpxx::log
{

enum class level : std::uint8_t
{
    trace,
    debug,
    info,
    warn,
    error,
    fatal,
    off
};

/// Side of the wire a traced line travelled.
enum class direction : std::uint8_t
{
    send,
    receive
};

struct entry
{
    level lvl = level::info;
    std::chrono::system_clock::time_point timestamp;
    /// Emitting part of the library: "ENGINE", "POOL", "CLIENT", "AUTH", ...
    std::string component;
    std::string message;
    std::source_location location;

    struct trace_info_t
    {
        direction dir;
        std::string protocol;
        std::string data;
    };
    /// Set for wire trace entries only, `message` is then empty.
    std::optional<trace_info_t> trace_info;
};

using callback_t = std::function<void(const entry&)>;

[[nodiscard]] constexpr std::string_view level_to_string(level lvl) noexcept
{
    constexpr std::string_view names[] = {"TRACE", "DEBUG", "INFO", "WARN", "ERROR", "FATAL", "OFF"};
    const auto index = static_cast<std::size_t>(lvl);
    return index < std::size(names) ? names[index] : "UNKNOWN";
}

class logger
{
public:
    static logger& instance() noexcept
    {
        static logger inst;
        return inst;
    }

    void set_level(level lvl) noexcept
    {
        threshold_.store(lvl, std::memory_order_relaxed);
    }

    [[nodiscard]] level get_level() const noexcept
    {
        return threshold_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] bool is_enabled(level lvl) const noexcept
    {
        return lvl != level::off && lvl >= get_level();
    }

    /// Route entries to `sink` instead of stderr, an empty function restores stderr.
    void set_callback(callback_t sink)
    {
        std::lock_guard lock(mutex_);
        sink_ = std::move(sink);
    }

    void clear_callback()
    {
        set_callback(nullptr);
    }

    /// Wire trace is independent of the level so it can stay off in debug builds.
    void set_trace_enabled(bool enabled) noexcept
    {
        trace_.store(enabled, std::memory_order_relaxed);
    }

    [[nodiscard]] bool is_trace_enabled() const noexcept
    {
        return trace_.load(std::memory_order_relaxed);
    }

    void log(level lvl, std::string_view component, std::string_view message,
        std::source_location loc = std::source_location::current())
    {
        if (!is_enabled(lvl))
            return;
        entry e;
        e.lvl = lvl;
        e.timestamp = std::chrono::system_clock::now();
        e.component = component;
        e.message = message;
        e.location = loc;
        emit(e);
    }

    /// Callers redact credentials before handing a line over.
    void trace_protocol(std::string_view protocol, direction dir, std::string_view data,
        std::source_location loc = std::source_location::current())
    {
        if (!is_trace_enabled())
            return;
        entry e;
        e.lvl = level::trace;
        e.timestamp = std::chrono::system_clock::now();
        e.location = loc;
        e.trace_info = entry::trace_info_t{dir, std::string(protocol), std::string(data)};
        emit(e);
    }

    /**
     * Text of an entry as written to stderr.
     *
     * `[hh:mm:ss.mmm] [LEVEL] [COMPONENT] message` for log entries and
     * `[hh:mm:ss.mmm] SMTP >>> line` for the wire trace.
     */
    [[nodiscard]] static std::string format(const entry& e)
    {
        std::string out = "[" + clock_text(e.timestamp) + "] ";
        if (e.trace_info)
        {
            out += e.trace_info->protocol;
            out += e.trace_info->dir == direction::send ? " >>> " : " <<< ";
            out += printable(e.trace_info->data);
            return out;
        }
        out += '[';
        out += level_to_string(e.lvl);
        out += "] ";
        if (!e.component.empty())
            out += "[" + e.component + "] ";
        out += e.message;
        return out;
    }

private:
    logger() = default;

    void emit(const entry& e)
    {
        std::lock_guard lock(mutex_);
        if (sink_)
            sink_(e);
        else
            std::cerr << format(e) << '\n';
    }

    static std::string clock_text(std::chrono::system_clock::time_point stamp)
    {
        const std::time_t secs = std::chrono::system_clock::to_time_t(stamp);
        const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(stamp.time_since_epoch()).count() % 1000;
        std::tm local{};
#ifdef _WIN32
        localtime_s(&local, &secs);
#else
        localtime_r(&secs, &local);
#endif
        char text[16]{};
        std::snprintf(text, sizeof(text), "%02d:%02d:%02d.%03d", local.tm_hour, local.tm_min, local.tm_sec,
            static_cast<int>(millis));
        return text;
    }

    /// One visible line: no line ending, control bytes shown as '.', long DATA chunks cut.
    static std::string printable(std::string_view data)
    {
        constexpr std::size_t TRACE_LIMIT = 500;
        while (!data.empty() && (data.back() == '\n' || data.back() == '\r'))
            data.remove_suffix(1);
        std::string out(data.substr(0, TRACE_LIMIT));
        std::replace_if(out.begin(), out.end(), [](char ch) { return static_cast<unsigned char>(ch) < 0x20; }, '.');
        if (data.size() > TRACE_LIMIT)
            out += "... [truncated]";
        return out;
    }

    std::atomic<level> threshold_{level::info};
    std::atomic<bool> trace_{false};
    std::mutex mutex_;
    callback_t sink_;
};

} // namespace smtpxx::log


#define SMTPXX_LOG(lvl, component, msg) \
    ::smtpxx::log::logger::instance().log(lvl, component, msg, std::source_location::current())

#define SMTPXX_TRACE(component, msg) SMTPXX_LOG(::smtpxx::log::level::trace, component, msg)
#define SMTPXX_DEBUG(component, msg) SMTPXX_LOG(::smtpxx::log::level::debug, component, msg)
#define SMTPXX_INFO(component, msg) SMTPXX_LOG(::smtpxx::log::level::info, component, msg)
#define SMTPXX_WARN(component, msg) SMTPXX_LOG(::smtpxx::log::level::warn, component, msg)
#define SMTPXX_ERROR(component, msg) SMTPXX_LOG(::smtpxx::log::level::error, component, msg)

#define SMTPXX_TRACE_SEND(protocol, data) \
    ::smtpxx::log::logger::instance().trace_protocol(protocol, ::smtpxx::log::direction::send, data)

#define SMTPXX_TRACE_RECV(protocol, data) \
    ::smtpxx::log::logger::instance().trace_protocol(protocol, ::smtpxx::log::direction::receive, data)
