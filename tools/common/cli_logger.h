#pragma once

#include <algorithm>
#include <iostream>
#include <utility>

namespace m2tools::log {

enum class VerbosityLevel : int { Quiet = 0, Verbose = 1, Debug = 2 };

inline VerbosityLevel current_level = VerbosityLevel::Quiet;

inline void set_verbosity(int level) {
    level = std::clamp(level, 0, 2);
    current_level = static_cast<VerbosityLevel>(level);
}

inline VerbosityLevel verbosity_level() { return current_level; }

inline bool verbose_enabled() { return current_level >= VerbosityLevel::Verbose; }
inline bool debug_enabled() { return current_level >= VerbosityLevel::Debug; }

constexpr const char* level_name(VerbosityLevel level) {
    switch (level) {
        case VerbosityLevel::Quiet: return "QUIET";
        case VerbosityLevel::Verbose: return "INFO";
        case VerbosityLevel::Debug: return "DEBUG";
    }
    return "INFO";
}

namespace detail {

template <typename... Args>
void write_line(std::ostream& stream, const char* prefix, Args&&... args) {
    if (prefix) stream << prefix;
    if constexpr (sizeof...(Args) > 0) {
        ((stream << std::forward<Args>(args) << ' '), ...);
    }
    stream << '\n';
}

} // namespace detail

template <typename... Args>
void log_impl(VerbosityLevel min_level, Args&&... args) {
    if (current_level < min_level) return;
    std::cerr << '[' << level_name(min_level) << "] ";
    detail::write_line(std::cerr, nullptr, std::forward<Args>(args)...);
}

template <typename... Args>
void info(Args&&... args) {
    log_impl(VerbosityLevel::Verbose, std::forward<Args>(args)...);
}

template <typename... Args>
void debug(Args&&... args) {
    log_impl(VerbosityLevel::Debug, std::forward<Args>(args)...);
}

template <typename... Args>
void warn(Args&&... args) {
    detail::write_line(std::cerr, "[WARN] ", std::forward<Args>(args)...);
}

template <typename... Args>
void error(Args&&... args) {
    detail::write_line(std::cerr, "[ERROR] ", std::forward<Args>(args)...);
}

// print writes a plain line to stdout (reports, usage text).
template <typename... Args>
void print(Args&&... args) {
    detail::write_line(std::cout, nullptr, std::forward<Args>(args)...);
}

} // namespace m2tools::log

namespace m2tools::cli {
using namespace m2tools::log;
}

#define LOGI(...) ::m2tools::log::info(__VA_ARGS__)
#define LOGW(...) ::m2tools::log::warn(__VA_ARGS__)
#define LOGE(...) ::m2tools::log::error(__VA_ARGS__)

#if M2TOOLS_DEBUG
#define LOGD(...) ::m2tools::log::debug(__VA_ARGS__)
#else
#define LOGD(...) do {} while (false)
#endif
