// Header-only logging for the MediaGrab core: libcurl init, admissions,
// terminal outcomes, cap changes, worker and file deletion failures.
// Silent unless MEDIAGRAB_LOG is set to a non-zero value; output goes to stderr.
#pragma once
#include <cstdio>
#include <cstdlib>
#include <cstdarg>

namespace mediagrab {

inline bool logEnabled() {
    const char* v = std::getenv("MEDIAGRAB_LOG");
    return v && *v && *v != '0';
}

inline void logf(const char* level, const char* fmt, ...) {
    if (!logEnabled()) return;
    std::fprintf(stderr, "[MediaGrab][%s] ", level);
    va_list ap;
    va_start(ap, fmt);
    std::vfprintf(stderr, fmt, ap);
    va_end(ap);
    std::fprintf(stderr, "\n");
}

} // namespace mediagrab

#define LOGI(fmt, ...) \
    do { \
        if (mediagrab::logEnabled()) \
            mediagrab::logf("INFO", fmt, ##__VA_ARGS__); \
    } while (0)

#define LOGW(fmt, ...) \
    do { \
        if (mediagrab::logEnabled()) \
            mediagrab::logf("WARN", fmt, ##__VA_ARGS__); \
    } while (0)

#define LOGE(fmt, ...) \
    do { \
        if (mediagrab::logEnabled()) \
            mediagrab::logf("ERROR", fmt, ##__VA_ARGS__); \
    } while (0)
