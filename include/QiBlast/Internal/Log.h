#pragma once

/**
 * @file Log.h
 * @brief Debug diagnostics gated by DetectionConfig::debug
 *
 * Output format: "[Tag] message" on stderr, one line per call.
 */

#include <QiBlast/Core/DetectionConfig.h>

#include <cstdarg>
#include <cstdio>

namespace Qi::Blast::Internal {

#if defined(__GNUC__) || defined(__clang__)
__attribute__((format(printf, 3, 4)))
#endif
inline void DebugLog(const DetectionConfig& config, const char* tag, const char* fmt, ...) {
    if (!config.debug) return;

    std::fprintf(stderr, "[%s] ", tag);
    va_list args;
    va_start(args, fmt);
    std::vfprintf(stderr, fmt, args);
    va_end(args);
    std::fprintf(stderr, "\n");
}

} // namespace Qi::Blast::Internal
