#pragma once
#include <SDL_log.h>

namespace circa
{
    enum LogCategory
    {
        CircaLogCategoryCore = SDL_LOG_CATEGORY_CUSTOM,
        CircaLogCategoryConfig,
        CircaLogCategorySampler
    };

    // Sets the SDL priority of every Circa category.
    // Verbose messages are dropped unless verbose is set.
    void initLogging(bool verbose);
}

#if defined(__clang__) || defined(__GNUC__)
#define CIRCA_PRINTF_FMT(idx) __attribute__((__format__(__printf__, idx, 0)))
#ifdef __clang__
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wformat-security"
#endif
#else
#define CIRCA_PRINTF_FMT(idx)
#endif

template <typename... Args> CIRCA_PRINTF_FMT(2) void logErr(int category, const char* fmt, Args... args)
{
    SDL_LogError(category, fmt, args...);
}

template <typename... Args> CIRCA_PRINTF_FMT(2) void logWarn(int category, const char* fmt, Args... args)
{
    SDL_LogWarn(category, fmt, args...);
}

template <typename... Args> CIRCA_PRINTF_FMT(2) void logVrb(int category, const char* fmt, Args... args)
{
    SDL_LogMessage(category, SDL_LOG_PRIORITY_VERBOSE, fmt, args...);
}

#ifdef __clang__
#pragma clang diagnostic pop
#endif
