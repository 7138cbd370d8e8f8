#include "Log.hpp"

namespace circa
{
    const int categories[] = {
        CircaLogCategoryCore,
        CircaLogCategoryConfig,
        CircaLogCategorySampler
    };

    void initLogging(bool verbose)
    {
        SDL_LogPriority priority = verbose ? SDL_LOG_PRIORITY_VERBOSE : SDL_LOG_PRIORITY_INFO;

        for (int category : categories)
        {
            SDL_LogSetPriority(category, priority);
        }
    }
}
