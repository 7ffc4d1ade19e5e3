#include "Log.hpp"

namespace mazegraph
{
    namespace log
    {
        void setPriority(SDL_LogPriority priority) noexcept
        {
            SDL_SetLogPriority(CATEGORY, priority);
        }

        SDL_LogPriority getPriority() noexcept
        {
            return SDL_GetLogPriority(CATEGORY);
        }
    }
}
