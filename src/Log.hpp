#ifndef LOG_HPP
#define LOG_HPP

#include <SDL3/SDL_log.h>

namespace mazegraph
{
    namespace log
    {
        // All library messages go through SDL's log with this category
        static constexpr int CATEGORY = SDL_LOG_CATEGORY_CUSTOM;

        /// Set the minimum priority printed for the library category
        void setPriority(SDL_LogPriority priority) noexcept;

        [[nodiscard]] SDL_LogPriority getPriority() noexcept;
    }
}

#endif // LOG_HPP
