#ifndef LOAD_OPTIONS_HPP
#define LOAD_OPTIONS_HPP

#include <optional>

#include <SDL3/SDL_log.h>

#include "Types.hpp"

namespace mazegraph
{
    /// @brief Settings for Maze::fromString, every field falls back to a default
    struct LoadOptions final
    {
        // Used when the text has no 'S' marker
        [[nodiscard]] CoordXY getDefaultStart() const { return mDefaultStart.value_or(CoordXY{0, 0}); }

        // Used when the text has no 'G' marker
        [[nodiscard]] CoordXY getDefaultGoal() const { return mDefaultGoal.value_or(CoordXY{7, 7}); }

        [[nodiscard]] std::optional<SDL_LogPriority> getLogPriority() const noexcept { return mLogPriority; }

        LoadOptions &withDefaultStart(const CoordXY &value)
        {
            mDefaultStart = value;
            return *this;
        }

        LoadOptions &withDefaultGoal(const CoordXY &value)
        {
            mDefaultGoal = value;
            return *this;
        }

        LoadOptions &withLogPriority(SDL_LogPriority value)
        {
            mLogPriority = value;
            return *this;
        }

    private:
        std::optional<CoordXY> mDefaultStart;
        std::optional<CoordXY> mDefaultGoal;
        std::optional<SDL_LogPriority> mLogPriority;
    }; // LoadOptions struct
}

#endif // LOAD_OPTIONS_HPP
