#ifndef MAZE_ERROR_HPP
#define MAZE_ERROR_HPP

#include <stdexcept>
#include <string_view>

namespace mazegraph
{
    /// @brief Recoverable failure raised by coordinate, graph and route operations
    /// @details Malformed maze text is not reported with this type, it is a fatal std::runtime_error
    class MazeError : public std::runtime_error
    {
    public:
        enum class Kind : unsigned int
        {
            OUT_OF_RANGE = 0,
            INVALID_LOCATION = 1,
            INVALID_VECTOR = 2,
            INVALID_DIRECTION = 3,
            INVALID_ROUTE = 4
        };

        explicit MazeError(Kind kind);
        MazeError(Kind kind, std::string_view detail);

        [[nodiscard]] Kind getKind() const noexcept { return mKind; }

        [[nodiscard]] static std::string_view toString(Kind kind) noexcept;

    private:
        Kind mKind;
    };
}

#endif // MAZE_ERROR_HPP
