#include "MazeError.hpp"

#include <string>

namespace mazegraph
{
    MazeError::MazeError(Kind kind)
        : std::runtime_error(std::string{toString(kind)}), mKind(kind)
    {
    }

    MazeError::MazeError(Kind kind, std::string_view detail)
        : std::runtime_error(std::string{toString(kind)} + ": " + std::string{detail}), mKind(kind)
    {
    }

    std::string_view MazeError::toString(Kind kind) noexcept
    {
        switch (kind)
        {
        case Kind::OUT_OF_RANGE:
            return "OutOfRange";
        case Kind::INVALID_LOCATION:
            return "InvalidLocation";
        case Kind::INVALID_VECTOR:
            return "InvalidVector";
        case Kind::INVALID_DIRECTION:
            return "InvalidDirection";
        case Kind::INVALID_ROUTE:
            return "InvalidRoute";
        }
        return "Unknown";
    }
}
