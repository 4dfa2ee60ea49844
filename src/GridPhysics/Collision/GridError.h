#pragma once
#include <stdexcept>
#include <string>

namespace GridPhysics {

// Thrown when a grid is constructed with dimensions that cannot tile the world.
class GridConfigError : public std::invalid_argument
{
public:
    explicit GridConfigError(const std::string &what) : std::invalid_argument(what)
    {
    }
};

} // namespace GridPhysics
