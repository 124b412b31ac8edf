#pragma once
#include "core/Base.hpp"

namespace FloorPlan3D
{
    // Side length of the square world footprint every floor plan is normalized into.
    constexpr float64_t WORLD_FOOTPRINT_SIZE = 10.0;

    /**
     * @brief Pixel to world multipliers. x maps to world X, y maps to world Z.
     */
    struct WorldScale
    {
        float64_t x = 0.0;
        float64_t y = 0.0;
    };

    class ScaleResolver
    {
    public:
        /**
         * @brief scale = WORLD_FOOTPRINT_SIZE / size on each axis, independent of aspect ratio.
         * @return VALIDATION_ERROR when width or height is not positive.
         */
        static Result Resolve( int32_t width, int32_t height, WorldScale& outScale );
    };
} // namespace FloorPlan3D
