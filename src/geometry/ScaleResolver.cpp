#include "geometry/ScaleResolver.hpp"

namespace FloorPlan3D
{
    Result ScaleResolver::Resolve( int32_t width, int32_t height, WorldScale& outScale )
    {
        if( width <= 0 || height <= 0 )
        {
            FP_CORE_ERROR( "[ScaleResolver] Cannot derive scale from {}x{} image", width, height );
            return Result::VALIDATION_ERROR;
        }

        outScale.x = WORLD_FOOTPRINT_SIZE / static_cast<float64_t>( width );
        outScale.y = WORLD_FOOTPRINT_SIZE / static_cast<float64_t>( height );
        return Result::SUCCESS;
    }
} // namespace FloorPlan3D
