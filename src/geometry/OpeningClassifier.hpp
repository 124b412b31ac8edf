#pragma once
#include "detection/Detection.hpp"
#include <vector>

namespace FloorPlan3D
{
    struct OpeningOverlap
    {
        ElementClass type;  // DOOR or WINDOW
        size_t       index; // Position in the door or window list
    };

    /**
     * @brief 2D overlap test between walls and openings, in pixel space.
     * The result is reported only; wall geometry is never cut.
     */
    class OpeningClassifier
    {
    public:
        // Touching edges count as overlapping. Assumes x1 <= x2 and y1 <= y2.
        static bool Intersects( const Rect& a, const Rect& b );

        // Doors first, then windows, each in input order.
        static std::vector<OpeningOverlap> FindOverlaps( const Rect& wall, const std::vector<Rect>& doors, const std::vector<Rect>& windows );
    };
} // namespace FloorPlan3D
