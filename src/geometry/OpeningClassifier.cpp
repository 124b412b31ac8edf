#include "geometry/OpeningClassifier.hpp"

namespace FloorPlan3D
{
    bool OpeningClassifier::Intersects( const Rect& a, const Rect& b )
    {
        return !( b.x2 < a.x1 || b.x1 > a.x2 || b.y2 < a.y1 || b.y1 > a.y2 );
    }

    std::vector<OpeningOverlap> OpeningClassifier::FindOverlaps( const Rect& wall, const std::vector<Rect>& doors, const std::vector<Rect>& windows )
    {
        std::vector<OpeningOverlap> overlaps;

        for( size_t i = 0; i < doors.size(); ++i )
        {
            if( Intersects( wall, doors[ i ] ) )
                overlaps.push_back( { ElementClass::DOOR, i } );
        }

        for( size_t i = 0; i < windows.size(); ++i )
        {
            if( Intersects( wall, windows[ i ] ) )
                overlaps.push_back( { ElementClass::WINDOW, i } );
        }

        return overlaps;
    }
} // namespace FloorPlan3D
