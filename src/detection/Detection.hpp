#pragma once
#include "core/Base.hpp"
#include <cmath>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace FloorPlan3D
{
    enum class ElementClass
    {
        WALL,
        DOOR,
        WINDOW,
    };

    inline std::string_view toString( ElementClass type )
    {
        switch( type )
        {
            case ElementClass::WALL:
                return "wall";
            case ElementClass::DOOR:
                return "door";
            case ElementClass::WINDOW:
                return "window";
            default:
                return "unknown";
        }
    }

    // Exact, case-sensitive match on the detector labels. Anything else is unrecognized.
    inline std::optional<ElementClass> ElementClassFromLabel( std::string_view label )
    {
        if( label == "wall" )
            return ElementClass::WALL;
        if( label == "door" )
            return ElementClass::DOOR;
        if( label == "window" )
            return ElementClass::WINDOW;
        return std::nullopt;
    }

    // Numeric class ids of the detection model (0 is background).
    inline std::optional<ElementClass> ElementClassFromId( int64_t id )
    {
        switch( id )
        {
            case 1:
                return ElementClass::WALL;
            case 2:
                return ElementClass::WINDOW;
            case 3:
                return ElementClass::DOOR;
            default:
                return std::nullopt;
        }
    }

    struct Point2D
    {
        float64_t x = 0.0;
        float64_t y = 0.0;
    };

    /**
     * @brief Axis-aligned box in image pixel space.
     */
    struct Rect
    {
        float64_t x1 = 0.0;
        float64_t y1 = 0.0;
        float64_t x2 = 0.0;
        float64_t y2 = 0.0;

        float64_t Width() const { return std::abs( x2 - x1 ); }
        float64_t Height() const { return std::abs( y2 - y1 ); }
        Point2D   Center() const { return { ( x1 + x2 ) * 0.5, ( y1 + y2 ) * 0.5 }; }

        // Horizontal iff strictly wider than tall; squares count as vertical.
        bool IsHorizontal() const { return Width() > Height(); }

        bool IsFinite() const { return std::isfinite( x1 ) && std::isfinite( y1 ) && std::isfinite( x2 ) && std::isfinite( y2 ); }
        bool IsDegenerate() const { return !IsFinite() || Width() == 0.0 || Height() == 0.0; }
    };

    /**
     * @brief Raw output of the detection model.
     * rects[i] and labels[i] describe the same object.
     */
    struct DetectionResult
    {
        int32_t                  width  = 0;
        int32_t                  height = 0;
        std::vector<Rect>        rects;
        std::vector<std::string> labels;
        std::optional<float64_t> averageDoor; // As reported by the detector, informational
    };

    /**
     * @brief Validated detection result, partitioned by class in input order.
     */
    struct FloorPlanLayout
    {
        std::vector<Rect> walls;
        std::vector<Rect> doors;
        std::vector<Rect> windows;
        int32_t           width           = 0;
        int32_t           height          = 0;
        uint32_t          droppedCount    = 0;
        float64_t         averageDoorSpan = 0.0; // Mean longer side of the doors, pixels
    };
} // namespace FloorPlan3D
