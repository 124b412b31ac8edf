#include "detection/DetectionParser.hpp"

#include <algorithm>
#include <cmath>

namespace FloorPlan3D
{
    namespace
    {
        bool ReadCoordinate( const nlohmann::json& point, const char* key, float64_t& out )
        {
            auto it = point.find( key );
            if( it == point.end() || !it->is_number() )
                return false;
            out = it->get<float64_t>();
            return true;
        }

        bool ReadDimension( const nlohmann::json& json, const char* key, int32_t& out )
        {
            auto it = json.find( key );
            if( it == json.end() || !it->is_number() )
                return false;

            // Image sizes come as integers, but tolerate 512.0
            float64_t value = it->get<float64_t>();
            if( !std::isfinite( value ) || value != std::floor( value ) || value < INT32_MIN || value > INT32_MAX )
                return false;

            out = static_cast<int32_t>( value );
            return true;
        }
    } // namespace

    Result DetectionParser::Parse( const DetectionResult& detection, FloorPlanLayout& outLayout )
    {
        if( detection.rects.size() != detection.labels.size() )
        {
            FP_CORE_ERROR( "[DetectionParser] {} rectangles but {} labels", detection.rects.size(), detection.labels.size() );
            return Result::VALIDATION_ERROR;
        }

        if( detection.width <= 0 || detection.height <= 0 )
        {
            FP_CORE_ERROR( "[DetectionParser] Invalid image size {}x{}", detection.width, detection.height );
            return Result::VALIDATION_ERROR;
        }

        FloorPlanLayout layout;
        layout.width  = detection.width;
        layout.height = detection.height;

        for( size_t i = 0; i < detection.rects.size(); ++i )
        {
            std::optional<ElementClass> type = ElementClassFromLabel( detection.labels[ i ] );
            if( !type )
            {
                FP_CORE_WARN( "[DetectionParser] Dropping element {} with unrecognized label '{}'", i, detection.labels[ i ] );
                layout.droppedCount++;
                continue;
            }

            switch( *type )
            {
                case ElementClass::WALL:
                    layout.walls.push_back( detection.rects[ i ] );
                    break;
                case ElementClass::DOOR:
                    layout.doors.push_back( detection.rects[ i ] );
                    break;
                case ElementClass::WINDOW:
                    layout.windows.push_back( detection.rects[ i ] );
                    break;
            }
        }

        layout.averageDoorSpan = ComputeAverageDoorSpan( layout.doors );
        if( detection.averageDoor && std::abs( *detection.averageDoor - layout.averageDoorSpan ) > 1e-6 )
        {
            FP_CORE_DEBUG( "[DetectionParser] Reported averageDoor {} differs from computed {}", *detection.averageDoor, layout.averageDoorSpan );
        }

        FP_CORE_INFO( "[DetectionParser] {}x{} px: {} walls, {} doors, {} windows, {} dropped", layout.width, layout.height, layout.walls.size(),
                      layout.doors.size(), layout.windows.size(), layout.droppedCount );

        outLayout = std::move( layout );
        return Result::SUCCESS;
    }

    float64_t DetectionParser::ComputeAverageDoorSpan( const std::vector<Rect>& doors )
    {
        if( doors.empty() )
            return 0.0;

        float64_t total = 0.0;
        for( const Rect& door : doors )
            total += std::max( door.Width(), door.Height() );

        return total / static_cast<float64_t>( doors.size() );
    }

    Result DetectionParser::FromJson( const nlohmann::json& json, DetectionResult& outDetection )
    {
        if( !json.is_object() )
        {
            FP_CORE_ERROR( "[DetectionParser] Detection JSON must be an object" );
            return Result::VALIDATION_ERROR;
        }

        DetectionResult detection;

        if( !ReadDimension( json, "Width", detection.width ) || !ReadDimension( json, "Height", detection.height ) )
        {
            FP_CORE_ERROR( "[DetectionParser] Missing or non-integer 'Width'/'Height'" );
            return Result::VALIDATION_ERROR;
        }

        auto points  = json.find( "points" );
        auto classes = json.find( "classes" );
        if( points == json.end() || !points->is_array() || classes == json.end() || !classes->is_array() )
        {
            FP_CORE_ERROR( "[DetectionParser] 'points' and 'classes' must be arrays" );
            return Result::VALIDATION_ERROR;
        }

        detection.rects.reserve( points->size() );
        for( size_t i = 0; i < points->size(); ++i )
        {
            const nlohmann::json& point = ( *points )[ i ];
            Rect                  rect;
            if( !point.is_object() || !ReadCoordinate( point, "x1", rect.x1 ) || !ReadCoordinate( point, "y1", rect.y1 ) ||
                !ReadCoordinate( point, "x2", rect.x2 ) || !ReadCoordinate( point, "y2", rect.y2 ) )
            {
                FP_CORE_ERROR( "[DetectionParser] points[{}] needs numeric x1, y1, x2, y2", i );
                return Result::VALIDATION_ERROR;
            }
            detection.rects.push_back( rect );
        }

        detection.labels.reserve( classes->size() );
        for( size_t i = 0; i < classes->size(); ++i )
        {
            const nlohmann::json& entry = ( *classes )[ i ];

            // Either {"name": "wall"} or the raw model id {"id": 1}. An entry without
            // a usable name keeps an empty label and is dropped later.
            std::string label;
            if( entry.is_object() )
            {
                auto name = entry.find( "name" );
                auto id   = entry.find( "id" );
                if( name != entry.end() && name->is_string() )
                {
                    label = name->get<std::string>();
                }
                else if( id != entry.end() && id->is_number_integer() )
                {
                    std::optional<ElementClass> type = ElementClassFromId( id->get<int64_t>() );
                    if( type )
                        label = std::string( toString( *type ) );
                }
            }
            else if( entry.is_string() )
            {
                label = entry.get<std::string>();
            }
            else
            {
                FP_CORE_ERROR( "[DetectionParser] classes[{}] must be an object or a string", i );
                return Result::VALIDATION_ERROR;
            }
            detection.labels.push_back( std::move( label ) );
        }

        auto averageDoor = json.find( "averageDoor" );
        if( averageDoor != json.end() && averageDoor->is_number() )
            detection.averageDoor = averageDoor->get<float64_t>();

        outDetection = std::move( detection );
        return Result::SUCCESS;
    }

    Result DetectionParser::FromJsonString( const std::string& text, DetectionResult& outDetection )
    {
        nlohmann::json json = nlohmann::json::parse( text, nullptr, false );
        if( json.is_discarded() )
        {
            FP_CORE_ERROR( "[DetectionParser] Detection input is not valid JSON" );
            return Result::VALIDATION_ERROR;
        }
        return FromJson( json, outDetection );
    }

    nlohmann::json DetectionParser::ToJson( const DetectionResult& detection )
    {
        nlohmann::json points  = nlohmann::json::array();
        nlohmann::json classes = nlohmann::json::array();

        for( const Rect& rect : detection.rects )
            points.push_back( { { "x1", rect.x1 }, { "y1", rect.y1 }, { "x2", rect.x2 }, { "y2", rect.y2 } } );
        for( const std::string& label : detection.labels )
            classes.push_back( { { "name", label } } );

        nlohmann::json json = { { "points", points }, { "classes", classes }, { "Width", detection.width }, { "Height", detection.height } };
        if( detection.averageDoor )
            json[ "averageDoor" ] = *detection.averageDoor;
        return json;
    }
} // namespace FloorPlan3D
