#pragma once
#include "detection/Detection.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace FloorPlan3D
{
    class DetectionParser
    {
    public:
        /**
         * @brief Validates a detection result and partitions it by class.
         * Elements with an unrecognized label are dropped, logged and counted.
         * @return VALIDATION_ERROR on mismatched rect/label counts or non-positive image size.
         *         outLayout is left untouched on failure.
         */
        static Result Parse( const DetectionResult& detection, FloorPlanLayout& outLayout );

        /**
         * @brief Decodes the detector wire format:
         * {"points":[{x1,y1,x2,y2}], "classes":[{"name"} | {"id"}], "Width", "Height", "averageDoor"?}
         * Count mismatches between points and classes are kept so that Parse() rejects them.
         */
        static Result FromJson( const nlohmann::json& json, DetectionResult& outDetection );
        static Result FromJsonString( const std::string& text, DetectionResult& outDetection );

        static nlohmann::json ToJson( const DetectionResult& detection );

        // Mean longer side over all doors, 0 when empty.
        static float64_t ComputeAverageDoorSpan( const std::vector<Rect>& doors );
    };
} // namespace FloorPlan3D
