#pragma once
#include "FloorPlan3DTypes.h"
#include "core/Base.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace FloorPlan3D
{
    /**
     * @brief Reads GeneratorConfig overrides from JSON.
     *
     * Keys: wall_height, wall_thickness, door_height, window_height, window_sill_height.
     * Absent keys keep the value already in the config, unknown keys are logged and ignored.
     * The merged config is validated before it is returned.
     */
    class ConfigLoader
    {
    public:
        static Result FromJson( const nlohmann::json& json, GeneratorConfig& inOutConfig );
        static Result FromJsonString( const std::string& text, GeneratorConfig& inOutConfig );

        static nlohmann::json ToJson( const GeneratorConfig& config );
    };
} // namespace FloorPlan3D
