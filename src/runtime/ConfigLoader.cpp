#include "runtime/ConfigLoader.hpp"

#include <cmath>

namespace FloorPlan3D
{
    Result GeneratorConfig::Validate() const
    {
        struct Field
        {
            const char* name;
            float64_t   value;
            bool        allowZero;
        };

        const Field fields[] = {
            { "wallHeight", wallHeight, false },     { "wallThickness", wallThickness, false },      { "doorHeight", doorHeight, false },
            { "windowHeight", windowHeight, false }, { "windowSillHeight", windowSillHeight, true },
        };

        for( const Field& field : fields )
        {
            if( !std::isfinite( field.value ) )
            {
                FP_CORE_ERROR( "[Config] {} is not finite", field.name );
                return Result::VALIDATION_ERROR;
            }
            if( field.allowZero ? field.value < 0.0 : field.value <= 0.0 )
            {
                FP_CORE_ERROR( "[Config] {} = {} is out of range", field.name, field.value );
                return Result::VALIDATION_ERROR;
            }
        }
        return Result::SUCCESS;
    }

    Result ConfigLoader::FromJson( const nlohmann::json& json, GeneratorConfig& inOutConfig )
    {
        if( !json.is_object() )
        {
            FP_CORE_ERROR( "[ConfigLoader] Config must be a JSON object" );
            return Result::VALIDATION_ERROR;
        }

        struct Binding
        {
            const char* key;
            float64_t*  target;
        };

        GeneratorConfig config = inOutConfig;
        const Binding   bindings[] = {
            { "wall_height", &config.wallHeight },     { "wall_thickness", &config.wallThickness },         { "door_height", &config.doorHeight },
            { "window_height", &config.windowHeight }, { "window_sill_height", &config.windowSillHeight },
        };

        for( auto it = json.begin(); it != json.end(); ++it )
        {
            bool known = false;
            for( const Binding& binding : bindings )
            {
                if( it.key() != binding.key )
                    continue;

                known = true;
                if( !it.value().is_number() )
                {
                    FP_CORE_ERROR( "[ConfigLoader] '{}' must be a number", binding.key );
                    return Result::VALIDATION_ERROR;
                }
                *binding.target = it.value().get<float64_t>();
                break;
            }

            if( !known )
                FP_CORE_WARN( "[ConfigLoader] Ignoring unknown key '{}'", it.key() );
        }

        FP_RETURN_IF_FAILED( config.Validate() );

        inOutConfig = config;
        return Result::SUCCESS;
    }

    Result ConfigLoader::FromJsonString( const std::string& text, GeneratorConfig& inOutConfig )
    {
        nlohmann::json json = nlohmann::json::parse( text, nullptr, false );
        if( json.is_discarded() )
        {
            FP_CORE_ERROR( "[ConfigLoader] Config is not valid JSON" );
            return Result::VALIDATION_ERROR;
        }
        return FromJson( json, inOutConfig );
    }

    nlohmann::json ConfigLoader::ToJson( const GeneratorConfig& config )
    {
        return { { "wall_height", config.wallHeight },
                 { "wall_thickness", config.wallThickness },
                 { "door_height", config.doorHeight },
                 { "window_height", config.windowHeight },
                 { "window_sill_height", config.windowSillHeight } };
    }
} // namespace FloorPlan3D
