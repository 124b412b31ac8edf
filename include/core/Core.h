#pragma once

#include <cstdint>
#include <memory>
#include <string_view>
#include <vector>

#if defined( _WIN32 ) && defined( FP_SHARED )
#    ifdef FP_BUILD_DLL
#        define FP_API __declspec( dllexport )
#    else
#        define FP_API __declspec( dllimport )
#    endif
#else
#    define FP_API
#endif

namespace FloorPlan3D
{
    using bool_t    = bool;
    using float32_t = float;
    using float64_t = double;

    // Error codes
    enum class Result : int32_t
    {
        SUCCESS             = 0,
        FAIL                = -1,
        NOT_IMPLEMENTED     = -2,
        INVALID_ARGS        = -3,
        VALIDATION_ERROR    = -20, // Malformed detection input or configuration
        GEOMETRY_ERROR      = -21, // Degenerate rectangle, element skipped
        SERIALIZATION_ERROR = -22, // Mesh cannot be packed into a glTF buffer
        IO_ERROR            = -30
    };

    inline std::string_view toString( Result result )
    {
        switch( result )
        {
            case Result::SUCCESS:
                return "SUCCESS";
            case Result::FAIL:
                return "FAIL";
            case Result::NOT_IMPLEMENTED:
                return "NOT_IMPLEMENTED";
            case Result::INVALID_ARGS:
                return "INVALID_ARGS";
            case Result::VALIDATION_ERROR:
                return "VALIDATION_ERROR";
            case Result::GEOMETRY_ERROR:
                return "GEOMETRY_ERROR";
            case Result::SERIALIZATION_ERROR:
                return "SERIALIZATION_ERROR";
            case Result::IO_ERROR:
                return "IO_ERROR";
            default:
                return "UNKNOWN";
        }
    }

    template<typename T>
    using Scope = std::unique_ptr<T>;

    template<typename T, typename... Args>
    constexpr Scope<T> CreateScope( Args&&... args )
    {
        return std::make_unique<T>( std::forward<Args>( args )... );
    }

    template<typename T>
    using Ref = std::shared_ptr<T>;

    template<typename T, typename... Args>
    constexpr Ref<T> CreateRef( Args&&... args )
    {
        return std::make_shared<T>( std::forward<Args>( args )... );
    }
} // namespace FloorPlan3D
