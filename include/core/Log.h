#pragma once

#include "core/Core.h"
#include <memory>
#include <spdlog/fmt/ostr.h>
#include <spdlog/spdlog.h>

namespace FloorPlan3D
{

    class FP_API Log
    {
    public:
        /**
         * @brief Creates the CORE and CLIENT loggers. Safe to call more than once
         * and from several threads; the getters call it on first use.
         */
        static void Init();

        /**
         * @brief Applies the same level to both loggers (initializing them if needed).
         */
        static void SetLevel( spdlog::level::level_enum level );

        static std::shared_ptr<spdlog::logger>& GetCoreLogger();
        static std::shared_ptr<spdlog::logger>& GetClientLogger();

    private:
        static void CreateLoggers();

        static std::shared_ptr<spdlog::logger> s_coreLogger;
        static std::shared_ptr<spdlog::logger> s_clientLogger;
    };

} // namespace FloorPlan3D

// Core Logging (library)
#define FP_CORE_TRACE( ... )    ::FloorPlan3D::Log::GetCoreLogger()->trace( __VA_ARGS__ )
#define FP_CORE_DEBUG( ... )    ::FloorPlan3D::Log::GetCoreLogger()->debug( __VA_ARGS__ )
#define FP_CORE_INFO( ... )     ::FloorPlan3D::Log::GetCoreLogger()->info( __VA_ARGS__ )
#define FP_CORE_WARN( ... )     ::FloorPlan3D::Log::GetCoreLogger()->warn( __VA_ARGS__ )
#define FP_CORE_ERROR( ... )    ::FloorPlan3D::Log::GetCoreLogger()->error( __VA_ARGS__ )
#define FP_CORE_CRITICAL( ... ) ::FloorPlan3D::Log::GetCoreLogger()->critical( __VA_ARGS__ )

// Client Logging (applications)
#define FP_TRACE( ... )    ::FloorPlan3D::Log::GetClientLogger()->trace( __VA_ARGS__ )
#define FP_INFO( ... )     ::FloorPlan3D::Log::GetClientLogger()->info( __VA_ARGS__ )
#define FP_WARN( ... )     ::FloorPlan3D::Log::GetClientLogger()->warn( __VA_ARGS__ )
#define FP_ERROR( ... )    ::FloorPlan3D::Log::GetClientLogger()->error( __VA_ARGS__ )
#define FP_CRITICAL( ... ) ::FloorPlan3D::Log::GetClientLogger()->critical( __VA_ARGS__ )
