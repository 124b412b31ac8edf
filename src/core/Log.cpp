#include "core/Log.h"

#include <mutex>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace FloorPlan3D
{

    Ref<spdlog::logger> Log::s_coreLogger   = nullptr;
    Ref<spdlog::logger> Log::s_clientLogger = nullptr;

    namespace
    {
        std::once_flag s_initFlag;
    }

    void Log::Init()
    {
        // The first caller creates the loggers; any concurrent caller waits for it
        std::call_once( s_initFlag, &Log::CreateLoggers );
    }

    void Log::CreateLoggers()
    {
        spdlog::set_pattern( "%^[%T] %n: %v%$" );

        // Reuse registered loggers if another module created them first
        s_coreLogger = spdlog::get( "CORE" );
        if( !s_coreLogger )
            s_coreLogger = spdlog::stdout_color_mt( "CORE" );

        s_clientLogger = spdlog::get( "CLIENT" );
        if( !s_clientLogger )
            s_clientLogger = spdlog::stdout_color_mt( "CLIENT" );

        s_coreLogger->set_level( spdlog::level::info );
        s_clientLogger->set_level( spdlog::level::info );

        // Still inside call_once here, so the macros cannot be used yet
        s_coreLogger->trace( "Logging system initialized." );
    }

    void Log::SetLevel( spdlog::level::level_enum level )
    {
        Init();
        s_coreLogger->set_level( level );
        s_clientLogger->set_level( level );
    }

    Ref<spdlog::logger>& Log::GetCoreLogger()
    {
        Init();
        return s_coreLogger;
    }

    Ref<spdlog::logger>& Log::GetClientLogger()
    {
        Init();
        return s_clientLogger;
    }

} // namespace FloorPlan3D
