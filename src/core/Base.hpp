#pragma once

#include "core/Core.h"
#include "core/Log.h"

#if defined( _MSC_VER )
#    define FP_DEBUGBREAK() __debugbreak()
#elif defined( __linux__ ) || defined( __APPLE__ )
#    include <signal.h>
#    define FP_DEBUGBREAK() raise( SIGTRAP )
#else
#    define FP_DEBUGBREAK()
#endif

#ifdef FP_DEBUG
#    define FP_ENABLE_ASSERTS
#endif

#ifdef FP_ENABLE_ASSERTS
#    define FP_CORE_ASSERT( x, ... )                                                                                                                 \
        {                                                                                                                                            \
            if( !( x ) )                                                                                                                             \
            {                                                                                                                                        \
                FP_CORE_ERROR( "Assertion Failed: {0}", __VA_ARGS__ );                                                                               \
                FP_DEBUGBREAK();                                                                                                                     \
            }                                                                                                                                        \
        }
#else
#    define FP_CORE_ASSERT( x, ... )
#endif

// Propagates a failed Result to the caller after logging where it happened.
#define FP_RETURN_IF_FAILED( x )                                                                                                                     \
    {                                                                                                                                                \
        ::FloorPlan3D::Result fpResult_ = ( x );                                                                                                     \
        if( fpResult_ != ::FloorPlan3D::Result::SUCCESS )                                                                                            \
        {                                                                                                                                            \
            FP_CORE_ERROR( "{} failed: {}", #x, ::FloorPlan3D::toString( fpResult_ ) );                                                              \
            return fpResult_;                                                                                                                        \
        }                                                                                                                                            \
    }
