#include "geometry/MeshBuilder.hpp"

#include "geometry/OpeningClassifier.hpp"
#include <cmath>

namespace FloorPlan3D
{
    namespace
    {
        // Appends one vertex with its normal and color, returns its index.
        uint32_t PushVertex( MeshBuffer& mesh, const glm::vec3& position, const glm::vec3& normal, const glm::vec3& color )
        {
            uint32_t index = static_cast<uint32_t>( mesh.vertices.size() );
            mesh.vertices.push_back( position );
            mesh.normals.push_back( normal );
            mesh.colors.push_back( color );
            return index;
        }

        glm::vec3 ToWorld( float64_t x, float64_t y, float64_t z )
        {
            return glm::vec3( static_cast<float32_t>( x ), static_cast<float32_t>( y ), static_cast<float32_t>( z ) );
        }
    } // namespace

    MeshBuilder::MeshBuilder( const GeneratorConfig& config, const WorldScale& scale )
        : m_config( config )
        , m_scale( scale )
    {
    }

    void MeshBuilder::Build( const FloorPlanLayout& layout, MeshBuffer& mesh, GenerationStats& outStats ) const
    {
        // Pre-allocate: floor + ceiling, 8 per wall, 4 per opening
        size_t vertexCount = 8 + layout.walls.size() * 8 + ( layout.doors.size() + layout.windows.size() ) * 4;
        size_t faceCount   = 4 + layout.walls.size() * 10 + ( layout.doors.size() + layout.windows.size() ) * 4;
        mesh.vertices.reserve( mesh.vertices.size() + vertexCount );
        mesh.normals.reserve( mesh.normals.size() + vertexCount );
        mesh.colors.reserve( mesh.colors.size() + vertexCount );
        mesh.faces.reserve( mesh.faces.size() + faceCount );

        AddFloor( mesh, layout.width, layout.height );

        for( size_t i = 0; i < layout.walls.size(); ++i )
        {
            const Rect& wall = layout.walls[ i ];

            if( AddWall( mesh, wall ) != Result::SUCCESS )
            {
                FP_CORE_WARN( "[MeshBuilder] Skipping degenerate wall {} ({}, {})-({}, {})", i, wall.x1, wall.y1, wall.x2, wall.y2 );
                outStats.skippedDegenerate++;
                continue;
            }

            // Only emitted walls are classified. Overlaps are reported; the wall stays solid under its openings.
            std::vector<OpeningOverlap> overlaps = OpeningClassifier::FindOverlaps( wall, layout.doors, layout.windows );
            if( !overlaps.empty() )
            {
                FP_CORE_DEBUG( "[MeshBuilder] Wall {} overlaps {} opening(s)", i, overlaps.size() );
                outStats.wallOpeningOverlaps += static_cast<uint32_t>( overlaps.size() );
            }
        }

        for( size_t i = 0; i < layout.doors.size(); ++i )
        {
            if( AddDoor( mesh, layout.doors[ i ] ) != Result::SUCCESS )
            {
                FP_CORE_WARN( "[MeshBuilder] Skipping degenerate door {}", i );
                outStats.skippedDegenerate++;
            }
        }

        for( size_t i = 0; i < layout.windows.size(); ++i )
        {
            if( AddWindow( mesh, layout.windows[ i ] ) != Result::SUCCESS )
            {
                FP_CORE_WARN( "[MeshBuilder] Skipping degenerate window {}", i );
                outStats.skippedDegenerate++;
            }
        }

        AddCeiling( mesh, layout.width, layout.height );
    }

    void MeshBuilder::AddFloor( MeshBuffer& mesh, int32_t width, int32_t height ) const
    {
        const float64_t w = width * m_scale.x;
        const float64_t d = height * m_scale.y;
        const glm::vec3 up( 0.0f, 1.0f, 0.0f );

        uint32_t base = PushVertex( mesh, ToWorld( 0.0, 0.0, 0.0 ), up, Palette::FLOOR );
        PushVertex( mesh, ToWorld( w, 0.0, 0.0 ), up, Palette::FLOOR );
        PushVertex( mesh, ToWorld( w, 0.0, d ), up, Palette::FLOOR );
        PushVertex( mesh, ToWorld( 0.0, 0.0, d ), up, Palette::FLOOR );

        mesh.faces.push_back( { base + 0, base + 1, base + 2 } );
        mesh.faces.push_back( { base + 0, base + 2, base + 3 } );
    }

    void MeshBuilder::AddCeiling( MeshBuffer& mesh, int32_t width, int32_t height ) const
    {
        const float64_t w = width * m_scale.x;
        const float64_t d = height * m_scale.y;
        const float64_t h = m_config.wallHeight;
        const glm::vec3 down( 0.0f, -1.0f, 0.0f );

        uint32_t base = PushVertex( mesh, ToWorld( 0.0, h, 0.0 ), down, Palette::CEILING );
        PushVertex( mesh, ToWorld( w, h, 0.0 ), down, Palette::CEILING );
        PushVertex( mesh, ToWorld( w, h, d ), down, Palette::CEILING );
        PushVertex( mesh, ToWorld( 0.0, h, d ), down, Palette::CEILING );

        // Winding reversed relative to the floor
        mesh.faces.push_back( { base + 0, base + 2, base + 1 } );
        mesh.faces.push_back( { base + 0, base + 3, base + 2 } );
    }

    Result MeshBuilder::AddWall( MeshBuffer& mesh, const Rect& wall ) const
    {
        if( wall.IsDegenerate() )
            return Result::GEOMETRY_ERROR;

        const float64_t x1   = wall.x1 * m_scale.x;
        const float64_t z1   = wall.y1 * m_scale.y;
        const float64_t x2   = wall.x2 * m_scale.x;
        const float64_t z2   = wall.y2 * m_scale.y;
        const float64_t half = m_config.wallThickness * 0.5;
        const float64_t h    = m_config.wallHeight;

        // Corner order per face: start-bottom, end-bottom, end-top, start-top
        glm::vec3 corners[ 8 ];
        glm::vec3 frontNormal;
        glm::vec3 backNormal;

        if( wall.IsHorizontal() )
        {
            // Runs along X, thickness along Z
            const float64_t zc     = ( z1 + z2 ) * 0.5;
            const float64_t zFront = zc - half;
            const float64_t zBack  = zc + half;

            corners[ 0 ] = ToWorld( x1, 0.0, zFront );
            corners[ 1 ] = ToWorld( x2, 0.0, zFront );
            corners[ 2 ] = ToWorld( x2, h, zFront );
            corners[ 3 ] = ToWorld( x1, h, zFront );
            corners[ 4 ] = ToWorld( x1, 0.0, zBack );
            corners[ 5 ] = ToWorld( x2, 0.0, zBack );
            corners[ 6 ] = ToWorld( x2, h, zBack );
            corners[ 7 ] = ToWorld( x1, h, zBack );
            frontNormal  = glm::vec3( 0.0f, 0.0f, -1.0f );
            backNormal   = glm::vec3( 0.0f, 0.0f, 1.0f );
        }
        else
        {
            // Runs along Z, thickness along X
            const float64_t xc     = ( x1 + x2 ) * 0.5;
            const float64_t xFront = xc - half;
            const float64_t xBack  = xc + half;

            corners[ 0 ] = ToWorld( xFront, 0.0, z1 );
            corners[ 1 ] = ToWorld( xFront, 0.0, z2 );
            corners[ 2 ] = ToWorld( xFront, h, z2 );
            corners[ 3 ] = ToWorld( xFront, h, z1 );
            corners[ 4 ] = ToWorld( xBack, 0.0, z1 );
            corners[ 5 ] = ToWorld( xBack, 0.0, z2 );
            corners[ 6 ] = ToWorld( xBack, h, z2 );
            corners[ 7 ] = ToWorld( xBack, h, z1 );
            frontNormal  = glm::vec3( -1.0f, 0.0f, 0.0f );
            backNormal   = glm::vec3( 1.0f, 0.0f, 0.0f );
        }

        for( const glm::vec3& corner : corners )
        {
            if( !std::isfinite( corner.x ) || !std::isfinite( corner.y ) || !std::isfinite( corner.z ) )
                return Result::GEOMETRY_ERROR;
        }

        // One normal per vertex: the front block and the back block point away from each other
        uint32_t b = static_cast<uint32_t>( mesh.vertices.size() );
        for( int i = 0; i < 8; ++i )
            PushVertex( mesh, corners[ i ], i < 4 ? frontNormal : backNormal, Palette::WALL );

        mesh.faces.push_back( { b + 0, b + 1, b + 2 } ); // Front
        mesh.faces.push_back( { b + 0, b + 2, b + 3 } );
        mesh.faces.push_back( { b + 5, b + 4, b + 7 } ); // Back
        mesh.faces.push_back( { b + 5, b + 7, b + 6 } );
        mesh.faces.push_back( { b + 4, b + 0, b + 3 } ); // Left
        mesh.faces.push_back( { b + 4, b + 3, b + 7 } );
        mesh.faces.push_back( { b + 1, b + 5, b + 6 } ); // Right
        mesh.faces.push_back( { b + 1, b + 6, b + 2 } );
        mesh.faces.push_back( { b + 3, b + 2, b + 6 } ); // Top
        mesh.faces.push_back( { b + 3, b + 6, b + 7 } );

        return Result::SUCCESS;
    }

    Result MeshBuilder::AddDoor( MeshBuffer& mesh, const Rect& door ) const
    {
        return AddOpening( mesh, door, 0.0, m_config.doorHeight, Palette::DOOR );
    }

    Result MeshBuilder::AddWindow( MeshBuffer& mesh, const Rect& window ) const
    {
        const float64_t bottom = m_config.windowSillHeight;
        return AddOpening( mesh, window, bottom, bottom + m_config.windowHeight, Palette::WINDOW );
    }

    Result MeshBuilder::AddOpening( MeshBuffer& mesh, const Rect& rect, float64_t bottom, float64_t top, const glm::vec3& color ) const
    {
        if( rect.IsDegenerate() )
            return Result::GEOMETRY_ERROR;

        const float64_t x1 = rect.x1 * m_scale.x;
        const float64_t z1 = rect.y1 * m_scale.y;
        const float64_t x2 = rect.x2 * m_scale.x;
        const float64_t z2 = rect.y2 * m_scale.y;

        glm::vec3 corners[ 4 ];
        glm::vec3 normal;

        if( rect.IsHorizontal() )
        {
            // Panel along X on the centre line
            const float64_t z = ( z1 + z2 ) * 0.5;
            corners[ 0 ]      = ToWorld( x1, bottom, z );
            corners[ 1 ]      = ToWorld( x2, bottom, z );
            corners[ 2 ]      = ToWorld( x2, top, z );
            corners[ 3 ]      = ToWorld( x1, top, z );
            normal            = glm::vec3( 0.0f, 0.0f, 1.0f );
        }
        else
        {
            // Panel along Z on the centre line
            const float64_t x = ( x1 + x2 ) * 0.5;
            corners[ 0 ]      = ToWorld( x, bottom, z1 );
            corners[ 1 ]      = ToWorld( x, bottom, z2 );
            corners[ 2 ]      = ToWorld( x, top, z2 );
            corners[ 3 ]      = ToWorld( x, top, z1 );
            normal            = glm::vec3( 1.0f, 0.0f, 0.0f );
        }

        for( const glm::vec3& corner : corners )
        {
            if( !std::isfinite( corner.x ) || !std::isfinite( corner.y ) || !std::isfinite( corner.z ) )
                return Result::GEOMETRY_ERROR;
        }

        uint32_t b = static_cast<uint32_t>( mesh.vertices.size() );
        for( const glm::vec3& corner : corners )
            PushVertex( mesh, corner, normal, color );

        // Front pair, then the same quad wound the other way for the back side
        mesh.faces.push_back( { b + 0, b + 1, b + 2 } );
        mesh.faces.push_back( { b + 0, b + 2, b + 3 } );
        mesh.faces.push_back( { b + 1, b + 0, b + 3 } );
        mesh.faces.push_back( { b + 1, b + 3, b + 2 } );

        return Result::SUCCESS;
    }
} // namespace FloorPlan3D
