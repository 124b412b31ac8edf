#include "runtime/FloorPlanGenerator.hpp"

#include "detection/DetectionParser.hpp"
#include "geometry/MeshBuilder.hpp"
#include "geometry/ScaleResolver.hpp"

namespace FloorPlan3D
{
    FloorPlanGenerator::FloorPlanGenerator( const GeneratorConfig& config )
        : m_config( config )
    {
    }

    Result FloorPlanGenerator::Generate( const DetectionResult& detection, GeneratedModel& outModel ) const
    {
        FP_RETURN_IF_FAILED( m_config.Validate() );

        FloorPlanLayout layout;
        FP_RETURN_IF_FAILED( DetectionParser::Parse( detection, layout ) );

        WorldScale scale;
        FP_RETURN_IF_FAILED( ScaleResolver::Resolve( layout.width, layout.height, scale ) );

        GeneratedModel model;
        model.stats.droppedLabels = layout.droppedCount;

        MeshBuilder builder( m_config, scale );
        builder.Build( layout, model.mesh, model.stats );

        model.metadata.wallHeight    = m_config.wallHeight;
        model.metadata.wallThickness = m_config.wallThickness;
        model.metadata.numVertices   = static_cast<uint32_t>( model.mesh.VertexCount() );
        model.metadata.numFaces      = static_cast<uint32_t>( model.mesh.FaceCount() );
        model.metadata.numWalls      = static_cast<uint32_t>( layout.walls.size() );
        model.metadata.numDoors      = static_cast<uint32_t>( layout.doors.size() );
        model.metadata.numWindows    = static_cast<uint32_t>( layout.windows.size() );

        if( model.stats.skippedDegenerate > 0 )
            FP_CORE_WARN( "[FloorPlanGenerator] {} degenerate element(s) skipped", model.stats.skippedDegenerate );

        outModel = std::move( model );
        return Result::SUCCESS;
    }
} // namespace FloorPlan3D
