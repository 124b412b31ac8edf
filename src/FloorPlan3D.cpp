#include "FloorPlan3D.h"

#include "core/Log.h"
#include "detection/DetectionParser.hpp"
#include "export/AssetWriter.hpp"
#include "export/GltfExporter.hpp"
#include "runtime/FloorPlanGenerator.hpp"

namespace FloorPlan3D
{

    // Impl
    struct FloorPlan3D::Impl
    {
        FloorPlan3DConfig         m_config;
        bool                      m_initialized;
        Scope<FileSystem>         m_fileSystem;
        Scope<FloorPlanGenerator> m_generator;

        Impl()
            : m_initialized( false )
        {
        }

        Result Initialize( const FloorPlan3DConfig& config )
        {
            if( m_initialized )
                return Result::SUCCESS;

            // 1. Config
            m_config = config;

            // 2. Logger
            Log::Init();
            FP_INFO( "Initializing FloorPlan3D..." );

            Result res = m_config.generator.Validate();
            if( res != Result::SUCCESS )
            {
                FP_ERROR( "Invalid generator configuration." );
                return res;
            }

            // 3. FileSystem
            m_fileSystem = CreateScope<FileSystem>();
            std::filesystem::path root;
            if( m_config.rootDirectory && m_config.rootDirectory[ 0 ] != '\0' )
                root = m_config.rootDirectory;

            res = m_fileSystem->Initialize( root );
            if( res != Result::SUCCESS )
            {
                m_fileSystem.reset();
                FP_ERROR( "Critical: FileSystem could not be initialized." );
                return res;
            }

            // 4. Generator
            m_generator = CreateScope<FloorPlanGenerator>( m_config.generator );

            m_initialized = true;
            FP_INFO( "FloorPlan3D initialized (wall height {} m, thickness {} m).", m_config.generator.wallHeight,
                     m_config.generator.wallThickness );
            return Result::SUCCESS;
        }

        void Shutdown()
        {
            if( !m_initialized )
                return;

            m_generator.reset();
            if( m_fileSystem )
            {
                m_fileSystem->Shutdown();
                m_fileSystem.reset();
            }
            m_initialized = false;
        }

        Result Run( const std::string& detectionJson, GltfAsset& outAsset, GenerationStats& outStats )
        {
            if( !m_initialized )
            {
                FP_CORE_ERROR( "FloorPlan3D used before Initialize()" );
                return Result::FAIL;
            }

            DetectionResult detection;
            FP_RETURN_IF_FAILED( DetectionParser::FromJsonString( detectionJson, detection ) );

            GeneratedModel model;
            FP_RETURN_IF_FAILED( m_generator->Generate( detection, model ) );
            FP_RETURN_IF_FAILED( GltfExporter::Export( model.mesh, model.metadata, outAsset ) );

            outStats = model.stats;
            return Result::SUCCESS;
        }

        static void Fill( const GltfAsset& asset, const GenerationStats& stats, ConversionOutput& output )
        {
            output.gltfJson = asset.document.dump();
            output.binary   = asset.binary;
            output.metadata = asset.metadata;
            output.stats    = stats;
        }
    };

    FloorPlan3D::FloorPlan3D()
        : m_impl( CreateScope<Impl>() )
    {
    }

    FloorPlan3D::~FloorPlan3D()
    {
        Shutdown();
    }

    Result FloorPlan3D::Initialize( const FloorPlan3DConfig& config )
    {
        return m_impl->Initialize( config );
    }

    void FloorPlan3D::Shutdown()
    {
        m_impl->Shutdown();
    }

    Result FloorPlan3D::Convert( const std::string& detectionJson, ConversionOutput& output )
    {
        GltfAsset       asset;
        GenerationStats stats;
        FP_RETURN_IF_FAILED( m_impl->Run( detectionJson, asset, stats ) );

        Impl::Fill( asset, stats, output );
        return Result::SUCCESS;
    }

    Result FloorPlan3D::ConvertFile( const std::string& inputPath, const std::string& outputPath, ConversionOutput& output )
    {
        if( !m_impl->m_initialized )
        {
            FP_CORE_ERROR( "FloorPlan3D used before Initialize()" );
            return Result::FAIL;
        }

        std::string text;
        FP_RETURN_IF_FAILED( m_impl->m_fileSystem->ReadFile( inputPath, text ) );

        GltfAsset       asset;
        GenerationStats stats;
        FP_RETURN_IF_FAILED( m_impl->Run( text, asset, stats ) );

        AssetWriter writer( *m_impl->m_fileSystem );
        switch( m_impl->m_config.outputFormat )
        {
            case OutputFormat::GLTF_EMBEDDED:
                FP_RETURN_IF_FAILED( writer.WriteEmbedded( outputPath, asset ) );
                break;
            case OutputFormat::GLTF_SEPARATE:
                FP_RETURN_IF_FAILED( writer.WriteGltf( outputPath, asset ) );
                break;
            case OutputFormat::GLB:
                FP_RETURN_IF_FAILED( writer.WriteGlb( outputPath, asset ) );
                break;
        }

        FP_INFO( "Wrote '{}' ({} vertices, {} faces)", outputPath, asset.metadata.numVertices, asset.metadata.numFaces );

        Impl::Fill( asset, stats, output );
        return Result::SUCCESS;
    }

    Result FloorPlan3D::WriteMetadata( const std::string& path, const ConversionOutput& output )
    {
        if( !m_impl->m_initialized )
            return Result::FAIL;

        AssetWriter writer( *m_impl->m_fileSystem );
        return writer.WriteMetadata( path, output.metadata, output.stats );
    }

    FileSystem* FloorPlan3D::GetFileSystem() const
    {
        return m_impl->m_fileSystem.get();
    }

    const FloorPlan3DConfig& FloorPlan3D::GetConfig() const
    {
        return m_impl->m_config;
    }

} // namespace FloorPlan3D
