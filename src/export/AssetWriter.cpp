#include "export/AssetWriter.hpp"

#include <filesystem>
#include <limits>
#include <sstream>

// tinygltf is compiled into this translation unit and serializes through nlohmann_json
#define TINYGLTF_IMPLEMENTATION
#include <nlohmann/json.hpp>
#include <tiny_gltf.h>

namespace FloorPlan3D
{
    namespace
    {
        using json = nlohmann::json;

        uint64_t PaddedSize( uint64_t size )
        {
            return ( size + 3 ) & ~uint64_t( 3 );
        }

        int AccessorType( const std::string& type )
        {
            if( type == "SCALAR" )
                return TINYGLTF_TYPE_SCALAR;
            if( type == "VEC2" )
                return TINYGLTF_TYPE_VEC2;
            if( type == "VEC3" )
                return TINYGLTF_TYPE_VEC3;
            if( type == "VEC4" )
                return TINYGLTF_TYPE_VEC4;
            return -1;
        }

        Result FillModel( const json& doc, const std::vector<uint8_t>& binary, tinygltf::Model& model )
        {
            model.asset.version   = doc.at( "asset" ).at( "version" ).get<std::string>();
            model.asset.generator = doc.at( "asset" ).value( "generator", std::string() );

            // 1. Buffer: exactly one, holding the exported bytes
            const json& buffers = doc.at( "buffers" );
            if( buffers.size() != 1 || buffers[ 0 ].at( "byteLength" ).get<uint64_t>() != binary.size() )
            {
                FP_CORE_ERROR( "[AssetWriter] Document must describe one buffer of {} bytes", binary.size() );
                return Result::SERIALIZATION_ERROR;
            }

            tinygltf::Buffer buffer;
            buffer.data = binary;
            model.buffers.push_back( std::move( buffer ) );

            // 2. Views and accessors
            for( const json& entry : doc.at( "bufferViews" ) )
            {
                tinygltf::BufferView view;
                view.buffer     = entry.at( "buffer" ).get<int>();
                view.byteOffset = entry.value( "byteOffset", size_t( 0 ) );
                view.byteLength = entry.at( "byteLength" ).get<size_t>();
                view.target     = entry.value( "target", 0 );
                model.bufferViews.push_back( view );
            }

            for( const json& entry : doc.at( "accessors" ) )
            {
                tinygltf::Accessor accessor;
                accessor.bufferView    = entry.at( "bufferView" ).get<int>();
                accessor.componentType = entry.at( "componentType" ).get<int>();
                accessor.count         = entry.at( "count" ).get<size_t>();
                accessor.type          = AccessorType( entry.at( "type" ).get<std::string>() );
                if( accessor.type < 0 )
                {
                    FP_CORE_ERROR( "[AssetWriter] Unknown accessor type '{}'", entry.at( "type" ).get<std::string>() );
                    return Result::SERIALIZATION_ERROR;
                }
                if( entry.contains( "min" ) )
                    accessor.minValues = entry[ "min" ].get<std::vector<double>>();
                if( entry.contains( "max" ) )
                    accessor.maxValues = entry[ "max" ].get<std::vector<double>>();
                model.accessors.push_back( accessor );
            }

            // 3. Materials, meshes, nodes, scenes
            for( const json& entry : doc.at( "materials" ) )
            {
                const json&        pbr = entry.at( "pbrMetallicRoughness" );
                tinygltf::Material material;
                material.pbrMetallicRoughness.baseColorFactor = pbr.at( "baseColorFactor" ).get<std::vector<double>>();
                material.pbrMetallicRoughness.metallicFactor  = pbr.at( "metallicFactor" ).get<double>();
                material.pbrMetallicRoughness.roughnessFactor = pbr.at( "roughnessFactor" ).get<double>();
                material.doubleSided                          = entry.value( "doubleSided", false );
                model.materials.push_back( material );
            }

            for( const json& entry : doc.at( "meshes" ) )
            {
                tinygltf::Mesh mesh;
                for( const json& source : entry.at( "primitives" ) )
                {
                    tinygltf::Primitive primitive;
                    for( auto it = source.at( "attributes" ).begin(); it != source.at( "attributes" ).end(); ++it )
                        primitive.attributes[ it.key() ] = it.value().get<int>();
                    primitive.indices  = source.value( "indices", -1 );
                    primitive.material = source.value( "material", -1 );
                    primitive.mode     = source.value( "mode", TINYGLTF_MODE_TRIANGLES );
                    mesh.primitives.push_back( primitive );
                }
                model.meshes.push_back( mesh );
            }

            for( const json& entry : doc.at( "nodes" ) )
            {
                tinygltf::Node node;
                node.mesh = entry.value( "mesh", -1 );
                model.nodes.push_back( node );
            }

            for( const json& entry : doc.at( "scenes" ) )
            {
                tinygltf::Scene scene;
                scene.nodes = entry.at( "nodes" ).get<std::vector<int>>();
                model.scenes.push_back( scene );
            }
            model.defaultScene = doc.value( "scene", 0 );

            return Result::SUCCESS;
        }
    } // namespace

    AssetWriter::AssetWriter( FileSystem& fileSystem )
        : m_fileSystem( fileSystem )
    {
    }

    Result AssetWriter::BuildModel( const GltfAsset& asset, tinygltf::Model& outModel )
    {
        tinygltf::Model model;
        try
        {
            FP_RETURN_IF_FAILED( FillModel( asset.document, asset.binary, model ) );
        }
        catch( const json::exception& e )
        {
            FP_CORE_ERROR( "[AssetWriter] Malformed glTF document: {}", e.what() );
            return Result::SERIALIZATION_ERROR;
        }

        outModel = std::move( model );
        return Result::SUCCESS;
    }

    Result AssetWriter::ComputeGlbLength( uint64_t jsonBytes, uint64_t binaryBytes, uint64_t& outLength )
    {
        const uint64_t limit = std::numeric_limits<uint32_t>::max();
        if( jsonBytes > limit || binaryBytes > limit )
        {
            FP_CORE_ERROR( "[AssetWriter] GLB chunk exceeds the 32-bit container limit" );
            return Result::SERIALIZATION_ERROR;
        }

        // Both operands are below 2^32 here, so the sum cannot wrap
        uint64_t length = GlbConstants::HEADER_SIZE + GlbConstants::CHUNK_HEADER_SIZE + PaddedSize( jsonBytes );
        if( binaryBytes > 0 )
            length += GlbConstants::CHUNK_HEADER_SIZE + PaddedSize( binaryBytes );

        if( length > limit )
        {
            FP_CORE_ERROR( "[AssetWriter] GLB of {} bytes exceeds the 32-bit container limit", length );
            return Result::SERIALIZATION_ERROR;
        }

        outLength = length;
        return Result::SUCCESS;
    }

    Result AssetWriter::SerializeEmbedded( const GltfAsset& asset, std::string& outText )
    {
        tinygltf::Model model;
        FP_RETURN_IF_FAILED( BuildModel( asset, model ) );

        // Stream output always embeds buffers as data URIs
        tinygltf::TinyGLTF gltf;
        std::ostringstream stream;
        if( !gltf.WriteGltfSceneToStream( &model, stream, true, false ) )
        {
            FP_CORE_ERROR( "[AssetWriter] tinygltf failed to serialize the embedded document" );
            return Result::SERIALIZATION_ERROR;
        }

        outText = stream.str();
        return Result::SUCCESS;
    }

    Result AssetWriter::SerializeGlb( const GltfAsset& asset, std::vector<uint8_t>& outBytes )
    {
        // tinygltf writes 32-bit chunk lengths without checking them
        uint64_t length = 0;
        FP_RETURN_IF_FAILED( ComputeGlbLength( asset.document.dump().size(), asset.binary.size(), length ) );

        tinygltf::Model model;
        FP_RETURN_IF_FAILED( BuildModel( asset, model ) );

        tinygltf::TinyGLTF gltf;
        std::ostringstream stream;
        if( !gltf.WriteGltfSceneToStream( &model, stream, false, true ) )
        {
            FP_CORE_ERROR( "[AssetWriter] tinygltf failed to serialize the GLB container" );
            return Result::SERIALIZATION_ERROR;
        }

        const std::string bytes = stream.str();
        outBytes.assign( bytes.begin(), bytes.end() );
        return Result::SUCCESS;
    }

    Result AssetWriter::WriteEmbedded( const std::string& path, const GltfAsset& asset )
    {
        std::string text;
        FP_RETURN_IF_FAILED( SerializeEmbedded( asset, text ) );
        return m_fileSystem.WriteFile( path, text );
    }

    Result AssetWriter::WriteGltf( const std::string& path, const GltfAsset& asset )
    {
        tinygltf::Model model;
        FP_RETURN_IF_FAILED( BuildModel( asset, model ) );

        std::filesystem::path gltfPath = m_fileSystem.ResolvePath( path );
        std::filesystem::path binPath  = gltfPath;
        binPath.replace_extension( ".bin" );

        // A non data URI makes tinygltf write the buffer to that file, relative to the .gltf
        model.buffers[ 0 ].uri = binPath.filename().string();

        FP_RETURN_IF_FAILED( m_fileSystem.CreateParentDirectories( path ) );

        // tinygltf writes the .bin before the document
        tinygltf::TinyGLTF gltf;
        if( !gltf.WriteGltfSceneToFile( &model, gltfPath.string(), false, false, true, false ) )
        {
            FP_CORE_ERROR( "[AssetWriter] Failed to write '{}' with its buffer '{}'", gltfPath.string(), binPath.filename().string() );

            // Do not leave a buffer file behind without its document
            Result cleanup = m_fileSystem.RemoveFile( binPath.string() );
            if( cleanup != Result::SUCCESS )
                FP_CORE_WARN( "[AssetWriter] Could not remove '{}'", binPath.string() );
            return Result::IO_ERROR;
        }

        FP_CORE_TRACE( "[AssetWriter] Wrote '{}' and '{}'", gltfPath.string(), binPath.string() );
        return Result::SUCCESS;
    }

    Result AssetWriter::WriteGlb( const std::string& path, const GltfAsset& asset )
    {
        std::vector<uint8_t> bytes;
        FP_RETURN_IF_FAILED( SerializeGlb( asset, bytes ) );
        return m_fileSystem.WriteFile( path, bytes.data(), bytes.size() );
    }

    nlohmann::json AssetWriter::MetadataToJson( const ModelMetadata& metadata )
    {
        return { { "wall_height", metadata.wallHeight },   { "wall_thickness", metadata.wallThickness }, { "num_vertices", metadata.numVertices },
                 { "num_faces", metadata.numFaces },       { "num_walls", metadata.numWalls },           { "num_doors", metadata.numDoors },
                 { "num_windows", metadata.numWindows } };
    }

    Result AssetWriter::WriteMetadata( const std::string& path, const ModelMetadata& metadata, const GenerationStats& stats )
    {
        nlohmann::json summary;
        summary[ "metadata" ] = MetadataToJson( metadata );
        summary[ "stats" ]    = { { "dropped_labels", stats.droppedLabels },
                                  { "skipped_degenerate", stats.skippedDegenerate },
                                  { "wall_opening_overlaps", stats.wallOpeningOverlaps } };
        return m_fileSystem.WriteFile( path, summary.dump( 2 ) );
    }
} // namespace FloorPlan3D
