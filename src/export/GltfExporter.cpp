#include "export/GltfExporter.hpp"

#include <cstring>
#include <limits>

namespace FloorPlan3D
{
    const char* GltfExporter::GENERATOR_NAME = "FloorPlan3D";

    namespace
    {
        constexpr uint64_t MAX_BUFFER_LENGTH = std::numeric_limits<uint32_t>::max();

        bool CheckedMul( uint64_t a, uint64_t b, uint64_t& out )
        {
            if( a != 0 && b > std::numeric_limits<uint64_t>::max() / a )
                return false;
            out = a * b;
            return true;
        }

        bool CheckedAdd( uint64_t a, uint64_t b, uint64_t& out )
        {
            if( b > std::numeric_limits<uint64_t>::max() - a )
                return false;
            out = a + b;
            return true;
        }

        // glTF buffers are little-endian regardless of the host
        void WriteU32( uint8_t* dst, uint32_t value )
        {
            dst[ 0 ] = static_cast<uint8_t>( value & 0xFF );
            dst[ 1 ] = static_cast<uint8_t>( ( value >> 8 ) & 0xFF );
            dst[ 2 ] = static_cast<uint8_t>( ( value >> 16 ) & 0xFF );
            dst[ 3 ] = static_cast<uint8_t>( ( value >> 24 ) & 0xFF );
        }

        void WriteF32( uint8_t* dst, float32_t value )
        {
            uint32_t bits;
            std::memcpy( &bits, &value, sizeof( bits ) );
            WriteU32( dst, bits );
        }

        uint8_t* WriteVec3Array( uint8_t* dst, const std::vector<glm::vec3>& values )
        {
            for( const glm::vec3& v : values )
            {
                WriteF32( dst + 0, v.x );
                WriteF32( dst + 4, v.y );
                WriteF32( dst + 8, v.z );
                dst += 12;
            }
            return dst;
        }

        nlohmann::json Vec3ToJson( const glm::vec3& v )
        {
            return nlohmann::json::array( { v.x, v.y, v.z } );
        }
    } // namespace

    SectionCounts GltfExporter::CountSections( const MeshBuffer& mesh )
    {
        return { static_cast<uint64_t>( mesh.vertices.size() ), static_cast<uint64_t>( mesh.normals.size() ),
                 static_cast<uint64_t>( mesh.colors.size() ), static_cast<uint64_t>( mesh.faces.size() ) };
    }

    Result GltfExporter::ComputeLayout( const SectionCounts& elementCounts, std::vector<BufferViewInfo>& outViews, uint64_t& outTotalLength )
    {
        std::vector<BufferViewInfo> views;
        views.reserve( elementCounts.size() );

        uint64_t offset = 0;
        for( uint64_t count : elementCounts )
        {
            BufferViewInfo view;
            view.byteOffset = offset;

            uint64_t components = 0;
            if( !CheckedMul( count, 3, components ) || !CheckedMul( components, GltfConstants::COMPONENT_SIZE, view.byteLength ) ||
                !CheckedAdd( offset, view.byteLength, offset ) )
            {
                FP_CORE_ERROR( "[GltfExporter] Buffer size overflow" );
                return Result::SERIALIZATION_ERROR;
            }
            views.push_back( view );
        }

        outViews       = std::move( views );
        outTotalLength = offset;
        return Result::SUCCESS;
    }

    Result GltfExporter::CheckLimits( uint64_t vertexCount, uint64_t bufferLength )
    {
        // Indices are uint32, so the vertex count must be addressable
        if( vertexCount > std::numeric_limits<uint32_t>::max() )
        {
            FP_CORE_ERROR( "[GltfExporter] {} vertices cannot be indexed with uint32", vertexCount );
            return Result::SERIALIZATION_ERROR;
        }

        if( bufferLength > MAX_BUFFER_LENGTH )
        {
            FP_CORE_ERROR( "[GltfExporter] Buffer of {} bytes exceeds the 32-bit limit", bufferLength );
            return Result::SERIALIZATION_ERROR;
        }

        return Result::SUCCESS;
    }

    Result GltfExporter::Export( const MeshBuffer& mesh, const ModelMetadata& metadata, GltfAsset& outAsset )
    {
        if( mesh.IsEmpty() )
        {
            FP_CORE_ERROR( "[GltfExporter] Mesh has no vertices" );
            return Result::SERIALIZATION_ERROR;
        }

        if( !mesh.IsConsistent() )
        {
            FP_CORE_ERROR( "[GltfExporter] Mesh arrays are not aligned or faces index out of range" );
            return Result::SERIALIZATION_ERROR;
        }

        std::vector<BufferViewInfo> views;
        uint64_t                    totalLength = 0;
        FP_RETURN_IF_FAILED( ComputeLayout( CountSections( mesh ), views, totalLength ) );
        FP_RETURN_IF_FAILED( CheckLimits( mesh.VertexCount(), totalLength ) );

        // 1. Bounding box for the POSITION accessor
        glm::vec3 minPos = mesh.vertices.front();
        glm::vec3 maxPos = mesh.vertices.front();
        for( const glm::vec3& v : mesh.vertices )
        {
            minPos = glm::min( minPos, v );
            maxPos = glm::max( maxPos, v );
        }

        // 2. Binary buffer: positions, normals, colors, indices
        std::vector<uint8_t> binary( static_cast<size_t>( totalLength ) );
        uint8_t*             dst = binary.data();
        dst                      = WriteVec3Array( dst, mesh.vertices );
        dst                      = WriteVec3Array( dst, mesh.normals );
        dst                      = WriteVec3Array( dst, mesh.colors );
        for( const glm::uvec3& face : mesh.faces )
        {
            WriteU32( dst + 0, face.x );
            WriteU32( dst + 4, face.y );
            WriteU32( dst + 8, face.z );
            dst += 12;
        }
        FP_CORE_ASSERT( dst == binary.data() + binary.size(), "Binary layout does not match the computed views" );

        // 3. Document
        using json = nlohmann::json;

        json bufferViews = json::array();
        for( size_t i = 0; i < views.size(); ++i )
        {
            const uint32_t target = i == static_cast<size_t>( BufferSection::INDICES ) ? GltfConstants::TARGET_ELEMENT_ARRAY_BUFFER
                                                                                        : GltfConstants::TARGET_ARRAY_BUFFER;
            bufferViews.push_back(
                { { "buffer", 0 }, { "byteOffset", views[ i ].byteOffset }, { "byteLength", views[ i ].byteLength }, { "target", target } } );
        }

        json accessors = json::array();
        accessors.push_back( { { "bufferView", static_cast<uint32_t>( BufferSection::POSITION ) },
                               { "componentType", GltfConstants::COMPONENT_FLOAT },
                               { "count", mesh.vertices.size() },
                               { "type", "VEC3" },
                               { "max", Vec3ToJson( maxPos ) },
                               { "min", Vec3ToJson( minPos ) } } );
        accessors.push_back( { { "bufferView", static_cast<uint32_t>( BufferSection::NORMAL ) },
                               { "componentType", GltfConstants::COMPONENT_FLOAT },
                               { "count", mesh.normals.size() },
                               { "type", "VEC3" } } );
        accessors.push_back( { { "bufferView", static_cast<uint32_t>( BufferSection::COLOR ) },
                               { "componentType", GltfConstants::COMPONENT_FLOAT },
                               { "count", mesh.colors.size() },
                               { "type", "VEC3" } } );
        accessors.push_back( { { "bufferView", static_cast<uint32_t>( BufferSection::INDICES ) },
                               { "componentType", GltfConstants::COMPONENT_UNSIGNED_INT },
                               { "count", mesh.IndexCount() },
                               { "type", "SCALAR" } } );

        json primitive = { { "attributes",
                             { { "POSITION", static_cast<uint32_t>( BufferSection::POSITION ) },
                               { "NORMAL", static_cast<uint32_t>( BufferSection::NORMAL ) },
                               { "COLOR_0", static_cast<uint32_t>( BufferSection::COLOR ) } } },
                           { "indices", static_cast<uint32_t>( BufferSection::INDICES ) },
                           { "material", 0 },
                           { "mode", GltfConstants::MODE_TRIANGLES } };

        json material = { { "pbrMetallicRoughness",
                            { { "baseColorFactor", { 1.0, 1.0, 1.0, 1.0 } }, { "metallicFactor", 0.0 }, { "roughnessFactor", 1.0 } } },
                          { "doubleSided", true } };

        json scene;
        scene[ "nodes" ] = json::array( { 0 } );

        json node;
        node[ "mesh" ] = 0;

        json meshEntry;
        meshEntry[ "primitives" ] = json::array();
        meshEntry[ "primitives" ].push_back( primitive );

        json document;
        document[ "asset" ]     = { { "version", "2.0" }, { "generator", GENERATOR_NAME } };
        document[ "scene" ]     = 0;
        document[ "scenes" ]    = json::array();
        document[ "nodes" ]     = json::array();
        document[ "materials" ] = json::array();
        document[ "meshes" ]    = json::array();
        document[ "scenes" ].push_back( scene );
        document[ "nodes" ].push_back( node );
        document[ "materials" ].push_back( material );
        document[ "meshes" ].push_back( meshEntry );
        document[ "accessors" ]   = accessors;
        document[ "bufferViews" ] = bufferViews;
        document[ "buffers" ]     = json::array();
        document[ "buffers" ].push_back( { { "byteLength", totalLength } } );

        ModelMetadata summary = metadata;
        summary.numVertices   = static_cast<uint32_t>( mesh.VertexCount() );
        summary.numFaces      = static_cast<uint32_t>( mesh.FaceCount() );

        FP_CORE_INFO( "[GltfExporter] {} vertices, {} faces, {} bytes", summary.numVertices, summary.numFaces, totalLength );

        outAsset.document = std::move( document );
        outAsset.binary   = std::move( binary );
        outAsset.metadata = summary;
        return Result::SUCCESS;
    }
} // namespace FloorPlan3D
