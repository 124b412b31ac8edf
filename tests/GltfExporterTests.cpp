#include "export/GltfExporter.hpp"
#include "geometry/MeshBuilder.hpp"
#include <cstring>
#include <gtest/gtest.h>
#include <limits>

using namespace FloorPlan3D;

namespace
{
    uint32_t ReadU32( const std::vector<uint8_t>& bytes, size_t offset )
    {
        return uint32_t( bytes[ offset ] ) | ( uint32_t( bytes[ offset + 1 ] ) << 8 ) | ( uint32_t( bytes[ offset + 2 ] ) << 16 ) |
               ( uint32_t( bytes[ offset + 3 ] ) << 24 );
    }

    float ReadF32( const std::vector<uint8_t>& bytes, size_t offset )
    {
        uint32_t bits = ReadU32( bytes, offset );
        float    value;
        std::memcpy( &value, &bits, sizeof( value ) );
        return value;
    }

    std::vector<glm::vec3> DecodeVec3( const std::vector<uint8_t>& bytes, const nlohmann::json& view )
    {
        size_t                 offset = view[ "byteOffset" ].get<size_t>();
        size_t                 length = view[ "byteLength" ].get<size_t>();
        std::vector<glm::vec3> values;
        for( size_t at = offset; at < offset + length; at += 12 )
            values.emplace_back( ReadF32( bytes, at ), ReadF32( bytes, at + 4 ), ReadF32( bytes, at + 8 ) );
        return values;
    }
} // namespace

class GltfExporterTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        WorldScale scale;
        ASSERT_EQ( ScaleResolver::Resolve( 400, 300, scale ), Result::SUCCESS );

        FloorPlanLayout layout;
        layout.width   = 400;
        layout.height  = 300;
        layout.walls   = { { 0, 0, 400, 8 }, { 0, 0, 8, 300 } };
        layout.doors   = { { 100, 0, 140, 8 } };
        layout.windows = { { 0, 120, 8, 180 } };

        MeshBuilder     builder( GeneratorConfig{}, scale );
        GenerationStats stats;
        builder.Build( layout, m_mesh, stats );

        m_metadata.wallHeight    = 3.0;
        m_metadata.wallThickness = 0.15;
        m_metadata.numWalls      = 2;
        m_metadata.numDoors      = 1;
        m_metadata.numWindows    = 1;
    }

    MeshBuffer    m_mesh;
    ModelMetadata m_metadata;
};

// 1. Document structure: one scene, node, mesh, material and buffer
TEST_F( GltfExporterTest, DocumentStructure )
{
    GltfAsset asset;
    ASSERT_EQ( GltfExporter::Export( m_mesh, m_metadata, asset ), Result::SUCCESS );

    const nlohmann::json& doc = asset.document;
    EXPECT_EQ( doc[ "asset" ][ "version" ], "2.0" );
    EXPECT_EQ( doc[ "asset" ][ "generator" ], "FloorPlan3D" );
    EXPECT_EQ( doc[ "scene" ], 0 );
    ASSERT_EQ( doc[ "scenes" ].size(), 1u );
    EXPECT_EQ( doc[ "scenes" ][ 0 ][ "nodes" ][ 0 ], 0 );
    EXPECT_EQ( doc[ "nodes" ][ 0 ][ "mesh" ], 0 );
    ASSERT_EQ( doc[ "buffers" ].size(), 1u );
    EXPECT_FALSE( doc[ "buffers" ][ 0 ].contains( "uri" ) );

    const nlohmann::json& primitive = doc[ "meshes" ][ 0 ][ "primitives" ][ 0 ];
    EXPECT_EQ( primitive[ "attributes" ][ "POSITION" ], 0 );
    EXPECT_EQ( primitive[ "attributes" ][ "NORMAL" ], 1 );
    EXPECT_EQ( primitive[ "attributes" ][ "COLOR_0" ], 2 );
    EXPECT_EQ( primitive[ "indices" ], 3 );
    EXPECT_EQ( primitive[ "mode" ], 4 );

    const nlohmann::json& material = doc[ "materials" ][ 0 ];
    EXPECT_TRUE( material[ "doubleSided" ].get<bool>() );
    EXPECT_EQ( material[ "pbrMetallicRoughness" ][ "metallicFactor" ], 0.0 );
    EXPECT_EQ( material[ "pbrMetallicRoughness" ][ "roughnessFactor" ], 1.0 );
}

// 2. Accessor counts and component types
TEST_F( GltfExporterTest, Accessors )
{
    GltfAsset asset;
    ASSERT_EQ( GltfExporter::Export( m_mesh, m_metadata, asset ), Result::SUCCESS );

    const nlohmann::json& accessors = asset.document[ "accessors" ];
    ASSERT_EQ( accessors.size(), 4u );
    for( size_t i = 0; i < 3; ++i )
    {
        EXPECT_EQ( accessors[ i ][ "componentType" ], GltfConstants::COMPONENT_FLOAT );
        EXPECT_EQ( accessors[ i ][ "type" ], "VEC3" );
        EXPECT_EQ( accessors[ i ][ "count" ], m_mesh.VertexCount() );
    }
    EXPECT_EQ( accessors[ 3 ][ "componentType" ], GltfConstants::COMPONENT_UNSIGNED_INT );
    EXPECT_EQ( accessors[ 3 ][ "type" ], "SCALAR" );
    EXPECT_EQ( accessors[ 3 ][ "count" ], m_mesh.IndexCount() );

    // Bounding box over all positions
    glm::vec3 minPos = m_mesh.vertices.front();
    glm::vec3 maxPos = m_mesh.vertices.front();
    for( const glm::vec3& v : m_mesh.vertices )
    {
        minPos = glm::min( minPos, v );
        maxPos = glm::max( maxPos, v );
    }
    EXPECT_EQ( accessors[ 0 ][ "min" ][ 0 ].get<float>(), minPos.x );
    EXPECT_EQ( accessors[ 0 ][ "min" ][ 2 ].get<float>(), minPos.z );
    EXPECT_EQ( accessors[ 0 ][ "max" ][ 1 ].get<float>(), maxPos.y );
    EXPECT_FLOAT_EQ( accessors[ 0 ][ "max" ][ 1 ].get<float>(), 3.0f );
}

// 3. Buffer views tile the buffer exactly, in section order
TEST_F( GltfExporterTest, BufferViewsSumToBufferLength )
{
    GltfAsset asset;
    ASSERT_EQ( GltfExporter::Export( m_mesh, m_metadata, asset ), Result::SUCCESS );

    const nlohmann::json& views  = asset.document[ "bufferViews" ];
    uint64_t              sum    = 0;
    uint64_t              offset = 0;
    ASSERT_EQ( views.size(), 4u );
    for( const nlohmann::json& view : views )
    {
        EXPECT_EQ( view[ "buffer" ], 0 );
        EXPECT_EQ( view[ "byteOffset" ].get<uint64_t>(), offset );
        EXPECT_EQ( view[ "byteOffset" ].get<uint64_t>() % 4, 0u );
        offset += view[ "byteLength" ].get<uint64_t>();
        sum += view[ "byteLength" ].get<uint64_t>();
    }

    EXPECT_EQ( sum, asset.document[ "buffers" ][ 0 ][ "byteLength" ].get<uint64_t>() );
    EXPECT_EQ( sum, asset.binary.size() );
    EXPECT_EQ( views[ 0 ][ "byteLength" ].get<uint64_t>(), m_mesh.VertexCount() * 12 );
    EXPECT_EQ( views[ 3 ][ "byteLength" ].get<uint64_t>(), m_mesh.IndexCount() * 4 );
    EXPECT_EQ( views[ 0 ][ "target" ], GltfConstants::TARGET_ARRAY_BUFFER );
    EXPECT_EQ( views[ 3 ][ "target" ], GltfConstants::TARGET_ELEMENT_ARRAY_BUFFER );
}

// 4. Decoding the buffer at the declared offsets gives back the mesh exactly
TEST_F( GltfExporterTest, BinaryDecodesLosslessly )
{
    GltfAsset asset;
    ASSERT_EQ( GltfExporter::Export( m_mesh, m_metadata, asset ), Result::SUCCESS );

    const nlohmann::json& views = asset.document[ "bufferViews" ];
    EXPECT_EQ( DecodeVec3( asset.binary, views[ 0 ] ), m_mesh.vertices );
    EXPECT_EQ( DecodeVec3( asset.binary, views[ 1 ] ), m_mesh.normals );
    EXPECT_EQ( DecodeVec3( asset.binary, views[ 2 ] ), m_mesh.colors );

    size_t                  offset = views[ 3 ][ "byteOffset" ].get<size_t>();
    std::vector<glm::uvec3> faces;
    for( size_t i = 0; i < m_mesh.FaceCount(); ++i, offset += 12 )
        faces.emplace_back( ReadU32( asset.binary, offset ), ReadU32( asset.binary, offset + 4 ), ReadU32( asset.binary, offset + 8 ) );
    EXPECT_EQ( faces, m_mesh.faces );
}

// 5. Metadata counts come from the mesh, the rest is passed through
TEST_F( GltfExporterTest, Metadata )
{
    GltfAsset asset;
    ASSERT_EQ( GltfExporter::Export( m_mesh, m_metadata, asset ), Result::SUCCESS );

    EXPECT_EQ( asset.metadata.numVertices, m_mesh.VertexCount() );
    EXPECT_EQ( asset.metadata.numFaces, m_mesh.FaceCount() );
    EXPECT_EQ( asset.metadata.numWalls, 2u );
    EXPECT_EQ( asset.metadata.numDoors, 1u );
    EXPECT_EQ( asset.metadata.numWindows, 1u );
    EXPECT_DOUBLE_EQ( asset.metadata.wallThickness, 0.15 );
}

// 6. Unusable meshes are rejected and the asset is left alone
TEST_F( GltfExporterTest, RejectsBadMesh )
{
    GltfAsset asset;
    asset.document[ "marker" ] = true;

    MeshBuffer empty;
    EXPECT_EQ( GltfExporter::Export( empty, m_metadata, asset ), Result::SERIALIZATION_ERROR );

    MeshBuffer misaligned = m_mesh;
    misaligned.colors.pop_back();
    EXPECT_EQ( GltfExporter::Export( misaligned, m_metadata, asset ), Result::SERIALIZATION_ERROR );

    MeshBuffer outOfRange = m_mesh;
    outOfRange.faces.push_back( glm::uvec3( 0, 1, static_cast<uint32_t>( m_mesh.VertexCount() ) ) );
    EXPECT_EQ( GltfExporter::Export( outOfRange, m_metadata, asset ), Result::SERIALIZATION_ERROR );

    EXPECT_TRUE( asset.document.contains( "marker" ) );
    EXPECT_TRUE( asset.binary.empty() );
}

// 7. Layout arithmetic
TEST_F( GltfExporterTest, ComputeLayout )
{
    std::vector<BufferViewInfo> views;
    uint64_t                    total = 0;
    ASSERT_EQ( GltfExporter::ComputeLayout( GltfExporter::CountSections( m_mesh ), views, total ), Result::SUCCESS );

    ASSERT_EQ( views.size(), static_cast<size_t>( BufferSection::COUNT ) );
    const uint64_t vec3Bytes = m_mesh.VertexCount() * 12;
    EXPECT_EQ( views[ 1 ].byteOffset, vec3Bytes );
    EXPECT_EQ( views[ 2 ].byteOffset, vec3Bytes * 2 );
    EXPECT_EQ( views[ 3 ].byteOffset, vec3Bytes * 3 );
    EXPECT_EQ( total, vec3Bytes * 3 + m_mesh.FaceCount() * 12 );
}

// 8. Section sizes that overflow 64-bit arithmetic fail and leave the outputs alone
TEST_F( GltfExporterTest, ComputeLayoutOverflow )
{
    const uint64_t maxCount = std::numeric_limits<uint64_t>::max();

    std::vector<BufferViewInfo> views( 1 );
    views[ 0 ].byteLength = 42;
    uint64_t total        = 7;

    // count * 12 overflows
    EXPECT_EQ( GltfExporter::ComputeLayout( { maxCount / 2, 0, 0, 0 }, views, total ), Result::SERIALIZATION_ERROR );

    // Each section fits, their sum does not
    const uint64_t largest = maxCount / 12;
    EXPECT_EQ( GltfExporter::ComputeLayout( { largest, largest, 0, 0 }, views, total ), Result::SERIALIZATION_ERROR );

    ASSERT_EQ( views.size(), 1u );
    EXPECT_EQ( views[ 0 ].byteLength, 42u );
    EXPECT_EQ( total, 7u );
}

// 9. 32-bit container limits on vertex count and buffer length
TEST_F( GltfExporterTest, ContainerLimits )
{
    const uint64_t maxU32 = std::numeric_limits<uint32_t>::max();

    EXPECT_EQ( GltfExporter::CheckLimits( 3, 48 ), Result::SUCCESS );
    EXPECT_EQ( GltfExporter::CheckLimits( maxU32, maxU32 ), Result::SUCCESS );
    EXPECT_EQ( GltfExporter::CheckLimits( maxU32 + 1, 48 ), Result::SERIALIZATION_ERROR );
    EXPECT_EQ( GltfExporter::CheckLimits( 3, maxU32 + 1 ), Result::SERIALIZATION_ERROR );

    // A layout that is valid in 64 bits but too large for the container
    std::vector<BufferViewInfo> views;
    uint64_t                    total = 0;
    const uint64_t              count = maxU32 / 12 + 1;
    ASSERT_EQ( GltfExporter::ComputeLayout( { count, count, count, count }, views, total ), Result::SUCCESS );
    EXPECT_GT( total, maxU32 );
    EXPECT_EQ( GltfExporter::CheckLimits( count, total ), Result::SERIALIZATION_ERROR );
}
