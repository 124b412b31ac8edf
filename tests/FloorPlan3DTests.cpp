#include "FloorPlan3D.h"
#include <filesystem>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using FloorPlan3D::Result;

namespace
{
    const char* SAMPLE_DETECTION = R"({
        "points": [
            {"x1": 0, "y1": 0, "x2": 500, "y2": 10},
            {"x1": 0, "y1": 0, "x2": 10, "y2": 300},
            {"x1": 200, "y1": 0, "x2": 240, "y2": 10},
            {"x1": 0, "y1": 100, "x2": 10, "y2": 160},
            {"x1": 50, "y1": 50, "x2": 60, "y2": 60}
        ],
        "classes": [ {"name": "wall"}, {"id": 1}, {"name": "door"}, {"id": 2}, {"id": 0} ],
        "Width": 500,
        "Height": 300,
        "averageDoor": 40
    })";
} // namespace

class FloorPlan3DTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        m_root = std::filesystem::current_path() / "temp_facade_env";
        if( std::filesystem::exists( m_root ) )
            std::filesystem::remove_all( m_root );

        m_rootString           = m_root.string();
        m_config.rootDirectory = m_rootString.c_str();
    }

    void TearDown() override
    {
        m_converter.Shutdown();
        if( std::filesystem::exists( m_root ) )
            std::filesystem::remove_all( m_root );
    }

    ::FloorPlan3D::FloorPlan3D        m_converter;
    ::FloorPlan3D::FloorPlan3DConfig  m_config;
    std::filesystem::path             m_root;
    std::string                       m_rootString;
};

// 1. In-memory conversion returns the document, buffer and metadata
TEST_F( FloorPlan3DTest, Convert )
{
    ASSERT_EQ( m_converter.Initialize( m_config ), Result::SUCCESS );

    ::FloorPlan3D::ConversionOutput output;
    ASSERT_EQ( m_converter.Convert( SAMPLE_DETECTION, output ), Result::SUCCESS );

    nlohmann::json document = nlohmann::json::parse( output.gltfJson );
    EXPECT_EQ( document[ "buffers" ][ 0 ][ "byteLength" ].get<size_t>(), output.binary.size() );
    EXPECT_FALSE( document[ "buffers" ][ 0 ].contains( "uri" ) );

    EXPECT_EQ( output.metadata.numWalls, 2u );
    EXPECT_EQ( output.metadata.numDoors, 1u );
    EXPECT_EQ( output.metadata.numWindows, 1u );
    EXPECT_EQ( output.metadata.numVertices, 4u + 16u + 4u + 4u + 4u );
    EXPECT_EQ( output.stats.droppedLabels, 1u );
}

// 2. Bad input surfaces the validation error
TEST_F( FloorPlan3DTest, ConvertRejectsBadInput )
{
    ASSERT_EQ( m_converter.Initialize( m_config ), Result::SUCCESS );

    ::FloorPlan3D::ConversionOutput output;
    EXPECT_EQ( m_converter.Convert( "not json", output ), Result::VALIDATION_ERROR );
    EXPECT_EQ( m_converter.Convert( R"({"points": [{"x1":0,"y1":0,"x2":1,"y2":1}], "classes": [], "Width": 5, "Height": 5})", output ),
               Result::VALIDATION_ERROR );
    EXPECT_TRUE( output.gltfJson.empty() );
    EXPECT_TRUE( output.binary.empty() );
}

// 3. Calls before Initialize fail cleanly
TEST_F( FloorPlan3DTest, RequiresInitialize )
{
    ::FloorPlan3D::ConversionOutput output;
    EXPECT_EQ( m_converter.Convert( SAMPLE_DETECTION, output ), Result::FAIL );
    EXPECT_EQ( m_converter.GetFileSystem(), nullptr );
}

// 4. Invalid generator settings are caught at Initialize
TEST_F( FloorPlan3DTest, InvalidConfig )
{
    m_config.generator.wallHeight = -1.0;
    EXPECT_EQ( m_converter.Initialize( m_config ), Result::VALIDATION_ERROR );
}

// 5. File conversion in every output format
TEST_F( FloorPlan3DTest, ConvertFileFormats )
{
    const struct
    {
        ::FloorPlan3D::OutputFormat format;
        const char*                 output;
        const char*                 sidecar;
    } cases[] = {
        { ::FloorPlan3D::OutputFormat::GLB, "plan.glb", nullptr },
        { ::FloorPlan3D::OutputFormat::GLTF_SEPARATE, "plan.gltf", "plan.bin" },
        { ::FloorPlan3D::OutputFormat::GLTF_EMBEDDED, "inline/plan.gltf", nullptr },
    };

    for( const auto& c : cases )
    {
        ::FloorPlan3D::FloorPlan3D converter;
        m_config.outputFormat = c.format;
        ASSERT_EQ( converter.Initialize( m_config ), Result::SUCCESS );
        ASSERT_EQ( converter.GetFileSystem()->WriteFile( "detection.json", std::string( SAMPLE_DETECTION ) ), Result::SUCCESS );

        ::FloorPlan3D::ConversionOutput output;
        ASSERT_EQ( converter.ConvertFile( "detection.json", c.output, output ), Result::SUCCESS );
        EXPECT_TRUE( std::filesystem::exists( m_root / c.output ) );
        if( c.sidecar )
            EXPECT_TRUE( std::filesystem::exists( m_root / c.sidecar ) );

        ASSERT_EQ( converter.WriteMetadata( "plan.meta.json", output ), Result::SUCCESS );
        EXPECT_TRUE( std::filesystem::exists( m_root / "plan.meta.json" ) );
        converter.Shutdown();
    }
}

// 6. Missing input file
TEST_F( FloorPlan3DTest, ConvertFileMissingInput )
{
    ASSERT_EQ( m_converter.Initialize( m_config ), Result::SUCCESS );

    ::FloorPlan3D::ConversionOutput output;
    EXPECT_EQ( m_converter.ConvertFile( "missing.json", "plan.glb", output ), Result::IO_ERROR );
    EXPECT_FALSE( std::filesystem::exists( m_root / "plan.glb" ) );
}
