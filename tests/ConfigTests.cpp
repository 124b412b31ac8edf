#include "runtime/ConfigLoader.hpp"
#include <gtest/gtest.h>
#include <limits>

using namespace FloorPlan3D;

// 1. Defaults
TEST( ConfigTest, Defaults )
{
    GeneratorConfig config;
    EXPECT_DOUBLE_EQ( config.wallHeight, 3.0 );
    EXPECT_DOUBLE_EQ( config.wallThickness, 0.15 );
    EXPECT_DOUBLE_EQ( config.doorHeight, 2.1 );
    EXPECT_DOUBLE_EQ( config.windowHeight, 1.2 );
    EXPECT_DOUBLE_EQ( config.windowSillHeight, 0.9 );
    EXPECT_EQ( config.Validate(), Result::SUCCESS );
}

// 2. Range checks
TEST( ConfigTest, Validate )
{
    GeneratorConfig config;
    config.windowSillHeight = 0.0;
    EXPECT_EQ( config.Validate(), Result::SUCCESS );

    config.windowSillHeight = -0.1;
    EXPECT_EQ( config.Validate(), Result::VALIDATION_ERROR );

    config                  = GeneratorConfig{};
    config.wallHeight       = 0.0;
    EXPECT_EQ( config.Validate(), Result::VALIDATION_ERROR );

    config                  = GeneratorConfig{};
    config.doorHeight       = std::numeric_limits<double>::infinity();
    EXPECT_EQ( config.Validate(), Result::VALIDATION_ERROR );

    config                  = GeneratorConfig{};
    config.windowHeight     = std::numeric_limits<double>::quiet_NaN();
    EXPECT_EQ( config.Validate(), Result::VALIDATION_ERROR );
}

// 3. Partial override keeps the other values
TEST( ConfigTest, FromJsonPartial )
{
    GeneratorConfig config;
    ASSERT_EQ( ConfigLoader::FromJsonString( R"({"wall_height": 2.7, "window_sill_height": 1})", config ), Result::SUCCESS );
    EXPECT_DOUBLE_EQ( config.wallHeight, 2.7 );
    EXPECT_DOUBLE_EQ( config.windowSillHeight, 1.0 );
    EXPECT_DOUBLE_EQ( config.wallThickness, 0.15 );
}

// 4. Unknown keys are ignored
TEST( ConfigTest, UnknownKeysIgnored )
{
    GeneratorConfig config;
    ASSERT_EQ( ConfigLoader::FromJsonString( R"({"roof": "flat", "door_height": 2.0})", config ), Result::SUCCESS );
    EXPECT_DOUBLE_EQ( config.doorHeight, 2.0 );
}

// 5. Bad input leaves the config untouched
TEST( ConfigTest, RejectsBadInput )
{
    GeneratorConfig config;
    EXPECT_EQ( ConfigLoader::FromJsonString( "{broken", config ), Result::VALIDATION_ERROR );
    EXPECT_EQ( ConfigLoader::FromJsonString( "[1, 2]", config ), Result::VALIDATION_ERROR );
    EXPECT_EQ( ConfigLoader::FromJsonString( R"({"wall_height": "tall"})", config ), Result::VALIDATION_ERROR );
    EXPECT_EQ( ConfigLoader::FromJsonString( R"({"wall_height": 2.5, "wall_thickness": -1})", config ), Result::VALIDATION_ERROR );
    EXPECT_DOUBLE_EQ( config.wallHeight, 3.0 );
    EXPECT_DOUBLE_EQ( config.wallThickness, 0.15 );
}

// 6. ToJson output loads back
TEST( ConfigTest, ToJsonLoadsBack )
{
    GeneratorConfig source;
    source.wallHeight   = 2.5;
    source.windowHeight = 1.4;

    GeneratorConfig loaded;
    ASSERT_EQ( ConfigLoader::FromJson( ConfigLoader::ToJson( source ), loaded ), Result::SUCCESS );
    EXPECT_DOUBLE_EQ( loaded.wallHeight, 2.5 );
    EXPECT_DOUBLE_EQ( loaded.windowHeight, 1.4 );
}
