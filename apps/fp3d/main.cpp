#include <FloorPlan3D.h>
#include <core/Log.h>
#include <runtime/ConfigLoader.hpp>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

#ifndef FP_VERSION
#    define FP_VERSION "0.0.0"
#endif

namespace
{
    void PrintUsage( const char* progName )
    {
        std::cout << "fp3d " << FP_VERSION << " - floor plan detections to glTF 2.0\n"
                  << "Usage: " << progName << " --input <detection.json> --output <model.gltf|model.glb> [options]\n\n"
                  << "Options:\n"
                  << "  --input <file>              Detector output JSON (required)\n"
                  << "  --output <file>             .glb container, or .gltf with an external .bin (required)\n"
                  << "  --embed                     With .gltf, inline the buffer as a base64 data URI\n"
                  << "  --config <file>             JSON with wall_height, wall_thickness, door_height,\n"
                  << "                              window_height, window_sill_height\n"
                  << "  --wall-height <m>           Default 3.0\n"
                  << "  --wall-thickness <m>        Default 0.15\n"
                  << "  --door-height <m>           Default 2.1\n"
                  << "  --window-height <m>         Default 1.2\n"
                  << "  --window-sill-height <m>    Default 0.9\n"
                  << "  --metadata <file>           Also write the model summary as JSON\n"
                  << "  --verbose                   Debug logging\n"
                  << "  --quiet                     Errors only\n"
                  << "  --version                   Print version and exit\n"
                  << "  --help                      Show this help\n\n"
                  << "Example:\n"
                  << "  " << progName << " --input plan.json --output plan.glb --wall-height 2.8\n";
    }

    bool ParseNumber( const std::string& text, double& out )
    {
        if( text.empty() )
            return false;

        char* end = nullptr;
        errno     = 0;
        out       = std::strtod( text.c_str(), &end );
        return errno == 0 && end == text.c_str() + text.size();
    }

    std::string Lowercase( std::string text )
    {
        for( char& c : text )
            c = static_cast<char>( std::tolower( static_cast<unsigned char>( c ) ) );
        return text;
    }
} // namespace

int main( int argc, char** argv )
{
    using FloorPlan3D::Result;

    FloorPlan3D::Log::Init();

    std::string inputFile;
    std::string outputFile;
    std::string configFile;
    std::string metadataFile;
    bool        embed = false;

    struct Override
    {
        const char*           flag;
        double FloorPlan3D::GeneratorConfig::*field;
        std::optional<double> value;
    };

    Override overrides[] = {
        { "--wall-height", &FloorPlan3D::GeneratorConfig::wallHeight, std::nullopt },
        { "--wall-thickness", &FloorPlan3D::GeneratorConfig::wallThickness, std::nullopt },
        { "--door-height", &FloorPlan3D::GeneratorConfig::doorHeight, std::nullopt },
        { "--window-height", &FloorPlan3D::GeneratorConfig::windowHeight, std::nullopt },
        { "--window-sill-height", &FloorPlan3D::GeneratorConfig::windowSillHeight, std::nullopt },
    };

    for( int i = 1; i < argc; ++i )
    {
        std::string arg = argv[ i ];

        if( arg == "--help" || arg == "-h" )
        {
            PrintUsage( argv[ 0 ] );
            return 0;
        }
        else if( arg == "--version" )
        {
            std::cout << FP_VERSION << std::endl;
            return 0;
        }
        else if( arg == "--verbose" )
        {
            FloorPlan3D::Log::SetLevel( spdlog::level::debug );
        }
        else if( arg == "--quiet" )
        {
            FloorPlan3D::Log::SetLevel( spdlog::level::err );
        }
        else if( arg == "--embed" )
        {
            embed = true;
        }
        else if( arg == "--input" && i + 1 < argc )
        {
            inputFile = argv[ ++i ];
        }
        else if( arg == "--output" && i + 1 < argc )
        {
            outputFile = argv[ ++i ];
        }
        else if( arg == "--config" && i + 1 < argc )
        {
            configFile = argv[ ++i ];
        }
        else if( arg == "--metadata" && i + 1 < argc )
        {
            metadataFile = argv[ ++i ];
        }
        else
        {
            bool matched = false;
            for( Override& entry : overrides )
            {
                if( arg != entry.flag || i + 1 >= argc )
                    continue;

                double value = 0.0;
                if( !ParseNumber( argv[ ++i ], value ) )
                {
                    FP_ERROR( "{} expects a number, got '{}'", entry.flag, argv[ i ] );
                    return 1;
                }
                entry.value = value;
                matched     = true;
                break;
            }

            if( !matched )
            {
                FP_ERROR( "Unknown or incomplete option '{}'", arg );
                PrintUsage( argv[ 0 ] );
                return 1;
            }
        }
    }

    if( inputFile.empty() || outputFile.empty() )
    {
        FP_ERROR( "--input and --output are required" );
        PrintUsage( argv[ 0 ] );
        return 1;
    }

    FloorPlan3D::FloorPlan3DConfig config;

    const std::string extension = Lowercase( std::filesystem::path( outputFile ).extension().string() );
    if( extension == ".glb" )
    {
        if( embed )
            FP_WARN( "--embed has no effect on .glb output" );
        config.outputFormat = FloorPlan3D::OutputFormat::GLB;
    }
    else if( extension == ".gltf" )
    {
        config.outputFormat = embed ? FloorPlan3D::OutputFormat::GLTF_EMBEDDED : FloorPlan3D::OutputFormat::GLTF_SEPARATE;
    }
    else
    {
        FP_ERROR( "Output must end in .gltf or .glb, got '{}'", outputFile );
        return 1;
    }

    // 1. Config file, then command line overrides
    if( !configFile.empty() )
    {
        FloorPlan3D::FileSystem fileSystem;
        std::string             text;
        Result                  res = fileSystem.Initialize( {} );
        if( res == Result::SUCCESS )
            res = fileSystem.ReadFile( configFile, text );
        if( res == Result::SUCCESS )
            res = FloorPlan3D::ConfigLoader::FromJsonString( text, config.generator );
        if( res != Result::SUCCESS )
        {
            FP_ERROR( "Failed to load config '{}': {}", configFile, FloorPlan3D::toString( res ) );
            return 1;
        }
    }

    for( const Override& entry : overrides )
    {
        if( entry.value )
            config.generator.*entry.field = *entry.value;
    }

    // 2. Convert
    FloorPlan3D::FloorPlan3D converter;
    Result                   res = converter.Initialize( config );
    if( res != Result::SUCCESS )
    {
        FP_ERROR( "Initialization failed: {}", FloorPlan3D::toString( res ) );
        return 1;
    }

    FloorPlan3D::ConversionOutput output;
    res = converter.ConvertFile( inputFile, outputFile, output );
    if( res != Result::SUCCESS )
    {
        FP_ERROR( "Conversion failed: {}", FloorPlan3D::toString( res ) );
        return 1;
    }

    if( !metadataFile.empty() )
    {
        res = converter.WriteMetadata( metadataFile, output );
        if( res != Result::SUCCESS )
        {
            FP_ERROR( "Writing metadata failed: {}", FloorPlan3D::toString( res ) );
            return 1;
        }
    }

    if( output.stats.droppedLabels > 0 || output.stats.skippedDegenerate > 0 )
    {
        FP_WARN( "{} element(s) with unknown labels dropped, {} degenerate element(s) skipped", output.stats.droppedLabels,
                 output.stats.skippedDegenerate );
    }

    FP_INFO( "Done: {} walls, {} doors, {} windows", output.metadata.numWalls, output.metadata.numDoors, output.metadata.numWindows );
    converter.Shutdown();
    return 0;
}
