#pragma once

#include "core/Core.h"
#include <cstdint>
#include <string>
#include <vector>

namespace FloorPlan3D
{

    /**
     * @brief Architectural parameters of one generation call (meters).
     * Read-only while a model is being generated.
     */
    struct GeneratorConfig
    {
        float64_t wallHeight       = 3.0;
        float64_t wallThickness    = 0.15;
        float64_t doorHeight       = 2.1;
        float64_t windowHeight     = 1.2;
        float64_t windowSillHeight = 0.9;

        /**
         * @brief Checks that every value is finite, heights and thickness are positive
         * and the sill height is not negative.
         * @return VALIDATION_ERROR when any value is out of range.
         */
        Result Validate() const;
    };

    /**
     * @brief Summary returned next to the exported asset.
     */
    struct ModelMetadata
    {
        float64_t wallHeight    = 0.0;
        float64_t wallThickness = 0.0;
        uint32_t  numVertices   = 0;
        uint32_t  numFaces      = 0;
        uint32_t  numWalls      = 0;
        uint32_t  numDoors      = 0;
        uint32_t  numWindows    = 0;
    };

    /**
     * @brief Counters for elements that did not turn into geometry as-is.
     */
    struct GenerationStats
    {
        uint32_t droppedLabels       = 0; // Unrecognized class labels
        uint32_t skippedDegenerate   = 0; // Zero width/height rectangles
        uint32_t wallOpeningOverlaps = 0; // Wall/opening pairs that overlap (not cut)
    };

    enum class OutputFormat
    {
        GLTF_EMBEDDED, // Single .gltf, buffer as base64 data URI
        GLTF_SEPARATE, // .gltf + external .bin
        GLB,           // Binary container
    };

    struct FloorPlan3DConfig
    {
        GeneratorConfig generator;
        OutputFormat    outputFormat  = OutputFormat::GLB;
        const char*     rootDirectory = nullptr; // Base for relative paths, CWD when null
    };

    /**
     * @brief Result of converting one detection result.
     */
    struct ConversionOutput
    {
        std::string          gltfJson; // Structural description (no buffer URI)
        std::vector<uint8_t> binary;   // Bytes referenced by the buffer views
        ModelMetadata        metadata;
        GenerationStats      stats;
    };

} // namespace FloorPlan3D
