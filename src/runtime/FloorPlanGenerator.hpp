#pragma once
#include "FloorPlan3DTypes.h"
#include "detection/Detection.hpp"
#include "resources/Mesh.hpp"

namespace FloorPlan3D
{
    struct GeneratedModel
    {
        MeshBuffer      mesh;
        ModelMetadata   metadata;
        GenerationStats stats;
    };

    /**
     * @brief Runs one detection result through parse, scale and mesh building.
     *
     * Holds only the configuration, which is never modified, so separate
     * Generate() calls may run on separate threads with their own outputs.
     */
    class FloorPlanGenerator
    {
    public:
        explicit FloorPlanGenerator( const GeneratorConfig& config );

        /**
         * @brief Builds floor, walls, doors, windows and ceiling for the detection.
         * @return VALIDATION_ERROR for an invalid config or detection result. outModel
         *         is only written on success.
         */
        Result Generate( const DetectionResult& detection, GeneratedModel& outModel ) const;

        const GeneratorConfig& GetConfig() const { return m_config; }

    private:
        GeneratorConfig m_config;
    };
} // namespace FloorPlan3D
