#pragma once
#include "FloorPlan3DTypes.h"
#include "detection/Detection.hpp"
#include "geometry/ScaleResolver.hpp"
#include "resources/Mesh.hpp"

namespace FloorPlan3D
{
    namespace Palette
    {
        inline const glm::vec3 FLOOR   = { 0.6f, 0.6f, 0.6f };
        inline const glm::vec3 CEILING = { 0.95f, 0.95f, 0.95f };
        inline const glm::vec3 WALL    = { 0.95f, 0.95f, 0.95f };
        inline const glm::vec3 DOOR    = { 0.4f, 0.25f, 0.1f };
        inline const glm::vec3 WINDOW  = { 0.3f, 0.6f, 0.9f };
    } // namespace Palette

    /**
     * @brief Emits building geometry into a caller-owned MeshBuffer.
     *
     * Pixel (x, y) maps to world (x * scale.x, 0, y * scale.y) with Y up. Every
     * element appends a fresh vertex block. Openings are thin double-sided panels
     * placed on top of the walls; walls are never cut.
     *
     * The builder only holds read-only parameters, so one instance can serve many
     * meshes, but a given MeshBuffer must not be shared between concurrent calls.
     */
    class MeshBuilder
    {
    public:
        MeshBuilder( const GeneratorConfig& config, const WorldScale& scale );

        /**
         * @brief Full building in the order floor, walls, doors, windows, ceiling.
         * Degenerate elements are skipped and counted in outStats.
         */
        void Build( const FloorPlanLayout& layout, MeshBuffer& mesh, GenerationStats& outStats ) const;

        // --- Single elements ---

        // 4 vertices, 2 faces at y = 0, normal +Y
        void AddFloor( MeshBuffer& mesh, int32_t width, int32_t height ) const;

        // 4 vertices, 2 faces at y = wallHeight, reversed winding, normal -Y
        void AddCeiling( MeshBuffer& mesh, int32_t width, int32_t height ) const;

        /**
         * @brief Box of wallThickness around the wall centre line, from the floor to wallHeight.
         * 8 vertices, 10 faces (no bottom).
         * @return GEOMETRY_ERROR for a degenerate rectangle; mesh is left untouched.
         */
        Result AddWall( MeshBuffer& mesh, const Rect& wall ) const;

        // 4 vertices, 4 faces. GEOMETRY_ERROR for a degenerate rectangle.
        Result AddDoor( MeshBuffer& mesh, const Rect& door ) const;
        Result AddWindow( MeshBuffer& mesh, const Rect& window ) const;

        const GeneratorConfig& GetConfig() const { return m_config; }
        const WorldScale&      GetScale() const { return m_scale; }

    private:
        Result AddOpening( MeshBuffer& mesh, const Rect& rect, float64_t bottom, float64_t top, const glm::vec3& color ) const;

        GeneratorConfig m_config;
        WorldScale      m_scale;
    };
} // namespace FloorPlan3D
