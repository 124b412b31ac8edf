#pragma once
#include <cstdint>
#include <glm/glm.hpp>
#include <vector>

namespace FloorPlan3D
{
    /**
     * @brief CPU-side triangle soup accumulated by the MeshBuilder.
     * vertices, normals and colors are index-aligned (one entry per vertex).
     * Every piece of geometry appends its own vertex block; nothing is welded.
     */
    struct MeshBuffer
    {
        std::vector<glm::vec3>  vertices; // World position, Y up
        std::vector<glm::vec3>  normals;
        std::vector<glm::vec3>  colors; // Linear RGB [0,1]
        std::vector<glm::uvec3> faces;  // Triangle indices into vertices

        size_t VertexCount() const { return vertices.size(); }
        size_t FaceCount() const { return faces.size(); }
        size_t IndexCount() const { return faces.size() * 3; }
        bool   IsEmpty() const { return vertices.empty(); }

        /**
         * @brief Checks the parallel array sizes and that every face index is in range.
         */
        bool IsConsistent() const
        {
            if( normals.size() != vertices.size() || colors.size() != vertices.size() )
                return false;

            const size_t count = vertices.size();
            for( const glm::uvec3& face : faces )
            {
                if( face.x >= count || face.y >= count || face.z >= count )
                    return false;
            }
            return true;
        }

        void Clear()
        {
            vertices.clear();
            normals.clear();
            colors.clear();
            faces.clear();
        }
    };
} // namespace FloorPlan3D
