#pragma once
#include "FloorPlan3DTypes.h"
#include "core/Base.hpp"
#include "resources/Mesh.hpp"
#include <array>
#include <nlohmann/json.hpp>
#include <vector>

namespace FloorPlan3D
{
    namespace GltfConstants
    {
        constexpr uint32_t COMPONENT_FLOAT             = 5126;
        constexpr uint32_t COMPONENT_UNSIGNED_INT      = 5125;
        constexpr uint32_t MODE_TRIANGLES              = 4;
        constexpr uint32_t COMPONENT_SIZE              = 4; // Every section is float32 or uint32
        constexpr uint32_t TARGET_ARRAY_BUFFER         = 34962;
        constexpr uint32_t TARGET_ELEMENT_ARRAY_BUFFER = 34963;
    } // namespace GltfConstants

    // Fixed section order inside the binary buffer; also the bufferView and accessor index.
    enum class BufferSection : uint32_t
    {
        POSITION = 0,
        NORMAL   = 1,
        COLOR    = 2,
        INDICES  = 3,
        COUNT
    };

    using SectionCounts = std::array<uint64_t, static_cast<size_t>( BufferSection::COUNT )>;

    struct BufferViewInfo
    {
        uint64_t byteOffset = 0;
        uint64_t byteLength = 0;
    };

    /**
     * @brief Exported model: the glTF document, the bytes its buffer views point into,
     * and the summary metadata. The document carries no buffer URI; embedding or
     * externalizing the bytes is up to the caller (see AssetWriter).
     */
    struct GltfAsset
    {
        nlohmann::json       document;
        std::vector<uint8_t> binary;
        ModelMetadata        metadata;
    };

    class GltfExporter
    {
    public:
        /**
         * @brief Packs positions, normals, colors and indices into one buffer and
         * describes it as a single-mesh glTF 2.0 scene.
         * @param mesh Finished mesh; read only.
         * @param metadata Copied into the asset. Vertex and face counts are taken from the mesh.
         * @return SERIALIZATION_ERROR for an empty or inconsistent mesh, or when a size
         *         exceeds the 32-bit limits of the container. outAsset is untouched on failure.
         */
        static Result Export( const MeshBuffer& mesh, const ModelMetadata& metadata, GltfAsset& outAsset );

        /**
         * @brief Byte ranges of the four sections, in BufferSection order.
         * @param elementCounts Number of 3-component entries per section (vertices, normals,
         *        colors, faces).
         * @return SERIALIZATION_ERROR on arithmetic overflow; the outputs are untouched then.
         */
        static Result ComputeLayout( const SectionCounts& elementCounts, std::vector<BufferViewInfo>& outViews, uint64_t& outTotalLength );

        static SectionCounts CountSections( const MeshBuffer& mesh );

        /**
         * @brief Vertex indices must fit in uint32 and the buffer length in the 32-bit
         * byteLength of the container.
         */
        static Result CheckLimits( uint64_t vertexCount, uint64_t bufferLength );

        static const char* GENERATOR_NAME;
    };
} // namespace FloorPlan3D
