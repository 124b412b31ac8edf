#pragma once
#include "core/FileSystem.h"
#include "export/GltfExporter.hpp"
#include <string>

namespace tinygltf
{
    class Model;
}

namespace FloorPlan3D
{
    namespace GlbConstants
    {
        constexpr uint32_t MAGIC             = 0x46546C67; // "glTF"
        constexpr uint32_t VERSION           = 2;
        constexpr uint32_t CHUNK_JSON        = 0x4E4F534A;
        constexpr uint32_t CHUNK_BIN         = 0x004E4942;
        constexpr uint32_t HEADER_SIZE       = 12;
        constexpr uint32_t CHUNK_HEADER_SIZE = 8;
    } // namespace GlbConstants

    /**
     * @brief Decides where the binary buffer of an exported asset lives and writes it out.
     * Serialization goes through tinygltf; the asset is first loaded into a tinygltf::Model.
     */
    class AssetWriter
    {
    public:
        explicit AssetWriter( FileSystem& fileSystem );

        /**
         * @brief Loads the exported document and its single buffer into a tinygltf model.
         * @return SERIALIZATION_ERROR if the document is malformed or its buffer length does
         *         not match the bytes. outModel is untouched on failure.
         */
        static Result BuildModel( const GltfAsset& asset, tinygltf::Model& outModel );

        // .gltf text with buffers[0].uri set to a base64 data URI.
        static Result SerializeEmbedded( const GltfAsset& asset, std::string& outText );

        /**
         * @brief Serializes the asset as a GLB container (header, JSON chunk, BIN chunk).
         * @return SERIALIZATION_ERROR if the container length does not fit in 32 bits.
         */
        static Result SerializeGlb( const GltfAsset& asset, std::vector<uint8_t>& outBytes );

        /**
         * @brief Container length for the given chunk payloads, each padded to 4 bytes.
         * @return SERIALIZATION_ERROR past the 32-bit length field.
         */
        static Result ComputeGlbLength( uint64_t jsonBytes, uint64_t binaryBytes, uint64_t& outLength );

        // Single .gltf with the buffer embedded as a data URI.
        Result WriteEmbedded( const std::string& path, const GltfAsset& asset );

        // .gltf plus <stem>.bin next to it; the buffer URI names the .bin file.
        Result WriteGltf( const std::string& path, const GltfAsset& asset );

        Result WriteGlb( const std::string& path, const GltfAsset& asset );

        /**
         * @brief Writes the model summary (metadata and generation counters) as JSON.
         */
        Result WriteMetadata( const std::string& path, const ModelMetadata& metadata, const GenerationStats& stats );

        static nlohmann::json MetadataToJson( const ModelMetadata& metadata );

    private:
        FileSystem& m_fileSystem;
    };
} // namespace FloorPlan3D
