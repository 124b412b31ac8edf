#pragma once
#include "FloorPlan3DTypes.h"

#include "core/Core.h"
#include "core/FileSystem.h"
#include <memory>
#include <string>

namespace FloorPlan3D
{

    /**
     * @brief Detection result to glTF 2.0 converter.
     *
     * Initialize() once, then Convert() any number of times. Each call is
     * independent; the converter keeps no state between calls besides its config.
     */
    class FP_API FloorPlan3D
    {
    public:
        FloorPlan3D();
        ~FloorPlan3D();

        Result Initialize( const FloorPlan3DConfig& config );
        void   Shutdown();

        /**
         * @brief Converts detector JSON text into the glTF document, the binary buffer and metadata.
         * The returned document carries no buffer URI.
         */
        Result Convert( const std::string& detectionJson, ConversionOutput& output );

        /**
         * @brief Reads detector JSON from inputPath and writes the model to outputPath using
         * the configured OutputFormat. Relative paths resolve against the root directory.
         */
        Result ConvertFile( const std::string& inputPath, const std::string& outputPath, ConversionOutput& output );

        Result WriteMetadata( const std::string& path, const ConversionOutput& output );

    public:
        FileSystem*              GetFileSystem() const;
        const FloorPlan3DConfig& GetConfig() const;

    private:
        struct Impl;
        std::unique_ptr<Impl> m_impl;
    };

} // namespace FloorPlan3D
