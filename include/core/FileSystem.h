#pragma once
#include "Core.h"
#include <filesystem>
#include <string>

namespace FloorPlan3D
{

    /**
     * @brief Small file access layer used by the writers and the command line tool.
     * Relative paths are resolved against the root directory; absolute paths are used as-is.
     */
    class FP_API FileSystem
    {
    public:
        FileSystem() = default;
        ~FileSystem();

        /**
         * @brief Sets the root directory. It is created when missing.
         * @param rootDirectory Base directory for relative paths (read/write).
         */
        Result Initialize( const std::filesystem::path& rootDirectory );
        void   Shutdown();

        // --- PUBLIC API ---

        Result ReadFile( const std::string& path, std::string& outData ) const;
        Result WriteFile( const std::string& path, const void* pData, size_t size );
        Result WriteFile( const std::string& path, const std::string& text );

        bool FileExists( const std::string& path ) const;

        /**
         * @brief Creates the directories leading to a file path, for writers that open the file themselves.
         */
        Result CreateParentDirectories( const std::string& path );

        // Deletes a single file. A missing file is not an error.
        Result RemoveFile( const std::string& path );

        /**
         * @brief Resolves a path against the root directory.
         */
        std::filesystem::path ResolvePath( const std::string& path ) const;

        const std::filesystem::path& GetRoot() const { return m_rootDirectory; }
        bool                         IsInitialized() const { return m_initialized; }

    private:
        std::filesystem::path m_rootDirectory;
        bool                  m_initialized = false;
    };

} // namespace FloorPlan3D
