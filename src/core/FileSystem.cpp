#include "core/FileSystem.h"

#include "core/Log.h"
#include <fstream>
#include <sstream>
#include <system_error>

namespace FloorPlan3D
{

    FileSystem::~FileSystem()
    {
        Shutdown();
    }

    Result FileSystem::Initialize( const std::filesystem::path& rootDirectory )
    {
        std::error_code ec;
        std::filesystem::path root = rootDirectory.empty() ? std::filesystem::current_path( ec ) : rootDirectory;
        if( ec )
        {
            FP_CORE_ERROR( "FileSystem: Cannot query working directory: {}", ec.message() );
            return Result::IO_ERROR;
        }

        if( !std::filesystem::exists( root, ec ) )
        {
            std::filesystem::create_directories( root, ec );
            if( ec )
            {
                FP_CORE_ERROR( "FileSystem: Cannot create root '{}': {}", root.string(), ec.message() );
                return Result::IO_ERROR;
            }
        }
        else if( !std::filesystem::is_directory( root, ec ) )
        {
            FP_CORE_ERROR( "FileSystem: Root '{}' is not a directory", root.string() );
            return Result::INVALID_ARGS;
        }

        m_rootDirectory = std::filesystem::absolute( root, ec );
        if( ec )
            m_rootDirectory = root;

        m_initialized = true;
        FP_CORE_TRACE( "FileSystem: Root '{}'", m_rootDirectory.string() );
        return Result::SUCCESS;
    }

    void FileSystem::Shutdown()
    {
        m_rootDirectory.clear();
        m_initialized = false;
    }

    std::filesystem::path FileSystem::ResolvePath( const std::string& path ) const
    {
        std::filesystem::path p( path );
        if( p.is_absolute() || m_rootDirectory.empty() )
            return p;

        // Operator / in std::filesystem automatically handles separator slashes
        return m_rootDirectory / p;
    }

    bool FileSystem::FileExists( const std::string& path ) const
    {
        std::error_code ec;
        return std::filesystem::is_regular_file( ResolvePath( path ), ec );
    }

    Result FileSystem::CreateParentDirectories( const std::string& path )
    {
        std::filesystem::path fullPath = ResolvePath( path );
        if( !fullPath.has_parent_path() )
            return Result::SUCCESS;

        std::error_code ec;
        std::filesystem::create_directories( fullPath.parent_path(), ec );
        if( ec )
        {
            FP_CORE_ERROR( "FileSystem: Cannot create directory '{}': {}", fullPath.parent_path().string(), ec.message() );
            return Result::IO_ERROR;
        }
        return Result::SUCCESS;
    }

    Result FileSystem::RemoveFile( const std::string& path )
    {
        std::filesystem::path fullPath = ResolvePath( path );

        std::error_code ec;
        std::filesystem::remove( fullPath, ec );
        if( ec )
        {
            FP_CORE_ERROR( "FileSystem: Cannot remove '{}': {}", fullPath.string(), ec.message() );
            return Result::IO_ERROR;
        }
        return Result::SUCCESS;
    }

    Result FileSystem::ReadFile( const std::string& path, std::string& outData ) const
    {
        std::filesystem::path fullPath = ResolvePath( path );

        std::ifstream file( fullPath, std::ios::in | std::ios::binary );
        if( !file.is_open() )
        {
            FP_CORE_ERROR( "FileSystem: Failed to open '{}' for reading", fullPath.string() );
            return Result::IO_ERROR;
        }

        std::ostringstream contents;
        contents << file.rdbuf();
        if( file.bad() )
        {
            FP_CORE_ERROR( "FileSystem: Read error on '{}'", fullPath.string() );
            return Result::IO_ERROR;
        }

        outData = contents.str();
        return Result::SUCCESS;
    }

    Result FileSystem::WriteFile( const std::string& path, const void* pData, size_t size )
    {
        if( pData == nullptr && size > 0 )
            return Result::INVALID_ARGS;

        std::filesystem::path fullPath = ResolvePath( path );

        Result result = CreateParentDirectories( path );
        if( result != Result::SUCCESS )
            return result;

        std::ofstream file( fullPath, std::ios::out | std::ios::binary | std::ios::trunc );
        if( !file.is_open() )
        {
            FP_CORE_ERROR( "FileSystem: Failed to open '{}' for writing", fullPath.string() );
            return Result::IO_ERROR;
        }

        if( size > 0 )
            file.write( static_cast<const char*>( pData ), static_cast<std::streamsize>( size ) );

        file.flush();
        if( !file )
        {
            FP_CORE_ERROR( "FileSystem: Write error on '{}'", fullPath.string() );
            return Result::IO_ERROR;
        }

        FP_CORE_TRACE( "FileSystem: Wrote {} bytes to '{}'", size, fullPath.string() );
        return Result::SUCCESS;
    }

    Result FileSystem::WriteFile( const std::string& path, const std::string& text )
    {
        return WriteFile( path, text.data(), text.size() );
    }

} // namespace FloorPlan3D
