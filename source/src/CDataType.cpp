#include <sys/stat.h>

#include <lap/core/CFile.hpp>

#include "CDataType.hpp"

namespace lap
{
namespace rds
{
    FileFingerprint fingerprintOf( core::StringView strPath ) noexcept
    {
        FileFingerprint fp;
        struct ::stat st;

        core::String path( strPath.data(), strPath.size() );
        if ( ::stat( path.c_str(), &st ) != 0 ) {
            return fp;
        }

        fp.exists   = true;
        fp.inode    = static_cast< core::UInt64 >( st.st_ino );
        fp.size     = static_cast< core::UInt64 >( st.st_size );
        fp.mtimeNs  = static_cast< core::Int64 >( st.st_mtim.tv_sec ) * 1000000000LL + st.st_mtim.tv_nsec;

        return fp;
    }

    core::String normalizePath( core::StringView strPath ) noexcept
    {
        core::String input( strPath.data(), strPath.size() );
        if ( input.empty() ) return input;

        core::Bool bAbsolute = ( input[0] == '/' );
        core::Vector< core::String > parts;

        core::Size start = 0;
        while ( start <= input.size() ) {
            core::Size pos = input.find( '/', start );
            if ( pos == core::String::npos ) pos = input.size();

            core::String part = input.substr( start, pos - start );
            if ( part.empty() || part == "." ) {
                // skip
            } else if ( part == ".." ) {
                if ( !parts.empty() && parts.back() != ".." ) {
                    parts.pop_back();
                } else if ( !bAbsolute ) {
                    parts.push_back( part );
                }
            } else {
                parts.push_back( part );
            }

            start = pos + 1;
        }

        core::String result = bAbsolute ? "/" : "";
        for ( core::Size i = 0; i < parts.size(); ++i ) {
            if ( i > 0 ) result += "/";
            result += parts[i];
        }

        if ( result.empty() ) result = ".";
        return result;
    }

    core::String parentDirectory( core::StringView strPath ) noexcept
    {
        core::String path( strPath.data(), strPath.size() );
        auto lastSlashPos = path.rfind( '/' );

        if ( lastSlashPos == core::String::npos ) return ".";
        if ( lastSlashPos == 0 ) return "/";

        return path.substr( 0, lastSlashPos );
    }

    core::Bool readFileText( core::StringView strPath, core::String& strContent ) noexcept
    {
        core::Vector< core::UInt8 > fileData;
        if ( !core::File::Util::ReadBinary( strPath.data(), fileData ) ) {
            return false;
        }

        strContent.assign( fileData.begin(), fileData.end() );
        return true;
    }
} // rds
} // lap
