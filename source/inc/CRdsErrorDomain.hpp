/**
 * @file CRdsErrorDomain.hpp
 * @author ddkv587 (ddkv587@gmail.com)
 * @brief Error domain of the resilient data store
 * @version 0.1
 * @date 2025-12-01
 * 
 * 
 */
#ifndef LAP_RDS_RDSERRORDOMAIN_HPP
#define LAP_RDS_RDSERRORDOMAIN_HPP

#include <exception>
#include <lap/core/CErrorCode.hpp>
#include <lap/core/CException.hpp>
#include <lap/core/CMemory.hpp>
#include <lap/core/CTypedef.hpp>

namespace lap
{
namespace rds
{
    enum class RdsErrc : core::ErrorDomain::CodeType 
    {
        kPhysicalStorageFailure     = 1,
        kIntegrityCorrupted         = 2,
        kSerializationFailed        = 3,
        kRenameFailed               = 4,
        kInvalidArgument            = 5
    };

    inline constexpr const core::Char* RdsErrMessage( RdsErrc errCode )
    {
        switch ( errCode ) {
        case RdsErrc::kPhysicalStorageFailure:
            return "Access to the storage fails.";
        case RdsErrc::kIntegrityCorrupted:
            return "Stored data cannot be read because the structural integrity is corrupted.";
        case RdsErrc::kSerializationFailed:
            return "The value cannot be serialized in the requested format.";
        case RdsErrc::kRenameFailed:
            return "Replacing the target file with the temporary file failed.";
        case RdsErrc::kInvalidArgument:
            return "Invalid argument provided to the function.";
        default:
            return "Unknown error";
        }
    }

    class RdsException : public core::Exception
    {
    public:
        IMP_OPERATOR_NEW(RdsException)
        
        explicit RdsException ( core::ErrorCode errorCode ) noexcept
            : core::Exception( errorCode )
        {
            ;
        }

        ~RdsException() noexcept 
        {
            ;
        }

        const core::Char* what() const noexcept 
        {
            return RdsErrMessage( static_cast< RdsErrc > ( Error().Value() ) );
        }
    };

    class RdsErrorDomain final : public core::ErrorDomain
    {
    public:
        IMP_OPERATOR_NEW(RdsErrorDomain)
        
        using Errc          = RdsErrc;
        using Exception     = RdsException;

    public:
        const core::Char*                       Name () const noexcept override                                             { return "RdsErrorDomain"; }
        const core::Char*                       Message ( CodeType errorCode ) const noexcept override                      { return RdsErrMessage( static_cast< Errc >( errorCode ) ); }
        void                                    ThrowAsException ( const core::ErrorCode &errorCode ) const override        { throw RdsException( errorCode ); }

        constexpr RdsErrorDomain () noexcept
            : core::ErrorDomain( 0x8000000000000201 )
        {
            ;
        }
    };

    static constexpr RdsErrorDomain g_rdsErrorDomain;
    
    constexpr const core::ErrorDomain& GetRdsDomain () noexcept
    {
        return g_rdsErrorDomain;
    }

    constexpr core::ErrorCode MakeErrorCode ( RdsErrc code, core::ErrorDomain::SupportDataType data ) noexcept
    {
        return { static_cast< core::ErrorDomain::CodeType >( code ), GetRdsDomain(), data };
    }
} // rds
} // lap

#endif
