//
//  FUSException.hpp
//  libfusfetch
//
//  Created by tihmstar on 02.06.25.
//

#ifndef FUSException_hpp
#define FUSException_hpp

#include <libgeneral/exception.hpp>

namespace tihmstar {
    namespace libfusfetch {
        /*
            All exceptions take tihmstar::exception's leading arguments:
            (commit_count, commit_sha, line, filename, fmt, args...)
            Throw them through libgeneral's retcustomerror/retcustomassure.
            Format arguments are forwarded explicitly, an inherited C-variadic
            constructor can not be called with arguments.
         */
        class FUSError : public tihmstar::exception{
        public:
            template<typename ... Args>
            FUSError(const char *commit_count_str, const char *commit_sha_str, int line, const char *filename, const char *err, Args ... args)
            : tihmstar::exception(commit_count_str, commit_sha_str, line, filename, err, args...) {}
        };

#pragma mark catalog
        class CatalogError : public FUSError{
        public:
            using FUSError::FUSError;
        };
        class CatalogEmptyError : public CatalogError{
        public:
            using CatalogError::CatalogError;
        };
        class CatalogUnparseableError : public CatalogError{
        public:
            using CatalogError::CatalogError;
        };
        class InvalidFirmwareError : public CatalogError{
        public:
            using CatalogError::CatalogError;
        };

#pragma mark auth
        class AuthError : public FUSError{
        public:
            using FUSError::FUSError;
        };
        class UnauthorizedError : public AuthError{
        public:
            using AuthError::AuthError;
        };

#pragma mark protocol
        class ProtocolError : public FUSError{
        public:
            using FUSError::FUSError;
        };
        class UnreachableError : public ProtocolError{
        public:
            using ProtocolError::ProtocolError;
        };

        //carries the HTTP or FUS status code that caused the failure
        class StatusError : public ProtocolError{
            int _status;
        public:
            StatusError(const char *commit_count_str, const char *commit_sha_str, int line, const char *filename, int status, const char *what)
            : ProtocolError(commit_count_str, commit_sha_str, line, filename, "%s (status=%d)", what, status), _status(status) {}
            int status() const noexcept {return _status;}
        };
        class ServerRejectedError : public StatusError{
        public:
            using StatusError::StatusError;
        };
        class UnknownStatusError : public StatusError{
        public:
            using StatusError::StatusError;
        };

#pragma mark retry
        class RetryError : public FUSError{
        public:
            using FUSError::FUSError;
        };
        class MaxAttemptsExceededError : public RetryError{
            int _attempts;
        public:
            MaxAttemptsExceededError(const char *commit_count_str, const char *commit_sha_str, int line, const char *filename, int attempts, const char *what)
            : RetryError(commit_count_str, commit_sha_str, line, filename, "%s (attempts=%d)", what, attempts), _attempts(attempts) {}
            int attempts() const noexcept {return _attempts;}
        };

#pragma mark range
        class RangeError : public FUSError{
        public:
            using FUSError::FUSError;
        };
        class InvalidRangeError : public RangeError{
        public:
            using RangeError::RangeError;
        };

#pragma mark transport
        class TransportError : public FUSError{
        public:
            using FUSError::FUSError;
        };
        class UpstreamRejectedError : public TransportError{
            int _status;
        public:
            UpstreamRejectedError(const char *commit_count_str, const char *commit_sha_str, int line, const char *filename, int status, const char *what)
            : TransportError(commit_count_str, commit_sha_str, line, filename, "%s (status=%d)", what, status), _status(status) {}
            int status() const noexcept {return _status;}
        };
        class TimeoutError : public TransportError{
        public:
            using TransportError::TransportError;
        };
    }
}

#endif /* FUSException_hpp */
