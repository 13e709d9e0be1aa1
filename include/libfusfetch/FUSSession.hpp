//
//  FUSSession.hpp
//  libfusfetch
//
//  Created by tihmstar on 04.06.25.
//

#ifndef FUSSession_hpp
#define FUSSession_hpp

#include <libfusfetch/FUSConfig.hpp>
#include <libfusfetch/FUSMessage.hpp>
#include <libfusfetch/HTTPTransport.hpp>
#include <libfusfetch/SessionCrypto.hpp>

#ifndef LIBFUSFETCH_API
#   define LIBFUSFETCH_API
#endif

namespace tihmstar {
    namespace libfusfetch {
        struct Session{
            std::string rawNonce;
            std::string decodedNonce;
            std::string signature;
            std::string sessionIdentifier;
        };

        /*
            One authenticated FUS session. Not copyable, every top-level operation acquires its own.
            transport, crypto and config must outlive the session.
         */
        class LIBFUSFETCH_API FUSSession{
            HTTPTransport &_transport;
            const SessionCrypto &_crypto;
            const FUSConfig &_config;
            Session _session;

            FUSSession(HTTPTransport &transport, const SessionCrypto &crypto, const FUSConfig &config);
            void applyNonce(const std::string &rawNonce);
        public:
            FUSSession(const FUSSession &) = delete;
            FUSSession &operator=(const FUSSession &) = delete;
            FUSSession(FUSSession &&) = default;

            static FUSSession acquire(HTTPTransport &transport, const SessionCrypto &crypto, const FUSConfig &config);

            const Session &session() const {return _session;}
            HTTPTransport &transport() const {return _transport;}
            const FUSConfig &config() const {return _config;}

            std::string logicCheck(const std::string &input) const;
            std::vector<uint8_t> deriveFileKey(const KeyMaterial &material) const;

            //picks up a new NONCE header or JSESSIONID cookie
            void refresh(const HTTPResponse &response);

            HTTPRequest authorize(HTTPRequest request) const;
            HTTPResponse post(const std::string &url, const FUSFields &put);
        };

        LIBFUSFETCH_API std::string authorizationHeader(const std::string &rawNonce, const std::string &signature);
    }
}

#endif /* FUSSession_hpp */
