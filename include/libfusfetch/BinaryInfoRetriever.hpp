//
//  BinaryInfoRetriever.hpp
//  libfusfetch
//
//  Created by tihmstar on 06.06.25.
//

#ifndef BinaryInfoRetriever_hpp
#define BinaryInfoRetriever_hpp

#include <libfusfetch/DeviceIdentity.hpp>
#include <libfusfetch/FUSSession.hpp>
#include <libfusfetch/FirmwareVersion.hpp>

#include <stdint.h>

#ifndef LIBFUSFETCH_API
#   define LIBFUSFETCH_API
#endif

namespace tihmstar {
    namespace libfusfetch {
        struct BinaryMetadata{
            std::string filename;
            std::string path;
            uint64_t size;
            std::string crc;
            int encryptionVersion;
            uint64_t lastModified;
            std::string displayName;
            std::string osVersion;
            std::string changelogURL;
            std::string platform;
            //version 4 key inputs
            std::string latestFirmwareVersion;
            std::string logicValueFactory;

            std::string sizeReadable() const;
        };

        /*
            Where the IMEI for each attempt comes from.
            A fixed imei is sent verbatim on every attempt, otherwise a fresh one is generated from tac.
         */
        struct IdentitySource{
            std::string imei;
            std::string tac;
            DigitSource rng;
        };

        struct BinaryInfoResult{
            BinaryMetadata metadata;
            std::vector<uint8_t> decryptionKey;
            std::string imei;
            std::string firmware;
            int attempts;
            FUSSession session;
        };

        class LIBFUSFETCH_API BinaryInfoRetriever{
            HTTPTransport &_transport;
            const SessionCrypto &_crypto;
            const FUSConfig &_config;
        public:
            BinaryInfoRetriever(HTTPTransport &transport, const SessionCrypto &crypto, const FUSConfig &config);

            BinaryInfoResult retrieve(const std::string &region, const std::string &model, const FirmwareVersion &firmware, const IdentitySource &identity);
        };

        LIBFUSFETCH_API FUSFields binaryInformFields(const std::string &firmware, const std::string &region, const std::string &model, const std::string &imei, const std::string &logicCheck, const std::string &clientVersion);
        LIBFUSFETCH_API BinaryMetadata parseBinaryMetadata(const FUSMessage &msg);
        LIBFUSFETCH_API int encryptionVersionForFilename(const std::string &filename);
    }
}

#endif /* BinaryInfoRetriever_hpp */
