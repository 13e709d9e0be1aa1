//
//  SessionCrypto.hpp
//  libfusfetch
//
//  Created by tihmstar on 03.06.25.
//

#ifndef SessionCrypto_hpp
#define SessionCrypto_hpp

#include <stdint.h>
#include <string>
#include <vector>

namespace tihmstar {
    namespace libfusfetch {
        struct KeyMaterial{
            int encryptionVersion; //2 or 4
            //version 2
            std::string firmware;
            std::string model;
            std::string region;
            //version 4
            std::string latestFirmwareVersion;
            std::string logicValueFactory;
        };

        /*
            Vendor specific byte transforms used by the session protocol.
            Implementations must be stateless, one instance may serve any number of sessions.
         */
        class SessionCrypto{
        public:
            virtual ~SessionCrypto() = default;

            virtual std::string decodeNonce(const std::string &rawNonce) const = 0;
            virtual std::string deriveSignature(const std::string &decodedNonce) const = 0;
            virtual std::string logicCheck(const std::string &decodedNonce, const std::string &input) const = 0;
            virtual std::vector<uint8_t> deriveFileKey(const KeyMaterial &material) const = 0;
        };
    }
}

#endif /* SessionCrypto_hpp */
