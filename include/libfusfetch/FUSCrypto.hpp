//
//  FUSCrypto.hpp
//  libfusfetch
//
//  Created by tihmstar on 03.06.25.
//

#ifndef FUSCrypto_hpp
#define FUSCrypto_hpp

#include <libfusfetch/SessionCrypto.hpp>

#ifndef LIBFUSFETCH_API
#   define LIBFUSFETCH_API
#endif

namespace tihmstar {
    namespace libfusfetch {
        class LIBFUSFETCH_API FUSCrypto : public SessionCrypto{
        public:
            std::string decodeNonce(const std::string &rawNonce) const override;
            std::string deriveSignature(const std::string &decodedNonce) const override;
            std::string logicCheck(const std::string &decodedNonce, const std::string &input) const override;
            std::vector<uint8_t> deriveFileKey(const KeyMaterial &material) const override;
        };

        LIBFUSFETCH_API std::string hexEncode(const std::vector<uint8_t> &data);
        LIBFUSFETCH_API std::vector<uint8_t> hexDecode(const std::string &hex);
    }
}

#endif /* FUSCrypto_hpp */
