//
//  StreamDecryptor.hpp
//  libfusfetch
//
//  Created by tihmstar on 07.06.25.
//

#ifndef StreamDecryptor_hpp
#define StreamDecryptor_hpp

#include <openssl/evp.h>

#include <functional>
#include <stdint.h>
#include <vector>

#ifndef LIBFUSFETCH_API
#   define LIBFUSFETCH_API
#endif

namespace tihmstar {
    namespace libfusfetch {
        /*
            Incremental AES-128-ECB decryption of a FUS binary.
            Input may be split at arbitrary offsets. The last decrypted block is held back
            until finalize() so its padding can be stripped, so at most one partial input block
            and one decrypted block are buffered between calls.
         */
        class LIBFUSFETCH_API StreamDecryptor{
        public:
            static constexpr size_t kBlockSize = 16;
            //return false to stop
            using Emit = std::function<bool(const uint8_t *buf, size_t size)>;
        private:
            EVP_CIPHER_CTX *_ctx;
            std::vector<uint8_t> _out;
            uint8_t _held[kBlockSize];
            bool _hasHeld;
            uint64_t _consumed;
        public:
            StreamDecryptor(const std::vector<uint8_t> &key);
            StreamDecryptor(const StreamDecryptor &) = delete;
            StreamDecryptor &operator=(const StreamDecryptor &) = delete;
            ~StreamDecryptor();

            bool update(const uint8_t *buf, size_t size, const Emit &emit);
            bool finalize(const Emit &emit);
        };
    }
}

#endif /* StreamDecryptor_hpp */
