//
//  StreamDecryptor.cpp
//  libfusfetch
//
//  Created by tihmstar on 07.06.25.
//

#include "../include/libfusfetch/StreamDecryptor.hpp"

#include <libgeneral/macros.h>
#include "FUSMacros.hpp"

#include <string.h>

using namespace tihmstar;
using namespace tihmstar::libfusfetch;

StreamDecryptor::StreamDecryptor(const std::vector<uint8_t> &key)
: _ctx(NULL), _held{}, _hasHeld(false), _consumed(0)
{
    retassure(key.size() == kBlockSize, "Decryption key must be %zu bytes, got %zu",kBlockSize,key.size());
    assure(_ctx = EVP_CIPHER_CTX_new());
    if (EVP_DecryptInit_ex(_ctx, EVP_aes_128_ecb(), NULL, key.data(), NULL) != 1
        || EVP_CIPHER_CTX_set_padding(_ctx, 0) != 1) {
        safeFreeCustom(_ctx, EVP_CIPHER_CTX_free);
        reterror("Failed to init AES-128-ECB");
    }
}

StreamDecryptor::~StreamDecryptor(){
    safeFreeCustom(_ctx, EVP_CIPHER_CTX_free);
}

bool StreamDecryptor::update(const uint8_t *buf, size_t size, const Emit &emit){
    int outl = 0;
    if (!size) return true;
    _out.resize(size + kBlockSize);
    assure(EVP_DecryptUpdate(_ctx, _out.data(), &outl, buf, (int)size) == 1);
    _consumed += size;
    if (!outl) return true;

    if (_hasHeld && !emit(_held, kBlockSize)) return false;
    if (outl > (int)kBlockSize && !emit(_out.data(), outl - kBlockSize)) return false;
    memcpy(_held, _out.data() + outl - kBlockSize, kBlockSize);
    _hasHeld = true;
    return true;
}

bool StreamDecryptor::finalize(const Emit &emit){
    uint8_t tail[kBlockSize*2] = {};
    int outl = 0;
    retcustomassure(libfusfetch::TransportError, (_consumed % kBlockSize) == 0, "Encrypted stream truncated after %llu bytes",(unsigned long long)_consumed);
    assure(EVP_DecryptFinal_ex(_ctx, tail, &outl) == 1);
    if (!_hasHeld) return true;
    _hasHeld = false;

    //a final byte outside 1..16 means the stream carried no padding
    uint8_t pad = _held[kBlockSize-1];
    size_t keep = (pad >= 1 && pad <= kBlockSize) ? kBlockSize - pad : kBlockSize;
    if (!keep) return true;
    return emit(_held, keep);
}
