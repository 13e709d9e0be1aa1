//
//  FUSCrypto.cpp
//  libfusfetch
//
//  Created by tihmstar on 03.06.25.
//

#include "../include/libfusfetch/FUSCrypto.hpp"

#include <openssl/evp.h>

#include <libgeneral/macros.h>
#include "FUSMacros.hpp"

#include <ctype.h>
#include <stdio.h>
#include <string.h>

using namespace tihmstar;
using namespace tihmstar::libfusfetch;

#define FUS_NONCE_KEY   "vicopx7dqu06emacgpnpy8j8zwhduwlh"
#define FUS_AUTH_SUFFIX "9u7qab84rpc16gvk"

#pragma mark private
static std::vector<uint8_t> base64Decode(const std::string &in){
    std::vector<uint8_t> ret;
    size_t padding = 0;
    int len = 0;
    retcustomassure(libfusfetch::ProtocolError, in.size() && (in.size() % 4) == 0, "Invalid base64 length %zu",in.size());
    ret.resize(in.size()/4*3);
    retcustomassure(libfusfetch::ProtocolError, (len = EVP_DecodeBlock(ret.data(), (const unsigned char*)in.data(), (int)in.size())) >= 0, "Failed to decode base64 '%s'",in.c_str());
    for (size_t i = in.size(); i>0 && in[i-1] == '='; i--) padding++;
    retcustomassure(libfusfetch::ProtocolError, padding <= 2 && padding <= (size_t)len, "Invalid base64 padding in '%s'",in.c_str());
    ret.resize(len - padding);
    return ret;
}

static std::string base64Encode(const std::vector<uint8_t> &in){
    std::string ret;
    ret.resize((in.size()+2)/3*4 + 1);
    int len = EVP_EncodeBlock((unsigned char*)&ret[0], in.data(), (int)in.size());
    ret.resize(len);
    return ret;
}

static std::vector<uint8_t> aes256cbc(bool encrypt, const std::string &key, const uint8_t *buf, size_t bufSize){
    EVP_CIPHER_CTX *ctx = NULL;
    cleanup([&]{
        safeFreeCustom(ctx, EVP_CIPHER_CTX_free);
    });
    std::vector<uint8_t> ret;
    int outl = 0;
    int finl = 0;
    assure(key.size() == 32);

    assure(ctx = EVP_CIPHER_CTX_new());
    assure(EVP_CipherInit_ex(ctx, EVP_aes_256_cbc(), NULL, (const unsigned char*)key.data(), (const unsigned char*)key.data(), encrypt ? 1 : 0) == 1);

    ret.resize(bufSize + EVP_MAX_BLOCK_LENGTH);
    assure(EVP_CipherUpdate(ctx, ret.data(), &outl, buf, (int)bufSize) == 1);
    retassure(EVP_CipherFinal_ex(ctx, ret.data() + outl, &finl) == 1, "AES-256-CBC %s failed",encrypt ? "encryption" : "decryption");
    ret.resize(outl + finl);
    return ret;
}

static std::vector<uint8_t> md5(const std::string &in){
    std::vector<uint8_t> ret(EVP_MAX_MD_SIZE);
    unsigned int len = 0;
    assure(EVP_Digest(in.data(), in.size(), ret.data(), &len, EVP_md5(), NULL) == 1);
    ret.resize(len);
    return ret;
}

static std::string logicCheckWithKey(const std::string &key, const std::string &input){
    std::string ret;
    retassure(input.size() >= 16, "Logic check input '%s' too short",input.c_str());
    for (char c : key) {
        ret += input[c & 0xf];
    }
    return ret;
}

#pragma mark FUSCrypto
std::string FUSCrypto::decodeNonce(const std::string &rawNonce) const{
    std::vector<uint8_t> enc = base64Decode(rawNonce);
    std::vector<uint8_t> dec;
    try {
        dec = aes256cbc(false, FUS_NONCE_KEY, enc.data(), enc.size());
    } catch (tihmstar::exception &e) {
        retcustomerror(libfusfetch::ProtocolError, "Failed to decrypt nonce '%s': %s",rawNonce.c_str(),e.what());
    }
    return {dec.begin(), dec.end()};
}

std::string FUSCrypto::deriveSignature(const std::string &decodedNonce) const{
    const char *nonceKey = FUS_NONCE_KEY;
    std::string key;
    retassure(decodedNonce.size() >= 16, "Decoded nonce too short");
    for (int i=0; i<16; i++) {
        key += nonceKey[(uint8_t)decodedNonce[i] % 16];
    }
    key += FUS_AUTH_SUFFIX;
    return base64Encode(aes256cbc(true, key, (const uint8_t*)decodedNonce.data(), decodedNonce.size()));
}

std::string FUSCrypto::logicCheck(const std::string &decodedNonce, const std::string &input) const{
    return logicCheckWithKey(decodedNonce, input);
}

std::vector<uint8_t> FUSCrypto::deriveFileKey(const KeyMaterial &material) const{
    if (material.encryptionVersion == 2) {
        return md5(material.region + ":" + material.model + ":" + material.firmware);
    } else if (material.encryptionVersion == 4) {
        retassure(material.latestFirmwareVersion.size() && material.logicValueFactory.size(), "Missing key material for encryption version 4");
        return md5(logicCheckWithKey(material.logicValueFactory, material.latestFirmwareVersion));
    }
    reterror("Unsupported encryption version %d",material.encryptionVersion);
}

#pragma mark public
LIBFUSFETCH_API std::string libfusfetch::hexEncode(const std::vector<uint8_t> &data){
    static const char digits[] = "0123456789abcdef";
    std::string ret;
    for (uint8_t c : data) {
        ret += digits[c >> 4];
        ret += digits[c & 0xf];
    }
    return ret;
}

LIBFUSFETCH_API std::vector<uint8_t> libfusfetch::hexDecode(const std::string &hex){
    std::vector<uint8_t> ret;
    retassure((hex.size() & 1) == 0, "Hex string '%s' has odd length",hex.c_str());
    for (size_t i=0; i<hex.size(); i+=2) {
        unsigned int v = 0;
        retassure(isxdigit((unsigned char)hex[i]) && isxdigit((unsigned char)hex[i+1]), "Invalid hex string '%s'",hex.c_str());
        sscanf(&hex[i], "%2x", &v);
        ret.push_back((uint8_t)v);
    }
    return ret;
}
