#include <gtest/gtest.h>

#include <libfusfetch/StreamDecryptor.hpp>
#include <libfusfetch/FUSException.hpp>

#include <openssl/evp.h>

#include <algorithm>

using namespace tihmstar::libfusfetch;

static const std::vector<uint8_t> kKey = {
    0xae,0x15,0x66,0x4a,0x86,0x2c,0x20,0xe0,0x7e,0x7b,0x0a,0xb7,0x7d,0xe2,0xf1,0xdc
};

static std::vector<uint8_t> encrypt(const std::vector<uint8_t> &plain, bool pad){
    EVP_CIPHER_CTX *ctx = EVP_CIPHER_CTX_new();
    std::vector<uint8_t> ret(plain.size() + 32);
    int outl = 0;
    int finl = 0;
    EVP_EncryptInit_ex(ctx, EVP_aes_128_ecb(), NULL, kKey.data(), NULL);
    EVP_CIPHER_CTX_set_padding(ctx, pad ? 1 : 0);
    EVP_EncryptUpdate(ctx, ret.data(), &outl, plain.data(), (int)plain.size());
    EVP_EncryptFinal_ex(ctx, ret.data() + outl, &finl);
    EVP_CIPHER_CTX_free(ctx);
    ret.resize(outl + finl);
    return ret;
}

static std::vector<uint8_t> pattern(size_t size){
    std::vector<uint8_t> ret(size);
    for (size_t i = 0; i < size; i++) ret[i] = (uint8_t)(i * 31 + 7);
    return ret;
}

static std::vector<uint8_t> decryptChunked(const std::vector<uint8_t> &cipher, size_t chunk){
    std::vector<uint8_t> out;
    StreamDecryptor::Emit emit = [&](const uint8_t *buf, size_t size){
        out.insert(out.end(), buf, buf + size);
        return true;
    };
    StreamDecryptor d(kKey);
    for (size_t off = 0; off < cipher.size(); off += chunk) {
        EXPECT_TRUE(d.update(cipher.data() + off, std::min(chunk, cipher.size() - off), emit));
    }
    EXPECT_TRUE(d.finalize(emit));
    return out;
}

TEST(StreamDecryptor, StripsPadding) {
    std::vector<uint8_t> plain = pattern(1000);
    EXPECT_EQ(decryptChunked(encrypt(plain, true), 1 << 16), plain);
}

TEST(StreamDecryptor, FullPaddingBlock) {
    std::vector<uint8_t> plain = pattern(64);
    std::vector<uint8_t> cipher = encrypt(plain, true);
    ASSERT_EQ(cipher.size(), 80u);
    EXPECT_EQ(decryptChunked(cipher, 16), plain);
}

TEST(StreamDecryptor, ChunkBoundariesDoNotMatter) {
    std::vector<uint8_t> plain = pattern(4099);
    std::vector<uint8_t> cipher = encrypt(plain, true);
    std::vector<uint8_t> whole = decryptChunked(cipher, cipher.size());
    EXPECT_EQ(whole, plain);
    for (size_t chunk : {1, 7, 15, 16, 17, 31, 32, 1000, 4096}) {
        EXPECT_EQ(decryptChunked(cipher, chunk), whole) << "chunk size " << chunk;
    }
}

TEST(StreamDecryptor, UnpaddedFinalBlockKept) {
    std::vector<uint8_t> plain = pattern(48);
    plain.back() = 0x42;
    EXPECT_EQ(decryptChunked(encrypt(plain, false), 5), plain);
}

TEST(StreamDecryptor, EmptyStream) {
    EXPECT_TRUE(decryptChunked({}, 16).empty());
}

TEST(StreamDecryptor, TruncatedStreamFails) {
    std::vector<uint8_t> cipher = encrypt(pattern(100), true);
    cipher.resize(cipher.size() - 3);
    StreamDecryptor d(kKey);
    StreamDecryptor::Emit emit = [](const uint8_t *, size_t){
        return true;
    };
    EXPECT_TRUE(d.update(cipher.data(), cipher.size(), emit));
    EXPECT_THROW(d.finalize(emit), TransportError);
}

TEST(StreamDecryptor, EmitCanStop) {
    std::vector<uint8_t> cipher = encrypt(pattern(256), true);
    StreamDecryptor d(kKey);
    size_t calls = 0;
    StreamDecryptor::Emit emit = [&](const uint8_t *, size_t){
        calls++;
        return false;
    };
    //the first block is held back, nothing to emit yet
    EXPECT_TRUE(d.update(cipher.data(), 16, emit));
    EXPECT_FALSE(d.update(cipher.data() + 16, 32, emit));
    EXPECT_EQ(calls, 1u);
}

TEST(StreamDecryptor, RejectsBadKey) {
    EXPECT_THROW(StreamDecryptor{std::vector<uint8_t>(8)}, tihmstar::exception);
}
