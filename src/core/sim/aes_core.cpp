#include <openssl/evp.h>
#include "../common/common.hpp"
#include "aes_core.hpp"

static const EVP_CIPHER* cipher_for(int key_len)
{
    switch (key_len)
    {
        case 16:
            return EVP_aes_128_ecb();
        case 24:
            return EVP_aes_192_ecb();
        case 32:
            return EVP_aes_256_ecb();
        default:
            SEException::die("[AES] Invalid key length %d\n", key_len);
    }
    return nullptr;
}

AES_Core::AES_Core() : key_len(0)
{
    enc_ctx = EVP_CIPHER_CTX_new();
    dec_ctx = EVP_CIPHER_CTX_new();
    if (!enc_ctx || !dec_ctx)
    {
        EVP_CIPHER_CTX_free(enc_ctx);
        EVP_CIPHER_CTX_free(dec_ctx);
        SEException::die("[AES] Failed to allocate cipher contexts\n");
    }
}

AES_Core::~AES_Core()
{
    EVP_CIPHER_CTX_free(enc_ctx);
    EVP_CIPHER_CTX_free(dec_ctx);
}

void AES_Core::set_key(const uint8_t* key, int key_len)
{
    const EVP_CIPHER* cipher = cipher_for(key_len);
    if (EVP_EncryptInit_ex(enc_ctx, cipher, nullptr, key, nullptr) != 1 ||
        EVP_DecryptInit_ex(dec_ctx, cipher, nullptr, key, nullptr) != 1)
        SEException::die("[AES] Key schedule failed\n");

    EVP_CIPHER_CTX_set_padding(enc_ctx, 0);
    EVP_CIPHER_CTX_set_padding(dec_ctx, 0);
    this->key_len = key_len;
}

void AES_Core::encrypt_block(const uint8_t* in, uint8_t* out)
{
    int out_len = 0;
    if (!key_len || EVP_EncryptUpdate(enc_ctx, out, &out_len, in, 16) != 1 || out_len != 16)
        SEException::die("[AES] Block encryption failed\n");
}

void AES_Core::decrypt_block(const uint8_t* in, uint8_t* out)
{
    int out_len = 0;
    if (!key_len || EVP_DecryptUpdate(dec_ctx, out, &out_len, in, 16) != 1 || out_len != 16)
        SEException::die("[AES] Block decryption failed\n");
}
