#ifndef AES_CORE_HPP
#define AES_CORE_HPP
#include <cstdint>

typedef struct evp_cipher_ctx_st EVP_CIPHER_CTX;

//Raw AES block cipher. Chaining is done by the engine model around it.
class AES_Core
{
    private:
        EVP_CIPHER_CTX* enc_ctx;
        EVP_CIPHER_CTX* dec_ctx;
        int key_len;
    public:
        AES_Core();
        ~AES_Core();
        AES_Core(const AES_Core&) = delete;
        AES_Core& operator=(const AES_Core&) = delete;

        //key_len is 16, 24 or 32 bytes
        void set_key(const uint8_t* key, int key_len);

        void encrypt_block(const uint8_t* in, uint8_t* out);
        void decrypt_block(const uint8_t* in, uint8_t* out);
};

#endif // AES_CORE_HPP
