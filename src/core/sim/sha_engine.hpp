#ifndef SHA_ENGINE_HPP
#define SHA_ENGINE_HPP
#include <cstddef>
#include <cstdint>

//Software model of the engine's hash unit. mode takes the SE_CONFIG.ENC_MODE encodings.
struct SHA_Engine
{
    uint8_t mode;

    uint32_t hash[8];
    uint64_t hash64[8];

    uint32_t messages[80];
    uint64_t messages64[80];

    uint8_t block[128];
    int block_len;
    uint64_t message_len;

    void reset_hash();
    bool valid_mode();
    int block_size();
    int digest_words();

    void update(const uint8_t* data, size_t len);
    void finish();

    //Word i of the digest in big-endian order
    uint32_t result_word(int index);

    void do_block();
    void _sha256();
    void _sha1();
    void _sha512();
};

#endif // SHA_ENGINE_HPP
