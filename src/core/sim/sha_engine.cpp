#include <cstring>
#include "../common/common.hpp"
#include "../se/registers.hpp"
#include "sha_engine.hpp"

const static uint32_t k_1[4] =
{
   0x5A827999, 0x6ED9EBA1, 0x8F1BBCDC, 0xCA62C1D6
};

const static uint32_t k_256[64] =
{
   0x428a2f98, 0x71374491, 0xb5c0fbcf, 0xe9b5dba5, 0x3956c25b, 0x59f111f1, 0x923f82a4, 0xab1c5ed5,
   0xd807aa98, 0x12835b01, 0x243185be, 0x550c7dc3, 0x72be5d74, 0x80deb1fe, 0x9bdc06a7, 0xc19bf174,
   0xe49b69c1, 0xefbe4786, 0x0fc19dc6, 0x240ca1cc, 0x2de92c6f, 0x4a7484aa, 0x5cb0a9dc, 0x76f988da,
   0x983e5152, 0xa831c66d, 0xb00327c8, 0xbf597fc7, 0xc6e00bf3, 0xd5a79147, 0x06ca6351, 0x14292967,
   0x27b70a85, 0x2e1b2138, 0x4d2c6dfc, 0x53380d13, 0x650a7354, 0x766a0abb, 0x81c2c92e, 0x92722c85,
   0xa2bfe8a1, 0xa81a664b, 0xc24b8b70, 0xc76c51a3, 0xd192e819, 0xd6990624, 0xf40e3585, 0x106aa070,
   0x19a4c116, 0x1e376c08, 0x2748774c, 0x34b0bcb5, 0x391c0cb3, 0x4ed8aa4a, 0x5b9cca4f, 0x682e6ff3,
   0x748f82ee, 0x78a5636f, 0x84c87814, 0x8cc70208, 0x90befffa, 0xa4506ceb, 0xbef9a3f7, 0xc67178f2
};

const static uint64_t k_512[80] =
{
   0x428a2f98d728ae22, 0x7137449123ef65cd, 0xb5c0fbcfec4d3b2f, 0xe9b5dba58189dbbc, 0x3956c25bf348b538,
   0x59f111f1b605d019, 0x923f82a4af194f9b, 0xab1c5ed5da6d8118, 0xd807aa98a3030242, 0x12835b0145706fbe,
   0x243185be4ee4b28c, 0x550c7dc3d5ffb4e2, 0x72be5d74f27b896f, 0x80deb1fe3b1696b1, 0x9bdc06a725c71235,
   0xc19bf174cf692694, 0xe49b69c19ef14ad2, 0xefbe4786384f25e3, 0x0fc19dc68b8cd5b5, 0x240ca1cc77ac9c65,
   0x2de92c6f592b0275, 0x4a7484aa6ea6e483, 0x5cb0a9dcbd41fbd4, 0x76f988da831153b5, 0x983e5152ee66dfab,
   0xa831c66d2db43210, 0xb00327c898fb213f, 0xbf597fc7beef0ee4, 0xc6e00bf33da88fc2, 0xd5a79147930aa725,
   0x06ca6351e003826f, 0x142929670a0e6e70, 0x27b70a8546d22ffc, 0x2e1b21385c26c926, 0x4d2c6dfc5ac42aed,
   0x53380d139d95b3df, 0x650a73548baf63de, 0x766a0abb3c77b2a8, 0x81c2c92e47edaee6, 0x92722c851482353b,
   0xa2bfe8a14cf10364, 0xa81a664bbc423001, 0xc24b8b70d0f89791, 0xc76c51a30654be30, 0xd192e819d6ef5218,
   0xd69906245565a910, 0xf40e35855771202a, 0x106aa07032bbd1b8, 0x19a4c116b8d2d0c8, 0x1e376c085141ab53,
   0x2748774cdf8eeb99, 0x34b0bcb5e19b48a8, 0x391c0cb3c5c95a63, 0x4ed8aa4ae3418acb, 0x5b9cca4f7763e373,
   0x682e6ff3d6b2b8a3, 0x748f82ee5defb2fc, 0x78a5636f43172f60, 0x84c87814a1f0ab72, 0x8cc702081a6439ec,
   0x90befffa23631e28, 0xa4506cebde82bde9, 0xbef9a3f7b2c67915, 0xc67178f2e372532b, 0xca273eceea26619c,
   0xd186b8c721c0c207, 0xeada7dd6cde0eb1e, 0xf57d4f7fee6ed178, 0x06f067aa72176fba, 0x0a637dc5a2c898a6,
   0x113f9804bef90dae, 0x1b710b35131c471b, 0x28db77f523047d84, 0x32caab7b40c72493, 0x3c9ebe0a15c9bebc,
   0x431d67c49c100d4c, 0x4cc5d4becb3e42b6, 0x597f299cfc657e2a, 0x5fcb6fab3ad6faec, 0x6c44198c4a475817
};

bool SHA_Engine::valid_mode()
{
    switch (mode)
    {
        case SE_Mode::SHA1:
        case SE_Mode::SHA224:
        case SE_Mode::SHA256:
        case SE_Mode::SHA384:
        case SE_Mode::SHA512:
            return true;
        default:
            return false;
    }
}

void SHA_Engine::reset_hash()
{
    switch (mode)
    {
        case SE_Mode::SHA256:
            hash[0] = 0x6a09e667;
            hash[1] = 0xbb67ae85;
            hash[2] = 0x3c6ef372;
            hash[3] = 0xa54ff53a;
            hash[4] = 0x510e527f;
            hash[5] = 0x9b05688c;
            hash[6] = 0x1f83d9ab;
            hash[7] = 0x5be0cd19;
            break;
        case SE_Mode::SHA224:
            hash[0] = 0xc1059ed8;
            hash[1] = 0x367cd507;
            hash[2] = 0x3070dd17;
            hash[3] = 0xf70e5939;
            hash[4] = 0xffc00b31;
            hash[5] = 0x68581511;
            hash[6] = 0x64f98fa7;
            hash[7] = 0xbefa4fa4;
            break;
        case SE_Mode::SHA1:
            hash[0] = 0x67452301;
            hash[1] = 0xEFCDAB89;
            hash[2] = 0x98BADCFE;
            hash[3] = 0x10325476;
            hash[4] = 0xC3D2E1F0;

            //Unused
            hash[5] = 0;
            hash[6] = 0;
            hash[7] = 0;
            break;
        case SE_Mode::SHA512:
            hash64[0] = 0x6a09e667f3bcc908;
            hash64[1] = 0xbb67ae8584caa73b;
            hash64[2] = 0x3c6ef372fe94f82b;
            hash64[3] = 0xa54ff53a5f1d36f1;
            hash64[4] = 0x510e527fade682d1;
            hash64[5] = 0x9b05688c2b3e6c1f;
            hash64[6] = 0x1f83d9abfb41bd6b;
            hash64[7] = 0x5be0cd19137e2179;
            break;
        case SE_Mode::SHA384:
            hash64[0] = 0xcbbb9d5dc1059ed8;
            hash64[1] = 0x629a292a367cd507;
            hash64[2] = 0x9159015a3070dd17;
            hash64[3] = 0x152fecd8f70e5939;
            hash64[4] = 0x67332667ffc00b31;
            hash64[5] = 0x8eb44a8768581511;
            hash64[6] = 0xdb0c2e0d64f98fa7;
            hash64[7] = 0x47b5481dbefa4fa4;
            break;
        default:
            SEException::die("[SHA] Unrecognized mode %d\n", mode);
    }

    block_len = 0;
    message_len = 0;
}

int SHA_Engine::block_size()
{
    return (mode == SE_Mode::SHA384 || mode == SE_Mode::SHA512) ? 128 : 64;
}

int SHA_Engine::digest_words()
{
    switch (mode)
    {
        case SE_Mode::SHA1:
            return 5;
        case SE_Mode::SHA224:
            return 7;
        case SE_Mode::SHA256:
            return 8;
        case SE_Mode::SHA384:
            return 12;
        case SE_Mode::SHA512:
            return 16;
        default:
            SEException::die("[SHA] Unrecognized mode %d\n", mode);
    }
    return 0;
}

void SHA_Engine::update(const uint8_t* data, size_t len)
{
    message_len += len;
    while (len)
    {
        size_t chunk = block_size() - block_len;
        if (chunk > len)
            chunk = len;

        memcpy(block + block_len, data, chunk);
        block_len += chunk;
        data += chunk;
        len -= chunk;

        if (block_len == block_size())
        {
            do_block();
            block_len = 0;
        }
    }
}

void SHA_Engine::finish()
{
    int size = block_size();
    int length_size = (size == 128) ? 16 : 8;
    uint64_t bit_len = message_len * 8;

    //Append '1' to the end of the user message
    block[block_len++] = 0x80;

    if (block_len > size - length_size)
    {
        //Not enough space to store the message length. We need to do another round
        memset(block + block_len, 0, size - block_len);
        do_block();
        block_len = 0;
    }

    memset(block + block_len, 0, size - block_len);
    store_be64(block + size - 8, bit_len);
    do_block();
    block_len = 0;
}

uint32_t SHA_Engine::result_word(int index)
{
    if (block_size() == 128)
    {
        uint64_t value = hash64[index / 2];
        return (index & 1) ? (value & 0xFFFFFFFF) : (value >> 32);
    }
    return hash[index];
}

void SHA_Engine::do_block()
{
    switch (mode)
    {
        case SE_Mode::SHA1:
            for (int i = 0; i < 16; i++)
                messages[i] = load_be32(block + (i * 4));
            _sha1();
            break;
        case SE_Mode::SHA224:
        case SE_Mode::SHA256:
            for (int i = 0; i < 16; i++)
                messages[i] = load_be32(block + (i * 4));
            _sha256();
            break;
        case SE_Mode::SHA384:
        case SE_Mode::SHA512:
            for (int i = 0; i < 16; i++)
                messages64[i] = load_be64(block + (i * 8));
            _sha512();
            break;
        default:
            SEException::die("[SHA] Unrecognized hash mode %d\n", mode);
    }
}

void SHA_Engine::_sha256()
{
    for (int i = 16; i < 64; i++)
    {
        uint32_t msg0 = messages[i - 15];
        uint32_t msg1 = messages[i - 2];
        uint32_t s0 = rotr32(msg0, 7) ^ rotr32(msg0, 18) ^ (msg0 >> 3);
        uint32_t s1 = rotr32(msg1, 17) ^ rotr32(msg1, 19) ^ (msg1 >> 10);
        messages[i] = messages[i - 16] + messages[i - 7] + s0 + s1;
    }

    uint32_t a, b, c, d, e, f, g, h;
    a = hash[0];
    b = hash[1];
    c = hash[2];
    d = hash[3];
    e = hash[4];
    f = hash[5];
    g = hash[6];
    h = hash[7];

    for (int i = 0; i < 64; i++)
    {
        uint32_t S1 = rotr32(e, 6) ^ rotr32(e, 11) ^ rotr32(e, 25);
        uint32_t ch = (e & f) ^ (~e & g);
        uint32_t temp1 = h + S1 + ch + k_256[i] + messages[i];
        uint32_t S0 = rotr32(a, 2) ^ rotr32(a, 13) ^ rotr32(a, 22);
        uint32_t maj = (a & b) ^ (a & c) ^ (b & c);
        uint32_t temp2 = S0 + maj;

        h = g;
        g = f;
        f = e;
        e = d + temp1;
        d = c;
        c = b;
        b = a;
        a = temp1 + temp2;
    }

    hash[0] += a;
    hash[1] += b;
    hash[2] += c;
    hash[3] += d;
    hash[4] += e;
    hash[5] += f;
    hash[6] += g;
    hash[7] += h;
}

void SHA_Engine::_sha1()
{
    for (int i = 16; i < 80; i++)
    {
        messages[i] = messages[i - 3] ^ messages[i - 8] ^ messages[i - 14] ^ messages[i - 16];
        messages[i] = rotl32(messages[i], 1);
    }

    uint32_t a, b, c, d, e, f;
    a = hash[0];
    b = hash[1];
    c = hash[2];
    d = hash[3];
    e = hash[4];

    for (int i = 0; i < 80; i++)
    {
        int index = i / 20;
        uint32_t k = k_1[index];
        switch (index)
        {
            case 0:
                f = (b & c) | ((~b) & d);
                break;
            case 2:
                f = (b & c) | (b & d) | (c & d);
                break;
            default:
                f = b ^ c ^ d;
                break;
        }

        uint32_t temp = rotl32(a, 5) + f + e + k + messages[i];
        e = d;
        d = c;
        c = rotl32(b, 30);
        b = a;
        a = temp;
    }

    hash[0] += a;
    hash[1] += b;
    hash[2] += c;
    hash[3] += d;
    hash[4] += e;
}

void SHA_Engine::_sha512()
{
    for (int i = 16; i < 80; i++)
    {
        uint64_t msg0 = messages64[i - 15];
        uint64_t msg1 = messages64[i - 2];
        uint64_t s0 = rotr64(msg0, 1) ^ rotr64(msg0, 8) ^ (msg0 >> 7);
        uint64_t s1 = rotr64(msg1, 19) ^ rotr64(msg1, 61) ^ (msg1 >> 6);
        messages64[i] = messages64[i - 16] + messages64[i - 7] + s0 + s1;
    }

    uint64_t a, b, c, d, e, f, g, h;
    a = hash64[0];
    b = hash64[1];
    c = hash64[2];
    d = hash64[3];
    e = hash64[4];
    f = hash64[5];
    g = hash64[6];
    h = hash64[7];

    for (int i = 0; i < 80; i++)
    {
        uint64_t S1 = rotr64(e, 14) ^ rotr64(e, 18) ^ rotr64(e, 41);
        uint64_t ch = (e & f) ^ (~e & g);
        uint64_t temp1 = h + S1 + ch + k_512[i] + messages64[i];
        uint64_t S0 = rotr64(a, 28) ^ rotr64(a, 34) ^ rotr64(a, 39);
        uint64_t maj = (a & b) ^ (a & c) ^ (b & c);
        uint64_t temp2 = S0 + maj;

        h = g;
        g = f;
        f = e;
        e = d + temp1;
        d = c;
        c = b;
        b = a;
        a = temp1 + temp2;
    }

    hash64[0] += a;
    hash64[1] += b;
    hash64[2] += c;
    hash64[3] += d;
    hash64[4] += e;
    hash64[5] += f;
    hash64[6] += g;
    hash64[7] += h;
}
