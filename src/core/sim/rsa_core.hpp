#ifndef RSA_CORE_HPP
#define RSA_CORE_HPP
#include <cstddef>
#include <cstdint>

//output = input ^ exponent mod modulus.
//Key and output words are least significant first, input is a big-endian byte string.
//Returns false for a zero modulus.
bool rsa_modexp(const uint32_t* modulus, int modulus_words, const uint32_t* exponent, int exponent_words,
                const uint8_t* input, size_t input_len, uint32_t* output, int output_words);

#endif // RSA_CORE_HPP
