#include <cstring>
#include <gmp.h>
#include "rsa_core.hpp"

bool rsa_modexp(const uint32_t* modulus, int modulus_words, const uint32_t* exponent, int exponent_words,
                const uint8_t* input, size_t input_len, uint32_t* output, int output_words)
{
    mpz_t gmp_msg, gmp_b, gmp_e, gmp_m;
    mpz_inits(gmp_msg, gmp_b, gmp_e, gmp_m, NULL);

    mpz_import(gmp_m, modulus_words, -1, sizeof(uint32_t), 0, 0, modulus);
    mpz_import(gmp_e, exponent_words, -1, sizeof(uint32_t), 0, 0, exponent);
    mpz_import(gmp_b, input_len, 1, 1, 1, 0, input);

    bool valid = mpz_sgn(gmp_m) != 0;
    memset(output, 0, output_words * sizeof(uint32_t));
    if (valid)
    {
        mpz_powm(gmp_msg, gmp_b, gmp_e, gmp_m);

        size_t count = (mpz_sizeinbase(gmp_msg, 2) + 31) / 32;
        if (count <= (size_t)output_words)
            mpz_export(output, nullptr, -1, sizeof(uint32_t), 0, 0, gmp_msg);
        else
            valid = false;
    }

    mpz_clears(gmp_msg, gmp_b, gmp_e, gmp_m, NULL);
    return valid;
}
