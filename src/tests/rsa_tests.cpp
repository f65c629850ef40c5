#include <cstring>
#include <vector>
#include <gtest/gtest.h>
#include "../core/common/common.hpp"
#include "../core/common/exceptions.hpp"
#include "../core/sim/sim_bench.hpp"

class RSATest : public testing::Test
{
    protected:
        SimBench bench;
        uint8_t modulus[64];
        uint8_t exponent[4];
        RSA_KeyInfo key_info;

        void SetUp() override
        {
            memset(modulus, 0xFF, sizeof(modulus));
            store_be32(exponent, 2);
            key_info.update(sizeof(modulus), sizeof(exponent));
        }
};

TEST(RSAKeyInfoTest, SizeCodes)
{
    RSA_KeyInfo info;
    info.update(256, 4);
    EXPECT_EQ(3u, info.modulus_size);
    EXPECT_EQ(1u, info.exponent_size);

    info.update(64, 256);
    EXPECT_EQ(0u, info.modulus_size);
    EXPECT_EQ(64u, info.exponent_size);

    info.reset();
    EXPECT_EQ(0u, info.modulus_size);
    EXPECT_EQ(0u, info.exponent_size);
}

TEST(RSAKeyInfoTest, RejectsSizesWithoutACode)
{
    RSA_KeyInfo info;
    info.update(128, 4);

    EXPECT_THROW(info.update(32, 4), SEException::FatalError);
    EXPECT_THROW(info.update(0, 4), SEException::FatalError);
    EXPECT_THROW(info.update(100, 4), SEException::FatalError);
    EXPECT_THROW(info.update(320, 4), SEException::FatalError);
    EXPECT_THROW(info.update(64, 6), SEException::FatalError);
    EXPECT_THROW(info.update(64, 260), SEException::FatalError);

    //Left as it was
    EXPECT_EQ(1u, info.modulus_size);
    EXPECT_EQ(1u, info.exponent_size);
}

TEST_F(RSATest, KeyTableIsLeastSignificantWordFirst)
{
    uint8_t big_modulus[256];
    for (int i = 0; i < 256; i++)
        big_modulus[i] = (uint8_t)i;

    bench.se.fill_rsa_keyslot(1, big_modulus, sizeof(big_modulus), exponent, sizeof(exponent));

    EXPECT_EQ(load_be32(big_modulus + 252), bench.sim.peek_rsa_keytable(1, true, 0));
    EXPECT_EQ(load_be32(big_modulus), bench.sim.peek_rsa_keytable(1, true, 63));
    EXPECT_EQ(2u, bench.sim.peek_rsa_keytable(1, false, 0));
    EXPECT_EQ(0u, bench.sim.peek_rsa_keytable(0, true, 0));
}

TEST_F(RSATest, ClearKeyslotIsIdempotent)
{
    bench.se.fill_rsa_keyslot(0, modulus, sizeof(modulus), exponent, sizeof(exponent));

    for (int pass = 0; pass < 2; pass++)
    {
        bench.se.clear_rsa_keyslot(0);

        for (int i = 0; i < RSA_KEYTABLE_WORDS; i++)
        {
            EXPECT_EQ(0u, bench.sim.peek_rsa_keytable(0, true, i)) << "pass " << pass << " word " << i;
            EXPECT_EQ(0u, bench.sim.peek_rsa_keytable(0, false, i)) << "pass " << pass << " word " << i;
        }
    }
}

TEST_F(RSATest, BadKeyMaterialIsFatal)
{
    EXPECT_THROW(bench.se.fill_rsa_keyslot(2, modulus, sizeof(modulus), exponent, sizeof(exponent)),
                 SEException::FatalError);
    EXPECT_THROW(bench.se.fill_rsa_keyslot(0, modulus, 63, exponent, sizeof(exponent)), SEException::FatalError);
    EXPECT_THROW(bench.se.clear_rsa_keyslot(-1), SEException::FatalError);
}

TEST_F(RSATest, SquaresSmallInput)
{
    bench.se.fill_rsa_keyslot(0, modulus, sizeof(modulus), exponent, sizeof(exponent));

    const uint8_t input[] = {0x03, 0x02};
    uint8_t output[64];
    ASSERT_EQ(SE_Result::Success, bench.se.rsa_encrypt(key_info, 0, input, sizeof(input), output, sizeof(output)));

    //0x302 * 0x302 = 0x90C04
    uint8_t expected[64];
    memset(expected, 0, sizeof(expected));
    expected[61] = 0x09;
    expected[62] = 0x0C;
    expected[63] = 0x04;
    EXPECT_EQ(0, memcmp(expected, output, sizeof(output)));

    const SimOperation& op = bench.sim.operations().back();
    EXPECT_EQ(SE_EncAlg::RSA, op.config.enc_alg);
    EXPECT_EQ(SE_Destination::RSAREG, op.config.destination);
    EXPECT_EQ(0u, bench.sim.peek_register(SE_RSA_KEY_SIZE));
    EXPECT_EQ(1u, bench.sim.peek_register(SE_RSA_EXP_SIZE));
}

TEST_F(RSATest, ReducesModuloModulus)
{
    uint8_t small_modulus[64];
    memset(small_modulus, 0, sizeof(small_modulus));
    small_modulus[63] = 13;
    store_be32(exponent, 3);
    bench.se.fill_rsa_keyslot(1, small_modulus, sizeof(small_modulus), exponent, sizeof(exponent));

    const uint8_t input[] = {100};
    uint8_t output[8];
    ASSERT_EQ(SE_Result::Success, bench.se.rsa_encrypt(key_info, 1, input, sizeof(input), output, sizeof(output)));

    //100^3 mod 13 = 1
    const uint8_t expected[8] = {0, 0, 0, 0, 0, 0, 0, 1};
    EXPECT_EQ(0, memcmp(expected, output, sizeof(output)));
    EXPECT_EQ(1u << SE_RSA_CONFIG_KEY_SLOT_SHIFT, bench.sim.peek_register(SE_RSA_CONFIG));
}

TEST_F(RSATest, EmptySlotIsException)
{
    const uint8_t input[] = {1};
    uint8_t output[64];
    EXPECT_EQ(SE_Result::Exception, bench.se.rsa_encrypt(key_info, 0, input, sizeof(input), output, sizeof(output)));
}

TEST_F(RSATest, BadBufferSizes)
{
    bench.se.fill_rsa_keyslot(0, modulus, sizeof(modulus), exponent, sizeof(exponent));

    std::vector<uint8_t> big(260);
    uint8_t output[64];
    EXPECT_EQ(SE_Result::MalformedBuffer, bench.se.rsa_encrypt(key_info, 0, big.data(), 16, output, 63));
    EXPECT_EQ(SE_Result::MalformedBuffer, bench.se.rsa_encrypt(key_info, 0, big.data(), 16, big.data(), 260));
    EXPECT_EQ(SE_Result::MalformedBuffer, bench.se.rsa_encrypt(key_info, 0, big.data(), 257, output, 64));
    EXPECT_TRUE(bench.sim.operations().empty());
}
