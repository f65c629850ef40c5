#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "../core/common/common.hpp"
#include "../core/platform/cache.hpp"
#include "../core/sim/sim_bench.hpp"
#include "test_util.hpp"

class SHATest : public testing::Test
{
    protected:
        SimBench bench;

        std::string hash(SHA_Mode mode, const std::string& message)
        {
            std::vector<uint8_t> out(SE_SHA::digest_size(mode));
            SE_Result result = bench.se.calculate_sha(mode, (const uint8_t*)message.data(), message.size(),
                                                      out.data());
            EXPECT_EQ(SE_Result::Success, result);
            return to_hex(out);
        }
};

TEST_F(SHATest, DigestSizes)
{
    EXPECT_EQ(20, SE_SHA::digest_size(SHA_Mode::SHA1));
    EXPECT_EQ(28, SE_SHA::digest_size(SHA_Mode::SHA224));
    EXPECT_EQ(32, SE_SHA::digest_size(SHA_Mode::SHA256));
    EXPECT_EQ(48, SE_SHA::digest_size(SHA_Mode::SHA384));
    EXPECT_EQ(64, SE_SHA::digest_size(SHA_Mode::SHA512));
}

TEST_F(SHATest, EmptyMessage)
{
    uint8_t out[32];
    ASSERT_EQ(SE_Result::Success, bench.se.calculate_sha256(nullptr, 0, out));
    EXPECT_EQ("e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855", to_hex(out, 32));
}

TEST_F(SHATest, ShortMessageAllModes)
{
    EXPECT_EQ("a9993e364706816aba3e25717850c26c9cd0d89d", hash(SHA_Mode::SHA1, "abc"));
    EXPECT_EQ("23097d223405d8228642a477bda255b32aadbce4bda0b3f7e36c9da7", hash(SHA_Mode::SHA224, "abc"));
    EXPECT_EQ("ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad", hash(SHA_Mode::SHA256, "abc"));
    EXPECT_EQ("cb00753f45a35e8bb5a03d699ac65007272c32ab0eded1631a8b605a43ff5bed"
              "8086072ba1e7cc2358baeca134c825a7", hash(SHA_Mode::SHA384, "abc"));
    EXPECT_EQ("ddaf35a193617abacc417349ae20413112e6fa4e89a97ea20a9eeee64b55d39a"
              "2192992a274fc1a836ba3c23a3feebbd454d4423643ce80e2a9ac94fa54ca49f", hash(SHA_Mode::SHA512, "abc"));
}

TEST_F(SHATest, MultiBlockMessages)
{
    EXPECT_EQ("248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1",
              hash(SHA_Mode::SHA256, "abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq"));

    std::string long_message(1000, 'a');
    EXPECT_EQ("41edece42d63e8d9bf515a9ba6932e1c20cbc9f5a5d134645adb5db1b9737ea3",
              hash(SHA_Mode::SHA256, long_message));
    EXPECT_EQ("67ba5535a46e3f86dbfbed8cbbaf0125c76ed549ff8b0b9e03e0c88cf90fa634"
              "fa7b12b47d77b694de488ace8d9a65967dc96df599727d3292a8d9d447709c97",
              hash(SHA_Mode::SHA512, long_message));
}

TEST_F(SHATest, ProgramsMessageLength)
{
    std::string message(1000, 'a');
    uint8_t out[32];
    ASSERT_EQ(SE_Result::Success, bench.se.calculate_sha256((const uint8_t*)message.data(), message.size(), out));

    EXPECT_EQ(8000u, bench.sim.peek_register(SE_SHA_MSG_LENGTH));
    EXPECT_EQ(8000u, bench.sim.peek_register(SE_SHA_MSG_LEFT));
    EXPECT_EQ(0u, bench.sim.peek_register(SE_SHA_MSG_LENGTH + 4));
    EXPECT_EQ((uint32_t)SE_SHA_CONFIG_HW_INIT_HASH, bench.sim.peek_register(SE_SHA_CONFIG));

    const SimOperation& op = bench.sim.operations().back();
    EXPECT_EQ(SE_EncAlg::SHA, op.config.enc_alg);
    EXPECT_EQ(SE_Mode::SHA256, op.config.enc_mode);
    EXPECT_EQ(SE_Destination::HASHREG, op.config.destination);
    EXPECT_EQ(1000u, op.in_bytes);
}

TEST_F(SHATest, WithoutByteswapWordsAreLittleEndian)
{
    uint8_t swapped[32], raw[32];
    ASSERT_EQ(SE_Result::Success, bench.se.calculate_sha(SHA_Mode::SHA256, (const uint8_t*)"abc", 3, swapped));
    ASSERT_EQ(SE_Result::Success, bench.se.calculate_sha(SHA_Mode::SHA256, (const uint8_t*)"abc", 3, raw, false));

    for (int i = 0; i < 8; i++)
        EXPECT_EQ(load_be32(swapped + (i * 4)), load_le32(raw + (i * 4)));
}

TEST_F(SHATest, FreshStateEveryCall)
{
    EXPECT_EQ(hash(SHA_Mode::SHA1, "abc"), hash(SHA_Mode::SHA1, "abc"));
    EXPECT_EQ("ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad", hash(SHA_Mode::SHA256, "abc"));
}

TEST(SHACoherentTest, NoCacheMaintenanceNeeded)
{
    SimDMAMapper dma;
    SimAhbArbiter ahb(AHB_ARBITRATION_BASE);
    SimSecurityEngine sim(&dma, &ahb, SE1_BASE);
    SimClock clock;
    CoherentCache cache;
    SecurityEngine se(&sim, SE1_BASE, &ahb, &clock, &cache, &dma, SE_Config());

    uint8_t out[32];
    ASSERT_EQ(SE_Result::Success, se.calculate_sha256((const uint8_t*)"abc", 3, out));
    EXPECT_EQ("ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad", to_hex(out, 32));
}
