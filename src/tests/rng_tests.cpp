#include <cstring>
#include <vector>
#include <gtest/gtest.h>
#include "../core/common/exceptions.hpp"
#include "../core/sim/sim_bench.hpp"
#include "test_util.hpp"

class RNGTest : public testing::Test
{
    protected:
        SimBench bench;
};

static bool all_zero(const uint8_t* data, size_t len)
{
    for (size_t i = 0; i < len; i++)
    {
        if (data[i])
            return false;
    }
    return true;
}

TEST_F(RNGTest, InitializeInstantiatesDRBG)
{
    ASSERT_EQ(SE_Result::Success, bench.se.initialize_rng());
    EXPECT_TRUE(bench.sim.drbg_ready());

    EXPECT_EQ(RNG_RESEED_INTERVAL, bench.sim.peek_register(SE_RNG_RESEED_INTERVAL));
    EXPECT_EQ((uint32_t)(SE_RNG_SRC_CONFIG_ENTROPY_SOURCE | SE_RNG_SRC_CONFIG_ENTROPY_LOCK),
              bench.sim.peek_register(SE_RNG_SRC_CONFIG));

    ASSERT_EQ(1u, bench.sim.operations().size());
    const SimOperation& op = bench.sim.operations()[0];
    EXPECT_EQ(SE_EncAlg::RNG, op.config.enc_alg);
    EXPECT_EQ(SE_Destination::MEMORY, op.config.destination);
    EXPECT_EQ(SE_RngMode::FORCE_INSTANTIATION, op.rng_config.mode);
    EXPECT_EQ(SE_RngSource::ENTROPY, op.rng_config.source);
    EXPECT_EQ(SE_InputSel::RANDOM, op.crypto_config.input_sel);
    EXPECT_EQ(0u, op.last_block);
}

TEST_F(RNGTest, GenerateBeforeInitializeFails)
{
    uint8_t out[16];
    EXPECT_EQ(SE_Result::Exception, bench.se.generate_random(out, sizeof(out)));
    EXPECT_FALSE(bench.sim.drbg_ready());
}

TEST_F(RNGTest, OneOperationPerBlock)
{
    ASSERT_EQ(SE_Result::Success, bench.se.initialize_rng());
    bench.sim.clear_operations();

    uint8_t out[33];
    memset(out, 0, sizeof(out));
    ASSERT_EQ(SE_Result::Success, bench.se.generate_random(out, sizeof(out)));

    //Two straight into the buffer, one through the padded block for the last byte
    const std::vector<SimOperation>& ops = bench.sim.operations();
    ASSERT_EQ(3u, ops.size());
    for (const SimOperation& op : ops)
    {
        EXPECT_EQ(0u, op.last_block);
        EXPECT_EQ(SE_RngMode::NORMAL, op.rng_config.mode);
        EXPECT_EQ(16u, op.out_bytes);
    }
    EXPECT_FALSE(all_zero(out, 16));
    EXPECT_FALSE(all_zero(out + 16, 16));
}

TEST_F(RNGTest, PartialBlockReachesCallerAndNoFurther)
{
    const uint64_t seeds[] = {1, 77, 9001};
    for (uint64_t seed : seeds)
    {
        SimBench partial, whole;
        partial.sim.set_entropy_seed(seed);
        whole.sim.set_entropy_seed(seed);
        ASSERT_EQ(SE_Result::Success, partial.se.initialize_rng());
        ASSERT_EQ(SE_Result::Success, whole.se.initialize_rng());

        uint8_t out[33 + 16];
        memset(out, 0x5A, sizeof(out));
        ASSERT_EQ(SE_Result::Success, partial.se.generate_random(out, 33));

        //Same DRBG stream, three whole blocks
        uint8_t reference[48];
        ASSERT_EQ(SE_Result::Success, whole.se.generate_random(reference, sizeof(reference)));

        EXPECT_EQ(0, memcmp(reference, out, 33)) << "seed " << seed;
        for (size_t i = 33; i < sizeof(out); i++)
            EXPECT_EQ(0x5A, out[i]) << "seed " << seed << " byte " << i;
    }
}

TEST_F(RNGTest, UntranslatableBuffersLeaveEngineUntouched)
{
    ASSERT_EQ(SE_Result::Success, bench.se.initialize_rng());
    bench.sim.clear_operations();

    std::vector<uint32_t> before = engine_state(bench.sim, 0);
    bench.dma.set_fail_all(true);

    uint8_t out[40];
    EXPECT_EQ(SE_Result::MalformedBuffer, bench.se.generate_random(out, 16));
    EXPECT_EQ(SE_Result::MalformedBuffer, bench.se.generate_random(out, 40));
    EXPECT_EQ(SE_Result::MalformedBuffer, bench.se.generate_random(out, 7));
    EXPECT_EQ(SE_Result::MalformedBuffer, bench.se.initialize_rng());

    EXPECT_TRUE(before == engine_state(bench.sim, 0));
    EXPECT_TRUE(bench.sim.operations().empty());
}

TEST_F(RNGTest, LastBlockFailureRunsNoBlocks)
{
    ASSERT_EQ(SE_Result::Success, bench.se.initialize_rng());
    bench.sim.clear_operations();

    uint8_t out[48];
    memset(out, 0, sizeof(out));
    std::vector<uint32_t> before = engine_state(bench.sim, 0);
    bench.dma.set_fail_address(out + 32);

    EXPECT_EQ(SE_Result::MalformedBuffer, bench.se.generate_random(out, sizeof(out)));
    EXPECT_TRUE(before == engine_state(bench.sim, 0));
    EXPECT_TRUE(bench.sim.operations().empty());
    EXPECT_TRUE(all_zero(out, sizeof(out)));
}

TEST_F(RNGTest, ZeroLengthIsNoOp)
{
    ASSERT_EQ(SE_Result::Success, bench.se.initialize_rng());
    bench.sim.clear_operations();

    EXPECT_EQ(SE_Result::Success, bench.se.generate_random(nullptr, 0));
    EXPECT_TRUE(bench.sim.operations().empty());
}

TEST_F(RNGTest, OutputDependsOnlyOnEntropy)
{
    SimBench a, b, c;
    a.sim.set_entropy_seed(1234);
    b.sim.set_entropy_seed(1234);
    c.sim.set_entropy_seed(4321);

    uint8_t out_a[32], out_b[32], out_c[32];
    ASSERT_EQ(SE_Result::Success, a.se.initialize_rng());
    ASSERT_EQ(SE_Result::Success, b.se.initialize_rng());
    ASSERT_EQ(SE_Result::Success, c.se.initialize_rng());
    ASSERT_EQ(SE_Result::Success, a.se.generate_random(out_a, sizeof(out_a)));
    ASSERT_EQ(SE_Result::Success, b.se.generate_random(out_b, sizeof(out_b)));
    ASSERT_EQ(SE_Result::Success, c.se.generate_random(out_c, sizeof(out_c)));

    EXPECT_EQ(0, memcmp(out_a, out_b, sizeof(out_a)));
    EXPECT_NE(0, memcmp(out_a, out_c, sizeof(out_a)));
    EXPECT_NE(0, memcmp(out_a, out_a + 16, 16));
}

TEST_F(RNGTest, ReseedsAtInterval)
{
    SE_Config config;
    config.reseed_interval = 2;
    SimBench short_bench(config);

    ASSERT_EQ(SE_Result::Success, short_bench.se.initialize_rng());
    uint8_t out[48];
    ASSERT_EQ(SE_Result::Success, short_bench.se.generate_random(out, sizeof(out)));

    //Four blocks in total, with a reseed after the second
    EXPECT_EQ(2u, short_bench.sim.drbg_block_count());
}

TEST_F(RNGTest, RandomKeyFillsKeyWords)
{
    ASSERT_EQ(SE_Result::Success, bench.se.initialize_rng());
    bench.sim.clear_operations();
    ASSERT_EQ(SE_Result::Success, bench.se.set_random_key(3));

    const std::vector<SimOperation>& ops = bench.sim.operations();
    ASSERT_EQ(2u, ops.size());
    EXPECT_EQ(SE_Destination::KEYTABLE, ops[0].config.destination);
    EXPECT_EQ(SE_Destination::KEYTABLE, ops[1].config.destination);

    bool low_set = false, high_set = false;
    for (int i = 0; i < 4; i++)
    {
        low_set |= bench.sim.peek_keytable(3, i) != 0;
        high_set |= bench.sim.peek_keytable(3, 4 + i) != 0;
    }
    EXPECT_TRUE(low_set);
    EXPECT_TRUE(high_set);
    for (int i = 8; i < AES_KEYTABLE_WORDS; i++)
        EXPECT_EQ(0u, bench.sim.peek_keytable(3, i));
}

TEST_F(RNGTest, RandomKeyRejectsBadSlot)
{
    EXPECT_THROW(bench.se.set_random_key(AES_KEY_SLOT_COUNT), SEException::FatalError);
}

TEST_F(RNGTest, GenerateSRK)
{
    ASSERT_EQ(SE_Result::Success, bench.se.initialize_rng());
    EXPECT_FALSE(bench.sim.has_srk());

    ASSERT_EQ(SE_Result::Success, bench.se.generate_srk());
    EXPECT_TRUE(bench.sim.has_srk());

    const SimOperation& op = bench.sim.operations().back();
    EXPECT_EQ(SE_Destination::SRK, op.config.destination);
    EXPECT_EQ(SE_RngMode::FORCE_RESEED, op.rng_config.mode);
}
