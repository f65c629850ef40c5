#include <vector>
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "../core/platform/ahb.hpp"
#include "../core/se/operation.hpp"
#include "../core/se/registers.hpp"
#include "../core/sim/sim_bench.hpp"
#include "test_util.hpp"

using testing::_;
using testing::AnyNumber;
using testing::InSequence;
using testing::NiceMock;

namespace
{

class MockCache : public CacheMaintenance
{
    public:
        MOCK_METHOD(void, flush_range, (const void* data, size_t len), (override));
        MOCK_METHOD(void, barrier, (), (override));
};

class MockBus : public MMIO_Bus
{
    public:
        MOCK_METHOD(uint32_t, read32, (uint32_t addr), (override));
        MOCK_METHOD(void, write32, (uint32_t addr, uint32_t value), (override));

        void delegate_to(MMIO_Bus* target)
        {
            ON_CALL(*this, read32(_)).WillByDefault([target](uint32_t addr) { return target->read32(addr); });
            ON_CALL(*this, write32(_, _)).WillByDefault([target](uint32_t addr, uint32_t value)
            {
                target->write32(addr, value);
            });
        }
};

//Empty-message SHA-256, the smallest operation that needs no buffers
void program_empty_hash(SE_Registers& regs)
{
    SE_CONFIG_REG config;
    config.enc_mode = SE_Mode::SHA256;
    config.dec_mode = 0;
    config.enc_alg = SE_EncAlg::SHA;
    config.dec_alg = SE_DecAlg::NOP;
    config.destination = SE_Destination::HASHREG;
    regs.write_config(config);
    regs.write32(SE_SHA_CONFIG, SE_SHA_CONFIG_HW_INIT_HASH);
}

}

class OperationTest : public testing::Test
{
    protected:
        SimBench bench;
        uint8_t digest[32];

        SE_Result hash()
        {
            return bench.se.calculate_sha256((const uint8_t*)"abc", 3, digest);
        }
};

TEST_F(OperationTest, CompletesImmediately)
{
    EXPECT_EQ(SE_Result::Success, hash());
    ASSERT_EQ(1u, bench.sim.operations().size());
    EXPECT_EQ(SE_Opcode::START, bench.sim.operations()[0].opcode);
    EXPECT_FALSE(bench.sim.operations()[0].error);
}

TEST_F(OperationTest, WaitsOutEngineLatency)
{
    bench.sim.set_latency(25);
    bench.sim.set_ahb_latency(10);
    EXPECT_EQ(SE_Result::Success, hash());
    EXPECT_EQ(SE_Result::Success, hash());
}

TEST_F(OperationTest, NeverDoneTimesOut)
{
    SimFaults faults;
    faults.never_complete = true;
    bench.sim.set_faults(faults);

    uint64_t start = bench.clock.peek();
    EXPECT_EQ(SE_Result::Timeout, hash());

    //One deadline's worth of milliseconds, give or take the logging reads
    uint64_t elapsed = bench.clock.peek() - start;
    EXPECT_GT(elapsed, 100u);
    EXPECT_LT(elapsed, 110u);
}

TEST_F(OperationTest, BusyEngineFailsIdleWait)
{
    SimFaults faults;
    faults.never_complete = true;
    bench.sim.set_faults(faults);
    ASSERT_EQ(SE_Result::Timeout, hash());

    //The engine is still busy, so the next operation cannot even start
    EXPECT_EQ(SE_Result::Timeout, bench.se.operation().prepare());
    EXPECT_EQ(SE_Result::Timeout, hash());
    EXPECT_EQ(1u, bench.sim.operations().size());
}

TEST_F(OperationTest, ConfiguredTimeoutIsHonoured)
{
    SE_Config config;
    config.timeout_ms = 20;
    SimBench short_bench(config);

    SimFaults faults;
    faults.never_complete = true;
    short_bench.sim.set_faults(faults);

    uint8_t out[32];
    EXPECT_EQ(SE_Result::Timeout, short_bench.se.calculate_sha256(nullptr, 0, out));
    EXPECT_LT(short_bench.clock.peek(), 30u);
}

TEST_F(OperationTest, StuckStateTimesOut)
{
    SimFaults faults;
    faults.stuck_busy = true;
    bench.sim.set_faults(faults);
    EXPECT_EQ(SE_Result::Timeout, hash());
}

TEST_F(OperationTest, StuckWriteQueueIsAhbTimeout)
{
    bench.ahb.set_stuck(true);
    EXPECT_EQ(SE_Result::AhbTimeout, hash());
}

TEST_F(OperationTest, ErrStatIsException)
{
    SimFaults faults;
    faults.raise_err_stat = true;
    bench.sim.set_faults(faults);
    EXPECT_EQ(SE_Result::Exception, hash());
}

TEST_F(OperationTest, ErrStatusIsException)
{
    SimFaults faults;
    faults.err_status = 0x4;
    bench.sim.set_faults(faults);
    EXPECT_EQ(SE_Result::Exception, hash());
}

TEST_F(OperationTest, StaleErrorsAreClearedBeforeNextOperation)
{
    SimFaults faults;
    faults.raise_err_stat = true;
    faults.err_status = 0x10;
    bench.sim.set_faults(faults);
    ASSERT_EQ(SE_Result::Exception, hash());

    bench.sim.set_faults(SimFaults());
    EXPECT_EQ(SE_Result::Success, hash());
    EXPECT_EQ(0u, bench.se.registers().read32(SE_ERR_STATUS));
}

TEST_F(OperationTest, EngineFailureIsException)
{
    bench.se.disable();
    EXPECT_EQ(SE_Result::Exception, hash());
    ASSERT_EQ(1u, bench.sim.operations().size());
    EXPECT_TRUE(bench.sim.operations()[0].error);
}

TEST_F(OperationTest, UnaddressableListsAreMalformed)
{
    bench.dma.set_fail_all(true);
    SE_LinkedList source, destination;
    EXPECT_EQ(SE_Result::MalformedBuffer, bench.se.operation().start_normal_operation(source, destination));
    EXPECT_TRUE(bench.sim.operations().empty());
}

TEST_F(OperationTest, UnaddressableListsAreCaughtBeforeConfiguration)
{
    uint8_t digest[32];
    uint8_t context[16];
    const uint8_t input[] = {1};
    RSA_KeyInfo key_info;

    std::vector<uint32_t> before = engine_state(bench.sim, 0);
    bench.dma.set_fail_all(true);

    EXPECT_EQ(SE_Result::MalformedBuffer, bench.se.calculate_sha256(nullptr, 0, digest));
    EXPECT_EQ(SE_Result::MalformedBuffer, bench.se.set_random_key(0));
    EXPECT_EQ(SE_Result::MalformedBuffer, bench.se.generate_srk());
    EXPECT_EQ(SE_Result::MalformedBuffer, bench.se.rsa_encrypt(key_info, 0, input, sizeof(input), digest, 4));
    EXPECT_EQ(SE_Result::MalformedBuffer, bench.se.context_save(nullptr, 0, context, sizeof(context)));

    EXPECT_TRUE(before == engine_state(bench.sim, 0));
    EXPECT_TRUE(bench.sim.operations().empty());
}

TEST_F(OperationTest, ResultNames)
{
    EXPECT_STREQ("Success", se_result_name(SE_Result::Success));
    EXPECT_STREQ("Timeout", se_result_name(SE_Result::Timeout));
    EXPECT_STREQ("AhbTimeout", se_result_name(SE_Result::AhbTimeout));
    EXPECT_STREQ("Exception", se_result_name(SE_Result::Exception));
    EXPECT_STREQ("MalformedBuffer", se_result_name(SE_Result::MalformedBuffer));
}

TEST(OperationOrderingTest, ListsAreFlushedAroundTrigger)
{
    SimDMAMapper dma;
    SimAhbArbiter ahb;
    SimSecurityEngine sim(&dma, &ahb);
    SimClock clock;
    NiceMock<MockBus> bus;
    MockCache cache;
    bus.delegate_to(&sim);

    SE_Registers regs(&bus, SE1_BASE);
    AHB_Arbiter arbiter(&ahb);
    SE_Operation op(&regs, &arbiter, &clock, &cache, &dma, SE_Config());

    program_empty_hash(regs);
    for (int i = 0; i < SE_SHA_MSG_LENGTH_COUNT; i++)
    {
        regs.write_sha_msg_length(i, 0);
        regs.write_sha_msg_left(i, 0);
    }

    SE_LinkedList source, destination;
    EXPECT_CALL(bus, write32(_, _)).Times(AnyNumber());
    {
        InSequence seq;
        EXPECT_CALL(cache, flush_range((const void*)&source, sizeof(SE_LinkedList)));
        EXPECT_CALL(cache, flush_range((const void*)&destination, sizeof(SE_LinkedList)));
        EXPECT_CALL(cache, barrier());
        EXPECT_CALL(bus, write32(SE1_BASE + SE_OPERATION, SE_Opcode::START));
        EXPECT_CALL(cache, barrier());
        EXPECT_CALL(cache, flush_range((const void*)&source, sizeof(SE_LinkedList)));
        EXPECT_CALL(cache, flush_range((const void*)&destination, sizeof(SE_LinkedList)));
        EXPECT_CALL(cache, barrier());
    }

    EXPECT_EQ(SE_Result::Success, op.start_normal_operation(source, destination));
    EXPECT_EQ(0xe3b0c442u, regs.read_hash_result(0));
}

TEST(OperationOrderingTest, StatusIsClearedBeforeOpcode)
{
    SimDMAMapper dma;
    SimAhbArbiter ahb;
    SimSecurityEngine sim(&dma, &ahb);
    SimClock clock;
    SimCache cache;
    NiceMock<MockBus> bus;
    bus.delegate_to(&sim);

    SE_Registers regs(&bus, SE1_BASE);
    AHB_Arbiter arbiter(&ahb);
    SE_Operation op(&regs, &arbiter, &clock, &cache, &dma, SE_Config());
    program_empty_hash(regs);

    SE_LinkedList source, destination;
    EXPECT_CALL(bus, write32(_, _)).Times(AnyNumber());
    {
        InSequence seq;
        EXPECT_CALL(bus, write32(SE1_BASE + SE_IN_LL_ADDR, _));
        EXPECT_CALL(bus, write32(SE1_BASE + SE_OUT_LL_ADDR, _));
        EXPECT_CALL(bus, write32(SE1_BASE + SE_ERR_STATUS, _));
        EXPECT_CALL(bus, write32(SE1_BASE + SE_INT_STATUS, _));
        EXPECT_CALL(bus, write32(SE1_BASE + SE_OPERATION, SE_Opcode::START));
    }

    EXPECT_EQ(SE_Result::Success, op.start_normal_operation(source, destination));
}
