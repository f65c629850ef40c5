#ifndef SIM_ENGINE_HPP
#define SIM_ENGINE_HPP
#include <cstddef>
#include <cstdint>
#include <vector>
#include "../platform/mmio.hpp"
#include "../se/constants.hpp"
#include "../se/linked_list.hpp"
#include "../se/registers.hpp"
#include "aes_core.hpp"
#include "sha_engine.hpp"

class SimAhbArbiter;
class SimDMAMapper;

//One executed operation, as the engine saw it when the opcode was written
struct SimOperation
{
    uint32_t opcode;
    SE_CONFIG_REG config;
    SE_CRYPTO_CONFIG_REG crypto_config;
    SE_RNG_CONFIG_REG rng_config;
    uint32_t last_block;
    uint32_t in_bytes;
    uint32_t out_bytes;
    bool error;
};

struct SimFaults
{
    bool never_complete;
    bool stuck_busy;
    bool raise_err_stat;
    uint32_t err_status;

    SimFaults() : never_complete(false), stuck_busy(false), raise_err_stat(false), err_status(0) {}
};

//Register-level model of a Tegra X1 Security Engine instance
class SimSecurityEngine : public MMIO_Bus
{
    private:
        uint32_t base;
        SimDMAMapper* dma;
        SimAhbArbiter* ahb;

        uint32_t regs[SE_REGISTER_SPACE / 4];
        uint32_t int_status;
        uint32_t err_status;

        uint32_t keytable[AES_KEY_SLOT_COUNT][AES_KEYTABLE_WORDS];
        uint32_t rsa_keytable[RSA_KEY_SLOT_COUNT][2][RSA_KEYTABLE_WORDS];

        //Operation in flight
        bool busy;
        int remaining_polls;
        int latency_polls;
        int ahb_latency;
        bool pending_error;
        bool stuck_state;

        //DRBG
        bool drbg_instantiated;
        uint8_t drbg_key[16];
        uint8_t drbg_v[16];
        uint32_t drbg_blocks;
        uint8_t entropy_key[16];
        uint64_t entropy_counter;

        bool srk_valid;
        uint8_t srk[16];

        AES_Core aes;
        AES_Core entropy_aes;
        SHA_Engine sha;

        SimFaults faults;

        //One entry per operation, kept until clear_operations() or reset()
        std::vector<SimOperation> log;

        uint32_t& reg(uint32_t offset) { return regs[offset / 4]; }
        void poll();
        void finish_operation();

        bool read_list(uint32_t addr, SE_LinkedList& list);
        bool gather(const SE_LinkedList& list, std::vector<uint8_t>& data);
        bool scatter(const SE_LinkedList& list, const uint8_t* data, size_t len);
        uint64_t capacity(const SE_LinkedList& list);

        void start_operation(uint32_t opcode);
        bool do_aes(const SE_CONFIG_REG& config, const SE_LinkedList& in, const SE_LinkedList& out,
                    SimOperation& entry);
        bool do_rng(const SE_CONFIG_REG& config, const SE_LinkedList& out, SimOperation& entry);
        bool do_sha(const SE_CONFIG_REG& config, const SE_LinkedList& in, SimOperation& entry);
        bool do_rsa(const SE_CONFIG_REG& config, const SE_LinkedList& in, SimOperation& entry);
        bool do_context_save(const SE_LinkedList& in, const SE_LinkedList& out, SimOperation& entry);

        void get_entropy(uint8_t* out);
        void drbg_update(bool reseed);
        bool drbg_generate(uint8_t* out);

        void keytable_block(int slot, int first_word, uint8_t* out);
        void write_keytable_block(int slot, int first_word, const uint8_t* data);
        bool load_key(int slot, uint8_t mode);
    public:
        SimSecurityEngine(SimDMAMapper* dma, SimAhbArbiter* ahb, uint32_t base = SE1_BASE);

        void reset();

        uint32_t read32(uint32_t addr) override;
        void write32(uint32_t addr, uint32_t value) override;

        //Completion is reported after this many STATUS/INT_STATUS reads
        void set_latency(int polls) { latency_polls = polls; }
        void set_ahb_latency(int reads) { ahb_latency = reads; }
        void set_faults(const SimFaults& faults) { this->faults = faults; }
        void set_entropy_seed(uint64_t seed);

        //Inspection, not reachable through the register interface
        const std::vector<SimOperation>& operations() const { return log; }
        void clear_operations() { log.clear(); }
        uint32_t peek_register(uint32_t offset) const { return regs[offset / 4]; }
        uint32_t peek_keytable(int slot, int word) const { return keytable[slot][word]; }
        uint32_t peek_rsa_keytable(int slot, bool modulus, int word) const;
        bool has_srk() const { return srk_valid; }
        bool drbg_ready() const { return drbg_instantiated; }
        uint32_t drbg_block_count() const { return drbg_blocks; }
};

#endif // SIM_ENGINE_HPP
