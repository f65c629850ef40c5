#ifndef SE_RNG_HPP
#define SE_RNG_HPP
#include <cstddef>
#include <cstdint>
#include "linked_list.hpp"
#include "operation.hpp"
#include "result.hpp"

class SE_Registers;

//Cache-line scratch block for partial DRBG output, with its list
struct RNG_Pad
{
    SE_CachePad data;
    SE_LinkedList source_ll, destination_ll;
};

//Front-end for the engine's DRBG
class SE_RNG
{
    private:
        SE_Registers* regs;
        SE_Operation* op;

        void init_rng(uint8_t destination, uint8_t mode);
        SE_Result prepare_pad(RNG_Pad& pad);
        SE_Result generate_block(RNG_Pad& pad, uint8_t* output, size_t len);
    public:
        SE_RNG(SE_Registers* regs, SE_Operation* op);

        SE_Result initialize();
        SE_Result generate_random(uint8_t* output, size_t len);
        SE_Result set_random_key(int slot);
        SE_Result generate_srk();
};

#endif // SE_RNG_HPP
