#ifndef ADDRESS_TRANSLATOR_HPP
#define ADDRESS_TRANSLATOR_HPP
#include <cstddef>
#include <cstdint>

//Maps a CPU-visible buffer to the 32-bit physical address the engine's DMA sees.
//Returns false when the buffer has no such address.
class AddressTranslator
{
    public:
        virtual ~AddressTranslator() {}

        virtual bool translate(const void* data, size_t len, uint32_t& phys) = 0;
};

//Flat mapping, used below the highest exception level
class IdentityTranslator : public AddressTranslator
{
    public:
        bool translate(const void* data, size_t len, uint32_t& phys) override;
};

//Stage 1 EL3 lookup through AT S1E3R and PAR_EL1
class EL3Translator : public AddressTranslator
{
    public:
        bool translate(const void* data, size_t len, uint32_t& phys) override;
};

#endif // ADDRESS_TRANSLATOR_HPP
