#ifndef MMIO_HPP
#define MMIO_HPP
#include <cstddef>
#include <cstdint>

//A 32-bit register bus. Addresses are physical and absolute.
class MMIO_Bus
{
    public:
        virtual ~MMIO_Bus() {}

        virtual uint32_t read32(uint32_t addr) = 0;
        virtual void write32(uint32_t addr, uint32_t value) = 0;
};

//Registers mapped into the CPU's address space, e.g. an identity mapped MMIO window
class DirectMMIO : public MMIO_Bus
{
    private:
        volatile uint32_t* window;
        uint32_t phys_base;
        uint32_t size;

        volatile uint32_t* reg_ptr(uint32_t addr);
    public:
        DirectMMIO(volatile void* window, uint32_t phys_base, uint32_t size);

        uint32_t read32(uint32_t addr) override;
        void write32(uint32_t addr, uint32_t value) override;
};

#endif // MMIO_HPP
