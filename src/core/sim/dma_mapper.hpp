#ifndef DMA_MAPPER_HPP
#define DMA_MAPPER_HPP
#include <cstddef>
#include <cstdint>
#include <vector>
#include "../platform/address_translator.hpp"

//Gives host buffers 32-bit physical windows so the simulated engine can DMA into them.
//Windows stay valid until reset(); buffers handed to translate() must outlive their use.
class SimDMAMapper : public AddressTranslator
{
    private:
        struct Window
        {
            uintptr_t host;
            size_t len;
            uint32_t phys;
        };

        std::vector<Window> windows;
        uint32_t next_phys;
        bool fail_all;
        uintptr_t fail_host;

        Window* find_phys(uint32_t phys, size_t len);
    public:
        SimDMAMapper();

        bool translate(const void* data, size_t len, uint32_t& phys) override;

        bool read(uint32_t phys, void* data, size_t len);
        bool write(uint32_t phys, const void* data, size_t len);

        void reset();
        void set_fail_all(bool fail) { fail_all = fail; }

        //Rejects any buffer covering this host address, nullptr to disable
        void set_fail_address(const void* data) { fail_host = (uintptr_t)data; }
        size_t window_count() const { return windows.size(); }
};

#endif // DMA_MAPPER_HPP
