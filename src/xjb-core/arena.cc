#include "xjb-core/arena.hh"

#include <algorithm>
#include <cstdint>
#include <cstring>

namespace xjb {

    Arena::Arena(size_t initial_block_size, RootAllocCb alloc, RootDeallocCb dealloc)
    :   m_blocks(),
        m_current_block(0),
        m_occupied_bytes(0),
        m_used_bytes(0),
        m_initial_block_size(initial_block_size == 0 ? sizeof(ABlk) : initial_block_size),
        m_next_block_size(m_initial_block_size),
        m_root_alloc(std::move(alloc)),
        m_root_dealloc(std::move(dealloc))
    {}

    Arena::~Arena() {
        for (Block& blk: m_blocks) {
            m_root_dealloc(blk.mem);
        }
    }

    void* Arena::allocate(size_t size, size_t align) {
        assert(is_pow2(align) && "alignment must be a power of 2");
        if (!m_blocks.empty()) {
            if (void* res = try_bump(size, align)) {
                return res;
            }
        }
        return allocate_slow(size, align);
    }

    void Arena::deallocate(void* ptr, size_t size, size_t align) {
        // bulk-freed in '~Arena'
        SUPPRESS_UNUSED_VARIABLE_WARNING(ptr);
        SUPPRESS_UNUSED_VARIABLE_WARNING(size);
        SUPPRESS_UNUSED_VARIABLE_WARNING(align);
    }

    void Arena::reset() {
        m_current_block = 0;
        m_occupied_bytes = 0;
        m_used_bytes = 0;
    }

    std::string_view Arena::copy_str(std::string_view src) {
        if (src.empty()) {
            return {};
        }
        char* mem = static_cast<char*>(allocate(src.size(), alignof(char)));
        std::memcpy(mem, src.data(), src.size());
        return {mem, src.size()};
    }

    size_t Arena::bytes_reserved() const {
        size_t total = 0;
        for (Block const& blk: m_blocks) {
            total += blk.capacity_bytes;
        }
        return total;
    }

    bool Arena::owns(void const* ptr) const {
        auto addr = reinterpret_cast<uintptr_t>(ptr);
        for (Block const& blk: m_blocks) {
            auto base = reinterpret_cast<uintptr_t>(blk.mem);
            if (base <= addr && addr < base + blk.capacity_bytes) {
                return true;
            }
        }
        return false;
    }

    void* Arena::try_bump(size_t size, size_t align) {
        Block const& blk = m_blocks[m_current_block];
        auto base = reinterpret_cast<uintptr_t>(blk.mem);
        uintptr_t cursor = base + m_occupied_bytes;
        // compare offsets within the block: 'aligned + size' may wrap
        size_t pad = static_cast<size_t>(align_up(cursor, align) - cursor);
        size_t free_bytes = blk.capacity_bytes - m_occupied_bytes;
        if (pad > free_bytes || size > free_bytes - pad) {
            return nullptr;
        }
        uintptr_t aligned = cursor + pad;
        m_used_bytes += pad + size;
        m_occupied_bytes += pad + size;
        return reinterpret_cast<void*>(aligned);
    }

    void* Arena::allocate_slow(size_t size, size_t align) {
        // blocks retained by an earlier 'reset' are reused first
        while (m_current_block + 1 < m_blocks.size()) {
            m_current_block++;
            m_occupied_bytes = 0;
            if (void* res = try_bump(size, align)) {
                return res;
            }
        }

        // root allocations are only aligned to sizeof(ABlk): over-aligned
        // requests need room to pad inside the fresh block.
        size_t padding = (align > sizeof(ABlk) ? align : 0);
        if (size > SIZE_MAX - padding) {
            fatal_out_of_memory(size);
        }
        size_t block_size = std::max(m_next_block_size, size + padding);
        auto mem = static_cast<APtr>(m_root_alloc(block_size));
        if (mem == nullptr) {
            fatal_out_of_memory(block_size);
        }
        m_blocks.push_back({mem, block_size});
        m_current_block = m_blocks.size() - 1;
        m_occupied_bytes = 0;
        m_next_block_size = std::min<size_t>(m_next_block_size * 2, XJB_CONFIG_ARENA_MAX_BLOCK_SIZE);

        void* res = try_bump(size, align);
        assert(res != nullptr && "fresh arena block could not satisfy allocation");
        return res;
    }

}   // namespace xjb
