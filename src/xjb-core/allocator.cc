#include "xjb-core/allocator.hh"

#include <new>
#include <cassert>

#include "xjb-core/common.hh"
#include "xjb-core/error.hh"

namespace xjb {

    void* HeapAllocator::allocate(size_t size, size_t align) {
        assert(is_pow2(align) && "alignment must be a power of 2");
        // 'operator new' may not be asked for 0 bytes portably across allocators.
        size_t byte_count = (size == 0 ? 1 : size);
        void* ptr = ::operator new(byte_count, std::align_val_t{align}, std::nothrow);
        if (ptr == nullptr) {
            fatal_out_of_memory(byte_count);
        }
        return ptr;
    }

    void HeapAllocator::deallocate(void* ptr, size_t size, size_t align) {
        SUPPRESS_UNUSED_VARIABLE_WARNING(size);
        ::operator delete(ptr, std::align_val_t{align});
    }

    HeapAllocator& heap_allocator() {
        static HeapAllocator s_heap_allocator;
        return s_heap_allocator;
    }

}   // namespace xjb
