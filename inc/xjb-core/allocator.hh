#pragma once

#include <functional>
#include <cstddef>

namespace xjb {

    // APtr = Aligned Pointer
    // ABlk = Aligned Block <=> sizeof(Aligned Block) == default alignment
    struct ABlk { size_t _0; size_t _1; };
    static_assert(__STDCPP_DEFAULT_NEW_ALIGNMENT__ == sizeof(ABlk));
    typedef ABlk* APtr;

    constexpr inline size_t KIBIBYTES(size_t num) { return num << 10; }
    constexpr inline size_t MIBIBYTES(size_t num) { return KIBIBYTES(num) << 10; }
    constexpr inline size_t GIBIBYTES(size_t num) { return MIBIBYTES(num) << 10; }

    using RootAllocCb = std::function<void*(size_t size_in_bytes)>;
    using RootDeallocCb = std::function<void(void* ptr)>;

    ///
    // Allocator: where a Korobka (or an owning Value) gets its payload memory.
    // - 'allocate' never returns null: host memory exhaustion is fatal.
    // - 'deallocate' must receive the same 'size' and 'align' as 'allocate'.
    //   Bulk-freeing allocators (arenas) ignore it.
    //

    class Allocator {
    public:
        virtual ~Allocator() = default;

    public:
        virtual void* allocate(size_t size, size_t align) = 0;
        virtual void deallocate(void* ptr, size_t size, size_t align) = 0;
        virtual bool frees_in_bulk() const = 0;

        // Invalidates every address handed out so far; no-op where unsupported.
        virtual void reset() {}
    };

    ///
    // HeapAllocator: the default allocator, backed by aligned 'operator new'.
    //

    class HeapAllocator final: public Allocator {
    public:
        void* allocate(size_t size, size_t align) override;
        void deallocate(void* ptr, size_t size, size_t align) override;
        bool frees_in_bulk() const override { return false; }
    };

    // process-wide instance used wherever no allocator is specified.
    HeapAllocator& heap_allocator();

}   // namespace xjb
