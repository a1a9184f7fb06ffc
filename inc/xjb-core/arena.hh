#pragma once

#include <vector>
#include <span>
#include <string_view>
#include <memory>
#include <new>
#include <utility>
#include <type_traits>
#include <sstream>
#include <cstdint>
#include <cstdlib>
#include <cassert>

#include "config/config.hh"
#include "xjb-core/common.hh"
#include "xjb-core/allocator.hh"
#include "xjb-core/error.hh"
#include "xjb-core/feedback.hh"

///
// Arena: variable-length bump allocator over a growing list of blocks.
// - every address handed out stays valid and unmoved until the arena is destroyed
//   (or 'reset' is called: see below).
// - no per-allocation free; blocks are released together in '~Arena'.
// - the arena only manages raw bytes: destructors of objects placed in it with
//   'make' or 'alloc_slice' must be run by their owner.
// - blocks grow geometrically: each new block is at least twice the previous
//   one, capped at XJB_CONFIG_ARENA_MAX_BLOCK_SIZE.
//

namespace xjb {

    class Arena final: public Allocator {
    private:
        struct Block {
            APtr mem;
            size_t capacity_bytes;
        };

    private:
        std::vector<Block> m_blocks;
        size_t m_current_block;
        size_t m_occupied_bytes;        // cursor into the current block
        size_t m_used_bytes;            // handed out since the last reset, padding included
        size_t m_initial_block_size;
        size_t m_next_block_size;
        RootAllocCb m_root_alloc;
        RootDeallocCb m_root_dealloc;

    public:
        explicit Arena(
            size_t initial_block_size = XJB_CONFIG_ARENA_DEFAULT_BLOCK_SIZE,
            RootAllocCb alloc = std::malloc,
            RootDeallocCb dealloc = std::free
        );
        ~Arena() override;

        // Korobkas and Values keep 'Allocator*' to their arena: it may not move.
        Arena(Arena const&) = delete;
        Arena& operator=(Arena const&) = delete;
        Arena(Arena&&) = delete;
        Arena& operator=(Arena&&) = delete;

    public:
        void* allocate(size_t size, size_t align) override;
        void deallocate(void* ptr, size_t size, size_t align) override;
        bool frees_in_bulk() const override { return true; }

        // Rewinds the cursor to the first block, keeping every block for reuse.
        // UNSAFE: every address handed out so far is invalidated. Not checked.
        void reset() override;

    public:
        template <typename T, typename... TArgs>
        T* make(TArgs&&... args);

        // 'count' value-initialized T, contiguous.
        template <typename T>
        std::span<T> alloc_slice(size_t count);
        template <typename T>
        std::span<T> copy_slice(std::span<T const> src);
        std::string_view copy_str(std::string_view src);

    public:
        size_t block_count() const { return m_blocks.size(); }
        size_t bytes_used() const { return m_used_bytes; }
        size_t bytes_reserved() const;
        size_t initial_block_size() const { return m_initial_block_size; }
        bool owns(void const* ptr) const;

    private:
        void* try_bump(size_t size, size_t align);
        void* allocate_slow(size_t size, size_t align);
    };

    template <typename T, typename... TArgs>
    T* Arena::make(TArgs&&... args) {
        void* mem = allocate(sizeof(T), alignof(T));
        return new(mem) T(std::forward<TArgs>(args)...);
    }
    template <typename T>
    std::span<T> Arena::alloc_slice(size_t count) {
        if (count > SIZE_MAX / sizeof(T)) {
            fatal_out_of_memory(SIZE_MAX);
        }
        T* mem = static_cast<T*>(allocate(count * sizeof(T), alignof(T)));
        std::uninitialized_value_construct_n(mem, count);
        return {mem, count};
    }
    template <typename T>
    std::span<T> Arena::copy_slice(std::span<T const> src) {
        if (src.size() > SIZE_MAX / sizeof(T)) {
            fatal_out_of_memory(SIZE_MAX);
        }
        T* mem = static_cast<T*>(allocate(src.size() * sizeof(T), alignof(T)));
        std::uninitialized_copy(src.begin(), src.end(), mem);
        return {mem, src.size()};
    }

    ///
    // TypedArena: single-type arena. Every slot has the same stride, so a slot
    // is found with one multiply and the whole arena can be walked.
    // - 'emplace' never moves earlier slots.
    // - destructors only run in 'destroy_all': dropping the arena with live
    //   non-trivial objects leaks whatever they own.
    //

    template <typename T>
    class TypedArena {
    public:
        static constexpr size_t STRIDE = sizeof(T);

    private:
        struct Block {
            T* slots;
            size_t capacity;
            size_t count;
        };

    private:
        std::vector<Block> m_blocks;
        size_t m_current_block;
        size_t m_next_block_capacity;

    public:
        explicit TypedArena(size_t initial_capacity = 64)
        :   m_blocks(),
            m_current_block(0),
            m_next_block_capacity(initial_capacity == 0 ? 1 : initial_capacity)
        {}
        ~TypedArena();

        TypedArena(TypedArena const&) = delete;
        TypedArena& operator=(TypedArena const&) = delete;

    public:
        template <typename... TArgs>
        T* emplace(TArgs&&... args);

        // runs '~T' on every live slot, then rewinds.
        void destroy_all();

        // UNSAFE: rewinds without destroying; all slots become invalid.
        void reset();

    public:
        size_t live_count() const;
        size_t block_count() const { return m_blocks.size(); }

    private:
        T* next_slot();
    };

    template <typename T>
    TypedArena<T>::~TypedArena() {
#if XJB_CONFIG_DEBUG_MODE
        if (!std::is_trivially_destructible_v<T> && live_count() > 0) {
            std::stringstream ss;
            ss << "TypedArena dropped with " << live_count() << " live object(s), potential resource leak";
            warning(ss.str());
        }
#endif
        for (Block& blk: m_blocks) {
            ::operator delete(static_cast<void*>(blk.slots), std::align_val_t{alignof(T)});
        }
    }

    template <typename T>
    template <typename... TArgs>
    T* TypedArena<T>::emplace(TArgs&&... args) {
        T* slot = next_slot();
        return new(slot) T(std::forward<TArgs>(args)...);
    }

    template <typename T>
    T* TypedArena<T>::next_slot() {
        while (m_current_block < m_blocks.size()) {
            Block& blk = m_blocks[m_current_block];
            if (blk.count < blk.capacity) {
                return blk.slots + blk.count++;
            }
            m_current_block++;
        }

        // all blocks full: append one
        size_t capacity = m_next_block_capacity;
        if (capacity > SIZE_MAX / STRIDE) {
            fatal_out_of_memory(SIZE_MAX);
        }
        size_t byte_count = capacity * STRIDE;
        void* mem = ::operator new(byte_count, std::align_val_t{alignof(T)}, std::nothrow);
        if (mem == nullptr) {
            fatal_out_of_memory(byte_count);
        }
        m_blocks.push_back({static_cast<T*>(mem), capacity, 0});
        m_current_block = m_blocks.size() - 1;
        if (m_next_block_capacity * STRIDE < XJB_CONFIG_ARENA_MAX_BLOCK_SIZE) {
            m_next_block_capacity *= 2;
        }

        Block& blk = m_blocks.back();
        return blk.slots + blk.count++;
    }

    template <typename T>
    void TypedArena<T>::destroy_all() {
        if constexpr (!std::is_trivially_destructible_v<T>) {
            for (Block& blk: m_blocks) {
                for (size_t i = 0; i < blk.count; i++) {
                    blk.slots[i].~T();
                }
            }
        }
        reset();
    }

    template <typename T>
    void TypedArena<T>::reset() {
        for (Block& blk: m_blocks) {
            blk.count = 0;
        }
        m_current_block = 0;
    }

    template <typename T>
    size_t TypedArena<T>::live_count() const {
        size_t total = 0;
        for (Block const& blk: m_blocks) {
            total += blk.count;
        }
        return total;
    }

}   // namespace xjb
