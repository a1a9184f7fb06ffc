#pragma once

#include <cstdint>
#include <cstddef>
#include "config/config.hh"
#include "robin_hood.h"

namespace xjb {

    template <typename T>
    using UnstableHashSet = robin_hood::unordered_flat_set<T>;
    template <typename T>
    using StableHashSet = robin_hood::unordered_node_set<T>;

    template <typename K, typename V>
    using UnstableHashMap = robin_hood::unordered_flat_map<K, V>;
    template <typename K, typename V>
    using StableHashMap = robin_hood::unordered_node_map<K, V>;

    #if (XJB_CONFIG_SIZEOF_VOID_P==8)
        using ssize_t = int64_t;
        using float_t = double;
    #else
        #error "Unknown XJB_CONFIG_SIZEOF_VOID_P value: expected 64-bit only"
    #endif

    // 'align' must be a power of 2
    constexpr inline size_t align_up(size_t offset, size_t align) {
        return (offset + (align - 1)) & ~(align - 1);
    }
    constexpr inline bool is_pow2(size_t n) {
        return n != 0 && (n & (n - 1)) == 0;
    }

    template <typename T>
    inline void SUPPRESS_UNUSED_VARIABLE_WARNING(T x) {
        // see: https://stackoverflow.com/questions/1486904/how-do-i-best-silence-a-warning-about-unused-variables
        (void)x;
    }

}   // namespace xjb
