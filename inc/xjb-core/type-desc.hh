#pragma once

#include <string>
#include <string_view>
#include <concepts>
#include <type_traits>
#include <new>
#include <cstddef>

///
// TypeDesc: one process-wide record per payload type.
// Descriptor identity (its address) is the type-check key: two WidePtrs hold
// the same type iff they point at the same TypeDesc.
// Descriptors are created on first use of 'type_desc<T>()' and never duplicated.
//

namespace xjb {

    struct TypeDesc {
        // runs '~T' on the payload; never frees memory.
        using DestroyFn = void (*)(void* payload);
        // copy-constructs '*src' into uninitialized storage at 'dst'.
        // Returns false (leaving 'dst' uninitialized) if the copy is impossible.
        using CloneFn = bool (*)(void const* src, void* dst);
        using EqualsFn = bool (*)(void const* lhs, void const* rhs);

        size_t size;
        size_t align;
        DestroyFn destroy;
        CloneFn clone;          // null => not cloneable
        EqualsFn equals;        // null => compared by identity only
    };

    ///
    // TypeDescTraits: how 'type_desc<T>' fills in the optional functions.
    // Specialize to override (e.g. for containers whose elements may not be
    // copyable even though the container's copy-constructor is declared).
    //

    template <typename T>
    struct TypeDescTraits {
        static constexpr TypeDesc::CloneFn clone() {
            if constexpr (std::is_copy_constructible_v<T>) {
                return [](void const* src, void* dst) -> bool {
                    new(dst) T(*static_cast<T const*>(src));
                    return true;
                };
            } else {
                return nullptr;
            }
        }
        static constexpr TypeDesc::EqualsFn equals() {
            if constexpr (std::equality_comparable<T>) {
                return [](void const* lhs, void const* rhs) -> bool {
                    return *static_cast<T const*>(lhs) == *static_cast<T const*>(rhs);
                };
            } else {
                return nullptr;
            }
        }
    };

    template <typename T>
    TypeDesc const& type_desc() {
        static_assert(!std::is_reference_v<T> && !std::is_const_v<T>, "descriptors describe plain object types");
        static TypeDesc const s_desc {
            sizeof(T),
            alignof(T),
            [](void* payload) { static_cast<T*>(payload)->~T(); },
            TypeDescTraits<T>::clone(),
            TypeDescTraits<T>::equals()
        };
        return s_desc;
    }

    ///
    // Named registry: lets hosts (and the serialization layer) find a
    // descriptor by name. Write during start-up only: not synchronized.
    //

    // returns false (and changes nothing) if 'name' already names another descriptor.
    bool register_type_name(TypeDesc const& desc, std::string name);
    TypeDesc const* lookup_type(std::string_view name);
    // "<unnamed>" for descriptors never registered.
    std::string const& type_name(TypeDesc const& desc);

    template <typename T>
    TypeDesc const& register_type(std::string name) {
        TypeDesc const& desc = type_desc<T>();
        register_type_name(desc, std::move(name));
        return desc;
    }

}   // namespace xjb
