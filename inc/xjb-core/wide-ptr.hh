#pragma once

#include <ostream>
#include <functional>
#include <cstddef>

#include "config/config.hh"
#include "xjb-core/type-desc.hh"

///
// WidePtr: (payload address, descriptor address). Type erasure in two words,
// no ownership: see Korobka for that.
// Invariant: if 'desc' is non-null, 'data' points at a live value of the type
// it describes for as long as the WidePtr is read.
//

namespace xjb {

    class WidePtr {
    private:
        void* m_data;
        TypeDesc const* m_desc;

    public:
        WidePtr()
        :   m_data(nullptr),
            m_desc(nullptr)
        {}
        WidePtr(void* data, TypeDesc const* desc)
        :   m_data(data),
            m_desc(desc)
        {}

    public:
        static WidePtr make(void* data, TypeDesc const& desc) {
            return WidePtr{data, &desc};
        }
        template <typename T>
        static WidePtr make(T* data) {
            return WidePtr{static_cast<void*>(data), &type_desc<T>()};
        }

    public:
        void* data() const { return m_data; }
        TypeDesc const* desc() const { return m_desc; }
        bool is_null() const { return m_data == nullptr || m_desc == nullptr; }

        template <typename T>
        bool is() const {
            return m_desc == &type_desc<T>();
        }

        // Checked in strict mode. In unchecked mode the caller must already
        // know the payload is a T (e.g. from the enclosing Value's tag).
        template <typename T>
        T* downcast() const {
#if !XJB_CONFIG_DISABLE_RUNTIME_TYPE_CHECKS
            return try_downcast<T>();
#else
            return static_cast<T*>(m_data);
#endif
        }

        // always checked, regardless of mode.
        template <typename T>
        T* try_downcast() const {
            return is<T>() ? static_cast<T*>(m_data) : nullptr;
        }
    };
    static_assert(sizeof(WidePtr) == 2 * sizeof(void*), "WidePtr must stay two words");

    // address + descriptor identity, never deep equality
    inline bool operator==(WidePtr const& lt, WidePtr const& rt) {
        return lt.data() == rt.data() && lt.desc() == rt.desc();
    }
    inline bool operator!=(WidePtr const& lt, WidePtr const& rt) {
        return !(lt == rt);
    }

    std::ostream& operator<<(std::ostream& out, WidePtr const& ptr);

}   // namespace xjb

template <>
struct std::hash<xjb::WidePtr> {
    size_t operator()(xjb::WidePtr const& ptr) const {
        size_t h1 = std::hash<void*>{}(ptr.data());
        size_t h2 = std::hash<void const*>{}(ptr.desc());
        return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
    }
};
