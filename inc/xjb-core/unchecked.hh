#pragma once

#include <optional>
#include <utility>
#include <new>

#include "config/config.hh"
#include "xjb-core/error.hh"
#include "xjb-core/feedback.hh"

///
// UncheckedOption<T>: a slot that is either empty or holds one T, where the
// caller always knows which.
// - XJB_CONFIG_DEBUG_MODE: backed by std::optional; taking/reading an empty
//   slot or setting a full one is logged and thrown. Destroying a full slot
//   warns: the payload is destroyed, but release builds would leak it.
// - otherwise: raw storage with no discriminant. Misuse is undefined and a
//   full slot is never destroyed: 'take' the payload out first.
//

namespace xjb {

#if XJB_CONFIG_DEBUG_MODE

    template <typename T>
    class UncheckedOption {
    private:
        std::optional<T> m_inner;

    public:
        UncheckedOption()
        :   m_inner()
        {}
        explicit UncheckedOption(T value)
        :   m_inner(std::move(value))
        {}
        ~UncheckedOption() {
            if (m_inner.has_value()) {
                warning("UncheckedOption destroyed while still holding a value: potential resource leak in release builds");
            }
        }

        UncheckedOption(UncheckedOption const&) = delete;
        UncheckedOption& operator=(UncheckedOption const&) = delete;

    public:
        T take() {
            if (!m_inner.has_value()) {
                raise(Error{ErrorKind::Unsupported, "UncheckedOption::take: slot is empty"});
            }
            T res{std::move(*m_inner)};
            m_inner.reset();
            return res;
        }
        T const& get_ref() const {
            if (!m_inner.has_value()) {
                raise(Error{ErrorKind::Unsupported, "UncheckedOption::get_ref: slot is empty"});
            }
            return *m_inner;
        }
        T& get_mut() {
            if (!m_inner.has_value()) {
                raise(Error{ErrorKind::Unsupported, "UncheckedOption::get_mut: slot is empty"});
            }
            return *m_inner;
        }
        void set(T value) {
            if (m_inner.has_value()) {
                raise(Error{ErrorKind::Unsupported, "UncheckedOption::set: slot is already full"});
            }
            m_inner.emplace(std::move(value));
        }
    };

#else

    template <typename T>
    class UncheckedOption {
    private:
        alignas(T) unsigned char m_storage[sizeof(T)];

    public:
        UncheckedOption() {}
        explicit UncheckedOption(T value) {
            new(m_storage) T(std::move(value));
        }

        UncheckedOption(UncheckedOption const&) = delete;
        UncheckedOption& operator=(UncheckedOption const&) = delete;

    public:
        T take() {
            T* slot = std::launder(reinterpret_cast<T*>(m_storage));
            T res{std::move(*slot)};
            slot->~T();
            return res;
        }
        T const& get_ref() const {
            return *std::launder(reinterpret_cast<T const*>(m_storage));
        }
        T& get_mut() {
            return *std::launder(reinterpret_cast<T*>(m_storage));
        }
        void set(T value) {
            new(m_storage) T(std::move(value));
        }
    };

#endif

}   // namespace xjb
