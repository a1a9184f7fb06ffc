#pragma once

#include <utility>
#include <sstream>
#include <new>

#include "xjb-core/allocator.hh"
#include "xjb-core/error.hh"
#include "xjb-core/type-desc.hh"
#include "xjb-core/wide-ptr.hh"

///
// Korobka: single-owner box for a type-erased payload.
// - the payload lives in memory from 'allocator' (an Arena or the heap).
// - dropping a non-empty Korobka runs the descriptor's destructor exactly once,
//   then returns the memory to the allocator (a no-op for arenas).
// - move-only: a moved-from Korobka is empty and dropping it does nothing.
//

namespace xjb {

    class Korobka {
    private:
        WidePtr m_ptr;
        Allocator* m_allocator;

    public:
        Korobka()
        :   m_ptr(),
            m_allocator(nullptr)
        {}
        ~Korobka() {
            drop();
        }

        Korobka(Korobka const&) = delete;
        Korobka& operator=(Korobka const&) = delete;

        Korobka(Korobka&& other) noexcept
        :   m_ptr(std::exchange(other.m_ptr, WidePtr{})),
            m_allocator(std::exchange(other.m_allocator, nullptr))
        {}
        Korobka& operator=(Korobka&& other) noexcept {
            if (this != &other) {
                drop();
                m_ptr = std::exchange(other.m_ptr, WidePtr{});
                m_allocator = std::exchange(other.m_allocator, nullptr);
            }
            return *this;
        }

    public:
        template <typename T, typename... TArgs>
        static Korobka new_in(Allocator& allocator, TArgs&&... args) {
            void* mem = allocator.allocate(sizeof(T), alignof(T));
            T* payload = new(mem) T(std::forward<TArgs>(args)...);
            return Korobka{WidePtr::make(payload), &allocator};
        }
        template <typename T, typename... TArgs>
        static Korobka make(TArgs&&... args) {
            return new_in<T>(heap_allocator(), std::forward<TArgs>(args)...);
        }

        // takes ownership of a payload previously allocated from 'allocator'
        // (e.g. one obtained from 'release').
        static Korobka adopt(WidePtr ptr, Allocator& allocator) {
            return Korobka{ptr, &allocator};
        }

        // copies the payload behind 'ptr' into fresh memory from 'allocator'.
        static Result<Korobka> clone_of(WidePtr ptr, Allocator& allocator);

    public:
        bool is_empty() const { return m_ptr.is_null(); }
        WidePtr ptr() const { return m_ptr; }
        TypeDesc const* desc() const { return m_ptr.desc(); }
        Allocator* allocator() const { return m_allocator; }

        // same contract as 'WidePtr::downcast': null on mismatch in strict mode.
        template <typename T>
        T const* as_ref() const {
            return m_ptr.downcast<T>();
        }
        template <typename T>
        T* as_mut() {
            return m_ptr.downcast<T>();
        }

        // Moves the payload out and empties the box. On a type mismatch the box
        // is left untouched.
        template <typename T>
        Result<T> into_inner();

        Result<Korobka> clone() const {
            if (is_empty()) {
                return Korobka{};
            }
            return clone_of(m_ptr, *m_allocator);
        }

        // gives up ownership without destroying the payload.
        WidePtr release() {
            m_allocator = nullptr;
            return std::exchange(m_ptr, WidePtr{});
        }

        // destroys the payload now.
        void reset() {
            drop();
        }

    private:
        Korobka(WidePtr ptr, Allocator* allocator)
        :   m_ptr(ptr),
            m_allocator(allocator)
        {}

        void drop() {
            if (!m_ptr.is_null()) {
                TypeDesc const* desc = m_ptr.desc();
                void* data = m_ptr.data();
                desc->destroy(data);
                m_allocator->deallocate(data, desc->size, desc->align);
            }
            m_ptr = WidePtr{};
            m_allocator = nullptr;
        }
    };

    template <typename T>
    Result<T> Korobka::into_inner() {
        if (!m_ptr.is<T>()) {
            std::stringstream ss;
            ss << "TypeMismatch: Korobka::into_inner: expected payload type '" << type_name(type_desc<T>())
               << "', got '" << (is_empty() ? std::string{"<empty>"} : type_name(*m_ptr.desc())) << "'";
            return Error{
                ErrorKind::TypeMismatch,
                ValueTag::Foreign,
                (is_empty() ? ValueTag::Void : ValueTag::Foreign),
                ss.str()
            };
        }
        T* payload = static_cast<T*>(m_ptr.data());
        T res{std::move(*payload)};
        drop();
        return res;
    }

    inline Result<Korobka> Korobka::clone_of(WidePtr ptr, Allocator& allocator) {
        if (ptr.is_null()) {
            return Korobka{};
        }
        TypeDesc const* desc = ptr.desc();
        if (desc->clone == nullptr) {
            return Error::not_cloneable("payload type '" + type_name(*desc) + "' has no clone function");
        }
        void* mem = allocator.allocate(desc->size, desc->align);
        if (!desc->clone(ptr.data(), mem)) {
            allocator.deallocate(mem, desc->size, desc->align);
            return Error::not_cloneable("payload type '" + type_name(*desc) + "' holds an element that cannot be cloned");
        }
        return Korobka{WidePtr{mem, desc}, &allocator};
    }

    // payload equality through the descriptor; identity when it has no 'equals'.
    inline bool operator==(Korobka const& lt, Korobka const& rt) {
        if (lt.is_empty() || rt.is_empty()) {
            return lt.is_empty() && rt.is_empty();
        }
        if (lt.desc() != rt.desc()) {
            return false;
        }
        if (lt.desc()->equals == nullptr) {
            return lt.ptr() == rt.ptr();
        }
        return lt.desc()->equals(lt.ptr().data(), rt.ptr().data());
    }

}   // namespace xjb
