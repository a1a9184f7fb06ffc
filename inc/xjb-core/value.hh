#pragma once

#include <ostream>
#include <string>
#include <string_view>
#include <vector>
#include <sstream>
#include <cstdint>

#include "config/config.hh"
#include "xjb-core/common.hh"
#include "xjb-core/allocator.hh"
#include "xjb-core/error.hh"
#include "xjb-core/korobka.hh"
#include "xjb-core/type-desc.hh"
#include "xjb-core/value-tag.hh"
#include "xjb-core/wide-ptr.hh"

///
// Value: compact tagged union, the runtime value representation.
// - Void/Bool/Int/Float and short strings are stored inline.
// - HeapString/Array/Object/Foreign hold a WidePtr to a payload in an Arena or
//   on the heap, plus an ownership flag:
//      - owning: dropping (or overwriting) the Value destroys the payload through
//        its descriptor and returns the memory to the allocator it came from.
//      - borrowing: the Value only references the payload; nothing is run on
//        drop. The payload's owner must outlive the Value.
// - Accessors return Result<...>. In strict mode a tag mismatch is reported as
//   TypeMismatch(expected, actual). With XJB_CONFIG_DISABLE_RUNTIME_TYPE_CHECKS
//   the check is compiled out and a mismatch is undefined behavior.
//

namespace xjb {

    class Value;

    using ValueArray = std::vector<Value>;
    using ValueObject = StableHashMap<std::string, Value>;

    class Value {
    public:
        static constexpr size_t INLINE_STRING_CAPACITY = 24;

    private:
        // raw fields rather than WidePtr: keeps 'Data' trivially copyable
        struct HeapPayload {
            void* data;
            TypeDesc const* desc;
            Allocator* allocator;       // null iff borrowing
        };
        union Data {
            bool b;
            int64_t i;
            double f;
            char s[INLINE_STRING_CAPACITY];
            HeapPayload heap;
        };

    private:
        ValueTag m_tag;
        bool m_owning;
        uint8_t m_inline_len;
        Data m_data;

    public:
        Value();
        ~Value();

        Value(Value&& other) noexcept;
        Value& operator=(Value&& other) noexcept;

        // copying may fail or allocate: use 'clone'
        Value(Value const&) = delete;
        Value& operator=(Value const&) = delete;

    public:
        static Value make_void();
        static Value from_bool(bool b);
        static Value from_int(int64_t i);
        static Value from_float(double f);
        // InlineString when 's' fits, else an owned HeapString from 'allocator'.
        static Value from_string(std::string_view s, Allocator& allocator = heap_allocator());
        static Value from_array(ValueArray elements, Allocator& allocator = heap_allocator());
        static Value from_object(ValueObject fields, Allocator& allocator = heap_allocator());

        // Foreign, owning the boxed payload.
        static Value from_foreign(Korobka payload);
        // Foreign, borrowing a payload owned elsewhere.
        static Value from_foreign(WidePtr payload);
        template <typename T, typename... TArgs>
        static Value make_foreign(Allocator& allocator, TArgs&&... args) {
            return from_foreign(Korobka::new_in<T>(allocator, std::forward<TArgs>(args)...));
        }

        // Tag picked from the descriptor: std::string => HeapString,
        // ValueArray => Array, ValueObject => Object, anything else => Foreign.
        static Value own(Korobka payload);
        static Value borrow(WidePtr payload);

    public:
        ValueTag tag() const { return m_tag; }
        bool is_void() const { return m_tag == ValueTag::Void; }
        bool is_bool() const { return m_tag == ValueTag::Bool; }
        bool is_int() const { return m_tag == ValueTag::Int; }
        bool is_float() const { return m_tag == ValueTag::Float; }
        bool is_string() const { return m_tag == ValueTag::InlineString || m_tag == ValueTag::HeapString; }
        bool is_array() const { return m_tag == ValueTag::Array; }
        bool is_object() const { return m_tag == ValueTag::Object; }
        bool is_foreign() const { return m_tag == ValueTag::Foreign; }
        bool is_number() const { return is_int() || is_float(); }

        // true only for heap-backed variants that own their payload
        bool is_owning() const { return m_owning; }
        // null WidePtr for inline variants
        WidePtr payload() const;
        Allocator* payload_allocator() const;

    public:
        Result<bool> as_bool() const;
        Result<int64_t> as_int() const;
        Result<double> as_float() const;
        // both InlineString and HeapString
        Result<std::string_view> as_str() const;
        Result<ValueArray*> as_array();
        Result<ValueArray const*> as_array() const;
        Result<ValueObject*> as_object();
        Result<ValueObject const*> as_object() const;

        template <typename T>
        Result<T*> as_foreign() const;

    public:
        // Int or Float => double
        Result<double> to_float() const;
        // Int, or a Float holding an integral value in range
        Result<int64_t> to_int() const;
        // Void and 'false' are falsy
        bool is_truthy() const;
        // strings: bytes, arrays: elements, objects: fields
        Result<size_t> length() const;

        Result<Value> clone() const;

    private:
        explicit Value(ValueTag tag);
        static Value from_heap(ValueTag tag, WidePtr ptr, Allocator* allocator);
        static ValueTag tag_for_desc(TypeDesc const* desc);

        void drop();
        void take(Value& other);
        Error mismatch(ValueTag expected, char const* context) const;
    };
    static_assert(sizeof(Value) == 32, "Value expected to be 4 words");

    template <typename T>
    Result<T*> Value::as_foreign() const {
#if !XJB_CONFIG_DISABLE_RUNTIME_TYPE_CHECKS
        if (m_tag != ValueTag::Foreign) {
            return mismatch(ValueTag::Foreign, "as_foreign");
        }
        if (m_data.heap.desc != &type_desc<T>()) {
            std::stringstream ss;
            ss << "TypeMismatch: as_foreign: expected payload type '" << type_name(type_desc<T>())
               << "', got '" << type_name(*m_data.heap.desc) << "'";
            return Error{ErrorKind::TypeMismatch, ValueTag::Foreign, ValueTag::Foreign, ss.str()};
        }
#endif
        return static_cast<T*>(m_data.heap.data);
    }

    // deep: strings by bytes (inline == heap), containers element-wise,
    // Foreign through the descriptor's 'equals' (identity when absent).
    bool operator==(Value const& lt, Value const& rt);
    inline bool operator!=(Value const& lt, Value const& rt) {
        return !(lt == rt);
    }

    void print_value(Value const& value, std::ostream& out);
    std::ostream& operator<<(std::ostream& out, Value const& value);

    // element-wise clones: fail if any nested element is not cloneable
    template <>
    struct TypeDescTraits<ValueArray> {
        static TypeDesc::CloneFn clone();
        static TypeDesc::EqualsFn equals();
    };
    template <>
    struct TypeDescTraits<ValueObject> {
        static TypeDesc::CloneFn clone();
        static TypeDesc::EqualsFn equals();
    };

}   // namespace xjb
