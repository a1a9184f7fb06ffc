#include "xjb-core/value.hh"

#include <cmath>
#include <cstring>
#include <limits>
#include <cassert>

#include "xjb-core/feedback.hh"

namespace xjb {

    ///
    // Value: lifecycle
    //

    Value::Value()
    :   Value(ValueTag::Void)
    {}

    Value::Value(ValueTag tag)
    :   m_tag(tag),
        m_owning(false),
        m_inline_len(0),
        m_data()
    {}

    Value::~Value() {
        drop();
    }

    Value::Value(Value&& other) noexcept
    :   Value(ValueTag::Void)
    {
        take(other);
    }

    Value& Value::operator=(Value&& other) noexcept {
        if (this != &other) {
            // overwriting a slot runs the old payload's destructor first
            drop();
            take(other);
        }
        return *this;
    }

    void Value::drop() {
        if (m_owning) {
            assert(is_heap_tag(m_tag));
            // ownership goes back into a Korobka, whose drop destroys and releases.
            Korobka owner = Korobka::adopt(payload(), *m_data.heap.allocator);
            owner.reset();
        }
        m_tag = ValueTag::Void;
        m_owning = false;
        m_inline_len = 0;
    }

    void Value::take(Value& other) {
        m_tag = other.m_tag;
        m_owning = other.m_owning;
        m_inline_len = other.m_inline_len;
        m_data = other.m_data;

        other.m_tag = ValueTag::Void;
        other.m_owning = false;
        other.m_inline_len = 0;
    }

    ///
    // Value: factories
    //

    Value Value::make_void() {
        return Value{ValueTag::Void};
    }
    Value Value::from_bool(bool b) {
        Value res{ValueTag::Bool};
        res.m_data.b = b;
        return res;
    }
    Value Value::from_int(int64_t i) {
        Value res{ValueTag::Int};
        res.m_data.i = i;
        return res;
    }
    Value Value::from_float(double f) {
        Value res{ValueTag::Float};
        res.m_data.f = f;
        return res;
    }
    Value Value::from_string(std::string_view s, Allocator& allocator) {
        if (s.size() <= INLINE_STRING_CAPACITY) {
            Value res{ValueTag::InlineString};
            std::memcpy(res.m_data.s, s.data(), s.size());
            res.m_inline_len = static_cast<uint8_t>(s.size());
            return res;
        }
        return own(Korobka::new_in<std::string>(allocator, s));
    }
    Value Value::from_array(ValueArray elements, Allocator& allocator) {
        return own(Korobka::new_in<ValueArray>(allocator, std::move(elements)));
    }
    Value Value::from_object(ValueObject fields, Allocator& allocator) {
        return own(Korobka::new_in<ValueObject>(allocator, std::move(fields)));
    }
    Value Value::from_foreign(Korobka payload) {
        Allocator* allocator = payload.allocator();
        WidePtr ptr = payload.release();
        if (ptr.is_null()) {
            return Value{};
        }
        return from_heap(ValueTag::Foreign, ptr, allocator);
    }
    Value Value::from_foreign(WidePtr payload) {
        if (payload.is_null()) {
            return Value{};
        }
        return from_heap(ValueTag::Foreign, payload, nullptr);
    }
    Value Value::own(Korobka payload) {
        Allocator* allocator = payload.allocator();
        WidePtr ptr = payload.release();
        if (ptr.is_null()) {
            return Value{};
        }
        return from_heap(tag_for_desc(ptr.desc()), ptr, allocator);
    }
    Value Value::borrow(WidePtr payload) {
        if (payload.is_null()) {
            return Value{};
        }
        return from_heap(tag_for_desc(payload.desc()), payload, nullptr);
    }

    Value Value::from_heap(ValueTag tag, WidePtr ptr, Allocator* allocator) {
        assert(is_heap_tag(tag));
        Value res{tag};
        res.m_owning = (allocator != nullptr);
        res.m_data.heap = HeapPayload{ptr.data(), ptr.desc(), allocator};
        return res;
    }

    ValueTag Value::tag_for_desc(TypeDesc const* desc) {
        if (desc == &type_desc<std::string>()) { return ValueTag::HeapString; }
        if (desc == &type_desc<ValueArray>()) { return ValueTag::Array; }
        if (desc == &type_desc<ValueObject>()) { return ValueTag::Object; }
        return ValueTag::Foreign;
    }

    WidePtr Value::payload() const {
        if (!is_heap_tag(m_tag)) {
            return WidePtr{};
        }
        return WidePtr{m_data.heap.data, m_data.heap.desc};
    }
    Allocator* Value::payload_allocator() const {
        return is_heap_tag(m_tag) ? m_data.heap.allocator : nullptr;
    }

    ///
    // Value: accessors
    //

    Error Value::mismatch(ValueTag expected, char const* context) const {
        return Error::type_mismatch(expected, m_tag, context);
    }

    Result<bool> Value::as_bool() const {
#if !XJB_CONFIG_DISABLE_RUNTIME_TYPE_CHECKS
        if (m_tag != ValueTag::Bool) {
            return mismatch(ValueTag::Bool, "as_bool");
        }
#endif
        return m_data.b;
    }
    Result<int64_t> Value::as_int() const {
#if !XJB_CONFIG_DISABLE_RUNTIME_TYPE_CHECKS
        if (m_tag != ValueTag::Int) {
            return mismatch(ValueTag::Int, "as_int");
        }
#endif
        return m_data.i;
    }
    Result<double> Value::as_float() const {
#if !XJB_CONFIG_DISABLE_RUNTIME_TYPE_CHECKS
        if (m_tag != ValueTag::Float) {
            return mismatch(ValueTag::Float, "as_float");
        }
#endif
        return m_data.f;
    }
    Result<std::string_view> Value::as_str() const {
        if (m_tag == ValueTag::InlineString) {
            return std::string_view{m_data.s, m_inline_len};
        }
#if !XJB_CONFIG_DISABLE_RUNTIME_TYPE_CHECKS
        if (m_tag != ValueTag::HeapString) {
            return mismatch(ValueTag::HeapString, "as_str");
        }
#endif
        return std::string_view{*static_cast<std::string const*>(m_data.heap.data)};
    }
    Result<ValueArray*> Value::as_array() {
#if !XJB_CONFIG_DISABLE_RUNTIME_TYPE_CHECKS
        if (m_tag != ValueTag::Array) {
            return mismatch(ValueTag::Array, "as_array");
        }
#endif
        return static_cast<ValueArray*>(m_data.heap.data);
    }
    Result<ValueArray const*> Value::as_array() const {
#if !XJB_CONFIG_DISABLE_RUNTIME_TYPE_CHECKS
        if (m_tag != ValueTag::Array) {
            return mismatch(ValueTag::Array, "as_array");
        }
#endif
        return static_cast<ValueArray const*>(m_data.heap.data);
    }
    Result<ValueObject*> Value::as_object() {
#if !XJB_CONFIG_DISABLE_RUNTIME_TYPE_CHECKS
        if (m_tag != ValueTag::Object) {
            return mismatch(ValueTag::Object, "as_object");
        }
#endif
        return static_cast<ValueObject*>(m_data.heap.data);
    }
    Result<ValueObject const*> Value::as_object() const {
#if !XJB_CONFIG_DISABLE_RUNTIME_TYPE_CHECKS
        if (m_tag != ValueTag::Object) {
            return mismatch(ValueTag::Object, "as_object");
        }
#endif
        return static_cast<ValueObject const*>(m_data.heap.data);
    }

    ///
    // Value: coercions
    // Coercions always check: they dispatch on the tag anyway.
    //

    Result<double> Value::to_float() const {
        switch (m_tag) {
            case ValueTag::Int: return static_cast<double>(m_data.i);
            case ValueTag::Float: return m_data.f;
            default: return mismatch(ValueTag::Float, "to_float");
        }
    }
    Result<int64_t> Value::to_int() const {
        switch (m_tag) {
            case ValueTag::Int: {
                return m_data.i;
            }
            case ValueTag::Float: {
                double f = m_data.f;
                // 2^63 is exactly representable; anything at or above it is out of range
                bool in_range = (f >= -9223372036854775808.0 && f < 9223372036854775808.0);
                if (!std::isfinite(f) || !in_range || std::trunc(f) != f) {
                    std::stringstream ss;
                    ss << "TypeMismatch: to_int: float " << f << " has no exact Int representation";
                    return Error{ErrorKind::TypeMismatch, ValueTag::Int, ValueTag::Float, ss.str()};
                }
                return static_cast<int64_t>(f);
            }
            default: {
                return mismatch(ValueTag::Int, "to_int");
            }
        }
    }
    bool Value::is_truthy() const {
        switch (m_tag) {
            case ValueTag::Void: return false;
            case ValueTag::Bool: return m_data.b;
            default: return true;
        }
    }
    Result<size_t> Value::length() const {
        switch (m_tag) {
            case ValueTag::InlineString: return static_cast<size_t>(m_inline_len);
            case ValueTag::HeapString: return static_cast<std::string const*>(m_data.heap.data)->size();
            case ValueTag::Array: return static_cast<ValueArray const*>(m_data.heap.data)->size();
            case ValueTag::Object: return static_cast<ValueObject const*>(m_data.heap.data)->size();
            default: return mismatch(ValueTag::Array, "length");
        }
    }

    ///
    // Value: clone
    //

    Result<Value> Value::clone() const {
        if (!is_heap_tag(m_tag) || !m_owning) {
            // scalars and inline strings copy; a borrowing Value clones into
            // another borrow of the same payload.
            Value res{m_tag};
            res.m_inline_len = m_inline_len;
            res.m_data = m_data;
            return res;
        }
        Result<Korobka> copy = Korobka::clone_of(payload(), *m_data.heap.allocator);
        if (!copy.ok()) {
            return copy.error();
        }
        Allocator* allocator = copy.value().allocator();
        WidePtr ptr = copy.value().release();
        return from_heap(m_tag, ptr, allocator);
    }

    ///
    // equivalence
    //

    bool operator==(Value const& lt, Value const& rt) {
        if (lt.is_string() && rt.is_string()) {
            return lt.as_str().value() == rt.as_str().value();
        }
        if (lt.tag() != rt.tag()) {
            return false;
        }
        switch (lt.tag()) {
            case ValueTag::Void: {
                return true;
            }
            case ValueTag::Bool: {
                return lt.as_bool().value() == rt.as_bool().value();
            }
            case ValueTag::Int: {
                return lt.as_int().value() == rt.as_int().value();
            }
            case ValueTag::Float: {
                return lt.as_float().value() == rt.as_float().value();
            }
            case ValueTag::Array: {
                return *lt.as_array().value() == *rt.as_array().value();
            }
            case ValueTag::Object: {
                TypeDesc::EqualsFn eq = TypeDescTraits<ValueObject>::equals();
                return eq(lt.as_object().value(), rt.as_object().value());
            }
            case ValueTag::Foreign: {
                WidePtr lp = lt.payload();
                WidePtr rp = rt.payload();
                if (lp.desc() != rp.desc()) {
                    return false;
                }
                if (lp.desc()->equals == nullptr) {
                    return lp == rp;
                }
                return lp.desc()->equals(lp.data(), rp.data());
            }
            case ValueTag::InlineString:
            case ValueTag::HeapString: {
                // handled above
                return false;
            }
        }
        return false;
    }

    ///
    // descriptors of the container payloads
    //

    static bool clone_value_array(void const* src, void* dst) {
        auto const& src_array = *static_cast<ValueArray const*>(src);
        ValueArray copy;
        copy.reserve(src_array.size());
        for (Value const& element: src_array) {
            Result<Value> element_copy = element.clone();
            if (!element_copy.ok()) {
                return false;
            }
            copy.push_back(std::move(element_copy).value());
        }
        new(dst) ValueArray(std::move(copy));
        return true;
    }
    static bool equals_value_array(void const* lhs, void const* rhs) {
        return *static_cast<ValueArray const*>(lhs) == *static_cast<ValueArray const*>(rhs);
    }
    static bool clone_value_object(void const* src, void* dst) {
        auto const& src_object = *static_cast<ValueObject const*>(src);
        ValueObject copy;
        copy.reserve(src_object.size());
        for (auto const& field: src_object) {
            Result<Value> field_copy = field.second.clone();
            if (!field_copy.ok()) {
                return false;
            }
            copy.emplace(field.first, std::move(field_copy).value());
        }
        new(dst) ValueObject(std::move(copy));
        return true;
    }
    static bool equals_value_object(void const* lhs, void const* rhs) {
        auto const& lt = *static_cast<ValueObject const*>(lhs);
        auto const& rt = *static_cast<ValueObject const*>(rhs);
        if (lt.size() != rt.size()) {
            return false;
        }
        for (auto const& field: lt) {
            auto it = rt.find(field.first);
            if (it == rt.end() || !(it->second == field.second)) {
                return false;
            }
        }
        return true;
    }

    TypeDesc::CloneFn TypeDescTraits<ValueArray>::clone() { return clone_value_array; }
    TypeDesc::EqualsFn TypeDescTraits<ValueArray>::equals() { return equals_value_array; }
    TypeDesc::CloneFn TypeDescTraits<ValueObject>::clone() { return clone_value_object; }
    TypeDesc::EqualsFn TypeDescTraits<ValueObject>::equals() { return equals_value_object; }

}   // namespace xjb
