#pragma once

#include <cstdint>

namespace xjb {

    enum class ValueTag: uint8_t {
        Void,
        Bool,
        Int,
        Float,
        InlineString,
        HeapString,
        Array,
        Object,
        Foreign
    };

    inline char const* value_tag_name(ValueTag tag) {
        switch (tag) {
            case ValueTag::Void: return "Void";
            case ValueTag::Bool: return "Bool";
            case ValueTag::Int: return "Int";
            case ValueTag::Float: return "Float";
            case ValueTag::InlineString: return "InlineString";
            case ValueTag::HeapString: return "HeapString";
            case ValueTag::Array: return "Array";
            case ValueTag::Object: return "Object";
            case ValueTag::Foreign: return "Foreign";
        }
        return "<bad-tag>";
    }

    // heap-backed tags hold a WidePtr payload
    inline bool is_heap_tag(ValueTag tag) {
        return (
            tag == ValueTag::HeapString ||
            tag == ValueTag::Array ||
            tag == ValueTag::Object ||
            tag == ValueTag::Foreign
        );
    }

}   // namespace xjb
