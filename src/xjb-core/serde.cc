#include "xjb-core/serde.hh"

#include <cmath>
#include <limits>
#include <sstream>

#include "xjb-core/common.hh"
#include "xjb-core/feedback.hh"

namespace xjb {

    static char const* const FOREIGN_TYPE_KEY = "$foreign";
    static char const* const FOREIGN_VALUE_KEY = "value";
    // wraps user objects that would otherwise read back as a '$foreign' wrapper
    // (or as another escaped object)
    static char const* const OBJECT_ESCAPE_KEY = "$object";

    static UnstableHashMap<TypeDesc const*, SerdeHook>& serde_hook_table() {
        static UnstableHashMap<TypeDesc const*, SerdeHook> s_table;
        return s_table;
    }

    bool register_serde_hook(TypeDesc const& desc, SerdeHook hook) {
        if (lookup_type(type_name(desc)) != &desc) {
            warning("register_serde_hook: type must be registered by name before it gets a serialization hook");
            return false;
        }
        serde_hook_table()[&desc] = std::move(hook);
        return true;
    }

    SerdeHook const* lookup_serde_hook(TypeDesc const& desc) {
        auto& table = serde_hook_table();
        auto it = table.find(&desc);
        return it == table.end() ? nullptr : &it->second;
    }

    ///
    // Value -> json
    //

    static Result<json> foreign_to_json(Value const& value) {
        WidePtr ptr = value.payload();
        SerdeHook const* hook = lookup_serde_hook(*ptr.desc());
        if (hook == nullptr || !hook->to_json) {
            return Error::unsupported(
                "Foreign payload of type '" + type_name(*ptr.desc()) + "' has no serialization hook"
            );
        }
        Result<json> inner = hook->to_json(ptr.data());
        if (!inner.ok()) {
            return inner.error();
        }
        json res = json::object();
        res[FOREIGN_TYPE_KEY] = type_name(*ptr.desc());
        res[FOREIGN_VALUE_KEY] = std::move(inner).value();
        return res;
    }

    Result<json> to_json(Value const& value) {
        switch (value.tag()) {
            case ValueTag::Void: {
                return json(nullptr);
            }
            case ValueTag::Bool: {
                return json(value.as_bool().value());
            }
            case ValueTag::Int: {
                return json(value.as_int().value());
            }
            case ValueTag::Float: {
                double f = value.as_float().value();
                if (!std::isfinite(f)) {
                    std::stringstream ss;
                    ss << "to_json: float " << f << " has no JSON representation";
                    return Error::unsupported(ss.str());
                }
                return json(f);
            }
            case ValueTag::InlineString:
            case ValueTag::HeapString: {
                return json(std::string{value.as_str().value()});
            }
            case ValueTag::Array: {
                json res = json::array();
                for (Value const& element: *value.as_array().value()) {
                    Result<json> element_json = to_json(element);
                    if (!element_json.ok()) {
                        return element_json.error();
                    }
                    res.push_back(std::move(element_json).value());
                }
                return res;
            }
            case ValueTag::Object: {
                json res = json::object();
                for (auto const& field: *value.as_object().value()) {
                    Result<json> field_json = to_json(field.second);
                    if (!field_json.ok()) {
                        return field_json.error();
                    }
                    res[field.first] = std::move(field_json).value();
                }
                if (res.contains(FOREIGN_TYPE_KEY) || (res.size() == 1 && res.contains(OBJECT_ESCAPE_KEY))) {
                    json escaped = json::object();
                    escaped[OBJECT_ESCAPE_KEY] = std::move(res);
                    return escaped;
                }
                return res;
            }
            case ValueTag::Foreign: {
                return foreign_to_json(value);
            }
        }
        return Error::unsupported("to_json: unknown value tag");
    }

    ///
    // json -> Value
    //

    // nullptr if 'value' is not a '$foreign' wrapper this process can rebuild
    static SerdeHook const* foreign_hook_for(json const& value) {
        if (value.size() != 2 || !value.contains(FOREIGN_TYPE_KEY) || !value.contains(FOREIGN_VALUE_KEY)) {
            return nullptr;
        }
        json const& type_name_json = value[FOREIGN_TYPE_KEY];
        if (!type_name_json.is_string()) {
            return nullptr;
        }
        TypeDesc const* desc = lookup_type(type_name_json.get_ref<std::string const&>());
        if (desc == nullptr) {
            return nullptr;
        }
        SerdeHook const* hook = lookup_serde_hook(*desc);
        if (hook == nullptr || !hook->from_json) {
            return nullptr;
        }
        return hook;
    }

    static bool is_escaped_object(json const& value) {
        return (
            value.size() == 1 &&
            value.contains(OBJECT_ESCAPE_KEY) &&
            value[OBJECT_ESCAPE_KEY].is_object()
        );
    }

    // fields only: no wrapper detection at this level
    static Result<Value> object_from_json(json const& value, Allocator& allocator) {
        ValueObject fields;
        fields.reserve(value.size());
        for (auto const& item: value.items()) {
            Result<Value> field_value = from_json(item.value(), allocator);
            if (!field_value.ok()) {
                return field_value.error();
            }
            fields.emplace(item.key(), std::move(field_value).value());
        }
        return Value::from_object(std::move(fields), allocator);
    }

    Result<Value> from_json(json const& value, Allocator& allocator) {
        switch (value.type()) {
            case json::value_t::null: {
                return Value::make_void();
            }
            case json::value_t::boolean: {
                return Value::from_bool(value.get<bool>());
            }
            case json::value_t::number_integer: {
                return Value::from_int(value.get<int64_t>());
            }
            case json::value_t::number_unsigned: {
                auto u = value.get<uint64_t>();
                if (u <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                    return Value::from_int(static_cast<int64_t>(u));
                }
                return Value::from_float(static_cast<double>(u));
            }
            case json::value_t::number_float: {
                return Value::from_float(value.get<double>());
            }
            case json::value_t::string: {
                return Value::from_string(value.get_ref<std::string const&>(), allocator);
            }
            case json::value_t::array: {
                ValueArray elements;
                elements.reserve(value.size());
                for (json const& element: value) {
                    Result<Value> element_value = from_json(element, allocator);
                    if (!element_value.ok()) {
                        return element_value.error();
                    }
                    elements.push_back(std::move(element_value).value());
                }
                return Value::from_array(std::move(elements), allocator);
            }
            case json::value_t::object: {
                if (is_escaped_object(value)) {
                    return object_from_json(value[OBJECT_ESCAPE_KEY], allocator);
                }
                if (SerdeHook const* hook = foreign_hook_for(value)) {
                    Result<Korobka> payload = hook->from_json(value[FOREIGN_VALUE_KEY], allocator);
                    if (!payload.ok()) {
                        return payload.error();
                    }
                    return Value::from_foreign(std::move(payload).value());
                }
                return object_from_json(value, allocator);
            }
            case json::value_t::binary: {
                return Error::unsupported("from_json: binary values have no Value counterpart");
            }
            case json::value_t::discarded: {
                return Error{ErrorKind::MalformedInput, "MalformedInput: from_json: discarded json value"};
            }
        }
        return Error{ErrorKind::MalformedInput, "MalformedInput: from_json: unknown json value type"};
    }

    ///
    // text
    //

    Result<std::string> serialize(Value const& value, int indent) {
        Result<json> structured = to_json(value);
        if (!structured.ok()) {
            return structured.error();
        }
        try {
            return structured.value().dump(indent, ' ', false, json::error_handler_t::strict);
        } catch (json::type_error const& err) {
            // thrown for strings that are not valid UTF-8
            return Error::unsupported(std::string{"serialize: "} + err.what());
        }
    }

    Result<Value> deserialize(std::string_view text, Allocator& allocator) {
        json structured = json::parse(text.begin(), text.end(), nullptr, false);
        if (structured.is_discarded()) {
            std::stringstream ss;
            ss << "MalformedInput: deserialize: not a valid JSON document (" << text.size() << " bytes)";
            return Error{ErrorKind::MalformedInput, ss.str()};
        }
        return from_json(structured, allocator);
    }

}   // namespace xjb
