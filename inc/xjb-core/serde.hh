#pragma once

#include <functional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "xjb-core/allocator.hh"
#include "xjb-core/error.hh"
#include "xjb-core/korobka.hh"
#include "xjb-core/type-desc.hh"
#include "xjb-core/value.hh"

///
// Serialization: Values <-> a self-describing structured form (JSON).
//  Void -> null, Bool -> boolean, Int/Float -> number, strings -> string,
//  Array -> array, Object -> object.
// Foreign payloads need a hook registered for their descriptor; they are written as
//  {"$foreign": "<registered type name>", "value": <hook output>}
// and read back as Foreign only if the hook can also rebuild them. Otherwise such
// an object deserializes as a plain Object.
// User Objects with a '$foreign' key (or '$object' as their only key) are written
// as {"$object": {...}} so they read back as Objects.
// Non-finite floats and non-UTF-8 strings are Unsupported rather than rewritten.
//

namespace xjb {

    using json = nlohmann::json;

    struct SerdeHook {
        std::function<Result<json>(void const* payload)> to_json;
        // may be empty: the type is then write-only
        std::function<Result<Korobka>(json const& value, Allocator& allocator)> from_json;
    };

    // 'desc' must already be named (see 'register_type'): the name is what is
    // written to '$foreign'. Returns false if it is not.
    bool register_serde_hook(TypeDesc const& desc, SerdeHook hook);
    SerdeHook const* lookup_serde_hook(TypeDesc const& desc);

    template <typename T>
    bool register_serde_hook(
        std::function<json(T const&)> to,
        std::function<Result<T>(json const&)> from
    ) {
        SerdeHook hook;
        hook.to_json = [to](void const* payload) -> Result<json> {
            return to(*static_cast<T const*>(payload));
        };
        if (from) {
            hook.from_json = [from](json const& value, Allocator& allocator) -> Result<Korobka> {
                Result<T> rebuilt = from(value);
                if (!rebuilt.ok()) {
                    return rebuilt.error();
                }
                return Korobka::new_in<T>(allocator, std::move(rebuilt).value());
            };
        }
        return register_serde_hook(type_desc<T>(), std::move(hook));
    }

    Result<json> to_json(Value const& value);
    Result<Value> from_json(json const& value, Allocator& allocator = heap_allocator());

    // text forms; 'indent' < 0 => compact
    Result<std::string> serialize(Value const& value, int indent = -1);
    Result<Value> deserialize(std::string_view text, Allocator& allocator = heap_allocator());

}   // namespace xjb
