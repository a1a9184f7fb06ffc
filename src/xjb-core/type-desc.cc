#include "xjb-core/type-desc.hh"

#include <sstream>

#include "xjb-core/common.hh"
#include "xjb-core/feedback.hh"

namespace xjb {

    struct TypeNameTable {
        UnstableHashMap<TypeDesc const*, std::string> name_of;
        UnstableHashMap<std::string, TypeDesc const*> desc_of;
    };

    // constructed on first use: registration may happen during static init.
    static TypeNameTable& type_name_table() {
        static TypeNameTable s_table;
        return s_table;
    }

    bool register_type_name(TypeDesc const& desc, std::string name) {
        TypeNameTable& table = type_name_table();

        auto existing_it = table.desc_of.find(name);
        if (existing_it != table.desc_of.end()) {
            if (existing_it->second == &desc) {
                return true;
            }
            std::stringstream ss;
            ss << "register_type_name: name '" << name << "' already registered for another type";
            warning(ss.str());
            return false;
        }

        // renaming: drop the old name so lookups stay one-to-one
        auto old_name_it = table.name_of.find(&desc);
        if (old_name_it != table.name_of.end()) {
            table.desc_of.erase(old_name_it->second);
        }
        table.name_of[&desc] = name;
        table.desc_of[std::move(name)] = &desc;
        return true;
    }

    TypeDesc const* lookup_type(std::string_view name) {
        TypeNameTable& table = type_name_table();
        auto it = table.desc_of.find(std::string{name});
        return it == table.desc_of.end() ? nullptr : it->second;
    }

    std::string const& type_name(TypeDesc const& desc) {
        static std::string const s_unnamed = "<unnamed>";
        TypeNameTable& table = type_name_table();
        auto it = table.name_of.find(&desc);
        return it == table.name_of.end() ? s_unnamed : it->second;
    }

}   // namespace xjb
