#include "xjb-core/value.hh"

#include <cmath>

namespace xjb {

    static void print_str(std::string_view s, std::ostream& out) {
        out << '"';
        for (char const cc: s) {
            switch (cc) {
                case '\n': out << "\\n"; break;
                case '\r': out << "\\r"; break;
                case '\t': out << "\\t"; break;
                case '\0': out << "\\0"; break;
                case '"': out << "\\\""; break;
                case '\\': out << "\\\\"; break;
                default: {
                    out << cc;
                } break;
            }
        }
        out << '"';
    }

    void print_value(Value const& value, std::ostream& out) {
        switch (value.tag()) {
            case ValueTag::Void: {
                out << "void";
            } break;
            case ValueTag::Bool: {
                out << (value.as_bool().value() ? "true" : "false");
            } break;
            case ValueTag::Int: {
                out << value.as_int().value();
            } break;
            case ValueTag::Float: {
                double f = value.as_float().value();
                out << f;
                // keep floats distinguishable from ints
                if (std::isfinite(f) && std::trunc(f) == f && std::abs(f) < 1e16) {
                    out << ".0";
                }
            } break;
            case ValueTag::InlineString:
            case ValueTag::HeapString: {
                print_str(value.as_str().value(), out);
            } break;
            case ValueTag::Array: {
                ValueArray const* array = value.as_array().value();
                out << '[';
                for (size_t i = 0; i < array->size(); i++) {
                    if (i > 0) {
                        out << ", ";
                    }
                    print_value((*array)[i], out);
                }
                out << ']';
            } break;
            case ValueTag::Object: {
                ValueObject const* object = value.as_object().value();
                out << '{';
                bool first = true;
                for (auto const& field: *object) {
                    if (!first) {
                        out << ", ";
                    }
                    first = false;
                    print_str(field.first, out);
                    out << ": ";
                    print_value(field.second, out);
                }
                out << '}';
            } break;
            case ValueTag::Foreign: {
                WidePtr ptr = value.payload();
                out << "#<foreign " << type_name(*ptr.desc()) << " @" << ptr.data() << '>';
            } break;
        }
    }

    std::ostream& operator<<(std::ostream& out, Value const& value) {
        print_value(value, out);
        return out;
    }

}   // namespace xjb
