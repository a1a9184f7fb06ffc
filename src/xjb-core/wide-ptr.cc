#include "xjb-core/wide-ptr.hh"

#include <ostream>

namespace xjb {

    std::ostream& operator<<(std::ostream& out, WidePtr const& ptr) {
        out << "WidePtr(" << ptr.data() << ", ";
        if (ptr.desc() == nullptr) {
            out << "null";
        } else {
            out << type_name(*ptr.desc());
        }
        out << ")";
        return out;
    }

}   // namespace xjb
