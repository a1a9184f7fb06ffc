#include "xjb-core/error.hh"

#include <sstream>
#include <cstdlib>

#include "xjb-core/feedback.hh"

namespace xjb {

    char const* error_kind_name(ErrorKind kind) {
        switch (kind) {
            case ErrorKind::TypeMismatch: return "TypeMismatch";
            case ErrorKind::NotCloneable: return "NotCloneable";
            case ErrorKind::Unsupported: return "Unsupported";
            case ErrorKind::AllocationFailure: return "AllocationFailure";
            case ErrorKind::MalformedInput: return "MalformedInput";
        }
        return "<bad-error-kind>";
    }

    Error::Error(ErrorKind kind, std::string message)
    :   Error(kind, ValueTag::Void, ValueTag::Void, std::move(message))
    {}

    Error::Error(ErrorKind kind, ValueTag expected, ValueTag actual, std::string message)
    :   m_kind(kind),
        m_expected(expected),
        m_actual(actual),
        m_message(std::move(message))
    {}

    Error Error::type_mismatch(ValueTag expected, ValueTag actual, std::string context) {
        std::stringstream ss;
        ss << "TypeMismatch: " << context << ": expected " << value_tag_name(expected)
           << ", got " << value_tag_name(actual);
        return Error{ErrorKind::TypeMismatch, expected, actual, ss.str()};
    }
    Error Error::not_cloneable(std::string context) {
        return Error{ErrorKind::NotCloneable, "NotCloneable: " + context};
    }
    Error Error::unsupported(std::string context) {
        return Error{ErrorKind::Unsupported, "Unsupported: " + context};
    }

    void raise(Error const& err) {
        xjb::error(err.message());
        throw err;
    }

    void fatal_out_of_memory(size_t requested_byte_count) {
        std::stringstream ss;
        ss << "Insufficient system memory: could not allocate " << requested_byte_count << "B" << std::endl
           << "AllocationFailure is not recoverable; terminating.";
        xjb::error(ss.str());
        std::abort();
    }

}   // namespace xjb
