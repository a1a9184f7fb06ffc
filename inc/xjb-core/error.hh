#pragma once

#include <cstddef>
#include <exception>
#include <string>
#include <utility>
#include <variant>

#include "xjb-core/value-tag.hh"

namespace xjb {

    enum class ErrorKind {
        TypeMismatch,
        NotCloneable,
        Unsupported,
        AllocationFailure,
        MalformedInput
    };
    char const* error_kind_name(ErrorKind kind);

    ///
    // Error: every non-fatal failure of this library.
    // 'expected' and 'actual' are only meaningful for 'TypeMismatch'.
    //

    class Error: public std::exception {
    private:
        ErrorKind m_kind;
        ValueTag m_expected;
        ValueTag m_actual;
        std::string m_message;

    public:
        Error(ErrorKind kind, std::string message);
        Error(ErrorKind kind, ValueTag expected, ValueTag actual, std::string message);

    public:
        static Error type_mismatch(ValueTag expected, ValueTag actual, std::string context);
        static Error not_cloneable(std::string context);
        static Error unsupported(std::string context);

    public:
        ErrorKind kind() const { return m_kind; }
        ValueTag expected() const { return m_expected; }
        ValueTag actual() const { return m_actual; }
        std::string const& message() const { return m_message; }
        char const* what() const noexcept override { return m_message.c_str(); }
    };

    // logs 'err' through 'xjb::error', then throws it.
    [[noreturn]] void raise(Error const& err);

    // host memory exhausted: not recoverable at this layer.
    [[noreturn]] void fatal_out_of_memory(size_t requested_byte_count);

    ///
    // Result<T>: either a T or an Error.
    //

    template <typename T>
    class Result {
    private:
        std::variant<T, Error> m_data;

    public:
        Result(T value)
        :   m_data(std::in_place_index<0>, std::move(value))
        {}
        Result(Error err)
        :   m_data(std::in_place_index<1>, std::move(err))
        {}

    public:
        bool ok() const { return m_data.index() == 0; }
        explicit operator bool() const { return ok(); }

        T& value() & {
            if (!ok()) { raise(std::get<1>(m_data)); }
            return std::get<0>(m_data);
        }
        T const& value() const& {
            if (!ok()) { raise(std::get<1>(m_data)); }
            return std::get<0>(m_data);
        }
        T&& value() && {
            if (!ok()) { raise(std::get<1>(m_data)); }
            return std::get<0>(std::move(m_data));
        }
        T value_or(T fallback) && {
            return ok() ? std::get<0>(std::move(m_data)) : std::move(fallback);
        }

        // precondition: '!ok()'
        Error const& error() const {
            return std::get<1>(m_data);
        }
    };

}   // namespace xjb
