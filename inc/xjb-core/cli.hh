// Command-line parsing for the xjb tools.
// Supports positional args, arity-0 flags, arity-1 flags and arity-N flags.
// All flags start with a single '-'; arity-1 and arity-N flags take their value
// from the next word.
// E.g.
// xjbv
//  -debug                      # an arity-0 arg, name='debug'
//  -block-kib 256              # an arity-1 arg, name='block-kib'
//  -- ./doc.json               # '--' ends flags: every later word is positional
// NOTE:
// - flag names cannot begin with '-': '--' is reserved as the separator
// - flags cannot be bundled ('-ab') or abbreviated
// - errors are logged, then thrown as 'xjb::Error' (kind 'MalformedInput')

#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "xjb-core/common.hh"

namespace xjb {

    using CliArity0Args = UnstableHashMap<std::string, size_t>;
    using CliArity1Args = UnstableHashMap<std::string, std::string>;
    using CliArityNArgs = UnstableHashMap<std::string, std::vector<std::string>>;

    struct CliArgs {
        std::vector<std::string> pos;
        CliArity0Args ar0;
        CliArity1Args ar1;
        CliArityNArgs arN;
    };

    class CliArgsParser {
    private:
        enum class RuleFlag {
            Arity0 = 0x1,
            Arity1 = 0x2,
            CanRepeat = 0x4
        };
        struct ArgRule {
            std::string name;
            std::string help;
            size_t rule_flags;
        };

    private:
        std::vector<ArgRule> m_rules;

    public:
        CliArgsParser();

    public:
        void reserve_args(size_t count);
        void add_ar0_option_rule(std::string option_name, std::string help = "", bool allow_multiple = false);
        void add_ar1_option_rule(std::string option_name, std::string help = "", bool allow_multiple = false);
        void add_arN_option_rule(std::string option_name, std::string help = "");

        // may be called more than once: every call starts from a clean state
        CliArgs parse(int argc, char const* argv[]) const;

        // one line per rule, in the order they were added
        std::string usage(std::string_view program_name, std::string_view positional_help) const;

    private:
        void add_generic_option_rule(std::string name, std::string help, int arity, bool allow_multiple);
        void eat_arg(std::string flag_content, CliArgs& out, int& index, int argc, char const* argv[]) const;
    };

}   // namespace xjb
