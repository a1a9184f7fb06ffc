#include "xjb-core/cli.hh"

#include <sstream>

#include "xjb-core/error.hh"
#include "xjb-core/feedback.hh"

namespace xjb {

    [[noreturn]] static void throw_bad_rule_error(std::string const& flag_name, std::string const& more) {
        std::stringstream ss;
        ss << "(Implementation error) cannot add invalid command-line rule: " << flag_name << ": " << more;
        raise(Error{ErrorKind::Unsupported, ss.str()});
    }
    [[noreturn]] static void throw_syntax_error(std::string const& more) {
        std::stringstream ss;
        ss << "Syntax error in command-line args: " << more;
        raise(Error{ErrorKind::MalformedInput, ss.str()});
    }
    [[noreturn]] static void throw_bad_opt_arg_error(std::string const& arg_name, std::string const& more) {
        std::stringstream ss;
        ss << "Bad optional command-line argument: -" << arg_name << ": " << more;
        raise(Error{ErrorKind::MalformedInput, ss.str()});
    }

    CliArgsParser::CliArgsParser()
    :   m_rules()
    {}

    void CliArgsParser::reserve_args(size_t count) {
        m_rules.reserve(count);
    }

    void CliArgsParser::add_ar0_option_rule(std::string option_name, std::string help, bool allow_multiple) {
        add_generic_option_rule(std::move(option_name), std::move(help), 0, allow_multiple);
    }
    void CliArgsParser::add_ar1_option_rule(std::string option_name, std::string help, bool allow_multiple) {
        add_generic_option_rule(std::move(option_name), std::move(help), 1, allow_multiple);
    }
    void CliArgsParser::add_arN_option_rule(std::string option_name, std::string help) {
        add_generic_option_rule(std::move(option_name), std::move(help), 2, true);
    }

    void CliArgsParser::add_generic_option_rule(std::string name, std::string help, int arity, bool allow_multiple) {
        // NOTE: arity arg is either '0', '1', or ANY OTHER VALUE (for 'N')
        if (name.empty()) {
            throw_bad_rule_error(name, "flag names cannot be empty");
        }
        if (name[0] == '-') {
            throw_bad_rule_error(name, "no flag name can begin with '-': its prefix would be '--' and this is a reserved token.");
        }
        for (auto const& existing_rule: m_rules) {
            if (existing_rule.name == name) {
                throw_bad_rule_error(name, "rule re-defined");
            }
        }

        size_t flags = (
            (arity == 0     ? static_cast<size_t>(RuleFlag::Arity0)    : 0) |
            (arity == 1     ? static_cast<size_t>(RuleFlag::Arity1)    : 0) |
            (allow_multiple ? static_cast<size_t>(RuleFlag::CanRepeat) : 0)
        );
        m_rules.push_back({std::move(name), std::move(help), flags});
    }

    CliArgs CliArgsParser::parse(int argc, char const* argv[]) const {
        CliArgs out_args;
        bool parsed_double_dash_separator = false;
        for (int i = 1; i < argc; i++) {
            char const* s = argv[i];
            if (!parsed_double_dash_separator && s[0] == '-' && s[1] == '-') {
                if (s[2] != '\0') {
                    throw_syntax_error("cannot include any characters after '--' (use '-flag' for all flags, a space separator for posarg)");
                }
                parsed_double_dash_separator = true;
            }
            else if (!parsed_double_dash_separator && s[0] == '-' && s[1] != '\0') {
                eat_arg(std::string{s + 1}, out_args, i, argc, argv);
            }
            else {
                // positional; a lone '-' is positional too (conventionally stdin)
                out_args.pos.emplace_back(s);
            }
        }
        return out_args;
    }

    void CliArgsParser::eat_arg(std::string flag_content, CliArgs& out, int& index, int argc, char const* argv[]) const {
        ArgRule const* rule = nullptr;
        for (auto const& candidate: m_rules) {
            if (candidate.name == flag_content) {
                rule = &candidate;
                break;
            }
        }
        if (rule == nullptr) {
            throw_bad_opt_arg_error(flag_content, "no matching optional rule is defined");
        }

        std::string const& key = rule->name;
        bool arity0 = rule->rule_flags & static_cast<size_t>(RuleFlag::Arity0);
        bool arity1 = rule->rule_flags & static_cast<size_t>(RuleFlag::Arity1);
        bool can_repeat = rule->rule_flags & static_cast<size_t>(RuleFlag::CanRepeat);

        if (arity0) {
            auto it = out.ar0.find(key);
            if (it == out.ar0.end()) {
                out.ar0[key] = 1;
            } else if (can_repeat) {
                ++it->second;
            } else {
                throw_bad_opt_arg_error(key, "cannot repeat this flag");
            }
            return;
        }

        // ar1 and arN: value is the next word
        if (index + 1 >= argc) {
            throw_bad_opt_arg_error(key, "expected a value after this flag");
        }
        std::string val = argv[++index];
        if (arity1) {
            if (!out.ar1.contains(key) || can_repeat) {
                out.ar1[key] = std::move(val);
            } else {
                throw_bad_opt_arg_error(key, "multiple values provided for the same unique optional argument");
            }
        } else {
            out.arN[key].push_back(std::move(val));
        }
    }

    std::string CliArgsParser::usage(std::string_view program_name, std::string_view positional_help) const {
        std::stringstream ss;
        ss << "usage: " << program_name;
        for (auto const& rule: m_rules) {
            bool arity0 = rule.rule_flags & static_cast<size_t>(RuleFlag::Arity0);
            ss << " [-" << rule.name << (arity0 ? "" : " <arg>") << "]";
        }
        ss << " [--] " << positional_help;
        for (auto const& rule: m_rules) {
            if (!rule.help.empty()) {
                ss << std::endl << "  -" << rule.name << ": " << rule.help;
            }
        }
        return ss.str();
    }

}   // namespace xjb
