#include <iostream>
#include <sstream>
#include <fstream>
#include <chrono>
#include <cstdlib>

#include "xjb-core/allocator.hh"
#include "xjb-core/arena.hh"
#include "xjb-core/cli.hh"
#include "xjb-core/error.hh"
#include "xjb-core/feedback.hh"
#include "xjb-core/serde.hh"
#include "xjb-core/value.hh"

namespace xjb {

    struct XjbvArgs {
        std::string input_path;     // empty => stdin
        size_t arena_block_size_in_bytes;
        bool pretty;
        bool tags;
        bool debug;
        bool help;
    };

    static void add_cli_rules(CliArgsParser& parser) {
        parser.reserve_args(5);
        parser.add_ar0_option_rule("help", "print this message and exit");
        parser.add_ar0_option_rule("debug", "log arena statistics and timings");
        parser.add_ar1_option_rule("block-kib", "size of the first arena block, in KiB");
        parser.add_ar0_option_rule("pretty", "indent the re-serialized document");
        parser.add_ar0_option_rule("tags", "print the tag of every nested value");
    }

    XjbvArgs parse_cli_args(int argc, char const* argv[]) {
        CliArgsParser parser;
        add_cli_rules(parser);
        CliArgs raw = parser.parse(argc, argv);

        XjbvArgs res; {
            if (raw.pos.size() > 1) {
                std::stringstream ss;
                ss << "Expected at most 1 positional argument, denoting the input filepath: got " << raw.pos.size();
                raise(Error{ErrorKind::MalformedInput, ss.str()});
            }

            // pos args
            //

            // input_path: '-' or none => stdin
            res.input_path = (raw.pos.empty() || raw.pos[0] == "-") ? std::string{} : raw.pos[0];

            // ar1
            //

            // block_kib:
            auto block_kib_it = raw.ar1.find("block-kib");
            if (block_kib_it == raw.ar1.end()) {
                res.arena_block_size_in_bytes = XJB_CONFIG_ARENA_DEFAULT_BLOCK_SIZE;
            } else {
                char* end = nullptr;
                unsigned long long kib = std::strtoull(block_kib_it->second.c_str(), &end, 10);
                if (end == block_kib_it->second.c_str() || *end != '\0' || kib == 0) {
                    std::stringstream ss;
                    ss << "Bad optional command-line argument: -block-kib: expected a positive integer, got '"
                       << block_kib_it->second << "'";
                    raise(Error{ErrorKind::MalformedInput, ss.str()});
                }
                res.arena_block_size_in_bytes = KIBIBYTES(kib);
            }

            // ar0
            //

            res.help = raw.ar0.contains("help");
            res.debug = raw.ar0.contains("debug");
            res.pretty = raw.ar0.contains("pretty");
            res.tags = raw.ar0.contains("tags");
        }
        return res;
    }

    static bool read_input(std::string const& input_path, std::string& out_text) {
        std::stringstream buf;
        if (input_path.empty()) {
            buf << std::cin.rdbuf();
        } else {
            std::ifstream f;
            f.open(input_path);
            if (!f.is_open()) {
                std::stringstream error_ss;
                error_ss
                    << "Failed to load file \"" << input_path << "\" to inspect." << std::endl
                    << "Does it exist? Is it readable?";
                error(error_ss.str());
                return false;
            }
            buf << f.rdbuf();
        }
        out_text = buf.str();
        return true;
    }

    static void print_tag_tree(Value const& value, std::ostream& out, size_t depth) {
        for (size_t i = 0; i < depth; i++) {
            out << "  ";
        }
        out << value_tag_name(value.tag());
        if (value.is_owning()) {
            out << " (owned)";
        }
        out << std::endl;
        if (value.is_array()) {
            for (Value const& element: *value.as_array().value()) {
                print_tag_tree(element, out, depth + 1);
            }
        } else if (value.is_object()) {
            for (auto const& field: *value.as_object().value()) {
                for (size_t i = 0; i <= depth; i++) {
                    out << "  ";
                }
                out << field.first << ':' << std::endl;
                print_tag_tree(field.second, out, depth + 2);
            }
        }
    }

    int inspect(XjbvArgs const& args) {
        std::string text;
        if (!read_input(args.input_path, text)) {
            return 1;
        }

        Arena arena{args.arena_block_size_in_bytes};
        {
            auto start = std::chrono::steady_clock::now();
            Result<Value> parsed = deserialize(text, arena);
            auto end = std::chrono::steady_clock::now();
            if (!parsed.ok()) {
                error(parsed.error().message());
                return 1;
            }
            Value value = std::move(parsed).value();

            if (args.debug) {
                auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end - start);
                std::stringstream ss;
                ss << "deserialized " << text.size() << " bytes in " << duration.count() << "us" << std::endl
                   << "arena: " << arena.block_count() << " block(s), "
                   << arena.bytes_used() << " bytes used of " << arena.bytes_reserved() << " reserved";
                info(ss.str());
            }

            std::cout << value << std::endl;
            if (args.tags) {
                print_tag_tree(value, std::cout, 0);
            }

            Result<std::string> round_trip = serialize(value, args.pretty ? 2 : -1);
            if (!round_trip.ok()) {
                error(round_trip.error().message());
                return 1;
            }
            std::cout << round_trip.value() << std::endl;
        }
        return 0;
    }

}   // namespace xjb

int main(int argc, char const* argv[]) {
    xjb::XjbvArgs args;
    try {
        args = xjb::parse_cli_args(argc, argv);
    } catch (xjb::Error const&) {
        // already reported by 'xjb::raise'
        return 2;
    }
    if (args.help) {
        xjb::CliArgsParser parser;
        xjb::add_cli_rules(parser);
        std::cout << parser.usage("xjbv", "[file | -]") << std::endl;
        return 0;
    }
    return xjb::inspect(args);
}
