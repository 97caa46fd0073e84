#include <cxxopts.hpp>
#include <iostream>
#include <fstream>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "boml/boml.hpp"
#include "boml/Json.hpp"

using namespace boml;

namespace {

bool read_input(const cxxopts::ParseResult& result, std::string& text) {
    if (result.count("file")) {
        const auto path = result["file"].as<std::string>();
        std::ifstream ifs(path, std::ios::binary);
        if (!ifs) {
            std::cerr << "Error: Could not open " << path << "\n";
            return false;
        }
        std::ostringstream ss;
        ss << ifs.rdbuf();
        text = ss.str();
        return true;
    }
    text.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    return true;
}

} // anonymous namespace

int main(int argc, char** argv) {
    // Parsed documents borrow from this buffer.
    std::string text;

    try {
        cxxopts::Options options("boml", "Parse TOML and inspect the result");
        options.positional_help("COMMAND [ARGS]");

        options.add_options()
            ("f,file", "TOML file to read (default: stdin)", cxxopts::value<std::string>())
            ("indent", "JSON indentation for dump/get", cxxopts::value<int>()->default_value("2"))
            ("h,help", "Show help");

        // Command + arguments captured as positional strings
        options.add_options()
            ("command", "Subcommand", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"command"});

        auto result = options.parse(argc, argv);
        if (result.count("help") || !result.count("command")) {
            std::cout << options.help() << "\n";
            std::cout << "Commands: decode | dump | get KEY | check\n";
            return 0;
        }

        auto cmdv = result["command"].as<std::vector<std::string>>();
        if (cmdv.empty()) { std::cerr << "Error: missing command\n"; return 1; }
        const std::string cmd = cmdv[0];
        const int indent = result["indent"].as<int>();

        if (cmd != "decode" && cmd != "dump" && cmd != "get" && cmd != "check") {
            std::cerr << "Unknown command: " << cmd << "\n";
            return 1;
        }
        if (cmd == "get" && cmdv.size() < 2) {
            std::cerr << "Error: insufficient arguments for command 'get'\n";
            return 1;
        }

        if (!read_input(result, text)) return 1;

        Document doc = parse(std::string_view(text));

        // DECODE: toml-test decoder output
        if (cmd == "decode") {
            std::cout << to_json(doc, JsonStyle::Tagged).dump() << "\n";
            return 0;
        }

        // DUMP
        if (cmd == "dump") {
            std::cout << to_json(doc).dump(indent) << "\n";
            return 0;
        }

        // GET
        if (cmd == "get") {
            const std::string& key = cmdv[1];
            const Value* v = find_by_dot(doc, key);
            if (!v) {
                std::cerr << "Key not found: " << key << "\n";
                return 1;
            }
            std::cout << to_json(*v).dump(indent) << "\n";
            return 0;
        }

        // CHECK
        std::cout << "OK: " << doc.size() << " top-level keys\n";
        return 0;

    } catch (const ParseError& pe) {
        std::cerr << "Error: " << describe(text, pe);
        return 1;
    } catch (const AccessorError& ae) {
        std::cerr << "Error: " << ae.what() << "\n";
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
