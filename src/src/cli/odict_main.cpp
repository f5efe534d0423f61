// odict - print, query and convert order-preserving JSON / YAML documents

#include <od/cli_args.h>
#include <od/json.h>
#include <od/yaml.h>

#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace {

struct IoError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

std::string readFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) throw IoError("failed to open file: " + path);
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

void showHelp() {
    std::cout << "odict - insertion-ordered view of JSON and YAML documents\n\n";
    std::cout << "Usage:\n";
    std::cout << "  odict <file> [--indent N]\n";
    std::cout << "  odict <file> --get <key> [--default <value>] [--ignore-case]\n";
    std::cout << "  odict <file> --keys\n";
    std::cout << "  odict <file> --to json|yaml [--indent N]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --get, -g <key>      Print the value of a top-level key\n";
    std::cout << "  --default, -d <val>  Printed when the key is missing\n";
    std::cout << "  --ignore-case, -i    Match keys case-insensitively\n";
    std::cout << "  --keys               Print the top-level keys in order\n";
    std::cout << "  --to <format>        Convert to json or yaml\n";
    std::cout << "  --indent N           Indent JSON output by N spaces\n\n";
    std::cout << "Files ending in .yaml or .yml are read as YAML, anything else as JSON.\n";
}

od::DictPtr load(const od::cli::CliArgs& args) {
    std::string content = readFile(args.getFilePath());
    if (args.getInputFormat() == od::cli::CliArgs::Format::YAML) return od::yaml::parse_yaml(content);
    return od::parse_json(content);
}

int run(const od::cli::CliArgs& args) {
    using Action = od::cli::CliArgs::Action;

    od::DictPtr data = load(args);
    if (args.ignoreCase()) data = data->setCaseInsensitive();

    switch (args.getAction()) {
        case Action::PRINT:
            std::cout << od::dump_json(*data, args.getIndent()) << "\n";
            return 0;

        case Action::GET: {
            auto [value, found] = data->get(args.getKey());
            if (!found) {
                if (args.hasDefault()) {
                    std::cout << args.getDefault() << "\n";
                    return 0;
                }
                std::cerr << "error: key not found: " << args.getKey() << "\n";
                return 1;
            }
            if (value.is_string()) std::cout << value.as_string() << "\n";
            else std::cout << od::dump_json(value) << "\n";
            return 0;
        }

        case Action::KEYS:
            for (auto const& k : data->keys()) std::cout << k << "\n";
            return 0;

        case Action::CONVERT:
            if (args.getOutputFormat() == od::cli::CliArgs::Format::YAML) std::cout << od::yaml::dump_yaml(*data);
            else std::cout << od::dump_json(*data, args.getIndent()) << "\n";
            return 0;

        case Action::HELP:
            break;
    }
    showHelp();
    return 0;
}

} // namespace

int main(int argc, const char* argv[]) {
    try {
        od::cli::CliArgs args(argc, argv);
        if (args.getAction() == od::cli::CliArgs::Action::HELP) {
            showHelp();
            return 0;
        }
        return run(args);
    } catch (const std::invalid_argument& e) {
        std::cerr << "error: " << e.what() << "\n";
        std::cerr << "Run 'odict --help' for usage.\n";
        return 2;
    } catch (const IoError& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 2;
    } catch (const od::DecodeError& e) {
        std::cerr << "parse error: " << e.what() << "\n";
        return 1;
    } catch (const od::yaml::YamlError& e) {
        std::cerr << "parse error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
}
