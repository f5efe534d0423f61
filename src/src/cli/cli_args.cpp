#include <od/cli_args.h>
#include <od/cli_utils.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>
#include <vector>

namespace od {
namespace cli {

namespace {
    std::string lower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
        return s;
    }

    bool ends_with(const std::string& s, const std::string& suffix) {
        return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
    }
}

CliArgs::CliArgs(int argc, const char* argv[]) {
    if (argc < 2) {
        action_ = Action::HELP;
        return;
    }

    std::string first = argv[1];
    if (first == "--help" || first == "-h") {
        action_ = Action::HELP;
        return;
    }
    filePath_ = first;
    action_ = Action::PRINT;

    static const std::vector<std::string> valid_options = {
        "--get", "-g", "--default", "-d", "--ignore-case", "-i", "--keys", "--to", "--indent", "--help", "-h"};

    auto value_of = [&](int& i, const std::string& flag) -> std::string {
        if (i + 1 >= argc) throw std::invalid_argument(flag + " requires an argument");
        return argv[++i];
    };

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--get" || arg == "-g") {
            action_ = Action::GET;
            key_ = value_of(i, "--get");
        } else if (arg == "--default" || arg == "-d") {
            defaultValue_ = value_of(i, "--default");
        } else if (arg == "--ignore-case" || arg == "-i") {
            ignoreCase_ = true;
        } else if (arg == "--keys") {
            action_ = Action::KEYS;
        } else if (arg == "--to") {
            std::string fmt = lower(value_of(i, "--to"));
            if (fmt == "json") outputFormat_ = Format::JSON;
            else if (fmt == "yaml" || fmt == "yml") outputFormat_ = Format::YAML;
            else throw std::invalid_argument("--to expects json or yaml, got '" + fmt + "'");
            action_ = Action::CONVERT;
        } else if (arg == "--indent") {
            std::string n = value_of(i, "--indent");
            size_t used = 0;
            int v = 0;
            try {
                v = std::stoi(n, &used);
            } catch (const std::exception&) {
                used = 0;
            }
            if (used != n.size() || v < 0) throw std::invalid_argument("--indent expects a non-negative integer, got '" + n + "'");
            indent_ = v;
        } else if (arg == "--help" || arg == "-h") {
            action_ = Action::HELP;
        } else {
            throw std::invalid_argument(cli_utils::unknown_flag_message(arg, valid_options));
        }
    }

    if (defaultValue_ && action_ != Action::GET) throw std::invalid_argument("--default is only valid with --get");
}

CliArgs::Format CliArgs::getInputFormat() const {
    std::string p = lower(filePath_);
    if (ends_with(p, ".yaml") || ends_with(p, ".yml")) return Format::YAML;
    return Format::JSON;
}

} // namespace cli
} // namespace od
