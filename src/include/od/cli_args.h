#pragma once

#include <optional>
#include <string>

namespace od {
namespace cli {

// Command line of the odict tool. Throws std::invalid_argument on a bad
// flag or a flag missing its argument.
class CliArgs {
  public:
    enum class Action {
        HELP,    // no file given
        PRINT,   // write the document back as JSON (default)
        GET,     // print one top-level value
        KEYS,    // list top-level keys in order
        CONVERT  // write the document in the --to format
    };

    enum class Format { JSON, YAML };

    CliArgs(int argc, const char* argv[]);

    Action getAction() const { return action_; }
    const std::string& getFilePath() const { return filePath_; }
    const std::string& getKey() const { return key_; }
    bool hasDefault() const { return defaultValue_.has_value(); }
    const std::string& getDefault() const { return *defaultValue_; }
    bool ignoreCase() const { return ignoreCase_; }
    Format getOutputFormat() const { return outputFormat_; }
    int getIndent() const { return indent_; }

    // Format of the input file, from its extension.
    Format getInputFormat() const;

  private:
    Action action_ = Action::HELP;
    std::string filePath_;
    std::string key_;
    std::optional<std::string> defaultValue_;
    bool ignoreCase_ = false;
    Format outputFormat_ = Format::JSON;
    int indent_ = 0;
};

} // namespace cli
} // namespace od
