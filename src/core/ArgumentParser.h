#pragma once
#include "Config.h"
#include <functional>
#include <ostream>
#include <string>
#include <vector>

namespace revkit {

class ArgumentParser {
public:
    ArgumentParser();

    // Returns false when the caller should stop: --help, --version or a usage error.
    bool parse(int argc, char** argv, Config& cfg);

    bool help_requested() const { return help_; }
    bool version_requested() const { return version_; }
    int exit_code() const { return exit_code_; }

    void print_help(std::ostream& os) const;

private:
    enum class ArgKind { None, String, Int, CSV };
    struct FlagSpec {
        const char* name;
        ArgKind kind;
        const char* help;
        std::function<void(Config&, const std::string&)> apply;
    };

    const FlagSpec* find_spec(const std::string& flag) const;
    bool fail(const std::string& msg);

    std::vector<FlagSpec> specs_;
    bool help_ = false;
    bool version_ = false;
    int exit_code_ = 0;
};

}
