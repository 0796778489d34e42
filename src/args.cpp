#include "args.hpp"
#include "errors.hpp"

#include <stdexcept>

std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 1; i + 1 < argc; i++) {
        if (std::string(argv[i]) == key) return std::string(argv[i + 1]);
    }
    return def;
}

int parse_positive_int(const std::string& s, const std::string& flag) {
    size_t pos = 0;
    int n = 0;
    try {
        n = std::stoi(s, &pos);
    } catch (const std::logic_error&) {
        throw ConfigurationError(flag + " must be a positive integer, got '" + s + "'");
    }
    if (pos != s.size() || n <= 0) throw ConfigurationError(flag + " must be a positive integer, got '" + s + "'");
    return n;
}
