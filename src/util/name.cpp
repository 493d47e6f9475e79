#include <pinion/name.hpp>
#include <cctype>

namespace pinion {

static bool is_name_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

static bool is_name_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
}

Result<InstallName> InstallName::parse(const std::string& raw) {
    if (raw.empty()) {
        return PinionError{PinionError::InvalidArg, "empty package name"};
    }

    if (!is_name_start(raw[0])) {
        return PinionError{PinionError::InvalidArg,
            "invalid package name '" + raw + "'",
            "package names must start with a letter or underscore"};
    }

    for (char c : raw) {
        if (!is_name_char(c)) {
            return PinionError{PinionError::InvalidArg,
                "invalid character '" + std::string(1, c) +
                "' in package name '" + raw + "'",
                "allowed: [A-Za-z0-9_-]"};
        }
    }

    InstallName name;
    name.name_ = raw;
    return Result<InstallName>::ok(std::move(name));
}

} // namespace pinion
