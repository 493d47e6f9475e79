#pragma once

#include <pinion/result.hpp>
#include <string>

namespace pinion {

// Directory name a package installs under: [A-Za-z_][A-Za-z0-9_-]*
// A single path component, so it can never escape the install root.
class InstallName {
public:
    static Result<InstallName> parse(const std::string& raw);

    const std::string& str() const { return name_; }

    bool operator==(const InstallName& o) const { return name_ == o.name_; }
    bool operator!=(const InstallName& o) const { return name_ != o.name_; }

private:
    std::string name_;
};

} // namespace pinion
