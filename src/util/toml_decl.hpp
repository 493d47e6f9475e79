#pragma once

// Package declaration parsing shared by the manifest and registry index
// readers. Internal; keeps toml++ out of the public headers.

#include <pinion/source.hpp>
#include <toml++/toml.hpp>

namespace pinion::detail {

// One declaration table; `where` names it in diagnostics
Result<PackageDecl> parse_package_decl(const toml::table& tbl,
                                       const std::string& where);

// An array of declaration tables
Result<std::vector<PackageDecl>> parse_package_decls(const toml::array& arr,
                                                     const std::string& where);

// A string or an array of strings
Result<std::vector<std::string>> string_or_list(const toml::node& node,
                                                const std::string& where);

} // namespace pinion::detail
