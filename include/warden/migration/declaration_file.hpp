#pragma once

#include <warden/schema/permission_declaration.hpp>

#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace warden::migration {

/// Read declaration blocks:
///
///   -- entity: <name>
///   <statement>;
///   <statement spanning
///    lines>;
///
/// Statements end at a `;` that closes a line. Other `--` lines and blank
/// lines are ignored. Blocks and statements keep file order; repeated entity
/// headers append to the same block.
std::optional<std::vector<warden::schema::permission_declaration_t>>
parse_declarations(std::istream& input, std::string& error);

std::optional<std::vector<warden::schema::permission_declaration_t>>
load_declarations(const std::filesystem::path& path, std::string& error);

}  // namespace warden::migration
