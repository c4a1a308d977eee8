#include <warden/migration/declaration_file.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <string_view>

using warden::schema::permission_declaration_t;

namespace warden::migration {

namespace {

constexpr auto kEntityHeader = std::string_view{"-- entity:"};
constexpr auto kWhitespace = std::string_view{" \t\r\n"};

std::string_view trim(std::string_view value) {
  auto first = value.find_first_not_of(kWhitespace);
  if (first == std::string_view::npos) {
    return {};
  }
  auto last = value.find_last_not_of(kWhitespace);
  return value.substr(first, last - first + 1);
}

}  // namespace

std::optional<std::vector<permission_declaration_t>> parse_declarations(
    std::istream& input,
    std::string& error) {
  auto declarations = std::vector<permission_declaration_t>{};
  auto* current = static_cast<permission_declaration_t*>(nullptr);
  auto statement = std::string{};
  auto line = std::string{};
  auto line_number = std::size_t{};

  while (std::getline(input, line)) {
    ++line_number;
    auto text = trim(line);
    if (text.starts_with(kEntityHeader)) {
      if (!statement.empty()) {
        error = fmt::format("line {}: unterminated statement before entity "
                            "header",
                            line_number);
        return std::nullopt;
      }
      auto entity = std::string{trim(text.substr(kEntityHeader.size()))};
      if (entity.empty()) {
        error = fmt::format("line {}: entity header without a name",
                            line_number);
        return std::nullopt;
      }
      auto it = std::ranges::find_if(
          declarations, [&](const permission_declaration_t& declaration) {
            return declaration.entity == entity;
          });
      if (it == std::end(declarations)) {
        declarations.push_back(permission_declaration_t{.entity = entity});
        current = &declarations.back();
      } else {
        current = &*it;
      }
      continue;
    }
    if (statement.empty() && (text.empty() || text.starts_with("--"))) {
      continue;
    }
    if (current == nullptr) {
      error = fmt::format("line {}: statement outside of an entity block",
                          line_number);
      return std::nullopt;
    }
    if (!statement.empty()) {
      statement.push_back('\n');
    }
    statement.append(text);
    if (text.ends_with(';')) {
      current->statements.push_back(std::move(statement));
      statement.clear();
    }
  }

  if (!statement.empty()) {
    error = "unterminated statement at end of input";
    return std::nullopt;
  }
  return declarations;
}

std::optional<std::vector<permission_declaration_t>> load_declarations(
    const std::filesystem::path& path,
    std::string& error) {
  auto input = std::ifstream{path};
  if (!input) {
    error = fmt::format("cannot open {}", path.string());
    return std::nullopt;
  }
  auto declarations = parse_declarations(input, error);
  if (declarations) {
    spdlog::debug("Loaded {} declaration block(s) from {}",
                  declarations->size(), path.string());
  }
  return declarations;
}

}  // namespace warden::migration
