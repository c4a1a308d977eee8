#include <warden/migration/declaration_file.hpp>
#include <warden/testing/common.hpp>
#include <gtest/gtest.h>

#include <fstream>
#include <sstream>
#include <string>

using warden::migration::parse_declarations;

TEST(declaration_file, groups_statements_by_entity_in_order) {
  auto input = std::istringstream{
      "-- permissions for the catalogue\n"
      "-- entity: books\n"
      "ALTER TABLE books ENABLE ROW LEVEL SECURITY;\n"
      "\n"
      "CREATE POLICY books_owner ON books\n"
      "  USING (owner = current_user);\n"
      "-- entity: loans\n"
      "GRANT SELECT ON loans TO role_librarians;\n"};
  auto error = std::string{};
  auto declarations = parse_declarations(input, error);
  ASSERT_TRUE(declarations.has_value()) << error;
  ASSERT_EQ(declarations->size(), 2u);

  const auto& books = (*declarations)[0];
  EXPECT_EQ(books.entity, "books");
  ASSERT_EQ(books.statements.size(), 2u);
  EXPECT_EQ(books.statements[0], "ALTER TABLE books ENABLE ROW LEVEL SECURITY;");
  EXPECT_EQ(books.statements[1],
            "CREATE POLICY books_owner ON books\nUSING (owner = current_user);");
  EXPECT_EQ((*declarations)[1].entity, "loans");
}

TEST(declaration_file, repeated_headers_append_to_the_same_entity) {
  auto input = std::istringstream{
      "-- entity: books\nGRANT SELECT ON books TO a;\n"
      "-- entity: loans\nGRANT SELECT ON loans TO a;\n"
      "-- entity: books\nGRANT INSERT ON books TO a;\n"};
  auto error = std::string{};
  auto declarations = parse_declarations(input, error);
  ASSERT_TRUE(declarations.has_value()) << error;
  ASSERT_EQ(declarations->size(), 2u);
  EXPECT_EQ((*declarations)[0].statements.size(), 2u);
  EXPECT_EQ((*declarations)[0].statements[1], "GRANT INSERT ON books TO a;");
}

TEST(declaration_file, rejects_statements_outside_an_entity) {
  auto input = std::istringstream{"GRANT SELECT ON books TO a;\n"};
  auto error = std::string{};
  EXPECT_FALSE(parse_declarations(input, error).has_value());
  EXPECT_NE(error.find("line 1"), std::string::npos);
}

TEST(declaration_file, rejects_unterminated_statements) {
  auto input = std::istringstream{"-- entity: books\nGRANT SELECT ON books\n"};
  auto error = std::string{};
  EXPECT_FALSE(parse_declarations(input, error).has_value());
  EXPECT_FALSE(error.empty());
}

TEST(declaration_file, loads_from_disk) {
  auto path = warden::testing::make_db_path("warden_declarations") + ".sql";
  {
    auto out = std::ofstream{path};
    out << "-- entity: books\nGRANT SELECT ON books TO a;\n";
  }
  auto error = std::string{};
  auto declarations = warden::migration::load_declarations(path, error);
  ASSERT_TRUE(declarations.has_value()) << error;
  EXPECT_EQ(declarations->size(), 1u);
  warden::testing::remove_path(path);

  EXPECT_FALSE(warden::migration::load_declarations(path, error).has_value());
}
