#include "mwb_fixture.hpp"
#include "zip_writer.hpp"

#include <mwb2dbm/archive_reader.hpp>
#include <mwb2dbm/converter.hpp>
#include <mwb2dbm/dbm_merge.hpp>
#include <mwb2dbm/error.hpp>
#include <mwb2dbm/trigger_config.hpp>

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

using namespace mwb2dbm;

namespace fs = std::filesystem;

namespace {

  test::model_spec
  library_model() {
    test::model_spec m;
    m.schema_name = "library";

    auto authors = test::simple_table("t-auth", "authors");
    authors.columns.push_back({.id = "t-auth.name",
                               .name = "name",
                               .type = test::simple_type("varchar"),
                               .not_null = true,
                               .length = 120});

    auto books = test::simple_table("t-book", "books");
    books.next_auto_inc = "1000";
    books.columns.push_back({.id = "t-book.author_id",
                             .name = "author_id",
                             .type = test::simple_type("int"),
                             .not_null = true});
    books.columns.push_back({.id = "t-book.format",
                             .name = "format",
                             .type = test::simple_type("enum"),
                             .explicit_params = "('paper','ebook')"});
    books.columns.push_back(
        {.id = "t-book.updated",
         .name = "updated_at",
         .type = test::simple_type("timestamp"),
         .default_value = "CURRENT_TIMESTAMP ON UPDATE CURRENT_TIMESTAMP"});
    books.indices.push_back({.id = "t-book.author_idx",
                             .name = "fk_author_idx",
                             .index_type = "INDEX",
                             .columns = {{"t-book.author_id", false}}});
    books.foreign_keys.push_back({.id = "fk-book-author",
                                  .name = "fk_books_authors",
                                  .referenced_table = "t-auth",
                                  .columns = {"t-book.author_id"}});
    books.triggers.push_back({"trg-book", "books_bi", "BEFORE", "INSERT"});

    m.tables = {authors, books};
    m.layers.push_back({"layer-1", "Catalog", 20, 20, "#F0F1FE"});
    m.figures.push_back({"fig-1", "t-auth", "layer-1", 10, 10, "#98BFDA"});
    m.figures.push_back({"fig-2", "t-book", "layer-1", 250, 10, "#98BFDA"});
    return m;
  }

  struct temp_dir {
    fs::path path;

    explicit temp_dir(const std::string& name)
        : path(fs::temp_directory_path() / ("mwb2dbm_conv_" + name)) {
      fs::remove_all(path);
      fs::create_directories(path);
    }

    ~temp_dir() {
      std::error_code ec;
      fs::remove_all(path, ec);
    }
  };

  std::string
  convert_file(const std::string& mwb, diagnostics& diag,
               const synthesis_options& options = {}) {
    return serialize_document(
        convert_document(load_model_document(mwb), options, diag));
  }

} // namespace

TEST_CASE("conversion: mwb container to dbm document", "[conversion]") {
  temp_dir dir("full");
  auto mwb = (dir.path / "library.mwb").string();
  test::write_mwb(mwb, library_model());

  trigger_config triggers;
  triggers.set("books_bi", "public.books_before_insert()");
  synthesis_options opts;
  opts.triggers = &triggers;

  diagnostics diag;
  auto dbm = convert_document(load_model_document(mwb), opts, diag);

  CHECK(diag.warning_count() == 0);
  CHECK(dbm.find_child("database", "name", "library") != nullptr);
  CHECK(dbm.find_child("tag", "name", "catalog") != nullptr);
  CHECK(dbm.find_child("usertype", "name", "enum_format") != nullptr);
  CHECK(dbm.find_child("relationship", "name", "fk_books_authors") != nullptr);
  CHECK(dbm.find_child("index", "name", "books_fk_author_idx") != nullptr);
  CHECK(dbm.find_child("function", "name", "update_updated_at_on_update") !=
        nullptr);
  CHECK(dbm.find_child("trigger", "name", "books_t_update_updated_at") !=
        nullptr);
  CHECK(dbm.find_child("trigger", "name", "books_bi") != nullptr);

  const auto* books = dbm.find_child("table", "name", "books");
  REQUIRE(books != nullptr);
  CHECK(*books->find_child("column", "name", "id")->attribute("start") ==
        "1000");
}

TEST_CASE("conversion: serialized output", "[conversion]") {
  temp_dir dir("serialized");
  auto mwb = (dir.path / "library.mwb").string();
  test::write_mwb(mwb, library_model());

  diagnostics diag;
  std::string text = convert_file(mwb, diag);

  CHECK(text.rfind("<?xml version='1.0' encoding='UTF-8'?>\n<dbmodel", 0) ==
        0);
  CHECK(text.find("<expression>length(name) &lt;= 120</expression>") !=
        std::string::npos);
  CHECK(text.back() == '\n');

  // The output reads back as a document.
  auto reparsed = parse_document(text);
  CHECK(reparsed.name() == "dbmodel");
  CHECK(reparsed.child_elements("table").size() == 2);
}

TEST_CASE("conversion: output is deterministic", "[conversion]") {
  temp_dir dir("deterministic");
  auto mwb = (dir.path / "library.mwb").string();
  test::write_mwb(mwb, library_model());

  diagnostics first_diag;
  diagnostics second_diag;
  CHECK(convert_file(mwb, first_diag) == convert_file(mwb, second_diag));
}

TEST_CASE("conversion: source triggers without configuration",
          "[conversion]") {
  temp_dir dir("no_triggers");
  auto mwb = (dir.path / "library.mwb").string();
  test::write_mwb(mwb, library_model());

  diagnostics diag;
  auto dbm = convert_document(load_model_document(mwb), {}, diag);
  CHECK(dbm.find_child("trigger", "name", "books_bi") == nullptr);
  CHECK(diag.warning_count() == 1);
  CHECK(diag.contains(severity::warning, "no trigger configuration"));
}

TEST_CASE("conversion: options without citext and fk indexes",
          "[conversion]") {
  temp_dir dir("options");
  auto mwb = (dir.path / "library.mwb").string();
  test::write_mwb(mwb, library_model());

  synthesis_options opts;
  opts.citext = false;
  opts.keep_fk_indexes = false;
  diagnostics diag;
  auto dbm = convert_document(load_model_document(mwb), opts, diag);

  CHECK(dbm.find_child("extension") == nullptr);
  CHECK(dbm.find_child("index") == nullptr);
  const auto* authors = dbm.find_child("table", "name", "authors");
  REQUIRE(authors != nullptr);
  CHECK(authors->find_child("constraint", "name", "authors_name_len") ==
        nullptr);
}

TEST_CASE("conversion: merging a hand-written fragment", "[conversion]") {
  temp_dir dir("merge");
  auto mwb = (dir.path / "library.mwb").string();
  test::write_mwb(mwb, library_model());

  diagnostics diag;
  auto dbm = convert_document(load_model_document(mwb), {}, diag);
  auto fragment = parse_document(
      "<dbmodel><function name=\"books_before_insert\"/></dbmodel>");
  CHECK(merge_dbm(dbm, fragment) == 1);

  auto children = dbm.child_elements();
  std::size_t merged = 0;
  std::size_t first_trigger = 0;
  for (std::size_t i = 0; i < children.size(); ++i) {
    const auto* name = children[i]->attribute("name");
    if (name != nullptr && *name == "books_before_insert") merged = i;
    if (first_trigger == 0 && children[i]->name() == "trigger")
      first_trigger = i;
  }
  CHECK(merged + 1 == first_trigger);
}

TEST_CASE("conversion: document checks", "[conversion]") {
  SECTION("wrong grt format") {
    auto m = library_model();
    m.grt_format = "1.0";
    diagnostics diag;
    CHECK_THROWS_AS(convert_document(test::mwb_root(m), {}, diag),
                    invalid_file_format);
  }
  SECTION("wrong document type") {
    auto m = library_model();
    m.document_type = "MySQL Workbench Snippet";
    diagnostics diag;
    CHECK_THROWS_AS(convert_document(test::mwb_root(m), {}, diag),
                    invalid_file_format);
  }
  SECTION("no document value") {
    auto root = parse_document("<data grt_format=\"2.0\" "
                               "document_type=\"MySQL Workbench Model\">"
                               "<value type=\"dict\"/></data>");
    diagnostics diag;
    CHECK_THROWS_AS(convert_document(root, {}, diag), invalid_file_format);
  }
}

TEST_CASE("conversion: container errors", "[conversion]") {
  temp_dir dir("container");

  SECTION("missing model entry") {
    auto path = (dir.path / "empty.mwb").string();
    test::write_zip(path, {{"lock", "", false}});
    CHECK_THROWS_AS(load_model_document(path), not_found_error);
  }
  SECTION("not a zip file") {
    auto path = (dir.path / "plain.mwb").string();
    {
      std::ofstream out(path);
      out << "this is not a zip archive";
    }
    CHECK_THROWS_AS(load_model_document(path), archive_error);
  }
  SECTION("malformed document") {
    auto path = (dir.path / "broken.mwb").string();
    test::write_zip(path, {{model_entry, "<data><value>", true}});
    CHECK_THROWS(load_model_document(path));
  }
}

TEST_CASE("conversion: output path", "[conversion]") {
  CHECK(output_path_for("model.mwb") == "model.dbm");
  CHECK(output_path_for("dir/shop.v2.mwb") == "dir/shop.v2.dbm");
  CHECK(output_path_for("noext") == "noext.dbm");
}
