#include <mwb2dbm/expat_reader.hpp>
#include <mwb2dbm/xml_element.hpp>

#include <catch2/catch_test_macros.hpp>

#include <stdexcept>
#include <string>

using namespace mwb2dbm;

TEST_CASE("xml_element: parse keeps attributes and children in order",
          "[xml_element]") {
  auto root = parse_document(
      R"(<data grt_format="2.0"><value key="a">1</value><link key="b">x</link></data>)");

  CHECK(root.name() == "data");
  REQUIRE(root.attribute("grt_format") != nullptr);
  CHECK(*root.attribute("grt_format") == "2.0");
  CHECK(root.attribute("missing") == nullptr);

  auto children = root.child_elements();
  REQUIRE(children.size() == 2);
  CHECK(children[0]->name() == "value");
  CHECK(children[0]->text() == "1");
  CHECK(children[1]->name() == "link");
}

TEST_CASE("xml_element: whitespace between elements is dropped",
          "[xml_element]") {
  auto root = parse_document("<a>\n  <b/>\n  <c> keep </c>\n</a>");

  CHECK(root.children().size() == 2);
  CHECK(root.text().empty());
  REQUIRE(root.find_child("c") != nullptr);
  CHECK(root.find_child("c")->text() == " keep ");
}

TEST_CASE("xml_element: find_child by attribute value", "[xml_element]") {
  auto root = parse_document(
      R"(<m><value key="catalog"/><value key="diagrams" id="d"/></m>)");

  const auto* d = root.find_child("value", "key", "diagrams");
  REQUIRE(d != nullptr);
  CHECK(*d->attribute("id") == "d");
  CHECK(root.find_child("value", "key", "nothing") == nullptr);
  CHECK(root.find_child("link") == nullptr);
}

TEST_CASE("xml_element: child_elements filtered by name", "[xml_element]") {
  auto root = parse_document("<r><a/><b/><a/>text</r>");

  CHECK(root.child_elements().size() == 3);
  CHECK(root.child_elements("a").size() == 2);
  CHECK(root.child_elements("z").empty());
}

TEST_CASE("xml_element: set_attribute replaces in place", "[xml_element]") {
  xml_element e("column", {{"name", "id"}, {"not-null", "false"}});
  e.set_attribute("not-null", "true");
  e.set_attribute("default-value", "0");

  REQUIRE(e.attributes().size() == 3);
  CHECK(e.attributes()[1].name == "not-null");
  CHECK(e.attributes()[1].value == "true");
  CHECK(e.attributes()[2].name == "default-value");
}

TEST_CASE("xml_element: set_text replaces text children", "[xml_element]") {
  xml_element e("comment");
  e.set_text("first");
  e.set_text("second");
  CHECK(e.text() == "second");
  CHECK(e.children().size() == 1);
}

TEST_CASE("xml_element: insert and index_of", "[xml_element]") {
  xml_element root("dbmodel");
  root.append(xml_element("table"));
  root.append(xml_element("trigger"));

  CHECK(root.index_of("trigger") == 1);
  CHECK(root.index_of("function") == xml_element::npos);

  root.insert(1, xml_element("function"));
  auto children = root.child_elements();
  REQUIRE(children.size() == 3);
  CHECK(children[1]->name() == "function");
  CHECK(root.index_of("trigger") == 2);

  CHECK_THROWS_AS(root.insert(10, xml_element("x")), std::out_of_range);
}

TEST_CASE("xml_element: serialize_document writes declaration and indents",
          "[xml_element]") {
  xml_element root("dbmodel", {{"pgmodeler-ver", "0.9.2"}});
  auto& box = root.append(xml_element("textbox", {{"name", "Sales"}}));
  box.append(xml_element("comment")).set_text("Sales & marketing");

  CHECK(serialize_document(root) ==
        "<?xml version='1.0' encoding='UTF-8'?>\n"
        "<dbmodel pgmodeler-ver=\"0.9.2\">\n"
        "  <textbox name=\"Sales\">\n"
        "    <comment>Sales &amp; marketing</comment>\n"
        "  </textbox>\n"
        "</dbmodel>\n");
}

TEST_CASE("xml_element: serialized tree parses back equal", "[xml_element]") {
  xml_element root("r", {{"a", "x\ty\"z"}});
  root.append(xml_element("e")).set_text("line1\nline2");
  root.append(xml_element("empty"));

  CHECK(parse_document(serialize_document(root)) == root);
}

TEST_CASE("xml_element: document without root element throws",
          "[xml_element]") {
  CHECK_THROWS_AS(parse_document("<?xml version='1.0'?>"), std::runtime_error);
}
