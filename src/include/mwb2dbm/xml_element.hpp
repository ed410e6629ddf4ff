#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace mwb2dbm {

  class xml_reader;
  class xml_writer;

  struct xml_attribute {
    std::string name;
    std::string value;

    bool
    operator==(const xml_attribute&) const = default;
  };

  // Mutable generic XML tree node: the parsed source document and the
  // synthesized destination document are both held as xml_element trees.
  class xml_element {
    std::string name_;
    std::vector<xml_attribute> attributes_;
    std::vector<std::variant<std::string, xml_element>> children_;

  public:
    using child = std::variant<std::string, xml_element>;

    static constexpr std::size_t npos = static_cast<std::size_t>(-1);

    xml_element() = default;

    explicit xml_element(std::string name) : name_(std::move(name)) {}

    xml_element(std::string name, std::vector<xml_attribute> attributes)
        : name_(std::move(name)), attributes_(std::move(attributes)) {}

    // Reads the element the reader is positioned on, up to and including
    // its end tag. Whitespace-only text between child elements is dropped.
    explicit xml_element(xml_reader& reader);

    const std::string&
    name() const {
      return name_;
    }

    const std::vector<xml_attribute>&
    attributes() const {
      return attributes_;
    }

    const std::vector<child>&
    children() const {
      return children_;
    }

    // Value of the named attribute, nullptr when absent.
    const std::string*
    attribute(std::string_view name) const;

    // Replaces an existing attribute in place or appends a new one.
    xml_element&
    set_attribute(std::string_view name, std::string value);

    // Concatenation of the direct text children.
    std::string
    text() const;

    // Replaces all text children with a single one.
    xml_element&
    set_text(std::string text);

    // Returns the appended element; the reference is invalidated by the
    // next change to this element's children.
    xml_element&
    append(xml_element element);

    void
    insert(std::size_t position, xml_element element);

    // Position in children() of the first element child named `name`.
    std::size_t
    index_of(std::string_view name) const;

    const xml_element*
    find_child(std::string_view name) const;

    const xml_element*
    find_child(std::string_view name, std::string_view attr_name,
               std::string_view attr_value) const;

    std::vector<const xml_element*>
    child_elements() const;

    std::vector<const xml_element*>
    child_elements(std::string_view name) const;

    void
    write(xml_writer& writer) const;

    // Declared here, defined out-of-line after the class is complete.
    bool
    operator==(const xml_element&) const;
  };

  inline bool
  xml_element::operator==(const xml_element& other) const {
    return name_ == other.name_ && attributes_ == other.attributes_ &&
           children_ == other.children_;
  }

  // Parses a complete document and returns its root element.
  xml_element
  parse_document(std::string_view xml);

  // Serializes `root` with an XML declaration, pretty-printed.
  std::string
  serialize_document(const xml_element& root);

} // namespace mwb2dbm
