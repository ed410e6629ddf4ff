#include <mwb2dbm/expat_reader.hpp>
#include <mwb2dbm/ostream_writer.hpp>
#include <mwb2dbm/xml_element.hpp>

#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>

namespace mwb2dbm {

  namespace {

    bool
    is_whitespace_only(std::string_view sv) {
      return std::all_of(sv.begin(), sv.end(), [](char c) {
        return c == ' ' || c == '\n' || c == '\r' || c == '\t';
      });
    }

  } // namespace

  xml_element::xml_element(xml_reader& reader) : name_(reader.name()) {
    for (std::size_t i = 0; i < reader.attribute_count(); ++i) {
      attributes_.push_back({reader.attribute_name(i),
                             std::string(reader.attribute_value(i))});
    }

    std::size_t start_depth = reader.depth();
    bool has_elements = false;
    while (reader.read()) {
      switch (reader.node_type()) {
        case xml_node_type::start_element:
          children_.emplace_back(xml_element(reader));
          has_elements = true;
          break;
        case xml_node_type::characters:
          children_.emplace_back(std::string(reader.text()));
          break;
        case xml_node_type::end_element:
          if (reader.depth() == start_depth) {
            if (has_elements) {
              std::erase_if(children_, [](const child& c) {
                const auto* s = std::get_if<std::string>(&c);
                return s != nullptr && is_whitespace_only(*s);
              });
            }
            return;
          }
          break;
      }
    }
    throw std::runtime_error("unexpected end of input while parsing element '" +
                             name_ + "'");
  }

  const std::string*
  xml_element::attribute(std::string_view name) const {
    for (const auto& attr : attributes_) {
      if (attr.name == name) return &attr.value;
    }
    return nullptr;
  }

  xml_element&
  xml_element::set_attribute(std::string_view name, std::string value) {
    for (auto& attr : attributes_) {
      if (attr.name == name) {
        attr.value = std::move(value);
        return *this;
      }
    }
    attributes_.push_back({std::string(name), std::move(value)});
    return *this;
  }

  std::string
  xml_element::text() const {
    std::string result;
    for (const auto& c : children_) {
      if (const auto* s = std::get_if<std::string>(&c)) result += *s;
    }
    return result;
  }

  xml_element&
  xml_element::set_text(std::string text) {
    std::erase_if(children_, [](const child& c) {
      return std::holds_alternative<std::string>(c);
    });
    if (!text.empty()) children_.emplace_back(std::move(text));
    return *this;
  }

  xml_element&
  xml_element::append(xml_element element) {
    children_.emplace_back(std::move(element));
    return std::get<xml_element>(children_.back());
  }

  void
  xml_element::insert(std::size_t position, xml_element element) {
    if (position > children_.size()) {
      throw std::out_of_range("xml_element::insert: position past end");
    }
    children_.insert(children_.begin() + static_cast<std::ptrdiff_t>(position),
                     child(std::move(element)));
  }

  std::size_t
  xml_element::index_of(std::string_view name) const {
    for (std::size_t i = 0; i < children_.size(); ++i) {
      const auto* e = std::get_if<xml_element>(&children_[i]);
      if (e != nullptr && e->name() == name) return i;
    }
    return npos;
  }

  const xml_element*
  xml_element::find_child(std::string_view name) const {
    for (const auto& c : children_) {
      const auto* e = std::get_if<xml_element>(&c);
      if (e != nullptr && e->name() == name) return e;
    }
    return nullptr;
  }

  const xml_element*
  xml_element::find_child(std::string_view name, std::string_view attr_name,
                          std::string_view attr_value) const {
    for (const auto& c : children_) {
      const auto* e = std::get_if<xml_element>(&c);
      if (e == nullptr || e->name() != name) continue;
      const auto* v = e->attribute(attr_name);
      if (v != nullptr && *v == attr_value) return e;
    }
    return nullptr;
  }

  std::vector<const xml_element*>
  xml_element::child_elements() const {
    std::vector<const xml_element*> result;
    for (const auto& c : children_) {
      if (const auto* e = std::get_if<xml_element>(&c)) result.push_back(e);
    }
    return result;
  }

  std::vector<const xml_element*>
  xml_element::child_elements(std::string_view name) const {
    std::vector<const xml_element*> result;
    for (const auto& c : children_) {
      const auto* e = std::get_if<xml_element>(&c);
      if (e != nullptr && e->name() == name) result.push_back(e);
    }
    return result;
  }

  void
  xml_element::write(xml_writer& writer) const {
    writer.start_element(name_);

    for (const auto& attr : attributes_) {
      writer.attribute(attr.name, attr.value);
    }

    for (const auto& c : children_) {
      std::visit(
          [&](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::string>) {
              writer.characters(v);
            } else {
              v.write(writer);
            }
          },
          c);
    }

    writer.end_element();
  }

  xml_element
  parse_document(std::string_view xml) {
    expat_reader reader(xml);
    while (reader.read()) {
      if (reader.node_type() == xml_node_type::start_element) {
        return xml_element(reader);
      }
    }
    throw std::runtime_error("XML parse error: no root element");
  }

  std::string
  serialize_document(const xml_element& root) {
    std::ostringstream os;
    os << "<?xml version='1.0' encoding='UTF-8'?>\n";
    ostream_writer writer(os, true);
    root.write(writer);
    os << '\n';
    return os.str();
  }

} // namespace mwb2dbm
