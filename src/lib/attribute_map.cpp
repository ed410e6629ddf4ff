#include <mwb2dbm/attribute_map.hpp>
#include <mwb2dbm/xml_element.hpp>

#include <charconv>
#include <cstdlib>
#include <string>

namespace mwb2dbm {

  namespace {

    std::string
    describe(const attribute_map& attrs, std::string_view key) {
      std::string s = "'" + std::string(key) + "'";
      if (!attrs.id().empty()) s += " of object " + attrs.id();
      return s;
    }

    std::int64_t
    parse_int(const std::string& text, std::string_view key) {
      std::int64_t value = 0;
      const char* first = text.data();
      const char* last = first + text.size();
      auto [ptr, ec] = std::from_chars(first, last, value);
      if (ec != std::errc() || ptr != last) {
        throw attribute_type_error("attribute '" + std::string(key) +
                                   "': invalid int value '" + text + "'");
      }
      return value;
    }

    double
    parse_real(const std::string& text, std::string_view key) {
      char* end = nullptr;
      double value = std::strtod(text.c_str(), &end);
      if (end == text.c_str() || *end != '\0') {
        throw attribute_type_error("attribute '" + std::string(key) +
                                   "': invalid real value '" + text + "'");
      }
      return value;
    }

    attribute_value
    decode_value(const std::string& type, const std::string& key,
                 const std::string& text) {
      if (type == "string") {
        if (text.empty()) return std::monostate{};
        return text;
      }
      if (type == "int") {
        if (text.empty()) return std::monostate{};
        return parse_int(text, key);
      }
      if (type == "real") {
        if (text.empty()) return std::monostate{};
        return parse_real(text, key);
      }
      if (type == "object") {
        if (text.empty()) return std::monostate{};
        return link_ref{text};
      }
      if (type == "list") return list_placeholder{};
      if (type == "dict") return dict_placeholder{};
      throw unsupported_attribute_type("attribute_map: unsupported type '" +
                                       type + "' for key '" + key + "'");
    }

    [[noreturn]] void
    throw_kind_mismatch(const attribute_map& attrs, std::string_view key,
                        const char* wanted) {
      throw attribute_type_error("attribute_map: attribute " +
                                 describe(attrs, key) + " is not " + wanted);
    }

  } // namespace

  attribute_map::attribute_map(const xml_element& element) {
    if (const auto* id = element.attribute("id")) id_ = *id;

    for (const auto* child : element.child_elements()) {
      if (child->name() != "value" && child->name() != "link") continue;
      const auto* key = child->attribute("key");
      const auto* type = child->attribute("type");
      if (key == nullptr || type == nullptr) continue;

      if (contains(*key)) {
        throw duplicate_key("attribute_map: duplicate key " +
                            describe(*this, *key));
      }
      entries_.emplace_back(*key, decode_value(*type, *key, child->text()));
    }
  }

  const attribute_value*
  attribute_map::find(std::string_view key) const {
    for (const auto& [k, v] : entries_) {
      if (k == key) return &v;
    }
    return nullptr;
  }

  const attribute_value&
  attribute_map::at(std::string_view key) const {
    const auto* v = find(key);
    if (v == nullptr) detail::throw_missing_field(*this, key);
    return *v;
  }

  std::optional<std::string>
  attribute_map::get_string(std::string_view key) const {
    const auto& v = at(key);
    if (std::holds_alternative<std::monostate>(v)) return std::nullopt;
    if (const auto* s = std::get_if<std::string>(&v)) return *s;
    throw_kind_mismatch(*this, key, "a string");
  }

  std::optional<std::string>
  attribute_map::get_link(std::string_view key) const {
    const auto& v = at(key);
    if (std::holds_alternative<std::monostate>(v)) return std::nullopt;
    if (const auto* l = std::get_if<link_ref>(&v)) return l->id;
    throw_kind_mismatch(*this, key, "an object link");
  }

  std::optional<std::int64_t>
  attribute_map::get_int(std::string_view key) const {
    const auto& v = at(key);
    if (std::holds_alternative<std::monostate>(v)) return std::nullopt;
    if (const auto* i = std::get_if<std::int64_t>(&v)) return *i;
    throw_kind_mismatch(*this, key, "an int");
  }

  std::optional<double>
  attribute_map::get_real(std::string_view key) const {
    const auto& v = at(key);
    if (std::holds_alternative<std::monostate>(v)) return std::nullopt;
    if (const auto* d = std::get_if<double>(&v)) return *d;
    if (const auto* i = std::get_if<std::int64_t>(&v))
      return static_cast<double>(*i);
    throw_kind_mismatch(*this, key, "a real");
  }

  namespace detail {

    void
    assign_field(std::string& out, const attribute_value& value,
                 const attribute_map& attrs, std::string_view key) {
      if (std::holds_alternative<std::monostate>(value)) {
        out.clear();
      } else if (const auto* s = std::get_if<std::string>(&value)) {
        out = *s;
      } else if (const auto* l = std::get_if<link_ref>(&value)) {
        out = l->id;
      } else {
        throw_kind_mismatch(attrs, key, "a string or an object link");
      }
    }

    void
    assign_field(std::optional<std::string>& out, const attribute_value& value,
                 const attribute_map& attrs, std::string_view key) {
      if (std::holds_alternative<std::monostate>(value)) {
        out.reset();
      } else if (const auto* s = std::get_if<std::string>(&value)) {
        out = *s;
      } else if (const auto* l = std::get_if<link_ref>(&value)) {
        out = l->id;
      } else if (const auto* i = std::get_if<std::int64_t>(&value)) {
        out = std::to_string(*i);
      } else {
        throw_kind_mismatch(attrs, key, "a scalar");
      }
    }

    void
    assign_field(std::int64_t& out, const attribute_value& value,
                 const attribute_map& attrs, std::string_view key) {
      if (std::holds_alternative<std::monostate>(value)) return;
      if (const auto* i = std::get_if<std::int64_t>(&value)) {
        out = *i;
        return;
      }
      throw_kind_mismatch(attrs, key, "an int");
    }

    void
    assign_field(double& out, const attribute_value& value,
                 const attribute_map& attrs, std::string_view key) {
      if (std::holds_alternative<std::monostate>(value)) return;
      if (const auto* d = std::get_if<double>(&value)) {
        out = *d;
      } else if (const auto* i = std::get_if<std::int64_t>(&value)) {
        out = static_cast<double>(*i);
      } else {
        throw_kind_mismatch(attrs, key, "a real");
      }
    }

    void
    assign_field(bool& out, const attribute_value& value,
                 const attribute_map& attrs, std::string_view key) {
      if (std::holds_alternative<std::monostate>(value)) return;
      if (const auto* i = std::get_if<std::int64_t>(&value)) {
        out = *i != 0;
        return;
      }
      throw_kind_mismatch(attrs, key, "an int flag");
    }

    void
    throw_missing_field(const attribute_map& attrs, std::string_view key) {
      throw key_not_found("attribute_map: missing key " + describe(attrs, key));
    }

  } // namespace detail

} // namespace mwb2dbm
