#include <mwb2dbm/error.hpp>
#include <mwb2dbm/type_catalog.hpp>
#include <mwb2dbm/xml_element.hpp>

#include <string>
#include <string_view>

namespace mwb2dbm {

  namespace {

    constexpr std::string_view native_prefix =
        "com.mysql.rdbms.mysql.datatype.";

    bool
    is_snake_case(std::string_view s) {
      if (s.empty()) return false;
      for (char c : s) {
        if (!((c >= 'a' && c <= 'z') || c == '_')) return false;
      }
      return true;
    }

  } // namespace

  std::string
  user_type::name() const {
    if (!attributes.contains("name")) return {};
    return attributes.get_string("name").value_or("");
  }

  const std::string&
  type_id(const data_type& t) {
    return std::visit([](const auto& v) -> const std::string& { return v.id; },
                      t);
  }

  const std::string&
  native_name(const data_type& t) {
    return std::visit(
        [](const auto& v) -> const std::string& { return v.native_name; }, t);
  }

  const std::string&
  category(const data_type& t) {
    return std::visit(
        [](const auto& v) -> const std::string& { return v.category; }, t);
  }

  std::string
  category_of(const std::string& native_name) {
    std::string_view sv(native_name);
    if (!sv.starts_with(native_prefix) ||
        !is_snake_case(sv.substr(native_prefix.size()))) {
      throw unrecognized_native_type("type_catalog: unrecognized native type '" +
                                     native_name + "'");
    }
    std::string result(sv.substr(native_prefix.size()));
    for (auto& c : result) {
      if (c >= 'a' && c <= 'z') c = static_cast<char>(c - 'a' + 'A');
    }
    return result;
  }

  type_catalog
  type_catalog::load(const xml_element& simple_types,
                     const xml_element& user_types) {
    type_catalog catalog;
    for (const auto* link : simple_types.child_elements())
      catalog.add_simple(*link);
    for (const auto* value : user_types.child_elements())
      catalog.add_user(*value);
    return catalog;
  }

  const data_type&
  type_catalog::add_simple(const xml_element& link) {
    if (link.name() != "link") {
      throw invalid_file_format("type_catalog: simple type entry is <" +
                                link.name() + ">, expected <link>");
    }
    std::string name = link.text();
    std::string cat = category_of(name);
    return insert(simple_type{name, name, std::move(cat)});
  }

  const data_type&
  type_catalog::add_user(const xml_element& value) {
    if (value.name() != "value") {
      throw invalid_file_format("type_catalog: user type entry is <" +
                                value.name() + ">, expected <value>");
    }
    attribute_map attrs(value);
    if (attrs.id().empty()) {
      throw invalid_file_format("type_catalog: user type without id");
    }

    auto actual = attrs.contains("actualType") ? attrs.get_link("actualType")
                                               : std::nullopt;
    if (!actual) {
      throw unresolved_reference("type_catalog: user type " + attrs.id() +
                                 " has no actualType");
    }
    std::string cat = category_of(*actual);
    if (find(*actual) == nullptr) {
      throw unresolved_reference("type_catalog: user type " + attrs.id() +
                                 " aliases unknown type '" + *actual + "'");
    }

    user_type t;
    t.id = attrs.id();
    t.native_name = *actual;
    t.category = std::move(cat);
    t.attributes = std::move(attrs);
    return insert(std::move(t));
  }

  const data_type*
  type_catalog::find(const std::string& id) const {
    auto it = entries_.find(id);
    if (it == entries_.end()) return nullptr;
    return &it->second;
  }

  const data_type&
  type_catalog::at(const std::string& id) const {
    const auto* t = find(id);
    if (t == nullptr) {
      throw unresolved_reference("type_catalog: unknown type id '" + id + "'");
    }
    return *t;
  }

  const data_type&
  type_catalog::insert(data_type t) {
    std::string id = type_id(t);
    auto [it, inserted] = entries_.emplace(id, std::move(t));
    if (!inserted) {
      throw duplicate_type_id("type_catalog: duplicate type id '" + id + "'");
    }
    order_.push_back(std::move(id));
    return it->second;
  }

} // namespace mwb2dbm
