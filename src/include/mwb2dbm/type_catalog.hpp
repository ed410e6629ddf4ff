#pragma once

#include <mwb2dbm/attribute_map.hpp>

#include <cstddef>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace mwb2dbm {

  class xml_element;

  // A built-in type, referenced directly by its native name.
  struct simple_type {
    std::string id;
    std::string native_name;
    std::string category;
  };

  // A named alias of exactly one built-in type.
  struct user_type {
    std::string id;
    std::string native_name;
    std::string category;
    attribute_map attributes;

    // The symbolic name (e.g. "BOOL"), empty when the type has none.
    std::string
    name() const;
  };

  using data_type = std::variant<simple_type, user_type>;

  const std::string&
  type_id(const data_type& t);

  const std::string&
  native_name(const data_type& t);

  const std::string&
  category(const data_type& t);

  // Upper-cased last segment of a native type name matching
  // "com.mysql.rdbms.mysql.datatype.<snake_case>". Throws
  // unrecognized_native_type for anything else.
  std::string
  category_of(const std::string& native_name);

  class type_catalog {
    std::unordered_map<std::string, data_type> entries_;
    std::vector<std::string> order_;

  public:
    type_catalog() = default;

    // Scans the `simpleDatatypes` links, then the `userDatatypes` values.
    static type_catalog
    load(const xml_element& simple_types, const xml_element& user_types);

    // `link` is one <link> child of the simple types list.
    const data_type&
    add_simple(const xml_element& link);

    // `value` is one <value struct-name="db.UserDatatype"> element.
    const data_type&
    add_user(const xml_element& value);

    const data_type*
    find(const std::string& id) const;

    // Throws unresolved_reference for an unknown id.
    const data_type&
    at(const std::string& id) const;

    std::size_t
    size() const {
      return entries_.size();
    }

    // Identifiers in insertion order.
    const std::vector<std::string>&
    ids() const {
      return order_;
    }

  private:
    const data_type&
    insert(data_type t);
  };

} // namespace mwb2dbm
