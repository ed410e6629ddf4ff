#pragma once

#include <mwb2dbm/error.hpp>

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace mwb2dbm {

  class xml_element;

  // The identifier of another GRT object (`type="object"`).
  struct link_ref {
    std::string id;

    bool
    operator==(const link_ref&) const = default;
  };

  // `list` and `dict` members are recognized but not decoded.
  struct list_placeholder {
    bool
    operator==(const list_placeholder&) const = default;
  };

  struct dict_placeholder {
    bool
    operator==(const dict_placeholder&) const = default;
  };

  // std::monostate stands for an empty value.
  using attribute_value = std::variant<std::monostate, std::string,
                                       std::int64_t, double, link_ref,
                                       list_placeholder, dict_placeholder>;

  // Ordered key -> typed value view of the direct `value`/`link` children
  // of one GRT element. This is the single decoding step shared by every
  // schema entity.
  class attribute_map {
    std::string id_;
    std::vector<std::pair<std::string, attribute_value>> entries_;

  public:
    attribute_map() = default;

    explicit attribute_map(const xml_element& element);

    // The `id` attribute of the decoded element, empty when it has none.
    const std::string&
    id() const {
      return id_;
    }

    std::size_t
    size() const {
      return entries_.size();
    }

    const std::vector<std::pair<std::string, attribute_value>>&
    entries() const {
      return entries_;
    }

    bool
    contains(std::string_view key) const {
      return find(key) != nullptr;
    }

    const attribute_value*
    find(std::string_view key) const;

    // Throws key_not_found for an unknown key.
    const attribute_value&
    at(std::string_view key) const;

    // Typed accessors: the key must exist (key_not_found otherwise) and hold
    // the requested kind or be empty (attribute_type_error otherwise).
    std::optional<std::string>
    get_string(std::string_view key) const;

    std::optional<std::string>
    get_link(std::string_view key) const;

    std::optional<std::int64_t>
    get_int(std::string_view key) const;

    std::optional<double>
    get_real(std::string_view key) const;
  };

  enum class field_use { required, optional };

  // One row of a field-type table: binds attribute `key` to a data member
  // of `Record`. The member type decides how the value is converted.
  template <typename Record>
  struct field {
    using target_type =
        std::variant<std::string Record::*, std::optional<std::string> Record::*,
                     std::int64_t Record::*, double Record::*, bool Record::*>;

    std::string_view key;
    target_type target;
    field_use use = field_use::required;
  };

  namespace detail {

    void
    assign_field(std::string& out, const attribute_value& value,
                 const attribute_map& attrs, std::string_view key);

    void
    assign_field(std::optional<std::string>& out, const attribute_value& value,
                 const attribute_map& attrs, std::string_view key);

    void
    assign_field(std::int64_t& out, const attribute_value& value,
                 const attribute_map& attrs, std::string_view key);

    void
    assign_field(double& out, const attribute_value& value,
                 const attribute_map& attrs, std::string_view key);

    void
    assign_field(bool& out, const attribute_value& value,
                 const attribute_map& attrs, std::string_view key);

    [[noreturn]] void
    throw_missing_field(const attribute_map& attrs, std::string_view key);

  } // namespace detail

  // Populates `record` from `attrs` according to `fields`. A missing
  // required key throws key_not_found; a missing optional key or an empty
  // value leaves the member at its default.
  template <typename Record>
  void
  bind_fields(const attribute_map& attrs, Record& record,
              std::initializer_list<field<Record>> fields) {
    for (const auto& f : fields) {
      const attribute_value* value = attrs.find(f.key);
      if (value == nullptr) {
        if (f.use == field_use::required)
          detail::throw_missing_field(attrs, f.key);
        continue;
      }
      std::visit(
          [&](auto member) {
            detail::assign_field(record.*member, *value, attrs, f.key);
          },
          f.target);
    }
  }

} // namespace mwb2dbm
