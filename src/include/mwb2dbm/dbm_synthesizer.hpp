#pragma once

#include <mwb2dbm/diagnostics.hpp>
#include <mwb2dbm/schema_graph.hpp>
#include <mwb2dbm/trigger_config.hpp>
#include <mwb2dbm/type_catalog.hpp>
#include <mwb2dbm/xml_element.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mwb2dbm {

  struct synthesis_options {
    // Rewrite (var)char columns to citext with a length check constraint.
    bool citext = true;
    // Keep non-unique indexes made only of foreign-key columns.
    bool keep_fk_indexes = true;
    // Prefix index names with their table name when missing.
    bool prefix_index_names = true;
    // Source triggers are emitted only when a configuration is given.
    const trigger_config* triggers = nullptr;
  };

  enum class type_class { plain, enumeration, fallback };

  // Destination base type for one source column type, before any
  // precision, flag or citext handling.
  struct type_mapping {
    std::string type;
    type_class kind = type_class::plain;
    std::optional<std::string> length;
    bool with_timezone = false;
  };

  type_mapping
  map_column_type(const data_type& t);

  bool
  is_integer_type(std::string_view type);

  // Parses "('a', 'b')" into {"a", "b"}. Throws invalid_column_spec on
  // a missing parenthesis or quote.
  std::vector<std::string>
  parse_enum_values(std::string_view params);

  // Builds the pgModeler model for `graph`.
  xml_element
  synthesize_dbm(const schema_graph& graph, const synthesis_options& options,
                 diagnostics& diag);

} // namespace mwb2dbm
