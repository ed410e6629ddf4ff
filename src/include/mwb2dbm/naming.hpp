#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace mwb2dbm {

  // PostgreSQL's NAMEDATALEN - 1.
  constexpr std::size_t max_identifier_length = 63;

  std::string
  to_lower(std::string_view s);

  // Returns `name` unchanged when it fits the identifier limit. Longer
  // names must end in "_idx"; they are cut so that the result is exactly
  // max_identifier_length long and still ends in "_idx". Any other
  // over-long name throws not_implemented.
  std::string
  fit_index_name(std::string name);

  // Destination index name: `<table>_<index>` when `prefix_table` is set and
  // the index name does not already mention the table, then fitted.
  std::string
  index_name_for(const std::string& table, const std::string& index,
                 bool prefix_table);

  // "update_<column>_on_update"
  std::string
  update_function_name(const std::string& column);

  // "<table>_t_update_<column>"
  std::string
  update_trigger_name(const std::string& table, const std::string& column);

  // Schema-qualified name: "public.<name>".
  std::string
  qualified(const std::string& name);

} // namespace mwb2dbm
