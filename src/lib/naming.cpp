#include <mwb2dbm/error.hpp>
#include <mwb2dbm/naming.hpp>

namespace mwb2dbm {

  namespace {

    constexpr std::string_view index_suffix = "_idx";

  } // namespace

  std::string
  to_lower(std::string_view s) {
    std::string result(s);
    for (auto& c : result) {
      if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
    }
    return result;
  }

  std::string
  fit_index_name(std::string name) {
    if (name.size() <= max_identifier_length) return name;
    if (!std::string_view(name).ends_with(index_suffix)) {
      throw not_implemented("index name '" + name + "' exceeds " +
                            std::to_string(max_identifier_length) +
                            " characters and does not end in _idx");
    }
    name.resize(max_identifier_length - index_suffix.size());
    name += index_suffix;
    return name;
  }

  std::string
  index_name_for(const std::string& table, const std::string& index,
                 bool prefix_table) {
    if (prefix_table && index.find(table) == std::string::npos) {
      return fit_index_name(table + "_" + index);
    }
    return fit_index_name(index);
  }

  std::string
  update_function_name(const std::string& column) {
    return "update_" + column + "_on_update";
  }

  std::string
  update_trigger_name(const std::string& table, const std::string& column) {
    return table + "_t_update_" + column;
  }

  std::string
  qualified(const std::string& name) {
    return "public." + name;
  }

} // namespace mwb2dbm
