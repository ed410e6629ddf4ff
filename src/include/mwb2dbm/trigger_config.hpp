#pragma once

#include <cstddef>
#include <istream>
#include <string>
#include <unordered_map>

namespace mwb2dbm {

  // Trigger name -> fully qualified function signature, read from the
  // [Triggers] section of an INI-style file:
  //
  //   [Triggers]
  //   orders_before_insert = public.orders_before_insert()
  //
  // Trigger names are matched case-insensitively.
  class trigger_config {
    std::unordered_map<std::string, std::string> entries_;

  public:
    static constexpr const char* section = "Triggers";

    trigger_config() = default;

    static trigger_config
    load(std::istream& in);

    // Throws config_error when the file cannot be opened.
    static trigger_config
    load_file(const std::string& path);

    // Signature for `trigger_name`, nullptr when not configured.
    const std::string*
    find(const std::string& trigger_name) const;

    void
    set(std::string trigger_name, std::string signature);

    std::size_t
    size() const {
      return entries_.size();
    }

    bool
    contains(const std::string& trigger_name) const {
      return find(trigger_name) != nullptr;
    }
  };

} // namespace mwb2dbm
