#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace mwb2dbm {

  // Names of the entries in the ZIP container at `path`, in central
  // directory order.
  std::vector<std::string>
  list_archive_entries(const std::string& path);

  // Returns the uncompressed contents of entry `inner_name` of the ZIP
  // container at `path`. Throws not_found_error when the container has no
  // such entry and archive_error when the container cannot be read.
  std::string
  extract_archive_entry(const std::string& path, std::string_view inner_name);

} // namespace mwb2dbm
