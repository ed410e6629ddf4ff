#pragma once

#include <mwb2dbm/xml_element.hpp>

#include <cstddef>

namespace mwb2dbm {

  // Copies the function and aggregate children of `fragment`'s root into
  // `target`, in order, before the first trigger of `target` (appended
  // when it has none). Other fragment children are ignored. Returns the
  // number of elements merged.
  std::size_t
  merge_dbm(xml_element& target, const xml_element& fragment);

} // namespace mwb2dbm
