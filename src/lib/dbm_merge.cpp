#include <mwb2dbm/dbm_merge.hpp>

namespace mwb2dbm {

  std::size_t
  merge_dbm(xml_element& target, const xml_element& fragment) {
    std::size_t position = target.index_of("trigger");
    std::size_t merged = 0;
    for (const auto* child : fragment.child_elements()) {
      if (child->name() != "function" && child->name() != "aggregate") continue;
      if (position == xml_element::npos) {
        target.append(*child);
      } else {
        target.insert(position++, *child);
      }
      ++merged;
    }
    return merged;
  }

} // namespace mwb2dbm
