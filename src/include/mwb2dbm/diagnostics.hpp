#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace mwb2dbm {

  enum class severity { info, warning };

  struct diagnostic {
    severity level;
    std::string message;
  };

  // Collects the recoverable conditions met during one conversion run.
  // The caller decides how (and whether) to print them.
  class diagnostics {
    std::vector<diagnostic> entries_;

  public:
    void
    info(std::string message) {
      entries_.push_back({severity::info, std::move(message)});
    }

    void
    warning(std::string message) {
      entries_.push_back({severity::warning, std::move(message)});
    }

    const std::vector<diagnostic>&
    entries() const {
      return entries_;
    }

    std::size_t
    warning_count() const {
      std::size_t n = 0;
      for (const auto& e : entries_) {
        if (e.level == severity::warning) ++n;
      }
      return n;
    }

    // True if any entry of the given severity contains `needle`.
    bool
    contains(severity level, const std::string& needle) const {
      for (const auto& e : entries_) {
        if (e.level == level && e.message.find(needle) != std::string::npos)
          return true;
      }
      return false;
    }
  };

} // namespace mwb2dbm
