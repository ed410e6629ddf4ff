#pragma once

#include <string>
#include <string_view>

namespace mwb2dbm {

  // An RGB color written as "#RRGGBB".
  class color {
    int r_ = 0;
    int g_ = 0;
    int b_ = 0;

  public:
    color() = default;

    color(int r, int g, int b) : r_(r), g_(g), b_(b) {}

    // Throws invalid_file_format unless `hex` is "#" plus six hex digits.
    static color
    parse(std::string_view hex);

    int
    red() const {
      return r_;
    }

    int
    green() const {
      return g_;
    }

    int
    blue() const {
      return b_;
    }

    // Adds `delta` to every channel, clamped to [0, 255].
    color
    shifted(int delta) const;

    // Upper-case "#RRGGBB".
    std::string
    str() const;

    bool
    operator==(const color&) const = default;
  };

} // namespace mwb2dbm
