#include <mwb2dbm/color.hpp>
#include <mwb2dbm/error.hpp>

#include <algorithm>

namespace mwb2dbm {

  namespace {

    int
    hex_digit(char c) {
      if (c >= '0' && c <= '9') return c - '0';
      if (c >= 'a' && c <= 'f') return c - 'a' + 10;
      if (c >= 'A' && c <= 'F') return c - 'A' + 10;
      return -1;
    }

    int
    clamp_channel(int v) {
      return std::clamp(v, 0, 255);
    }

  } // namespace

  color
  color::parse(std::string_view hex) {
    if (hex.size() != 7 || hex[0] != '#') {
      throw invalid_file_format("invalid color '" + std::string(hex) + "'");
    }
    int channels[3];
    for (int i = 0; i < 3; ++i) {
      int hi = hex_digit(hex[1 + 2 * i]);
      int lo = hex_digit(hex[2 + 2 * i]);
      if (hi < 0 || lo < 0) {
        throw invalid_file_format("invalid color '" + std::string(hex) + "'");
      }
      channels[i] = hi * 16 + lo;
    }
    return color(channels[0], channels[1], channels[2]);
  }

  color
  color::shifted(int delta) const {
    return color(clamp_channel(r_ + delta), clamp_channel(g_ + delta),
                 clamp_channel(b_ + delta));
  }

  std::string
  color::str() const {
    static constexpr char digits[] = "0123456789ABCDEF";
    std::string s = "#";
    for (int v : {r_, g_, b_}) {
      s += digits[v / 16];
      s += digits[v % 16];
    }
    return s;
  }

} // namespace mwb2dbm
