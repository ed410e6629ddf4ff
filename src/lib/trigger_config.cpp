#include <mwb2dbm/error.hpp>
#include <mwb2dbm/naming.hpp>
#include <mwb2dbm/trigger_config.hpp>

#include <fstream>
#include <string>
#include <string_view>

namespace mwb2dbm {

  namespace {

    std::string_view
    trim(std::string_view s) {
      auto is_space = [](char c) {
        return c == ' ' || c == '\t' || c == '\r' || c == '\n';
      };
      while (!s.empty() && is_space(s.front()))
        s.remove_prefix(1);
      while (!s.empty() && is_space(s.back()))
        s.remove_suffix(1);
      return s;
    }

  } // namespace

  trigger_config
  trigger_config::load(std::istream& in) {
    trigger_config result;
    std::string current_section;
    bool in_section = false;
    std::string line;
    std::size_t line_no = 0;

    while (std::getline(in, line)) {
      ++line_no;
      auto text = trim(line);
      if (text.empty() || text.front() == '#' || text.front() == ';') continue;

      if (text.front() == '[') {
        if (text.back() != ']') {
          throw config_error("trigger_config: line " + std::to_string(line_no) +
                             ": unterminated section header");
        }
        current_section = std::string(trim(text.substr(1, text.size() - 2)));
        in_section = true;
        continue;
      }

      if (!in_section) {
        throw config_error("trigger_config: line " + std::to_string(line_no) +
                           ": entry outside of any section");
      }

      auto sep = text.find_first_of("=:");
      if (sep == std::string_view::npos) {
        throw config_error("trigger_config: line " + std::to_string(line_no) +
                           ": expected key = value");
      }

      if (current_section != section) continue;

      auto key = trim(text.substr(0, sep));
      auto value = trim(text.substr(sep + 1));
      if (key.empty()) {
        throw config_error("trigger_config: line " + std::to_string(line_no) +
                           ": empty key");
      }
      result.set(std::string(key), std::string(value));
    }

    return result;
  }

  trigger_config
  trigger_config::load_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
      throw config_error("trigger_config: cannot open file: " + path);
    }
    return load(in);
  }

  const std::string*
  trigger_config::find(const std::string& trigger_name) const {
    auto it = entries_.find(to_lower(trigger_name));
    if (it == entries_.end()) return nullptr;
    return &it->second;
  }

  void
  trigger_config::set(std::string trigger_name, std::string signature) {
    entries_.insert_or_assign(to_lower(trigger_name), std::move(signature));
  }

} // namespace mwb2dbm
