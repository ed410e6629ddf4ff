#include <mwb2dbm/color.hpp>
#include <mwb2dbm/dbm_synthesizer.hpp>
#include <mwb2dbm/error.hpp>
#include <mwb2dbm/naming.hpp>

#include <algorithm>
#include <cstdint>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace mwb2dbm {

  namespace {

    constexpr double position_scale_x = 1.8;
    constexpr double position_scale_y = 1.2;

    // Channel delta between a layer's color and its title shade.
    constexpr int title_shade_delta = -40;

    const std::string default_layer_color = "#E1E1E1";
    const std::string table_body_colors = "#fcfcfc,#fcfcfc,#808080";
    const std::string table_name_colors = "#000000";

    const std::string schema_name = "public";
    const std::string owner_name = "postgres";

    const std::string update_timestamp_default =
        "CURRENT_TIMESTAMP ON UPDATE CURRENT_TIMESTAMP";

    bool
    is_boolean_alias(const std::string& name) {
      return name == "UBOOL" || name == "BOOLEAN" || name == "BOOL";
    }

    std::string
    trim(std::string_view s) {
      auto first = s.find_first_not_of(" \t\r\n");
      if (first == std::string_view::npos) return {};
      auto last = s.find_last_not_of(" \t\r\n");
      return std::string(s.substr(first, last - first + 1));
    }

    std::string
    scaled(double value, double scale) {
      return std::to_string(static_cast<long long>(value * scale));
    }

    std::string
    bool_text(bool b) {
      return b ? "true" : "false";
    }

    xml_element
    text_element(std::string name, std::string text) {
      xml_element e(std::move(name));
      e.set_text(std::move(text));
      return e;
    }

    xml_element
    schema_ref() {
      return xml_element("schema", {{"name", schema_name}});
    }

    xml_element
    role_ref() {
      return xml_element("role", {{"name", owner_name}});
    }

    xml_element
    check_constraint(const std::string& name, const std::string& table_name,
                     std::string expression) {
      xml_element c("constraint", {{"name", name},
                                   {"type", "ck-constr"},
                                   {"table", qualified(table_name)}});
      c.append(text_element("expression", std::move(expression)));
      return c;
    }

    xml_element
    domain_element(const std::string& name, const std::string& base_type,
                   const std::string& constraint_name,
                   std::string expression) {
      xml_element d("domain", {{"name", name}, {"not-null", "false"}});
      d.append(schema_ref());
      d.append(role_ref());
      d.append(xml_element("type", {{"name", base_type}, {"length", "0"}}));
      auto& c = d.append(
          xml_element("constraint", {{"name", constraint_name}, {"type", "check"}}));
      c.append(text_element("expression", std::move(expression)));
      return d;
    }

    xml_element
    update_timestamp_function(const std::string& name,
                              const std::string& column) {
      xml_element f("function",
                    {{"name", name},
                     {"window-func", "false"},
                     {"returns-setof", "false"},
                     {"behavior-type", "CALLED ON NULL INPUT"},
                     {"function-type", "VOLATILE"},
                     {"security-type", "SECURITY INVOKER"},
                     {"execution-cost", "1000"},
                     {"row-amount", "0"}});
      f.append(schema_ref());
      f.append(role_ref());
      f.append(text_element(
          "comment", "ON UPDATE CURRENT TIMESTAMP equivalent for column " + column));
      f.append(xml_element("language",
                           {{"name", "plpgsql"}, {"sql-disabled", "true"}}));
      auto& rt = f.append(xml_element("return-type"));
      rt.append(xml_element("type", {{"name", "trigger"}, {"length", "0"}}));
      f.append(text_element("definition",
                            "BEGIN\n"
                            "    IF (NEW::varchar != OLD::varchar) THEN\n"
                            "        NEW." +
                                column +
                                " = CURRENT_TIMESTAMP;\n"
                                "        RETURN NEW;\n"
                                "    END IF;\n"
                                "    RETURN OLD;\n"
                                "END;\n"));
      return f;
    }

    xml_element
    trigger_element(const std::string& name, const std::string& firing_type,
                    bool on_insert, bool on_delete, bool on_update,
                    const std::string& table_name,
                    const std::string& signature) {
      xml_element t("trigger", {{"name", name},
                                {"firing-type", firing_type},
                                {"per-line", "true"},
                                {"constraint", "false"},
                                {"ins-event", bool_text(on_insert)},
                                {"del-event", bool_text(on_delete)},
                                {"upd-event", bool_text(on_update)},
                                {"trunc-event", "false"},
                                {"table", qualified(table_name)}});
      t.append(xml_element("function", {{"signature", signature}}));
      return t;
    }

    // Ordered attributes of a column's <type> child.
    class type_attributes {
      std::vector<xml_attribute> items_;

    public:
      const std::string*
      get(std::string_view name) const {
        for (const auto& a : items_) {
          if (a.name == name) return &a.value;
        }
        return nullptr;
      }

      void
      set(std::string_view name, std::string value) {
        for (auto& a : items_) {
          if (a.name == name) {
            a.value = std::move(value);
            return;
          }
        }
        items_.push_back({std::string(name), std::move(value)});
      }

      void
      erase(std::string_view name) {
        std::erase_if(items_, [&](const xml_attribute& a) { return a.name == name; });
      }

      const std::vector<xml_attribute>&
      items() const {
        return items_;
      }
    };

    struct foreign_key_ref {
      const table* owner;
      const foreign_key* fk;
    };

    // State of one synthesis run: names already emitted and the elements
    // that are appended after all tables.
    class synthesizer {
      const schema_graph& graph_;
      const synthesis_options& options_;
      diagnostics& diag_;

      xml_element root_;
      std::set<std::string> enums_;
      std::set<std::string> domains_;
      std::vector<foreign_key_ref> foreign_keys_;
      std::vector<xml_element> indexes_;
      std::vector<std::string> update_function_names_;
      std::vector<xml_element> update_functions_;
      std::vector<xml_element> update_triggers_;
      std::vector<xml_element> triggers_;

    public:
      synthesizer(const schema_graph& graph, const synthesis_options& options,
                  diagnostics& diag)
          : graph_(graph), options_(options), diag_(diag) {}

      xml_element
      run() {
        write_prologue();
        for (const auto& l : graph_.main_diagram.layers) write_layer(l);
        for (const char* base : {"smallint", "integer", "bigint"}) {
          std::string name = std::string("u") + base;
          domains_.insert(name);
          root_.append(domain_element(name, base, "ge0", "VALUE >= 0"));
        }

        bool tables_have_triggers = false;
        for (const auto& t : graph_.tables) {
          write_table(t);
          if (!t.triggers.empty()) tables_have_triggers = true;
        }
        if (options_.triggers == nullptr && tables_have_triggers) {
          diag_.warning("Skipping trigger generation: no trigger configuration "
                        "was provided");
        }

        // Identifying relationships first.
        std::stable_sort(foreign_keys_.begin(), foreign_keys_.end(),
                         [](const foreign_key_ref& a, const foreign_key_ref& b) {
                           return a.fk->primary && !b.fk->primary;
                         });
        for (const auto& ref : foreign_keys_) write_relationship(ref);

        for (auto& e : indexes_) root_.append(std::move(e));
        for (auto& e : update_functions_) root_.append(std::move(e));
        for (auto& e : update_triggers_) root_.append(std::move(e));
        for (auto& e : triggers_) root_.append(std::move(e));
        return std::move(root_);
      }

    private:
      void
      write_prologue() {
        root_ = xml_element("dbmodel", {{"pgmodeler-ver", "0.9.2"},
                                        {"last-position", "0,0"},
                                        {"last-zoom", "1"},
                                        {"max-obj-count", "4"},
                                        {"default-schema", schema_name},
                                        {"default-owner", owner_name}});
        root_.append(xml_element("database", {{"name", graph_.schema_name},
                                              {"is-template", "false"},
                                              {"allow-conns", "true"}}));
        root_.append(xml_element("schema", {{"name", schema_name},
                                            {"layer", "0"},
                                            {"fill-color", "#e1e1e1"},
                                            {"sql-disabled", "true"}}));
        if (options_.citext) {
          auto& ext = root_.append(xml_element(
              "extension", {{"name", "citext"}, {"handles-type", "true"}}));
          ext.append(schema_ref());
        }
      }

      color
      layer_color(const layer& l) {
        if (const auto* f = graph_.main_diagram.first_table_figure(l);
            f != nullptr && f->color && !f->color->empty()) {
          return color::parse(*f->color);
        }
        diag_.warning("Layer \"" + l.name +
                      "\" has no colored table figure, using the layer color");
        return color::parse(l.color && !l.color->empty() ? *l.color
                                                         : default_layer_color);
      }

      void
      write_layer(const layer& l) {
        color c = layer_color(l);
        color title = c.shifted(title_shade_delta);

        auto& box = root_.append(xml_element(
            "textbox", {{"name", l.name}, {"layer", "0"}, {"font-size", "9"}}));
        box.append(xml_element("position",
                               {{"x", scaled(l.left, position_scale_x)},
                                {"y", scaled(l.top, position_scale_y)}}));
        box.append(text_element("comment", l.name));

        auto& tag = root_.append(xml_element("tag", {{"name", to_lower(l.name)}}));
        tag.append(xml_element("style", {{"id", "table-body"},
                                         {"colors", table_body_colors}}));
        tag.append(xml_element("style", {{"id", "table-ext-body"},
                                         {"colors", table_body_colors}}));
        tag.append(xml_element("style", {{"id", "table-name"},
                                         {"colors", table_name_colors}}));
        tag.append(xml_element("style", {{"id", "table-schema-name"},
                                         {"colors", table_name_colors}}));
        tag.append(xml_element(
            "style", {{"id", "table-title"},
                      {"colors", c.str() + "," + c.str() + "," + title.str()}}));
        tag.append(text_element("comment", l.name));
      }

      void
      write_table(const table& t) {
        const auto& dia = graph_.main_diagram;
        const figure* fig = dia.table_figure(t.id);
        const layer* lay = fig != nullptr ? dia.figure_layer(*fig) : nullptr;
        if (fig == nullptr) {
          diag_.warning("Table " + t.name + " has no figure in diagram \"" +
                        dia.name + "\", placing it at the origin");
        }

        xml_element tnode("table", {{"name", t.name},
                                    {"layer", "0"},
                                    {"collapse-mode", "2"},
                                    {"max-obj-count", "0"}});
        tnode.append(schema_ref());
        tnode.append(role_ref());
        if (lay != nullptr) {
          tnode.append(xml_element("tag", {{"name", to_lower(lay->name)}}));
        }

        double left = 0;
        double top = 0;
        if (fig != nullptr) {
          left = fig->left + (lay != nullptr ? lay->left : 0);
          top = fig->top + (lay != nullptr ? lay->top : 0);
        }
        tnode.append(xml_element("position",
                                 {{"x", scaled(left, position_scale_x)},
                                  {"y", scaled(top, position_scale_y)}}));

        std::vector<xml_element> constraints;
        std::vector<std::pair<std::size_t, std::string>> column_order;
        bool identity_applied = false;
        for (std::size_t i = 0; i < t.columns.size(); ++i) {
          if (t.is_foreign_key_member(i)) {
            column_order.emplace_back(i, t.columns[i].name);
            continue;
          }
          tnode.append(
              write_column(t, t.columns[i], identity_applied, constraints));
        }
        for (auto& c : constraints) tnode.append(std::move(c));

        for (const auto& idx : t.indexes) write_index(t, idx, tnode);

        for (const auto& fk : t.foreign_keys) foreign_keys_.push_back({&t, &fk});

        if (!column_order.empty()) {
          auto& order = tnode.append(
              xml_element("customidxs", {{"object-type", "column"}}));
          for (const auto& [position, name] : column_order) {
            order.append(xml_element(
                "object", {{"name", name}, {"index", std::to_string(position)}}));
          }
        }

        if (options_.triggers != nullptr) {
          for (const auto& trg : t.triggers) write_source_trigger(t, trg);
        }

        root_.append(std::move(tnode));
      }

      std::string
      unique_enum_name(const column& c) {
        std::string name = "enum_" + c.name;
        for (std::size_t n = enums_.size() + 1; enums_.count(name) != 0; ++n) {
          name = "enum_" + std::to_string(n) + "_" + c.name;
        }
        enums_.insert(name);
        return name;
      }

      std::string
      write_enum(const table& t, const column& c) {
        if (!c.explicit_params) {
          throw invalid_column_spec("column " + t.name + "." + c.name +
                                    ": enum without a value list");
        }
        std::vector<std::string> values;
        try {
          values = parse_enum_values(*c.explicit_params);
        } catch (const invalid_column_spec& e) {
          throw invalid_column_spec("column " + t.name + "." + c.name + ": " +
                                    e.what());
        }

        std::string joined;
        for (const auto& v : values) {
          if (!joined.empty()) joined += ',';
          joined += v;
        }

        std::string name = unique_enum_name(c);
        auto& node = root_.append(xml_element(
            "usertype", {{"name", name}, {"configuration", "enumeration"}}));
        node.append(schema_ref());
        node.append(role_ref());
        node.append(xml_element("enumeration", {{"values", joined}}));
        return qualified(name);
      }

      void
      add_update_timestamp(const table& t, const column& c) {
        std::string fname = update_function_name(c.name);
        if (std::find(update_function_names_.begin(),
                      update_function_names_.end(),
                      fname) == update_function_names_.end()) {
          update_function_names_.push_back(fname);
          update_functions_.push_back(update_timestamp_function(fname, c.name));
        }
        update_triggers_.push_back(
            trigger_element(update_trigger_name(t.name, c.name), "BEFORE",
                            false, false, true, t.name,
                            qualified(fname) + "()"));
      }

      std::string
      normalize_default(const table& t, const column& c, std::string value,
                        const std::string& type) {
        if (value == "1" || value == "0") {
          if (type == "boolean") return value == "1" ? "TRUE" : "FALSE";
          return value;
        }
        if (value == "TRUE" || value == "FALSE" || value == "CURRENT_TIMESTAMP")
          return value;
        if (value.size() >= 2 && value.front() == '\'' && value.back() == '\'')
          return value;
        if (value == update_timestamp_default) {
          add_update_timestamp(t, c);
          return "CURRENT_TIMESTAMP";
        }
        diag_.warning("Unknown default value " + value + " for column " +
                      t.name + "." + c.name);
        return value;
      }

      // Domain emulating a fixed number of decimal digits.
      std::string
      precision_domain(const std::string& type, std::int64_t precision,
                       bool is_unsigned) {
        std::string digits = std::to_string(precision);
        std::string name = (is_unsigned ? "u" : "") + type + digits;
        if (domains_.insert(name).second) {
          std::string nines(static_cast<std::size_t>(precision), '9');
          std::string min = is_unsigned ? "0" : "-" + nines;
          root_.append(domain_element(name, type, "range" + digits,
                                      "VALUE >= " + min + " AND VALUE <= " +
                                          nines));
        }
        return qualified(name);
      }

      xml_element
      write_column(const table& t, const column& c, bool& identity_applied,
                   std::vector<xml_element>& constraints) {
        const std::string where = t.name + "." + c.name;
        xml_element node("column", {{"name", c.name}});

        if (c.auto_increment) {
          if (identity_applied) {
            throw not_implemented("table " + t.name +
                                  ": more than one auto-increment column");
          }
          identity_applied = true;
        }

        const data_type& dt = graph_.types.at(c.type_id);
        type_mapping mapped = map_column_type(dt);
        type_attributes attrs;
        attrs.set("length", mapped.length.value_or("0"));
        if (mapped.with_timezone) attrs.set("with-timezone", "true");

        std::string type = mapped.type;
        switch (mapped.kind) {
        case type_class::plain:
          break;
        case type_class::enumeration:
          type = write_enum(t, c);
          break;
        case type_class::fallback:
          diag_.warning("Unknown type " + category(dt) + " for column " + where +
                        ", using smallint");
          break;
        }

        if (c.not_null) node.set_attribute("not-null", "true");

        if (c.auto_increment && is_integer_type(type)) {
          node.set_attribute("identity-type", "ALWAYS");
          if (t.next_auto_inc && !t.next_auto_inc->empty())
            node.set_attribute("start", *t.next_auto_inc);
        }

        if (c.default_value && !c.default_value->empty()) {
          if (c.default_value_is_null) {
            throw invalid_column_spec("column " + where + ": default value " +
                                      *c.default_value +
                                      " together with defaultValueIsNull");
          }
          node.set_attribute("default-value",
                             normalize_default(t, c, *c.default_value, type));
        } else if (c.default_value_is_null) {
          diag_.warning("Unsupported null default value for column " + where);
        }

        bool unsigned_consumed = false;
        if (c.length > 0) {
          if (c.precision >= 0 || c.scale >= 0) {
            throw invalid_numeric_spec(
                "column " + where + ": length " + std::to_string(c.length) +
                " with precision " + std::to_string(c.precision) +
                " and scale " + std::to_string(c.scale));
          }
          if (*attrs.get("length") != "0") {
            throw invalid_numeric_spec("column " + where + ": length " +
                                       std::to_string(c.length) +
                                       " on a fixed-length type");
          }
          attrs.set("length", std::to_string(c.length));
        } else if (c.precision > 0) {
          if (c.length >= 0) {
            throw invalid_numeric_spec(
                "column " + where + ": precision " +
                std::to_string(c.precision) + " with length " +
                std::to_string(c.length));
          }
          if (c.scale < 0) {
            type = precision_domain(type, c.precision, c.has_flag("UNSIGNED"));
            unsigned_consumed = true;
          } else {
            if (*attrs.get("length") != "0") {
              throw invalid_numeric_spec("column " + where + ": precision " +
                                         std::to_string(c.precision) +
                                         " on a fixed-length type");
            }
            attrs.set("length", std::to_string(c.precision));
            attrs.set("precision", std::to_string(c.scale));
          }
        } else if (c.scale > 0) {
          throw invalid_numeric_spec("column " + where + ": scale " +
                                     std::to_string(c.scale) +
                                     " without precision");
        }

        for (const auto& flag : c.flags) {
          if (flag != "UNSIGNED") {
            diag_.warning("Unsupported flag " + flag + " on column " + where);
            continue;
          }
          if (unsigned_consumed) continue;
          if (is_integer_type(type)) {
            if (c.auto_increment) {
              diag_.info("Unsupported domain in identity column " + where);
            } else {
              type = qualified("u" + type);
            }
          } else {
            constraints.push_back(check_constraint(
                t.name + "_" + c.name + "_ge0", t.name, c.name + " >= 0"));
          }
        }

        if (options_.citext && (type == "varchar" || type == "char")) {
          const char* op = type == "char" ? "=" : "<=";
          constraints.push_back(check_constraint(
              t.name + "_" + c.name + "_len", t.name,
              "length(" + c.name + ") " + op + " " + *attrs.get("length")));
          type = "citext";
          attrs.erase("length");
        }

        xml_element type_node("type", {{"name", type}});
        for (const auto& a : attrs.items()) type_node.set_attribute(a.name, a.value);
        node.append(std::move(type_node));

        if (c.comment && !c.comment->empty()) {
          node.append(text_element("comment", *c.comment));
        }
        return node;
      }

      void
      write_index(const table& t, const table_index& idx, xml_element& tnode) {
        std::vector<const index_column*> own_columns;
        for (const auto& ic : idx.columns) {
          if (!t.is_foreign_key_member(ic.column)) own_columns.push_back(&ic);
        }
        bool keep = idx.kind == index_kind::unique ||
                    (idx.kind == index_kind::index && options_.keep_fk_indexes);
        if (own_columns.empty() && !keep) return;

        if (idx.kind == index_kind::primary) {
          std::string names;
          for (const auto* ic : own_columns) {
            if (!names.empty()) names += ',';
            names += t.columns[ic->column].name;
          }
          auto& pk = tnode.append(
              xml_element("constraint", {{"name", t.name + "_pk"},
                                         {"type", "pk-constr"},
                                         {"table", qualified(t.name)}}));
          pk.append(xml_element("columns",
                                {{"names", names}, {"ref-type", "src-columns"}}));
          return;
        }

        xml_element node(
            "index",
            {{"name", index_name_for(t.name, idx.name, options_.prefix_index_names)},
             {"table", qualified(t.name)},
             {"concurrent", "false"},
             {"unique", bool_text(idx.unique)},
             {"fast-update", "false"},
             {"buffering", "false"},
             {"index-type", "btree"},
             {"factor", "0"}});
        for (const auto& ic : idx.columns) {
          auto& el = node.append(
              xml_element("idxelement", {{"use-sorting", "true"},
                                         {"nulls-first", "false"},
                                         {"asc-order", bool_text(!ic.descend)}}));
          el.append(xml_element("column", {{"name", t.columns[ic.column].name}}));
        }
        indexes_.push_back(std::move(node));
      }

      void
      write_source_trigger(const table& t, const trigger& trg) {
        const std::string* signature = options_.triggers->find(trg.name);
        if (signature == nullptr) {
          diag_.warning("Trigger " + trg.name +
                        " not present in trigger configuration, skipping");
          return;
        }
        triggers_.push_back(trigger_element(
            trg.name, trg.timing, trg.event == "INSERT", trg.event == "DELETE",
            trg.event == "UPDATE", t.name, *signature));
      }

      void
      write_relationship(const foreign_key_ref& ref) {
        const table& owner = *ref.owner;
        const foreign_key& fk = *ref.fk;
        if (!fk.referenced_table) {
          diag_.info("Foreign key " + fk.name + " on table " + owner.name +
                     " has no referenced table, skipping");
          return;
        }
        if (!fk.many) {
          throw not_implemented("foreign key " + fk.name + " on table " +
                                owner.name + ": only one-to-many is supported");
        }
        const table* referenced = graph_.find_table(*fk.referenced_table);
        if (referenced == nullptr) {
          throw unresolved_reference("foreign key " + fk.name + " on table " +
                                     owner.name + ": unknown table " +
                                     *fk.referenced_table);
        }
        if (fk.columns.size() != 1) {
          throw not_implemented("foreign key " + fk.name + " on table " +
                                owner.name + ": " +
                                std::to_string(fk.columns.size()) +
                                " columns, only one is supported");
        }
        const column& source = owner.columns[fk.columns.front()];

        auto& rel = root_.append(xml_element(
            "relationship",
            {{"name", fk.name},
             {"type", "rel1n"},
             {"layer", "0"},
             {"src-col-pattern", source.name},
             {"pk-pattern", "{dt}_pk"},
             {"uq-pattern", "{dt}_uq"},
             {"src-fk-pattern", "{st}_fk"},
             {"src-table", qualified(referenced->name)},
             {"dst-table", qualified(owner.name)},
             {"src-required", bool_text(fk.mandatory && source.not_null)},
             {"dst-required", "false"},
             {"identifier", bool_text(fk.primary)},
             {"upd-action", fk.update_rule},
             {"del-action", fk.delete_rule}}));
        auto& label = rel.append(xml_element("label", {{"ref-type", "name-label"}}));
        label.append(xml_element("position", {{"x", "0"}, {"y", "0"}}));
      }
    };

  } // namespace

  bool
  is_integer_type(std::string_view type) {
    return type == "smallint" || type == "integer" || type == "bigint";
  }

  type_mapping
  map_column_type(const data_type& t) {
    const std::string& cat = category(t);
    type_mapping m;
    if (cat == "SMALLINT" || cat == "JSON" || cat == "DECIMAL" ||
        cat == "VARCHAR" || cat == "BIGINT" || cat == "DATE" || cat == "CHAR") {
      m.type = to_lower(cat);
    } else if (cat == "INT") {
      m.type = "integer";
    } else if (cat == "TINYINT") {
      const auto* user = std::get_if<user_type>(&t);
      m.type = user != nullptr && is_boolean_alias(user->name()) ? "boolean"
                                                                 : "smallint";
    } else if (cat == "FLOAT") {
      m.type = "real";
    } else if (cat == "DOUBLE") {
      m.type = "double precision";
    } else if (cat == "TIMESTAMP" || cat == "DATETIME" ||
               cat == "TIMESTAMP_F" || cat == "DATETIME_F") {
      m.type = "timestamp with time zone";
      m.with_timezone = true;
    } else if (cat == "TIME") {
      m.type = "time with time zone";
      m.with_timezone = true;
    } else if (cat == "TINYTEXT") {
      m.type = "varchar";
      m.length = "255";
    } else if (cat == "TEXT") {
      m.type = "varchar";
      m.length = "65535";
    } else if (cat == "MEDIUMTEXT" || cat == "LONGTEXT") {
      m.type = "text";
    } else if (cat == "ENUM") {
      m.kind = type_class::enumeration;
    } else {
      m.type = "smallint";
      m.kind = type_class::fallback;
    }
    return m;
  }

  std::vector<std::string>
  parse_enum_values(std::string_view params) {
    std::string list = trim(params);
    if (list.size() < 2 || list.front() != '(' || list.back() != ')') {
      throw invalid_column_spec("malformed enum list " + std::string(params));
    }
    std::vector<std::string> values;
    std::string_view body = std::string_view(list).substr(1, list.size() - 2);
    for (;;) {
      auto comma = body.find(',');
      std::string item = trim(body.substr(0, comma));
      if (item.size() < 2 || item.front() != '\'' || item.back() != '\'') {
        throw invalid_column_spec("malformed enum value " + item);
      }
      values.push_back(trim(std::string_view(item).substr(1, item.size() - 2)));
      if (comma == std::string_view::npos) break;
      body.remove_prefix(comma + 1);
    }
    return values;
  }

  xml_element
  synthesize_dbm(const schema_graph& graph, const synthesis_options& options,
                 diagnostics& diag) {
    return synthesizer(graph, options, diag).run();
  }

} // namespace mwb2dbm
