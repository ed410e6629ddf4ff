#include <mwb2dbm/attribute_map.hpp>
#include <mwb2dbm/error.hpp>
#include <mwb2dbm/schema_graph.hpp>
#include <mwb2dbm/xml_element.hpp>

#include <algorithm>
#include <string>
#include <string_view>

namespace mwb2dbm {

  namespace {

    const std::string table_figure_struct = "workbench.physical.TableFigure";
    const std::string view_figure_struct = "workbench.physical.ViewFigure";
    const std::string diagram_struct = "workbench.physical.Diagram";
    const std::string schema_struct = "db.mysql.Schema";

    // The <value> or <link> child of `element` carrying key="<key>".
    const xml_element*
    find_member(const xml_element& element, std::string_view key) {
      for (const auto* child : element.child_elements()) {
        const auto* k = child->attribute("key");
        if (k != nullptr && *k == key) return child;
      }
      return nullptr;
    }

    const xml_element&
    require_member(const xml_element& element, std::string_view key,
                   std::string_view context) {
      const auto* m = find_member(element, key);
      if (m == nullptr) {
        std::string id;
        if (const auto* i = element.attribute("id")) id = " " + *i;
        throw invalid_file_format(std::string(context) + id +
                                  ": missing member '" + std::string(key) +
                                  "'");
      }
      return *m;
    }

    std::string
    struct_name(const xml_element& element) {
      const auto* s = element.attribute("struct-name");
      return s != nullptr ? *s : std::string();
    }

    index_kind
    parse_index_kind(const std::string& type, const table& owner,
                     const std::string& index_name) {
      if (type == "PRIMARY") return index_kind::primary;
      if (type == "UNIQUE") return index_kind::unique;
      if (type == "INDEX") return index_kind::index;
      throw invalid_file_format("index " + owner.name + "." + index_name +
                                ": unknown index type '" + type + "'");
    }

  } // namespace

  bool
  column::has_flag(const std::string& flag) const {
    return std::find(flags.begin(), flags.end(), flag) != flags.end();
  }

  std::size_t
  table::column_position(const std::string& column_id) const {
    auto it = column_ids_.find(column_id);
    if (it == column_ids_.end()) {
      throw column_not_found("table " + name + ": column " + column_id +
                             " not found");
    }
    return it->second;
  }

  const foreign_key*
  table::owning_foreign_key(std::size_t column) const {
    const auto& fk = links_[column].foreign_key;
    return fk ? &foreign_keys[*fk] : nullptr;
  }

  bool
  table::in_primary_index(std::size_t column) const {
    for (const auto& m : links_[column].indices) {
      if (indexes[m.index].kind == index_kind::primary) return true;
    }
    return false;
  }

  void
  table::add_column(column c) {
    auto [it, inserted] = column_ids_.emplace(c.id, columns.size());
    if (!inserted) {
      throw duplicate_key("table " + name + ": duplicate column id " + c.id);
    }
    columns.push_back(std::move(c));
    links_.emplace_back();
  }

  void
  table::add_index(table_index idx) {
    std::size_t index_pos = indexes.size();
    for (std::size_t i = 0; i < idx.columns.size(); ++i) {
      auto& memberships = links_[idx.columns[i].column].indices;
      index_membership m{index_pos, i};
      if (std::find(memberships.begin(), memberships.end(), m) !=
          memberships.end()) {
        throw duplicate_key("index " + name + "." + idx.name +
                            ": index column registered twice");
      }
      memberships.push_back(m);
    }
    indexes.push_back(std::move(idx));
  }

  void
  table::add_foreign_key(foreign_key fk) {
    std::size_t fk_pos = foreign_keys.size();
    for (auto col : fk.columns) {
      auto& owner = links_[col].foreign_key;
      if (owner.has_value()) {
        throw invalid_file_format(
            "table " + name + ": column " + columns[col].name +
            " belongs to foreign keys " + foreign_keys[*owner].name + " and " +
            fk.name);
      }
      owner = fk_pos;
    }
    foreign_keys.push_back(std::move(fk));
  }

  const figure*
  diagram::table_figure(const std::string& table_id) const {
    for (const auto& f : figures) {
      if (f.kind == figure_kind::table && f.table == table_id) return &f;
    }
    return nullptr;
  }

  const figure*
  diagram::view_figure(const std::string& view_id) const {
    for (const auto& f : figures) {
      if (f.kind == figure_kind::view && f.view == view_id) return &f;
    }
    return nullptr;
  }

  const layer*
  diagram::figure_layer(const figure& f) const {
    if (!f.layer) return nullptr;
    for (const auto& l : layers) {
      if (l.id == *f.layer) return &l;
    }
    return nullptr;
  }

  const figure*
  diagram::first_table_figure(const layer& l) const {
    for (const auto& f : figures) {
      if (f.kind != figure_kind::table) continue;
      if (figure_layer(f) == &l) return &f;
    }
    return nullptr;
  }

  const table*
  schema_graph::find_table(const std::string& id) const {
    for (const auto& t : tables) {
      if (t.id == id) return &t;
    }
    return nullptr;
  }

  column
  read_column(const xml_element& element, const type_catalog& types) {
    attribute_map attrs(element);

    column c;
    c.id = attrs.id();
    bind_fields<column>(
        attrs, c,
        {
            {"name", &column::name},
            {"isNotNull", &column::not_null, field_use::optional},
            {"autoIncrement", &column::auto_increment, field_use::optional},
            {"defaultValue", &column::default_value, field_use::optional},
            {"defaultValueIsNull", &column::default_value_is_null,
             field_use::optional},
            {"length", &column::length, field_use::optional},
            {"precision", &column::precision, field_use::optional},
            {"scale", &column::scale, field_use::optional},
            {"datatypeExplicitParams", &column::explicit_params,
             field_use::optional},
            {"comment", &column::comment, field_use::optional},
        });

    if (const auto* flags = find_member(element, "flags")) {
      for (const auto* flag : flags->child_elements())
        c.flags.push_back(flag->text());
    }

    const auto* user = find_member(element, "userType");
    const auto* simple = find_member(element, "simpleType");
    if ((user == nullptr) == (simple == nullptr)) {
      throw invalid_file_format("column " + c.name + " (" + c.id +
                                "): needs exactly one of userType and "
                                "simpleType");
    }
    c.type_id = (user != nullptr ? user : simple)->text();
    types.at(c.type_id);
    return c;
  }

  table_index
  read_index(const xml_element& element, const table& owner) {
    attribute_map attrs(element);

    table_index idx;
    idx.id = attrs.id();
    bind_fields<table_index>(attrs, idx,
                             {
                                 {"name", &table_index::name},
                                 {"indexType", &table_index::index_type},
                                 {"isPrimary", &table_index::is_primary},
                                 {"unique", &table_index::unique,
                                  field_use::optional},
                             });

    idx.kind = parse_index_kind(idx.index_type, owner, idx.name);
    if (idx.is_primary != (idx.kind == index_kind::primary)) {
      throw invalid_file_format("index " + owner.name + "." + idx.name +
                                ": isPrimary disagrees with indexType " +
                                idx.index_type);
    }

    const auto& columns = require_member(element, "columns", "index");
    for (const auto* col_el : columns.child_elements()) {
      attribute_map col_attrs(*col_el);
      index_column ic;
      ic.id = col_attrs.id();
      bind_fields<index_column>(
          col_attrs, ic,
          {
              {"referencedColumn", &index_column::referenced_column},
              {"descend", &index_column::descend, field_use::optional},
          });
      ic.column = owner.column_position(ic.referenced_column);
      idx.columns.push_back(std::move(ic));
    }
    if (idx.columns.empty()) {
      throw invalid_file_format("index " + owner.name + "." + idx.name +
                                " has no columns");
    }
    return idx;
  }

  foreign_key
  read_foreign_key(const xml_element& element, const table& owner) {
    attribute_map attrs(element);

    foreign_key fk;
    fk.id = attrs.id();
    bind_fields<foreign_key>(
        attrs, fk,
        {
            {"name", &foreign_key::name},
            {"referencedTable", &foreign_key::referenced_table,
             field_use::optional},
            {"many", &foreign_key::many},
            {"mandatory", &foreign_key::mandatory},
            {"updateRule", &foreign_key::update_rule},
            {"deleteRule", &foreign_key::delete_rule},
        });

    const auto& columns = require_member(element, "columns", "foreign key");
    for (const auto* link : columns.child_elements()) {
      std::size_t pos = owner.column_position(link->text());
      fk.columns.push_back(pos);
      if (owner.in_primary_index(pos)) fk.primary = true;
    }
    return fk;
  }

  trigger
  read_trigger(const xml_element& element) {
    attribute_map attrs(element);

    trigger t;
    t.id = attrs.id();
    bind_fields<trigger>(attrs, t,
                         {
                             {"name", &trigger::name},
                             {"timing", &trigger::timing},
                             {"event", &trigger::event},
                         });
    return t;
  }

  table
  read_table(const xml_element& element, const type_catalog& types) {
    attribute_map attrs(element);

    table t;
    t.id = attrs.id();
    bind_fields<table>(attrs, t,
                       {
                           {"name", &table::name},
                           {"nextAutoInc", &table::next_auto_inc,
                            field_use::optional},
                       });

    const auto& columns = require_member(element, "columns", "table " + t.name);
    for (const auto* c : columns.child_elements())
      t.add_column(read_column(*c, types));
    if (t.columns.empty()) {
      throw invalid_file_format("table " + t.name + " has no columns");
    }

    if (const auto* indices = find_member(element, "indices")) {
      for (const auto* i : indices->child_elements())
        t.add_index(read_index(*i, t));
    }

    if (const auto* fks = find_member(element, "foreignKeys")) {
      for (const auto* fk : fks->child_elements())
        t.add_foreign_key(read_foreign_key(*fk, t));
    }

    if (const auto* triggers = find_member(element, "triggers")) {
      for (const auto* tr : triggers->child_elements())
        t.triggers.push_back(read_trigger(*tr));
    }

    return t;
  }

  figure
  read_figure(const xml_element& element) {
    attribute_map attrs(element);

    figure f;
    f.id = attrs.id();
    f.struct_name = struct_name(element);
    if (f.struct_name == table_figure_struct) {
      f.kind = figure_kind::table;
    } else if (f.struct_name == view_figure_struct) {
      f.kind = figure_kind::view;
    }
    bind_fields<figure>(attrs, f,
                        {
                            {"table", &figure::table, field_use::optional},
                            {"view", &figure::view, field_use::optional},
                            {"layer", &figure::layer, field_use::optional},
                            {"left", &figure::left},
                            {"top", &figure::top},
                            {"color", &figure::color, field_use::optional},
                        });
    if (f.kind == figure_kind::table && !f.table) {
      throw unresolved_reference("table figure " + f.id +
                                 " does not reference a table");
    }
    return f;
  }

  layer
  read_layer(const xml_element& element) {
    attribute_map attrs(element);

    layer l;
    l.id = attrs.id();
    bind_fields<layer>(attrs, l,
                       {
                           {"name", &layer::name},
                           {"left", &layer::left},
                           {"top", &layer::top},
                           {"color", &layer::color, field_use::optional},
                       });
    return l;
  }

  diagram
  read_diagram(const xml_element& element) {
    attribute_map attrs(element);

    diagram d;
    d.id = attrs.id();
    bind_fields<diagram>(attrs, d, {{"name", &diagram::name}});

    require_member(element, "connections", "diagram " + d.name);
    const auto& figures = require_member(element, "figures", "diagram " + d.name);
    const auto& layers = require_member(element, "layers", "diagram " + d.name);

    for (const auto* f : figures.child_elements())
      d.figures.push_back(read_figure(*f));
    for (const auto* l : layers.child_elements())
      d.layers.push_back(read_layer(*l));
    return d;
  }

  schema_graph
  build_schema_graph(const xml_element& physical_model, diagnostics& diag) {
    const auto& catalog =
        require_member(physical_model, "catalog", "physical model");

    const auto& schemata = require_member(catalog, "schemata", "catalog");
    const auto* schema = schemata.find_child("value", "struct-name", schema_struct);
    if (schema == nullptr) {
      throw invalid_file_format("catalog: no " + schema_struct + " schema");
    }
    if (schemata.child_elements("value").size() > 1) {
      diag.info("Model has several schemata, converting the first one");
    }

    schema_graph graph;
    attribute_map schema_attrs(*schema);
    graph.schema_name = schema_attrs.get_string("name").value_or("");

    graph.types = type_catalog::load(
        require_member(catalog, "simpleDatatypes", "catalog"),
        require_member(catalog, "userDatatypes", "catalog"));

    const auto& tables = require_member(*schema, "tables", "schema");
    for (const auto* t : tables.child_elements())
      graph.tables.push_back(read_table(*t, graph.types));
    if (graph.tables.empty()) {
      throw invalid_file_format("schema " + graph.schema_name +
                                " has no tables");
    }

    const auto& diagrams =
        require_member(physical_model, "diagrams", "physical model");
    std::vector<diagram> read_diagrams;
    for (const auto* d : diagrams.child_elements()) {
      if (struct_name(*d) != diagram_struct) {
        throw invalid_file_format("diagram " + struct_name(*d) +
                                  " is not a " + diagram_struct);
      }
      read_diagrams.push_back(read_diagram(*d));
    }
    if (read_diagrams.empty()) {
      throw invalid_file_format("physical model has no diagrams");
    }
    graph.main_diagram = std::move(read_diagrams.front());
    diag.info("Using diagram \"" + graph.main_diagram.name + "\"");
    if (read_diagrams.size() > 1) {
      diag.info("Ignoring " + std::to_string(read_diagrams.size() - 1) +
                " further diagram(s)");
    }

    return graph;
  }

} // namespace mwb2dbm
