#pragma once

#include <mwb2dbm/diagnostics.hpp>
#include <mwb2dbm/type_catalog.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace mwb2dbm {

  class xml_element;

  struct column {
    std::string id;
    std::string name;
    bool not_null = false;
    bool auto_increment = false;
    std::optional<std::string> default_value;
    bool default_value_is_null = false;
    std::int64_t length = -1;
    std::int64_t precision = -1;
    std::int64_t scale = -1;
    std::optional<std::string> explicit_params;
    std::optional<std::string> comment;
    std::vector<std::string> flags;
    std::string type_id;

    bool
    has_flag(const std::string& flag) const;
  };

  enum class index_kind { primary, unique, index };

  struct index_column {
    std::string id;
    std::string referenced_column;
    bool descend = false;
    // Position of the referenced column in its table.
    std::size_t column = 0;
  };

  struct table_index {
    std::string id;
    std::string name;
    std::string index_type;
    bool is_primary = false;
    bool unique = false;
    index_kind kind = index_kind::index;
    std::vector<index_column> columns;
  };

  struct foreign_key {
    std::string id;
    std::string name;
    std::optional<std::string> referenced_table;
    bool many = false;
    bool mandatory = false;
    std::string update_rule;
    std::string delete_rule;
    // Positions of the member columns in the owning table.
    std::vector<std::size_t> columns;
    // Set when a member column also belongs to the primary index.
    bool primary = false;
  };

  struct trigger {
    std::string id;
    std::string name;
    std::string timing;
    std::string event;
  };

  // Reference from a column to one of the index columns naming it.
  struct index_membership {
    std::size_t index;
    std::size_t position;

    bool
    operator==(const index_membership&) const = default;
  };

  // Back-references of one column, kept beside the columns instead of
  // inside them.
  struct column_links {
    std::optional<std::size_t> foreign_key;
    std::vector<index_membership> indices;
  };

  class table {
  public:
    std::string id;
    std::string name;
    std::optional<std::string> next_auto_inc;
    std::vector<column> columns;
    std::vector<table_index> indexes;
    std::vector<foreign_key> foreign_keys;
    std::vector<trigger> triggers;

    // Position of the column with identifier `column_id`; throws
    // column_not_found.
    std::size_t
    column_position(const std::string& column_id) const;

    const column_links&
    links(std::size_t column) const {
      return links_[column];
    }

    bool
    is_foreign_key_member(std::size_t column) const {
      return links_[column].foreign_key.has_value();
    }

    // The foreign key owning the column, nullptr when it has none.
    const foreign_key*
    owning_foreign_key(std::size_t column) const;

    bool
    in_primary_index(std::size_t column) const;

    // Construction steps, in dependency order.
    void
    add_column(column c);

    void
    add_index(table_index idx);

    void
    add_foreign_key(foreign_key fk);

  private:
    std::unordered_map<std::string, std::size_t> column_ids_;
    std::vector<column_links> links_;
  };

  enum class figure_kind { table, view, other };

  struct figure {
    std::string id;
    std::string struct_name;
    figure_kind kind = figure_kind::other;
    std::optional<std::string> table;
    std::optional<std::string> view;
    std::optional<std::string> layer;
    double left = 0;
    double top = 0;
    std::optional<std::string> color;
  };

  struct layer {
    std::string id;
    std::string name;
    double left = 0;
    double top = 0;
    std::optional<std::string> color;
  };

  class diagram {
  public:
    std::string id;
    std::string name;
    std::vector<figure> figures;
    std::vector<layer> layers;

    const figure*
    table_figure(const std::string& table_id) const;

    const figure*
    view_figure(const std::string& view_id) const;

    const layer*
    figure_layer(const figure& f) const;

    const figure*
    first_table_figure(const layer& l) const;
  };

  struct schema_graph {
    std::string schema_name;
    type_catalog types;
    std::vector<table> tables;
    diagram main_diagram;

    const table*
    find_table(const std::string& id) const;
  };

  // Decoders for the individual GRT entities. Each takes the entity's
  // <value> element.
  column
  read_column(const xml_element& element, const type_catalog& types);

  table_index
  read_index(const xml_element& element, const table& owner);

  foreign_key
  read_foreign_key(const xml_element& element, const table& owner);

  trigger
  read_trigger(const xml_element& element);

  table
  read_table(const xml_element& element, const type_catalog& types);

  figure
  read_figure(const xml_element& element);

  layer
  read_layer(const xml_element& element);

  diagram
  read_diagram(const xml_element& element);

  // Builds the graph from a `workbench.physical.Model` element: types, then
  // tables (columns, indexes, foreign keys, triggers), then the first
  // diagram.
  schema_graph
  build_schema_graph(const xml_element& physical_model, diagnostics& diag);

} // namespace mwb2dbm
