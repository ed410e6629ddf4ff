#pragma once

#include <mwb2dbm/xml_element.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace mwb2dbm::test {

  // Builders for in-memory MySQL Workbench documents. Field order follows
  // the GRT document so that designated initializers read naturally.

  struct column_spec {
    std::string id;
    std::string name;
    // Simple type id ("com.mysql.rdbms.mysql.datatype.int") or the id of a
    // user type when `user_type` is set.
    std::string type;
    bool user_type = false;
    bool not_null = false;
    bool auto_increment = false;
    std::string default_value;
    bool default_value_is_null = false;
    long long length = -1;
    long long precision = -1;
    long long scale = -1;
    std::string explicit_params;
    std::string comment;
    std::vector<std::string> flags;
  };

  struct index_spec {
    std::string id;
    std::string name;
    std::string index_type;
    bool unique = false;
    // (column id, descend)
    std::vector<std::pair<std::string, bool>> columns;
  };

  struct foreign_key_spec {
    std::string id;
    std::string name;
    std::string referenced_table;
    bool many = true;
    bool mandatory = true;
    std::string update_rule = "NO ACTION";
    std::string delete_rule = "NO ACTION";
    std::vector<std::string> columns;
  };

  struct trigger_spec {
    std::string id;
    std::string name;
    std::string timing;
    std::string event;
  };

  struct table_spec {
    std::string id;
    std::string name;
    std::string next_auto_inc;
    std::vector<column_spec> columns;
    std::vector<index_spec> indices;
    std::vector<foreign_key_spec> foreign_keys;
    std::vector<trigger_spec> triggers;
  };

  struct user_type_spec {
    std::string id;
    std::string name;
    std::string actual_type;
  };

  struct layer_spec {
    std::string id;
    std::string name;
    double left = 0;
    double top = 0;
    std::string color;
  };

  struct figure_spec {
    std::string id;
    std::string table;
    std::string layer;
    double left = 0;
    double top = 0;
    std::string color;
  };

  struct model_spec {
    std::string schema_name = "shop";
    std::vector<user_type_spec> user_types;
    std::vector<table_spec> tables;
    std::string diagram_name = "Main";
    std::vector<layer_spec> layers;
    std::vector<figure_spec> figures;
    std::string grt_format = "2.0";
    std::string document_type = "MySQL Workbench Model";
  };

  // "com.mysql.rdbms.mysql.datatype.<name>"
  std::string
  simple_type(std::string_view name);

  // Every simple type the builders declare in the catalog.
  const std::vector<std::string>&
  simple_type_names();

  // Root <data> element of the document.
  xml_element
  mwb_root(const model_spec& model);

  // Serialized document.mwb.xml contents.
  std::string
  mwb_document(const model_spec& model);

  // Writes an .mwb container holding the document.
  void
  write_mwb(const std::string& path, const model_spec& model);

  // A table with one auto-increment integer primary key named "id".
  table_spec
  simple_table(std::string id, std::string name);

} // namespace mwb2dbm::test
