#include "mwb_fixture.hpp"
#include "zip_writer.hpp"

#include <mwb2dbm/converter.hpp>

#include <sstream>

namespace mwb2dbm::test {

  namespace {

    xml_element
    string_value(const std::string& key, const std::string& text) {
      xml_element e("value", {{"type", "string"}, {"key", key}});
      if (!text.empty()) e.set_text(text);
      return e;
    }

    xml_element
    int_value(const std::string& key, long long v) {
      xml_element e("value", {{"type", "int"}, {"key", key}});
      e.set_text(std::to_string(v));
      return e;
    }

    std::string
    real_text(double v) {
      std::ostringstream os;
      os << v;
      return os.str();
    }

    xml_element
    real_value(const std::string& key, double v) {
      xml_element e("value", {{"type", "real"}, {"key", key}});
      e.set_text(real_text(v));
      return e;
    }

    xml_element
    link(const std::string& key, const std::string& id) {
      xml_element e("link", {{"type", "object"}, {"key", key}});
      if (!id.empty()) e.set_text(id);
      return e;
    }

    xml_element
    object(const std::string& struct_name, const std::string& id) {
      return xml_element("value", {{"type", "object"},
                                   {"struct-name", struct_name},
                                   {"id", id}});
    }

    xml_element
    list(const std::string& key, const std::string& content_struct = {}) {
      std::vector<xml_attribute> attrs{{"type", "list"},
                                       {"content-type", "object"}};
      if (!content_struct.empty())
        attrs.push_back({"content-struct-name", content_struct});
      attrs.push_back({"key", key});
      return xml_element("value", std::move(attrs));
    }

    xml_element
    column_element(const column_spec& c) {
      auto e = object("db.mysql.Column", c.id);
      e.append(string_value("name", c.name));
      e.append(int_value("isNotNull", c.not_null ? 1 : 0));
      e.append(int_value("autoIncrement", c.auto_increment ? 1 : 0));
      e.append(string_value("defaultValue", c.default_value));
      e.append(int_value("defaultValueIsNull", c.default_value_is_null ? 1 : 0));
      e.append(int_value("length", c.length));
      e.append(int_value("precision", c.precision));
      e.append(int_value("scale", c.scale));
      e.append(string_value("datatypeExplicitParams", c.explicit_params));
      e.append(string_value("comment", c.comment));
      auto& flags = e.append(
          xml_element("value", {{"type", "list"},
                                {"content-type", "string"},
                                {"key", "flags"}}));
      for (const auto& f : c.flags) {
        xml_element v("value", {{"type", "string"}});
        v.set_text(f);
        flags.append(std::move(v));
      }
      e.append(link(c.user_type ? "userType" : "simpleType", c.type));
      return e;
    }

    xml_element
    index_element(const index_spec& idx) {
      auto e = object("db.mysql.Index", idx.id);
      e.append(string_value("name", idx.name));
      e.append(string_value("indexType", idx.index_type));
      e.append(int_value("isPrimary", idx.index_type == "PRIMARY" ? 1 : 0));
      e.append(int_value("unique", idx.unique ? 1 : 0));
      auto& cols = e.append(list("columns", "db.mysql.IndexColumn"));
      int n = 0;
      for (const auto& [column_id, descend] : idx.columns) {
        auto ic = object("db.mysql.IndexColumn",
                         idx.id + "-c" + std::to_string(n++));
        ic.append(link("referencedColumn", column_id));
        ic.append(int_value("descend", descend ? 1 : 0));
        cols.append(std::move(ic));
      }
      return e;
    }

    xml_element
    foreign_key_element(const foreign_key_spec& fk) {
      auto e = object("db.mysql.ForeignKey", fk.id);
      e.append(string_value("name", fk.name));
      if (!fk.referenced_table.empty())
        e.append(link("referencedTable", fk.referenced_table));
      e.append(int_value("many", fk.many ? 1 : 0));
      e.append(int_value("mandatory", fk.mandatory ? 1 : 0));
      e.append(string_value("updateRule", fk.update_rule));
      e.append(string_value("deleteRule", fk.delete_rule));
      auto& cols = e.append(list("columns", "db.Column"));
      for (const auto& c : fk.columns) {
        xml_element l("link", {{"type", "object"}});
        l.set_text(c);
        cols.append(std::move(l));
      }
      return e;
    }

    xml_element
    trigger_element(const trigger_spec& t) {
      auto e = object("db.mysql.Trigger", t.id);
      e.append(string_value("name", t.name));
      e.append(string_value("timing", t.timing));
      e.append(string_value("event", t.event));
      return e;
    }

    xml_element
    table_element(const table_spec& t) {
      auto e = object("db.mysql.Table", t.id);
      e.append(string_value("name", t.name));
      e.append(string_value("nextAutoInc", t.next_auto_inc));
      auto& cols = e.append(list("columns", "db.mysql.Column"));
      for (const auto& c : t.columns) cols.append(column_element(c));
      auto& idxs = e.append(list("indices", "db.mysql.Index"));
      for (const auto& i : t.indices) idxs.append(index_element(i));
      auto& fks = e.append(list("foreignKeys", "db.mysql.ForeignKey"));
      for (const auto& fk : t.foreign_keys) fks.append(foreign_key_element(fk));
      auto& trgs = e.append(list("triggers", "db.mysql.Trigger"));
      for (const auto& trg : t.triggers) trgs.append(trigger_element(trg));
      return e;
    }

    xml_element
    diagram_element(const model_spec& m) {
      auto e = object("workbench.physical.Diagram", "diagram-1");
      e.append(string_value("name", m.diagram_name));
      e.append(list("connections", "workbench.physical.Connection"));
      auto& figs = e.append(list("figures", "model.Figure"));
      for (const auto& f : m.figures) {
        auto fe = object("workbench.physical.TableFigure", f.id);
        fe.append(link("table", f.table));
        if (!f.layer.empty()) fe.append(link("layer", f.layer));
        fe.append(real_value("left", f.left));
        fe.append(real_value("top", f.top));
        fe.append(string_value("color", f.color));
        figs.append(std::move(fe));
      }
      auto& layers = e.append(list("layers", "workbench.physical.Layer"));
      for (const auto& l : m.layers) {
        auto le = object("workbench.physical.Layer", l.id);
        le.append(string_value("name", l.name));
        le.append(real_value("left", l.left));
        le.append(real_value("top", l.top));
        le.append(string_value("color", l.color));
        layers.append(std::move(le));
      }
      return e;
    }

  } // namespace

  std::string
  simple_type(std::string_view name) {
    return "com.mysql.rdbms.mysql.datatype." + std::string(name);
  }

  const std::vector<std::string>&
  simple_type_names() {
    static const std::vector<std::string> names = {
        "tinyint",    "smallint", "mediumint",  "int",       "bigint",
        "float",      "double",   "decimal",    "char",      "varchar",
        "tinytext",   "text",     "mediumtext", "longtext",  "datetime",
        "datetime_f", "date",     "time",       "timestamp", "timestamp_f",
        "enum",       "json",     "blob",
    };
    return names;
  }

  xml_element
  mwb_root(const model_spec& m) {
    xml_element root("data", {{"grt_format", m.grt_format},
                              {"document_type", m.document_type},
                              {"version", "1.4.4"}});
    auto& doc = root.append(object("workbench.Document", "document-1"));
    doc.append(string_value("name", "Document"));
    auto& models = doc.append(list("physicalModels", "workbench.physical.Model"));
    auto& model = models.append(object("workbench.physical.Model", "model-1"));

    auto catalog = object("db.mysql.Catalog", "catalog-1");
    catalog.set_attribute("key", "catalog");
    auto& schemata = catalog.append(list("schemata", "db.mysql.Schema"));
    auto& schema = schemata.append(object("db.mysql.Schema", "schema-1"));
    schema.append(string_value("name", m.schema_name));
    auto& tables = schema.append(list("tables", "db.mysql.Table"));
    for (const auto& t : m.tables) tables.append(table_element(t));

    auto& simple = catalog.append(xml_element(
        "value", {{"type", "list"},
                  {"content-type", "object"},
                  {"content-struct-name", "db.SimpleDatatype"},
                  {"key", "simpleDatatypes"}}));
    for (const auto& n : simple_type_names()) {
      xml_element l("link", {{"type", "object"}});
      l.set_text(simple_type(n));
      simple.append(std::move(l));
    }
    auto& user = catalog.append(list("userDatatypes", "db.UserDatatype"));
    for (const auto& u : m.user_types) {
      auto ue = object("db.UserDatatype", u.id);
      ue.append(string_value("name", u.name));
      ue.append(link("actualType", u.actual_type));
      user.append(std::move(ue));
    }
    model.append(std::move(catalog));

    auto& diagrams = model.append(list("diagrams", "workbench.physical.Diagram"));
    diagrams.append(diagram_element(m));
    return root;
  }

  std::string
  mwb_document(const model_spec& m) {
    return serialize_document(mwb_root(m));
  }

  void
  write_mwb(const std::string& path, const model_spec& m) {
    write_zip(path, {{"lock", "", false}, {model_entry, mwb_document(m)}});
  }

  table_spec
  simple_table(std::string id, std::string name) {
    table_spec t;
    t.id = id;
    t.name = std::move(name);
    t.columns.push_back({.id = id + ".id",
                         .name = "id",
                         .type = simple_type("int"),
                         .not_null = true,
                         .auto_increment = true});
    t.indices.push_back({.id = id + ".pk",
                         .name = "PRIMARY",
                         .index_type = "PRIMARY",
                         .unique = true,
                         .columns = {{id + ".id", false}}});
    return t;
  }

} // namespace mwb2dbm::test
