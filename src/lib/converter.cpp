#include <mwb2dbm/archive_reader.hpp>
#include <mwb2dbm/converter.hpp>
#include <mwb2dbm/error.hpp>
#include <mwb2dbm/schema_graph.hpp>

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace mwb2dbm {

  namespace {

    const std::string document_struct = "workbench.Document";
    const std::string physical_model_struct = "workbench.physical.Model";

    std::string
    attribute_or_empty(const xml_element& e, std::string_view name) {
      const auto* v = e.attribute(name);
      return v != nullptr ? *v : std::string();
    }

  } // namespace

  std::string
  output_path_for(const std::string& input) {
    std::filesystem::path p(input);
    p.replace_extension(".dbm");
    return p.string();
  }

  xml_element
  load_model_document(const std::string& path) {
    return parse_document(extract_archive_entry(path, model_entry));
  }

  const xml_element&
  document_value(const xml_element& root) {
    std::string format = attribute_or_empty(root, "grt_format");
    if (format != expected_grt_format) {
      throw invalid_file_format("converter: unsupported grt_format '" +
                                format + "'");
    }
    std::string type = attribute_or_empty(root, "document_type");
    if (type != expected_document_type) {
      throw invalid_file_format("converter: unsupported document_type '" +
                                type + "'");
    }

    auto children = root.child_elements();
    if (children.empty() || children.front()->name() != "value" ||
        attribute_or_empty(*children.front(), "struct-name") !=
            document_struct) {
      throw invalid_file_format("converter: first element is not a " +
                                document_struct + " value");
    }
    return *children.front();
  }

  const xml_element&
  first_physical_model(const xml_element& document, diagnostics& diag) {
    const auto* models = document.find_child("value", "key", "physicalModels");
    std::vector<const xml_element*> found;
    if (models != nullptr) {
      for (const auto* m : models->child_elements("value")) {
        if (attribute_or_empty(*m, "struct-name") == physical_model_struct)
          found.push_back(m);
      }
    }
    if (found.empty()) {
      throw invalid_file_format("converter: document has no " +
                                physical_model_struct);
    }
    if (found.size() > 1) {
      diag.info("Document has " + std::to_string(found.size()) +
                " physical models, using the first one");
    }
    return *found.front();
  }

  xml_element
  convert_document(const xml_element& root, const synthesis_options& options,
                   diagnostics& diag) {
    const auto& model = first_physical_model(document_value(root), diag);
    schema_graph graph = build_schema_graph(model, diag);
    return synthesize_dbm(graph, options, diag);
  }

} // namespace mwb2dbm
