#pragma once

#include <mwb2dbm/dbm_synthesizer.hpp>
#include <mwb2dbm/diagnostics.hpp>
#include <mwb2dbm/xml_element.hpp>

#include <string>

namespace mwb2dbm {

  // Name of the model document inside an .mwb container.
  inline constexpr const char* model_entry = "document.mwb.xml";

  inline constexpr const char* expected_grt_format = "2.0";
  inline constexpr const char* expected_document_type = "MySQL Workbench Model";

  // `input` with its extension replaced by ".dbm".
  std::string
  output_path_for(const std::string& input);

  // Extracts and parses the model document of the .mwb container at
  // `path`. Throws archive_error, not_found_error, or std::runtime_error on
  // malformed XML.
  xml_element
  load_model_document(const std::string& path);

  // Throws invalid_file_format unless `root` is a GRT 2.0 Workbench model
  // whose first child is the workbench.Document value.
  const xml_element&
  document_value(const xml_element& root);

  // First workbench.physical.Model of the document.
  const xml_element&
  first_physical_model(const xml_element& document, diagnostics& diag);

  // Validates `root`, builds the schema graph of its first physical model
  // and synthesizes the destination model.
  xml_element
  convert_document(const xml_element& root, const synthesis_options& options,
                   diagnostics& diag);

} // namespace mwb2dbm
