#pragma once

#include <stdexcept>
#include <string>

namespace mwb2dbm {

  // Base of every fatal condition raised while converting a model.
  class conversion_error : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
  };

  class key_not_found : public conversion_error {
  public:
    using conversion_error::conversion_error;
  };

  class duplicate_key : public conversion_error {
  public:
    using conversion_error::conversion_error;
  };

  class unsupported_attribute_type : public conversion_error {
  public:
    using conversion_error::conversion_error;
  };

  // A present attribute whose declared type does not match the field
  // it is bound to, or whose text does not parse as that type.
  class attribute_type_error : public conversion_error {
  public:
    using conversion_error::conversion_error;
  };

  class unrecognized_native_type : public conversion_error {
  public:
    using conversion_error::conversion_error;
  };

  class duplicate_type_id : public conversion_error {
  public:
    using conversion_error::conversion_error;
  };

  class unresolved_reference : public conversion_error {
  public:
    using conversion_error::conversion_error;
  };

  class column_not_found : public unresolved_reference {
  public:
    using unresolved_reference::unresolved_reference;
  };

  class invalid_numeric_spec : public conversion_error {
  public:
    using conversion_error::conversion_error;
  };

  class invalid_column_spec : public conversion_error {
  public:
    using conversion_error::conversion_error;
  };

  class invalid_file_format : public conversion_error {
  public:
    using conversion_error::conversion_error;
  };

  class not_implemented : public conversion_error {
  public:
    using conversion_error::conversion_error;
  };

  class not_found_error : public conversion_error {
  public:
    using conversion_error::conversion_error;
  };

  class archive_error : public conversion_error {
  public:
    using conversion_error::conversion_error;
  };

  class config_error : public conversion_error {
  public:
    using conversion_error::conversion_error;
  };

} // namespace mwb2dbm
