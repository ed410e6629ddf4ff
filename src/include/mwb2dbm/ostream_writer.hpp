#pragma once

#include <mwb2dbm/xml_writer.hpp>

#include <memory>
#include <ostream>

namespace mwb2dbm {

  class ostream_writer : public xml_writer {
  public:
    // With `pretty` set, element-only content is indented by two spaces per
    // level. Elements holding text are written inline so their text is
    // never altered.
    explicit ostream_writer(std::ostream& os, bool pretty = false);
    ~ostream_writer() override;

    ostream_writer(const ostream_writer&) = delete;
    ostream_writer&
    operator=(const ostream_writer&) = delete;
    ostream_writer(ostream_writer&&) noexcept;
    ostream_writer&
    operator=(ostream_writer&&) noexcept;

    void
    start_element(std::string_view name) override;

    void
    end_element() override;

    void
    attribute(std::string_view name, std::string_view value) override;

    void
    characters(std::string_view text) override;

  private:
    struct impl;
    std::unique_ptr<impl> impl_;
  };

} // namespace mwb2dbm
