#include <mwb2dbm/error.hpp>
#include <mwb2dbm/naming.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>

using namespace mwb2dbm;

TEST_CASE("to_lower folds ASCII letters only", "[naming]") {
  CHECK(to_lower("Sales Layer") == "sales layer");
  CHECK(to_lower("ÄB") == "Äb");
  CHECK(to_lower("") == "");
}

TEST_CASE("short index names are kept", "[naming]") {
  CHECK(fit_index_name("orders_customer_idx") == "orders_customer_idx");
  CHECK(fit_index_name("no_suffix") == "no_suffix");
}

TEST_CASE("name of exactly 63 characters is kept", "[naming]") {
  std::string name(63, 'a');
  CHECK(fit_index_name(name) == name);
}

TEST_CASE("overlong _idx name is cut to 63 and keeps the suffix",
          "[naming]") {
  std::string name = std::string(66, 'x') + "_idx";
  REQUIRE(name.size() == 70);

  auto fitted = fit_index_name(name);
  CHECK(fitted.size() == max_identifier_length);
  CHECK(fitted.ends_with("_idx"));
  CHECK(fitted == std::string(59, 'x') + "_idx");
}

TEST_CASE("overlong name without _idx is rejected", "[naming]") {
  std::string name(70, 'y');
  CHECK_THROWS_AS(fit_index_name(name), not_implemented);
}

TEST_CASE("index names are prefixed with the table when asked", "[naming]") {
  CHECK(index_name_for("orders", "fk_customer_idx", true) ==
        "orders_fk_customer_idx");
  CHECK(index_name_for("orders", "fk_customer_idx", false) ==
        "fk_customer_idx");
}

TEST_CASE("index names already naming the table are not prefixed",
          "[naming]") {
  CHECK(index_name_for("orders", "orders_date_idx", true) ==
        "orders_date_idx");
  CHECK(index_name_for("orders", "idx_orders_date", true) ==
        "idx_orders_date");
}

TEST_CASE("prefixing can push a name over the limit", "[naming]") {
  std::string index = std::string(50, 'c') + "_idx";
  auto name = index_name_for("customer_addresses", index, true);
  CHECK(name.size() == max_identifier_length);
  CHECK(name.starts_with("customer_addresses_"));
  CHECK(name.ends_with("_idx"));
}

TEST_CASE("update timestamp emulation names", "[naming]") {
  CHECK(update_function_name("updated_at") == "update_updated_at_on_update");
  CHECK(update_trigger_name("orders", "updated_at") ==
        "orders_t_update_updated_at");
  CHECK(qualified("orders") == "public.orders");
}
