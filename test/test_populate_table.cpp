#include "dimension_loader.hpp"
#include "ds_error.hpp"
#include "row_count.hpp"
#include "schema_introspector.hpp"
#include "test_helpers.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <optional>
#include <string>

using namespace test_helpers;
using Catch::Matchers::ContainsSubstring;

namespace {
void create_business_unit_tables(test_warehouse &warehouse) {
  warehouse.run(
      "CREATE TABLE tbl_d_business_unit (Business_Unit_Id INTEGER PRIMARY "
      "KEY, Business_Unit_Cd VARCHAR UNIQUE, Business_Unit VARCHAR, "
      "Business_Unit_Desc VARCHAR, Batch_Id INTEGER, Insert_Date TIMESTAMP, "
      "Update_Date TIMESTAMP)");
  warehouse.run("CREATE TABLE stg_d_business_unit (Business_Unit_Cd VARCHAR, "
                "Business_Unit VARCHAR, Business_Unit_Desc VARCHAR, Batch_Id "
                "INTEGER, Insert_Date TIMESTAMP, Update_Date TIMESTAMP)");

  warehouse.run("INSERT INTO tbl_d_business_unit VALUES (101, 'BU1', 'Unit "
                "1', 'Description 1', 1, NULL, NULL)");
  warehouse.run(
      "INSERT INTO stg_d_business_unit VALUES ('BU1', 'Unit 1 Updated', "
      "'Description 1 Updated', 2, NULL, NULL), ('BU2', 'Unit 2', "
      "'Description 2', 2, NULL, NULL)");
}

merge_spec business_unit_spec() {
  merge_spec spec;
  spec.target = {std::nullopt, "tbl_d_business_unit"};
  spec.source = {std::nullopt, "stg_d_business_unit"};
  spec.match_keys = {"Business_Unit_Cd"};
  spec.surrogate_key_column = "Business_Unit_Id";
  spec.update_columns = {"Business_Unit", "Business_Unit_Desc", "Batch_Id",
                         "Update_Date"};
  spec.insert_columns = {"Business_Unit_Cd", "Business_Unit",
                         "Business_Unit_Desc", "Batch_Id", "Insert_Date"};
  return spec;
}
} // namespace

TEST_CASE("Merge updates matched and inserts new rows", "[merge]") {
  test_warehouse warehouse;
  recording_logger log;
  DimensionLoader loader(log.logger);
  create_business_unit_tables(warehouse);

  const auto result =
      loader.populate_table_from_source(warehouse.con, business_unit_spec());
  REQUIRE(result.rows_updated == 1);
  REQUIRE(result.rows_inserted == 1);
  REQUIRE(result.inserted_count_origin == row_count::origin::reported);

  REQUIRE(warehouse.count("SELECT COUNT(*) FROM tbl_d_business_unit") == 2);
  REQUIRE(warehouse.count("SELECT Batch_Id FROM tbl_d_business_unit WHERE "
                          "Business_Unit_Cd = 'BU1'") == 2);
  REQUIRE(warehouse.count("SELECT Business_Unit_Id FROM tbl_d_business_unit "
                          "WHERE Business_Unit_Cd = 'BU1'") == 101);
  REQUIRE(warehouse.count("SELECT Business_Unit_Id FROM tbl_d_business_unit "
                          "WHERE Business_Unit_Cd = 'BU2'") == 102);
  REQUIRE(warehouse.count(
              "SELECT COUNT(*) FROM tbl_d_business_unit WHERE Business_Unit = "
              "'Unit 1 Updated'") == 1);
  REQUIRE(log.sink->contains("INFO", "numbered_rows"));

  SECTION("a second run inserts nothing") {
    const auto second =
        loader.populate_table_from_source(warehouse.con, business_unit_spec());
    REQUIRE(second.rows_updated == 2);
    REQUIRE(second.rows_inserted == 0);
    REQUIRE(warehouse.count("SELECT COUNT(*) FROM tbl_d_business_unit") == 2);
  }
}

TEST_CASE("Merge drops the source when asked", "[merge]") {
  test_warehouse warehouse;
  recording_logger log;
  DimensionLoader loader(log.logger);
  create_business_unit_tables(warehouse);

  auto spec = business_unit_spec();
  spec.drop_source_after = true;
  loader.populate_table_from_source(warehouse.con, spec);

  REQUIRE_FALSE(SchemaIntrospector(warehouse.con).table_exists(spec.source));
  REQUIRE_THROWS_AS(warehouse.count("SELECT COUNT(*) FROM stg_d_business_unit"),
                    ds_error::DatabaseError);
}

TEST_CASE("Merge into an empty target starts at the default id", "[merge]") {
  test_warehouse warehouse;
  recording_logger log;
  DimensionLoader loader(log.logger);
  create_business_unit_tables(warehouse);
  warehouse.run("DELETE FROM tbl_d_business_unit");

  auto spec = business_unit_spec();
  spec.default_start_id = 500;
  const auto result = loader.populate_table_from_source(warehouse.con, spec);
  REQUIRE(result.rows_updated == 0);
  REQUIRE(result.rows_inserted == 2);
  REQUIRE(warehouse.count("SELECT Business_Unit_Id FROM tbl_d_business_unit "
                          "WHERE Business_Unit_Cd = 'BU1'") == 501);
  REQUIRE(warehouse.count("SELECT Business_Unit_Id FROM tbl_d_business_unit "
                          "WHERE Business_Unit_Cd = 'BU2'") == 502);
}

TEST_CASE("Merge counts inserted rows when the driver does not", "[merge]") {
  test_warehouse warehouse;
  recording_logger log;
  DimensionLoader loader(log.logger);
  create_business_unit_tables(warehouse);

  SECTION("fallback count") {
    CountlessConnection con(warehouse.con);
    const auto result =
        loader.populate_table_from_source(con, business_unit_spec());
    REQUIRE(result.rows_updated == 1);
    REQUIRE(result.rows_inserted == 1);
    REQUIRE(result.inserted_count_origin == row_count::origin::counted);
  }

  SECTION("failing fallback count degrades to 0") {
    CountlessConnection con(warehouse.con, true);
    const auto result =
        loader.populate_table_from_source(con, business_unit_spec());
    REQUIRE(result.rows_updated == 1);
    REQUIRE(result.rows_inserted == 0);
    REQUIRE(result.inserted_count_origin == row_count::origin::unavailable);
    REQUIRE(log.sink->contains(
        "WARNING", "Could not determine row count from fallback count SQL"));
    // the merge itself was committed
    REQUIRE(warehouse.count("SELECT COUNT(*) FROM tbl_d_business_unit") == 2);
  }
}

TEST_CASE("Merge validates its input before touching data", "[merge]") {
  test_warehouse warehouse;
  recording_logger log;
  DimensionLoader loader(log.logger);
  create_business_unit_tables(warehouse);
  auto spec = business_unit_spec();

  SECTION("empty column lists") {
    spec.update_columns.clear();
    REQUIRE_THROWS_AS(loader.populate_table_from_source(warehouse.con, spec),
                      ds_error::ValidationError);
  }

  SECTION("missing column") {
    spec.insert_columns.push_back("Region");
    REQUIRE_THROWS_WITH(loader.populate_table_from_source(warehouse.con, spec),
                        ContainsSubstring("Region"));
  }

  SECTION("surrogate key listed as update column") {
    spec.update_columns.push_back("Business_Unit_Id");
    REQUIRE_THROWS_AS(loader.populate_table_from_source(warehouse.con, spec),
                      ds_error::ValidationError);
  }

  SECTION("surrogate key used as match key") {
    spec.match_keys = {"Business_Unit_Id"};
    REQUIRE_THROWS_AS(loader.populate_table_from_source(warehouse.con, spec),
                      ds_error::ValidationError);
    spec.match_keys = {"Business_Unit_Cd", "Business_Unit_Id"};
    REQUIRE_THROWS_WITH(loader.populate_table_from_source(warehouse.con, spec),
                        ContainsSubstring("must not be part of `match_keys`"));
  }

  SECTION("unsafe table name") {
    spec.target.table_name = "tbl; DROP TABLE x";
    REQUIRE_THROWS_AS(loader.populate_table_from_source(warehouse.con, spec),
                      ds_error::InvalidIdentifier);
  }

  SECTION("missing source table") {
    spec.source.table_name = "stg_missing";
    REQUIRE_THROWS_WITH(loader.populate_table_from_source(warehouse.con, spec),
                        ContainsSubstring("does not exist"));
  }

  REQUIRE(warehouse.count("SELECT Batch_Id FROM tbl_d_business_unit") == 1);
}

TEST_CASE("Merge rolls back on database errors", "[merge]") {
  test_warehouse warehouse;
  recording_logger log;
  DimensionLoader loader(log.logger);
  create_business_unit_tables(warehouse);
  // the duplicated new key violates the UNIQUE constraint of the target
  warehouse.run("INSERT INTO stg_d_business_unit VALUES ('BU3', 'Unit 3', "
                "'Description 3', 2, NULL, NULL), ('BU3', 'Unit 3', "
                "'Description 3', 2, NULL, NULL)");

  REQUIRE_THROWS_AS(
      loader.populate_table_from_source(warehouse.con, business_unit_spec()),
      ds_error::DatabaseError);
  REQUIRE(log.sink->contains(
      "SEVERE", "Database error occurred during populate_table_from_source"));

  REQUIRE(warehouse.count("SELECT COUNT(*) FROM tbl_d_business_unit") == 1);
  REQUIRE(warehouse.count("SELECT Batch_Id FROM tbl_d_business_unit") == 1);
}
