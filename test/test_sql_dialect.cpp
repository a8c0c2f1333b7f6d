#include "sql_dialect.hpp"
#include "sql_generator.hpp"
#include "table_name.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <optional>
#include <string>

using Catch::Matchers::ContainsSubstring;

TEST_CASE("Identifier quoting", "[sql_dialect]") {
  const TsqlDialect tsql;
  const DuckDBDialect duckdb_dialect;

  REQUIRE(tsql.quote_identifier("Business_Unit_Cd") == "[Business_Unit_Cd]");
  REQUIRE(tsql.quote_identifier("a]b") == "[a]]b]");
  REQUIRE(duckdb_dialect.quote_identifier("Business_Unit_Cd") ==
          "\"Business_Unit_Cd\"");
  REQUIRE(duckdb_dialect.quote_identifier("a\"b") == "\"a\"\"b\"");
}

TEST_CASE("T-SQL statement shapes", "[sql_dialect]") {
  const TsqlDialect tsql;

  REQUIRE(tsql.clone_empty_table("[dbo].[dim]", "[dbo].[stg]") ==
          "SELECT * INTO [dbo].[dim] FROM [dbo].[stg] WHERE 1 = 0");
  REQUIRE(tsql.add_column("[dbo].[dim]", "Dim_Id", "BIGINT") ==
          "ALTER TABLE [dbo].[dim] ADD [Dim_Id] BIGINT NULL");
  REQUIRE(tsql.row_number({}) ==
          "ROW_NUMBER() OVER (ORDER BY (SELECT NULL))");
  REQUIRE(tsql.row_number({"src.[a]", "src.[b]"}) ==
          "ROW_NUMBER() OVER (ORDER BY src.[a], src.[b])");
  REQUIRE(tsql.update_from_join("[dim]", "[stg]", {"Name", "Region"}, {"Cd"},
                                "") ==
          "UPDATE tgt SET tgt.[Name] = src.[Name], tgt.[Region] = "
          "src.[Region] FROM [dim] AS tgt INNER JOIN [stg] AS src ON "
          "tgt.[Cd] = src.[Cd]");
}

TEST_CASE("DuckDB statement shapes", "[sql_dialect]") {
  const DuckDBDialect duckdb_dialect;

  REQUIRE(duckdb_dialect.clone_empty_table("\"dim\"", "\"stg\"") ==
          "CREATE TABLE \"dim\" AS SELECT * FROM \"stg\" LIMIT 0");
  REQUIRE(duckdb_dialect.add_column("\"dim\"", "Dim_Id", "BIGINT") ==
          "ALTER TABLE \"dim\" ADD COLUMN \"Dim_Id\" BIGINT");
  REQUIRE(duckdb_dialect.update_from_join("\"dim\"", "\"stg\"", {"Name"},
                                          {"Cd", "Region"},
                                          "tgt.\"Id\" IS NOT NULL") ==
          "UPDATE \"dim\" AS tgt SET \"Name\" = src.\"Name\" FROM \"stg\" AS "
          "src WHERE tgt.\"Cd\" = src.\"Cd\" AND tgt.\"Region\" = "
          "src.\"Region\" AND tgt.\"Id\" IS NOT NULL");
}

TEST_CASE("Merge insert numbers unmatched rows", "[sql_generator]") {
  const TsqlDialect tsql;
  const MergeSqlGenerator sql_generator(tsql);
  const table_def target{"dbo", "Dim_Business_Unit"};
  const table_def source{"stg", "Business_Unit"};

  const auto sql = sql_generator.insert_unmatched(
      target, source, {"Business_Unit_Cd", "Business_Unit_Name"},
      {"Business_Unit_Cd"}, "Business_Unit_Id", 41);

  REQUIRE(sql ==
          "INSERT INTO [dbo].[Dim_Business_Unit] ([Business_Unit_Id], "
          "[Business_Unit_Cd], [Business_Unit_Name]) SELECT 41 + "
          "numbered_rows.rn AS [Business_Unit_Id], "
          "numbered_rows.[Business_Unit_Cd], "
          "numbered_rows.[Business_Unit_Name] FROM (SELECT "
          "src.[Business_Unit_Cd], src.[Business_Unit_Name], ROW_NUMBER() "
          "OVER (ORDER BY src.[Business_Unit_Cd]) AS rn FROM "
          "[stg].[Business_Unit] AS src WHERE NOT EXISTS (SELECT 1 FROM "
          "[dbo].[Dim_Business_Unit] AS tgt WHERE tgt.[Business_Unit_Cd] = "
          "src.[Business_Unit_Cd])) AS numbered_rows");
  REQUIRE(sql_generator.count_numbered_rows(target, "Business_Unit_Id", 41) ==
          "SELECT COUNT(*) FROM [dbo].[Dim_Business_Unit] WHERE "
          "[Business_Unit_Id] > 41");
}

TEST_CASE("Delta statements", "[sql_generator]") {
  const DuckDBDialect duckdb_dialect;
  const MergeSqlGenerator sql_generator(duckdb_dialect);
  const table_def target{std::nullopt, "dim"};
  const table_def source{std::nullopt, "stg"};

  REQUIRE(sql_generator.insert_values(target, {"a", "b"}, 3) ==
          "INSERT INTO \"dim\" (\"a\", \"b\") VALUES (?, ?), (?, ?), (?, ?)");

  const auto select_sql =
      sql_generator.select_missing_rows(source, target, {"k1", "k2", "v"},
                                        {"k1", "k2"});
  REQUIRE_THAT(select_sql,
               ContainsSubstring("tgt.\"k1\" = src.\"k1\" AND tgt.\"k2\" = "
                                 "src.\"k2\""));
  REQUIRE_THAT(select_sql, ContainsSubstring("ORDER BY src.\"k1\", src.\"k2\""));
}

TEST_CASE("Data-quality count statements", "[sql_generator]") {
  const TsqlDialect tsql;
  const MergeSqlGenerator sql_generator(tsql);
  const table_def table{std::nullopt, "stg"};

  REQUIRE(sql_generator.count_null_rows(table, {"a", "b"}) ==
          "SELECT COUNT(*) FROM [stg] WHERE [a] IS NULL OR [b] IS NULL");
  REQUIRE(sql_generator.count_duplicate_keys(table, {"a"}) ==
          "SELECT COUNT(*) FROM (SELECT [a] FROM [stg] GROUP BY [a] HAVING "
          "COUNT(*) > 1) AS duplicate_keys");
  REQUIRE(sql_generator.drop_table(table) == "DROP TABLE IF EXISTS [stg]");
}
