#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>

#include "Catalog.h"

static std::vector<application_record_t> sample_catalog()
{
  return {
    { "RobotArm", "Pick and place demo", "alice" },
    { "Lamp", "Turns the desk light on", "bob" },
    { "Sentry", "Patrols the office with a robot", "carol" },
  };
}

TEST(CatalogSearch, EmptyTextMatchesEverything) {
  search_query_t query{ "", SEARCH_NAME };
  search_result_t result = catalog_search(sample_catalog(), query);
  EXPECT_EQ(result.count, 3);
  ASSERT_EQ(result.matches.size(), 3u);
  EXPECT_EQ(result.matches[0].name, "RobotArm");
  EXPECT_EQ(result.matches[2].name, "Sentry");
}

TEST(CatalogSearch, NoFieldsMatchesNothing) {
  search_query_t query{ "x", 0 };
  search_result_t result = catalog_search(sample_catalog(), query);
  EXPECT_EQ(result.count, 0);
  EXPECT_TRUE(result.matches.empty());

  query.text = "";
  EXPECT_EQ(catalog_search(sample_catalog(), query).count, 0);
}

TEST(CatalogSearch, CaseInsensitiveName) {
  search_query_t query{ "BOT", SEARCH_NAME };
  search_result_t result = catalog_search(sample_catalog(), query);
  ASSERT_EQ(result.count, 1);
  EXPECT_EQ(result.matches[0].name, "RobotArm");
}

TEST(CatalogSearch, OnlySelectedFieldsAreSearched) {
  search_query_t query{ "robot", SEARCH_DESCRIPTION };
  search_result_t result = catalog_search(sample_catalog(), query);
  ASSERT_EQ(result.count, 1);
  EXPECT_EQ(result.matches[0].name, "Sentry");

  query.fields = SEARCH_NAME | SEARCH_DESCRIPTION;
  EXPECT_EQ(catalog_search(sample_catalog(), query).count, 2);

  query = { "BOB", SEARCH_AUTHOR };
  result = catalog_search(sample_catalog(), query);
  ASSERT_EQ(result.count, 1);
  EXPECT_EQ(result.matches[0].name, "Lamp");
}

TEST(CatalogSearch, EmptyCatalog) {
  search_query_t query{ "", SEARCH_ALL };
  EXPECT_EQ(catalog_search({}, query).count, 0);
}

TEST(CatalogSearch, FieldNames) {
  unsigned int fields;
  std::string error;
  EXPECT_TRUE(search_fields_from_names({"name", "author"}, fields, error));
  EXPECT_EQ(fields, (unsigned int) (SEARCH_NAME | SEARCH_AUTHOR));

  EXPECT_TRUE(search_fields_from_names({}, fields, error));
  EXPECT_EQ(fields, 0u);

  EXPECT_FALSE(search_fields_from_names({"name", "title"}, fields, error));
  EXPECT_EQ(error, "bad field \"title\": must be name, description, or author");
}

TEST(Catalog, LoadFromArray) {
  Catalog catalog;
  std::string error;
  ASSERT_EQ(catalog.load_string(
	      "[{\"name\": \"Lamp\", \"description\": \"light\"},"
	      " {\"name\": \"Fan\", \"author\": \"dee\", \"rating\": 5}]",
	      error), Catalog::CATALOG_OK) << error;

  auto apps = catalog.list();
  ASSERT_EQ(apps.size(), 2u);
  EXPECT_EQ(apps[0].description, "light");
  EXPECT_EQ(apps[0].author, "");
  EXPECT_EQ(apps[1].author, "dee");
}

TEST(Catalog, LoadFromApplicationsObject) {
  Catalog catalog;
  std::string error;
  ASSERT_EQ(catalog.load_string(
	      "{\"applications\": [{\"name\": \"Lamp\"}]}", error),
	    Catalog::CATALOG_OK) << error;
  EXPECT_EQ(catalog.size(), 1);
}

TEST(Catalog, RejectsBadDocuments) {
  Catalog catalog;
  catalog.add({ "Keep", "", "" });
  std::string error;

  EXPECT_EQ(catalog.load_string("[{\"description\": \"no name\"}]", error),
	    Catalog::CATALOG_ERROR);
  EXPECT_EQ(error, "catalog entry 0 has no name");

  EXPECT_EQ(catalog.load_string("{\"apps\": []}", error),
	    Catalog::CATALOG_ERROR);
  EXPECT_EQ(catalog.load_string("[1, 2", error), Catalog::CATALOG_ERROR);

  // a failed load leaves the previous records alone
  ASSERT_EQ(catalog.size(), 1);
  EXPECT_EQ(catalog.list()[0].name, "Keep");
}

TEST(Catalog, LoadFile) {
  std::string path = ::testing::TempDir() + "rqserv_catalog.json";
  {
    std::ofstream out(path);
    out << "[{\"name\": \"RobotArm\", \"author\": \"alice\"}]";
  }

  Catalog catalog;
  std::string error;
  ASSERT_EQ(catalog.load(path, error), Catalog::CATALOG_OK) << error;
  EXPECT_EQ(catalog.size(), 1);
  std::remove(path.c_str());

  EXPECT_EQ(catalog.load(path, error), Catalog::CATALOG_ERROR);
  EXPECT_EQ(catalog.size(), 1);
}
