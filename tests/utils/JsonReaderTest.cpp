/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE JsonReaderTest
#include "utils/JsonReader.hpp"
#include <boost/test/unit_test.hpp>
#include <cstdio>
#include <fstream>
#include <string>

using namespace GridRoute;

BOOST_AUTO_TEST_SUITE(JsonValueTests)

BOOST_AUTO_TEST_CASE(TestBasicTypes) {
  JsonValue nullVal;
  BOOST_CHECK(nullVal.isNull());
  BOOST_CHECK_EQUAL(nullVal.getType(), JsonType::Null);
  BOOST_CHECK_EQUAL(nullVal.toString(), "null");

  JsonValue trueVal(true);
  BOOST_CHECK(trueVal.isBool());
  BOOST_CHECK_EQUAL(trueVal.toString(), "true");

  JsonValue intVal(42);
  JsonValue doubleVal(0.125);
  BOOST_CHECK(intVal.isNumber());
  BOOST_CHECK(intVal.isInteger());
  BOOST_CHECK(!doubleVal.isInteger());
  BOOST_CHECK_EQUAL(intVal.toString(), "42");
  BOOST_CHECK_EQUAL(doubleVal.toString(), "0.125");

  JsonValue stringVal("cell");
  BOOST_CHECK(stringVal.isString());
  BOOST_CHECK_EQUAL(stringVal.toString(), "\"cell\"");
}

BOOST_AUTO_TEST_CASE(TestSafeAccessors) {
  JsonValue text("optimal");
  JsonValue whole(7);
  JsonValue fraction(7.5);

  BOOST_CHECK_EQUAL(text.tryAsString().value(), "optimal");
  BOOST_CHECK(!text.tryAsInt().has_value());
  BOOST_CHECK_EQUAL(whole.tryAsInt().value(), 7);
  BOOST_CHECK(!whole.tryAsString().has_value());
  // Fractional numbers are not silently truncated
  BOOST_CHECK(!fraction.tryAsInt().has_value());
  BOOST_CHECK_CLOSE(fraction.tryAsNumber().value(), 7.5, 0.001);
  BOOST_CHECK(text.tryAsArray() == nullptr);
  BOOST_CHECK(text.tryAsObject() == nullptr);
}

BOOST_AUTO_TEST_CASE(TestObjectBuilding) {
  JsonValue point;
  point["x"] = JsonValue(3);
  point["y"] = JsonValue(4);
  BOOST_CHECK(point.isObject());
  BOOST_CHECK_EQUAL(point.size(), 2);
  BOOST_CHECK(point.hasKey("x"));
  BOOST_CHECK(!point.hasKey("z"));

  const JsonValue &view = point;
  BOOST_CHECK(view["z"].isNull());
  BOOST_CHECK(view[0].isNull());
}

BOOST_AUTO_TEST_CASE(TestArrayBuilding) {
  JsonValue path;
  path.push_back(JsonValue(1));
  path.push_back(JsonValue("two"));
  BOOST_CHECK(path.isArray());
  BOOST_CHECK_EQUAL(path.size(), 2);
  BOOST_CHECK_EQUAL(path[1].asString(), "two");
  BOOST_CHECK(path[5].isNull());
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(JsonWriterTests)

BOOST_AUTO_TEST_CASE(TestKeysWrittenInSortedOrder) {
  JsonValue doc;
  doc["total_distance"] = JsonValue(4);
  doc["algorithm_used"] = JsonValue("optimal");
  doc["path"] = JsonValue(JsonArray{});
  BOOST_CHECK_EQUAL(doc.toString(),
                    "{\"algorithm_used\":\"optimal\",\"path\":[],\"total_distance\":4}");
}

BOOST_AUTO_TEST_CASE(TestStringEscaping) {
  JsonValue text(std::string("line\n\"quoted\"\\tab\t\x01"));
  BOOST_CHECK_EQUAL(text.toString(), "\"line\\n\\\"quoted\\\"\\\\tab\\t\\u0001\"");
}

BOOST_AUTO_TEST_CASE(TestPrettyPrinting) {
  JsonValue doc;
  doc["a"] = JsonValue(1);
  JsonArray list;
  list.push_back(JsonValue(true));
  doc["b"] = JsonValue(list);
  BOOST_CHECK_EQUAL(doc.toPrettyString(), "{\n  \"a\": 1,\n  \"b\": [\n    true\n  ]\n}");
}

BOOST_AUTO_TEST_CASE(TestWrittenTextParsesBack) {
  JsonValue doc;
  doc["message"] = JsonValue("tab\there \u00e9");
  doc["seconds"] = JsonValue(0.0015);

  JsonReader reader;
  BOOST_REQUIRE(reader.parse(doc.toString()));
  BOOST_CHECK_EQUAL(reader.getRoot()["message"].asString(), "tab\there \u00e9");
  BOOST_CHECK_CLOSE(reader.getRoot()["seconds"].asNumber(), 0.0015, 0.001);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(JsonReaderParsingTests)

BOOST_AUTO_TEST_CASE(TestScalars) {
  JsonReader reader;

  BOOST_CHECK(reader.parse("null"));
  BOOST_CHECK(reader.getRoot().isNull());

  BOOST_CHECK(reader.parse("false"));
  BOOST_CHECK_EQUAL(reader.getRoot().asBool(), false);

  BOOST_CHECK(reader.parse("-17"));
  BOOST_CHECK_EQUAL(reader.getRoot().asInt(), -17);

  BOOST_CHECK(reader.parse("1.5e2"));
  BOOST_CHECK_CLOSE(reader.getRoot().asNumber(), 150.0, 0.001);

  BOOST_CHECK(reader.parse("0"));
  BOOST_CHECK_EQUAL(reader.getRoot().asInt(), 0);

  BOOST_CHECK(reader.parse("\"fast\""));
  BOOST_CHECK_EQUAL(reader.getRoot().asString(), "fast");
}

BOOST_AUTO_TEST_CASE(TestStringEscapes) {
  JsonReader reader;

  BOOST_CHECK(reader.parse("\"a\\nb\\t\\\"c\\\\d\\/e\""));
  BOOST_CHECK_EQUAL(reader.getRoot().asString(), "a\nb\t\"c\\d/e");

  BOOST_CHECK(reader.parse("\"\\u0041\\u00e9\""));
  BOOST_CHECK_EQUAL(reader.getRoot().asString(), "A\u00e9");

  // Surrogate pair for U+1F600
  BOOST_CHECK(reader.parse("\"\\ud83d\\ude00\""));
  BOOST_CHECK_EQUAL(reader.getRoot().asString(), "\xF0\x9F\x98\x80");
}

BOOST_AUTO_TEST_CASE(TestGridDocument) {
  JsonReader reader;
  const std::string request = R"({
        "grid": [[0, 0, 1],
                 [1, 0, 0]],
        "start": {"x": 0, "y": 0},
        "end": {"x": 1, "y": 2},
        "pickup_points": [],
        "algorithm": "balanced"
    })";

  BOOST_REQUIRE(reader.parse(request));
  const auto &root = reader.getRoot();
  BOOST_CHECK_EQUAL(root["grid"].size(), 2);
  BOOST_CHECK_EQUAL(root["grid"][0][2].asInt(), 1);
  BOOST_CHECK_EQUAL(root["end"]["y"].asInt(), 2);
  BOOST_CHECK(root["pickup_points"].isArray());
  BOOST_CHECK_EQUAL(root["pickup_points"].size(), 0);
  BOOST_CHECK_EQUAL(root["algorithm"].asString(), "balanced");
}

BOOST_AUTO_TEST_CASE(TestDuplicateKeysKeepLast) {
  JsonReader reader;
  BOOST_REQUIRE(reader.parse(R"({"algorithm": "fast", "algorithm": "optimal"})"));
  BOOST_CHECK_EQUAL(reader.getRoot().size(), 1);
  BOOST_CHECK_EQUAL(reader.getRoot()["algorithm"].asString(), "optimal");
}

BOOST_AUTO_TEST_CASE(TestFailedParseClearsRoot) {
  JsonReader reader;
  BOOST_REQUIRE(reader.parse("[1, 2]"));
  BOOST_CHECK(!reader.parse("[1, 2"));
  BOOST_CHECK(reader.getRoot().isNull());

  BOOST_CHECK(reader.parse("3"));
  BOOST_CHECK(reader.getLastError().empty());
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(JsonReaderErrorTests)

BOOST_AUTO_TEST_CASE(TestInvalidDocuments) {
  JsonReader reader;
  const char *invalid[] = {
      "",
      "   ",
      "hello",
      "{\"key\": \"value\",}",
      "[1, 2, 3,]",
      "{\"key\": \"value\"",
      "[1, 2, 3",
      "123.",
      "01",
      "-",
      "1e",
      "\"hello",
      "\"bad\\x\"",
      "\"\\ud83d\"",
      "42 43",
      "{\"key\" \"value\"}",
      "{42: \"value\"}",
      "[1 2 3]",
      "truee",
      "nul",
      "@",
  };

  for (const char *text : invalid) {
    BOOST_TEST_CONTEXT("input: " << text) {
      BOOST_CHECK(!reader.parse(text));
      BOOST_CHECK(!reader.getLastError().empty());
    }
  }
}

BOOST_AUTO_TEST_CASE(TestControlCharacterInString) {
  JsonReader reader;
  BOOST_CHECK(!reader.parse(std::string("\"a\nb\"")));
}

BOOST_AUTO_TEST_CASE(TestErrorReportsPosition) {
  JsonReader reader;
  BOOST_CHECK(!reader.parse("{\n  \"grid\": [0, 1,, 0]\n}"));
  const std::string &error = reader.getLastError();
  BOOST_CHECK(error.find("Line 2") != std::string::npos);
  BOOST_CHECK(error.find("Column") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(TestNestingLimit) {
  JsonReader reader;
  const size_t deep = JsonReader::MAX_DEPTH + 10;
  std::string text(deep, '[');
  text += std::string(deep, ']');
  BOOST_CHECK(!reader.parse(text));
  BOOST_CHECK(reader.getLastError().find("depth") != std::string::npos);

  std::string shallow(10, '[');
  shallow += std::string(10, ']');
  BOOST_CHECK(reader.parse(shallow));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(JsonReaderFileTests)

BOOST_AUTO_TEST_CASE(TestSaveAndLoad) {
  const std::string filename = "jsonreader_test_temp.json";

  JsonValue doc;
  doc["planner"]["cache_capacity"] = JsonValue(250);
  doc["planner"]["reject_duplicate_waypoints"] = JsonValue(false);
  BOOST_REQUIRE(JsonReader::saveToFile(doc, filename));

  JsonReader reader;
  BOOST_REQUIRE(reader.loadFromFile(filename));
  BOOST_CHECK_EQUAL(reader.getRoot()["planner"]["cache_capacity"].asInt(), 250);
  BOOST_CHECK_EQUAL(reader.getRoot()["planner"]["reject_duplicate_waypoints"].asBool(), false);

  std::remove(filename.c_str());
}

BOOST_AUTO_TEST_CASE(TestNonExistentFile) {
  JsonReader reader;
  BOOST_CHECK(!reader.loadFromFile("non_existent_file.json"));
  BOOST_CHECK(reader.getLastError().find("non_existent_file.json") != std::string::npos);
}

BOOST_AUTO_TEST_SUITE_END()
