// =============================================================================
//  SEQUIN
//  
//  Copyright © 2008-present: The SEQUIN Authors
//            Please see the AUTHORS.md file.
//  
//  All rights reserved. This program and the accompanying materials
//  are made available under the terms of the GNU Public License v3.0 (or, at
//  your option, any later version) which accompanies this distribution, and
//  is available at http://www.gnu.org/licenses/gpl.html
// =============================================================================

#include <catch.hpp>

#include "common/JsonParameterProvider.hpp"
#include "sequin/Exceptions.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdio>
#include <sstream>
#include <string>
#include <vector>

namespace
{
	const char* unitConfig()
	{
		return R"json({
			"UNIT_TYPE": "HEAT_EXCHANGER",
			"AREA": [10.0],
			"HAS_PRESSURE_CHANGE": 1,
			"SECTIONS": [1, 0, 1],
			"PACKAGE_NAMES": ["WATER_STEAM", "LIQUID_WATER"],
			"hot_side": {
				"PROPERTY_PACKAGE": "WATER_STEAM",
				"package_args": {
					"CP_LIQ": 75.3
				}
			}
		})json";
	}
}

TEST_CASE("JsonParameterProvider reads scalars", "[JsonParameterProvider],[IO]")
{
	sequin::JsonParameterProvider jpp(unitConfig());

	CHECK(jpp.getString("UNIT_TYPE") == "HEAT_EXCHANGER");
	CHECK(jpp.getDouble("AREA") == 10.0);
	CHECK(jpp.getInt("HAS_PRESSURE_CHANGE") == 1);
	CHECK(jpp.getBool("HAS_PRESSURE_CHANGE"));

	CHECK_THROWS(jpp.getDouble("UNIT_TYPE"));
	CHECK_THROWS(jpp.getDouble("MISSING"));
	CHECK_THROWS(jpp.getString("SECTIONS"));
}

TEST_CASE("JsonParameterProvider reads arrays", "[JsonParameterProvider],[IO]")
{
	const std::string config = unitConfig();
	sequin::JsonParameterProvider jpp(config);

	const std::vector<int> sections = jpp.getIntArray("SECTIONS");
	REQUIRE(sections.size() == 3);
	CHECK(sections[0] == 1);
	CHECK(sections[1] == 0);
	CHECK(sections[2] == 1);

	const std::vector<bool> flags = jpp.getBoolArray("SECTIONS");
	REQUIRE(flags.size() == 3);
	CHECK(flags[0]);
	CHECK_FALSE(flags[1]);
	CHECK(flags[2]);

	const std::vector<std::string> names = jpp.getStringArray("PACKAGE_NAMES");
	REQUIRE(names.size() == 2);
	CHECK(names[1] == "LIQUID_WATER");

	// Scalars are returned as single element arrays
	const std::vector<std::string> type = jpp.getStringArray("UNIT_TYPE");
	REQUIRE(type.size() == 1);
	CHECK(type[0] == "HEAT_EXCHANGER");

	CHECK(jpp.isArray("SECTIONS"));
	CHECK_FALSE(jpp.isArray("UNIT_TYPE"));
	CHECK(jpp.numElements("SECTIONS") == 3);
	CHECK(jpp.numElements("AREA") == 1);
}

TEST_CASE("JsonParameterProvider navigates scopes", "[JsonParameterProvider],[IO]")
{
	sequin::JsonParameterProvider jpp(unitConfig());

	CHECK(jpp.exists("hot_side"));
	CHECK_FALSE(jpp.exists("cold_side"));
	CHECK(jpp.isScope("hot_side"));
	CHECK_FALSE(jpp.isScope("AREA"));
	CHECK_THROWS_AS(jpp.pushScope("AREA"), sequin::InvalidParameterException);

	jpp.pushScope("hot_side");
	CHECK(jpp.getString("PROPERTY_PACKAGE") == "WATER_STEAM");
	CHECK_FALSE(jpp.exists("UNIT_TYPE"));

	jpp.pushScope("package_args");
	CHECK(jpp.getDouble("CP_LIQ") == 75.3);

	const std::vector<std::string> names = jpp.parameterNames();
	REQUIRE(names.size() == 1);
	CHECK(names[0] == "CP_LIQ");

	jpp.popScope();
	jpp.popScope();
	CHECK(jpp.exists("UNIT_TYPE"));

	// Popping the root scope has no effect
	jpp.popScope();
	CHECK(jpp.exists("UNIT_TYPE"));

	std::vector<std::string> rootNames = jpp.parameterNames();
	std::sort(rootNames.begin(), rootNames.end());
	REQUIRE(rootNames.size() == 6);
	CHECK(rootNames.front() == "AREA");
	CHECK(rootNames.back() == "hot_side");
}

TEST_CASE("JsonParameterProvider modifies fields", "[JsonParameterProvider],[IO]")
{
	sequin::JsonParameterProvider jpp;
	CHECK(jpp.parameterNames().empty());

	jpp.set("TOLERANCE", 1e-8);
	jpp.set("MAX_ITER", 50);
	jpp.set("VERBOSE", true);
	jpp.set("SOLVER_NAME", "ATRN_RES");
	jpp.set("NAME", std::string("fwh"));
	jpp.set("AREA", std::vector<double>{1000.0, 1000.0});
	jpp.set("SUBSOLVERS", std::vector<std::string>{"ATRN_ERR", "ATRN_RES"});

	CHECK(jpp.getDouble("TOLERANCE") == 1e-8);
	CHECK(jpp.getInt("MAX_ITER") == 50);
	CHECK(jpp.getBool("VERBOSE"));
	CHECK(jpp.getInt("VERBOSE") == 1);
	CHECK(jpp.getString("SOLVER_NAME") == "ATRN_RES");
	CHECK(jpp.getString("NAME") == "fwh");
	CHECK(jpp.getDoubleArray("AREA").size() == 2);
	CHECK(jpp.getStringArray("SUBSOLVERS")[0] == "ATRN_ERR");

	jpp.set("MAX_ITER", 20);
	CHECK(jpp.getInt("MAX_ITER") == 20);

	jpp.addScope("condense");
	jpp.pushScope("condense");
	jpp.set("AREA", 100.0);
	jpp.popScope();

	// Adding an existing scope keeps its contents
	jpp.addScope("condense");
	jpp.pushScope("condense");
	CHECK(jpp.getDouble("AREA") == 100.0);
	jpp.popScope();

	jpp.remove("VERBOSE");
	CHECK_FALSE(jpp.exists("VERBOSE"));
	CHECK((*jpp.data())["condense"]["AREA"].get<double>() == 100.0);
}

TEST_CASE("JsonParameterProvider copies and moves", "[JsonParameterProvider],[IO]")
{
	nlohmann::json config;
	config["NAME"] = "hx";
	config["cold_side"]["PROPERTY_PACKAGE"] = "LIQUID_WATER";

	sequin::JsonParameterProvider orig(config);
	orig.pushScope("cold_side");

	SECTION("Copy starts at the root scope")
	{
		sequin::JsonParameterProvider cpy(orig);
		CHECK(cpy.getString("NAME") == "hx");

		cpy.set("NAME", "other");
		orig.popScope();
		CHECK(orig.getString("NAME") == "hx");
	}

	SECTION("Copy assignment")
	{
		sequin::JsonParameterProvider cpy;
		cpy = orig;
		CHECK(cpy.exists("cold_side"));
		CHECK(cpy.getString("NAME") == "hx");
	}

	SECTION("Move keeps the opened scope")
	{
		sequin::JsonParameterProvider moved(std::move(orig));
		CHECK(moved.getString("PROPERTY_PACKAGE") == "LIQUID_WATER");
		moved.popScope();
		CHECK(moved.getString("NAME") == "hx");
	}

	SECTION("Move assignment")
	{
		sequin::JsonParameterProvider moved;
		moved = std::move(orig);
		CHECK(moved.getString("PROPERTY_PACKAGE") == "LIQUID_WATER");
	}
}

TEST_CASE("JsonParameterProvider writes and reads files", "[JsonParameterProvider],[IO]")
{
	const std::string fileName = "sequin-jpp-roundtrip.json";

	sequin::JsonParameterProvider jpp(unitConfig());
	jpp.toFile(fileName);

	sequin::JsonParameterProvider loaded = sequin::JsonParameterProvider::fromFile(fileName);
	std::remove(fileName.c_str());

	CHECK(*loaded.data() == *jpp.data());

	std::ostringstream ss;
	ss << loaded;
	CHECK(nlohmann::json::parse(ss.str()) == *jpp.data());

	CHECK_THROWS_AS(sequin::JsonParameterProvider::fromFile("sequin-does-not-exist.json"), sequin::InvalidParameterException);
}
