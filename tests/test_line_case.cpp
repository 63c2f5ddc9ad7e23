#include <gtest/gtest.h>
#include "LineCase.hpp"
#include <cstdio>
#include <fstream>

namespace {

TEST(LineCaseTest, LoadsSectionsWithSharedDefaults) {
    json doc = json::parse(R"({
        "name": "flat",
        "length_km": 12.0,
        "geometry": {"type": "three_phase", "phases": [[0, 10], [6, 10], [12, 10]]},
        "resistance": {"material": "aluminum", "area_mm2": 240, "t1": 20, "t2": 70},
        "inductance": {"radius_mm": 11.0, "gmr_m": "auto"},
        "capacitance": {"radius_mm": 11.0, "height_m": 11.0, "length_km": 3.0}
    })");

    LineCase c;
    ASSERT_TRUE(c.load(doc));
    EXPECT_EQ(c.name, "flat");

    ASSERT_TRUE(c.resistance.has_value());
    EXPECT_EQ(c.resistance->conductor.material, Material::Aluminum);
    EXPECT_DOUBLE_EQ(c.resistance->conductor.resistivity, 2.82e-8);
    EXPECT_DOUBLE_EQ(c.resistance->conductor.area, 240e-6);
    EXPECT_DOUBLE_EQ(c.resistance->conditions.length_km, 12.0);

    ASSERT_TRUE(c.inductance.has_value());
    EXPECT_DOUBLE_EQ(c.inductance->radius_m, 0.011);
    EXPECT_FALSE(c.inductance->gmr_m.has_value());
    EXPECT_TRUE(std::holds_alternative<ThreePhase>(c.inductance->geometry));

    ASSERT_TRUE(c.capacitance.has_value());
    EXPECT_DOUBLE_EQ(c.capacitance->length_km, 3.0);
    EXPECT_DOUBLE_EQ(c.capacitance->height_m, 11.0);
}

TEST(LineCaseTest, AbsentSectionsAreNotComputed) {
    LineCase c;
    ASSERT_TRUE(c.load(json::parse(R"({"name": "r_only", "resistance": {}})")));
    EXPECT_TRUE(c.resistance.has_value());
    EXPECT_FALSE(c.inductance.has_value());
    EXPECT_FALSE(c.capacitance.has_value());
    EXPECT_DOUBLE_EQ(c.resistance->conditions.t2, 50.0);
}

TEST(LineCaseTest, ZeroGmrMeansAuto) {
    LineCase c;
    ASSERT_TRUE(c.load(json::parse(R"({"inductance": {"gmr_m": 0}})")));
    EXPECT_FALSE(c.inductance->gmr_m.has_value());

    ASSERT_TRUE(c.load(json::parse(R"({"inductance": {"gmr_m": 0.0061}})")));
    ASSERT_TRUE(c.inductance->gmr_m.has_value());
    EXPECT_DOUBLE_EQ(*c.inductance->gmr_m, 0.0061);
}

TEST(LineCaseTest, SectionGeometryOverridesTopLevel) {
    LineCase c;
    ASSERT_TRUE(c.load(json::parse(R"({
        "geometry": {"type": "single", "spacing": 3.0},
        "inductance": {},
        "capacitance": {"geometry": {"type": "three_phase", "phases": [{"x": 0, "y": 9}, {"x": 3, "y": 9}, {"x": 6, "y": 9}]}}
    })")));
    ASSERT_TRUE(std::holds_alternative<SinglePhase>(c.inductance->geometry));
    EXPECT_DOUBLE_EQ(std::get<SinglePhase>(c.inductance->geometry).spacing, 3.0);
    ASSERT_TRUE(std::holds_alternative<ThreePhase>(c.capacitance->geometry));
    EXPECT_DOUBLE_EQ(std::get<ThreePhase>(c.capacitance->geometry).c.x, 6.0);
}

TEST(LineCaseTest, RejectsMalformedCases) {
    LineCase c;
    EXPECT_FALSE(c.load(json::parse(R"({"resistance": {"material": "gold"}})")));
    EXPECT_FALSE(c.load(json::parse(R"({"geometry": {"type": "hexagon"}, "inductance": {}})")));
    EXPECT_FALSE(c.load(json::parse(R"({"geometry": {"type": "three_phase", "phases": [[0, 1], [2, 1]]}})")));
    EXPECT_FALSE(c.load(json::parse(R"({"capacitance": {"height_m": "tall"}})")));
    EXPECT_FALSE(c.load(json::parse(R"({"inductance": {"gmr_m": "big"}})")));
}

TEST(LineCaseTest, RejectedDocumentLeavesCaseUntouched) {
    LineCase c;
    ASSERT_TRUE(c.load(json::parse(R"({"name": "good", "resistance": {}, "inductance": {}})")));

    EXPECT_FALSE(c.load(json::parse(R"({"name": "bad", "capacitance": {"height_m": "tall"}})")));
    EXPECT_FALSE(c.load(json::parse(R"({"name": "worse", "resistance": {"material": "gold"}})")));

    EXPECT_EQ(c.name, "good");
    EXPECT_TRUE(c.resistance.has_value());
    EXPECT_TRUE(c.inductance.has_value());
    EXPECT_FALSE(c.capacitance.has_value());
}

TEST(LineCaseTest, LoadFromJsonFile) {
    const char* path = "linepar_case_test.json";
    {
        std::ofstream out(path);
        out << R"({"name": "from_file", "resistance": {"material": "Cu"}})";
    }
    LineCase c;
    EXPECT_TRUE(c.load_from_json(path));
    EXPECT_EQ(c.name, "from_file");
    EXPECT_EQ(c.stem, "linepar_case_test");
    std::remove(path);

    EXPECT_FALSE(c.load_from_json("does_not_exist.json"));
}

TEST(LineCaseTest, DefaultsDescribeTheClassroomLine) {
    LineCase c = LineCase::defaults();
    ASSERT_TRUE(c.resistance && c.inductance && c.capacitance);
    EXPECT_EQ(c.resistance->conductor.material, Material::Copper);
    EXPECT_DOUBLE_EQ(c.inductance->radius_m, 0.01);
    EXPECT_DOUBLE_EQ(c.capacitance->height_m, 10.0);
}

} // namespace
