#include <gtest/gtest.h>
#include <chain/chain_exporter.hpp>
#include <chain/mjcf_writer.hpp>
#include "test_helpers.hpp"
#include <tinyxml2.h>
#include <cmath>
#include <filesystem>
#include <string>

using namespace spirob;
using namespace spirob::test;

namespace {

UnfoldLayout layout_for(const DesignParams& params) {
    return UnfoldLayout::build(params, decompose_polar(params.spiral));
}

// Distance of `pt` from the line through a and b
double distance_to_line(const Vec2& pt, const Vec2& a, const Vec2& b) {
    Vec2 d = b - a;
    return std::abs(d.cross(pt - a)) / d.length();
}

bool within_segment_x(const Vec2& pt, const Vec2& a, const Vec2& b) {
    double lo = std::min(a.x, b.x) - 1e-9;
    double hi = std::max(a.x, b.x) + 1e-9;
    return pt.x >= lo && pt.x <= hi;
}

}  // namespace

// ============================================
// Cable sites
// ============================================

TEST(CableSitesTest, SitesLieOnTheLastUnitEdges) {
    UnfoldLayout layout = layout_for(reference_params());
    CableSites sites = compute_cable_sites(layout, 0.5, 0.9);
    const FlatUnit& last = layout.primary().back();

    EXPECT_TRUE(sites.intersected);
    EXPECT_NEAR(distance_to_line(sites.left, last.inner_leading(), last.outer_leading()), 0.0, 1e-9);
    EXPECT_NEAR(distance_to_line(sites.right, last.inner_trailing(), last.outer_trailing()), 0.0, 1e-9);
    EXPECT_TRUE(within_segment_x(sites.left, last.inner_leading(), last.outer_leading()));
    EXPECT_TRUE(within_segment_x(sites.right, last.inner_trailing(), last.outer_trailing()));
}

TEST(CableSitesTest, SitesLieOnTheCableLine) {
    UnfoldLayout layout = layout_for(small_params());
    const RobotDimensions& dims = layout.dimensions();
    CableSites sites = compute_cable_sites(layout, 0.5, 0.9);

    Vec2 tip(0.0, 0.5 * dims.tip_size * 0.5);
    Vec2 base(dims.robot_length, 0.9 * dims.base_size * 0.5);
    EXPECT_NEAR(distance_to_line(sites.left, tip, base), 0.0, 1e-9);
    EXPECT_NEAR(distance_to_line(sites.right, tip, base), 0.0, 1e-9);
    EXPECT_LT(sites.left.x, sites.right.x);
}

TEST(CableSitesTest, MissedEdgesFallBackToInterpolation) {
    UnfoldLayout layout = layout_for(small_params());
    // A line far above the unit never meets its edges
    CableSites sites = compute_cable_sites(layout, 50.0, 50.0);
    const FlatUnit& last = layout.primary().back();

    EXPECT_FALSE(sites.intersected);
    EXPECT_DOUBLE_EQ(sites.left.x, last.inner_leading().x);
    EXPECT_DOUBLE_EQ(sites.right.x, last.inner_trailing().x);
}

// ============================================
// Chain description
// ============================================

TEST(ChainExporterTest, HingeChainBodiesScaleByGamma) {
    ChainSpec spec;
    spec.unit_height = 2.0;
    spec.scale = 1.1;
    spec.num_units = 3;
    spec.sites = CableSites{Vec2(1.0, 0.5), Vec2(2.0, 0.75), true};

    ChainDescription chain = build_chain(spec);

    ASSERT_EQ(chain.bodies.size(), 3u);
    EXPECT_EQ(chain.bodies[0].name, "link_0");
    EXPECT_EQ(chain.bodies[2].joint_name, "joint_2");
    EXPECT_DOUBLE_EQ(chain.bodies[0].offset, 2.0);
    EXPECT_NEAR(chain.bodies[2].offset, 2.0 * 1.21, 1e-12);
    EXPECT_NEAR(chain.bodies[1].mass, 0.011, 1e-12);
    EXPECT_NEAR(chain.bodies[1].inertia, 0.00011, 1e-12);

    const auto& sites = chain.bodies[1].sites;
    ASSERT_EQ(sites.size(), 2u);
    EXPECT_EQ(sites[0].name, "cable1_unit1");
    EXPECT_EQ(sites[1].name, "cable2_unit1");
    EXPECT_NEAR(sites[0].pos.x, 1.1, 1e-12);
    EXPECT_NEAR(sites[1].pos.y, 0.825, 1e-12);
    EXPECT_DOUBLE_EQ(sites[1].pos.z, 0.0);

    ASSERT_EQ(chain.actuators.size(), 6u);
    EXPECT_EQ(chain.actuators[0].name, "cable1_act0");
    EXPECT_EQ(chain.actuators[5].site, "cable2_unit2");
    EXPECT_DOUBLE_EQ(chain.actuators[0].kp, 100.0);
    EXPECT_DOUBLE_EQ(chain.actuators[0].kv, 10.0);
}

TEST(ChainExporterTest, HingeWithoutSitesHasNoActuators) {
    ChainSpec spec;
    spec.num_units = 4;
    ChainDescription chain = build_chain(spec);

    EXPECT_EQ(chain.bodies.size(), 4u);
    EXPECT_TRUE(chain.actuators.empty());
    for (const auto& body : chain.bodies) {
        EXPECT_TRUE(body.sites.empty());
    }
}

TEST(ChainExporterTest, BallChainPlacesThreeSitesAroundTheAxis) {
    ChainSpec spec;
    spec.joint = JointKind::Ball;
    spec.unit_height = 4.0;
    spec.scale = 1.0;
    spec.num_units = 2;
    spec.robot_length = 50.0;

    ChainDescription chain = build_chain(spec);

    const auto& sites = chain.bodies[0].sites;
    ASSERT_EQ(sites.size(), 3u);
    EXPECT_EQ(sites[2].name, "cable3_unit0");
    for (const auto& site : sites) {
        EXPECT_DOUBLE_EQ(site.pos.x, 2.0);
    }
    EXPECT_DOUBLE_EQ(sites[0].pos.y, 5.0);
    EXPECT_DOUBLE_EQ(sites[0].pos.z, 0.0);
    EXPECT_DOUBLE_EQ(sites[1].pos.y, -2.5);
    EXPECT_NEAR(sites[1].pos.z, 4.33, 1e-12);
    EXPECT_NEAR(sites[2].pos.z, -4.33, 1e-12);
    EXPECT_EQ(chain.actuators.size(), 6u);
}

TEST(ChainExporterTest, SpecFollowsDesignParams) {
    DesignParams params = reference_params();
    params.sim_stiffness = 0.8;
    params.sim_damping = 0.05;
    UnfoldLayout layout = layout_for(params);

    ChainSpec spec = chain_spec_for(params, layout);
    EXPECT_EQ(spec.num_units, 24u);
    EXPECT_EQ(spec.joint, JointKind::Hinge);
    EXPECT_DOUBLE_EQ(spec.joint_limit_deg, 30.0);
    EXPECT_DOUBLE_EQ(spec.scale, layout.dimensions().gamma);
    EXPECT_DOUBLE_EQ(spec.unit_height, layout.dimensions().unit_height);
    EXPECT_DOUBLE_EQ(spec.stiffness, 0.8);
    EXPECT_DOUBLE_EQ(spec.damping, 0.05);
    ASSERT_TRUE(spec.sites.has_value());
    EXPECT_TRUE(spec.sites->intersected);

    params.cable_mode = CableMode::ThreeCable;
    ChainSpec ball = chain_spec_for(params, layout);
    EXPECT_EQ(ball.joint, JointKind::Ball);
    EXPECT_FALSE(ball.sites.has_value());
}

// ============================================
// MJCF document
// ============================================

TEST(MjcfWriterTest, LinksNestInsideTheBase) {
    DesignParams params = reference_params();
    UnfoldLayout layout = layout_for(params);
    ChainDescription chain = build_chain(chain_spec_for(params, layout));

    std::string xml = to_mjcf(chain);
    tinyxml2::XMLDocument doc;
    ASSERT_EQ(doc.Parse(xml.c_str()), tinyxml2::XML_SUCCESS);

    const tinyxml2::XMLElement* root = doc.FirstChildElement("mujoco");
    ASSERT_NE(root, nullptr);
    EXPECT_STREQ(root->Attribute("model"), "spiral_robot");

    const tinyxml2::XMLElement* body = root->FirstChildElement("worldbody")->FirstChildElement("body");
    ASSERT_NE(body, nullptr);
    EXPECT_STREQ(body->Attribute("name"), "base");

    std::size_t depth = 0;
    for (const auto* link = body->FirstChildElement("body"); link;
         link = link->FirstChildElement("body")) {
        std::string expected = "link_" + std::to_string(depth);
        EXPECT_STREQ(link->Attribute("name"), expected.c_str());
        EXPECT_EQ(link->FirstChildElement("body") == nullptr, depth == 23);
        ++depth;
    }
    EXPECT_EQ(depth, 24u);

    const auto* joint = body->FirstChildElement("body")->FirstChildElement("joint");
    ASSERT_NE(joint, nullptr);
    EXPECT_STREQ(joint->Attribute("type"), "hinge");
    EXPECT_STREQ(joint->Attribute("range"), "-0.523500 0.523500");
}

TEST(MjcfWriterTest, MeshScaleAndActuators) {
    ChainSpec spec;
    spec.scale = 1.25;
    spec.num_units = 2;
    spec.sites = CableSites{Vec2(1.0, 0.5), Vec2(2.0, 0.5), true};

    std::string xml = to_mjcf(build_chain(spec));
    tinyxml2::XMLDocument doc;
    ASSERT_EQ(doc.Parse(xml.c_str()), tinyxml2::XML_SUCCESS);

    const auto* root = doc.FirstChildElement("mujoco");
    const auto* mesh = root->FirstChildElement("asset")->FirstChildElement("mesh");
    ASSERT_NE(mesh, nullptr);
    EXPECT_STREQ(mesh->Attribute("file"), "baselink.stl");
    EXPECT_STREQ(mesh->Attribute("scale"), "1.250000 1.250000 1.250000");

    std::size_t count = 0;
    for (const auto* pos = root->FirstChildElement("actuator")->FirstChildElement("position");
         pos; pos = pos->NextSiblingElement("position")) {
        EXPECT_STREQ(pos->Attribute("kp"), "100");
        EXPECT_STREQ(pos->Attribute("kv"), "10");
        ++count;
    }
    EXPECT_EQ(count, 4u);
}

TEST(MjcfWriterTest, WritesFile) {
    ChainSpec spec;
    spec.num_units = 1;
    auto path = std::filesystem::temp_directory_path() / "spirob_chain_test.xml";

    write_mjcf(build_chain(spec), path.string());

    tinyxml2::XMLDocument doc;
    EXPECT_EQ(doc.LoadFile(path.string().c_str()), tinyxml2::XML_SUCCESS);
    std::filesystem::remove(path);
}

TEST(MjcfWriterTest, UnwritablePathThrows) {
    ChainSpec spec;
    EXPECT_THROW(write_mjcf(build_chain(spec), "/nonexistent-dir/robot.xml"), std::runtime_error);
}
