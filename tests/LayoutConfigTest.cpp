#include "LayoutConfig.h"

#include <gtest/gtest.h>

#include <limits>

namespace {

TEST(LayoutConfig, DefaultsPerKind)
{
    LayoutConfig c = LayoutConfig::defaults();
    EXPECT_EQ(c.distanceFor(LinkKind::Orchestrator), 380.0);
    EXPECT_EQ(c.distanceFor(LinkKind::Subfeature), 230.0);
    EXPECT_EQ(c.distanceFor(LinkKind::Overlap), 400.0);
    EXPECT_EQ(c.strengthFor(LinkKind::Orchestrator), 0.6);
    EXPECT_EQ(c.strengthFor(LinkKind::Subfeature), 0.32);
    EXPECT_EQ(c.strengthFor(LinkKind::Overlap), 0.08);
    EXPECT_EQ(c.repulsionFor(NodeKind::Major), -2400.0);
    EXPECT_EQ(c.repulsionFor(NodeKind::Minor), -600.0);
    EXPECT_EQ(c.collisionPadding, 22.0);
    EXPECT_EQ(c.alphaDecay, 0.011);
    EXPECT_EQ(c.velocityDecay, 0.35);
    EXPECT_EQ(c.alphaMin, 0.001);
    EXPECT_EQ(c.snapshotEvery, 2);
}

TEST(LayoutConfig, MergeTouchesOnlyPresentFields)
{
    LayoutConfig c = LayoutConfig::defaults();
    LayoutConfigPatch p;
    p.setLinkDistance(LinkKind::Overlap, 500.0).setRepulsion(NodeKind::Major, -3000.0);
    p.velocityDecay = 0.5;
    c.merge(p);
    EXPECT_EQ(c.distanceFor(LinkKind::Overlap), 500.0);
    EXPECT_EQ(c.distanceFor(LinkKind::Subfeature), 230.0);
    EXPECT_EQ(c.repulsionFor(NodeKind::Major), -3000.0);
    EXPECT_EQ(c.repulsionFor(NodeKind::Minor), -600.0);
    EXPECT_EQ(c.velocityDecay, 0.5);
    EXPECT_EQ(c.alphaDecay, 0.011);
}

TEST(LayoutConfig, EmptyPatchChangesNothing)
{
    LayoutConfigPatch p;
    EXPECT_TRUE(p.empty());
    LayoutConfig c = LayoutConfig::defaults();
    c.merge(p);
    EXPECT_EQ(c.describe(), LayoutConfig::defaults().describe());

    p.snapshotEvery = 3;
    EXPECT_FALSE(p.empty());
}

TEST(LayoutConfig, ValidatedReplacesUnusableValues)
{
    const double nan = std::numeric_limits<double>::quiet_NaN();
    LayoutConfig c = LayoutConfig::defaults();
    c.linkDistance[0] = -1.0;
    c.linkStrength[1] = nan;
    c.repulsion[1] = std::numeric_limits<double>::infinity();
    c.alphaDecay = 1.5;
    c.velocityDecay = nan;
    c.snapshotEvery = 0;
    c.theta = -0.1;
    c.collisionPadding = -4.0;

    LayoutConfig v = c.validated();
    const LayoutConfig d = LayoutConfig::defaults();
    EXPECT_EQ(v.linkDistance[0], d.linkDistance[0]);
    EXPECT_EQ(v.linkStrength[1], d.linkStrength[1]);
    EXPECT_EQ(v.repulsion[1], d.repulsion[1]);
    EXPECT_EQ(v.alphaDecay, d.alphaDecay);
    EXPECT_EQ(v.velocityDecay, d.velocityDecay);
    EXPECT_EQ(v.snapshotEvery, d.snapshotEvery);
    EXPECT_EQ(v.theta, d.theta);
    EXPECT_EQ(v.collisionPadding, d.collisionPadding);
}

TEST(LayoutConfig, ValidatedKeepsLegalValues)
{
    LayoutConfig c = LayoutConfig::defaults();
    c.linkDistance[2] = 0.0;
    c.repulsion[0] = 100.0; // attraction is allowed
    c.alphaDecay = 0.0;
    c.snapshotEvery = 5;
    c.theta = 0.0;
    LayoutConfig v = c.validated();
    EXPECT_EQ(v.linkDistance[2], 0.0);
    EXPECT_EQ(v.repulsion[0], 100.0);
    EXPECT_EQ(v.alphaDecay, 0.0);
    EXPECT_EQ(v.snapshotEvery, 5);
    EXPECT_EQ(v.theta, 0.0);
}

TEST(GraphTypes, KindNamesParse)
{
    NodeKind nk{};
    EXPECT_TRUE(parseNodeKind("major", nk));
    EXPECT_EQ(nk, NodeKind::Major);
    EXPECT_FALSE(parseNodeKind("huge", nk));

    LinkKind lk{};
    EXPECT_TRUE(parseLinkKind("overlap", lk));
    EXPECT_EQ(lk, LinkKind::Overlap);
    EXPECT_STREQ(linkKindName(LinkKind::Orchestrator), "orchestrator");
    EXPECT_STREQ(nodeKindName(NodeKind::Minor), "minor");
    EXPECT_FALSE(parseLinkKind("", lk));
}

}  // namespace
