#include <gtest/gtest.h>

#include "RecordingSurface.h"
#include "../lib/ribbon-core/RibbonGeometry.h"
#include "../lib/ribbon-core/RibbonRenderer.h"

using namespace ribbon;
using ribbon::test::PathCommand;
using ribbon::test::RecordingSurface;

namespace
{
RibbonLayout layout(float lineHeight, float viewWidth, bool fluid)
{
    RibbonLayout l;
    l.lineHeight  = lineHeight;
    l.viewWidth   = viewWidth;
    l.isFluidMode = fluid;
    return l;
}
} // namespace

TEST(RibbonGeometry, ChannelConstants)
{
    EXPECT_FLOAT_EQ(RibbonGeometry::centerX(800.f),    400.f);
    EXPECT_FLOAT_EQ(RibbonGeometry::leftEnd(800.f),    370.f);
    EXPECT_FLOAT_EQ(RibbonGeometry::rightStart(800.f), 430.f);
    EXPECT_FLOAT_EQ(RibbonGeometry::rightStart(123.f) - RibbonGeometry::leftEnd(123.f),
                    RibbonGeometry::kRibbonGap);
}

TEST(RibbonGeometry, BandCoversOneRow)
{
    RibbonGeometry g = RibbonGeometry::build(layout(16.f, 1000.f, true), 48.f);
    EXPECT_FLOAT_EQ(g.band.topY,    48.f);
    EXPECT_FLOAT_EQ(g.band.bottomY, 64.f);
    EXPECT_FLOAT_EQ(g.band.leftEnd,    470.f);
    EXPECT_FLOAT_EQ(g.band.rightStart, 530.f);
}

TEST(RibbonGeometry, FluidEdgesAreSymmetricCubics)
{
    RibbonGeometry g = RibbonGeometry::build(layout(22.f, 800.f, true), 0.f);

    ASSERT_TRUE(g.fillPath.isClosed());
    ASSERT_EQ(g.fillPath.count(SegmentKind::Cubic), 2);

    const PathSegment& top = g.fillPath.segments[1];
    ASSERT_EQ(top.kind, SegmentKind::Cubic);
    EXPECT_EQ(top.c1, glm::vec2(400.f, 0.f));
    EXPECT_EQ(top.c2, glm::vec2(400.f, 0.f));
    EXPECT_EQ(top.to, glm::vec2(430.f, 0.f));

    // Bottom edge runs right to left; control points mirror the top edge.
    const PathSegment& bottom = g.fillPath.segments[3];
    ASSERT_EQ(bottom.kind, SegmentKind::Cubic);
    EXPECT_EQ(bottom.c1, glm::vec2(400.f, 22.f));
    EXPECT_EQ(bottom.c2, glm::vec2(400.f, 22.f));
    EXPECT_EQ(bottom.to, glm::vec2(370.f, 22.f));
}

TEST(RibbonGeometry, ControlPointsSitHalfAGapInside)
{
    // At any width the control points stay cpX = 30 in from each end.
    RibbonGeometry g = RibbonGeometry::build(layout(22.f, 2000.f, true), 0.f);
    const PathSegment& top = g.topBorder.segments.at(1);
    EXPECT_FLOAT_EQ(top.c1.x - g.band.leftEnd,    30.f);
    EXPECT_FLOAT_EQ(g.band.rightStart - top.c2.x, 30.f);
}

TEST(RibbonGeometry, BlocksModeUsesStraightEdges)
{
    RibbonGeometry g = RibbonGeometry::build(layout(22.f, 800.f, false), 0.f);

    EXPECT_EQ(g.fillPath.count(SegmentKind::Cubic), 0);
    EXPECT_EQ(g.fillPath.count(SegmentKind::Line),  3);
    EXPECT_TRUE(g.fillPath.isClosed());
    EXPECT_EQ(g.topBorder.count(SegmentKind::Line),    1);
    EXPECT_EQ(g.bottomBorder.count(SegmentKind::Line), 1);
}

TEST(RibbonGeometry, CornersMatchAcrossModes)
{
    RibbonGeometry fluid  = RibbonGeometry::build(layout(30.f, 640.f, true),  90.f);
    RibbonGeometry blocks = RibbonGeometry::build(layout(30.f, 640.f, false), 90.f);

    std::vector<glm::vec2> expect = {
        fluid.band.topLeft(), fluid.band.topRight(),
        fluid.band.bottomRight(), fluid.band.bottomLeft(),
    };
    EXPECT_EQ(fluid.fillPath.anchors(),  expect);
    EXPECT_EQ(blocks.fillPath.anchors(), expect);
}

TEST(RibbonGeometry, TicksAreVerticalAtChannelEdges)
{
    RibbonGeometry g = RibbonGeometry::build(layout(22.f, 800.f, true), 44.f);

    auto left  = g.leftTick.anchors();
    auto right = g.rightTick.anchors();
    ASSERT_EQ(left.size(),  2u);
    ASSERT_EQ(right.size(), 2u);
    EXPECT_EQ(left[0],  glm::vec2(370.f, 44.f));
    EXPECT_EQ(left[1],  glm::vec2(370.f, 66.f));
    EXPECT_EQ(right[0], glm::vec2(430.f, 44.f));
    EXPECT_EQ(right[1], glm::vec2(430.f, 66.f));
}

TEST(RibbonGeometry, ReplayIssuesSegmentsInOrder)
{
    RibbonGeometry g = RibbonGeometry::build(layout(22.f, 800.f, true), 0.f);
    RecordingSurface surface;

    replayPath(g.fillPath, surface);
    surface.fillWithGradient(LinearGradient{});

    ASSERT_EQ(surface.beginCount, 1);
    ASSERT_EQ(surface.shapes.size(), 1u);
    const auto& cmds = surface.shapes[0].commands;
    ASSERT_EQ(cmds.size(), g.fillPath.segments.size());
    EXPECT_EQ(cmds[0].kind, PathCommand::Move);
    EXPECT_EQ(cmds[1].kind, PathCommand::Curve);
    EXPECT_EQ(cmds[2].kind, PathCommand::Line);
    EXPECT_EQ(cmds[3].kind, PathCommand::Curve);
    EXPECT_EQ(cmds[4].kind, PathCommand::Close);
}

// ============================================================
// Gradient sampling
// ============================================================

TEST(LinearGradient, SamplesBetweenStops)
{
    RibbonBand band;
    band.topY = 0.f;
    band.bottomY = 20.f;
    band.leftEnd = 100.f;
    band.rightStart = 160.f;

    LinearGradient g = RibbonRenderer::fillGradient(band, {1.f, 0.f, 0.f, 1.f});

    EXPECT_FLOAT_EQ(g.sample(0.f).a,   0.1f);
    EXPECT_FLOAT_EQ(g.sample(0.5f).a,  0.2f);
    EXPECT_FLOAT_EQ(g.sample(1.f).a,   0.1f);
    EXPECT_NEAR(g.sample(0.25f).a, 0.15f, 1e-6f);

    // Out of range parameters clamp to the end stops.
    EXPECT_FLOAT_EQ(g.sample(-3.f).a, 0.1f);
    EXPECT_FLOAT_EQ(g.sample(7.f).a,  0.1f);

    // Points project onto the horizontal axis; y is irrelevant.
    EXPECT_FLOAT_EQ(g.sampleAt({130.f, 0.f}).a,  0.2f);
    EXPECT_FLOAT_EQ(g.sampleAt({130.f, 19.f}).a, 0.2f);
    EXPECT_FLOAT_EQ(g.sampleAt({40.f,  5.f}).a,  0.1f);
}

TEST(LinearGradient, DegenerateCases)
{
    LinearGradient empty;
    EXPECT_FLOAT_EQ(empty.sample(0.5f).a, 0.f);

    LinearGradient point;
    point.start = point.end = {5.f, 5.f};
    point.stops = {{0.f, {1.f, 1.f, 1.f, 0.4f}}, {1.f, {1.f, 1.f, 1.f, 0.9f}}};
    EXPECT_FLOAT_EQ(point.sampleAt({100.f, 100.f}).a, 0.4f);
}

TEST(DrawSurface, WithOpacityKeepsRgb)
{
    glm::vec4 c = withOpacity({0.2f, 0.4f, 0.6f, 0.5f}, 0.6f);
    EXPECT_FLOAT_EQ(c.r, 0.2f);
    EXPECT_FLOAT_EQ(c.g, 0.4f);
    EXPECT_FLOAT_EQ(c.b, 0.6f);
    EXPECT_FLOAT_EQ(c.a, 0.3f);
}
