#include <gtest/gtest.h>
#include "camera/ZoomCamera.h"

using namespace clustermap;

static PackedNode circle(double x, double y, double r, int depth, int parent) {
    PackedNode pn;
    pn.x = x;
    pn.y = y;
    pn.r = r;
    pn.depth = depth;
    pn.parent = parent;
    return pn;
}

// Root filling an 800x600 box with two small children left of centre
static PackedLayout twoChildLayout() {
    PackedLayout layout;
    layout.width = 800;
    layout.height = 600;
    layout.nodes.push_back(circle(400, 300, 300, 0, -1));
    layout.nodes.push_back(circle(200, 300, 50, 1, 0));
    layout.nodes.push_back(circle(300, 300, 50, 1, 0));
    layout.nodes[0].children = {1, 2};
    return layout;
}

TEST(ZoomCameraTest, IdentityByDefault) {
    Scheduler s;
    ZoomCamera cam(s);
    EXPECT_EQ(cam.state(), ZoomState{});

    XYvec p = cam.toScreen(XYvec{123, 45}, 800, 600);
    EXPECT_NEAR(p.x, 123, 1e-12);
    EXPECT_NEAR(p.y, 45, 1e-12);
}

TEST(ZoomCameraTest, ScaleAboutViewportCentre) {
    Scheduler s;
    ZoomCamera cam(s);
    cam.jumpTo(ZoomState{2.0, 10.0, -20.0});

    // W/2 + k * (p - W/2 + x)
    XYvec p = cam.toScreen(XYvec{500, 300}, 800, 600);
    EXPECT_NEAR(p.x, 400 + 2.0 * (500 - 400 + 10), 1e-9);
    EXPECT_NEAR(p.y, 300 + 2.0 * (300 - 300 - 20), 1e-9);

    XYvec centre = cam.toScreen(XYvec{390, 320}, 800, 600);
    EXPECT_NEAR(centre.x, 400, 1e-9);
    EXPECT_NEAR(centre.y, 300, 1e-9);
}

TEST(ZoomCameraTest, ToViewInvertsToScreen) {
    Scheduler s;
    ZoomCamera cam(s);
    cam.jumpTo(ZoomState{3.5, -42.0, 17.0});

    XYvec v{271.0, 88.0};
    XYvec back = cam.toView(cam.toScreen(v, 1024, 768), 1024, 768);
    EXPECT_NEAR(back.x, v.x, 1e-9);
    EXPECT_NEAR(back.y, v.y, 1e-9);
}

TEST(ZoomCameraTest, FitCentresBoxWithoutZoomingIn) {
    PackedLayout layout = twoChildLayout();
    ZoomState fit = ZoomCamera::computeFitZoom(layout, 800, 600);

    // Box 150..350 x 250..350 padded is well inside the viewport: k stays 1
    EXPECT_DOUBLE_EQ(fit.k, 1.0);
    EXPECT_DOUBLE_EQ(fit.x, 150.0);
    EXPECT_DOUBLE_EQ(fit.y, 0.0);

    Scheduler s;
    ZoomCamera cam(s);
    cam.jumpTo(fit);
    XYvec c = cam.toScreen(XYvec{250, 300}, 800, 600);
    EXPECT_NEAR(c.x, 400, 1e-9);
    EXPECT_NEAR(c.y, 300, 1e-9);
}

TEST(ZoomCameraTest, FitShrinksOversizedContent) {
    PackedLayout layout;
    layout.nodes.push_back(circle(400, 300, 300, 0, -1));
    layout.nodes.push_back(circle(400, 300, 500, 1, 0));

    ZoomState fit = ZoomCamera::computeFitZoom(layout, 800, 600);
    // 10% of the viewport per side: min(640, 480) / 1000
    EXPECT_DOUBLE_EQ(fit.k, 0.48);
    EXPECT_DOUBLE_EQ(fit.x, 0.0);
    EXPECT_DOUBLE_EQ(fit.y, 0.0);
}

TEST(ZoomCameraTest, FitIgnoresRootOnly) {
    PackedLayout layout;
    layout.nodes.push_back(circle(400, 300, 300, 0, -1));
    EXPECT_EQ(ZoomCamera::computeFitZoom(layout, 800, 600), ZoomState{});
    EXPECT_EQ(ZoomCamera::computeFitZoom(PackedLayout{}, 800, 600), ZoomState{});
}

TEST(ZoomCameraTest, JumpNotifiesAndCancelsAnimation) {
    Scheduler s;
    ZoomCamera cam(s);
    int steps = 0;
    cam.setStepCallback([&steps] { ++steps; });

    cam.animateTo(ZoomState{2.0, 0.0, 0.0}, 0.0);
    EXPECT_TRUE(cam.isAnimating());

    cam.jumpTo(ZoomState{0.5, 1.0, 2.0});
    EXPECT_FALSE(cam.isAnimating());
    EXPECT_EQ(steps, 1);
    EXPECT_EQ(cam.state(), (ZoomState{0.5, 1.0, 2.0}));
    EXPECT_FALSE(s.hasPending());
}

TEST(ZoomCameraTest, AnimationEasesOutAndLandsExactly) {
    Scheduler s;
    ZoomCamera cam(s);
    int steps = 0;
    cam.setStepCallback([&steps] { ++steps; });

    ZoomState target{3.0, 100.0, -50.0};
    cam.animateTo(target, 10.0);
    EXPECT_EQ(cam.target(), target);
    EXPECT_EQ(cam.state(), ZoomState{});

    // Halfway in time: ease-out cubic gives 0.875 of the travel
    s.iteration(10.0 + ZoomCamera::ZOOM_DURATION / 2.0);
    EXPECT_NEAR(cam.state().k, 1.0 + 2.0 * 0.875, 1e-9);
    EXPECT_NEAR(cam.state().x, 100.0 * 0.875, 1e-9);
    EXPECT_NEAR(cam.state().y, -50.0 * 0.875, 1e-9);
    EXPECT_TRUE(cam.isAnimating());

    s.iteration(10.0 + ZoomCamera::ZOOM_DURATION + 0.01);
    EXPECT_EQ(cam.state(), target);
    EXPECT_FALSE(cam.isAnimating());
    EXPECT_EQ(steps, 2);
}

TEST(ZoomCameraTest, NewAnimationStartsFromCurrentState) {
    Scheduler s;
    ZoomCamera cam(s);

    cam.animateTo(ZoomState{5.0, 0.0, 0.0}, 0.0);
    s.iteration(ZoomCamera::ZOOM_DURATION / 2.0);
    double midK = cam.state().k;

    cam.animateTo(ZoomState{1.0, 0.0, 0.0}, 1.0);
    EXPECT_EQ(s.pendingCount(), 1u);

    s.iteration(1.0);
    EXPECT_NEAR(cam.state().k, midK, 1e-9);
    s.iteration(1.0 + ZoomCamera::ZOOM_DURATION);
    EXPECT_DOUBLE_EQ(cam.state().k, 1.0);
}

TEST(ZoomCameraTest, DestructorCancelsTransition) {
    Scheduler s;
    {
        ZoomCamera cam(s);
        cam.animateTo(ZoomState{2.0, 0.0, 0.0}, 0.0);
        EXPECT_TRUE(s.hasPending());
    }
    EXPECT_FALSE(s.hasPending());
}
