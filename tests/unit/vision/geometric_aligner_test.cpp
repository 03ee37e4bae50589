#include <markscan/vision/geometric_aligner.hpp>
#include <support/synthetic_page.hpp>
#include <gtest/gtest.h>
#include <opencv2/imgproc.hpp>
#include <cmath>

namespace mc = markscan::core;
namespace mt = markscan::testing;
namespace mv = markscan::vision;

namespace {

mc::FormTemplate square_template() {
  mc::FormTemplate t;
  t.name = "square";
  t.canvas = {1000, 1000};
  t.dpi = 300.0;
  t.anchors = {mc::AnchorSpec{mc::Corner::TopLeft, {0.1, 0.1}},
               mc::AnchorSpec{mc::Corner::TopRight, {0.9, 0.1}},
               mc::AnchorSpec{mc::Corner::BottomRight, {0.9, 0.9}},
               mc::AnchorSpec{mc::Corner::BottomLeft, {0.1, 0.9}}};
  return t;
}

mc::AnchorCandidate at(mc::Corner c, double x, double y) {
  mc::AnchorCandidate a;
  a.corner = c;
  a.position = {x, y};
  a.confidence = 1.0;
  return a;
}

/// Template anchors moved by (dx, dy): a perfect rectangle on the scan.
mc::AnchorSet shifted(const mc::FormTemplate& t, double dx, double dy) {
  mc::AnchorSet s{};
  for (const mc::Corner c : mc::kCorners) {
    const auto p = t.canonical_anchor(c);
    s[mc::corner_index(c)] = at(c, p.x + dx, p.y + dy);
  }
  return s;
}

mc::PageImage white_page(int w, int h, double dpi) {
  return mt::page_of(mt::blank_canvas(w, h), dpi);
}

}  // namespace

TEST(GeometricAligner, PerfectRectangleHasZeroResidualAndOkTier) {
  const auto tpl = square_template();
  const mv::GeometricAligner aligner(tpl);
  const auto result = aligner.align(white_page(1000, 1000, 300.0), shifted(tpl, 20.0, 10.0));
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->anchors_used, 4u);
  EXPECT_EQ(result->transform.kind(), mc::TransformKind::Projective);
  EXPECT_NEAR(result->mean_residual_px, 0.0, 1e-6);
  EXPECT_NEAR(result->planarity_px, 0.0, 1e-6);
  EXPECT_EQ(result->tier, mc::QualityTier::Ok);

  const auto c = result->transform.to_canonical({520.0, 510.0});
  EXPECT_NEAR(c.x, 500.0, 1e-6);
  EXPECT_NEAR(c.y, 500.0, 1e-6);
}

TEST(GeometricAligner, ThreeAnchorsGiveExactAffine) {
  const auto tpl = square_template();
  const mv::GeometricAligner aligner(tpl);
  // Rotated, scaled and shifted scan; bottom-left missing.
  const double a = 0.03;
  const double s = 1.02;
  mc::AnchorSet detected{};
  for (const mc::Corner c : {mc::Corner::TopLeft, mc::Corner::TopRight, mc::Corner::BottomRight}) {
    const auto p = tpl.canonical_anchor(c);
    detected[mc::corner_index(c)] =
        at(c, s * (std::cos(a) * p.x - std::sin(a) * p.y) + 15.0,
           s * (std::sin(a) * p.x + std::cos(a) * p.y) - 7.0);
  }
  const auto result = aligner.align(white_page(1100, 1100, 300.0), detected);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->anchors_used, 3u);
  EXPECT_EQ(result->transform.kind(), mc::TransformKind::Affine);
  EXPECT_LT(result->mean_residual_px, 1e-6);
  EXPECT_LT(result->max_residual_px, 1e-6);
  EXPECT_EQ(result->tier, mc::QualityTier::Ok);
}

TEST(GeometricAligner, TwoOrFewerAnchorsAreInsufficient) {
  const auto tpl = square_template();
  const mv::GeometricAligner aligner(tpl);
  const auto page = white_page(1000, 1000, 300.0);

  mc::AnchorSet detected = shifted(tpl, 0.0, 0.0);
  detected[mc::corner_index(mc::Corner::TopRight)].reset();
  detected[mc::corner_index(mc::Corner::BottomLeft)].reset();
  auto two = aligner.align(page, detected);
  ASSERT_FALSE(two.has_value());
  EXPECT_EQ(two.error(), mc::PipelineError::InsufficientAnchors);

  auto none = aligner.align(page, mc::AnchorSet{});
  ASSERT_FALSE(none.has_value());
  EXPECT_EQ(none.error(), mc::PipelineError::InsufficientAnchors);
}

TEST(GeometricAligner, CollinearAnchorsFail) {
  const auto tpl = square_template();
  const mv::GeometricAligner aligner(tpl);
  mc::AnchorSet detected{};
  detected[0] = at(mc::Corner::TopLeft, 100.0, 100.0);
  detected[1] = at(mc::Corner::TopRight, 500.0, 100.0);
  detected[2] = at(mc::Corner::BottomRight, 900.0, 100.0);
  auto fit = aligner.fit(detected);
  ASSERT_FALSE(fit.has_value());
  EXPECT_EQ(fit.error(), mc::PipelineError::TransformFailed);
}

TEST(GeometricAligner, RansacFitsPerfectRectangle) {
  const auto tpl = square_template();
  mv::AlignerConfig cfg;
  cfg.projective_method = mv::ProjectiveMethod::Ransac;
  const mv::GeometricAligner aligner(tpl, cfg);
  const auto fit = aligner.fit(shifted(tpl, -12.0, 30.0));
  ASSERT_TRUE(fit.has_value());
  EXPECT_LT(fit->mean_residual_px, 1e-2);
}

TEST(GeometricAligner, NonPlanarQuadShowsInPlanarity) {
  const auto tpl = square_template();
  const mv::GeometricAligner aligner(tpl);
  mc::AnchorSet detected = shifted(tpl, 0.0, 0.0);
  detected[mc::corner_index(mc::Corner::BottomRight)]->position.x += 20.0;
  const auto fit = aligner.fit(detected);
  ASSERT_TRUE(fit.has_value());
  EXPECT_NEAR(fit->mean_residual_px, 0.0, 1e-6);
  EXPECT_GT(fit->planarity_px, 1.0);
}

TEST(GeometricAligner, FourAnchorFitIsGradedOnPlanarity) {
  const auto tpl = square_template();
  mc::AnchorSet detected = shifted(tpl, 0.0, 0.0);
  // One corner 20 px off: an affine fit leaves 5 px at every anchor.
  detected[mc::corner_index(mc::Corner::BottomRight)]->position.x += 20.0;
  const auto page = white_page(1000, 1000, 300.0);

  const mv::GeometricAligner gated(tpl);
  const auto warned = gated.align(page, detected);
  ASSERT_TRUE(warned.has_value());
  EXPECT_NEAR(warned->mean_residual_px, 0.0, 1e-6);
  EXPECT_NEAR(warned->planarity_px, 5.0, 1e-6);
  EXPECT_NEAR(warned->graded_residual_px, 5.0, 1e-6);
  EXPECT_EQ(warned->tier, mc::QualityTier::Warn);

  detected[mc::corner_index(mc::Corner::BottomRight)]->position.x += 20.0;
  const auto failed = gated.align(page, detected);
  ASSERT_TRUE(failed.has_value());
  EXPECT_EQ(failed->tier, mc::QualityTier::Fail);

  mv::AlignerConfig cfg;
  cfg.gate_on_planarity = false;
  const mv::GeometricAligner ungated(tpl, cfg);
  const auto ok = ungated.align(page, detected);
  ASSERT_TRUE(ok.has_value());
  EXPECT_NEAR(ok->graded_residual_px, ok->mean_residual_px, 1e-12);
  EXPECT_EQ(ok->tier, mc::QualityTier::Ok);
}

TEST(GeometricAligner, ThreeAnchorFitIgnoresPlanarityGate) {
  const auto tpl = square_template();
  mc::AnchorSet detected = shifted(tpl, 5.0, 5.0);
  detected[mc::corner_index(mc::Corner::BottomRight)].reset();
  const mv::GeometricAligner aligner(tpl);
  const auto r = aligner.align(white_page(1000, 1000, 300.0), detected);
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->transform.kind(), mc::TransformKind::Affine);
  EXPECT_NEAR(r->graded_residual_px, r->mean_residual_px, 1e-12);
  EXPECT_EQ(r->tier, mc::QualityTier::Ok);
}

TEST(GeometricAligner, WarpsPageIntoCroppedCanonicalImage) {
  const auto tpl = square_template();
  const mv::GeometricAligner aligner(tpl);
  cv::Mat scan = mt::blank_canvas(1000, 1000);
  cv::rectangle(scan, cv::Rect(520, 510, 20, 20), cv::Scalar(0), cv::FILLED);
  const auto result = aligner.align(mt::page_of(scan, 300.0), shifted(tpl, 20.0, 10.0));
  ASSERT_TRUE(result.has_value());

  // Margin 0.125 in at 300 dpi = 38 px around the anchor box 100..900.
  EXPECT_EQ(result->crop, (mc::CropBounds{62, 62, 938, 938}));
  const auto& img = result->canonical_image;
  ASSERT_TRUE(img.valid());
  EXPECT_EQ(img.width(), 876u);
  EXPECT_EQ(img.height(), 876u);
  EXPECT_DOUBLE_EQ(img.dpi(), 300.0);
  // The square lands at canonical (500, 500), i.e. cropped (438, 438).
  EXPECT_LT(img.at(448, 448), 50);
  EXPECT_EQ(img.at(400, 400), 255);
}

TEST(GeometricAligner, InvalidPageIsRejected) {
  const auto tpl = square_template();
  const mv::GeometricAligner aligner(tpl);
  auto r = aligner.align(mc::PageImage(), shifted(tpl, 0.0, 0.0));
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), mc::PipelineError::InvalidPage);
}

TEST(GeometricAligner, ThresholdsScaleWithPageDpi) {
  const mv::GeometricAligner aligner(square_template());
  const auto t = aligner.scaled_thresholds(150.0);
  EXPECT_DOUBLE_EQ(t.ok_px, 2.25);
  EXPECT_DOUBLE_EQ(t.warn_px, 3.0);
}

TEST(CropBounds, ExpandsOutwardByMargin) {
  const mc::CanvasSize canvas{2000, 2000};
  for (int m = 1; m <= 60; m += 7) {
    for (double off = 100.0; off < 400.0; off += 73.3) {
      const std::array<mc::CanonicalPoint, 4> anchors{
          mc::CanonicalPoint{off, off + 11.0}, mc::CanonicalPoint{off + 900.0, off + 5.0},
          mc::CanonicalPoint{off + 905.0, off + 1200.0}, mc::CanonicalPoint{off - 3.0, off + 1190.0}};
      const auto b = mv::compute_crop_bounds(anchors, m, canvas);
      const double min_x = off - 3.0;
      const double max_x = off + 905.0;
      const double min_y = off + 5.0;
      const double max_y = off + 1200.0;
      EXPECT_EQ(b.x0, static_cast<int>(std::floor(min_x)) - m);
      EXPECT_EQ(b.y0, static_cast<int>(std::floor(min_y)) - m);
      EXPECT_EQ(b.x1, static_cast<int>(std::ceil(max_x)) + m);
      EXPECT_EQ(b.y1, static_cast<int>(std::ceil(max_y)) + m);
      // Strict containment of the anchor bounding box.
      EXPECT_LT(b.x0, min_x);
      EXPECT_LT(b.y0, min_y);
      EXPECT_GT(b.x1, max_x);
      EXPECT_GT(b.y1, max_y);
    }
  }
}

TEST(CropBounds, ClampsOnlyAtCanvasEdges) {
  const std::array<mc::CanonicalPoint, 4> anchors{
      mc::CanonicalPoint{5.0, 10.0}, mc::CanonicalPoint{995.0, 10.0},
      mc::CanonicalPoint{995.0, 500.0}, mc::CanonicalPoint{5.0, 500.0}};
  const auto b = mv::compute_crop_bounds(anchors, 20, {1000, 1000});
  EXPECT_EQ(b.x0, 0);
  EXPECT_EQ(b.y0, 0);
  EXPECT_EQ(b.x1, 1000);
  EXPECT_EQ(b.y1, 520);
}

TEST(CropBounds, AlignerUsesTemplateMarginAtTemplateDpi) {
  const mv::GeometricAligner aligner(square_template());
  EXPECT_EQ(aligner.margin_px(), 38);
  EXPECT_EQ(aligner.crop_bounds(), (mc::CropBounds{62, 62, 938, 938}));
}
