#include <markscan/vision/geometric_aligner.hpp>
#include <markscan/vision/cv_interop.hpp>
#include <opencv2/calib3d.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <optional>
#include <utility>

namespace markscan::vision {

namespace mc = markscan::core;

namespace {

constexpr double kMinTriangleDet = 1e-6;
constexpr double kMinSpanArea = 1.0;

struct Correspondences {
  std::vector<mc::Corner> corners;
  std::vector<cv::Point2d> raw;
  std::vector<cv::Point2d> canonical;
};

Correspondences gather(const mc::AnchorSet& detected, const mc::FormTemplate& tpl) {
  Correspondences c;
  for (const mc::Corner corner : mc::kCorners) {
    const auto& cand = detected[mc::corner_index(corner)];
    if (!cand) continue;
    const mc::CanonicalPoint dst = tpl.canonical_anchor(corner);
    c.corners.push_back(corner);
    c.raw.emplace_back(cand->position.x, cand->position.y);
    c.canonical.emplace_back(dst.x, dst.y);
  }
  return c;
}

mc::PageTransform::Matrix to_matrix(const cv::Matx33d& m) {
  return {m(0, 0), m(0, 1), m(0, 2), m(1, 0), m(1, 1),
          m(1, 2), m(2, 0), m(2, 1), m(2, 2)};
}

/// Largest triangle area over any three points; ~0 when all are collinear.
double max_triangle_area(const std::vector<cv::Point2d>& pts) {
  double best = 0.0;
  for (std::size_t i = 0; i < pts.size(); ++i) {
    for (std::size_t j = i + 1; j < pts.size(); ++j) {
      for (std::size_t k = j + 1; k < pts.size(); ++k) {
        const cv::Point2d u = pts[j] - pts[i];
        const cv::Point2d v = pts[k] - pts[i];
        best = std::max(best, 0.5 * std::abs(u.cross(v)));
      }
    }
  }
  return best;
}

/// Exact affine map of three raw points onto three canonical points.
std::optional<cv::Matx33d> solve_affine(const std::vector<cv::Point2d>& src,
                                        const std::vector<cv::Point2d>& dst) {
  cv::Matx33d a(src[0].x, src[0].y, 1.0,
                src[1].x, src[1].y, 1.0,
                src[2].x, src[2].y, 1.0);
  if (std::abs(cv::determinant(a)) < kMinTriangleDet) return std::nullopt;

  const cv::Vec3d bx(dst[0].x, dst[1].x, dst[2].x);
  const cv::Vec3d by(dst[0].y, dst[1].y, dst[2].y);
  cv::Vec3d rx;
  cv::Vec3d ry;
  if (!cv::solve(a, bx, rx, cv::DECOMP_LU) || !cv::solve(a, by, ry, cv::DECOMP_LU)) {
    return std::nullopt;
  }
  return cv::Matx33d(rx[0], rx[1], rx[2], ry[0], ry[1], ry[2], 0.0, 0.0, 1.0);
}

/// Similarity that moves the centroid to the origin and the mean distance to sqrt(2).
cv::Matx33d normalizer(const std::vector<cv::Point2d>& pts) {
  cv::Point2d mean{0.0, 0.0};
  for (const auto& p : pts) mean += p;
  mean *= 1.0 / static_cast<double>(pts.size());
  double spread = 0.0;
  for (const auto& p : pts) spread += cv::norm(p - mean);
  spread /= static_cast<double>(pts.size());
  const double s = spread > 0.0 ? std::sqrt(2.0) / spread : 1.0;
  return cv::Matx33d(s, 0.0, -s * mean.x, 0.0, s, -s * mean.y, 0.0, 0.0, 1.0);
}

cv::Point2d apply(const cv::Matx33d& m, const cv::Point2d& p) {
  const cv::Vec3d v = m * cv::Vec3d(p.x, p.y, 1.0);
  return {v[0] / v[2], v[1] / v[2]};
}

/// Normalized DLT; least squares for four or more correspondences.
std::optional<cv::Matx33d> solve_homography_dlt(const std::vector<cv::Point2d>& src,
                                                const std::vector<cv::Point2d>& dst) {
  const cv::Matx33d ts = normalizer(src);
  const cv::Matx33d td = normalizer(dst);
  const int n = static_cast<int>(src.size());

  cv::Mat a = cv::Mat::zeros(2 * n, 9, CV_64F);
  for (int i = 0; i < n; ++i) {
    const cv::Point2d s = apply(ts, src[static_cast<std::size_t>(i)]);
    const cv::Point2d d = apply(td, dst[static_cast<std::size_t>(i)]);
    double* r0 = a.ptr<double>(2 * i);
    double* r1 = a.ptr<double>(2 * i + 1);
    r0[0] = s.x; r0[1] = s.y; r0[2] = 1.0;
    r0[6] = -d.x * s.x; r0[7] = -d.x * s.y; r0[8] = -d.x;
    r1[3] = s.x; r1[4] = s.y; r1[5] = 1.0;
    r1[6] = -d.y * s.x; r1[7] = -d.y * s.y; r1[8] = -d.y;
  }
  cv::Mat h;
  cv::SVD::solveZ(a, h);
  if (h.empty()) return std::nullopt;

  cv::Matx33d hn(h.ptr<double>());
  cv::Matx33d full = td.inv() * hn * ts;
  if (std::abs(full(2, 2)) < 1e-12) return std::nullopt;
  full *= 1.0 / full(2, 2);
  return full;
}

std::optional<cv::Matx33d> solve_homography_ransac(const std::vector<cv::Point2d>& src,
                                                   const std::vector<cv::Point2d>& dst,
                                                   double reproj_px) {
  std::vector<cv::Point2f> s(src.begin(), src.end());
  std::vector<cv::Point2f> d(dst.begin(), dst.end());
  cv::Mat h = cv::findHomography(s, d, cv::RANSAC, reproj_px);
  if (h.empty()) return std::nullopt;
  h.convertTo(h, CV_64F);
  return cv::Matx33d(h.ptr<double>());
}

/// Mean residual of the least-squares affine map canonical -> raw.
double affine_planarity(const std::vector<cv::Point2d>& raw,
                        const std::vector<cv::Point2d>& canonical) {
  const int n = static_cast<int>(raw.size());
  cv::Mat a(n, 3, CV_64F);
  cv::Mat bx(n, 1, CV_64F);
  cv::Mat by(n, 1, CV_64F);
  for (int i = 0; i < n; ++i) {
    const auto k = static_cast<std::size_t>(i);
    a.at<double>(i, 0) = canonical[k].x;
    a.at<double>(i, 1) = canonical[k].y;
    a.at<double>(i, 2) = 1.0;
    bx.at<double>(i, 0) = raw[k].x;
    by.at<double>(i, 0) = raw[k].y;
  }
  cv::Mat cx;
  cv::Mat cy;
  if (!cv::solve(a, bx, cx, cv::DECOMP_SVD) || !cv::solve(a, by, cy, cv::DECOMP_SVD)) {
    return 0.0;
  }
  const cv::Mat px = a * cx;
  const cv::Mat py = a * cy;
  double sum = 0.0;
  for (int i = 0; i < n; ++i) {
    sum += std::hypot(px.at<double>(i, 0) - bx.at<double>(i, 0),
                      py.at<double>(i, 0) - by.at<double>(i, 0));
  }
  return sum / n;
}

}  // namespace

mc::CropBounds compute_crop_bounds(const std::array<mc::CanonicalPoint, 4>& anchors,
                                   int margin_px,
                                   mc::CanvasSize canvas) noexcept {
  double min_x = anchors[0].x;
  double max_x = anchors[0].x;
  double min_y = anchors[0].y;
  double max_y = anchors[0].y;
  for (const auto& p : anchors) {
    min_x = std::min(min_x, p.x);
    max_x = std::max(max_x, p.x);
    min_y = std::min(min_y, p.y);
    max_y = std::max(max_y, p.y);
  }
  const int m = std::max(0, margin_px);
  const int w = static_cast<int>(canvas.width);
  const int h = static_cast<int>(canvas.height);
  mc::CropBounds b;
  b.x0 = std::clamp(static_cast<int>(std::floor(min_x)) - m, 0, w);
  b.y0 = std::clamp(static_cast<int>(std::floor(min_y)) - m, 0, h);
  b.x1 = std::clamp(static_cast<int>(std::ceil(max_x)) + m, 0, w);
  b.y1 = std::clamp(static_cast<int>(std::ceil(max_y)) + m, 0, h);
  return b;
}

GeometricAligner::GeometricAligner(mc::FormTemplate tpl, AlignerConfig config)
    : tpl_(std::move(tpl)), config_(config) {}

mc::QualityThresholds GeometricAligner::scaled_thresholds(double page_dpi) const noexcept {
  const double s = config_.reference_dpi > 0.0 ? page_dpi / config_.reference_dpi : 1.0;
  return mc::QualityThresholds{config_.thresholds.ok_px * s,
                               config_.thresholds.warn_px * s};
}

double GeometricAligner::graded_residual(const TransformFit& fit) const noexcept {
  if (config_.gate_on_planarity &&
      fit.transform.kind() == mc::TransformKind::Projective) {
    return std::max(fit.mean_residual_px, fit.planarity_px);
  }
  return fit.mean_residual_px;
}

int GeometricAligner::margin_px() const noexcept {
  return static_cast<int>(std::lround(config_.crop_margin_in * tpl_.dpi));
}

mc::CropBounds GeometricAligner::crop_bounds() const noexcept {
  std::array<mc::CanonicalPoint, 4> anchors{};
  for (const mc::Corner corner : mc::kCorners) {
    anchors[mc::corner_index(corner)] = tpl_.canonical_anchor(corner);
  }
  return compute_crop_bounds(anchors, margin_px(), tpl_.canvas);
}

std::expected<TransformFit, mc::PipelineError> GeometricAligner::fit(
    const mc::AnchorSet& detected) const {
  const Correspondences c = gather(detected, tpl_);
  if (c.raw.size() < 3) {
    return std::unexpected(mc::PipelineError::InsufficientAnchors);
  }
  if (max_triangle_area(c.raw) < kMinSpanArea) {
    return std::unexpected(mc::PipelineError::TransformFailed);
  }

  std::optional<cv::Matx33d> m;
  mc::TransformKind kind = mc::TransformKind::Affine;
  if (c.raw.size() == 3) {
    m = solve_affine(c.raw, c.canonical);
  } else {
    kind = mc::TransformKind::Projective;
    m = config_.projective_method == ProjectiveMethod::Ransac
            ? solve_homography_ransac(c.raw, c.canonical, config_.ransac_reproj_px)
            : solve_homography_dlt(c.raw, c.canonical);
  }
  if (!m) return std::unexpected(mc::PipelineError::TransformFailed);

  TransformFit out;
  out.transform = mc::PageTransform(kind, to_matrix(*m));
  if (!out.transform.invertible()) {
    return std::unexpected(mc::PipelineError::TransformFailed);
  }

  double sum = 0.0;
  for (std::size_t i = 0; i < c.corners.size(); ++i) {
    const mc::RawPixelPoint back = out.transform.to_raw(
        mc::CanonicalPoint{c.canonical[i].x, c.canonical[i].y});
    const double r = mc::distance(back, mc::RawPixelPoint{c.raw[i].x, c.raw[i].y});
    if (!std::isfinite(r)) return std::unexpected(mc::PipelineError::TransformFailed);
    out.residuals.push_back(mc::AnchorResidual{c.corners[i], r});
    sum += r;
    out.max_residual_px = std::max(out.max_residual_px, r);
  }
  out.mean_residual_px = sum / static_cast<double>(c.corners.size());
  out.planarity_px = affine_planarity(c.raw, c.canonical);
  return out;
}

std::expected<mc::AlignmentResult, mc::PipelineError> GeometricAligner::align(
    const mc::PageImage& page, const mc::AnchorSet& detected) const {
  const cv::Mat src = as_mat(page);
  if (src.empty()) return std::unexpected(mc::PipelineError::InvalidPage);

  auto fitted = fit(detected);
  if (!fitted) return std::unexpected(fitted.error());

  const auto& m = fitted->transform.matrix();
  const cv::Matx33d h(m.data());
  cv::Mat canonical;
  cv::warpPerspective(src, canonical, cv::Mat(h),
                      cv::Size(static_cast<int>(tpl_.canvas.width),
                               static_cast<int>(tpl_.canvas.height)),
                      cv::INTER_LINEAR, cv::BORDER_CONSTANT,
                      cv::Scalar(config_.border_value));

  mc::AlignmentResult r;
  r.graded_residual_px = graded_residual(*fitted);
  r.transform = fitted->transform;
  r.anchors_used = fitted->residuals.size();
  r.residuals = std::move(fitted->residuals);
  r.mean_residual_px = fitted->mean_residual_px;
  r.max_residual_px = fitted->max_residual_px;
  r.planarity_px = fitted->planarity_px;
  r.thresholds = scaled_thresholds(page.dpi());
  r.tier = mc::classify_residual(r.graded_residual_px, r.thresholds);
  r.crop = crop_bounds();
  if (r.crop.empty()) return std::unexpected(mc::PipelineError::InvalidTemplate);

  const cv::Mat cropped =
      canonical(cv::Rect(r.crop.x0, r.crop.y0, r.crop.width(), r.crop.height()));
  r.canonical_image = to_page_image(cropped, tpl_.dpi);
  return r;
}

}  // namespace markscan::vision
