//  Copyright 2026 Yurun Zi
//
//  Licensed under the Apache License, Version 2.0 (the "License");
//  you may not use this file except in compliance with the License.
//  You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
//  Unless required by applicable law or agreed to in writing, software
//  distributed under the License is distributed on an "AS IS" BASIS,
//  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//  See the License for the specific language governing permissions and
//  limitations under the License.

#include "geometry/coordinate_transform.hpp"

#include <algorithm>
#include <cmath>

namespace exodus {
auto CoordinateTransform::SnapRotation(int64_t degrees) -> QuarterTurn {
  int64_t normalized = degrees % 360;
  if (normalized < 0) normalized += 360;
  const int64_t quarter = ((normalized + 45) / 90) % 4;
  return static_cast<QuarterTurn>(quarter * 90);
}

auto CoordinateTransform::Compose(QuarterTurn lhs, QuarterTurn rhs) -> QuarterTurn {
  return SnapRotation(static_cast<int64_t>(lhs) + static_cast<int64_t>(rhs));
}

auto CoordinateTransform::BoundsFromCorners(const RawFaceCorners& corners) -> cv::Rect2d {
  const double xs[] = {corners.top_left_.x, corners.top_right_.x, corners.bottom_left_.x,
                       corners.bottom_right_.x};
  const double ys[] = {1.0 - corners.top_left_.y, 1.0 - corners.top_right_.y,
                       1.0 - corners.bottom_left_.y, 1.0 - corners.bottom_right_.y};
  const auto [min_x, max_x] = std::minmax_element(std::begin(xs), std::end(xs));
  const auto [min_y, max_y] = std::minmax_element(std::begin(ys), std::end(ys));
  return {*min_x, *min_y, *max_x - *min_x, *max_y - *min_y};
}

auto CoordinateTransform::FlipVertical(const cv::Rect2d& rect) -> cv::Rect2d {
  return {rect.x, 1.0 - rect.y - rect.height, rect.width, rect.height};
}

auto CoordinateTransform::Rotate(const cv::Rect2d& rect, QuarterTurn turn) -> cv::Rect2d {
  const double x = rect.x;
  const double y = rect.y;
  const double w = rect.width;
  const double h = rect.height;
  switch (turn) {
    case QuarterTurn::DEG_0:
      return {x, y, w, h};
    case QuarterTurn::DEG_90:
      return {y, x, h, w};
    case QuarterTurn::DEG_180:
      return {1.0 - x - w, 1.0 - y - h, w, h};
    case QuarterTurn::DEG_270:
      return {1.0 - y - h, 1.0 - x - w, h, w};
  }
  return rect;
}

auto CoordinateTransform::InverseRotate(const cv::Rect2d& rect, QuarterTurn turn) -> cv::Rect2d {
  const double x = rect.x;
  const double y = rect.y;
  const double w = rect.width;
  const double h = rect.height;
  switch (turn) {
    case QuarterTurn::DEG_0:
      return {x, y, w, h};
    case QuarterTurn::DEG_90:
      // (X, Y, W, H) = (y, x, h, w)
      return {y, x, h, w};
    case QuarterTurn::DEG_180:
      return {1.0 - x - w, 1.0 - y - h, w, h};
    case QuarterTurn::DEG_270:
      // (X, Y, W, H) = (1-y-h, 1-x-w, h, w)  =>  x = 1-Y-H, y = 1-X-W
      return {1.0 - y - h, 1.0 - x - w, h, w};
  }
  return rect;
}

auto CoordinateTransform::Scale(const cv::Rect2d& rect, const SensorCorrection& correction)
    -> cv::Rect2d {
  return {rect.x * correction.width_factor_, rect.y * correction.height_factor_,
          rect.width * correction.width_factor_, rect.height * correction.height_factor_};
}

auto CoordinateTransform::ApplyCrop(const cv::Rect2d& rect, const CropOperation& crop,
                                    const cv::Size2d& master_size) -> cv::Rect2d {
  if (crop.width_ <= 0.0 || crop.height_ <= 0.0 || master_size.width <= 0.0 ||
      master_size.height <= 0.0) {
    return rect;
  }
  // Top edge of the crop window, measured from the top of the master
  const double crop_top = master_size.height - crop.y_ - crop.height_;
  return {(rect.x * master_size.width - crop.x_) / crop.width_,
          (rect.y * master_size.height - crop_top) / crop.height_,
          rect.width * master_size.width / crop.width_,
          rect.height * master_size.height / crop.height_};
}

auto CoordinateTransform::Clamp(const cv::Rect2d& rect) -> cv::Rect2d {
  const double x0 = std::clamp(rect.x, 0.0, 1.0);
  const double y0 = std::clamp(rect.y, 0.0, 1.0);
  const double x1 = std::clamp(rect.x + std::max(rect.width, 0.0), 0.0, 1.0);
  const double y1 = std::clamp(rect.y + std::max(rect.height, 0.0), 0.0, 1.0);
  return {x0, y0, std::max(0.0, x1 - x0), std::max(0.0, y1 - y0)};
}

auto CoordinateTransform::Center(const cv::Rect2d& rect) -> cv::Point2d {
  return {rect.x + rect.width / 2.0, rect.y + rect.height / 2.0};
}

auto CoordinateTransform::IsNormalized(const cv::Rect2d& rect) -> bool {
  return rect.width >= 0.0 && rect.height >= 0.0 && rect.x >= -kEpsilon &&
         rect.y >= -kEpsilon && rect.x + rect.width <= 1.0 + kEpsilon &&
         rect.y + rect.height <= 1.0 + kEpsilon;
}
};  // namespace exodus
