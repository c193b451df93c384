#include "bqa_coord_quad.h"
#include <algorithm>

namespace bqa {

bqa_coord_quad::bqa_coord_quad() {}

bqa_coord_quad::bqa_coord_quad(double x_val, double y_val, double width_val, double height_val)
  : x(x_val), y(y_val), width(width_val), height(height_val)
{
}

std::optional<bqa_coord_quad> bqa_coord_quad::from_list(const std::vector<double>& coords) {
  if (coords.size() < 4) {
    return std::nullopt;
  }
  return bqa_coord_quad(coords[0], coords[1], coords[2], coords[3]);
}

double bqa_coord_quad::get_left() const {
  return x;
}

double bqa_coord_quad::get_right() const {
  return x + width;
}

double bqa_coord_quad::get_top() const {
  return y;
}

double bqa_coord_quad::get_bottom() const {
  return y + height;
}

double bqa_coord_quad::area() const {
  return width * height;
}

bool bqa_coord_quad::within_image(double image_width, double image_height) const {
  return !(x < 0 || y < 0 || get_right() > image_width || get_bottom() > image_height);
}

bqa_excess bqa_coord_quad::excess(double image_width, double image_height) const {
  bqa_excess e;
  e.width = std::max(0.0, get_right() - image_width);
  e.height = std::max(0.0, get_bottom() - image_height);
  e.x = std::max(0.0, -x);
  e.y = std::max(0.0, -y);
  return e;
}

void bqa_bounding_box::include(const bqa_coord_quad& quad) {
  if (!has_quads_) {
    min_x_ = quad.get_left();
    min_y_ = quad.get_top();
    max_x_ = quad.get_right();
    max_y_ = quad.get_bottom();
    has_quads_ = true;
    return;
  }
  min_x_ = std::min(min_x_, quad.get_left());
  min_y_ = std::min(min_y_, quad.get_top());
  max_x_ = std::max(max_x_, quad.get_right());
  max_y_ = std::max(max_y_, quad.get_bottom());
}

bqa_coord_quad bqa_bounding_box::to_quad() const {
  return bqa_coord_quad(min_x_, min_y_, max_x_ - min_x_, max_y_ - min_y_);
}

double bqa_bounding_box::area() const {
  return (max_x_ - min_x_) * (max_y_ - min_y_);
}

} // namespace bqa
