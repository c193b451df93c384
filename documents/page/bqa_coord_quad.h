#ifndef BQA_COORD_QUAD_H
#define BQA_COORD_QUAD_H

#include <optional>
#include <vector>

namespace bqa {

// Excess of a rectangle past each edge of an image canvas, all >= 0.
struct bqa_excess {
  double width = 0.0;   // past the right edge
  double height = 0.0;  // past the bottom edge
  double x = 0.0;       // past the left edge, max(0, -x)
  double y = 0.0;       // past the top edge, max(0, -y)

  bool any() const { return width > 0 || height > 0 || x > 0 || y > 0; }
};

// [x, y, width, height] rectangle in image pixel space.
class bqa_coord_quad
{
public:
  double x = 0.0;
  double y = 0.0;
  double width = 0.0;
  double height = 0.0;

  bqa_coord_quad();
  bqa_coord_quad(double x_val, double y_val, double width_val, double height_val);

  // Quad from a raw "c" list; nullopt when fewer than four values are present.
  static std::optional<bqa_coord_quad> from_list(const std::vector<double>& coords);

  double get_left() const;
  double get_right() const;
  double get_top() const;
  double get_bottom() const;
  double area() const;

  // x >= 0, y >= 0, right <= image_width, bottom <= image_height.
  // Touching an image edge counts as inside.
  bool within_image(double image_width, double image_height) const;

  bqa_excess excess(double image_width, double image_height) const;
};

// Smallest rectangle enclosing a set of quads, accumulated one quad at a time.
class bqa_bounding_box
{
public:
  void include(const bqa_coord_quad& quad);
  bool empty() const { return !has_quads_; }

  double min_x() const { return min_x_; }
  double min_y() const { return min_y_; }
  double max_x() const { return max_x_; }
  double max_y() const { return max_y_; }

  bqa_coord_quad to_quad() const;
  double area() const;

private:
  bool has_quads_ = false;
  double min_x_ = 0.0;
  double min_y_ = 0.0;
  double max_x_ = 0.0;
  double max_y_ = 0.0;
};

} // namespace bqa

#endif // BQA_COORD_QUAD_H
