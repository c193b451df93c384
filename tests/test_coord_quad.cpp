#include <catch2/catch_all.hpp>
#include "../documents/page/bqa_coord_quad.h"

using namespace bqa;

SCENARIO("bqa_coord_quad provides basic geometry operations") {
    GIVEN("A quad with position and size") {
        bqa_coord_quad quad(10, 20, 100, 50);

        WHEN("Calculating edge positions") {
            THEN("Edges follow from x, y, width and height") {
                REQUIRE(quad.get_left() == 10);
                REQUIRE(quad.get_right() == 110);
                REQUIRE(quad.get_top() == 20);
                REQUIRE(quad.get_bottom() == 70);
                REQUIRE(quad.area() == 5000);
            }
        }
    }

    GIVEN("Raw coordinate lists") {
        WHEN("The list has four or more values") {
            auto quad = bqa_coord_quad::from_list({1, 2, 3, 4, 99});

            THEN("The first four values are used") {
                REQUIRE(quad.has_value());
                REQUIRE(quad->x == 1);
                REQUIRE(quad->y == 2);
                REQUIRE(quad->width == 3);
                REQUIRE(quad->height == 4);
            }
        }

        WHEN("The list is too short or empty") {
            THEN("No quad is produced") {
                REQUIRE_FALSE(bqa_coord_quad::from_list({1, 2, 3}).has_value());
                REQUIRE_FALSE(bqa_coord_quad::from_list({}).has_value());
            }
        }
    }
}

SCENARIO("bqa_coord_quad checks containment in an image canvas") {
    GIVEN("A 200 x 100 image") {
        const double width = 200;
        const double height = 100;

        WHEN("The quad lies inside") {
            bqa_coord_quad quad(10, 10, 100, 50);

            THEN("It is within the image and has no excess") {
                REQUIRE(quad.within_image(width, height));
                bqa_excess e = quad.excess(width, height);
                REQUIRE_FALSE(e.any());
                REQUIRE(e.width == 0);
                REQUIRE(e.height == 0);
                REQUIRE(e.x == 0);
                REQUIRE(e.y == 0);
            }
        }

        WHEN("The quad touches the right and bottom edges") {
            bqa_coord_quad quad(100, 50, 100, 50);

            THEN("It still counts as inside") {
                REQUIRE(quad.within_image(width, height));
            }
        }

        WHEN("The quad extends past the bottom edge") {
            bqa_coord_quad quad(10, 80, 100, 50);

            THEN("Only the height excess is set") {
                REQUIRE_FALSE(quad.within_image(width, height));
                bqa_excess e = quad.excess(width, height);
                REQUIRE(e.height == 30);
                REQUIRE(e.width == 0);
                REQUIRE(e.x == 0);
                REQUIRE(e.y == 0);
            }
        }

        WHEN("The quad starts at negative coordinates and overflows to the right") {
            bqa_coord_quad quad(-5, -7, 250, 20);

            THEN("Every direction reports its own overflow") {
                REQUIRE_FALSE(quad.within_image(width, height));
                bqa_excess e = quad.excess(width, height);
                REQUIRE(e.x == 5);
                REQUIRE(e.y == 7);
                REQUIRE(e.width == 45);
                REQUIRE(e.height == 0);
            }
        }
    }
}

SCENARIO("bqa_bounding_box encloses a set of quads") {
    GIVEN("An empty box") {
        bqa_bounding_box box;

        THEN("It reports empty") {
            REQUIRE(box.empty());
        }

        WHEN("Two separate quads are included") {
            box.include(bqa_coord_quad(10, 10, 20, 10));
            box.include(bqa_coord_quad(50, 40, 10, 30));

            THEN("The box spans both") {
                REQUIRE_FALSE(box.empty());
                REQUIRE(box.min_x() == 10);
                REQUIRE(box.min_y() == 10);
                REQUIRE(box.max_x() == 60);
                REQUIRE(box.max_y() == 70);
                REQUIRE(box.area() == 3000);

                bqa_coord_quad q = box.to_quad();
                REQUIRE(q.x == 10);
                REQUIRE(q.y == 10);
                REQUIRE(q.width == 50);
                REQUIRE(q.height == 60);
            }
        }
    }
}
