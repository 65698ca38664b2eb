/****************************************************************************
 *                                                                          *
 *  Author : lukasz.iwaszkiewicz@gmail.com                                  *
 *  ~~~~~~~~                                                                *
 *  License : see COPYING file for details.                                 *
 *  ~~~~~~~~~                                                               *
 ****************************************************************************/

#pragma once
#include <algorithm>
#include <cstdint>

namespace tg {

/// Terminal coordinates are counted in characters, (0, 0) is the top left corner.
using Coordinate = int;
using Dimension = int;

class Point {
public:
        constexpr Point (Coordinate x = 0, Coordinate y = 0) : x_{x}, y_{y} {}

        constexpr Point &operator+= (Point const &p)
        {
                x_ += p.x_;
                y_ += p.y_;
                return *this;
        }

        constexpr Point &operator-= (Point const &p)
        {
                x_ -= p.x_;
                y_ -= p.y_;
                return *this;
        }

        constexpr Point operator+ (Point p) const
        {
                p += *this;
                return p;
        }

        constexpr Point operator- (Point const &p) const
        {
                Point ret = *this;
                ret -= p;
                return ret;
        }

        constexpr bool operator== (Point const &) const = default;

        constexpr Coordinate &x () { return x_; }
        constexpr Coordinate x () const { return x_; }
        constexpr Coordinate &y () { return y_; }
        constexpr Coordinate y () const { return y_; }

private:
        Coordinate x_;
        Coordinate y_;
};

struct Dimensions {
        constexpr Dimensions (Dimension w = 0, Dimension h = 0) : width{w}, height{h} {}
        constexpr bool operator== (Dimensions const &) const = default;

        Dimension width{};
        Dimension height{};
};

/**
 * Rectangle of character cells. The stop point is one past the last column / row.
 */
struct Rect {
        constexpr Point stop () const { return origin + Point (size.width, size.height); }

        /// Inclusive on every edge, so a click on the border hits the element.
        constexpr bool contains (Point const &p) const
        {
                return origin.x () <= p.x () && p.x () <= origin.x () + size.width && origin.y () <= p.y ()
                        && p.y () <= origin.y () + size.height;
        }

        constexpr bool operator== (Rect const &) const = default;

        Point origin{};
        Dimensions size{};
};

namespace detail {

        constexpr bool heightsOverlap (Coordinate y1, Dimension height1, Coordinate y2, Dimension height2)
        {
                auto y1d = y1 + height1 - 1;
                auto y2d = y2 + height2 - 1;
                return y1 <= y2d && y2 <= y1d;
        }

        static_assert (!heightsOverlap (-1, 1, 0, 2));
        static_assert (heightsOverlap (0, 1, 0, 2));
        static_assert (heightsOverlap (1, 1, 0, 2));
        static_assert (!heightsOverlap (2, 1, 0, 2));

        template <typename T> constexpr T clamp (T val, T lo, T hi) { return std::max (lo, std::min (val, hi)); }

} // namespace detail
} // namespace tg
