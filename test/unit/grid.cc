/****************************************************************************
 *                                                                          *
 *  Author : lukasz.iwaszkiewicz@gmail.com                                  *
 *  ~~~~~~~~                                                                *
 *  License : see COPYING file for details.                                 *
 *  ~~~~~~~~~                                                               *
 ****************************************************************************/

#include "termgrid/errors.h"
#include "termgrid/grid.h"
#include <catch2/catch.hpp>
#include <algorithm>
#include <vector>

using namespace tg;

static_assert (Rect{{0, 0}, {2, 2}}.contains ({1, 1}));
static_assert (Rect{{1, 1}, {2, 3}}.stop () == Point{3, 4});

TEST_CASE ("Cell dimensions", "[grid]")
{
        Grid g{3, 3, 800, 600};

        REQUIRE (g.cellDimensions () == std::pair{266, 200});
        REQUIRE (g.offsets () == std::pair{0, 2});

        SECTION ("Remainder goes to the last row only")
        {
                REQUIRE (g.cellRect (0, 0).size == Dimensions{200, 266});
                REQUIRE (g.cellRect (1, 2).size == Dimensions{200, 266});
                REQUIRE (g.cellRect (2, 0).size == Dimensions{200, 268});
                REQUIRE (g.cellRect (2, 2).origin == Point{400, 532});
        }

        SECTION ("Spans")
        {
                auto r = g.cellRect (1, 0, 2, 3);
                REQUIRE (r.origin == Point{0, 266});
                REQUIRE (r.size == Dimensions{600, 534});
        }

        SECTION ("Title bar offset")
        {
                Grid t{3, 3, 800, 600, 1};
                REQUIRE (t.cellRect (0, 0).origin == Point{0, 1});
                REQUIRE (t.cellRect (2, 1).origin == Point{200, 533});
        }
}

TEST_CASE ("Cells tile the whole area", "[grid]")
{
        auto [rows, columns, height, width] = GENERATE (table<int, int, int, int> ({
                {1, 1, 4, 4},
                {3, 3, 10, 10},
                {2, 5, 17, 23},
                {4, 3, 13, 40},
                {5, 7, 31, 50},
        }));

        Grid g{rows, columns, height, width};
        std::vector<int> coverage (size_t (height * width));

        for (int r = 0; r < rows; ++r) {
                for (int c = 0; c < columns; ++c) {
                        auto rect = g.cellRect (r, c);

                        for (auto y = rect.origin.y (); y < rect.stop ().y (); ++y) {
                                for (auto x = rect.origin.x (); x < rect.stop ().x (); ++x) {
                                        REQUIRE (x < width);
                                        REQUIRE (y < height);
                                        ++coverage.at (size_t (y * width + x));
                                }
                        }
                }
        }

        REQUIRE (std::ranges::all_of (coverage, [] (int n) { return n == 1; }));
}

TEST_CASE ("Grid size errors", "[grid]")
{
        REQUIRE_THROWS_AS (Grid (3, 3, 9, 100), TooSmallError);
        REQUIRE_THROWS_AS (Grid (3, 3, 100, 9), TooSmallError);
        REQUIRE_THROWS_AS (Grid (0, 3, 100, 100), InvalidValueError);
        REQUIRE_NOTHROW (Grid (3, 3, 10, 10));

        SECTION ("Failed resize leaves the grid untouched")
        {
                Grid g{3, 3, 30, 30};
                REQUIRE_THROWS_AS (g.resize (5, 30), TooSmallError);
                REQUIRE (g.height () == 30);
                REQUIRE (g.rowHeight () == 10);

                g.resize (60, 90);
                REQUIRE (g.cellDimensions () == std::pair{20, 30});
        }

        SECTION ("Rows and columns")
        {
                Grid g{3, 3, 30, 30};
                g.setNumRows (5);
                REQUIRE (g.rowHeight () == 6);
                REQUIRE_THROWS_AS (g.setNumColumns (10), TooSmallError);
                REQUIRE (g.columns () == 3);
        }
}

TEST_CASE ("Grid contains", "[grid]")
{
        Grid g{3, 4, 30, 40};

        REQUIRE (g.contains (0, 0, 3, 4));
        REQUIRE (g.contains (2, 3, 1, 1));
        REQUIRE (!g.contains (2, 3, 2, 1));
        REQUIRE (!g.contains (0, 3, 1, 2));
        REQUIRE (!g.contains (-1, 0, 1, 1));
        REQUIRE (!g.contains (0, 0, 0, 1));
}
