/****************************************************************************
 *                                                                          *
 *  Author : lukasz.iwaszkiewicz@gmail.com                                  *
 *  ~~~~~~~~                                                                *
 *  License : see COPYING file for details.                                 *
 *  ~~~~~~~~~                                                               *
 ****************************************************************************/

#pragma once
#include "geometry.h"
#include <utility>

namespace tg {

/**
 * Splits the terminal area into rows x columns equal cells. Integer division leaves
 * a remainder (offsets), which is added to the cells of the last row / column so the
 * cells tile the whole area.
 */
class Grid {
public:
        /**
         * height and width are the size of the area managed by the grid. titleBarOffset
         * shifts every cell down (1 when the title bar occupies the first terminal row).
         * Throws TooSmallError unless 3 * rows < height and 3 * columns < width.
         */
        Grid (Dimension rows, Dimension columns, Dimension height, Dimension width, Coordinate titleBarOffset = 0);

        /// Absolute rectangle of the given cell range. Spans are not validated here.
        Rect cellRect (Dimension row, Dimension column, Dimension rowSpan = 1, Dimension columnSpan = 1) const;

        /// Recomputes everything for the new size. On error nothing changes.
        void resize (Dimension height, Dimension width);

        void setNumRows (Dimension rows);
        void setNumColumns (Dimension columns);

        /// {rowHeight, columnWidth}
        std::pair<Dimension, Dimension> cellDimensions () const { return {rowHeight_, columnWidth_}; }

        /// {offsetX, offsetY}
        std::pair<Dimension, Dimension> offsets () const { return {offsetX_, offsetY_}; }

        Dimension rows () const { return rows_; }
        Dimension columns () const { return columns_; }
        Dimension height () const { return height_; }
        Dimension width () const { return width_; }
        Dimension rowHeight () const { return rowHeight_; }
        Dimension columnWidth () const { return columnWidth_; }
        Coordinate titleBarOffset () const { return titleBarOffset_; }

        bool contains (Dimension row, Dimension column, Dimension rowSpan, Dimension columnSpan) const;

private:
        static void check (Dimension rows, Dimension columns, Dimension height, Dimension width);
        void recompute ();

        Dimension rows_;
        Dimension columns_;
        Dimension height_;
        Dimension width_;
        Coordinate titleBarOffset_;
        Dimension rowHeight_{};
        Dimension columnWidth_{};
        Dimension offsetX_{};
        Dimension offsetY_{};
};

} // namespace tg
