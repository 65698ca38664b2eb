/****************************************************************************
 *                                                                          *
 *  Author : lukasz.iwaszkiewicz@gmail.com                                  *
 *  ~~~~~~~~                                                                *
 *  License : see COPYING file for details.                                 *
 *  ~~~~~~~~~                                                               *
 ****************************************************************************/

#include "grid.h"
#include "errors.h"
#include <fmt/format.h>

namespace tg {

Grid::Grid (Dimension rows, Dimension columns, Dimension height, Dimension width, Coordinate titleBarOffset)
    : rows_{rows}, columns_{columns}, height_{height}, width_{width}, titleBarOffset_{titleBarOffset}
{
        check (rows, columns, height, width);
        recompute ();
}

/****************************************************************************/

void Grid::check (Dimension rows, Dimension columns, Dimension height, Dimension width)
{
        if (rows < 1 || columns < 1) {
                throw InvalidValueError (fmt::format ("Grid needs at least one row and one column, got {}x{}", rows, columns));
        }

        if (3 * rows >= height) {
                throw TooSmallError (fmt::format ("Height {} is too small for {} rows", height, rows));
        }

        if (3 * columns >= width) {
                throw TooSmallError (fmt::format ("Width {} is too small for {} columns", width, columns));
        }
}

/****************************************************************************/

void Grid::recompute ()
{
        rowHeight_ = height_ / rows_;
        columnWidth_ = width_ / columns_;
        offsetY_ = height_ % rows_;
        offsetX_ = width_ % columns_;
}

/****************************************************************************/

Rect Grid::cellRect (Dimension row, Dimension column, Dimension rowSpan, Dimension columnSpan) const
{
        Dimension w = columnSpan * columnWidth_;
        Dimension h = rowSpan * rowHeight_;

        if (column + columnSpan == columns_) {
                w += offsetX_;
        }

        if (row + rowSpan == rows_) {
                h += offsetY_;
        }

        return {{column * columnWidth_, row * rowHeight_ + titleBarOffset_}, {w, h}};
}

/****************************************************************************/

void Grid::resize (Dimension height, Dimension width)
{
        check (rows_, columns_, height, width);
        height_ = height;
        width_ = width;
        recompute ();
}

/****************************************************************************/

void Grid::setNumRows (Dimension rows)
{
        check (rows, columns_, height_, width_);
        rows_ = rows;
        recompute ();
}

void Grid::setNumColumns (Dimension columns)
{
        check (rows_, columns, height_, width_);
        columns_ = columns;
        recompute ();
}

/****************************************************************************/

bool Grid::contains (Dimension row, Dimension column, Dimension rowSpan, Dimension columnSpan) const
{
        return row >= 0 && column >= 0 && rowSpan >= 1 && columnSpan >= 1 && row + rowSpan <= rows_ && column + columnSpan <= columns_;
}

} // namespace tg
