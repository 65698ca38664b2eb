/****************************************************************************
 *                                                                          *
 *  Author : lukasz.iwaszkiewicz@gmail.com                                  *
 *  ~~~~~~~~                                                                *
 *  License : see COPYING file for details.                                 *
 *  ~~~~~~~~~                                                               *
 ****************************************************************************/

#include "display.h"
#include <string>

namespace tg::detail {

void line (IDisplay &disp, Point pos, Dimension len, std::string_view chr, Attributes const &attr)
{
        if (len <= 0) {
                return;
        }

        std::string tmp;
        tmp.reserve (len * chr.size ());

        for (Dimension i = 0; i < len; ++i) {
                tmp += chr;
        }

        disp.print (pos, tmp, attr);
}

/*--------------------------------------------------------------------------*/

void border (IDisplay &disp, Rect const &rect, BorderCharacters const &chars, Attributes const &attr)
{
        auto w = rect.size.width;
        auto h = rect.size.height;

        if (w < 2 || h < 2) {
                return;
        }

        auto x = rect.origin.x ();
        auto y = rect.origin.y ();

        std::string top{chars.nwcorner};
        std::string bottom{chars.swcorner};

        for (Dimension i = 0; i < w - 2; ++i) {
                top += chars.hline;
                bottom += chars.hline;
        }

        top += chars.necorner;
        bottom += chars.secorner;

        disp.print ({x, y}, top, attr);

        for (Coordinate row = y + 1; row < y + h - 1; ++row) {
                disp.print ({x, row}, chars.vline, attr);
                disp.print ({x + w - 1, row}, chars.vline, attr);
        }

        disp.print ({x, y + h - 1}, bottom, attr);
}

} // namespace tg::detail
