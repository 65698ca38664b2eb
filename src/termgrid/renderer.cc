/****************************************************************************
 *                                                                          *
 *  Author : lukasz.iwaszkiewicz@gmail.com                                  *
 *  ~~~~~~~~                                                                *
 *  License : see COPYING file for details.                                 *
 *  ~~~~~~~~~                                                               *
 ****************************************************************************/

#include "renderer.h"
#include "element.h"
#include <algorithm>
#include <string>
#include <vector>

namespace tg {

void Renderer::drawBorder (UIElement const &element, bool fill, bool withTitle)
{
        auto [padx, pady] = element.padding ();
        auto start = element.startPosition ();
        Rect rect{{start.x () + padx, start.y () + pady}, {element.width () - 2 * padx, element.height () - 2 * pady}};
        drawFrame (rect, element.title (), fill, withTitle);
}

/****************************************************************************/

void Renderer::drawFrame (Rect const &rect, std::string_view title, bool fill, bool withTitle)
{
        auto w = rect.size.width;
        auto h = rect.size.height;

        if (w < 2 || h < 2) {
                return;
        }

        Attributes attr{color, bold};

        if (fill) {
                std::string blank (w - 2, ' ');

                for (Coordinate y = rect.origin.y () + 1; y < rect.origin.y () + h - 1; ++y) {
                        display_.print ({rect.origin.x () + 1, y}, blank, attr);
                }
        }

        detail::border (display_, rect, borders_, attr);

        // +-- title ---+
        auto titleLen = detail::textWidth (title);

        if (withTitle && !title.empty () && titleLen + 6 <= w) {
                std::string t{" "};
                t += title;
                t += " ";
                display_.print ({rect.origin.x () + 3, rect.origin.y ()}, t, attr);
        }
}

/****************************************************************************/

Dimension Renderer::textWidth (UIElement const &element, bool bordered)
{
        auto [padx, pady] = element.padding ();
        return std::max (0, element.width () - 2 * padx - ((bordered) ? (4) : (0)));
}

/****************************************************************************/

void Renderer::drawText (UIElement const &element, std::string_view line, Coordinate y, Alignment alignment, bool bordered, bool selected,
                         int startPos)
{
        auto [padx, pady] = element.padding ();
        auto startX = element.startPosition ().x () + padx;
        auto len = textWidth (element, bordered);
        auto baseColor = (selected) ? (element.selectedColor ()) : (element.color ());
        Attributes attr{color, bold || element.isSelected ()};

        if (bordered) {
                display_.print ({startX, y}, borders_.vline, attr);
                display_.print ({startX + 1, y}, " ", attr);
                startX += 2;
        }

        auto visible = (startPos < int (line.size ())) ? (line.substr (std::max (startPos, 0))) : (std::string_view{});
        auto renderText = detail::align (visible, len, alignment);
        std::vector<Fragment> fragments{{renderText, baseColor}};

        for (auto const &rule : rules) {
                if (auto res = rule.fragments (line, renderText, baseColor, selected); res.matched) {
                        fragments = std::move (res.fragments);
                        break;
                }
        }

        for (auto const &f : fragments) {
                display_.print ({startX, y}, f.text, {f.color, attr.bold});
                startX += detail::textWidth (f.text);
        }

        if (bordered) {
                display_.print ({startX, y}, " ", attr);
                display_.print ({startX + 1, y}, borders_.vline, attr);
        }
}

/****************************************************************************/

namespace detail {
        std::string align (std::string_view str, Dimension len, Alignment alignment)
        {
                if (len <= 0) {
                        return {};
                }

                std::string ret{str.substr (0, size_t (len))};
                auto gap = len - int (ret.size ());

                switch (alignment) {
                case Alignment::left:
                        ret.append (gap, ' ');
                        break;

                case Alignment::center:
                        ret.insert (0, gap / 2, ' ');
                        ret.append (gap - gap / 2, ' ');
                        break;

                case Alignment::right:
                        ret.insert (0, gap, ' ');
                        break;
                }

                return ret;
        }
} // namespace detail

} // namespace tg
