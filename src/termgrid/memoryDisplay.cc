/****************************************************************************
 *                                                                          *
 *  Author : lukasz.iwaszkiewicz@gmail.com                                  *
 *  ~~~~~~~~                                                                *
 *  License : see COPYING file for details.                                 *
 *  ~~~~~~~~~                                                               *
 ****************************************************************************/

#include "memoryDisplay.h"

namespace tg {

MemoryDisplay::MemoryDisplay (Dimensions size, int maxColorPairs) : size_{size}, maxPairs{maxColorPairs} { clear (); }

/****************************************************************************/

void MemoryDisplay::print (Point const &pos, std::string_view str, Attributes const &attr)
{
        if (pos.y () < 0 || pos.y () >= size_.height) {
                return;
        }

        auto x = pos.x ();
        auto &row = cells.at (pos.y ());

        for (size_t i = 0; i < str.size ();) {
                // Single UTF-8 code point.
                size_t len = 1;
                while (i + len < str.size () && (static_cast<unsigned char> (str[i + len]) & 0xc0) == 0x80) {
                        ++len;
                }

                if (x >= 0 && x < size_.width) {
                        row.at (x) = {std::string{str.substr (i, len)}, attr};
                }

                ++x;
                i += len;
        }
}

/****************************************************************************/

void MemoryDisplay::clear ()
{
        cells.assign (size_.height, std::vector<Cell> (size_.width));
}

/****************************************************************************/

Event MemoryDisplay::poll (Timeout timeout)
{
        lastTimeout_ = timeout;

        if (events.empty ()) {
                return std::monostate{};
        }

        auto e = events.front ();
        events.pop_front ();
        return e;
}

/****************************************************************************/

void MemoryDisplay::pushKeys (std::string_view chars)
{
        for (auto c : chars) {
                pushKey (toKey (c));
        }
}

/****************************************************************************/

void MemoryDisplay::resize (Dimensions const &size)
{
        size_ = size;
        clear ();
        push (ResizeEvent{size});
}

/****************************************************************************/

std::string MemoryDisplay::line (Coordinate y) const
{
        std::string ret;

        for (auto const &c : cells.at (y)) {
                ret += c.chr;
        }

        return ret;
}

/****************************************************************************/

std::string MemoryDisplay::at (Point const &pos) const { return cells.at (pos.y ()).at (pos.x ()).chr; }

Attributes MemoryDisplay::attributes (Point const &pos) const { return cells.at (pos.y ()).at (pos.x ()).attr; }

/****************************************************************************/

bool MemoryDisplay::contains (std::string_view str) const
{
        for (Coordinate y = 0; y < size_.height; ++y) {
                if (line (y).find (str) != std::string::npos) {
                        return true;
                }
        }

        return false;
}

} // namespace tg
