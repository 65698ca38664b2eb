/****************************************************************************
 *                                                                          *
 *  Author : lukasz.iwaszkiewicz@gmail.com                                  *
 *  ~~~~~~~~                                                                *
 *  License : see COPYING file for details.                                 *
 *  ~~~~~~~~~                                                               *
 ****************************************************************************/

#pragma once
#include "colors.h"
#include "geometry.h"
#include "keys.h"
#include <chrono>
#include <optional>
#include <string_view>
#include <variant>

namespace tg {

struct KeyEvent {
        Key key{Key::unknown};
};

struct MouseInput {
        Point position{};
        MouseEvent event{MouseEvent::unknown};
};

struct ResizeEvent {
        Dimensions size{};
};

/// What poll returns. std::monostate means the timeout expired.
using Event = std::variant<std::monostate, KeyEvent, MouseInput, ResizeEvent>;

using Timeout = std::optional<std::chrono::milliseconds>;

/**
 * Display interface. Everything the library draws or reads from the terminal goes
 * through here.
 */
class IDisplay {
public:
        IDisplay () = default;
        IDisplay (IDisplay const &) = default;
        IDisplay &operator= (IDisplay const &) = default;
        IDisplay (IDisplay &&) noexcept = default;
        IDisplay &operator= (IDisplay &&) noexcept = default;
        virtual ~IDisplay () = default;

        /// Prints str starting at pos. Characters falling outside the screen are dropped.
        virtual void print (Point const &pos, std::string_view str, Attributes const &attr) = 0;
        virtual void clear () = 0;
        virtual void refresh () = 0;

        virtual void initColorPair (ColorPair id, int16_t fg, int16_t bg) = 0;
        virtual int maxColorPairs () const = 0;

        virtual Dimensions size () const = 0;

        /// Waits for the next input event. Empty timeout blocks.
        virtual Event poll (Timeout timeout) = 0;

        virtual void moveCursor (Point const &pos) = 0;
        virtual void showCursor (bool visible) = 0;
        virtual void enableMouse (bool /* enabled */) {}
};

namespace detail {

        /// Number of terminal columns of an UTF-8 string (one per code point).
        constexpr Dimension textWidth (std::string_view str)
        {
                Dimension ret{};

                for (auto c : str) {
                        if ((static_cast<unsigned char> (c) & 0xc0) != 0x80) {
                                ++ret;
                        }
                }

                return ret;
        }

        static_assert (textWidth ("abc") == 3);
        static_assert (textWidth ("╭─╮") == 3);

        /// Horizontal run of len copies of chr.
        void line (IDisplay &disp, Point pos, Dimension len, std::string_view chr, Attributes const &attr);

        /// Frame around rect. Does nothing for rectangles smaller than 2x2.
        void border (IDisplay &disp, Rect const &rect, BorderCharacters const &chars, Attributes const &attr);

} // namespace detail
} // namespace tg
