/****************************************************************************
 *                                                                          *
 *  Author : lukasz.iwaszkiewicz@gmail.com                                  *
 *  ~~~~~~~~                                                                *
 *  License : see COPYING file for details.                                 *
 *  ~~~~~~~~~                                                               *
 ****************************************************************************/

#pragma once
#include "geometry.h"
#include <cstdint>
#include <string_view>

namespace tg {

/**
 * Backend independent key codes. Printable ASCII characters are their own codes, so
 * any character can be turned into a Key with toKey.
 */
enum class Key : int32_t {
        unknown = -1,
        tab = 9,
        enter = 10,
        escape = 27,
        space = 32,
        backspace = 127,

        aLower = 'a',
        nLower = 'n',
        qLower = 'q',
        yLower = 'y',
        nUpper = 'N',
        qUpper = 'Q',
        yUpper = 'Y',

        up = 0x100,
        down,
        left,
        right,
        ctrlUp,
        ctrlDown,
        ctrlLeft,
        ctrlRight,
        shiftTab,
        home,
        end,
        pageUp,
        pageDown,
        del,
        insert,
        f1,
        f2,
        f3,
        f4,
        f5,
        f6,
        f7,
        f8
};

constexpr Key toKey (char c) { return Key (static_cast<unsigned char> (c)); }

/// True for keys that insert a character into text editors.
constexpr bool isPrintable (Key k) { return int32_t (k) >= 32 && int32_t (k) < 127; }

constexpr char toChar (Key k) { return isPrintable (k) ? char (k) : '\0'; }

static_assert (isPrintable (toKey ('x')));
static_assert (!isPrintable (Key::enter));
static_assert (toKey ('q') == Key::qLower);

constexpr bool isArrow (Key k) { return k == Key::up || k == Key::down || k == Key::left || k == Key::right; }
static_assert (isArrow (Key::left));
static_assert (!isArrow (Key::ctrlLeft));

/// Human readable name, used in logs and in the live debug window.
std::string_view keyName (Key k);

enum class MouseEvent {
        leftClick,
        leftDoubleClick,
        leftTripleClick,
        leftPress,
        leftRelease,
        middleClick,
        rightClick,
        rightDoubleClick,
        rightPress,
        rightRelease,
        unknown
};

} // namespace tg
