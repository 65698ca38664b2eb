/****************************************************************************
 *                                                                          *
 *  Author : lukasz.iwaszkiewicz@gmail.com                                  *
 *  ~~~~~~~~                                                                *
 *  License : see COPYING file for details.                                 *
 *  ~~~~~~~~~                                                               *
 ****************************************************************************/

#pragma once
#include "logging.h"
#include <cstdint>
#include <memory>
#include <regex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tg {

/// The eight base terminal colors. Values follow the curses COLOR_* numbering.
enum class Color : int16_t { black, red, green, yellow, blue, magenta, cyan, white };

constexpr int baseColorCount = 8;

/// Backend color pair id. 0 is the terminal default and is never registered.
using ColorPair = int16_t;

/**
 * Id of a base pair. Every foreground is combined with the seven other backgrounds,
 * which gives ids 1..56 in foreground major order.
 */
constexpr ColorPair colorPair (Color fg, Color bg)
{
        auto f = int (fg);
        auto b = int (bg);

        if (f == b) {
                return 0;
        }

        return ColorPair (f * (baseColorCount - 1) + (b < f ? b : b - 1) + 1);
}

constexpr ColorPair lastBaseColorPair = baseColorCount * (baseColorCount - 1);

static_assert (colorPair (Color::black, Color::red) == 1);
static_assert (colorPair (Color::white, Color::cyan) == lastBaseColorPair);

namespace colors {
        constexpr ColorPair whiteOnBlack = colorPair (Color::white, Color::black);
        constexpr ColorPair yellowOnBlack = colorPair (Color::yellow, Color::black);
        constexpr ColorPair redOnBlack = colorPair (Color::red, Color::black);
        constexpr ColorPair cyanOnBlack = colorPair (Color::cyan, Color::black);
        constexpr ColorPair magentaOnBlack = colorPair (Color::magenta, Color::black);
        constexpr ColorPair greenOnBlack = colorPair (Color::green, Color::black);
        constexpr ColorPair blueOnBlack = colorPair (Color::blue, Color::black);
        constexpr ColorPair blackOnGreen = colorPair (Color::black, Color::green);
        constexpr ColorPair blackOnWhite = colorPair (Color::black, Color::white);
        constexpr ColorPair blackOnYellow = colorPair (Color::black, Color::yellow);
        constexpr ColorPair whiteOnRed = colorPair (Color::white, Color::red);
        constexpr ColorPair whiteOnBlue = colorPair (Color::white, Color::blue);
        constexpr ColorPair whiteOnGreen = colorPair (Color::white, Color::green);
        constexpr ColorPair yellowOnBlue = colorPair (Color::yellow, Color::blue);
        constexpr ColorPair redOnWhite = colorPair (Color::red, Color::white);
} // namespace colors

/// What a single print call draws with.
struct Attributes {
        constexpr bool operator== (Attributes const &) const = default;

        ColorPair color{colors::whiteOnBlack};
        bool bold{};
};

class IDisplay;

/**
 * Registers the base pairs in a backend and hands out ids for custom ones.
 */
class Palette {
public:
        explicit Palette (IDisplay &display);

        /// Registers the 56 base pairs.
        void initialize ();

        /**
         * Returns an id for the (fg, bg) combination. fg and bg are backend color numbers,
         * so 256 color terminals can use anything below 256 here.
         */
        ColorPair registerColorPair (int16_t fg, int16_t bg);

        int customCount () const { return int (custom.size ()); }

private:
        struct Custom {
                int16_t fg;
                int16_t bg;
                ColorPair id;
        };

        IDisplay &display;
        std::vector<Custom> custom;
};

/****************************************************************************/

/**
 * Six strings a border is built of. Fields must outlive the struct (string literals).
 */
struct BorderCharacters {
        std::string_view nwcorner;
        std::string_view necorner;
        std::string_view swcorner;
        std::string_view secorner;
        std::string_view hline;
        std::string_view vline;
};

namespace borders {
        constexpr BorderCharacters ascii{"+", "+", "+", "+", "-", "|"};
        constexpr BorderCharacters unicode{"╭", "╮", "╰", "╯", "─", "│"};
} // namespace borders

enum class BorderStyle { ascii, unicode };

/****************************************************************************/

/// Part of a line drawn with a single color.
struct Fragment {
        std::string text;
        ColorPair color;
};

/**
 * Colors (parts of) lines of text in widgets. A rule first decides whether a line
 * matches, and then which part of it gets the rule color.
 */
class ColorRule {
public:
        enum class RuleType { startsWith, endsWith, notStartsWith, notEndsWith, contains };
        enum class MatchType { line, regex, region };

        struct Result {
                std::vector<Fragment> fragments;
                bool matched{};
        };

        /**
         * region is a [first, last) pair of columns of the rendered text, used only
         * with MatchType::region. It is swapped when given in the reverse order.
         */
        ColorRule (std::string pattern, ColorPair color, ColorPair selectedColor, RuleType ruleType, MatchType matchType,
                   std::pair<int, int> region = {0, 1}, bool includeWhitespace = false,
                   Logger logger = {});

        /**
         * Splits renderText (the visible part of line) into fragments. Unmatched
         * lines come back as a single fragment in defaultColor.
         */
        Result fragments (std::string_view line, std::string_view renderText, ColorPair defaultColor, bool selected = false) const;

        bool matches (std::string_view line) const;

        RuleType ruleType () const { return ruleType_; }
        MatchType matchType () const { return matchType_; }
        std::pair<int, int> region () const { return region_; }

private:
        std::vector<Fragment> splitOnRegex (std::string_view text, ColorPair ruleColor, ColorPair defaultColor) const;
        std::vector<Fragment> splitOnRegion (std::string_view text, ColorPair ruleColor, ColorPair defaultColor) const;

        std::string pattern;
        std::regex compiled;
        ColorPair color;
        ColorPair selectedColor;
        RuleType ruleType_;
        MatchType matchType_;
        std::pair<int, int> region_;
        bool includeWhitespace;
        Logger logger;
};

} // namespace tg
