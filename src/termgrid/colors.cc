/****************************************************************************
 *                                                                          *
 *  Author : lukasz.iwaszkiewicz@gmail.com                                  *
 *  ~~~~~~~~                                                                *
 *  License : see COPYING file for details.                                 *
 *  ~~~~~~~~~                                                               *
 ****************************************************************************/

#include "colors.h"
#include "display.h"
#include "errors.h"
#include <algorithm>
#include <fmt/format.h>

namespace tg {

Palette::Palette (IDisplay &display) : display{display} {}

/****************************************************************************/

void Palette::initialize ()
{
        for (int fg = 0; fg < baseColorCount; ++fg) {
                for (int bg = 0; bg < baseColorCount; ++bg) {
                        if (fg != bg) {
                                display.initColorPair (colorPair (Color (fg), Color (bg)), int16_t (fg), int16_t (bg));
                        }
                }
        }

        for (auto const &c : custom) {
                display.initColorPair (c.id, c.fg, c.bg);
        }
}

/****************************************************************************/

ColorPair Palette::registerColorPair (int16_t fg, int16_t bg)
{
        if (fg >= 0 && fg < baseColorCount && bg >= 0 && bg < baseColorCount && fg != bg) {
                return colorPair (Color (fg), Color (bg));
        }

        if (auto i = std::find_if (custom.cbegin (), custom.cend (), [fg, bg] (auto const &c) { return c.fg == fg && c.bg == bg; });
            i != custom.cend ()) {
                return i->id;
        }

        auto id = ColorPair (lastBaseColorPair + 1 + customCount ());

        if (id >= display.maxColorPairs ()) {
                throw InvalidValueError (fmt::format ("Color pair limit of {} reached", display.maxColorPairs ()));
        }

        custom.push_back ({fg, bg, id});
        display.initColorPair (id, fg, bg);
        return id;
}

/****************************************************************************/
/* ColorRule                                                                */
/****************************************************************************/

ColorRule::ColorRule (std::string pattern, ColorPair color, ColorPair selectedColor, RuleType ruleType, MatchType matchType,
                      std::pair<int, int> region, bool includeWhitespace, Logger logger)
    : pattern{std::move (pattern)},
      color{color},
      selectedColor{selectedColor},
      ruleType_{ruleType},
      matchType_{matchType},
      region_{region},
      includeWhitespace{includeWhitespace},
      logger{orNull (std::move (logger))}
{
        if (region_.first > region_.second) {
                std::swap (region_.first, region_.second);
        }

        // Prefix / suffix rules compare literally, so their pattern need not be a valid regex.
        if (ruleType_ == RuleType::contains || matchType_ == MatchType::regex) {
                compiled.assign (this->pattern);
        }
}

/*--------------------------------------------------------------------------*/

namespace {
        std::string_view trim (std::string_view s)
        {
                auto first = s.find_first_not_of (" \t\r\n");

                if (first == std::string_view::npos) {
                        return {};
                }

                auto last = s.find_last_not_of (" \t\r\n");
                return s.substr (first, last - first + 1);
        }
} // namespace

/*--------------------------------------------------------------------------*/

bool ColorRule::matches (std::string_view line) const
{
        auto tmp = (includeWhitespace) ? (line) : (trim (line));

        switch (ruleType_) {
        case RuleType::startsWith:
                return tmp.starts_with (pattern);

        case RuleType::endsWith:
                return tmp.ends_with (pattern);

        case RuleType::notStartsWith:
                return !tmp.starts_with (pattern);

        case RuleType::notEndsWith:
                return !tmp.ends_with (pattern);

        case RuleType::contains:
                return std::regex_search (line.begin (), line.end (), compiled);
        }

        return false;
}

/*--------------------------------------------------------------------------*/

ColorRule::Result ColorRule::fragments (std::string_view line, std::string_view renderText, ColorPair defaultColor, bool selected) const
{
        if (!matches (line)) {
                return {{{std::string{renderText}, defaultColor}}, false};
        }

        auto ruleColor = (selected) ? (selectedColor) : (color);
        Result ret{{}, true};

        switch (matchType_) {
        case MatchType::line:
                ret.fragments.push_back ({std::string{renderText}, ruleColor});
                break;

        case MatchType::regex:
                ret.fragments = splitOnRegex (renderText, ruleColor, defaultColor);
                break;

        case MatchType::region:
                ret.fragments = splitOnRegion (renderText, ruleColor, defaultColor);
                break;
        }

        logger->debug ("[ColorRule] '{}' matched, {} fragment(s)", pattern, ret.fragments.size ());
        return ret;
}

/*--------------------------------------------------------------------------*/

std::vector<Fragment> ColorRule::splitOnRegex (std::string_view text, ColorPair ruleColor, ColorPair defaultColor) const
{
        std::vector<Fragment> ret;
        std::string tmp{text};
        size_t last{};

        for (auto i = std::sregex_iterator (tmp.begin (), tmp.end (), compiled); i != std::sregex_iterator (); ++i) {
                auto pos = size_t (i->position ());
                auto len = size_t (i->length ());

                if (len == 0) {
                        continue;
                }

                if (pos > last) {
                        ret.push_back ({tmp.substr (last, pos - last), defaultColor});
                }

                ret.push_back ({tmp.substr (pos, len), ruleColor});
                last = pos + len;
        }

        if (last < tmp.size () || ret.empty ()) {
                ret.push_back ({tmp.substr (last), defaultColor});
        }

        return ret;
}

/*--------------------------------------------------------------------------*/

std::vector<Fragment> ColorRule::splitOnRegion (std::string_view text, ColorPair ruleColor, ColorPair defaultColor) const
{
        auto size = int (text.size ());
        auto first = std::clamp (region_.first, 0, size);
        auto last = std::clamp (region_.second, 0, size);
        std::vector<Fragment> ret;

        if (first > 0) {
                ret.push_back ({std::string{text.substr (0, first)}, defaultColor});
        }

        if (last > first) {
                ret.push_back ({std::string{text.substr (first, last - first)}, ruleColor});
        }

        if (last < size) {
                ret.push_back ({std::string{text.substr (last)}, defaultColor});
        }

        return ret;
}

} // namespace tg
