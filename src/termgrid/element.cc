/****************************************************************************
 *                                                                          *
 *  Author : lukasz.iwaszkiewicz@gmail.com                                  *
 *  ~~~~~~~~                                                                *
 *  License : see COPYING file for details.                                 *
 *  ~~~~~~~~~                                                               *
 ****************************************************************************/

#include "element.h"
#include "errors.h"

namespace tg {

UIElement::UIElement (ElementId id, std::string title, Logger logger) : id_{id}, title_{std::move (title)}, logger{orNull (std::move (logger))} {}

/****************************************************************************/

void UIElement::updateHeightWidth ()
{
        start_ = absoluteStartPos ();
        stop_ = absoluteStopPos ();
        height_ = stop_.y () - start_.y ();
        width_ = stop_.x () - start_.x ();
}

/****************************************************************************/

Dimensions UIElement::absoluteDimensions () const
{
        auto start = absoluteStartPos ();
        auto stop = absoluteStopPos ();
        return {stop.x () - start.x (), stop.y () - start.y ()};
}

/****************************************************************************/

void UIElement::handleMousePress (Point const &pos, MouseEvent event)
{
        if (mouseHandler) {
                mouseHandler (pos, event);
        }
}

/****************************************************************************/

void UIElement::setPadding (Dimension x, Dimension y)
{
        if (x < 0 || y < 0) {
                throw InvalidValueError ("Padding can not be negative");
        }

        padx = x;
        pady = y;
        updateHeightWidth ();
}

/****************************************************************************/

void UIElement::setColor (ColorPair c)
{
        if (borderColor_ == color_) {
                borderColor_ = c;
        }

        if (focusBorderColor_ == color_) {
                focusBorderColor_ = c;
        }

        if (selectedColor_ == color_) {
                selectedColor_ = c;
        }

        color_ = c;
}

} // namespace tg
