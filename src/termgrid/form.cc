/****************************************************************************
 *                                                                          *
 *  Author : lukasz.iwaszkiewicz@gmail.com                                  *
 *  ~~~~~~~~                                                                *
 *  License : see COPYING file for details.                                 *
 *  ~~~~~~~~~                                                               *
 ****************************************************************************/

#include "form.h"
#include "errors.h"
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <set>

namespace tg {

FormField::FormField (std::string name, std::string initialText, bool password, bool required, Logger logger)
    : TextEditor{std::move (initialText), password, std::move (logger)}, name_{std::move (name)}, required{required}
{
}

/*--------------------------------------------------------------------------*/

std::optional<std::string> FormField::validate () const
{
        if (required && get ().empty ()) {
                return fmt::format ("Field {} cannot be empty!", name_);
        }

        return std::nullopt;
}

/****************************************************************************/
/* FormFieldElement                                                         */
/****************************************************************************/

FormFieldElement::FormFieldElement (FormPopup const &parent, size_t index, size_t count, FormField field, Logger logger)
    : UIElement{ElementId (index), field.name (), std::move (logger)}, parent{parent}, index{index}, count{count}, field_{std::move (field)}
{
        padx = 0;
        pady = 0;
        setColor (parent.color ());
        updateHeightWidth ();
}

/*--------------------------------------------------------------------------*/

Point FormFieldElement::absoluteStartPos () const
{
        auto [ppadx, ppady] = parent.padding ();
        auto start = parent.startPosition ();
        auto fieldHeight = (parent.height () - 1 - ppady) / int (count);
        return {start.x () + 3 + ppadx, start.y () + 1 + ppady + fieldHeight * int (index)};
}

Point FormFieldElement::absoluteStopPos () const
{
        auto [ppadx, ppady] = parent.padding ();
        auto start = parent.startPosition ();
        auto stop = parent.stopPosition ();
        auto fieldHeight = (parent.height () - 1 - ppady) / int (count);
        return {stop.x () - 3 - ppadx, start.y () + 1 + ppady + fieldHeight * int (index + 1) - 1};
}

/*--------------------------------------------------------------------------*/

void FormFieldElement::updateHeightWidth ()
{
        UIElement::updateHeightWidth ();
        field_.setViewport (startPosition ().x () + 2, startPosition ().y () + 1, width () - 5);
}

/*--------------------------------------------------------------------------*/

void FormFieldElement::handleKeyPress (Key key) { field_.handleKey (key); }

/*--------------------------------------------------------------------------*/

void FormFieldElement::draw (Renderer &r)
{
        auto title = (field_.isRequired ()) ? (title_ + " *") : (title_);
        r.setColorMode (color_);
        r.setBold (selected_);
        r.drawFrame ({startPosition (), {width (), 3}}, title);
        r.setBold (false);
        r.print ({startPosition ().x () + 2, startPosition ().y () + 1}, field_.visibleText ());

        if (selected_) {
                r.drawCursor (field_.cursorPosition ());
        }
}

/****************************************************************************/
/* FormPopup                                                                */
/****************************************************************************/

FormPopup::FormPopup (IRoot &root, std::vector<FieldSpec> const &fields, std::string title, ColorPair color, Command command, Logger logger)
    : Popup{root, std::move (title), {}, color, logger}, numFields{fields.size ()}, command{std::move (command)}
{
        std::set<std::string> names;

        for (auto const &f : fields) {
                if (!names.insert (f.name).second) {
                        throw DuplicateFormKeyError (fmt::format ("Form field '{}' is defined more than once", f.name));
                }
        }

        helpText_ = "Form popup. Tab to move between fields, Enter to submit, Esc to cancel.";
        UIElement::updateHeightWidth ();

        for (size_t i = 0; i < fields.size (); ++i) {
                auto const &f = fields.at (i);
                fields_.push_back (std::make_unique<FormFieldElement> (*this, i, fields.size (),
                                                                       FormField{f.name, f.initialText, f.password, f.required, logger}, logger));
        }

        if (!fields_.empty ()) {
                fields_.front ()->setSelected (true);
        }
}

/*--------------------------------------------------------------------------*/

Dimensions FormPopup::requiredSize () const
{
        auto size = root.absoluteSize ();
        Dimension w = (size.width < 80) ? (size.width - 6) : (80);
        Dimension h = std::min (4 + 2 * pady + 5 * int (std::max<size_t> (numFields, 1)), size.height);
        return {std::max (w, 0), h};
}

Point FormPopup::absoluteStartPos () const
{
        auto size = root.absoluteSize ();
        auto req = requiredSize ();
        return {size.width / 2 - req.width / 2, size.height / 2 - req.height / 2};
}

Point FormPopup::absoluteStopPos () const
{
        auto size = root.absoluteSize ();
        auto req = requiredSize ();
        return {size.width / 2 + req.width / 2, size.height / 2 + req.height / 2};
}

/*--------------------------------------------------------------------------*/

void FormPopup::updateHeightWidth ()
{
        Popup::updateHeightWidth ();

        for (auto &f : fields_) {
                f->updateHeightWidth ();
        }

        if (warning_) {
                warning_->updateHeightWidth ();
        }
}

/****************************************************************************/

void FormPopup::selectField (size_t i)
{
        if (fields_.empty ()) {
                return;
        }

        fields_.at (selected)->setSelected (false);
        selected = i % fields_.size ();
        fields_.at (selected)->setSelected (true);
}

void FormPopup::jumpToNextField () { selectField (selected + 1); }

void FormPopup::jumpToPreviousField () { selectField ((selected == 0) ? (fields_.size () - 1) : (selected - 1)); }

/****************************************************************************/

std::vector<std::string> FormPopup::invalidFields () const
{
        std::vector<std::string> ret;

        for (auto const &f : fields_) {
                if (f->field ().validate ()) {
                        ret.push_back (f->field ().name ());
                }
        }

        return ret;
}

/*--------------------------------------------------------------------------*/

FormPopup::Result FormPopup::get () const
{
        Result ret;

        for (auto const &f : fields_) {
                ret[f->field ().name ()] = f->field ().get ();
        }

        return ret;
}

/*--------------------------------------------------------------------------*/

void FormPopup::submit ()
{
        auto invalid = invalidFields ();

        if (invalid.empty ()) {
                auto result = get ();
                close ();

                if (command) {
                        command (result);
                }

                return;
        }

        std::string message;

        for (auto const &f : fields_) {
                if (auto msg = f->field ().validate ()) {
                        message = *msg;
                        break;
                }
        }

        logger->info ("[FormPopup] {}", message);
        warning_ = std::make_unique<MessagePopup> (root, message, fmt::format ("Required fields: [{}]", fmt::join (invalid, ", ")),
                                                   colors::yellowOnBlack, logger);
        warning_->setNested (true);
}

/****************************************************************************/

void FormPopup::handleKeyPress (Key key)
{
        if (warning_) {
                warning_->handleKeyPress (key);

                if (warning_->isClosed ()) {
                        warning_.reset ();
                }

                return;
        }

        switch (key) {
        case Key::escape:
                close ();
                break;

        case Key::tab:
        case Key::down:
                jumpToNextField ();
                break;

        case Key::shiftTab:
        case Key::up:
                jumpToPreviousField ();
                break;

        case Key::enter:
                submit ();
                break;

        default:
                if (!fields_.empty ()) {
                        fields_.at (selected)->handleKeyPress (key);
                }
                break;
        }
}

/*--------------------------------------------------------------------------*/

void FormPopup::handleMousePress (Point const &pos, MouseEvent event)
{
        if (warning_) {
                warning_->handleMousePress (pos, event);
                return;
        }

        Popup::handleMousePress (pos, event);

        for (size_t i = 0; i < fields_.size (); ++i) {
                if (fields_.at (i)->containsPosition (pos)) {
                        selectField (i);
                        break;
                }
        }
}

/****************************************************************************/

void FormPopup::draw (Renderer &r)
{
        drawFrame (r);

        for (auto &f : fields_) {
                f->draw (r);
        }

        r.unsetColorMode ();

        if (warning_) {
                r.resetCursor ();
                warning_->draw (r);
        }
}

} // namespace tg
