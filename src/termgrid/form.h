/****************************************************************************
 *                                                                          *
 *  Author : lukasz.iwaszkiewicz@gmail.com                                  *
 *  ~~~~~~~~                                                                *
 *  License : see COPYING file for details.                                 *
 *  ~~~~~~~~~                                                               *
 ****************************************************************************/

#pragma once
#include "popups.h"
#include "textEditor.h"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tg {

/**
 * Named text field of a form.
 */
class FormField : public TextEditor {
public:
        FormField (std::string name, std::string initialText, bool password, bool required, Logger logger);

        std::string const &name () const { return name_; }
        bool isRequired () const { return required; }

        /// Error message, or nothing if the field is valid.
        std::optional<std::string> validate () const;

private:
        std::string name_;
        bool required;
};

class FormPopup;

/**
 * One field drawn inside the form popup. Its position is derived from the parent
 * popup and the field index.
 */
class FormFieldElement : public UIElement {
public:
        FormFieldElement (FormPopup const &parent, size_t index, size_t count, FormField field, Logger logger);

        ElementKind kind () const override { return ElementKind::formField; }
        Point absoluteStartPos () const override;
        Point absoluteStopPos () const override;
        void updateHeightWidth () override;
        void handleKeyPress (Key key) override;
        void draw (Renderer &r) override;

        FormField &field () { return field_; }
        FormField const &field () const { return field_; }

private:
        FormPopup const &parent;
        size_t index;
        size_t count;
        FormField field_;
};

/**
 * Several text fields. Tab moves between them, Enter submits. A submission with
 * missing required fields opens a warning inside the form and keeps everything typed.
 */
class FormPopup : public Popup {
public:
        using Result = std::map<std::string, std::string>;
        using Command = std::function<void (Result const &)>;

        struct FieldSpec {
                std::string name;
                std::string initialText{};
                bool password{};
                bool required{};
        };

        /// Throws DuplicateFormKeyError for repeated field names.
        FormPopup (IRoot &root, std::vector<FieldSpec> const &fields, std::string title, ColorPair color, Command command, Logger logger);

        /// Centered, 80 columns (or the screen minus 6) by 5 rows per field.
        Point absoluteStartPos () const override;
        Point absoluteStopPos () const override;
        void updateHeightWidth () override;
        void handleKeyPress (Key key) override;
        void handleMousePress (Point const &pos, MouseEvent event) override;
        void draw (Renderer &r) override;

        std::vector<std::unique_ptr<FormFieldElement>> const &fields () const { return fields_; }
        size_t selectedField () const { return selected; }

        void jumpToNextField ();
        void jumpToPreviousField ();

        /// Names of the invalid fields (empty if the form can be submitted).
        std::vector<std::string> invalidFields () const;
        Result get () const;

        /// Nested warning, if one is shown.
        MessagePopup const *warning () const { return warning_.get (); }

private:
        Dimensions requiredSize () const;
        void submit ();
        void selectField (size_t i);

        size_t numFields;
        std::vector<std::unique_ptr<FormFieldElement>> fields_;
        size_t selected{};
        Command command;
        std::unique_ptr<MessagePopup> warning_;
};

} // namespace tg
