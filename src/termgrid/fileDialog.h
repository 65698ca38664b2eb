/****************************************************************************
 *                                                                          *
 *  Author : lukasz.iwaszkiewicz@gmail.com                                  *
 *  ~~~~~~~~                                                                *
 *  License : see COPYING file for details.                                 *
 *  ~~~~~~~~~                                                               *
 ****************************************************************************/

#pragma once
#include "colors.h"
#include "popups.h"
#include "selectableList.h"
#include "textEditor.h"
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tg {

enum class DialogType { openFile, openDir, saveAs };

/**
 * One entry of a directory listing.
 */
struct FileDirElement {
        std::string name;
        std::filesystem::path path;
        bool directory{};

        /// "<DIR> name" for directories, name indented by the same amount for files.
        std::string label () const;
        bool operator== (FileDirElement const &) const = default;
};

/// Names starting with a dot.
bool isHidden (std::filesystem::path const &path);

/**
 * Directory listing as a scrollable list. Directories come first, then files (not
 * listed in openDir mode). ".." leads to the parent unless the current directory is
 * the root of the filesystem.
 */
class FileSelectImplementation : public SelectableList<FileDirElement> {
public:
        /// Throws std::filesystem::filesystem_error if initialDir can not be listed.
        FileSelectImplementation (std::filesystem::path const &initialDir, DialogType type, std::vector<std::string> extensions = {},
                                  bool showHidden = false, Logger logger = {});

        /// Lists the current directory again.
        void refresh ();

        /**
         * Moves to dir and lists it. On failure the previous directory is restored and the
         * error rethrown.
         */
        void changeDirectory (std::filesystem::path const &dir);

        std::filesystem::path const &currentDir () const { return current; }
        DialogType dialogType () const { return type; }

        void setShowHidden (bool s) { showHidden = s; }
        bool isShowingHidden () const { return showHidden; }

private:
        bool extensionAllowed (std::string const &name) const;

        std::filesystem::path current;
        DialogType type;
        std::vector<std::string> extensions;
        bool showHidden;
};

/****************************************************************************/

class FileDialogPopup;

/**
 * The listing part of the dialog. Enter on a directory goes into it, Enter on a file
 * submits it (openFile only).
 */
class FileSelectElement : public UIElement {
public:
        FileSelectElement (FileDialogPopup &dialog, FileSelectImplementation impl, Logger logger);

        ElementKind kind () const override { return ElementKind::fileSelect; }
        Point absoluteStartPos () const override;
        Point absoluteStopPos () const override;
        void handleKeyPress (Key key) override;
        void handleMousePress (Point const &pos, MouseEvent event) override;
        void draw (Renderer &r) override;

        FileSelectImplementation &list () { return impl; }
        FileSelectImplementation const &list () const { return impl; }

private:
        void enterSelected ();

        FileDialogPopup &dialog;
        FileSelectImplementation impl;
        std::vector<ColorRule> rules;
};

/*--------------------------------------------------------------------------*/

/**
 * Name of a new file or directory. Enter creates it (openFile, openDir) or submits
 * the path (saveAs).
 */
class FileNameInput : public UIElement {
public:
        FileNameInput (FileDialogPopup &dialog, std::string title, Logger logger);

        ElementKind kind () const override { return ElementKind::fileNameInput; }
        Point absoluteStartPos () const override;
        Point absoluteStopPos () const override;
        void updateHeightWidth () override;
        void handleKeyPress (Key key) override;
        void draw (Renderer &r) override;

        TextEditor &editor () { return editor_; }
        TextEditor const &editor () const { return editor_; }

private:
        void create ();

        FileDialogPopup &dialog;
        TextEditor editor_;
};

/*--------------------------------------------------------------------------*/

/**
 * OK (number 1) or Cancel (number 2), laid out in the bottom right of the dialog.
 */
class DialogButton : public UIElement {
public:
        DialogButton (FileDialogPopup &dialog, std::string title, std::string helpText, int number, Logger logger);

        ElementKind kind () const override { return ElementKind::dialogButton; }
        Point absoluteStartPos () const override;
        Point absoluteStopPos () const override;
        void handleKeyPress (Key key) override;
        void handleMousePress (Point const &pos, MouseEvent event) override;
        void draw (Renderer &r) override;

        void press ();

private:
        FileDialogPopup &dialog;
        int number;
};

/****************************************************************************/

/**
 * File picker. Tab cycles the listing, the name input and the two buttons. Problems
 * are reported in a nested warning popup which takes the input until it is closed.
 */
class FileDialogPopup : public Popup {
public:
        using Command = std::function<void (std::string const &)>;

        FileDialogPopup (IRoot &root, Command command, std::filesystem::path const &initialDir, DialogType type,
                         std::vector<std::string> extensions, bool showHidden, ColorPair color, Logger logger);

        /// (w/8, h/9) to (7w/8, 35h/36).
        Point absoluteStartPos () const override;
        Point absoluteStopPos () const override;
        void updateHeightWidth () override;
        void handleKeyPress (Key key) override;
        void handleMousePress (Point const &pos, MouseEvent event) override;
        void draw (Renderer &r) override;

        DialogType dialogType () const { return type; }

        /// Closes the dialog and runs the command if path is valid, shows a warning otherwise.
        void submit (std::filesystem::path const &path);

        /// Warning message if path can not be the result of this dialog.
        std::optional<std::string> validate (std::filesystem::path const &path) const;

        void displayWarning (std::string message);
        MessagePopup const *warning () const { return warning_.get (); }

        FileSelectElement &fileSelect () { return *fileSelect_; }
        FileNameInput &fileNameInput () { return *fileNameInput_; }
        DialogButton &okButton () { return *okButton_; }
        DialogButton &cancelButton () { return *cancelButton_; }

        /// Index of the focused sub element (listing, input, OK, Cancel).
        size_t selectedElement () const { return selected; }
        void selectElement (size_t i);

private:
        std::vector<UIElement *> elements () const;

        Command command;
        DialogType type;
        std::unique_ptr<FileSelectElement> fileSelect_;
        std::unique_ptr<FileNameInput> fileNameInput_;
        std::unique_ptr<DialogButton> okButton_;
        std::unique_ptr<DialogButton> cancelButton_;
        std::unique_ptr<MessagePopup> warning_;
        size_t selected{};
};

} // namespace tg
