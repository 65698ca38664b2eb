/****************************************************************************
 *                                                                          *
 *  Author : lukasz.iwaszkiewicz@gmail.com                                  *
 *  ~~~~~~~~                                                                *
 *  License : see COPYING file for details.                                 *
 *  ~~~~~~~~~                                                               *
 ****************************************************************************/

#include "fileDialog.h"
#include "widgets.h"
#include <algorithm>
#include <fmt/format.h>
#include <fstream>
#include <system_error>
#include <unistd.h>

namespace tg {
namespace fs = std::filesystem;

namespace {

        std::string dialogTitle (DialogType type)
        {
                switch (type) {
                case DialogType::openFile:
                        return "Open File";

                case DialogType::openDir:
                        return "Open Directory";

                default:
                        return "Save As";
                }
        }

        std::string inputTitle (DialogType type)
        {
                switch (type) {
                case DialogType::openFile:
                        return "New File";

                case DialogType::openDir:
                        return "New Dir";

                default:
                        return "New Name";
                }
        }

        /// Absolute, without the trailing separator.
        fs::path normalize (fs::path const &p)
        {
                auto ret = fs::absolute (p).lexically_normal ();

                if (!ret.has_filename () && ret != ret.root_path ()) {
                        ret = ret.parent_path ();
                }

                return ret;
        }

} // namespace

/****************************************************************************/

std::string FileDirElement::label () const
{
        constexpr std::string_view dirMarker = "<DIR> ";
        return (directory) ? (std::string{dirMarker} + name) : (std::string (dirMarker.size (), ' ') + name);
}

bool isHidden (fs::path const &path) { return path.filename ().string ().starts_with ('.'); }

/****************************************************************************/
/* FileSelectImplementation                                                 */
/****************************************************************************/

FileSelectImplementation::FileSelectImplementation (fs::path const &initialDir, DialogType type, std::vector<std::string> extensions,
                                                    bool showHidden, Logger logger)
    : SelectableList<FileDirElement>{std::move (logger)}, current{normalize (initialDir)}, type{type}, extensions{std::move (extensions)},
      showHidden{showHidden}
{
        refresh ();
}

/*--------------------------------------------------------------------------*/

bool FileSelectImplementation::extensionAllowed (std::string const &name) const
{
        return extensions.empty () || std::ranges::any_of (extensions, [&name] (auto const &ext) { return name.ends_with (ext); });
}

/*--------------------------------------------------------------------------*/

void FileSelectImplementation::refresh ()
{
        if (!fs::is_directory (current)) {
                throw fs::filesystem_error ("Not a directory", current, std::make_error_code (std::errc::no_such_file_or_directory));
        }

        std::vector<FileDirElement> dirs;
        std::vector<FileDirElement> files;

        for (auto const &entry : fs::directory_iterator{current}) {
                if (!showHidden && isHidden (entry.path ())) {
                        continue;
                }

                auto name = entry.path ().filename ().string ();
                std::error_code ec;

                if (entry.is_directory (ec)) {
                        dirs.push_back ({name, entry.path (), true});
                }
                else if (extensionAllowed (name)) {
                        files.push_back ({name, entry.path (), false});
                }
        }

        auto byName = [] (auto const &a, auto const &b) { return a.name < b.name; };
        std::ranges::sort (dirs, byName);
        std::ranges::sort (files, byName);

        clear ();

        if (auto up = current.parent_path (); up != current) {
                addItem ({"..", up, true});
        }

        addItemList (dirs);

        if (type != DialogType::openDir) {
                addItemList (files);
        }

        logger->debug ("[FileSelect] {}: {} directories, {} files", current.string (), dirs.size (), files.size ());
}

/*--------------------------------------------------------------------------*/

void FileSelectImplementation::changeDirectory (fs::path const &dir)
{
        auto old = current;
        current = normalize (dir);

        try {
                refresh ();
        }
        catch (fs::filesystem_error const &) {
                current = old;
                refresh ();
                throw;
        }
}

/****************************************************************************/
/* FileSelectElement                                                        */
/****************************************************************************/

FileSelectElement::FileSelectElement (FileDialogPopup &dialog, FileSelectImplementation impl, Logger logger)
    : UIElement{0, impl.currentDir ().string (), logger}, dialog{dialog}, impl{std::move (impl)}
{
        setColor (dialog.color ());
        selectedColor_ = colors::blackOnWhite;
        helpText_ = "Use up/down to scroll, Enter to open a directory or pick a file, Tab to move on.";
        rules.emplace_back ("<DIR>", colors::blueOnBlack, colors::whiteOnBlue, ColorRule::RuleType::startsWith, ColorRule::MatchType::region,
                            std::pair{6, 1000}, false, logger);
        updateHeightWidth ();
}

/*--------------------------------------------------------------------------*/

Point FileSelectElement::absoluteStartPos () const
{
        auto [ppadx, ppady] = dialog.padding ();
        auto start = dialog.startPosition ();
        return {start.x () + 3 + ppadx, start.y () + ppady + 3};
}

Point FileSelectElement::absoluteStopPos () const
{
        auto [ppadx, ppady] = dialog.padding ();
        auto stop = dialog.stopPosition ();
        return {stop.x () - 3 - ppadx, stop.y () - ppady - 7};
}

/*--------------------------------------------------------------------------*/

void FileSelectElement::enterSelected ()
{
        auto item = impl.get ();

        if (!item) {
                return;
        }

        if (!item->directory) {
                if (dialog.dialogType () == DialogType::openFile) {
                        dialog.submit (item->path);
                }

                return;
        }

        try {
                impl.changeDirectory (item->path);
        }
        catch (fs::filesystem_error const &e) {
                logger->warn ("[FileSelect] {}", e.what ());

                if (e.code () == std::errc::permission_denied) {
                        dialog.displayWarning (fmt::format ("Permission Error Accessing: {} !", item->path.string ()));
                }
                else {
                        dialog.displayWarning ("Selected directory does not exist!");
                }
        }

        title_ = impl.currentDir ().string ();
}

/*--------------------------------------------------------------------------*/

void FileSelectElement::handleKeyPress (Key key)
{
        if (key == Key::enter) {
                enterSelected ();
                return;
        }

        detail::scrollList (impl, key, viewportHeight ());
}

/*--------------------------------------------------------------------------*/

void FileSelectElement::handleMousePress (Point const &pos, MouseEvent event)
{
        UIElement::handleMousePress (pos, event);

        if (event == MouseEvent::leftClick) {
                detail::clickList (*this, impl, pos);
        }
        else if (event == MouseEvent::leftDoubleClick && detail::clickList (*this, impl, pos)) {
                enterSelected ();
        }
}

/*--------------------------------------------------------------------------*/

void FileSelectElement::draw (Renderer &r)
{
        r.setColorMode (color_);
        r.setBold (selected_);
        r.drawBorder (*this);
        r.setBold (false);
        r.setColorRules (rules);
        detail::drawList (r, *this, impl);
        r.resetColorRules ();
}

/****************************************************************************/
/* FileNameInput                                                            */
/****************************************************************************/

FileNameInput::FileNameInput (FileDialogPopup &dialog, std::string title, Logger logger)
    : UIElement{0, std::move (title), logger}, dialog{dialog}, editor_{{}, false, logger}
{
        padx = 0;
        pady = 0;
        setColor (dialog.color ());
        helpText_ = "Press Tab to move to the next field, or Enter to submit.";
        updateHeightWidth ();
}

/*--------------------------------------------------------------------------*/

Point FileNameInput::absoluteStartPos () const
{
        auto [ppadx, ppady] = dialog.padding ();
        return {dialog.startPosition ().x () + 4 + ppadx, dialog.stopPosition ().y () - ppady - 7};
}

Point FileNameInput::absoluteStopPos () const
{
        auto [ppadx, ppady] = dialog.padding ();
        auto stop = dialog.stopPosition ();
        return {stop.x () - 4 - 3 * dialog.width () / 7, stop.y () - ppady - 2};
}

/*--------------------------------------------------------------------------*/

void FileNameInput::updateHeightWidth ()
{
        UIElement::updateHeightWidth ();
        editor_.setViewport (startPosition ().x () + 2, startPosition ().y () + height () / 2 + 1, Renderer::textWidth (*this) - 1);
}

/*--------------------------------------------------------------------------*/

void FileNameInput::create ()
{
        auto name = editor_.get ();
        editor_.clear ();

        if (name.empty ()) {
                return;
        }

        auto path = dialog.fileSelect ().list ().currentDir () / name;

        if (dialog.dialogType () == DialogType::saveAs) {
                dialog.submit (path);
                return;
        }

        std::error_code ec;

        if (fs::exists (path, ec)) {
                dialog.displayWarning ("File/Directory already exists!");
                return;
        }

        bool created{};

        if (dialog.dialogType () == DialogType::openDir) {
                created = fs::create_directory (path, ec);
        }
        else {
                created = bool (std::ofstream{path});
        }

        if (!created) {
                logger->warn ("[FileNameInput] Could not create {}: {}", path.string (), ec.message ());
                dialog.displayWarning ("Insufficient permissions!");
                return;
        }

        try {
                dialog.fileSelect ().list ().refresh ();
        }
        catch (fs::filesystem_error const &e) {
                dialog.displayWarning (e.what ());
        }
}

/*--------------------------------------------------------------------------*/

void FileNameInput::handleKeyPress (Key key)
{
        if (key == Key::enter) {
                create ();
                return;
        }

        editor_.handleKey (key);
}

/*--------------------------------------------------------------------------*/

void FileNameInput::draw (Renderer &r)
{
        auto y = editor_.cursorPosition ().y ();
        r.setColorMode (color_);
        r.drawBorder (*this, false, false);
        r.drawText (*this, title_, y - 2, Alignment::left, true, selected_);
        r.drawText (*this, editor_.visibleText (), y, Alignment::left, true, selected_);

        if (selected_) {
                r.drawCursor (editor_.cursorPosition ());
        }
}

/****************************************************************************/
/* DialogButton                                                             */
/****************************************************************************/

DialogButton::DialogButton (FileDialogPopup &dialog, std::string title, std::string helpText, int number, Logger logger)
    : UIElement{0, std::move (title), std::move (logger)}, dialog{dialog}, number{number}
{
        setColor ((number == 1) ? (colors::greenOnBlack) : (colors::redOnBlack));
        helpText_ = std::move (helpText);
        alignment = Alignment::center;
        updateHeightWidth ();
}

/*--------------------------------------------------------------------------*/

Point DialogButton::absoluteStartPos () const
{
        auto stop = dialog.stopPosition ();
        return {stop.x () - 4 - (3 - number) * dialog.width () / 7, stop.y () - dialog.padding ().second - 7};
}

Point DialogButton::absoluteStopPos () const
{
        auto stop = dialog.stopPosition ();
        return {stop.x () - 4 - (2 - number) * dialog.width () / 7, stop.y () - dialog.padding ().second - 2};
}

/*--------------------------------------------------------------------------*/

void DialogButton::press ()
{
        if (number != 1) {
                dialog.close ();
                return;
        }

        auto const &dir = dialog.fileSelect ().list ().currentDir ();

        switch (dialog.dialogType ()) {
        case DialogType::saveAs:
                dialog.submit (dir / dialog.fileNameInput ().editor ().get ());
                break;

        case DialogType::openDir:
                dialog.submit (dir);
                break;

        default:
                if (auto item = dialog.fileSelect ().list ().get ()) {
                        dialog.submit (item->path);
                }
                else {
                        dialog.displayWarning ("No path is selected!");
                }
                break;
        }
}

/*--------------------------------------------------------------------------*/

void DialogButton::handleKeyPress (Key key)
{
        if (key == Key::enter) {
                press ();
        }
}

void DialogButton::handleMousePress (Point const &pos, MouseEvent event)
{
        UIElement::handleMousePress (pos, event);

        if (event == MouseEvent::leftClick) {
                press ();
        }
}

/*--------------------------------------------------------------------------*/

void DialogButton::draw (Renderer &r)
{
        r.setColorMode (color_);
        r.setBold (selected_);
        r.drawBorder (*this, true, false);
        r.drawText (*this, title_, startPosition ().y () + height () / 2, alignment, true, selected_);
        r.setBold (false);
}

/****************************************************************************/
/* FileDialogPopup                                                          */
/****************************************************************************/

FileDialogPopup::FileDialogPopup (IRoot &root, Command command, fs::path const &initialDir, DialogType type,
                                  std::vector<std::string> extensions, bool showHidden, ColorPair color, Logger logger)
    : Popup{root, dialogTitle (type), {}, color, logger}, command{std::move (command)}, type{type}
{
        UIElement::updateHeightWidth ();
        fileSelect_ = std::make_unique<FileSelectElement> (
                *this, FileSelectImplementation{initialDir, type, std::move (extensions), showHidden, logger}, logger);
        fileNameInput_ = std::make_unique<FileNameInput> (*this, inputTitle (type), logger);
        okButton_ = std::make_unique<DialogButton> (*this, "OK", title_, 1, logger);
        cancelButton_ = std::make_unique<DialogButton> (*this, "Cancel", "Cancel " + title_, 2, logger);
        fileSelect_->setSelected (true);
        helpText_ = fileSelect_->helpText ();
}

/*--------------------------------------------------------------------------*/

Point FileDialogPopup::absoluteStartPos () const
{
        auto size = root.absoluteSize ();
        return {size.width / 8, size.height / 9};
}

Point FileDialogPopup::absoluteStopPos () const
{
        auto size = root.absoluteSize ();
        return {7 * size.width / 8, 35 * size.height / 36};
}

/*--------------------------------------------------------------------------*/

void FileDialogPopup::updateHeightWidth ()
{
        Popup::updateHeightWidth ();

        for (auto *e : elements ()) {
                if (e != nullptr) {
                        e->updateHeightWidth ();
                }
        }

        if (warning_) {
                warning_->updateHeightWidth ();
        }
}

/*--------------------------------------------------------------------------*/

std::vector<UIElement *> FileDialogPopup::elements () const
{
        return {fileSelect_.get (), fileNameInput_.get (), okButton_.get (), cancelButton_.get ()};
}

void FileDialogPopup::selectElement (size_t i)
{
        auto all = elements ();
        all.at (selected)->setSelected (false);
        selected = i % all.size ();
        all.at (selected)->setSelected (true);
        helpText_ = all.at (selected)->helpText ();
}

/****************************************************************************/

std::optional<std::string> FileDialogPopup::validate (fs::path const &path) const
{
        std::error_code ec;

        switch (type) {
        case DialogType::openFile:
                if (!fs::is_regular_file (path, ec)) {
                        return "Please select a valid file path!";
                }
                break;

        case DialogType::openDir:
                if (!fs::is_directory (path, ec)) {
                        return "Please select a valid directory path!";
                }
                break;

        case DialogType::saveAs:
                if (::access (fileSelect_->list ().currentDir ().c_str (), W_OK) != 0) {
                        return "Permission Error!";
                }
                break;
        }

        return std::nullopt;
}

/*--------------------------------------------------------------------------*/

void FileDialogPopup::submit (fs::path const &path)
{
        if (auto msg = validate (path)) {
                displayWarning (*msg);
                return;
        }

        logger->info ("[FileDialog] Selected {}", path.string ());
        close ();

        if (command) {
                command (path.string ());
        }
}

/*--------------------------------------------------------------------------*/

void FileDialogPopup::displayWarning (std::string message)
{
        logger->warn ("[FileDialog] {}", message);
        warning_ = std::make_unique<MessagePopup> (root, "Warning!", std::move (message), colors::yellowOnBlack, logger);
        warning_->setNested (true);
}

/****************************************************************************/

void FileDialogPopup::handleKeyPress (Key key)
{
        if (warning_) {
                warning_->handleKeyPress (key);

                if (warning_->isClosed ()) {
                        warning_.reset ();
                }

                return;
        }

        switch (key) {
        case Key::tab:
                selectElement (selected + 1);
                break;

        case Key::shiftTab:
                selectElement (selected + elements ().size () - 1);
                break;

        case Key::escape:
                close ();
                break;

        default:
                elements ().at (selected)->handleKeyPress (key);
                break;
        }
}

/*--------------------------------------------------------------------------*/

void FileDialogPopup::handleMousePress (Point const &pos, MouseEvent event)
{
        if (warning_) {
                warning_->handleMousePress (pos, event);
                return;
        }

        Popup::handleMousePress (pos, event);
        auto all = elements ();

        for (size_t i = 0; i < all.size (); ++i) {
                if (all.at (i)->containsPosition (pos)) {
                        // Buttons act on the click without taking the focus.
                        if (i < 2) {
                                selectElement (i);
                        }

                        all.at (i)->handleMousePress (pos, event);
                        break;
                }
        }
}

/****************************************************************************/

void FileDialogPopup::draw (Renderer &r)
{
        drawFrame (r);
        auto all = elements ();

        for (auto *e : all) {
                e->draw (r);
        }

        // Selected one last, so its cursor wins.
        all.at (selected)->draw (r);
        r.unsetColorMode ();

        if (warning_) {
                r.resetCursor ();
                warning_->draw (r);
        }
}

} // namespace tg
