/****************************************************************************
 *                                                                          *
 *  Author : lukasz.iwaszkiewicz@gmail.com                                  *
 *  ~~~~~~~~                                                                *
 *  License : see COPYING file for details.                                 *
 *  ~~~~~~~~~                                                               *
 ****************************************************************************/

#include "testRoot.h"
#include "termgrid/fileDialog.h"
#include "termgrid/memoryDisplay.h"
#include "termgrid/renderer.h"
#include <catch2/catch.hpp>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include <string_view>
#include <vector>

using namespace tg;
namespace fs = std::filesystem;

namespace {

/// Temporary directory with two sub directories, two files and a hidden file.
struct TempTree {
        TempTree ()
        {
                fs::create_directories (dir / "alpha");
                fs::create_directories (dir / "beta");
                std::ofstream{dir / "b.txt"} << "b";
                std::ofstream{dir / "a.cfg"} << "a";
                std::ofstream{dir / ".hidden"} << "h";
        }

        TempTree (TempTree const &) = delete;
        TempTree &operator= (TempTree const &) = delete;
        TempTree (TempTree &&) = delete;
        TempTree &operator= (TempTree &&) = delete;

        ~TempTree ()
        {
                std::error_code ec;
                fs::remove_all (dir, ec);
        }

        fs::path dir{fs::absolute (fs::temp_directory_path () / ("termgrid-test-" + std::to_string (std::random_device{}()))).lexically_normal ()};
};

std::vector<std::string> names (FileSelectImplementation const &list)
{
        std::vector<std::string> ret;

        for (auto const &e : list.itemList ()) {
                ret.push_back (e.name);
        }

        return ret;
}

using Names = std::vector<std::string>;

struct Fixture : public TempTree {
        TestRoot root;
        MemoryDisplay disp{{80, 24}};
        Renderer renderer{disp};
        std::vector<std::string> results;
        FileDialogPopup::Command command = [this] (auto const &s) { results.push_back (s); };
};

void type (UIElement &e, std::string_view s)
{
        for (auto c : s) {
                e.handleKeyPress (toKey (c));
        }
}

} // namespace

TEST_CASE ("Directory listing", "[fileDialog]")
{
        TempTree tree;

        SECTION ("Directories first, hidden files skipped")
        {
                FileSelectImplementation list{tree.dir, DialogType::openFile};
                REQUIRE (names (list) == Names{"..", "alpha", "beta", "a.cfg", "b.txt"});
                REQUIRE (list.itemList ().at (1).label () == "<DIR> alpha");
                REQUIRE (list.itemList ().at (3).label () == "      a.cfg");
                REQUIRE (list.itemList ().at (3).path == tree.dir / "a.cfg");
                REQUIRE (list.itemList ().front ().path == tree.dir.parent_path ());
        }

        SECTION ("Directories only")
        {
                FileSelectImplementation list{tree.dir, DialogType::openDir};
                REQUIRE (names (list) == Names{"..", "alpha", "beta"});
        }

        SECTION ("Extension filter")
        {
                FileSelectImplementation list{tree.dir, DialogType::openFile, {".txt"}};
                REQUIRE (names (list) == Names{"..", "alpha", "beta", "b.txt"});
        }

        SECTION ("Hidden files")
        {
                FileSelectImplementation list{tree.dir, DialogType::openFile, {}, true};
                REQUIRE (names (list) == Names{"..", "alpha", "beta", ".hidden", "a.cfg", "b.txt"});

                list.setShowHidden (false);
                list.refresh ();
                REQUIRE (list.size () == 5);
        }

        SECTION ("Changing directories")
        {
                FileSelectImplementation list{tree.dir / "alpha" / "", DialogType::openFile};
                REQUIRE (list.currentDir () == tree.dir / "alpha");
                REQUIRE (names (list) == Names{".."});

                list.changeDirectory (tree.dir / "alpha" / "..");
                REQUIRE (list.currentDir () == tree.dir);

                REQUIRE_THROWS_AS (list.changeDirectory (tree.dir / "missing"), fs::filesystem_error);
                REQUIRE (list.currentDir () == tree.dir);
                REQUIRE (list.size () == 5);
        }

        SECTION ("Root has no parent entry")
        {
                FileSelectImplementation list{"/", DialogType::openDir};
                REQUIRE (std::ranges::none_of (list.itemList (), [] (auto const &e) { return e.name == ".."; }));
        }

        SECTION ("Missing directory")
        {
                REQUIRE_THROWS_AS ((FileSelectImplementation{tree.dir / "missing", DialogType::openFile}), fs::filesystem_error);
        }

        SECTION ("Hidden names")
        {
                REQUIRE (isHidden (".git"));
                REQUIRE (isHidden ("/a/.b"));
                REQUIRE (!isHidden ("/a/.b/c"));
        }
}

TEST_CASE_METHOD (Fixture, "Open file dialog", "[fileDialog]")
{
        FileDialogPopup dialog{root, command, dir, DialogType::openFile, {}, false, colors::whiteOnBlack, {}};

        REQUIRE (dialog.title () == "Open File");
        REQUIRE (dialog.startPosition () == Point{10, 2});
        REQUIRE (dialog.stopPosition () == Point{70, 23});
        REQUIRE (dialog.selectedElement () == 0);
        REQUIRE (dialog.fileSelect ().isSelected ());

        SECTION ("Enter on a file submits it")
        {
                for (int i = 0; i < 3; ++i) {
                        dialog.handleKeyPress (Key::down);
                }

                dialog.handleKeyPress (Key::enter);
                REQUIRE (results == Names{(dir / "a.cfg").string ()});
                REQUIRE (dialog.isClosed ());
                REQUIRE (root.closeCount == 1);
        }

        SECTION ("Enter on a directory opens it")
        {
                dialog.handleKeyPress (Key::down);
                dialog.handleKeyPress (Key::enter);
                REQUIRE (dialog.fileSelect ().list ().currentDir () == dir / "alpha");
                REQUIRE (dialog.fileSelect ().title () == (dir / "alpha").string ());
                REQUIRE (results.empty ());

                dialog.handleKeyPress (Key::enter);
                REQUIRE (dialog.fileSelect ().list ().currentDir () == dir);
        }

        SECTION ("Directory removed in the meantime")
        {
                dialog.handleKeyPress (Key::down);
                fs::remove (dir / "alpha");
                dialog.handleKeyPress (Key::enter);

                REQUIRE (dialog.warning () != nullptr);
                REQUIRE (dialog.warning ()->text () == "Selected directory does not exist!");
                REQUIRE (dialog.fileSelect ().list ().currentDir () == dir);

                // The warning takes the input until it is dismissed.
                dialog.handleKeyPress (Key::tab);
                REQUIRE (dialog.selectedElement () == 0);
                dialog.handleKeyPress (Key::escape);
                REQUIRE (dialog.warning () == nullptr);
                REQUIRE (!dialog.isClosed ());
                REQUIRE (root.closeCount == 0);
        }

        SECTION ("Tab cycles the elements")
        {
                dialog.handleKeyPress (Key::tab);
                REQUIRE (dialog.selectedElement () == 1);
                REQUIRE (dialog.fileNameInput ().isSelected ());
                REQUIRE (!dialog.fileSelect ().isSelected ());
                REQUIRE (dialog.helpText () == dialog.fileNameInput ().helpText ());

                dialog.handleKeyPress (Key::tab);
                dialog.handleKeyPress (Key::tab);
                dialog.handleKeyPress (Key::tab);
                REQUIRE (dialog.selectedElement () == 0);

                dialog.handleKeyPress (Key::shiftTab);
                REQUIRE (dialog.selectedElement () == 3);
        }

        SECTION ("New file")
        {
                dialog.handleKeyPress (Key::tab);
                type (dialog, "new.txt");
                dialog.handleKeyPress (Key::enter);

                REQUIRE (fs::is_regular_file (dir / "new.txt"));
                REQUIRE (names (dialog.fileSelect ().list ()) == Names{"..", "alpha", "beta", "a.cfg", "b.txt", "new.txt"});
                REQUIRE (dialog.fileNameInput ().editor ().get ().empty ());
                REQUIRE (!dialog.isClosed ());

                type (dialog, "new.txt");
                dialog.handleKeyPress (Key::enter);
                REQUIRE (dialog.warning () != nullptr);
                REQUIRE (dialog.warning ()->text () == "File/Directory already exists!");
        }

        SECTION ("Empty name does nothing")
        {
                dialog.handleKeyPress (Key::tab);
                dialog.handleKeyPress (Key::enter);
                REQUIRE (dialog.warning () == nullptr);
                REQUIRE (dialog.fileSelect ().list ().size () == 5);
        }

        SECTION ("OK needs a file")
        {
                dialog.okButton ().press ();
                REQUIRE (dialog.warning () != nullptr);
                REQUIRE (dialog.warning ()->text () == "Please select a valid file path!");
                REQUIRE (results.empty ());
        }

        SECTION ("OK with a file")
        {
                dialog.handleKeyPress (Key::end);
                dialog.handleKeyPress (Key::tab);
                dialog.handleKeyPress (Key::tab);
                dialog.handleKeyPress (Key::enter);
                REQUIRE (results == Names{(dir / "b.txt").string ()});
        }

        SECTION ("Cancel")
        {
                dialog.handleKeyPress (Key::shiftTab);
                dialog.handleKeyPress (Key::enter);
                REQUIRE (dialog.isClosed ());
                REQUIRE (results.empty ());
        }

        SECTION ("Escape")
        {
                dialog.handleKeyPress (Key::escape);
                REQUIRE (dialog.isClosed ());
                REQUIRE (results.empty ());
        }

        SECTION ("Click selects, double click enters")
        {
                auto first = dialog.fileSelect ().startPosition ().y () + 1;
                dialog.handleMousePress ({20, first + 2}, MouseEvent::leftClick);
                REQUIRE (dialog.fileSelect ().list ().get ()->name == "beta");

                dialog.handleMousePress ({20, first + 2}, MouseEvent::leftDoubleClick);
                REQUIRE (dialog.fileSelect ().list ().currentDir () == dir / "beta");
        }

        SECTION ("Draw")
        {
                dialog.draw (renderer);
                REQUIRE (disp.contains (" Open File "));
                REQUIRE (disp.contains ("<DIR> alpha"));
                REQUIRE (disp.contains ("      b.txt"));
                REQUIRE (disp.contains ("New File"));
                REQUIRE (disp.contains ("OK"));

                // Caption inside the frame, not under its left edge.
                auto &input = dialog.fileNameInput ();
                auto captionRow = input.startPosition ().y () + input.height () / 2 - 1;
                REQUIRE (disp.at ({input.startPosition ().x (), captionRow}) == "|");
                REQUIRE (disp.at ({input.startPosition ().x () + 2, captionRow}) == "N");

                auto dirRow = dialog.fileSelect ().startPosition ().y () + 2;
                auto textX = dialog.fileSelect ().startPosition ().x () + 3;
                REQUIRE (disp.at ({textX, dirRow}) == "<");
                REQUIRE (disp.attributes ({textX + 6, dirRow}).color == colors::blueOnBlack);
                REQUIRE (disp.attributes ({textX, dirRow}).color == colors::whiteOnBlack);
        }
}

TEST_CASE_METHOD (Fixture, "Open directory dialog", "[fileDialog]")
{
        FileDialogPopup dialog{root, command, dir, DialogType::openDir, {}, false, colors::whiteOnBlack, {}};
        REQUIRE (dialog.title () == "Open Directory");
        REQUIRE (dialog.fileSelect ().list ().size () == 3);

        SECTION ("OK submits the current directory")
        {
                dialog.handleKeyPress (Key::down);
                dialog.handleKeyPress (Key::enter);
                dialog.okButton ().press ();
                REQUIRE (results == Names{(dir / "alpha").string ()});
        }

        SECTION ("New directory")
        {
                dialog.handleKeyPress (Key::tab);
                type (dialog, "gamma");
                dialog.handleKeyPress (Key::enter);
                REQUIRE (fs::is_directory (dir / "gamma"));
                REQUIRE (names (dialog.fileSelect ().list ()) == Names{"..", "alpha", "beta", "gamma"});
        }

        SECTION ("Cancel by mouse")
        {
                auto center = dialog.cancelButton ().startPosition () + Point{2, 2};
                dialog.handleMousePress (center, MouseEvent::leftClick);
                REQUIRE (dialog.isClosed ());
                REQUIRE (results.empty ());
                REQUIRE (dialog.selectedElement () == 0);
        }
}

TEST_CASE_METHOD (Fixture, "Save as dialog", "[fileDialog]")
{
        FileDialogPopup dialog{root, command, dir, DialogType::saveAs, {}, false, colors::whiteOnBlack, {}};
        REQUIRE (dialog.title () == "Save As");

        dialog.handleKeyPress (Key::tab);
        type (dialog, "out.txt");

        SECTION ("Enter in the name input")
        {
                dialog.handleKeyPress (Key::enter);
                REQUIRE (results == Names{(dir / "out.txt").string ()});
                REQUIRE (!fs::exists (dir / "out.txt"));
        }

        SECTION ("OK button")
        {
                dialog.okButton ().press ();
                REQUIRE (results == Names{(dir / "out.txt").string ()});
        }
}

TEST_CASE ("File dialog on a missing directory", "[fileDialog]")
{
        TestRoot root;
        REQUIRE_THROWS_AS ((FileDialogPopup{root, nullptr, "/definitely/not/here", DialogType::openFile, {}, false, colors::whiteOnBlack, {}}),
                           fs::filesystem_error);
}
