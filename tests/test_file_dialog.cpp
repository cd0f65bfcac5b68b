// tests/test_file_dialog.cpp
//
// Dialog capability layers and the builder, driven against mock COM objects so no window is ever shown.

#include <doctest/doctest.h>

#include <atomic>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>

#include "WideShell/FileDialog.h"
#include "WideShell/FileDialogBuilder.h"
#include "test_support/MockCom.h"

using WideShell::CoTaskMemWideString;
using WideShell::DisplayNameType;
using WideShell::ExternalHandle;
using WideShell::FileDialog;
using WideShell::FileOpenDialog;
using WideShell::FileOpenDialogBuilder;
using WideShell::FileSaveDialog;
using WideShell::FileSaveDialogBuilder;
using WideShell::FilterList;
using WideShell::HandleState;
using WideShell::ModalWindow;
using WideShell::ShellItem;
using WideShellTests::MockFileOpenDialog;
using WideShellTests::MockShellItem;
using WideShellTests::RefCounters;

namespace
{
struct MockDialogFixture
{
    RefCounters dialogCounters;
    MockFileOpenDialog* mock = new MockFileOpenDialog(dialogCounters);
    std::optional<FileOpenDialog> dialog;

    MockDialogFixture()
    {
        dialog.emplace(ExternalHandle<IFileOpenDialog>::Adopt(mock));
    }
};

ShellItem MakeItem(RefCounters& counters, const wchar_t* name = L"C:\\folder")
{
    return ShellItem(ExternalHandle<IShellItem>::Adopt(new MockShellItem(counters, name)));
}

class TempFolder
{
public:
    TempFolder()
    {
        static std::atomic<unsigned long long> counter{0};
        const auto pid = static_cast<unsigned long>(::GetCurrentProcessId());
        const auto n   = counter.fetch_add(1, std::memory_order_relaxed);
        _path          = std::filesystem::temp_directory_path() / (L"wideshell_dialog_" + std::to_wstring(pid) + L"_" + std::to_wstring(n));
        std::filesystem::create_directories(_path);
    }

    TempFolder(const TempFolder&)            = delete;
    TempFolder& operator=(const TempFolder&) = delete;

    ~TempFolder()
    {
        std::error_code ec;
        std::filesystem::remove_all(_path, ec);
    }

    [[nodiscard]] const std::filesystem::path& Path() const noexcept
    {
        return _path;
    }

private:
    std::filesystem::path _path;
};
} // namespace

TEST_CASE("SetDefaultFolder hands the item's only reference to the dialog")
{
    MockDialogFixture fixture;
    RefCounters item;

    {
        ShellItem folder = MakeItem(item);
        CHECK(fixture.dialog->SetDefaultFolder(std::move(folder)) == S_OK);
        // Dropping `folder` here must not release again.
    }

    CHECK(fixture.mock->setDefaultFolderCalls == 1);
    CHECK(item.releases == 1);
    CHECK(item.releasesInsideConsumingCall == 1);
    CHECK(item.destroyed);
}

TEST_CASE("SetFolder consumes the item even when the call fails")
{
    MockDialogFixture fixture;
    fixture.mock->setFolderResult = E_INVALIDARG;
    RefCounters item;

    CHECK(fixture.dialog->SetFolder(MakeItem(item)) == E_INVALIDARG);

    CHECK(item.releases == 1);
    CHECK(item.releasesInsideConsumingCall == 1);
}

TEST_CASE("SetFileTypes passes every descriptor")
{
    MockDialogFixture fixture;

    FilterList filters;
    filters.AddFilter(L"toml", L"*.toml");
    filters.AddFilter(L"sks", L"*.txt;*.lbl");

    CHECK(fixture.dialog->SetFileTypes(filters) == S_OK);

    REQUIRE(fixture.mock->fileTypes.size() == 2u);
    CHECK(fixture.mock->fileTypes[0].first == L"toml");
    CHECK(fixture.mock->fileTypes[0].second == L"*.toml");
    CHECK(fixture.mock->fileTypes[1].second == L"*.txt;*.lbl");
}

TEST_CASE("Narrower views borrow the same object")
{
    MockDialogFixture fixture;
    const int addRefsBefore = fixture.dialogCounters.addRefs;

    const FileDialog fileDialog = *fixture.dialog;
    const ModalWindow window    = fileDialog;

    CHECK(window.Show() == S_OK);
    CHECK(fixture.mock->showCalls == 1);
    CHECK(fixture.mock->lastOwner == nullptr);

    WideShell::WideString name;
    REQUIRE(WideShell::WideString::Create(L"level.txt", name) == S_OK);
    CHECK(fileDialog.SetFileName(name) == S_OK);
    CHECK(fixture.mock->fileName == L"level.txt");

    CHECK(fixture.dialogCounters.addRefs == addRefsBefore);
    CHECK(fixture.dialogCounters.releases == 0);
}

TEST_CASE("The owning dialog releases its reference once")
{
    RefCounters counters;
    {
        FileOpenDialog dialog(ExternalHandle<IFileOpenDialog>::Adopt(new MockFileOpenDialog(counters)));
        FileOpenDialog moved = std::move(dialog);
        CHECK(moved.Handle().State() == HandleState::Unreleased);
    }
    CHECK(counters.releases == 1);
    CHECK(counters.destroyed);
}

TEST_CASE("GetResult wraps a new reference on the chosen item")
{
    MockDialogFixture fixture;
    RefCounters item;
    auto* chosen         = new MockShellItem(item, L"C:\\picked\\level.txt");
    fixture.mock->result = chosen;

    {
        std::optional<ShellItem> result;
        REQUIRE(fixture.dialog->GetResult(result) == S_OK);
        REQUIRE(result.has_value());
        CHECK(item.addRefs == 1);

        CoTaskMemWideString path;
        REQUIRE(result->GetDisplayName(DisplayNameType::FileSysPath, path) == S_OK);
        CHECK(chosen->lastRequested == SIGDN_FILESYSPATH);
        CHECK(path.AsWideStr().AsSlice() == L"C:\\picked\\level.txt");
        CHECK(path.ToPath() == std::filesystem::path(L"C:\\picked\\level.txt"));
    }
    CHECK(item.releases == 1);

    fixture.mock->result = nullptr;
    chosen->Release();
    CHECK(item.destroyed);
}

TEST_CASE("GetResult failure leaves the output empty")
{
    MockDialogFixture fixture;

    std::optional<ShellItem> result;
    CHECK(fixture.dialog->GetResult(result) == E_UNEXPECTED);
    CHECK_FALSE(result.has_value());
}

TEST_CASE("GetDisplayName failures are returned as-is")
{
    RefCounters item;
    auto* raw              = new MockShellItem(item, L"x");
    raw->displayNameResult = E_NOTIMPL;
    const ShellItem shellItem(ExternalHandle<IShellItem>::Adopt(raw));

    CoTaskMemWideString name;
    CHECK(shellItem.GetDisplayName(DisplayNameType::Url, name) == E_NOTIMPL);
    CHECK_FALSE(name.IsValid());
}

TEST_CASE("Options round-trip through the dialog")
{
    MockDialogFixture fixture;

    FILEOPENDIALOGOPTIONS options = 0;
    REQUIRE(fixture.dialog->GetOptions(options) == S_OK);
    CHECK(options == static_cast<FILEOPENDIALOGOPTIONS>(FOS_FILEMUSTEXIST | FOS_PATHMUSTEXIST));

    REQUIRE(fixture.dialog->SetOptions(options | FOS_PICKFOLDERS) == S_OK);
    CHECK((fixture.mock->options & FOS_PICKFOLDERS) != 0);
}

TEST_CASE("Builder applies filters, file name, title and folder picking")
{
    MockDialogFixture fixture;

    FileOpenDialogBuilder builder;
    builder.FileType("toml", "*.toml").FileType(L"sks", L"*.txt;*.lbl").FileName(L"level.txt").Title(L"Pick a level").PickFolders();

    CHECK_FALSE(builder.ComInitRequested());
    CHECK(builder.Filters().Size() == 2u);

    REQUIRE(builder.Apply(*fixture.dialog) == S_OK);

    REQUIRE(fixture.mock->fileTypes.size() == 2u);
    CHECK(fixture.mock->fileTypes[1].first == L"sks");
    CHECK(fixture.mock->fileName == L"level.txt");
    CHECK(fixture.mock->title == L"Pick a level");
    CHECK((fixture.mock->options & FOS_PICKFOLDERS) != 0);
    CHECK((fixture.mock->options & FOS_FORCEFILESYSTEM) != 0);

    // Nothing was asked about folders.
    CHECK(fixture.mock->setDefaultFolderCalls == 0);
    CHECK(fixture.mock->setFolderCalls == 0);
}

TEST_CASE("Builder hands both folders to the dialog")
{
    MockDialogFixture fixture;
    const TempFolder defaultFolder;
    const TempFolder folder;

    FileOpenDialogBuilder builder;
    builder.DefaultPath(defaultFolder.Path()).Path(folder.Path());

    REQUIRE(builder.Apply(*fixture.dialog) == S_OK);

    CHECK(fixture.mock->setDefaultFolderCalls == 1);
    CHECK(fixture.mock->setFolderCalls == 1);
    REQUIRE_FALSE(fixture.mock->defaultFolderPath.empty());
    REQUIRE_FALSE(fixture.mock->folderPath.empty());
    CHECK(std::filesystem::equivalent(fixture.mock->defaultFolderPath, defaultFolder.Path()));
    CHECK(std::filesystem::equivalent(fixture.mock->folderPath, folder.Path()));
}

TEST_CASE("Builder stops at a folder that does not exist")
{
    MockDialogFixture fixture;
    const TempFolder parent;

    FileOpenDialogBuilder builder;
    builder.DefaultPath(parent.Path() / L"missing").Title(L"never set");

    CHECK(FAILED(builder.Apply(*fixture.dialog)));
    CHECK(fixture.mock->setDefaultFolderCalls == 0);
    CHECK(fixture.mock->title.empty());
}

TEST_CASE("Builder with no settings leaves the dialog alone")
{
    MockDialogFixture fixture;

    const FileOpenDialogBuilder builder{};
    REQUIRE(builder.Apply(*fixture.dialog) == S_OK);

    CHECK(fixture.mock->fileTypes.empty());
    CHECK(fixture.mock->fileName.empty());
    CHECK(fixture.mock->title.empty());
    CHECK((fixture.mock->options & FOS_PICKFOLDERS) == 0);
}

TEST_CASE("Builder rejects a file name with an interior NUL")
{
    MockDialogFixture fixture;

    FileOpenDialogBuilder builder;
    builder.FileName(std::wstring(L"bad\0name", 8));

    CHECK(builder.Apply(*fixture.dialog) == WIDESHELL_E_INTERIOR_NUL);
    CHECK(fixture.mock->fileName.empty());
}

TEST_CASE("Both dialogs can be created from the shell")
{
    std::optional<FileOpenDialog> open;
    REQUIRE(FileOpenDialog::Create(open) == S_OK);
    REQUIRE(open.has_value());
    CHECK(open->Handle().State() == HandleState::Unreleased);

    std::optional<FileSaveDialog> save;
    REQUIRE(FileSaveDialog::Create(save) == S_OK);
    REQUIRE(save.has_value());
    CHECK(save->Handle().State() == HandleState::Unreleased);

    const FileDialog fileView = *save;
    const ModalWindow window  = *save;
    CHECK(fileView.FileDialogPtr() == save->FileDialogPtr());
    CHECK(window.ModalWindowPtr() == save->ModalWindowPtr());
    CHECK(static_cast<ModalWindow>(fileView).ModalWindowPtr() == save->ModalWindowPtr());
}

TEST_CASE("Folder picking applies to open dialogs only")
{
    const TempFolder folder;

    std::optional<FileOpenDialog> open;
    REQUIRE(FileOpenDialogBuilder{}.PickFolders().DefaultPath(folder.Path()).Build(open) == S_OK);
    REQUIRE(open.has_value());

    FILEOPENDIALOGOPTIONS openOptions = 0;
    REQUIRE(open->GetOptions(openOptions) == S_OK);
    CHECK((openOptions & FOS_PICKFOLDERS) != 0);

    std::optional<FileSaveDialog> save;
    REQUIRE(FileSaveDialogBuilder{}.PickFolders().Title(L"Save a level").FileName(L"level.txt").Build(save) == S_OK);
    REQUIRE(save.has_value());

    FILEOPENDIALOGOPTIONS saveOptions = 0;
    REQUIRE(save->GetOptions(saveOptions) == S_OK);
    CHECK((saveOptions & FOS_PICKFOLDERS) == 0);
}

TEST_CASE("Convenience builders request COM initialization")
{
    CHECK(WideShell::NfdOpenBuilder().ComInitRequested());
    CHECK(WideShell::NfdSaveBuilder().ComInitRequested());
}

TEST_CASE("Cancellation is recognized")
{
    CHECK(WideShell::IsCancelled(HRESULT_FROM_WIN32(ERROR_CANCELLED)));
    CHECK_FALSE(WideShell::IsCancelled(E_FAIL));
    CHECK_FALSE(WideShell::IsCancelled(S_OK));
}
