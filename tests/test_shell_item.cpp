// tests/test_shell_item.cpp
//
// Shell items built by the real shell from files on disk, plus the display-name mapping.

#include <doctest/doctest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <system_error>

#include "WideShell/ShellItem.h"

using WideShell::CoTaskMemWideString;
using WideShell::DisplayNameType;
using WideShell::ItemIdList;
using WideShell::ShellItem;

namespace fs = std::filesystem;

namespace
{
// Creates a uniquely named file in the temp directory and deletes it on scope exit.
class TempFile
{
public:
    TempFile()
    {
        static std::atomic<unsigned long long> counter{0};
        const auto pid = static_cast<unsigned long>(::GetCurrentProcessId());
        const auto n   = counter.fetch_add(1, std::memory_order_relaxed);

        _directory = fs::temp_directory_path();
        _name      = L"wideshell_" + std::to_wstring(pid) + L"_" + std::to_wstring(n) + L".txt";

        std::ofstream(Path()) << "level";
    }

    TempFile(const TempFile&)            = delete;
    TempFile& operator=(const TempFile&) = delete;

    ~TempFile()
    {
        std::error_code ec;
        fs::remove(Path(), ec);
    }

    [[nodiscard]] fs::path Path() const
    {
        return _directory / _name;
    }

    [[nodiscard]] const fs::path& Directory() const noexcept
    {
        return _directory;
    }

    [[nodiscard]] const std::wstring& Name() const noexcept
    {
        return _name;
    }

private:
    fs::path _directory;
    std::wstring _name;
};

// Restores the working directory on scope exit.
class CurrentDirectoryScope
{
public:
    explicit CurrentDirectoryScope(const fs::path& directory) : _previous(fs::current_path())
    {
        fs::current_path(directory);
    }

    CurrentDirectoryScope(const CurrentDirectoryScope&)            = delete;
    CurrentDirectoryScope& operator=(const CurrentDirectoryScope&) = delete;

    ~CurrentDirectoryScope()
    {
        std::error_code ec;
        fs::current_path(_previous, ec);
    }

private:
    fs::path _previous;
};

bool SameFile(const fs::path& a, const fs::path& b)
{
    std::error_code ec;
    return fs::equivalent(a, b, ec) && ! ec;
}
} // namespace

TEST_CASE("FromPath on an absolute path names the same file")
{
    const TempFile file;

    std::optional<ShellItem> item;
    REQUIRE(ShellItem::FromPath(file.Path(), item) == S_OK);
    REQUIRE(item.has_value());

    CoTaskMemWideString path;
    REQUIRE(item->GetDisplayName(DisplayNameType::FileSysPath, path) == S_OK);
    CHECK(SameFile(path.ToPath(), file.Path()));

    CoTaskMemWideString name;
    REQUIRE(item->GetDisplayName(DisplayNameType::ParentRelativeParsing, name) == S_OK);
    CHECK(name.AsWideStr().AsSlice() == file.Name());
}

TEST_CASE("FromPath resolves a relative path against the working directory")
{
    const TempFile file;
    const CurrentDirectoryScope cwd(file.Directory());

    std::optional<ShellItem> item;
    REQUIRE(ShellItem::FromPath(fs::path(file.Name()), item) == S_OK);

    CoTaskMemWideString path;
    REQUIRE(item->GetDisplayName(DisplayNameType::FileSysPath, path) == S_OK);
    CHECK(SameFile(path.ToPath(), file.Path()));
}

TEST_CASE("FromPath rejects an interior NUL before calling the shell")
{
    std::optional<ShellItem> item;
    CHECK(ShellItem::FromPath(fs::path(std::wstring(L"C:\\a\0b", 6)), item) == WIDESHELL_E_INTERIOR_NUL);
    CHECK_FALSE(item.has_value());
}

TEST_CASE("FromPath on a missing file fails")
{
    const TempFile file;
    const fs::path missing = file.Directory() / L"wideshell_does_not_exist.bin";

    std::optional<ShellItem> item;
    CHECK(FAILED(ShellItem::FromPath(missing, item)));
    CHECK_FALSE(item.has_value());
}

TEST_CASE("An item id list leads to the same file")
{
    const TempFile file;

    WideShell::WideString path;
    REQUIRE(WideShell::WideString::Create(file.Path(), path) == S_OK);

    std::optional<ItemIdList> idList;
    REQUIRE(ItemIdList::CreateFromPath(path, idList) == S_OK);
    REQUIRE(idList.has_value());
    CHECK(idList->Get() != nullptr);

    std::optional<ShellItem> item;
    REQUIRE(ShellItem::FromIdList(*idList, item) == S_OK);

    CoTaskMemWideString resolved;
    REQUIRE(item->GetDisplayName(DisplayNameType::FileSysPath, resolved) == S_OK);
    CHECK(SameFile(resolved.ToPath(), file.Path()));
}

TEST_CASE("An item id list for a missing file fails")
{
    const TempFile file;

    WideShell::WideString missing;
    REQUIRE(WideShell::WideString::Create(file.Directory() / L"wideshell_does_not_exist.bin", missing) == S_OK);

    std::optional<ItemIdList> idList;
    CHECK(FAILED(ItemIdList::CreateFromPath(missing, idList)));
    CHECK_FALSE(idList.has_value());
}

TEST_CASE("Display name types map to their SIGDN and back")
{
    struct Expected
    {
        DisplayNameType type;
        SIGDN sigdn;
        const wchar_t* name;
    };

    const Expected table[] = {
        {DisplayNameType::NormalDisplay, SIGDN_NORMALDISPLAY, L"NormalDisplay"},
        {DisplayNameType::ParentRelativeParsing, SIGDN_PARENTRELATIVEPARSING, L"ParentRelativeParsing"},
        {DisplayNameType::DesktopAbsoluteParsing, SIGDN_DESKTOPABSOLUTEPARSING, L"DesktopAbsoluteParsing"},
        {DisplayNameType::ParentRelativeEditing, SIGDN_PARENTRELATIVEEDITING, L"ParentRelativeEditing"},
        {DisplayNameType::DesktopAbsoluteEditing, SIGDN_DESKTOPABSOLUTEEDITING, L"DesktopAbsoluteEditing"},
        {DisplayNameType::FileSysPath, SIGDN_FILESYSPATH, L"FileSysPath"},
        {DisplayNameType::Url, SIGDN_URL, L"Url"},
        {DisplayNameType::ParentRelativeForAddressBar, SIGDN_PARENTRELATIVEFORADDRESSBAR, L"ParentRelativeForAddressBar"},
        {DisplayNameType::ParentRelative, SIGDN_PARENTRELATIVE, L"ParentRelative"},
        {DisplayNameType::ParentRelativeForUi, SIGDN_PARENTRELATIVEFORUI, L"ParentRelativeForUi"},
    };

    for (const Expected& entry : table)
    {
        CAPTURE(static_cast<int>(entry.type));
        CHECK(WideShell::ToSigdn(entry.type) == entry.sigdn);
        CHECK(std::wstring_view(WideShell::DisplayNameTypeName(entry.type)) == entry.name);

        DisplayNameType parsed = DisplayNameType::NormalDisplay;
        REQUIRE(WideShell::TryParseDisplayNameType(entry.name, parsed));
        CHECK(parsed == entry.type);
    }

    DisplayNameType untouched = DisplayNameType::Url;
    CHECK_FALSE(WideShell::TryParseDisplayNameType(L"filesyspath", untouched));
    CHECK(untouched == DisplayNameType::Url);
}
