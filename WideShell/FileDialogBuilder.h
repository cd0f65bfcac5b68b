#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "FileDialog.h"
#include "FilterList.h"

namespace WideShell
{
// Returned by Show() / Execute() when the user dismissed the dialog.
inline constexpr HRESULT kDialogCancelled = HRESULT_FROM_WIN32(ERROR_CANCELLED);

[[nodiscard]] constexpr bool IsCancelled(HRESULT hr) noexcept
{
    return hr == kDialogCancelled;
}

// Collects dialog settings, then creates and configures a dialog in one go.
// Nothing is set on the dialog unless asked for; COM is left alone unless InitCom() was called.
template <typename Dialog> class FileDialogBuilder
{
public:
    FileDialogBuilder() = default;

    FileDialogBuilder(FileDialogBuilder&&) noexcept            = default;
    FileDialogBuilder& operator=(FileDialogBuilder&&) noexcept = default;

    // Joins the process-wide MTA before the dialog is created.
    FileDialogBuilder& InitCom() noexcept
    {
        _initCom = true;
        return *this;
    }

    // Folder shown when the user has no recent folder for this dialog.
    FileDialogBuilder& DefaultPath(std::filesystem::path path)
    {
        _defaultPath = std::move(path);
        return *this;
    }

    // Folder shown regardless of the user's history.
    FileDialogBuilder& Path(std::filesystem::path path)
    {
        _path = std::move(path);
        return *this;
    }

    // A zero code unit in either argument is a programming error and terminates.
    template <typename Name, typename Pattern> FileDialogBuilder& FileType(Name&& name, Pattern&& pattern)
    {
        _filters.AddFilter(std::forward<Name>(name), std::forward<Pattern>(pattern));
        return *this;
    }

    FileDialogBuilder& FileName(std::wstring fileName)
    {
        _fileName = std::move(fileName);
        return *this;
    }

    FileDialogBuilder& Title(std::wstring title)
    {
        _title = std::move(title);
        return *this;
    }

    // Open dialogs only; ignored with a warning on save dialogs.
    FileDialogBuilder& PickFolders() noexcept
    {
        _pickFolders = true;
        return *this;
    }

    [[nodiscard]] bool ComInitRequested() const noexcept
    {
        return _initCom;
    }

    [[nodiscard]] const FilterList& Filters() const noexcept
    {
        return _filters;
    }

    // Creates the dialog and applies every setting. On failure `out` is left empty.
    [[nodiscard]] HRESULT Build(std::optional<Dialog>& out) const;

    // Applies the settings to a dialog that already exists. Stops at the first failing step.
    [[nodiscard]] HRESULT Apply(const Dialog& dialog) const;

    // Build(), Show(), then the file system path of the chosen item.
    // A dismissed dialog returns kDialogCancelled.
    [[nodiscard]] HRESULT Execute(std::filesystem::path& selected) const;

private:
    bool _initCom     = false;
    bool _pickFolders = false;
    std::optional<std::filesystem::path> _defaultPath;
    std::optional<std::filesystem::path> _path;
    FilterList _filters;
    std::optional<std::wstring> _fileName;
    std::optional<std::wstring> _title;
};

using FileOpenDialogBuilder = FileDialogBuilder<FileOpenDialog>;
using FileSaveDialogBuilder = FileDialogBuilder<FileSaveDialog>;

extern template class FileDialogBuilder<FileOpenDialog>;
extern template class FileDialogBuilder<FileSaveDialog>;

// Builders with InitCom() already set.
[[nodiscard]] FileOpenDialogBuilder NfdOpenBuilder();
[[nodiscard]] FileSaveDialogBuilder NfdSaveBuilder();

// Plain open / save dialogs with default settings.
[[nodiscard]] HRESULT NfdOpen(std::filesystem::path& selected);
[[nodiscard]] HRESULT NfdSave(std::filesystem::path& selected);
} // namespace WideShell
