#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>

#include "FileDialogBuilder.h"
#include "ShellItem.h"

namespace WideShell
{
inline constexpr int64_t kDialogSettingsSchemaVersion = 1;
inline constexpr size_t kMaxDialogSettingsFileBytes   = 1u * 1024u * 1024u; // 1 MiB

enum class DialogKind : uint8_t
{
    Open,
    Save,
};

struct DialogFilterSetting
{
    std::wstring name;
    std::wstring pattern;

    bool operator==(const DialogFilterSetting&) const = default;
};

// Everything needed to run one dialog from a settings file.
struct DialogSettings
{
    DialogKind kind = DialogKind::Open;
    bool initCom    = true;
    std::optional<std::filesystem::path> defaultPath;
    std::optional<std::filesystem::path> path;
    std::optional<std::wstring> fileName;
    std::optional<std::wstring> title;
    bool pickFolders = false;
    std::vector<DialogFilterSetting> filters;
    DisplayNameType display = DisplayNameType::FileSysPath;
};

[[nodiscard]] const wchar_t* DialogKindName(DialogKind kind) noexcept;

// Parses a JSON5 document (UTF-8, optional BOM). Unknown keys are ignored; members of the wrong type are logged
// and skipped. Returns HRESULT_FROM_WIN32(ERROR_INVALID_DATA) for malformed documents or an unsupported
// schemaVersion, in which case `settings` is left untouched.
[[nodiscard]] HRESULT ParseDialogSettings(std::string_view json, DialogSettings& settings) noexcept;

// S_FALSE when the file does not exist; `settings` then keeps its defaults.
[[nodiscard]] HRESULT LoadDialogSettings(const std::filesystem::path& file, DialogSettings& settings) noexcept;

// Copies the settings into a builder. Filters are added after any the builder already has.
void ApplyDialogSettings(const DialogSettings& settings, FileOpenDialogBuilder& builder);
void ApplyDialogSettings(const DialogSettings& settings, FileSaveDialogBuilder& builder);
} // namespace WideShell
