#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string_view>

#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>

#include <shlobj_core.h>
#include <shobjidl_core.h>

#pragma warning(push)
// WIL: C4625 (copy ctor deleted), C4626 (copy assign deleted), C5026 (move ctor deleted), C5027 (move assign deleted)
#pragma warning(disable : 4625 4626 5026 5027)
#include <wil/resource.h>
#pragma warning(pop)

#include "ExternalHandle.h"
#include "WideString.h"

namespace WideShell
{
enum class DisplayNameType : uint8_t
{
    NormalDisplay,
    ParentRelativeParsing,
    DesktopAbsoluteParsing,
    ParentRelativeEditing,
    DesktopAbsoluteEditing,
    FileSysPath,
    Url,
    ParentRelativeForAddressBar,
    ParentRelative,
    ParentRelativeForUi,
};

[[nodiscard]] SIGDN ToSigdn(DisplayNameType type) noexcept;

// Stable name ("FileSysPath", ...) used in logs, settings and on the command line.
[[nodiscard]] const wchar_t* DisplayNameTypeName(DisplayNameType type) noexcept;
[[nodiscard]] bool TryParseDisplayNameType(std::wstring_view text, DisplayNameType& out) noexcept;

// Terminated string allocated by the shell with CoTaskMemAlloc.
class CoTaskMemWideString
{
public:
    CoTaskMemWideString() = default;

    // Takes ownership. `text` must be non-null and terminated.
    explicit CoTaskMemWideString(wil::unique_cotaskmem_string text) noexcept;

    CoTaskMemWideString(CoTaskMemWideString&&) noexcept            = default;
    CoTaskMemWideString& operator=(CoTaskMemWideString&&) noexcept = default;

    [[nodiscard]] bool IsValid() const noexcept
    {
        return static_cast<bool>(_text);
    }

    // Trusts the shell's terminator; the view lives as long as this object.
    [[nodiscard]] WideStr AsWideStr() const noexcept;

    [[nodiscard]] std::filesystem::path ToPath() const;

private:
    wil::unique_cotaskmem_string _text;
    size_t _size = 0;
};

// Absolute item identifier list, freed with ILFree.
class ItemIdList
{
public:
    using Storage = wil::unique_any<PIDLIST_ABSOLUTE, decltype(&::ILFree), ::ILFree>;

    // The OS rejects relative paths here.
    [[nodiscard]] static HRESULT CreateFromPath(WideStr path, std::optional<ItemIdList>& out) noexcept;

    ItemIdList(ItemIdList&&) noexcept            = default;
    ItemIdList& operator=(ItemIdList&&) noexcept = default;

    [[nodiscard]] PCIDLIST_ABSOLUTE Get() const noexcept
    {
        return _pidl.get();
    }

private:
    explicit ItemIdList(Storage pidl) noexcept : _pidl(std::move(pidl))
    {
    }

    Storage _pidl;
};

class ShellItem
{
public:
    explicit ShellItem(ExternalHandle<IShellItem> handle) noexcept : _handle(std::move(handle))
    {
    }

    ShellItem(ShellItem&&) noexcept            = default;
    ShellItem& operator=(ShellItem&&) noexcept = default;

    // Resolves `path` against the current directory first, so relative paths are accepted.
    // A path holding a zero code unit fails with WIDESHELL_E_INTERIOR_NUL.
    [[nodiscard]] static HRESULT FromPath(const std::filesystem::path& path, std::optional<ShellItem>& out);
    [[nodiscard]] static HRESULT FromParsingName(WideStr parsingName, std::optional<ShellItem>& out) noexcept;
    [[nodiscard]] static HRESULT FromIdList(const ItemIdList& idList, std::optional<ShellItem>& out) noexcept;

    [[nodiscard]] HRESULT GetDisplayName(DisplayNameType type, CoTaskMemWideString& out) const noexcept;

    [[nodiscard]] ExternalHandle<IShellItem>& Handle() noexcept
    {
        return _handle;
    }

    [[nodiscard]] const ExternalHandle<IShellItem>& Handle() const noexcept
    {
        return _handle;
    }

private:
    ExternalHandle<IShellItem> _handle;
};
} // namespace WideShell
