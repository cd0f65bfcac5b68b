#include <array>
#include <cwchar>
#include <utility>

#include "Contract.h"
#include "FullPathName.h"
#include "ShellItem.h"

#include "Helpers.h"

namespace WideShell
{
namespace
{
struct DisplayNameEntry
{
    DisplayNameType type;
    SIGDN sigdn;
    const wchar_t* name;
};

constexpr std::array<DisplayNameEntry, 10> kDisplayNames = {{
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
}};

const DisplayNameEntry& Lookup(DisplayNameType type) noexcept
{
    const size_t index = static_cast<size_t>(type);
    Contract::Check(index < kDisplayNames.size(), L"unknown DisplayNameType");
    return kDisplayNames[index];
}
} // namespace

SIGDN ToSigdn(DisplayNameType type) noexcept
{
    return Lookup(type).sigdn;
}

const wchar_t* DisplayNameTypeName(DisplayNameType type) noexcept
{
    return Lookup(type).name;
}

bool TryParseDisplayNameType(std::wstring_view text, DisplayNameType& out) noexcept
{
    for (const DisplayNameEntry& entry : kDisplayNames)
    {
        if (text == entry.name)
        {
            out = entry.type;
            return true;
        }
    }
    return false;
}

CoTaskMemWideString::CoTaskMemWideString(wil::unique_cotaskmem_string text) noexcept : _text(std::move(text))
{
    Contract::Check(static_cast<bool>(_text), L"CoTaskMemWideString built from a null string");
    _size = std::wcslen(_text.get());
}

WideStr CoTaskMemWideString::AsWideStr() const noexcept
{
    Contract::Check(IsValid(), L"CoTaskMemWideString read while empty");
    return WideStr::FromWideWithNulUnchecked(_text.get(), _size + 1u);
}

std::filesystem::path CoTaskMemWideString::ToPath() const
{
    return std::filesystem::path(AsWideStr().AsSlice());
}

HRESULT ItemIdList::CreateFromPath(WideStr path, std::optional<ItemIdList>& out) noexcept
{
    out.reset();

    Storage pidl(::ILCreateFromPathW(path.AsPtr()));
    if (! pidl)
    {
        const HRESULT hr = HResultFromLastError();
        Debug::Warning(L"ILCreateFromPathW({}) failed: 0x{:08X}", path.AsSlice(), static_cast<unsigned>(hr));
        return hr;
    }

    out.emplace(ItemIdList(std::move(pidl)));
    return S_OK;
}

HRESULT ShellItem::FromPath(const std::filesystem::path& path, std::optional<ShellItem>& out)
{
    out.reset();

    NulError error;
    WideString input;
    HRESULT hr = WideString::Create(path, input, &error);
    if (FAILED(hr))
    {
        Debug::Error(L"ShellItem::FromPath: {}", error.Message());
        return hr;
    }

    FullPathName resolved;
    hr = ResolveFullPathName(input, resolved);
    if (FAILED(hr))
    {
        return hr;
    }

    return FromParsingName(resolved.path, out);
}

HRESULT ShellItem::FromParsingName(WideStr parsingName, std::optional<ShellItem>& out) noexcept
{
    out.reset();

    IShellItem* raw  = nullptr;
    const HRESULT hr = ::SHCreateItemFromParsingName(parsingName.AsPtr(), nullptr, IID_PPV_ARGS(&raw));
    if (FAILED(hr))
    {
        Debug::Warning(L"SHCreateItemFromParsingName({}) failed: 0x{:08X}", parsingName.AsSlice(), static_cast<unsigned>(hr));
        return hr;
    }

    out.emplace(ExternalHandle<IShellItem>::Adopt(raw));
    return S_OK;
}

HRESULT ShellItem::FromIdList(const ItemIdList& idList, std::optional<ShellItem>& out) noexcept
{
    out.reset();

    IShellItem* raw  = nullptr;
    const HRESULT hr = ::SHCreateItemFromIDList(idList.Get(), IID_PPV_ARGS(&raw));
    if (FAILED(hr))
    {
        Debug::Warning(L"SHCreateItemFromIDList failed: 0x{:08X}", static_cast<unsigned>(hr));
        return hr;
    }

    out.emplace(ExternalHandle<IShellItem>::Adopt(raw));
    return S_OK;
}

HRESULT ShellItem::GetDisplayName(DisplayNameType type, CoTaskMemWideString& out) const noexcept
{
    wil::unique_cotaskmem_string text;
    const HRESULT hr = _handle->GetDisplayName(ToSigdn(type), text.put());
    if (FAILED(hr))
    {
        Debug::Warning(L"IShellItem::GetDisplayName({}) failed: 0x{:08X}", DisplayNameTypeName(type), static_cast<unsigned>(hr));
        return hr;
    }

    Contract::Check(static_cast<bool>(text), L"IShellItem::GetDisplayName succeeded without a string");
    out = CoTaskMemWideString(std::move(text));
    return S_OK;
}
} // namespace WideShell
