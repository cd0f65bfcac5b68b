#include <string>
#include <utility>

#pragma warning(push)
// WIL: C4625 (copy ctor deleted), C4626 (copy assign deleted), C5026 (move ctor deleted), C5027 (move assign deleted)
#pragma warning(disable : 4625 4626 5026 5027)
#include <wil/resource.h>
#pragma warning(pop)

#pragma warning(push)
// (C6297) Arithmetic overflow. Results might not be an expected value.
// (C28182) Dereferencing NULL pointer.'cur_key->next' contains the same NULL value as 'removed_item' did..
#pragma warning(disable : 6297 28182)
#include <yyjson.h>
#pragma warning(pop)

#include "DialogSettings.h"
#include "IntoWide.h"

#include "Helpers.h"

namespace WideShell
{
namespace
{
std::wstring WideFromUtf8(std::string_view text)
{
    const WideBuffer units = IntoWide(text);
    return std::wstring(units.begin(), units.end());
}

// Blank input is rejected before yyjson sees it.
std::wstring_view DescribeJsonReadError(yyjson_read_code code) noexcept
{
    switch (code)
    {
        case YYJSON_READ_ERROR_MEMORY_ALLOCATION: return L"out of memory";
        case YYJSON_READ_ERROR_EMPTY_CONTENT: return L"only whitespace or comments";
        case YYJSON_READ_ERROR_UNEXPECTED_END: return L"document ends early";
        case YYJSON_READ_ERROR_UNEXPECTED_CONTENT: return L"content after the settings object";
        case YYJSON_READ_ERROR_INVALID_COMMENT: return L"unterminated comment";
        default: return L"syntax error";
    }
}

void LogJsonParseError(const yyjson_read_err& err) noexcept
{
    const std::wstring detail = err.msg ? WideFromUtf8(err.msg) : std::wstring{};
    Debug::Error(L"Dialog settings are not valid JSON5 at byte {}: {} ({})", err.pos, DescribeJsonReadError(static_cast<yyjson_read_code>(err.code)), detail);
}

using JsonTypeCheck = bool (*)(yyjson_val*);

// The member `key` of `obj` when it has the expected type. A missing member is silent; a member of another type
// is reported and treated as missing.
yyjson_val* TypedMember(yyjson_val* obj, const char* key, JsonTypeCheck isExpectedType, const wchar_t* typeName) noexcept
{
    yyjson_val* value = yyjson_obj_get(obj, key);
    if (value && ! isExpectedType(value))
    {
        Debug::Warning(L"Dialog settings: '{}' should be {}, ignoring it", WideFromUtf8(key), typeName);
        return nullptr;
    }
    return value;
}

std::optional<std::string_view> StringMember(yyjson_val* obj, const char* key) noexcept
{
    yyjson_val* value = TypedMember(obj, key, [](yyjson_val* v) noexcept { return yyjson_is_str(v); }, L"a string");
    if (! value)
    {
        return std::nullopt;
    }
    return std::string_view(yyjson_get_str(value), yyjson_get_len(value));
}

void ReadBoolMember(yyjson_val* obj, const char* key, bool& out) noexcept
{
    if (yyjson_val* value = TypedMember(obj, key, [](yyjson_val* v) noexcept { return yyjson_is_bool(v); }, L"a boolean"))
    {
        out = yyjson_get_bool(value);
    }
}

void ParseFilters(yyjson_val* arr, std::vector<DialogFilterSetting>& filters)
{
    size_t index    = 0;
    size_t maxIndex = 0;
    yyjson_val* item = nullptr;
    yyjson_arr_foreach(arr, index, maxIndex, item)
    {
        if (! yyjson_is_obj(item))
        {
            Debug::Warning(L"filters[{}] is not an object", index);
            continue;
        }

        const std::optional<std::string_view> name    = StringMember(item, "name");
        const std::optional<std::string_view> pattern = StringMember(item, "pattern");
        if (! name.has_value() || ! pattern.has_value())
        {
            Debug::Warning(L"filters[{}] needs both 'name' and 'pattern'", index);
            continue;
        }

        DialogFilterSetting filter{WideFromUtf8(name.value()), WideFromUtf8(pattern.value())};
        if (filter.name.find(L'\0') != std::wstring::npos || filter.pattern.find(L'\0') != std::wstring::npos)
        {
            Debug::Warning(L"filters[{}] contains a NUL character", index);
            continue;
        }

        filters.push_back(std::move(filter));
    }
}

template <typename Dialog> void ApplyToBuilder(const DialogSettings& settings, FileDialogBuilder<Dialog>& builder)
{
    if (settings.initCom)
    {
        builder.InitCom();
    }
    if (settings.defaultPath.has_value())
    {
        builder.DefaultPath(settings.defaultPath.value());
    }
    if (settings.path.has_value())
    {
        builder.Path(settings.path.value());
    }
    for (const DialogFilterSetting& filter : settings.filters)
    {
        builder.FileType(filter.name, filter.pattern);
    }
    if (settings.fileName.has_value())
    {
        builder.FileName(settings.fileName.value());
    }
    if (settings.title.has_value())
    {
        builder.Title(settings.title.value());
    }
    if (settings.pickFolders)
    {
        builder.PickFolders();
    }
}
} // namespace

const wchar_t* DialogKindName(DialogKind kind) noexcept
{
    switch (kind)
    {
        case DialogKind::Open: return L"open";
        case DialogKind::Save: return L"save";
    }
    return L"unknown";
}

HRESULT ParseDialogSettings(std::string_view json, DialogSettings& settings) noexcept
{
    if (json.find_first_not_of(" \t\r\n") == std::string_view::npos)
    {
        Debug::Error(L"Dialog settings are empty");
        return HRESULT_FROM_WIN32(ERROR_INVALID_DATA);
    }

    // yyjson_read_opts wants a mutable buffer.
    std::string mutableJson(json);

    yyjson_read_err err{};
    yyjson_doc* doc = yyjson_read_opts(mutableJson.data(), mutableJson.size(), YYJSON_READ_JSON5 | YYJSON_READ_ALLOW_BOM, nullptr, &err);
    if (! doc)
    {
        LogJsonParseError(err);
        if (err.code == YYJSON_READ_ERROR_MEMORY_ALLOCATION)
        {
            return E_OUTOFMEMORY;
        }
        return HRESULT_FROM_WIN32(ERROR_INVALID_DATA);
    }

    auto freeDoc = wil::scope_exit([&] { yyjson_doc_free(doc); });

    yyjson_val* root = yyjson_doc_get_root(doc);
    if (! root || ! yyjson_is_obj(root))
    {
        Debug::Error(L"Failed to parse dialog settings: expected object at root");
        return HRESULT_FROM_WIN32(ERROR_INVALID_DATA);
    }

    yyjson_val* schema = yyjson_obj_get(root, "schemaVersion");
    if (! schema || ! yyjson_is_int(schema) || yyjson_get_int(schema) != kDialogSettingsSchemaVersion)
    {
        Debug::Error(L"Unsupported schema version in dialog settings");
        return HRESULT_FROM_WIN32(ERROR_INVALID_DATA);
    }

    DialogSettings parsed = settings;

    if (const auto kind = StringMember(root, "kind"); kind.has_value())
    {
        if (kind.value() == "open")
        {
            parsed.kind = DialogKind::Open;
        }
        else if (kind.value() == "save")
        {
            parsed.kind = DialogKind::Save;
        }
        else
        {
            Debug::Warning(L"Unknown dialog kind '{}'", WideFromUtf8(kind.value()));
        }
    }

    ReadBoolMember(root, "initCom", parsed.initCom);
    ReadBoolMember(root, "pickFolders", parsed.pickFolders);

    if (const auto defaultPath = StringMember(root, "defaultPath"); defaultPath.has_value())
    {
        parsed.defaultPath = std::filesystem::path(WideFromUtf8(defaultPath.value()));
    }
    if (const auto path = StringMember(root, "path"); path.has_value())
    {
        parsed.path = std::filesystem::path(WideFromUtf8(path.value()));
    }
    if (const auto fileName = StringMember(root, "fileName"); fileName.has_value())
    {
        parsed.fileName = WideFromUtf8(fileName.value());
    }
    if (const auto title = StringMember(root, "title"); title.has_value())
    {
        parsed.title = WideFromUtf8(title.value());
    }
    if (const auto display = StringMember(root, "display"); display.has_value())
    {
        const std::wstring displayName = WideFromUtf8(display.value());
        if (! TryParseDisplayNameType(displayName, parsed.display))
        {
            Debug::Warning(L"Unknown display name type '{}'", displayName);
        }
    }

    if (yyjson_val* filters = TypedMember(root, "filters", [](yyjson_val* v) noexcept { return yyjson_is_arr(v); }, L"an array"))
    {
        parsed.filters.clear();
        ParseFilters(filters, parsed.filters);
    }

    settings = std::move(parsed);
    return S_OK;
}

HRESULT LoadDialogSettings(const std::filesystem::path& file, DialogSettings& settings) noexcept
{
    wil::unique_handle handle(
        CreateFileW(file.c_str(), GENERIC_READ, FILE_SHARE_READ | FILE_SHARE_WRITE | FILE_SHARE_DELETE, nullptr, OPEN_EXISTING, FILE_ATTRIBUTE_NORMAL, nullptr));
    if (! handle)
    {
        const DWORD lastError = GetLastError();
        if (lastError == ERROR_FILE_NOT_FOUND || lastError == ERROR_PATH_NOT_FOUND)
        {
            Debug::Info(L"No dialog settings at '{}', using defaults", file.c_str());
            return S_FALSE;
        }

        Debug::Error(L"Failed to open dialog settings '{}' (error {})", file.c_str(), lastError);
        return Win32ErrorToHResult(lastError);
    }

    LARGE_INTEGER size{};
    if (! GetFileSizeEx(handle.get(), &size))
    {
        auto lastError = Debug::ErrorWithLastError(L"Failed to get size of dialog settings '{}'", file.c_str());
        return Win32ErrorToHResult(lastError);
    }

    if (size.QuadPart < 0 || static_cast<uint64_t>(size.QuadPart) > kMaxDialogSettingsFileBytes)
    {
        Debug::Error(L"Dialog settings '{}' has invalid size {}", file.c_str(), size.QuadPart);
        return HRESULT_FROM_WIN32(ERROR_FILE_INVALID);
    }

    std::string bytes(static_cast<size_t>(size.QuadPart), '\0');
    DWORD read = 0;
    if (! bytes.empty() && ! ReadFile(handle.get(), bytes.data(), static_cast<DWORD>(bytes.size()), &read, nullptr))
    {
        auto lastError = Debug::ErrorWithLastError(L"Failed to read dialog settings '{}'", file.c_str());
        return Win32ErrorToHResult(lastError);
    }
    bytes.resize(read);

    const HRESULT hr = ParseDialogSettings(bytes, settings);
    if (FAILED(hr))
    {
        Debug::Error(L"Dialog settings '{}' rejected: 0x{:08X}", file.c_str(), static_cast<unsigned>(hr));
    }
    return hr;
}

void ApplyDialogSettings(const DialogSettings& settings, FileOpenDialogBuilder& builder)
{
    ApplyToBuilder(settings, builder);
}

void ApplyDialogSettings(const DialogSettings& settings, FileSaveDialogBuilder& builder)
{
    ApplyToBuilder(settings, builder);
}
} // namespace WideShell
