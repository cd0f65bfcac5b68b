#include <cwchar>
#include <format>
#include <limits>

#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>

#include "Contract.h"
#include "IntoWide.h"
#include "WideString.h"

#include "Helpers.h"

namespace WideShell
{
namespace
{
WideBuffer CopyWithSpare(std::wstring_view text)
{
    WideBuffer result;
    result.reserve(text.size() + 1u);
    result.assign(text.begin(), text.end());
    return result;
}
} // namespace

WideBuffer IntoWide(WideBuffer data)
{
    data.reserve(data.size() + 1u);
    return data;
}

WideBuffer IntoWide(std::wstring_view text)
{
    return CopyWithSpare(text);
}

WideBuffer IntoWide(const std::wstring& text)
{
    return CopyWithSpare(text);
}

WideBuffer IntoWide(const wchar_t* text)
{
    if (! text)
    {
        return CopyWithSpare({});
    }
    return CopyWithSpare(std::wstring_view(text, std::wcslen(text)));
}

WideBuffer IntoWide(const std::filesystem::path& path)
{
    return CopyWithSpare(path.native());
}

WideBuffer IntoWide(WideStr text)
{
    return CopyWithSpare(text.AsSlice());
}

WideBuffer IntoWide(std::string_view utf8)
{
    if (utf8.empty())
    {
        return CopyWithSpare({});
    }

    // The conversion is total; an input the API cannot take in one call is a caller bug, not data to drop.
    if (utf8.size() > static_cast<size_t>((std::numeric_limits<int>::max)()))
    {
        Contract::Violation(std::format(L"IntoWide: UTF-8 input of {} bytes exceeds a single MultiByteToWideChar call", utf8.size()));
    }

    // No MB_ERR_INVALID_CHARS: ill-formed input is replaced with U+FFFD instead of failing the conversion.
    const int inputLength = static_cast<int>(utf8.size());
    const int required    = MultiByteToWideChar(CP_UTF8, 0, utf8.data(), inputLength, nullptr, 0);
    if (required <= 0)
    {
        const DWORD lastError = Debug::ErrorWithLastError(L"IntoWide: MultiByteToWideChar failed to size {} bytes", utf8.size());
        Contract::Violation(std::format(L"IntoWide: MultiByteToWideChar sizing failed (error {})", lastError));
    }

    WideBuffer result(static_cast<size_t>(required));
    result.reserve(result.size() + 1u);
    const int written = MultiByteToWideChar(CP_UTF8, 0, utf8.data(), inputLength, result.data(), required);
    if (written != required)
    {
        const DWORD lastError = Debug::ErrorWithLastError(L"IntoWide: MultiByteToWideChar wrote {} of {} code units", written, required);
        Contract::Violation(std::format(L"IntoWide: MultiByteToWideChar conversion failed (error {})", lastError));
    }

    return result;
}

WideBuffer IntoWide(const std::string& utf8)
{
    return IntoWide(std::string_view(utf8));
}

WideBuffer IntoWide(const char* utf8)
{
    if (! utf8)
    {
        return CopyWithSpare({});
    }
    return IntoWide(std::string_view(utf8));
}
} // namespace WideShell
