#include <algorithm>
#include <format>
#include <limits>

#include "Contract.h"
#include "WideString.h"

#include "Helpers.h"

namespace WideShell
{
namespace
{
constexpr bool IsHighSurrogate(wchar_t unit) noexcept
{
    return unit >= 0xD800 && unit <= 0xDBFF;
}

constexpr bool IsLowSurrogate(wchar_t unit) noexcept
{
    return unit >= 0xDC00 && unit <= 0xDFFF;
}

void AppendScalar(std::wstring& out, char32_t scalar)
{
    if (scalar < 0x10000u)
    {
        out.push_back(static_cast<wchar_t>(scalar));
        return;
    }

    const char32_t offset = scalar - 0x10000u;
    out.push_back(static_cast<wchar_t>(0xD800u + (offset >> 10)));
    out.push_back(static_cast<wchar_t>(0xDC00u + (offset & 0x3FFu)));
}

void AppendEscaped(std::wstring& out, char32_t scalar)
{
    switch (scalar)
    {
        case U'"': out.append(L"\\\""); return;
        case U'\\': out.append(L"\\\\"); return;
        case U'\n': out.append(L"\\n"); return;
        case U'\r': out.append(L"\\r"); return;
        case U'\t': out.append(L"\\t"); return;
        case U'\0': out.append(L"\\0"); return;
        default: break;
    }

    if (scalar < 0x20u || scalar == 0x7Fu)
    {
        out.append(std::format(L"\\u{{{:x}}}", static_cast<uint32_t>(scalar)));
        return;
    }

    AppendScalar(out, scalar);
}
} // namespace

Utf16Chars::Iterator::Iterator(const wchar_t* position, const wchar_t* end) noexcept : _position(position), _end(end)
{
    Decode();
}

Utf16Chars::Iterator& Utf16Chars::Iterator::operator++() noexcept
{
    _position += _width;
    Decode();
    return *this;
}

void Utf16Chars::Iterator::Decode() noexcept
{
    if (_position == _end)
    {
        _width   = 0;
        _current = DecodedChar::Scalar(0);
        return;
    }

    const wchar_t lead = *_position;
    if (IsHighSurrogate(lead))
    {
        if ((_position + 1) != _end && IsLowSurrogate(_position[1]))
        {
            const char32_t high = static_cast<char32_t>(lead) - 0xD800u;
            const char32_t low  = static_cast<char32_t>(_position[1]) - 0xDC00u;
            _current            = DecodedChar::Scalar(0x10000u + ((high << 10) | low));
            _width              = 2;
            return;
        }

        _current = DecodedChar::Unpaired(lead);
        _width   = 1;
        return;
    }

    if (IsLowSurrogate(lead))
    {
        _current = DecodedChar::Unpaired(lead);
        _width   = 1;
        return;
    }

    _current = DecodedChar::Scalar(static_cast<char32_t>(lead));
    _width   = 1;
}

WideStr WideStr::Suffix(size_t offset) const noexcept
{
    if (offset >= _lenWithNul)
    {
        Contract::Violation(std::format(L"index out of bounds: the len is {} but the index is {}", _lenWithNul, offset));
    }

    return WideStr(_data + offset, _lenWithNul - offset);
}

WideString WideStr::ToOwned() const
{
    WideBuffer data;
    data.reserve(_lenWithNul);
    data.assign(_data, _data + _lenWithNul);
    return WideString::FromVecWithNulUnchecked(std::move(data));
}

std::string WideStr::ToUtf8() const
{
    const std::wstring_view text = AsSlice();
    if (text.empty())
    {
        return {};
    }

    if (text.size() > static_cast<size_t>((std::numeric_limits<int>::max)()))
    {
        Contract::Violation(std::format(L"WideStr::ToUtf8: {} code units exceed a single WideCharToMultiByte call", text.size()));
    }

    // No WC_ERR_INVALID_CHARS: unpaired surrogates are replaced instead of failing the whole string.
    const int inputLength = static_cast<int>(text.size());
    const int required    = WideCharToMultiByte(CP_UTF8, 0, text.data(), inputLength, nullptr, 0, nullptr, nullptr);
    if (required <= 0)
    {
        const DWORD lastError = Debug::ErrorWithLastError(L"WideStr::ToUtf8: WideCharToMultiByte failed to size {} code units", text.size());
        Contract::Violation(std::format(L"WideStr::ToUtf8: WideCharToMultiByte sizing failed (error {})", lastError));
    }

    std::string result(static_cast<size_t>(required), '\0');
    const int written = WideCharToMultiByte(CP_UTF8, 0, text.data(), inputLength, result.data(), required, nullptr, nullptr);
    if (written != required)
    {
        const DWORD lastError = Debug::ErrorWithLastError(L"WideStr::ToUtf8: WideCharToMultiByte wrote {} of {} bytes", written, required);
        Contract::Violation(std::format(L"WideStr::ToUtf8: WideCharToMultiByte conversion failed (error {})", lastError));
    }

    return result;
}

std::wstring WideStr::ToDebugString() const
{
    std::wstring result;
    result.reserve(_lenWithNul + 2u);
    result.push_back(L'"');
    for (const DecodedChar& ch : Chars())
    {
        AppendEscaped(result, ch.ValueOr());
    }
    result.push_back(L'"');
    return result;
}

WideString::WideString() : _data{L'\0'}
{
}

HRESULT WideString::CreateFromBuffer(WideBuffer data, WideString& out, NulError* error)
{
    const auto nul = std::find(data.begin(), data.end(), L'\0');
    if (nul != data.end())
    {
        const size_t position = static_cast<size_t>(nul - data.begin());
        if (error)
        {
            *error = NulError(position, std::move(data));
        }
        return WIDESHELL_E_INTERIOR_NUL;
    }

    data.push_back(L'\0');
    out = WideString(std::move(data));
    return S_OK;
}

HRESULT WideString::FromVecWithNul(WideBuffer data, WideString& out, FromVecWithNulError* error) noexcept
{
    const auto nul = std::find(data.begin(), data.end(), L'\0');
    if (nul == data.end())
    {
        if (error)
        {
            *error = FromVecWithNulError(FromVecWithNulErrorKind::NotNulTerminated, 0, std::move(data));
        }
        return WIDESHELL_E_NOT_NUL_TERMINATED;
    }

    const size_t position = static_cast<size_t>(nul - data.begin());
    if (position != data.size() - 1u)
    {
        if (error)
        {
            *error = FromVecWithNulError(FromVecWithNulErrorKind::InteriorNul, position, std::move(data));
        }
        return WIDESHELL_E_INTERIOR_NUL;
    }

    out = WideString(std::move(data));
    return S_OK;
}

WideString WideString::FromVecWithNulUnchecked(WideBuffer data) noexcept
{
    return WideString(std::move(data));
}

WideStr WideString::AsWideStr() const noexcept
{
    if (_data.empty())
    {
        return WideStr::FromWideWithNulUnchecked(L"", 1u);
    }
    return WideStr::FromWideWithNulUnchecked(_data.data(), _data.size());
}

WideBuffer WideString::IntoVecWithNul() &&
{
    if (_data.empty())
    {
        return WideBuffer{L'\0'};
    }
    return std::move(_data);
}
} // namespace WideShell
