#pragma once

#include <cstddef>
#include <functional>
#include <iterator>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>

#include "IntoWide.h"
#include "WideErrors.h"

namespace WideShell
{
inline constexpr char32_t kReplacementCharacter = U'\xFFFD';

// Result of decoding one logical character: a Unicode scalar value, or the unpaired surrogate that stopped it.
class DecodedChar
{
public:
    [[nodiscard]] static constexpr DecodedChar Scalar(char32_t value) noexcept
    {
        return DecodedChar(value, 0);
    }

    [[nodiscard]] static constexpr DecodedChar Unpaired(wchar_t surrogate) noexcept
    {
        return DecodedChar(0, surrogate);
    }

    [[nodiscard]] constexpr bool IsValid() const noexcept
    {
        return _unpaired == 0;
    }

    // Only meaningful when IsValid().
    [[nodiscard]] constexpr char32_t Value() const noexcept
    {
        return _value;
    }

    // Only meaningful when ! IsValid().
    [[nodiscard]] constexpr wchar_t UnpairedSurrogate() const noexcept
    {
        return _unpaired;
    }

    [[nodiscard]] constexpr char32_t ValueOr(char32_t replacement = kReplacementCharacter) const noexcept
    {
        return IsValid() ? _value : replacement;
    }

    constexpr bool operator==(const DecodedChar&) const noexcept = default;

private:
    constexpr DecodedChar(char32_t value, wchar_t unpaired) noexcept : _value(value), _unpaired(unpaired)
    {
    }

    char32_t _value   = 0;
    wchar_t _unpaired = 0;
};

// Lazy UTF-16 decoder over a code-unit range. Iterating again starts over from the first unit.
class Utf16Chars
{
public:
    class Iterator
    {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type        = DecodedChar;
        using difference_type   = std::ptrdiff_t;
        using pointer           = const DecodedChar*;
        using reference         = const DecodedChar&;

        Iterator() noexcept = default;
        Iterator(const wchar_t* position, const wchar_t* end) noexcept;

        reference operator*() const noexcept
        {
            return _current;
        }

        pointer operator->() const noexcept
        {
            return &_current;
        }

        Iterator& operator++() noexcept;
        Iterator operator++(int) noexcept
        {
            Iterator previous = *this;
            ++*this;
            return previous;
        }

        bool operator==(const Iterator& other) const noexcept
        {
            return _position == other._position;
        }

    private:
        void Decode() noexcept;

        const wchar_t* _position = nullptr;
        const wchar_t* _end      = nullptr;
        size_t _width            = 0;
        DecodedChar _current     = DecodedChar::Scalar(0);
    };

    explicit Utf16Chars(std::wstring_view units) noexcept : _units(units)
    {
    }

    [[nodiscard]] Iterator begin() const noexcept
    {
        return Iterator(_units.data(), _units.data() + _units.size());
    }

    [[nodiscard]] Iterator end() const noexcept
    {
        const wchar_t* last = _units.data() + _units.size();
        return Iterator(last, last);
    }

private:
    std::wstring_view _units;
};

class WideString;

// Borrowed view over code units whose only zero is the last one.
// The pointer from AsPtr() is valid for as long as the owner of the viewed storage.
class WideStr
{
public:
    // The caller guarantees that data[lenWithNul - 1] == 0 and that no earlier unit is zero.
    [[nodiscard]] static WideStr FromWideWithNulUnchecked(const wchar_t* data, size_t lenWithNul) noexcept
    {
        return WideStr(data, lenWithNul);
    }

    [[nodiscard]] static WideStr FromWideWithNulUnchecked(std::span<const wchar_t> data) noexcept
    {
        return WideStr(data.data(), data.size());
    }

    [[nodiscard]] PCWSTR AsPtr() const noexcept
    {
        return _data;
    }

    [[nodiscard]] PCWSTR c_str() const noexcept
    {
        return _data;
    }

    // Without the terminator.
    [[nodiscard]] std::wstring_view AsSlice() const noexcept
    {
        return std::wstring_view(_data, _lenWithNul - 1u);
    }

    // Including the terminator.
    [[nodiscard]] std::span<const wchar_t> AsSliceWithNul() const noexcept
    {
        return std::span<const wchar_t>(_data, _lenWithNul);
    }

    [[nodiscard]] size_t Size() const noexcept
    {
        return _lenWithNul - 1u;
    }

    [[nodiscard]] size_t SizeWithNul() const noexcept
    {
        return _lenWithNul;
    }

    [[nodiscard]] bool Empty() const noexcept
    {
        return _lenWithNul == 1u;
    }

    [[nodiscard]] Utf16Chars Chars() const noexcept
    {
        return Utf16Chars(AsSlice());
    }

    // View of the units from `offset` on, terminator included.
    // `offset` must be below SizeWithNul(); anything else is a fatal contract violation.
    [[nodiscard]] WideStr Suffix(size_t offset) const noexcept;

    [[nodiscard]] WideString ToOwned() const;

    // Lossy: unpaired surrogates become U+FFFD. More than INT_MAX code units is a fatal contract violation.
    [[nodiscard]] std::string ToUtf8() const;

    // Quoted and escaped, for log output.
    [[nodiscard]] std::wstring ToDebugString() const;

    friend bool operator==(WideStr a, WideStr b) noexcept
    {
        return a.AsSlice() == b.AsSlice();
    }

    friend bool operator<(WideStr a, WideStr b) noexcept
    {
        return a.AsSlice() < b.AsSlice();
    }

private:
    WideStr(const wchar_t* data, size_t lenWithNul) noexcept : _data(data), _lenWithNul(lenWithNul)
    {
    }

    const wchar_t* _data = nullptr;
    size_t _lenWithNul   = 0;
};

// Owned, immutable, NUL-terminated wide string with no interior NUL.
class WideString
{
public:
    // The empty string.
    WideString();

    WideString(const WideString&)            = default;
    WideString& operator=(const WideString&) = default;
    WideString(WideString&&) noexcept        = default;
    WideString& operator=(WideString&&) noexcept = default;

    // Builds from any input IntoWide accepts. Fails with WIDESHELL_E_INTERIOR_NUL if the converted data holds a zero;
    // `error` then receives the position and the converted data, untouched.
    template <typename Input> [[nodiscard]] static HRESULT Create(Input&& input, WideString& out, NulError* error = nullptr)
    {
        return CreateFromBuffer(IntoWide(std::forward<Input>(input)), out, error);
    }

    // Validates a buffer that should already end with its only terminator.
    [[nodiscard]] static HRESULT FromVecWithNul(WideBuffer data, WideString& out, FromVecWithNulError* error = nullptr) noexcept;

    // The caller guarantees that data ends with the only zero it contains.
    [[nodiscard]] static WideString FromVecWithNulUnchecked(WideBuffer data) noexcept;

    [[nodiscard]] WideStr AsWideStr() const noexcept;

    operator WideStr() const noexcept
    {
        return AsWideStr();
    }

    [[nodiscard]] PCWSTR AsPtr() const noexcept
    {
        return AsWideStr().AsPtr();
    }

    [[nodiscard]] PCWSTR c_str() const noexcept
    {
        return AsWideStr().AsPtr();
    }

    [[nodiscard]] std::wstring_view AsSlice() const noexcept
    {
        return AsWideStr().AsSlice();
    }

    [[nodiscard]] std::span<const wchar_t> AsSliceWithNul() const noexcept
    {
        return AsWideStr().AsSliceWithNul();
    }

    [[nodiscard]] size_t Size() const noexcept
    {
        return AsWideStr().Size();
    }

    [[nodiscard]] bool Empty() const noexcept
    {
        return AsWideStr().Empty();
    }

    [[nodiscard]] Utf16Chars Chars() const noexcept
    {
        return AsWideStr().Chars();
    }

    [[nodiscard]] WideStr Suffix(size_t offset) const noexcept
    {
        return AsWideStr().Suffix(offset);
    }

    [[nodiscard]] std::string ToUtf8() const
    {
        return AsWideStr().ToUtf8();
    }

    [[nodiscard]] std::wstring ToDebugString() const
    {
        return AsWideStr().ToDebugString();
    }

    // Gives back the storage, terminator included.
    [[nodiscard]] WideBuffer IntoVecWithNul() &&;

    friend bool operator==(const WideString& a, const WideString& b) noexcept
    {
        return a.AsSlice() == b.AsSlice();
    }

    friend bool operator<(const WideString& a, const WideString& b) noexcept
    {
        return a.AsSlice() < b.AsSlice();
    }

private:
    explicit WideString(WideBuffer data) noexcept : _data(std::move(data))
    {
    }

    [[nodiscard]] static HRESULT CreateFromBuffer(WideBuffer data, WideString& out, NulError* error);

    // Empty only after a move; read as the empty string.
    WideBuffer _data;
};
} // namespace WideShell

template <> struct std::hash<WideShell::WideStr>
{
    size_t operator()(WideShell::WideStr value) const noexcept
    {
        return std::hash<std::wstring_view>{}(value.AsSlice());
    }
};

template <> struct std::hash<WideShell::WideString>
{
    size_t operator()(const WideShell::WideString& value) const noexcept
    {
        return std::hash<std::wstring_view>{}(value.AsSlice());
    }
};
