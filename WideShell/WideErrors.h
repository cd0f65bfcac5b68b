#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>

#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>

#include "IntoWide.h"

// Validation failures surfaced through HRESULT-returning plumbing (FACILITY_ITF, customer range).
#define WIDESHELL_E_INTERIOR_NUL _HRESULT_TYPEDEF_(0x80040201L)
#define WIDESHELL_E_NOT_NUL_TERMINATED _HRESULT_TYPEDEF_(0x80040202L)

namespace WideShell
{
// A zero code unit was found while building a WideString from arbitrary data.
// Carries the rejected data exactly as it was handed in, without a terminator appended.
class NulError
{
public:
    NulError() = default;
    NulError(size_t position, WideBuffer data) noexcept : _position(position), _data(std::move(data))
    {
    }

    [[nodiscard]] size_t Position() const noexcept
    {
        return _position;
    }

    [[nodiscard]] const WideBuffer& Data() const noexcept
    {
        return _data;
    }

    // Hands the rejected data back to the caller.
    [[nodiscard]] WideBuffer IntoVec() && noexcept
    {
        return std::move(_data);
    }

    [[nodiscard]] std::wstring Message() const;

    bool operator==(const NulError&) const = default;

private:
    size_t _position = 0;
    WideBuffer _data;
};

enum class FromVecWithNulErrorKind : uint8_t
{
    InteriorNul,
    NotNulTerminated,
};

// A buffer that was supposed to be terminated already failed validation.
class FromVecWithNulError
{
public:
    FromVecWithNulError() = default;
    FromVecWithNulError(FromVecWithNulErrorKind kind, size_t position, WideBuffer data) noexcept
        : _kind(kind),
          _position(position),
          _data(std::move(data))
    {
    }

    [[nodiscard]] FromVecWithNulErrorKind Kind() const noexcept
    {
        return _kind;
    }

    // Position of the interior NUL. Meaningless for NotNulTerminated.
    [[nodiscard]] size_t Position() const noexcept
    {
        return _position;
    }

    [[nodiscard]] const WideBuffer& Data() const noexcept
    {
        return _data;
    }

    [[nodiscard]] WideBuffer IntoVec() && noexcept
    {
        return std::move(_data);
    }

    [[nodiscard]] HRESULT ToHResult() const noexcept
    {
        return _kind == FromVecWithNulErrorKind::InteriorNul ? WIDESHELL_E_INTERIOR_NUL : WIDESHELL_E_NOT_NUL_TERMINATED;
    }

    [[nodiscard]] std::wstring Message() const;

    bool operator==(const FromVecWithNulError&) const = default;

private:
    FromVecWithNulErrorKind _kind = FromVecWithNulErrorKind::NotNulTerminated;
    size_t _position              = 0;
    WideBuffer _data;
};

// Maps a Win32 error code to an HRESULT. A zero code means the failing API did not set one.
[[nodiscard]] inline HRESULT Win32ErrorToHResult(DWORD error) noexcept
{
    return error == ERROR_SUCCESS ? E_FAIL : HRESULT_FROM_WIN32(error);
}

[[nodiscard]] inline HRESULT HResultFromLastError() noexcept
{
    return Win32ErrorToHResult(::GetLastError());
}

// Text for the library's own HRESULTs; empty for anything else.
[[nodiscard]] const wchar_t* DescribeWideShellError(HRESULT hr) noexcept;
} // namespace WideShell
