#pragma once

#include <cstddef>
#include <functional>
#include <optional>

#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>

#include "WideString.h"

namespace WideShell
{
// Buffer size for the first resolution attempt, in code units.
inline constexpr DWORD kInitialPathCapacity = MAX_PATH;

// Same contract as GetFullPathNameW: 0 on failure (details in GetLastError()), the required size including the
// terminator when `bufferLength` is too small, otherwise the number of units written without the terminator.
using FullPathResolver = std::function<DWORD(PCWSTR fileName, DWORD bufferLength, PWSTR buffer, PWSTR* filePart)>;

struct FullPathName
{
    WideString path;

    // Index of the first code unit of the file name inside `path`, when the path names a file.
    std::optional<size_t> fileNameOffset;

    // The file name part, terminator included. Empty when there is no file name.
    [[nodiscard]] WideStr FileName() const noexcept
    {
        return fileNameOffset.has_value() ? path.Suffix(fileNameOffset.value()) : path.Suffix(path.Size());
    }
};

// Resolves `input` to an absolute path, growing the buffer to whatever size the resolver asks for until one call fits.
[[nodiscard]] HRESULT ResolveFullPathName(WideStr input, FullPathName& out);
[[nodiscard]] HRESULT ResolveFullPathName(WideStr input, FullPathName& out, const FullPathResolver& resolver);
} // namespace WideShell
