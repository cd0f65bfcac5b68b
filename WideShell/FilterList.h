#pragma once

#include <cstddef>
#include <format>
#include <utility>
#include <vector>

#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>

#include <shtypes.h>

#include "Contract.h"
#include "WideString.h"

namespace WideShell
{
// File-type filters for a file dialog.
// Owns every (name, pattern) pair and exports a COMDLG_FILTERSPEC array whose pointers reference that storage.
// Append-only: a descriptor keeps pointing at the pair it was created for for the lifetime of the list.
class FilterList
{
public:
    FilterList() = default;

    explicit FilterList(size_t capacity)
    {
        Reserve(capacity);
    }

    // A copy would export pointers into the source's strings.
    FilterList(const FilterList&)            = delete;
    FilterList& operator=(const FilterList&) = delete;

    // Moving keeps the heap buffers of every stored string, so the descriptors stay valid.
    FilterList(FilterList&&) noexcept            = default;
    FilterList& operator=(FilterList&&) noexcept = default;

    // Both arguments go through IntoWide. A zero code unit in either one is a programming error.
    template <typename Name, typename Pattern> void AddFilter(Name&& name, Pattern&& pattern)
    {
        NulError error;
        WideString ownedName;
        if (FAILED(WideString::Create(std::forward<Name>(name), ownedName, &error)))
        {
            Contract::Violation(std::format(L"filter name: {}", error.Message()));
        }

        WideString ownedPattern;
        if (FAILED(WideString::Create(std::forward<Pattern>(pattern), ownedPattern, &error)))
        {
            Contract::Violation(std::format(L"filter pattern: {}", error.Message()));
        }

        AddFilter(std::move(ownedName), std::move(ownedPattern));
    }

    void AddFilter(WideString name, WideString pattern);

    void Reserve(size_t capacity);

    [[nodiscard]] size_t Size() const noexcept
    {
        return _specs.size();
    }

    [[nodiscard]] bool Empty() const noexcept
    {
        return _specs.empty();
    }

    // Descriptor array for IFileDialog::SetFileTypes; Size() entries.
    [[nodiscard]] const COMDLG_FILTERSPEC* Data() const noexcept
    {
        return _specs.data();
    }

    [[nodiscard]] WideStr Name(size_t index) const noexcept;
    [[nodiscard]] WideStr Pattern(size_t index) const noexcept;

private:
    std::vector<std::pair<WideString, WideString>> _storage;
    std::vector<COMDLG_FILTERSPEC> _specs;
};
} // namespace WideShell
