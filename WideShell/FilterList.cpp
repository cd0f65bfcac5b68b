#include "FilterList.h"

namespace WideShell
{
void FilterList::AddFilter(WideString name, WideString pattern)
{
    // Reserve both first so a failed allocation cannot leave the vectors out of step.
    _storage.reserve(_storage.size() + 1u);
    _specs.reserve(_specs.size() + 1u);

    _storage.emplace_back(std::move(name), std::move(pattern));

    // Reallocating _storage moves the strings but not their buffers, so earlier descriptors are still good.
    const auto& stored = _storage.back();
    _specs.push_back(COMDLG_FILTERSPEC{stored.first.AsPtr(), stored.second.AsPtr()});
}

void FilterList::Reserve(size_t capacity)
{
    _storage.reserve(capacity);
    _specs.reserve(capacity);
}

WideStr FilterList::Name(size_t index) const noexcept
{
    Contract::Check(index < _storage.size(), L"FilterList::Name index out of range");
    return _storage[index].first.AsWideStr();
}

WideStr FilterList::Pattern(size_t index) const noexcept
{
    Contract::Check(index < _storage.size(), L"FilterList::Pattern index out of range");
    return _storage[index].second.AsWideStr();
}
} // namespace WideShell
