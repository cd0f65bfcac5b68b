#include <format>

#include "WideErrors.h"

namespace WideShell
{
std::wstring NulError::Message() const
{
    return std::format(L"nul wide char found in provided data at position: {}", _position);
}

std::wstring FromVecWithNulError::Message() const
{
    if (_kind == FromVecWithNulErrorKind::InteriorNul)
    {
        return std::format(L"data provided contains an interior nul wide char at pos {}", _position);
    }
    return L"data provided is not nul terminated";
}

const wchar_t* DescribeWideShellError(HRESULT hr) noexcept
{
    switch (hr)
    {
        case WIDESHELL_E_INTERIOR_NUL: return L"A string contained an interior NUL";
        case WIDESHELL_E_NOT_NUL_TERMINATED: return L"A buffer was not NUL terminated";
        default: return L"";
    }
}
} // namespace WideShell
