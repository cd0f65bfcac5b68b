#pragma once

#include <exception>
#include <string_view>

#include "Helpers.h"

// A broken contract (a foreign call that reported success but handed back garbage, or a caller that indexed
// past the end of a string) leaves no state worth recovering. Log it and fail fast so the crash pipeline
// captures a dump at the point of detection.
namespace WideShell::Contract
{
[[noreturn]] inline void Violation(std::wstring_view message) noexcept
{
    Debug::Error(L"WideShell contract violation: {}", message);
#ifdef _DEBUG
    if (IsDebuggerPresent())
    {
        DebugBreak();
    }
#endif
    std::terminate();
}

inline void Check(bool condition, std::wstring_view message) noexcept
{
    if (! condition)
    {
        Violation(message);
    }
}
} // namespace WideShell::Contract
