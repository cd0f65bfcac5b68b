#pragma once

#include <optional>

#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>

#include <combaseapi.h>

#include "ExternalHandle.h"

#include "Helpers.h"

namespace WideShell
{
// Keeps the process-wide multithreaded apartment alive for the rest of the process.
// Safe to call from anywhere, any number of times, concurrently: the MTA usage count is taken exactly once and
// every caller gets the HRESULT of that single attempt.
[[nodiscard]] HRESULT InitMtaComRuntime() noexcept;

// Instantiates `clsid` and wraps the interface pointer it returns.
template <typename Interface> [[nodiscard]] HRESULT CreateInstance(REFCLSID clsid, DWORD context, std::optional<ExternalHandle<Interface>>& out) noexcept
{
    out.reset();

    wil::com_ptr_nothrow<Interface> instance;
    const HRESULT hr = CoCreateInstance(clsid, nullptr, context, IID_PPV_ARGS(instance.put()));
    if (FAILED(hr))
    {
        Debug::Error(L"CoCreateInstance failed: 0x{:08X}", static_cast<unsigned>(hr));
        return hr;
    }

    out.emplace(ExternalHandle<Interface>::Adopt(instance.detach()));
    return S_OK;
}
} // namespace WideShell
