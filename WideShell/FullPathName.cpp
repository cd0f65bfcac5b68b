#include <algorithm>
#include <format>

#include "Contract.h"
#include "FullPathName.h"

#include "Helpers.h"

namespace WideShell
{
HRESULT ResolveFullPathName(WideStr input, FullPathName& out)
{
    return ResolveFullPathName(input, out, [](PCWSTR fileName, DWORD bufferLength, PWSTR buffer, PWSTR* filePart) noexcept
                               { return ::GetFullPathNameW(fileName, bufferLength, buffer, filePart); });
}

HRESULT ResolveFullPathName(WideStr input, FullPathName& out, const FullPathResolver& resolver)
{
    Debug::Perf::Scope perf(L"ResolveFullPathName");

    WideBuffer buffer(kInitialPathCapacity);
    uint64_t attempts = 0;

    for (;;)
    {
        ++attempts;

        PWSTR filePart       = nullptr;
        const DWORD capacity = static_cast<DWORD>(buffer.size());
        const DWORD result   = resolver(input.AsPtr(), capacity, buffer.data(), &filePart);
        if (result == 0)
        {
            const HRESULT hr = HResultFromLastError();
            Debug::Error(L"ResolveFullPathName: resolving {} failed: 0x{:08X}", input.ToDebugString(), static_cast<unsigned>(hr));
            perf.SetHr(hr);
            return hr;
        }

        if (result >= capacity)
        {
            // Too small; `result` is the size needed including the terminator.
            buffer.resize(std::max<size_t>(result, static_cast<size_t>(capacity) + 1u));
            continue;
        }

        const size_t written = result;

        // The file part is only trusted while this buffer is alive: turn it into an index right away.
        std::optional<size_t> fileNameOffset;
        if (filePart != nullptr)
        {
            const wchar_t* const first = buffer.data();
            const bool inside          = filePart >= first && filePart <= first + written;
            Contract::Check(inside, L"GetFullPathNameW returned a file part outside of the output buffer");
            fileNameOffset = static_cast<size_t>(filePart - first);
        }

        buffer.resize(written + 1u);
        FromVecWithNulError error;
        WideString path;
        if (FAILED(WideString::FromVecWithNul(std::move(buffer), path, &error)))
        {
            Contract::Violation(std::format(L"GetFullPathNameW returned an invalid buffer: {}", error.Message()));
        }

        out.path           = std::move(path);
        out.fileNameOffset = fileNameOffset;

        perf.SetValue(attempts);
        if (attempts > 1)
        {
            Debug::Info(L"ResolveFullPathName: {} needed {} attempts", out.path.ToDebugString(), attempts);
        }
        return S_OK;
    }
}
} // namespace WideShell
