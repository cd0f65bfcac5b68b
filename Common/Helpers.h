#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <format>
#include <iterator>
#include <limits>
#include <mutex>
#include <new>
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

#include <evntrace.h>

#pragma warning(push)
// WIL and TraceLogging: C4625 (copy ctor deleted), C4626 (copy assign deleted), C5026 (move ctor deleted),
// C5027 (move assign deleted), C4820 (padding)
#pragma warning(disable : 4625 4626 5026 5027 4820)
#include <TraceLoggingProvider.h>
#include <wil/resource.h>
#pragma warning(pop)

#pragma warning(push)
#pragma warning(disable : 4514) // unreferenced inline function has been removed

//////////////////////////////////////////////////////////////////////////////////
// Logging
//
// Every message becomes a "WideShell" ETW event. Formatting is skipped entirely while no trace session listens,
// so logging on failure paths costs one provider check.
//
// Exactly one .cpp per module defines WIDESHELL_DEFINE_TRACE_PROVIDER before including this header; provider
// handles cannot be shared across module boundaries.
#if ! defined(WIDESHELL_DEFINE_TRACE_PROVIDER)
TRACELOGGING_DECLARE_PROVIDER(g_WideShellProvider);
#else
TRACELOGGING_DEFINE_PROVIDER(g_WideShellProvider,
                             "WideShell",
                             // {7d3a1f52-94c8-4e0b-b6a1-2f5c8e91d043}
                             (0x7d3a1f52, 0x94c8, 0x4e0b, 0xb6, 0xa1, 0x2f, 0x5c, 0x8e, 0x91, 0xd0, 0x43));
#endif

namespace Debug
{
// Carried as an event field; the ETW level of every event is TRACE_LEVEL_INFORMATION.
enum class Level : uint8_t
{
    Error   = 1,
    Warning = 2,
    Info    = 4,
};

namespace detail
{
inline constexpr ULONGLONG kMessageKeyword = 0x1;
inline constexpr ULONGLONG kPerfKeyword    = 0x2;

inline std::once_flag g_registerOnce;
inline std::atomic<bool> g_registered{false};

// Depth of the CallTracer scopes open on this thread.
inline thread_local int g_depth = 0;

inline bool ProviderEnabled(ULONGLONG keyword) noexcept
{
    std::call_once(g_registerOnce,
                   []() noexcept
                   {
                       const HRESULT hr = TraceLoggingRegister(g_WideShellProvider);
                       g_registered.store(SUCCEEDED(hr), std::memory_order_release);
#ifdef _DEBUG
                       if (FAILED(hr))
                       {
                           OutputDebugStringW(L"WideShell: TraceLoggingRegister failed\n");
                       }
#endif
                   });

    if (! g_registered.load(std::memory_order_acquire))
    {
        return false;
    }
    return TraceLoggingProviderEnabled(g_WideShellProvider, TRACE_LEVEL_INFORMATION, keyword) != 0;
}

inline USHORT CountedLength(std::wstring_view text) noexcept
{
    return static_cast<USHORT>(std::min<size_t>(text.size(), (std::numeric_limits<USHORT>::max)()));
}

inline void Publish(Level level, std::wstring_view message) noexcept
{
    TraceLoggingWrite(g_WideShellProvider,
                      "Message",
                      TraceLoggingLevel(TRACE_LEVEL_INFORMATION),
                      TraceLoggingKeyword(kMessageKeyword),
                      TraceLoggingUInt8(static_cast<UINT8>(level), "Level"),
                      TraceLoggingUInt32(GetCurrentThreadId(), "ThreadId"),
                      TraceLoggingInt32(g_depth, "Depth"),
                      TraceLoggingCountedWideString(message.data(), CountedLength(message), "Message"));

#ifdef _DEBUG
    if (level == Level::Error)
    {
        OutputDebugStringW(std::wstring(message).append(L"\n").c_str());
    }
#endif
}

template <typename... Args> void Format(Level level, std::wformat_string<Args...> format, Args&&... args) noexcept
{
    if (! ProviderEnabled(kMessageKeyword))
    {
        return;
    }

    // noexcept boundary: a bad format string must not take the caller down.
    try
    {
        std::wstring message(static_cast<size_t>(std::max(g_depth, 0)) * 2u, L' ');
        std::format_to(std::back_inserter(message), format, std::forward<Args>(args)...);
        Publish(level, message);
    }
    catch (const std::bad_alloc&)
    {
        // Out-of-memory is fatal.
        std::terminate();
    }
    catch (const std::exception&)
    {
        Publish(level, L"[unformattable log message]");
    }
}
} // namespace detail

// System text for a Win32 error code or an HRESULT, without the trailing line break. Empty when the system has none.
inline std::wstring SystemMessage(DWORD code)
{
    wil::unique_hlocal_string buffer;
    const DWORD length = ::FormatMessageW(FORMAT_MESSAGE_ALLOCATE_BUFFER | FORMAT_MESSAGE_FROM_SYSTEM | FORMAT_MESSAGE_IGNORE_INSERTS,
                                          nullptr,
                                          code,
                                          MAKELANGID(LANG_NEUTRAL, SUBLANG_DEFAULT),
                                          reinterpret_cast<PWSTR>(buffer.put()),
                                          0,
                                          nullptr);
    if (length == 0 || ! buffer)
    {
        return {};
    }

    std::wstring_view text(buffer.get(), length);
    while (! text.empty() && (text.back() == L'\r' || text.back() == L'\n' || text.back() == L' ' || text.back() == L'.'))
    {
        text.remove_suffix(1);
    }
    return std::wstring(text);
}

template <typename... Args> void Info(std::wformat_string<Args...> format, Args&&... args) noexcept
{
    detail::Format(Level::Info, format, std::forward<Args>(args)...);
}

template <typename... Args> void Warning(std::wformat_string<Args...> format, Args&&... args) noexcept
{
    detail::Format(Level::Warning, format, std::forward<Args>(args)...);
}

template <typename... Args> void Error(std::wformat_string<Args...> format, Args&&... args) noexcept
{
    detail::Format(Level::Error, format, std::forward<Args>(args)...);
}

// Logs the message followed by GetLastError() and its system text. Returns the error code, read before anything
// else could overwrite it.
template <typename... Args> DWORD ErrorWithLastError(std::wformat_string<Args...> format, Args&&... args) noexcept
{
    const DWORD lastError = ::GetLastError();
    if (! detail::ProviderEnabled(detail::kMessageKeyword))
    {
        return lastError;
    }

    try
    {
        const std::wstring message = std::format(format, std::forward<Args>(args)...);
        const std::wstring system  = lastError != ERROR_SUCCESS ? SystemMessage(lastError) : std::wstring(L"no error code set");
        detail::Format(Level::Error, L"{} --> ({}) {}", message, lastError, system);
    }
    catch (const std::bad_alloc&)
    {
        std::terminate();
    }
    catch (const std::exception&)
    {
        detail::Format(Level::Error, L"[unformattable log message] --> ({})", lastError);
    }
    return lastError;
}

namespace Perf
{
// Emits one "PerfScope" event with the elapsed time when it goes out of scope. Value and HRESULT are free-form
// payload set by the owner before it ends.
class Scope final
{
public:
    explicit Scope(std::wstring_view name) noexcept : _enabled(detail::ProviderEnabled(detail::kPerfKeyword)), _name(name)
    {
        if (_enabled)
        {
            _start = std::chrono::steady_clock::now();
        }
    }

    Scope(const Scope&)            = delete;
    Scope& operator=(const Scope&) = delete;

    ~Scope() noexcept
    {
        if (! _enabled)
        {
            return;
        }

        const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - _start);
        TraceLoggingWrite(g_WideShellProvider,
                          "PerfScope",
                          TraceLoggingLevel(TRACE_LEVEL_INFORMATION),
                          TraceLoggingKeyword(detail::kPerfKeyword),
                          TraceLoggingCountedWideString(_name.data(), detail::CountedLength(_name), "Name"),
                          TraceLoggingUInt64(static_cast<uint64_t>(elapsed.count()), "DurationUs"),
                          TraceLoggingUInt64(_value, "Value"),
                          TraceLoggingHResult(_hr, "Hr"));
    }

    void SetValue(uint64_t value) noexcept
    {
        _value = value;
    }

    void SetHr(HRESULT hr) noexcept
    {
        _hr = hr;
    }

private:
    bool _enabled = false;
    std::wstring_view _name;
    std::chrono::steady_clock::time_point _start{};
    uint64_t _value = 0;
    HRESULT _hr     = S_OK;
};
} // namespace Perf
} // namespace Debug

// Indents the messages logged inside the current function and logs its duration on the way out.
class CallTracer
{
public:
    explicit CallTracer(const wchar_t* functionName) noexcept
        : _enabled(Debug::detail::ProviderEnabled(Debug::detail::kMessageKeyword)),
          _functionName(functionName)
    {
        if (_enabled)
        {
            ++Debug::detail::g_depth;
            _start = std::chrono::steady_clock::now();
        }
    }

    CallTracer(const CallTracer&)            = delete;
    CallTracer& operator=(const CallTracer&) = delete;

    ~CallTracer() noexcept
    {
        if (! _enabled)
        {
            return;
        }

        const std::chrono::duration<double, std::milli> elapsed = std::chrono::steady_clock::now() - _start;
        --Debug::detail::g_depth;
        Debug::Info(L"{} done ({:.3f}ms)", _functionName, elapsed.count());
    }

private:
    bool _enabled                = false;
    const wchar_t* _functionName = nullptr;
    std::chrono::steady_clock::time_point _start{};
};

#define WIDESHELL_CONCAT_IMPL(a, b) a##b
#define WIDESHELL_CONCAT(a, b) WIDESHELL_CONCAT_IMPL(a, b)
#define WIDESHELL_WIDEN_IMPL(x) L##x
#define WIDESHELL_WIDEN(x) WIDESHELL_WIDEN_IMPL(x)

#define TRACER [[maybe_unused]] CallTracer WIDESHELL_CONCAT(_tracer_, __COUNTER__)(WIDESHELL_WIDEN(__FUNCTION__))

#pragma warning(pop)
