#include <atomic>
#include <mutex>

#include "ComRuntime.h"

namespace WideShell
{
namespace
{
std::once_flag g_mtaUsageOnce;
std::atomic<HRESULT> g_mtaUsageResult{E_PENDING};

// Never decremented: the apartment lives until the process exits.
CO_MTA_USAGE_COOKIE g_mtaUsageCookie = nullptr;
} // namespace

HRESULT InitMtaComRuntime() noexcept
{
    std::call_once(g_mtaUsageOnce,
                   []() noexcept
                   {
                       const HRESULT hr = CoIncrementMTAUsage(&g_mtaUsageCookie);
                       if (FAILED(hr))
                       {
                           Debug::Error(L"CoIncrementMTAUsage failed: 0x{:08X}", static_cast<unsigned>(hr));
                       }
                       else
                       {
                           Debug::Info(L"Process-wide MTA initialized");
                       }
                       g_mtaUsageResult.store(hr, std::memory_order_release);
                   });

    return g_mtaUsageResult.load(std::memory_order_acquire);
}
} // namespace WideShell
