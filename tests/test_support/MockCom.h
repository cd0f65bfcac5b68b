// tests/test_support/MockCom.h
//
// Minimal in-process COM objects for exercising handle ownership without the real shell.
// Every object starts with one reference (the one a factory would hand out) and deletes itself at zero.
// Counters live outside the objects so they can be checked after the last Release().
#pragma once

#include <algorithm>
#include <atomic>
#include <string>
#include <utility>
#include <vector>

#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>

#include <objbase.h>
#include <shobjidl_core.h>

namespace WideShellTests
{
// Set by the mock dialog while it runs a call that consumes the item it receives.
inline thread_local bool g_insideConsumingCall = false;

struct RefCounters
{
    int addRefs                     = 0;
    int releases                    = 0;
    int releasesInsideConsumingCall = 0;
    bool destroyed                  = false;
};

class MockShellItem final : public IShellItem
{
public:
    MockShellItem(RefCounters& counters, std::wstring displayName) : _counters(counters), _displayName(std::move(displayName))
    {
    }

    // IUnknown
    IFACEMETHODIMP QueryInterface(REFIID riid, void** ppv) override
    {
        if (! ppv)
        {
            return E_POINTER;
        }
        if (riid == __uuidof(IUnknown) || riid == __uuidof(IShellItem))
        {
            *ppv = static_cast<IShellItem*>(this);
            AddRef();
            return S_OK;
        }
        *ppv = nullptr;
        return E_NOINTERFACE;
    }

    IFACEMETHODIMP_(ULONG) AddRef() override
    {
        ++_counters.addRefs;
        return static_cast<ULONG>(++_refs);
    }

    IFACEMETHODIMP_(ULONG) Release() override
    {
        ++_counters.releases;
        if (g_insideConsumingCall)
        {
            ++_counters.releasesInsideConsumingCall;
        }

        const long refs = --_refs;
        if (refs == 0)
        {
            _counters.destroyed = true;
            delete this;
        }
        return static_cast<ULONG>(refs);
    }

    // IShellItem
    IFACEMETHODIMP BindToHandler(IBindCtx*, REFGUID, REFIID, void** ppv) override
    {
        if (ppv)
        {
            *ppv = nullptr;
        }
        return E_NOTIMPL;
    }

    IFACEMETHODIMP GetParent(IShellItem** ppsi) override
    {
        if (ppsi)
        {
            *ppsi = nullptr;
        }
        return E_NOTIMPL;
    }

    IFACEMETHODIMP GetDisplayName(SIGDN sigdnName, LPWSTR* ppszName) override
    {
        if (! ppszName)
        {
            return E_POINTER;
        }
        *ppszName = nullptr;

        lastRequested = sigdnName;
        if (FAILED(displayNameResult))
        {
            return displayNameResult;
        }

        const size_t bytes = (_displayName.size() + 1u) * sizeof(wchar_t);
        auto* text         = static_cast<wchar_t*>(CoTaskMemAlloc(bytes));
        if (! text)
        {
            return E_OUTOFMEMORY;
        }
        std::copy(_displayName.c_str(), _displayName.c_str() + _displayName.size() + 1u, text);
        *ppszName = text;
        return S_OK;
    }

    IFACEMETHODIMP GetAttributes(SFGAOF, SFGAOF* psfgaoAttribs) override
    {
        if (psfgaoAttribs)
        {
            *psfgaoAttribs = 0;
        }
        return E_NOTIMPL;
    }

    IFACEMETHODIMP Compare(IShellItem*, SICHINTF, int* piOrder) override
    {
        if (piOrder)
        {
            *piOrder = 0;
        }
        return E_NOTIMPL;
    }

    HRESULT displayNameResult = S_OK;
    SIGDN lastRequested       = SIGDN_NORMALDISPLAY;

private:
    ~MockShellItem() = default;

    RefCounters& _counters;
    std::wstring _displayName;
    std::atomic<long> _refs{1};
};

// Records what the code under test configured. Consuming calls (SetDefaultFolder / SetFolder) release the item
// they receive, the way a foreign side that takes over the reference would.
class MockFileOpenDialog final : public IFileOpenDialog
{
public:
    explicit MockFileOpenDialog(RefCounters& counters) : _counters(counters)
    {
    }

    // IUnknown
    IFACEMETHODIMP QueryInterface(REFIID riid, void** ppv) override
    {
        if (! ppv)
        {
            return E_POINTER;
        }
        if (riid == __uuidof(IUnknown) || riid == __uuidof(IModalWindow) || riid == __uuidof(IFileDialog) || riid == __uuidof(IFileOpenDialog))
        {
            *ppv = static_cast<IFileOpenDialog*>(this);
            AddRef();
            return S_OK;
        }
        *ppv = nullptr;
        return E_NOINTERFACE;
    }

    IFACEMETHODIMP_(ULONG) AddRef() override
    {
        ++_counters.addRefs;
        return static_cast<ULONG>(++_refs);
    }

    IFACEMETHODIMP_(ULONG) Release() override
    {
        ++_counters.releases;
        const long refs = --_refs;
        if (refs == 0)
        {
            _counters.destroyed = true;
            delete this;
        }
        return static_cast<ULONG>(refs);
    }

    // IModalWindow
    IFACEMETHODIMP Show(HWND owner) override
    {
        ++showCalls;
        lastOwner = owner;
        return showResult;
    }

    // IFileDialog
    IFACEMETHODIMP SetFileTypes(UINT cFileTypes, const COMDLG_FILTERSPEC* rgFilterSpec) override
    {
        fileTypes.clear();
        for (UINT i = 0; i < cFileTypes; ++i)
        {
            fileTypes.emplace_back(rgFilterSpec[i].pszName, rgFilterSpec[i].pszSpec);
        }
        return S_OK;
    }

    IFACEMETHODIMP SetFileTypeIndex(UINT) override
    {
        return E_NOTIMPL;
    }

    IFACEMETHODIMP GetFileTypeIndex(UINT*) override
    {
        return E_NOTIMPL;
    }

    IFACEMETHODIMP Advise(IFileDialogEvents*, DWORD*) override
    {
        return E_NOTIMPL;
    }

    IFACEMETHODIMP Unadvise(DWORD) override
    {
        return E_NOTIMPL;
    }

    IFACEMETHODIMP SetOptions(FILEOPENDIALOGOPTIONS fos) override
    {
        options = fos;
        return S_OK;
    }

    IFACEMETHODIMP GetOptions(FILEOPENDIALOGOPTIONS* pfos) override
    {
        if (! pfos)
        {
            return E_POINTER;
        }
        *pfos = options;
        return S_OK;
    }

    IFACEMETHODIMP SetDefaultFolder(IShellItem* psi) override
    {
        ++setDefaultFolderCalls;
        defaultFolderPath = FileSysPathOf(psi);
        return Consume(psi, setDefaultFolderResult);
    }

    IFACEMETHODIMP SetFolder(IShellItem* psi) override
    {
        ++setFolderCalls;
        folderPath = FileSysPathOf(psi);
        return Consume(psi, setFolderResult);
    }

    IFACEMETHODIMP GetFolder(IShellItem**) override
    {
        return E_NOTIMPL;
    }

    IFACEMETHODIMP GetCurrentSelection(IShellItem**) override
    {
        return E_NOTIMPL;
    }

    IFACEMETHODIMP SetFileName(LPCWSTR pszName) override
    {
        fileName = pszName ? pszName : L"";
        return S_OK;
    }

    IFACEMETHODIMP GetFileName(LPWSTR*) override
    {
        return E_NOTIMPL;
    }

    IFACEMETHODIMP SetTitle(LPCWSTR pszTitle) override
    {
        title = pszTitle ? pszTitle : L"";
        return S_OK;
    }

    IFACEMETHODIMP SetOkButtonLabel(LPCWSTR) override
    {
        return E_NOTIMPL;
    }

    IFACEMETHODIMP SetFileNameLabel(LPCWSTR) override
    {
        return E_NOTIMPL;
    }

    // Hands out a new reference on `result`, or fails when there is none.
    IFACEMETHODIMP GetResult(IShellItem** ppsi) override
    {
        if (! ppsi)
        {
            return E_POINTER;
        }
        *ppsi = nullptr;
        if (! result)
        {
            return E_UNEXPECTED;
        }
        result->AddRef();
        *ppsi = result;
        return S_OK;
    }

    IFACEMETHODIMP AddPlace(IShellItem*, FDAP) override
    {
        return E_NOTIMPL;
    }

    IFACEMETHODIMP SetDefaultExtension(LPCWSTR) override
    {
        return E_NOTIMPL;
    }

    IFACEMETHODIMP Close(HRESULT) override
    {
        return E_NOTIMPL;
    }

    IFACEMETHODIMP SetClientGuid(REFGUID) override
    {
        return E_NOTIMPL;
    }

    IFACEMETHODIMP ClearClientData() override
    {
        return E_NOTIMPL;
    }

    IFACEMETHODIMP SetFilter(IShellItemFilter*) override
    {
        return E_NOTIMPL;
    }

    // IFileOpenDialog
    IFACEMETHODIMP GetResults(IShellItemArray**) override
    {
        return E_NOTIMPL;
    }

    IFACEMETHODIMP GetSelectedItems(IShellItemArray**) override
    {
        return E_NOTIMPL;
    }

    HRESULT showResult             = S_OK;
    HRESULT setDefaultFolderResult = S_OK;
    HRESULT setFolderResult        = S_OK;
    int showCalls                  = 0;
    int setDefaultFolderCalls      = 0;
    int setFolderCalls             = 0;
    HWND lastOwner                 = nullptr;
    FILEOPENDIALOGOPTIONS options  = FOS_FILEMUSTEXIST | FOS_PATHMUSTEXIST;
    std::vector<std::pair<std::wstring, std::wstring>> fileTypes;
    std::wstring fileName;
    std::wstring title;

    // File system paths of the items the folder calls received, read before they were released.
    std::wstring defaultFolderPath;
    std::wstring folderPath;

    // Borrowed; the test keeps its own reference alive while the dialog may hand it out.
    IShellItem* result = nullptr;

private:
    ~MockFileOpenDialog() = default;

    static std::wstring FileSysPathOf(IShellItem* item)
    {
        if (! item)
        {
            return {};
        }

        LPWSTR name = nullptr;
        if (FAILED(item->GetDisplayName(SIGDN_FILESYSPATH, &name)) || ! name)
        {
            return {};
        }
        std::wstring path(name);
        CoTaskMemFree(name);
        return path;
    }

    HRESULT Consume(IShellItem* item, HRESULT outcome)
    {
        g_insideConsumingCall = true;
        if (item)
        {
            item->Release();
        }
        g_insideConsumingCall = false;
        return outcome;
    }

    RefCounters& _counters;
    std::atomic<long> _refs{1};
};
} // namespace WideShellTests
