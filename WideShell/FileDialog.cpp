#include "ComRuntime.h"
#include "FileDialog.h"

namespace WideShell
{
namespace
{
template <typename Dialog> HRESULT CreateOwnedDialog(REFCLSID clsid, const wchar_t* what, std::optional<Dialog>& out) noexcept
{
    out.reset();

    std::optional<ExternalHandle<typename Dialog::Interface>> handle;
    const HRESULT hr = CreateInstance(clsid, CLSCTX_INPROC_SERVER, handle);
    if (FAILED(hr))
    {
        Debug::Error(L"Creating the {} failed: 0x{:08X}", what, static_cast<unsigned>(hr));
        return hr;
    }

    out.emplace(std::move(*handle));
    return S_OK;
}
} // namespace

HRESULT FileOpenDialog::Create(std::optional<FileOpenDialog>& out) noexcept
{
    return CreateOwnedDialog(CLSID_FileOpenDialog, L"file open dialog", out);
}

HRESULT FileSaveDialog::Create(std::optional<FileSaveDialog>& out) noexcept
{
    return CreateOwnedDialog(CLSID_FileSaveDialog, L"file save dialog", out);
}
} // namespace WideShell
