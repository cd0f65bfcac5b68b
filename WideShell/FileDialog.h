#pragma once

#include <limits>
#include <optional>

#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>

#include <shobjidl_core.h>

#include "Contract.h"
#include "ExternalHandle.h"
#include "FilterList.h"
#include "ShellItem.h"
#include "WideString.h"

#include "Helpers.h"

namespace WideShell
{
// Capability layers
//
//   ModalWindow   Show
//   FileDialog    + folders, file types, file name, title, options, result
//   FileOpenDialog / FileSaveDialog   own the COM reference
//
// Each layer's operations live in a CRTP mixin that only needs the derived class to expose the raw interface
// pointer for that layer. The owning dialogs convert to the borrowed views, so they can be passed wherever a
// narrower capability is expected.

template <typename Derived> class ModalWindowOps
{
public:
    // Blocks until the window closes. A dismissed window yields HRESULT_FROM_WIN32(ERROR_CANCELLED).
    [[nodiscard]] HRESULT Show(HWND parent = nullptr) const noexcept
    {
        return static_cast<const Derived&>(*this).ModalWindowPtr()->Show(parent);
    }
};

template <typename Derived> class FileDialogOps
{
public:
    // Consumes `folder`: its reference is handed to the dialog whether or not the call succeeds.
    [[nodiscard]] HRESULT SetDefaultFolder(ShellItem folder) const noexcept
    {
        IFileDialog* const dialog = Dialog();
        const HRESULT hr          = folder.Handle().HandOff([dialog](IShellItem* item) noexcept { return dialog->SetDefaultFolder(item); });
        if (FAILED(hr))
        {
            Debug::Warning(L"IFileDialog::SetDefaultFolder failed: 0x{:08X}", static_cast<unsigned>(hr));
        }
        return hr;
    }

    // Consumes `folder`, same as SetDefaultFolder.
    [[nodiscard]] HRESULT SetFolder(ShellItem folder) const noexcept
    {
        IFileDialog* const dialog = Dialog();
        const HRESULT hr          = folder.Handle().HandOff([dialog](IShellItem* item) noexcept { return dialog->SetFolder(item); });
        if (FAILED(hr))
        {
            Debug::Warning(L"IFileDialog::SetFolder failed: 0x{:08X}", static_cast<unsigned>(hr));
        }
        return hr;
    }

    // The dialog copies the descriptors; `filters` only needs to outlive this call.
    [[nodiscard]] HRESULT SetFileTypes(const FilterList& filters) const noexcept
    {
        Contract::Check(filters.Size() <= (std::numeric_limits<UINT>::max)(), L"too many file type filters for IFileDialog::SetFileTypes");
        const HRESULT hr = Dialog()->SetFileTypes(static_cast<UINT>(filters.Size()), filters.Data());
        if (FAILED(hr))
        {
            Debug::Warning(L"IFileDialog::SetFileTypes({} filters) failed: 0x{:08X}", filters.Size(), static_cast<unsigned>(hr));
        }
        return hr;
    }

    [[nodiscard]] HRESULT SetFileName(WideStr fileName) const noexcept
    {
        const HRESULT hr = Dialog()->SetFileName(fileName.AsPtr());
        if (FAILED(hr))
        {
            Debug::Warning(L"IFileDialog::SetFileName({}) failed: 0x{:08X}", fileName.AsSlice(), static_cast<unsigned>(hr));
        }
        return hr;
    }

    [[nodiscard]] HRESULT SetTitle(WideStr title) const noexcept
    {
        return Dialog()->SetTitle(title.AsPtr());
    }

    [[nodiscard]] HRESULT GetOptions(FILEOPENDIALOGOPTIONS& options) const noexcept
    {
        options = 0;
        return Dialog()->GetOptions(&options);
    }

    [[nodiscard]] HRESULT SetOptions(FILEOPENDIALOGOPTIONS options) const noexcept
    {
        return Dialog()->SetOptions(options);
    }

    // The item the user picked, once Show() returned S_OK.
    [[nodiscard]] HRESULT GetResult(std::optional<ShellItem>& out) const noexcept
    {
        out.reset();

        IShellItem* raw  = nullptr;
        const HRESULT hr = Dialog()->GetResult(&raw);
        if (FAILED(hr))
        {
            Debug::Warning(L"IFileDialog::GetResult failed: 0x{:08X}", static_cast<unsigned>(hr));
            return hr;
        }

        out.emplace(ExternalHandle<IShellItem>::Adopt(raw));
        return S_OK;
    }

private:
    IFileDialog* Dialog() const noexcept
    {
        return static_cast<const Derived&>(*this).FileDialogPtr();
    }
};

// Borrowed view; valid while the dialog it was taken from is alive.
class ModalWindow : public ModalWindowOps<ModalWindow>
{
public:
    explicit ModalWindow(IModalWindow* window) noexcept : _window(window)
    {
        Contract::Check(window != nullptr, L"ModalWindow over a null interface");
    }

    [[nodiscard]] IModalWindow* ModalWindowPtr() const noexcept
    {
        return _window;
    }

private:
    IModalWindow* _window = nullptr;
};

// Borrowed view; valid while the dialog it was taken from is alive.
class FileDialog : public ModalWindowOps<FileDialog>, public FileDialogOps<FileDialog>
{
public:
    explicit FileDialog(IFileDialog* dialog) noexcept : _dialog(dialog)
    {
        Contract::Check(dialog != nullptr, L"FileDialog over a null interface");
    }

    operator ModalWindow() const noexcept
    {
        return ModalWindow(_dialog);
    }

    [[nodiscard]] IModalWindow* ModalWindowPtr() const noexcept
    {
        return _dialog;
    }

    [[nodiscard]] IFileDialog* FileDialogPtr() const noexcept
    {
        return _dialog;
    }

private:
    IFileDialog* _dialog = nullptr;
};

class FileOpenDialog : public ModalWindowOps<FileOpenDialog>, public FileDialogOps<FileOpenDialog>
{
public:
    using Interface = IFileOpenDialog;

    // CLSID_FileOpenDialog, in-process. The calling thread must be in a COM apartment.
    [[nodiscard]] static HRESULT Create(std::optional<FileOpenDialog>& out) noexcept;

    explicit FileOpenDialog(ExternalHandle<IFileOpenDialog> handle) noexcept : _handle(std::move(handle))
    {
    }

    FileOpenDialog(FileOpenDialog&&) noexcept            = default;
    FileOpenDialog& operator=(FileOpenDialog&&) noexcept = default;

    operator FileDialog() const noexcept
    {
        return FileDialog(FileDialogPtr());
    }

    operator ModalWindow() const noexcept
    {
        return ModalWindow(ModalWindowPtr());
    }

    [[nodiscard]] IModalWindow* ModalWindowPtr() const noexcept
    {
        return _handle.As<IModalWindow>();
    }

    [[nodiscard]] IFileDialog* FileDialogPtr() const noexcept
    {
        return _handle.As<IFileDialog>();
    }

    [[nodiscard]] const ExternalHandle<IFileOpenDialog>& Handle() const noexcept
    {
        return _handle;
    }

private:
    ExternalHandle<IFileOpenDialog> _handle;
};

class FileSaveDialog : public ModalWindowOps<FileSaveDialog>, public FileDialogOps<FileSaveDialog>
{
public:
    using Interface = IFileSaveDialog;

    // CLSID_FileSaveDialog, in-process. The calling thread must be in a COM apartment.
    [[nodiscard]] static HRESULT Create(std::optional<FileSaveDialog>& out) noexcept;

    explicit FileSaveDialog(ExternalHandle<IFileSaveDialog> handle) noexcept : _handle(std::move(handle))
    {
    }

    FileSaveDialog(FileSaveDialog&&) noexcept            = default;
    FileSaveDialog& operator=(FileSaveDialog&&) noexcept = default;

    operator FileDialog() const noexcept
    {
        return FileDialog(FileDialogPtr());
    }

    operator ModalWindow() const noexcept
    {
        return ModalWindow(ModalWindowPtr());
    }

    [[nodiscard]] IModalWindow* ModalWindowPtr() const noexcept
    {
        return _handle.As<IModalWindow>();
    }

    [[nodiscard]] IFileDialog* FileDialogPtr() const noexcept
    {
        return _handle.As<IFileDialog>();
    }

    [[nodiscard]] const ExternalHandle<IFileSaveDialog>& Handle() const noexcept
    {
        return _handle;
    }

private:
    ExternalHandle<IFileSaveDialog> _handle;
};
} // namespace WideShell
