#include <type_traits>

#include "ComRuntime.h"
#include "FileDialogBuilder.h"
#include "ShellItem.h"

#include "Helpers.h"

namespace WideShell
{
template <typename Dialog> HRESULT FileDialogBuilder<Dialog>::Build(std::optional<Dialog>& out) const
{
    TRACER;

    out.reset();

    HRESULT hr = S_OK;
    if (_initCom)
    {
        hr = InitMtaComRuntime();
        if (FAILED(hr))
        {
            return hr;
        }
    }

    std::optional<Dialog> dialog;
    hr = Dialog::Create(dialog);
    if (FAILED(hr))
    {
        return hr;
    }

    hr = Apply(*dialog);
    if (FAILED(hr))
    {
        return hr;
    }

    out = std::move(dialog);
    return S_OK;
}

template <typename Dialog> HRESULT FileDialogBuilder<Dialog>::Apply(const Dialog& dialog) const
{
    HRESULT hr = S_OK;

    if (_defaultPath.has_value())
    {
        std::optional<ShellItem> item;
        hr = ShellItem::FromPath(_defaultPath.value(), item);
        if (FAILED(hr))
        {
            Debug::Error(L"Default folder {} is not usable: 0x{:08X}", _defaultPath->native(), static_cast<unsigned>(hr));
            return hr;
        }

        hr = dialog.SetDefaultFolder(std::move(*item));
        if (FAILED(hr))
        {
            return hr;
        }
    }

    if (_path.has_value())
    {
        std::optional<ShellItem> item;
        hr = ShellItem::FromPath(_path.value(), item);
        if (FAILED(hr))
        {
            Debug::Error(L"Folder {} is not usable: 0x{:08X}", _path->native(), static_cast<unsigned>(hr));
            return hr;
        }

        hr = dialog.SetFolder(std::move(*item));
        if (FAILED(hr))
        {
            return hr;
        }
    }

    if (! _filters.Empty())
    {
        hr = dialog.SetFileTypes(_filters);
        if (FAILED(hr))
        {
            return hr;
        }
    }

    if (_fileName.has_value())
    {
        NulError error;
        WideString fileName;
        hr = WideString::Create(_fileName.value(), fileName, &error);
        if (FAILED(hr))
        {
            Debug::Error(L"File name rejected: {}", error.Message());
            return hr;
        }

        hr = dialog.SetFileName(fileName);
        if (FAILED(hr))
        {
            return hr;
        }
    }

    if (_title.has_value())
    {
        NulError error;
        WideString title;
        hr = WideString::Create(_title.value(), title, &error);
        if (FAILED(hr))
        {
            Debug::Error(L"Title rejected: {}", error.Message());
            return hr;
        }

        hr = dialog.SetTitle(title);
        if (FAILED(hr))
        {
            Debug::Warning(L"IFileDialog::SetTitle failed: 0x{:08X}", static_cast<unsigned>(hr));
            return hr;
        }
    }

    if (_pickFolders)
    {
        if constexpr (std::is_same_v<Dialog, FileOpenDialog>)
        {
            FILEOPENDIALOGOPTIONS options = 0;
            hr                            = dialog.GetOptions(options);
            if (SUCCEEDED(hr))
            {
                hr = dialog.SetOptions(options | FOS_PICKFOLDERS | FOS_FORCEFILESYSTEM | FOS_PATHMUSTEXIST);
            }
            if (FAILED(hr))
            {
                Debug::Warning(L"Switching the dialog to folder picking failed: 0x{:08X}", static_cast<unsigned>(hr));
                return hr;
            }
        }
        else
        {
            Debug::Warning(L"PickFolders() has no effect on a save dialog");
        }
    }

    return S_OK;
}

template <typename Dialog> HRESULT FileDialogBuilder<Dialog>::Execute(std::filesystem::path& selected) const
{
    selected.clear();

    std::optional<Dialog> dialog;
    HRESULT hr = Build(dialog);
    if (FAILED(hr))
    {
        return hr;
    }

    hr = dialog->Show(nullptr);
    if (IsCancelled(hr))
    {
        Debug::Info(L"Dialog cancelled by the user");
        return hr;
    }
    if (FAILED(hr))
    {
        Debug::Error(L"IModalWindow::Show failed: 0x{:08X}", static_cast<unsigned>(hr));
        return hr;
    }

    std::optional<ShellItem> item;
    hr = dialog->GetResult(item);
    if (FAILED(hr))
    {
        return hr;
    }

    CoTaskMemWideString path;
    hr = item->GetDisplayName(DisplayNameType::FileSysPath, path);
    if (FAILED(hr))
    {
        return hr;
    }

    selected = path.ToPath();
    return S_OK;
}

template class FileDialogBuilder<FileOpenDialog>;
template class FileDialogBuilder<FileSaveDialog>;

FileOpenDialogBuilder NfdOpenBuilder()
{
    FileOpenDialogBuilder builder;
    builder.InitCom();
    return builder;
}

FileSaveDialogBuilder NfdSaveBuilder()
{
    FileSaveDialogBuilder builder;
    builder.InitCom();
    return builder;
}

HRESULT NfdOpen(std::filesystem::path& selected)
{
    return NfdOpenBuilder().Execute(selected);
}

HRESULT NfdSave(std::filesystem::path& selected)
{
    return NfdSaveBuilder().Execute(selected);
}
} // namespace WideShell
