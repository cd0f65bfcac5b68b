// WideShellDemo - runs one shell file dialog and prints the chosen item.
//
//   WideShellDemo.exe [open|save] [--config <file.json>] [--filter name=pattern]... [--name <file>] [--path <dir>]
//                     [--default-path <dir>] [--title <text>] [--folders] [--display <DisplayNameType>]
//
// Exit codes: 0 selected, 1 cancelled, 2 failed, 3 bad command line.
#include <filesystem>
#include <format>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>

#include "WideShell/DialogSettings.h"
#include "WideShell/FileDialogBuilder.h"
#include "WideShell/ShellItem.h"
#include "WideShell/WideErrors.h"

#include "Helpers.h"
#include "Version.h"

namespace
{
constexpr int kExitSelected  = 0;
constexpr int kExitCancelled = 1;
constexpr int kExitFailed    = 2;
constexpr int kExitUsage     = 3;

constexpr std::wstring_view kUsage =
    L"Usage: WideShellDemo [open|save] [--config <file.json>] [--filter name=pattern]... [--name <file>]\n"
    L"                     [--path <dir>] [--default-path <dir>] [--title <text>] [--folders]\n"
    L"                     [--display <DisplayNameType>] [--version] [--help]";

struct CommandLine
{
    std::optional<std::wstring> configFile;
    std::optional<WideShell::DialogKind> kind;
    std::vector<WideShell::DialogFilterSetting> filters;
    std::optional<std::wstring> fileName;
    std::optional<std::wstring> path;
    std::optional<std::wstring> defaultPath;
    std::optional<std::wstring> title;
    std::optional<WideShell::DisplayNameType> display;
    bool pickFolders = false;
    bool showHelp    = false;
    bool showVersion = false;
};

void WriteUtf8(HANDLE out, std::wstring_view text)
{
    WideShell::WideString line;
    if (FAILED(WideShell::WideString::Create(text, line)))
    {
        return;
    }

    std::string utf8 = line.ToUtf8();
    utf8.push_back('\n');

    DWORD written = 0;
    static_cast<void>(WriteFile(out, utf8.data(), static_cast<DWORD>(utf8.size()), &written, nullptr));
}

void WriteOut(std::wstring_view text)
{
    WriteUtf8(GetStdHandle(STD_OUTPUT_HANDLE), text);
}

void WriteErr(std::wstring_view text)
{
    WriteUtf8(GetStdHandle(STD_ERROR_HANDLE), text);
}

void InitializeDpiAwareness()
{
    static std::once_flag once;
    std::call_once(once,
                   []
                   {
                       if (! SetProcessDpiAwarenessContext(DPI_AWARENESS_CONTEXT_PER_MONITOR_AWARE_V2))
                       {
                           // Already set by a manifest, or an older OS.
                           Debug::Warning(L"SetProcessDpiAwarenessContext failed: {}", GetLastError());
                       }
                   });
}

bool ParseCommandLine(int argc, wchar_t** argv, CommandLine& out, std::wstring& error)
{
    for (int i = 1; i < argc; ++i)
    {
        const std::wstring_view arg = argv[i];

        auto takeValue = [&](std::optional<std::wstring>& value) -> bool
        {
            if (i + 1 >= argc)
            {
                error = std::format(L"{} needs a value", arg);
                return false;
            }
            value = argv[++i];
            return true;
        };

        if (arg == L"open" || arg == L"save")
        {
            out.kind = arg == L"open" ? WideShell::DialogKind::Open : WideShell::DialogKind::Save;
        }
        else if (arg == L"--config")
        {
            if (! takeValue(out.configFile))
            {
                return false;
            }
        }
        else if (arg == L"--filter")
        {
            std::optional<std::wstring> spec;
            if (! takeValue(spec))
            {
                return false;
            }
            const size_t equals = spec->find(L'=');
            if (equals == std::wstring::npos || equals == 0 || equals + 1 == spec->size())
            {
                error = std::format(L"--filter expects name=pattern, got '{}'", spec.value());
                return false;
            }
            out.filters.push_back({spec->substr(0, equals), spec->substr(equals + 1)});
        }
        else if (arg == L"--name")
        {
            if (! takeValue(out.fileName))
            {
                return false;
            }
        }
        else if (arg == L"--path")
        {
            if (! takeValue(out.path))
            {
                return false;
            }
        }
        else if (arg == L"--default-path")
        {
            if (! takeValue(out.defaultPath))
            {
                return false;
            }
        }
        else if (arg == L"--title")
        {
            if (! takeValue(out.title))
            {
                return false;
            }
        }
        else if (arg == L"--display")
        {
            std::optional<std::wstring> name;
            if (! takeValue(name))
            {
                return false;
            }
            WideShell::DisplayNameType type = WideShell::DisplayNameType::FileSysPath;
            if (! WideShell::TryParseDisplayNameType(name.value(), type))
            {
                error = std::format(L"unknown display name type '{}'", name.value());
                return false;
            }
            out.display = type;
        }
        else if (arg == L"--folders")
        {
            out.pickFolders = true;
        }
        else if (arg == L"--help" || arg == L"-h" || arg == L"/?")
        {
            out.showHelp = true;
        }
        else if (arg == L"--version")
        {
            out.showVersion = true;
        }
        else
        {
            error = std::format(L"unexpected argument '{}'", arg);
            return false;
        }
    }
    return true;
}

// Command-line values win over the settings file.
void MergeCommandLine(const CommandLine& commandLine, WideShell::DialogSettings& settings)
{
    if (commandLine.kind.has_value())
    {
        settings.kind = commandLine.kind.value();
    }
    settings.filters.insert(settings.filters.end(), commandLine.filters.begin(), commandLine.filters.end());
    if (commandLine.fileName.has_value())
    {
        settings.fileName = commandLine.fileName;
    }
    if (commandLine.path.has_value())
    {
        settings.path = std::filesystem::path(commandLine.path.value());
    }
    if (commandLine.defaultPath.has_value())
    {
        settings.defaultPath = std::filesystem::path(commandLine.defaultPath.value());
    }
    if (commandLine.title.has_value())
    {
        settings.title = commandLine.title;
    }
    if (commandLine.display.has_value())
    {
        settings.display = commandLine.display.value();
    }
    if (commandLine.pickFolders)
    {
        settings.pickFolders = true;
    }
}

template <typename Dialog> HRESULT RunDialog(const WideShell::DialogSettings& settings, std::wstring& selected)
{
    TRACER;

    WideShell::FileDialogBuilder<Dialog> builder;
    WideShell::ApplyDialogSettings(settings, builder);

    std::optional<Dialog> dialog;
    HRESULT hr = builder.Build(dialog);
    if (FAILED(hr))
    {
        return hr;
    }

    hr = dialog->Show(nullptr);
    if (FAILED(hr))
    {
        return hr;
    }

    std::optional<WideShell::ShellItem> item;
    hr = dialog->GetResult(item);
    if (FAILED(hr))
    {
        return hr;
    }

    WideShell::CoTaskMemWideString name;
    hr = item->GetDisplayName(settings.display, name);
    if (FAILED(hr))
    {
        return hr;
    }

    selected.assign(name.AsWideStr().AsSlice());
    return S_OK;
}

std::wstring DescribeHResult(HRESULT hr)
{
    const wchar_t* own = WideShell::DescribeWideShellError(hr);
    if (own && own[0] != L'\0')
    {
        return std::format(L"0x{:08X} ({})", static_cast<unsigned>(hr), own);
    }

    const std::wstring system = Debug::SystemMessage(static_cast<DWORD>(hr));
    if (system.empty())
    {
        return std::format(L"0x{:08X}", static_cast<unsigned>(hr));
    }
    return std::format(L"0x{:08X} ({})", static_cast<unsigned>(hr), system);
}
} // namespace

int wmain(int argc, wchar_t** argv)
{
    SetConsoleOutputCP(CP_UTF8);

    CommandLine commandLine;
    std::wstring error;
    if (! ParseCommandLine(argc, argv, commandLine, error))
    {
        WriteErr(std::format(L"WideShellDemo: {}", error));
        WriteErr(kUsage);
        return kExitUsage;
    }

    if (commandLine.showHelp)
    {
        WriteOut(kUsage);
        return kExitSelected;
    }

    if (commandLine.showVersion)
    {
        WriteOut(L"WideShellDemo " VERSINFO_VERSION_FULL);
        return kExitSelected;
    }

    InitializeDpiAwareness();

    WideShell::DialogSettings settings;
    if (commandLine.configFile.has_value())
    {
        const HRESULT hr = WideShell::LoadDialogSettings(commandLine.configFile.value(), settings);
        if (FAILED(hr))
        {
            WriteErr(std::format(L"WideShellDemo: cannot use '{}': {}", commandLine.configFile.value(), DescribeHResult(hr)));
            return kExitFailed;
        }
        if (hr == S_FALSE)
        {
            WriteErr(std::format(L"WideShellDemo: '{}' not found, using defaults", commandLine.configFile.value()));
        }
    }

    MergeCommandLine(commandLine, settings);

    Debug::Info(L"WideShellDemo {}: {} dialog, {} filter(s), display {}",
                VERSINFO_VERSION_FULL,
                WideShell::DialogKindName(settings.kind),
                settings.filters.size(),
                WideShell::DisplayNameTypeName(settings.display));

    std::wstring selected;
    const HRESULT hr = settings.kind == WideShell::DialogKind::Open ? RunDialog<WideShell::FileOpenDialog>(settings, selected)
                                                                    : RunDialog<WideShell::FileSaveDialog>(settings, selected);
    if (WideShell::IsCancelled(hr))
    {
        WriteErr(L"WideShellDemo: cancelled");
        return kExitCancelled;
    }
    if (FAILED(hr))
    {
        WriteErr(std::format(L"WideShellDemo: dialog failed: {}", DescribeHResult(hr)));
        return kExitFailed;
    }

    WriteOut(selected);
    return kExitSelected;
}
