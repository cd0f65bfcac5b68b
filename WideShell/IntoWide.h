#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace WideShell
{
static_assert(sizeof(wchar_t) == 2, "WideShell requires 16-bit wchar_t code units");

// Raw code units on their way to becoming a WideString. May hold zeros; validation rejects them later.
using WideBuffer = std::vector<wchar_t>;

class WideStr;

// Conversion layer: every overload returns the code units of its input with room reserved for one terminator,
// which is not appended.
[[nodiscard]] WideBuffer IntoWide(WideBuffer data);
[[nodiscard]] WideBuffer IntoWide(std::wstring_view text);
[[nodiscard]] WideBuffer IntoWide(const std::wstring& text);
[[nodiscard]] WideBuffer IntoWide(const wchar_t* text);
[[nodiscard]] WideBuffer IntoWide(const std::filesystem::path& path);
[[nodiscard]] WideBuffer IntoWide(WideStr text);

// UTF-8 input. Ill-formed sequences become U+FFFD; embedded NULs are kept. Input longer than INT_MAX bytes is a
// fatal contract violation.
[[nodiscard]] WideBuffer IntoWide(std::string_view utf8);
[[nodiscard]] WideBuffer IntoWide(const std::string& utf8);
[[nodiscard]] WideBuffer IntoWide(const char* utf8);
} // namespace WideShell
