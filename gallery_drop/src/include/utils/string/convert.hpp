#pragma once

#include <utf8.h>

#include <filesystem>
#include <string>

namespace conv {
auto ToBytes(const std::wstring& wstr) -> std::string;
auto ToBytes(std::wstring&& wstr) -> std::string;

auto FromBytes(const std::string& str) -> std::wstring;
auto FromBytes(std::string&& str) -> std::wstring;

// Decodes UTF-8; invalid sequences are replaced rather than rejected
auto ToCodePoints(const std::string& str) -> std::u32string;

auto PathToUtf8(const std::filesystem::path& path) -> std::string;
auto Utf8ToPath(const std::string& str) -> std::filesystem::path;
};  // namespace conv
