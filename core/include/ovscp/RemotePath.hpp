// POSIX-style path helpers for remote (SFTP) paths. Remote paths always use
// '/' regardless of the local platform.
#pragma once
#include <string>

namespace ovscp {

// "base" + "/" + "name" without doubling separators. Empty base yields name.
std::string joinRemotePath(const std::string& base, const std::string& name);

// Lexical clean-up: collapses "//", drops "." segments, resolves "..".
// Empty input yields ".".
std::string cleanRemotePath(const std::string& path);

// Last path element ("/a/b/" -> "b", "/" -> "/", "" -> "").
std::string remoteBaseName(const std::string& path);

// Everything but the last element ("/a/b" -> "/a", "a" -> ".", "/a" -> "/").
std::string remoteDirName(const std::string& path);

// True for a single path component: non-empty, not "." or "..", no '/'.
bool isPlainEntryName(const std::string& name);

} // namespace ovscp
