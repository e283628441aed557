// POSIX-style remote path helpers (SFTP paths always use '/').
#pragma once
#include <string>

namespace twinpane {

// Joins base and name with exactly one '/'. Empty base means root.
std::string joinRemotePath(const std::string &base, const std::string &name);

// Parent directory of a remote path; "/" for top-level entries and root.
std::string remoteParentPath(const std::string &path);

// Last path component, ignoring trailing slashes.
std::string remoteBaseName(const std::string &path);

// Strips trailing slashes (keeping "/") and maps "" to "/".
std::string normalizeRemotePath(const std::string &path);

// True for "~" and "~/..." paths.
bool isHomeRelative(const std::string &path);

// Replaces the leading "~" with home. Paths that are not home relative are
// returned unchanged.
std::string expandHomePath(const std::string &path, const std::string &home);

} // namespace twinpane
