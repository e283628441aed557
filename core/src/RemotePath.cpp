#include "twinpane/RemotePath.hpp"

namespace twinpane {

std::string joinRemotePath(const std::string &base, const std::string &name) {
    if (base.empty())
        return std::string("/") + name;
    if (base.back() == '/')
        return base + name;
    return base + "/" + name;
}

std::string normalizeRemotePath(const std::string &path) {
    if (path.empty())
        return "/";
    std::string out = path;
    while (out.size() > 1 && out.back() == '/')
        out.pop_back();
    return out;
}

std::string remoteParentPath(const std::string &path) {
    const std::string p = normalizeRemotePath(path);
    const auto slash = p.find_last_of('/');
    if (slash == std::string::npos)
        return ".";
    if (slash == 0)
        return "/";
    return p.substr(0, slash);
}

std::string remoteBaseName(const std::string &path) {
    const std::string p = normalizeRemotePath(path);
    if (p == "/")
        return p;
    const auto slash = p.find_last_of('/');
    return slash == std::string::npos ? p : p.substr(slash + 1);
}

bool isHomeRelative(const std::string &path) {
    return path == "~" || path.rfind("~/", 0) == 0;
}

std::string expandHomePath(const std::string &path, const std::string &home) {
    if (!isHomeRelative(path))
        return path;
    if (path == "~" || path == "~/")
        return home;
    return joinRemotePath(home, path.substr(2));
}

} // namespace twinpane
