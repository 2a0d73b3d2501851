#include "ovscp/RemotePath.hpp"
#include <vector>

namespace ovscp {

std::string joinRemotePath(const std::string& base, const std::string& name) {
    std::size_t start = 0;
    while (start < name.size() && name[start] == '/')
        ++start;
    const std::string tail = name.substr(start);
    if (base.empty())
        return tail;
    if (tail.empty())
        return base;
    if (base.back() == '/')
        return base + tail;
    return base + "/" + tail;
}

std::string cleanRemotePath(const std::string& path) {
    if (path.empty())
        return ".";
    const bool absolute = path.front() == '/';
    std::vector<std::string> parts;
    std::size_t i = 0;
    while (i <= path.size()) {
        std::size_t j = path.find('/', i);
        if (j == std::string::npos)
            j = path.size();
        const std::string seg = path.substr(i, j - i);
        if (seg.empty() || seg == ".") {
            // skip
        } else if (seg == "..") {
            if (!parts.empty() && parts.back() != "..")
                parts.pop_back();
            else if (!absolute)
                parts.push_back(seg);
        } else {
            parts.push_back(seg);
        }
        i = j + 1;
    }
    std::string out = absolute ? "/" : "";
    for (std::size_t k = 0; k < parts.size(); ++k) {
        if (k)
            out += '/';
        out += parts[k];
    }
    if (out.empty())
        return ".";
    return out;
}

std::string remoteBaseName(const std::string& path) {
    if (path.empty())
        return {};
    std::size_t end = path.size();
    while (end > 1 && path[end - 1] == '/')
        --end;
    if (end == 1 && path[0] == '/')
        return "/";
    const std::size_t slash = path.rfind('/', end - 1);
    if (slash == std::string::npos)
        return path.substr(0, end);
    return path.substr(slash + 1, end - slash - 1);
}

std::string remoteDirName(const std::string& path) {
    const std::string clean = cleanRemotePath(path);
    if (clean == "/")
        return "/";
    const std::size_t slash = clean.rfind('/');
    if (slash == std::string::npos)
        return ".";
    if (slash == 0)
        return "/";
    return clean.substr(0, slash);
}

bool isPlainEntryName(const std::string& name) {
    return !name.empty() && name != "." && name != ".." &&
           name.find('/') == std::string::npos;
}

} // namespace ovscp
