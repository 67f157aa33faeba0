#include "capture/camera_device.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <set>

namespace asciicam {

namespace {

std::string to_lower_copy(std::string s) {
    for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

bool is_numeric(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

std::string read_first_line(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::string line;
    if (in) std::getline(in, line);
    while (!line.empty() && std::isspace(static_cast<unsigned char>(line.back()))) {
        line.pop_back();
    }
    return line;
}

}

std::vector<CameraInfo> list_cameras(const std::string& sysfs_root) {
    std::vector<CameraInfo> found;
    std::error_code ec;
    std::filesystem::directory_iterator it(sysfs_root, ec);
    if (ec) return found;

    for (const auto& entry : it) {
        const std::string node = entry.path().filename().string();
        if (node.rfind("video", 0) != 0) continue;
        const std::string suffix = node.substr(5);
        if (!is_numeric(suffix)) continue;

        CameraInfo info;
        info.index = std::stoi(suffix);
        info.name = read_first_line(entry.path() / "name");
        if (info.name.empty()) info.name = node;
        found.push_back(info);
    }

    std::sort(found.begin(), found.end(),
              [](const CameraInfo& a, const CameraInfo& b) { return a.index < b.index; });

    // UVC cameras expose a metadata node with the same name as the capture
    // node; keep the lowest index, which is the capture one.
    std::vector<CameraInfo> cameras;
    std::set<std::string> seen;
    for (const auto& info : found) {
        const std::string lower = to_lower_copy(info.name);
        if (lower.find("virtual") != std::string::npos || lower.find("dummy") != std::string::npos) {
            continue;
        }
        if (!seen.insert(info.name).second) continue;
        cameras.push_back(info);
    }
    return cameras;
}

}
