#include "Utils.hpp"
#include <sys/stat.h>
#include <sys/types.h>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace prism {
namespace utils {

std::string get_timestamp_string(const std::string& format) {
    auto now = std::time(nullptr);
    std::tm tm{};
    localtime_r(&now, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, format.c_str());
    return oss.str();
}

bool ensure_directory_exists(const std::string& path) {
    if (path.empty()) return true;

    struct stat info;
    if (stat(path.c_str(), &info) == 0) {
        return S_ISDIR(info.st_mode);
    }

    // Try to create directory
    return mkdir(path.c_str(), 0755) == 0;
}

std::string parent_directory(const std::string& path) {
    const auto pos = path.find_last_of('/');
    if (pos == std::string::npos || pos == 0) return "";
    return path.substr(0, pos);
}

cv::Rect clamp_rect(const cv::Rect& rect, const cv::Size& bounds) {
    return rect & cv::Rect(0, 0, bounds.width, bounds.height);
}

cv::Rect default_forehead_rect(const cv::Size& face_size) {
    const int x = static_cast<int>(face_size.width * 0.30);
    const int y = static_cast<int>(face_size.height * 0.10);
    const int w = static_cast<int>(face_size.width * 0.40);
    const int h = static_cast<int>(face_size.height * 0.20);
    return clamp_rect(cv::Rect(x, y, w, h), face_size);
}

} // namespace utils
} // namespace prism
