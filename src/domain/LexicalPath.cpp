#include "domain/LexicalPath.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>

namespace linkwalker::domain::lexical {

namespace fs = std::filesystem;

namespace {
    bool IsDriveRooted(const std::string& path) {
        return path.size() >= 2 && std::isalpha(static_cast<unsigned char>(path[0])) && path[1] == ':';
    }

    char DriveLetter(const std::string& path) {
        return static_cast<char>(std::tolower(static_cast<unsigned char>(path[0])));
    }
}

std::string Normalize(const std::string& path) {
    if (path.empty()) return ".";

    std::string unified = path;
    std::replace(unified.begin(), unified.end(), '\\', '/');

    std::string normal = fs::path(unified).lexically_normal().generic_string();
    while (normal.size() > 1 && normal.back() == '/') {
        // Keep "C:/" intact.
        if (normal.size() == 3 && IsDriveRooted(normal)) break;
        normal.pop_back();
    }
    return normal.empty() ? "." : normal;
}

bool IsAbsolute(const std::string& path) {
    if (path.empty()) return false;
    if (path[0] == '/' || path[0] == '\\') return true;
    return IsDriveRooted(path) && path.size() >= 3 && (path[2] == '/' || path[2] == '\\');
}

std::string MakeAbsolute(const std::string& path) {
    if (IsAbsolute(path)) return Normalize(path);
    return Normalize(Join(fs::current_path().generic_string(), path));
}

std::string Join(const std::string& head, const std::string& tail) {
    if (head.empty() || IsAbsolute(tail)) return tail;
    if (tail.empty()) return head;
    if (head.back() == '/' || head.back() == '\\') return head + tail;
    return head + "/" + tail;
}

std::string DirName(const std::string& path) {
    std::string unified = path;
    std::replace(unified.begin(), unified.end(), '\\', '/');
    size_t slash = unified.find_last_of('/');
    if (slash == std::string::npos) return "";
    if (slash == 0) return "/";
    return unified.substr(0, slash);
}

std::optional<std::string> Relative(const std::string& path, const std::string& base) {
    std::string absPath = MakeAbsolute(path);
    std::string absBase = MakeAbsolute(base);

    bool pathDrive = IsDriveRooted(absPath);
    bool baseDrive = IsDriveRooted(absBase);
    if (pathDrive != baseDrive) return std::nullopt;
    if (pathDrive && DriveLetter(absPath) != DriveLetter(absBase)) return std::nullopt;
    if (pathDrive) {
        // Compare below the drive so "c:" and "C:" agree.
        absPath = absPath.substr(2);
        absBase = absBase.substr(2);
    }

    fs::path rel = fs::path(absPath).lexically_relative(fs::path(absBase));
    if (rel.empty()) return std::nullopt;
    return rel.generic_string();
}

bool EscapesBase(const std::string& relativePath) {
    return relativePath.rfind("..", 0) == 0;
}

std::string ComparisonKey(const std::string& path) {
    std::string key = Normalize(path);
    std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c){ return std::tolower(c); });
    return key;
}

} // namespace linkwalker::domain::lexical
