#pragma once

#include <cdd/hash.hpp>

#include <filesystem>
#include <fstream>
#include <string>

namespace cdd::testing {

namespace fs = std::filesystem;

class TempDir {
public:
    explicit TempDir(const std::string& prefix = "cdd_test_") {
        path_ = fs::temp_directory_path() / (prefix + cdd::random_hex_token(8));
        fs::create_directories(path_);
        // Resolve /tmp symlinks so comparisons against canonical paths hold
        path_ = fs::canonical(path_);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    std::string path() const { return path_.string(); }
    fs::path operator/(const std::string& rel) const { return path_ / rel; }

    // Write `content` to `rel`, creating parent directories
    std::string write(const std::string& rel, const std::string& content) const {
        fs::path p = path_ / rel;
        fs::create_directories(p.parent_path());
        std::ofstream out(p, std::ios::binary);
        out << content;
        return p.string();
    }

    std::string mkdir(const std::string& rel) const {
        fs::create_directories(path_ / rel);
        return (path_ / rel).string();
    }

private:
    fs::path path_;
};

} // namespace cdd::testing
