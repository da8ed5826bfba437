#pragma once

#include <cstdio>
#include <fstream>
#include <string>

#include <unistd.h>

namespace plugctl::testing {

/// File under /tmp holding `contents`, removed on destruction.
class TempFile {
public:
    TempFile(const std::string& tag, const std::string& contents) {
        path_ = "/tmp/plugctl-" + tag + "-" + std::to_string(::getpid()) + ".json";
        std::ofstream out(path_, std::ios::trunc);
        out << contents;
    }

    ~TempFile() { std::remove(path_.c_str()); }

    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

} // namespace plugctl::testing
