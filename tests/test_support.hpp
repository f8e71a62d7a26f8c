#pragma once

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include "utils/encoding.hpp"

namespace agentbox::testing {

// Scratch directory removed on destruction.
class TempWorkspace {
public:
    explicit TempWorkspace(const std::string& tag = "ws") {
        root_ = std::filesystem::temp_directory_path() /
                ("agentbox_test_" + tag + "_" + utils::RandomHex(6));
        std::filesystem::create_directories(root_);
        root_ = std::filesystem::canonical(root_);
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }

    void Write(const std::string& relative, const std::string& content) const {
        const auto path = root_ / relative;
        std::filesystem::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary);
        out << content;
    }

    std::string Read(const std::string& relative) const {
        std::ifstream in(root_ / relative, std::ios::binary);
        std::ostringstream buffer;
        buffer << in.rdbuf();
        return buffer.str();
    }

private:
    std::filesystem::path root_;
};

}  // namespace agentbox::testing
