#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include "events/action.hpp"
#include "runtime/runtime.hpp"

namespace agentbox::runtime {

// Filesystem operations confined to one directory tree. Every path is
// resolved against the root and rejected with PathEscapeError when its
// normalised form lands outside it, symlinks included.
// Throws FileAccessError when `path` has an extension outside `allowed`.
// Paths without an extension and an empty allow-list always pass.
void CheckAllowedExtension(const std::filesystem::path& path, const std::vector<std::string>& allowed);

class WorkspaceFs {
public:
    struct Policy {
        std::size_t max_file_size = 100 * 1024 * 1024;
        // Empty means every extension is accepted.
        std::vector<std::string> allowed_extensions;
    };

    WorkspaceFs(const std::filesystem::path& root, Policy policy);

    const std::filesystem::path& root() const { return root_; }

    std::filesystem::path Resolve(const std::string& path) const;
    std::string Relative(const std::filesystem::path& resolved) const;

    std::string Read(const std::string& path) const;
    std::size_t Write(const std::string& path, const std::string& content) const;
    std::vector<FileInfo> List(const std::string& path) const;
    void Remove(const std::string& path) const;
    void MakeDirectory(const std::string& path) const;
    std::vector<SearchMatch> Search(const events::SearchAction& search) const;

private:
    std::filesystem::path root_;
    Policy policy_;
};

}  // namespace agentbox::runtime
