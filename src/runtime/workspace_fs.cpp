#include "runtime/workspace_fs.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>

#include <fnmatch.h>
#include <sys/stat.h>

#include "utils/common.hpp"

namespace agentbox::runtime {
namespace fs = std::filesystem;

namespace {

constexpr std::size_t kMaxSearchResults = 500;

std::string PermissionString(fs::perms perms) {
    auto bit = [perms](fs::perms flag, char c) {
        return (perms & flag) != fs::perms::none ? c : '-';
    };
    std::string out;
    out += bit(fs::perms::owner_read, 'r');
    out += bit(fs::perms::owner_write, 'w');
    out += bit(fs::perms::owner_exec, 'x');
    out += bit(fs::perms::group_read, 'r');
    out += bit(fs::perms::group_write, 'w');
    out += bit(fs::perms::group_exec, 'x');
    out += bit(fs::perms::others_read, 'r');
    out += bit(fs::perms::others_write, 'w');
    out += bit(fs::perms::others_exec, 'x');
    return out;
}

bool IsWithin(const fs::path& root, const fs::path& candidate) {
    auto root_it = root.begin();
    auto candidate_it = candidate.begin();
    for (; root_it != root.end(); ++root_it, ++candidate_it) {
        if (root_it->empty()) {
            // trailing separator on the root
            continue;
        }
        if (candidate_it == candidate.end() || *root_it != *candidate_it) {
            return false;
        }
    }
    return true;
}

bool ContainsCaseInsensitive(const std::string& haystack, const std::string& needle) {
    return utils::ToLower(haystack).find(utils::ToLower(needle)) != std::string::npos;
}

}  // namespace

WorkspaceFs::WorkspaceFs(const fs::path& root, Policy policy)
    : root_(fs::weakly_canonical(fs::absolute(root))),
      policy_(std::move(policy)) {}

fs::path WorkspaceFs::Resolve(const std::string& path) const {
    fs::path candidate = path.empty() ? fs::path(".") : fs::path(path);
    if (candidate.is_relative()) {
        candidate = root_ / candidate;
    }
    std::error_code ec;
    auto resolved = fs::weakly_canonical(candidate, ec);
    if (ec) {
        resolved = candidate.lexically_normal();
    }
    if (!IsWithin(root_, resolved)) {
        throw PathEscapeError("Path escapes workspace: " + path);
    }
    return resolved;
}

std::string WorkspaceFs::Relative(const fs::path& resolved) const {
    auto relative = resolved.lexically_relative(root_).generic_string();
    return relative.empty() ? "." : relative;
}

void CheckAllowedExtension(const fs::path& path, const std::vector<std::string>& allowed) {
    if (allowed.empty()) {
        return;
    }
    const auto extension = utils::ToLower(path.extension().string());
    if (extension.empty()) {
        return;
    }
    if (std::find(allowed.begin(), allowed.end(), extension) == allowed.end()) {
        throw FileAccessError("File extension not allowed: " + extension);
    }
}

std::string WorkspaceFs::Read(const std::string& path) const {
    const auto resolved = Resolve(path);
    std::error_code ec;
    if (!fs::exists(resolved, ec)) {
        throw FileAccessError("File not found: " + path);
    }
    if (fs::is_directory(resolved, ec)) {
        throw FileAccessError("Path is a directory: " + path);
    }
    const auto size = fs::file_size(resolved, ec);
    if (!ec && size > policy_.max_file_size) {
        throw FileAccessError("File too large: " + path + " (" + std::to_string(size) + " bytes)");
    }
    std::ifstream input(resolved, std::ios::binary);
    if (!input.is_open()) {
        throw FileAccessError("Permission denied: " + path);
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return buffer.str();
}

std::size_t WorkspaceFs::Write(const std::string& path, const std::string& content) const {
    const auto resolved = Resolve(path);
    CheckAllowedExtension(resolved, policy_.allowed_extensions);
    if (content.size() > policy_.max_file_size) {
        throw FileAccessError("Content too large: " + std::to_string(content.size()) + " bytes");
    }
    std::error_code ec;
    if (fs::is_directory(resolved, ec)) {
        throw FileAccessError("Path is a directory: " + path);
    }
    fs::create_directories(resolved.parent_path(), ec);
    if (ec) {
        throw FileAccessError("Cannot create parent directory for " + path + ": " + ec.message());
    }
    std::ofstream output(resolved, std::ios::binary | std::ios::trunc);
    if (!output.is_open()) {
        throw FileAccessError("Permission denied: " + path);
    }
    output << content;
    output.close();
    if (!output) {
        throw FileAccessError("Failed to write " + path);
    }
    return content.size();
}

std::vector<FileInfo> WorkspaceFs::List(const std::string& path) const {
    const auto resolved = Resolve(path);
    std::error_code ec;
    if (!fs::exists(resolved, ec)) {
        throw FileAccessError("Directory not found: " + path);
    }
    if (!fs::is_directory(resolved, ec)) {
        throw FileAccessError("Not a directory: " + path);
    }
    std::vector<FileInfo> files;
    for (const auto& entry : fs::directory_iterator(resolved, fs::directory_options::skip_permission_denied, ec)) {
        FileInfo info{};
        info.name = entry.path().filename().string();
        info.path = Relative(entry.path());
        info.is_directory = entry.is_directory(ec);
        struct stat st {};
        if (::stat(entry.path().c_str(), &st) == 0) {
            info.size = info.is_directory ? 0 : static_cast<std::uintmax_t>(st.st_size);
            info.modified = static_cast<double>(st.st_mtime);
        }
        info.permissions = PermissionString(entry.status(ec).permissions());
        files.push_back(std::move(info));
    }
    if (ec) {
        throw FileAccessError("Cannot list " + path + ": " + ec.message());
    }
    std::sort(files.begin(), files.end(), [](const FileInfo& a, const FileInfo& b) {
        return a.name < b.name;
    });
    return files;
}

void WorkspaceFs::Remove(const std::string& path) const {
    const auto resolved = Resolve(path);
    if (resolved == root_) {
        throw PathEscapeError("Refusing to delete the workspace root");
    }
    std::error_code ec;
    if (!fs::exists(fs::symlink_status(resolved, ec))) {
        throw FileAccessError("Path not found: " + path);
    }
    fs::remove_all(resolved, ec);
    if (ec) {
        throw FileAccessError("Failed to delete " + path + ": " + ec.message());
    }
}

void WorkspaceFs::MakeDirectory(const std::string& path) const {
    const auto resolved = Resolve(path);
    std::error_code ec;
    if (fs::exists(resolved, ec) && !fs::is_directory(resolved, ec)) {
        throw FileAccessError("Path exists and is not a directory: " + path);
    }
    fs::create_directories(resolved, ec);
    if (ec) {
        throw FileAccessError("Failed to create directory " + path + ": " + ec.message());
    }
}

std::vector<SearchMatch> WorkspaceFs::Search(const events::SearchAction& search) const {
    const auto base = Resolve(search.path.value_or("."));
    std::error_code ec;
    if (!fs::exists(base, ec)) {
        throw FileAccessError("Path not found: " + search.path.value_or("."));
    }

    std::vector<fs::path> candidates;
    if (fs::is_regular_file(base, ec)) {
        candidates.push_back(base);
    } else {
        fs::recursive_directory_iterator it(base, fs::directory_options::skip_permission_denied, ec);
        for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
            if (!it->is_regular_file(ec)) {
                continue;
            }
            // Links are searched only when their target stays inside the root.
            if (it->is_symlink(ec)) {
                const auto target = fs::weakly_canonical(it->path(), ec);
                if (ec || !IsWithin(root_, target)) {
                    ec.clear();
                    continue;
                }
            }
            candidates.push_back(it->path());
        }
    }
    std::sort(candidates.begin(), candidates.end());

    std::vector<SearchMatch> matches;
    for (const auto& file : candidates) {
        if (search.file_pattern &&
            ::fnmatch(search.file_pattern->c_str(), file.filename().c_str(), 0) != 0) {
            continue;
        }
        if (fs::file_size(file, ec) > policy_.max_file_size || ec) {
            continue;
        }
        std::ifstream input(file, std::ios::binary);
        if (!input.is_open()) {
            continue;
        }
        std::string line;
        int number = 0;
        while (std::getline(input, line)) {
            ++number;
            if (line.find('\0') != std::string::npos) {
                break;
            }
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            const bool hit = search.case_sensitive
                ? line.find(search.query) != std::string::npos
                : ContainsCaseInsensitive(line, search.query);
            if (hit) {
                matches.push_back({Relative(file), number, line});
                if (matches.size() >= kMaxSearchResults) {
                    return matches;
                }
            }
        }
    }
    return matches;
}

}  // namespace agentbox::runtime
