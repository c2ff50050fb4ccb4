/**
 * @file scratch_environment.cpp
 * @brief ScratchEnvironment implementation.
 * @author CodeVerdict contributors
 */

#include "sandbox/scratch_environment.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <string>
#include <system_error>
#include <vector>

namespace code_verdict {

namespace {

/// Give the owner rwx on @p dir and on every directory below it. Symlinks are not followed.
void restore_directory_access(const std::filesystem::path& dir, std::error_code& ec) {
    namespace fs = std::filesystem;
    fs::permissions(dir, fs::perms::owner_all, fs::perm_options::add, ec);
    if (ec) return;

    for (fs::directory_iterator it{dir, ec}; !ec && it != fs::directory_iterator{}; it.increment(ec)) {
        std::error_code status_ec;
        if (it->symlink_status(status_ec).type() != fs::file_type::directory) continue;
        restore_directory_access(it->path(), ec);
    }
}

}  // namespace

Result<ScratchEnvironment> ScratchEnvironment::provision(const std::filesystem::path& root) {
    std::error_code ec;
    std::filesystem::create_directories(root, ec);
    if (ec) {
        return Error{ErrorCode::Io, "Cannot create scratch root '" + root.string()
                                        + "': " + ec.message()};
    }

    auto canonical_root = std::filesystem::canonical(root, ec);
    if (ec) {
        return Error{ErrorCode::Io, "Cannot resolve scratch root '" + root.string()
                                        + "': " + ec.message()};
    }

    // mkdtemp creates the directory with mode 0700 and a unique name.
    std::string pattern = (canonical_root / "exec-XXXXXX").string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');
    if (::mkdtemp(buffer.data()) == nullptr) {
        return Error{ErrorCode::Io, "mkdtemp failed under '" + canonical_root.string()
                                        + "': " + std::strerror(errno)};
    }
    return ScratchEnvironment{std::filesystem::path{buffer.data()}};
}

ScratchEnvironment::~ScratchEnvironment() {
    teardown();
}

ScratchEnvironment::ScratchEnvironment(ScratchEnvironment&& other) noexcept
    : path_(std::move(other.path_)) {
    other.path_.clear();
}

ScratchEnvironment& ScratchEnvironment::operator=(ScratchEnvironment&& other) noexcept {
    if (this != &other) {
        teardown();
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

Result<void> ScratchEnvironment::remove() {
    if (path_.empty()) return {};
    const std::filesystem::path path = std::move(path_);
    path_.clear();

    std::error_code access_ec;
    restore_directory_access(path, access_ec);

    std::error_code ec;
    std::filesystem::remove_all(path, ec);
    std::error_code exists_ec;
    if (!ec && !std::filesystem::exists(path, exists_ec)) return {};

    std::string reason = ec ? ec.message() : "directory still present";
    if (access_ec) reason += " (restoring permissions: " + access_ec.message() + ")";
    return Error{ErrorCode::Io, "Cannot remove scratch '" + path.string() + "': " + reason};
}

void ScratchEnvironment::teardown() noexcept {
    if (path_.empty()) return;
    std::error_code ec;
    restore_directory_access(path_, ec);
    std::filesystem::remove_all(path_, ec);
    path_.clear();
}

bool ScratchEnvironment::contains(const std::filesystem::path& candidate) const {
    if (path_.empty() || !candidate.is_absolute()) return false;
    std::error_code ec;
    auto resolved = std::filesystem::weakly_canonical(candidate, ec);
    if (ec) return false;
    return path_is_within(path_, resolved);
}

bool path_is_within(const std::filesystem::path& base, const std::filesystem::path& candidate) {
    auto normal_base = base.lexically_normal();
    if (!normal_base.has_filename()) normal_base = normal_base.parent_path();
    auto normal_candidate = candidate.lexically_normal();

    auto [base_it, cand_it] = std::mismatch(normal_base.begin(), normal_base.end(),
                                            normal_candidate.begin(), normal_candidate.end());
    return base_it == normal_base.end();
}

}  // namespace code_verdict
