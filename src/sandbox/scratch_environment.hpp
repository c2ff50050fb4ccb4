/**
 * @file scratch_environment.hpp
 * @brief Disposable per-execution working directory.
 * @author CodeVerdict contributors
 */

#pragma once

#include "core/result.hpp"

#include <filesystem>

namespace code_verdict {

/**
 * @brief A brand-new, private (0700) directory that exists for exactly one execution.
 *
 * The directory and everything below it is removed when the object is
 * destroyed, on every exit path. Move-only; a moved-from instance owns nothing.
 */
class ScratchEnvironment {
public:
    /// Create a fresh directory under @p root (created if missing).
    static Result<ScratchEnvironment> provision(const std::filesystem::path& root);

    ~ScratchEnvironment();

    ScratchEnvironment(ScratchEnvironment&& other) noexcept;
    ScratchEnvironment& operator=(ScratchEnvironment&& other) noexcept;
    ScratchEnvironment(const ScratchEnvironment&) = delete;
    ScratchEnvironment& operator=(const ScratchEnvironment&) = delete;

    /// Canonical absolute path of the directory.
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    /**
     * @brief Whether @p candidate names this directory or something below it.
     *
     * @p candidate must be absolute; it is canonicalized (symlinks of the
     * existing prefix resolved) before the comparison.
     */
    [[nodiscard]] bool contains(const std::filesystem::path& candidate) const;

    /**
     * @brief Remove the directory now instead of at destruction.
     *
     * Owner rwx is restored on every directory below the scratch first, since
     * candidate code may have revoked it. The instance owns nothing afterwards,
     * whether or not the removal succeeded.
     * @return Io error naming what was left behind.
     */
    [[nodiscard]] Result<void> remove();

    /// remove() without a report; used on destruction.
    void teardown() noexcept;

private:
    explicit ScratchEnvironment(std::filesystem::path path) : path_(std::move(path)) {}

    std::filesystem::path path_;
};

/**
 * @brief Lexical containment test on already-normalized absolute paths.
 */
[[nodiscard]] bool path_is_within(const std::filesystem::path& base,
                                  const std::filesystem::path& candidate);

}  // namespace code_verdict
