#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace toolhost::internal
{

/// Compute SHA256 hash of a file
/// Returns hex-encoded SHA256 hash (64 characters) or std::nullopt on error
std::optional<std::string> compute_file_sha256(const std::filesystem::path& file_path);

/// Verify the executable path is in the allowlist
/// If allowlist is empty, returns true (no restriction)
bool verify_executable_path_allowed(const std::string& executable_path,
                                    const std::vector<std::string>& allowed_paths);

/// Verify the executable hash matches the expected SHA256
/// If expected_hash is nullopt, returns true (no hash check)
bool verify_executable_hash(const std::filesystem::path& executable_path,
                            const std::optional<std::string>& expected_hash,
                            std::string& error_message);

/// Existence, allowlist and hash checks together.
/// Throws ExecutableNotFoundError describing the first failed check.
void verify_executable(const std::string& executable_path,
                       const std::vector<std::string>& allowed_paths,
                       const std::optional<std::string>& expected_hash);

} // namespace toolhost::internal
