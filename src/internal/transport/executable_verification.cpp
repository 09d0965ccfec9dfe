#include "executable_verification.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <memory>
#include <openssl/evp.h>
#include <sstream>
#include <toolhost/errors.hpp>

namespace toolhost::internal
{

std::optional<std::string> compute_file_sha256(const std::filesystem::path& file_path)
{
    std::ifstream file(file_path, std::ios::binary);
    if (!file)
        return std::nullopt;

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx || !EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr))
        return std::nullopt;

    const size_t BUFFER_SIZE = 8192;
    char buffer[BUFFER_SIZE];
    while (file.read(buffer, BUFFER_SIZE) || file.gcount() > 0)
        if (!EVP_DigestUpdate(ctx.get(), buffer, static_cast<size_t>(file.gcount())))
            return std::nullopt;

    if (file.bad())
        return std::nullopt;

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_length = 0;
    if (!EVP_DigestFinal_ex(ctx.get(), hash, &hash_length))
        return std::nullopt;

    std::ostringstream oss;
    for (unsigned int i = 0; i < hash_length; ++i)
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);

    return oss.str();
}

bool verify_executable_path_allowed(const std::string& executable_path,
                                    const std::vector<std::string>& allowed_paths)
{
    if (allowed_paths.empty())
        return true;

    // Compare canonical forms so symlinked install locations still match
    namespace fs = std::filesystem;
    std::error_code ec;
    fs::path normalized = fs::canonical(executable_path, ec);
    if (ec)
        normalized = fs::path(executable_path);

    for (const auto& allowed : allowed_paths)
    {
        fs::path normalized_allowed = fs::canonical(allowed, ec);
        if (ec)
            normalized_allowed = fs::path(allowed);

        if (normalized == normalized_allowed)
            return true;
    }

    return false;
}

bool verify_executable_hash(const std::filesystem::path& executable_path,
                            const std::optional<std::string>& expected_hash,
                            std::string& error_message)
{
    if (!expected_hash)
        return true;

    if (expected_hash->length() != 64)
    {
        error_message = "Invalid hash format: expected 64-character hex string";
        return false;
    }

    if (!std::all_of(expected_hash->begin(), expected_hash->end(),
                     [](unsigned char c) { return std::isxdigit(c) != 0; }))
    {
        error_message = "Invalid hash format: contains non-hex characters";
        return false;
    }

    auto actual_hash = compute_file_sha256(executable_path);
    if (!actual_hash)
    {
        error_message = "Failed to compute file hash";
        return false;
    }

    std::string expected_lower = *expected_hash;
    std::transform(expected_lower.begin(), expected_lower.end(), expected_lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (expected_lower != *actual_hash)
    {
        error_message =
            "Executable hash mismatch: expected " + expected_lower + " but got " + *actual_hash;
        return false;
    }

    return true;
}

void verify_executable(const std::string& executable_path,
                       const std::vector<std::string>& allowed_paths,
                       const std::optional<std::string>& expected_hash)
{
    std::error_code ec;
    if (!std::filesystem::exists(executable_path, ec))
        throw ExecutableNotFoundError("Executable does not exist: " + executable_path);

    if (!verify_executable_path_allowed(executable_path, allowed_paths))
        throw ExecutableNotFoundError("Executable not in allowlist: " + executable_path +
                                      ". Configure allowed_executable_paths.");

    std::string error_msg;
    if (!verify_executable_hash(executable_path, expected_hash, error_msg))
        throw ExecutableNotFoundError("Executable integrity check failed: " + error_msg);
}

} // namespace toolhost::internal
