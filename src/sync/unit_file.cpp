#include "unitsync/sync/unit_file.hpp"

#include <openssl/evp.h>

#include <cerrno>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <system_error>

namespace unitsync::sync {
namespace fs = std::filesystem;

namespace {

using DigestContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

std::error_code last_errno() {
    return std::error_code(errno, std::generic_category());
}

std::string digest_to_hex(const unsigned char* digest, unsigned int length) {
    std::ostringstream oss;
    for (unsigned int i = 0; i < length; ++i) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(digest[i]);
    }
    return oss.str();
}

DigestContext new_sha256() {
    DigestContext ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (ctx && EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        ctx.reset();
    }
    return ctx;
}

Result<Fingerprint> finish(EVP_MD_CTX* ctx, const std::string& unit) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx, digest, &length) != 1) {
        return Fail<Fingerprint>(ErrorKind::Read, unit, "SHA-256 finalization failed");
    }
    return Ok(digest_to_hex(digest, length));
}

fs::path staging_path_for(const fs::path& destination) {
    return destination.parent_path() / ("." + destination.filename().string() + ".unitsync-tmp");
}

} // namespace

Result<Fingerprint> fingerprint_file(const fs::path& path, const std::string& unit) {
    std::error_code ec;
    const auto status = fs::status(path, ec);
    if (status.type() == fs::file_type::not_found) {
        return Fail<Fingerprint>(ErrorKind::Read, unit, "no such file " + path.string(),
                                 std::make_error_code(std::errc::no_such_file_or_directory));
    }
    if (ec) {
        return Fail<Fingerprint>(ErrorKind::Read, unit, "failed to stat " + path.string(), ec);
    }
    if (!fs::is_regular_file(status)) {
        return Fail<Fingerprint>(ErrorKind::Read, unit, "not a regular file: " + path.string());
    }

    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return Fail<Fingerprint>(ErrorKind::Read, unit, "failed to open " + path.string(), last_errno());
    }

    auto ctx = new_sha256();
    if (!ctx) {
        return Fail<Fingerprint>(ErrorKind::Read, unit, "SHA-256 initialization failed");
    }

    char buffer[4096];
    while (input.read(buffer, sizeof(buffer)) || input.gcount() > 0) {
        const auto count = static_cast<std::size_t>(input.gcount());
        if (EVP_DigestUpdate(ctx.get(), buffer, count) != 1) {
            return Fail<Fingerprint>(ErrorKind::Read, unit, "SHA-256 update failed");
        }
    }
    if (input.bad()) {
        return Fail<Fingerprint>(ErrorKind::Read, unit, "failed to read " + path.string());
    }

    return finish(ctx.get(), unit);
}

Result<Fingerprint> fingerprint_bytes(std::string_view data) {
    auto ctx = new_sha256();
    if (!ctx) {
        return Fail<Fingerprint>(ErrorKind::Read, {}, "SHA-256 initialization failed");
    }
    if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
        return Fail<Fingerprint>(ErrorKind::Read, {}, "SHA-256 update failed");
    }
    return finish(ctx.get(), {});
}

Result<void> copy_unit_file(const fs::path& source, const fs::path& destination, const std::string& unit) {
    std::ifstream input(source, std::ios::binary);
    if (!input) {
        return Fail<void>(ErrorKind::Copy, unit, "failed to open source file " + source.string(), last_errno());
    }

    const auto staging = staging_path_for(destination);
    auto discard_staging = [&staging]() {
        std::error_code ignored;
        fs::remove(staging, ignored);
    };

    {
        std::ofstream output(staging, std::ios::binary | std::ios::trunc);
        if (!output) {
            return Fail<void>(ErrorKind::Copy, unit, "failed to create " + staging.string(), last_errno());
        }

        char buffer[4096];
        while (input.read(buffer, sizeof(buffer)) || input.gcount() > 0) {
            output.write(buffer, input.gcount());
            if (!output) {
                discard_staging();
                return Fail<void>(ErrorKind::Copy, unit, "failed to write " + staging.string());
            }
        }
        if (input.bad()) {
            discard_staging();
            return Fail<void>(ErrorKind::Copy, unit, "failed to read " + source.string());
        }

        output.flush();
        if (!output) {
            discard_staging();
            return Fail<void>(ErrorKind::Copy, unit, "failed to flush " + staging.string());
        }
    }

    std::error_code ec;
    fs::rename(staging, destination, ec);
    if (ec) {
        discard_staging();
        return Fail<void>(ErrorKind::Copy, unit, "failed to move unit file into " + destination.string(), ec);
    }

    return Ok();
}

Result<void> remove_unit_file(const fs::path& path, const std::string& unit) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        return Fail<void>(ErrorKind::Remove, unit, "failed to remove " + path.string(), ec);
    }
    return Ok();
}

bool is_editor_artifact(std::string_view name) noexcept {
    constexpr std::string_view swap_suffix = ".swp";
    if (name.size() >= swap_suffix.size() &&
        name.compare(name.size() - swap_suffix.size(), swap_suffix.size(), swap_suffix) == 0) {
        return true;
    }
    return !name.empty() && name.back() == '~';
}

} // namespace unitsync::sync
