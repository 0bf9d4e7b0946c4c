#include "sandbox/scoped_temp_file.hpp"

#include <cerrno>
#include <cstdlib>
#include <system_error>
#include <unistd.h>
#include <vector>

#include "utils/logging.hpp"

namespace pyfence::sandbox {
namespace {

void WriteAll(int fd, const std::string& content) {
    std::size_t written = 0;
    while (written < content.size()) {
        const auto n = ::write(fd, content.data() + written, content.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw std::system_error(errno, std::generic_category(), "write temp file");
        }
        written += static_cast<std::size_t>(n);
    }
}

}  // namespace

ScopedTempFile::ScopedTempFile(const std::string& suffix, const std::string& initial_content) {
    const auto pattern = (std::filesystem::temp_directory_path() / ("pyfence_XXXXXX" + suffix)).string();
    std::vector<char> name(pattern.begin(), pattern.end());
    name.push_back('\0');

    const int fd = ::mkstemps(name.data(), static_cast<int>(suffix.size()));
    if (fd < 0) {
        throw std::system_error(errno, std::generic_category(), "create temp file " + pattern);
    }
    path_ = std::filesystem::path(name.data());

    try {
        WriteAll(fd, initial_content);
    } catch (const std::system_error&) {
        ::close(fd);
        Release();
        throw;
    }
    ::close(fd);
}

ScopedTempFile::~ScopedTempFile() {
    Release();
}

ScopedTempFile::ScopedTempFile(ScopedTempFile&& other) noexcept
    : path_(std::move(other.path_)) {
    other.path_.clear();
}

ScopedTempFile& ScopedTempFile::operator=(ScopedTempFile&& other) noexcept {
    if (this != &other) {
        Release();
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

void ScopedTempFile::Release() noexcept {
    if (path_.empty()) {
        return;
    }
    std::error_code ec;
    std::filesystem::remove(path_, ec);
    if (ec) {
        utils::Log(utils::LogLevel::kWarn, "sandbox", "temp file not removed", {
            {"path", path_.string()},
            {"error", ec.message()}
        });
    }
    path_.clear();
}

}  // namespace pyfence::sandbox
