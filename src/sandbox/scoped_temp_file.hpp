#pragma once

#include <filesystem>
#include <string>

namespace pyfence::sandbox {

// A temporary file owned by one scope. Created with its initial content in the
// system temp directory; removed when the owner goes away, whichever way.
class ScopedTempFile {
public:
    // Throws std::system_error when the file cannot be created or written.
    explicit ScopedTempFile(const std::string& suffix = ".tmp",
                            const std::string& initial_content = "");
    ~ScopedTempFile();

    ScopedTempFile(ScopedTempFile&& other) noexcept;
    ScopedTempFile& operator=(ScopedTempFile&& other) noexcept;
    ScopedTempFile(const ScopedTempFile&) = delete;
    ScopedTempFile& operator=(const ScopedTempFile&) = delete;

    const std::filesystem::path& Path() const { return path_; }

private:
    void Release() noexcept;

    std::filesystem::path path_;
};

}  // namespace pyfence::sandbox
