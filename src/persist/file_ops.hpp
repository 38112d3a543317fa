#pragma once

#include <filesystem>
#include <system_error>

namespace persist {

struct FileOpResult {
    bool ok{false};
    std::error_code error{};
};

// Every mutation the archive stages perform goes through this seam so that individual
// failures can be scripted in tests.
class IFileOps {
public:
    virtual ~IFileOps() = default;
    virtual FileOpResult remove(const std::filesystem::path& p) noexcept = 0;
    virtual FileOpResult copy_overwrite(const std::filesystem::path& from,
                                        const std::filesystem::path& to) noexcept = 0;
    virtual FileOpResult rename(const std::filesystem::path& from,
                                const std::filesystem::path& to) noexcept = 0;
    virtual FileOpResult ensure_dir(const std::filesystem::path& dir) noexcept = 0;
};

class PosixFileOps : public IFileOps {
public:
    FileOpResult remove(const std::filesystem::path& p) noexcept override;
    FileOpResult copy_overwrite(const std::filesystem::path& from,
                                const std::filesystem::path& to) noexcept override;
    FileOpResult rename(const std::filesystem::path& from,
                        const std::filesystem::path& to) noexcept override;
    FileOpResult ensure_dir(const std::filesystem::path& dir) noexcept override;
};

} // namespace persist
