#include "persist/file_ops.hpp"

namespace persist {

FileOpResult PosixFileOps::remove(const std::filesystem::path& p) noexcept {
    std::error_code ec;
    const bool removed = std::filesystem::remove(p, ec);
    if (ec) {
        return {false, ec};
    }
    if (!removed) {
        return {false, std::make_error_code(std::errc::no_such_file_or_directory)};
    }
    return {true, {}};
}

FileOpResult PosixFileOps::copy_overwrite(const std::filesystem::path& from,
                                          const std::filesystem::path& to) noexcept {
    std::error_code ec;
    std::filesystem::copy_file(from, to, std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
        return {false, ec};
    }
    return {true, {}};
}

FileOpResult PosixFileOps::rename(const std::filesystem::path& from,
                                  const std::filesystem::path& to) noexcept {
    std::error_code ec;
    std::filesystem::rename(from, to, ec);
    if (ec) {
        return {false, ec};
    }
    return {true, {}};
}

FileOpResult PosixFileOps::ensure_dir(const std::filesystem::path& dir) noexcept {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        return {false, ec};
    }
    return {true, {}};
}

} // namespace persist
