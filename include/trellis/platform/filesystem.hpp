#pragma once

/** \file filesystem.hpp
 *  \brief POSIX file primitives used by the log and the stores.
 *
 * Provides:
 * - RAII file descriptor ownership
 * - positioned read/write that loop over short transfers
 * - file and directory fsync
 * - durable whole-file replacement (tmp, fsync, rename, directory fsync)
 */

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <expected>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include "trellis/error.hpp"

namespace trellis::platform {

/** \brief File handle wrapper for RAII.
 *
 * Automatically closes file on destruction.
 */
class FileHandle {
public:
    using native_handle_type = int;

    FileHandle() noexcept = default;

    explicit FileHandle(native_handle_type handle) noexcept
        : handle_(handle) {}

    ~FileHandle() {
        close();
    }

    FileHandle(FileHandle&& other) noexcept
        : handle_(other.handle_) {
        other.handle_ = -1;
    }

    auto operator=(FileHandle&& other) noexcept -> FileHandle& {
        if (this != &other) {
            close();
            handle_ = other.handle_;
            other.handle_ = -1;
        }
        return *this;
    }

    FileHandle(const FileHandle&) = delete;
    auto operator=(const FileHandle&) -> FileHandle& = delete;

    [[nodiscard]] auto get() const noexcept -> native_handle_type { return handle_; }
    [[nodiscard]] auto is_valid() const noexcept -> bool { return handle_ >= 0; }

    auto close() noexcept -> void {
        if (is_valid()) {
            ::close(handle_);
            handle_ = -1;
        }
    }

private:
    native_handle_type handle_ = -1;
};

enum class OpenMode { read_only, read_write, create };

inline auto errno_message(std::string_view what, const std::filesystem::path& path) -> std::string {
    std::string m(what);
    m += " ";
    m += path.string();
    m += ": ";
    m += std::strerror(errno);
    return m;
}

/** \brief Open a file. `create` opens read-write and creates it when absent (never truncates). */
[[nodiscard]] inline auto open_file(const std::filesystem::path& path, OpenMode mode)
    -> std::expected<FileHandle, core::error> {
    int flags = O_CLOEXEC;
    switch (mode) {
        case OpenMode::read_only: flags |= O_RDONLY; break;
        case OpenMode::read_write: flags |= O_RDWR; break;
        case OpenMode::create: flags |= O_RDWR | O_CREAT; break;
    }
    const int fd = ::open(path.c_str(), flags, 0644);
    if (fd == -1) {
        const auto code = errno == ENOENT ? core::error_code::not_found : core::error_code::io_failed;
        return std::unexpected(core::error{code, errno_message("open failed", path), "platform.fs"});
    }
    return FileHandle(fd);
}

/** \brief Sync file data and metadata to disk. */
inline auto sync_file(const FileHandle& handle) noexcept -> bool {
    if (!handle.is_valid()) return false;
    return ::fsync(handle.get()) == 0;
}

/** \brief Best-effort directory sync so that creations and renames are durable. */
inline auto sync_directory(const std::filesystem::path& dir) noexcept -> void {
    const int fd = ::open(dir.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) return;
    (void)::fsync(fd);
    (void)::close(fd);
}

[[nodiscard]] inline auto get_file_size(const FileHandle& handle) noexcept -> std::optional<std::uint64_t> {
    struct stat st{};
    if (!handle.is_valid() || ::fstat(handle.get(), &st) != 0) return std::nullopt;
    return static_cast<std::uint64_t>(st.st_size);
}

/** \brief Positioned read; loops until `out` is full or EOF. Returns bytes read. */
inline auto read_at(const FileHandle& handle, std::span<std::uint8_t> out, std::uint64_t offset)
    -> std::expected<std::size_t, core::error> {
    std::size_t done = 0;
    while (done < out.size()) {
        const auto n = ::pread(handle.get(), out.data() + done, out.size() - done,
                               static_cast<off_t>(offset + done));
        if (n < 0) {
            if (errno == EINTR) continue;
            return std::unexpected(core::error{core::error_code::io_failed,
                                               std::string("pread failed: ") + std::strerror(errno), "platform.fs"});
        }
        if (n == 0) break;
        done += static_cast<std::size_t>(n);
    }
    return done;
}

/** \brief Positioned write of all bytes. */
inline auto write_at(const FileHandle& handle, std::span<const std::uint8_t> bytes, std::uint64_t offset)
    -> std::expected<void, core::error> {
    std::size_t done = 0;
    while (done < bytes.size()) {
        const auto n = ::pwrite(handle.get(), bytes.data() + done, bytes.size() - done,
                                static_cast<off_t>(offset + done));
        if (n < 0) {
            if (errno == EINTR) continue;
            return std::unexpected(core::error{core::error_code::io_failed,
                                               std::string("pwrite failed: ") + std::strerror(errno), "platform.fs"});
        }
        done += static_cast<std::size_t>(n);
    }
    return {};
}

inline auto truncate_file(const FileHandle& handle, std::uint64_t size) -> std::expected<void, core::error> {
    if (::ftruncate(handle.get(), static_cast<off_t>(size)) != 0) {
        return std::unexpected(core::error{core::error_code::io_failed,
                                           std::string("ftruncate failed: ") + std::strerror(errno), "platform.fs"});
    }
    return {};
}

/** \brief Durably replace `path` with `contents`.
 *
 * 1) write `<path>.tmp`, 2) fsync it, 3) rename over `path`, 4) fsync the directory.
 * A crash leaves either the old or the new file, never a mix.
 */
inline auto atomic_write_file(const std::filesystem::path& path, std::span<const std::uint8_t> contents)
    -> std::expected<void, core::error> {
    auto tmp = path;
    tmp += ".tmp";
    {
        const int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
        if (fd < 0) {
            return std::unexpected(core::error{core::error_code::io_failed, errno_message("tmp open failed", tmp), "platform.fs"});
        }
        FileHandle h(fd);
        if (auto w = write_at(h, contents, 0); !w) {
            std::error_code rec; (void)std::filesystem::remove(tmp, rec);
            return w;
        }
        if (!sync_file(h)) {
            std::error_code rec; (void)std::filesystem::remove(tmp, rec);
            return std::unexpected(core::error{core::error_code::io_failed, errno_message("tmp fsync failed", tmp), "platform.fs"});
        }
    }
    std::error_code ec;
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        (void)std::filesystem::remove(tmp, ec);
        return std::unexpected(core::error{core::error_code::io_failed, "rename failed: " + path.string(), "platform.fs"});
    }
    sync_directory(path.parent_path());
    return {};
}

inline auto atomic_write_file(const std::filesystem::path& path, std::string_view text)
    -> std::expected<void, core::error> {
    return atomic_write_file(path, std::span<const std::uint8_t>(
        reinterpret_cast<const std::uint8_t*>(text.data()), text.size()));
}

} // namespace trellis::platform
