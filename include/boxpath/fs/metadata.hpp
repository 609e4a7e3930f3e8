#pragma once

#include <cstdint>
#include <filesystem>
#include <string_view>
#include <sys/stat.h>
#include <sys/types.h>

namespace boxpath::fs {

enum class FileType {
    Regular,
    Directory,
    Symlink,
    Block,
    Character,
    Fifo,
    Socket,
    Unknown,
};

/// Stat-like record returned by BoxedPath::stat().
struct Metadata {
    FileType type = FileType::Unknown;
    std::uintmax_t size = 0;
    std::uint32_t mode = 0;  // permission bits only (07777)
    std::uintmax_t hard_links = 0;
    std::uint32_t uid = 0;
    std::uint32_t gid = 0;
    dev_t device = 0;
    ino_t inode = 0;
    std::filesystem::file_time_type modified{};

    [[nodiscard]] auto is_directory() const noexcept -> bool { return type == FileType::Directory; }
    [[nodiscard]] auto is_regular_file() const noexcept -> bool { return type == FileType::Regular; }

    [[nodiscard]] static auto from_stat(const struct stat& st) -> Metadata;
};

auto file_type_to_string(FileType type) -> std::string_view;

} // namespace boxpath::fs
