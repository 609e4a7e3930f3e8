#include "boxpath/fs/metadata.hpp"

#include <chrono>

namespace boxpath::fs {

namespace {

auto type_from_mode(mode_t mode) -> FileType {
    if (S_ISREG(mode)) return FileType::Regular;
    if (S_ISDIR(mode)) return FileType::Directory;
    if (S_ISLNK(mode)) return FileType::Symlink;
    if (S_ISBLK(mode)) return FileType::Block;
    if (S_ISCHR(mode)) return FileType::Character;
    if (S_ISFIFO(mode)) return FileType::Fifo;
    if (S_ISSOCK(mode)) return FileType::Socket;
    return FileType::Unknown;
}

/// st_mtim is a system_clock instant; file_time_type uses its own epoch.
auto to_file_time(const struct timespec& ts) -> std::filesystem::file_time_type {
    auto since_epoch = std::chrono::seconds(ts.tv_sec) + std::chrono::nanoseconds(ts.tv_nsec);
    auto sys_time = std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(since_epoch));
    using file_clock = std::filesystem::file_time_type::clock;
    return std::chrono::time_point_cast<std::filesystem::file_time_type::duration>(
        file_clock::from_sys(sys_time));
}

} // anonymous namespace

auto Metadata::from_stat(const struct stat& st) -> Metadata {
    Metadata meta;
    meta.type = type_from_mode(st.st_mode);
    meta.size = static_cast<std::uintmax_t>(st.st_size);
    meta.mode = static_cast<std::uint32_t>(st.st_mode & 07777);
    meta.hard_links = static_cast<std::uintmax_t>(st.st_nlink);
    meta.uid = static_cast<std::uint32_t>(st.st_uid);
    meta.gid = static_cast<std::uint32_t>(st.st_gid);
    meta.device = st.st_dev;
    meta.inode = st.st_ino;
    meta.modified = to_file_time(st.st_mtim);
    return meta;
}

auto file_type_to_string(FileType type) -> std::string_view {
    switch (type) {
        case FileType::Regular: return "regular";
        case FileType::Directory: return "directory";
        case FileType::Symlink: return "symlink";
        case FileType::Block: return "block";
        case FileType::Character: return "character";
        case FileType::Fifo: return "fifo";
        case FileType::Socket: return "socket";
        case FileType::Unknown: return "unknown";
    }
    return "unknown";
}

} // namespace boxpath::fs
