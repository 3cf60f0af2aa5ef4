// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/disk/error.hpp>
#include <cerrno>
#include <string>

namespace ferry::disk {

namespace {

struct LocalCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "ferry::local";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<LocalErrc>(ev)) {
            case LocalErrc::missing:                  return "Local file does not exist";
            case LocalErrc::no_permission:            return "No permission for local file";
            case LocalErrc::out_of_space:             return "No space left for received file";
            case LocalErrc::bad_path:                 return "File name not usable as a local path";
            case LocalErrc::name_taken:               return "Local name already taken";
            case LocalErrc::download_dir_unavailable: return "Download directory cannot be created";
            case LocalErrc::write_failed:             return "Writing received data failed";
            case LocalErrc::read_failed:              return "Reading local file failed";
            case LocalErrc::seek_failed:              return "Repositioning in local file failed";
            case LocalErrc::not_open:                 return "Local file not open";
            default:                                  return "Unknown local file error";
        }
    }
};

} // namespace

const std::error_category& local_category() noexcept {
    static LocalCategory category;
    return category;
}

std::error_code from_errno(int err, LocalErrc fallback) noexcept {
    switch (err) {
        case ENOENT:
            return LocalErrc::missing;
        case EACCES:
        case EPERM:
        case EROFS:
            return LocalErrc::no_permission;
        case ENOSPC:
        case EDQUOT:
        case EFBIG:
            return LocalErrc::out_of_space;
        case ENAMETOOLONG:
        case ENOTDIR:
        case EISDIR:
        case EINVAL:
            return LocalErrc::bad_path;
        case EEXIST:
            return LocalErrc::name_taken;
        case EBADF:
            return LocalErrc::not_open;
        default:
            return fallback;
    }
}

} // namespace ferry::disk
