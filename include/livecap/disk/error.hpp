// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>
#include <string>

namespace livecap::disk {

enum class DiskErrc {
    success = 0,
    create_directory_failed,
    open_failed,
    write_error,
    read_error,
    invalid_manifest,
};

namespace detail {

struct DiskErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "livecap::disk";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<DiskErrc>(ev)) {
            case DiskErrc::success:                  return "Success";
            case DiskErrc::create_directory_failed:  return "Could not create directory";
            case DiskErrc::open_failed:              return "Could not open file";
            case DiskErrc::write_error:              return "Write error";
            case DiskErrc::read_error:               return "Read error";
            case DiskErrc::invalid_manifest:         return "Invalid capture manifest";
            default:                                 return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::DiskErrcCategory& disk_errc_category() noexcept {
    static detail::DiskErrcCategory category;
    return category;
}

inline std::error_code make_error_code(DiskErrc e) noexcept {
    return {static_cast<int>(e), disk_errc_category()};
}

} // namespace livecap::disk

namespace std {

template<>
struct is_error_code_enum<livecap::disk::DiskErrc> : true_type {};

} // namespace std
