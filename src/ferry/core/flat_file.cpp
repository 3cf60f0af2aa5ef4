// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/core/flat_file.hpp>
#include <ferry/core/byte_order.hpp>
#include <algorithm>
#include <cctype>
#include <cstring>
#include <new>

namespace ferry::core {

namespace {

struct TypeEntry {
    std::string_view extension;
    std::string_view type_code;
    std::string_view creator_code;
};

constexpr TypeEntry TYPE_TABLE[] = {
    {"sit",        "SIT!", "SIT!"},
    {"pdf",        "PDF ", "CARO"},
    {"gif",        "GIFf", "ogle"},
    {"txt",        "TEXT", "ttxt"},
    {"zip",        "ZIP ", "SITx"},
    {"tgz",        "Gzip", "SITx"},
    {"hqx",        "TEXT", "SITx"},
    {"jpg",        "JPEG", "ogle"},
    {"jpeg",       "JPEG", "ogle"},
    {"img",        "rohd", "ddsk"},
    {"sea",        "APPL", "aust"},
    {"mov",        "MooV", "TVOD"},
    {"incomplete", "HTft", "HTLC"},
};

constexpr std::string_view DEFAULT_TYPE_CODE = "TEXT";
constexpr std::string_view DEFAULT_CREATOR_CODE = "TTXT";

constexpr std::string_view PLATFORM_TAG = "AMAC";
constexpr std::uint32_t PLATFORM_FLAGS = 0x00000100;

constexpr std::uint32_t SIDECAR_MAGIC = 0x00051607;
constexpr std::uint32_t SIDECAR_VERSION = 0x00020000;
constexpr std::uint32_t SIDECAR_RESOURCE_FORK_ID = 2;
constexpr std::size_t SIDECAR_ENTRIES_OFFSET = 26;     // magic + version + filler + count
constexpr std::size_t SIDECAR_ENTRY_SIZE = 12;

// INFO payload offsets
constexpr std::size_t INFO_TYPE_OFFSET = 4;
constexpr std::size_t INFO_CREATOR_OFFSET = 8;
constexpr std::size_t INFO_FLAGS_OFFSET = 12;
constexpr std::size_t INFO_PLATFORM_FLAGS_OFFSET = 16;
constexpr std::size_t INFO_CREATE_DATE_OFFSET = 52;
constexpr std::size_t INFO_MODIFY_DATE_OFFSET = 60;
constexpr std::size_t INFO_NAME_SIZE_OFFSET = 70;
constexpr std::size_t INFO_NAME_OFFSET = 72;

// Four-character code, space padded or truncated
void store_code(std::span<std::byte> dst, std::string_view code) noexcept {
    for (std::size_t i = 0; i < 4; ++i) {
        dst[i] = static_cast<std::byte>(i < code.size() ? code[i] : ' ');
    }
}

std::string load_string(std::span<const std::byte> src) {
    return std::string(reinterpret_cast<const char*>(src.data()), src.size());
}

void append(std::vector<std::byte>& out, std::string_view s) {
    const auto* p = reinterpret_cast<const std::byte*>(s.data());
    out.insert(out.end(), p, p + s.size());
}

} // namespace

//=============================================================================
// File types and dates
//=============================================================================

FileType file_type_from_filename(std::string_view file_name) {
    auto dot = file_name.rfind('.');
    if (dot != std::string_view::npos && dot + 1 < file_name.size()) {
        auto ext = file_name.substr(dot + 1);
        for (const auto& entry : TYPE_TABLE) {
            if (entry.extension.size() == ext.size() &&
                std::equal(ext.begin(), ext.end(), entry.extension.begin(), [](char a, char b) {
                    return std::tolower(static_cast<unsigned char>(a)) == b;
                })) {
                return {std::string(entry.type_code), std::string(entry.creator_code)};
            }
        }
    }
    return {std::string(DEFAULT_TYPE_CODE), std::string(DEFAULT_CREATOR_CODE)};
}

HotlineTime encode_hotline_time(std::chrono::system_clock::time_point tp) noexcept {
    using namespace std::chrono;

    auto day = floor<days>(tp);
    year_month_day ymd{day};
    auto year_start = sys_days{ymd.year() / January / 1};
    auto seconds_into_year = duration_cast<seconds>(tp - year_start).count();

    HotlineTime out{};
    store_be16(out, static_cast<std::uint16_t>(static_cast<int>(ymd.year())));
    // Bytes 2..3 are milliseconds, always written as zero
    store_be32(std::span(out).subspan(4), static_cast<std::uint32_t>(seconds_into_year));
    return out;
}

std::chrono::system_clock::time_point decode_hotline_time(std::span<const std::byte> bytes) noexcept {
    using namespace std::chrono;

    if (bytes.size() < 8) {
        return {};
    }

    auto y = year{static_cast<int>(load_be16(bytes))};
    auto secs = seconds{load_be32(bytes.subspan(4))};
    return sys_days{y / January / 1} + secs;
}

//=============================================================================
// Container header and fork headers
//=============================================================================

std::array<std::byte, FLAT_FILE_HEADER_SIZE> encode_header(std::uint16_t fork_count) noexcept {
    std::array<std::byte, FLAT_FILE_HEADER_SIZE> out{};
    // Reserved [0:4] and [6:22] stay zero
    store_be16(std::span(out).subspan(4), FLAT_FILE_VERSION);
    store_be16(std::span(out).subspan(22), fork_count);
    return out;
}

std::expected<std::uint16_t, std::error_code> decode_header(Reader& reader) noexcept {
    std::array<std::byte, FLAT_FILE_HEADER_SIZE> buf;
    if (auto ec = read_exact(reader, buf, TransferErrc::truncated_header)) {
        return std::unexpected(ec);
    }

    // Version at [4:6] is not checked
    auto fork_count = load_be16(std::span<const std::byte>(buf).subspan(22));
    if (fork_count < 1 || fork_count > 3) {
        return std::unexpected(make_error_code(TransferErrc::bad_fork_count));
    }
    return fork_count;
}

ForkType fork_type_from_tag(std::span<const std::byte> tag) noexcept {
    auto matches = [&](std::string_view name) {
        return tag.size() >= 4 && std::memcmp(tag.data(), name.data(), 4) == 0;
    };

    if (matches(FORK_TAG_INFO)) return ForkType::info;
    if (matches(FORK_TAG_DATA)) return ForkType::data;
    if (matches(FORK_TAG_RESOURCE)) return ForkType::resource;
    return ForkType::unknown;
}

std::array<std::byte, FORK_HEADER_SIZE> encode_fork_header(ForkType type, std::uint32_t data_size) noexcept {
    std::array<std::byte, FORK_HEADER_SIZE> out{};
    switch (type) {
        case ForkType::info:     store_tag(out, FORK_TAG_INFO); break;
        case ForkType::data:     store_tag(out, FORK_TAG_DATA); break;
        case ForkType::resource: store_tag(out, FORK_TAG_RESOURCE); break;
        default: break;
    }
    // Compression [4:6] and reserved [6:12] stay zero
    store_be32(std::span(out).subspan(12), data_size);
    return out;
}

std::expected<ForkHeader, std::error_code> decode_fork_header(Reader& reader) noexcept {
    std::array<std::byte, FORK_HEADER_SIZE> buf;
    if (auto ec = read_exact(reader, buf, TransferErrc::truncated_fork)) {
        return std::unexpected(ec);
    }

    std::span<const std::byte> view(buf);
    ForkHeader header;
    header.type = fork_type_from_tag(view.first(4));
    std::memcpy(header.tag.data(), buf.data(), header.tag.size());
    header.compression = load_be16(view.subspan(4));
    header.data_size = load_be32(view.subspan(12));
    return header;
}

//=============================================================================
// INFO fork
//=============================================================================

std::vector<std::byte> encode_info_payload(const InfoFork& info) {
    auto name = std::string_view(info.name).substr(0, std::min(info.name.size(), MAX_FILE_NAME_SIZE));
    auto comment = std::string_view(info.comment).substr(0, std::min<std::size_t>(info.comment.size(), 0xFFFF));

    std::vector<std::byte> out(INFO_NAME_OFFSET);
    std::span<std::byte> fixed(out);

    store_code(fixed, info.platform);
    store_code(fixed.subspan(INFO_TYPE_OFFSET), info.type_code);
    store_code(fixed.subspan(INFO_CREATOR_OFFSET), info.creator_code);
    store_be32(fixed.subspan(INFO_FLAGS_OFFSET), info.flags);
    store_be32(fixed.subspan(INFO_PLATFORM_FLAGS_OFFSET), PLATFORM_FLAGS);
    std::copy(info.create_date.begin(), info.create_date.end(), out.begin() + INFO_CREATE_DATE_OFFSET);
    std::copy(info.modify_date.begin(), info.modify_date.end(), out.begin() + INFO_MODIFY_DATE_OFFSET);
    // Name script at [68:70] is zero
    store_be16(fixed.subspan(INFO_NAME_SIZE_OFFSET), static_cast<std::uint16_t>(name.size()));

    append(out, name);

    std::array<std::byte, 2> comment_size;
    store_be16(comment_size, static_cast<std::uint16_t>(comment.size()));
    out.insert(out.end(), comment_size.begin(), comment_size.end());
    append(out, comment);

    return out;
}

std::vector<std::byte> encode_info_fork(std::string_view file_name,
                                        std::chrono::system_clock::time_point mod_time,
                                        std::string_view type_code,
                                        std::string_view creator_code) {
    InfoFork info;
    info.platform = std::string(PLATFORM_TAG);

    auto guessed = file_type_from_filename(file_name);
    info.type_code = type_code.empty() ? guessed.type_code : std::string(type_code);
    info.creator_code = creator_code.empty() ? guessed.creator_code : std::string(creator_code);

    info.modify_date = encode_hotline_time(mod_time);
    info.create_date = info.modify_date;
    info.name = std::string(file_name);

    auto payload = encode_info_payload(info);
    auto header = encode_fork_header(ForkType::info, static_cast<std::uint32_t>(payload.size()));

    std::vector<std::byte> out;
    out.reserve(header.size() + payload.size());
    out.insert(out.end(), header.begin(), header.end());
    out.insert(out.end(), payload.begin(), payload.end());
    return out;
}

std::expected<InfoFork, std::error_code> decode_info_fork(std::span<const std::byte> payload) noexcept {
    if (payload.size() < INFO_NAME_OFFSET) {
        return std::unexpected(make_error_code(TransferErrc::truncated_fork));
    }

    try {
        InfoFork info;
        info.platform = load_string(payload.first(4));
        info.type_code = load_string(payload.subspan(INFO_TYPE_OFFSET, 4));
        info.creator_code = load_string(payload.subspan(INFO_CREATOR_OFFSET, 4));
        info.flags = load_be32(payload.subspan(INFO_FLAGS_OFFSET));
        std::copy_n(payload.begin() + INFO_CREATE_DATE_OFFSET, 8, info.create_date.begin());
        std::copy_n(payload.begin() + INFO_MODIFY_DATE_OFFSET, 8, info.modify_date.begin());

        std::size_t name_size = load_be16(payload.subspan(INFO_NAME_SIZE_OFFSET));
        if (payload.size() < INFO_NAME_OFFSET + name_size) {
            return std::unexpected(make_error_code(TransferErrc::truncated_fork));
        }
        info.name = load_string(payload.subspan(INFO_NAME_OFFSET, name_size));

        // Some servers end the payload right after the name
        auto pos = INFO_NAME_OFFSET + name_size;
        if (payload.size() >= pos + 2) {
            std::size_t comment_size = load_be16(payload.subspan(pos));
            pos += 2;
            if (payload.size() < pos + comment_size) {
                return std::unexpected(make_error_code(TransferErrc::truncated_fork));
            }
            info.comment = load_string(payload.subspan(pos, comment_size));
        }

        return info;
    } catch (const std::bad_alloc&) {
        return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
    }
}

//=============================================================================
// AppleDouble sidecar
//=============================================================================

std::error_code encode_sidecar_header(Writer& writer, std::uint32_t resource_fork_size) noexcept {
    // Header proper is 38 bytes; the rest up to the payload offset is zero
    std::array<std::byte, SIDECAR_HEADER_SIZE> buf{};
    std::span<std::byte> view(buf);

    store_be32(view, SIDECAR_MAGIC);
    store_be32(view.subspan(4), SIDECAR_VERSION);
    store_be16(view.subspan(24), 1);

    auto entry = view.subspan(SIDECAR_ENTRIES_OFFSET);
    store_be32(entry, SIDECAR_RESOURCE_FORK_ID);
    store_be32(entry.subspan(4), static_cast<std::uint32_t>(SIDECAR_HEADER_SIZE));
    store_be32(entry.subspan(8), resource_fork_size);

    return writer.write(buf);
}

std::expected<SidecarEntry, std::error_code> decode_sidecar_header(Reader& reader) noexcept {
    std::array<std::byte, SIDECAR_HEADER_SIZE> buf;
    if (auto ec = read_exact(reader, buf, TransferErrc::bad_sidecar)) {
        return std::unexpected(ec);
    }

    std::span<const std::byte> view(buf);
    if (load_be32(view) != SIDECAR_MAGIC || load_be32(view.subspan(4)) != SIDECAR_VERSION) {
        return std::unexpected(make_error_code(TransferErrc::bad_sidecar));
    }

    std::size_t count = load_be16(view.subspan(24));
    std::size_t max_entries = (SIDECAR_HEADER_SIZE - SIDECAR_ENTRIES_OFFSET) / SIDECAR_ENTRY_SIZE;
    if (count == 0 || count > max_entries) {
        return std::unexpected(make_error_code(TransferErrc::bad_sidecar));
    }

    for (std::size_t i = 0; i < count; ++i) {
        auto entry = view.subspan(SIDECAR_ENTRIES_OFFSET + i * SIDECAR_ENTRY_SIZE, SIDECAR_ENTRY_SIZE);
        if (load_be32(entry) != SIDECAR_RESOURCE_FORK_ID) {
            continue;
        }
        // Payload must start right after the fixed header
        SidecarEntry out{load_be32(entry.subspan(4)), load_be32(entry.subspan(8))};
        if (out.offset != SIDECAR_HEADER_SIZE) {
            return std::unexpected(make_error_code(TransferErrc::bad_sidecar));
        }
        return out;
    }

    return std::unexpected(make_error_code(TransferErrc::bad_sidecar));
}

} // namespace ferry::core
