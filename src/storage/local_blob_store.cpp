#include "vault/storage/local_blob_store.hpp"

#include "vault/core/ids.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace vault::storage {
namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

constexpr const char* kMetaSuffix = ".json";
constexpr const char* kPartSuffix = ".part";

Result<std::string> read_text(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return fail<std::string>(ErrorCode::Io, "cannot open " + path.string());
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return Ok(buffer.str());
}

Result<void> write_text_atomic(const fs::path& path, const std::string& text) {
    const fs::path tmp = path.string() + ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Err<void>(Error(ErrorCode::Io, "cannot write " + tmp.string()));
        }
        out << text;
        if (!out) {
            return Err<void>(Error(ErrorCode::Io, "short write to " + tmp.string()));
        }
    }
    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        return Err<void>(Error(ErrorCode::Io, "rename to " + path.string() + " failed: " + ec.message()));
    }
    return Ok();
}

} // namespace

std::string to_string(Location location) {
    switch (location) {
        case Location::Inbox: return "inbox";
        case Location::Manifests: return "manifests";
        case Location::Processing: return "processing";
        case Location::NeedsReview: return "holding/needs_review";
        case Location::PossibleDuplicates: return "holding/possible_duplicates";
        case Location::TranscribeLater: return "holding/transcribe_later";
        case Location::Sidecars: return "metadata/sidecars";
    }
    return "unknown";
}

std::optional<Location> location_from_string(const std::string& text) {
    for (Location location : all_locations()) {
        if (to_string(location) == text) {
            return location;
        }
    }
    return std::nullopt;
}

const std::vector<Location>& all_locations() {
    static const std::vector<Location> locations = {
        Location::Inbox, Location::Manifests, Location::Processing, Location::NeedsReview,
        Location::PossibleDuplicates, Location::TranscribeLater, Location::Sidecars,
    };
    return locations;
}

LocalBlobStore::LocalBlobStore(fs::path root)
    : root_(std::move(root)) {
}

Result<void> LocalBlobStore::initialize() {
    for (Location location : all_locations()) {
        auto r = ensure_dir(location_dir(location));
        if (r.is_error()) {
            return r;
        }
    }
    return ensure_dir(staging_dir());
}

Result<std::string> LocalBlobStore::upload(Location location, const std::string& name,
                                           const std::vector<std::uint8_t>& bytes,
                                           const std::string& mime_type) {
    std::lock_guard lock(mutex_);

    BlobInfo info;
    info.id = random_hex(32);
    info.name = name;
    info.mime_type = mime_type;
    info.size_bytes = bytes.size();
    info.location = location;
    info.created_at = std::time(nullptr);

    const fs::path dir = location_dir(location);
    if (auto r = ensure_dir(dir); r.is_error()) {
        return Err<std::string>(r.error());
    }

    const fs::path tmp = dir / (info.id + ".tmp");
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            return fail<std::string>(ErrorCode::Io, "cannot create " + tmp.string());
        }
        out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        if (!out) {
            return fail<std::string>(ErrorCode::Io, "short write to " + tmp.string());
        }
    }

    if (auto r = write_meta(dir / (info.id + kMetaSuffix), info); r.is_error()) {
        return Err<std::string>(r.error());
    }

    std::error_code ec;
    fs::rename(tmp, dir / info.id, ec);
    if (ec) {
        return fail<std::string>(ErrorCode::Io, "cannot publish blob " + info.id + ": " + ec.message());
    }
    return Ok(info.id);
}

Result<void> LocalBlobStore::download(const std::string& id, const fs::path& dest) {
    fs::path source;
    {
        std::lock_guard lock(mutex_);
        auto info = find_locked(id);
        if (info.is_error()) {
            return Err<void>(info.error());
        }
        source = location_dir(info.value().location) / id;
    }

    if (auto r = ensure_dir(dest.parent_path()); r.is_error()) {
        return r;
    }

    std::error_code ec;
    fs::copy_file(source, dest, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        return Err<void>(Error(ErrorCode::Io, "download of " + id + " failed: " + ec.message()));
    }
    return Ok();
}

Result<void> LocalBlobStore::move(const std::string& id, Location location) {
    std::lock_guard lock(mutex_);

    auto info = find_locked(id);
    if (info.is_error()) {
        return Err<void>(info.error());
    }
    if (info.value().location == location) {
        return Ok();
    }

    const fs::path from = location_dir(info.value().location);
    const fs::path to = location_dir(location);
    if (auto r = ensure_dir(to); r.is_error()) {
        return r;
    }

    // Data first: a crash between the two renames leaves the meta behind,
    // which find_locked ignores because the data file is missing.
    std::error_code ec;
    fs::rename(from / id, to / id, ec);
    if (ec) {
        return Err<void>(Error(ErrorCode::Io, "move of " + id + " failed: " + ec.message()));
    }
    fs::rename(from / (id + kMetaSuffix), to / (id + kMetaSuffix), ec);
    if (ec) {
        return Err<void>(Error(ErrorCode::Io, "move of " + id + " metadata failed: " + ec.message()));
    }

    spdlog::debug("Moved blob {} from {} to {}", id, to_string(info.value().location), to_string(location));
    return Ok();
}

Result<void> LocalBlobStore::remove(const std::string& id) {
    std::lock_guard lock(mutex_);

    auto info = find_locked(id);
    if (info.is_error()) {
        return Err<void>(info.error());
    }

    // Data first, as in move(): metadata without data is never listed
    const fs::path dir = location_dir(info.value().location);
    std::error_code ec;
    fs::remove(dir / id, ec);
    if (ec) {
        return Err<void>(Error(ErrorCode::Io, "remove of " + id + " failed: " + ec.message()));
    }
    fs::remove(dir / (id + kMetaSuffix), ec);
    if (ec) {
        spdlog::warn("Blob {} removed but its metadata stayed: {}", id, ec.message());
    }

    spdlog::debug("Removed blob {} from {}", id, to_string(info.value().location));
    return Ok();
}

Result<std::vector<BlobInfo>> LocalBlobStore::list(Location location) {
    std::lock_guard lock(mutex_);

    std::vector<BlobInfo> blobs;
    const fs::path dir = location_dir(location);
    std::error_code ec;
    if (!fs::exists(dir, ec)) {
        return Ok(blobs);
    }

    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        const fs::path path = entry.path();
        if (path.extension() != kMetaSuffix) {
            continue;
        }
        const std::string id = path.stem().string();
        if (!valid_id(id) || !fs::exists(dir / id)) {
            continue;
        }
        auto info = read_meta(path, location);
        if (info.is_error()) {
            spdlog::warn("Skipping blob {} with unreadable metadata: {}", id, info.error().message);
            continue;
        }
        blobs.push_back(std::move(info.value()));
    }
    if (ec) {
        return fail<std::vector<BlobInfo>>(ErrorCode::Io, "cannot list " + dir.string() + ": " + ec.message());
    }

    std::sort(blobs.begin(), blobs.end(), [](const BlobInfo& a, const BlobInfo& b) {
        if (a.created_at != b.created_at) {
            return a.created_at < b.created_at;
        }
        return a.id < b.id;
    });
    return Ok(blobs);
}

Result<BlobInfo> LocalBlobStore::stat(const std::string& id) {
    std::lock_guard lock(mutex_);
    return find_locked(id);
}

Result<std::vector<std::uint8_t>> LocalBlobStore::read(const std::string& id) {
    fs::path path;
    {
        std::lock_guard lock(mutex_);
        auto info = find_locked(id);
        if (info.is_error()) {
            return Err<std::vector<std::uint8_t>>(info.error());
        }
        path = location_dir(info.value().location) / id;
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return fail<std::vector<std::uint8_t>>(ErrorCode::Io, "cannot open blob " + id);
    }
    std::vector<std::uint8_t> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    return Ok(bytes);
}

// ────────────────────────────────────────────────────────
// Resumable sessions
// ────────────────────────────────────────────────────────

Result<std::string> LocalBlobStore::create_resumable_session(const ResumableMeta& meta) {
    if (auto r = ensure_dir(staging_dir()); r.is_error()) {
        return Err<std::string>(r.error());
    }

    const std::string handle = random_hex(32);
    json j{
        {"name", meta.name},
        {"mime_type", meta.mime_type},
        {"total_bytes", meta.total_bytes},
        {"location", to_string(meta.location)},
    };
    if (auto r = write_text_atomic(staging_dir() / (handle + kMetaSuffix), j.dump()); r.is_error()) {
        return Err<std::string>(r.error());
    }

    std::ofstream create(staging_dir() / (handle + kPartSuffix), std::ios::binary | std::ios::trunc);
    if (!create) {
        return fail<std::string>(ErrorCode::Io, "cannot create staging file for " + handle);
    }
    return Ok(handle);
}

Result<void> LocalBlobStore::append_range(const std::string& handle, std::uint64_t offset,
                                          const std::uint8_t* data, std::size_t size) {
    if (!valid_id(handle)) {
        return Err<void>(Error(ErrorCode::NotFound, "unknown resumable session"));
    }

    auto received = query_received_bytes(handle);
    if (received.is_error()) {
        return Err<void>(received.error());
    }
    if (received.value() != offset) {
        return Err<void>(Error(ErrorCode::InvalidRange,
                               "append at " + std::to_string(offset) + " but " +
                               std::to_string(received.value()) + " bytes received"));
    }

    auto meta = read_session_meta(handle);
    if (meta.is_error()) {
        return Err<void>(meta.error());
    }
    if (offset + size > meta.value().total_bytes) {
        return Err<void>(Error(ErrorCode::InvalidRange, "append past declared size"));
    }

    std::ofstream out(staging_dir() / (handle + kPartSuffix), std::ios::binary | std::ios::app);
    if (!out) {
        return Err<void>(Error(ErrorCode::Transient, "cannot open staging file for " + handle));
    }
    out.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
    out.flush();
    if (!out) {
        return Err<void>(Error(ErrorCode::Transient, "write to staging file failed for " + handle));
    }
    return Ok();
}

Result<std::uint64_t> LocalBlobStore::query_received_bytes(const std::string& handle) {
    if (!valid_id(handle)) {
        return fail<std::uint64_t>(ErrorCode::NotFound, "unknown resumable session");
    }
    std::error_code ec;
    const auto size = fs::file_size(staging_dir() / (handle + kPartSuffix), ec);
    if (ec) {
        return fail<std::uint64_t>(ErrorCode::NotFound, "unknown resumable session " + handle);
    }
    return Ok(static_cast<std::uint64_t>(size));
}

Result<std::string> LocalBlobStore::finalize_resumable(const std::string& handle) {
    auto meta = read_session_meta(handle);
    if (meta.is_error()) {
        return Err<std::string>(meta.error());
    }
    auto received = query_received_bytes(handle);
    if (received.is_error()) {
        return Err<std::string>(received.error());
    }
    if (received.value() != meta.value().total_bytes) {
        return fail<std::string>(ErrorCode::InvalidRange,
                                 "session " + handle + " has " + std::to_string(received.value()) +
                                 " of " + std::to_string(meta.value().total_bytes) + " bytes");
    }

    std::lock_guard lock(mutex_);

    BlobInfo info;
    info.id = random_hex(32);
    info.name = meta.value().name;
    info.mime_type = meta.value().mime_type;
    info.size_bytes = received.value();
    info.location = meta.value().location;
    info.created_at = std::time(nullptr);

    const fs::path dir = location_dir(info.location);
    if (auto r = ensure_dir(dir); r.is_error()) {
        return Err<std::string>(r.error());
    }
    if (auto r = write_meta(dir / (info.id + kMetaSuffix), info); r.is_error()) {
        return Err<std::string>(r.error());
    }

    std::error_code ec;
    fs::rename(staging_dir() / (handle + kPartSuffix), dir / info.id, ec);
    if (ec) {
        return fail<std::string>(ErrorCode::Io, "cannot publish session " + handle + ": " + ec.message());
    }
    fs::remove(staging_dir() / (handle + kMetaSuffix), ec);
    if (ec) {
        spdlog::warn("Stale session metadata left for {}: {}", handle, ec.message());
    }
    return Ok(info.id);
}

Result<void> LocalBlobStore::abort_resumable(const std::string& handle) {
    if (!valid_id(handle)) {
        return Err<void>(Error(ErrorCode::NotFound, "unknown resumable session"));
    }
    std::error_code ec;
    fs::remove(staging_dir() / (handle + kPartSuffix), ec);
    fs::remove(staging_dir() / (handle + kMetaSuffix), ec);
    if (ec) {
        return Err<void>(Error(ErrorCode::Io, "cannot abort session " + handle + ": " + ec.message()));
    }
    return Ok();
}

// ────────────────────────────────────────────────────────
// Helpers
// ────────────────────────────────────────────────────────

fs::path LocalBlobStore::location_dir(Location location) const {
    return root_ / to_string(location);
}

fs::path LocalBlobStore::staging_dir() const {
    return root_ / ".resumable";
}

Result<BlobInfo> LocalBlobStore::find_locked(const std::string& id) const {
    if (!valid_id(id)) {
        return fail<BlobInfo>(ErrorCode::NotFound, "invalid blob id");
    }
    for (Location location : all_locations()) {
        const fs::path dir = location_dir(location);
        std::error_code ec;
        if (fs::exists(dir / id, ec) && fs::exists(dir / (id + kMetaSuffix), ec)) {
            return read_meta(dir / (id + kMetaSuffix), location);
        }
    }
    return fail<BlobInfo>(ErrorCode::NotFound, "no blob " + id);
}

Result<void> LocalBlobStore::write_meta(const fs::path& path, const BlobInfo& info) const {
    json j{
        {"name", info.name},
        {"mime_type", info.mime_type},
        {"created_at", static_cast<long long>(info.created_at)},
    };
    return write_text_atomic(path, j.dump());
}

Result<BlobInfo> LocalBlobStore::read_meta(const fs::path& path, Location location) const {
    auto text = read_text(path);
    if (text.is_error()) {
        return Err<BlobInfo>(text.error());
    }
    json j = json::parse(text.value(), nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return fail<BlobInfo>(ErrorCode::Io, "corrupt metadata " + path.string());
    }

    BlobInfo info;
    info.id = path.stem().string();
    info.name = j.value("name", "");
    info.mime_type = j.value("mime_type", "application/octet-stream");
    info.created_at = static_cast<std::time_t>(j.value("created_at", 0LL));
    info.location = location;

    std::error_code ec;
    info.size_bytes = fs::file_size(path.parent_path() / info.id, ec);
    if (ec) {
        return fail<BlobInfo>(ErrorCode::NotFound, "blob data missing for " + info.id);
    }
    return Ok(info);
}

Result<ResumableMeta> LocalBlobStore::read_session_meta(const std::string& handle) const {
    if (!valid_id(handle)) {
        return fail<ResumableMeta>(ErrorCode::NotFound, "unknown resumable session");
    }
    auto text = read_text(staging_dir() / (handle + kMetaSuffix));
    if (text.is_error()) {
        return fail<ResumableMeta>(ErrorCode::NotFound, "unknown resumable session " + handle);
    }
    json j = json::parse(text.value(), nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return fail<ResumableMeta>(ErrorCode::Io, "corrupt session metadata for " + handle);
    }

    ResumableMeta meta;
    meta.name = j.value("name", "");
    meta.mime_type = j.value("mime_type", "application/octet-stream");
    meta.total_bytes = j.value("total_bytes", std::uint64_t{0});
    meta.location = location_from_string(j.value("location", "inbox")).value_or(Location::Inbox);
    return Ok(meta);
}

bool LocalBlobStore::valid_id(const std::string& id) {
    return !id.empty() && id.size() <= 64 &&
           std::all_of(id.begin(), id.end(), [](unsigned char c) { return std::isxdigit(c) != 0; });
}

Result<void> LocalBlobStore::ensure_dir(const fs::path& path) {
    if (path.empty()) {
        return Ok();
    }
    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec && !fs::exists(path)) {
        return Err<void>(Error(ErrorCode::Io, "failed to create directory " + path.string()));
    }
    return Ok();
}

} // namespace vault::storage
