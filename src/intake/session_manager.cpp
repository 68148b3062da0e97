#include "vault/intake/session_manager.hpp"

#include "vault/core/ids.hpp"
#include "vault/events/events.hpp"

#include <spdlog/spdlog.h>

#include <charconv>
#include <chrono>

namespace vault::intake {

using model::UploadSession;

namespace {

bool parse_u64(const std::string& text, std::uint64_t& out) {
    if (text.empty()) {
        return false;
    }
    const char* begin = text.data();
    const char* end = begin + text.size();
    auto [ptr, ec] = std::from_chars(begin, end, out);
    return ec == std::errc() && ptr == end;
}

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t");
    return text.substr(first, last - first + 1);
}

} // namespace

Result<ByteRange> parse_content_range(const std::string& header) {
    const std::string value = trim(header);
    const std::string prefix = "bytes ";
    if (value.compare(0, prefix.size(), prefix) != 0) {
        return fail<ByteRange>(ErrorCode::InvalidRange, "Content-Range must start with 'bytes ': " + header);
    }

    const std::string range_text = trim(value.substr(prefix.size()));
    const auto slash = range_text.find('/');
    if (slash == std::string::npos) {
        return fail<ByteRange>(ErrorCode::InvalidRange, "Content-Range missing total: " + header);
    }

    ByteRange range;
    if (!parse_u64(range_text.substr(slash + 1), range.total)) {
        return fail<ByteRange>(ErrorCode::InvalidRange, "Content-Range total is not a number: " + header);
    }

    const std::string span = range_text.substr(0, slash);
    if (span == "*") {
        range.probe = true;
        return Ok(range);
    }

    const auto dash = span.find('-');
    if (dash == std::string::npos ||
        !parse_u64(span.substr(0, dash), range.first) ||
        !parse_u64(span.substr(dash + 1), range.last)) {
        return fail<ByteRange>(ErrorCode::InvalidRange, "malformed Content-Range: " + header);
    }
    if (range.first > range.last) {
        return fail<ByteRange>(ErrorCode::InvalidRange, "Content-Range first byte after last: " + header);
    }
    return Ok(range);
}

SessionManager::SessionManager(config::UploadConfig config,
                               storage::BlobStore& store,
                               IntakeStateStore& state,
                               const ContributorRegistry& contributors,
                               events::EventBus* bus)
    : config_(config)
    , store_(store)
    , state_(state)
    , contributors_(contributors)
    , bus_(bus) {
}

Result<InitUploadResponse> SessionManager::init_upload(const InitUploadRequest& request) {
    if (!contributors_.is_valid(request.contributor_token)) {
        return fail<InitUploadResponse>(ErrorCode::InvalidToken, "unknown contributor token");
    }
    if (request.filename.empty()) {
        return fail<InitUploadResponse>(ErrorCode::InvalidArgument, "filename is required");
    }
    if (request.size_bytes == 0) {
        return fail<InitUploadResponse>(ErrorCode::InvalidArgument, "sizeBytes must be positive");
    }
    if (request.size_bytes > config_.max_file_bytes) {
        return fail<InitUploadResponse>(ErrorCode::FileTooLarge,
            "file of " + std::to_string(request.size_bytes) + " bytes exceeds limit of " +
            std::to_string(config_.max_file_bytes));
    }

    std::string batch_id;
    if (request.batch_id && !request.batch_id->empty()) {
        auto batch = state_.get_batch(*request.batch_id);
        if (batch.is_error()) {
            return Err<InitUploadResponse>(batch.error());
        }
        // A batch owned by someone else is reported as unknown
        if (!batch.value() || batch.value()->contributor_token != request.contributor_token) {
            return fail<InitUploadResponse>(ErrorCode::UnknownBatch, "no batch " + *request.batch_id);
        }
        if (batch.value()->finalized) {
            return fail<InitUploadResponse>(ErrorCode::BatchFinalized,
                                            "batch " + *request.batch_id + " is finalized");
        }
        batch_id = *request.batch_id;
    }

    storage::ResumableMeta meta;
    meta.name = request.filename;
    meta.mime_type = request.mime_type.empty() ? "application/octet-stream" : request.mime_type;
    meta.total_bytes = request.size_bytes;
    meta.location = storage::Location::Inbox;

    auto handle = store_.create_resumable_session(meta);
    if (handle.is_error()) {
        return fail<InitUploadResponse>(ErrorCode::Transient,
                                        "could not open remote session: " + handle.error().message);
    }

    const std::time_t now = std::time(nullptr);
    UploadSession session;
    session.session_id = generate_uuid();
    session.remote_handle = handle.value();
    session.contributor_token = request.contributor_token;
    session.filename = request.filename;
    session.mime_type = meta.mime_type;
    session.total_bytes = request.size_bytes;
    session.committed_offset = 0;
    session.batch_id = batch_id;
    session.created_at = now;
    session.updated_at = now;

    auto stored = state_.put_session(session);
    if (stored.is_error()) {
        auto aborted = store_.abort_resumable(session.remote_handle);
        if (aborted.is_error()) {
            spdlog::warn("Abort of remote session {} failed: {}", session.remote_handle,
                         aborted.error().message);
        }
        return Err<InitUploadResponse>(stored.error());
    }

    if (bus_ != nullptr) {
        bus_->emit(events::UploadInitiatedEvent{session.session_id, session.contributor_token,
                                                session.filename, session.total_bytes});
    }

    return Ok(InitUploadResponse{session.session_id, config_.chunk_size_hint});
}

Result<ChunkOutcome> SessionManager::put_chunk(const std::string& session_id, const ByteRange& range,
                                               const std::uint8_t* data, std::size_t size) {
    auto mutex = lock_for(session_id);
    std::lock_guard guard(*mutex);

    auto loaded = load_session(session_id);
    if (loaded.is_error()) {
        return Err<ChunkOutcome>(loaded.error());
    }
    UploadSession session = loaded.value();

    if (range.total != session.total_bytes) {
        return fail<ChunkOutcome>(ErrorCode::InvalidRange,
            "range total " + std::to_string(range.total) + " differs from declared size " +
            std::to_string(session.total_bytes));
    }

    if (range.probe || size == 0) {
        return resync(session, true);
    }

    if (range.last >= range.total) {
        return fail<ChunkOutcome>(ErrorCode::InvalidRange, "last byte beyond total");
    }
    if (size != range.length()) {
        return fail<ChunkOutcome>(ErrorCode::InvalidRange,
            "payload of " + std::to_string(size) + " bytes does not match range length " +
            std::to_string(range.length()));
    }

    if (range.first != session.committed_offset) {
        spdlog::info("Chunk for session {} starts at {} but committed offset is {}",
                     session_id, range.first, session.committed_offset);
        return resync(session, false);
    }

    auto appended = store_.append_range(session.remote_handle, range.first, data, size);
    if (appended.is_error()) {
        if (appended.error().code == ErrorCode::InvalidRange) {
            // The remote store disagrees with our offset
            return resync(session, false);
        }
        spdlog::warn("Append failed for session {} at {}: {}", session_id, range.first,
                     appended.error().message);
        return fail<ChunkOutcome>(ErrorCode::Transient, "blob store append failed: " + appended.error().message);
    }

    session.committed_offset += size;
    session.updated_at = std::time(nullptr);
    auto stored = state_.put_session(session);
    if (stored.is_error()) {
        return Err<ChunkOutcome>(stored.error());
    }

    if (bus_ != nullptr) {
        bus_->emit(events::ChunkAcceptedEvent{session_id, range.first, size,
                                              session.committed_offset, session.total_bytes});
    }

    if (session.committed_offset == session.total_bytes) {
        return complete(session);
    }
    return Ok(ChunkOutcome::accepted(session.committed_offset));
}

Result<ChunkOutcome> SessionManager::probe(const std::string& session_id) {
    auto mutex = lock_for(session_id);
    std::lock_guard guard(*mutex);

    auto loaded = load_session(session_id);
    if (loaded.is_error()) {
        return Err<ChunkOutcome>(loaded.error());
    }
    UploadSession session = loaded.value();
    return resync(session, true);
}

std::size_t SessionManager::reap_expired(std::time_t now) {
    auto sessions = state_.list_sessions();
    if (sessions.is_error()) {
        spdlog::error("Session reaper could not list sessions: {}", sessions.error().message);
        return 0;
    }

    std::size_t reaped = 0;
    for (const auto& candidate : sessions.value()) {
        if (now - candidate.updated_at <= config_.session_ttl_seconds) {
            continue;
        }

        auto mutex = lock_for(candidate.session_id);
        std::lock_guard guard(*mutex);

        // Re-read under the lock; a chunk may have landed meanwhile
        auto current = state_.get_session(candidate.session_id);
        if (current.is_error() || !current.value() ||
            now - current.value()->updated_at <= config_.session_ttl_seconds) {
            continue;
        }
        const UploadSession& session = *current.value();

        auto aborted = store_.abort_resumable(session.remote_handle);
        if (aborted.is_error()) {
            spdlog::warn("Abort of expired session {} failed: {}", session.session_id, aborted.error().message);
        }
        auto erased = state_.erase_session(session.session_id);
        if (erased.is_error()) {
            spdlog::error("Could not drop expired session {}: {}", session.session_id, erased.error().message);
            continue;
        }
        release_lock(session.session_id);

        if (bus_ != nullptr) {
            bus_->emit(events::UploadExpiredEvent{session.session_id, session.committed_offset});
        }
        ++reaped;
    }
    return reaped;
}

Result<std::size_t> SessionManager::active_sessions() {
    return state_.session_count();
}

std::shared_ptr<std::mutex> SessionManager::lock_for(const std::string& session_id) {
    std::lock_guard lock(locks_mutex_);
    auto& entry = session_locks_[session_id];
    if (!entry) {
        entry = std::make_shared<std::mutex>();
    }
    return entry;
}

void SessionManager::release_lock(const std::string& session_id) {
    std::lock_guard lock(locks_mutex_);
    session_locks_.erase(session_id);
}

Result<UploadSession> SessionManager::load_session(const std::string& session_id) {
    auto found = state_.get_session(session_id);
    if (found.is_error()) {
        return Err<UploadSession>(found.error());
    }
    if (!found.value()) {
        // Drop the lock entry created by the lookup of an unknown id
        release_lock(session_id);
        return fail<UploadSession>(ErrorCode::UnknownSession, "no upload session " + session_id);
    }
    return Ok(*found.value());
}

Result<ChunkOutcome> SessionManager::resync(UploadSession& session, bool explicit_probe) {
    auto received = store_.query_received_bytes(session.remote_handle);
    if (received.is_error()) {
        return fail<ChunkOutcome>(ErrorCode::Transient, "blob store status query failed: " + received.error().message);
    }

    std::uint64_t offset = received.value();
    if (offset > session.total_bytes) {
        return fail<ChunkOutcome>(ErrorCode::Internal,
            "remote session holds " + std::to_string(offset) + " bytes of " + std::to_string(session.total_bytes));
    }
    if (offset < session.committed_offset) {
        spdlog::warn("Remote session for {} reports {} bytes, below committed {}",
                     session.session_id, offset, session.committed_offset);
    }

    if (offset != session.committed_offset) {
        session.committed_offset = offset;
        session.updated_at = std::time(nullptr);
        auto stored = state_.put_session(session);
        if (stored.is_error()) {
            return Err<ChunkOutcome>(stored.error());
        }
    }

    if (offset == session.total_bytes) {
        return complete(session);
    }

    if (bus_ != nullptr) {
        bus_->emit(events::UploadResumedEvent{session.session_id, offset, explicit_probe});
    }
    return Ok(ChunkOutcome::resume(offset));
}

Result<ChunkOutcome> SessionManager::complete(UploadSession& session) {
    auto finalized = store_.finalize_resumable(session.remote_handle);
    if (finalized.is_error()) {
        // Session stays; the next probe retries finalization
        return fail<ChunkOutcome>(ErrorCode::Transient, "blob store finalize failed: " + finalized.error().message);
    }
    const std::string origin_file_id = finalized.value();

    if (!session.batch_id.empty()) {
        model::ManifestFile file{origin_file_id, session.filename, session.total_bytes};
        auto recorded = state_.append_batch_file(session.batch_id, file);
        if (recorded.is_error()) {
            spdlog::warn("Upload {} not recorded in batch {}: {}", origin_file_id, session.batch_id,
                         recorded.error().message);
        }
    }

    auto erased = state_.erase_session(session.session_id);
    if (erased.is_error()) {
        spdlog::warn("Completed session {} could not be erased: {}", session.session_id, erased.error().message);
    }
    release_lock(session.session_id);

    if (bus_ != nullptr) {
        const auto elapsed = std::chrono::seconds(std::time(nullptr) - session.created_at);
        bus_->emit(events::UploadCompletedEvent{
            session.session_id, origin_file_id, session.filename, session.total_bytes,
            std::chrono::duration_cast<std::chrono::milliseconds>(elapsed)});
    }

    return Ok(ChunkOutcome::complete(session.total_bytes, origin_file_id));
}

} // namespace vault::intake
