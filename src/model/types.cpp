#include "vault/model/types.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace vault {
namespace model {
namespace {

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool starts_with(const std::string& text, const std::string& prefix) {
    return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

std::string to_string(AssetStatus status) {
    switch (status) {
        case AssetStatus::Uploaded: return "uploaded";
        case AssetStatus::Processing: return "processing";
        case AssetStatus::NeedsReview: return "needs_review";
        case AssetStatus::PossibleDuplicate: return "possible_duplicate";
        case AssetStatus::TranscribeLater: return "transcribe_later";
        case AssetStatus::Error: return "error";
        case AssetStatus::Approved: return "approved";
        case AssetStatus::Archived: return "archived";
        case AssetStatus::Rejected: return "rejected";
    }
    return "error";
}

std::optional<AssetStatus> status_from_string(const std::string& text) {
    static const std::unordered_map<std::string, AssetStatus> spellings {
        {"uploaded", AssetStatus::Uploaded},
        {"processing", AssetStatus::Processing},
        {"needs_review", AssetStatus::NeedsReview},
        {"pending", AssetStatus::NeedsReview},
        {"possible_duplicate", AssetStatus::PossibleDuplicate},
        {"possible_duplicates", AssetStatus::PossibleDuplicate},
        {"duplicate", AssetStatus::PossibleDuplicate},
        {"transcribe_later", AssetStatus::TranscribeLater},
        {"error", AssetStatus::Error},
        {"failed", AssetStatus::Error},
        {"approved", AssetStatus::Approved},
        {"archived", AssetStatus::Archived},
        {"rejected", AssetStatus::Rejected},
    };

    const auto it = spellings.find(lowercase(text));
    if (it == spellings.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string to_string(DuplicateMethod method) {
    return method == DuplicateMethod::Exact ? "exact" : "near";
}

std::optional<DuplicateMethod> duplicate_method_from_string(const std::string& text) {
    const auto value = lowercase(text);
    if (value == "exact" || value == "sha256") {
        return DuplicateMethod::Exact;
    }
    if (value == "near" || value == "phash") {
        return DuplicateMethod::Near;
    }
    return std::nullopt;
}

MediaKind media_kind_from_mime(const std::string& mime_type) {
    const auto mime = lowercase(mime_type);
    if (starts_with(mime, "image/")) {
        return MediaKind::Image;
    }
    if (starts_with(mime, "video/")) {
        return MediaKind::Video;
    }
    if (starts_with(mime, "audio/")) {
        return MediaKind::Audio;
    }
    return MediaKind::Other;
}

std::string to_string(MediaKind kind) {
    switch (kind) {
        case MediaKind::Image: return "image";
        case MediaKind::Video: return "video";
        case MediaKind::Audio: return "audio";
        case MediaKind::Other: return "other";
    }
    return "other";
}

} // namespace model
} // namespace vault
