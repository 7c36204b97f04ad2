#include "uldas/types.h"

namespace uldas {

const char* track_type_name(TrackType type) {
    switch (type) {
        case TrackType::Audio: return "audio";
        case TrackType::Subtitle: return "subtitle";
        case TrackType::Video: return "video";
        default: return "other";
    }
}

const char* verdict_method_name(VerdictMethod method) {
    switch (method) {
        case VerdictMethod::SampledSegment: return "sampled_segment";
        case VerdictMethod::FullTrack: return "full_track";
        case VerdictMethod::AggregatedMajority: return "aggregated_majority";
    }
    return "unknown";
}

const char* failure_kind_name(FailureKind kind) {
    switch (kind) {
        case FailureKind::Extraction: return "extraction";
        case FailureKind::Inference: return "inference";
        case FailureKind::LowConfidence: return "low_confidence";
        case FailureKind::Timeout: return "timeout";
        case FailureKind::Write: return "write";
    }
    return "unknown";
}

} // namespace uldas
