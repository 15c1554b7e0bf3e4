#include "ff/errors.h"

namespace ff {

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::DATA_UNAVAILABLE: return "DataUnavailable";
        case ErrorKind::INSUFFICIENT_DATA: return "InsufficientData";
        case ErrorKind::MALFORMED_RECORD: return "MalformedRecord";
        case ErrorKind::ARTIFACT_UNAVAILABLE: return "ArtifactUnavailable";
        case ErrorKind::SCHEMA_MISMATCH: return "SchemaMismatch";
        case ErrorKind::INVALID_CONFIG: return "InvalidConfig";
        case ErrorKind::STORAGE: return "Storage";
    }
    return "Unknown";
}

} // namespace ff
