#include "core/generation_result.hpp"

const char *toString(GenerationStrategy strategy)
{
    switch (strategy)
    {
    case GenerationStrategy::LOCAL:
        return "local";
    case GenerationStrategy::DELEGATED:
        return "delegated";
    }
    return "unknown";
}

const char *toString(GenerationErrorKind kind)
{
    switch (kind)
    {
    case GenerationErrorKind::NONE:
        return "none";
    case GenerationErrorKind::INVALID_REQUEST:
        return "invalid_request";
    case GenerationErrorKind::PAYLOAD_TOO_LARGE:
        return "payload_too_large";
    case GenerationErrorKind::DELEGATION:
        return "delegation";
    case GenerationErrorKind::PACKAGING:
        return "packaging";
    case GenerationErrorKind::CANCELLED:
        return "cancelled";
    case GenerationErrorKind::INTERNAL:
        return "internal";
    }
    return "unknown";
}
