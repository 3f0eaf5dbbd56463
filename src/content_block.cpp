#include "core/content_block.hpp"

const ImageAsset &assetOf(const ImageOutcome &outcome)
{
    return std::visit([](const auto &image) -> const ImageAsset &
                      { return image.asset; },
                      outcome);
}

std::string toString(UnavailableReason reason)
{
    switch (reason)
    {
    case UnavailableReason::NOT_FOUND:
        return "not found";
    case UnavailableReason::TIMEOUT:
        return "timeout";
    case UnavailableReason::TRANSPORT_ERROR:
        return "transport error";
    case UnavailableReason::DECODE_ERROR:
        return "decode error";
    case UnavailableReason::ENCODE_ERROR:
        return "encode error";
    }
    return "unknown";
}
