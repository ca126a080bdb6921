#include "dropshelf/DropPayload.hpp"

#include <algorithm>

namespace dropshelf {

PayloadClass classifyPayload(const DropPayload &payload) {
    const bool anyDirect =
        std::any_of(payload.directPaths.begin(), payload.directPaths.end(),
                    [](const std::string &p) { return !p.empty(); });
    if (anyDirect)
        return PayloadClass::Direct;
    const bool anyPromise =
        std::any_of(payload.promises.begin(), payload.promises.end(),
                    [](const FilePromisePtr &p) { return p != nullptr; });
    if (anyPromise)
        return PayloadClass::Promised;
    return PayloadClass::Unrecognized;
}

const char *payloadClassName(PayloadClass c) {
    switch (c) {
    case PayloadClass::Direct:
        return "Direct";
    case PayloadClass::Promised:
        return "Promised";
    case PayloadClass::Unrecognized:
        return "Unrecognized";
    }
    return "Unknown";
}

} // namespace dropshelf
