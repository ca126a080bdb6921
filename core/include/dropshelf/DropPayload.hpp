// Inbound drop payload and its classification into the fast path (direct
// file references) or the slow path (promises).
#pragma once
#include "FilePromise.hpp"
#include <string>
#include <vector>

namespace dropshelf {

struct DropPayload {
    std::vector<std::string> directPaths; // local files, in drop order
    FilePromiseList promises;             // in drop order

    bool empty() const { return directPaths.empty() && promises.empty(); }
};

enum class PayloadClass { Direct, Promised, Unrecognized };

// Direct wins whenever at least one direct reference exists; promises in the
// same payload are then ignored, matching how drop sources offer the same
// files both ways.
PayloadClass classifyPayload(const DropPayload &payload);

const char *payloadClassName(PayloadClass c);

} // namespace dropshelf
