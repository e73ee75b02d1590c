#pragma once

#include <string>
#include <core/types.hpp>
#include "session.hpp"

// Destination for captured sessions. The capture loop treats every
// failure here as non-fatal: it is logged and capture continues.
class InteractionSink {
public:
    virtual ~InteractionSink() = default;

    // A session has started.
    virtual Result<void> begin(const Session& session) = 0;

    // A turn was finalized. Interactions of one session arrive in
    // sequence order.
    virtual Result<void> append(const std::string& session_id,
                                const Interaction& interaction) = 0;

    // The session ended; `session` carries its final status and end time.
    virtual Result<void> finish(const Session& session) = 0;
};
