#pragma once

#include <cstdint>
#include <string>

namespace HN {

/**
 * ChangeSink receives query change notifications from a QueryStore.
 * The store holds only a weak_ptr<ChangeSink> and locks it before notifying;
 * a sink that has been destroyed is dropped silently. Notifications are
 * delivered after the store lock is released, so a sink may read the store.
 */
struct ChangeSink {
    virtual ~ChangeSink() = default;

    // Called once per version bump of queryId.
    virtual void queryChanged(const std::string& queryId, std::uint64_t version) = 0;
};

} // namespace HN
