#pragma once
#include <hnmd/core/Error.hpp>
#include <hnmd/data/Filter.hpp>
#include <hnmd/data/Record.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <vector>

namespace HN {

/**
 * RecordStream: one continuous request against a DataSource.
 *
 * next(wait) blocks for at most `wait` and returns:
 *  - a batch (possibly empty) when records arrived,
 *  - std::nullopt once the stream has ended or was cancelled,
 *  - an Error when the source failed.
 * cancel() may be called from any thread and makes a blocked next() return.
 */
struct RecordStream {
    virtual ~RecordStream() = default;

    virtual auto next(std::chrono::milliseconds wait) -> Expected<std::optional<std::vector<Record>>> = 0;
    virtual auto cancel() -> void                                                                      = 0;
};

/**
 * DataSource: the remote record source (relay client) seen by the runtime.
 * fetchOnce reports expiry either as Error::Code::FetchTimeout or as an empty
 * list; both mean "no result".
 */
struct DataSource {
    virtual ~DataSource() = default;

    virtual auto subscribe(Filter const& filter) -> Expected<std::unique_ptr<RecordStream>>                          = 0;
    virtual auto fetchOnce(Filter const& filter, std::chrono::milliseconds timeout) -> Expected<std::vector<Record>> = 0;
};

} // namespace HN
