#pragma once

#include "core/shared/types.h"

#include <QString>
#include <optional>

namespace pl {

// PageStore -- read-only, exact-match page text lookup.
//
// A miss is an expected outcome: get() returns nullopt and the caller skips
// the page. Implementations must be safe to call from several worker threads
// at once.
class PageStore {
public:
    virtual ~PageStore() = default;

    virtual std::optional<PageRow> get(const QString& documentId, int page) const = 0;

    virtual int pageCount() const = 0;
};

} // namespace pl
