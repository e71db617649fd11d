#include "storage/range_scan.hpp"

#include <utility>

namespace sortkv {

RangeScan::RangeScan(CursorPtr cursor, KeyRange range)
    : cursor_(std::move(cursor)), range_(std::move(range)) {
    if (range_.empty()) {
        done_ = true;
        return;
    }

    if (range_.from) {
        cursor_->seek(*range_.from);
    } else {
        cursor_->seek_first();
    }
    settle();
}

void RangeScan::advance() {
    if (done_) {
        return;
    }
    cursor_->next();
    settle();
}

void RangeScan::settle() {
    // Keys arrive in ascending order, so the first key past the upper bound
    // ends the scan for good.
    if (!cursor_->valid() || !range_.below_upper(cursor_->key())) {
        done_ = true;
    }
}

} // namespace sortkv
