#include "common/error.hpp"

namespace sortkv {

namespace {

class StoreCategory final : public std::error_category {
public:
    const char* name() const noexcept override { return "sortkv.store"; }

    std::string message(int ev) const override {
        switch (static_cast<StoreErrc>(ev)) {
            case StoreErrc::ok:           return "success";
            case StoreErrc::not_found:    return "key not found";
            case StoreErrc::backend_io:   return "storage backend I/O error";
            case StoreErrc::corrupt_data: return "persisted data is corrupt";
            case StoreErrc::not_open:     return "store is not open";
            case StoreErrc::already_open: return "store is already open";
        }
        return "unknown store error";
    }
};

} // anonymous namespace

const std::error_category& store_category() noexcept {
    static const StoreCategory category;
    return category;
}

std::error_code make_error_code(StoreErrc e) noexcept {
    return {static_cast<int>(e), store_category()};
}

} // namespace sortkv
