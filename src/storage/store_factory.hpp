#pragma once

#include "storage/store.hpp"
#include "storage/types.hpp"

#include <filesystem>

namespace sortkv {

// Returns a closed store for `backend`.
[[nodiscard]] StorePtr make_store(Backend backend, StoreOptions options = {});

// Returns a store for `backend` already opened at `location`.
// Throws BackendIOError if the engine cannot be opened.
[[nodiscard]] StorePtr open_store(Backend backend,
                                  const std::filesystem::path& location,
                                  StoreOptions options = {});

} // namespace sortkv
