// ==============================================================================
// scheduler.cpp - Пул рабочих потоков
// ==============================================================================

#include "salvage/scheduler.hpp"

#include "salvage/platform.hpp"

namespace salvage::scan {

size_t resolve_worker_count(int requested) {
    if (requested <= 0) {
        return platform::hardware_threads();
    }
    return static_cast<size_t>(requested);
}

}  // namespace salvage::scan
