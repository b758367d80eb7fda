/**
 * @file types.cpp
 * @brief Shared callbacks
 */

#include "t2p/core/types.hpp"
#include <iostream>

namespace t2p {

StatusCallback stderr_status() {
    return [](const std::string& message) {
        std::cerr << "[t2p] " << message << "\n";
    };
}

} // namespace t2p
