#include "panelayout/node_id.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>

namespace panelayout {

    namespace {

        std::atomic<uint64_t> node_sequence{0};

        int64_t               coarse_timestamp_ms() {
            const auto now = std::chrono::system_clock::now().time_since_epoch();
            return std::chrono::duration_cast<std::chrono::milliseconds>(now).count();
        }

    } // namespace

    NodeId next_node_id() {
        const uint64_t sequence = node_sequence.fetch_add(1, std::memory_order_relaxed) + 1;
        std::string    id       = "node-";
        id.append(std::to_string(coarse_timestamp_ms()));
        id.push_back('-');
        id.append(std::to_string(sequence));
        return id;
    }

} // namespace panelayout
