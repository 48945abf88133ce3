#ifndef PANELAYOUT_NODE_ID_HPP
#define PANELAYOUT_NODE_ID_HPP

#include <string>

namespace panelayout {

    using NodeId = std::string;

    // "node-<unix-ms>-<seq>". The sequence is process-wide and never repeats.
    NodeId next_node_id();

} // namespace panelayout

#endif // PANELAYOUT_NODE_ID_HPP
