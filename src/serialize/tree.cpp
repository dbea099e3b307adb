#include "serialize/tree.hpp"

#include <spdlog/fmt/fmt.h>

#include <cmath>
#include <locale>
#include <sstream>

namespace pitwall::serialize {

double widenFloat(float value) {
    if (!std::isfinite(value)) {
        return static_cast<double>(value);
    }
    // fmt prints the shortest text that reads back as the same float
    // and is locale independent; read it back the same way
    std::istringstream text(fmt::format("{}", value));
    text.imbue(std::locale::classic());
    double widened = 0.0;
    text >> widened;
    return widened;
}

Tree toTree(const packets::PacketHeader& header) {
    return TreeBuilder::record(header);
}

Tree toTree(const packets::DecodedPacket& packet) {
    Tree tree = Tree::object();
    tree["header"] = toTree(packet.header);

    std::visit([&tree](const auto& body) {
        using Body = std::decay_t<decltype(body)>;
        TreeBuilder builder(tree);
        Body::fields(body, builder);
    }, packet.body);

    return tree;
}

std::string renderJson(const Tree& tree) {
    return tree.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
}

} // namespace pitwall::serialize
