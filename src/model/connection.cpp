/// @file connection.cpp
/// @brief Component id index and pad reference resolution

#include "model/connection.hpp"

namespace tapeboard {

void ComponentIndex::build() const {
    by_id_.clear();
    by_id_.reserve(components_.size());
    for (size_t i = 0; i < components_.size(); i++) {
        by_id_.emplace(components_[i].id, i);
    }
    built_ = true;
}

const Component* ComponentIndex::find(const std::string& id) const {
    auto position = position_of(id);
    return position ? &components_[*position] : nullptr;
}

std::optional<size_t> ComponentIndex::position_of(const std::string& id) const {
    if (!built_) {
        build();
    }
    auto it = by_id_.find(id);
    if (it == by_id_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<ResolvedEndpoint> resolve_pad(const ComponentIndex& index, const PadRef& ref) {
    const Component* component = index.find(ref.component_id);
    if (component == nullptr) {
        return std::nullopt;
    }
    if (ref.pad_index < 0 || ref.pad_index >= static_cast<int>(component->pads.size())) {
        return std::nullopt;
    }
    const Pad* pad = &component->pads[static_cast<size_t>(ref.pad_index)];
    return ResolvedEndpoint{component, pad, to_world(*component, pad->pos)};
}

std::optional<SkippedConnection> check_connection(const ComponentIndex& index,
                                                  const Connection& connection) {
    for (const PadRef* ref : {&connection.from, &connection.to}) {
        const Component* component = index.find(ref->component_id);
        if (component == nullptr) {
            return SkippedConnection{connection.id,
                                     "unknown component '" + ref->component_id + "'"};
        }
        if (ref->pad_index < 0 || ref->pad_index >= static_cast<int>(component->pads.size())) {
            return SkippedConnection{connection.id,
                                     "pad " + std::to_string(ref->pad_index) +
                                         " out of range on '" + ref->component_id + "' (" +
                                         std::to_string(component->pads.size()) + " pads)"};
        }
    }
    return std::nullopt;
}

} // namespace tapeboard
