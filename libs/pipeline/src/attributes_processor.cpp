// Copyright 2025 sigroute Contributors
// SPDX-License-Identifier: Apache-2.0

#include "sigroute/attributes_processor.hpp"

namespace sigroute {

const char* to_string(AttributeAction::Type type) {
    switch (type) {
        case AttributeAction::Type::Insert: return "insert";
        case AttributeAction::Type::Update: return "update";
        case AttributeAction::Type::Upsert: return "upsert";
        case AttributeAction::Type::Delete: return "delete";
    }
    return "unknown";
}

std::optional<AttributeAction::Type> attribute_action_from_string(const std::string& name) {
    if (name == "insert") return AttributeAction::Type::Insert;
    if (name == "update") return AttributeAction::Type::Update;
    if (name == "upsert") return AttributeAction::Type::Upsert;
    if (name == "delete") return AttributeAction::Type::Delete;
    return std::nullopt;
}

AttributesProcessor::AttributesProcessor(std::string name, std::vector<AttributeAction> actions)
    : name_(std::move(name)), actions_(std::move(actions)) {}

void AttributesProcessor::process(std::vector<Signal>& signals) const {
    for (auto& signal : signals) {
        apply(signal.mutable_attributes());
    }
}

void AttributesProcessor::apply(Attributes& attributes) const {
    for (const auto& action : actions_) {
        if (action.type == AttributeAction::Type::Delete) {
            attributes.erase(action.key);
            continue;
        }

        std::optional<AttributeValue> value = action.value;
        if (!action.from_attribute.empty()) {
            auto source = attributes.find(action.from_attribute);
            if (source == attributes.end()) {
                continue;
            }
            value = source->second;
        }
        if (!value) {
            continue;
        }

        bool present = attributes.count(action.key) > 0;
        switch (action.type) {
            case AttributeAction::Type::Insert:
                if (!present) attributes.emplace(action.key, *value);
                break;
            case AttributeAction::Type::Update:
                if (present) attributes[action.key] = *value;
                break;
            case AttributeAction::Type::Upsert:
                attributes[action.key] = *value;
                break;
            case AttributeAction::Type::Delete:
                break;
        }
    }
}

}  // namespace sigroute
