// Copyright 2025 sigroute Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file attributes_processor.hpp
/// @brief Insert, update, upsert and delete actions on signal attributes

#include "sigroute/processor.hpp"

#include <optional>
#include <string>
#include <vector>

namespace sigroute {

struct AttributeAction {
    enum class Type {
        Insert,  ///< Set only if the key is absent
        Update,  ///< Set only if the key is present
        Upsert,  ///< Always set
        Delete   ///< Remove the key
    };

    std::string key;
    Type type = Type::Upsert;
    /// Literal value, used unless from_attribute is set
    std::optional<AttributeValue> value;
    /// Copy the value of another attribute of the same signal
    std::string from_attribute;
};

/// @return "insert", "update", "upsert" or "delete"
const char* to_string(AttributeAction::Type type);

std::optional<AttributeAction::Type> attribute_action_from_string(const std::string& name);

class AttributesProcessor : public Processor {
public:
    AttributesProcessor(std::string name, std::vector<AttributeAction> actions);

    void process(std::vector<Signal>& signals) const override;

    std::string name() const override { return name_; }

    /// Apply the actions to one attribute map, in order
    void apply(Attributes& attributes) const;

private:
    std::string name_;
    std::vector<AttributeAction> actions_;
};

}  // namespace sigroute
