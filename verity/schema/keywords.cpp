/*
 * keywords.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-4-5

Description: Validators for individual JSON Schema keywords

**************************************************/

#include "keywords.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <memory>
#include <regex>
#include <set>

#include <spdlog/spdlog.h>

#include "verity/utils/string.hpp"

namespace verity::schema {

namespace {
constexpr double MULTIPLE_OF_TOLERANCE = 1e-9;

using RegexPtr = std::shared_ptr<const std::regex>;

auto compileRegex(const std::string& pattern) -> RegexPtr {
    try {
        return std::make_shared<const std::regex>(pattern,
                                                  std::regex::ECMAScript);
    } catch (const std::regex_error& e) {
        spdlog::warn("Invalid regex pattern '{}': {}", pattern, e.what());
        return nullptr;
    }
}

auto describeTypes(const std::vector<PrimitiveType>& types) -> std::string {
    std::string text;
    for (std::size_t i = 0; i < types.size(); ++i) {
        if (i > 0) {
            text += " or ";
        }
        text += std::format("'{}'", toString(types[i]));
    }
    return text;
}
}  // namespace

auto formatNumber(double number) -> std::string {
    return std::format("{}", number);
}

auto validateType(std::vector<PrimitiveType> types) -> Validator {
    return [types = std::move(types)](const json& value) {
        if (std::ranges::any_of(types, [&value](PrimitiveType type) {
                return matchesType(value, type);
            })) {
            return ValidationResult::valid();
        }
        if (types.empty()) {
            return ValidationResult::invalid(std::format(
                "'{}' is not of any recognised type", describeValue(value)));
        }
        return ValidationResult::invalid(
            std::format("'{}' is not of type {}", describeValue(value),
                        describeTypes(types)));
    };
}

auto validateEnum(std::vector<json> values) -> Validator {
    return [values = std::move(values)](const json& value) {
        if (std::find(values.begin(), values.end(), value) != values.end()) {
            return ValidationResult::valid();
        }
        return ValidationResult::invalid(
            std::format("'{}' is not a valid enumeration value of '{}'",
                        describeValue(value), describeValue(json(values))));
    };
}

auto validateMaxLength(std::size_t maxLength) -> Validator {
    return [maxLength](const json& value) {
        if (!value.is_string() ||
            utils::utf8Length(value.get_ref<const std::string&>()) <=
                maxLength) {
            return ValidationResult::valid();
        }
        return ValidationResult::invalid(std::format(
            "Length of string is larger than max length {}", maxLength));
    };
}

auto validateMinLength(std::size_t minLength) -> Validator {
    return [minLength](const json& value) {
        if (!value.is_string() ||
            utils::utf8Length(value.get_ref<const std::string&>()) >=
                minLength) {
            return ValidationResult::valid();
        }
        return ValidationResult::invalid(std::format(
            "Length of string is smaller than minimum length {}", minLength));
    };
}

auto validatePattern(const std::string& pattern) -> Validator {
    auto regex = compileRegex(pattern);
    if (!regex) {
        return invalid(std::format("Invalid regex pattern '{}'", pattern));
    }

    return [regex, pattern](const json& value) {
        if (!value.is_string() ||
            std::regex_search(value.get_ref<const std::string&>(), *regex)) {
            return ValidationResult::valid();
        }
        return ValidationResult::invalid(
            std::format("'{}' does not match pattern: '{}'",
                        value.get_ref<const std::string&>(), pattern));
    };
}

auto validateMultipleOf(double divisor) -> Validator {
    if (!(divisor > 0) || !std::isfinite(divisor)) {
        return invalid(std::format("multipleOf must be greater than 0, got {}",
                                   formatNumber(divisor)));
    }

    return [divisor](const json& value) {
        if (!value.is_number()) {
            return ValidationResult::valid();
        }
        const auto quotient = value.get<double>() / divisor;
        if (std::isfinite(quotient) &&
            std::fabs(quotient - std::round(quotient)) <=
                MULTIPLE_OF_TOLERANCE * std::max(1.0, std::fabs(quotient))) {
            return ValidationResult::valid();
        }
        return ValidationResult::invalid(
            std::format("{} is not a multiple of {}", describeValue(value),
                        formatNumber(divisor)));
    };
}

auto validateMinimum(double minimum, bool exclusive) -> Validator {
    return [minimum, exclusive](const json& value) {
        if (!value.is_number()) {
            return ValidationResult::valid();
        }
        const auto number = value.get<double>();
        if (exclusive ? number > minimum : number >= minimum) {
            return ValidationResult::valid();
        }
        if (exclusive) {
            return ValidationResult::invalid(std::format(
                "Value is lower than or equal to exclusive minimum value of {}",
                formatNumber(minimum)));
        }
        return ValidationResult::invalid(std::format(
            "Value is lower than minimum value of {}", formatNumber(minimum)));
    };
}

auto validateMaximum(double maximum, bool exclusive) -> Validator {
    return [maximum, exclusive](const json& value) {
        if (!value.is_number()) {
            return ValidationResult::valid();
        }
        const auto number = value.get<double>();
        if (exclusive ? number < maximum : number <= maximum) {
            return ValidationResult::valid();
        }
        if (exclusive) {
            return ValidationResult::invalid(std::format(
                "Value exceeds or equals exclusive maximum value of {}",
                formatNumber(maximum)));
        }
        return ValidationResult::invalid(std::format(
            "Value exceeds maximum value of {}", formatNumber(maximum)));
    };
}

auto validateMinItems(std::size_t minItems) -> Validator {
    return [minItems](const json& value) {
        if (!value.is_array() || value.size() >= minItems) {
            return ValidationResult::valid();
        }
        return ValidationResult::invalid(std::format(
            "Length of array is smaller than the minimum {}", minItems));
    };
}

auto validateMaxItems(std::size_t maxItems) -> Validator {
    return [maxItems](const json& value) {
        if (!value.is_array() || value.size() <= maxItems) {
            return ValidationResult::valid();
        }
        return ValidationResult::invalid(std::format(
            "Length of array is greater than maximum {}", maxItems));
    };
}

auto validateUniqueItems() -> Validator {
    return [](const json& value) {
        if (!value.is_array()) {
            return ValidationResult::valid();
        }
        std::set<json> seen;
        for (const auto& item : value) {
            if (!seen.insert(item).second) {
                return ValidationResult::invalid(std::format(
                    "{} does not have unique items", describeValue(value)));
            }
        }
        return ValidationResult::valid();
    };
}

auto validateItems(Validator items) -> Validator {
    return [items = std::move(items)](const json& value) {
        if (!value.is_array()) {
            return ValidationResult::valid();
        }
        std::vector<ValidationResult> results;
        results.reserve(value.size());
        for (const auto& element : value) {
            results.push_back(items(element));
        }
        return flatten(results);
    };
}

auto validateTupleItems(std::vector<Validator> items, bool allowAdditional,
                        Validator additional) -> Validator {
    return [items = std::move(items), allowAdditional,
            additional = std::move(additional)](const json& value) {
        if (!value.is_array()) {
            return ValidationResult::valid();
        }
        std::vector<ValidationResult> results;
        results.reserve(value.size());
        for (std::size_t index = 0; index < value.size(); ++index) {
            if (index < items.size()) {
                results.push_back(items[index](value[index]));
            } else if (allowAdditional) {
                results.push_back(additional(value[index]));
            } else {
                results.push_back(ValidationResult::invalid(
                    "Additional items are not permitted in this array"));
            }
        }
        return flatten(results);
    };
}

auto validateMaxProperties(std::size_t maxProperties) -> Validator {
    return [maxProperties](const json& value) {
        if (!value.is_object() || value.size() <= maxProperties) {
            return ValidationResult::valid();
        }
        return ValidationResult::invalid(std::format(
            "Amount of properties is greater than maximum permitted {}",
            maxProperties));
    };
}

auto validateMinProperties(std::size_t minProperties) -> Validator {
    return [minProperties](const json& value) {
        if (!value.is_object() || value.size() >= minProperties) {
            return ValidationResult::valid();
        }
        return ValidationResult::invalid(std::format(
            "Amount of properties is less than the required amount {}",
            minProperties));
    };
}

auto validateRequired(std::vector<std::string> keys) -> Validator {
    return [keys = std::move(keys)](const json& value) {
        if (!value.is_object()) {
            return ValidationResult::valid();
        }
        std::vector<std::string> missing;
        for (const auto& key : keys) {
            if (!value.contains(key)) {
                missing.push_back(
                    std::format("Required property '{}' is missing", key));
            }
        }
        if (missing.empty()) {
            return ValidationResult::valid();
        }
        return ValidationResult::fromErrors(std::move(missing));
    };
}

auto validateProperties(
    std::vector<std::pair<std::string, Validator>> properties,
    std::vector<std::pair<std::string, Validator>> patternProperties,
    bool allowAdditional, Validator additional) -> Validator {
    std::vector<std::pair<RegexPtr, Validator>> patterns;
    patterns.reserve(patternProperties.size());
    for (auto& [pattern, validator] : patternProperties) {
        auto regex = compileRegex(pattern);
        if (!regex) {
            return invalid(std::format(
                "Invalid regex pattern '{}' in 'patternProperties'", pattern));
        }
        patterns.emplace_back(std::move(regex), std::move(validator));
    }

    return [properties = std::move(properties), patterns = std::move(patterns),
            allowAdditional,
            additional = std::move(additional)](const json& value) {
        if (!value.is_object()) {
            return ValidationResult::valid();
        }

        std::vector<ValidationResult> results;
        for (const auto& item : value.items()) {
            const std::string& key = item.key();
            const json& child = item.value();
            bool matched = false;

            auto declared = std::ranges::find_if(
                properties,
                [&key](const auto& entry) { return entry.first == key; });
            if (declared != properties.end()) {
                matched = true;
                results.push_back(declared->second(child));
            }

            for (const auto& [regex, validator] : patterns) {
                if (std::regex_search(key, *regex)) {
                    matched = true;
                    results.push_back(validator(child));
                }
            }

            if (matched) {
                continue;
            }
            if (allowAdditional) {
                results.push_back(additional(child));
            } else {
                results.push_back(ValidationResult::invalid(std::format(
                    "Additional property '{}' is not permitted in this object",
                    key)));
            }
        }
        return flatten(results);
    };
}

auto validateSchemaDependency(std::string key,
                              Validator dependency) -> Validator {
    return [key = std::move(key),
            dependency = std::move(dependency)](const json& value) {
        if (!value.is_object() || !value.contains(key)) {
            return ValidationResult::valid();
        }
        return dependency(value);
    };
}

auto validatePropertyDependency(std::string key,
                                std::vector<std::string> dependencies)
    -> Validator {
    return [key = std::move(key),
            dependencies = std::move(dependencies)](const json& value) {
        if (!value.is_object() || !value.contains(key)) {
            return ValidationResult::valid();
        }
        std::vector<std::string> missing;
        for (const auto& dependency : dependencies) {
            if (!value.contains(dependency)) {
                missing.push_back(std::format(
                    "'{}' is missing its dependency of '{}'", key, dependency));
            }
        }
        if (missing.empty()) {
            return ValidationResult::valid();
        }
        return ValidationResult::fromErrors(std::move(missing));
    };
}

auto validateFormat(std::string name, FormatValidator format) -> Validator {
    return [name = std::move(name),
            format = std::move(format)](const json& value) {
        if (!value.is_string() ||
            format(value.get_ref<const std::string&>())) {
            return ValidationResult::valid();
        }
        return ValidationResult::invalid(
            std::format("'{}' is not a valid '{}' value",
                        value.get_ref<const std::string&>(), name));
    };
}

}  // namespace verity::schema
