#include "verity/schema/schema.hpp"

#include <iostream>
#include <string_view>

#include <spdlog/spdlog.h>

using namespace verity::schema;

int main() {
    spdlog::set_level(spdlog::level::warn);

    // Define a JSON schema with a shared definition
    json document = {
        {"title", "Server"},
        {"type", "object"},
        {"definitions", {{"port", {{"type", "integer"}, {"minimum", 1}, {"maximum", 65535}}}}},
        {"properties",
         {
             {"name", {{"type", "string"}, {"minLength", 1}}},
             {"address", {{"type", "string"}, {"format", "ipv4"}}},
             {"host", {{"type", "string"}, {"format", "hostname"}}},
             {"port", {{"$ref", "#/definitions/port"}}},
             {"tags", {{"type", "array"}, {"items", {{"type", "string"}}}, {"uniqueItems", true}}},
         }},
        {"required", {"name", "address", "port"}},
        {"additionalProperties", false}};

    // Add a custom format next to the built-in ipv4 and ipv6 formats
    auto formats = FormatRegistry::withDefaults();
    formats.registerFormat("hostname", [](std::string_view text) {
        return !text.empty() && text.size() <= 253 &&
               text.find_first_of(" /") == std::string_view::npos;
    });

    Schema schema(document, formats);
    std::cout << "Schema: " << schema.title().value_or("<untitled>") << " ("
              << schema.document().size() << " keywords)" << std::endl;

    // A conforming instance
    json validInstance = {{"name", "primary"},
                          {"address", "10.0.0.1"},
                          {"host", "db.internal"},
                          {"port", 8080},
                          {"tags", {"web", "public"}}};

    auto result = schema.validate(validInstance);
    std::cout << "Valid instance is valid: " << std::boolalpha
              << result.isValid() << std::endl;

    // An instance breaking several constraints
    json invalidInstance = {{"name", ""},
                            {"address", "10.0.0"},
                            {"host", "bad host"},
                            {"port", 70000},
                            {"tags", {"web", "web"}},
                            {"owner", "ops"}};

    result = schema.validate(invalidInstance);
    std::cout << "Invalid instance is valid: " << std::boolalpha
              << result.isValid() << std::endl;

    std::cout << "Validation errors:" << std::endl;
    for (const auto& error : result.errors()) {
        std::cout << "Error: " << error << std::endl;
    }

    std::cout << result.toJson().dump(2) << std::endl;
    return 0;
}
