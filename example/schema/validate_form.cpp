#include <iostream>
#include <string>

#include "vigil/vigil.hpp"

using namespace vigil;
using schema::Schema;
using type::Array;
using type::Object;
using type::Value;
using json = nlohmann::json;

// Helper function to print section headers
void printHeader(const std::string& title) {
    std::cout << "\n=================================================="
              << std::endl;
    std::cout << "  " << title << std::endl;
    std::cout << "==================================================\n"
              << std::endl;
}

void printResult(const schema::ValidationResult& result) {
    std::cout << result.toJson().dump(2) << std::endl;
}

int main() {
    schema::Engine engine;

    // Signup form declared in code
    schema::SchemaNode signup = Schema::object({
        {"name", Schema::string().required().validator(
                     [](const Value& value, const schema::ValidationContext&)
                         -> schema::Verdict {
                         if (value.asString().size() < 2) {
                             return "Name must have at least 2 characters";
                         }
                         return true;
                     })},
        {"email", Schema::string().required().customType("email")},
        {"cpf", Schema::string().required().customType("cpf")},
        {"phone", Schema::string().optional().customType("phone")},
        {"role", Schema::string().withDefault("viewer")},
        {"tags", Schema::array(Schema::string()).maxLength(5).unique().optional()},
    });

    printHeader("Valid submission");
    Value good(Object{{"name", "Ana Silva"},
                      {"email", "Ana@Example.COM"},
                      {"cpf", "52998224725"},
                      {"phone", "11987654321"},
                      {"tags", Array{"admin", "ops"}},
                      {"csrf", "ignored"}});
    // Extra keys only warn in strict mode; the transformed copy drops them
    printResult(engine.validate(
        good, signup,
        {.strict = true, .transform = true, .applyDefaults = true}));

    printHeader("Invalid submission");
    Value bad(Object{{"name", "A"},
                     {"email", "ana@"},
                     {"cpf", "111.111.111-11"},
                     {"tags", Array{"x", "x"}}});
    printResult(engine.validate(bad, signup));

    printHeader("Schema loaded from JSON");
    auto loaded = schema::schemaFromJson(json::parse(R"({
        "users": {
            "type": "array",
            "minLength": 1,
            "items": {
                "email": {"type": "string", "required": true, "customType": "email"},
                "zip": {"type": "string", "customType": "cep", "optional": true}
            }
        }
    })"));
    auto data = type::fromJson(json::parse(R"({
        "users": [
            {"email": "a@example.com", "zip": "01310-100"},
            {"email": "broken"}
        ]
    })"));
    printResult(engine.validate(data, loaded));

    return 0;
}
