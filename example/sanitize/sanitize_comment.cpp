#include <iostream>
#include <string>

#include "vigil/vigil.hpp"

using namespace vigil;
using type::Array;
using type::Object;
using type::Value;

// Helper function to print section headers
void printHeader(const std::string& title) {
    std::cout << "\n=================================================="
              << std::endl;
    std::cout << "  " << title << std::endl;
    std::cout << "==================================================\n"
              << std::endl;
}

int main() {
    Value comment(Object{
        {"author", "  mallory  "},
        {"body",
         "Nice post!<script>fetch('/steal?c='+document.cookie)</script>"
         "<img src=x onerror=\"alert(1)\"> <!-- hidden -->"},
        {"links", Array{"<a href=\"javascript:alert(1)\">click</a>",
                        "https://example.com"}}});

    printHeader("Default configuration");
    auto result = sanitize::sanitize(comment);
    std::cout << result.toJson().dump(2) << std::endl;

    printHeader("Rich text with an allow-list");
    sanitize::SanitizationConfig rich;
    rich.escapeHtml = false;
    rich.allowedTags = {"b", "i", "a", "p"};
    rich.allowedAttributes = {"href"};
    rich.maxLength = 80;
    auto richResult = sanitize::sanitize(
        Value("<p onclick=\"x()\">Hello <b>world</b> <u>again</u>"
              "<a href=\"/profile\" target=\"_blank\">me</a></p>"),
        rich);
    std::cout << type::toJson(richResult.sanitized).dump() << std::endl;
    for (const auto& fragment : richResult.removed) {
        std::cout << "  removed: " << fragment << std::endl;
    }

    printHeader("sanitizeHtml");
    std::cout << sanitize::sanitizeHtml(
                     "<div><b>bold</b> 1 < 2 <script>x()</script></div>",
                     {"b"}, {})
              << std::endl;

    printHeader("Type guards");
    Value user(Object{{"id", 1}, {"name", "Ana"}, {"email", "ana@example.com"}});
    std::cout << std::boolalpha << "isUser: " << guard::isUser(user)
              << "\nisArrayOf(links, isString): "
              << guard::isArrayOf(comment.get("links"), guard::isString)
              << std::endl;

    return 0;
}
