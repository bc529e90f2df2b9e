#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "vigil/sanitize/sanitizer.hpp"
#include "vigil/utils/string.hpp"

using namespace vigil::sanitize;
using vigil::type::Array;
using vigil::type::Object;
using vigil::type::Value;
using ::testing::Contains;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::IsEmpty;

class SanitizerTest : public ::testing::Test {
protected:
    static auto clean(const std::string& text,
                      const SanitizationConfig& config) -> std::string {
        std::vector<std::string> removed;
        std::vector<std::string> warnings;
        return sanitizeString(text, config, removed, warnings);
    }

    SanitizationConfig markupOnly = [] {
        SanitizationConfig config;
        config.escapeHtml = false;
        return config;
    }();
};

TEST_F(SanitizerTest, RemovesScriptAndRecordsIt) {
    auto result = sanitize(Value("<p>Hello<script>alert(1)</script></p>"));
    EXPECT_EQ(result.sanitized,
              Value("&lt;p&gt;Hello&lt;&#x2F;p&gt;"));
    EXPECT_THAT(result.removed, Contains("<script>alert(1)</script>"));
    EXPECT_THAT(result.warnings, IsEmpty());
}

TEST_F(SanitizerTest, RemovesDangerousMarkup) {
    EXPECT_EQ(clean("<iframe src=\"x\"></iframe>ok", markupOnly), "ok");
    EXPECT_EQ(clean("<img src=x onerror=\"steal()\">", markupOnly),
              "<img src=\"x\">");
    EXPECT_EQ(clean("<a href=\"javascript:go()\">x</a>", markupOnly),
              "<a>x</a>");
    EXPECT_EQ(clean("<meta http-equiv=refresh>text", markupOnly), "text");
    EXPECT_EQ(clean("<style>p{}</style><p style=\"color:red\">t</p>",
                    markupOnly),
              "<p>t</p>");
    EXPECT_EQ(clean("a<!-- hidden -->b", markupOnly), "ab");
}

TEST_F(SanitizerTest, NestedObfuscationIsRemovedToFixpoint) {
    std::string text = clean("<scr<script>x</script>ipt>alert(1)</script>",
                             markupOnly);
    EXPECT_EQ(clean(text, markupOnly), text);
    EXPECT_THAT(text, ::testing::Not(HasSubstr("</script>")));
}

TEST_F(SanitizerTest, IdempotentWithoutEscaping) {
    for (const std::string input :
         {"  <b>hi</b>   <script>x</script> there <!-- c --> ",
          "<a href=\"vbscript:x\" onclick=\"y\">link</a>",
          "plain\t\ttext\n", "<<script>script>alert(1)<</script>/script>"}) {
        std::string once = clean(input, markupOnly);
        EXPECT_EQ(clean(once, markupOnly), once) << input;
    }
    EXPECT_EQ(clean("  <b>hi</b>   <script>x</script> there <!-- c --> ",
                    markupOnly),
              "<b>hi</b> there");
}

TEST_F(SanitizerTest, EscapingTwiceDoubleEscapes) {
    SanitizationConfig config;
    std::string once = clean("a & b", config);
    EXPECT_EQ(once, "a &amp; b");
    EXPECT_EQ(clean(once, config), "a &amp;amp; b");
}

TEST_F(SanitizerTest, ControlCharactersAndWhitespace) {
    EXPECT_EQ(clean(std::string("a\x01\x7f b\x00" "c", 7), markupOnly), "a bc");

    SanitizationConfig keep = markupOnly;
    keep.normalizeWhitespace = false;
    EXPECT_EQ(clean("  a  b ", keep), "  a  b ");
}

TEST_F(SanitizerTest, StripNonAlphanumeric) {
    SanitizationConfig config;
    config.stripNonAlphanumeric = true;
    EXPECT_EQ(clean("Olá, mundo! <b>42</b>", config), "Ol mundo ltbgt42ltx2Fbgt");

    config.escapeHtml = false;
    EXPECT_EQ(clean("a-b  c!", config), "ab c");
}

TEST_F(SanitizerTest, TruncatesByCodePoints) {
    SanitizationConfig config;
    config.maxLength = 5;
    EXPECT_EQ(clean("héllo world", config), "héllo");

    config.maxLength = 6;
    EXPECT_EQ(clean("hello world", config), "hello");
}

TEST_F(SanitizerTest, AllowListKeepsSafeTags) {
    SanitizationConfig config = markupOnly;
    config.allowedTags = {"b", "a"};
    config.allowedAttributes = {"href"};
    EXPECT_EQ(clean("<b>x</b><u>y</u><a href=\"/p\" title=\"t\">z</a>", config),
              "<b>x</b>y<a href=\"/p\">z</a>");
}

TEST_F(SanitizerTest, WalksNestedStructures) {
    Value data(Object{
        {"title", "<b>Hi</b>"},
        {"tags", Array{" a ", "<script>x</script>b"}},
        {"count", 3},
        {"active", true},
        {"missing", nullptr}});
    auto result = sanitize(data, markupOnly);
    const Value& out = result.sanitized;
    EXPECT_EQ(out.get("title"), Value("<b>Hi</b>"));
    EXPECT_EQ(out.get("tags"), Value(Array{"a", "b"}));
    EXPECT_EQ(out.get("count"), Value(3));
    EXPECT_EQ(out.get("active"), Value(true));
    EXPECT_TRUE(out.get("missing").isNull());
}

TEST_F(SanitizerTest, SanitizesKeys) {
    Value data(Object{{"  name ", "x"}});
    auto result = sanitize(data);
    EXPECT_TRUE(result.sanitized.contains("name"));
}

TEST_F(SanitizerTest, KeyCollisionKeepsFirst) {
    Value data(Object{{"a<script>x</script>", 1}, {"a", 2}});
    auto result = sanitize(data);
    ASSERT_EQ(result.sanitized.size(), 1U);
    EXPECT_EQ(result.sanitized.get("a"), Value(1));
    ASSERT_EQ(result.warnings.size(), 1U);
    EXPECT_THAT(result.warnings[0], HasSubstr("collides"));
}

TEST_F(SanitizerTest, DepthLimitReplacesWithNull) {
    SanitizationConfig config;
    config.maxDepth = 1;
    Value data(Object{{"a", Object{{"b", Object{{"c", "x"}}}}}});
    auto result = sanitize(data, config);
    EXPECT_TRUE(result.sanitized.get("a").get("b").isNull());
    ASSERT_EQ(result.warnings.size(), 1U);
    EXPECT_THAT(result.warnings[0], HasSubstr("a.b"));
}

TEST_F(SanitizerTest, NeverThrowsOnOddInput) {
    std::string binary;
    for (int c = 0; c < 256; ++c) {
        binary.push_back(static_cast<char>(c));
    }
    for (const std::string input :
         {std::string("<"), std::string("<<<>>>"), std::string("<a b='"),
          std::string("<!--"), std::string("\xff\xfe<script"), binary}) {
        EXPECT_NO_THROW((void)sanitize(Value(input)));
    }
}

TEST_F(SanitizerTest, FailingStageLeavesStringUnsanitized) {
    SanitizationConfig config;
    config.extraStages.push_back([](std::string_view text) -> std::string {
        if (text.find("boom") != std::string_view::npos) {
            throw std::runtime_error("stage exploded");
        }
        return std::string(text);
    });
    const std::string hostile = "<script>alert(1)</script>boom";
    Value data(Object{{"bio", hostile}, {"name", "<b>Ana</b>"}});

    SanitizationResult result;
    ASSERT_NO_THROW(result = sanitize(data, config));
    EXPECT_EQ(result.sanitized.get("bio"), Value(hostile));
    EXPECT_EQ(result.sanitized.get("name"), Value("&lt;b&gt;Ana&lt;&#x2F;b&gt;"));
    ASSERT_EQ(result.warnings.size(), 1U);
    EXPECT_THAT(result.warnings[0], HasSubstr("bio"));
    EXPECT_THAT(result.warnings[0], HasSubstr("left unsanitized"));
    EXPECT_THAT(result.warnings[0], HasSubstr("stage exploded"));
}

TEST_F(SanitizerTest, ExtraStagesRunBeforeTruncation) {
    SanitizationConfig config = markupOnly;
    config.maxLength = 5;
    config.extraStages.push_back(
        [](std::string_view text) { return vigil::utils::toUpper(text); });
    EXPECT_EQ(clean("hello world", config), "HELLO");
}

TEST_F(SanitizerTest, UnsettledMarkupRemovalIsReported) {
    SanitizationConfig config = markupOnly;
    config.maxPasses = 1;
    auto result = sanitize(Value(Array{"<!-- note -->Hello", "plain"}), config);
    EXPECT_EQ(result.sanitized.asArray()[0], Value("Hello"));
    ASSERT_EQ(result.warnings.size(), 1U);
    EXPECT_THAT(result.warnings[0], HasSubstr("did not settle after 1 passes"));
    EXPECT_THAT(result.warnings[0], HasSubstr("[0]"));

    auto settled = sanitize(Value("<!-- note -->Hello"), markupOnly);
    EXPECT_THAT(settled.warnings, IsEmpty());
}

TEST_F(SanitizerTest, ConfigFromJson) {
    auto config = SanitizationConfig::fromJson(
        {{"escapeHtml", false},
         {"maxLength", 10},
         {"allowedTags", {"B", "i"}},
         {"maxPasses", 4}});
    EXPECT_FALSE(config.escapeHtml);
    EXPECT_EQ(config.maxPasses, 4U);
    EXPECT_EQ(SanitizationConfig::defaults().maxPasses, 32U);
    EXPECT_TRUE(config.removeScripts);
    EXPECT_EQ(config.maxLength.value_or(0), 10U);
    EXPECT_THAT(config.allowedTags, ElementsAre("b", "i"));

    EXPECT_THROW((void)SanitizationConfig::fromJson({{"maxLength", "ten"}}),
                 std::invalid_argument);
    EXPECT_THROW((void)SanitizationConfig::fromJson({{"allowedTags", {1, 2}}}),
                 std::invalid_argument);

    json round = config.toJson();
    EXPECT_EQ(round["maxLength"], 10);
    EXPECT_EQ(round["maxPasses"], 4);
    EXPECT_TRUE(SanitizationConfig::defaults().toJson()["maxLength"].is_null());
}

TEST_F(SanitizerTest, ResultToJson) {
    auto result = sanitize(Value(Array{"<script>x</script>ok"}));
    json out = result.toJson();
    EXPECT_EQ(out["sanitized"], json::array({"ok"}));
    EXPECT_EQ(out["removed"][0], "<script>x</script>");
}
