#include <gtest/gtest.h>
#include <shebang/plugin.hpp>

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

using namespace shebang;

namespace {

class CapturingLogger : public Logger {
public:
    void log(LogLevel level, const std::string& message) override {
        if (level < min_level_) return;
        messages.emplace_back(level, message);
    }

    bool contains(const std::string& fragment) const {
        for (const auto& entry : messages) {
            if (entry.second.find(fragment) != std::string::npos) return true;
        }
        return false;
    }

    std::vector<std::pair<LogLevel, std::string>> messages;
};

FormatRequest make_request(std::string text, const std::string& path = "script.sh") {
    FormatRequest request;
    request.file_path = path;
    request.file_text = std::move(text);
    return request;
}

}  // namespace

class PluginHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        logger_.set_min_level(LogLevel::DEBUG);
    }

    CapturingLogger logger_;
    PluginHandler handler_{&logger_};
};

// ============================================================================
// Plugin Info
// ============================================================================

TEST_F(PluginHandlerTest, PluginInfo) {
    auto info = handler_.plugin_info();
    EXPECT_EQ(info.name, "shebang-fmt");
    EXPECT_EQ(info.config_key, "shebang");
    EXPECT_EQ(info.version, SHEBANG_VERSION);
    EXPECT_EQ(info.help_url, SHEBANG_HELP_URL);
    EXPECT_TRUE(info.config_schema_url.empty());

    std::string update_url = SHEBANG_UPDATE_URL;
    if (update_url.empty()) {
        EXPECT_FALSE(info.update_url.has_value());
    } else {
        ASSERT_TRUE(info.update_url.has_value());
        EXPECT_EQ(*info.update_url, update_url);
    }
}

TEST_F(PluginHandlerTest, PluginInfoJson) {
    nlohmann::json j = handler_.plugin_info();
    EXPECT_EQ(j["name"], "shebang-fmt");
    EXPECT_EQ(j["configKey"], "shebang");
    EXPECT_EQ(j["helpUrl"], SHEBANG_HELP_URL);
    EXPECT_TRUE(j.contains("configSchemaUrl"));
    EXPECT_TRUE(j.contains("updateUrl"));
}

TEST(PluginInfoJsonTest, MissingUpdateUrlIsNull) {
    PluginInfo info;
    info.name = "shebang-fmt";
    nlohmann::json j = info;
    EXPECT_TRUE(j["updateUrl"].is_null());

    info.update_url = "https://example.com/latest.json";
    j = info;
    EXPECT_EQ(j["updateUrl"], "https://example.com/latest.json");
}

// ============================================================================
// Configuration
// ============================================================================

TEST_F(PluginHandlerTest, ResolveEmptyConfig) {
    auto result = handler_.resolve_config(nlohmann::json::object(), GlobalConfiguration{});
    EXPECT_TRUE(result.diagnostics.empty());
    EXPECT_TRUE(result.file_matching.matches("run.sh"));
    EXPECT_TRUE(result.file_matching.matches("Makefile"));
}

TEST_F(PluginHandlerTest, ResolveIgnoresUnknownKeys) {
    nlohmann::json config = {{"lineWidth", 40}, {"whatever", true}};
    GlobalConfiguration global;
    global.use_tabs = true;

    auto result = handler_.resolve_config(config, global);
    EXPECT_TRUE(result.diagnostics.empty());
}

TEST_F(PluginHandlerTest, ResolveNullConfig) {
    auto result = handler_.resolve_config(nlohmann::json(), GlobalConfiguration{});
    EXPECT_TRUE(result.diagnostics.empty());
}

TEST_F(PluginHandlerTest, ResolveNonObjectConfig) {
    auto result = handler_.resolve_config(nlohmann::json(5), GlobalConfiguration{});
    ASSERT_EQ(result.diagnostics.size(), 1u);
    EXPECT_EQ(result.diagnostics[0].property_name, "shebang");
    EXPECT_NE(result.diagnostics[0].message.find("number"), std::string::npos);
    EXPECT_TRUE(result.file_matching.matches("run.sh"));
}

TEST_F(PluginHandlerTest, ResolvedConfigJson) {
    nlohmann::json j = handler_.resolve_config(nlohmann::json::array(), GlobalConfiguration{});

    EXPECT_EQ(j["config"], nlohmann::json::object());
    ASSERT_TRUE(j["diagnostics"].is_array());
    ASSERT_EQ(j["diagnostics"].size(), 1u);
    EXPECT_EQ(j["diagnostics"][0]["propertyName"], "shebang");

    const auto& names = j["fileMatching"]["fileNames"];
    ASSERT_TRUE(names.is_array());
    EXPECT_NE(std::find(names.begin(), names.end(), "GNUmakefile"), names.end());
    EXPECT_TRUE(j["fileMatching"]["fileExtensions"].is_array());
}

// ============================================================================
// Formatting
// ============================================================================

TEST_F(PluginHandlerTest, FormatChangesText) {
    auto result = handler_.format(make_request("#!/bin/sh   \nfoo\n"));
    ASSERT_TRUE(result.ok()) << result.error().to_string();
    ASSERT_TRUE(result.value().has_value());
    EXPECT_EQ(*result.value(), "#!/bin/sh\nfoo\n");
    EXPECT_TRUE(logger_.contains("normalized shebang"));
}

TEST_F(PluginHandlerTest, FormatUnchangedText) {
    auto result = handler_.format(make_request("#!/usr/bin/env python3 -u\nprint(1)\n"));
    ASSERT_TRUE(result.ok());
    EXPECT_FALSE(result.value().has_value());
    EXPECT_TRUE(logger_.contains("already formatted"));
}

TEST_F(PluginHandlerTest, FormatWithoutShebang) {
    auto result = handler_.format(make_request("echo hi\n"));
    ASSERT_TRUE(result.ok());
    EXPECT_FALSE(result.value().has_value());
    EXPECT_TRUE(logger_.contains("no shebang"));
}

TEST_F(PluginHandlerTest, FormatIgnoresPath) {
    auto result = handler_.format(make_request("#!  /bin/sh\n", "notes.txt"));
    ASSERT_TRUE(result.ok());
    ASSERT_TRUE(result.value().has_value());
    EXPECT_EQ(*result.value(), "#!/bin/sh\n");
}

TEST_F(PluginHandlerTest, WorksWithoutLogger) {
    PluginHandler handler;
    auto result = handler.format(make_request("#!/bin/sh \n"));
    ASSERT_TRUE(result.ok());
    ASSERT_TRUE(result.value().has_value());
    EXPECT_EQ(*result.value(), "#!/bin/sh\n");
}

// ============================================================================
// Ranges
// ============================================================================

TEST_F(PluginHandlerTest, RangeCoveringFirstLine) {
    auto request = make_request("#!/bin/sh   \nfoo\n");
    request.range = TextRange{0, 12};

    auto result = handler_.format(request);
    ASSERT_TRUE(result.ok());
    ASSERT_TRUE(result.value().has_value());
    EXPECT_EQ(*result.value(), "#!/bin/sh\nfoo\n");
}

TEST_F(PluginHandlerTest, RangeWholeFile) {
    auto request = make_request("#!/bin/sh   \nfoo\n");
    request.range = TextRange{0, request.file_text.size()};

    auto result = handler_.format(request);
    ASSERT_TRUE(result.ok());
    ASSERT_TRUE(result.value().has_value());
    EXPECT_EQ(*result.value(), "#!/bin/sh\nfoo\n");
}

TEST_F(PluginHandlerTest, RangeNotAtStart) {
    auto request = make_request("#!/bin/sh   \nfoo\n");
    request.range = TextRange{13, 16};

    auto result = handler_.format(request);
    ASSERT_TRUE(result.ok());
    EXPECT_FALSE(result.value().has_value());
    EXPECT_TRUE(logger_.contains("range does not cover"));
}

TEST_F(PluginHandlerTest, RangeEndingInsideFirstLine) {
    auto request = make_request("#!/bin/sh   -x\nfoo\n");
    request.range = TextRange{0, 11};

    auto result = handler_.format(request);
    ASSERT_TRUE(result.ok());
    EXPECT_FALSE(result.value().has_value());
    EXPECT_TRUE(logger_.contains("range ends inside"));
}

TEST_F(PluginHandlerTest, RangePastEndOfText) {
    auto request = make_request("#!/bin/sh\n");
    request.range = TextRange{0, 100};

    auto result = handler_.format(request);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error_code(), ErrorCode::INVALID_ARGUMENT);
}

TEST_F(PluginHandlerTest, RangeStartAfterEnd) {
    auto request = make_request("#!/bin/sh\nfoo\n");
    request.range = TextRange{5, 2};

    auto result = handler_.format(request);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error_code(), ErrorCode::INVALID_ARGUMENT);
    EXPECT_THROW(result.value(), std::runtime_error);
}
