/*
 *   Copyright (c) 2025 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <gtest/gtest.h>

#include <schema_finder/schema_finder.h>

using namespace schema_finder;

TEST(search_policy, defaults)
{
    search_policy policy;
    EXPECT_FALSE(policy.get_include_package_name());
    EXPECT_TRUE(policy.get_include_path_to_file());
    EXPECT_EQ(policy.get_path_to_file_separator(), path_separator::dot);
    EXPECT_EQ(policy.get_path_to_class_separator(), path_separator::dot);
    EXPECT_TRUE(policy.get_custom_patterns().empty());
    EXPECT_EQ(policy.validate(), error::OK());
}

TEST(search_policy, to_string_names_every_field)
{
    search_policy policy(true, false, path_separator::slash, path_separator::none, {"{class_name}_{method_name}"});
    auto text = policy.to_string();
    EXPECT_NE(text.find("include_package_name=true"), std::string::npos) << text;
    EXPECT_NE(text.find("include_path_to_file=false"), std::string::npos) << text;
    EXPECT_NE(text.find("path_to_file_separator=path_separator::SLASH"), std::string::npos) << text;
    EXPECT_NE(text.find("path_to_class_separator=path_separator::NONE"), std::string::npos) << text;
    EXPECT_NE(text.find("'{class_name}_{method_name}'"), std::string::npos) << text;
}

TEST(search_policy, validate_rejects_unknown_placeholder)
{
    search_policy good(false, true, path_separator::dot, path_separator::dot, {"{package_name}/{object_name}"});
    EXPECT_EQ(good.validate(), error::OK());

    search_policy unknown(false, true, path_separator::dot, path_separator::dot, {"{function_name}"});
    EXPECT_EQ(unknown.validate(), error::INVALID_PATTERN());

    search_policy unbalanced(false, true, path_separator::dot, path_separator::dot, {"{class_name"});
    EXPECT_EQ(unbalanced.validate(), error::INVALID_PATTERN());
}

TEST(search_policy, render_pattern)
{
    object_path path;
    ASSERT_EQ(object_path::parse("perekrestok_api.endpoints.catalog.ProductService.similar", path), error::OK());

    std::string rendered;
    ASSERT_EQ(render_pattern("{class_name}_{method_name}", path, rendered), error::OK());
    EXPECT_EQ(rendered, "ProductService_similar");

    ASSERT_EQ(render_pattern("{package_name}", path, rendered), error::OK());
    EXPECT_EQ(rendered, "perekrestok_api.endpoints.catalog");

    ASSERT_EQ(render_pattern("custom/{object_name}", path, rendered), error::OK());
    EXPECT_EQ(rendered, "custom/perekrestok_api.endpoints.catalog.ProductService.similar");

    // literal braces are escaped the fmt way
    ASSERT_EQ(render_pattern("{{{method_name}}}", path, rendered), error::OK());
    EXPECT_EQ(rendered, "{similar}");
}

TEST(search_policy, render_pattern_without_class)
{
    object_path path;
    ASSERT_EQ(object_path::parse("mypackage.utils.helper", path), error::OK());

    std::string rendered;
    ASSERT_EQ(render_pattern("[{class_name}]{method_name}", path, rendered), error::OK());
    EXPECT_EQ(rendered, "[]helper");
}

TEST(path_separator, text_and_names)
{
    EXPECT_STREQ(separator_text(path_separator::dot), ".");
    EXPECT_STREQ(separator_text(path_separator::slash), "/");
    EXPECT_STREQ(separator_text(path_separator::none), "");
    EXPECT_STREQ(to_string(path_separator::dot), "DOT");
    EXPECT_STREQ(to_string(path_separator::slash), "SLASH");
    EXPECT_STREQ(to_string(path_separator::none), "NONE");
}

TEST(path_separator, parse)
{
    path_separator separator = path_separator::dot;
    ASSERT_TRUE(parse_path_separator("/", separator));
    EXPECT_EQ(separator, path_separator::slash);
    ASSERT_TRUE(parse_path_separator("None", separator));
    EXPECT_EQ(separator, path_separator::none);
    ASSERT_TRUE(parse_path_separator(".", separator));
    EXPECT_EQ(separator, path_separator::dot);

    separator = path_separator::slash;
    EXPECT_FALSE(parse_path_separator("::", separator));
    EXPECT_FALSE(parse_path_separator("", separator));
    EXPECT_EQ(separator, path_separator::slash);
}

TEST(file_kind, extensions)
{
    EXPECT_STREQ(extension(file_kind::schema), ".schema.json");
    EXPECT_STREQ(extension(file_kind::data), ".json");
    EXPECT_STREQ(to_string(file_kind::schema), "schema");
    EXPECT_STREQ(to_string(file_kind::data), "json");
}

TEST(error_codes, to_string)
{
    EXPECT_STRNE(error::to_string(error::NOT_FOUND()), error::to_string(error::PROBE_FAILED()));
    for (int code = error::MIN(); code <= error::MAX(); ++code)
    {
        EXPECT_NE(error::to_string(code), nullptr);
    }
    EXPECT_LT(error::MAX(), error::OK());
}
