/*
 *   Copyright (c) 2025 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <sstream>

#include <gtest/gtest.h>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/ostream_sink.h>

#include <schema_finder/schema_finder.h>
#include <schema_finder/observer/console_resolution_observer.h>
#include <schema_finder/observer/multiplexing_resolution_observer.h>

#include "schema_directory_fixture.h"

using namespace schema_finder;

namespace
{
    class counting_observer : public i_resolution_observer
    {
    public:
        mutable int started = 0;
        mutable int probed = 0;
        mutable int hits = 0;
        mutable int failures = 0;
        mutable int completed = 0;
        mutable int messages = 0;

        void on_resolution_started(const std::string&, const std::filesystem::path&, size_t) const override { ++started; }
        void on_candidate_probed(
            const std::string&, const candidate&, const std::filesystem::path&, bool matched) const override
        {
            ++probed;
            if (matched)
                ++hits;
        }
        void on_probe_failed(
            const std::string&, const candidate&, const std::filesystem::path&, const std::error_code&) const override
        {
            ++failures;
        }
        void on_resolution_completed(const std::string&, int) const override { ++completed; }
        void message(level_enum, const char*) const override { ++messages; }
    };

    std::shared_ptr<spdlog::logger> make_capturing_logger(const std::string& name, std::ostringstream& stream)
    {
        auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(stream);
        auto logger = std::make_shared<spdlog::logger>(name, sink);
        logger->set_pattern("%v");
        logger->set_level(spdlog::level::trace);
        return logger;
    }

    size_t count_of(const std::string& text, const std::string& needle)
    {
        size_t count = 0;
        for (auto pos = text.find(needle); pos != std::string::npos; pos = text.find(needle, pos + needle.size()))
            ++count;
        return count;
    }
}

TEST(multiplexing_resolution_observer, ignores_null_children)
{
    std::shared_ptr<i_resolution_observer> observer;
    ASSERT_TRUE(multiplexing_resolution_observer::create(
        observer, {std::make_shared<counting_observer>(), nullptr, std::make_shared<counting_observer>()}));

    auto multiplexer = std::static_pointer_cast<multiplexing_resolution_observer>(observer);
    EXPECT_EQ(multiplexer->get_child_count(), 2u);
    multiplexer->add_child(nullptr);
    EXPECT_EQ(multiplexer->get_child_count(), 2u);
    multiplexer->clear_children();
    EXPECT_EQ(multiplexer->get_child_count(), 0u);
}

TEST(multiplexing_resolution_observer, forwards_every_event)
{
    auto first = std::make_shared<counting_observer>();
    auto second = std::make_shared<counting_observer>();
    std::shared_ptr<i_resolution_observer> observer;
    ASSERT_TRUE(multiplexing_resolution_observer::create(observer, {first, second}));

    candidate probed {"x.schema.json", "x", file_kind::schema, ""};
    observer->on_resolution_started("x", "dir", 1);
    observer->on_candidate_probed("x", probed, "dir/x.schema.json", true);
    observer->on_probe_failed("x", probed, "dir/x.schema.json", std::make_error_code(std::errc::permission_denied));
    observer->on_resolution_completed("x", error::OK());
    observer->message(i_resolution_observer::info, "hello");

    for (auto& child : {first, second})
    {
        EXPECT_EQ(child->started, 1);
        EXPECT_EQ(child->probed, 1);
        EXPECT_EQ(child->hits, 1);
        EXPECT_EQ(child->failures, 1);
        EXPECT_EQ(child->completed, 1);
        EXPECT_EQ(child->messages, 1);
    }
}

using console_observer_test = schema_directory_fixture;

TEST_F(console_observer_test, drives_a_resolution)
{
    create_file("similar.schema.json");

    std::shared_ptr<i_resolution_observer> console;
    ASSERT_TRUE(console_resolution_observer::create(console));
    ASSERT_NE(console, nullptr);

    auto counter = std::make_shared<counting_observer>();
    std::shared_ptr<i_resolution_observer> observer;
    ASSERT_TRUE(multiplexing_resolution_observer::create(observer, {console, counter}));

    resolver finder(get_root(), observer);
    resolution result;
    ASSERT_EQ(finder.resolve(
                  "perekrestok_api.endpoints.catalog.ProductService.similar", search_policy(), generation_options {}, result),
        error::OK());
    EXPECT_EQ(counter->probed, 7);
    EXPECT_EQ(counter->hits, 1);
    EXPECT_EQ(counter->completed, 1);

    console->message(i_resolution_observer::warn, "console observer message");
}

TEST(console_resolution_observer, instances_do_not_collide)
{
    std::shared_ptr<i_resolution_observer> first;
    std::shared_ptr<i_resolution_observer> second;
    ASSERT_TRUE(console_resolution_observer::create(first, false));
    ASSERT_TRUE(console_resolution_observer::create(second, true));
    EXPECT_NE(first, second);
    first.reset();
    second->on_resolution_completed("x", error::NOT_FOUND());
}

TEST_F(console_observer_test, prints_hits_and_misses)
{
    create_file("similar.schema.json");

    std::ostringstream output;
    std::shared_ptr<i_resolution_observer> console;
    ASSERT_TRUE(console_resolution_observer::create(console, make_capturing_logger("capture_misses", output)));

    resolver finder(get_root(), console);
    resolution result;
    ASSERT_EQ(finder.resolve(
                  "perekrestok_api.endpoints.catalog.ProductService.similar", search_policy(), generation_options {}, result),
        error::OK());

    auto text = output.str();
    EXPECT_NE(text.find("resolving perekrestok_api.endpoints.catalog.ProductService.similar in "), std::string::npos)
        << text;
    EXPECT_NE(text.find("(10 candidates)"), std::string::npos) << text;
    EXPECT_EQ(count_of(text, "[miss]"), 6u) << text;
    EXPECT_NE(text.find("  [miss] ProductService.similar.schema.json"), std::string::npos) << text;
    EXPECT_EQ(count_of(text, "[hit]"), 1u) << text;
    EXPECT_NE(text.find("[hit]  similar.schema.json (schema)"), std::string::npos) << text;
    EXPECT_NE(text.find("perekrestok_api.endpoints.catalog.ProductService.similar resolved"), std::string::npos) << text;
}

TEST_F(console_observer_test, hides_misses_when_asked)
{
    create_file("shared.json");

    std::ostringstream output;
    std::shared_ptr<i_resolution_observer> console;
    ASSERT_TRUE(console_resolution_observer::create(console, make_capturing_logger("capture_hits", output), false));

    resolver finder(get_root(), console);
    resolution result;
    ASSERT_EQ(finder.find_named("shared", result), error::OK());
    ASSERT_EQ(result.attempted.size(), 2u);

    auto text = output.str();
    EXPECT_EQ(count_of(text, "[miss]"), 0u) << text;
    EXPECT_NE(text.find("[hit]  shared.json (json)"), std::string::npos) << text;
}

TEST_F(console_observer_test, prints_unresolved_and_messages)
{
    std::ostringstream output;
    std::shared_ptr<i_resolution_observer> console;
    ASSERT_TRUE(console_resolution_observer::create(console, make_capturing_logger("capture_unresolved", output)));

    resolver finder(get_root() / "absent", console);
    resolution result;
    ASSERT_EQ(finder.find_named("missing", result), error::NOT_FOUND());

    auto text = output.str();
    EXPECT_NE(text.find("WARN schema directory"), std::string::npos) << text;
    EXPECT_NE(text.find("missing unresolved: " + std::string(error::to_string(error::NOT_FOUND()))), std::string::npos)
        << text;
}
