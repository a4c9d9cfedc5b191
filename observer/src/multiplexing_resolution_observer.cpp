/*
 *   Copyright (c) 2025 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <schema_finder/observer/multiplexing_resolution_observer.h>

namespace schema_finder
{
    bool multiplexing_resolution_observer::create(std::shared_ptr<i_resolution_observer>& observer,
        std::vector<std::shared_ptr<i_resolution_observer>>&& child_observers)
    {
        // Allow empty multiplexer - observers can be added later
        observer = std::make_shared<multiplexing_resolution_observer>(std::move(child_observers));
        return true;
    }

    multiplexing_resolution_observer::multiplexing_resolution_observer(
        std::vector<std::shared_ptr<i_resolution_observer>>&& child_observers)
    {
        for (auto& child : child_observers)
            add_child(std::move(child));
    }

    void multiplexing_resolution_observer::add_child(std::shared_ptr<i_resolution_observer> child)
    {
        if (child)
        {
            children_.push_back(std::move(child));
        }
    }

    size_t multiplexing_resolution_observer::get_child_count() const
    {
        return children_.size();
    }

    void multiplexing_resolution_observer::clear_children()
    {
        children_.clear();
    }

    void multiplexing_resolution_observer::on_resolution_started(
        const std::string& subject, const std::filesystem::path& base_directory, size_t candidate_count) const
    {
        for (const auto& child : children_)
        {
            child->on_resolution_started(subject, base_directory, candidate_count);
        }
    }

    void multiplexing_resolution_observer::on_candidate_probed(
        const std::string& subject, const candidate& probed, const std::filesystem::path& full_path, bool matched) const
    {
        for (const auto& child : children_)
        {
            child->on_candidate_probed(subject, probed, full_path, matched);
        }
    }

    void multiplexing_resolution_observer::on_probe_failed(const std::string& subject,
        const candidate& probed,
        const std::filesystem::path& full_path,
        const std::error_code& ec) const
    {
        for (const auto& child : children_)
        {
            child->on_probe_failed(subject, probed, full_path, ec);
        }
    }

    void multiplexing_resolution_observer::on_resolution_completed(const std::string& subject, int result) const
    {
        for (const auto& child : children_)
        {
            child->on_resolution_completed(subject, result);
        }
    }

    void multiplexing_resolution_observer::message(level_enum level, const char* message) const
    {
        for (const auto& child : children_)
        {
            child->message(level, message);
        }
    }
}
