/*
 *   Copyright (c) 2025 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <vector>
#include <memory>

#include <schema_finder/i_resolution_observer.h>

namespace schema_finder
{
    /**
     * @brief An observer that forwards every event to a list of child observers.
     *
     * Lets a caller run the console observer alongside its own collector (for example one that
     * gathers misses for a build report). Children are fixed before resolutions start; the list
     * is not guarded against concurrent modification.
     */
    class multiplexing_resolution_observer : public schema_finder::i_resolution_observer
    {
    private:
        std::vector<std::shared_ptr<i_resolution_observer>> children_;

    public:
        /**
         * @brief Factory method to create a multiplexing observer.
         *
         * @param observer Output parameter for the created observer
         * @param child_observers Observers to forward to
         * @return true if creation was successful, false otherwise
         */
        static bool create(std::shared_ptr<i_resolution_observer>& observer,
            std::vector<std::shared_ptr<i_resolution_observer>>&& child_observers);

        explicit multiplexing_resolution_observer(std::vector<std::shared_ptr<i_resolution_observer>>&& child_observers);

        virtual ~multiplexing_resolution_observer() = default;
        multiplexing_resolution_observer(const multiplexing_resolution_observer&) = delete;
        multiplexing_resolution_observer& operator=(const multiplexing_resolution_observer&) = delete;

        // null children are ignored
        void add_child(std::shared_ptr<i_resolution_observer> child);

        size_t get_child_count() const;

        void clear_children();

        // i_resolution_observer interface - all methods forward to children
        void on_resolution_started(
            const std::string& subject, const std::filesystem::path& base_directory, size_t candidate_count) const override;
        void on_candidate_probed(const std::string& subject,
            const candidate& probed,
            const std::filesystem::path& full_path,
            bool matched) const override;
        void on_probe_failed(const std::string& subject,
            const candidate& probed,
            const std::filesystem::path& full_path,
            const std::error_code& ec) const override;
        void on_resolution_completed(const std::string& subject, int result) const override;

        void message(level_enum level, const char* message) const override;
    };
}
