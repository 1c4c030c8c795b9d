#pragma once

#include "profile.hpp"
#include "database_manager.hpp"
#include <optional>
#include <string>
#include <vector>

namespace session {

    struct ProfileSummary {
        std::string id;
        std::string name;
        core::Timestamp updated_at = 0;
    };

    // Stores TraderProfile documents as JSON in the `profiles` table
    class ProfileRepository {
    public:
        explicit ProfileRepository(data::DatabaseManager& database);

        // Insert or replace; updated_at is stamped with the current wall time
        bool save(const TraderProfile& profile);
        // nullopt when missing or when the stored document cannot be decoded
        std::optional<TraderProfile> load(const std::string& id);
        std::vector<ProfileSummary> list();
        bool remove(const std::string& id);

    private:
        data::DatabaseManager& database_;
    };

} // namespace session
