#include "profile_repository.hpp"
#include "logging.hpp"
#include <chrono>
#include <stdexcept>

namespace session {

    namespace {
        core::Timestamp wallClockNow() {
            return std::chrono::duration_cast<std::chrono::seconds>(
                std::chrono::system_clock::now().time_since_epoch()).count();
        }
    }

    ProfileRepository::ProfileRepository(data::DatabaseManager& database)
        : database_(database) {}

    bool ProfileRepository::save(const TraderProfile& profile) {
        auto logger = core::logging::getLogger();
        if (profile.id.empty()) {
            logger->error("Refusing to save a profile without an id.");
            return false;
        }

        data::ProfileRecord record;
        record.id = profile.id;
        record.name = profile.name;
        record.updated_at = wallClockNow();
        try {
            record.payload = nlohmann::json(profile).dump();
        } catch (const nlohmann::json::exception& e) {
            logger->error("Failed to serialize profile {}: {}", profile.id, e.what());
            return false;
        }

        if (!database_.saveProfile(record)) {
            logger->error("Failed to store profile {}", profile.id);
            return false;
        }
        logger->info("Profile '{}' ({}) saved, {} bytes", profile.name, profile.id, record.payload.size());
        return true;
    }

    std::optional<TraderProfile> ProfileRepository::load(const std::string& id) {
        auto logger = core::logging::getLogger();
        auto record = database_.loadProfile(id);
        if (!record) {
            logger->warn("Profile {} not found", id);
            return std::nullopt;
        }

        try {
            auto profile = nlohmann::json::parse(record->payload).get<TraderProfile>();
            logger->info("Profile '{}' ({}) loaded", profile.name, profile.id);
            return profile;
        } catch (const nlohmann::json::exception& e) {
            logger->error("Stored profile {} is not valid JSON: {}", id, e.what());
        } catch (const std::invalid_argument& e) {
            logger->error("Stored profile {} has invalid values: {}", id, e.what());
        }
        return std::nullopt;
    }

    std::vector<ProfileSummary> ProfileRepository::list() {
        std::vector<ProfileSummary> summaries;
        for (const auto& record : database_.listProfiles()) {
            summaries.push_back(ProfileSummary{record.id, record.name, record.updated_at});
        }
        return summaries;
    }

    bool ProfileRepository::remove(const std::string& id) {
        const bool removed = database_.deleteProfile(id);
        if (removed) {
            core::logging::getLogger()->info("Profile {} deleted", id);
        }
        return removed;
    }

} // namespace session
