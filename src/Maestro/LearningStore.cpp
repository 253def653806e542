// =================================================================
// src/Maestro/LearningStore.cpp
// =================================================================
// Implementation of the JSON learning store.

#include "Maestro/LearningStore.hpp"
#include "Maestro/Logger.hpp"
#include "Maestro/Types.hpp"
#include <filesystem>
#include <fstream>

using json = nlohmann::json;

namespace Maestro {

JsonLearningStore::JsonLearningStore(const std::string& directory)
    : m_directory(directory) {
}

void JsonLearningStore::save(const std::string& name, const LearningSnapshot& snapshot) {
    std::error_code ec;
    std::filesystem::create_directories(m_directory, ec);
    if (ec) {
        throw MaestroError(ErrorKind::UNAVAILABLE, "Cannot create directory " + m_directory + ": " + ec.message());
    }

    std::string path = pathFor(name);
    std::ofstream file(path);
    if (!file.is_open()) {
        throw MaestroError(ErrorKind::UNAVAILABLE, "Cannot open " + path + " for writing");
    }
    file << toJson(snapshot).dump(2) << std::endl;

    Logger::getInstance().debug("LearningStore", "Saved " + snapshot.engine + " snapshot", path);
}

std::optional<LearningSnapshot> JsonLearningStore::load(const std::string& name) {
    std::string path = pathFor(name);
    if (!std::filesystem::exists(path)) {
        return std::nullopt;
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw MaestroError(ErrorKind::UNAVAILABLE, "Cannot open " + path);
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        throw MaestroError(ErrorKind::INVALID_ARGUMENT, "Malformed learning snapshot " + path + ": " + e.what());
    }
    return fromJson(j);
}

json JsonLearningStore::toJson(const LearningSnapshot& snapshot) {
    json j;
    j["schema_version"] = SCHEMA_VERSION;
    j["engine"] = snapshot.engine;
    j["parameters"] = snapshot.parameters;
    j["table"] = snapshot.table;
    j["baselines"] = snapshot.baselines;
    return j;
}

LearningSnapshot JsonLearningStore::fromJson(const json& j) {
    if (!j.is_object()) {
        throw MaestroError(ErrorKind::INVALID_ARGUMENT, "Learning snapshot is not a JSON object");
    }

    int version = j.value("schema_version", 0);
    if (version != SCHEMA_VERSION) {
        throw MaestroError(ErrorKind::INVALID_ARGUMENT,
                           "Unsupported learning schema version " + std::to_string(version));
    }

    LearningSnapshot snapshot;
    try {
        snapshot.engine = j.value("engine", "");
        snapshot.parameters = j.value("parameters", std::map<std::string, double>());
        snapshot.table = j.value("table", std::map<std::string, std::map<std::string, double>>());
        snapshot.baselines = j.value("baselines", std::map<std::string, double>());
    } catch (const json::exception& e) {
        throw MaestroError(ErrorKind::INVALID_ARGUMENT, std::string("Malformed learning snapshot: ") + e.what());
    }
    return snapshot;
}

std::string JsonLearningStore::pathFor(const std::string& name) const {
    return (std::filesystem::path(m_directory) / (name + ".json")).string();
}

} // namespace Maestro
