// =================================================================
// include/Maestro/LearningStore.hpp
// =================================================================
// Versioned serialization of learning tables.

#pragma once

#include "nlohmann/json.hpp"
#include <string>
#include <map>
#include <optional>

namespace Maestro {

/**
 * @brief Engine-independent learning state
 */
struct LearningSnapshot {
    std::string engine;                                           ///< "q_learning" or "policy_gradient"
    std::map<std::string, double> parameters;                     ///< Hyperparameters and exploration state
    std::map<std::string, std::map<std::string, double>> table;   ///< state key -> action -> value
    std::map<std::string, double> baselines;                      ///< state key -> baseline
};

/**
 * @brief Storage for learning snapshots
 */
class LearningStore {
public:
    virtual ~LearningStore() = default;

    /**
     * @brief Persist a snapshot under a name
     */
    virtual void save(const std::string& name, const LearningSnapshot& snapshot) = 0;

    /**
     * @brief Load a snapshot
     * @return Snapshot, or empty when nothing was saved under the name
     */
    virtual std::optional<LearningSnapshot> load(const std::string& name) = 0;
};

/**
 * @brief Learning store writing one JSON document per snapshot
 *
 * Schema: {"schema_version":1,"engine":...,"parameters":{...},
 * "table":{stateKey:{action:value}},"baselines":{stateKey:value}}
 */
class JsonLearningStore : public LearningStore {
public:
    static constexpr int SCHEMA_VERSION = 1;

    /**
     * @brief Constructor
     * @param directory Directory holding <name>.json files
     */
    explicit JsonLearningStore(const std::string& directory);

    void save(const std::string& name, const LearningSnapshot& snapshot) override;
    std::optional<LearningSnapshot> load(const std::string& name) override;

    static nlohmann::json toJson(const LearningSnapshot& snapshot);

    /**
     * @brief Parse a snapshot document
     * @throws MaestroError INVALID_ARGUMENT for unknown schema versions or malformed documents
     */
    static LearningSnapshot fromJson(const nlohmann::json& j);

private:
    std::string m_directory;

    std::string pathFor(const std::string& name) const;
};

} // namespace Maestro
