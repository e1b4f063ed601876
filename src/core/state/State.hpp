#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include "types.hpp"

namespace flowgraph {

class State;
using StatePtr = std::shared_ptr<State>;

/**
 * @brief Versioned key/value document flowing through one execution.
 *
 * @details
 * The payload (data) and the metadata side-channel are JSON objects. Every
 * mutation of either bumps version() by exactly one and advances
 * updated_at(). Clone() returns a deep copy sharing no mutable structure
 * with the source.
 *
 * **Thread Safety:** all accessors are synchronized with a shared mutex
 * (exclusive writers, concurrent readers). Getters return copies, never
 * references into the document.
 */
class State {
public:
    State(std::string id, std::string graph_id);

    State(const State&) = delete;
    State& operator=(const State&) = delete;

    // Identity
    const std::string& id() const noexcept { return id_; }
    const std::string& graph_id() const noexcept { return graph_id_; }
    std::string user_id() const;
    std::string session_id() const;
    void SetUserId(std::string user_id);
    void SetSessionId(std::string session_id);

    TimePoint created_at() const;
    TimePoint updated_at() const;
    int64_t version() const;

    // Payload access
    std::optional<json::value> Get(std::string_view key) const;
    std::optional<std::string> GetString(std::string_view key) const;
    // Doubles truncate toward zero; empty when the number does not fit int64.
    std::optional<int64_t> GetInt(std::string_view key) const;
    std::optional<double> GetDouble(std::string_view key) const;
    std::optional<bool> GetBool(std::string_view key) const;
    std::optional<json::array> GetArray(std::string_view key) const;
    std::optional<json::object> GetObject(std::string_view key) const;

    void Set(std::string_view key, json::value value);

    // All keys written under one lock with a single version bump.
    void SetMultiple(const json::object& values);

    // @return false (and no version bump) when the key was absent.
    bool Delete(std::string_view key);

    bool Has(std::string_view key) const;
    std::vector<std::string> Keys() const;
    std::size_t Size() const;
    json::object Data() const;

    // Metadata side-channel
    void SetMetadata(std::string_view key, json::value value);
    std::optional<json::value> GetMetadata(std::string_view key) const;
    json::object Metadata() const;

    StatePtr Clone() const;

    // Wire format: {id, graph_id, user_id?, session_id?, data, metadata,
    //               created_at, updated_at, version}
    json::object ToJson() const;
    std::string Serialize() const;

    // @throws ValidationError if the document does not match the wire format.
    static StatePtr FromJson(const json::value& doc);
    static StatePtr Parse(std::string_view text);

private:
    // Caller must hold the exclusive lock.
    void Touch();

    const std::string id_;
    const std::string graph_id_;

    mutable std::shared_mutex mutex_;
    std::string user_id_;
    std::string session_id_;
    json::object data_;
    json::object metadata_;
    TimePoint created_at_;
    TimePoint updated_at_;
    int64_t version_ = 1;
};

}  // namespace flowgraph
