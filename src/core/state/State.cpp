#include "State.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <mutex>
#include <utility>

#include "Errors.hpp"
#include "TimeUtils.hpp"

namespace flowgraph {

namespace {

template <class T>
T require(const json::object& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end()) {
        throw ValidationError(std::string("state document missing key: ") + key);
    }
    try {
        return json::value_to<T>(it->value());
    } catch (const std::exception& e) {
        throw ValidationError(std::string("failed to parse state key '") + key + "': " + e.what());
    }
}

std::string optional_string(const json::object& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->value().is_null()) return {};
    if (!it->value().is_string()) {
        throw ValidationError(std::string("state key '") + key + "' must be a string");
    }
    return std::string(it->value().get_string());
}

}  // namespace

State::State(std::string id, std::string graph_id)
    : id_(std::move(id)), graph_id_(std::move(graph_id)) {
    created_at_ = util::Now();
    updated_at_ = created_at_;
}

std::string State::user_id() const {
    std::shared_lock lock(mutex_);
    return user_id_;
}

std::string State::session_id() const {
    std::shared_lock lock(mutex_);
    return session_id_;
}

void State::SetUserId(std::string user_id) {
    std::unique_lock lock(mutex_);
    user_id_ = std::move(user_id);
}

void State::SetSessionId(std::string session_id) {
    std::unique_lock lock(mutex_);
    session_id_ = std::move(session_id);
}

TimePoint State::created_at() const {
    std::shared_lock lock(mutex_);
    return created_at_;
}

TimePoint State::updated_at() const {
    std::shared_lock lock(mutex_);
    return updated_at_;
}

int64_t State::version() const {
    std::shared_lock lock(mutex_);
    return version_;
}

// =========================================================
//  Payload
// =========================================================

std::optional<json::value> State::Get(std::string_view key) const {
    std::shared_lock lock(mutex_);
    auto it = data_.find(key);
    if (it == data_.end()) return std::nullopt;
    return it->value();
}

std::optional<std::string> State::GetString(std::string_view key) const {
    auto value = Get(key);
    if (!value || !value->is_string()) return std::nullopt;
    return std::string(value->get_string());
}

std::optional<int64_t> State::GetInt(std::string_view key) const {
    auto value = Get(key);
    if (!value) return std::nullopt;
    switch (value->kind()) {
        case json::kind::int64:
            return value->get_int64();
        case json::kind::uint64: {
            const uint64_t u = value->get_uint64();
            if (u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) return std::nullopt;
            return static_cast<int64_t>(u);
        }
        case json::kind::double_: {
            // [-2^63, 2^63): both bounds are exact doubles
            const double d = value->get_double();
            if (!std::isfinite(d) || d < -0x1p63 || d >= 0x1p63) return std::nullopt;
            return static_cast<int64_t>(d);
        }
        default:
            return std::nullopt;
    }
}

std::optional<double> State::GetDouble(std::string_view key) const {
    auto value = Get(key);
    if (!value) return std::nullopt;
    switch (value->kind()) {
        case json::kind::int64:
            return static_cast<double>(value->get_int64());
        case json::kind::uint64:
            return static_cast<double>(value->get_uint64());
        case json::kind::double_:
            return value->get_double();
        default:
            return std::nullopt;
    }
}

std::optional<bool> State::GetBool(std::string_view key) const {
    auto value = Get(key);
    if (!value || !value->is_bool()) return std::nullopt;
    return value->get_bool();
}

std::optional<json::array> State::GetArray(std::string_view key) const {
    auto value = Get(key);
    if (!value || !value->is_array()) return std::nullopt;
    return value->get_array();
}

std::optional<json::object> State::GetObject(std::string_view key) const {
    auto value = Get(key);
    if (!value || !value->is_object()) return std::nullopt;
    return value->get_object();
}

void State::Set(std::string_view key, json::value value) {
    std::unique_lock lock(mutex_);
    data_.insert_or_assign(key, std::move(value));
    Touch();
}

void State::SetMultiple(const json::object& values) {
    std::unique_lock lock(mutex_);
    for (const auto& kv : values) {
        data_.insert_or_assign(kv.key(), kv.value());
    }
    Touch();
}

bool State::Delete(std::string_view key) {
    std::unique_lock lock(mutex_);
    if (data_.erase(key) == 0) return false;
    Touch();
    return true;
}

bool State::Has(std::string_view key) const {
    std::shared_lock lock(mutex_);
    return data_.contains(key);
}

std::vector<std::string> State::Keys() const {
    std::shared_lock lock(mutex_);
    std::vector<std::string> keys;
    keys.reserve(data_.size());
    for (const auto& kv : data_) {
        keys.emplace_back(kv.key());
    }
    return keys;
}

std::size_t State::Size() const {
    std::shared_lock lock(mutex_);
    return data_.size();
}

json::object State::Data() const {
    std::shared_lock lock(mutex_);
    return data_;
}

// =========================================================
//  Metadata
// =========================================================

void State::SetMetadata(std::string_view key, json::value value) {
    std::unique_lock lock(mutex_);
    metadata_.insert_or_assign(key, std::move(value));
    Touch();
}

std::optional<json::value> State::GetMetadata(std::string_view key) const {
    std::shared_lock lock(mutex_);
    auto it = metadata_.find(key);
    if (it == metadata_.end()) return std::nullopt;
    return it->value();
}

json::object State::Metadata() const {
    std::shared_lock lock(mutex_);
    return metadata_;
}

void State::Touch() {
    ++version_;
    // updated_at must strictly advance even when the clock has not ticked
    auto now = util::Now();
    updated_at_ = now > updated_at_ ? now : updated_at_ + Clock::duration(1);
}

// =========================================================
//  Clone & Serialization
// =========================================================

StatePtr State::Clone() const {
    auto clone = std::make_shared<State>(id_, graph_id_);

    std::shared_lock lock(mutex_);
    clone->user_id_ = user_id_;
    clone->session_id_ = session_id_;
    // json::value copies are deep: nested objects and arrays are duplicated
    clone->data_ = data_;
    clone->metadata_ = metadata_;
    clone->created_at_ = created_at_;
    clone->updated_at_ = updated_at_;
    clone->version_ = version_;
    return clone;
}

json::object State::ToJson() const {
    std::shared_lock lock(mutex_);
    json::object doc;
    doc["id"] = id_;
    doc["graph_id"] = graph_id_;
    if (!user_id_.empty()) doc["user_id"] = user_id_;
    if (!session_id_.empty()) doc["session_id"] = session_id_;
    doc["data"] = data_;
    doc["metadata"] = metadata_;
    doc["created_at"] = util::FormatTimestamp(created_at_);
    doc["updated_at"] = util::FormatTimestamp(updated_at_);
    doc["version"] = version_;
    return doc;
}

std::string State::Serialize() const {
    return json::serialize(ToJson());
}

StatePtr State::FromJson(const json::value& doc) {
    if (!doc.is_object()) {
        throw ValidationError("state document must be a JSON object");
    }
    const auto& obj = doc.get_object();

    auto state = std::make_shared<State>(require<std::string>(obj, "id"),
                                         require<std::string>(obj, "graph_id"));
    state->user_id_ = optional_string(obj, "user_id");
    state->session_id_ = optional_string(obj, "session_id");

    if (auto it = obj.find("data"); it != obj.end() && !it->value().is_null()) {
        if (!it->value().is_object()) throw ValidationError("state 'data' must be an object");
        state->data_ = it->value().get_object();
    }
    if (auto it = obj.find("metadata"); it != obj.end() && !it->value().is_null()) {
        if (!it->value().is_object()) throw ValidationError("state 'metadata' must be an object");
        state->metadata_ = it->value().get_object();
    }

    state->created_at_ = util::ParseTimestamp(require<std::string>(obj, "created_at"));
    state->updated_at_ = util::ParseTimestamp(require<std::string>(obj, "updated_at"));
    state->version_ = require<int64_t>(obj, "version");
    return state;
}

StatePtr State::Parse(std::string_view text) {
    boost::system::error_code ec;
    json::value doc = json::parse(text, ec);
    if (ec) {
        throw ValidationError("invalid state JSON: " + ec.message());
    }
    return FromJson(doc);
}

}  // namespace flowgraph
