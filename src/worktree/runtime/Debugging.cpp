#include "worktree/runtime/Debugging.hpp"

#include <nlohmann/json.hpp>

namespace WT {

namespace {

auto malformed(std::string message) -> std::unexpected<Error> {
    return std::unexpected(Error{Error::Code::MalformedInput, std::move(message)});
}

auto stringField(nlohmann::json const& json, char const* name) -> Expected<std::string> {
    auto it = json.find(name);
    if (it == json.end() || !it->is_string()) {
        return malformed(std::string("missing string field '") + name + "'");
    }
    return it->get<std::string>();
}

auto nestedEquals(std::shared_ptr<UpdateDebugInfo const> const& lhs, std::shared_ptr<UpdateDebugInfo const> const& rhs) -> bool {
    if (!lhs || !rhs) {
        return lhs == rhs;
    }
    return *lhs == *rhs;
}

auto sourceToJson(UpdateDebugInfo const& info) -> nlohmann::json {
    nlohmann::json source{{"type", std::string(updateSourceToString(info.source))}};
    if (info.source == UpdateDebugInfo::Source::Subtree && info.nested) {
        source["debugInfo"] = toJson(*info.nested);
    }
    return source;
}

} // namespace

bool DebugSnapshot::operator==(DebugSnapshot const& other) const {
    return workflowType == other.workflowType && stateDescription == other.stateDescription && children == other.children;
}

bool DebugSnapshot::Child::operator==(Child const& other) const {
    return key == other.key && snapshot == other.snapshot;
}

auto DebugSnapshot::child(std::string_view key) const -> DebugSnapshot const* {
    for (auto const& entry : children) {
        if (entry.key == key) {
            return &entry.snapshot;
        }
    }
    return nullptr;
}

auto UpdateDebugInfo::didUpdate(std::string workflowType, Source source) -> UpdateDebugInfo {
    UpdateDebugInfo info;
    info.workflowType = std::move(workflowType);
    info.kind         = Kind::DidUpdate;
    info.source       = source;
    return info;
}

auto UpdateDebugInfo::didUpdateFromSubtree(std::string workflowType, UpdateDebugInfo child) -> UpdateDebugInfo {
    UpdateDebugInfo info;
    info.workflowType = std::move(workflowType);
    info.kind         = Kind::DidUpdate;
    info.source       = Source::Subtree;
    info.nested       = std::make_shared<UpdateDebugInfo const>(std::move(child));
    return info;
}

auto UpdateDebugInfo::childDidUpdate(std::string workflowType, UpdateDebugInfo child) -> UpdateDebugInfo {
    UpdateDebugInfo info;
    info.workflowType = std::move(workflowType);
    info.kind         = Kind::ChildDidUpdate;
    info.nested       = std::make_shared<UpdateDebugInfo const>(std::move(child));
    return info;
}

auto UpdateDebugInfo::originWorkflowType() const -> std::string const& {
    auto const* current = this;
    while (current->nested) {
        current = current->nested.get();
    }
    return current->workflowType;
}

bool UpdateDebugInfo::operator==(UpdateDebugInfo const& other) const {
    if (workflowType != other.workflowType || kind != other.kind) {
        return false;
    }
    if (kind == Kind::DidUpdate && source != other.source) {
        return false;
    }
    return nestedEquals(nested, other.nested);
}

auto updateSourceToString(UpdateDebugInfo::Source source) -> std::string_view {
    switch (source) {
    case UpdateDebugInfo::Source::External:
        return "external";
    case UpdateDebugInfo::Source::Worker:
        return "worker";
    case UpdateDebugInfo::Source::SideEffect:
        return "side-effect";
    case UpdateDebugInfo::Source::Subtree:
        return "subtree";
    }
    return "external";
}

auto toJson(DebugSnapshot const& snapshot) -> nlohmann::json {
    nlohmann::json children = nlohmann::json::array();
    for (auto const& child : snapshot.children) {
        children.push_back(nlohmann::json{{"key", child.key}, {"snapshot", toJson(child.snapshot)}});
    }
    return nlohmann::json{
            {"workflowType", snapshot.workflowType},
            {"stateDescription", snapshot.stateDescription},
            {"children", std::move(children)},
    };
}

auto snapshotFromJson(nlohmann::json const& json) -> Expected<DebugSnapshot> {
    if (!json.is_object()) {
        return malformed("debug snapshot must be an object");
    }
    DebugSnapshot snapshot;
    auto          type = stringField(json, "workflowType");
    if (!type) {
        return std::unexpected(type.error());
    }
    auto state = stringField(json, "stateDescription");
    if (!state) {
        return std::unexpected(state.error());
    }
    snapshot.workflowType     = std::move(*type);
    snapshot.stateDescription = std::move(*state);

    if (auto it = json.find("children"); it != json.end()) {
        if (!it->is_array()) {
            return malformed("debug snapshot children must be an array");
        }
        snapshot.children.reserve(it->size());
        for (auto const& entry : *it) {
            if (!entry.is_object()) {
                return malformed("debug snapshot child must be an object");
            }
            auto key = stringField(entry, "key");
            if (!key) {
                return std::unexpected(key.error());
            }
            auto nested = entry.find("snapshot");
            if (nested == entry.end()) {
                return malformed("debug snapshot child missing snapshot");
            }
            auto child = snapshotFromJson(*nested);
            if (!child) {
                return std::unexpected(child.error());
            }
            snapshot.children.push_back(DebugSnapshot::Child{std::move(*key), std::move(*child)});
        }
    }
    return snapshot;
}

auto toJson(UpdateDebugInfo const& info) -> nlohmann::json {
    nlohmann::json kind;
    if (info.kind == UpdateDebugInfo::Kind::DidUpdate) {
        kind = nlohmann::json{{"type", "didUpdate"}, {"source", sourceToJson(info)}};
    } else {
        kind = nlohmann::json{{"type", "childDidUpdate"}};
        if (info.nested) {
            kind["childUpdate"] = toJson(*info.nested);
        }
    }
    return nlohmann::json{{"workflowType", info.workflowType}, {"kind", std::move(kind)}};
}

auto updateInfoFromJson(nlohmann::json const& json) -> Expected<UpdateDebugInfo> {
    if (!json.is_object()) {
        return malformed("update debug info must be an object");
    }
    auto type = stringField(json, "workflowType");
    if (!type) {
        return std::unexpected(type.error());
    }
    auto kindIt = json.find("kind");
    if (kindIt == json.end() || !kindIt->is_object()) {
        return malformed("update debug info missing kind");
    }
    auto kindType = stringField(*kindIt, "type");
    if (!kindType) {
        return std::unexpected(kindType.error());
    }

    if (*kindType == "childDidUpdate") {
        auto childIt = kindIt->find("childUpdate");
        if (childIt == kindIt->end()) {
            return malformed("childDidUpdate missing childUpdate");
        }
        auto child = updateInfoFromJson(*childIt);
        if (!child) {
            return child;
        }
        return UpdateDebugInfo::childDidUpdate(std::move(*type), std::move(*child));
    }
    if (*kindType != "didUpdate") {
        return malformed("unknown update kind '" + *kindType + "'");
    }

    auto sourceIt = kindIt->find("source");
    if (sourceIt == kindIt->end() || !sourceIt->is_object()) {
        return malformed("didUpdate missing source");
    }
    auto sourceType = stringField(*sourceIt, "type");
    if (!sourceType) {
        return std::unexpected(sourceType.error());
    }
    if (*sourceType == "external") {
        return UpdateDebugInfo::didUpdate(std::move(*type), UpdateDebugInfo::Source::External);
    }
    if (*sourceType == "worker") {
        return UpdateDebugInfo::didUpdate(std::move(*type), UpdateDebugInfo::Source::Worker);
    }
    if (*sourceType == "side-effect") {
        return UpdateDebugInfo::didUpdate(std::move(*type), UpdateDebugInfo::Source::SideEffect);
    }
    if (*sourceType == "subtree") {
        auto nestedIt = sourceIt->find("debugInfo");
        if (nestedIt == sourceIt->end()) {
            return malformed("subtree source missing debugInfo");
        }
        auto nested = updateInfoFromJson(*nestedIt);
        if (!nested) {
            return nested;
        }
        return UpdateDebugInfo::didUpdateFromSubtree(std::move(*type), std::move(*nested));
    }
    return malformed("unknown update source '" + *sourceType + "'");
}

auto dumpSnapshot(DebugSnapshot const& snapshot, int indent) -> std::string {
    return toJson(snapshot).dump(indent);
}

auto parseSnapshot(std::string_view text) -> Expected<DebugSnapshot> {
    auto json = nlohmann::json::parse(text, nullptr, false);
    if (json.is_discarded()) {
        return malformed("debug snapshot is not valid JSON");
    }
    return snapshotFromJson(json);
}

auto dumpUpdateInfo(UpdateDebugInfo const& info, int indent) -> std::string {
    return toJson(info).dump(indent);
}

auto parseUpdateInfo(std::string_view text) -> Expected<UpdateDebugInfo> {
    auto json = nlohmann::json::parse(text, nullptr, false);
    if (json.is_discarded()) {
        return malformed("update debug info is not valid JSON");
    }
    return updateInfoFromJson(json);
}

StreamDebugger::StreamDebugger(std::ostream& out) : out(out) {}

void StreamDebugger::didEnterInitialState(DebugSnapshot const& snapshot) {
    nlohmann::json line{{"event", "initialState"}, {"snapshot", toJson(snapshot)}};
    std::lock_guard<std::mutex> lock(mutex);
    out << line.dump() << '\n';
}

void StreamDebugger::didUpdate(DebugSnapshot const& snapshot, UpdateDebugInfo const& update) {
    nlohmann::json line{{"event", "update"}, {"snapshot", toJson(snapshot)}, {"update", toJson(update)}};
    std::lock_guard<std::mutex> lock(mutex);
    out << line.dump() << '\n';
}

} // namespace WT
