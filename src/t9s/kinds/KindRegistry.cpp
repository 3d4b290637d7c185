#include <t9s/kinds/KindRegistry.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <string>

namespace T9 {

namespace {

auto registration_error(KindSpec const& spec, std::string const& what) -> Error {
    std::string message{"kind '"};
    message.append(kindName(spec.id));
    message.append("': ");
    message.append(what);
    return Error{Error::Code::InvalidConfiguration, std::move(message)};
}

auto spec_tokens(KindSpec const& spec) -> std::vector<std::string_view> {
    std::vector<std::string_view> tokens;
    tokens.reserve(spec.aliases.size() + 1);
    tokens.emplace_back(spec.segment);
    for (auto const& alias : spec.aliases) {
        tokens.emplace_back(alias);
    }
    return tokens;
}

} // namespace

auto KindRegistryBuilder::add(KindSpec spec) -> std::optional<Error> {
    t9_log("KindRegistryBuilder::add " + std::string{kindName(spec.id)}, "KindRegistry");
    auto& slot = specs_[kindIndex(spec.id)];
    if (slot.has_value()) {
        return registration_error(spec, "registered twice");
    }
    if (!spec.collection && !spec.detail) {
        return registration_error(spec, "needs a collection or a detail view");
    }
    if (spec.segment.empty()) {
        return registration_error(spec, "URI segment must not be empty");
    }
    if (!spec.identity.parse || !spec.identity.format || !spec.identity.label) {
        return registration_error(spec, "identity adapter is incomplete");
    }
    if (spec.collection && (!spec.collection->rows || !spec.collection->is_loading || !spec.collection->row_identity)) {
        return registration_error(spec, "collection adapter is incomplete");
    }
    if (spec.detail && (!spec.detail->lines || spec.detail->tabs.empty())) {
        return registration_error(spec, "detail adapter is incomplete");
    }

    for (auto const& other : specs_) {
        if (!other) {
            continue;
        }
        for (auto token : spec_tokens(spec)) {
            if (other->acceptsSegment(token)) {
                return registration_error(spec, "URI segment '" + std::string{token} + "' already belongs to "
                                                    + std::string{kindName(other->id)});
            }
        }
    }

    for (std::size_t i = 0; i < spec.operations.size(); ++i) {
        auto const& op = spec.operations[i];
        if (!op.to_effects || !op.applicability) {
            return registration_error(spec, "operation '" + std::string{operationName(op.id)} + "' is incomplete");
        }
        for (std::size_t j = 0; j < i; ++j) {
            auto const& earlier = spec.operations[j];
            if (earlier.id == op.id) {
                return registration_error(spec, "duplicate operation '" + std::string{operationName(op.id)} + "'");
            }
            if (op.key && earlier.key && *op.key == *earlier.key) {
                return registration_error(spec, "operations '" + std::string{operationName(earlier.id)} + "' and '"
                                                    + std::string{operationName(op.id)} + "' share key '"
                                                    + op.key->label() + "'");
            }
        }
    }

    slot = std::move(spec);
    return std::nullopt;
}

auto KindRegistryBuilder::finalize() && -> Expected<KindRegistry> {
    KindRegistry registry;
    for (auto kind : kAllKinds) {
        auto& slot = specs_[kindIndex(kind)];
        if (!slot) {
            return std::unexpected(Error{Error::Code::InvalidConfiguration,
                                         "kind '" + std::string{kindName(kind)} + "' was never registered"});
        }
    }
    for (auto kind : kAllKinds) {
        auto const& spec = *specs_[kindIndex(kind)];
        for (auto child : spec.children) {
            if (child == kind || !specs_[kindIndex(child)]->collection) {
                return std::unexpected(registration_error(spec, "child '" + std::string{kindName(child)}
                                                                    + "' must be another kind with a collection"));
            }
        }
    }
    for (auto kind : kAllKinds) {
        registry.specs_[kindIndex(kind)] = std::move(*specs_[kindIndex(kind)]);
    }
    t9_log("KindRegistry finalized", "KindRegistry");
    return registry;
}

auto KindRegistry::kindForSegment(std::string_view token) const -> std::optional<KindId> {
    for (auto const& spec : specs_) {
        if (spec.acceptsSegment(token)) {
            return spec.id;
        }
    }
    return std::nullopt;
}

auto KindRegistry::operations_for(KindId kind, AppState const& state) const -> std::vector<OperationSpec const*> {
    std::vector<OperationSpec const*> available;
    for (auto const& op : get(kind).operations) {
        if (op.applicability(state)) {
            available.push_back(&op);
        }
    }
    return available;
}

auto KindRegistry::resolve_effects(KindId kind, OperationId op, OperationTarget const& target, AppState const& state) const
    -> Expected<std::vector<Effect>> {
    auto const* spec = get(kind).findOperation(op);
    if (spec == nullptr) {
        return std::unexpected(Error{Error::Code::OperationNotFound,
                                     std::string{operationName(op)} + " is not an operation of " + std::string{kindName(kind)}});
    }
    return spec->to_effects(target, state);
}

auto MakeDefaultKindRegistry() -> Expected<KindRegistry> {
    KindRegistryBuilder builder;
    if (auto error = RegisterBuiltinKinds(builder)) {
        return std::unexpected(*error);
    }
    return std::move(builder).finalize();
}

} // namespace T9
