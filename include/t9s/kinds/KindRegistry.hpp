#pragma once
#include <t9s/core/Error.hpp>
#include <t9s/kinds/KindSpec.hpp>

#include <array>
#include <optional>
#include <string_view>
#include <vector>

namespace T9 {

class KindRegistry;

/**
 * KindRegistryBuilder: collects KindSpecs during startup.
 *
 * add() validates each spec as it arrives and refuses duplicates or specs that
 * describe neither a collection nor a detail view. finalize() checks that the
 * closed KindId set is fully covered and hands out the read-only registry. The
 * caller treats any error here as fatal.
 */
class KindRegistryBuilder {
public:
    auto add(KindSpec spec) -> std::optional<Error>;
    auto finalize() && -> Expected<KindRegistry>;

private:
    std::array<std::optional<KindSpec>, kKindCount> specs_;
};

class KindRegistry {
public:
    // Total over KindId: finalize() guarantees every kind has a spec.
    [[nodiscard]] auto get(KindId kind) const -> KindSpec const& { return specs_[kindIndex(kind)]; }

    [[nodiscard]] auto kindForSegment(std::string_view token) const -> std::optional<KindId>;

    [[nodiscard]] auto operations_for(KindId kind, AppState const& state) const -> std::vector<OperationSpec const*>;

    [[nodiscard]] auto resolve_effects(KindId kind, OperationId op, OperationTarget const& target, AppState const& state) const
        -> Expected<std::vector<Effect>>;

private:
    friend class KindRegistryBuilder;
    KindRegistry() = default;

    std::array<KindSpec, kKindCount> specs_{};
};

// Registers workflows, schedules, activities and task queues.
auto RegisterBuiltinKinds(KindRegistryBuilder& builder) -> std::optional<Error>;
auto MakeDefaultKindRegistry() -> Expected<KindRegistry>;

} // namespace T9
