/*
 * registry.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-6-4

Description: Sealable name-keyed tables of custom types, validators and
transformers

**************************************************/

#ifndef VIGIL_SCHEMA_REGISTRY_HPP
#define VIGIL_SCHEMA_REGISTRY_HPP

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "vigil/error/exception.hpp"
#include "vigil/schema/schema.hpp"

namespace vigil::schema {

/**
 * @brief Name-keyed table that becomes read-only once sealed.
 *
 * Entries are added during an explicit initialization phase. After seal()
 * every further add() throws RegistryError, so a sealed table can be read
 * from any number of threads without locking.
 *
 * @tparam Fn Callable type stored under each name
 */
template <typename Fn>
class Registry {
public:
    explicit Registry(std::string kind) : kind_(std::move(kind)) {}

    /**
     * @brief Registers @p fn under @p name, replacing an earlier entry.
     * @throws error::RegistryError if the registry is sealed, the name is
     * empty or the callable is empty
     */
    void add(std::string name, Fn fn) {
        if (sealed_) {
            THROW_REGISTRY_ERROR("Cannot register ", kind_, " '", name,
                                 "': registry is sealed");
        }
        if (name.empty()) {
            THROW_REGISTRY_ERROR("Cannot register ", kind_,
                                 " with an empty name");
        }
        if (!fn) {
            THROW_REGISTRY_ERROR("Cannot register empty ", kind_, " '", name,
                                 "'");
        }
        auto it = entries_.find(name);
        if (it != entries_.end()) {
            spdlog::warn("Overriding {} '{}'", kind_, name);
            it->second = std::move(fn);
            return;
        }
        spdlog::debug("Registering {}: {}", kind_, name);
        entries_.emplace(std::move(name), std::move(fn));
    }

    /**
     * @brief Looks up an entry.
     * @return Pointer to the callable, or nullptr when not registered
     */
    [[nodiscard]] auto find(std::string_view name) const -> const Fn* {
        auto it = entries_.find(name);
        return it != entries_.end() ? &it->second : nullptr;
    }

    [[nodiscard]] auto contains(std::string_view name) const -> bool {
        return entries_.find(name) != entries_.end();
    }

    /// Registered names in lexicographic order.
    [[nodiscard]] auto names() const -> std::vector<std::string> {
        std::vector<std::string> out;
        out.reserve(entries_.size());
        for (const auto& entry : entries_) {
            out.push_back(entry.first);
        }
        return out;
    }

    [[nodiscard]] auto size() const noexcept -> std::size_t {
        return entries_.size();
    }

    void seal() noexcept { sealed_ = true; }
    [[nodiscard]] auto isSealed() const noexcept -> bool { return sealed_; }

private:
    std::string kind_;
    std::map<std::string, Fn, std::less<>> entries_;
    bool sealed_{false};
};

/**
 * @brief The three tables consulted while validating and transforming.
 */
struct Registries {
    Registry<TypePredicate> customTypes{"custom type"};
    Registry<ValidatorFn> validators{"validator"};
    Registry<TransformFn> transformers{"transformer"};

    /**
     * @brief Registries seeded with the built-in formats (email, url, uuid,
     * cpf, cnpj, date, phone, cep) and transformers.
     */
    [[nodiscard]] static auto withDefaults() -> Registries;

    /// Seals all three tables.
    void seal();

    [[nodiscard]] auto isSealed() const noexcept -> bool {
        return customTypes.isSealed() && validators.isSealed() &&
               transformers.isSealed();
    }
};

}  // namespace vigil::schema

#endif  // VIGIL_SCHEMA_REGISTRY_HPP
