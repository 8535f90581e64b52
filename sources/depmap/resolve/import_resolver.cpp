//
// Created by gregorian-rayne on 1/16/26.
//

#include "depmap/resolve/import_resolver.hpp"
#include "depmap/utils/string_utils.hpp"

#include <algorithm>
#include <utility>

namespace depmap::resolve {

    namespace su = string_utils;

    namespace {

        Resolution local(ModuleId id) {
            return {ImportClass::Local, std::move(id)};
        }

        Resolution classified(const ImportClass cls) {
            return {cls, std::nullopt};
        }

    }  // namespace

    ImportResolver::ImportResolver(const scanner::ModuleRegistry& registry, StdlibTable stdlib)
        : registry_(registry)
        , stdlib_(std::move(stdlib))
    {}

    Resolution ImportResolver::resolve(const RawImport& raw, const Module& importer) const {
        if (raw.is_relative()) {
            return resolve_relative(raw, importer);
        }
        return resolve_absolute(raw);
    }

    Resolution ImportResolver::resolve_relative(const RawImport& raw, const Module& importer) const {
        std::string_view base = importer.package;
        const std::size_t climb = raw.depth - 1;

        if (climb > su::component_count(base)) {
            return classified(ImportClass::Unresolvable);
        }
        for (std::size_t i = 0; i < climb; ++i) {
            base = su::parent_name(base);
        }

        const auto candidate = su::join_dotted(base, raw.target);
        if (candidate.empty()) {
            return classified(ImportClass::Unresolvable);
        }

        const std::size_t floor = std::max<std::size_t>(su::component_count(base), 1);
        if (auto match = registry_.longest_prefix_match(candidate, floor)) {
            return local(std::move(*match));
        }
        return classified(ImportClass::Unresolvable);
    }

    Resolution ImportResolver::resolve_absolute(const RawImport& raw) const {
        const std::string_view target = raw.target;
        const std::string_view top = su::first_component(target);

        if (top.empty()) {
            return classified(ImportClass::Unresolvable);
        }

        if (const auto& root_package = registry_.root_package();
            root_package && *root_package == top && target.size() > top.size()) {
            if (auto match = registry_.longest_prefix_match(target.substr(top.size() + 1), 1)) {
                return local(std::move(*match));
            }
        }

        if (auto match = registry_.longest_prefix_match(target, 1)) {
            return local(std::move(*match));
        }

        if (registry_.has_prefix(top)) {
            return classified(ImportClass::Unresolvable);
        }

        if (stdlib_.contains(top)) {
            return classified(ImportClass::StandardLibrary);
        }

        return classified(ImportClass::ThirdParty);
    }

}  // namespace depmap::resolve
