//
// Created by gregorian-rayne on 1/15/26.
//

#include "depmap/extractors/extractor.hpp"

#include <algorithm>

namespace depmap::extractors {

    bool IImportExtractor::can_extract(const fs::path& path) const {
        const auto ext = path.extension().string();
        const auto extensions = supported_extensions();
        return std::ranges::find(extensions, ext) != extensions.end();
    }

    ExtractorRegistry& ExtractorRegistry::instance() {
        static ExtractorRegistry registry;
        return registry;
    }

    void ExtractorRegistry::register_extractor(std::unique_ptr<IImportExtractor> extractor) {
        if (!extractor) {
            return;
        }

        std::lock_guard lock(mutex_);
        const auto exists = std::ranges::any_of(extractors_, [&](const auto& registered) {
            return registered->name() == extractor->name();
        });
        if (!exists) {
            extractors_.push_back(std::move(extractor));
        }
    }

    const IImportExtractor* ExtractorRegistry::find_for_file(const fs::path& path) const {
        std::lock_guard lock(mutex_);
        for (const auto& extractor : extractors_) {
            if (extractor->can_extract(path)) {
                return extractor.get();
            }
        }
        return nullptr;
    }

    const IImportExtractor* ExtractorRegistry::find_by_name(const std::string_view name) const {
        std::lock_guard lock(mutex_);
        for (const auto& extractor : extractors_) {
            if (extractor->name() == name) {
                return extractor.get();
            }
        }
        return nullptr;
    }

    std::vector<const IImportExtractor*> ExtractorRegistry::list() const {
        std::lock_guard lock(mutex_);
        std::vector<const IImportExtractor*> result;
        result.reserve(extractors_.size());
        for (const auto& extractor : extractors_) {
            result.push_back(extractor.get());
        }
        return result;
    }

}  // namespace depmap::extractors
