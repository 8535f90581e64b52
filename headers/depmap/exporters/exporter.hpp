//
// Created by gregorian-rayne on 1/21/26.
//

#ifndef DEPMAP_EXPORTER_HPP
#define DEPMAP_EXPORTER_HPP

/**
 * @file exporter.hpp
 * @brief Report writers: sectioned text, JSON, Markdown and Graphviz DOT.
 */

#include "depmap/result.hpp"
#include "depmap/error.hpp"
#include "depmap/types.hpp"
#include "depmap/exporters/report.hpp"

#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace depmap::exporters {

    enum class ExportFormat {
        Text,
        JSON,
        Markdown,
        Dot
    };

    struct ExportOptions {
        bool pretty_print = true;           // JSON indentation
        bool highlight_cycles = true;       // DOT: cycle edges in red
    };

    class IExporter {
    public:
        virtual ~IExporter() = default;

        [[nodiscard]] virtual ExportFormat format() const noexcept = 0;

        [[nodiscard]] virtual std::string_view file_extension() const noexcept = 0;

        [[nodiscard]] virtual std::string_view format_name() const noexcept = 0;

        /**
         * Writes the report to a stream.
         */
        [[nodiscard]] virtual Result<void, Error> export_to_stream(
            std::ostream& stream,
            const Report& report,
            const ExportOptions& options
        ) const = 0;

        /**
         * Writes the report to a file, creating parent directories.
         */
        [[nodiscard]] virtual Result<void, Error> export_to_file(
            const fs::path& path,
            const Report& report,
            const ExportOptions& options
        ) const;

        [[nodiscard]] virtual Result<std::string, Error> export_to_string(
            const Report& report,
            const ExportOptions& options
        ) const;
    };

    class ExporterFactory {
    public:
        [[nodiscard]] static Result<std::unique_ptr<IExporter>, Error> create(ExportFormat format);

        /**
         * Picks the format from the file extension.
         */
        [[nodiscard]] static Result<std::unique_ptr<IExporter>, Error> create_for_file(const fs::path& path);

        [[nodiscard]] static std::vector<ExportFormat> available_formats();
    };

    [[nodiscard]] std::string_view format_to_string(ExportFormat format) noexcept;

    [[nodiscard]] std::optional<ExportFormat> string_to_format(std::string_view str) noexcept;

    /**
     * Exporter with a fixed format, extension and display name.
     */
    class BasicExporter : public IExporter {
    public:
        [[nodiscard]] ExportFormat format() const noexcept override { return format_; }
        [[nodiscard]] std::string_view file_extension() const noexcept override { return extension_; }
        [[nodiscard]] std::string_view format_name() const noexcept override { return name_; }

    protected:
        BasicExporter(const ExportFormat format, const std::string_view extension, const std::string_view name)
            : format_(format), extension_(extension), name_(name) {}

    private:
        ExportFormat format_;
        std::string_view extension_;
        std::string_view name_;
    };

    using StreamResult = Result<void, Error>;

    class TextExporter final : public BasicExporter {
    public:
        TextExporter() : BasicExporter(ExportFormat::Text, ".txt", "Text") {}

        [[nodiscard]] StreamResult export_to_stream(
            std::ostream& stream, const Report& report, const ExportOptions& options) const override;
    };

    /**
     * Top-level keys: depmap_version, project, summary, modules,
     * dependencies, circular_imports, coupling_metrics, orphans.
     * Coupling metrics are listed by module name.
     */
    class JsonExporter final : public BasicExporter {
    public:
        JsonExporter() : BasicExporter(ExportFormat::JSON, ".json", "JSON") {}

        [[nodiscard]] StreamResult export_to_stream(
            std::ostream& stream, const Report& report, const ExportOptions& options) const override;
    };

    class MarkdownExporter final : public BasicExporter {
    public:
        MarkdownExporter() : BasicExporter(ExportFormat::Markdown, ".md", "Markdown") {}

        [[nodiscard]] StreamResult export_to_stream(
            std::ostream& stream, const Report& report, const ExportOptions& options) const override;
    };

    /**
     * Graphviz graph. Node ids are module ids with dots turned into
     * underscores and labels break at every dot. Packages are filled
     * green; with highlight_cycles, edges on a cycle are drawn red.
     *
     * Render with: dot -Tpng deps.dot -o deps.png
     */
    class DotExporter final : public BasicExporter {
    public:
        DotExporter() : BasicExporter(ExportFormat::Dot, ".dot", "DOT") {}

        [[nodiscard]] StreamResult export_to_stream(
            std::ostream& stream, const Report& report, const ExportOptions& options) const override;
    };

    /**
     * Graphviz identifier for a module id ("pkg.core" -> "pkg_core").
     */
    [[nodiscard]] std::string dot_identifier(const ModuleId& id);

}  // namespace depmap::exporters

#endif //DEPMAP_EXPORTER_HPP
