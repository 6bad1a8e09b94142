#ifndef MANIFEST_HPP
#define MANIFEST_HPP

#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace Hookstage {

/**
 * @brief One rendered resource document.
 */
struct Manifest
{
    std::string raw;    // Exact document text, handed to the applier untouched
    YAML::Node node;    // Parsed document
    std::string kind;   // Top-level "kind", empty if absent
    std::string name;   // "metadata.name", empty if absent
    std::string source; // Template path from "# Source:" or the file it came from

    /**
     * @brief Returns "Kind/name" for log messages, falling back to the source.
     */
    std::string displayName() const;
};

/**
 * @class ManifestLoader
 * @brief Turns rendered output into a flat, ordered sequence of manifests.
 *
 * Input can be a single multi-document YAML file, a directory tree of
 * .yaml/.yml files (visited in sorted path order), a tar archive read with
 * libarchive (visited in archive order), or "-" for standard input. Sub-package
 * output is expected to be already flattened into that input; the loader
 * never reorders documents by origin.
 */
class ManifestLoader
{
public:
    /**
     * @brief Splits a multi-document YAML stream on lines starting with "---".
     *
     * Empty documents (blank or comment-only) are dropped.
     *
     * @param stream The full text of the stream.
     * @param origin Label used as source when a document carries no
     *        "# Source:" comment, and in error messages.
     * @return The parsed manifests in stream order.
     * @throws HookError (InvalidManifest) if a document fails to parse or is not a map.
     */
    static std::vector<Manifest> splitDocuments(const std::string& stream,
                                                const std::string& origin);

    /**
     * @brief Parses a single document.
     * @return A manifest whose node is a YAML null when the document is empty.
     * @throws HookError (InvalidManifest) on parse errors or non-map documents.
     */
    static Manifest parseDocument(const std::string& raw, const std::string& origin);

    /**
     * @brief Loads manifests from a file, directory, archive or "-" (stdin).
     * @throws HookError (InvalidManifest) if the input cannot be read or parsed.
     */
    static std::vector<Manifest> load(const std::string& path);

    static std::vector<Manifest> loadFile(const std::string& path);
    static std::vector<Manifest> loadDirectory(const std::string& path);
    static std::vector<Manifest> loadArchive(const std::string& path);

    /**
     * @brief True for paths ending in .tar, .tar.gz or .tgz.
     */
    static bool isArchivePath(const std::string& path);
};

} // namespace Hookstage

#endif // MANIFEST_HPP
