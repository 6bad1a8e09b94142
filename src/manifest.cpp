#include "manifest.hpp"
#include "errors.hpp"
#include "utils.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <archive.h>
#include <archive_entry.h>

namespace fs = std::filesystem;

namespace Hookstage {

// Read buffer handed to libarchive.
const int archiveBufferSize = 65536; // 64 KB

namespace {
    const std::string sourcePrefix = "# Source:";

    bool isDocumentSeparator(const std::string& line)
    {
        if (line.compare(0, 3, "---") != 0) {
            return false;
        }
        // "---" alone, or followed by whitespace (e.g. "--- # comment")
        return line.size() == 3 || line[3] == ' ' || line[3] == '\t' || line[3] == '\r';
    }

    bool isManifestFile(const fs::path& path)
    {
        std::string ext = path.extension().string();
        return ext == ".yaml" || ext == ".yml";
    }

    std::string readWholeFile(const std::string& path)
    {
        std::ifstream file(path, std::ios::binary);
        if (!file.is_open()) {
            throw HookError(HookErrorKind::InvalidManifest,
                            "Unable to open manifest file: " + path);
        }
        std::ostringstream contents;
        contents << file.rdbuf();
        return contents.str();
    }
} // end anonymous namespace

std::string Manifest::displayName() const
{
    if (!kind.empty() && !name.empty()) {
        return kind + "/" + name;
    }
    if (!name.empty()) {
        return name;
    }
    return source.empty() ? std::string("<unnamed>") : source;
}

Manifest ManifestLoader::parseDocument(const std::string& raw, const std::string& origin)
{
    Manifest manifest;
    manifest.raw = raw;
    manifest.source = origin;

    // Renderers label each document with the template it came from
    std::istringstream lines(raw);
    std::string line;
    while (std::getline(lines, line)) {
        if (line.compare(0, sourcePrefix.size(), sourcePrefix) == 0) {
            std::string source = line.substr(sourcePrefix.size());
            trim(source);
            if (!source.empty()) {
                manifest.source = source;
            }
            break;
        }
    }

    try {
        manifest.node = YAML::Load(raw);
    } catch (const YAML::Exception& e) {
        throw HookError(HookErrorKind::InvalidManifest,
                        "Failed to parse manifest from " + manifest.source + ": " + e.what());
    }

    if (manifest.node.IsNull()) {
        return manifest;
    }
    if (!manifest.node.IsMap()) {
        throw HookError(HookErrorKind::InvalidManifest,
                        "Manifest from " + manifest.source + " is not a YAML map");
    }

    try {
        const YAML::Node& root = manifest.node;
        if (root["kind"] && root["kind"].IsScalar()) {
            manifest.kind = root["kind"].as<std::string>();
        }
        const YAML::Node metadata = root["metadata"];
        if (metadata && metadata.IsMap() && metadata["name"] && metadata["name"].IsScalar()) {
            manifest.name = metadata["name"].as<std::string>();
        }
    } catch (const YAML::Exception& e) {
        throw HookError(HookErrorKind::InvalidManifest,
                        "Malformed metadata in manifest from " + manifest.source + ": " + e.what());
    }

    return manifest;
}

std::vector<Manifest> ManifestLoader::splitDocuments(const std::string& stream,
                                                     const std::string& origin)
{
    std::vector<std::string> documents;
    std::string current;
    std::istringstream input(stream);
    std::string line;

    while (std::getline(input, line)) {
        if (isDocumentSeparator(line)) {
            documents.push_back(current);
            current.clear();
            continue;
        }
        current += line;
        current += '\n';
    }
    documents.push_back(current);

    std::vector<Manifest> manifests;
    for (const auto& document : documents) {
        std::string trimmed = document;
        trim(trimmed);
        if (trimmed.empty()) {
            continue;
        }

        Manifest manifest = parseDocument(document, origin);
        if (manifest.node.IsNull()) {
            // Comment-only document
            continue;
        }
        manifests.push_back(std::move(manifest));
    }
    return manifests;
}

std::vector<Manifest> ManifestLoader::loadFile(const std::string& path)
{
    return splitDocuments(readWholeFile(path), path);
}

std::vector<Manifest> ManifestLoader::loadDirectory(const std::string& path)
{
    std::vector<fs::path> files;
    try {
        for (const auto& entry : fs::recursive_directory_iterator(path)) {
            if (entry.is_regular_file() && isManifestFile(entry.path())) {
                files.push_back(entry.path());
            }
        }
    } catch (const fs::filesystem_error& e) {
        throw HookError(HookErrorKind::InvalidManifest,
                        "Error iterating manifest directory '" + path + "': " + e.what());
    }

    // Sort for a deterministic discovery order
    std::sort(files.begin(), files.end());

    std::vector<Manifest> manifests;
    for (const auto& file : files) {
        std::vector<Manifest> fromFile = loadFile(file.string());
        manifests.insert(manifests.end(),
                         std::make_move_iterator(fromFile.begin()),
                         std::make_move_iterator(fromFile.end()));
    }
    return manifests;
}

std::vector<Manifest> ManifestLoader::loadArchive(const std::string& path)
{
    struct archive* a = archive_read_new();
    archive_read_support_filter_all(a);
    archive_read_support_format_all(a);

    if (archive_read_open_filename(a, path.c_str(), archiveBufferSize) != ARCHIVE_OK) {
        std::string reason = archive_error_string(a) ? archive_error_string(a) : "unknown error";
        archive_read_free(a);
        throw HookError(HookErrorKind::InvalidManifest,
                        "Could not open archive " + path + ": " + reason);
    }

    std::vector<Manifest> manifests;
    struct archive_entry* entry;
    int status = ARCHIVE_OK;

    while ((status = archive_read_next_header(a, &entry)) == ARCHIVE_OK) {
        const char* entryPath = archive_entry_pathname(entry);
        std::string entryName = entryPath ? entryPath : "";

        if (archive_entry_filetype(entry) != AE_IFREG || !isManifestFile(entryName)) {
            archive_read_data_skip(a);
            continue;
        }

        std::string contents;
        char buffer[8192];
        la_ssize_t bytesRead = 0;
        while ((bytesRead = archive_read_data(a, buffer, sizeof(buffer))) > 0) {
            contents.append(buffer, static_cast<size_t>(bytesRead));
        }
        if (bytesRead < 0) {
            std::string reason = archive_error_string(a) ? archive_error_string(a) : "read error";
            archive_read_free(a);
            throw HookError(HookErrorKind::InvalidManifest,
                            "Failed to read " + entryName + " from " + path + ": " + reason);
        }

        try {
            std::vector<Manifest> fromEntry = splitDocuments(contents, path + ":" + entryName);
            manifests.insert(manifests.end(),
                             std::make_move_iterator(fromEntry.begin()),
                             std::make_move_iterator(fromEntry.end()));
        } catch (const HookError&) {
            archive_read_free(a);
            throw;
        }
    }

    if (status != ARCHIVE_EOF) {
        std::string reason = archive_error_string(a) ? archive_error_string(a) : "read error";
        archive_read_free(a);
        throw HookError(HookErrorKind::InvalidManifest,
                        "Error reading archive " + path + ": " + reason);
    }

    archive_read_close(a);
    archive_read_free(a);
    return manifests;
}

bool ManifestLoader::isArchivePath(const std::string& path)
{
    return endsWith(path, ".tar") || endsWith(path, ".tar.gz") || endsWith(path, ".tgz");
}

std::vector<Manifest> ManifestLoader::load(const std::string& path)
{
    if (path == "-") {
        std::string stream((std::istreambuf_iterator<char>(std::cin)),
                           std::istreambuf_iterator<char>());
        return splitDocuments(stream, "<stdin>");
    }

    if (!fs::exists(path)) {
        throw HookError(HookErrorKind::InvalidManifest, "Manifest path not found: " + path);
    }
    if (fs::is_directory(path)) {
        return loadDirectory(path);
    }
    if (isArchivePath(path)) {
        return loadArchive(path);
    }
    return loadFile(path);
}

} // namespace Hookstage
