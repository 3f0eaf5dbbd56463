#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

/**
 * @brief Snapshot of the textual report content handed to document generation.
 *
 * Sections map a section identifier (e.g. "research") to field -> text. The
 * mapping order is irrelevant; document order comes from ReportSchema.
 */
struct ReportContentModel
{
    std::string title;
    std::map<std::string, std::map<std::string, std::string>> sections;

    const std::string *findField(const std::string &section, const std::string &field) const;
};

/**
 * @brief A photograph attached to the report. Read-only to the generator.
 */
struct ImageAsset
{
    std::string id;
    std::string original_filename;
    std::string source_locator; // Remote URL or object-storage key
    uint64_t declared_byte_size = 0;
    std::string mime_type;
    std::string description;
    int order = 0;
};

struct GenerationOptions
{
    bool embed_images_inline = false;
    bool enhance_text = false;
};

struct ReportFieldSpec
{
    const char *key;
    const char *label;
};

struct ReportSectionSpec
{
    const char *id;
    const char *title;
    std::vector<ReportFieldSpec> fields;
};

/**
 * @brief Fixed section-then-field order of the inspection report.
 */
class ReportSchema
{
public:
    static const std::vector<ReportSectionSpec> &sections();

    // Legacy section keys still sent by older clients, mapped to the canonical id
    static std::string canonicalSectionId(const std::string &id);
};
