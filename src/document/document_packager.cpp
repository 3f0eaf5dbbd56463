#include "document/document_packager.hpp"
#include "document/zip_archive.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cmath>
#include <ctime>
#include <sstream>

namespace
{
    constexpr int64_t EMU_PER_PIXEL = 9525; // 96 dpi

    const char *XML_DECLARATION = "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n";

    std::string runs(const std::string &text, bool bold)
    {
        const std::string run_properties = bold ? "<w:rPr><w:b/></w:rPr>" : "";
        std::ostringstream xml;
        std::istringstream lines(text);
        std::string line;
        bool first = true;
        while (std::getline(lines, line))
        {
            if (!line.empty() && line.back() == '\r')
            {
                line.pop_back();
            }
            xml << "<w:r>" << run_properties;
            if (!first)
            {
                xml << "<w:br/>";
            }
            xml << "<w:t xml:space=\"preserve\">" << DocumentPackager::escapeXml(line) << "</w:t></w:r>";
            first = false;
        }
        return xml.str();
    }

    std::string paragraph(const std::string &text, bool bold = false, const std::string &style = "", bool centered = false)
    {
        std::ostringstream xml;
        xml << "<w:p>";
        if (!style.empty() || centered)
        {
            xml << "<w:pPr>";
            if (!style.empty())
                xml << "<w:pStyle w:val=\"" << style << "\"/>";
            if (centered)
                xml << "<w:jc w:val=\"center\"/>";
            xml << "</w:pPr>";
        }
        xml << runs(text, bold) << "</w:p>";
        return xml.str();
    }

    std::string currentTimestamp()
    {
        std::time_t now = std::time(nullptr);
        std::tm utc{};
        gmtime_r(&now, &utc);
        char buffer[32];
        std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc);
        return buffer;
    }
}

DocumentPackager::DocumentPackager(const GenerationSettings &settings)
    : settings_(settings)
{
}

std::string DocumentPackager::escapeXml(const std::string &text)
{
    std::string escaped;
    escaped.reserve(text.size());
    for (unsigned char c : text)
    {
        switch (c)
        {
        case '&':
            escaped += "&amp;";
            break;
        case '<':
            escaped += "&lt;";
            break;
        case '>':
            escaped += "&gt;";
            break;
        case '"':
            escaped += "&quot;";
            break;
        case '\'':
            escaped += "&apos;";
            break;
        default:
            // XML 1.0 forbids most control characters
            if (c < 0x20 && c != '\t' && c != '\n' && c != '\r')
                break;
            escaped += static_cast<char>(c);
        }
    }
    return escaped;
}

void DocumentPackager::displayExtent(int width, int height, int64_t &cx, int64_t &cy) const
{
    double display_width = settings_.display_width_px;
    double display_height = settings_.display_height_px;
    if (width > 0 && height > 0)
    {
        const double factor = std::min(display_width / width, display_height / height);
        display_width = std::max(1.0, std::round(width * factor));
        display_height = std::max(1.0, std::round(height * factor));
    }
    cx = static_cast<int64_t>(display_width) * EMU_PER_PIXEL;
    cy = static_cast<int64_t>(display_height) * EMU_PER_PIXEL;
}

std::string DocumentPackager::imageBlockXml(const ImageBlock &block, std::vector<MediaPart> &media) const
{
    std::ostringstream xml;
    const ImageAsset &asset = assetOf(block.image);
    const std::string position = std::to_string(block.position);

    if (const auto *reference = std::get_if<ImageReference>(&block.image))
    {
        std::string text = position + ". " + reference->asset.original_filename;
        if (!reference->asset.description.empty())
            text += "\n   Description: " + reference->asset.description;
        if (!reference->asset.source_locator.empty())
            text += "\n   Link: " + reference->asset.source_locator;
        xml << paragraph(text, false);
        return xml.str();
    }

    xml << paragraph("Image " + position + ": " + asset.original_filename, true);
    if (!asset.description.empty())
    {
        xml << paragraph(asset.description);
    }

    const auto *embedded = std::get_if<EmbeddedImage>(&block.image);
    if (!embedded)
    {
        xml << paragraph("[Image could not be loaded: " + asset.original_filename + "]");
        return xml.str();
    }

    const size_t index = media.size() + 1;
    const std::string file_name = "image" + std::to_string(index) + ".jpeg";
    media.push_back(MediaPart{"word/media/" + file_name, "rIdImg" + std::to_string(index), &embedded->encoded_bytes});

    int64_t cx = 0;
    int64_t cy = 0;
    displayExtent(embedded->width, embedded->height, cx, cy);
    const std::string drawing_id = std::to_string(index);

    xml << "<w:p><w:pPr><w:jc w:val=\"center\"/></w:pPr><w:r><w:drawing>"
        << "<wp:inline distT=\"0\" distB=\"0\" distL=\"0\" distR=\"0\">"
        << "<wp:extent cx=\"" << cx << "\" cy=\"" << cy << "\"/>"
        << "<wp:docPr id=\"" << drawing_id << "\" name=\"Picture " << drawing_id << "\" descr=\""
        << escapeXml(asset.description.empty() ? asset.original_filename : asset.description) << "\"/>"
        << "<wp:cNvGraphicFramePr><a:graphicFrameLocks noChangeAspect=\"1\"/></wp:cNvGraphicFramePr>"
        << "<a:graphic><a:graphicData uri=\"http://schemas.openxmlformats.org/drawingml/2006/picture\">"
        << "<pic:pic><pic:nvPicPr><pic:cNvPr id=\"" << drawing_id << "\" name=\"" << file_name << "\"/><pic:cNvPicPr/></pic:nvPicPr>"
        << "<pic:blipFill><a:blip r:embed=\"" << media.back().relationship_id << "\"/><a:stretch><a:fillRect/></a:stretch></pic:blipFill>"
        << "<pic:spPr><a:xfrm><a:off x=\"0\" y=\"0\"/><a:ext cx=\"" << cx << "\" cy=\"" << cy << "\"/></a:xfrm>"
        << "<a:prstGeom prst=\"rect\"><a:avLst/></a:prstGeom></pic:spPr></pic:pic>"
        << "</a:graphicData></a:graphic></wp:inline></w:drawing></w:r></w:p>";
    return xml.str();
}

std::string DocumentPackager::documentXml(const std::vector<ContentBlock> &blocks, std::vector<MediaPart> &media) const
{
    std::ostringstream xml;
    xml << XML_DECLARATION
        << "<w:document xmlns:w=\"http://schemas.openxmlformats.org/wordprocessingml/2006/main\""
        << " xmlns:r=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships\""
        << " xmlns:wp=\"http://schemas.openxmlformats.org/drawingml/2006/wordprocessingDrawing\""
        << " xmlns:a=\"http://schemas.openxmlformats.org/drawingml/2006/main\""
        << " xmlns:pic=\"http://schemas.openxmlformats.org/drawingml/2006/picture\">"
        << "<w:body>";

    for (const auto &block : blocks)
    {
        if (const auto *heading = std::get_if<HeadingBlock>(&block))
        {
            switch (heading->level)
            {
            case 0:
                xml << paragraph(heading->text, false, "Title", true);
                break;
            case 1:
                xml << paragraph(heading->text, false, "Heading1");
                break;
            default:
                xml << paragraph(heading->text, true);
                break;
            }
        }
        else if (const auto *text = std::get_if<ParagraphBlock>(&block))
        {
            xml << paragraph(text->text);
        }
        else
        {
            xml << imageBlockXml(std::get<ImageBlock>(block), media);
        }
    }

    xml << "<w:sectPr><w:pgSz w:w=\"12240\" w:h=\"15840\"/>"
        << "<w:pgMar w:top=\"1440\" w:right=\"1440\" w:bottom=\"1440\" w:left=\"1440\" w:header=\"720\" w:footer=\"720\" w:gutter=\"0\"/>"
        << "</w:sectPr></w:body></w:document>";
    return xml.str();
}

std::string DocumentPackager::contentTypesXml()
{
    return std::string(XML_DECLARATION) +
           "<Types xmlns=\"http://schemas.openxmlformats.org/package/2006/content-types\">"
           "<Default Extension=\"rels\" ContentType=\"application/vnd.openxmlformats-package.relationships+xml\"/>"
           "<Default Extension=\"xml\" ContentType=\"application/xml\"/>"
           "<Default Extension=\"jpeg\" ContentType=\"image/jpeg\"/>"
           "<Override PartName=\"/word/document.xml\" ContentType=\"application/vnd.openxmlformats-officedocument.wordprocessingml.document.main+xml\"/>"
           "<Override PartName=\"/word/styles.xml\" ContentType=\"application/vnd.openxmlformats-officedocument.wordprocessingml.styles+xml\"/>"
           "<Override PartName=\"/docProps/core.xml\" ContentType=\"application/vnd.openxmlformats-package.core-properties+xml\"/>"
           "<Override PartName=\"/docProps/app.xml\" ContentType=\"application/vnd.openxmlformats-officedocument.extended-properties+xml\"/>"
           "</Types>";
}

std::string DocumentPackager::packageRelsXml()
{
    return std::string(XML_DECLARATION) +
           "<Relationships xmlns=\"http://schemas.openxmlformats.org/package/2006/relationships\">"
           "<Relationship Id=\"rId1\" Type=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships/officeDocument\" Target=\"word/document.xml\"/>"
           "<Relationship Id=\"rId2\" Type=\"http://schemas.openxmlformats.org/package/2006/relationships/metadata/core-properties\" Target=\"docProps/core.xml\"/>"
           "<Relationship Id=\"rId3\" Type=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships/extended-properties\" Target=\"docProps/app.xml\"/>"
           "</Relationships>";
}

std::string DocumentPackager::documentRelsXml(const std::vector<MediaPart> &media)
{
    std::ostringstream xml;
    xml << XML_DECLARATION
        << "<Relationships xmlns=\"http://schemas.openxmlformats.org/package/2006/relationships\">"
        << "<Relationship Id=\"rIdStyles\" Type=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships/styles\" Target=\"styles.xml\"/>";
    for (const auto &part : media)
    {
        // Targets are relative to word/
        xml << "<Relationship Id=\"" << part.relationship_id
            << "\" Type=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships/image\" Target=\""
            << part.part_name.substr(5) << "\"/>";
    }
    xml << "</Relationships>";
    return xml.str();
}

std::string DocumentPackager::coreXml(const DocumentProperties &properties)
{
    const std::string created = properties.created.empty() ? currentTimestamp() : properties.created;
    std::ostringstream xml;
    xml << XML_DECLARATION
        << "<cp:coreProperties xmlns:cp=\"http://schemas.openxmlformats.org/package/2006/metadata/core-properties\""
        << " xmlns:dc=\"http://purl.org/dc/elements/1.1/\" xmlns:dcterms=\"http://purl.org/dc/terms/\""
        << " xmlns:xsi=\"http://www.w3.org/2001/XMLSchema-instance\">"
        << "<dc:title>" << escapeXml(properties.title) << "</dc:title>"
        << "<dc:subject>" << escapeXml(properties.subject) << "</dc:subject>"
        << "<dc:creator>" << escapeXml(properties.creator) << "</dc:creator>"
        << "<dc:description>" << escapeXml(properties.description) << "</dc:description>"
        << "<dcterms:created xsi:type=\"dcterms:W3CDTF\">" << created << "</dcterms:created>"
        << "</cp:coreProperties>";
    return xml.str();
}

std::string DocumentPackager::appXml()
{
    return std::string(XML_DECLARATION) +
           "<Properties xmlns=\"http://schemas.openxmlformats.org/officeDocument/2006/extended-properties\">"
           "<Application>report_docgen</Application></Properties>";
}

std::string DocumentPackager::stylesXml()
{
    return std::string(XML_DECLARATION) +
           "<w:styles xmlns:w=\"http://schemas.openxmlformats.org/wordprocessingml/2006/main\">"
           "<w:docDefaults><w:rPrDefault><w:rPr><w:rFonts w:ascii=\"Calibri\" w:hAnsi=\"Calibri\"/><w:sz w:val=\"22\"/></w:rPr></w:rPrDefault>"
           "<w:pPrDefault><w:pPr><w:spacing w:after=\"200\"/></w:pPr></w:pPrDefault></w:docDefaults>"
           "<w:style w:type=\"paragraph\" w:default=\"1\" w:styleId=\"Normal\"><w:name w:val=\"Normal\"/></w:style>"
           "<w:style w:type=\"paragraph\" w:styleId=\"Title\"><w:name w:val=\"Title\"/><w:basedOn w:val=\"Normal\"/>"
           "<w:pPr><w:spacing w:after=\"400\"/></w:pPr><w:rPr><w:b/><w:sz w:val=\"40\"/></w:rPr></w:style>"
           "<w:style w:type=\"paragraph\" w:styleId=\"Heading1\"><w:name w:val=\"heading 1\"/><w:basedOn w:val=\"Normal\"/>"
           "<w:pPr><w:keepNext/><w:spacing w:before=\"400\" w:after=\"200\"/><w:outlineLvl w:val=\"0\"/></w:pPr>"
           "<w:rPr><w:b/><w:caps/><w:sz w:val=\"28\"/></w:rPr></w:style>"
           "</w:styles>";
}

PackResult DocumentPackager::pack(const std::vector<ContentBlock> &blocks, const DocumentProperties &properties) const
{
    PackResult result;

    uint64_t image_bytes = 0;
    for (const auto &block : blocks)
    {
        if (const auto *image = std::get_if<ImageBlock>(&block))
        {
            if (const auto *embedded = std::get_if<EmbeddedImage>(&image->image))
                image_bytes += embedded->encoded_bytes.size();
        }
    }
    // Images are stored, not compressed, so their raw size is a lower bound on the package
    if (image_bytes > settings_.max_package_bytes)
    {
        result.status = PackStatus::PAYLOAD_TOO_LARGE;
        result.error_message = "Embedded images total " + std::to_string(image_bytes) +
                               " bytes, above the package limit of " + std::to_string(settings_.max_package_bytes);
        Logger::warn(result.error_message);
        return result;
    }

    std::vector<MediaPart> media;
    const std::string document = documentXml(blocks, media);

    ZipArchive zip;
    const std::vector<std::pair<std::string, std::string>> xml_parts = {
        {"[Content_Types].xml", contentTypesXml()},
        {"_rels/.rels", packageRelsXml()},
        {"docProps/core.xml", coreXml(properties)},
        {"docProps/app.xml", appXml()},
        {"word/document.xml", document},
        {"word/styles.xml", stylesXml()},
        {"word/_rels/document.xml.rels", documentRelsXml(media)}};

    bool added = true;
    for (const auto &part : xml_parts)
    {
        added = added && zip.addEntry(part.first, part.second);
    }
    // JPEG data does not shrink under deflate
    for (const auto &part : media)
    {
        added = added && zip.addEntry(part.part_name, *part.bytes, ZipCompression::STORE);
    }

    if (added)
    {
        result.package = zip.finish();
    }
    if (!added || result.package.empty())
    {
        result.status = PackStatus::CONTAINER_ERROR;
        result.error_message = zip.errorMessage();
        Logger::error("Failed to build document package: " + result.error_message);
        return result;
    }
    result.image_parts = media.size();

    if (result.package.size() > settings_.max_package_bytes)
    {
        result.status = PackStatus::PAYLOAD_TOO_LARGE;
        result.error_message = "Document size " + std::to_string(result.package.size()) +
                               " bytes exceeds limit of " + std::to_string(settings_.max_package_bytes) + " bytes";
        result.package.clear();
        Logger::warn(result.error_message);
        return result;
    }

    Logger::info("Packaged document: " + std::to_string(result.package.size()) + " bytes, " +
                 std::to_string(result.image_parts) + " image parts");
    return result;
}
