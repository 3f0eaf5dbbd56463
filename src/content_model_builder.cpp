#include "core/content_model_builder.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cctype>

bool ContentModelBuilder::isBlank(const std::string &text)
{
    return std::all_of(text.begin(), text.end(), [](unsigned char c)
                       { return std::isspace(c) != 0; });
}

std::vector<ContentBlock> ContentModelBuilder::build(const ReportContentModel &model)
{
    std::vector<ContentBlock> blocks;

    if (!isBlank(model.title))
    {
        blocks.emplace_back(HeadingBlock{model.title, 0});
    }

    for (const auto &section : ReportSchema::sections())
    {
        bool heading_emitted = false;
        for (const auto &field : section.fields)
        {
            const std::string *value = model.findField(section.id, field.key);
            if (!value || isBlank(*value))
            {
                continue;
            }

            if (!heading_emitted)
            {
                blocks.emplace_back(HeadingBlock{section.title, 1});
                heading_emitted = true;
            }
            blocks.emplace_back(HeadingBlock{std::string(field.label) + ":", 2});
            blocks.emplace_back(ParagraphBlock{*value});
        }
    }

    Logger::debug("Built " + std::to_string(blocks.size()) + " text blocks for report: " + model.title);
    return blocks;
}

void ContentModelBuilder::appendImageBlocks(std::vector<ContentBlock> &blocks,
                                            const std::vector<ImageOutcome> &images,
                                            bool embedded)
{
    if (images.empty())
    {
        return;
    }

    blocks.emplace_back(HeadingBlock{embedded ? "Images" : "Referenced Images", 1});
    for (size_t i = 0; i < images.size(); ++i)
    {
        blocks.emplace_back(ImageBlock{images[i], i + 1});
    }
}
