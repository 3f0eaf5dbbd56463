#pragma once

#include <vector>
#include "core/content_block.hpp"
#include "core/report_model.hpp"

/**
 * @brief Maps a report snapshot to the ordered content blocks of the document body.
 *
 * Text is copied verbatim; list-to-prose rewriting happens before this step
 * (see TextEnhancer).
 */
class ContentModelBuilder
{
public:
    /**
     * @brief Build text-only blocks in fixed schema order
     *
     * Emits the title (level 0), then for each section with at least one
     * non-empty field a section heading (level 1), and for every non-empty field
     * a label heading (level 2) followed by a paragraph with the field text.
     */
    static std::vector<ContentBlock> build(const ReportContentModel &model);

    /**
     * @brief Append the image section for already-processed images
     * @param embedded true for the inline "Images" section, false for "Referenced Images"
     */
    static void appendImageBlocks(std::vector<ContentBlock> &blocks,
                                  const std::vector<ImageOutcome> &images,
                                  bool embedded);

    static bool isBlank(const std::string &text);
};
