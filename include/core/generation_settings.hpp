#pragma once

#include <cstdint>

constexpr uint64_t MIB = 1024ull * 1024ull;

/**
 * @brief Budgets and ceilings for one generation run.
 *
 * Defaults match the shipped config.yaml; ServerConfigManager::getGenerationSettings()
 * returns the configured values.
 */
struct GenerationSettings
{
    // Image pipeline
    int batch_size = 3;
    int inter_batch_delay_ms = 100;

    // Re-encoding
    uint64_t max_embed_size_bytes = 2 * MIB;
    int max_image_width = 800;
    int max_image_height = 600;
    int jpeg_quality = 85;
    int min_jpeg_quality = 40;

    // Packaging
    uint64_t max_package_bytes = 50 * MIB;
    int display_width_px = 400;
    int display_height_px = 300;

    // Feasibility
    uint64_t local_payload_ceiling_bytes = 40 * MIB;
    double low_memory_threshold_gb = 4.0;
    int low_memory_max_images = 10;
};
