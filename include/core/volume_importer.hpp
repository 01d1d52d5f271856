#pragma once

#include "core/assembly_error.hpp"
#include "core/diagnostics.hpp"
#include "core/import_config.hpp"
#include "core/slice_metadata.hpp"
#include "core/volumetric_image.hpp"

#include <expected>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <vector>

namespace voxel_stack::core {

/// Progress callback for import operations
using ProgressCallback = std::function<void(size_t current, size_t total, const std::string& message)>;

/// Slice readers of one volume, in arbitrary order
using SliceSourceList = std::vector<std::unique_ptr<ISliceSource>>;

/// One volume of a batch import
struct VolumeRequest {
    SliceSourceList sources;
    Modality modality = Modality::Generic;
};

/// Outcome of one volume of a batch import
struct VolumeImportResult {
    std::expected<VolumetricImage, AssemblyError> image;

    /// Diagnostics reported while this volume was assembled
    std::vector<Diagnostic> diagnostics;
};

/**
 * @brief Import pipeline from slice readers to a volumetric image
 *
 * Loads slice metadata, assembles the volume geometry, loads pixel data in
 * sorted order, stacks it and wraps it in the image variant of the
 * requested modality.
 *
 * @code
 * VolumeImporter importer(config);
 * CollectingDiagnosticsSink diagnostics;
 * auto image = importer.importVolume(sources, Modality::CT, diagnostics);
 * @endcode
 *
 * ## Thread Safety
 * - importVolume() may be called concurrently for different source lists
 * - The progress callback may be invoked from worker threads; invocations
 *   are serialized
 */
class VolumeImporter {
public:
    VolumeImporter();
    explicit VolumeImporter(ImportConfig config);
    ~VolumeImporter();

    // Non-copyable, movable
    VolumeImporter(const VolumeImporter&) = delete;
    VolumeImporter& operator=(const VolumeImporter&) = delete;
    VolumeImporter(VolumeImporter&&) noexcept;
    VolumeImporter& operator=(VolumeImporter&&) noexcept;

    /**
     * @brief Set progress callback for long-running operations
     */
    void setProgressCallback(ProgressCallback callback);

    [[nodiscard]] const ImportConfig& config() const;

    /**
     * @brief Import one volume
     * @param sources Slice readers; loaded in place
     * @param modality Modality deciding the image variant
     * @param sink Receives diagnostics; they are also recorded on the image
     * @return Image on success, SliceLoadFailed / GeometryMismatch / ... otherwise
     */
    [[nodiscard]] std::expected<VolumetricImage, AssemblyError>
    importVolume(SliceSourceList& sources, Modality modality, DiagnosticsSink& sink);

    /**
     * @brief Import one volume on a background task
     *
     * The importer and the sink must outlive the returned future.
     */
    [[nodiscard]] std::future<std::expected<VolumetricImage, AssemblyError>>
    importVolumeAsync(SliceSourceList sources, Modality modality, DiagnosticsSink& sink);

    /**
     * @brief Import independent volumes concurrently
     *
     * Each volume runs on its own task with its own diagnostics collector;
     * a failing volume does not affect the others.
     *
     * @return One result per request, in request order
     */
    [[nodiscard]] std::vector<VolumeImportResult> importBatch(std::vector<VolumeRequest> requests);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace voxel_stack::core
