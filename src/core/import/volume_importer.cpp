#include "core/volume_importer.hpp"
#include "core/logging.hpp"
#include "core/stack_assembler.hpp"

#include <mutex>
#include <utility>

namespace voxel_stack::core {

namespace {
auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("VolumeImporter");
    return logger;
}

/// Forwards diagnostics to the caller's sink and keeps their messages for the image
class RecordingSink : public DiagnosticsSink {
public:
    explicit RecordingSink(DiagnosticsSink& target) : target_(target) {}

    void report(const Diagnostic& diagnostic) override {
        messages_.push_back(diagnostic.message);
        target_.report(diagnostic);
    }

    [[nodiscard]] const std::vector<std::string>& messages() const { return messages_; }

private:
    DiagnosticsSink& target_;
    std::vector<std::string> messages_;
};

AssemblyError toAssemblyError(const ImageError& error) {
    auto code = error.code == ImageError::Code::DimensionMismatch
        ? AssemblyError::Code::PixelDataMismatch
        : AssemblyError::Code::InternalError;
    return AssemblyError{code, error.message};
}

}  // anonymous namespace

class VolumeImporter::Impl {
public:
    ImportConfig config;
    ProgressCallback progressCallback;
    std::mutex progressMutex;

    void reportProgress(size_t current, size_t total, const std::string& message)
    {
        std::lock_guard lock(progressMutex);
        if (progressCallback) {
            progressCallback(current, total, message);
        }
    }
};

VolumeImporter::VolumeImporter()
    : VolumeImporter(ImportConfig{})
{
}

VolumeImporter::VolumeImporter(ImportConfig config)
    : impl_(std::make_unique<Impl>())
{
    impl_->config = std::move(config);
}

VolumeImporter::~VolumeImporter() = default;

VolumeImporter::VolumeImporter(VolumeImporter&&) noexcept = default;
VolumeImporter& VolumeImporter::operator=(VolumeImporter&&) noexcept = default;

void VolumeImporter::setProgressCallback(ProgressCallback callback)
{
    std::lock_guard lock(impl_->progressMutex);
    impl_->progressCallback = std::move(callback);
}

const ImportConfig& VolumeImporter::config() const
{
    return impl_->config;
}

std::expected<VolumetricImage, AssemblyError>
VolumeImporter::importVolume(SliceSourceList& sources, Modality modality, DiagnosticsSink& sink)
{
    getLogger()->info("Importing {} volume from {} slices", toString(modality), sources.size());

    if (sources.empty()) {
        getLogger()->error("No slices to import");
        return std::unexpected(AssemblyError{
            AssemblyError::Code::EmptyInput,
            "No slices to import"
        });
    }

    if (!impl_->config.assembly.isValid()) {
        return std::unexpected(AssemblyError{
            AssemblyError::Code::InvalidConfiguration,
            "Assembly configuration is invalid"
        });
    }

    impl_->reportProgress(0, 100, "Loading slice metadata...");

    std::vector<SliceMetadata> slices;
    slices.reserve(sources.size());
    for (size_t i = 0; i < sources.size(); ++i) {
        if (!sources[i]) {
            return std::unexpected(AssemblyError{
                AssemblyError::Code::SliceLoadFailed,
                "Slice source " + std::to_string(i) + " is null"
            });
        }
        if (auto loaded = sources[i]->loadMetadata(); !loaded) {
            getLogger()->error("Failed to load metadata of slice {}: {}", i, loaded.error().message);
            return std::unexpected(AssemblyError{
                AssemblyError::Code::SliceLoadFailed,
                "Metadata of slice " + std::to_string(i) + ": " + loaded.error().message
            });
        }

        SliceMetadata slice = sources[i]->metadata();
        slice.originalIndex = i;
        slice.pixelData = nullptr;
        slices.push_back(std::move(slice));
    }

    impl_->reportProgress(20, 100, "Assembling geometry...");

    RecordingSink recorder(sink);
    StackAssembler assembler(impl_->config.assembly);
    auto stack = assembler.assemble(std::move(slices), recorder);
    if (!stack) {
        return std::unexpected(stack.error());
    }

    impl_->reportProgress(40, 100, "Loading pixel data...");

    for (auto& slice : stack->slices) {
        auto& source = sources[slice.originalIndex];
        if (auto loaded = source->loadData(); !loaded) {
            getLogger()->error("Failed to load data of slice {}: {}",
                               slice.originalIndex, loaded.error().message);
            return std::unexpected(AssemblyError{
                AssemblyError::Code::SliceLoadFailed,
                "Data of slice " + std::to_string(slice.originalIndex) + ": " + loaded.error().message
            });
        }

        const auto& loadedSlice = source->metadata();
        slice.pixelData = loadedSlice.pixelData;
        slice.rescale = loadedSlice.rescale;
    }

    impl_->reportProgress(70, 100, "Stacking slices...");

    auto voxels = assembler.stackPixelData(*stack);
    if (!voxels) {
        getLogger()->error("Failed to stack pixel data: {}", voxels.error().message);
        return std::unexpected(voxels.error());
    }

    auto image = makeVolumetricImage(modality, *voxels, stack->geometry, impl_->config.roundingMode);
    if (!image) {
        getLogger()->error("Failed to create image: {}", image.error().message);
        return std::unexpected(toAssemblyError(image.error()));
    }

    for (const auto& message : recorder.messages()) {
        baseOf(*image).addDiagnostic(message);
    }

    getLogger()->info("Imported {} image with {} diagnostics",
                      toString(intensityKind(*image)), recorder.messages().size());
    impl_->reportProgress(100, 100, "Volume imported successfully");
    return image;
}

std::future<std::expected<VolumetricImage, AssemblyError>>
VolumeImporter::importVolumeAsync(SliceSourceList sources, Modality modality, DiagnosticsSink& sink)
{
    return std::async(std::launch::async,
        [this, sources = std::move(sources), modality, &sink]() mutable {
            return importVolume(sources, modality, sink);
        });
}

std::vector<VolumeImportResult> VolumeImporter::importBatch(std::vector<VolumeRequest> requests)
{
    getLogger()->info("Importing batch of {} volumes", requests.size());

    struct PendingVolume {
        std::unique_ptr<CollectingDiagnosticsSink> sink;
        std::future<std::expected<VolumetricImage, AssemblyError>> future;
    };

    std::vector<PendingVolume> pending;
    pending.reserve(requests.size());
    for (auto& request : requests) {
        PendingVolume volume;
        volume.sink = std::make_unique<CollectingDiagnosticsSink>();
        volume.future = importVolumeAsync(std::move(request.sources), request.modality, *volume.sink);
        pending.push_back(std::move(volume));
    }

    std::vector<VolumeImportResult> results;
    results.reserve(pending.size());
    size_t failed = 0;
    for (auto& volume : pending) {
        VolumeImportResult result{volume.future.get(), volume.sink->diagnostics()};
        if (!result.image) {
            ++failed;
        }
        results.push_back(std::move(result));
    }

    getLogger()->info("Batch complete: {} imported, {} failed", results.size() - failed, failed);
    return results;
}

}  // namespace voxel_stack::core
