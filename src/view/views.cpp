#include "kestrel/view/views.hpp"
#include "kestrel/core/logging.hpp"

namespace kestrel {

Views::Views(AG& ag, ViewsConfig config)
    : ag_(ag)
    , config_(std::move(config))
    , currentVfs_(config_.vfs ? *config_.vfs : VfsFile::memory())
    , renderContext_(ag, config_.render, this)
    , stage_(config_.virtualWidth, config_.virtualHeight) {
    stage_.setName(std::string("stage"));
    KESTREL_DEBUG(LogCategory::Scene, "Views created (" + Xml::formatNumber(config_.virtualWidth) +
        "x" + Xml::formatNumber(config_.virtualHeight) + ")");
}

Views::~Views() {
    stage_.removeChildren();
    renderContext_.close();
}

void Views::invalidatedView(View* view) {
    invalidationCount_++;
    lastInvalidatedView_ = view;
    onInvalidated_(view);
}

// =============================================================================
// Frame
// =============================================================================

void Views::update(double dtSeconds) {
    stage_.update(dtSeconds);
}

void Views::beginFrame() {
    renderContext_.stats().startFrame();
    if (config_.clearEachFrame) {
        renderContext_.flush();
        ag_.clear(config_.clearColor);
    }
}

void Views::renderStage() {
    stage_.render(renderContext_);
}

void Views::endFrame() {
    renderContext_.afterRender();
    frameCount_++;
}

void Views::render() {
    beginFrame();
    renderStage();
    endFrame();
}

void Views::frame(double dtSeconds) {
    update(dtSeconds);
    render();
}

} // namespace kestrel
