#include "GpuDevice.h"
#include <sstream>

namespace gpu {

//===========================================================================================
//==                                   RESOURCE ARENA                                      ==
//===========================================================================================

ResourceArena::ResourceArena(const Capabilities& caps) : caps_(caps) {}

TextureId ResourceArena::create_texture(int width, int height, const std::string& label) {
    if (width <= 0 || height <= 0) {
        throw ResourceError("texture '" + label + "' has an empty extent");
    }
    if (width > caps_.max_texture_size || height > caps_.max_texture_size) {
        std::ostringstream msg;
        msg << "texture '" << label << "' (" << width << "x" << height
            << ") exceeds max texture size " << caps_.max_texture_size;
        throw ResourceError(msg.str());
    }

    std::unique_ptr<Texture2D> tex;
    try {
        tex = std::make_unique<Texture2D>(width, height, label);
    } catch (const std::bad_alloc&) {
        throw ResourceError("allocation failed for texture '" + label + "'");
    }
    slots_.push_back(std::move(tex));
    return static_cast<TextureId>(slots_.size());
}

bool ResourceArena::contains(TextureId id) const {
    return id != kNullTexture && id <= slots_.size() && slots_[id - 1] != nullptr;
}

Texture2D& ResourceArena::texture(TextureId id) {
    if (!contains(id)) {
        throw ResourceError("invalid texture handle " + std::to_string(id));
    }
    return *slots_[id - 1];
}

const Texture2D& ResourceArena::texture(TextureId id) const {
    if (!contains(id)) {
        throw ResourceError("invalid texture handle " + std::to_string(id));
    }
    return *slots_[id - 1];
}

void ResourceArena::release(TextureId id) {
    if (contains(id)) {
        slots_[id - 1].reset();
    }
}

void ResourceArena::release_all() {
    for (auto& slot : slots_) slot.reset();
}

size_t ResourceArena::live_count() const {
    size_t live = 0;
    for (const auto& slot : slots_) {
        if (slot) ++live;
    }
    return live;
}

size_t ResourceArena::bytes_allocated() const {
    size_t bytes = 0;
    for (const auto& slot : slots_) {
        if (slot) bytes += slot->byte_size();
    }
    return bytes;
}

//===========================================================================================
//==                                       DEVICE                                          ==
//===========================================================================================

Device::Device(const Capabilities& caps, bool enable_threading)
    : caps_(caps), arena_(caps), threading_(enable_threading), passes_issued_(0) {}

void Device::require_float_pipeline() const {
    if (!caps_.color_buffer_float) {
        throw CapabilityError("device cannot render to floating-point colour buffers");
    }
    if (!caps_.float_blend) {
        throw CapabilityError("device cannot blend into floating-point colour buffers");
    }
}

void Device::link(const KernelSignature& signature) const {
    std::ostringstream msg;
    if (signature.output_attachments <= 0) {
        msg << "kernel '" << signature.name << "' declares no outputs";
        throw LinkError(msg.str());
    }
    if (signature.output_attachments > caps_.max_draw_buffers ||
        signature.output_attachments > kMaxColorAttachments) {
        msg << "kernel '" << signature.name << "' writes " << signature.output_attachments
            << " attachments, device supports " << caps_.max_draw_buffers;
        throw LinkError(msg.str());
    }
    if (signature.input_bindings > caps_.max_texture_bindings) {
        msg << "kernel '" << signature.name << "' binds " << signature.input_bindings
            << " textures, device supports " << caps_.max_texture_bindings;
        throw LinkError(msg.str());
    }
    if (signature.needs_float_blend && !caps_.float_blend) {
        msg << "kernel '" << signature.name << "' requires float blending";
        throw LinkError(msg.str());
    }
}

void Device::check_framebuffer(const Framebuffer& fb) const {
    if (fb.attachments.empty()) {
        throw ResourceError("framebuffer has no attachments");
    }
    if (static_cast<int>(fb.attachments.size()) > caps_.max_draw_buffers ||
        static_cast<int>(fb.attachments.size()) > kMaxColorAttachments) {
        throw ResourceError("framebuffer exceeds max draw buffers");
    }
    const Texture2D& first = arena_.texture(fb.attachments.front());
    for (TextureId id : fb.attachments) {
        const Texture2D& tex = arena_.texture(id);
        if (tex.width != first.width || tex.height != first.height) {
            throw ResourceError("framebuffer incomplete: attachment '" + tex.label +
                                "' does not match '" + first.label + "'");
        }
    }
}

Device::BoundTargets Device::bind(const Framebuffer& fb) {
    check_framebuffer(fb);
    BoundTargets targets;
    targets.count = static_cast<int>(fb.attachments.size());
    for (int a = 0; a < targets.count; ++a) {
        targets.textures[a] = &arena_.texture(fb.attachments[a]);
    }
    targets.width = targets.textures[0]->width;
    targets.height = targets.textures[0]->height;
    ++passes_issued_;
    return targets;
}

void Device::clear(const Framebuffer& fb, const Texel& value) {
    BoundTargets targets = bind(fb);
    for (int a = 0; a < targets.count; ++a) {
        targets.textures[a]->clear(value);
    }
}

} // namespace gpu
