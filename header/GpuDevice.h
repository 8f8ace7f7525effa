#pragma once
#include <Eigen/Dense>
#include <Eigen/StdVector>
#include <algorithm>
#include <array>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#ifdef _OPENMP
#include <omp.h>
#endif

// Software compute substrate. Models the subset of a float-renderable GPU the
// gravity pipeline relies on: RGBA32F textures, multi-target framebuffers,
// full-viewport fragment passes and point passes with additive blending.
namespace gpu {

using Texel = Eigen::Vector4f;
using TexelBuffer = std::vector<Texel, Eigen::aligned_allocator<Texel>>;
using TextureId = uint32_t;

constexpr TextureId kNullTexture = 0;
constexpr int kMaxColorAttachments = 4;

class CapabilityError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class LinkError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ResourceError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct Capabilities {
    bool color_buffer_float;      // float textures are renderable
    bool float_blend;             // additive blending into float targets
    int max_texture_size;         // per dimension
    int max_draw_buffers;         // simultaneous colour attachments
    int max_texture_bindings;     // read textures bindable by one kernel

    Capabilities()
        : color_buffer_float(true)
        , float_blend(true)
        , max_texture_size(16384)
        , max_draw_buffers(kMaxColorAttachments)
        , max_texture_bindings(64)
    {}
};

struct Texture2D {
    int width;
    int height;
    std::string label;
    TexelBuffer texels;

    Texture2D(int w, int h, std::string name)
        : width(w), height(h), label(std::move(name)),
          texels(static_cast<size_t>(w) * static_cast<size_t>(h), Texel::Zero()) {}

    const Texel& fetch(int x, int y) const { return texels[static_cast<size_t>(y) * width + x]; }
    Texel& at(int x, int y) { return texels[static_cast<size_t>(y) * width + x]; }
    void clear(const Texel& value = Texel::Zero()) { std::fill(texels.begin(), texels.end(), value); }
    size_t byte_size() const { return texels.size() * sizeof(Texel); }
};

// Owns every texture by handle. Handles are never reused, so a stale handle
// is detected instead of aliasing a newer texture.
class ResourceArena {
public:
    explicit ResourceArena(const Capabilities& caps = Capabilities{});
    ~ResourceArena() = default;

    ResourceArena(const ResourceArena&) = delete;
    ResourceArena& operator=(const ResourceArena&) = delete;

    TextureId create_texture(int width, int height, const std::string& label);
    bool contains(TextureId id) const;
    Texture2D& texture(TextureId id);
    const Texture2D& texture(TextureId id) const;

    void release(TextureId id);
    void release_all();

    size_t live_count() const;
    size_t bytes_allocated() const;

private:
    Capabilities caps_;
    std::vector<std::unique_ptr<Texture2D>> slots_;   // slot i holds handle i+1
};

enum class BlendMode {
    Replace,
    Additive
};

struct Framebuffer {
    std::vector<TextureId> attachments;
    BlendMode blend;

    Framebuffer() : blend(BlendMode::Replace) {}
    Framebuffer(std::vector<TextureId> targets, BlendMode mode)
        : attachments(std::move(targets)), blend(mode) {}
};

// Binding layout a kernel declares; validated against the device when the
// owning stage is created.
struct KernelSignature {
    std::string name;
    int input_bindings;
    int output_attachments;
    bool needs_float_blend;
};

struct PointFragment {
    int x;
    int y;
    std::array<Texel, kMaxColorAttachments> values;
};

class Device {
public:
    explicit Device(const Capabilities& caps = Capabilities{}, bool enable_threading = true);

    const Capabilities& caps() const { return caps_; }
    ResourceArena& arena() { return arena_; }
    const ResourceArena& arena() const { return arena_; }

    bool threading_enabled() const { return threading_; }
    uint64_t passes_issued() const { return passes_issued_; }

    // Throws CapabilityError unless float rendering and blending are present
    void require_float_pipeline() const;

    // Throws LinkError when the signature cannot be satisfied by this device
    void link(const KernelSignature& signature) const;

    // Throws ResourceError for a framebuffer that cannot be rendered to
    void check_framebuffer(const Framebuffer& fb) const;

    void clear(const Framebuffer& fb, const Texel& value = Texel::Zero());

    /*  Runs fragment(x, y, out) for every texel of the framebuffer's viewport.
        out[0..attachments) must be written by the fragment; blending follows
        fb.blend. Invocations are independent and run in parallel.
    */
    template <typename Fragment>
    void draw_fullscreen(const Framebuffer& fb, Fragment&& fragment);

    /*  Runs vertex(i, frag) for i in [0, count). A vertex returning false
        emits nothing. Vertices run in parallel; emitted fragments are then
        blended in primitive order so sums are reproducible.
    */
    template <typename Vertex>
    void draw_points(const Framebuffer& fb, size_t count, Vertex&& vertex);

private:
    struct BoundTargets {
        std::array<Texture2D*, kMaxColorAttachments> textures{};
        int count = 0;
        int width = 0;
        int height = 0;
    };

    BoundTargets bind(const Framebuffer& fb);

    Capabilities caps_;
    ResourceArena arena_;
    bool threading_;
    uint64_t passes_issued_;
    std::vector<PointFragment> point_scratch_;
    std::vector<uint8_t> point_emitted_;
};

template <typename Fragment>
void Device::draw_fullscreen(const Framebuffer& fb, Fragment&& fragment) {
    BoundTargets targets = bind(fb);
    const bool additive = fb.blend == BlendMode::Additive;
    const int width = targets.width;
    const int height = targets.height;

    #pragma omp parallel for schedule(static) if(threading_)
    for (int y = 0; y < height; ++y) {
        std::array<Texel, kMaxColorAttachments> out;
        for (int x = 0; x < width; ++x) {
            for (int a = 0; a < targets.count; ++a) out[a] = Texel::Zero();
            fragment(x, y, out.data());
            for (int a = 0; a < targets.count; ++a) {
                Texel& dst = targets.textures[a]->at(x, y);
                if (additive) dst += out[a];
                else dst = out[a];
            }
        }
    }
}

template <typename Vertex>
void Device::draw_points(const Framebuffer& fb, size_t count, Vertex&& vertex) {
    BoundTargets targets = bind(fb);
    point_scratch_.resize(count);
    point_emitted_.assign(count, 0);

    const long long n = static_cast<long long>(count);
    #pragma omp parallel for schedule(static) if(threading_)
    for (long long i = 0; i < n; ++i) {
        PointFragment& frag = point_scratch_[static_cast<size_t>(i)];
        for (int a = 0; a < targets.count; ++a) frag.values[a] = Texel::Zero();
        point_emitted_[static_cast<size_t>(i)] = vertex(static_cast<size_t>(i), frag) ? 1 : 0;
    }

    const bool additive = fb.blend == BlendMode::Additive;
    for (size_t i = 0; i < count; ++i) {
        if (!point_emitted_[i]) continue;
        const PointFragment& frag = point_scratch_[i];
        // Outside the viewport: clipped
        if (frag.x < 0 || frag.y < 0 || frag.x >= targets.width || frag.y >= targets.height) continue;
        for (int a = 0; a < targets.count; ++a) {
            Texel& dst = targets.textures[a]->at(frag.x, frag.y);
            if (additive) dst += frag.values[a];
            else dst = frag.values[a];
        }
    }
}

} // namespace gpu
