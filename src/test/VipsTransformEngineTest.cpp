#include <cassert>
#include <iostream>

#include "domain/PipelineErrors.hpp"
#include "infrastructure/VipsTransformEngine.hpp"
#include "test/VipsImageTestSupport.hpp"

using namespace pixelorigin;
using namespace pixelorigin::test;
using infrastructure::VipsTransformEngine;

namespace {

domain::SourceArtifact PngSource(int width, int height, const std::vector<double>& pixel) {
    return domain::SourceArtifact(EncodePng(MakeImage(width, height, pixel)), std::string("image/png"));
}

domain::TransformPlan Plan(const domain::OperationMap& operations) {
    return domain::TransformPlan::FromOperations(operations, 75);
}

vips::VImage Run(VipsTransformEngine& engine, const domain::SourceArtifact& source,
                 const domain::OperationMap& operations, std::string* contentType = nullptr) {
    auto encoded = engine.transform(source, Plan(operations));
    if (contentType) *contentType = encoded.contentType;
    return DecodeBytes(encoded.bytes);
}

void TestResize(VipsTransformEngine& engine) {
    auto source = PngSource(200, 100, {10, 20, 30});

    auto widthOnly = Run(engine, source, {{"width", "100"}});
    assert(widthOnly.width() == 100 && widthOnly.height() == 50);

    auto heightOnly = Run(engine, source, {{"height", "30"}});
    assert(heightOnly.width() == 60 && heightOnly.height() == 30);

    auto exact = Run(engine, source, {{"width", "50"}, {"height", "80"}});
    assert(exact.width() == 50 && exact.height() == 80);

    auto odd = Run(engine, PngSource(300, 101, {1, 2, 3}), {{"width", "150"}});
    assert(odd.width() == 150 && odd.height() == 51);

    auto untouched = Run(engine, source, {{"format", "png"}});
    assert(untouched.width() == 200 && untouched.height() == 100);
    std::cout << "[PASS] resize policy" << std::endl;
}

void TestOrientation() {
    auto rotated = MakeImage(200, 100, {0, 0, 0}).copy();
    rotated.set(VIPS_META_ORIENTATION, 6);

    domain::TransformPlan plan;
    auto upright = VipsTransformEngine::ApplyGeometry(rotated, plan);
    assert(plan.autoOrient);
    assert(upright.width() == 100 && upright.height() == 200);
    assert(VipsTransformEngine::ExifOrientation(upright) == 1);

    // Resize happens first, then the rotation.
    domain::TransformPlan resized;
    resized.targetWidth = 100;
    auto resizedUpright = VipsTransformEngine::ApplyGeometry(rotated, resized);
    assert(resizedUpright.width() == 50 && resizedUpright.height() == 100);

    auto plain = MakeImage(200, 100, {0, 0, 0});
    domain::TransformPlan untouched;
    auto same = VipsTransformEngine::ApplyGeometry(plain, untouched);
    assert(!untouched.autoOrient);
    assert(same.width() == 200 && same.height() == 100);
    std::cout << "[PASS] orientation correction" << std::endl;
}

void TestAlphaPolicy(VipsTransformEngine& engine) {
    auto translucent = PngSource(40, 20, {255, 0, 0, 128});
    std::string contentType;

    auto jpeg = Run(engine, translucent, {{"format", "jpeg"}}, &contentType);
    assert(contentType == "image/jpeg");
    assert(!jpeg.has_alpha() && jpeg.bands() == 3);

    auto fallback = Run(engine, translucent, {{"format", "tiff"}}, &contentType);
    assert(contentType == "image/jpeg");
    assert(!fallback.has_alpha());

    auto webp = Run(engine, translucent, {{"format", "webp"}}, &contentType);
    assert(contentType == "image/webp");
    assert(!webp.has_alpha());

    auto png = Run(engine, translucent, {{"format", "png"}}, &contentType);
    assert(contentType == "image/png");
    assert(png.has_alpha());

    if (HasOperation("gifsave_buffer")) {
        auto gif = Run(engine, PngSource(40, 20, {255, 0, 0, 0}), {{"format", "gif"}}, &contentType);
        assert(contentType == "image/gif");
        assert(gif.has_alpha());
    }

    if (HasOperation("heifsave_buffer") && HasOperation("heifload_buffer")) {
        auto avif = engine.transform(translucent, Plan({{"format", "avif"}}));
        assert(avif.contentType == "image/avif");
        assert(!DecodeBytes(avif.bytes).has_alpha());
    } else {
        std::cout << "[Test] libvips built without HEIF support, skipping avif" << std::endl;
    }
    std::cout << "[PASS] alpha policy" << std::endl;
}

void TestGreyAlphaFlatten(VipsTransformEngine& engine) {
    auto greyAlpha = vips::VImage::black(30, 20)
        .new_from_image(std::vector<double>{128, 64})
        .copy(vips::VImage::option()->set("interpretation", VIPS_INTERPRETATION_B_W));
    assert(greyAlpha.bands() == 2 && greyAlpha.has_alpha());
    domain::SourceArtifact source(EncodePng(greyAlpha), std::string("image/png"));

    for (const char* format : {"jpeg", "webp"}) {
        std::string contentType;
        auto out = Run(engine, source, {{"format", format}, {"width", "15"}}, &contentType);
        assert(contentType == std::string("image/") + format);
        assert(!out.has_alpha());
        assert(out.width() == 15 && out.height() == 10);
    }

    std::string contentType;
    auto png = Run(engine, source, {{"format", "png"}}, &contentType);
    assert(contentType == "image/png");
    assert(png.has_alpha());
    std::cout << "[PASS] grey+alpha sources flatten for opaque formats" << std::endl;
}

void TestNativeFormat(VipsTransformEngine& engine) {
    std::string contentType;
    auto png = Run(engine, PngSource(20, 20, {1, 2, 3}), {{"width", "10"}}, &contentType);
    assert(contentType == "image/png");
    assert(LoaderOf(png).rfind("pngload", 0) == 0);

    domain::SourceArtifact jpegSource(EncodeJpeg(MakeImage(20, 20, {1, 2, 3})), std::string("image/jpeg"));
    Run(engine, jpegSource, {{"width", "10"}}, &contentType);
    assert(contentType == "image/jpeg");
    std::cout << "[PASS] native format kept when none requested" << std::endl;
}

void TestQuality(VipsTransformEngine& engine) {
    auto source = PngSource(64, 64, {90, 120, 200});
    for (const char* quality : {"0", "1", "250", "-4", "abc"}) {
        for (const char* format : {"jpeg", "webp", "png", "gif"}) {
            if (std::string(format) == "gif" && !HasOperation("gifsave_buffer")) continue;
            auto encoded = engine.transform(source, Plan({{"format", format}, {"quality", quality}}));
            assert(!encoded.bytes.empty());
        }
    }

    std::cout << "[PASS] quality handling" << std::endl;
}

void TestDecodeError(VipsTransformEngine& engine) {
    bool threw = false;
    try {
        engine.transform(domain::SourceArtifact("definitely not an image", std::string("image/png")), Plan({}));
    } catch (const domain::DecodeError& e) {
        threw = true;
        assert(e.stage() == domain::PipelineStage::Decode);
    }
    assert(threw);

    threw = false;
    try {
        engine.transform(domain::SourceArtifact("", std::nullopt), Plan({}));
    } catch (const domain::DecodeError&) {
        threw = true;
    }
    assert(threw);
    std::cout << "[PASS] undecodable input" << std::endl;
}

} // namespace

int main(int, char** argv) {
    std::cout << "[Test] Starting VipsTransformEngine Test..." << std::endl;
    if (VIPS_INIT(argv[0]) != 0) {
        std::cout << "[FAIL] libvips init: " << vips_error_buffer() << std::endl;
        return 1;
    }

    VipsTransformEngine engine;
    TestResize(engine);
    TestOrientation();
    TestAlphaPolicy(engine);
    TestGreyAlphaFlatten(engine);
    TestNativeFormat(engine);
    TestQuality(engine);
    TestDecodeError(engine);

    vips_shutdown();
    std::cout << "[PASS] VipsTransformEngine Test." << std::endl;
    return 0;
}
