/* Copyright (c) V-Nova International Limited 2025-2026. All rights reserved.
 * This software is licensed under the BSD-3-Clause-Clear License by V-Nova Limited.
 * No patent licenses are granted under this license. For enquiries about patent licenses,
 * please contact legal@v-nova.com.
 * The VPXdec software is a stand-alone project and is NOT A CONTRIBUTION to any other project.
 * If the software is incorporated into another project, THE TERMS OF THE BSD-3-CLAUSE-CLEAR LICENSE
 * AND THE ADDITIONAL LICENSING INFORMATION CONTAINED IN THIS FILE MUST BE MAINTAINED, AND THE
 * SOFTWARE DOES NOT AND MUST NOT ADOPT THE LICENSE OF THE INCORPORATING PROJECT. However, the
 * software may be incorporated into a project under a compatible license provided the requirements
 * of the BSD-3-Clause-Clear license are respected, and V-Nova Limited remains
 * licensor of the software ONLY UNDER the BSD-3-Clause-Clear license (not the compatible license).
 * ANY ONWARD DISTRIBUTION, WHETHER STAND-ALONE OR AS PART OF ANY OTHER PROJECT, REMAINS SUBJECT TO
 * THE EXCLUSION OF PATENT LICENSES PROVISION OF THE BSD-3-CLAUSE-CLEAR LICENSE. */

#include <VPXdec/common/log.h>
#include <VPXdec/media/decoder_registry.h>
#include <VPXdec/media/frame_pool.h>
#include <VPXdec/media/packet.h>
#include <VPXdec/media/video_decoder.h>
#include <VPXdec/vpx/vpx_decoder.h>
//
#include <VPXdec/utility/check.h>
#include <VPXdec/utility/frame_hash.h>
#include <VPXdec/utility/ivf_reader.h>
#include <VPXdec/utility/raw_writer.h>
#include <VPXdec/utility/types_fmt.h>
//
#include <CLI/CLI.hpp>
#include <fmt/core.h>
//
#include <cstdint>
#include <cstdlib>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

using namespace vpxdec;
using namespace vpxdec::utility;

namespace {

struct Output
{
    std::unique_ptr<RawWriter> writer;
    std::unique_ptr<FrameHash> hash;
    uint32_t frames = 0;
};

// Fetch every frame the decoder has ready.
void drain(VideoDecoder& decoder, const std::shared_ptr<FramePool>& pool, Output& output)
{
    std::shared_ptr<Frame> frame;
    while (VD_VPXDEC_AGAIN(decoder.receiveFrame(pool, frame))) {
        fmt::print("Frame {}: {}\n", output.frames, frame->descriptor());
        VD_UTILITY_CHECK_MSG(output.writer->write(*frame), "writing output");
        if (output.hash) {
            output.hash->updateFrame(*frame);
        }
        output.frames++;
        frame.reset();
    }
}

} // namespace

int main(int argc, char** argv)
{
    std::string inputFile;
    std::string outputFile;
    bool useFramePool{false};
    int32_t threads{0};
    bool hash{false};
    bool verbose{false};

    CLI::App app{"VPXdec C++ Sample"};
    app.add_option("input", inputFile, "Input IVF stream")->required();
    app.add_option("output", outputFile, "Output YUV")->required();
    app.add_flag("--frame-pool", useFramePool, "Receive frames from a frame pool");
    app.add_option("--threads", threads, "Decoder threads (0 for library default)")->default_val(0);
    app.add_flag("--hash", hash, "Print an xxHash of the decoded frames");
    app.add_flag("-v,--verbose", verbose, "Verbose output");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    // Open input
    auto reader = createIvfReader(inputFile);
    if (!reader) {
        fmt::print("Could not open input {}\n", inputFile);
        return EXIT_FAILURE;
    }

    decoder::registerVpxDecoders();
    const auto builder = DecoderRegistry::instance().findDecoder(reader->codec());
    if (!builder) {
        fmt::print("No decoder for {} ({})\n", reader->codec(),
                   std::string_view(reader->header().fourcc, sizeof(reader->header().fourcc)));
        return EXIT_FAILURE;
    }

    // Open output file
    Output output;
    output.writer = createRawWriter(outputFile);
    if (!output.writer) {
        fmt::print("Could not open output {}\n", outputFile);
        return EXIT_FAILURE;
    }
    if (hash) {
        output.hash = std::make_unique<FrameHash>();
    }

    // Create and initialize decoder
    DecoderOptions options;
    options.set("threads", threads);
    options.set("log_stdout", true);
    // Simple command line option for verbose logging
    options.set("log_level",
                static_cast<int32_t>(verbose ? LogLevel::Debug : LogLevel::Warning));

    VideoDecoderParameters params;
    params.width = reader->header().width;
    params.height = reader->header().height;

    std::unique_ptr<VideoDecoder> decoder;
    VD_VPXDEC_CHECK(builder->createDecoder(reader->codec(), params, &options, decoder));
    fmt::print("Decoding {}x{} {} with {}\n", params.width, params.height, reader->codec(),
               decoder->name());

    std::shared_ptr<FramePool> pool;
    if (useFramePool) {
        pool = std::make_shared<FramePool>();
    }

    // Frame loop - send each packet, then collect what it produced
    std::vector<uint8_t> payload;
    int64_t timestamp = 0;
    while (reader->read(payload, timestamp)) {
        const ReturnCode rc = decoder->sendPacket(Packet::fromVector(payload, timestamp));
        if (rc == ReturnCode::DecodeError) {
            fmt::print("Packet {} ({} bytes) did not decode\n", reader->framesRead() - 1,
                       payload.size());
            continue;
        }
        VD_VPXDEC_CHECK(rc);
        drain(*decoder, pool, output);
    }

    // End of stream
    VD_VPXDEC_CHECK(decoder->flush());
    drain(*decoder, pool, output);

    fmt::print("Decoded {} frames from {} packets\n", output.frames, reader->framesRead());
    if (output.hash) {
        fmt::print("xxhash: {}\n", output.hash->hexDigest());
    }

    decoder.reset();
    return EXIT_SUCCESS;
}
