#include <gtest/gtest.h>
#include <bsplink/client/analysis_reader.h>

#include "common/bsp_test_helpers.h"

namespace bsplink::client::test {

TEST(AnalysisCodec, EncodeThenDecodeKeepsPayload) {
    auto bytes = encode_analysis("symbols:\nA\nB\n");
    EXPECT_EQ(bytes.rfind("BSPLINK-ANALYSIS 1\n", 0), 0u);

    auto decoded = decode_analysis(bytes, "/ws/out/core.analysis");
    ASSERT_TRUE(decoded) << decoded.error().message;
    EXPECT_EQ(decoded.value().payload, "symbols:\nA\nB\n");
    EXPECT_EQ(decoded.value().formatVersion, kAnalysisFormatVersion);
    EXPECT_EQ(decoded.value().location, "/ws/out/core.analysis");
}

TEST(AnalysisCodec, RejectsForeignOrFutureFiles) {
    auto noHeader = decode_analysis("just some bytes", "/x");
    ASSERT_FALSE(noHeader);
    EXPECT_EQ(noHeader.error().code, ErrorCode::DecodeFailed);

    EXPECT_FALSE(decode_analysis("ZINC-ANALYSIS 1\npayload", "/x"));
    EXPECT_FALSE(decode_analysis("BSPLINK-ANALYSIS one\npayload", "/x"));
    EXPECT_FALSE(decode_analysis("BSPLINK-ANALYSIS\npayload", "/x"));

    auto future = decode_analysis("BSPLINK-ANALYSIS 99\npayload", "/x");
    ASSERT_FALSE(future);
    EXPECT_NE(future.error().message.find("unsupported version 99"), std::string::npos);
}

TEST(FileAnalysisReader, MissingFileIsEmptyNotError) {
    bsplink::tests::TempDir dir;
    FileAnalysisReader reader;
    auto r = reader.read(dir / "absent.analysis");
    ASSERT_TRUE(r);
    EXPECT_FALSE(r.value().has_value());
}

TEST(FileAnalysisReader, ReadsWrittenFile) {
    bsplink::tests::TempDir dir;
    auto path = bsplink::tests::write_file(dir / "core" / "c-1.analysis", encode_analysis("ok"));
    FileAnalysisReader reader;
    auto r = reader.read(path);
    ASSERT_TRUE(r) << r.error().message;
    ASSERT_TRUE(r.value().has_value());
    EXPECT_EQ(r.value()->payload, "ok");
    EXPECT_EQ(r.value()->location, path);
}

TEST(FileAnalysisReader, CorruptOrOversizedFileFails) {
    bsplink::tests::TempDir dir;
    auto corrupt = bsplink::tests::write_file(dir / "bad.analysis", "garbage");
    FileAnalysisReader reader;
    auto r = reader.read(corrupt);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::DecodeFailed);

    auto big = bsplink::tests::write_file(dir / "big.analysis", encode_analysis(std::string(64, 'x')));
    FileAnalysisReader small(16);
    auto tooLarge = small.read(big);
    ASSERT_FALSE(tooLarge);
    EXPECT_NE(tooLarge.error().message.find("too large"), std::string::npos);
}

} // namespace bsplink::client::test
