/* Copyright (c) 2026 hors<horsicq@gmail.com>
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */
#include <gtest/gtest.h>

#include "iszbuilder.h"
#include "xisz.h"

TEST(XISZObfuscationTest, AppliedTwiceRestoresInput)
{
    QByteArray baEmpty;
    EXPECT_EQ(XISZ::xorObfuscate(XISZ::xorObfuscate(baEmpty)), baEmpty);

    for (qint32 nSize = 1; nSize < 40; nSize += 3) {
        QByteArray baData = ISZBuilder::createPattern(nSize, (quint8)nSize);
        baData[0] = (char)0xFF;

        QByteArray baObfuscated = XISZ::xorObfuscate(baData);

        EXPECT_NE(baObfuscated, baData);
        EXPECT_EQ(XISZ::xorObfuscate(baObfuscated), baData);
    }
}

TEST(XISZObfuscationTest, KeyRepeatsEveryFourBytes)
{
    QByteArray baZeros(9, 0);
    QByteArray baKey = XISZ::xorObfuscate(baZeros);

    const quint8 key[4] = {0xB6, 0x8C, 0xA5, 0xDE};

    for (qint32 i = 0; i < baKey.size(); i++) {
        EXPECT_EQ((quint8)baKey.at(i), key[i % 4]) << "byte " << i;
    }
}

TEST(XISZObfuscationTest, InPlaceMatchesCopy)
{
    QByteArray baData = ISZBuilder::createPattern(21, 7);
    QByteArray baCopy = XISZ::xorObfuscate(baData);

    XISZ::xorObfuscate(baData.data(), baData.size());

    EXPECT_EQ(baData, baCopy);
}

TEST(XISZChunkPointerTest, SplitsMethodAndSize)
{
    // 0xC00005: method 3, size 5
    const char data1[3] = {0x05, 0x00, (char)0xC0};
    XISZ_DEF::CHUNK_POINTER chunkPointer = XISZ::decodeChunkPointer(data1);
    EXPECT_EQ(chunkPointer.storageMethod, XISZ_DEF::STORAGE_METHOD_BZIP2);
    EXPECT_EQ(chunkPointer.nSize, 5u);

    // 0x7FFFFF: method 1, largest size
    const char data2[3] = {(char)0xFF, (char)0xFF, 0x7F};
    chunkPointer = XISZ::decodeChunkPointer(data2);
    EXPECT_EQ(chunkPointer.storageMethod, XISZ_DEF::STORAGE_METHOD_DATA);
    EXPECT_EQ(chunkPointer.nSize, 0x3FFFFFu);

    // 0x800200: method 2, size 512
    const char data3[3] = {0x00, 0x02, (char)0x80};
    chunkPointer = XISZ::decodeChunkPointer(data3);
    EXPECT_EQ(chunkPointer.storageMethod, XISZ_DEF::STORAGE_METHOD_ZLIB);
    EXPECT_EQ(chunkPointer.nSize, 512u);

    const char data4[3] = {0x00, 0x01, 0x00};
    chunkPointer = XISZ::decodeChunkPointer(data4);
    EXPECT_EQ(chunkPointer.storageMethod, XISZ_DEF::STORAGE_METHOD_ZEROS);
    EXPECT_EQ(chunkPointer.nSize, 256u);
}

TEST(XISZChunkPointerTest, DecodesBuilderPacking)
{
    QByteArray baPacked = ISZBuilder::packChunkPointer(XISZ_DEF::STORAGE_METHOD_ZLIB, 123456);

    XISZ_DEF::CHUNK_POINTER chunkPointer = XISZ::decodeChunkPointer(baPacked.constData());

    EXPECT_EQ(chunkPointer.storageMethod, XISZ_DEF::STORAGE_METHOD_ZLIB);
    EXPECT_EQ(chunkPointer.nSize, 123456u);
}

TEST(XISZChunkPointerTest, SegmentRecordDecoding)
{
    XISZ_DEF::SEGMENT segment = {};
    segment.nSize = 0x100000000LL;
    segment.nNumberOfChunks = 17;
    segment.nFirstChunkNumber = 3;
    segment.nChunkOffset = 0x1C0;
    segment.nLeftSize = 42;

    QByteArray baRecord = ISZBuilder::packSegment(segment);
    ASSERT_EQ(baRecord.size(), XISZ_DEF::SEGMENT_RECORD_SIZE);

    XISZ_DEF::SEGMENT decoded = XISZ::decodeSegment(baRecord.constData());

    EXPECT_EQ(decoded.nSize, 0x100000000LL);
    EXPECT_EQ(decoded.nNumberOfChunks, 17);
    EXPECT_EQ(decoded.nFirstChunkNumber, 3);
    EXPECT_EQ(decoded.nChunkOffset, 0x1C0);
    EXPECT_EQ(decoded.nLeftSize, 42);
}
