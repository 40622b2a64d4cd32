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
#ifndef XISZ_DEF_H
#define XISZ_DEF_H

#include <QtGlobal>

namespace XISZ_DEF {

const quint32 S_SIGNATURE = 0x215A7349;  // 'IsZ!'
const quint8 S_VERSION = 1;

const qint32 HEADER_SIZE = 64;
const qint32 SEGMENT_RECORD_SIZE = 24;
const qint32 POINTER_LENGTH = 3;

// ~'IsZ!'
const quint8 XOR_KEY[4] = {0xB6, 0x8C, 0xA5, 0xDE};

const quint32 CHUNK_SIZE_MASK = 0x3FFFFF;
const qint32 CHUNK_METHOD_SHIFT = 22;

enum STORAGE_METHOD {
    STORAGE_METHOD_ZEROS = 0,
    STORAGE_METHOD_DATA,
    STORAGE_METHOD_ZLIB,
    STORAGE_METHOD_BZIP2
};

enum ENCRYPTION_TYPE {
    ENCRYPTION_TYPE_NONE = 0,
    ENCRYPTION_TYPE_PASSWORD,
    ENCRYPTION_TYPE_AES128,
    ENCRYPTION_TYPE_AES192,
    ENCRYPTION_TYPE_AES256
};

// 64 bytes, little-endian, no padding
struct HEADER {
    quint32 nSignature;              // 0x00 'IsZ!'
    quint8 nHeaderSize;              // 0x04
    quint8 nVersion;                 // 0x05
    quint32 nVolumeSerialNumber;     // 0x06
    quint16 nSectorSize;             // 0x0A
    quint32 nTotalSectors;           // 0x0C
    quint8 nEncryptionType;          // 0x10
    qint64 nSegmentSize;             // 0x11
    quint32 nNumberOfBlocks;         // 0x19
    quint32 nBlockSize;              // 0x1D
    quint8 nPointerLength;           // 0x21
    qint8 nFileSegmentNumber;        // 0x22
    quint32 nChunkPointersOffset;    // 0x23
    quint32 nSegmentPointersOffset;  // 0x27
    quint32 nDataOffset;             // 0x2B
    quint8 nReserved;                // 0x2F
    quint32 nChecksum1;              // 0x30 uncompressed data
    quint32 nSize1;                  // 0x34 compressed data
    quint32 nUnknown2;               // 0x38
    quint32 nChecksum2;              // 0x3C compressed data
};

// Segment definition table entry, 24 bytes
struct SEGMENT {
    qint64 nSize;
    qint32 nNumberOfChunks;
    qint32 nFirstChunkNumber;
    qint32 nChunkOffset;
    qint32 nLeftSize;  // bytes of the last chunk stored in the next segment
};

struct CHUNK_POINTER {
    STORAGE_METHOD storageMethod;
    quint32 nSize;  // uncompressed size for STORAGE_METHOD_ZEROS
};

}  // namespace XISZ_DEF

#endif  // XISZ_DEF_H
